#include "planner/core/CalendarOrchestrator.hpp"

#include <algorithm>

#include "planner/cache/CacheEntry.hpp"
#include "planner/cache/EventCache.hpp"
#include "planner/core/Logging.hpp"
#include "planner/core/Preloader.hpp"
#include "planner/net/AccessTokenProvider.hpp"
#include "planner/net/RemoteCalendarClient.hpp"

namespace planner {
namespace core {

CalendarOrchestrator::CalendarOrchestrator(net::RemoteCalendarClient &client,
                                           const net::AccessTokenProvider &tokens,
                                           cache::EventCache &cache,
                                           Preloader *preloader,
                                           QObject *parent)
    : QObject(parent)
    , m_client(client)
    , m_tokens(tokens)
    , m_cache(cache)
    , m_preloader(preloader)
{
}

CalendarOrchestrator::~CalendarOrchestrator() = default;

void CalendarOrchestrator::load(const data::DateRange &range, LoadOptions options)
{
    if (!range.isValid()) {
        qCWarning(lcCore) << "ignoring load of invalid range" << range.start << range.end;
        return;
    }

    const quint64 generation = ++m_generation;
    m_range = range;
    m_outstanding = 0;
    m_linkedCount = 0;
    m_failures.clear();
    setError(QString());

    if (range == data::DateRange::monthContaining(range.start)) {
        m_navigationDirection = m_lastMonth.isValid() ? (range.start > m_lastMonth) - (range.start < m_lastMonth) : 0;
        m_lastMonth = range.start;
    } else {
        m_navigationDirection = 0;
    }

    qCInfo(lcCore) << "load" << range.start << "to" << range.end << "generation" << generation
                   << (options.forceRefresh ? "(forced)" : "");

    for (const data::AccountKind account : data::AllAccountKinds) {
        if (!m_tokens.isLinked(account)) {
            continue;
        }
        ++m_linkedCount;
        const QString key = cache::cacheKey(account, range);

        if (!options.forceRefresh) {
            if (auto cached = m_cache.get(key)) {
                auto calendars = m_cache.calendars(key);
                const bool complete = calendars.has_value();
                publish(account, std::move(*cached), std::move(calendars));
                if (complete) {
                    continue;
                }
                // Calendar lists are not persisted; fetch them along with fresh events.
                qCDebug(lcCore) << "cached events without calendars for" << key;
            }
        }

        ++m_outstanding;
        net::FetchRequest *request = m_client.fetchEvents(account, range);
        request->setParent(this);
        const quint64 clearEpoch = m_clearEpoch;
        connect(request, &net::FetchRequest::finished, this, [this, request, key, generation, clearEpoch]() {
            handleFetchFinished(request, key, generation, clearEpoch);
        });
    }

    if (m_outstanding == 0) {
        finishLoad();
        return;
    }
    setLoading(true);
}

void CalendarOrchestrator::loadMonth(const QDate &date, LoadOptions options)
{
    load(data::DateRange::monthContaining(date), options);
}

void CalendarOrchestrator::loadWeek(const QDate &date, LoadOptions options)
{
    load(data::DateRange::weekContaining(date), options);
}

void CalendarOrchestrator::loadDay(const QDate &date, LoadOptions options)
{
    load(data::DateRange::paddedDay(date, DayPaddingDays), options);
}

void CalendarOrchestrator::refresh(const QDate &date, ViewInterval interval)
{
    LoadOptions options;
    options.forceRefresh = true;
    switch (interval) {
    case ViewInterval::Day:
        loadDay(date, options);
        break;
    case ViewInterval::Week:
        loadWeek(date, options);
        break;
    case ViewInterval::Month:
        loadMonth(date, options);
        break;
    }
}

void CalendarOrchestrator::clearAll()
{
    ++m_clearEpoch;
    ++m_generation;
    m_outstanding = 0;
    m_failures.clear();
    m_lastMonth = QDate();
    m_navigationDirection = 0;

    if (m_preloader) {
        m_preloader->discardInFlight();
    }
    m_cache.clearAll();

    for (const data::AccountKind account : data::AllAccountKinds) {
        AccountState &accountState = state(account);
        accountState.events.clear();
        accountState.calendars.clear();
        accountState.index.clear();
        emit eventsChanged(account);
        emit calendarsChanged(account);
    }
    setError(QString());
    setLoading(false);
}

void CalendarOrchestrator::clearCacheForMonth(const QDate &date)
{
    const data::DateRange month = data::DateRange::monthContaining(date);
    for (const data::AccountKind account : data::AllAccountKinds) {
        m_cache.invalidate(cache::cacheKey(account, month));
    }
}

const std::vector<data::CalendarEvent> &CalendarOrchestrator::events(data::AccountKind account) const
{
    return state(account).events;
}

const std::vector<data::CalendarSource> &CalendarOrchestrator::calendars(data::AccountKind account) const
{
    return state(account).calendars;
}

std::vector<data::CalendarEvent> CalendarOrchestrator::eventsOn(const QDate &day,
                                                                std::optional<data::AccountKind> account) const
{
    if (account) {
        return state(*account).index.eventsOn(day);
    }
    std::vector<data::CalendarEvent> merged = m_personal.index.eventsOn(day);
    const std::vector<data::CalendarEvent> professional = m_professional.index.eventsOn(day);
    merged.insert(merged.end(), professional.begin(), professional.end());
    std::stable_sort(merged.begin(), merged.end(), data::dayOrderLessThan);
    return merged;
}

bool CalendarOrchestrator::isLoading() const
{
    return m_loading;
}

QString CalendarOrchestrator::errorMessage() const
{
    return m_errorMessage;
}

data::DateRange CalendarOrchestrator::currentRange() const
{
    return m_range;
}

quint64 CalendarOrchestrator::generation() const
{
    return m_generation;
}

CalendarOrchestrator::AccountState &CalendarOrchestrator::state(data::AccountKind account)
{
    return account == data::AccountKind::Personal ? m_personal : m_professional;
}

const CalendarOrchestrator::AccountState &CalendarOrchestrator::state(data::AccountKind account) const
{
    return account == data::AccountKind::Personal ? m_personal : m_professional;
}

void CalendarOrchestrator::publish(data::AccountKind account,
                                   std::vector<data::CalendarEvent> events,
                                   std::optional<std::vector<data::CalendarSource>> calendars)
{
    AccountState &accountState = state(account);
    accountState.events = std::move(events);
    accountState.index.rebuild(accountState.events);
    emit eventsChanged(account);

    if (calendars) {
        accountState.calendars = std::move(*calendars);
        emit calendarsChanged(account);
    }
}

void CalendarOrchestrator::handleFetchFinished(net::FetchRequest *request,
                                               const QString &key,
                                               quint64 generation,
                                               quint64 clearEpoch)
{
    request->deleteLater();
    if (clearEpoch != m_clearEpoch) {
        qCDebug(lcCore) << "dropping" << key << "fetched before the cache was cleared";
        return;
    }

    if (!request->hasError()) {
        m_cache.put(key, request->events());
        m_cache.putCalendars(key, request->calendars());
    }

    if (generation != m_generation) {
        qCDebug(lcCore) << "not publishing superseded result" << key;
        return;
    }

    --m_outstanding;
    const data::AccountKind account = request->account();
    if (request->hasError()) {
        qCWarning(lcCore) << "loading" << data::accountKindName(account) << "failed:"
                          << request->error()->describe();
        m_failures.push_back(*request->error());
    } else {
        publish(account, request->events(), request->calendars());
    }

    if (m_outstanding == 0) {
        finishLoad();
    }
}

void CalendarOrchestrator::finishLoad()
{
    const int failed = static_cast<int>(m_failures.size());
    if (failed > 0) {
        if (m_linkedCount > 1 && failed == m_linkedCount) {
            setError(tr("Failed to load calendar data for both accounts"));
        } else if (m_linkedCount == 1) {
            setError(m_failures.front().describe());
        } else {
            qCInfo(lcCore) << "one account failed to load, keeping the other";
        }
    }
    setLoading(false);

    // Only month keys are warmed, so day and week loads would never read them back.
    const bool monthLoad = m_range == data::DateRange::monthContaining(m_range.start);
    if (failed == 0 && monthLoad && m_preloader) {
        const QDate pivot = m_range.start.addDays(m_range.start.daysTo(m_range.end) / 2);
        if (m_navigationDirection != 0) {
            m_preloader->warmTowards(pivot, m_navigationDirection);
        } else {
            m_preloader->warmAdjacent(pivot);
        }
    }
    emit loadFinished();
}

void CalendarOrchestrator::setLoading(bool loading)
{
    if (m_loading == loading) {
        return;
    }
    m_loading = loading;
    emit loadingChanged(m_loading);
}

void CalendarOrchestrator::setError(const QString &message)
{
    if (m_errorMessage == message) {
        return;
    }
    m_errorMessage = message;
    emit errorChanged(m_errorMessage);
}

} // namespace core
} // namespace planner
