#include "planner/core/Preloader.hpp"

#include "planner/cache/CacheEntry.hpp"
#include "planner/cache/EventCache.hpp"
#include "planner/core/Logging.hpp"
#include "planner/net/AccessTokenProvider.hpp"
#include "planner/net/RemoteCalendarClient.hpp"

namespace planner {
namespace core {

Preloader::Preloader(net::RemoteCalendarClient &client,
                     const net::AccessTokenProvider &tokens,
                     cache::EventCache &cache,
                     QObject *parent)
    : QObject(parent)
    , m_client(client)
    , m_tokens(tokens)
    , m_cache(cache)
{
}

Preloader::~Preloader() = default;

void Preloader::warmAdjacent(const QDate &pivot)
{
    warmTowards(pivot, 0);
}

void Preloader::warmTowards(const QDate &pivot, int direction)
{
    if (!pivot.isValid()) {
        return;
    }
    const QDate previous = pivot.addMonths(-1);
    const QDate next = pivot.addMonths(1);

    std::vector<QDate> months;
    if (direction > 0) {
        months = { next, pivot.addMonths(2), previous };
    } else if (direction < 0) {
        months = { previous, pivot.addMonths(-2), next };
    } else {
        months = { previous, next };
    }
    for (const QDate &month : months) {
        warmRange(data::DateRange::monthContaining(month));
    }
}

void Preloader::warmRange(const data::DateRange &range)
{
    if (!range.isValid()) {
        return;
    }
    for (const data::AccountKind account : data::AllAccountKinds) {
        if (m_tokens.isLinked(account)) {
            warm(account, range);
        }
    }
}

int Preloader::pendingCount() const
{
    return m_inFlight.size();
}

void Preloader::discardInFlight()
{
    ++m_epoch;
    if (m_inFlight.isEmpty()) {
        return;
    }
    qCDebug(lcCore) << "discarding" << m_inFlight.size() << "warm-up fetches";
    m_inFlight.clear();
    emit idle();
}

void Preloader::warm(data::AccountKind account, const data::DateRange &range)
{
    const QString key = cache::cacheKey(account, range);
    if (m_inFlight.contains(key) || m_cache.hasValidEntry(key)) {
        return;
    }

    qCDebug(lcCore) << "warming" << key;
    m_inFlight.insert(key);
    net::FetchRequest *request = m_client.fetchEvents(account, range);
    request->setParent(this);
    const quint64 epoch = m_epoch;
    connect(request, &net::FetchRequest::finished, this, [this, request, key, epoch]() {
        handleFinished(request, key, epoch);
    });
}

void Preloader::handleFinished(net::FetchRequest *request, const QString &key, quint64 epoch)
{
    request->deleteLater();
    if (epoch != m_epoch) {
        return;
    }
    m_inFlight.remove(key);

    if (request->hasError()) {
        qCWarning(lcCore) << "warm-up of" << key << "failed:" << request->error()->describe();
    } else {
        m_cache.put(key, request->events());
        m_cache.putCalendars(key, request->calendars());
    }

    if (m_inFlight.isEmpty()) {
        emit idle();
    }
}

} // namespace core
} // namespace planner
