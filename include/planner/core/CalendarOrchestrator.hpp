#pragma once

#include <QDate>
#include <QObject>
#include <QString>
#include <optional>
#include <vector>

#include "planner/data/CalendarEvent.hpp"
#include "planner/data/DateRange.hpp"
#include "planner/data/EventDayIndex.hpp"
#include "planner/net/CalendarError.hpp"

namespace planner {
namespace cache {
class EventCache;
}
namespace net {
class AccessTokenProvider;
class FetchRequest;
class RemoteCalendarClient;
}

namespace core {

class Preloader;

enum class ViewInterval
{
    Day,
    Week,
    Month,
};

struct LoadOptions
{
    bool forceRefresh = false;
};

// Cache-or-fetch front end for the views. Publishes one event list per linked account.
class CalendarOrchestrator : public QObject
{
    Q_OBJECT

public:
    static constexpr int DayPaddingDays = 7;

    CalendarOrchestrator(net::RemoteCalendarClient &client,
                         const net::AccessTokenProvider &tokens,
                         cache::EventCache &cache,
                         Preloader *preloader,
                         QObject *parent = nullptr);
    ~CalendarOrchestrator() override;

    void load(const data::DateRange &range, LoadOptions options = LoadOptions());
    void loadMonth(const QDate &date, LoadOptions options = LoadOptions());
    void loadWeek(const QDate &date, LoadOptions options = LoadOptions());
    void loadDay(const QDate &date, LoadOptions options = LoadOptions());
    void refresh(const QDate &date, ViewInterval interval);

    void clearAll();
    void clearCacheForMonth(const QDate &date);

    const std::vector<data::CalendarEvent> &events(data::AccountKind account) const;
    const std::vector<data::CalendarSource> &calendars(data::AccountKind account) const;
    std::vector<data::CalendarEvent> eventsOn(const QDate &day,
                                              std::optional<data::AccountKind> account = std::nullopt) const;
    bool isLoading() const;
    QString errorMessage() const;
    data::DateRange currentRange() const;
    quint64 generation() const;

signals:
    void eventsChanged(planner::data::AccountKind account);
    void calendarsChanged(planner::data::AccountKind account);
    void loadingChanged(bool loading);
    void errorChanged(const QString &message);
    void loadFinished();

private:
    struct AccountState
    {
        std::vector<data::CalendarEvent> events;
        std::vector<data::CalendarSource> calendars;
        data::EventDayIndex index;
    };

    AccountState &state(data::AccountKind account);
    const AccountState &state(data::AccountKind account) const;

    void publish(data::AccountKind account,
                 std::vector<data::CalendarEvent> events,
                 std::optional<std::vector<data::CalendarSource>> calendars);
    void handleFetchFinished(net::FetchRequest *request, const QString &key, quint64 generation, quint64 clearEpoch);
    void finishLoad();
    void setLoading(bool loading);
    void setError(const QString &message);

    net::RemoteCalendarClient &m_client;
    const net::AccessTokenProvider &m_tokens;
    cache::EventCache &m_cache;
    Preloader *m_preloader = nullptr;

    AccountState m_personal;
    AccountState m_professional;

    data::DateRange m_range;
    quint64 m_generation = 0;
    quint64 m_clearEpoch = 0;
    int m_outstanding = 0;
    int m_linkedCount = 0;
    std::vector<net::CalendarError> m_failures;
    QDate m_lastMonth;
    int m_navigationDirection = 0;

    bool m_loading = false;
    QString m_errorMessage;
};

} // namespace core
} // namespace planner
