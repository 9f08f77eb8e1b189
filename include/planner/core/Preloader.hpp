#pragma once

#include <QDate>
#include <QObject>
#include <QSet>
#include <QString>

#include "planner/data/CalendarEvent.hpp"
#include "planner/data/DateRange.hpp"

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

// Warms the cache for months around the one being viewed. Results only ever land in the cache.
class Preloader : public QObject
{
    Q_OBJECT

public:
    Preloader(net::RemoteCalendarClient &client,
              const net::AccessTokenProvider &tokens,
              cache::EventCache &cache,
              QObject *parent = nullptr);
    ~Preloader() override;

    void warmAdjacent(const QDate &pivot);
    // direction > 0: next, next + 1, previous. direction < 0: previous, previous - 1, next.
    void warmTowards(const QDate &pivot, int direction);
    void warmRange(const data::DateRange &range);

    int pendingCount() const;
    // Drops every outstanding warm-up; their results are ignored when they arrive.
    void discardInFlight();

signals:
    void idle();

private:
    void warm(data::AccountKind account, const data::DateRange &range);
    void handleFinished(net::FetchRequest *request, const QString &key, quint64 epoch);

    net::RemoteCalendarClient &m_client;
    const net::AccessTokenProvider &m_tokens;
    cache::EventCache &m_cache;
    QSet<QString> m_inFlight;
    quint64 m_epoch = 0;
};

} // namespace core
} // namespace planner
