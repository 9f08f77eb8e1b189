#pragma once

#include <QByteArray>
#include <QDateTime>
#include <QObject>
#include <QString>
#include <map>
#include <optional>
#include <vector>

#include "planner/cache/CacheEntry.hpp"
#include "planner/data/CalendarEvent.hpp"

namespace planner {
namespace core {
class Clock;
}
namespace data {
class PersistentStore;
}

namespace cache {

// Two-tier event cache. The memory tier is bounded (LRU) and short-lived, the persistent tier
// outlives it and is promoted back into memory on read. Persistent writes are deferred to the
// event loop so put() never blocks on I/O.
class EventCache : public QObject
{
    Q_OBJECT

public:
    struct Options
    {
        qint64 memoryTtlSeconds = 30 * 60;
        qint64 persistentTtlSeconds = 24 * 60 * 60;
        int maxMemoryEntries = 6;
    };

    EventCache(const core::Clock &clock, data::PersistentStore &store, Options options, QObject *parent = nullptr);
    ~EventCache() override;

    std::optional<std::vector<data::CalendarEvent>> get(const QString &key);
    void put(const QString &key, std::vector<data::CalendarEvent> events);
    bool hasValidEntry(const QString &key) const;

    void putCalendars(const QString &key, std::vector<data::CalendarSource> calendars);
    std::optional<std::vector<data::CalendarSource>> calendars(const QString &key) const;

    void invalidate(const QString &key);
    void clearAll();

    int memoryEntryCount() const;
    bool hasPendingWrites() const;
    const Options &options() const;

    static QString eventsStoreKey(const QString &key);
    static QString timestampStoreKey(const QString &key);

public slots:
    void flushPendingWrites();

private:
    struct PendingWrite
    {
        QByteArray payload;
        QDateTime writtenAt;
    };

    std::optional<QDateTime> persistentTimestamp(const QString &key) const;
    void purgePersistent(const QString &key);
    void dropMemory(const QString &key);
    void touch(const QString &key);
    void evictIfNeeded();
    void schedulePersistentWrite(const QString &key, PendingWrite write);

    const core::Clock &m_clock;
    data::PersistentStore &m_store;
    Options m_options;
    std::map<QString, CacheEntry<std::vector<data::CalendarEvent>>> m_memory;
    std::map<QString, CacheEntry<std::vector<data::CalendarSource>>> m_calendars;
    std::map<QString, quint64> m_accessOrder;
    quint64 m_accessCounter = 0;
    std::map<QString, PendingWrite> m_pendingWrites;
    bool m_flushScheduled = false;
};

} // namespace cache
} // namespace planner
