#include "planner/cache/EventCache.hpp"

#include <QTimer>
#include <algorithm>

#include "planner/core/Clock.hpp"
#include "planner/core/Logging.hpp"
#include "planner/data/EventJson.hpp"
#include "planner/data/PersistentStore.hpp"

namespace planner {
namespace cache {

namespace {
const QString EventsPrefix = QStringLiteral("CalendarCache_");
const QString TimestampPrefix = QStringLiteral("CacheTimestamp_");
} // namespace

EventCache::EventCache(const core::Clock &clock, data::PersistentStore &store, Options options, QObject *parent)
    : QObject(parent)
    , m_clock(clock)
    , m_store(store)
    , m_options(options)
{
}

EventCache::~EventCache()
{
    flushPendingWrites();
}

std::optional<std::vector<data::CalendarEvent>> EventCache::get(const QString &key)
{
    const QDateTime now = m_clock.now();

    const auto memoryIt = m_memory.find(key);
    if (memoryIt != m_memory.end() && memoryIt->second.isValid(now, m_options.memoryTtlSeconds)) {
        touch(key);
        qCDebug(lcCache) << "memory hit" << key;
        return memoryIt->second.payload;
    }

    std::optional<QByteArray> payload;
    QDateTime writtenAt;
    const auto pendingIt = m_pendingWrites.find(key);
    if (pendingIt != m_pendingWrites.end()) {
        payload = pendingIt->second.payload;
        writtenAt = pendingIt->second.writtenAt;
    } else {
        payload = m_store.read(eventsStoreKey(key));
        if (payload) {
            writtenAt = persistentTimestamp(key).value_or(QDateTime());
        }
    }

    if (payload) {
        if (isWithinTtl(writtenAt, now, m_options.persistentTtlSeconds)) {
            if (auto events = data::decodeEvents(*payload)) {
                m_memory[key] = { *events, now };
                touch(key);
                evictIfNeeded();
                qCDebug(lcCache) << "promoted persistent entry" << key;
                return events;
            }
            qCWarning(lcCache) << "discarding undecodable persistent entry" << key;
        } else {
            qCDebug(lcCache) << "persistent entry expired" << key;
        }
    }

    qCDebug(lcCache) << "miss" << key;
    dropMemory(key);
    purgePersistent(key);
    return std::nullopt;
}

void EventCache::put(const QString &key, std::vector<data::CalendarEvent> events)
{
    const QDateTime now = m_clock.now();
    const bool persist = !events.empty();
    QByteArray payload;
    if (persist) {
        payload = data::encodeEvents(events);
    }

    m_memory[key] = { std::move(events), now };
    touch(key);
    evictIfNeeded();

    if (!persist) {
        // An older non-empty record must not be promoted over the empty result.
        qCDebug(lcCache) << "not persisting empty entry" << key;
        purgePersistent(key);
        return;
    }
    schedulePersistentWrite(key, { payload, now });
}

bool EventCache::hasValidEntry(const QString &key) const
{
    const QDateTime now = m_clock.now();

    const auto memoryIt = m_memory.find(key);
    if (memoryIt != m_memory.end() && memoryIt->second.isValid(now, m_options.memoryTtlSeconds)) {
        return true;
    }
    const auto pendingIt = m_pendingWrites.find(key);
    if (pendingIt != m_pendingWrites.end()) {
        return isWithinTtl(pendingIt->second.writtenAt, now, m_options.persistentTtlSeconds);
    }
    const auto writtenAt = persistentTimestamp(key);
    return writtenAt && isWithinTtl(*writtenAt, now, m_options.persistentTtlSeconds)
        && m_store.read(eventsStoreKey(key)).has_value();
}

void EventCache::putCalendars(const QString &key, std::vector<data::CalendarSource> calendars)
{
    m_calendars[key] = { std::move(calendars), m_clock.now() };
}

std::optional<std::vector<data::CalendarSource>> EventCache::calendars(const QString &key) const
{
    const auto it = m_calendars.find(key);
    if (it == m_calendars.end() || !it->second.isValid(m_clock.now(), m_options.memoryTtlSeconds)) {
        return std::nullopt;
    }
    return it->second.payload;
}

void EventCache::invalidate(const QString &key)
{
    dropMemory(key);
    purgePersistent(key);
}

void EventCache::clearAll()
{
    m_memory.clear();
    m_calendars.clear();
    m_accessOrder.clear();
    m_pendingWrites.clear();

    const QStringList keys = m_store.keys();
    int removed = 0;
    for (const QString &storeKey : keys) {
        if (storeKey.startsWith(EventsPrefix) || storeKey.startsWith(TimestampPrefix)) {
            if (m_store.remove(storeKey)) {
                ++removed;
            }
        }
    }
    qCInfo(lcCache) << "cleared cache," << removed << "persistent records removed";
}

int EventCache::memoryEntryCount() const
{
    return static_cast<int>(m_memory.size());
}

bool EventCache::hasPendingWrites() const
{
    return !m_pendingWrites.empty();
}

const EventCache::Options &EventCache::options() const
{
    return m_options;
}

QString EventCache::eventsStoreKey(const QString &key)
{
    return EventsPrefix + key;
}

QString EventCache::timestampStoreKey(const QString &key)
{
    return TimestampPrefix + key;
}

void EventCache::flushPendingWrites()
{
    m_flushScheduled = false;
    if (m_pendingWrites.empty()) {
        return;
    }

    std::map<QString, PendingWrite> writes;
    writes.swap(m_pendingWrites);
    for (const auto &[key, write] : writes) {
        const QByteArray stamp = write.writtenAt.toUTC().toString(Qt::ISODateWithMs).toUtf8();
        const bool ok = m_store.write(eventsStoreKey(key), write.payload)
            && m_store.write(timestampStoreKey(key), stamp);
        if (!ok) {
            qCWarning(lcCache) << "unable to persist" << key;
            purgePersistent(key);
        }
    }
}

std::optional<QDateTime> EventCache::persistentTimestamp(const QString &key) const
{
    const auto raw = m_store.read(timestampStoreKey(key));
    if (!raw) {
        return std::nullopt;
    }
    const QDateTime stamp = QDateTime::fromString(QString::fromUtf8(*raw), Qt::ISODateWithMs);
    if (!stamp.isValid()) {
        return std::nullopt;
    }
    return stamp;
}

void EventCache::purgePersistent(const QString &key)
{
    m_pendingWrites.erase(key);
    m_store.remove(eventsStoreKey(key));
    m_store.remove(timestampStoreKey(key));
}

void EventCache::dropMemory(const QString &key)
{
    m_memory.erase(key);
    m_calendars.erase(key);
    m_accessOrder.erase(key);
}

void EventCache::touch(const QString &key)
{
    m_accessOrder[key] = ++m_accessCounter;
}

void EventCache::evictIfNeeded()
{
    if (m_options.maxMemoryEntries <= 0) {
        return;
    }
    while (static_cast<int>(m_memory.size()) > m_options.maxMemoryEntries) {
        const auto oldest = std::min_element(m_accessOrder.begin(), m_accessOrder.end(),
                                             [](const auto &lhs, const auto &rhs) {
                                                 return lhs.second < rhs.second;
                                             });
        if (oldest == m_accessOrder.end()) {
            return;
        }
        const QString key = oldest->first;
        qCDebug(lcCache) << "evicting" << key << "from memory";
        m_memory.erase(key);
        m_calendars.erase(key);
        m_accessOrder.erase(oldest);
    }
}

void EventCache::schedulePersistentWrite(const QString &key, PendingWrite write)
{
    m_pendingWrites[key] = std::move(write);
    if (m_flushScheduled) {
        return;
    }
    m_flushScheduled = true;
    QTimer::singleShot(0, this, &EventCache::flushPendingWrites);
}

} // namespace cache
} // namespace planner
