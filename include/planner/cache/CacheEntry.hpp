#pragma once

#include <QDateTime>
#include <QString>
#include <QtGlobal>

#include "planner/data/CalendarEvent.hpp"
#include "planner/data/DateRange.hpp"

namespace planner {
namespace cache {

inline bool isWithinTtl(const QDateTime &writtenAt, const QDateTime &now, qint64 ttlSeconds)
{
    return writtenAt.isValid() && writtenAt.msecsTo(now) < ttlSeconds * 1000;
}

template<typename T>
struct CacheEntry
{
    T payload;
    QDateTime writtenAt;

    bool isValid(const QDateTime &now, qint64 ttlSeconds) const
    {
        return isWithinTtl(writtenAt, now, ttlSeconds);
    }
};

// "<account>_<yyyy-MM-dd>_<yyyy-MM-dd>"
QString cacheKey(data::AccountKind account, const QDate &start, const QDate &end);
QString cacheKey(data::AccountKind account, const data::DateRange &range);

} // namespace cache
} // namespace planner
