#pragma once

#include <QString>
#include <QUrl>

#include "planner/cache/EventCache.hpp"
#include "planner/layout/TimelineLayout.hpp"

class QSettings;

namespace planner {
namespace core {

struct PlannerSettings
{
    qint64 memoryTtlSeconds = 30 * 60;
    qint64 persistentTtlSeconds = 24 * 60 * 60;
    int maxMemoryEntries = 6;
    QString cacheDirectory;

    QUrl apiBaseUrl = QUrl(QStringLiteral("https://www.googleapis.com/calendar/v3"));
    int requestTimeoutMs = 30000;

    double hourHeight = 80.0;
    int baseHour = 0;
    int endHour = 24;
    double minEventHeight = 20.0;

    // Missing or unusable values keep their defaults.
    static PlannerSettings fromSettings(const QSettings &settings);
    static QString defaultCacheDirectory();

    cache::EventCache::Options cacheOptions() const;
    layout::TimelineConfig timelineConfig(double columnWidth) const;
};

} // namespace core
} // namespace planner
