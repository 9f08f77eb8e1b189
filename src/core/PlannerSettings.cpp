#include "planner/core/PlannerSettings.hpp"

#include <QDir>
#include <QSettings>
#include <QStandardPaths>

#include "planner/core/Logging.hpp"

namespace planner {
namespace core {

namespace {
template<typename T>
T positiveValue(const QSettings &settings, const QString &key, T fallback)
{
    if (!settings.contains(key)) {
        return fallback;
    }
    bool ok = false;
    const double value = settings.value(key).toDouble(&ok);
    if (!ok || value <= 0) {
        qCWarning(lcCore) << "ignoring setting" << key << "=" << settings.value(key);
        return fallback;
    }
    return static_cast<T>(value);
}

int hourValue(const QSettings &settings, const QString &key, int fallback)
{
    if (!settings.contains(key)) {
        return fallback;
    }
    bool ok = false;
    const int value = settings.value(key).toInt(&ok);
    if (!ok || value < 0 || value > 24) {
        qCWarning(lcCore) << "ignoring setting" << key << "=" << settings.value(key);
        return fallback;
    }
    return value;
}
} // namespace

PlannerSettings PlannerSettings::fromSettings(const QSettings &settings)
{
    PlannerSettings result;
    result.memoryTtlSeconds = positiveValue<qint64>(settings, QStringLiteral("cache/memoryTtlSeconds"),
                                                    result.memoryTtlSeconds);
    result.persistentTtlSeconds = positiveValue<qint64>(settings, QStringLiteral("cache/persistentTtlSeconds"),
                                                        result.persistentTtlSeconds);
    result.maxMemoryEntries = positiveValue<int>(settings, QStringLiteral("cache/maxMemoryEntries"),
                                                 result.maxMemoryEntries);
    result.cacheDirectory = settings.value(QStringLiteral("cache/directory")).toString();
    if (result.cacheDirectory.isEmpty()) {
        result.cacheDirectory = defaultCacheDirectory();
    }

    const QUrl baseUrl(settings.value(QStringLiteral("network/apiBaseUrl")).toString());
    if (baseUrl.isValid() && !baseUrl.isRelative()) {
        result.apiBaseUrl = baseUrl;
    }
    result.requestTimeoutMs = positiveValue<int>(settings, QStringLiteral("network/requestTimeoutMs"),
                                                 result.requestTimeoutMs);

    result.hourHeight = positiveValue<double>(settings, QStringLiteral("timeline/hourHeight"), result.hourHeight);
    result.baseHour = hourValue(settings, QStringLiteral("timeline/baseHour"), result.baseHour);
    result.endHour = hourValue(settings, QStringLiteral("timeline/endHour"), result.endHour);
    if (result.endHour <= result.baseHour) {
        qCWarning(lcCore) << "timeline window" << result.baseHour << "-" << result.endHour << "is empty, using 0-24";
        result.baseHour = 0;
        result.endHour = 24;
    }
    result.minEventHeight = positiveValue<double>(settings, QStringLiteral("timeline/minEventHeight"),
                                                  result.minEventHeight);
    return result;
}

QString PlannerSettings::defaultCacheDirectory()
{
    QString dataFolder = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (dataFolder.isEmpty()) {
        dataFolder = QDir::homePath() + QStringLiteral("/.local/share/planner");
    }
    return QDir(dataFolder).filePath(QStringLiteral("event-cache"));
}

cache::EventCache::Options PlannerSettings::cacheOptions() const
{
    cache::EventCache::Options options;
    options.memoryTtlSeconds = memoryTtlSeconds;
    options.persistentTtlSeconds = persistentTtlSeconds;
    options.maxMemoryEntries = maxMemoryEntries;
    return options;
}

layout::TimelineConfig PlannerSettings::timelineConfig(double columnWidth) const
{
    layout::TimelineConfig config;
    config.hourHeight = hourHeight;
    config.baseHour = baseHour;
    config.endHour = endHour;
    config.columnWidth = columnWidth;
    config.minEventHeight = minEventHeight;
    return config;
}

} // namespace core
} // namespace planner
