#include "planner/layout/TimelineLayout.hpp"

#include <algorithm>

#include "planner/core/Logging.hpp"
#include "planner/data/EventDayIndex.hpp"

namespace planner {
namespace layout {

namespace {
constexpr double MinimumAllDayBlockHeight = 20.0;

struct Segment
{
    const data::CalendarEvent *event = nullptr;
    QDateTime start;
    QDateTime end;
};

bool intersects(const Segment &lhs, const Segment &rhs)
{
    return lhs.start < rhs.end && lhs.end > rhs.start;
}

std::optional<Segment> segmentOnDay(const data::CalendarEvent &event, const QDate &day)
{
    const QDateTime start = event.startTime().toLocalTime();
    const QDateTime end = event.endTime().toLocalTime();
    if (!start.isValid() || !end.isValid() || !data::occursOn(event, day)) {
        return std::nullopt;
    }

    const QDateTime dayStart = day.startOfDay();
    const QDateTime dayEnd(day, QTime(23, 59, 59));

    Segment segment;
    segment.event = &event;
    segment.start = start.date() < day ? dayStart : start;
    segment.end = end.date() > day ? dayEnd : end;
    if (segment.end < segment.start) {
        segment.end = segment.start;
    }
    return segment;
}
} // namespace

double timeToOffset(const QTime &time, const TimelineConfig &config)
{
    const double minutes = time.minute() + time.second() / 60.0;
    return (time.hour() - config.baseHour) * config.hourHeight + minutes * (config.hourHeight / 60.0);
}

double allDayBlockHeight(int eventCount, const TimelineConfig &config)
{
    if (eventCount <= 0) {
        return 0.0;
    }
    const double rows = eventCount * (config.allDayContentHeight + config.allDayPadding);
    return std::max(MinimumAllDayBlockHeight, rows);
}

std::vector<AllDayRow> layoutAllDayEvents(const QDate &day,
                                          const std::vector<data::CalendarEvent> &events,
                                          const TimelineConfig &config)
{
    std::vector<AllDayRow> rows;
    const double rowPitch = config.allDayContentHeight + config.allDayPadding;
    for (const auto &event : events) {
        if (!event.isAllDay() || !data::occursOn(event, day)) {
            continue;
        }
        AllDayRow row;
        row.event = &event;
        row.verticalOffset = static_cast<double>(rows.size()) * rowPitch;
        row.height = config.allDayContentHeight;
        row.width = config.columnWidth;
        row.isPersonal = event.account == data::AccountKind::Personal;
        rows.push_back(row);
    }
    return rows;
}

std::vector<EventLayout> layoutTimedEvents(const QDate &day,
                                           const std::vector<data::CalendarEvent> &events,
                                           const TimelineConfig &config)
{
    std::vector<Segment> segments;
    segments.reserve(events.size());
    for (const auto &event : events) {
        if (event.isAllDay()) {
            continue;
        }
        if (auto segment = segmentOnDay(event, day)) {
            segments.push_back(*segment);
        }
    }
    std::stable_sort(segments.begin(), segments.end(), [](const Segment &lhs, const Segment &rhs) {
        return lhs.start < rhs.start;
    });

    std::vector<std::vector<const Segment *>> clusters;
    for (const auto &segment : segments) {
        auto match = std::find_if(clusters.begin(), clusters.end(), [&segment](const auto &cluster) {
            return std::any_of(cluster.begin(), cluster.end(), [&segment](const Segment *member) {
                return intersects(*member, segment);
            });
        });
        if (match == clusters.end()) {
            clusters.push_back({ &segment });
        } else {
            match->push_back(&segment);
        }
    }

    std::vector<EventLayout> layouts;
    layouts.reserve(segments.size());
    for (int clusterIndex = 0; clusterIndex < static_cast<int>(clusters.size()); ++clusterIndex) {
        const auto &cluster = clusters[static_cast<std::size_t>(clusterIndex)];
        const int count = static_cast<int>(cluster.size());
        const double band = config.columnWidth / count;
        for (int column = 0; column < count; ++column) {
            const Segment &segment = *cluster[static_cast<std::size_t>(column)];
            const double durationHours = segment.start.secsTo(segment.end) / 3600.0;

            EventLayout layout;
            layout.event = segment.event;
            layout.verticalOffset = timeToOffset(segment.start.time(), config);
            layout.height = std::max(config.minEventHeight, durationHours * config.hourHeight);
            layout.columnWidth = std::max(0.0, band - config.columnGap);
            layout.horizontalOffset = column * band + config.columnGap / 2.0;
            layout.isPersonal = segment.event->account == data::AccountKind::Personal;
            layout.column = column;
            layout.columnCount = count;
            layout.cluster = clusterIndex;
            layouts.push_back(layout);
        }
    }
    return layouts;
}

std::optional<double> currentTimeOffset(const QDate &day, const QDateTime &now, const TimelineConfig &config)
{
    if (!now.isValid()) {
        return std::nullopt;
    }
    const QDateTime local = now.toLocalTime();
    if (local.date() != day) {
        return std::nullopt;
    }
    const int hour = local.time().hour();
    if (config.restrictIndicatorToWindow && (hour < config.baseHour || hour > config.endHour)) {
        return std::nullopt;
    }
    return timeToOffset(local.time(), config);
}

DayLayout layoutDay(const QDate &day,
                    const std::vector<data::CalendarEvent> &events,
                    const TimelineConfig &config,
                    const QDateTime &now)
{
    DayLayout result;
    result.allDayRows = layoutAllDayEvents(day, events, config);
    result.allDayBlockHeight = allDayBlockHeight(static_cast<int>(result.allDayRows.size()), config);
    result.timed = layoutTimedEvents(day, events, config);
    result.currentTimeOffset = currentTimeOffset(day, now, config);
    qCDebug(lcLayout) << day << ":" << result.allDayRows.size() << "all-day," << result.timed.size() << "timed";
    return result;
}

} // namespace layout
} // namespace planner
