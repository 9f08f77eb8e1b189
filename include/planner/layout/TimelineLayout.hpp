#pragma once

#include <QDate>
#include <QDateTime>
#include <QTime>
#include <optional>
#include <vector>

#include "planner/data/CalendarEvent.hpp"

namespace planner {
namespace layout {

struct TimelineConfig
{
    double hourHeight = 80.0;
    int baseHour = 0;
    int endHour = 24;
    double columnWidth = 0.0;
    double minEventHeight = 20.0;
    double columnGap = 4.0;
    double allDayContentHeight = 20.0;
    double allDayPadding = 4.0;
    bool restrictIndicatorToWindow = false;
};

// Geometry of one timed event inside a single day column. `event` points into the list that was
// laid out and is only valid while that list is.
struct EventLayout
{
    const data::CalendarEvent *event = nullptr;
    double verticalOffset = 0.0;
    double height = 0.0;
    double columnWidth = 0.0;
    double horizontalOffset = 0.0;
    bool isPersonal = false;
    int column = 0;
    int columnCount = 1;
    int cluster = 0;
};

struct AllDayRow
{
    const data::CalendarEvent *event = nullptr;
    double verticalOffset = 0.0;
    double height = 0.0;
    double width = 0.0;
    bool isPersonal = false;
};

struct DayLayout
{
    std::vector<AllDayRow> allDayRows;
    double allDayBlockHeight = 0.0;
    std::vector<EventLayout> timed;
    std::optional<double> currentTimeOffset;
};

double timeToOffset(const QTime &time, const TimelineConfig &config);

// Zero when there is nothing to show, otherwise never less than one minimum row.
double allDayBlockHeight(int eventCount, const TimelineConfig &config);

std::vector<AllDayRow> layoutAllDayEvents(const QDate &day,
                                          const std::vector<data::CalendarEvent> &events,
                                          const TimelineConfig &config);

/*
 * Events are visited in start order. Each one joins the first existing cluster holding an event it
 * overlaps, or opens a new cluster. A cluster of k events is split into k equal bands in the same
 * order. Multi-day events are clipped to the rendered day.
 */
std::vector<EventLayout> layoutTimedEvents(const QDate &day,
                                           const std::vector<data::CalendarEvent> &events,
                                           const TimelineConfig &config);

std::optional<double> currentTimeOffset(const QDate &day, const QDateTime &now, const TimelineConfig &config);

DayLayout layoutDay(const QDate &day,
                    const std::vector<data::CalendarEvent> &events,
                    const TimelineConfig &config,
                    const QDateTime &now);

} // namespace layout
} // namespace planner
