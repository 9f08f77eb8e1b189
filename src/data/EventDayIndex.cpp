#include "planner/data/EventDayIndex.hpp"

#include <QTime>
#include <algorithm>
#include <utility>

#include "planner/core/Logging.hpp"

namespace planner {
namespace data {

namespace {
constexpr int MaxSpanDays = 366;

// First and last day (inclusive) an event occupies in local time.
std::pair<QDate, QDate> daySpan(const CalendarEvent &event)
{
    const QDateTime start = event.startTime();
    if (!start.isValid()) {
        return {};
    }

    if (event.isAllDay()) {
        const QDate startDay = event.start.date;
        const QDate exclusiveEnd = event.end.isDateOnly() ? event.end.date
                                                          : event.endTime().toLocalTime().date();
        if (!exclusiveEnd.isValid() || exclusiveEnd <= startDay) {
            return { startDay, startDay };
        }
        return { startDay, exclusiveEnd.addDays(-1) };
    }

    const QDate startDay = start.toLocalTime().date();
    const QDateTime end = event.endTime().toLocalTime();
    if (!end.isValid() || end <= start) {
        return { startDay, startDay };
    }
    QDate endDay = end.date();
    if (end.time() == QTime(0, 0) && endDay > startDay) {
        endDay = endDay.addDays(-1);
    }
    return { startDay, endDay };
}
} // namespace

bool occursOn(const CalendarEvent &event, const QDate &day)
{
    const auto [first, last] = daySpan(event);
    if (!first.isValid() || !day.isValid()) {
        return false;
    }
    return day >= first && day <= last;
}

bool dayOrderLessThan(const CalendarEvent &lhs, const CalendarEvent &rhs)
{
    const QDateTime lhsStart = lhs.startTime();
    const QDateTime rhsStart = rhs.startTime();
    if (lhsStart.isValid() != rhsStart.isValid()) {
        return !lhsStart.isValid();
    }
    if (lhsStart == rhsStart) {
        const QDateTime lhsEnd = lhs.endTime();
        const QDateTime rhsEnd = rhs.endTime();
        if (lhsEnd.isValid() != rhsEnd.isValid()) {
            return lhsEnd.isValid();
        }
        return lhsEnd < rhsEnd;
    }
    return lhsStart < rhsStart;
}

EventDayIndex::EventDayIndex(const std::vector<CalendarEvent> &events)
{
    rebuild(events);
}

void EventDayIndex::rebuild(const std::vector<CalendarEvent> &events)
{
    m_days.clear();
    for (const CalendarEvent &event : events) {
        const auto [first, last] = daySpan(event);
        if (!first.isValid()) {
            continue;
        }
        QDate lastDay = last;
        if (first.daysTo(lastDay) > MaxSpanDays) {
            qCDebug(lcData) << "clamping span of event" << event.id << "to" << MaxSpanDays << "days";
            lastDay = first.addDays(MaxSpanDays);
        }
        for (QDate day = first; day <= lastDay; day = day.addDays(1)) {
            m_days[day].push_back(event);
        }
    }
    for (auto &entry : m_days) {
        std::stable_sort(entry.second.begin(), entry.second.end(), dayOrderLessThan);
    }
}

void EventDayIndex::clear()
{
    m_days.clear();
}

std::vector<CalendarEvent> EventDayIndex::eventsOn(const QDate &day) const
{
    const auto it = m_days.find(day);
    if (it == m_days.end()) {
        return {};
    }
    return it->second;
}

bool EventDayIndex::isEmpty() const
{
    return m_days.empty();
}

} // namespace data
} // namespace planner
