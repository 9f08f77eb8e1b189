#pragma once

#include <QDate>
#include <map>
#include <vector>

#include "planner/data/CalendarEvent.hpp"

namespace planner {
namespace data {

bool occursOn(const CalendarEvent &event, const QDate &day);

// Ordering used for per-day lists: start, then end. Missing start sorts first, missing end last.
bool dayOrderLessThan(const CalendarEvent &lhs, const CalendarEvent &rhs);

class EventDayIndex
{
public:
    EventDayIndex() = default;
    explicit EventDayIndex(const std::vector<CalendarEvent> &events);

    void rebuild(const std::vector<CalendarEvent> &events);
    void clear();

    std::vector<CalendarEvent> eventsOn(const QDate &day) const;
    bool isEmpty() const;

private:
    std::map<QDate, std::vector<CalendarEvent>> m_days;
};

} // namespace data
} // namespace planner
