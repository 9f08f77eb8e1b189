#include "planner/data/DateRange.hpp"

namespace planner {
namespace data {

DateRange DateRange::monthContaining(const QDate &day)
{
    if (!day.isValid()) {
        return {};
    }
    const QDate monthStart(day.year(), day.month(), 1);
    return { monthStart, monthStart.addMonths(1) };
}

DateRange DateRange::weekContaining(const QDate &day)
{
    if (!day.isValid()) {
        return {};
    }
    // Monday-first weeks.
    const QDate weekStart = day.addDays(-(day.dayOfWeek() - 1));
    return { weekStart, weekStart.addDays(7) };
}

DateRange DateRange::paddedDay(const QDate &day, int paddingDays)
{
    if (!day.isValid()) {
        return {};
    }
    const int padding = qMax(0, paddingDays);
    return { day.addDays(-padding), day.addDays(padding + 1) };
}

bool operator==(const DateRange &lhs, const DateRange &rhs)
{
    return lhs.start == rhs.start && lhs.end == rhs.end;
}

bool operator!=(const DateRange &lhs, const DateRange &rhs)
{
    return !(lhs == rhs);
}

} // namespace data
} // namespace planner
