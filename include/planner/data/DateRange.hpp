#pragma once

#include <QDate>
#include <QDateTime>

namespace planner {
namespace data {

// Half-open range of calendar days [start, end).
struct DateRange
{
    QDate start;
    QDate end;

    bool isValid() const { return start.isValid() && end.isValid() && start < end; }
    bool contains(const QDate &day) const { return day >= start && day < end; }
    QDateTime startDateTime() const { return start.startOfDay(); }
    QDateTime endDateTime() const { return end.startOfDay(); }

    static DateRange monthContaining(const QDate &day);
    static DateRange weekContaining(const QDate &day);
    static DateRange paddedDay(const QDate &day, int paddingDays);
};

bool operator==(const DateRange &lhs, const DateRange &rhs);
bool operator!=(const DateRange &lhs, const DateRange &rhs);

} // namespace data
} // namespace planner
