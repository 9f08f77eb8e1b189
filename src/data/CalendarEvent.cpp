#include "planner/data/CalendarEvent.hpp"

#include <algorithm>

namespace planner {
namespace data {

QString accountKindName(AccountKind kind)
{
    switch (kind) {
    case AccountKind::Professional:
        return QStringLiteral("professional");
    case AccountKind::Personal:
    default:
        return QStringLiteral("personal");
    }
}

std::optional<AccountKind> accountKindFromName(const QString &name)
{
    const QString normalized = name.trimmed().toLower();
    if (normalized == QLatin1String("personal")) {
        return AccountKind::Personal;
    }
    if (normalized == QLatin1String("professional")) {
        return AccountKind::Professional;
    }
    return std::nullopt;
}

EventDateTime EventDateTime::fromDate(const QDate &date)
{
    EventDateTime value;
    value.date = date;
    return value;
}

EventDateTime EventDateTime::fromDateTime(const QDateTime &dateTime, const QString &timeZone)
{
    EventDateTime value;
    value.dateTime = dateTime;
    value.timeZone = timeZone;
    return value;
}

QDateTime EventDateTime::resolved() const
{
    if (dateTime.isValid()) {
        return dateTime;
    }
    if (date.isValid()) {
        return date.startOfDay();
    }
    return {};
}

bool operator==(const EventDateTime &lhs, const EventDateTime &rhs)
{
    return lhs.date == rhs.date && lhs.dateTime == rhs.dateTime && lhs.timeZone == rhs.timeZone;
}

bool operator!=(const EventDateTime &lhs, const EventDateTime &rhs)
{
    return !(lhs == rhs);
}

bool operator==(const CalendarEvent &lhs, const CalendarEvent &rhs)
{
    return lhs.id == rhs.id
        && lhs.title == rhs.title
        && lhs.description == rhs.description
        && lhs.location == rhs.location
        && lhs.start == rhs.start
        && lhs.end == rhs.end
        && lhs.sourceCalendarId == rhs.sourceCalendarId
        && lhs.account == rhs.account
        && lhs.recurringInstanceId == rhs.recurringInstanceId
        && lhs.recurrenceRules == rhs.recurrenceRules;
}

bool operator!=(const CalendarEvent &lhs, const CalendarEvent &rhs)
{
    return !(lhs == rhs);
}

bool operator==(const CalendarSource &lhs, const CalendarSource &rhs)
{
    return lhs.id == rhs.id
        && lhs.displayName == rhs.displayName
        && lhs.description == rhs.description
        && lhs.foregroundColor == rhs.foregroundColor
        && lhs.backgroundColor == rhs.backgroundColor
        && lhs.isPrimary == rhs.isPrimary;
}

bool operator!=(const CalendarSource &lhs, const CalendarSource &rhs)
{
    return !(lhs == rhs);
}

void sortByStartTime(std::vector<CalendarEvent> &events)
{
    std::stable_sort(events.begin(), events.end(), [](const CalendarEvent &lhs, const CalendarEvent &rhs) {
        const QDateTime lhsStart = lhs.startTime();
        const QDateTime rhsStart = rhs.startTime();
        if (!lhsStart.isValid()) {
            return false;
        }
        if (!rhsStart.isValid()) {
            return true;
        }
        return lhsStart < rhsStart;
    });
}

} // namespace data
} // namespace planner
