#pragma once

#include <QDate>
#include <QDateTime>
#include <QMetaType>
#include <QString>
#include <QStringList>
#include <optional>
#include <vector>

namespace planner {
namespace data {

enum class AccountKind
{
    Personal,
    Professional,
};

constexpr AccountKind AllAccountKinds[] = { AccountKind::Personal, AccountKind::Professional };

QString accountKindName(AccountKind kind);
std::optional<AccountKind> accountKindFromName(const QString &name);

struct CalendarSource
{
    QString id;
    QString displayName;
    QString description;
    QString foregroundColor;
    QString backgroundColor;
    std::optional<bool> isPrimary;
};

// Either a date-only value (all-day) or an instant with optional zone name.
struct EventDateTime
{
    QDate date;
    QDateTime dateTime;
    QString timeZone;

    static EventDateTime fromDate(const QDate &date);
    static EventDateTime fromDateTime(const QDateTime &dateTime, const QString &timeZone = QString());

    bool isDateOnly() const { return date.isValid(); }
    bool isValid() const { return date.isValid() || dateTime.isValid(); }
    QDateTime resolved() const;
};

struct CalendarEvent
{
    QString id;
    QString title;
    QString description;
    QString location;
    EventDateTime start;
    EventDateTime end;
    QString sourceCalendarId;
    AccountKind account = AccountKind::Personal;
    QString recurringInstanceId;
    QStringList recurrenceRules; // raw RRULE/EXDATE lines, never expanded

    bool isAllDay() const { return start.isDateOnly(); }
    bool isLikelyRecurring() const { return !recurringInstanceId.isEmpty() || !recurrenceRules.isEmpty(); }
    QDateTime startTime() const { return start.resolved(); }
    QDateTime endTime() const { return end.resolved(); }
};

bool operator==(const EventDateTime &lhs, const EventDateTime &rhs);
bool operator!=(const EventDateTime &lhs, const EventDateTime &rhs);
bool operator==(const CalendarEvent &lhs, const CalendarEvent &rhs);
bool operator!=(const CalendarEvent &lhs, const CalendarEvent &rhs);
bool operator==(const CalendarSource &lhs, const CalendarSource &rhs);
bool operator!=(const CalendarSource &lhs, const CalendarSource &rhs);

// Ascending by start; events without a resolvable start keep their relative order at the end.
void sortByStartTime(std::vector<CalendarEvent> &events);

} // namespace data
} // namespace planner

Q_DECLARE_METATYPE(planner::data::AccountKind)
