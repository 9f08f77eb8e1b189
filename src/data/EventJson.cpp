#include "planner/data/EventJson.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>

#include "planner/core/Logging.hpp"

namespace planner {
namespace data {

namespace {
constexpr auto DATE_FORMAT = "yyyy-MM-dd";

EventDateTime parseDateTime(const QJsonObject &object)
{
    EventDateTime value;
    value.timeZone = object.value(QStringLiteral("timeZone")).toString();
    const QString dateString = object.value(QStringLiteral("date")).toString();
    if (!dateString.isEmpty()) {
        value.date = QDate::fromString(dateString, QLatin1String(DATE_FORMAT));
        return value;
    }
    const QString dateTimeString = object.value(QStringLiteral("dateTime")).toString();
    if (!dateTimeString.isEmpty()) {
        value.dateTime = QDateTime::fromString(dateTimeString, Qt::ISODateWithMs);
        if (!value.dateTime.isValid()) {
            value.dateTime = QDateTime::fromString(dateTimeString, Qt::ISODate);
        }
    }
    return value;
}

QJsonObject dateTimeToJson(const EventDateTime &value)
{
    QJsonObject object;
    if (value.date.isValid()) {
        object.insert(QStringLiteral("date"), value.date.toString(QLatin1String(DATE_FORMAT)));
    } else if (value.dateTime.isValid()) {
        object.insert(QStringLiteral("dateTime"), value.dateTime.toString(Qt::ISODateWithMs));
    }
    if (!value.timeZone.isEmpty()) {
        object.insert(QStringLiteral("timeZone"), value.timeZone);
    }
    return object;
}

std::optional<QJsonDocument> parseDocument(const QByteArray &payload)
{
    QJsonParseError error;
    const QJsonDocument document = QJsonDocument::fromJson(payload, &error);
    if (error.error != QJsonParseError::NoError) {
        qCWarning(lcData) << "unable to parse JSON payload:" << error.errorString()
                          << "at offset" << error.offset;
        return std::nullopt;
    }
    return document;
}

QJsonArray itemsOf(const QJsonDocument &document)
{
    return document.object().value(QStringLiteral("items")).toArray();
}
} // namespace

QJsonObject eventToJson(const CalendarEvent &event)
{
    QJsonObject object;
    object.insert(QStringLiteral("id"), event.id);
    object.insert(QStringLiteral("summary"), event.title);
    if (!event.description.isEmpty()) {
        object.insert(QStringLiteral("description"), event.description);
    }
    if (!event.location.isEmpty()) {
        object.insert(QStringLiteral("location"), event.location);
    }
    object.insert(QStringLiteral("start"), dateTimeToJson(event.start));
    object.insert(QStringLiteral("end"), dateTimeToJson(event.end));
    if (!event.sourceCalendarId.isEmpty()) {
        object.insert(QStringLiteral("calendarId"), event.sourceCalendarId);
    }
    object.insert(QStringLiteral("account"), accountKindName(event.account));
    if (!event.recurringInstanceId.isEmpty()) {
        object.insert(QStringLiteral("recurringEventId"), event.recurringInstanceId);
    }
    if (!event.recurrenceRules.isEmpty()) {
        object.insert(QStringLiteral("recurrence"), QJsonArray::fromStringList(event.recurrenceRules));
    }
    return object;
}

std::optional<CalendarEvent> eventFromJson(const QJsonObject &object)
{
    const QString id = object.value(QStringLiteral("id")).toString();
    if (id.isEmpty()) {
        return std::nullopt;
    }

    CalendarEvent event;
    event.id = id;
    event.title = object.value(QStringLiteral("summary")).toString();
    event.description = object.value(QStringLiteral("description")).toString();
    event.location = object.value(QStringLiteral("location")).toString();
    event.start = parseDateTime(object.value(QStringLiteral("start")).toObject());
    event.end = parseDateTime(object.value(QStringLiteral("end")).toObject());
    event.sourceCalendarId = object.value(QStringLiteral("calendarId")).toString();
    event.account = accountKindFromName(object.value(QStringLiteral("account")).toString())
                        .value_or(AccountKind::Personal);
    event.recurringInstanceId = object.value(QStringLiteral("recurringEventId")).toString();

    const QJsonArray recurrence = object.value(QStringLiteral("recurrence")).toArray();
    for (const QJsonValue &rule : recurrence) {
        const QString text = rule.toString();
        if (!text.isEmpty()) {
            event.recurrenceRules << text;
        }
    }
    return event;
}

std::optional<std::vector<CalendarEvent>> parseEventsResponse(const QByteArray &payload,
                                                              AccountKind account,
                                                              const QString &calendarId)
{
    const auto document = parseDocument(payload);
    if (!document || !document->isObject()) {
        return std::nullopt;
    }

    std::vector<CalendarEvent> events;
    const QJsonArray items = itemsOf(*document);
    events.reserve(static_cast<size_t>(items.size()));
    for (const QJsonValue &item : items) {
        auto event = eventFromJson(item.toObject());
        if (!event) {
            continue;
        }
        event->sourceCalendarId = calendarId;
        event->account = account;
        events.push_back(std::move(*event));
    }
    return events;
}

std::optional<std::vector<CalendarSource>> parseCalendarListResponse(const QByteArray &payload)
{
    const auto document = parseDocument(payload);
    if (!document || !document->isObject()) {
        return std::nullopt;
    }

    std::vector<CalendarSource> calendars;
    const QJsonArray items = itemsOf(*document);
    calendars.reserve(static_cast<size_t>(items.size()));
    for (const QJsonValue &item : items) {
        const QJsonObject object = item.toObject();
        const QString id = object.value(QStringLiteral("id")).toString();
        if (id.isEmpty()) {
            continue;
        }
        CalendarSource source;
        source.id = id;
        source.displayName = object.value(QStringLiteral("summary")).toString();
        source.description = object.value(QStringLiteral("description")).toString();
        source.foregroundColor = object.value(QStringLiteral("foregroundColor")).toString();
        source.backgroundColor = object.value(QStringLiteral("backgroundColor")).toString();
        if (object.contains(QStringLiteral("primary"))) {
            source.isPrimary = object.value(QStringLiteral("primary")).toBool();
        }
        calendars.push_back(std::move(source));
    }
    return calendars;
}

QByteArray encodeEvents(const std::vector<CalendarEvent> &events)
{
    QJsonArray array;
    for (const CalendarEvent &event : events) {
        array.append(eventToJson(event));
    }
    return QJsonDocument(array).toJson(QJsonDocument::Compact);
}

std::optional<std::vector<CalendarEvent>> decodeEvents(const QByteArray &payload)
{
    const auto document = parseDocument(payload);
    if (!document || !document->isArray()) {
        return std::nullopt;
    }

    std::vector<CalendarEvent> events;
    const QJsonArray array = document->array();
    events.reserve(static_cast<size_t>(array.size()));
    for (const QJsonValue &value : array) {
        if (!value.isObject()) {
            return std::nullopt;
        }
        auto event = eventFromJson(value.toObject());
        if (!event) {
            return std::nullopt;
        }
        events.push_back(std::move(*event));
    }
    return events;
}

} // namespace data
} // namespace planner
