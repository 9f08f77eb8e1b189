#pragma once

#include <QByteArray>
#include <QJsonObject>
#include <QString>
#include <optional>
#include <vector>

#include "planner/data/CalendarEvent.hpp"

namespace planner {
namespace data {

// Remote service envelopes ({"items": [...]}). std::nullopt means the payload was not valid JSON.
std::optional<std::vector<CalendarEvent>> parseEventsResponse(const QByteArray &payload,
                                                              AccountKind account,
                                                              const QString &calendarId);
std::optional<std::vector<CalendarSource>> parseCalendarListResponse(const QByteArray &payload);

// Persistent cache format: a JSON array of events in wire shape plus calendarId and account.
QByteArray encodeEvents(const std::vector<CalendarEvent> &events);
std::optional<std::vector<CalendarEvent>> decodeEvents(const QByteArray &payload);

QJsonObject eventToJson(const CalendarEvent &event);
std::optional<CalendarEvent> eventFromJson(const QJsonObject &object);

} // namespace data
} // namespace planner
