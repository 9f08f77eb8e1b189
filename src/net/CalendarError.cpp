#include "planner/net/CalendarError.hpp"

#include <QObject>

namespace planner {
namespace net {

CalendarError CalendarError::auth(QString message)
{
    return { Kind::Auth, 0, std::move(message) };
}

CalendarError CalendarError::network(QString message)
{
    return { Kind::Network, 0, std::move(message) };
}

CalendarError CalendarError::api(int statusCode)
{
    return { Kind::Api, statusCode, QString() };
}

CalendarError CalendarError::decode(QString message)
{
    return { Kind::Decode, 0, std::move(message) };
}

CalendarError CalendarError::fromHttpStatus(int statusCode)
{
    if (statusCode == 401 || statusCode == 403) {
        CalendarError error = auth(QObject::tr("Access denied to Google Calendar"));
        error.statusCode = statusCode;
        return error;
    }
    return api(statusCode);
}

QString CalendarError::describe() const
{
    switch (kind) {
    case Kind::Auth:
        return message.isEmpty() ? QObject::tr("Failed to authenticate with Google Calendar") : message;
    case Kind::Api:
        return QObject::tr("Google Calendar API error: %1").arg(statusCode);
    case Kind::Decode:
        return QObject::tr("Invalid response from Google Calendar API");
    case Kind::Network:
    default:
        return QObject::tr("Network error: %1").arg(message);
    }
}

} // namespace net
} // namespace planner
