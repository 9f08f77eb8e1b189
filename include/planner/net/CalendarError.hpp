#pragma once

#include <QString>

namespace planner {
namespace net {

struct CalendarError
{
    enum class Kind
    {
        Auth,
        Network,
        Api,
        Decode,
    };

    Kind kind = Kind::Network;
    int statusCode = 0;
    QString message;

    static CalendarError auth(QString message);
    static CalendarError network(QString message);
    static CalendarError api(int statusCode);
    static CalendarError decode(QString message);

    // Maps an HTTP status to Auth (401/403) or Api (anything else outside 2xx).
    static CalendarError fromHttpStatus(int statusCode);

    QString describe() const;
};

} // namespace net
} // namespace planner
