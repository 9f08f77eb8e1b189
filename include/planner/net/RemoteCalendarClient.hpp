#pragma once

#include <QObject>
#include <optional>
#include <vector>

#include "planner/data/CalendarEvent.hpp"
#include "planner/data/DateRange.hpp"
#include "planner/net/CalendarError.hpp"

namespace planner {
namespace net {

// Result of one asynchronous fetch. finished() is always delivered through the event loop, so a
// caller may connect after receiving the request. The receiver of finished() owns the request
// and is expected to deleteLater() it.
class FetchRequest : public QObject
{
    Q_OBJECT

public:
    explicit FetchRequest(data::AccountKind account, QObject *parent = nullptr);
    ~FetchRequest() override;

    data::AccountKind account() const;
    bool isFinished() const;
    bool hasError() const;
    const std::optional<CalendarError> &error() const;
    const std::vector<data::CalendarSource> &calendars() const;
    const std::vector<data::CalendarEvent> &events() const;

    void finishWithCalendars(std::vector<data::CalendarSource> calendars);
    void finishWithEvents(std::vector<data::CalendarSource> calendars, std::vector<data::CalendarEvent> events);
    void finishWithError(CalendarError error);

signals:
    void finished();

private:
    bool markFinished();

    data::AccountKind m_account;
    bool m_finished = false;
    std::optional<CalendarError> m_error;
    std::vector<data::CalendarSource> m_calendars;
    std::vector<data::CalendarEvent> m_events;
};

class RemoteCalendarClient
{
public:
    virtual ~RemoteCalendarClient() = default;

    virtual FetchRequest *fetchCalendars(data::AccountKind account) = 0;
    // Resolves the account's calendars first; the finished request carries both lists.
    virtual FetchRequest *fetchEvents(data::AccountKind account, const data::DateRange &range) = 0;
};

} // namespace net
} // namespace planner
