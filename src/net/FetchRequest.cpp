#include "planner/net/RemoteCalendarClient.hpp"

#include "planner/core/Logging.hpp"

namespace planner {
namespace net {

FetchRequest::FetchRequest(data::AccountKind account, QObject *parent)
    : QObject(parent)
    , m_account(account)
{
}

FetchRequest::~FetchRequest() = default;

data::AccountKind FetchRequest::account() const
{
    return m_account;
}

bool FetchRequest::isFinished() const
{
    return m_finished;
}

bool FetchRequest::hasError() const
{
    return m_error.has_value();
}

const std::optional<CalendarError> &FetchRequest::error() const
{
    return m_error;
}

const std::vector<data::CalendarSource> &FetchRequest::calendars() const
{
    return m_calendars;
}

const std::vector<data::CalendarEvent> &FetchRequest::events() const
{
    return m_events;
}

void FetchRequest::finishWithCalendars(std::vector<data::CalendarSource> calendars)
{
    if (!markFinished()) {
        return;
    }
    m_calendars = std::move(calendars);
    QMetaObject::invokeMethod(this, "finished", Qt::QueuedConnection);
}

void FetchRequest::finishWithEvents(std::vector<data::CalendarSource> calendars, std::vector<data::CalendarEvent> events)
{
    if (!markFinished()) {
        return;
    }
    m_calendars = std::move(calendars);
    m_events = std::move(events);
    QMetaObject::invokeMethod(this, "finished", Qt::QueuedConnection);
}

void FetchRequest::finishWithError(CalendarError error)
{
    if (!markFinished()) {
        return;
    }
    qCWarning(lcNet) << data::accountKindName(m_account) << "request failed:" << error.describe();
    m_error = std::move(error);
    QMetaObject::invokeMethod(this, "finished", Qt::QueuedConnection);
}

bool FetchRequest::markFinished()
{
    if (m_finished) {
        qCWarning(lcNet) << "request for" << data::accountKindName(m_account) << "finished twice";
        return false;
    }
    m_finished = true;
    return true;
}

} // namespace net
} // namespace planner
