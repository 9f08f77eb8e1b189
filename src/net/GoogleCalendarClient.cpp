#include "planner/net/GoogleCalendarClient.hpp"

#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QPointer>
#include <QTimer>
#include <QUrlQuery>
#include <memory>

#include "planner/core/Logging.hpp"
#include "planner/data/EventJson.hpp"
#include "planner/net/AccessTokenProvider.hpp"

namespace planner {
namespace net {

namespace {
const char *TimedOutProperty = "plannerTimedOut";

struct EventsFetchState
{
    QPointer<FetchRequest> request;
    std::vector<data::CalendarSource> calendars;
    std::vector<data::CalendarEvent> events;
    std::optional<CalendarError> firstError;
    int pending = 0;
    int succeeded = 0;
};

QString rfc3339(const QDateTime &value)
{
    return value.toUTC().toString(Qt::ISODate);
}
} // namespace

GoogleCalendarClient::GoogleCalendarClient(QNetworkAccessManager &network,
                                           const AccessTokenProvider &tokens,
                                           QUrl baseUrl,
                                           int requestTimeoutMs,
                                           QObject *parent)
    : QObject(parent)
    , m_network(network)
    , m_tokens(tokens)
    , m_baseUrl(std::move(baseUrl))
    , m_requestTimeoutMs(requestTimeoutMs)
{
}

GoogleCalendarClient::~GoogleCalendarClient() = default;

QUrl GoogleCalendarClient::calendarListUrl(const QUrl &baseUrl)
{
    QUrl url(baseUrl);
    url.setPath(baseUrl.path() + QStringLiteral("/users/me/calendarList"));
    return url;
}

QUrl GoogleCalendarClient::eventsUrl(const QUrl &baseUrl, const QString &calendarId, const data::DateRange &range)
{
    QUrl url(baseUrl);
    const QString encodedId = QString::fromLatin1(QUrl::toPercentEncoding(calendarId));
    url.setPath(baseUrl.path() + QStringLiteral("/calendars/") + encodedId + QStringLiteral("/events"));

    QUrlQuery query;
    query.addQueryItem(QStringLiteral("timeMin"), rfc3339(range.startDateTime()));
    query.addQueryItem(QStringLiteral("timeMax"), rfc3339(range.endDateTime()));
    query.addQueryItem(QStringLiteral("singleEvents"), QStringLiteral("true"));
    query.addQueryItem(QStringLiteral("orderBy"), QStringLiteral("startTime"));
    url.setQuery(query);
    return url;
}

FetchRequest *GoogleCalendarClient::fetchCalendars(data::AccountKind account)
{
    auto *request = new FetchRequest(account);
    const auto token = m_tokens.accessToken(account);
    if (!token) {
        request->finishWithError(CalendarError::auth(tr("No access token available")));
        return request;
    }

    QPointer<FetchRequest> guard(request);
    requestCalendars(*token, [guard](std::optional<CalendarError> error, std::vector<data::CalendarSource> calendars) {
        if (!guard) {
            return;
        }
        if (error) {
            guard->finishWithError(std::move(*error));
            return;
        }
        guard->finishWithCalendars(std::move(calendars));
    });
    return request;
}

FetchRequest *GoogleCalendarClient::fetchEvents(data::AccountKind account, const data::DateRange &range)
{
    auto *request = new FetchRequest(account);
    if (!range.isValid()) {
        request->finishWithError(CalendarError::api(400));
        return request;
    }
    const auto token = m_tokens.accessToken(account);
    if (!token) {
        request->finishWithError(CalendarError::auth(tr("No access token available")));
        return request;
    }

    QPointer<FetchRequest> guard(request);
    const QString accessToken = *token;
    requestCalendars(accessToken, [this, guard, account, accessToken, range](std::optional<CalendarError> error,
                                                                            std::vector<data::CalendarSource> calendars) {
        if (!guard) {
            return;
        }
        if (error) {
            guard->finishWithError(std::move(*error));
            return;
        }
        if (calendars.empty()) {
            guard->finishWithEvents({}, {});
            return;
        }

        auto state = std::make_shared<EventsFetchState>();
        state->request = guard;
        state->calendars = calendars;
        state->pending = static_cast<int>(calendars.size());

        for (const data::CalendarSource &calendar : calendars) {
            const QString calendarId = calendar.id;
            requestEvents(account, accessToken, calendarId, range,
                          [state, calendarId](std::optional<CalendarError> error, std::vector<data::CalendarEvent> events) {
                if (error) {
                    qCWarning(lcNet) << "skipping events of calendar" << calendarId << ":" << error->describe();
                    if (!state->firstError) {
                        state->firstError = std::move(error);
                    }
                } else {
                    ++state->succeeded;
                    state->events.insert(state->events.end(),
                                         std::make_move_iterator(events.begin()),
                                         std::make_move_iterator(events.end()));
                }

                if (--state->pending > 0 || !state->request) {
                    return;
                }
                if (state->succeeded == 0 && state->firstError) {
                    state->request->finishWithError(std::move(*state->firstError));
                    return;
                }
                data::sortByStartTime(state->events);
                state->request->finishWithEvents(std::move(state->calendars), std::move(state->events));
            });
        }
    });
    return request;
}

QNetworkReply *GoogleCalendarClient::get(const QUrl &url, const QString &accessToken)
{
    QNetworkRequest request(url);
    request.setRawHeader(QByteArrayLiteral("Authorization"), QByteArrayLiteral("Bearer ") + accessToken.toUtf8());
    request.setRawHeader(QByteArrayLiteral("Accept"), QByteArrayLiteral("application/json"));

    qCDebug(lcNet) << "GET" << url.toString();
    QNetworkReply *reply = m_network.get(request);
    setupReplyTimeout(reply);
    return reply;
}

void GoogleCalendarClient::requestCalendars(const QString &accessToken, CalendarsCallback done)
{
    QNetworkReply *reply = get(calendarListUrl(m_baseUrl), accessToken);
    connect(reply, &QNetworkReply::finished, this, [reply, done]() {
        reply->deleteLater();
        if (auto error = replyError(reply)) {
            done(std::move(error), {});
            return;
        }
        auto calendars = data::parseCalendarListResponse(reply->readAll());
        if (!calendars) {
            done(CalendarError::decode(QStringLiteral("calendar list")), {});
            return;
        }
        qCDebug(lcNet) << "received" << calendars->size() << "calendars";
        done(std::nullopt, std::move(*calendars));
    });
}

void GoogleCalendarClient::requestEvents(data::AccountKind account,
                                         const QString &accessToken,
                                         const QString &calendarId,
                                         const data::DateRange &range,
                                         EventsCallback done)
{
    QNetworkReply *reply = get(eventsUrl(m_baseUrl, calendarId, range), accessToken);
    connect(reply, &QNetworkReply::finished, this, [reply, account, calendarId, done]() {
        reply->deleteLater();
        if (auto error = replyError(reply)) {
            done(std::move(error), {});
            return;
        }
        auto events = data::parseEventsResponse(reply->readAll(), account, calendarId);
        if (!events) {
            done(CalendarError::decode(QStringLiteral("events of ") + calendarId), {});
            return;
        }
        done(std::nullopt, std::move(*events));
    });
}

void GoogleCalendarClient::setupReplyTimeout(QNetworkReply *reply) const
{
    if (m_requestTimeoutMs <= 0 || !reply) {
        return;
    }
    auto *timer = new QTimer(reply);
    timer->setSingleShot(true);
    connect(timer, &QTimer::timeout, reply, [reply]() {
        if (reply->isRunning()) {
            reply->setProperty(TimedOutProperty, true);
            reply->abort();
        }
    });
    timer->start(m_requestTimeoutMs);
}

std::optional<CalendarError> GoogleCalendarClient::replyError(QNetworkReply *reply)
{
    if (reply->property(TimedOutProperty).toBool()) {
        return CalendarError::network(tr("request timed out"));
    }
    const QVariant status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    if (status.isValid()) {
        const int code = status.toInt();
        if (code < 200 || code >= 300) {
            return CalendarError::fromHttpStatus(code);
        }
    }
    if (reply->error() != QNetworkReply::NoError) {
        return CalendarError::network(reply->errorString());
    }
    return std::nullopt;
}

} // namespace net
} // namespace planner
