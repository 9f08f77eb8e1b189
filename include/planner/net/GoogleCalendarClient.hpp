#pragma once

#include <QObject>
#include <QUrl>
#include <functional>
#include <optional>
#include <vector>

#include "planner/net/RemoteCalendarClient.hpp"

class QNetworkAccessManager;
class QNetworkReply;

namespace planner {
namespace net {

class AccessTokenProvider;

// Google Calendar v3 style REST client. Only the first page of every listing is read.
class GoogleCalendarClient : public QObject, public RemoteCalendarClient
{
    Q_OBJECT

public:
    GoogleCalendarClient(QNetworkAccessManager &network,
                         const AccessTokenProvider &tokens,
                         QUrl baseUrl,
                         int requestTimeoutMs,
                         QObject *parent = nullptr);
    ~GoogleCalendarClient() override;

    FetchRequest *fetchCalendars(data::AccountKind account) override;
    FetchRequest *fetchEvents(data::AccountKind account, const data::DateRange &range) override;

    static QUrl calendarListUrl(const QUrl &baseUrl);
    static QUrl eventsUrl(const QUrl &baseUrl, const QString &calendarId, const data::DateRange &range);

private:
    using CalendarsCallback = std::function<void(std::optional<CalendarError>, std::vector<data::CalendarSource>)>;
    using EventsCallback = std::function<void(std::optional<CalendarError>, std::vector<data::CalendarEvent>)>;

    QNetworkReply *get(const QUrl &url, const QString &accessToken);
    void requestCalendars(const QString &accessToken, CalendarsCallback done);
    void requestEvents(data::AccountKind account,
                       const QString &accessToken,
                       const QString &calendarId,
                       const data::DateRange &range,
                       EventsCallback done);
    void setupReplyTimeout(QNetworkReply *reply) const;

    static std::optional<CalendarError> replyError(QNetworkReply *reply);

    QNetworkAccessManager &m_network;
    const AccessTokenProvider &m_tokens;
    QUrl m_baseUrl;
    int m_requestTimeoutMs = 0;
};

} // namespace net
} // namespace planner
