#include <QtTest/QtTest>
#include <QUrlQuery>
#include <memory>

#include "FakeNetworkAccessManager.hpp"
#include "FakeTokenProvider.hpp"
#include "planner/net/GoogleCalendarClient.hpp"

using namespace planner;

namespace {

const QUrl BaseUrl(QStringLiteral("https://calendar.test/v3"));
const data::DateRange March = data::DateRange::monthContaining(QDate(2024, 3, 1));

const QByteArray CalendarList = R"({"items": [
    {"id": "home", "summary": "Home", "primary": true},
    {"id": "team/calendar", "summary": "Team"}
]})";

const QByteArray HomeEvents = R"({"items": [
    {"id": "h1", "summary": "Groceries",
     "start": {"dateTime": "2024-03-04T10:00:00Z"}, "end": {"dateTime": "2024-03-04T10:30:00Z"}}
]})";

const QByteArray TeamEvents = R"({"items": [
    {"id": "t2", "summary": "Offsite", "start": {"date": "2024-03-06"}, "end": {"date": "2024-03-07"}},
    {"id": "t1", "summary": "Planning",
     "start": {"dateTime": "2024-03-04T08:00:00Z"}, "end": {"dateTime": "2024-03-04T09:00:00Z"}}
]})";

testing::CannedResponse ok(const QByteArray &body)
{
    testing::CannedResponse response;
    response.body = body;
    return response;
}

testing::CannedResponse status(int code)
{
    testing::CannedResponse response;
    response.status = code;
    response.body = R"({"error": {"code": 0}})";
    return response;
}

} // namespace

class GoogleCalendarClientTest : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void buildsEventsQuery();
    void buildsCalendarListUrl();
    void fetchesCalendars();
    void mergesEventsOfAllCalendars();
    void sendsBearerToken();
    void skipsFailingCalendar();
    void reportsFailureWhenEveryCalendarFails();
    void mapsUnauthorizedToAuthError();
    void mapsServerErrorToApiError();
    void requiresAccessToken();
    void reportsTransportFailure();
    void timesOutStalledRequest();
    void reportsUndecodableResponse();

private:
    std::unique_ptr<net::FetchRequest> waitFor(net::FetchRequest *request);

    std::unique_ptr<testing::FakeNetworkAccessManager> m_network;
    std::unique_ptr<testing::FakeTokenProvider> m_tokens;
    std::unique_ptr<net::GoogleCalendarClient> m_client;
};

void GoogleCalendarClientTest::init()
{
    m_network = std::make_unique<testing::FakeNetworkAccessManager>();
    m_tokens = std::make_unique<testing::FakeTokenProvider>();
    m_tokens->link(data::AccountKind::Personal, QStringLiteral("secret"));
    m_client = std::make_unique<net::GoogleCalendarClient>(*m_network, *m_tokens, BaseUrl, 5000);

    m_network->setResponse(QStringLiteral("/users/me/calendarList"), ok(CalendarList));
    m_network->setResponse(QStringLiteral("/calendars/home/events"), ok(HomeEvents));
    m_network->setResponse(QStringLiteral("/calendars/team%2Fcalendar/events"), ok(TeamEvents));
}

void GoogleCalendarClientTest::cleanup()
{
    m_client.reset();
    m_tokens.reset();
    m_network.reset();
}

std::unique_ptr<net::FetchRequest> GoogleCalendarClientTest::waitFor(net::FetchRequest *request)
{
    std::unique_ptr<net::FetchRequest> owned(request);
    QSignalSpy spy(request, &net::FetchRequest::finished);
    if (spy.isEmpty()) {
        spy.wait(2000);
    }
    return owned;
}

void GoogleCalendarClientTest::buildsEventsQuery()
{
    const QUrl url = net::GoogleCalendarClient::eventsUrl(BaseUrl, QStringLiteral("team/calendar"), March);
    QCOMPARE(url.host(), QStringLiteral("calendar.test"));
    QCOMPARE(url.path(QUrl::FullyEncoded), QStringLiteral("/v3/calendars/team%2Fcalendar/events"));

    const QUrlQuery query(url);
    QCOMPARE(query.queryItemValue(QStringLiteral("timeMin")), March.startDateTime().toUTC().toString(Qt::ISODate));
    QCOMPARE(query.queryItemValue(QStringLiteral("timeMax")), March.endDateTime().toUTC().toString(Qt::ISODate));
    QCOMPARE(query.queryItemValue(QStringLiteral("singleEvents")), QStringLiteral("true"));
    QCOMPARE(query.queryItemValue(QStringLiteral("orderBy")), QStringLiteral("startTime"));
}

void GoogleCalendarClientTest::buildsCalendarListUrl()
{
    QCOMPARE(net::GoogleCalendarClient::calendarListUrl(BaseUrl).toString(),
             QStringLiteral("https://calendar.test/v3/users/me/calendarList"));
}

void GoogleCalendarClientTest::fetchesCalendars()
{
    const auto request = waitFor(m_client->fetchCalendars(data::AccountKind::Personal));
    QVERIFY(request->isFinished());
    QVERIFY(!request->hasError());
    QCOMPARE(request->calendars().size(), static_cast<size_t>(2));
    QCOMPARE(request->calendars().front().displayName, QStringLiteral("Home"));
    QCOMPARE(m_network->requests().size(), 1);
}

void GoogleCalendarClientTest::mergesEventsOfAllCalendars()
{
    const auto request = waitFor(m_client->fetchEvents(data::AccountKind::Personal, March));
    QVERIFY(request->isFinished());
    QVERIFY(!request->hasError());

    const auto &events = request->events();
    QCOMPARE(events.size(), static_cast<size_t>(3));
    QCOMPARE(events[0].id, QStringLiteral("t1"));
    QCOMPARE(events[1].id, QStringLiteral("h1"));
    QCOMPARE(events[2].id, QStringLiteral("t2"));
    QCOMPARE(events[0].sourceCalendarId, QStringLiteral("team/calendar"));
    QCOMPARE(events[1].sourceCalendarId, QStringLiteral("home"));
    for (const auto &event : events) {
        QCOMPARE(event.account, data::AccountKind::Personal);
    }
    QCOMPARE(request->calendars().size(), static_cast<size_t>(2));
    QCOMPARE(m_network->requests().size(), 3);
}

void GoogleCalendarClientTest::sendsBearerToken()
{
    const auto request = waitFor(m_client->fetchEvents(data::AccountKind::Personal, March));
    QVERIFY(request->isFinished());
    QVERIFY(!m_network->requests().isEmpty());
    for (const QNetworkRequest &sent : m_network->requests()) {
        QCOMPARE(sent.rawHeader("Authorization"), QByteArray("Bearer secret"));
    }
}

void GoogleCalendarClientTest::skipsFailingCalendar()
{
    m_network->setResponse(QStringLiteral("/calendars/team%2Fcalendar/events"), status(500));
    const auto request = waitFor(m_client->fetchEvents(data::AccountKind::Personal, March));
    QVERIFY(request->isFinished());
    QVERIFY(!request->hasError());
    QCOMPARE(request->events().size(), static_cast<size_t>(1));
    QCOMPARE(request->events().front().id, QStringLiteral("h1"));
}

void GoogleCalendarClientTest::reportsFailureWhenEveryCalendarFails()
{
    m_network->setResponse(QStringLiteral("/calendars/home/events"), status(503));
    m_network->setResponse(QStringLiteral("/calendars/team%2Fcalendar/events"), status(503));
    const auto request = waitFor(m_client->fetchEvents(data::AccountKind::Personal, March));
    QVERIFY(request->hasError());
    QCOMPARE(request->error()->kind, net::CalendarError::Kind::Api);
    QCOMPARE(request->error()->statusCode, 503);
    QVERIFY(request->events().empty());
}

void GoogleCalendarClientTest::mapsUnauthorizedToAuthError()
{
    m_network->setResponse(QStringLiteral("/users/me/calendarList"), status(401));
    const auto request = waitFor(m_client->fetchEvents(data::AccountKind::Personal, March));
    QVERIFY(request->hasError());
    QCOMPARE(request->error()->kind, net::CalendarError::Kind::Auth);
    QCOMPARE(request->error()->statusCode, 401);
    QCOMPARE(request->error()->describe(), QStringLiteral("Access denied to Google Calendar"));
    QCOMPARE(m_network->requests().size(), 1);

    m_network->setResponse(QStringLiteral("/users/me/calendarList"), status(403));
    const auto forbidden = waitFor(m_client->fetchCalendars(data::AccountKind::Personal));
    QCOMPARE(forbidden->error()->kind, net::CalendarError::Kind::Auth);
}

void GoogleCalendarClientTest::mapsServerErrorToApiError()
{
    m_network->setResponse(QStringLiteral("/users/me/calendarList"), status(500));
    const auto request = waitFor(m_client->fetchCalendars(data::AccountKind::Personal));
    QVERIFY(request->hasError());
    QCOMPARE(request->error()->kind, net::CalendarError::Kind::Api);
    QCOMPARE(request->error()->describe(), QStringLiteral("Google Calendar API error: 500"));
}

void GoogleCalendarClientTest::requiresAccessToken()
{
    m_tokens->linkWithoutToken(data::AccountKind::Professional);
    const auto request = waitFor(m_client->fetchEvents(data::AccountKind::Professional, March));
    QVERIFY(request->hasError());
    QCOMPARE(request->error()->kind, net::CalendarError::Kind::Auth);
    QCOMPARE(request->error()->describe(), QStringLiteral("No access token available"));
    QVERIFY(m_network->requests().isEmpty());
}

void GoogleCalendarClientTest::reportsTransportFailure()
{
    testing::CannedResponse unreachable;
    unreachable.transportError = QNetworkReply::HostNotFoundError;
    m_network->setResponse(QStringLiteral("/users/me/calendarList"), unreachable);

    const auto request = waitFor(m_client->fetchCalendars(data::AccountKind::Personal));
    QVERIFY(request->hasError());
    QCOMPARE(request->error()->kind, net::CalendarError::Kind::Network);
    QVERIFY(request->error()->describe().startsWith(QStringLiteral("Network error: ")));
}

void GoogleCalendarClientTest::timesOutStalledRequest()
{
    testing::CannedResponse stalled;
    stalled.hang = true;
    m_network->setResponse(QStringLiteral("/users/me/calendarList"), stalled);
    m_client = std::make_unique<net::GoogleCalendarClient>(*m_network, *m_tokens, BaseUrl, 50);

    const auto request = waitFor(m_client->fetchCalendars(data::AccountKind::Personal));
    QVERIFY(request->isFinished());
    QCOMPARE(request->error()->kind, net::CalendarError::Kind::Network);
}

void GoogleCalendarClientTest::reportsUndecodableResponse()
{
    m_network->setResponse(QStringLiteral("/users/me/calendarList"), ok("<html>maintenance</html>"));
    const auto request = waitFor(m_client->fetchCalendars(data::AccountKind::Personal));
    QVERIFY(request->hasError());
    QCOMPARE(request->error()->kind, net::CalendarError::Kind::Decode);
    QCOMPARE(request->error()->describe(), QStringLiteral("Invalid response from Google Calendar API"));
}

QTEST_GUILESS_MAIN(GoogleCalendarClientTest)
#include "GoogleCalendarClientTest.moc"
