#include <QtTest/QtTest>

#include "FakeCalendarClient.hpp"
#include "FakeTokenProvider.hpp"
#include "ManualClock.hpp"
#include "planner/cache/CacheEntry.hpp"
#include "planner/cache/EventCache.hpp"
#include "planner/core/Preloader.hpp"
#include "planner/data/InMemoryPersistentStore.hpp"

using namespace planner;

namespace {

const QDate Pivot(2024, 3, 15);

data::DateRange month(int year, int monthNumber)
{
    return data::DateRange::monthContaining(QDate(year, monthNumber, 1));
}

std::vector<data::CalendarEvent> oneEvent(data::AccountKind account)
{
    data::CalendarEvent event;
    event.id = QStringLiteral("evt");
    event.account = account;
    event.start = data::EventDateTime::fromDateTime(QDateTime(Pivot, QTime(9, 0)));
    event.end = data::EventDateTime::fromDateTime(QDateTime(Pivot, QTime(10, 0)));
    return { event };
}

} // namespace

class PreloaderTest : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void warmsNeighbouringMonthsForLinkedAccounts();
    void skipsRangesAlreadyCached();
    void warmsAheadInNavigationDirection();
    void warmsBehindInNavigationDirection();
    void doesNotDuplicateInFlightRanges();
    void dropsFailedWarmUps();
    void ignoresResultsAfterDiscard();

private:
    std::unique_ptr<testing::ManualClock> m_clock;
    std::unique_ptr<data::InMemoryPersistentStore> m_store;
    std::unique_ptr<cache::EventCache> m_cache;
    std::unique_ptr<testing::FakeCalendarClient> m_client;
    std::unique_ptr<testing::FakeTokenProvider> m_tokens;
    std::unique_ptr<core::Preloader> m_preloader;
};

void PreloaderTest::init()
{
    m_clock = std::make_unique<testing::ManualClock>();
    m_store = std::make_unique<data::InMemoryPersistentStore>();
    m_cache = std::make_unique<cache::EventCache>(*m_clock, *m_store, cache::EventCache::Options());
    m_client = std::make_unique<testing::FakeCalendarClient>();
    m_tokens = std::make_unique<testing::FakeTokenProvider>();
    m_preloader = std::make_unique<core::Preloader>(*m_client, *m_tokens, *m_cache);

    m_client->setEvents(data::AccountKind::Personal, oneEvent(data::AccountKind::Personal));
    m_client->setEvents(data::AccountKind::Professional, oneEvent(data::AccountKind::Professional));
}

void PreloaderTest::cleanup()
{
    m_preloader.reset();
    m_tokens.reset();
    m_client.reset();
    m_cache.reset();
    m_store.reset();
    m_clock.reset();
}

void PreloaderTest::warmsNeighbouringMonthsForLinkedAccounts()
{
    m_tokens->link(data::AccountKind::Personal);
    m_tokens->link(data::AccountKind::Professional);
    QSignalSpy idleSpy(m_preloader.get(), &core::Preloader::idle);

    m_preloader->warmAdjacent(Pivot);
    QCOMPARE(m_client->fetchCount(), 4);
    QCOMPARE(m_preloader->pendingCount(), 4);

    QVERIFY(idleSpy.wait());
    QCOMPARE(idleSpy.count(), 1);
    QCOMPARE(m_preloader->pendingCount(), 0);
    for (const data::AccountKind account : data::AllAccountKinds) {
        QVERIFY(m_cache->hasValidEntry(cache::cacheKey(account, month(2024, 2))));
        QVERIFY(m_cache->hasValidEntry(cache::cacheKey(account, month(2024, 4))));
        QVERIFY(!m_cache->hasValidEntry(cache::cacheKey(account, month(2024, 3))));
    }
}

void PreloaderTest::skipsRangesAlreadyCached()
{
    m_tokens->link(data::AccountKind::Personal);
    m_cache->put(cache::cacheKey(data::AccountKind::Personal, month(2024, 2)), oneEvent(data::AccountKind::Personal));

    m_preloader->warmAdjacent(Pivot);
    QCOMPARE(m_client->fetchCount(), 1);
    QCOMPARE(m_client->calls().front().range, month(2024, 4));
}

void PreloaderTest::warmsAheadInNavigationDirection()
{
    m_tokens->link(data::AccountKind::Personal);
    m_preloader->warmTowards(Pivot, 1);

    const auto &calls = m_client->calls();
    QCOMPARE(calls.size(), static_cast<size_t>(3));
    QCOMPARE(calls[0].range, month(2024, 4));
    QCOMPARE(calls[1].range, month(2024, 5));
    QCOMPARE(calls[2].range, month(2024, 2));
}

void PreloaderTest::warmsBehindInNavigationDirection()
{
    m_tokens->link(data::AccountKind::Professional);
    m_preloader->warmTowards(QDate(2024, 1, 20), -1);

    const auto &calls = m_client->calls();
    QCOMPARE(calls.size(), static_cast<size_t>(3));
    QCOMPARE(calls[0].range, month(2023, 12));
    QCOMPARE(calls[1].range, month(2023, 11));
    QCOMPARE(calls[2].range, month(2024, 2));
    QCOMPARE(calls[0].account, data::AccountKind::Professional);
}

void PreloaderTest::doesNotDuplicateInFlightRanges()
{
    m_tokens->link(data::AccountKind::Personal);
    m_client->setDeferred(true);
    QSignalSpy idleSpy(m_preloader.get(), &core::Preloader::idle);

    m_preloader->warmAdjacent(Pivot);
    m_preloader->warmAdjacent(Pivot);
    QCOMPARE(m_client->fetchCount(), 2);

    m_client->completeAll();
    QVERIFY(idleSpy.wait());
    QCOMPARE(m_preloader->pendingCount(), 0);
}

void PreloaderTest::dropsFailedWarmUps()
{
    m_tokens->link(data::AccountKind::Personal);
    m_client->setError(data::AccountKind::Personal, net::CalendarError::network(QStringLiteral("offline")));
    QSignalSpy idleSpy(m_preloader.get(), &core::Preloader::idle);

    m_preloader->warmAdjacent(Pivot);
    QVERIFY(idleSpy.wait());
    QVERIFY(!m_cache->hasValidEntry(cache::cacheKey(data::AccountKind::Personal, month(2024, 2))));
    QCOMPARE(m_store->writeCount(), 0);
}

void PreloaderTest::ignoresResultsAfterDiscard()
{
    m_tokens->link(data::AccountKind::Personal);
    m_client->setDeferred(true);
    QSignalSpy idleSpy(m_preloader.get(), &core::Preloader::idle);

    m_preloader->warmAdjacent(Pivot);
    m_preloader->discardInFlight();
    QCOMPARE(m_preloader->pendingCount(), 0);
    QCOMPARE(idleSpy.count(), 1);

    m_client->completeAll();
    QTest::qWait(20);
    QVERIFY(!m_cache->hasValidEntry(cache::cacheKey(data::AccountKind::Personal, month(2024, 2))));
    QCOMPARE(idleSpy.count(), 1);
}

QTEST_GUILESS_MAIN(PreloaderTest)
#include "PreloaderTest.moc"
