#include <QtTest/QtTest>

#include "planner/data/FilePersistentStore.hpp"
#include "planner/data/InMemoryPersistentStore.hpp"

using namespace planner::data;

class PersistentStoreTest : public QObject
{
    Q_OBJECT

private slots:
    void inMemoryStoreReadWriteRemove();
    void fileStoreSurvivesReopen();
    void fileStoreKeysAreDecoded();
    void fileStoreRemovesMissingKeyGracefully();
};

void PersistentStoreTest::inMemoryStoreReadWriteRemove()
{
    InMemoryPersistentStore store;
    QVERIFY(!store.read(QStringLiteral("a")).has_value());
    QVERIFY(!store.write(QString(), "ignored"));

    QVERIFY(store.write(QStringLiteral("a"), "first"));
    QVERIFY(store.write(QStringLiteral("a"), "second"));
    QCOMPARE(store.read(QStringLiteral("a")).value(), QByteArray("second"));
    QCOMPARE(store.writeCount(), 2);
    QCOMPARE(store.keys(), QStringList{ QStringLiteral("a") });

    QVERIFY(store.remove(QStringLiteral("a")));
    QVERIFY(!store.remove(QStringLiteral("a")));
    QVERIFY(store.keys().isEmpty());
}

void PersistentStoreTest::fileStoreSurvivesReopen()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString folder = dir.filePath(QStringLiteral("cache"));
    {
        FilePersistentStore store(folder);
        QVERIFY(store.write(QStringLiteral("CalendarCache_personal_2024-03-01_2024-04-01"), "[]"));
    }
    FilePersistentStore reopened(folder);
    const auto value = reopened.read(QStringLiteral("CalendarCache_personal_2024-03-01_2024-04-01"));
    QVERIFY(value.has_value());
    QCOMPARE(*value, QByteArray("[]"));
}

void PersistentStoreTest::fileStoreKeysAreDecoded()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    FilePersistentStore store(dir.path());
    const QString awkward = QStringLiteral("team/calendar:2024 #1");
    QVERIFY(store.write(awkward, "payload"));
    QVERIFY(store.write(QStringLiteral("plain"), "other"));

    QStringList keys = store.keys();
    keys.sort();
    QCOMPARE(keys, (QStringList{ QStringLiteral("plain"), awkward }));
    QCOMPARE(store.read(awkward).value(), QByteArray("payload"));
}

void PersistentStoreTest::fileStoreRemovesMissingKeyGracefully()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    FilePersistentStore store(dir.path());
    QVERIFY(!store.remove(QStringLiteral("absent")));
    QVERIFY(store.write(QStringLiteral("present"), "x"));
    QVERIFY(store.remove(QStringLiteral("present")));
    QVERIFY(!store.read(QStringLiteral("present")).has_value());
}

QTEST_GUILESS_MAIN(PersistentStoreTest)
#include "PersistentStoreTest.moc"
