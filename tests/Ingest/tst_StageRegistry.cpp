#include <QtTest/QtTest>
#include <QSignalSpy>

#include "ingest/StageRegistry.h"

class tst_StageRegistry : public QObject
{
    Q_OBJECT

private slots:
    void testLastWriteWins();
    void testDoneIsSticky();
    void testSignalOnlyOnChange();
    void testIgnoresEmptyValues();
    void testIndependentKeys();
};

void tst_StageRegistry::testLastWriteWins()
{
    StageRegistry registry;
    QVERIFY(registry.update("c1/Lecture 1", "QUEUED"));
    QVERIFY(registry.update("c1/Lecture 1", "TRANSCODING"));
    QCOMPARE(registry.stage("c1/Lecture 1"), QString("TRANSCODING"));
    QVERIFY(!registry.isDone("c1/Lecture 1"));
}

void tst_StageRegistry::testDoneIsSticky()
{
    StageRegistry registry;
    QVERIFY(registry.update("c1/Lecture 1", "DONE"));
    QVERIFY(registry.isDone("c1/Lecture 1"));

    // A late stage from an overlapping task must not regress the entry
    QVERIFY(!registry.update("c1/Lecture 1", "MERGING"));
    QVERIFY(!registry.update("c1/Lecture 1", "FAILED"));
    QCOMPARE(registry.stage("c1/Lecture 1"), QString("DONE"));
}

void tst_StageRegistry::testSignalOnlyOnChange()
{
    StageRegistry registry;
    QSignalSpy spy(&registry, &StageRegistry::stageChanged);

    registry.update("k", "QUEUED");
    registry.update("k", "QUEUED");
    registry.update("k", "MERGING");

    QCOMPARE(spy.count(), 2);
    QCOMPARE(spy.at(1).at(0).toString(), QString("k"));
    QCOMPARE(spy.at(1).at(1).toString(), QString("MERGING"));
}

void tst_StageRegistry::testIgnoresEmptyValues()
{
    StageRegistry registry;
    QVERIFY(!registry.update(QString(), "DONE"));
    QVERIFY(!registry.update("k", QString()));
    QCOMPARE(registry.size(), 0);
    QVERIFY(!registry.contains("k"));
}

void tst_StageRegistry::testIndependentKeys()
{
    StageRegistry registry;
    registry.update("a", "DONE");
    registry.update("b", "QUEUED");

    QVERIFY(registry.isDone("a"));
    QVERIFY(!registry.isDone("b"));
    QCOMPARE(registry.size(), 2);

    registry.clear();
    QCOMPARE(registry.size(), 0);
    QVERIFY(!registry.isDone("a"));
}

QTEST_MAIN(tst_StageRegistry)
#include "tst_StageRegistry.moc"
