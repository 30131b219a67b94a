#include <QtTest/QtTest>
#include <QSignalSpy>

#include "ingest/CancellationToken.h"
#include "ingest/StagePoller.h"
#include "mocks/MockIngestionApi.h"

namespace {

constexpr int kIntervalMs = 5;

QStringList observedTags(const QSignalSpy& spy)
{
    QStringList tags;
    for (const QList<QVariant>& args : spy) {
        tags << args.at(0).value<PipelineObservation>().stage.tag();
    }
    return tags;
}

} // namespace

class tst_StagePoller : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();
    void init();
    void cleanup();

    void testParseObservation();
    void testParseClampsProgress();
    void testParseMissingStage();
    void testScriptedSequenceEndsInSuccess();
    void testFailedStageCarriesMessage();
    void testUnknownStageIsFailure();
    void testUnrecognizedTagKeepsPolling();
    void testMissingStageIsProtocolError();
    void testFetchErrorIsNotRetried();
    void testCancellationStopsPolling();
    void testStopIsSilent();

private:
    StagePoller* createPoller(int intervalMs = kIntervalMs);

    MockIngestionApi* m_api = nullptr;
    QList<StagePoller*> m_pollers;
};

void tst_StagePoller::initTestCase()
{
    qRegisterMetaType<IngestionError>();
    qRegisterMetaType<PipelineObservation>();
}

void tst_StagePoller::init()
{
    m_api = new MockIngestionApi;
}

void tst_StagePoller::cleanup()
{
    qDeleteAll(m_pollers);
    m_pollers.clear();
    delete m_api;
    m_api = nullptr;
}

StagePoller* tst_StagePoller::createPoller(int intervalMs)
{
    MockIngestionApi* api = m_api;
    auto* poller = new StagePoller([api]() { return api->fetchIngestionStatus("upload-1"); }, intervalMs);
    m_pollers.append(poller);
    return poller;
}

void tst_StagePoller::testParseObservation()
{
    QJsonObject body = MockIngestionApi::stage("TRANSCODING", 0.25, "  working  ");
    body["downloadUrl"] = "/api/download/abc";

    PipelineObservation observation;
    QString error;
    QVERIFY(StagePoller::parseObservation(body, &observation, &error));
    QVERIFY(error.isEmpty());
    QCOMPARE(observation.stage.kind(), PipelineStage::Kind::Transcoding);
    QCOMPARE(observation.progress, 0.25);
    QCOMPARE(observation.message, QString("working"));
    QCOMPARE(observation.downloadRef, QString("/api/download/abc"));
}

void tst_StagePoller::testParseClampsProgress()
{
    PipelineObservation observation;

    QVERIFY(StagePoller::parseObservation(MockIngestionApi::stage("MERGING", 3.5), &observation));
    QCOMPARE(observation.progress, 1.0);

    QVERIFY(StagePoller::parseObservation(MockIngestionApi::stage("MERGING", -1.0), &observation));
    QCOMPARE(observation.progress, 0.0);

    QJsonObject textual;
    textual["stage"] = "MERGING";
    textual["progress"] = "0.5";
    QVERIFY(StagePoller::parseObservation(textual, &observation));
    QCOMPARE(observation.progress, 0.5);
}

void tst_StagePoller::testParseMissingStage()
{
    QJsonObject body;
    body["progress"] = 0.5;

    QString error;
    QVERIFY(!StagePoller::parseObservation(body, nullptr, &error));
    QVERIFY(!error.isEmpty());
}

void tst_StagePoller::testScriptedSequenceEndsInSuccess()
{
    m_api->setIngestionStatusScript({
        MockIngestionApi::stage("QUEUED"),
        MockIngestionApi::stage("MERGING"),
        MockIngestionApi::stage("TRANSCODING", 0.3),
        MockIngestionApi::stage("TRANSCODING", 0.9),
        MockIngestionApi::stage("DONE", 1.0),
    });

    StagePoller* poller = createPoller();
    QSignalSpy observedSpy(poller, &StagePoller::observed);
    QSignalSpy succeededSpy(poller, &StagePoller::succeeded);
    QSignalSpy failedSpy(poller, &StagePoller::failed);

    poller->start();
    QVERIFY(poller->isPolling());
    QVERIFY(succeededSpy.wait(2000));

    QCOMPARE(observedTags(observedSpy),
             QStringList({"QUEUED", "MERGING", "TRANSCODING", "TRANSCODING", "DONE"}));
    QCOMPARE(observedSpy.at(2).at(0).value<PipelineObservation>().progress, 0.3);
    QCOMPARE(failedSpy.count(), 0);
    QCOMPARE(poller->fetchCount(), 5);
    QVERIFY(!poller->isPolling());

    // No further requests after the terminal stage
    QTest::qWait(kIntervalMs * 4);
    QCOMPARE(m_api->callCount(MockIngestionApi::Operation::FetchIngestionStatus), 5);
}

void tst_StagePoller::testFailedStageCarriesMessage()
{
    m_api->setIngestionStatusScript({
        MockIngestionApi::stage("MERGING"),
        MockIngestionApi::stage("FAILED", 0.0, "codec error"),
    });

    StagePoller* poller = createPoller();
    QSignalSpy succeededSpy(poller, &StagePoller::succeeded);
    QSignalSpy failedSpy(poller, &StagePoller::failed);

    poller->start();
    QVERIFY(failedSpy.wait(2000));

    const IngestionError error = failedSpy.at(0).at(0).value<IngestionError>();
    QCOMPARE(error.kind, IngestionError::Kind::Server);
    QCOMPARE(error.message, QString("codec error"));
    QCOMPARE(succeededSpy.count(), 0);
}

void tst_StagePoller::testUnknownStageIsFailure()
{
    m_api->setIngestionStatusScript({MockIngestionApi::stage("UNKNOWN")});

    StagePoller* poller = createPoller();
    QSignalSpy failedSpy(poller, &StagePoller::failed);

    poller->start();
    QVERIFY(failedSpy.wait(2000));
    QVERIFY(failedSpy.at(0).at(0).value<IngestionError>().message.contains("UNKNOWN"));
}

void tst_StagePoller::testUnrecognizedTagKeepsPolling()
{
    m_api->setIngestionStatusScript({
        MockIngestionApi::stage("FOO"),
        MockIngestionApi::stage("FOO"),
        MockIngestionApi::stage("DONE", 1.0),
    });

    StagePoller* poller = createPoller();
    QSignalSpy observedSpy(poller, &StagePoller::observed);
    QSignalSpy succeededSpy(poller, &StagePoller::succeeded);

    poller->start();
    QVERIFY(succeededSpy.wait(2000));

    QCOMPARE(observedTags(observedSpy), QStringList({"FOO", "FOO", "DONE"}));
    QVERIFY(!observedSpy.at(0).at(0).value<PipelineObservation>().stage.isRecognized());
}

void tst_StagePoller::testMissingStageIsProtocolError()
{
    QJsonObject body;
    body["progress"] = 0.1;
    m_api->setIngestionStatusScript({body});

    StagePoller* poller = createPoller();
    QSignalSpy observedSpy(poller, &StagePoller::observed);
    QSignalSpy failedSpy(poller, &StagePoller::failed);

    poller->start();
    QVERIFY(failedSpy.wait(2000));
    QCOMPARE(failedSpy.at(0).at(0).value<IngestionError>().kind, IngestionError::Kind::Protocol);
    QCOMPARE(observedSpy.count(), 0);
}

void tst_StagePoller::testFetchErrorIsNotRetried()
{
    m_api->setResponder(MockIngestionApi::Operation::FetchIngestionStatus, [](const MockIngestionApi::Request&) {
        return MockIngestionApi::serverError(503, "Service unavailable");
    });

    StagePoller* poller = createPoller();
    QSignalSpy failedSpy(poller, &StagePoller::failed);

    poller->start();
    QVERIFY(failedSpy.wait(2000));

    const IngestionError error = failedSpy.at(0).at(0).value<IngestionError>();
    QCOMPARE(error.kind, IngestionError::Kind::Server);
    QCOMPARE(error.httpStatus, 503);

    QTest::qWait(kIntervalMs * 4);
    QCOMPARE(m_api->callCount(MockIngestionApi::Operation::FetchIngestionStatus), 1);
    QCOMPARE(failedSpy.count(), 1);
}

void tst_StagePoller::testCancellationStopsPolling()
{
    m_api->setIngestionStatusScript({MockIngestionApi::stage("TRANSCODING", 0.1)});

    CancellationToken token;
    StagePoller* poller = createPoller(20);
    QSignalSpy observedSpy(poller, &StagePoller::observed);
    QSignalSpy succeededSpy(poller, &StagePoller::succeeded);
    QSignalSpy failedSpy(poller, &StagePoller::failed);

    poller->start(&token);
    QVERIFY(observedSpy.wait(2000));

    token.cancel();
    QCOMPARE(failedSpy.count(), 1);
    QVERIFY(failedSpy.at(0).at(0).value<IngestionError>().isCancelled());
    QVERIFY(!poller->isPolling());

    const int fetches = m_api->callCount(MockIngestionApi::Operation::FetchIngestionStatus);
    QTest::qWait(80);
    QCOMPARE(m_api->callCount(MockIngestionApi::Operation::FetchIngestionStatus), fetches);
    QCOMPARE(m_api->outstandingCalls(), 0);
    QCOMPARE(succeededSpy.count(), 0);
    QCOMPARE(failedSpy.count(), 1);
}

void tst_StagePoller::testStopIsSilent()
{
    m_api->setDelay(MockIngestionApi::Operation::FetchIngestionStatus, 30);

    StagePoller* poller = createPoller();
    QSignalSpy observedSpy(poller, &StagePoller::observed);
    QSignalSpy succeededSpy(poller, &StagePoller::succeeded);
    QSignalSpy failedSpy(poller, &StagePoller::failed);

    poller->start();
    poller->stop();

    QTest::qWait(80);
    QCOMPARE(observedSpy.count(), 0);
    QCOMPARE(succeededSpy.count(), 0);
    QCOMPARE(failedSpy.count(), 0);
    QCOMPARE(m_api->abortedCalls(), 1);
    QCOMPARE(m_api->outstandingCalls(), 0);
}

QTEST_MAIN(tst_StagePoller)
#include "tst_StagePoller.moc"
