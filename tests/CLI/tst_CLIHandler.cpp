#include <QtTest>

#include <QFile>
#include <QTemporaryDir>

#include "cli/CLIHandler.h"
#include "cli/commands/ConfigCommand.h"
#include "cli/commands/IngestCommand.h"
#include "mocks/MockIngestionApi.h"
#include "settings/IngestionSettingsManager.h"
#include "settings/Settings.h"

#include <memory>
#include <utility>

using IngestKit::CLI::CLIHandler;
using IngestKit::CLI::CLIResult;
using IngestKit::CLI::ConfigCommand;
using IngestKit::CLI::IngestCommand;

namespace {

const QString kResolvedDownload = QStringLiteral("http://mock.invalid/api/download/0123456789abcdef");

IngestCommand::ApiFactory mockApi(std::function<void(MockIngestionApi*)> configure = {})
{
    return [configure](const IngestionConfig&) -> IIngestionApi* {
        auto* api = new MockIngestionApi;
        if (configure) {
            configure(api);
        }
        return api;
    };
}

} // namespace

class tst_CLIHandler : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void handler_requiresArguments();
    void handler_printsHelp();
    void handler_printsVersion();
    void handler_rejectsUnknownCommand();
    void handler_commandHelp();

    void config_listsAllSettings();
    void config_getAcceptsShortAndFullKey();
    void config_getUnknownKey();
    void config_setReportsEffectiveValue();
    void config_setRequiresValue();
    void config_setRejectsBadValues_data();
    void config_setRejectsBadValues();
    void config_reset();

    void ingest_requiresFile();
    void ingest_rejectsUnreadableFile();
    void ingest_requiresCourseAndTitle();
    void ingest_rejectsNonNumericIds();
    void ingest_rejectsBadEndpoint();
    void ingest_uploadsAndReportsDownload();
    void ingest_reportsExistingContent();
    void ingest_runsDeepProcessing();
    void ingest_keepsFileLocal();
    void ingest_reportsServerFailure();

private:
    void clearSettings();
    QString writeSampleFile(int size = 4096);
    CLIResult runIngest(const QStringList& args, IngestCommand::ApiFactory factory = mockApi());

    QTemporaryDir m_dir;
};

void tst_CLIHandler::init()
{
    clearSettings();
}

void tst_CLIHandler::cleanup()
{
    clearSettings();
}

void tst_CLIHandler::clearSettings()
{
    auto settings = IngestKit::getSettings();
    for (const QString& key : IngestionSettingsManager::keys()) {
        settings.remove(key);
    }
    settings.sync();
}

QString tst_CLIHandler::writeSampleFile(int size)
{
    const QString path = m_dir.filePath("lecture.ts");
    QFile file(path);
    if (file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        file.write(QByteArray(size, 'r'));
        file.close();
    }
    return path;
}

CLIResult tst_CLIHandler::runIngest(const QStringList& args, IngestCommand::ApiFactory factory)
{
    CLIHandler handler;
    handler.addCommand(std::make_unique<IngestCommand>(std::move(factory)));
    return handler.process(QStringList({"ingestkit", "ingest"}) + args);
}

void tst_CLIHandler::handler_requiresArguments()
{
    CLIHandler handler;
    QVERIFY(!CLIHandler::hasArguments({"ingestkit"}));
    QVERIFY(CLIHandler::hasArguments({"ingestkit", "config"}));

    const CLIResult result = handler.process({"ingestkit"});
    QCOMPARE(result.code, CLIResult::Code::InvalidArguments);
    QVERIFY(result.message.contains("Usage: ingestkit"));
}

void tst_CLIHandler::handler_printsHelp()
{
    CLIHandler handler;
    const CLIResult result = handler.process({"ingestkit", "--help"});
    QVERIFY(result.isSuccess());
    QVERIFY(result.message.contains("ingest "));
    QVERIFY(result.message.contains("config"));
}

void tst_CLIHandler::handler_printsVersion()
{
    CLIHandler handler;
    const CLIResult result = handler.process({"ingestkit", "-v"});
    QVERIFY(result.isSuccess());
    QVERIFY(result.message.startsWith("IngestKit version "));
}

void tst_CLIHandler::handler_rejectsUnknownCommand()
{
    CLIHandler handler;
    const CLIResult result = handler.process({"ingestkit", "upload"});
    QCOMPARE(result.code, CLIResult::Code::InvalidArguments);
    QVERIFY(result.message.startsWith("Unknown command: upload"));
}

void tst_CLIHandler::handler_commandHelp()
{
    CLIHandler handler;
    const CLIResult result = handler.process({"ingestkit", "ingest", "--help"});
    QVERIFY(result.isSuccess());
    QVERIFY(result.message.contains("--course-id"));
}

void tst_CLIHandler::config_listsAllSettings()
{
    CLIHandler handler;
    const CLIResult result = handler.process({"ingestkit", "config"});
    QVERIFY(result.isSuccess());
    QVERIFY(result.message.startsWith("Current settings:"));
    for (const QString& key : IngestionSettingsManager::keys()) {
        QVERIFY2(result.message.contains(key), qPrintable(key));
    }
    QVERIFY(result.message.contains("ingestion/concurrency = 4"));
}

void tst_CLIHandler::config_getAcceptsShortAndFullKey()
{
    CLIHandler handler;
    QCOMPARE(handler.process({"ingestkit", "config", "--get", "pollIntervalMs"}).message, QString("1000"));
    QCOMPARE(handler.process({"ingestkit", "config", "--get", "ingestion/apiPrefix"}).message, QString("/api"));
}

void tst_CLIHandler::config_getUnknownKey()
{
    CLIHandler handler;
    const CLIResult result = handler.process({"ingestkit", "config", "--get", "colour"});
    QCOMPARE(result.code, CLIResult::Code::InvalidArguments);
    QCOMPARE(result.message, QString("Setting not found: colour"));
}

void tst_CLIHandler::config_setReportsEffectiveValue()
{
    CLIHandler handler;

    CLIResult result = handler.process({"ingestkit", "config", "--set", "concurrency", "64"});
    QVERIFY(result.isSuccess());
    QCOMPARE(result.message, QString("Set ingestion/concurrency = 16"));
    QCOMPARE(IngestionSettingsManager::instance().concurrency(), 16);

    result = handler.process({"ingestkit", "config", "--set", "resumeReusedSessions", "yes"});
    QCOMPARE(result.message, QString("Set ingestion/resumeReusedSessions = true"));

    result = handler.process({"ingestkit", "config", "--set", "endpoint", "https://media.example"});
    QVERIFY(result.isSuccess());
    QCOMPARE(IngestionSettingsManager::instance().endpoint(), QUrl("https://media.example"));
}

void tst_CLIHandler::config_setRequiresValue()
{
    CLIHandler handler;
    const CLIResult result = handler.process({"ingestkit", "config", "--set", "concurrency"});
    QCOMPARE(result.code, CLIResult::Code::InvalidArguments);
    QCOMPARE(result.message, QString("Value required for --set"));
}

void tst_CLIHandler::config_setRejectsBadValues_data()
{
    QTest::addColumn<QString>("key");
    QTest::addColumn<QString>("value");

    QTest::newRow("number") << "partSizeBytes" << "lots";
    QTest::newRow("bool") << "resumeReusedSessions" << "maybe";
    QTest::newRow("endpoint") << "endpoint" << "not a url";
}

void tst_CLIHandler::config_setRejectsBadValues()
{
    QFETCH(QString, key);
    QFETCH(QString, value);

    CLIHandler handler;
    const CLIResult result = handler.process({"ingestkit", "config", "--set", key, value});
    QCOMPARE(result.code, CLIResult::Code::InvalidArguments);

    auto settings = IngestKit::getSettings();
    QVERIFY(!settings.contains(QStringLiteral("ingestion/") + key));
}

void tst_CLIHandler::config_reset()
{
    IngestionSettingsManager::instance().setConcurrency(2);

    CLIHandler handler;
    const CLIResult result = handler.process({"ingestkit", "config", "--reset"});
    QVERIFY(result.isSuccess());
    QCOMPARE(result.message, QString("Settings reset to defaults"));
    QCOMPARE(IngestionSettingsManager::instance().concurrency(), 4);
}

void tst_CLIHandler::ingest_requiresFile()
{
    const CLIResult result = runIngest({"--course-id", "CS101", "--title", "Lecture 3"});
    QCOMPARE(result.code, CLIResult::Code::InvalidArguments);
    QCOMPARE(result.message, QString("File path required"));
}

void tst_CLIHandler::ingest_rejectsUnreadableFile()
{
    const CLIResult result =
        runIngest({"--course-id", "CS101", "--title", "Lecture 3", m_dir.filePath("missing.ts")});
    QCOMPARE(result.code, CLIResult::Code::FileError);
    QVERIFY(result.message.contains("missing.ts"));
}

void tst_CLIHandler::ingest_requiresCourseAndTitle()
{
    const CLIResult result = runIngest({"--course-id", "CS101", writeSampleFile()});
    QCOMPARE(result.code, CLIResult::Code::InvalidArguments);
}

void tst_CLIHandler::ingest_rejectsNonNumericIds()
{
    const CLIResult result =
        runIngest({"--course-id", "CS101", "--title", "Lecture 3", "--video-id", "abc", writeSampleFile()});
    QCOMPARE(result.code, CLIResult::Code::InvalidArguments);
    QVERIFY(result.message.contains("Invalid --video-id: abc"));

    const CLIResult tooLarge = runIngest({"--course-id", "CS101", "--title", "Lecture 3",
                                          "--session-id", "9007199254740992", writeSampleFile()});
    QCOMPARE(tooLarge.code, CLIResult::Code::InvalidArguments);
    QVERIFY(tooLarge.message.contains("Invalid --session-id"));
}

void tst_CLIHandler::ingest_rejectsBadEndpoint()
{
    const CLIResult result =
        runIngest({"--course-id", "CS101", "--title", "Lecture 3", "--endpoint", "nowhere", writeSampleFile()});
    QCOMPARE(result.code, CLIResult::Code::InvalidArguments);
}

void tst_CLIHandler::ingest_uploadsAndReportsDownload()
{
    IngestionSettingsManager::instance().setPartSizeBytes(64 * 1024);

    const CLIResult result =
        runIngest({"--course-id", "CS101", "--title", "Lecture 3", "--video-id", "42", writeSampleFile(200 * 1024)});
    QVERIFY2(result.isSuccess(), qPrintable(result.message));
    QCOMPARE(result.message, kResolvedDownload);
}

void tst_CLIHandler::ingest_reportsExistingContent()
{
    const CLIResult result = runIngest({"--course-id", "CS101", "--title", "Lecture 3", writeSampleFile()},
                                       mockApi([](MockIngestionApi* api) {
                                           api->setContentExists("/api/download/0123456789abcdef");
                                       }));
    QVERIFY(result.isSuccess());
    QCOMPARE(result.message, kResolvedDownload);
}

void tst_CLIHandler::ingest_runsDeepProcessing()
{
    auto deepStarts = std::make_shared<int>(0);
    const CLIResult result = runIngest({"--course-id", "CS101", "--title", "Lecture 3", "--deep", writeSampleFile()},
                                       mockApi([deepStarts](MockIngestionApi* api) {
                                           api->setResponder(MockIngestionApi::Operation::StartDeepProcess,
                                                             [deepStarts](const MockIngestionApi::Request&) {
                                                                 ++*deepStarts;
                                                                 return MockIngestionApi::ok();
                                                             });
                                       }));
    QVERIFY2(result.isSuccess(), qPrintable(result.message));
    QCOMPARE(*deepStarts, 1);
}

void tst_CLIHandler::ingest_keepsFileLocal()
{
    const QString path = writeSampleFile();
    const CLIResult result = runIngest({"--course-id", "CS101", "--title", "Lecture 3", "--no-transcode", path});
    QVERIFY(result.isSuccess());
    QCOMPARE(QUrl(result.message).toLocalFile(), QFileInfo(path).absoluteFilePath());
}

void tst_CLIHandler::ingest_reportsServerFailure()
{
    const CLIResult result = runIngest({"--course-id", "CS101", "--title", "Lecture 3", writeSampleFile()},
                                       mockApi([](MockIngestionApi* api) {
                                           api->setIngestionStatusScript(
                                               {MockIngestionApi::stage("FAILED", 0.0, "transcoder crashed")});
                                       }));
    QCOMPARE(result.code, CLIResult::Code::IngestionError);
    QCOMPARE(result.message, QString("transcoder crashed"));
}

QTEST_MAIN(tst_CLIHandler)
#include "tst_CLIHandler.moc"
