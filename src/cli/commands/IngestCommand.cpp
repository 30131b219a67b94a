#include "cli/commands/IngestCommand.h"

#include "ingest/HttpIngestionApi.h"
#include "ingest/IngestionManager.h"
#include "ingest/IngestionSessionController.h"
#include "ingest/PayloadSources.h"
#include "ingest/StageRegistry.h"
#include "settings/IngestionSettingsManager.h"

#include <QEventLoop>
#include <QFileInfo>
#include <QTextStream>
#include <QTimer>
#include <QUrl>

#include <memory>
#include <utility>

namespace IngestKit {
namespace CLI {

namespace {

bool parseOptionalId(const QCommandLineParser& parser,
                     const QString& option,
                     std::optional<qint64>* value,
                     QString* errorMessage)
{
    if (!parser.isSet(option)) {
        return true;
    }
    bool ok = false;
    const qint64 parsed = parser.value(option).toLongLong(&ok);
    if (!ok || !ContentIdentity::isJsonSafeId(parsed)) {
        *errorMessage = QString("Invalid --%1: %2").arg(option, parser.value(option));
        return false;
    }
    *value = parsed;
    return true;
}

} // namespace

IngestCommand::IngestCommand(ApiFactory apiFactory)
    : m_apiFactory(std::move(apiFactory))
{
}

QString IngestCommand::name() const { return "ingest"; }

QString IngestCommand::description() const { return "Upload a recording and track server processing"; }

void IngestCommand::setupOptions(QCommandLineParser& parser)
{
    parser.addOption({"course-id", "Course identifier (required)", "id"});
    parser.addOption({"course-name", "Course display name", "name"});
    parser.addOption({"title", "Session title within the course (required)", "title"});
    parser.addOption({"video-id", "Numeric video id", "id"});
    parser.addOption({"session-id", "Numeric session id", "id"});
    parser.addOption({"started-at", "Session start time", "time"});
    parser.addOption({"deep", "Run deep processing after ingestion"});
    parser.addOption({"no-transcode", "Only read the file, do not send it to the server"});
    parser.addOption({"endpoint", "Service endpoint (overrides the configured one)", "url"});
    parser.addPositionalArgument("file", "File to ingest");
}

CLIResult IngestCommand::execute(const QCommandLineParser& parser)
{
    const QStringList positionalArgs = parser.positionalArguments();
    if (positionalArgs.isEmpty()) {
        return CLIResult::error(CLIResult::Code::InvalidArguments, "File path required");
    }
    const QString filePath = positionalArgs.first();
    const QFileInfo fileInfo(filePath);
    if (!fileInfo.isFile() || !fileInfo.isReadable()) {
        return CLIResult::error(CLIResult::Code::FileError, QString("Cannot read file: %1").arg(filePath));
    }

    IngestionTask task;
    task.identity.courseId = parser.value("course-id").trimmed();
    task.identity.courseName = parser.value("course-name").trimmed();
    task.identity.courseTitle = parser.value("title").trimmed();
    task.identity.startedAt = parser.value("started-at").trimmed();
    task.identity.originalFilename = fileInfo.fileName();
    task.autoTranscode = !parser.isSet("no-transcode");

    QString errorMessage;
    if (!parseOptionalId(parser, "video-id", &task.identity.videoId, &errorMessage)
        || !parseOptionalId(parser, "session-id", &task.identity.sessionId, &errorMessage)) {
        return CLIResult::error(CLIResult::Code::InvalidArguments, errorMessage);
    }
    if (!task.identity.isValid()) {
        return CLIResult::error(CLIResult::Code::InvalidArguments, "--course-id and --title are required");
    }

    IngestionConfig config = IngestionSettingsManager::instance().config();
    if (parser.isSet("endpoint")) {
        const QUrl endpoint(parser.value("endpoint").trimmed());
        if (!endpoint.isValid() || endpoint.host().isEmpty()) {
            return CLIResult::error(CLIResult::Code::InvalidArguments,
                                    QString("Invalid endpoint: %1").arg(parser.value("endpoint")));
        }
        config.endpoint = endpoint;
    }

    std::unique_ptr<IIngestionApi> api(m_apiFactory ? m_apiFactory(config) : new HttpIngestionApi(config));
    if (!api) {
        return CLIResult::error(CLIResult::Code::GeneralError, "No ingestion service available");
    }

    StageRegistry registry;
    IngestionManager manager(api.get(), &registry, config,
                             [filePath](const IngestionTask&) { return new FilePayloadSource(filePath); });

    const bool runDeepProcess = parser.isSet("deep");
    QTextStream out(stdout);
    QEventLoop loop;
    CLIResult result = CLIResult::error(CLIResult::Code::GeneralError, "Ingestion did not finish");
    bool done = false;
    auto finish = [&](const CLIResult& outcome) {
        result = outcome;
        done = true;
        loop.quit();
    };

    QObject::connect(&manager, &IngestionManager::taskStateChanged, &loop,
                     [&](int id, const TaskState& state) {
        out << state.describe() << '\n';
        out.flush();

        if (state.isCancelled()) {
            finish(CLIResult::error(CLIResult::Code::Cancelled, state.message));
        } else if (state.isError()) {
            finish(CLIResult::error(CLIResult::Code::IngestionError, state.message));
        } else if (state.isFinished()) {
            IngestionSessionController* controller = manager.controller(id);
            const bool deepPending = runDeepProcess && controller
                && controller->checkpoint() == TaskStateMachine::Checkpoint::IngestionDone;
            if (!deepPending) {
                finish(CLIResult::success(state.resultRef));
                return;
            }
            // Leave the state change notification before starting the next pipeline
            QTimer::singleShot(0, &loop, [&manager, &finish, id]() {
                if (!manager.startDeepProcessing(id)) {
                    finish(CLIResult::error(CLIResult::Code::IngestionError,
                                            "Deep processing could not be started"));
                }
            });
        }
    });

    if (manager.createTask(task, &errorMessage) < 0) {
        return CLIResult::error(CLIResult::Code::IngestionError, errorMessage);
    }

    if (!done) {
        loop.exec();
    }
    return result;
}

} // namespace CLI
} // namespace IngestKit
