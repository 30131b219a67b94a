#include <QCoreApplication>
#include <QTextStream>

#include "cli/CLIHandler.h"
#include "settings/Settings.h"
#include "version.h"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    // Set application metadata
    app.setApplicationName(IngestKit::settingsApplicationName());
    app.setOrganizationName(IngestKit::kOrganizationName);
    app.setApplicationVersion(INGESTKIT_VERSION);

    IngestKit::CLI::CLIHandler handler;
    const IngestKit::CLI::CLIResult result = handler.process(app.arguments());

    if (!result.message.isEmpty()) {
        QTextStream stream(result.isSuccess() ? stdout : stderr);
        stream << result.message;
        if (!result.message.endsWith('\n')) {
            stream << '\n';
        }
    }

    return static_cast<int>(result.code);
}
