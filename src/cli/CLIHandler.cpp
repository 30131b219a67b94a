#include "cli/CLIHandler.h"

#include "cli/commands/ConfigCommand.h"
#include "cli/commands/IngestCommand.h"
#include "version.h"

#include <QCommandLineParser>
#include <QTextStream>
#include <utility>

namespace IngestKit {
namespace CLI {

CLIHandler::CLIHandler() { registerCommands(); }

CLIHandler::~CLIHandler() = default;

void CLIHandler::registerCommands()
{
    addCommand(std::make_unique<IngestCommand>());
    addCommand(std::make_unique<ConfigCommand>());
}

void CLIHandler::addCommand(CLICommandPtr command)
{
    if (command) {
        const QString name = command->name();
        m_commands[name] = std::move(command);
    }
}

bool CLIHandler::hasArguments(const QStringList& arguments)
{
    // Exclude program name, check if there are other arguments
    return arguments.size() > 1;
}

CLIResult CLIHandler::process(const QStringList& arguments)
{
    if (arguments.size() < 2) {
        return CLIResult::error(CLIResult::Code::InvalidArguments, getHelpText());
    }

    const QString& cmdOrOption = arguments.at(1);

    // Handle global options
    if (cmdOrOption == "--help" || cmdOrOption == "-h") {
        return CLIResult::success(getHelpText());
    }
    if (cmdOrOption == "--version" || cmdOrOption == "-v") {
        return CLIResult::success(getVersionText());
    }

    // Find command
    CLICommand* command = findCommand(cmdOrOption);
    if (!command) {
        return CLIResult::error(
            CLIResult::Code::InvalidArguments,
            QString("Unknown command: %1\n\n%2").arg(cmdOrOption, getHelpText()));
    }

    // Setup and parse command arguments
    QCommandLineParser parser;
    parser.setApplicationDescription(command->description());
    parser.addHelpOption();

    command->setupOptions(parser);

    // Remove command name, keep remaining arguments
    QStringList cmdArgs = arguments;
    cmdArgs.removeAt(1);

    if (!parser.parse(cmdArgs)) {
        return CLIResult::error(CLIResult::Code::InvalidArguments, parser.errorText());
    }

    if (parser.isSet("help")) {
        return CLIResult::success(parser.helpText());
    }

    return command->execute(parser);
}

CLICommand* CLIHandler::findCommand(const QString& name) const
{
    auto it = m_commands.find(name.toLower());
    return it != m_commands.end() ? it->second.get() : nullptr;
}

QString CLIHandler::getHelpText() const
{
    QString help;
    QTextStream out(&help);

    out << "IngestKit - Chunked upload and remote pipeline tracking\n\n";
    out << "Usage: ingestkit <command> [options]\n\n";
    out << "Commands:\n";

    // std::map keeps commands sorted by name
    for (const auto& [name, cmd] : m_commands) {
        out << QString("  %1  %2\n").arg(name, -10).arg(cmd->description());
    }

    out << "\nGlobal Options:\n";
    out << "  -h, --help     Display this help message\n";
    out << "  -v, --version  Display version information\n";
    out << "\nUse 'ingestkit <command> --help' for more information about a command.\n";

    return help;
}

QString CLIHandler::getVersionText() { return QString("IngestKit version %1").arg(INGESTKIT_VERSION); }

} // namespace CLI
} // namespace IngestKit
