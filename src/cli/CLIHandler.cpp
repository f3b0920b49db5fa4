#include "cli/CLIHandler.h"

#include "cli/commands/AdjustCommand.h"
#include "cli/commands/AnchorsCommand.h"
#include "cli/commands/ConfigCommand.h"
#include "cli/commands/HandlesCommand.h"
#include "cli/commands/ResizeCommand.h"
#include "cli/commands/RotateCommand.h"
#include "cli/commands/ToRectCommand.h"
#include "version.h"

#include <QCommandLineParser>
#include <QDebug>
#include <QTextStream>

#include <exception>

namespace RotoRect {
namespace CLI {

CLIHandler::CLIHandler() { registerCommands(); }

CLIHandler::~CLIHandler() = default;

void CLIHandler::registerCommands()
{
    auto addCmd = [this](CLICommandPtr cmd) { m_commands[cmd->name()] = std::move(cmd); };

    addCmd(std::make_unique<RotateCommand>());
    addCmd(std::make_unique<AdjustCommand>());
    addCmd(std::make_unique<AnchorsCommand>());
    addCmd(std::make_unique<ToRectCommand>());
    addCmd(std::make_unique<ResizeCommand>());
    addCmd(std::make_unique<HandlesCommand>());
    addCmd(std::make_unique<ConfigCommand>());
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
    cmdArgs.removeAt(1); // Remove command name

    if (!parser.parse(cmdArgs)) {
        return CLIResult::error(CLIResult::Code::InvalidArguments, parser.errorText());
    }

    if (parser.isSet("help")) {
        return CLIResult::success(parser.helpText());
    }

    qDebug() << "CLIHandler: executing" << command->name();

    try {
        return command->execute(parser);
    } catch (const std::exception& e) {
        qWarning() << "CLIHandler:" << command->name() << "failed:" << e.what();
        return CLIResult::error(
            CLIResult::Code::GeneralError,
            QString("%1 failed: %2").arg(command->name(), QString::fromUtf8(e.what())));
    }
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

    out << "RotoRect - Rotated rectangle handle geometry\n\n";
    out << "Usage: rotorect <command> [options]\n\n";
    out << "Commands:\n";

    // std::map keeps commands sorted by name
    for (const auto& [name, cmd] : m_commands) {
        out << QString("  %1  %2\n").arg(name, -10).arg(cmd->description());
    }

    out << "\nGlobal Options:\n";
    out << "  -h, --help     Display this help message\n";
    out << "  -v, --version  Display version information\n";
    out << "\nUse 'rotorect <command> --help' for more information about a command.\n";

    return help;
}

QString CLIHandler::getVersionText() { return QString("RotoRect version %1").arg(ROTORECT_VERSION); }

} // namespace CLI
} // namespace RotoRect
