#ifndef CLI_HANDLER_H
#define CLI_HANDLER_H

#include "CLICommand.h"
#include "CLIResult.h"

#include <QString>
#include <QStringList>
#include <map>
#include <memory>

namespace RotoRect {
namespace CLI {

/**
 * @brief CLI handler for parsing and executing commands
 *
 * Every command runs locally and synchronously. Exceptions escaping a
 * command are reported as CLIResult::Code::GeneralError.
 */
class CLIHandler
{
public:
    CLIHandler();
    ~CLIHandler();

    /**
     * @brief Parse and execute command line
     * @param arguments Command line arguments (including program name)
     * @return Execution result
     */
    CLIResult process(const QStringList& arguments);

    /**
     * @brief Get main help text
     */
    QString getHelpText() const;

    /**
     * @brief Get version text
     */
    static QString getVersionText();

private:
    void registerCommands();
    CLICommand* findCommand(const QString& name) const;

    std::map<QString, CLICommandPtr> m_commands;
};

} // namespace CLI
} // namespace RotoRect

#endif // CLI_HANDLER_H
