#ifndef HANDLES_COMMAND_H
#define HANDLES_COMMAND_H

#include "cli/CLICommand.h"

namespace RotoRect {
namespace CLI {

/**
 * @brief Print the world-space position of every handle
 */
class HandlesCommand : public CLICommand
{
public:
    QString name() const override;
    QString description() const override;
    void setupOptions(QCommandLineParser& parser) override;
    CLIResult execute(const QCommandLineParser& parser) override;
};

} // namespace CLI
} // namespace RotoRect

#endif // HANDLES_COMMAND_H
