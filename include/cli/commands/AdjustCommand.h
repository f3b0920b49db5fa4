#ifndef ADJUST_COMMAND_H
#define ADJUST_COMMAND_H

#include "cli/CLICommand.h"

namespace RotoRect {
namespace CLI {

/**
 * @brief Re-express two diagonal corners around a shifted rotation center
 */
class AdjustCommand : public CLICommand
{
public:
    QString name() const override;
    QString description() const override;
    void setupOptions(QCommandLineParser& parser) override;
    CLIResult execute(const QCommandLineParser& parser) override;
};

} // namespace CLI
} // namespace RotoRect

#endif // ADJUST_COMMAND_H
