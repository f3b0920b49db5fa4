#ifndef ANCHORS_COMMAND_H
#define ANCHORS_COMMAND_H

#include "cli/CLICommand.h"

namespace RotoRect {
namespace CLI {

/**
 * @brief Resolve the fixed and moving anchors of a handle drag
 */
class AnchorsCommand : public CLICommand
{
public:
    QString name() const override;
    QString description() const override;
    void setupOptions(QCommandLineParser& parser) override;
    CLIResult execute(const QCommandLineParser& parser) override;
};

} // namespace CLI
} // namespace RotoRect

#endif // ANCHORS_COMMAND_H
