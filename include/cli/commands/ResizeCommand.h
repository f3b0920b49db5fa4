#ifndef RESIZE_COMMAND_H
#define RESIZE_COMMAND_H

#include "cli/CLICommand.h"

namespace RotoRect {
namespace CLI {

/**
 * @brief Resize a rotated rectangle by dragging one of its handles
 */
class ResizeCommand : public CLICommand
{
public:
    QString name() const override;
    QString description() const override;
    void setupOptions(QCommandLineParser& parser) override;
    CLIResult execute(const QCommandLineParser& parser) override;
};

} // namespace CLI
} // namespace RotoRect

#endif // RESIZE_COMMAND_H
