#include "cli/commands/ToRectCommand.h"

#include "cli/GeometryArguments.h"
#include "cli/GeometryOutput.h"
#include "geometry/HandleResolver.h"

namespace RotoRect {
namespace CLI {

QString ToRectCommand::name() const { return "torect"; }

QString ToRectCommand::description() const { return "Rebuild a rectangle from drag anchors"; }

void ToRectCommand::setupOptions(QCommandLineParser& parser)
{
    parser.addOption({{"f", "fixed"}, "Fixed anchor (x,y)", "point"});
    parser.addOption({{"m", "moving"}, "Moving anchor (x,y)", "point"});
    parser.addOption({"handle", "Dragged handle (e.g. top-right, middle-left)", "name"});
    GeometryOutput::addOptions(parser, true);
}

CLIResult ToRectCommand::execute(const QCommandLineParser& parser)
{
    Point fixed;
    CLIResult status = requirePoint(parser, "fixed", &fixed);
    if (!status.isSuccess()) {
        return status;
    }

    Point moving;
    status = requirePoint(parser, "moving", &moving);
    if (!status.isSuccess()) {
        return status;
    }

    Handle handle = Handle::TopRight;
    status = requireHandle(parser, "handle", &handle);
    if (!status.isSuccess()) {
        return status;
    }

    OutputOptions options;
    status = GeometryOutput::optionsFromParser(parser, true, &options);
    if (!status.isSuccess()) {
        return status;
    }
    const GeometryOutput output(options);

    const Rectangle rect = toRect(fixed, moving, handle);
    return output.result(output.json(rect), output.text(rect));
}

} // namespace CLI
} // namespace RotoRect
