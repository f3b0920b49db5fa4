#include "cli/commands/AnchorsCommand.h"

#include "cli/GeometryArguments.h"
#include "cli/GeometryOutput.h"
#include "geometry/HandleResolver.h"

#include <QJsonObject>

namespace RotoRect {
namespace CLI {

QString AnchorsCommand::name() const { return "anchors"; }

QString AnchorsCommand::description() const { return "Resolve fixed and moving anchors of a drag"; }

void AnchorsCommand::setupOptions(QCommandLineParser& parser)
{
    parser.addOption({{"r", "rect"}, "Rectangle before the drag (x,y,width,height)", "rect"});
    parser.addOption({{"t", "target"}, "New handle position (x,y)", "point"});
    parser.addOption({{"a", "angle"}, "Rotation of the rectangle in degrees", "degrees"});
    parser.addOption({"handle", "Dragged handle (e.g. top-right, middle-left)", "name"});
    GeometryOutput::addOptions(parser, false);
}

CLIResult AnchorsCommand::execute(const QCommandLineParser& parser)
{
    Rectangle rect;
    CLIResult status = requireRectangle(parser, "rect", &rect);
    if (!status.isSuccess()) {
        return status;
    }

    Point target;
    status = requirePoint(parser, "target", &target);
    if (!status.isSuccess()) {
        return status;
    }

    qreal angle = 0.0;
    status = requireAngle(parser, "angle", &angle);
    if (!status.isSuccess()) {
        return status;
    }

    Handle handle = Handle::TopRight;
    status = requireHandle(parser, "handle", &handle);
    if (!status.isSuccess()) {
        return status;
    }

    OutputOptions options;
    status = GeometryOutput::optionsFromParser(parser, false, &options);
    if (!status.isSuccess()) {
        return status;
    }
    const GeometryOutput output(options);

    const AnchorPair anchors = getAdjustedPoint(rect, target, angle, handle);

    QJsonObject json;
    json["handle"] = handleName(handle);
    json["fixed"] = output.json(anchors.fixed);
    json["moving"] = output.json(anchors.moving);

    const QString text = QString("fixed: %1\nmoving: %2")
                             .arg(output.text(anchors.fixed), output.text(anchors.moving));
    return output.result(json, text);
}

} // namespace CLI
} // namespace RotoRect
