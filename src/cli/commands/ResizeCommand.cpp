#include "cli/commands/ResizeCommand.h"

#include "cli/GeometryArguments.h"
#include "cli/GeometryOutput.h"
#include "geometry/HandleResolver.h"

#include <QDebug>
#include <QJsonObject>

namespace RotoRect {
namespace CLI {

QString ResizeCommand::name() const { return "resize"; }

QString ResizeCommand::description() const { return "Resize a rotated rectangle by a handle"; }

void ResizeCommand::setupOptions(QCommandLineParser& parser)
{
    parser.addOption({{"r", "rect"}, "Rectangle before the drag (x,y,width,height)", "rect"});
    parser.addOption({{"t", "target"}, "New handle position (x,y)", "point"});
    parser.addOption({{"a", "angle"}, "Rotation of the rectangle in degrees", "degrees"});
    parser.addOption({"handle", "Dragged handle (e.g. top-right, middle-left)", "name"});
    parser.addOption({"anchors", "Also print the fixed and moving anchors"});
    GeometryOutput::addOptions(parser, true);
}

CLIResult ResizeCommand::execute(const QCommandLineParser& parser)
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
    status = GeometryOutput::optionsFromParser(parser, true, &options);
    if (!status.isSuccess()) {
        return status;
    }
    const GeometryOutput output(options);

    const AnchorPair anchors = getAdjustedPoint(rect, target, angle, handle);
    const Rectangle resized = toRect(anchors, handle);
    qDebug() << "ResizeCommand:" << handle << rect << "->" << resized;

    if (!parser.isSet("anchors")) {
        return output.result(output.json(resized), output.text(resized));
    }

    QJsonObject json;
    json["handle"] = handleName(handle);
    json["fixed"] = output.json(anchors.fixed);
    json["moving"] = output.json(anchors.moving);
    json["rect"] = output.json(resized);

    const QString text = QString("fixed: %1\nmoving: %2\nrect: %3")
                             .arg(output.text(anchors.fixed),
                                  output.text(anchors.moving),
                                  output.text(resized));
    return output.result(json, text);
}

} // namespace CLI
} // namespace RotoRect
