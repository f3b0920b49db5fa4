#include "cli/commands/RotateCommand.h"

#include "cli/GeometryArguments.h"
#include "cli/GeometryOutput.h"
#include "geometry/Rotation.h"

namespace RotoRect {
namespace CLI {

QString RotateCommand::name() const { return "rotate"; }

QString RotateCommand::description() const { return "Rotate a point around an origin"; }

void RotateCommand::setupOptions(QCommandLineParser& parser)
{
    parser.addOption({{"p", "point"}, "Point to rotate (x,y)", "point"});
    parser.addOption({{"o", "origin"}, "Center of rotation (x,y)", "point"});
    parser.addOption({{"a", "angle"}, "Rotation angle in degrees (counter-clockwise)", "degrees"});
    GeometryOutput::addOptions(parser, false);
}

CLIResult RotateCommand::execute(const QCommandLineParser& parser)
{
    Point point;
    CLIResult status = requirePoint(parser, "point", &point);
    if (!status.isSuccess()) {
        return status;
    }

    Point origin;
    status = requirePoint(parser, "origin", &origin);
    if (!status.isSuccess()) {
        return status;
    }

    qreal angle = 0.0;
    status = requireAngle(parser, "angle", &angle);
    if (!status.isSuccess()) {
        return status;
    }

    OutputOptions options;
    status = GeometryOutput::optionsFromParser(parser, false, &options);
    if (!status.isSuccess()) {
        return status;
    }
    const GeometryOutput output(options);

    const Point rotated = rotate(point, origin, angle);
    return output.result(output.json(rotated), output.text(rotated));
}

} // namespace CLI
} // namespace RotoRect
