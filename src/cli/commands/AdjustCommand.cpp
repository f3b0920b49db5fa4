#include "cli/commands/AdjustCommand.h"

#include "cli/GeometryArguments.h"
#include "cli/GeometryOutput.h"
#include "geometry/Rotation.h"

#include <QJsonObject>

namespace RotoRect {
namespace CLI {

QString AdjustCommand::name() const { return "adjust"; }

QString AdjustCommand::description() const
{
    return "Re-express diagonal corners around a shifted rotation center";
}

void AdjustCommand::setupOptions(QCommandLineParser& parser)
{
    parser.addOption({"corner-a", "Corner A of the rectangle (x,y)", "point"});
    parser.addOption({"corner-c", "Corner C, diagonal to A (x,y)", "point"});
    parser.addOption({{"c", "center"}, "Center to rotate corner A around (x,y)", "point"});
    parser.addOption({{"a", "angle"}, "Rotation angle in degrees", "degrees"});
    GeometryOutput::addOptions(parser, false);
}

CLIResult AdjustCommand::execute(const QCommandLineParser& parser)
{
    Point cornerA;
    CLIResult status = requirePoint(parser, "corner-a", &cornerA);
    if (!status.isSuccess()) {
        return status;
    }

    Point cornerC;
    status = requirePoint(parser, "corner-c", &cornerC);
    if (!status.isSuccess()) {
        return status;
    }

    Point center;
    status = requirePoint(parser, "center", &center);
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

    const DiagonalCorners corners = adjustPoints(cornerA, cornerC, center, angle);

    QJsonObject json;
    json["a"] = output.json(corners.a);
    json["c"] = output.json(corners.c);

    const QString text = QString("a: %1\nc: %2").arg(output.text(corners.a), output.text(corners.c));
    return output.result(json, text);
}

} // namespace CLI
} // namespace RotoRect
