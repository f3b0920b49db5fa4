#include "cli/commands/HandlesCommand.h"

#include "cli/GeometryArguments.h"
#include "cli/GeometryOutput.h"
#include "geometry/HandleResolver.h"

#include <QJsonObject>
#include <QStringList>

namespace RotoRect {
namespace CLI {

QString HandlesCommand::name() const { return "handles"; }

QString HandlesCommand::description() const { return "Print the position of every handle"; }

void HandlesCommand::setupOptions(QCommandLineParser& parser)
{
    parser.addOption({{"r", "rect"}, "Rectangle (x,y,width,height)", "rect"});
    parser.addOption({{"a", "angle"}, "Rotation of the rectangle in degrees (default: 0)", "degrees"});
    GeometryOutput::addOptions(parser, false);
}

CLIResult HandlesCommand::execute(const QCommandLineParser& parser)
{
    Rectangle rect;
    CLIResult status = requireRectangle(parser, "rect", &rect);
    if (!status.isSuccess()) {
        return status;
    }

    qreal angle = 0.0;
    status = optionalAngle(parser, "angle", &angle);
    if (!status.isSuccess()) {
        return status;
    }

    OutputOptions options;
    status = GeometryOutput::optionsFromParser(parser, false, &options);
    if (!status.isSuccess()) {
        return status;
    }
    const GeometryOutput output(options);

    const auto positions = handlePositions(rect, angle);

    QJsonObject json;
    QStringList lines;
    for (std::size_t i = 0; i < allHandles().size(); ++i) {
        const QString name = handleName(allHandles()[i]);
        json[name] = output.json(positions[i]);
        lines.append(QString("%1: %2").arg(name, output.text(positions[i])));
    }
    return output.result(json, lines.join('\n'));
}

} // namespace CLI
} // namespace RotoRect
