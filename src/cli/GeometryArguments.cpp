#include "cli/GeometryArguments.h"

#include <QStringList>

namespace RotoRect {
namespace CLI {

namespace {
std::optional<QList<qreal>> parseNumberList(const QString& text, int expectedCount)
{
    const QStringList parts = text.split(',');
    if (parts.size() != expectedCount) {
        return std::nullopt;
    }

    QList<qreal> values;
    values.reserve(expectedCount);
    for (const QString& part : parts) {
        const std::optional<qreal> value = parseNumber(part);
        if (!value) {
            return std::nullopt;
        }
        values.append(*value);
    }
    return values;
}

QString handleNameList()
{
    QStringList names;
    for (Handle handle : allHandles()) {
        names.append(handleName(handle));
    }
    return names.join(", ");
}
} // namespace

std::optional<qreal> parseNumber(const QString& text)
{
    bool ok = false;
    const qreal value = text.trimmed().toDouble(&ok);
    if (!ok) {
        return std::nullopt;
    }
    return value;
}

std::optional<Point> parsePoint(const QString& text)
{
    const auto values = parseNumberList(text, 2);
    if (!values) {
        return std::nullopt;
    }
    return Point(values->at(0), values->at(1));
}

std::optional<Rectangle> parseRectangle(const QString& text)
{
    const auto values = parseNumberList(text, 4);
    if (!values) {
        return std::nullopt;
    }
    return Rectangle(values->at(0), values->at(1), values->at(2), values->at(3));
}

CLIResult requirePoint(const QCommandLineParser& parser, const QString& option, Point* out)
{
    if (!parser.isSet(option)) {
        return CLIResult::error(
            CLIResult::Code::InvalidArguments,
            QString("Point required. Use --%1 x,y").arg(option));
    }

    const QString value = parser.value(option);
    const std::optional<Point> point = parsePoint(value);
    if (!point) {
        return CLIResult::error(
            CLIResult::Code::InvalidArguments,
            QString("Invalid --%1 value: %2 (expected x,y)").arg(option, value));
    }
    *out = *point;
    return CLIResult::success();
}

CLIResult requireRectangle(const QCommandLineParser& parser, const QString& option, Rectangle* out)
{
    if (!parser.isSet(option)) {
        return CLIResult::error(
            CLIResult::Code::InvalidArguments,
            QString("Rectangle required. Use --%1 x,y,width,height").arg(option));
    }

    const QString value = parser.value(option);
    const std::optional<Rectangle> rect = parseRectangle(value);
    if (!rect) {
        return CLIResult::error(
            CLIResult::Code::InvalidArguments,
            QString("Invalid --%1 value: %2 (expected x,y,width,height)").arg(option, value));
    }
    *out = *rect;
    return CLIResult::success();
}

CLIResult requireAngle(const QCommandLineParser& parser, const QString& option, qreal* out)
{
    if (!parser.isSet(option)) {
        return CLIResult::error(
            CLIResult::Code::InvalidArguments,
            QString("Angle required. Use --%1 degrees").arg(option));
    }
    return optionalAngle(parser, option, out);
}

CLIResult optionalAngle(const QCommandLineParser& parser, const QString& option, qreal* out)
{
    if (!parser.isSet(option)) {
        *out = 0.0;
        return CLIResult::success();
    }

    const QString value = parser.value(option);
    const std::optional<qreal> angle = parseNumber(value);
    if (!angle) {
        return CLIResult::error(
            CLIResult::Code::InvalidArguments,
            QString("Invalid angle value: %1").arg(value));
    }
    *out = *angle;
    return CLIResult::success();
}

CLIResult requireHandle(const QCommandLineParser& parser, const QString& option, Handle* out)
{
    if (!parser.isSet(option)) {
        return CLIResult::error(
            CLIResult::Code::InvalidArguments,
            QString("Handle required. Use --%1 <%2>").arg(option, handleNameList()));
    }

    const QString value = parser.value(option);
    const std::optional<Handle> handle = handleFromName(value);
    if (!handle) {
        return CLIResult::error(
            CLIResult::Code::InvalidArguments,
            QString("Unknown handle: %1 (expected one of: %2)").arg(value, handleNameList()));
    }
    *out = *handle;
    return CLIResult::success();
}

} // namespace CLI
} // namespace RotoRect
