#ifndef CLI_GEOMETRY_ARGUMENTS_H
#define CLI_GEOMETRY_ARGUMENTS_H

#include "CLIResult.h"
#include "geometry/Handle.h"
#include "geometry/Point.h"
#include "geometry/Rectangle.h"

#include <QCommandLineParser>
#include <QString>
#include <optional>

namespace RotoRect {
namespace CLI {

// "12.5" -> 12.5
std::optional<qreal> parseNumber(const QString& text);

// "x,y"
std::optional<Point> parsePoint(const QString& text);

// "x,y,width,height"; width and height may be zero or negative
std::optional<Rectangle> parseRectangle(const QString& text);

/**
 * @brief Read a mandatory option from the parser.
 *
 * Each helper stores the parsed value in @p out and returns success, or
 * returns an InvalidArguments result naming the option when it is missing
 * or malformed.
 */
CLIResult requirePoint(const QCommandLineParser& parser, const QString& option, Point* out);
CLIResult requireRectangle(const QCommandLineParser& parser, const QString& option, Rectangle* out);
CLIResult requireAngle(const QCommandLineParser& parser, const QString& option, qreal* out);
CLIResult requireHandle(const QCommandLineParser& parser, const QString& option, Handle* out);

// Like requireAngle(), but an unset option yields 0
CLIResult optionalAngle(const QCommandLineParser& parser, const QString& option, qreal* out);

} // namespace CLI
} // namespace RotoRect

#endif // CLI_GEOMETRY_ARGUMENTS_H
