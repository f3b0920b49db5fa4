#ifndef CLI_GEOMETRY_OUTPUT_H
#define CLI_GEOMETRY_OUTPUT_H

#include "CLIResult.h"
#include "geometry/Point.h"
#include "geometry/Rectangle.h"

#include <QCommandLineParser>
#include <QJsonObject>
#include <QString>

namespace RotoRect {
namespace CLI {

struct OutputOptions {
    int precision = 6;
    bool json = false;
    bool normalizeRectangles = false;
};

/**
 * @brief Formats geometry results as text or JSON.
 *
 * Text output reuses the input syntax ("x,y" and "x,y,width,height") so
 * results can be fed back into another command.
 */
class GeometryOutput
{
public:
    explicit GeometryOutput(const OutputOptions& options);

    /**
     * @brief Add --json and --precision (and --normalize when the command
     *        prints rectangles) to a command's parser.
     */
    static void addOptions(QCommandLineParser& parser, bool printsRectangles);

    /**
     * @brief Resolve output options: command line flags override the
     *        values stored in GeometrySettingsManager.
     */
    static CLIResult optionsFromParser(const QCommandLineParser& parser, bool printsRectangles,
                                       OutputOptions* out);

    QString number(qreal value) const;
    QString text(const Point& point) const;
    QString text(const Rectangle& rect) const;
    QJsonObject json(const Point& point) const;
    QJsonObject json(const Rectangle& rect) const;

    // Rectangle as it should be displayed (normalized when requested)
    Rectangle displayed(const Rectangle& rect) const;

    // Picks the JSON document or the text form depending on the options
    CLIResult result(const QJsonObject& json, const QString& text) const;

private:
    qreal rounded(qreal value) const;

    OutputOptions m_options;
};

} // namespace CLI
} // namespace RotoRect

#endif // CLI_GEOMETRY_OUTPUT_H
