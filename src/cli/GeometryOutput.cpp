#include "cli/GeometryOutput.h"

#include "settings/GeometrySettingsManager.h"

#include <QJsonDocument>
#include <QtMath>

#include <cmath>

namespace RotoRect {
namespace CLI {

GeometryOutput::GeometryOutput(const OutputOptions& options)
    : m_options(options)
{
}

void GeometryOutput::addOptions(QCommandLineParser& parser, bool printsRectangles)
{
    parser.addOption({"json", "Print the result as JSON"});
    parser.addOption({"precision", "Decimal places in the output (0-15)", "digits"});
    if (printsRectangles) {
        parser.addOption({"normalize", "Print rectangles with non-negative width and height"});
    }
}

CLIResult GeometryOutput::optionsFromParser(const QCommandLineParser& parser, bool printsRectangles,
                                            OutputOptions* out)
{
    const auto& settings = GeometrySettingsManager::instance();

    OutputOptions options;
    options.precision = settings.loadOutputPrecision();
    options.json = settings.loadJsonOutput() || parser.isSet("json");
    options.normalizeRectangles = settings.loadNormalizeRectangles();
    if (printsRectangles && parser.isSet("normalize")) {
        options.normalizeRectangles = true;
    }

    if (parser.isSet("precision")) {
        const QString value = parser.value("precision");
        bool ok = false;
        const int precision = value.toInt(&ok);
        if (!ok || precision < GeometrySettingsManager::kMinOutputPrecision
            || precision > GeometrySettingsManager::kMaxOutputPrecision) {
            return CLIResult::error(
                CLIResult::Code::InvalidArguments,
                QString("Invalid precision value: %1 (expected %2-%3)")
                    .arg(value)
                    .arg(GeometrySettingsManager::kMinOutputPrecision)
                    .arg(GeometrySettingsManager::kMaxOutputPrecision));
        }
        options.precision = precision;
    }

    *out = options;
    return CLIResult::success();
}

qreal GeometryOutput::rounded(qreal value) const
{
    if (!qIsFinite(value)) {
        return value;
    }
    const qreal scale = std::pow(10.0, m_options.precision);
    const qreal scaled = value * scale;
    // Too large to carry the requested decimals anyway
    if (!qIsFinite(scaled)) {
        return value;
    }
    const qreal result = std::round(scaled) / scale;
    // Avoid printing "-0"
    return result == 0.0 ? 0.0 : result;
}

QString GeometryOutput::number(qreal value) const
{
    if (qIsNaN(value)) {
        return QStringLiteral("nan");
    }
    if (qIsInf(value)) {
        return value > 0 ? QStringLiteral("inf") : QStringLiteral("-inf");
    }

    QString text = QString::number(rounded(value), 'f', m_options.precision);
    if (text.contains('.')) {
        while (text.endsWith('0')) {
            text.chop(1);
        }
        if (text.endsWith('.')) {
            text.chop(1);
        }
    }
    return text;
}

QString GeometryOutput::text(const Point& point) const
{
    return QString("%1,%2").arg(number(point.x()), number(point.y()));
}

QString GeometryOutput::text(const Rectangle& rect) const
{
    const Rectangle shown = displayed(rect);
    return QString("%1,%2,%3,%4")
        .arg(number(shown.x()), number(shown.y()), number(shown.width()), number(shown.height()));
}

QJsonObject GeometryOutput::json(const Point& point) const
{
    QJsonObject object;
    object["x"] = rounded(point.x());
    object["y"] = rounded(point.y());
    return object;
}

QJsonObject GeometryOutput::json(const Rectangle& rect) const
{
    const Rectangle shown = displayed(rect);
    QJsonObject object;
    object["x"] = rounded(shown.x());
    object["y"] = rounded(shown.y());
    object["width"] = rounded(shown.width());
    object["height"] = rounded(shown.height());
    return object;
}

Rectangle GeometryOutput::displayed(const Rectangle& rect) const
{
    return m_options.normalizeRectangles ? rect.normalized() : rect;
}

CLIResult GeometryOutput::result(const QJsonObject& json, const QString& text) const
{
    if (m_options.json) {
        return CLIResult::success(
            QString::fromUtf8(QJsonDocument(json).toJson(QJsonDocument::Compact)));
    }
    return CLIResult::success(text);
}

} // namespace CLI
} // namespace RotoRect
