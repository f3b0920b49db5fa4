#include "cli/commands/ConfigCommand.h"

#include "settings/GeometrySettingsManager.h"
#include "settings/Settings.h"

#include <QDebug>
#include <QSettings>
#include <QTextStream>

namespace RotoRect {
namespace CLI {

namespace {
QString currentValue(const QString& key)
{
    const auto& manager = GeometrySettingsManager::instance();
    if (key == kSettingsKeyOutputPrecision) {
        return QString::number(manager.loadOutputPrecision());
    }
    if (key == kSettingsKeyJsonOutput) {
        return manager.loadJsonOutput() ? "true" : "false";
    }
    return manager.loadNormalizeRectangles() ? "true" : "false";
}

bool parseBool(const QString& value, bool* ok)
{
    const QString lowered = value.trimmed().toLower();
    if (lowered == "true" || lowered == "1" || lowered == "yes" || lowered == "on") {
        *ok = true;
        return true;
    }
    if (lowered == "false" || lowered == "0" || lowered == "no" || lowered == "off") {
        *ok = true;
        return false;
    }
    *ok = false;
    return false;
}

CLIResult syncResult(QSettings& settings, const QString& successMessage)
{
    settings.sync();
    if (settings.status() != QSettings::NoError) {
        qWarning() << "ConfigCommand: failed to write settings to" << settings.fileName();
        return CLIResult::error(CLIResult::Code::SettingsError,
                                QString("Failed to write settings: %1").arg(settings.fileName()));
    }
    return CLIResult::success(successMessage);
}
} // namespace

QString ConfigCommand::name() const { return "config"; }

QString ConfigCommand::description() const { return "Get or set output configuration"; }

void ConfigCommand::setupOptions(QCommandLineParser& parser)
{
    parser.addOption({"get", "Get setting value", "key"});
    parser.addOption({"set", "Set setting value (use with positional arg)", "key"});
    parser.addOption({"list", "List all settings"});
    parser.addOption({"reset", "Reset to default values"});
    parser.addPositionalArgument("value", "Value to set (when using --set)");
}

CLIResult ConfigCommand::execute(const QCommandLineParser& parser)
{
    const QStringList keys = knownSettingsKeys();

    // --list: List all settings with their effective values
    if (parser.isSet("list")) {
        QString output;
        QTextStream out(&output);
        out << "Current settings:\n";
        for (const QString& key : keys) {
            out << QString("  %1 = %2\n").arg(key, currentValue(key));
        }
        return CLIResult::success(output);
    }

    // --get: Get setting value
    if (parser.isSet("get")) {
        const QString key = parser.value("get");
        if (!keys.contains(key)) {
            return CLIResult::error(
                CLIResult::Code::InvalidArguments, QString("Setting not found: %1").arg(key));
        }
        return CLIResult::success(currentValue(key));
    }

    // --set: Set setting value
    if (parser.isSet("set")) {
        const QString key = parser.value("set");
        if (!keys.contains(key)) {
            return CLIResult::error(
                CLIResult::Code::InvalidArguments, QString("Setting not found: %1").arg(key));
        }
        const QStringList positionalArgs = parser.positionalArguments();
        if (positionalArgs.isEmpty()) {
            return CLIResult::error(CLIResult::Code::InvalidArguments, "Value required for --set");
        }
        const QString value = positionalArgs.first();

        QSettings settings = getSettings();
        bool ok = false;
        if (key == kSettingsKeyOutputPrecision) {
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
            settings.setValue(key, precision);
        } else {
            const bool enabled = parseBool(value, &ok);
            if (!ok) {
                return CLIResult::error(
                    CLIResult::Code::InvalidArguments,
                    QString("Invalid boolean value: %1").arg(value));
            }
            settings.setValue(key, enabled);
        }
        return syncResult(settings, QString("Set %1 = %2").arg(key, value));
    }

    // --reset: Reset to defaults
    if (parser.isSet("reset")) {
        QSettings settings = getSettings();
        for (const QString& key : keys) {
            settings.remove(key);
        }
        return syncResult(settings, "Settings reset to defaults");
    }

    return CLIResult::error(
        CLIResult::Code::InvalidArguments, "Specify one of --list, --get, --set or --reset");
}

} // namespace CLI
} // namespace RotoRect
