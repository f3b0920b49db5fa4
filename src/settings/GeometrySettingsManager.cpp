#include "settings/GeometrySettingsManager.h"
#include "settings/Settings.h"
#include <QSettings>

GeometrySettingsManager& GeometrySettingsManager::instance()
{
    static GeometrySettingsManager instance;
    return instance;
}

int GeometrySettingsManager::loadOutputPrecision() const
{
    auto settings = RotoRect::getSettings();
    bool ok = false;
    int precision = settings.value(RotoRect::kSettingsKeyOutputPrecision, kDefaultOutputPrecision)
                        .toInt(&ok);
    if (!ok) {
        return kDefaultOutputPrecision;
    }
    // Clamp to valid range
    return qBound(kMinOutputPrecision, precision, kMaxOutputPrecision);
}

void GeometrySettingsManager::saveOutputPrecision(int precision)
{
    auto settings = RotoRect::getSettings();
    settings.setValue(RotoRect::kSettingsKeyOutputPrecision, precision);
}

bool GeometrySettingsManager::loadJsonOutput() const
{
    auto settings = RotoRect::getSettings();
    return settings.value(RotoRect::kSettingsKeyJsonOutput, kDefaultJsonOutput).toBool();
}

void GeometrySettingsManager::saveJsonOutput(bool enabled)
{
    auto settings = RotoRect::getSettings();
    settings.setValue(RotoRect::kSettingsKeyJsonOutput, enabled);
}

bool GeometrySettingsManager::loadNormalizeRectangles() const
{
    auto settings = RotoRect::getSettings();
    return settings
        .value(RotoRect::kSettingsKeyNormalizeRectangles, kDefaultNormalizeRectangles)
        .toBool();
}

void GeometrySettingsManager::saveNormalizeRectangles(bool enabled)
{
    auto settings = RotoRect::getSettings();
    settings.setValue(RotoRect::kSettingsKeyNormalizeRectangles, enabled);
}
