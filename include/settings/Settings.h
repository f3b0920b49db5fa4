#pragma once

#include <QSettings>
#include <QString>
#include <QStringList>
#include "version.h"

namespace RotoRect {

inline constexpr const char* kOrganizationName = "RotoRect";
inline constexpr const char* kApplicationName = ROTORECT_APP_NAME;

// Settings keys
inline constexpr const char* kSettingsKeyOutputPrecision = "output/precision";
inline constexpr const char* kSettingsKeyJsonOutput = "output/json";
inline constexpr const char* kSettingsKeyNormalizeRectangles = "output/normalizeRectangles";

inline QStringList knownSettingsKeys()
{
    return {
        QString::fromLatin1(kSettingsKeyOutputPrecision),
        QString::fromLatin1(kSettingsKeyJsonOutput),
        QString::fromLatin1(kSettingsKeyNormalizeRectangles)
    };
}

inline QSettings getSettings()
{
    return QSettings(kOrganizationName, kApplicationName);
}

} // namespace RotoRect
