#ifndef GEOMETRYSETTINGSMANAGER_H
#define GEOMETRYSETTINGSMANAGER_H

#include <QtGlobal>

/**
 * @brief Singleton class for managing geometry output settings.
 *
 * Controls how the command line front-end prints results: decimal
 * precision, JSON vs. text output, and whether rectangles with negative
 * extents are normalized before display. The geometry library itself
 * never reads these.
 */
class GeometrySettingsManager
{
public:
    static GeometrySettingsManager& instance();

    // Decimal places (0 - 15)
    int loadOutputPrecision() const;
    void saveOutputPrecision(int precision);

    bool loadJsonOutput() const;
    void saveJsonOutput(bool enabled);

    // Display-only; toRect() results are never normalized by the library
    bool loadNormalizeRectangles() const;
    void saveNormalizeRectangles(bool enabled);

    // Default values
    static constexpr int kDefaultOutputPrecision = 6;
    static constexpr int kMinOutputPrecision = 0;
    static constexpr int kMaxOutputPrecision = 15;
    static constexpr bool kDefaultJsonOutput = false;
    static constexpr bool kDefaultNormalizeRectangles = false;

private:
    GeometrySettingsManager() = default;
    GeometrySettingsManager(const GeometrySettingsManager&) = delete;
    GeometrySettingsManager& operator=(const GeometrySettingsManager&) = delete;
};

#endif // GEOMETRYSETTINGSMANAGER_H
