#ifndef ROTORECT_HANDLE_H
#define ROTORECT_HANDLE_H

#include <QString>

#include <array>
#include <optional>

class QDebug;

namespace RotoRect {

// Resize handles on a rectangle's bounding box (corners and edge midpoints)
enum class Handle {
    TopRight = 0,
    MiddleRight,
    BottomRight,

    TopLeft,
    MiddleLeft,
    BottomLeft,

    TopMiddle,
    BottomMiddle
};

// Every handle in enumerator order
inline constexpr std::array<Handle, 8> allHandles()
{
    return {Handle::TopRight,   Handle::MiddleRight, Handle::BottomRight, Handle::TopLeft,
            Handle::MiddleLeft, Handle::BottomLeft,  Handle::TopMiddle,   Handle::BottomMiddle};
}

/**
 * @brief Kebab-case name of a handle, e.g. "top-right".
 * @return Empty string for a value outside the enumerators
 */
QString handleName(Handle handle);

/**
 * @brief Parse a handle name.
 *
 * Case-insensitive; "top-right", "top_right" and "TopRight" are accepted.
 */
std::optional<Handle> handleFromName(const QString& name);

std::optional<Handle> handleFromIndex(int index);

bool isCornerHandle(Handle handle);

QDebug operator<<(QDebug debug, Handle handle);

} // namespace RotoRect

#endif // ROTORECT_HANDLE_H
