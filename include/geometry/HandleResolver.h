#ifndef ROTORECT_HANDLERESOLVER_H
#define ROTORECT_HANDLERESOLVER_H

#include "geometry/Handle.h"
#include "geometry/Point.h"
#include "geometry/Rectangle.h"

#include <array>

namespace RotoRect {

// Anchor points of a drag: the corner that stays put and the one that follows the handle
struct AnchorPair {
    Point fixed;
    Point moving;
};

/**
 * @brief Compute the fixed and moving anchors for a handle drag.
 *
 * Corner handles keep the opposite corner fixed and move exactly to
 * @p target. Edge handles only change one dimension: the target is taken
 * into the rectangle's local frame, the constrained coordinate is replaced
 * by the original edge, and the result is rotated back into world space.
 *
 * @param rectangle Rectangle before the drag (local frame)
 * @param target New handle position in world space
 * @param angleDegrees Rotation of the rectangle around its center
 * @param handle Dragged handle
 * @throws std::invalid_argument if @p handle is not one of the enumerators
 */
AnchorPair getAdjustedPoint(const Rectangle& rectangle, const Point& target,
                            qreal angleDegrees, Handle handle);

/**
 * @brief Rebuild a local-frame rectangle from a drag's anchor points.
 *
 * Width or height come out negative when the drag crosses the fixed corner.
 *
 * @throws std::invalid_argument if @p handle is not one of the enumerators
 */
Rectangle toRect(const Point& fixed, const Point& moving, Handle handle);
Rectangle toRect(const AnchorPair& anchors, Handle handle);

// getAdjustedPoint() followed by toRect()
Rectangle resizeWithHandle(const Rectangle& rectangle, const Point& target,
                           qreal angleDegrees, Handle handle);

/**
 * @brief World-space position of a handle on a rotated rectangle.
 *
 * Dragging a handle to its own position leaves an unrotated rectangle
 * unchanged.
 *
 * @throws std::invalid_argument if @p handle is not one of the enumerators
 */
Point handlePosition(const Rectangle& rectangle, qreal angleDegrees, Handle handle);

// Positions in allHandles() order
std::array<Point, 8> handlePositions(const Rectangle& rectangle, qreal angleDegrees);

} // namespace RotoRect

#endif // ROTORECT_HANDLERESOLVER_H
