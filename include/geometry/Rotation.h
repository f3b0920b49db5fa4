#ifndef ROTORECT_ROTATION_H
#define ROTORECT_ROTATION_H

#include "geometry/Point.h"

namespace RotoRect {

// Two diagonal corners of a rectangle (A and its opposite C)
struct DiagonalCorners {
    Point a;
    Point c;
};

/**
 * @brief Rotate a point around an origin.
 *
 * Uses the standard rotation matrix, so positive angles turn from the +x
 * axis towards the +y axis. Non-finite inputs propagate to the result.
 *
 * @param point Point to rotate
 * @param origin Center of rotation
 * @param angleDegrees Rotation angle in degrees
 * @return The rotated point
 */
Point rotate(const Point& point, const Point& origin, qreal angleDegrees);

/**
 * @brief Re-express two diagonal corners around a shifted rotation center.
 *
 * Corner A is rotated around @p center by @p angleDegrees. The midpoint of
 * that rotated A and corner C becomes the new center, and both points are
 * rotated back by -angleDegrees around it.
 *
 * The corners are not checked for being diagonal.
 *
 * @return A' and C'
 */
DiagonalCorners adjustPoints(const Point& cornerA, const Point& cornerC,
                             const Point& center, qreal angleDegrees);

} // namespace RotoRect

#endif // ROTORECT_ROTATION_H
