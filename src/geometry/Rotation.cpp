#include "geometry/Rotation.h"

#include <QtMath>

namespace RotoRect {

Point rotate(const Point& point, const Point& origin, qreal angleDegrees)
{
    const qreal radians = qDegreesToRadians(angleDegrees);
    const qreal cosA = qCos(radians);
    const qreal sinA = qSin(radians);

    const qreal dx = point.x() - origin.x();
    const qreal dy = point.y() - origin.y();

    return Point(
        dx * cosA - dy * sinA + origin.x(),
        dx * sinA + dy * cosA + origin.y()
    );
}

DiagonalCorners adjustPoints(const Point& cornerA, const Point& cornerC,
                             const Point& center, qreal angleDegrees)
{
    const Point rotatedA = rotate(cornerA, center, angleDegrees);

    const Point newCenter(
        (rotatedA.x() + cornerC.x()) / 2,
        (rotatedA.y() + cornerC.y()) / 2
    );

    return {
        rotate(rotatedA, newCenter, -angleDegrees),
        rotate(cornerC, newCenter, -angleDegrees)
    };
}

} // namespace RotoRect
