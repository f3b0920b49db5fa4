#include "geometry/HandleResolver.h"

#include "geometry/Rotation.h"

#include <QString>

#include <stdexcept>

namespace RotoRect {

namespace {
[[noreturn]] void throwUnknownHandle(Handle handle)
{
    throw std::invalid_argument(
        QString("Unsupported handle value: %1").arg(static_cast<int>(handle)).toStdString());
}
} // namespace

AnchorPair getAdjustedPoint(const Rectangle& rectangle, const Point& target,
                            qreal angleDegrees, Handle handle)
{
    const qreal x = rectangle.x();
    const qreal y = rectangle.y();
    const qreal w = rectangle.width();
    const qreal h = rectangle.height();
    const Point center = rectangle.center();

    // Target in the rectangle's unrotated frame
    const Point normalC = rotate(target, center, -angleDegrees);

    switch (handle) {
    case Handle::TopRight:
        return {Point(x, y), target};

    case Handle::MiddleRight: {
        const Point interpolated(normalC.x(), y + h);
        return {Point(x, y), rotate(interpolated, center, angleDegrees)};
    }

    case Handle::BottomRight:
        return {Point(x, y + h), target};

    case Handle::TopLeft:
        return {Point(x + w, y), target};

    case Handle::MiddleLeft: {
        const Point interpolated(normalC.x(), y + h);
        return {Point(x + w, y), rotate(interpolated, center, angleDegrees)};
    }

    case Handle::BottomLeft:
        return {Point(x + w, y + h), target};

    case Handle::TopMiddle: {
        const Point interpolated(x + w, normalC.y());
        return {Point(x, y), rotate(interpolated, center, angleDegrees)};
    }

    case Handle::BottomMiddle: {
        const Point interpolated(x + w, normalC.y());
        return {Point(x, y + h), rotate(interpolated, center, angleDegrees)};
    }
    }

    throwUnknownHandle(handle);
}

Rectangle toRect(const Point& fixed, const Point& moving, Handle handle)
{
    switch (handle) {
    case Handle::TopRight:
    case Handle::MiddleRight:
    case Handle::TopMiddle:
        return Rectangle(fixed.x(), fixed.y(), moving.x() - fixed.x(), moving.y() - fixed.y());

    case Handle::BottomRight: {
        const qreal height = fixed.y() - moving.y();
        return Rectangle(fixed.x(), fixed.y() - height, moving.x() - fixed.x(), height);
    }

    case Handle::TopLeft:
    case Handle::MiddleLeft: {
        const qreal height = moving.y() - fixed.y();
        return Rectangle(moving.x(), moving.y() - height, fixed.x() - moving.x(), height);
    }

    case Handle::BottomLeft:
        return Rectangle(moving.x(), moving.y(), fixed.x() - moving.x(), fixed.y() - moving.y());

    case Handle::BottomMiddle:
        return Rectangle(fixed.x(), moving.y(), moving.x() - fixed.x(), fixed.y() - moving.y());
    }

    throwUnknownHandle(handle);
}

Rectangle toRect(const AnchorPair& anchors, Handle handle)
{
    return toRect(anchors.fixed, anchors.moving, handle);
}

Rectangle resizeWithHandle(const Rectangle& rectangle, const Point& target,
                           qreal angleDegrees, Handle handle)
{
    return toRect(getAdjustedPoint(rectangle, target, angleDegrees, handle), handle);
}

Point handlePosition(const Rectangle& rectangle, qreal angleDegrees, Handle handle)
{
    const qreal x = rectangle.x();
    const qreal y = rectangle.y();
    const qreal w = rectangle.width();
    const qreal h = rectangle.height();
    const Point center = rectangle.center();

    switch (handle) {
    case Handle::TopRight:
        return rotate(Point(x + w, y + h), center, angleDegrees);
    case Handle::MiddleRight:
        return rotate(Point(x + w, y + h / 2), center, angleDegrees);
    case Handle::BottomRight:
        return rotate(Point(x + w, y), center, angleDegrees);
    case Handle::TopLeft:
        return rotate(Point(x, y + h), center, angleDegrees);
    case Handle::MiddleLeft:
        return rotate(Point(x, y + h / 2), center, angleDegrees);
    case Handle::BottomLeft:
        return rotate(Point(x, y), center, angleDegrees);
    case Handle::TopMiddle:
        return rotate(Point(x + w / 2, y + h), center, angleDegrees);
    case Handle::BottomMiddle:
        return rotate(Point(x + w / 2, y), center, angleDegrees);
    }

    throwUnknownHandle(handle);
}

std::array<Point, 8> handlePositions(const Rectangle& rectangle, qreal angleDegrees)
{
    std::array<Point, 8> positions;
    for (std::size_t i = 0; i < allHandles().size(); ++i) {
        positions[i] = handlePosition(rectangle, angleDegrees, allHandles()[i]);
    }
    return positions;
}

} // namespace RotoRect
