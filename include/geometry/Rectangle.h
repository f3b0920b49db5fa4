#ifndef ROTORECT_RECTANGLE_H
#define ROTORECT_RECTANGLE_H

#include "geometry/Point.h"

#include <QRectF>
#include <QSizeF>

class QDebug;

namespace RotoRect {

/**
 * @brief Immutable rectangle in its unrotated local frame.
 *
 * Width and height may be negative when a handle is dragged past the
 * opposite edge. The rectangle carries no rotation; the angle is always
 * passed alongside it.
 */
class Rectangle
{
public:
    constexpr Rectangle() = default;
    constexpr Rectangle(qreal x, qreal y, qreal width, qreal height)
        : m_x(x), m_y(y), m_width(width), m_height(height)
    {
    }

    constexpr qreal x() const { return m_x; }
    constexpr qreal y() const { return m_y; }
    constexpr qreal width() const { return m_width; }
    constexpr qreal height() const { return m_height; }

    Point center() const { return Point(m_x + m_width / 2, m_y + m_height / 2); }
    Point position() const { return Point(m_x, m_y); }
    QSizeF size() const { return QSizeF(m_width, m_height); }

    // Same area with non-negative width and height. Never applied implicitly.
    Rectangle normalized() const;

    bool fuzzyEquals(const Rectangle& other, qreal epsilon = 1e-9) const;

    QRectF toRectF() const { return QRectF(m_x, m_y, m_width, m_height); }
    static Rectangle fromRectF(const QRectF& rect)
    {
        return Rectangle(rect.x(), rect.y(), rect.width(), rect.height());
    }

    friend constexpr bool operator==(const Rectangle& lhs, const Rectangle& rhs)
    {
        return lhs.m_x == rhs.m_x && lhs.m_y == rhs.m_y
            && lhs.m_width == rhs.m_width && lhs.m_height == rhs.m_height;
    }
    friend constexpr bool operator!=(const Rectangle& lhs, const Rectangle& rhs)
    {
        return !(lhs == rhs);
    }

private:
    qreal m_x = 0.0;
    qreal m_y = 0.0;
    qreal m_width = 0.0;
    qreal m_height = 0.0;
};

QDebug operator<<(QDebug debug, const Rectangle& rect);

} // namespace RotoRect

#endif // ROTORECT_RECTANGLE_H
