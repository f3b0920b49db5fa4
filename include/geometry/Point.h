#ifndef ROTORECT_POINT_H
#define ROTORECT_POINT_H

#include <QPointF>
#include <QtGlobal>

#include <cstddef>
#include <tuple>
#include <utility>

class QDebug;

namespace RotoRect {

/**
 * @brief Immutable 2D point.
 *
 * Equality is exact. Use fuzzyEquals() when comparing results of
 * trigonometric computations.
 */
class Point
{
public:
    constexpr Point() = default;
    constexpr Point(qreal x, qreal y) : m_x(x), m_y(y) {}

    constexpr qreal x() const { return m_x; }
    constexpr qreal y() const { return m_y; }

    /**
     * @brief Component access by index.
     * @param index 0 for x, 1 for y
     * @throws std::out_of_range for any other index
     */
    qreal operator[](int index) const;

    std::pair<qreal, qreal> pos() const { return {m_x, m_y}; }

    template <std::size_t I>
    constexpr qreal get() const
    {
        static_assert(I < 2, "Point has two components");
        if constexpr (I == 0) {
            return m_x;
        } else {
            return m_y;
        }
    }

    bool fuzzyEquals(const Point& other, qreal epsilon = 1e-9) const;

    QPointF toPointF() const { return QPointF(m_x, m_y); }
    static Point fromPointF(const QPointF& point) { return Point(point.x(), point.y()); }

    friend constexpr bool operator==(const Point& lhs, const Point& rhs)
    {
        return lhs.m_x == rhs.m_x && lhs.m_y == rhs.m_y;
    }
    friend constexpr bool operator!=(const Point& lhs, const Point& rhs) { return !(lhs == rhs); }

private:
    qreal m_x = 0.0;
    qreal m_y = 0.0;
};

QDebug operator<<(QDebug debug, const Point& point);

} // namespace RotoRect

// Structured bindings: auto [x, y] = point;
namespace std {
template <>
struct tuple_size<RotoRect::Point> : std::integral_constant<std::size_t, 2> {};

template <std::size_t I>
struct tuple_element<I, RotoRect::Point> {
    using type = qreal;
};
} // namespace std

#endif // ROTORECT_POINT_H
