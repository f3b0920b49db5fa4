#include "geometry/Point.h"

#include <QDebug>
#include <QString>
#include <QtMath>

#include <stdexcept>

namespace RotoRect {

qreal Point::operator[](int index) const
{
    if (index == 0) {
        return m_x;
    }
    if (index == 1) {
        return m_y;
    }
    throw std::out_of_range(
        QString("Point index %1 out of range (0-1)").arg(index).toStdString());
}

bool Point::fuzzyEquals(const Point& other, qreal epsilon) const
{
    return qAbs(m_x - other.m_x) <= epsilon && qAbs(m_y - other.m_y) <= epsilon;
}

QDebug operator<<(QDebug debug, const Point& point)
{
    QDebugStateSaver saver(debug);
    debug.nospace() << "Point(" << point.x() << ", " << point.y() << ')';
    return debug;
}

} // namespace RotoRect
