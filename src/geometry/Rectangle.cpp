#include "geometry/Rectangle.h"

#include <QDebug>
#include <QtMath>

namespace RotoRect {

Rectangle Rectangle::normalized() const
{
    qreal x = m_x;
    qreal y = m_y;
    qreal width = m_width;
    qreal height = m_height;

    if (width < 0) {
        x += width;
        width = -width;
    }
    if (height < 0) {
        y += height;
        height = -height;
    }
    return Rectangle(x, y, width, height);
}

bool Rectangle::fuzzyEquals(const Rectangle& other, qreal epsilon) const
{
    return qAbs(m_x - other.m_x) <= epsilon
        && qAbs(m_y - other.m_y) <= epsilon
        && qAbs(m_width - other.m_width) <= epsilon
        && qAbs(m_height - other.m_height) <= epsilon;
}

QDebug operator<<(QDebug debug, const Rectangle& rect)
{
    QDebugStateSaver saver(debug);
    debug.nospace() << "Rectangle(" << rect.x() << ", " << rect.y() << ' '
                    << rect.width() << 'x' << rect.height() << ')';
    return debug;
}

} // namespace RotoRect
