#include "geometry/Handle.h"

#include <QDebug>

namespace RotoRect {

namespace {
QString canonicalName(QString name)
{
    name = name.trimmed().toLower();
    name.remove('-');
    name.remove('_');
    return name;
}
} // namespace

QString handleName(Handle handle)
{
    switch (handle) {
    case Handle::TopRight:
        return QStringLiteral("top-right");
    case Handle::MiddleRight:
        return QStringLiteral("middle-right");
    case Handle::BottomRight:
        return QStringLiteral("bottom-right");
    case Handle::TopLeft:
        return QStringLiteral("top-left");
    case Handle::MiddleLeft:
        return QStringLiteral("middle-left");
    case Handle::BottomLeft:
        return QStringLiteral("bottom-left");
    case Handle::TopMiddle:
        return QStringLiteral("top-middle");
    case Handle::BottomMiddle:
        return QStringLiteral("bottom-middle");
    }
    return QString();
}

std::optional<Handle> handleFromName(const QString& name)
{
    const QString wanted = canonicalName(name);
    if (wanted.isEmpty()) {
        return std::nullopt;
    }

    for (Handle handle : allHandles()) {
        if (canonicalName(handleName(handle)) == wanted) {
            return handle;
        }
    }
    return std::nullopt;
}

std::optional<Handle> handleFromIndex(int index)
{
    if (index < 0 || index >= static_cast<int>(allHandles().size())) {
        return std::nullopt;
    }
    return allHandles()[static_cast<std::size_t>(index)];
}

bool isCornerHandle(Handle handle)
{
    switch (handle) {
    case Handle::TopRight:
    case Handle::BottomRight:
    case Handle::TopLeft:
    case Handle::BottomLeft:
        return true;
    case Handle::MiddleRight:
    case Handle::MiddleLeft:
    case Handle::TopMiddle:
    case Handle::BottomMiddle:
        return false;
    }
    return false;
}

QDebug operator<<(QDebug debug, Handle handle)
{
    QDebugStateSaver saver(debug);
    const QString name = handleName(handle);
    if (name.isEmpty()) {
        debug.nospace() << "Handle(" << static_cast<int>(handle) << ')';
    } else {
        debug.nospace() << "Handle(" << qPrintable(name) << ')';
    }
    return debug;
}

} // namespace RotoRect
