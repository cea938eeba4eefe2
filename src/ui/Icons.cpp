#include "eventually/ui/Icons.hpp"

#include "eventually/core/Errors.hpp"
#include "eventually/core/Logging.hpp"

#include <QFile>
#include <QFontMetrics>
#include <QPainter>

namespace eventually {
namespace ui {

QIcon loadIcon(const QString &key)
{
    if (key.isEmpty()) {
        return {};
    }
    const QString path = QStringLiteral(":/icons/%1.svg").arg(key);
    if (!QFile::exists(path)) {
        qCWarning(EVENTUALLY_UI_LOG) << "loadIcon:" << core::errorMessage(core::CalendarError::IconMissing) << key;
        return {};
    }
    return QIcon(path);
}

QPixmap calendarDot(const QColor &color, int size)
{
    QPixmap pixmap(size, size);
    pixmap.fill(Qt::transparent);

    QPainter painter(&pixmap);
    painter.setRenderHint(QPainter::Antialiasing);
    painter.setPen(Qt::NoPen);
    painter.setBrush(color);
    const qreal diameter = size / 2.0;
    const qreal offset = (size - diameter) / 2.0;
    painter.drawEllipse(QRectF(offset, offset, diameter, diameter));
    return pixmap;
}

QPixmap renderStatusTitle(const QString &title, const QFont &font, const QColor &textColor, int height)
{
    const QFontMetrics metrics(font);
    const int padding = 4;
    const int width = qMax(height, metrics.horizontalAdvance(title) + 2 * padding);

    QPixmap pixmap(width, height);
    pixmap.fill(Qt::transparent);

    QPainter painter(&pixmap);
    painter.setRenderHint(QPainter::TextAntialiasing);
    painter.setFont(font);
    painter.setPen(textColor);
    painter.drawText(QRect(padding, 0, width - 2 * padding, height), Qt::AlignVCenter | Qt::AlignLeft, title);
    return pixmap;
}

} // namespace ui
} // namespace eventually
