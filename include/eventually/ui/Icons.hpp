#pragma once

#include <QColor>
#include <QFont>
#include <QIcon>
#include <QPixmap>
#include <QString>

namespace eventually {
namespace ui {

// Icon from the :/icons resources; a null icon when the key is unknown.
QIcon loadIcon(const QString &key);

QPixmap calendarDot(const QColor &color, int size = 16);

// Status title rendered for trays that only show images.
QPixmap renderStatusTitle(const QString &title, const QFont &font, const QColor &textColor, int height = 22);

} // namespace ui
} // namespace eventually
