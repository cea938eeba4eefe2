#pragma once

#include <QColor>
#include <QDate>
#include <QDateTime>
#include <QSet>
#include <QString>
#include <QUrl>
#include <optional>
#include <vector>

#include "eventually/data/EventInfo.hpp"

namespace eventually {
namespace core {
class EventCollection;
}

namespace ui {

enum class MenuActionKind {
    None,
    JoinCall,
    OpenEvent,
    DismissEvent,
    Quit
};

struct MenuAction
{
    MenuActionKind kind = MenuActionKind::None;
    QString payload;
};

enum class TextStyle {
    Bold,
    Secondary,
    Tertiary
};

// Offsets are QString (UTF-16) positions within MenuRow::label.
struct TextSpan
{
    int start = 0;
    int length = 0;
    TextStyle style = TextStyle::Bold;
};

enum class MenuRowKind {
    Action,
    Header,
    Event,
    Separator,
    Placeholder
};

struct MenuRow
{
    MenuRowKind kind = MenuRowKind::Action;
    QString label;
    QString iconKey;
    std::optional<QColor> dotColor;
    std::vector<TextSpan> spans;
    bool enabled = true;
    QString shortcut;
    MenuAction action;

    bool hasStyle(TextStyle style) const;
};

struct DayGroup
{
    QDate date;
    QString dayName;
    QString dateLabel;
    std::vector<const data::EventInfo *> events;

    QString header() const;
};

// Today, tomorrow and the two following days; empty days are left out.
std::vector<DayGroup> groupByDay(const core::EventCollection &collection, const QDate &today);

std::vector<MenuRow> buildMenuRows(const core::EventCollection &collection,
                                   const QSet<QString> &dismissed,
                                   const QDateTime &now);

QString openEventPayload(const data::EventInfo &event);

// URL a JoinCall or OpenEvent action should open.
std::optional<QUrl> targetUrl(const MenuAction &action);

} // namespace ui
} // namespace eventually
