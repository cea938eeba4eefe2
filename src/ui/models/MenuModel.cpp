#include "eventually/ui/models/MenuModel.hpp"

#include "eventually/core/Errors.hpp"
#include "eventually/core/EventCollection.hpp"
#include "eventually/core/Formatting.hpp"
#include "eventually/core/Logging.hpp"
#include "eventually/core/ServiceInfo.hpp"

#include <QLocale>
#include <QStringList>
#include <algorithm>

namespace eventually {
namespace ui {

namespace {
const QString PAYLOAD_SEPARATOR = QStringLiteral("|||");

MenuRow separatorRow()
{
    MenuRow row;
    row.kind = MenuRowKind::Separator;
    row.enabled = false;
    return row;
}

MenuRow actionRow(const QString &label, const QString &iconKey, MenuActionKind kind, const QString &payload)
{
    MenuRow row;
    row.kind = MenuRowKind::Action;
    row.label = label;
    row.iconKey = iconKey;
    row.action = MenuAction{kind, payload};
    return row;
}

void appendQuickActions(const data::EventInfo &event, std::vector<MenuRow> &rows)
{
    if (const auto url = core::extractUrl(event.location)) {
        const core::Service service = core::detectService(*url);
        rows.push_back(actionRow(QStringLiteral("Join %1 Event").arg(core::serviceName(service)),
                                 core::serviceIcon(service), MenuActionKind::JoinCall, *url));
    }
    rows.push_back(actionRow(QStringLiteral("Open in Calendar"), QStringLiteral("calendar"), MenuActionKind::OpenEvent,
                             openEventPayload(event)));
    rows.push_back(actionRow(QStringLiteral("Dismiss Event"), QStringLiteral("circle-x"), MenuActionKind::DismissEvent,
                             event.occurrenceKey));
    rows.push_back(separatorRow());
}

MenuRow eventRow(const data::EventInfo &event, bool highlighted, bool dismissed, const QDateTime &now)
{
    const bool allDay = core::isAllDay(event.start, event.end);
    const QString startTime = core::formatTime(event.start);
    const QString endTime = core::formatTime(event.end);
    const QString prefix = allDay ? QStringLiteral("All day:") : QStringLiteral("%1 - %2").arg(startTime, endTime);

    MenuRow row;
    row.kind = MenuRowKind::Event;
    row.label = prefix + QLatin1Char(' ') + event.title;
    row.dotColor = event.calendarColor;
    row.action = MenuAction{MenuActionKind::OpenEvent, openEventPayload(event)};

    const int fullLength = row.label.size();
    // Covers "- HH:mm" after the start time.
    const TextSpan endTimeSpan{startTime.size() + 1, 2 + endTime.size(), TextStyle::Secondary};

    if (highlighted) {
        row.spans.push_back(TextSpan{0, fullLength, TextStyle::Bold});
    }
    if (!allDay) {
        row.spans.push_back(endTimeSpan);
    }
    if (event.end < now || dismissed) {
        row.spans.push_back(TextSpan{0, fullLength, TextStyle::Secondary});
        if (!allDay) {
            row.spans.push_back(TextSpan{endTimeSpan.start, endTimeSpan.length, TextStyle::Tertiary});
        }
    }
    return row;
}
} // namespace

bool MenuRow::hasStyle(TextStyle style) const
{
    return std::any_of(spans.cbegin(), spans.cend(), [style](const TextSpan &span) { return span.style == style; });
}

QString DayGroup::header() const
{
    return QStringLiteral("%1, %2").arg(dayName, dateLabel);
}

std::vector<DayGroup> groupByDay(const core::EventCollection &collection, const QDate &today)
{
    const QLocale locale = QLocale::c();
    std::vector<DayGroup> groups;
    for (int offset = 0; offset < core::EventCollection::kDaysToFetch; ++offset) {
        const QDate date = today.addDays(offset);
        auto events = collection.eventsOn(date);
        if (events.empty()) {
            continue;
        }

        DayGroup group;
        group.date = date;
        if (offset == 0) {
            group.dayName = QStringLiteral("Today");
        } else if (offset == 1) {
            group.dayName = QStringLiteral("Tomorrow");
        } else {
            group.dayName = locale.dayName(date.dayOfWeek(), QLocale::LongFormat);
        }
        group.dateLabel = locale.toString(date, QStringLiteral("dd MMM"));
        group.events = std::move(events);
        groups.push_back(std::move(group));
    }
    return groups;
}

std::vector<MenuRow> buildMenuRows(const core::EventCollection &collection,
                                   const QSet<QString> &dismissed,
                                   const QDateTime &now)
{
    std::vector<MenuRow> rows;

    const auto status = collection.findCurrentOrNext(dismissed, now);
    if (status) {
        appendQuickActions(*status->event, rows);
    }

    if (collection.isEmpty()) {
        MenuRow placeholder;
        placeholder.kind = MenuRowKind::Placeholder;
        placeholder.label = QStringLiteral("No events");
        placeholder.enabled = false;
        rows.push_back(placeholder);
    } else {
        for (const DayGroup &group : groupByDay(collection, now.toLocalTime().date())) {
            MenuRow header;
            header.kind = MenuRowKind::Header;
            header.label = group.header();
            header.enabled = false;
            header.spans.push_back(TextSpan{0, group.dayName.size(), TextStyle::Bold});
            rows.push_back(header);

            for (const data::EventInfo *event : group.events) {
                const bool highlighted = status && status->event->occurrenceKey == event->occurrenceKey;
                rows.push_back(eventRow(*event, highlighted, dismissed.contains(event->occurrenceKey), now));
            }
            rows.push_back(separatorRow());
        }
    }

    MenuRow quit = actionRow(QStringLiteral("Quit"), QString(), MenuActionKind::Quit, QString());
    quit.shortcut = QStringLiteral("q");
    rows.push_back(quit);
    return rows;
}

QString openEventPayload(const data::EventInfo &event)
{
    return event.eventId + PAYLOAD_SEPARATOR
        + (event.hasRecurrence ? QStringLiteral("true") : QStringLiteral("false"));
}

std::optional<QUrl> targetUrl(const MenuAction &action)
{
    QString urlString;
    switch (action.kind) {
    case MenuActionKind::OpenEvent: {
        const QStringList parts = action.payload.split(PAYLOAD_SEPARATOR);
        const bool hasRecurrence = parts.value(1) == QLatin1String("true");
        // Calendar.app cannot address a single recurring instance by id.
        urlString = hasRecurrence ? QStringLiteral("ical://") : QStringLiteral("ical://ekevent/%1").arg(parts.value(0));
        break;
    }
    case MenuActionKind::JoinCall:
        urlString = action.payload;
        if (urlString.contains(QLatin1String("slack"))) {
            urlString = core::slackHuddleLink(urlString).value_or(urlString);
        }
        break;
    case MenuActionKind::None:
    case MenuActionKind::DismissEvent:
    case MenuActionKind::Quit:
        return std::nullopt;
    }

    const QUrl url(urlString, QUrl::StrictMode);
    if (urlString.isEmpty() || !url.isValid()) {
        qCWarning(EVENTUALLY_UI_LOG) << "targetUrl:" << core::errorMessage(core::CalendarError::UrlConstructionFailed)
                                     << urlString;
        return std::nullopt;
    }
    return url;
}

} // namespace ui
} // namespace eventually
