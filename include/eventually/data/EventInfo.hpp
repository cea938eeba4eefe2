#pragma once

#include <QColor>
#include <QDateTime>
#include <QString>
#include <optional>

namespace eventually {
namespace data {

struct CalendarRecord;

inline const QColor kDefaultCalendarColor = QColor::fromRgbF(0.5, 0.5, 0.5);

struct EventInfo
{
    QString title;
    QDateTime start;
    QDateTime end;
    QString eventId;
    // eventId plus start time; recurring instances share the eventId.
    QString occurrenceKey;
    bool hasRecurrence = false;
    std::optional<QString> location;
    QColor calendarColor = kDefaultCalendarColor;

    static EventInfo fromRecord(const CalendarRecord &record);
};

QString makeOccurrenceKey(const QString &eventId, const QDateTime &start);

} // namespace data
} // namespace eventually
