#include "eventually/data/EventInfo.hpp"

#include "eventually/data/EventSource.hpp"

namespace eventually {
namespace data {

EventInfo EventInfo::fromRecord(const CalendarRecord &record)
{
    EventInfo event;
    event.title = record.title;
    event.start = record.start.toLocalTime();
    event.end = record.end.toLocalTime();
    event.eventId = record.id;
    event.occurrenceKey = makeOccurrenceKey(record.id, record.start);
    event.hasRecurrence = record.hasRecurrence;
    event.location = record.location;
    event.calendarColor = record.calendarColor.isValid() ? record.calendarColor : kDefaultCalendarColor;
    return event;
}

QString makeOccurrenceKey(const QString &eventId, const QDateTime &start)
{
    return eventId + QStringLiteral("|||") + QString::number(start.toSecsSinceEpoch());
}

} // namespace data
} // namespace eventually
