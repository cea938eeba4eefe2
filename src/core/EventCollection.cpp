#include "eventually/core/EventCollection.hpp"

#include "eventually/data/EventSource.hpp"

#include <QTime>
#include <algorithm>

namespace eventually {
namespace core {

EventCollection::EventCollection(std::vector<data::EventInfo> events)
    : m_events(std::move(events))
{
    std::stable_sort(m_events.begin(), m_events.end(), [](const data::EventInfo &lhs, const data::EventInfo &rhs) {
        return lhs.start < rhs.start;
    });
}

EventCollection EventCollection::fromRecords(const std::vector<data::CalendarRecord> &records)
{
    std::vector<data::EventInfo> events;
    events.reserve(records.size());
    for (const auto &record : records) {
        events.push_back(data::EventInfo::fromRecord(record));
    }
    return EventCollection(std::move(events));
}

std::pair<QDateTime, QDateTime> EventCollection::fetchWindow(const QDateTime &now)
{
    const QDate today = now.toLocalTime().date();
    return {QDateTime(today, QTime(0, 0)), QDateTime(today.addDays(kDaysToFetch), QTime(23, 59, 59))};
}

std::optional<EventStatus> EventCollection::findCurrentOrNext(const QSet<QString> &dismissed,
                                                              const QDateTime &now) const
{
    const QDate today = now.toLocalTime().date();
    std::optional<EventStatus> upcoming;

    for (const auto &event : m_events) {
        if (event.start.date() != today || dismissed.contains(event.occurrenceKey)) {
            continue;
        }
        if (event.start <= now && now <= event.end) {
            return EventStatus{EventState::Current, &event};
        }
        if (event.start > now && !upcoming) {
            upcoming = EventStatus{EventState::Upcoming, &event};
        }
    }
    return upcoming;
}

QString EventCollection::statusTitle(const QSet<QString> &dismissed, const QDateTime &now,
                                     const TitleFormat &format) const
{
    const auto status = findCurrentOrNext(dismissed, now);
    if (status) {
        const data::EventInfo &event = *status->event;
        if (status->state == EventState::Current) {
            return formatStatusTitle(event.title, now.secsTo(event.end), StatusTemplate::TimeLeft, format);
        }
        return formatStatusTitle(event.title, now.secsTo(event.start), StatusTemplate::StartsIn, format);
    }

    const QDate today = now.toLocalTime().date();
    const bool anyToday = std::any_of(m_events.cbegin(), m_events.cend(), [&](const data::EventInfo &event) {
        return event.start.date() == today && !dismissed.contains(event.occurrenceKey);
    });
    return anyToday ? QStringLiteral("No more events today") : QStringLiteral("No events today");
}

std::vector<const data::EventInfo *> EventCollection::eventsOn(const QDate &date) const
{
    std::vector<const data::EventInfo *> result;
    for (const auto &event : m_events) {
        if (event.start.date() == date) {
            result.push_back(&event);
        }
    }
    return result;
}

const std::vector<data::EventInfo> &EventCollection::events() const
{
    return m_events;
}

bool EventCollection::isEmpty() const
{
    return m_events.empty();
}

std::size_t EventCollection::size() const
{
    return m_events.size();
}

} // namespace core
} // namespace eventually
