#pragma once

#include <QDate>
#include <QDateTime>
#include <QSet>
#include <QString>
#include <optional>
#include <utility>
#include <vector>

#include "eventually/core/Formatting.hpp"
#include "eventually/data/EventInfo.hpp"

namespace eventually {
namespace data {
struct CalendarRecord;
}

namespace core {

enum class EventState {
    Current,
    Upcoming
};

// Refers into the EventCollection it was found in.
struct EventStatus
{
    EventState state;
    const data::EventInfo *event;
};

class EventCollection
{
public:
    static constexpr int kDaysToFetch = 4;

    EventCollection() = default;
    explicit EventCollection(std::vector<data::EventInfo> events);

    static EventCollection fromRecords(const std::vector<data::CalendarRecord> &records);

    // Local midnight today to 23:59:59 kDaysToFetch days later.
    static std::pair<QDateTime, QDateTime> fetchWindow(const QDateTime &now);

    std::optional<EventStatus> findCurrentOrNext(const QSet<QString> &dismissed, const QDateTime &now) const;
    QString statusTitle(const QSet<QString> &dismissed, const QDateTime &now, const TitleFormat &format = {}) const;

    std::vector<const data::EventInfo *> eventsOn(const QDate &date) const;

    const std::vector<data::EventInfo> &events() const;
    bool isEmpty() const;
    std::size_t size() const;

private:
    std::vector<data::EventInfo> m_events;
};

} // namespace core
} // namespace eventually
