#include "eventually/data/InMemoryEventSource.hpp"

#include <utility>

namespace eventually {
namespace data {

InMemoryEventSource::InMemoryEventSource() = default;
InMemoryEventSource::~InMemoryEventSource() = default;

void InMemoryEventSource::requestAccess(AccessCallback completion)
{
    switch (m_accessMode) {
    case AccessMode::Granted:
        completion(true);
        break;
    case AccessMode::Denied:
        completion(false);
        break;
    case AccessMode::NeverAnswers:
        m_pending = std::move(completion);
        break;
    }
}

std::optional<std::vector<CalendarRecord>> InMemoryEventSource::fetchRecords(const QDateTime &from,
                                                                             const QDateTime &to) const
{
    if (!m_available) {
        return std::nullopt;
    }
    std::vector<CalendarRecord> records;
    for (const auto &record : m_records) {
        if (record.end < from || record.start > to) {
            continue;
        }
        records.push_back(record);
    }
    return records;
}

void InMemoryEventSource::addRecord(CalendarRecord record)
{
    if (!record.end.isValid() || record.end < record.start) {
        record.end = record.start.addSecs(30 * 60);
    }
    m_records.push_back(std::move(record));
}

void InMemoryEventSource::clear()
{
    m_records.clear();
}

void InMemoryEventSource::setAccessMode(AccessMode mode)
{
    m_accessMode = mode;
}

void InMemoryEventSource::setAvailable(bool available)
{
    m_available = available;
}

EventSource::AccessCallback InMemoryEventSource::takePendingCallback()
{
    return std::exchange(m_pending, AccessCallback{});
}

} // namespace data
} // namespace eventually
