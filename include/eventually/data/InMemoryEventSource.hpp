#pragma once

#include "eventually/data/EventSource.hpp"

namespace eventually {
namespace data {

class InMemoryEventSource : public EventSource
{
public:
    enum class AccessMode {
        Granted,
        Denied,
        NeverAnswers
    };

    InMemoryEventSource();
    ~InMemoryEventSource() override;

    void requestAccess(AccessCallback completion) override;
    std::optional<std::vector<CalendarRecord>> fetchRecords(const QDateTime &from,
                                                            const QDateTime &to) const override;

    void addRecord(CalendarRecord record);
    void clear();
    void setAccessMode(AccessMode mode);
    void setAvailable(bool available);

    // Completion held back in NeverAnswers mode.
    AccessCallback takePendingCallback();

private:
    std::vector<CalendarRecord> m_records;
    AccessMode m_accessMode = AccessMode::Granted;
    bool m_available = true;
    AccessCallback m_pending;
};

} // namespace data
} // namespace eventually
