#pragma once

#include <QColor>
#include <QDateTime>
#include <QString>
#include <QStringList>
#include <functional>
#include <optional>
#include <vector>

namespace eventually {
namespace data {

// One occurrence as delivered by a calendar backend.
struct CalendarRecord
{
    QString id;
    QString title;
    QDateTime start;
    QDateTime end;
    std::optional<QString> location;
    bool hasRecurrence = false;
    QColor calendarColor;
};

class EventSource
{
public:
    using AccessCallback = std::function<void(bool granted)>;

    virtual ~EventSource() = default;

    // The callback may run on any thread, and at most once.
    virtual void requestAccess(AccessCallback completion) = 0;

    // std::nullopt when the store cannot be read.
    virtual std::optional<std::vector<CalendarRecord>> fetchRecords(const QDateTime &from,
                                                                    const QDateTime &to) const = 0;

    // Files whose modification means the calendar changed.
    virtual QStringList watchedPaths() const { return {}; }
};

} // namespace data
} // namespace eventually
