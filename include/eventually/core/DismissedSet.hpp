#pragma once

#include <QSet>
#include <QString>
#include <chrono>
#include <mutex>

class DismissedSetTest;

namespace eventually {
namespace core {

// Occurrence keys the user dismissed during this session. Entries are never
// removed. Shared by reference between the status title, the menu builder
// and the action handlers.
class DismissedSet
{
public:
    explicit DismissedSet(std::chrono::milliseconds lockTimeout = std::chrono::milliseconds(100));

    DismissedSet(const DismissedSet &) = delete;
    DismissedSet &operator=(const DismissedSet &) = delete;

    // Returns false when the lock could not be acquired in time.
    bool dismiss(const QString &occurrenceKey);
    bool contains(const QString &occurrenceKey) const;

    // Copy taken under the lock; empty if the lock is unavailable.
    QSet<QString> snapshot() const;

private:
    friend class ::DismissedSetTest;

    mutable std::timed_mutex m_mutex;
    QSet<QString> m_keys;
    std::chrono::milliseconds m_lockTimeout;
};

} // namespace core
} // namespace eventually
