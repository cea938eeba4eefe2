#include "eventually/core/DismissedSet.hpp"

#include "eventually/core/Errors.hpp"
#include "eventually/core/Logging.hpp"

namespace eventually {
namespace core {

DismissedSet::DismissedSet(std::chrono::milliseconds lockTimeout)
    : m_lockTimeout(lockTimeout)
{
}

bool DismissedSet::dismiss(const QString &occurrenceKey)
{
    std::unique_lock<std::timed_mutex> lock(m_mutex, m_lockTimeout);
    if (!lock.owns_lock()) {
        qCWarning(EVENTUALLY_CORE_LOG) << "DismissedSet::dismiss:" << errorMessage(CalendarError::LockUnavailable)
                                       << occurrenceKey;
        return false;
    }
    m_keys.insert(occurrenceKey);
    return true;
}

bool DismissedSet::contains(const QString &occurrenceKey) const
{
    std::unique_lock<std::timed_mutex> lock(m_mutex, m_lockTimeout);
    if (!lock.owns_lock()) {
        qCWarning(EVENTUALLY_CORE_LOG) << "DismissedSet::contains:" << errorMessage(CalendarError::LockUnavailable);
        return false;
    }
    return m_keys.contains(occurrenceKey);
}

QSet<QString> DismissedSet::snapshot() const
{
    std::unique_lock<std::timed_mutex> lock(m_mutex, m_lockTimeout);
    if (!lock.owns_lock()) {
        qCWarning(EVENTUALLY_CORE_LOG) << "DismissedSet::snapshot:" << errorMessage(CalendarError::LockUnavailable);
        return {};
    }
    return m_keys;
}

} // namespace core
} // namespace eventually
