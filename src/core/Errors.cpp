#include "eventually/core/Errors.hpp"

namespace eventually {
namespace core {

QString errorMessage(CalendarError error)
{
    switch (error) {
    case CalendarError::AccessDenied:
        return QStringLiteral("Calendar access denied by user");
    case CalendarError::StoreUnavailable:
        return QStringLiteral("Calendar event store unavailable");
    case CalendarError::LockUnavailable:
        return QStringLiteral("Dismissed events lock unavailable");
    case CalendarError::IconMissing:
        return QStringLiteral("Menu icon missing");
    case CalendarError::UrlConstructionFailed:
    default:
        return QStringLiteral("Could not construct URL");
    }
}

} // namespace core
} // namespace eventually
