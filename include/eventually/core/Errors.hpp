#pragma once

#include <QString>

namespace eventually {
namespace core {

enum class CalendarError {
    AccessDenied,
    StoreUnavailable,
    LockUnavailable,
    IconMissing,
    UrlConstructionFailed
};

QString errorMessage(CalendarError error);

} // namespace core
} // namespace eventually
