#include "eventually/core/AccessRequest.hpp"

#include "eventually/core/Errors.hpp"
#include "eventually/core/Logging.hpp"
#include "eventually/data/EventSource.hpp"

#include <atomic>
#include <future>
#include <memory>

namespace eventually {
namespace core {

bool requestAccessBlocking(data::EventSource &source, std::chrono::milliseconds timeout)
{
    // Shared so a callback arriving after the timeout still has a live promise.
    auto promise = std::make_shared<std::promise<bool>>();
    auto answered = std::make_shared<std::atomic_bool>(false);
    std::future<bool> result = promise->get_future();

    source.requestAccess([promise, answered](bool granted) {
        if (!answered->exchange(true)) {
            promise->set_value(granted);
        }
    });

    if (result.wait_for(timeout) != std::future_status::ready) {
        qCWarning(EVENTUALLY_CORE_LOG) << "requestAccessBlocking: no answer after" << timeout.count()
                                       << "ms, treating as denied";
        return false;
    }
    const bool granted = result.get();
    if (!granted) {
        qCWarning(EVENTUALLY_CORE_LOG) << "requestAccessBlocking:" << errorMessage(CalendarError::AccessDenied);
    }
    return granted;
}

} // namespace core
} // namespace eventually
