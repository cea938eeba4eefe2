#pragma once

#include <chrono>

namespace eventually {
namespace data {
class EventSource;
}

namespace core {

// Asks the source for calendar access and blocks until it answers or the
// timeout passes. No answer in time counts as denied.
bool requestAccessBlocking(data::EventSource &source, std::chrono::milliseconds timeout);

} // namespace core
} // namespace eventually
