#pragma once

#include <memory>

#include "eventually/core/Settings.hpp"

namespace eventually {
namespace data {
class EventSource;
}

namespace core {

class DismissedSet;

class AppContext
{
public:
    explicit AppContext(Settings settings);
    AppContext(Settings settings, std::unique_ptr<data::EventSource> eventSource);
    ~AppContext();

    const Settings &settings() const;
    data::EventSource &eventSource();
    DismissedSet &dismissedSet();

private:
    Settings m_settings;
    std::unique_ptr<data::EventSource> m_eventSource;
    std::unique_ptr<DismissedSet> m_dismissedSet;
};

} // namespace core
} // namespace eventually
