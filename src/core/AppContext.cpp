#include "eventually/core/AppContext.hpp"

#include "eventually/core/DismissedSet.hpp"
#include "eventually/data/IcsEventSource.hpp"

namespace eventually {
namespace core {

AppContext::AppContext(Settings settings)
    : AppContext(settings, std::make_unique<data::IcsEventSource>(settings.calendarFiles))
{
}

AppContext::AppContext(Settings settings, std::unique_ptr<data::EventSource> eventSource)
    : m_settings(std::move(settings))
    , m_eventSource(std::move(eventSource))
    , m_dismissedSet(std::make_unique<DismissedSet>(m_settings.lockTimeout))
{
}

AppContext::~AppContext() = default;

const Settings &AppContext::settings() const
{
    return m_settings;
}

data::EventSource &AppContext::eventSource()
{
    return *m_eventSource;
}

DismissedSet &AppContext::dismissedSet()
{
    return *m_dismissedSet;
}

} // namespace core
} // namespace eventually
