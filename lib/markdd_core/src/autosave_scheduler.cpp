#include "markdd/core/autosave_scheduler.hpp"

namespace markdd::core
{

AutosaveScheduler::AutosaveScheduler(bool enabled, std::chrono::seconds interval)
{
    configure(enabled, interval);
}

void AutosaveScheduler::configure(bool enabled, std::chrono::seconds interval)
{
    active = enabled;
    period = interval.count() > 0 ? interval : kDefaultAutosaveInterval;
    if (!active)
        deadline.reset();
}

void AutosaveScheduler::onDocumentChanged(bool hasFile, bool isModified, Clock::time_point now)
{
    if (active && hasFile && isModified)
        deadline = now + period;
    else
        deadline.reset();
}

void AutosaveScheduler::onSaveResult(bool success, Clock::time_point now)
{
    if (success || !active)
        deadline.reset();
    else
        deadline = now + period;
}

bool AutosaveScheduler::due(Clock::time_point now) const noexcept
{
    return deadline.has_value() && now >= *deadline;
}

} // namespace markdd::core
