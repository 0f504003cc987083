#pragma once

#include <chrono>
#include <optional>

namespace markdd::core
{

inline constexpr std::chrono::seconds kDefaultAutosaveInterval{30};

// Decides when the host should save on its own. The scheduler never saves
// anything; the host polls due() from its idle loop.
class AutosaveScheduler
{
public:
    using Clock = std::chrono::steady_clock;

    AutosaveScheduler() = default;
    AutosaveScheduler(bool enabled, std::chrono::seconds interval);

    void configure(bool enabled, std::chrono::seconds interval);
    bool enabled() const noexcept { return active; }
    std::chrono::seconds interval() const noexcept { return period; }

    // Called after every change event of the watched buffer.
    void onDocumentChanged(bool hasFile, bool isModified, Clock::time_point now);
    void onSaveResult(bool success, Clock::time_point now);

    bool due(Clock::time_point now) const noexcept;
    bool pending() const noexcept { return deadline.has_value(); }
    void cancel() noexcept { deadline.reset(); }

private:
    bool active = false;
    std::chrono::seconds period = kDefaultAutosaveInterval;
    std::optional<Clock::time_point> deadline;
};

} // namespace markdd::core
