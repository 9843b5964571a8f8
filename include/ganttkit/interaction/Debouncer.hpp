#pragma once
#include <chrono>
#include <functional>

namespace GK {

/**
 * Timer-reset debounce driven by caller-supplied time. Each schedule()
 * replaces the pending action and pushes the deadline to now + wait; poll()
 * runs the action once the deadline has passed.
 */
class Debouncer {
public:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    explicit Debouncer(std::chrono::milliseconds wait)
        : wait_(wait) {}

    auto schedule(TimePoint now, std::function<void()> action) -> void;
    // Returns true when the pending action ran.
    auto poll(TimePoint now) -> bool;
    auto cancel() -> void;

    [[nodiscard]] auto pending() const -> bool { return static_cast<bool>(action_); }
    [[nodiscard]] auto deadline() const -> TimePoint { return lastCall_ + wait_; }
    [[nodiscard]] auto wait() const -> std::chrono::milliseconds { return wait_; }

private:
    std::chrono::milliseconds wait_;
    TimePoint                 lastCall_{};
    std::function<void()>     action_;
};

} // namespace GK
