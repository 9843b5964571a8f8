#include <ganttkit/interaction/Debouncer.hpp>

#include <utility>

namespace GK {

auto Debouncer::schedule(TimePoint now, std::function<void()> action) -> void {
    lastCall_ = now;
    action_   = std::move(action);
}

auto Debouncer::poll(TimePoint now) -> bool {
    if (!action_ || now - lastCall_ < wait_)
        return false;
    auto action = std::move(action_);
    action_     = nullptr;
    action();
    return true;
}

auto Debouncer::cancel() -> void {
    action_ = nullptr;
}

} // namespace GK
