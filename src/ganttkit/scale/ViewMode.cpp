#include <ganttkit/scale/ViewMode.hpp>

#include <algorithm>
#include <cctype>
#include <string>

namespace GK {

namespace {

auto compact(std::string_view text) -> std::string {
    std::string result;
    result.reserve(text.size());
    for (unsigned char ch : text) {
        if (ch == ' ' || ch == '_' || ch == '-')
            continue;
        result.push_back(static_cast<char>(std::tolower(ch)));
    }
    return result;
}

} // namespace

auto to_string(ViewMode mode) -> std::string_view {
    switch (mode) {
    case ViewMode::QuarterDay:
        return "Quarter Day";
    case ViewMode::HalfDay:
        return "Half Day";
    case ViewMode::Day:
        return "Day";
    case ViewMode::Week:
        return "Week";
    case ViewMode::Month:
        return "Month";
    case ViewMode::Year:
        return "Year";
    }
    return "Day";
}

auto ParseViewMode(std::string_view text) -> Expected<ViewMode> {
    auto const key = compact(text);
    for (auto mode : kAllViewModes) {
        if (compact(to_string(mode)) == key)
            return mode;
    }
    return std::unexpected(Error{Error::Code::InvalidViewMode, "unknown view mode: " + std::string{text}});
}

auto ApplyScale(ViewMode mode) -> Scale {
    switch (mode) {
    case ViewMode::QuarterDay:
        return Scale{.mode = mode, .step_hours = 6, .column_width = 38};
    case ViewMode::HalfDay:
        return Scale{.mode = mode, .step_hours = 12, .column_width = 38};
    case ViewMode::Day:
        return Scale{.mode = mode, .step_hours = 24, .column_width = 38};
    case ViewMode::Week:
        return Scale{.mode = mode, .step_hours = 24 * 7, .column_width = 140};
    case ViewMode::Month:
        return Scale{.mode = mode, .step_hours = 24 * 30, .column_width = 120};
    case ViewMode::Year:
        return Scale{.mode = mode, .step_hours = 24 * 365, .column_width = 120};
    }
    return Scale{};
}

auto ZoomViewMode(std::span<ViewMode const> modes, Scale const& current, int zoom) -> std::optional<ViewMode> {
    auto it = std::find(modes.begin(), modes.end(), current.mode);
    if (it == modes.end() || zoom == 0)
        return std::nullopt;
    auto const index = static_cast<std::size_t>(std::distance(modes.begin(), it));
    if (zoom > 0) {
        if (index == 0)
            return std::nullopt;
        return modes[index - 1];
    }
    if (current.column_width <= 15 || index + 1 >= modes.size())
        return std::nullopt;
    return modes[index + 1];
}

} // namespace GK
