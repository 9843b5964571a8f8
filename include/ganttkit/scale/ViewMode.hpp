#pragma once
#include <ganttkit/core/Error.hpp>

#include <array>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace GK {

enum class ViewMode {
    QuarterDay,
    HalfDay,
    Day,
    Week,
    Month,
    Year
};

inline constexpr std::array<ViewMode, 6> kAllViewModes{ViewMode::QuarterDay, ViewMode::HalfDay, ViewMode::Day,
                                                       ViewMode::Week,       ViewMode::Month,   ViewMode::Year};

// Hours per column and pixels per column for a view mode.
struct Scale {
    ViewMode mode         = ViewMode::Day;
    double   step_hours   = 24;
    double   column_width = 38;
};

[[nodiscard]] auto to_string(ViewMode mode) -> std::string_view;
// Accepts the display names ("Quarter Day") and their compact forms ("quarter_day").
[[nodiscard]] auto ParseViewMode(std::string_view text) -> Expected<ViewMode>;

[[nodiscard]] auto ApplyScale(ViewMode mode) -> Scale;

/**
 * Steps through the configured modes: a positive zoom moves towards the
 * finer end of the list, a negative zoom towards the coarser end while
 * columns are still wider than 15px. Returns nullopt when no step applies.
 */
[[nodiscard]] auto ZoomViewMode(std::span<ViewMode const> modes, Scale const& current, int zoom) -> std::optional<ViewMode>;

} // namespace GK
