#include <ganttkit/geometry/BarGeometry.hpp>

#include <algorithm>
#include <cmath>

namespace GK::Geometry {

auto ComputeX(DateTime const& start, DateTime const& ganttStart, Scale const& scale) -> double {
    if (scale.mode == ViewMode::Month) {
        auto const days = Calendar::Diff(start, ganttStart, TimeUnit::Day);
        return static_cast<double>(days) * scale.column_width / 30;
    }
    auto const hours = Calendar::Diff(start, ganttStart, TimeUnit::Hour);
    return static_cast<double>(hours) / scale.step_hours * scale.column_width;
}

auto ComputeWidth(DateTime const& start, DateTime const& end, Scale const& scale) -> double {
    auto const hours = Calendar::Diff(end, start, TimeUnit::Hour);
    return static_cast<double>(hours) / scale.step_hours * scale.column_width;
}

auto ToGeometry(Task const& task, std::size_t row, Scale const& scale, DateTime const& ganttStart, LayoutMetrics const& metrics) -> BarRect {
    return BarRect{.x      = ComputeX(task.start_at, ganttStart, scale),
                   .y      = metrics.row_y(row),
                   .width  = ComputeWidth(task.start_at, task.end_at, scale),
                   .height = metrics.bar_height};
}

auto FromGeometry(double x, double width, Scale const& scale, DateTime const& ganttStart) -> DateRange {
    constexpr double kMillisecondsPerHour = 3'600'000.0;
    auto const       startHours           = x / scale.column_width * scale.step_hours;
    auto const       spanHours            = width / scale.column_width * scale.step_hours;
    auto const       start                = ganttStart + DateTime::Duration{std::llround(startHours * kMillisecondsPerHour)};
    auto const       end                  = start + DateTime::Duration{std::llround(spanHours * kMillisecondsPerHour)};
    return DateRange{.start = start, .end = end};
}

auto SnapUnit(Scale const& scale) -> double {
    switch (scale.mode) {
    case ViewMode::Week:
        return scale.column_width / 7;
    case ViewMode::Month:
        return scale.column_width / 30;
    default:
        return scale.column_width;
    }
}

auto SnapDelta(double dx, Scale const& scale) -> double {
    auto const unit = SnapUnit(scale);
    if (unit <= 0)
        return dx;
    auto const magnitude = std::abs(dx);
    auto       steps     = std::floor(magnitude / unit);
    auto const remainder = magnitude - steps * unit;
    if (remainder > unit / 2)
        steps += 1;
    auto const snapped = steps * unit;
    return dx < 0 ? -snapped : snapped;
}

auto ProgressWidth(double width, int progress) -> double {
    return width * static_cast<double>(progress) / 100;
}

auto ComputeProgress(double progressWidth, double width) -> int {
    if (width <= 0)
        return 0;
    auto const ratio = std::clamp(progressWidth / width, 0.0, 1.0);
    // Absorb representation error so ProgressWidth round-trips.
    return static_cast<int>(ratio * 100 + 1e-9);
}

} // namespace GK::Geometry
