#pragma once
#include <ganttkit/core/DateTime.hpp>
#include <ganttkit/geometry/LayoutMetrics.hpp>
#include <ganttkit/model/Task.hpp>
#include <ganttkit/scale/ViewMode.hpp>

#include <cstddef>

namespace GK {

struct BarRect {
    double x      = 0;
    double y      = 0;
    double width  = 0;
    double height = 0;

    [[nodiscard]] auto end_x() const -> double { return x + width; }
    [[nodiscard]] auto center_x() const -> double { return x + width / 2; }
    [[nodiscard]] auto center_y() const -> double { return y + height / 2; }

    auto operator==(BarRect const&) const -> bool = default;
};

namespace Geometry {

[[nodiscard]] auto ComputeX(DateTime const& start, DateTime const& ganttStart, Scale const& scale) -> double;
[[nodiscard]] auto ComputeWidth(DateTime const& start, DateTime const& end, Scale const& scale) -> double;

// Bar rectangle for a task drawn in the given visible row.
[[nodiscard]] auto ToGeometry(Task const& task, std::size_t row, Scale const& scale, DateTime const& ganttStart, LayoutMetrics const& metrics) -> BarRect;

/**
 * Inverse of ToGeometry for the horizontal extent. Pixels become fractional
 * scale steps, then hours, rounded to the millisecond. The end is exclusive.
 */
[[nodiscard]] auto FromGeometry(double x, double width, Scale const& scale, DateTime const& ganttStart) -> DateRange;

// Pixel size of one snap step: a column, a day for Week, a day for Month.
[[nodiscard]] auto SnapUnit(Scale const& scale) -> double;

// Nearest whole number of snap steps; an exact half step rounds towards zero.
[[nodiscard]] auto SnapDelta(double dx, Scale const& scale) -> double;

[[nodiscard]] auto ProgressWidth(double width, int progress) -> double;
[[nodiscard]] auto ComputeProgress(double progressWidth, double width) -> int;

} // namespace Geometry

} // namespace GK
