#pragma once
#include <ganttkit/core/DateTime.hpp>
#include <ganttkit/geometry/LayoutMetrics.hpp>
#include <ganttkit/model/Task.hpp>
#include <ganttkit/scale/ViewMode.hpp>

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace GK::Timeline {

struct AxisLabel {
    DateTime    date;
    std::string lower_text;
    std::string upper_text; // empty when the column starts no new upper period
    double      lower_x = 0;
    double      lower_y = 0;
    double      upper_x = 0;
    double      upper_y = 0;
};

struct GridTick {
    double x     = 0;
    bool   thick = false;
};

// Padded [gantt_start, gantt_end] covering every task. An empty list centres on today.
[[nodiscard]] auto ComputeRange(std::span<Task const> tasks, ViewMode mode, DateTime const& today = Calendar::Today()) -> DateRange;

// Column start dates from gantt_start up to and including the first one at or past gantt_end.
[[nodiscard]] auto ColumnDates(DateRange const& range, Scale const& scale) -> std::vector<DateTime>;

[[nodiscard]] auto AxisLabels(std::span<DateTime const> dates, Scale const& scale, LayoutMetrics const& metrics, std::string_view language = "en")
    -> std::vector<AxisLabel>;

[[nodiscard]] auto GridTicks(std::span<DateTime const> dates, Scale const& scale) -> std::vector<GridTick>;

[[nodiscard]] auto ContentWidth(std::span<DateTime const> dates, Scale const& scale) -> double;

// Column x of today's highlight; only the Day view draws one.
[[nodiscard]] auto TodayHighlightX(DateRange const& range, Scale const& scale, DateTime const& today) -> std::optional<double>;

} // namespace GK::Timeline
