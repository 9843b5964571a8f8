#pragma once
#include <ganttkit/core/DateTime.hpp>
#include <ganttkit/core/Error.hpp>
#include <ganttkit/geometry/LayoutMetrics.hpp>
#include <ganttkit/model/TaskNormalizer.hpp>
#include <ganttkit/scale/ViewMode.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace GK {

struct ChartOptions {
    ViewMode              view_mode{ViewMode::Day};
    std::vector<ViewMode> view_modes{kAllViewModes.begin(), kAllViewModes.end()};
    double                header_height{50};
    double                bar_height{20};
    double                bar_corner_radius{3};
    double                arrow_curve{5};
    double                padding{18};
    std::string           language{"en"};
    std::string           date_format{"YYYY-MM-DD"};
    bool                  sortable{false};
    std::string           popup_trigger{"click"};
    // Carried for embedders that draw their own popup; never rendered here.
    std::string custom_popup_html;

    // Overridable for deterministic runs. Empty falls back to the local clock / random ids.
    std::function<DateTime()> today;
    TaskIdGenerator           id_generator;

    [[nodiscard]] auto metrics() const -> LayoutMetrics;
};

// Parses a JSON object of options on top of the defaults. Unknown keys are ignored.
auto ParseChartOptions(std::string_view json) -> Expected<ChartOptions>;

auto ValidateChartOptions(ChartOptions const& options) -> std::optional<std::string>;

// Reads GANTTKIT_VIEW_MODE, GANTTKIT_LANGUAGE and GANTTKIT_SORTABLE.
bool ApplyChartEnvOverrides(ChartOptions& options);

bool IsValidPopupTrigger(std::string_view trigger);

} // namespace GK
