#pragma once
#include <ganttkit/chart/BarLayer.hpp>
#include <ganttkit/chart/ChartOptions.hpp>
#include <ganttkit/core/DateTime.hpp>
#include <ganttkit/core/Error.hpp>
#include <ganttkit/graph/DependencyGraph.hpp>
#include <ganttkit/interaction/Debouncer.hpp>
#include <ganttkit/interaction/InteractionController.hpp>
#include <ganttkit/model/Task.hpp>
#include <ganttkit/render/Renderer.hpp>
#include <ganttkit/scale/Timeline.hpp>
#include <ganttkit/scale/ViewMode.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace GK {

struct ChartEvents {
    // end is the inclusive last second of the new range.
    std::function<void(Task const& task, DateTime const& start, DateTime const& end)> on_date_change;
    std::function<void(Task const& task, int progress)>                                on_progress_change;
    std::function<void(ViewMode mode)>                                                 on_view_change;
    std::function<void(Task const& task)>                                              on_click;
};

struct ChartLayers {
    Render::ShapeHandle grid;
    Render::ShapeHandle arrow;
    Render::ShapeHandle progress;
    Render::ShapeHandle bar;
    Render::ShapeHandle details;
    Render::ShapeHandle date;
};

/**
 * Owns a task list and draws it into a Renderer: grid, axis labels, bars and
 * dependency arrows. Pointer gestures arrive through the renderer's
 * listeners and are handed to an InteractionController; committed changes
 * are written back into the tasks and reported through ChartEvents.
 *
 * Structural changes (refresh, view mode, collapse) re-normalize the tasks
 * and redraw everything.
 */
class Chart {
    // Only Create can name this, so the public constructor stays internal.
    struct ConstructionKey {
        explicit ConstructionKey() = default;
    };

public:
    using Clock = std::chrono::steady_clock;

    static constexpr std::chrono::milliseconds kScrollDebounce{50};

    static auto Create(Render::Renderer* renderer, std::vector<Task> tasks, ChartOptions options = {}, ChartEvents events = {})
        -> Expected<std::unique_ptr<Chart>>;

    Chart(ConstructionKey, Render::Renderer& renderer, ChartOptions options, ChartEvents events);
    Chart(Chart const&)            = delete;
    Chart& operator=(Chart const&) = delete;

    auto refresh(std::vector<Task> tasks) -> void;
    auto change_view_mode(ViewMode mode) -> void;
    // Steps through options().view_modes; returns false when there is no further mode.
    auto scale_view_mode(int zoom) -> bool;
    // Returns false for an unknown id.
    auto toggle_collapse(std::string_view id) -> bool;
    auto unselect_all() -> void;

    // Scroll offset reported by the host; the location update is debounced.
    auto handle_scroll(double scrollX, Clock::time_point now) -> void;
    // Runs debounced work whose deadline has passed.
    auto poll_timers(Clock::time_point now) -> void;
    auto set_viewport_width(double width) -> void;

    [[nodiscard]] auto tasks() const -> TaskList const& { return tasks_; }
    [[nodiscard]] auto task(std::string_view id) const -> Task const* { return tasks_.find(id); }
    [[nodiscard]] auto graph() const -> DependencyGraph const& { return graph_; }
    [[nodiscard]] auto bars() -> BarLayer& { return bars_; }
    [[nodiscard]] auto bars() const -> BarLayer const& { return bars_; }
    [[nodiscard]] auto interaction() const -> InteractionController const& { return *interaction_; }
    [[nodiscard]] auto options() const -> ChartOptions const& { return options_; }
    [[nodiscard]] auto view_mode() const -> ViewMode { return scale_.mode; }
    [[nodiscard]] auto scale() const -> Scale const& { return scale_; }
    [[nodiscard]] auto range() const -> DateRange const& { return range_; }
    [[nodiscard]] auto dates() const -> std::vector<DateTime> const& { return dates_; }
    [[nodiscard]] auto axis_labels() const -> std::vector<Timeline::AxisLabel> const& { return labels_; }
    [[nodiscard]] auto layers() const -> ChartLayers const& { return layers_; }
    [[nodiscard]] auto grid_width() const -> double { return gridWidth_; }
    [[nodiscard]] auto grid_height() const -> double { return gridHeight_; }
    [[nodiscard]] auto scroll_position() const -> double { return scrollX_; }
    // Date under the left edge of the viewport, as of the last debounced scroll update.
    [[nodiscard]] auto current_location() const -> DateTime const& { return currentLocation_; }
    [[nodiscard]] auto active_id() const -> std::optional<std::string>;

private:
    auto today() const -> DateTime;
    auto setup_tasks(std::vector<Task> tasks) -> void;
    auto setup_dates() -> void;
    auto render() -> void;
    auto render_grid() -> void;
    auto render_dates() -> void;
    auto render_bars() -> void;
    auto bind_root_events() -> void;
    auto bind_bar_events(Bar const& bar) -> void;
    auto select(std::string const& id) -> void;
    auto initial_scroll() const -> double;
    auto update_location() -> void;

    auto commit_dates(std::string const& id, DateRange const& range) -> void;
    auto commit_progress(std::string const& id, int progress) -> void;
    auto reorder_rows(std::vector<std::string> const& order) -> void;
    auto scroll_by(double dx) -> void;

    Render::Renderer& renderer_;
    ChartOptions      options_;
    ChartEvents       events_;

    TaskList                              tasks_;
    DependencyGraph                       graph_;
    Scale                                 scale_;
    DateRange                             range_;
    std::vector<DateTime>                 dates_;
    std::vector<Timeline::AxisLabel>      labels_;
    ChartLayers                           layers_;
    BarLayer                              bars_;
    std::unique_ptr<InteractionController> interaction_;

    double   gridWidth_     = 0;
    double   gridHeight_    = 0;
    double   viewportWidth_ = 0;
    double   scrollX_       = 0;
    Debouncer scrollDebouncer_{kScrollDebounce};
    DateTime currentLocation_;
};

} // namespace GK
