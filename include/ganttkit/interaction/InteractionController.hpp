#pragma once
#include <ganttkit/chart/BarLayer.hpp>
#include <ganttkit/graph/DependencyGraph.hpp>
#include <ganttkit/render/Renderer.hpp>

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace GK {

enum class InteractionState {
    Idle,
    Dragging,
    ResizingLeft,
    ResizingRight,
    ResizingProgress,
    Sorting,
    PendingCollapse,
    Panning
};

enum class PressTarget {
    BarBody,
    LeftHandle,
    RightHandle,
    ProgressHandle,
    Caret,
    Grid
};

[[nodiscard]] auto to_string(InteractionState state) -> std::string_view;

struct InteractionConfig {
    bool                      sortable           = false;
    double                    collapse_threshold = 5;
    double                    pan_factor         = 1.5;
    std::chrono::milliseconds cooldown{1000};
};

struct InteractionCallbacks {
    // New [start, end) read back from a bar's geometry.
    std::function<void(std::string const& id, DateRange const& range)> commit_dates;
    std::function<void(std::string const& id, int progress)>           commit_progress;
    std::function<void(std::string const& id)>                          toggle_collapse;
    // Visible task ids in their new row order.
    std::function<void(std::vector<std::string> const& order)> reorder_rows;
    std::function<void(double dx)>                             scroll_by;
    std::function<void(std::string const& id)>                 activate;
};

/**
 * Pointer gesture state machine over a BarLayer. One gesture is tracked at
 * a time; a press while a gesture is active is ignored and release is the
 * only way back to Idle.
 *
 * Moving or left-resizing a bar carries its dependents along by the same
 * snapped delta. Project and tag ancestors are stretched to enclose their
 * dependents. With sorting enabled, vertical drags past one bar height
 * reorder the rows.
 */
class InteractionController {
public:
    using PointerEvent = Render::PointerEvent;

    InteractionController(BarLayer& bars, DependencyGraph const& graph, InteractionConfig config, InteractionCallbacks callbacks);

    // Returns false when the press was ignored.
    auto press(PressTarget target, std::string_view taskId, PointerEvent const& event) -> bool;
    auto move(PointerEvent const& event) -> void;
    auto release(PointerEvent const& event) -> void;
    // Drops the gesture without committing anything; used when the chart is rebuilt underneath it.
    auto cancel() -> void;

    [[nodiscard]] auto state() const -> InteractionState { return state_; }
    [[nodiscard]] auto idle() const -> bool { return state_ == InteractionState::Idle; }
    [[nodiscard]] auto target_id() const -> std::string const& { return targetId_; }
    [[nodiscard]] auto config() const -> InteractionConfig const& { return config_; }
    auto set_sortable(bool sortable) -> void { config_.sortable = sortable; }

private:
    struct Commit {
        std::string id;
        DateRange   range;
    };

    auto begin_bar_gesture(Bar& bar) -> void;
    auto drag_bars(double dx, double dy) -> void;
    auto fit_envelopes() -> void;
    auto sort_rows() -> void;
    auto resize_progress(double dx) -> void;
    auto finish_bar_gesture(PointerEvent const& event, double dy) -> std::vector<Commit>;
    auto finish_progress(PointerEvent const& event) -> std::optional<int>;
    auto reset() -> void;

    BarLayer&              bars_;
    DependencyGraph const& graph_;
    InteractionConfig      config_;
    InteractionCallbacks   callbacks_;

    InteractionState         state_ = InteractionState::Idle;
    std::string              targetId_;
    std::vector<std::string> carriedIds_;  // target first, then its dependents
    std::vector<std::string> ancestorIds_;
    double                   startX_ = 0;
    double                   startY_ = 0;
};

} // namespace GK
