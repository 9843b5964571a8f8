#include <ganttkit/interaction/InteractionController.hpp>
#include <ganttkit/geometry/BarGeometry.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace GK {

auto to_string(InteractionState state) -> std::string_view {
    switch (state) {
    case InteractionState::Idle:
        return "idle";
    case InteractionState::Dragging:
        return "dragging";
    case InteractionState::ResizingLeft:
        return "resizing_left";
    case InteractionState::ResizingRight:
        return "resizing_right";
    case InteractionState::ResizingProgress:
        return "resizing_progress";
    case InteractionState::Sorting:
        return "sorting";
    case InteractionState::PendingCollapse:
        return "pending_collapse";
    case InteractionState::Panning:
        return "panning";
    }
    return "idle";
}

InteractionController::InteractionController(BarLayer& bars, DependencyGraph const& graph, InteractionConfig config, InteractionCallbacks callbacks)
    : bars_(bars), graph_(graph), config_(config), callbacks_(std::move(callbacks)) {}

auto InteractionController::press(PressTarget target, std::string_view taskId, PointerEvent const& event) -> bool {
    if (!idle())
        return false;

    startX_ = event.x;
    startY_ = event.y;

    if (target == PressTarget::Grid) {
        state_ = InteractionState::Panning;
        return true;
    }

    auto* bar = bars_.find(taskId);
    if (bar == nullptr)
        return false;

    switch (target) {
    case PressTarget::BarBody:
        state_ = InteractionState::Dragging;
        break;
    case PressTarget::LeftHandle:
        state_ = bar->invalid ? InteractionState::Dragging : InteractionState::ResizingLeft;
        break;
    case PressTarget::RightHandle:
        state_ = bar->invalid ? InteractionState::Dragging : InteractionState::ResizingRight;
        break;
    case PressTarget::ProgressHandle:
        if (bar->invalid || !bar->progress_body.valid())
            return false;
        state_ = InteractionState::ResizingProgress;
        break;
    case PressTarget::Caret:
        state_ = InteractionState::PendingCollapse;
        break;
    case PressTarget::Grid:
        break;
    }

    targetId_ = bar->task_id;
    if (state_ == InteractionState::ResizingProgress) {
        bar->progress_origin = DragOrigin{.width = bar->progress_body.width()};
    } else {
        begin_bar_gesture(*bar);
    }

    gk_log("Press on " + targetId_ + " -> " + std::string{to_string(state_)}, "Interaction");
    if (callbacks_.activate)
        callbacks_.activate(targetId_);
    return true;
}

auto InteractionController::begin_bar_gesture(Bar& bar) -> void {
    carriedIds_.clear();
    ancestorIds_.clear();

    carriedIds_.push_back(bar.task_id);
    for (auto const& id : graph_.descendants(bar.task_id))
        carriedIds_.push_back(id);
    for (auto const& id : carriedIds_) {
        if (auto* carried = bars_.find(id))
            carried->capture_origin();
    }

    for (auto const& id : graph_.ancestors(bar.task_id)) {
        auto* ancestor = bars_.find(id);
        if (ancestor == nullptr)
            continue;
        ancestor->capture_origin();
        ancestorIds_.push_back(id);
    }
}

auto InteractionController::move(PointerEvent const& event) -> void {
    if (idle())
        return;

    auto const dx = event.x - startX_;
    auto const dy = event.y - startY_;

    switch (state_) {
    case InteractionState::Panning:
        if (callbacks_.scroll_by)
            callbacks_.scroll_by(-dx * config_.pan_factor);
        startX_ = event.x;
        return;
    case InteractionState::ResizingProgress:
        resize_progress(dx);
        return;
    case InteractionState::PendingCollapse:
        if (std::hypot(dx, dy) <= config_.collapse_threshold)
            return;
        state_ = InteractionState::Dragging;
        break;
    default:
        break;
    }
    drag_bars(dx, dy);
}

auto InteractionController::drag_bars(double dx, double dy) -> void {
    auto* primary = bars_.find(targetId_);
    if (primary == nullptr)
        return;

    auto const  snapped  = Geometry::SnapDelta(dx, bars_.scale());
    bool const  dragging = state_ == InteractionState::Dragging || state_ == InteractionState::Sorting;
    auto const& origin   = primary->origin;
    primary->origin.final_dx = snapped;

    if (state_ == InteractionState::ResizingLeft) {
        bars_.update_position(*primary, BarUpdate{.x = origin.x + snapped, .width = origin.width - snapped});
    } else if (state_ == InteractionState::ResizingRight) {
        bars_.update_position(*primary, BarUpdate{.width = origin.width + snapped});
    } else {
        auto const y = std::clamp(origin.y + dy, bars_.min_drag_y(), bars_.max_drag_y());
        BarUpdate  update{.x = origin.x + snapped};
        if (config_.sortable)
            update.y = y;
        bars_.update_position(*primary, update);
    }

    for (std::size_t i = 1; i < carriedIds_.size(); ++i) {
        auto* bar = bars_.find(carriedIds_[i]);
        if (bar == nullptr)
            continue;
        if (state_ != InteractionState::ResizingLeft && !dragging)
            continue;
        bar->origin.final_dx = snapped;
        bars_.update_position(*bar, BarUpdate{.x = bar->origin.x + snapped});
    }

    fit_envelopes();

    if (config_.sortable && dragging && std::abs(dy - primary->origin.final_dy) > bars_.metrics().bar_height)
        sort_rows();
}

auto InteractionController::fit_envelopes() -> void {
    for (auto const& id : ancestorIds_) {
        auto* ancestor = bars_.find(id);
        if (ancestor == nullptr || !ancestor->is_envelope())
            continue;

        auto minX = std::numeric_limits<double>::infinity();
        auto maxX = -std::numeric_limits<double>::infinity();
        for (auto const& descendantId : graph_.descendants(id)) {
            auto const* bar = bars_.find(descendantId);
            if (bar == nullptr)
                continue;
            minX = std::min(minX, bar->body.x());
            maxX = std::max(maxX, bar->body.end_x());
        }
        if (minX > maxX)
            continue;

        if (minX > ancestor->origin.x)
            bars_.update_position(*ancestor, BarUpdate{.x = minX, .width = maxX - minX});
        else
            bars_.update_position(*ancestor, BarUpdate{.width = maxX - ancestor->origin.x});
    }
}

auto InteractionController::sort_rows() -> void {
    auto changed = bars_.sort_by_y();
    for (auto* bar : changed) {
        auto const y = bars_.row_y(bar->row);
        if (bar->task_id == targetId_) {
            bar->origin.final_dy = y - bar->origin.y;
            continue;
        }
        bars_.update_position(*bar, BarUpdate{.y = y});
    }
    state_ = InteractionState::Sorting;
    gk_log("Rows reordered while dragging " + targetId_, "Interaction");
    if (callbacks_.reorder_rows)
        callbacks_.reorder_rows(bars_.row_order());
}

auto InteractionController::resize_progress(double dx) -> void {
    auto* bar = bars_.find(targetId_);
    if (bar == nullptr)
        return;
    auto&      origin  = bar->progress_origin;
    auto const clamped = std::clamp(dx, -origin.width, bar->body.width() - origin.width);
    bars_.set_progress_width(*bar, origin.width + clamped);
    origin.final_dx = clamped;
}

auto InteractionController::release(PointerEvent const& event) -> void {
    if (idle())
        return;

    auto const dy = event.y - startY_;
    auto const id = targetId_;

    switch (state_) {
    case InteractionState::Dragging:
    case InteractionState::Sorting:
    case InteractionState::ResizingLeft:
    case InteractionState::ResizingRight: {
        auto commits = finish_bar_gesture(event, dy);
        reset();
        if (callbacks_.commit_dates) {
            for (auto const& commit : commits)
                callbacks_.commit_dates(commit.id, commit.range);
        }
        return;
    }
    case InteractionState::ResizingProgress: {
        auto progress = finish_progress(event);
        reset();
        if (progress && callbacks_.commit_progress)
            callbacks_.commit_progress(id, *progress);
        return;
    }
    case InteractionState::PendingCollapse:
        reset();
        gk_log("Toggle collapse of " + id, "Interaction");
        if (callbacks_.toggle_collapse)
            callbacks_.toggle_collapse(id);
        return;
    case InteractionState::Panning:
    case InteractionState::Idle:
        break;
    }
    reset();
}

auto InteractionController::finish_bar_gesture(PointerEvent const& event, double dy) -> std::vector<Commit> {
    std::vector<Commit> commits;
    auto const          cooldownEnd = event.timestamp + config_.cooldown;

    for (auto const& id : carriedIds_) {
        auto* bar = bars_.find(id);
        if (bar == nullptr || bar->origin.final_dx == 0)
            continue;
        commits.push_back(Commit{.id = id, .range = bars_.compute_dates(*bar)});
        bar->cooldown_until = cooldownEnd;
    }

    for (auto const& id : ancestorIds_) {
        auto* bar = bars_.find(id);
        if (bar == nullptr || !bar->is_envelope())
            continue;
        if (bar->body.x() == bar->origin.x && bar->body.width() == bar->origin.width)
            continue;
        commits.push_back(Commit{.id = id, .range = bars_.compute_dates(*bar)});
        bar->cooldown_until = cooldownEnd;
    }

    if (auto* primary = bars_.find(targetId_); primary != nullptr && config_.sortable && dy != primary->origin.final_dy)
        bars_.update_position(*primary, BarUpdate{.y = primary->origin.y + primary->origin.final_dy});

    return commits;
}

auto InteractionController::finish_progress(PointerEvent const& event) -> std::optional<int> {
    auto* bar = bars_.find(targetId_);
    if (bar == nullptr || bar->progress_origin.final_dx == 0)
        return std::nullopt;
    auto const progress = bars_.compute_progress(*bar);
    bars_.set_progress(*bar, progress);
    bar->cooldown_until = event.timestamp + config_.cooldown;
    return progress;
}

auto InteractionController::cancel() -> void {
    reset();
}

auto InteractionController::reset() -> void {
    state_ = InteractionState::Idle;
    targetId_.clear();
    carriedIds_.clear();
    ancestorIds_.clear();
    startX_ = 0;
    startY_ = 0;
}

} // namespace GK
