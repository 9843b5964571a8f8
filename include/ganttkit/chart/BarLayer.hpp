#pragma once
#include <ganttkit/core/DateTime.hpp>
#include <ganttkit/geometry/BarGeometry.hpp>
#include <ganttkit/geometry/LayoutMetrics.hpp>
#include <ganttkit/graph/DependencyGraph.hpp>
#include <ganttkit/model/Task.hpp>
#include <ganttkit/render/Renderer.hpp>
#include <ganttkit/render/ShapeGeometry.hpp>
#include <ganttkit/routing/ArrowRouter.hpp>
#include <ganttkit/scale/ViewMode.hpp>

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace GK {

struct BarShapes {
    Render::ShapeHandle group;
    Render::ShapeHandle bar_group;
    Render::ShapeHandle handle_group;
    Render::ShapeHandle label;
    Render::ShapeHandle handle_left;
    Render::ShapeHandle handle_right;
    Render::ShapeHandle handle_progress;
    Render::ShapeHandle caret;
};

// Geometry captured when a gesture starts, plus the snapped deltas applied since.
struct DragOrigin {
    double x        = 0;
    double y        = 0;
    double width    = 0;
    double final_dx = 0;
    double final_dy = 0;
};

struct BarUpdate {
    std::optional<double> x;
    std::optional<double> width;
    std::optional<double> y;
};

struct Bar {
    std::string task_id;
    std::string name;
    std::string custom_class;
    TaskType    type        = TaskType::Plain;
    bool        invalid     = false;
    bool        collapsible = false;
    bool        active      = false;
    int         progress    = 0;
    std::size_t row         = 0;

    Render::ShapeGeometry body;
    Render::ShapeGeometry progress_body;
    BarShapes             shapes;

    DragOrigin               origin;
    DragOrigin               progress_origin;
    std::vector<std::size_t> arrows;

    std::chrono::steady_clock::time_point cooldown_until{};

    [[nodiscard]] auto in_cooldown(std::chrono::steady_clock::time_point now) const -> bool { return now < cooldown_until; }
    [[nodiscard]] auto is_envelope() const -> bool { return type != TaskType::Plain; }
    auto capture_origin() -> void;
};

struct Arrow {
    std::string         from_id;
    std::string         to_id;
    Render::ShapeHandle shape;
    ArrowPath           path;
};

/**
 * Owns the drawn bars and dependency arrows of the visible tasks. Bar
 * geometry lives in the renderer's shapes and is read back through
 * ShapeGeometry; every position change resynchronizes the label, handles,
 * progress fill, caret and attached arrows.
 */
class BarLayer {
public:
    struct Context {
        Render::Renderer*   renderer = nullptr;
        Render::ShapeHandle bar_layer;
        Render::ShapeHandle arrow_layer;
        Scale               scale;
        DateTime            gantt_start;
        LayoutMetrics       metrics;
    };

    static constexpr double kHandleWidth        = 8;
    static constexpr double kCaretWidth         = 12;
    static constexpr double kCaretHeight        = 6;
    static constexpr double kCaretMinLabelSpace = 40;

    auto build(Context context, TaskList const& tasks, DependencyGraph const& graph) -> void;
    auto reset() -> void;

    [[nodiscard]] auto find(std::string_view id) -> Bar*;
    [[nodiscard]] auto find(std::string_view id) const -> Bar const*;
    // Bars in row order.
    [[nodiscard]] auto ordered() -> std::vector<Bar*>;
    [[nodiscard]] auto size() const -> std::size_t { return bars_.size(); }
    [[nodiscard]] auto arrows() const -> std::vector<Arrow> const& { return arrows_; }

    [[nodiscard]] auto scale() const -> Scale const& { return context_.scale; }
    [[nodiscard]] auto metrics() const -> LayoutMetrics const& { return context_.metrics; }
    [[nodiscard]] auto row_y(std::size_t row) const -> double { return context_.metrics.row_y(row); }
    [[nodiscard]] auto min_drag_y() const -> double { return context_.metrics.header_height; }
    [[nodiscard]] auto max_drag_y() const -> double;

    // Applies the update unless the new width would be narrower than one column.
    auto update_position(Bar& bar, BarUpdate const& update) -> bool;
    auto set_progress_width(Bar& bar, double width) -> void;
    auto set_progress(Bar& bar, int progress) -> void;
    auto set_active(Bar& bar, bool active) -> void;

    [[nodiscard]] auto compute_dates(Bar const& bar) const -> DateRange;
    [[nodiscard]] auto compute_progress(Bar const& bar) const -> int;

    // Reorders rows by current bar y (stable) and returns the bars whose row changed.
    auto sort_by_y() -> std::vector<Bar*>;
    [[nodiscard]] auto row_order() const -> std::vector<std::string>;

private:
    auto make_bar(Task const& task, DependencyGraph const& graph) -> Bar;
    auto sync_label(Bar& bar) -> void;
    auto sync_handles(Bar& bar) -> void;
    auto sync_progress(Bar& bar) -> void;
    auto sync_arrows(Bar& bar) -> void;
    auto progress_points(Bar const& bar) const -> std::string;
    auto caret_points(Bar const& bar) const -> std::string;
    auto arrow_options() const -> ArrowOptions;

    Context                  context_;
    std::vector<Bar>         bars_;
    std::vector<std::size_t> order_;
    std::vector<Arrow>       arrows_;
};

} // namespace GK
