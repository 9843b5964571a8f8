#include <ganttkit/chart/BarLayer.hpp>

#include <algorithm>
#include <sstream>

namespace GK {

namespace {

using Render::Attributes;
using Render::ShapeHandle;
using Render::ShapeKind;

auto bar_rect(Bar const& bar) -> BarRect {
    return BarRect{.x = bar.body.x(), .y = bar.body.y(), .width = bar.body.width(), .height = bar.body.height()};
}

auto wrapper_class(Bar const& bar) -> std::string {
    std::string cls = "bar-wrapper";
    if (!bar.custom_class.empty())
        cls += " " + bar.custom_class;
    if (bar.active)
        cls += " active";
    return cls;
}

} // namespace

auto Bar::capture_origin() -> void {
    origin = DragOrigin{.x = body.x(), .y = body.y(), .width = body.width()};
}

auto BarLayer::reset() -> void {
    bars_.clear();
    order_.clear();
    arrows_.clear();
}

auto BarLayer::build(Context context, TaskList const& tasks, DependencyGraph const& graph) -> void {
    reset();
    context_ = context;
    if (context_.renderer == nullptr)
        return;

    bars_.reserve(tasks.visible.size());
    for (auto position : tasks.visible) {
        bars_.push_back(make_bar(tasks.tasks[position], graph));
        order_.push_back(bars_.size() - 1);
    }

    auto& renderer = *context_.renderer;
    for (auto position : tasks.visible) {
        auto const& task = tasks.tasks[position];
        auto*       to   = find(task.id);
        for (auto const& dependency : task.dependencies) {
            auto* from = find(dependency);
            if (from == nullptr || to == nullptr || from == to)
                continue;
            Arrow arrow{.from_id = from->task_id, .to_id = to->task_id};
            arrow.path  = RouteArrow(bar_rect(*from), bar_rect(*to), arrow_options());
            arrow.shape = renderer.create_shape(ShapeKind::Path, context_.arrow_layer,
                                                Attributes{{"d", arrow.path.d}, {"data-from", arrow.from_id}, {"data-to", arrow.to_id}});
            arrows_.push_back(std::move(arrow));
            from->arrows.push_back(arrows_.size() - 1);
            to->arrows.push_back(arrows_.size() - 1);
        }
    }
}

auto BarLayer::make_bar(Task const& task, DependencyGraph const& graph) -> Bar {
    auto&       renderer = *context_.renderer;
    auto const& metrics  = context_.metrics;
    auto const  rect     = Geometry::ToGeometry(task, task.index.value_or(0), context_.scale, context_.gantt_start, metrics);
    auto const  radius   = metrics.bar_corner_radius;

    Bar bar;
    bar.task_id      = task.id;
    bar.name         = task.name;
    bar.custom_class = task.custom_class;
    bar.type         = task.type;
    bar.invalid      = task.invalid;
    bar.collapsible  = graph.has_dependents(task.id);
    bar.progress     = task.progress;
    bar.row          = task.index.value_or(0);

    auto& shapes        = bar.shapes;
    shapes.group        = renderer.create_shape(ShapeKind::Group, context_.bar_layer,
                                                Attributes{{"class", wrapper_class(bar)}, {"data-id", task.id}});
    shapes.bar_group    = renderer.create_shape(ShapeKind::Group, shapes.group,
                                                Attributes{{"class", std::string{bar.collapsible ? "bar-group collapsable" : "bar-group"}}});
    shapes.handle_group = renderer.create_shape(ShapeKind::Group, shapes.group, Attributes{{"class", std::string{"handle-group"}}});

    Attributes body{{"x", rect.x},
                    {"y", rect.y},
                    {"width", rect.width},
                    {"height", rect.height},
                    {"rx", radius},
                    {"ry", radius},
                    {"class", std::string{task.invalid ? "bar bar-invalid" : "bar"}}};
    if (!task.color.empty())
        body.emplace_back("style", "fill: " + task.color + "; stroke-width:1; stroke:lightgrey; ");
    bar.body = Render::ShapeGeometry{renderer, renderer.create_shape(ShapeKind::Rect, shapes.bar_group, std::move(body))};

    if (!task.invalid) {
        Attributes progress{{"x", rect.x},
                            {"y", rect.y},
                            {"width", Geometry::ProgressWidth(rect.width, task.progress)},
                            {"height", rect.height},
                            {"rx", radius},
                            {"ry", radius},
                            {"class", std::string{"bar-progress"}}};
        if (!task.color.empty())
            progress.emplace_back("style", "fill: " + task.color);
        bar.progress_body = Render::ShapeGeometry{renderer, renderer.create_shape(ShapeKind::Rect, shapes.bar_group, std::move(progress))};
    }

    shapes.label = renderer.create_shape(ShapeKind::Text, shapes.bar_group,
                                         Attributes{{"x", rect.center_x()},
                                                    {"y", rect.center_y()},
                                                    {"text", task.name},
                                                    {"class", std::string{"bar-label"}},
                                                    {"text-anchor", std::string{"middle"}}});
    sync_label(bar);

    if (!task.invalid) {
        shapes.handle_right = renderer.create_shape(ShapeKind::Rect, shapes.handle_group,
                                                    Attributes{{"x", rect.end_x() - 9},
                                                               {"y", rect.y + 1},
                                                               {"width", kHandleWidth},
                                                               {"height", rect.height - 2},
                                                               {"rx", radius},
                                                               {"ry", radius},
                                                               {"class", std::string{"handle right"}}});
        shapes.handle_left  = renderer.create_shape(ShapeKind::Rect, shapes.handle_group,
                                                    Attributes{{"x", rect.x + 1},
                                                               {"y", rect.y + 1},
                                                               {"width", kHandleWidth},
                                                               {"height", rect.height - 2},
                                                               {"rx", radius},
                                                               {"ry", radius},
                                                               {"class", std::string{"handle left"}}});
        if (task.progress > 0 && task.progress < 100) {
            shapes.handle_progress = renderer.create_shape(ShapeKind::Polygon, shapes.handle_group,
                                                           Attributes{{"points", progress_points(bar)}, {"class", std::string{"handle progress"}}});
        }
    }

    if (bar.collapsible) {
        auto const labelWidth = renderer.get_bounding_box(shapes.label).width;
        if (rect.width - labelWidth > kCaretMinLabelSpace) {
            shapes.caret = renderer.create_shape(ShapeKind::Polygon, shapes.handle_group,
                                                 Attributes{{"points", caret_points(bar)}, {"class", std::string{"caret"}}});
        }
    }
    return bar;
}

auto BarLayer::find(std::string_view id) -> Bar* {
    for (auto& bar : bars_) {
        if (bar.task_id == id)
            return &bar;
    }
    return nullptr;
}

auto BarLayer::find(std::string_view id) const -> Bar const* {
    for (auto const& bar : bars_) {
        if (bar.task_id == id)
            return &bar;
    }
    return nullptr;
}

auto BarLayer::ordered() -> std::vector<Bar*> {
    std::vector<Bar*> result;
    result.reserve(order_.size());
    for (auto index : order_)
        result.push_back(&bars_[index]);
    return result;
}

auto BarLayer::max_drag_y() const -> double {
    return context_.metrics.header_height + static_cast<double>(bars_.size()) * context_.metrics.row_height();
}

auto BarLayer::update_position(Bar& bar, BarUpdate const& update) -> bool {
    if (update.width && *update.width < context_.scale.column_width)
        return false;
    if (update.x)
        bar.body.set_x(*update.x);
    if (update.width)
        bar.body.set_width(*update.width);
    if (update.y)
        bar.body.set_y(*update.y);
    sync_label(bar);
    sync_handles(bar);
    sync_progress(bar);
    sync_arrows(bar);
    return true;
}

auto BarLayer::set_progress_width(Bar& bar, double width) -> void {
    if (!bar.progress_body.valid())
        return;
    bar.progress_body.set_width(width);
    if (bar.shapes.handle_progress.valid())
        context_.renderer->set_attribute(bar.shapes.handle_progress, "points", progress_points(bar));
}

auto BarLayer::set_progress(Bar& bar, int progress) -> void {
    bar.progress = progress;
    sync_progress(bar);
    sync_handles(bar);
}

auto BarLayer::set_active(Bar& bar, bool active) -> void {
    bar.active = active;
    context_.renderer->set_attribute(bar.shapes.group, "class", wrapper_class(bar));
}

auto BarLayer::compute_dates(Bar const& bar) const -> DateRange {
    return Geometry::FromGeometry(bar.body.x(), bar.body.width(), context_.scale, context_.gantt_start);
}

auto BarLayer::compute_progress(Bar const& bar) const -> int {
    return Geometry::ComputeProgress(bar.progress_body.width(), bar.body.width());
}

auto BarLayer::sort_by_y() -> std::vector<Bar*> {
    std::stable_sort(order_.begin(), order_.end(), [this](std::size_t a, std::size_t b) {
        return bars_[a].body.y() < bars_[b].body.y();
    });
    std::vector<Bar*> changed;
    for (std::size_t row = 0; row < order_.size(); ++row) {
        auto& bar = bars_[order_[row]];
        if (bar.row != row) {
            bar.row = row;
            changed.push_back(&bar);
        }
    }
    return changed;
}

auto BarLayer::row_order() const -> std::vector<std::string> {
    std::vector<std::string> ids;
    ids.reserve(order_.size());
    for (auto index : order_)
        ids.push_back(bars_[index].task_id);
    return ids;
}

auto BarLayer::sync_label(Bar& bar) -> void {
    auto&      renderer   = *context_.renderer;
    auto const labelWidth = renderer.get_bounding_box(bar.shapes.label).width;
    auto const x          = bar.body.x();
    auto const width      = bar.body.width();
    if (labelWidth > width) {
        renderer.set_attribute(bar.shapes.label, "class", std::string{"bar-label big"});
        renderer.set_attribute(bar.shapes.label, "text-anchor", std::string{"start"});
        renderer.set_attribute(bar.shapes.label, "x", x + width + 5);
    } else {
        renderer.set_attribute(bar.shapes.label, "class", std::string{"bar-label"});
        renderer.set_attribute(bar.shapes.label, "text-anchor", std::string{"middle"});
        renderer.set_attribute(bar.shapes.label, "x", x + width / 2);
    }
    renderer.set_attribute(bar.shapes.label, "y", bar.body.y() + bar.body.height() / 2);
}

auto BarLayer::sync_handles(Bar& bar) -> void {
    if (bar.invalid)
        return;
    auto&      renderer = *context_.renderer;
    auto const x        = bar.body.x();
    auto const y        = bar.body.y();
    renderer.set_attribute(bar.shapes.handle_left, "x", x + 1);
    renderer.set_attribute(bar.shapes.handle_left, "y", y + 1);
    renderer.set_attribute(bar.shapes.handle_right, "x", bar.body.end_x() - 9);
    renderer.set_attribute(bar.shapes.handle_right, "y", y + 1);
    if (bar.shapes.caret.valid())
        renderer.set_attribute(bar.shapes.caret, "points", caret_points(bar));
    if (bar.shapes.handle_progress.valid())
        renderer.set_attribute(bar.shapes.handle_progress, "points", progress_points(bar));
}

auto BarLayer::sync_progress(Bar& bar) -> void {
    if (bar.invalid || !bar.progress_body.valid())
        return;
    bar.progress_body.set_x(bar.body.x());
    bar.progress_body.set_y(bar.body.y());
    bar.progress_body.set_width(Geometry::ProgressWidth(bar.body.width(), bar.progress));
}

auto BarLayer::sync_arrows(Bar& bar) -> void {
    auto& renderer = *context_.renderer;
    for (auto index : bar.arrows) {
        auto&       arrow = arrows_[index];
        auto const* from  = find(arrow.from_id);
        auto const* to    = find(arrow.to_id);
        if (from == nullptr || to == nullptr)
            continue;
        arrow.path = RouteArrow(bar_rect(*from), bar_rect(*to), arrow_options());
        renderer.set_attribute(arrow.shape, "d", arrow.path.d);
    }
}

auto BarLayer::progress_points(Bar const& bar) const -> std::string {
    auto const endX   = bar.progress_body.end_x();
    auto const bottom = bar.progress_body.y() + bar.progress_body.height();
    std::ostringstream points;
    points << endX - 5 << ',' << bottom << ',' << endX + 5 << ',' << bottom << ',' << endX << ',' << bottom - 8.66;
    return points.str();
}

auto BarLayer::caret_points(Bar const& bar) const -> std::string {
    auto const x = bar.body.end_x() - 20;
    auto const y = bar.body.y() + context_.metrics.bar_height / 2;
    std::ostringstream points;
    points << x - kCaretWidth / 2 << ',' << y - kCaretHeight / 2 << ' '
           << x << ',' << y + kCaretHeight / 2 << ' '
           << x + kCaretWidth / 2 << ',' << y - kCaretHeight / 2;
    return points.str();
}

auto BarLayer::arrow_options() const -> ArrowOptions {
    return ArrowOptions{.padding = context_.metrics.padding, .bar_height = context_.metrics.bar_height, .arrow_curve = context_.metrics.arrow_curve};
}

} // namespace GK
