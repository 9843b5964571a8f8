#include <ganttkit/chart/Chart.hpp>
#include <ganttkit/geometry/BarGeometry.hpp>
#include <ganttkit/model/TaskNormalizer.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

namespace GK {

namespace {

using Render::Attributes;
using Render::Gesture;
using Render::PointerEvent;
using Render::ShapeHandle;
using Render::ShapeKind;

auto layer(Render::Renderer& renderer, char const* name) -> ShapeHandle {
    return renderer.create_shape(ShapeKind::Group, renderer.root(), Attributes{{"class", std::string{name}}});
}

} // namespace

auto Chart::Create(Render::Renderer* renderer, std::vector<Task> tasks, ChartOptions options, ChartEvents events)
    -> Expected<std::unique_ptr<Chart>> {
    if (renderer == nullptr)
        return std::unexpected(Error{Error::Code::InvalidTarget, "chart requires a drawing target"});
    if (auto invalid = ValidateChartOptions(options))
        return std::unexpected(Error{Error::Code::InvalidOption, *invalid});

    auto chart = std::make_unique<Chart>(ConstructionKey{}, *renderer, std::move(options), std::move(events));
    chart->bind_root_events();
    chart->setup_tasks(std::move(tasks));
    chart->change_view_mode(chart->options_.view_mode);
    gk_log("Chart created with " + std::to_string(chart->tasks_.tasks.size()) + " tasks", "Chart");
    return chart;
}

Chart::Chart(ConstructionKey, Render::Renderer& renderer, ChartOptions options, ChartEvents events)
    : renderer_(renderer), options_(std::move(options)), events_(std::move(events)) {
    InteractionCallbacks callbacks{
            .commit_dates    = [this](std::string const& id, DateRange const& range) { commit_dates(id, range); },
            .commit_progress = [this](std::string const& id, int progress) { commit_progress(id, progress); },
            .toggle_collapse = [this](std::string const& id) { toggle_collapse(id); },
            .reorder_rows    = [this](std::vector<std::string> const& order) { reorder_rows(order); },
            .scroll_by       = [this](double dx) { scroll_by(dx); },
            .activate        = [this](std::string const& id) { select(id); },
    };
    interaction_ = std::make_unique<InteractionController>(bars_, graph_, InteractionConfig{.sortable = options_.sortable}, std::move(callbacks));
}

auto Chart::today() const -> DateTime {
    return options_.today ? options_.today() : Calendar::Today();
}

auto Chart::refresh(std::vector<Task> tasks) -> void {
    setup_tasks(std::move(tasks));
    change_view_mode(scale_.mode);
}

auto Chart::setup_tasks(std::vector<Task> tasks) -> void {
    NormalizeContext context{.today = today(), .generate_id = options_.id_generator};
    tasks_ = NormalizeTasks(std::move(tasks), context);
    graph_ = DependencyGraph::Build(tasks_.tasks);
    gk_log("Dependency graph rebuilt with " + std::to_string(graph_.edge_count()) + " edges", "Chart");
}

auto Chart::change_view_mode(ViewMode mode) -> void {
    scale_             = ApplyScale(mode);
    options_.view_mode = mode;
    setup_dates();
    render();
    gk_log("View mode " + std::string{to_string(mode)}, "Chart");
    if (events_.on_view_change)
        events_.on_view_change(mode);
}

auto Chart::scale_view_mode(int zoom) -> bool {
    auto next = ZoomViewMode(options_.view_modes, scale_, zoom);
    if (!next)
        return false;
    change_view_mode(*next);
    return true;
}

auto Chart::setup_dates() -> void {
    range_ = Timeline::ComputeRange(tasks_.tasks, scale_.mode, today());
    dates_ = Timeline::ColumnDates(range_, scale_);
}

auto Chart::toggle_collapse(std::string_view id) -> bool {
    auto* task = tasks_.find(id);
    if (task == nullptr)
        return false;

    task->collapsed = !task->collapsed;
    auto const collapsed = task->collapsed;
    auto const taskId    = task->id;
    for (auto const& descendantId : graph_.descendants(taskId)) {
        auto* descendant = tasks_.find(descendantId);
        if (descendant == nullptr)
            continue;
        bool parentCollapsed = false;
        if (!descendant->dependencies.empty()) {
            if (auto const* parent = tasks_.find(descendant->dependencies.front()))
                parentCollapsed = parent->collapsed;
        }
        descendant->visible = !(collapsed || parentCollapsed);
    }

    gk_log(std::string{collapsed ? "Collapsed " : "Expanded "} + taskId, "Chart");
    setup_tasks(std::move(tasks_.tasks));
    change_view_mode(scale_.mode);
    return true;
}

auto Chart::render() -> void {
    interaction_->cancel();
    bars_.reset();
    scrollDebouncer_.cancel();
    renderer_.clear();

    layers_ = ChartLayers{.grid     = layer(renderer_, "grid"),
                          .arrow    = layer(renderer_, "arrow"),
                          .progress = layer(renderer_, "progress"),
                          .bar      = layer(renderer_, "bar"),
                          .details  = layer(renderer_, "details"),
                          .date     = layer(renderer_, "date")};

    render_grid();
    render_dates();
    render_bars();

    renderer_.set_attribute(renderer_.root(), "width", gridWidth_);
    renderer_.set_attribute(renderer_.root(), "height", gridHeight_);

    scrollX_ = initial_scroll();
    update_location();
}

auto Chart::render_grid() -> void {
    auto const metrics   = options_.metrics();
    auto const rowHeight = metrics.row_height();
    auto const rows      = tasks_.visible.size();

    gridWidth_  = Timeline::ContentWidth(dates_, scale_);
    gridHeight_ = metrics.header_height + metrics.padding + rowHeight * static_cast<double>(rows);

    renderer_.create_shape(ShapeKind::Rect, layers_.grid,
                           Attributes{{"x", 0.0}, {"y", 0.0}, {"width", gridWidth_}, {"height", gridHeight_}, {"class", std::string{"grid-background"}}});

    auto const rowsGroup  = renderer_.create_shape(ShapeKind::Group, layers_.grid, Attributes{});
    auto const linesGroup = renderer_.create_shape(ShapeKind::Group, layers_.grid, Attributes{});
    auto       rowY       = metrics.header_height + metrics.padding / 2;
    for (std::size_t row = 0; row < rows; ++row) {
        renderer_.create_shape(ShapeKind::Rect, rowsGroup,
                               Attributes{{"x", 0.0},
                                          {"y", rowY},
                                          {"width", gridWidth_},
                                          {"height", rowHeight},
                                          {"class", std::string{"grid-row"}},
                                          {"data-id", tasks_.visible_task(row).id}});
        renderer_.create_shape(ShapeKind::Line, linesGroup,
                               Attributes{{"x1", 0.0}, {"y1", rowY + rowHeight}, {"x2", gridWidth_}, {"y2", rowY + rowHeight}, {"class", std::string{"row-line"}}});
        rowY += rowHeight;
    }

    renderer_.create_shape(ShapeKind::Rect, layers_.grid,
                           Attributes{{"x", 0.0},
                                      {"y", 0.0},
                                      {"width", gridWidth_},
                                      {"height", metrics.header_height + 10},
                                      {"class", std::string{"grid-header"}}});

    auto const tickY      = metrics.header_height + metrics.padding / 2;
    auto const tickHeight = rowHeight * static_cast<double>(rows);
    for (auto const& tick : Timeline::GridTicks(dates_, scale_)) {
        std::ostringstream path;
        path << "M " << tick.x << ' ' << tickY << " v " << tickHeight;
        renderer_.create_shape(ShapeKind::Path, layers_.grid,
                               Attributes{{"d", path.str()}, {"class", std::string{tick.thick ? "tick thick" : "tick"}}});
    }

    if (auto x = Timeline::TodayHighlightX(range_, scale_, today())) {
        renderer_.create_shape(ShapeKind::Rect, layers_.grid,
                               Attributes{{"x", *x},
                                          {"y", 0.0},
                                          {"width", scale_.column_width},
                                          {"height", gridHeight_},
                                          {"class", std::string{"today-highlight"}}});
    }

    renderer_.listen(layers_.grid, Gesture::Press, [this](PointerEvent const& event) {
        interaction_->press(PressTarget::Grid, {}, event);
    });
    renderer_.listen(layers_.grid, Gesture::Click, [this](PointerEvent const&) {
        if (options_.popup_trigger == "click")
            unselect_all();
    });
}

auto Chart::render_dates() -> void {
    labels_ = Timeline::AxisLabels(dates_, scale_, options_.metrics(), options_.language);
    for (auto const& label : labels_) {
        renderer_.create_shape(ShapeKind::Text, layers_.date,
                               Attributes{{"x", label.lower_x}, {"y", label.lower_y}, {"text", label.lower_text}, {"class", std::string{"lower-text"}}});
        if (label.upper_text.empty())
            continue;
        auto upper = renderer_.create_shape(ShapeKind::Text, layers_.date,
                                            Attributes{{"x", label.upper_x}, {"y", label.upper_y}, {"text", label.upper_text}, {"class", std::string{"upper-text"}}});
        if (renderer_.get_bounding_box(upper).x2() > gridWidth_)
            renderer_.remove(upper);
    }
}

auto Chart::render_bars() -> void {
    BarLayer::Context context{.renderer    = &renderer_,
                              .bar_layer   = layers_.bar,
                              .arrow_layer = layers_.arrow,
                              .scale       = scale_,
                              .gantt_start = range_.start,
                              .metrics     = options_.metrics()};
    bars_.build(context, tasks_, graph_);
    for (auto* bar : bars_.ordered())
        bind_bar_events(*bar);
}

auto Chart::bind_root_events() -> void {
    auto const root = renderer_.root();
    renderer_.listen(root, Gesture::Move, [this](PointerEvent const& event) { interaction_->move(event); });
    renderer_.listen(root, Gesture::Release, [this](PointerEvent const& event) { interaction_->release(event); });
    renderer_.listen(root, Gesture::Scroll, [this](PointerEvent const& event) { handle_scroll(event.x, event.timestamp); });
}

auto Chart::bind_bar_events(Bar const& bar) -> void {
    auto const id     = bar.task_id;
    auto       press  = [this, id](PressTarget target) {
        return [this, id, target](PointerEvent const& event) { interaction_->press(target, id, event); };
    };
    auto const& shapes = bar.shapes;

    renderer_.listen(shapes.bar_group, Gesture::Press, press(PressTarget::BarBody));
    if (shapes.handle_left.valid())
        renderer_.listen(shapes.handle_left, Gesture::Press, press(PressTarget::LeftHandle));
    if (shapes.handle_right.valid())
        renderer_.listen(shapes.handle_right, Gesture::Press, press(PressTarget::RightHandle));
    if (shapes.handle_progress.valid())
        renderer_.listen(shapes.handle_progress, Gesture::Press, press(PressTarget::ProgressHandle));
    if (shapes.caret.valid())
        renderer_.listen(shapes.caret, Gesture::Press, press(PressTarget::Caret));

    renderer_.listen(shapes.group, Gesture::Click, [this, id](PointerEvent const& event) {
        auto const* current = bars_.find(id);
        if (current == nullptr || current->in_cooldown(event.timestamp))
            return;
        if (options_.popup_trigger == "click")
            select(id);
    });
    renderer_.listen(shapes.group, Gesture::DoubleClick, [this, id](PointerEvent const& event) {
        auto const* current = bars_.find(id);
        if (current == nullptr || current->in_cooldown(event.timestamp))
            return;
        if (options_.popup_trigger == "dblclick")
            select(id);
        if (auto const* task = tasks_.find(id); task != nullptr && events_.on_click)
            events_.on_click(*task);
    });
}

auto Chart::select(std::string const& id) -> void {
    unselect_all();
    if (auto* bar = bars_.find(id))
        bars_.set_active(*bar, true);
}

auto Chart::unselect_all() -> void {
    for (auto* bar : bars_.ordered()) {
        if (bar->active)
            bars_.set_active(*bar, false);
    }
}

auto Chart::active_id() const -> std::optional<std::string> {
    for (auto const& id : bars_.row_order()) {
        if (auto const* bar = bars_.find(id); bar != nullptr && bar->active)
            return id;
    }
    return std::nullopt;
}

auto Chart::commit_dates(std::string const& id, DateRange const& range) -> void {
    auto* task = tasks_.find(id);
    if (task == nullptr)
        return;
    if (task->start_at == range.start && task->end_at == range.end)
        return;

    StoreCommittedRange(*task, range.start, range.end);
    gk_log("Task " + id + " moved to " + Calendar::ToString(range.start, true) + " .. " + Calendar::ToString(range.end, true), "Chart");
    if (events_.on_date_change)
        events_.on_date_change(*task, range.start, Calendar::Add(range.end, -1, TimeUnit::Second));
}

auto Chart::commit_progress(std::string const& id, int progress) -> void {
    auto* task = tasks_.find(id);
    if (task == nullptr)
        return;
    task->progress = progress;
    gk_log("Task " + id + " progress " + std::to_string(progress), "Chart");
    if (events_.on_progress_change)
        events_.on_progress_change(*task, progress);
}

auto Chart::reorder_rows(std::vector<std::string> const& order) -> void {
    // Visible tasks trade places among the slots they already occupy; hidden tasks stay put.
    auto slots = tasks_.visible;
    std::sort(slots.begin(), slots.end());

    std::vector<Task> moved;
    moved.reserve(order.size());
    for (auto const& id : order) {
        auto position = tasks_.position_of(id);
        if (!position)
            return;
        moved.push_back(tasks_.tasks[*position]);
    }
    if (moved.size() != slots.size())
        return;

    for (std::size_t row = 0; row < slots.size(); ++row) {
        moved[row].index          = row;
        tasks_.tasks[slots[row]] = std::move(moved[row]);
    }
    tasks_.visible = std::move(slots);
}

auto Chart::scroll_by(double dx) -> void {
    auto const maxScroll = std::max(0.0, gridWidth_ - viewportWidth_);
    scrollX_             = std::clamp(scrollX_ + dx, 0.0, maxScroll);
    update_location();
}

auto Chart::handle_scroll(double scrollX, Clock::time_point now) -> void {
    scrollX_ = std::max(0.0, scrollX);
    scrollDebouncer_.schedule(now, [this] { update_location(); });
}

auto Chart::poll_timers(Clock::time_point now) -> void {
    scrollDebouncer_.poll(now);
}

auto Chart::set_viewport_width(double width) -> void {
    viewportWidth_ = std::max(0.0, width);
}

auto Chart::initial_scroll() const -> double {
    if (tasks_.tasks.empty())
        return 0;
    auto earliest = tasks_.tasks.front().start_at;
    for (auto const& task : tasks_.tasks)
        earliest = std::min(earliest, task.start_at);
    auto const hours = static_cast<double>(Calendar::Diff(earliest, range_.start, TimeUnit::Hour));
    return std::max(0.0, hours / scale_.step_hours * scale_.column_width - scale_.column_width);
}

auto Chart::update_location() -> void {
    currentLocation_ = Geometry::FromGeometry(scrollX_, scale_.column_width, scale_, range_.start).start;
}

} // namespace GK
