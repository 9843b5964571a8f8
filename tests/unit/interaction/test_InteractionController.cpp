#include <ganttkit/interaction/InteractionController.hpp>
#include <ganttkit/model/TaskNormalizer.hpp>
#include <ganttkit/render/SvgDocument.hpp>

#include <doctest/doctest.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

using namespace GK;
using namespace std::chrono_literals;
using Render::PointerEvent;

namespace {

auto date(int year, int month, int day) -> DateTime {
    return DateTime::FromFields(year, month - 1, day);
}

auto make_task(std::string id, DateTime start, DateTime end, std::vector<std::string> dependencies = {}) -> Task {
    Task task;
    task.id           = id;
    task.name         = id;
    task.start        = start;
    task.end          = end;
    task.dependencies = std::move(dependencies);
    return task;
}

auto pointer(double x, double y, std::chrono::steady_clock::time_point timestamp = {}) -> PointerEvent {
    return PointerEvent{.x = x, .y = y, .timestamp = timestamp};
}

struct Recorded {
    std::vector<std::pair<std::string, DateRange>> dates;
    std::vector<std::pair<std::string, int>>       progress;
    std::vector<std::string>                       collapsed;
    std::vector<std::vector<std::string>>          orders;
    std::vector<double>                            scrolls;
    std::vector<std::string>                       activated;
};

// Bars laid out in the day view from 2024-01-10, one column per day.
struct Fixture {
    explicit Fixture(std::vector<Task> tasks, bool sortable = false) {
        list  = NormalizeTasks(std::move(tasks));
        graph = DependencyGraph::Build(list.tasks);
        bars.build(BarLayer::Context{.renderer    = &doc,
                                     .bar_layer   = doc.create_shape(Render::ShapeKind::Group, doc.root(), {}),
                                     .arrow_layer = doc.create_shape(Render::ShapeKind::Group, doc.root(), {}),
                                     .scale       = ApplyScale(ViewMode::Day),
                                     .gantt_start = date(2024, 1, 10),
                                     .metrics     = LayoutMetrics{}},
                   list, graph);
        controller = std::make_unique<InteractionController>(
            bars, graph, InteractionConfig{.sortable = sortable},
            InteractionCallbacks{
                .commit_dates    = [this](std::string const& id, DateRange const& range) { recorded.dates.emplace_back(id, range); },
                .commit_progress = [this](std::string const& id, int value) { recorded.progress.emplace_back(id, value); },
                .toggle_collapse = [this](std::string const& id) { recorded.collapsed.push_back(id); },
                .reorder_rows    = [this](std::vector<std::string> const& order) { recorded.orders.push_back(order); },
                .scroll_by       = [this](double dx) { recorded.scrolls.push_back(dx); },
                .activate        = [this](std::string const& id) { recorded.activated.push_back(id); },
            });
    }

    auto bar(std::string const& id) -> Bar& {
        auto* found = bars.find(id);
        REQUIRE(found != nullptr);
        return *found;
    }

    Render::SvgDocument                    doc;
    TaskList                               list;
    DependencyGraph                        graph;
    BarLayer                               bars;
    Recorded                               recorded;
    std::unique_ptr<InteractionController> controller;
};

} // namespace

TEST_SUITE("interaction.controller") {

TEST_CASE("Dragging a bar snaps to whole days") {
    Fixture f({make_task("a", date(2024, 1, 10), date(2024, 1, 11))});
    auto&   controller = *f.controller;
    auto const t0      = std::chrono::steady_clock::time_point{} + 10s;

    REQUIRE(controller.press(PressTarget::BarBody, "a", pointer(10, 70)));
    CHECK(controller.state() == InteractionState::Dragging);
    CHECK(f.recorded.activated == std::vector<std::string>{"a"});

    SUBCASE("Half a column or less stays put") {
        controller.move(pointer(29, 70));
        CHECK(f.bar("a").body.x() == doctest::Approx(0));
        controller.release(pointer(29, 70, t0));
        CHECK(f.recorded.dates.empty());
        CHECK(controller.idle());
    }
    SUBCASE("Past half a column moves one day") {
        controller.move(pointer(30, 70));
        CHECK(f.bar("a").body.x() == doctest::Approx(38));
        CHECK(f.bar("a").body.width() == doctest::Approx(76));
        controller.release(pointer(30, 70, t0));

        REQUIRE(f.recorded.dates.size() == 1);
        CHECK(f.recorded.dates[0].first == "a");
        CHECK(f.recorded.dates[0].second.start == date(2024, 1, 11));
        CHECK(f.recorded.dates[0].second.end == date(2024, 1, 13));
        CHECK(controller.idle());
        CHECK(f.bar("a").in_cooldown(t0 + 500ms));
        CHECK_FALSE(f.bar("a").in_cooldown(t0 + 1000ms));
    }
    SUBCASE("Vertical movement is ignored without sorting") {
        controller.move(pointer(10, 200));
        CHECK(f.bar("a").body.y() == doctest::Approx(68));
        controller.release(pointer(10, 200, t0));
        CHECK(f.recorded.orders.empty());
    }
}

TEST_CASE("Only one gesture at a time") {
    Fixture f({make_task("a", date(2024, 1, 10), date(2024, 1, 11)), make_task("b", date(2024, 1, 10), date(2024, 1, 11))});
    auto&   controller = *f.controller;

    REQUIRE(controller.press(PressTarget::BarBody, "a", pointer(10, 70)));
    CHECK_FALSE(controller.press(PressTarget::BarBody, "b", pointer(10, 110)));
    CHECK(controller.target_id() == "a");

    controller.cancel();
    CHECK(controller.idle());
    CHECK(f.recorded.dates.empty());
    CHECK_FALSE(controller.press(PressTarget::BarBody, "missing", pointer(0, 0)));
    CHECK(controller.idle());
}

TEST_CASE("Resize handles change one edge") {
    Fixture f({make_task("a", date(2024, 1, 10), date(2024, 1, 11))});
    auto&   controller = *f.controller;

    SUBCASE("Left handle moves the start") {
        REQUIRE(controller.press(PressTarget::LeftHandle, "a", pointer(2, 70)));
        CHECK(controller.state() == InteractionState::ResizingLeft);
        controller.move(pointer(40, 70));
        CHECK(f.bar("a").body.x() == doctest::Approx(38));
        CHECK(f.bar("a").body.width() == doctest::Approx(38));
        controller.release(pointer(40, 70));
        REQUIRE(f.recorded.dates.size() == 1);
        CHECK(f.recorded.dates[0].second.start == date(2024, 1, 11));
        CHECK(f.recorded.dates[0].second.end == date(2024, 1, 12));
    }
    SUBCASE("Right handle moves the end") {
        REQUIRE(controller.press(PressTarget::RightHandle, "a", pointer(70, 70)));
        CHECK(controller.state() == InteractionState::ResizingRight);
        controller.move(pointer(110, 70));
        CHECK(f.bar("a").body.x() == doctest::Approx(0));
        CHECK(f.bar("a").body.width() == doctest::Approx(114));
        controller.release(pointer(110, 70));
        REQUIRE(f.recorded.dates.size() == 1);
        CHECK(f.recorded.dates[0].second.end == date(2024, 1, 13));
    }
    SUBCASE("Bars never shrink below one column") {
        REQUIRE(controller.press(PressTarget::RightHandle, "a", pointer(70, 70)));
        controller.move(pointer(0, 70));
        CHECK(f.bar("a").body.width() == doctest::Approx(76));
    }
}

TEST_CASE("Dependents travel with a dragged bar") {
    Fixture f({make_task("a", date(2024, 1, 10), date(2024, 1, 11)),
               make_task("b", date(2024, 1, 12), date(2024, 1, 13), {"a"})});
    auto&   controller = *f.controller;

    SUBCASE("Drag carries dependents") {
        REQUIRE(controller.press(PressTarget::BarBody, "a", pointer(10, 70)));
        controller.move(pointer(30, 70));
        CHECK(f.bar("b").body.x() == doctest::Approx(114));
        controller.release(pointer(30, 70));

        REQUIRE(f.recorded.dates.size() == 2);
        CHECK(f.recorded.dates[0].first == "a");
        CHECK(f.recorded.dates[1].first == "b");
        CHECK(f.recorded.dates[1].second.start == date(2024, 1, 13));
        CHECK(f.recorded.dates[1].second.end == date(2024, 1, 15));
    }
    SUBCASE("Right resize leaves dependents alone") {
        REQUIRE(controller.press(PressTarget::RightHandle, "a", pointer(70, 70)));
        controller.move(pointer(110, 70));
        CHECK(f.bar("b").body.x() == doctest::Approx(76));
        controller.release(pointer(110, 70));
        REQUIRE(f.recorded.dates.size() == 1);
        CHECK(f.recorded.dates[0].first == "a");
    }
}

TEST_CASE("Project bars stretch to enclose their dependents") {
    auto project = make_task("p", date(2024, 1, 10), date(2024, 1, 11));
    project.type = TaskType::Project;
    Fixture f({project, make_task("a", date(2024, 1, 10), date(2024, 1, 11), {"p"}),
               make_task("b", date(2024, 1, 12), date(2024, 1, 13), {"p"})});
    auto&   controller = *f.controller;

    REQUIRE(controller.press(PressTarget::BarBody, "b", pointer(80, 145)));
    controller.move(pointer(100, 145));
    CHECK(f.bar("b").body.x() == doctest::Approx(114));
    CHECK(f.bar("p").body.x() == doctest::Approx(0));
    CHECK(f.bar("p").body.width() == doctest::Approx(190));
    controller.release(pointer(100, 145));

    REQUIRE(f.recorded.dates.size() == 2);
    CHECK(f.recorded.dates[0].first == "b");
    CHECK(f.recorded.dates[1].first == "p");
    CHECK(f.recorded.dates[1].second.start == date(2024, 1, 10));
    CHECK(f.recorded.dates[1].second.end == date(2024, 1, 15));
}

TEST_CASE("Progress handle drags the fill") {
    auto task     = make_task("a", date(2024, 1, 10), date(2024, 1, 11));
    task.progress = 50;
    Fixture f({task});
    auto&   controller = *f.controller;

    REQUIRE(f.bar("a").shapes.handle_progress.valid());
    REQUIRE(controller.press(PressTarget::ProgressHandle, "a", pointer(38, 85)));
    CHECK(controller.state() == InteractionState::ResizingProgress);

    SUBCASE("Quarter of the bar") {
        controller.move(pointer(57, 85));
        CHECK(f.bar("a").progress_body.width() == doctest::Approx(57));
        controller.release(pointer(57, 85));
        REQUIRE(f.recorded.progress.size() == 1);
        CHECK(f.recorded.progress[0] == std::pair<std::string, int>{"a", 75});
        CHECK(f.bar("a").progress == 75);
    }
    SUBCASE("Clamped to the bar") {
        controller.move(pointer(300, 85));
        CHECK(f.bar("a").progress_body.width() == doctest::Approx(76));
        controller.move(pointer(-300, 85));
        CHECK(f.bar("a").progress_body.width() == doctest::Approx(0));
        controller.release(pointer(-300, 85));
        REQUIRE(f.recorded.progress.size() == 1);
        CHECK(f.recorded.progress[0].second == 0);
    }
    SUBCASE("No movement commits nothing") {
        controller.release(pointer(38, 85));
        CHECK(f.recorded.progress.empty());
    }
}

TEST_CASE("Invalid bars cannot be resized") {
    Task undated;
    undated.id = "u";
    Fixture f({undated});
    auto&   controller = *f.controller;

    REQUIRE(f.bar("u").invalid);
    CHECK_FALSE(controller.press(PressTarget::ProgressHandle, "u", pointer(10, 70)));
    CHECK(controller.idle());
    REQUIRE(controller.press(PressTarget::LeftHandle, "u", pointer(10, 70)));
    CHECK(controller.state() == InteractionState::Dragging);
}

TEST_CASE("Caret press toggles collapse unless dragged") {
    Fixture f({make_task("r", date(2024, 1, 10), date(2024, 1, 11)), make_task("c", date(2024, 1, 10), date(2024, 1, 11), {"r"})});
    auto&   controller = *f.controller;

    REQUIRE(controller.press(PressTarget::Caret, "r", pointer(56, 78)));
    CHECK(controller.state() == InteractionState::PendingCollapse);

    SUBCASE("Small jitter still collapses") {
        controller.move(pointer(59, 81));
        CHECK(controller.state() == InteractionState::PendingCollapse);
        controller.release(pointer(59, 81));
        CHECK(f.recorded.collapsed == std::vector<std::string>{"r"});
    }
    SUBCASE("Moving further becomes a drag") {
        controller.move(pointer(66, 78));
        CHECK(controller.state() == InteractionState::Dragging);
        controller.release(pointer(66, 78));
        CHECK(f.recorded.collapsed.empty());
        CHECK(f.recorded.dates.empty());
    }
}

TEST_CASE("Panning the grid scrolls the other way") {
    Fixture f({make_task("a", date(2024, 1, 10), date(2024, 1, 11))});
    auto&   controller = *f.controller;

    REQUIRE(controller.press(PressTarget::Grid, "", pointer(100, 300)));
    CHECK(controller.state() == InteractionState::Panning);
    controller.move(pointer(90, 300));
    controller.move(pointer(80, 300));
    CHECK(f.recorded.scrolls == std::vector<double>{15, 15});
    CHECK(f.recorded.activated.empty());
    controller.release(pointer(80, 300));
    CHECK(controller.idle());
}

TEST_CASE("Vertical drags reorder rows when sortable") {
    Fixture f({make_task("a", date(2024, 1, 10), date(2024, 1, 11)),
               make_task("b", date(2024, 1, 10), date(2024, 1, 11)),
               make_task("c", date(2024, 1, 10), date(2024, 1, 11))},
              true);
    auto& controller = *f.controller;

    REQUIRE(controller.press(PressTarget::BarBody, "a", pointer(10, 70)));
    controller.move(pointer(10, 90));
    CHECK(f.recorded.orders.empty());
    CHECK(f.bar("a").body.y() == doctest::Approx(88));

    controller.move(pointer(10, 115));
    CHECK(controller.state() == InteractionState::Sorting);
    REQUIRE(f.recorded.orders.size() == 1);
    CHECK(f.recorded.orders[0] == std::vector<std::string>{"b", "a", "c"});
    CHECK(f.bar("b").body.y() == doctest::Approx(68));
    CHECK(f.bar("a").row == 1);

    controller.release(pointer(10, 115));
    CHECK(f.bar("a").body.y() == doctest::Approx(106));
    CHECK(f.recorded.dates.empty());
    CHECK(controller.idle());
}

TEST_CASE("State names") {
    CHECK(to_string(InteractionState::Idle) == "idle");
    CHECK(to_string(InteractionState::ResizingProgress) == "resizing_progress");
    CHECK(to_string(InteractionState::PendingCollapse) == "pending_collapse");
}

}
