#include <ganttkit/geometry/BarGeometry.hpp>
#include <ganttkit/model/TaskNormalizer.hpp>
#include <ganttkit/scale/Timeline.hpp>

#include <doctest/doctest.h>

#include <cstdint>
#include <cstdlib>
#include <string>

using namespace GK;

namespace {

auto date(int year, int month, int day, int hour = 0) -> DateTime {
    return DateTime::FromFields(year, month - 1, day, hour);
}

} // namespace

TEST_SUITE("geometry.bar") {

TEST_CASE("Two day task in the day view") {
    Task task;
    task.start = date(2024, 1, 10);
    task.end   = date(2024, 1, 11);
    auto list  = NormalizeTasks({task});

    auto const scale      = ApplyScale(ViewMode::Day);
    auto const ganttStart = date(2023, 11, 10);
    LayoutMetrics metrics;

    auto rect = Geometry::ToGeometry(list.tasks[0], 0, scale, ganttStart, metrics);
    CHECK(rect.x == doctest::Approx(2318));
    CHECK(rect.width == doctest::Approx(76));
    CHECK(rect.y == doctest::Approx(68));
    CHECK(rect.height == doctest::Approx(20));

    auto second = Geometry::ToGeometry(list.tasks[0], 2, scale, ganttStart, metrics);
    CHECK(second.y == doctest::Approx(68 + 2 * 38));

    auto range = Geometry::FromGeometry(rect.x, rect.width, scale, ganttStart);
    CHECK(range.start == date(2024, 1, 10));
    CHECK(range.end == date(2024, 1, 12));
}

TEST_CASE("Geometry maps back to the task dates in every view mode") {
    Task whole;
    whole.id    = "whole";
    whole.start = date(2024, 1, 10);
    whole.end   = date(2024, 1, 11);
    Task offset;
    offset.id    = "offset";
    offset.start = date(2024, 1, 10, 6);
    offset.end   = date(2024, 1, 13, 18);
    auto list    = NormalizeTasks({whole, offset});
    LayoutMetrics metrics;

    for (auto mode : kAllViewModes) {
        auto const modeName = std::string{to_string(mode)};
        CAPTURE(modeName);
        auto const scale      = ApplyScale(mode);
        auto const ganttStart = Timeline::ComputeRange(list.tasks, mode).start;

        auto const& day   = list.tasks[0];
        auto        rect  = Geometry::ToGeometry(day, 0, scale, ganttStart, metrics);
        auto        range = Geometry::FromGeometry(rect.x, rect.width, scale, ganttStart);
        CHECK(range.start == day.start_at);
        CHECK(range.end == day.end_at);

        // Month places bars by whole days, so an intra-day start lands within one snap unit.
        auto const& timed     = list.tasks[1];
        auto        timedRect = Geometry::ToGeometry(timed, 1, scale, ganttStart, metrics);
        auto        back      = Geometry::FromGeometry(timedRect.x, timedRect.width, scale, ganttStart);
        auto const  unitMs    = static_cast<std::int64_t>(Geometry::SnapUnit(scale) / scale.column_width * scale.step_hours * 3'600'000);
        CHECK(std::llabs((back.start - timed.start_at).count()) <= unitMs);
        CHECK(std::llabs((back.end - timed.end_at).count()) <= unitMs);
        CHECK((back.end - back.start) == (timed.end_at - timed.start_at));
    }
}

TEST_CASE("Horizontal position per view mode") {
    auto const ganttStart = date(2024, 1, 1);

    CHECK(Geometry::ComputeX(date(2024, 1, 8), ganttStart, ApplyScale(ViewMode::Week)) == doctest::Approx(140));
    CHECK(Geometry::ComputeX(date(2024, 1, 2), ganttStart, ApplyScale(ViewMode::QuarterDay)) == doctest::Approx(4 * 38));
    CHECK(Geometry::ComputeX(date(2024, 1, 1, 12), ganttStart, ApplyScale(ViewMode::HalfDay)) == doctest::Approx(38));
    CHECK(Geometry::ComputeX(date(2024, 2, 1), ganttStart, ApplyScale(ViewMode::Month)) == doctest::Approx(31 * 4));
    CHECK(Geometry::ComputeWidth(date(2024, 1, 1), date(2024, 1, 3), ApplyScale(ViewMode::Day)) == doctest::Approx(76));
}

TEST_CASE("Geometry maps back to dates at sub-column resolution") {
    auto const scale      = ApplyScale(ViewMode::Day);
    auto const ganttStart = date(2024, 1, 1);

    auto range = Geometry::FromGeometry(19, 38, scale, ganttStart);
    CHECK(range.start == date(2024, 1, 1, 12));
    CHECK(range.end == date(2024, 1, 2, 12));
}

TEST_CASE("Snapping to whole steps") {
    auto const day = ApplyScale(ViewMode::Day);
    CHECK(Geometry::SnapUnit(day) == doctest::Approx(38));
    CHECK(Geometry::SnapDelta(0, day) == doctest::Approx(0));
    CHECK(Geometry::SnapDelta(19, day) == doctest::Approx(0));
    CHECK(Geometry::SnapDelta(20, day) == doctest::Approx(38));
    CHECK(Geometry::SnapDelta(-20, day) == doctest::Approx(-38));
    CHECK(Geometry::SnapDelta(-19, day) == doctest::Approx(0));
    CHECK(Geometry::SnapDelta(57, day) == doctest::Approx(38));
    CHECK(Geometry::SnapDelta(58, day) == doctest::Approx(76));

    auto const week = ApplyScale(ViewMode::Week);
    CHECK(Geometry::SnapUnit(week) == doctest::Approx(20));
    CHECK(Geometry::SnapDelta(31, week) == doctest::Approx(40));

    auto const month = ApplyScale(ViewMode::Month);
    CHECK(Geometry::SnapUnit(month) == doctest::Approx(4));
    CHECK(Geometry::SnapDelta(-7, month) == doctest::Approx(-8));
}

TEST_CASE("Progress width and readback") {
    CHECK(Geometry::ProgressWidth(76, 50) == doctest::Approx(38));
    CHECK(Geometry::ProgressWidth(76, 0) == doctest::Approx(0));
    CHECK(Geometry::ComputeProgress(57, 76) == 75);
    CHECK(Geometry::ComputeProgress(-5, 76) == 0);
    CHECK(Geometry::ComputeProgress(100, 76) == 100);
    CHECK(Geometry::ComputeProgress(10, 0) == 0);

    for (int progress = 0; progress <= 100; ++progress)
        CHECK(Geometry::ComputeProgress(Geometry::ProgressWidth(76, progress), 76) == progress);
}

}
