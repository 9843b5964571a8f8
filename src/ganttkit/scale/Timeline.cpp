#include <ganttkit/scale/Timeline.hpp>

#include <map>

namespace GK::Timeline {

namespace {

constexpr double kUpperLabelRise = 25;

auto add_column(DateTime const& date, Scale const& scale) -> DateTime {
    switch (scale.mode) {
    case ViewMode::Year:
        return Calendar::Add(date, 1, TimeUnit::Year);
    case ViewMode::Month:
        return Calendar::Add(date, 1, TimeUnit::Month);
    default:
        return Calendar::Add(date, static_cast<std::int64_t>(scale.step_hours), TimeUnit::Hour);
    }
}

struct LabelText {
    std::string lower;
    std::string upper;
};

auto label_text(DateTime const& date, DateTime const* previous, std::size_t column, ViewMode mode, std::string_view language) -> LabelText {
    auto const f        = date.fields();
    bool const first    = previous == nullptr;
    bool const newDay   = first || f.day != previous->day();
    bool const newMonth = first || f.month != previous->month();
    bool const newYear  = first || f.year != previous->year();
    auto       format   = [&](std::string_view pattern) { return Calendar::Format(date, pattern, language); };

    switch (mode) {
    case ViewMode::QuarterDay:
        return {format("HH"), newDay ? format("D MMM") : std::string{}};
    case ViewMode::HalfDay:
        return {format("HH"), newDay ? format(newMonth ? "D MMM" : "D") : std::string{}};
    case ViewMode::Day:
        return {newDay ? format("D") : std::string{}, newMonth ? format("MMMM") : std::string{}};
    case ViewMode::Week:
        return {format(newMonth ? "D MMM" : "D"),
                newMonth ? format((column < 5 || f.month == 0) ? "MMMM YYYY" : "MMMM") : std::string{}};
    case ViewMode::Month:
        return {format("MMMM"), newYear ? format("YYYY") : std::string{}};
    case ViewMode::Year:
        return {format("YYYY"), newYear ? format("YYYY") : std::string{}};
    }
    return {};
}

} // namespace

auto ComputeRange(std::span<Task const> tasks, ViewMode mode, DateTime const& today) -> DateRange {
    DateTime start = today;
    DateTime end   = today;
    if (!tasks.empty()) {
        start = tasks.front().start_at;
        end   = tasks.front().end_at;
        for (auto const& task : tasks) {
            if (task.start_at < start)
                start = task.start_at;
            if (task.end_at > end)
                end = task.end_at;
        }
    }

    start = Calendar::StartOf(start, TimeUnit::Day);
    end   = Calendar::StartOf(end, TimeUnit::Day);

    switch (mode) {
    case ViewMode::Year:
        start = Calendar::StartOf(Calendar::Add(start, -6, TimeUnit::Year), TimeUnit::Year);
        end   = Calendar::Add(end, 6, TimeUnit::Year);
        break;
    case ViewMode::Month:
        start = Calendar::Add(start, -8, TimeUnit::Month);
        end   = Calendar::Add(end, 8, TimeUnit::Month);
        break;
    default:
        start = Calendar::Add(start, -2, TimeUnit::Month);
        end   = Calendar::Add(end, 2, TimeUnit::Month);
        break;
    }
    return DateRange{.start = start, .end = end};
}

auto ColumnDates(DateRange const& range, Scale const& scale) -> std::vector<DateTime> {
    std::vector<DateTime> dates;
    DateTime              current = range.start;
    dates.push_back(current);
    while (current < range.end) {
        current = add_column(current, scale);
        dates.push_back(current);
    }
    return dates;
}

auto AxisLabels(std::span<DateTime const> dates, Scale const& scale, LayoutMetrics const& metrics, std::string_view language) -> std::vector<AxisLabel> {
    std::map<int, int> monthsPerYear;
    if (scale.mode == ViewMode::Month) {
        for (auto const& date : dates)
            ++monthsPerYear[date.year()];
    }

    auto const cw = scale.column_width;
    std::vector<AxisLabel> labels;
    labels.reserve(dates.size());
    for (std::size_t i = 0; i < dates.size(); ++i) {
        auto const& date     = dates[i];
        auto const* previous = i > 0 ? &dates[i - 1] : nullptr;
        auto        text     = label_text(date, previous, i, scale.mode, language);

        double lowerOffset = 0;
        double upperOffset = 0;
        switch (scale.mode) {
        case ViewMode::QuarterDay:
            upperOffset = cw * 4 / 2;
            break;
        case ViewMode::HalfDay:
            upperOffset = cw * 2 / 2;
            break;
        case ViewMode::Day:
            lowerOffset = cw / 2;
            upperOffset = cw * 30 / 2;
            break;
        case ViewMode::Week:
            upperOffset = cw * 4 / 2;
            break;
        case ViewMode::Month:
            lowerOffset = cw / 2;
            upperOffset = cw * monthsPerYear[date.year()] / 2;
            break;
        case ViewMode::Year:
            lowerOffset = cw / 2;
            upperOffset = cw * 30 / 2;
            break;
        }

        auto const baseX = static_cast<double>(i) * cw;
        labels.push_back(AxisLabel{.date       = date,
                                   .lower_text = std::move(text.lower),
                                   .upper_text = std::move(text.upper),
                                   .lower_x    = baseX + lowerOffset,
                                   .lower_y    = metrics.header_height,
                                   .upper_x    = baseX + upperOffset,
                                   .upper_y    = metrics.header_height - kUpperLabelRise});
    }
    return labels;
}

auto GridTicks(std::span<DateTime const> dates, Scale const& scale) -> std::vector<GridTick> {
    std::vector<GridTick> ticks;
    ticks.reserve(dates.size());
    double x = 0;
    for (auto const& date : dates) {
        auto const f     = date.fields();
        bool       thick = false;
        switch (scale.mode) {
        case ViewMode::Day:
            thick = f.day == 1;
            break;
        case ViewMode::Week:
            thick = f.day >= 1 && f.day < 8;
            break;
        case ViewMode::Month:
            thick = f.month % 3 == 0;
            break;
        default:
            break;
        }
        ticks.push_back(GridTick{.x = x, .thick = thick});
        if (scale.mode == ViewMode::Month)
            x += Calendar::DaysInMonth(f.year, f.month) * scale.column_width / 30;
        else
            x += scale.column_width;
    }
    return ticks;
}

auto ContentWidth(std::span<DateTime const> dates, Scale const& scale) -> double {
    return static_cast<double>(dates.size()) * scale.column_width;
}

auto TodayHighlightX(DateRange const& range, Scale const& scale, DateTime const& today) -> std::optional<double> {
    if (scale.mode != ViewMode::Day)
        return std::nullopt;
    auto const hours = Calendar::Diff(today, range.start, TimeUnit::Hour);
    return static_cast<double>(hours) / scale.step_hours * scale.column_width;
}

} // namespace GK::Timeline
