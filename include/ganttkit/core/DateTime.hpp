#pragma once
#include <ganttkit/core/Error.hpp>

#include <chrono>
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace GK {

enum class TimeUnit {
    Millisecond,
    Second,
    Minute,
    Hour,
    Day,
    Month,
    Year
};

// Broken-down wall-clock fields. Month is zero-based.
struct DateFields {
    int year        = 1970;
    int month       = 0;
    int day         = 1;
    int hour        = 0;
    int minute      = 0;
    int second      = 0;
    int millisecond = 0;
};

/**
 * Naive local wall-clock instant with millisecond resolution. No timezone or
 * daylight-saving adjustments are applied anywhere, so adding 24 hours always
 * lands on the same time-of-day of the following date.
 */
class DateTime {
public:
    using Duration  = std::chrono::milliseconds;
    using TimePoint = std::chrono::local_time<Duration>;

    DateTime() = default;
    explicit DateTime(TimePoint tp)
        : tp_(tp) {}

    // Component overflow normalizes (month 12 is January of the next year,
    // day 0 is the last day of the previous month).
    [[nodiscard]] static auto FromFields(DateFields const& fields) -> DateTime;
    [[nodiscard]] static auto FromFields(int year, int month, int day, int hour = 0, int minute = 0, int second = 0, int millisecond = 0) -> DateTime;
    [[nodiscard]] static auto FromEpochMilliseconds(std::int64_t ms) -> DateTime;

    [[nodiscard]] auto fields() const -> DateFields;
    [[nodiscard]] auto time_point() const -> TimePoint { return tp_; }
    [[nodiscard]] auto epoch_milliseconds() const -> std::int64_t { return tp_.time_since_epoch().count(); }

    [[nodiscard]] auto year() const -> int { return fields().year; }
    [[nodiscard]] auto month() const -> int { return fields().month; }
    [[nodiscard]] auto day() const -> int { return fields().day; }
    [[nodiscard]] auto hour() const -> int { return fields().hour; }
    [[nodiscard]] auto minute() const -> int { return fields().minute; }
    [[nodiscard]] auto second() const -> int { return fields().second; }
    [[nodiscard]] auto millisecond() const -> int { return fields().millisecond; }
    [[nodiscard]] auto has_zero_time() const -> bool;

    auto operator<=>(DateTime const&) const = default;

    auto operator+(Duration d) const -> DateTime { return DateTime{tp_ + d}; }
    auto operator-(Duration d) const -> DateTime { return DateTime{tp_ - d}; }
    auto operator-(DateTime const& other) const -> Duration { return tp_ - other.tp_; }

private:
    TimePoint tp_{};
};

struct DateRange {
    DateTime start;
    DateTime end;

    auto operator==(DateRange const&) const -> bool = default;
};

namespace Calendar {

inline constexpr std::string_view DefaultFormat = "YYYY-MM-DD HH:mm:ss.SSS";

/**
 * Parses "Y-M-D[ H[:m[:s[.fff]]]]". Month is one-based in text. Each
 * component is read as its leading integer; trailing garbage inside a
 * component is ignored. Missing day defaults to 1.
 */
[[nodiscard]] auto Parse(std::string_view text) -> Expected<DateTime>;
[[nodiscard]] inline auto Parse(DateTime const& value) -> DateTime { return value; }

[[nodiscard]] auto Format(DateTime const& value, std::string_view pattern = DefaultFormat, std::string_view language = "en") -> std::string;
[[nodiscard]] auto ToString(DateTime const& value, bool withTime = false) -> std::string;

// Floor of whole units elapsed from b to a. Months are 30 days, years 360.
[[nodiscard]] auto Diff(DateTime const& a, DateTime const& b, TimeUnit unit = TimeUnit::Day) -> std::int64_t;
[[nodiscard]] auto Add(DateTime const& value, std::int64_t qty, TimeUnit unit) -> DateTime;
[[nodiscard]] auto StartOf(DateTime const& value, TimeUnit unit) -> DateTime;

[[nodiscard]] auto DaysInMonth(DateTime const& value) -> int;
[[nodiscard]] auto DaysInMonth(int year, int month) -> int;
[[nodiscard]] auto IsLeapYear(int year) -> bool;

[[nodiscard]] auto Now() -> DateTime;
[[nodiscard]] auto Today() -> DateTime;

[[nodiscard]] auto MonthName(int month, std::string_view language = "en") -> std::string_view;
[[nodiscard]] auto IsKnownLanguage(std::string_view language) -> bool;
[[nodiscard]] auto ParseTimeUnit(std::string_view text) -> std::optional<TimeUnit>;

} // namespace Calendar

} // namespace GK
