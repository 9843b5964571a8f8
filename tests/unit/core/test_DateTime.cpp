#include <ganttkit/core/DateTime.hpp>

#include <doctest/doctest.h>

using namespace GK;

namespace {

auto date(int year, int month, int day, int hour = 0, int minute = 0, int second = 0, int ms = 0) -> DateTime {
    return DateTime::FromFields(year, month - 1, day, hour, minute, second, ms);
}

} // namespace

TEST_SUITE("core.calendar") {

TEST_CASE("Parse reads date and optional time") {
    auto plain = Calendar::Parse("2024-01-10");
    REQUIRE(plain.has_value());
    CHECK(*plain == date(2024, 1, 10));
    CHECK(plain->month() == 0);

    auto withTime = Calendar::Parse("2024-03-05 14:30:15.250");
    REQUIRE(withTime.has_value());
    CHECK(*withTime == date(2024, 3, 5, 14, 30, 15, 250));

    auto hourOnly = Calendar::Parse("2024-03-05 7");
    REQUIRE(hourOnly.has_value());
    CHECK(hourOnly->hour() == 7);
    CHECK(hourOnly->minute() == 0);

    auto noDay = Calendar::Parse("2024-06");
    REQUIRE(noDay.has_value());
    CHECK(*noDay == date(2024, 6, 1));
}

TEST_CASE("Parse normalizes overflowing components") {
    auto overflow = Calendar::Parse("2023-13-01");
    REQUIRE(overflow.has_value());
    CHECK(*overflow == date(2024, 1, 1));

    auto dayOverflow = Calendar::Parse("2024-02-30");
    REQUIRE(dayOverflow.has_value());
    CHECK(*dayOverflow == date(2024, 3, 1));
}

TEST_CASE("Parse rejects years the calendar cannot hold") {
    auto far = Calendar::Parse("99999-01-01");
    REQUIRE_FALSE(far.has_value());
    CHECK(far.error().code == Error::Code::MalformedInput);

    auto last = Calendar::Parse("32767-12-31 23:59");
    REQUIRE(last.has_value());
    CHECK(last->year() == 32767);
    CHECK(last->month() == 11);

    CHECK_FALSE(Calendar::Parse("32767-13-01").has_value());
    CHECK_FALSE(Calendar::Parse("32767-12-32").has_value());
}

TEST_CASE("Parse rejects malformed input") {
    CHECK_FALSE(Calendar::Parse("").has_value());
    CHECK_FALSE(Calendar::Parse("not a date").has_value());
    CHECK_FALSE(Calendar::Parse("2024").has_value());
    auto bad = Calendar::Parse("2024-xx-01");
    REQUIRE_FALSE(bad.has_value());
    CHECK(bad.error().code == Error::Code::MalformedInput);
    CHECK_FALSE(Calendar::Parse("2024-01-01 ab:00").has_value());
}

TEST_CASE("Format replaces tokens longest first") {
    auto value = date(2024, 3, 5, 9, 7, 3, 45);
    CHECK(Calendar::Format(value) == "2024-03-05 09:07:03.045");
    CHECK(Calendar::Format(value, "D MMM") == "05 March");
    CHECK(Calendar::Format(value, "MMMM YYYY") == "March 2024");
    CHECK(Calendar::Format(value, "HH") == "09");
    CHECK(Calendar::Format(value, "MMMM", "de") == "März");
    CHECK(Calendar::Format(value, "MMMM", "xx") == "March");
}

TEST_CASE("Format leaves month names untouched by later tokens") {
    auto december = date(2024, 12, 24);
    CHECK(Calendar::Format(december, "MMMM D") == "December 24");
}

TEST_CASE("ToString with and without time") {
    auto value = date(2024, 1, 2, 3, 4, 5, 6);
    CHECK(Calendar::ToString(value) == "2024-01-02");
    CHECK(Calendar::ToString(value, true) == "2024-01-02 03:04:05.006");
}

TEST_CASE("Diff floors whole units") {
    auto a = date(2024, 1, 10);
    auto b = date(2024, 1, 12, 12);
    CHECK(Calendar::Diff(b, a, TimeUnit::Day) == 2);
    CHECK(Calendar::Diff(b, a, TimeUnit::Hour) == 60);
    CHECK(Calendar::Diff(a, b, TimeUnit::Day) == -3);
    CHECK(Calendar::Diff(date(2024, 3, 1), date(2024, 1, 1), TimeUnit::Month) == 2);
    CHECK(Calendar::Diff(date(2034, 1, 1), date(2024, 1, 1), TimeUnit::Year) == 10);
    CHECK(Calendar::Diff(date(2035, 1, 1), date(2024, 1, 1), TimeUnit::Year) == 11);
}

TEST_CASE("Add works per component with overflow") {
    auto jan31 = date(2024, 1, 31);
    CHECK(Calendar::Add(jan31, 1, TimeUnit::Month) == date(2024, 3, 2));
    CHECK(Calendar::Add(jan31, -2, TimeUnit::Month) == date(2023, 12, 1));
    CHECK(Calendar::Add(jan31, 24, TimeUnit::Hour) == date(2024, 2, 1));
    CHECK(Calendar::Add(jan31, 2, TimeUnit::Day) == date(2024, 2, 2));
    CHECK(Calendar::Add(date(2024, 2, 29), 1, TimeUnit::Year) == date(2025, 3, 1));
    CHECK(Calendar::Add(jan31, -1, TimeUnit::Second) == date(2024, 1, 30, 23, 59, 59));
}

TEST_CASE("StartOf zeroes finer components") {
    auto value = date(2024, 5, 17, 13, 45, 30, 500);
    CHECK(Calendar::StartOf(value, TimeUnit::Day) == date(2024, 5, 17));
    CHECK(Calendar::StartOf(value, TimeUnit::Month) == date(2024, 5, 1));
    CHECK(Calendar::StartOf(value, TimeUnit::Year) == date(2024, 1, 1));
    CHECK(Calendar::StartOf(value, TimeUnit::Hour) == date(2024, 5, 17, 13));
    CHECK(Calendar::StartOf(value, TimeUnit::Millisecond) == value);
}

TEST_CASE("Month lengths and leap years") {
    CHECK(Calendar::DaysInMonth(date(2024, 2, 10)) == 29);
    CHECK(Calendar::DaysInMonth(date(2023, 2, 10)) == 28);
    CHECK(Calendar::DaysInMonth(2024, 11) == 31);
    CHECK(Calendar::DaysInMonth(2024, 3) == 30);
    CHECK(Calendar::IsLeapYear(2000));
    CHECK_FALSE(Calendar::IsLeapYear(1900));
    CHECK(Calendar::IsLeapYear(2024));
    CHECK_FALSE(Calendar::IsLeapYear(2023));
}

TEST_CASE("Zero time detection") {
    CHECK(date(2024, 1, 1).has_zero_time());
    CHECK_FALSE(date(2024, 1, 1, 0, 0, 0, 1).has_zero_time());
    CHECK(Calendar::Today().has_zero_time());
}

TEST_CASE("Month names and time units") {
    CHECK(Calendar::MonthName(0) == "January");
    CHECK(Calendar::MonthName(11, "fr") == "Décembre");
    CHECK(Calendar::MonthName(4, "ptBr") == "Maio");
    CHECK(Calendar::IsKnownLanguage("hu"));
    CHECK_FALSE(Calendar::IsKnownLanguage("klingon"));
    CHECK(Calendar::ParseTimeUnit("hours") == TimeUnit::Hour);
    CHECK(Calendar::ParseTimeUnit("day") == TimeUnit::Day);
    CHECK_FALSE(Calendar::ParseTimeUnit("fortnight").has_value());
}

}
