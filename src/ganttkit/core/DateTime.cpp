#include <ganttkit/core/DateTime.hpp>

#include <array>
#include <cmath>
#include <ctime>
#include <string>
#include <utility>
#include <vector>

namespace GK {

namespace {

using namespace std::chrono;

constexpr std::array<std::string_view, 10> kLanguages{"en", "es", "it", "ru", "ptBr", "fr", "tr", "zh", "de", "hu"};

constexpr std::array<std::array<std::string_view, 12>, 10> kMonthNames{{
    {"January", "February", "March", "April", "May", "June", "July", "August", "September", "October", "November", "December"},
    {"Enero", "Febrero", "Marzo", "Abril", "Mayo", "Junio", "Julio", "Agosto", "Septiembre", "Octubre", "Noviembre", "Diciembre"},
    {"Gennaio", "Febbraio", "Marzo", "Aprile", "Maggio", "Giugno", "Luglio", "Agosto", "Settembre", "Ottobre", "Novembre", "Dicembre"},
    {"Январь", "Февраль", "Март", "Апрель", "Май", "Июнь", "Июль", "Август", "Сентябрь", "Октябрь", "Ноябрь", "Декабрь"},
    {"Janeiro", "Fevereiro", "Março", "Abril", "Maio", "Junho", "Julho", "Agosto", "Setembro", "Outubro", "Novembro", "Dezembro"},
    {"Janvier", "Février", "Mars", "Avril", "Mai", "Juin", "Juillet", "Août", "Septembre", "Octobre", "Novembre", "Décembre"},
    {"Ocak", "Şubat", "Mart", "Nisan", "Mayıs", "Haziran", "Temmuz", "Ağustos", "Eylül", "Ekim", "Kasım", "Aralık"},
    {"一月", "二月", "三月", "四月", "五月", "六月", "七月", "八月", "九月", "十月", "十一月", "十二月"},
    {"Januar", "Februar", "März", "April", "Mai", "Juni", "Juli", "August", "September", "Oktober", "November", "Dezember"},
    {"Január", "Február", "Március", "Április", "Május", "Június", "Július", "Augusztus", "Szeptember", "Október", "November", "December"},
}};

// Range of std::chrono::year.
constexpr std::int64_t kMinYear = -32767;
constexpr std::int64_t kMaxYear = 32767;

auto floor_div(std::int64_t value, std::int64_t divisor) -> std::int64_t {
    auto q = value / divisor;
    if ((value % divisor != 0) && ((value < 0) != (divisor < 0)))
        --q;
    return q;
}

auto language_index(std::string_view language) -> std::size_t {
    for (std::size_t i = 0; i < kLanguages.size(); ++i) {
        if (kLanguages[i] == language)
            return i;
    }
    return 0;
}

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t' || text.front() == '\n' || text.front() == '\r'))
        text.remove_prefix(1);
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t' || text.back() == '\n' || text.back() == '\r'))
        text.remove_suffix(1);
    return text;
}

// Reads the leading integer of a component; anything after the digits is ignored.
auto parse_leading_int(std::string_view text) -> std::optional<int> {
    std::size_t pos = 0;
    while (pos < text.size() && text[pos] == ' ')
        ++pos;
    bool negative = false;
    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        negative = text[pos] == '-';
        ++pos;
    }
    std::size_t const digitsStart = pos;
    std::int64_t      value       = 0;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
        value = value * 10 + (text[pos] - '0');
        if (value > 1'000'000'000)
            return std::nullopt;
        ++pos;
    }
    if (pos == digitsStart)
        return std::nullopt;
    return static_cast<int>(negative ? -value : value);
}

// Time components must be entirely numeric; an empty component counts as zero.
auto parse_time_component(std::string_view text) -> std::optional<int> {
    if (text.empty())
        return 0;
    int value = 0;
    for (char ch : text) {
        if (ch < '0' || ch > '9')
            return std::nullopt;
        value = value * 10 + (ch - '0');
        if (value > 1'000'000)
            return std::nullopt;
    }
    return value;
}

auto parse_fraction_ms(std::string_view text) -> std::optional<int> {
    int value  = 0;
    int digits = 0;
    for (char ch : text) {
        if (ch < '0' || ch > '9')
            break;
        if (digits < 3) {
            value = value * 10 + (ch - '0');
            ++digits;
        }
    }
    while (digits < 3) {
        value *= 10;
        ++digits;
    }
    return value;
}

auto split(std::string_view text, auto isSeparator) -> std::vector<std::string_view> {
    std::vector<std::string_view> parts;
    std::size_t                   begin = 0;
    for (std::size_t i = 0; i <= text.size(); ++i) {
        if (i == text.size() || isSeparator(text[i])) {
            parts.push_back(text.substr(begin, i - begin));
            begin = i + 1;
        }
    }
    return parts;
}

auto pad(long long value, std::size_t width) -> std::string {
    auto digits = std::to_string(value < 0 ? -value : value);
    if (digits.size() < width)
        digits.insert(0, width - digits.size(), '0');
    if (value < 0)
        digits.insert(digits.begin(), '-');
    return digits;
}

auto placeholder(std::size_t index) -> std::string {
    return std::string{'\x1f', static_cast<char>('0' + index), '\x1f'};
}

} // namespace

auto DateTime::FromFields(DateFields const& f) -> DateTime {
    auto const yearCarry = floor_div(f.month, 12);
    auto const month     = static_cast<unsigned>(f.month - yearCarry * 12);
    auto const ymd       = year_month_day{std::chrono::year{static_cast<int>(f.year + yearCarry)}, std::chrono::month{month + 1}, std::chrono::day{1}};
    auto const days      = local_days{ymd} + std::chrono::days{f.day - 1};
    auto       tp        = time_point_cast<Duration>(days);
    tp += hours{f.hour} + minutes{f.minute} + seconds{f.second} + milliseconds{f.millisecond};
    return DateTime{tp};
}

auto DateTime::FromFields(int year, int month, int day, int hour, int minute, int second, int millisecond) -> DateTime {
    return FromFields(DateFields{.year = year, .month = month, .day = day, .hour = hour, .minute = minute, .second = second, .millisecond = millisecond});
}

auto DateTime::FromEpochMilliseconds(std::int64_t ms) -> DateTime {
    return DateTime{TimePoint{Duration{ms}}};
}

auto DateTime::fields() const -> DateFields {
    auto const dayPoint = std::chrono::floor<std::chrono::days>(tp_);
    auto const ymd      = year_month_day{dayPoint};
    auto const hms      = hh_mm_ss<Duration>{tp_ - dayPoint};
    return DateFields{.year        = static_cast<int>(ymd.year()),
                      .month       = static_cast<int>(static_cast<unsigned>(ymd.month())) - 1,
                      .day         = static_cast<int>(static_cast<unsigned>(ymd.day())),
                      .hour        = static_cast<int>(hms.hours().count()),
                      .minute      = static_cast<int>(hms.minutes().count()),
                      .second      = static_cast<int>(hms.seconds().count()),
                      .millisecond = static_cast<int>(hms.subseconds().count())};
}

auto DateTime::has_zero_time() const -> bool {
    return tp_ == time_point_cast<Duration>(std::chrono::floor<std::chrono::days>(tp_));
}

namespace Calendar {

auto Parse(std::string_view text) -> Expected<DateTime> {
    auto const trimmed = trim(text);
    if (trimmed.empty())
        return std::unexpected(Error{Error::Code::MalformedInput, "empty date"});

    auto const space    = trimmed.find(' ');
    auto const datePart = trimmed.substr(0, space);
    auto       timePart = space == std::string_view::npos ? std::string_view{} : trim(trimmed.substr(space + 1));
    if (auto const nextSpace = timePart.find(' '); nextSpace != std::string_view::npos)
        timePart = timePart.substr(0, nextSpace);

    auto const dateParts = split(datePart, [](char ch) { return ch == '-'; });
    if (dateParts.size() < 2 || dateParts.size() > 3)
        return std::unexpected(Error{Error::Code::MalformedInput, "date must be Y-M or Y-M-D: " + std::string{text}});

    DateFields fields;
    auto const yearValue  = parse_leading_int(dateParts[0]);
    auto const monthValue = parse_leading_int(dateParts[1]);
    if (!yearValue || !monthValue)
        return std::unexpected(Error{Error::Code::MalformedInput, "date component is not a number: " + std::string{text}});
    fields.year  = *yearValue;
    fields.month = *monthValue - 1;
    if (auto const carried = static_cast<std::int64_t>(fields.year) + floor_div(fields.month, 12); carried < kMinYear || carried > kMaxYear)
        return std::unexpected(Error{Error::Code::MalformedInput, "year out of range: " + std::string{text}});
    if (dateParts.size() == 3) {
        auto const dayValue = parse_leading_int(dateParts[2]);
        if (!dayValue)
            return std::unexpected(Error{Error::Code::MalformedInput, "day is not a number: " + std::string{text}});
        fields.day = *dayValue;
    }

    if (!timePart.empty()) {
        auto const timeParts = split(timePart, [](char ch) { return ch == ':' || ch == '.'; });
        if (timeParts.size() > 4)
            return std::unexpected(Error{Error::Code::MalformedInput, "too many time components: " + std::string{text}});
        std::array<int*, 3> targets{&fields.hour, &fields.minute, &fields.second};
        for (std::size_t i = 0; i < timeParts.size(); ++i) {
            if (i == 3) {
                fields.millisecond = *parse_fraction_ms(timeParts[i]);
                continue;
            }
            auto const value = parse_time_component(timeParts[i]);
            if (!value)
                return std::unexpected(Error{Error::Code::MalformedInput, "time component is not a number: " + std::string{text}});
            *targets[i] = *value;
        }
    }

    auto const result = DateTime::FromFields(fields);
    // Day and time overflow can still carry the instant past the last representable year.
    if (result < DateTime::FromFields(static_cast<int>(kMinYear), 0, 1) || result > DateTime::FromFields(static_cast<int>(kMaxYear), 11, 31, 23, 59, 59, 999))
        return std::unexpected(Error{Error::Code::MalformedInput, "date out of range: " + std::string{text}});
    return result;
}

auto Format(DateTime const& value, std::string_view pattern, std::string_view language) -> std::string {
    auto const f = value.fields();

    // Longest token first; each token replaces its first occurrence only.
    std::array<std::pair<std::string_view, std::string>, 10> const tokens{{
        {"YYYY", pad(f.year, 2)},
        {"MMMM", std::string{MonthName(f.month, language)}},
        {"SSS", pad(f.millisecond, 3)},
        {"MMM", std::string{MonthName(f.month, language)}},
        {"MM", pad(f.month + 1, 2)},
        {"DD", pad(f.day, 2)},
        {"HH", pad(f.hour, 2)},
        {"mm", pad(f.minute, 2)},
        {"ss", pad(f.second, 2)},
        {"D", pad(f.day, 2)},
    }};

    std::string              result{pattern};
    std::vector<std::string> values;
    for (auto const& [key, text] : tokens) {
        auto const pos = result.find(key);
        if (pos == std::string::npos)
            continue;
        result.replace(pos, key.size(), placeholder(values.size()));
        values.push_back(text);
    }
    for (std::size_t i = 0; i < values.size(); ++i) {
        auto const marker = placeholder(i);
        auto const pos    = result.find(marker);
        if (pos != std::string::npos)
            result.replace(pos, marker.size(), values[i]);
    }
    return result;
}

auto ToString(DateTime const& value, bool withTime) -> std::string {
    auto const  f    = value.fields();
    std::string text = pad(f.year, 2) + '-' + pad(f.month + 1, 2) + '-' + pad(f.day, 2);
    if (withTime) {
        text += ' ' + pad(f.hour, 2) + ':' + pad(f.minute, 2) + ':' + pad(f.second, 2) + '.' + pad(f.millisecond, 3);
    }
    return text;
}

auto Diff(DateTime const& a, DateTime const& b, TimeUnit unit) -> std::int64_t {
    double const ms      = static_cast<double>((a - b).count());
    double const secs    = ms / 1000;
    double const minutes = secs / 60;
    double const hours   = minutes / 60;
    double const days    = hours / 24;
    double const months  = days / 30;
    double const years   = months / 12;

    double value = days;
    switch (unit) {
    case TimeUnit::Millisecond:
        value = ms;
        break;
    case TimeUnit::Second:
        value = secs;
        break;
    case TimeUnit::Minute:
        value = minutes;
        break;
    case TimeUnit::Hour:
        value = hours;
        break;
    case TimeUnit::Day:
        value = days;
        break;
    case TimeUnit::Month:
        value = months;
        break;
    case TimeUnit::Year:
        value = years;
        break;
    }
    return static_cast<std::int64_t>(std::floor(value));
}

auto Add(DateTime const& value, std::int64_t qty, TimeUnit unit) -> DateTime {
    switch (unit) {
    case TimeUnit::Millisecond:
        return value + milliseconds{qty};
    case TimeUnit::Second:
        return value + duration_cast<milliseconds>(seconds{qty});
    case TimeUnit::Minute:
        return value + duration_cast<milliseconds>(minutes{qty});
    case TimeUnit::Hour:
        return value + duration_cast<milliseconds>(hours{qty});
    case TimeUnit::Day:
        return value + duration_cast<milliseconds>(std::chrono::days{qty});
    case TimeUnit::Month: {
        auto f = value.fields();
        f.month += static_cast<int>(qty);
        return DateTime::FromFields(f);
    }
    case TimeUnit::Year: {
        auto f = value.fields();
        f.year += static_cast<int>(qty);
        return DateTime::FromFields(f);
    }
    }
    return value;
}

auto StartOf(DateTime const& value, TimeUnit unit) -> DateTime {
    auto f = value.fields();
    switch (unit) {
    case TimeUnit::Year:
        f.month = 0;
        [[fallthrough]];
    case TimeUnit::Month:
        f.day = 1;
        [[fallthrough]];
    case TimeUnit::Day:
        f.hour = 0;
        [[fallthrough]];
    case TimeUnit::Hour:
        f.minute = 0;
        [[fallthrough]];
    case TimeUnit::Minute:
        f.second = 0;
        [[fallthrough]];
    case TimeUnit::Second:
        f.millisecond = 0;
        [[fallthrough]];
    case TimeUnit::Millisecond:
        break;
    }
    return DateTime::FromFields(f);
}

auto DaysInMonth(int yearValue, int monthValue) -> int {
    auto const yearCarry = floor_div(monthValue, 12);
    auto const month     = static_cast<unsigned>(monthValue - yearCarry * 12);
    auto const last      = year_month_day_last{year{static_cast<int>(yearValue + yearCarry)}, month_day_last{std::chrono::month{month + 1}}};
    return static_cast<int>(static_cast<unsigned>(last.day()));
}

auto DaysInMonth(DateTime const& value) -> int {
    auto const f = value.fields();
    return DaysInMonth(f.year, f.month);
}

auto IsLeapYear(int yearValue) -> bool {
    return year{yearValue}.is_leap();
}

auto Now() -> DateTime {
    auto const  now     = system_clock::now();
    auto const  seconds = time_point_cast<std::chrono::seconds>(now);
    auto const  millis  = duration_cast<milliseconds>(now - seconds);
    std::time_t raw     = system_clock::to_time_t(seconds);
    std::tm     tm{};
    if (localtime_r(&raw, &tm) == nullptr)
        return DateTime::FromEpochMilliseconds(duration_cast<milliseconds>(now.time_since_epoch()).count());
    return DateTime::FromFields(tm.tm_year + 1900, tm.tm_mon, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(millis.count()));
}

auto Today() -> DateTime {
    return StartOf(Now(), TimeUnit::Day);
}

auto MonthName(int month, std::string_view language) -> std::string_view {
    auto const normalized = static_cast<std::size_t>(month - floor_div(month, 12) * 12);
    return kMonthNames[language_index(language)][normalized];
}

auto IsKnownLanguage(std::string_view language) -> bool {
    for (auto const& known : kLanguages) {
        if (known == language)
            return true;
    }
    return false;
}

auto ParseTimeUnit(std::string_view text) -> std::optional<TimeUnit> {
    if (text.ends_with('s'))
        text.remove_suffix(1);
    if (text == "millisecond")
        return TimeUnit::Millisecond;
    if (text == "second")
        return TimeUnit::Second;
    if (text == "minute")
        return TimeUnit::Minute;
    if (text == "hour")
        return TimeUnit::Hour;
    if (text == "day")
        return TimeUnit::Day;
    if (text == "month")
        return TimeUnit::Month;
    if (text == "year")
        return TimeUnit::Year;
    return std::nullopt;
}

} // namespace Calendar

} // namespace GK
