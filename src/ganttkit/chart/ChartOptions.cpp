#include <ganttkit/chart/ChartOptions.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

namespace GK {

namespace {

std::optional<bool> parse_bool(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    std::string normalized;
    normalized.reserve(text.size());
    std::transform(text.begin(), text.end(), std::back_inserter(normalized), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on") {
        return true;
    }
    if (normalized == "0" || normalized == "false" || normalized == "no" || normalized == "off") {
        return false;
    }
    return std::nullopt;
}

template <typename Setter>
bool apply_env(char const* key, Setter&& setter) {
    if (const char* raw = std::getenv(key)) {
        return setter(std::string_view{raw});
    }
    return true;
}

auto option_error(std::string const& key, char const* expectation) -> Error {
    return Error{Error::Code::InvalidOption, "option '" + key + "' must be " + expectation};
}

auto read_number(nlohmann::json const& object, char const* key, double& target) -> std::optional<Error> {
    auto it = object.find(key);
    if (it == object.end() || it->is_null())
        return std::nullopt;
    if (!it->is_number())
        return option_error(key, "a number");
    target = it->get<double>();
    return std::nullopt;
}

auto read_string(nlohmann::json const& object, char const* key, std::string& target) -> std::optional<Error> {
    auto it = object.find(key);
    if (it == object.end() || it->is_null())
        return std::nullopt;
    if (!it->is_string())
        return option_error(key, "a string");
    target = it->get<std::string>();
    return std::nullopt;
}

auto read_bool(nlohmann::json const& object, char const* key, bool& target) -> std::optional<Error> {
    auto it = object.find(key);
    if (it == object.end() || it->is_null())
        return std::nullopt;
    if (it->is_boolean()) {
        target = it->get<bool>();
        return std::nullopt;
    }
    if (it->is_string()) {
        if (auto parsed = parse_bool(it->get<std::string>())) {
            target = *parsed;
            return std::nullopt;
        }
    }
    return option_error(key, "a boolean");
}

} // namespace

auto ChartOptions::metrics() const -> LayoutMetrics {
    return LayoutMetrics{.header_height     = header_height,
                         .bar_height        = bar_height,
                         .bar_corner_radius = bar_corner_radius,
                         .arrow_curve       = arrow_curve,
                         .padding           = padding};
}

bool IsValidPopupTrigger(std::string_view trigger) {
    return trigger == "click" || trigger == "dblclick" || trigger == "mousedown";
}

auto ParseChartOptions(std::string_view json) -> Expected<ChartOptions> {
    auto object = nlohmann::json::parse(json, nullptr, false);
    if (object.is_discarded())
        return std::unexpected(Error{Error::Code::MalformedInput, "options are not valid JSON"});
    if (!object.is_object())
        return std::unexpected(Error{Error::Code::MalformedInput, "options must be a JSON object"});

    ChartOptions options;

    if (auto it = object.find("view_mode"); it != object.end() && !it->is_null()) {
        if (!it->is_string())
            return std::unexpected(option_error("view_mode", "a string"));
        auto mode = ParseViewMode(it->get<std::string>());
        if (!mode)
            return std::unexpected(mode.error());
        options.view_mode = *mode;
    }

    if (auto it = object.find("view_modes"); it != object.end() && !it->is_null()) {
        if (!it->is_array())
            return std::unexpected(option_error("view_modes", "an array of view mode names"));
        options.view_modes.clear();
        for (auto const& entry : *it) {
            if (!entry.is_string())
                return std::unexpected(option_error("view_modes", "an array of view mode names"));
            auto mode = ParseViewMode(entry.get<std::string>());
            if (!mode)
                return std::unexpected(mode.error());
            options.view_modes.push_back(*mode);
        }
    }

    for (auto const& [key, target] : {std::pair<char const*, double*>{"header_height", &options.header_height},
                                      std::pair<char const*, double*>{"bar_height", &options.bar_height},
                                      std::pair<char const*, double*>{"bar_corner_radius", &options.bar_corner_radius},
                                      std::pair<char const*, double*>{"arrow_curve", &options.arrow_curve},
                                      std::pair<char const*, double*>{"padding", &options.padding}}) {
        if (auto error = read_number(object, key, *target))
            return std::unexpected(*error);
    }

    for (auto const& [key, target] : {std::pair<char const*, std::string*>{"language", &options.language},
                                      std::pair<char const*, std::string*>{"date_format", &options.date_format},
                                      std::pair<char const*, std::string*>{"popup_trigger", &options.popup_trigger},
                                      std::pair<char const*, std::string*>{"custom_popup_html", &options.custom_popup_html}}) {
        if (auto error = read_string(object, key, *target))
            return std::unexpected(*error);
    }

    if (auto error = read_bool(object, "sortable", options.sortable))
        return std::unexpected(*error);

    if (auto invalid = ValidateChartOptions(options))
        return std::unexpected(Error{Error::Code::InvalidOption, *invalid});

    gk_log("Parsed chart options (view mode " + std::string{to_string(options.view_mode)} + ")", "Options");
    return options;
}

auto ValidateChartOptions(ChartOptions const& options) -> std::optional<std::string> {
    if (options.view_modes.empty()) {
        return std::string{"view_modes must not be empty"};
    }
    if (std::find(options.view_modes.begin(), options.view_modes.end(), options.view_mode) == options.view_modes.end()) {
        return "view_mode '" + std::string{to_string(options.view_mode)} + "' is not listed in view_modes";
    }
    if (!(options.bar_height > 0)) {
        return std::string{"bar_height must be > 0"};
    }
    if (!(options.header_height >= 0)) {
        return std::string{"header_height must be >= 0"};
    }
    if (!(options.padding >= 0)) {
        return std::string{"padding must be >= 0"};
    }
    if (!(options.bar_corner_radius >= 0)) {
        return std::string{"bar_corner_radius must be >= 0"};
    }
    if (!(options.arrow_curve >= 0)) {
        return std::string{"arrow_curve must be >= 0"};
    }
    if (options.language.empty()) {
        return std::string{"language must not be empty"};
    }
    if (options.date_format.empty()) {
        return std::string{"date_format must not be empty"};
    }
    if (!IsValidPopupTrigger(options.popup_trigger)) {
        return "Unsupported popup_trigger: " + options.popup_trigger;
    }
    return std::nullopt;
}

bool ApplyChartEnvOverrides(ChartOptions& options) {
    if (!apply_env("GANTTKIT_VIEW_MODE", [&](std::string_view value) {
            auto mode = ParseViewMode(value);
            if (!mode) {
                std::cerr << "GANTTKIT_VIEW_MODE: " << describeError(mode.error()) << "\n";
                return false;
            }
            options.view_mode = *mode;
            if (std::find(options.view_modes.begin(), options.view_modes.end(), *mode) == options.view_modes.end()) {
                options.view_modes.push_back(*mode);
            }
            return true;
        })) {
        return false;
    }

    if (!apply_env("GANTTKIT_LANGUAGE", [&](std::string_view value) {
            if (value.empty()) {
                std::cerr << "GANTTKIT_LANGUAGE must not be empty\n";
                return false;
            }
            if (!Calendar::IsKnownLanguage(value)) {
                gk_log("Unknown language " + std::string{value} + ", month names fall back to en", "Options");
            }
            options.language = std::string{value};
            return true;
        })) {
        return false;
    }

    if (!apply_env("GANTTKIT_SORTABLE", [&](std::string_view value) {
            auto parsed = parse_bool(value);
            if (!parsed.has_value()) {
                std::cerr << "GANTTKIT_SORTABLE must be a boolean (true/false, 1/0, yes/no)\n";
                return false;
            }
            options.sortable = *parsed;
            return true;
        })) {
        return false;
    }

    return true;
}

} // namespace GK
