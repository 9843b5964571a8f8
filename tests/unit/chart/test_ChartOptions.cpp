#include <ganttkit/chart/ChartOptions.hpp>

#include <doctest/doctest.h>

#include <algorithm>
#include <cstdlib>
#include <optional>
#include <string>

using namespace GK;

namespace {

struct EnvGuard {
    explicit EnvGuard(const char* key, const char* value)
        : key_(key) {
        if (const char* existing = std::getenv(key)) {
            original_ = std::string{existing};
        }
        if (value != nullptr) {
            setenv(key, value, 1);
        } else {
            unsetenv(key);
        }
    }

    ~EnvGuard() {
        if (original_.has_value()) {
            setenv(key_.c_str(), original_->c_str(), 1);
        } else {
            unsetenv(key_.c_str());
        }
    }

    std::string                key_;
    std::optional<std::string> original_;
};

auto lists(ChartOptions const& options, ViewMode mode) -> bool {
    return std::find(options.view_modes.begin(), options.view_modes.end(), mode) != options.view_modes.end();
}

} // namespace

TEST_SUITE("chart.options") {

TEST_CASE("Defaults describe the day view") {
    ChartOptions options;
    CHECK(options.view_mode == ViewMode::Day);
    CHECK(options.view_modes.size() == 6);
    CHECK(options.popup_trigger == "click");
    CHECK_FALSE(options.sortable);
    CHECK_FALSE(ValidateChartOptions(options).has_value());

    auto metrics = options.metrics();
    CHECK(metrics.header_height == doctest::Approx(50));
    CHECK(metrics.row_height() == doctest::Approx(38));
}

TEST_CASE("Parses options over the defaults") {
    auto options = ParseChartOptions(R"({
        "view_mode": "Week",
        "view_modes": ["Day", "Week", "Month"],
        "bar_height": 30,
        "padding": 10,
        "language": "de",
        "date_format": "DD.MM.YYYY",
        "sortable": "yes",
        "popup_trigger": "dblclick",
        "custom_popup_html": "<div/>",
        "unknown": 1
    })");
    REQUIRE(options.has_value());
    CHECK(options->view_mode == ViewMode::Week);
    CHECK(options->view_modes.size() == 3);
    CHECK(options->bar_height == doctest::Approx(30));
    CHECK(options->padding == doctest::Approx(10));
    CHECK(options->header_height == doctest::Approx(50));
    CHECK(options->language == "de");
    CHECK(options->date_format == "DD.MM.YYYY");
    CHECK(options->sortable);
    CHECK(options->popup_trigger == "dblclick");
    CHECK(options->custom_popup_html == "<div/>");
}

TEST_CASE("Rejects malformed and invalid options") {
    SUBCASE("Not JSON") {
        auto options = ParseChartOptions("{");
        REQUIRE_FALSE(options.has_value());
        CHECK(options.error().code == Error::Code::MalformedInput);
    }
    SUBCASE("Not an object") {
        auto options = ParseChartOptions("[1, 2]");
        REQUIRE_FALSE(options.has_value());
        CHECK(options.error().code == Error::Code::MalformedInput);
    }
    SUBCASE("Unknown view mode") {
        auto options = ParseChartOptions(R"({"view_mode": "Decade"})");
        REQUIRE_FALSE(options.has_value());
        CHECK(options.error().code == Error::Code::InvalidViewMode);
    }
    SUBCASE("Wrong value type") {
        auto options = ParseChartOptions(R"({"bar_height": "tall"})");
        REQUIRE_FALSE(options.has_value());
        CHECK(options.error().code == Error::Code::InvalidOption);
        CHECK(options.error().message == std::optional<std::string>{"option 'bar_height' must be a number"});
    }
    SUBCASE("Unparseable boolean") {
        auto options = ParseChartOptions(R"({"sortable": "maybe"})");
        REQUIRE_FALSE(options.has_value());
        CHECK(options.error().code == Error::Code::InvalidOption);
    }
    SUBCASE("View mode missing from the list") {
        auto options = ParseChartOptions(R"({"view_mode": "Year", "view_modes": ["Day"]})");
        REQUIRE_FALSE(options.has_value());
        CHECK(options.error().code == Error::Code::InvalidOption);
    }
    SUBCASE("Unsupported popup trigger") {
        auto options = ParseChartOptions(R"({"popup_trigger": "hover"})");
        REQUIRE_FALSE(options.has_value());
        CHECK(options.error().code == Error::Code::InvalidOption);
    }
}

TEST_CASE("Validation guards metrics and names") {
    ChartOptions options;

    options.bar_height = 0;
    CHECK(ValidateChartOptions(options).has_value());
    options.bar_height = 20;

    options.padding = -1;
    CHECK(ValidateChartOptions(options).has_value());
    options.padding = 18;

    options.language.clear();
    CHECK(ValidateChartOptions(options).has_value());
    options.language = "en";

    options.view_modes.clear();
    CHECK(ValidateChartOptions(options).has_value());

    CHECK(IsValidPopupTrigger("mousedown"));
    CHECK_FALSE(IsValidPopupTrigger("hover"));
}

TEST_CASE("Environment overrides") {
    EnvGuard view("GANTTKIT_VIEW_MODE", nullptr);
    EnvGuard language("GANTTKIT_LANGUAGE", nullptr);
    EnvGuard sortable("GANTTKIT_SORTABLE", nullptr);

    SUBCASE("Nothing set keeps the options") {
        ChartOptions options;
        CHECK(ApplyChartEnvOverrides(options));
        CHECK(options.view_mode == ViewMode::Day);
    }
    SUBCASE("View mode is added to the list when missing") {
        EnvGuard     mode("GANTTKIT_VIEW_MODE", "month");
        ChartOptions options;
        options.view_modes = {ViewMode::Day};
        CHECK(ApplyChartEnvOverrides(options));
        CHECK(options.view_mode == ViewMode::Month);
        CHECK(lists(options, ViewMode::Month));
        CHECK_FALSE(ValidateChartOptions(options).has_value());
    }
    SUBCASE("Language and sorting") {
        EnvGuard     lang("GANTTKIT_LANGUAGE", "fr");
        EnvGuard     sort("GANTTKIT_SORTABLE", "on");
        ChartOptions options;
        CHECK(ApplyChartEnvOverrides(options));
        CHECK(options.language == "fr");
        CHECK(options.sortable);
    }
    SUBCASE("Bad values are rejected") {
        ChartOptions options;
        {
            EnvGuard mode("GANTTKIT_VIEW_MODE", "Decade");
            CHECK_FALSE(ApplyChartEnvOverrides(options));
        }
        {
            EnvGuard sort("GANTTKIT_SORTABLE", "perhaps");
            CHECK_FALSE(ApplyChartEnvOverrides(options));
        }
    }
}

}
