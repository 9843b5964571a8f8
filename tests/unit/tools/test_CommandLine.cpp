#include <doctest/doctest.h>

#include "cli/CommandLine.hpp"

#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {
auto make_argv(std::initializer_list<const char*> list) {
    return std::vector<const char*>(list);
}
}

TEST_CASE("CommandLine parses flags and values") {
    GK::Tools::CommandLine cli{"gantt_render_test"};

    bool        dump = false;
    std::string tasks;
    std::string view;
    cli.add_flag("--dump-json", {.on_set = [&] { dump = true; }});
    cli.add_value("--tasks", {.on_value = [&](std::string_view value) -> GK::Tools::CommandLine::ParseError {
                      tasks = std::string{value};
                      return std::nullopt;
                  }});
    cli.add_value("--view", {.on_value = [&](std::string_view value) -> GK::Tools::CommandLine::ParseError {
                      view = std::string{value};
                      return std::nullopt;
                  }});

    auto argv = make_argv({"prog", "--dump-json", "--tasks", "plan.json", "--view=Week"});
    CHECK(cli.parse(static_cast<int>(argv.size()), argv.data()));
    CHECK(dump);
    CHECK(tasks == "plan.json");
    CHECK(view == "Week");
    CHECK(cli.errors().empty());
}

TEST_CASE("CommandLine aliases resolve to their target") {
    GK::Tools::CommandLine cli{"gantt_render_test"};
    int                    helpCount = 0;
    cli.add_flag("--help", {.on_set = [&] { ++helpCount; }});
    cli.add_alias("-h", "--help");

    auto argv = make_argv({"prog", "-h", "--help"});
    CHECK(cli.parse(static_cast<int>(argv.size()), argv.data()));
    CHECK(helpCount == 2);
}

TEST_CASE("CommandLine reports malformed arguments") {
    GK::Tools::CommandLine   cli{"gantt_render_test"};
    std::vector<std::string> logged;
    cli.set_error_logger([&](std::string const& message) { logged.push_back(message); });
    cli.add_flag("--dump-json", {});
    cli.add_value("--indent", {.on_value = [](std::string_view value) -> GK::Tools::CommandLine::ParseError {
                      if (value.empty() || value.find_first_not_of("0123456789") != std::string_view::npos)
                          return std::string{"--indent expects a non-negative integer"};
                      return std::nullopt;
                  }});
    cli.add_value("--output", {});

    SUBCASE("Unknown argument") {
        auto argv = make_argv({"prog", "--bogus"});
        CHECK_FALSE(cli.parse(static_cast<int>(argv.size()), argv.data()));
        REQUIRE(logged.size() == 1);
        CHECK(logged[0] == "gantt_render_test: unknown argument '--bogus'");
    }
    SUBCASE("Flag given a value") {
        auto argv = make_argv({"prog", "--dump-json=yes"});
        CHECK_FALSE(cli.parse(static_cast<int>(argv.size()), argv.data()));
        CHECK(cli.errors() == std::vector<std::string>{"gantt_render_test: --dump-json does not accept a value"});
    }
    SUBCASE("Missing value") {
        auto argv = make_argv({"prog", "--output"});
        CHECK_FALSE(cli.parse(static_cast<int>(argv.size()), argv.data()));
        CHECK(cli.errors() == std::vector<std::string>{"gantt_render_test: --output requires a value"});
    }
    SUBCASE("Handler rejects the value") {
        auto argv = make_argv({"prog", "--indent", "two"});
        CHECK_FALSE(cli.parse(static_cast<int>(argv.size()), argv.data()));
        CHECK(cli.errors() == std::vector<std::string>{"gantt_render_test: --indent expects a non-negative integer"});
    }
    SUBCASE("Errors are collected rather than stopping the parse") {
        auto argv = make_argv({"prog", "--bogus", "--indent=x", "--dump-json"});
        CHECK_FALSE(cli.parse(static_cast<int>(argv.size()), argv.data()));
        CHECK(cli.errors().size() == 2);
    }
}
