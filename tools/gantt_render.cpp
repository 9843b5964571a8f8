#include "cli/CommandLine.hpp"

#include <ganttkit/chart/Chart.hpp>
#include <ganttkit/chart/ChartOptions.hpp>
#include <ganttkit/model/TaskJson.hpp>
#include <ganttkit/model/TaskNormalizer.hpp>
#include <ganttkit/render/SvgDocument.hpp>

#include <algorithm>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

namespace {

struct RenderOptions {
    std::filesystem::path                tasksPath;
    std::optional<std::filesystem::path> optionsPath;
    std::optional<std::filesystem::path> outputPath;
    std::optional<GK::ViewMode>          viewMode;
    std::optional<GK::DateTime>          today;
    bool                                 dumpJson = false;
    int                                  indent   = 2;
    bool                                 showHelp = false;
};

void print_usage() {
    std::cout << "Usage: gantt_render --tasks <file> [options]\n"
                 "Options:\n"
                 "  --tasks <file>      JSON task list (array or {\"tasks\": [...]})\n"
                 "  --options <file>    JSON chart options\n"
                 "  --view <mode>       View mode (quarter_day, half_day, day, week, month, year)\n"
                 "  --today <date>      Reference date for tasks without bounds (default: local today)\n"
                 "  --output <file>     Write to file instead of stdout\n"
                 "  --dump-json         Print the normalized tasks as JSON instead of SVG\n"
                 "  --indent <n>        JSON indent for --dump-json (default 2, -1 for compact)\n"
                 "  --help              Show this message\n"
                 "Environment: GANTTKIT_VIEW_MODE, GANTTKIT_LANGUAGE, GANTTKIT_SORTABLE\n";
}

auto parse_cli(int argc, char** argv) -> std::optional<RenderOptions> {
    using GK::Tools::CommandLine;
    RenderOptions options;

    CommandLine cli{"gantt_render"};
    cli.set_error_logger([](std::string const& message) { std::cerr << message << "\n"; });

    auto path_option = [](std::string_view name, auto& target) {
        return CommandLine::ValueOption{.on_value = [name, &target](std::string_view value) -> CommandLine::ParseError {
            if (value.empty()) {
                return std::string{name} + " requires a file";
            }
            target = std::filesystem::path(std::string{value});
            return std::nullopt;
        }};
    };
    cli.add_value("--tasks", path_option("--tasks", options.tasksPath));
    cli.add_value("--options", path_option("--options", options.optionsPath));
    cli.add_value("--output", path_option("--output", options.outputPath));

    cli.add_value("--view", {.on_value = [&](std::string_view value) -> CommandLine::ParseError {
                      auto mode = GK::ParseViewMode(value);
                      if (!mode) {
                          return "--view: " + GK::describeError(mode.error());
                      }
                      options.viewMode = *mode;
                      return std::nullopt;
                  }});
    cli.add_value("--today", {.on_value = [&](std::string_view value) -> CommandLine::ParseError {
                      auto date = GK::Calendar::Parse(value);
                      if (!date) {
                          return "--today: " + GK::describeError(date.error());
                      }
                      options.today = *date;
                      return std::nullopt;
                  }});
    cli.add_value("--indent", {.on_value = [&](std::string_view value) -> CommandLine::ParseError {
                      try {
                          std::size_t consumed = 0;
                          options.indent       = std::stoi(std::string{value}, &consumed);
                          if (consumed != value.size()) {
                              return std::string{"--indent must be numeric"};
                          }
                      } catch (std::exception const&) {
                          return std::string{"--indent must be numeric"};
                      }
                      return std::nullopt;
                  }});

    cli.add_flag("--dump-json", {.on_set = [&] { options.dumpJson = true; }});
    cli.add_flag("--help", {.on_set = [&] { options.showHelp = true; }});
    cli.add_alias("-h", "--help");

    if (!cli.parse(argc, argv)) {
        return std::nullopt;
    }
    if (!options.showHelp && options.tasksPath.empty()) {
        std::cerr << "gantt_render: --tasks is required\n";
        return std::nullopt;
    }
    return options;
}

auto read_file(std::filesystem::path const& path) -> std::optional<std::string> {
    std::ifstream stream(path, std::ios::binary);
    if (!stream.is_open()) {
        std::cerr << "Failed to open '" << path.string() << "'" << std::endl;
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << stream.rdbuf();
    return buffer.str();
}

auto write_output(std::string const& payload, std::optional<std::filesystem::path> const& output) -> bool {
    if (!output) {
        std::cout << payload << std::endl;
        return true;
    }
    if (auto parent = output->parent_path(); !parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            std::cerr << "Failed to create '" << parent.string() << "': " << ec.message() << std::endl;
            return false;
        }
    }
    std::ofstream stream(*output, std::ios::binary);
    if (!stream.is_open()) {
        std::cerr << "Failed to open output file '" << output->string() << "'" << std::endl;
        return false;
    }
    stream << payload;
    if (!stream.good()) {
        std::cerr << "Failed to write output" << std::endl;
        return false;
    }
    return true;
}

auto load_chart_options(RenderOptions const& cliOptions) -> std::optional<GK::ChartOptions> {
    GK::ChartOptions options;
    if (cliOptions.optionsPath) {
        auto payload = read_file(*cliOptions.optionsPath);
        if (!payload) {
            return std::nullopt;
        }
        auto parsed = GK::ParseChartOptions(*payload);
        if (!parsed) {
            std::cerr << "Invalid options: " << GK::describeError(parsed.error()) << std::endl;
            return std::nullopt;
        }
        options = std::move(*parsed);
    }
    if (!GK::ApplyChartEnvOverrides(options)) {
        return std::nullopt;
    }
    if (cliOptions.viewMode) {
        options.view_mode = *cliOptions.viewMode;
        if (std::find(options.view_modes.begin(), options.view_modes.end(), options.view_mode) == options.view_modes.end()) {
            options.view_modes.push_back(options.view_mode);
        }
    }
    if (cliOptions.today) {
        options.today = [today = *cliOptions.today] { return today; };
    }
    if (auto invalid = GK::ValidateChartOptions(options)) {
        std::cerr << "Invalid options: " << *invalid << std::endl;
        return std::nullopt;
    }
    return options;
}

} // namespace

int main(int argc, char** argv) {
    auto cliOptions = parse_cli(argc, argv);
    if (!cliOptions) {
        print_usage();
        return EXIT_FAILURE;
    }
    if (cliOptions->showHelp) {
        print_usage();
        return EXIT_SUCCESS;
    }

    auto payload = read_file(cliOptions->tasksPath);
    if (!payload) {
        return EXIT_FAILURE;
    }
    auto tasks = GK::ParseTasksJson(*payload);
    if (!tasks) {
        std::cerr << "Invalid tasks: " << GK::describeError(tasks.error()) << std::endl;
        return EXIT_FAILURE;
    }

    auto chartOptions = load_chart_options(*cliOptions);
    if (!chartOptions) {
        return EXIT_FAILURE;
    }

    if (cliOptions->dumpJson) {
        GK::NormalizeContext context{.generate_id = chartOptions->id_generator};
        if (chartOptions->today) {
            context.today = chartOptions->today();
        }
        auto normalized = GK::NormalizeTasks(std::move(*tasks), context);
        return write_output(GK::SerializeTasks(normalized.tasks, cliOptions->indent), cliOptions->outputPath) ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    GK::Render::SvgDocument document;
    auto                    chart = GK::Chart::Create(&document, std::move(*tasks), std::move(*chartOptions));
    if (!chart) {
        std::cerr << "Render failed: " << GK::describeError(chart.error()) << std::endl;
        return EXIT_FAILURE;
    }

    if (!write_output(document.serialize(), cliOptions->outputPath)) {
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
