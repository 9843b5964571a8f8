#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <parallel_hashmap/phmap.h>

namespace GK::Tools {

/**
 * Minimal flag parser for the command line tools. Options are registered
 * with a handler; values are taken from the next token or from an
 * attached "--name=value". Handler errors and unknown options are reported
 * through the error logger and make parse() return false.
 */
class CommandLine {
public:
    using ParseError = std::optional<std::string>;

    struct FlagOption {
        std::function<void()> on_set;
    };

    struct ValueOption {
        std::function<ParseError(std::string_view)> on_value;
    };

    explicit CommandLine(std::string_view programName);

    void set_error_logger(std::function<void(std::string const&)> logger);

    void add_flag(std::string_view name, FlagOption option);
    void add_value(std::string_view name, ValueOption option);
    void add_alias(std::string_view alias, std::string_view target);

    [[nodiscard]] bool parse(int argc, char const* const* argv);
    [[nodiscard]] auto errors() const -> std::vector<std::string> const& { return errors_; }

private:
    struct Entry {
        std::string                                  name;
        bool                                         expects_value = false;
        std::function<void()>                        flag_handler;
        std::function<ParseError(std::string_view)> value_handler;
    };

    auto find(std::string_view name) -> Entry*;
    void report(std::string_view message);

    std::string                                          programName_;
    std::vector<Entry>                                   entries_;
    phmap::flat_hash_map<std::string, std::size_t>       lookup_;
    std::function<void(std::string const&)>              errorLogger_;
    std::vector<std::string>                             errors_;
};

} // namespace GK::Tools
