#include "CommandLine.hpp"

#include <iostream>
#include <utility>

namespace GK::Tools {

CommandLine::CommandLine(std::string_view programName)
    : programName_(programName) {}

void CommandLine::set_error_logger(std::function<void(std::string const&)> logger) {
    errorLogger_ = std::move(logger);
}

void CommandLine::add_flag(std::string_view name, FlagOption option) {
    entries_.push_back(Entry{.name = std::string{name}, .flag_handler = std::move(option.on_set)});
    lookup_.emplace(entries_.back().name, entries_.size() - 1);
}

void CommandLine::add_value(std::string_view name, ValueOption option) {
    entries_.push_back(Entry{.name = std::string{name}, .expects_value = true, .value_handler = std::move(option.on_value)});
    lookup_.emplace(entries_.back().name, entries_.size() - 1);
}

void CommandLine::add_alias(std::string_view alias, std::string_view target) {
    auto it = lookup_.find(std::string{target});
    if (it == lookup_.end()) {
        report("missing option for alias '" + std::string{alias} + "'");
        return;
    }
    lookup_.emplace(std::string{alias}, it->second);
}

bool CommandLine::parse(int argc, char const* const* argv) {
    errors_.clear();
    for (int i = 1; i < argc; ++i) {
        std::string_view                token{argv[i]};
        std::string_view                name = token;
        std::optional<std::string_view> attached;
        if (auto equals = token.find('='); equals != std::string_view::npos) {
            name     = token.substr(0, equals);
            attached = token.substr(equals + 1);
        }

        auto* entry = find(name);
        if (entry == nullptr) {
            report("unknown argument '" + std::string{token} + "'");
            continue;
        }

        if (!entry->expects_value) {
            if (attached) {
                report(entry->name + " does not accept a value");
                continue;
            }
            if (entry->flag_handler) {
                entry->flag_handler();
            }
            continue;
        }

        std::string_view value;
        if (attached) {
            value = *attached;
        } else if (i + 1 < argc) {
            value = argv[++i];
        } else {
            report(entry->name + " requires a value");
            continue;
        }

        if (entry->value_handler) {
            if (auto error = entry->value_handler(value)) {
                report(*error);
            }
        }
    }
    return errors_.empty();
}

auto CommandLine::find(std::string_view name) -> Entry* {
    auto it = lookup_.find(std::string{name});
    if (it == lookup_.end()) {
        return nullptr;
    }
    return &entries_[it->second];
}

void CommandLine::report(std::string_view message) {
    std::string text = programName_;
    text.append(": ");
    text.append(message.begin(), message.end());
    errors_.push_back(text);
    if (errorLogger_) {
        errorLogger_(text);
    } else {
        std::cerr << text << '\n';
    }
}

} // namespace GK::Tools
