#include <ganttkit/model/TaskNormalizer.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <chrono>
#include <random>

namespace GK {

namespace {

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t'))
        text.remove_prefix(1);
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t'))
        text.remove_suffix(1);
    return text;
}

auto clean_dependencies(std::vector<std::string> const& raw) -> std::vector<std::string> {
    std::vector<std::string> cleaned;
    cleaned.reserve(raw.size());
    for (auto const& entry : raw) {
        auto const id = trim(entry);
        if (id.empty())
            continue;
        if (std::find(cleaned.begin(), cleaned.end(), id) != cleaned.end())
            continue;
        cleaned.emplace_back(id);
    }
    return cleaned;
}

auto normalize_bounds(Task& task, DateTime const& today) -> void {
    if (task.start && task.end && Calendar::Diff(*task.end, *task.start, TimeUnit::Year) > kMaximumSpanYears) {
        gk_log("Task " + task.name + " spans more than ten years, dropping end", "Normalizer");
        task.end.reset();
    }

    task.invalid = !task.start || !task.end;

    if (!task.start && !task.end) {
        task.start_at = today;
        task.end_at   = Calendar::Add(today, kDefaultSpanDays, TimeUnit::Day);
        return;
    }
    if (!task.start) {
        // The start comes from the supplied end, before the end-of-day bump.
        task.start_at = Calendar::Add(*task.end, -kDefaultSpanDays, TimeUnit::Day);
        task.end_at   = task.end->has_zero_time() ? Calendar::Add(*task.end, 24, TimeUnit::Hour) : *task.end;
        return;
    }
    if (!task.end) {
        task.start_at = *task.start;
        task.end_at   = Calendar::Add(*task.start, kDefaultSpanDays, TimeUnit::Day);
        return;
    }

    task.start_at = *task.start;
    // A bare date as end means the whole of that day.
    task.end_at = task.end->has_zero_time() ? Calendar::Add(*task.end, 24, TimeUnit::Hour) : *task.end;
    if (task.end_at <= task.start_at) {
        gk_log("Task " + task.name + " ends before it starts", "Normalizer");
        task.end_at  = Calendar::Add(task.start_at, kDefaultSpanDays, TimeUnit::Day);
        task.invalid = true;
    }
}

} // namespace

auto GenerateTaskId(std::string_view name) -> std::string {
    static constexpr std::string_view kAlphabet = "0123456789abcdefghijklmnopqrstuvwxyz";
    thread_local std::mt19937_64      engine{std::random_device{}()};
    std::uniform_int_distribution<std::size_t> pick(0, kAlphabet.size() - 1);

    std::string id{name};
    id.push_back('_');
    for (int i = 0; i < kGeneratedIdSuffixLen; ++i)
        id.push_back(kAlphabet[pick(engine)]);
    return id;
}

auto SplitDependencies(std::string_view text) -> std::vector<std::string> {
    std::vector<std::string> parts;
    while (true) {
        auto const comma = text.find(',');
        auto const part  = trim(text.substr(0, comma));
        if (!part.empty())
            parts.emplace_back(part);
        if (comma == std::string_view::npos)
            break;
        text.remove_prefix(comma + 1);
    }
    return parts;
}

auto NormalizeTasks(std::vector<Task> tasks, NormalizeContext const& context) -> TaskList {
    TaskList list;
    list.tasks = std::move(tasks);

    for (auto& task : list.tasks) {
        normalize_bounds(task, context.today);
        task.progress     = std::clamp(task.progress, 0, 100);
        task.dependencies = clean_dependencies(task.dependencies);
        if (task.id.empty())
            task.id = context.generate_id ? context.generate_id(task.name) : GenerateTaskId(task.name);
        task.index.reset();
    }

    for (std::size_t i = 0; i < list.tasks.size(); ++i) {
        auto& task = list.tasks[i];
        if (!task.is_visible())
            continue;
        task.index = list.visible.size();
        list.visible.push_back(i);
    }

    gk_log("Normalized " + std::to_string(list.tasks.size()) + " tasks, " + std::to_string(list.visible.size()) + " visible", "Normalizer");
    return list;
}

auto StoreCommittedRange(Task& task, DateTime start, DateTime end) -> void {
    task.start    = start;
    // May precede start; normalization adds the day back.
    task.end      = end.has_zero_time() ? Calendar::Add(end, -24, TimeUnit::Hour) : end;
    task.start_at = start;
    task.end_at   = end;
    task.invalid  = false;
}

} // namespace GK
