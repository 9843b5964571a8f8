#pragma once
#include <ganttkit/core/DateTime.hpp>
#include <ganttkit/model/Task.hpp>

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace GK {

using TaskIdGenerator = std::function<std::string(std::string_view name)>;

struct NormalizeContext {
    DateTime        today = Calendar::Today();
    TaskIdGenerator generate_id;
};

inline constexpr int kDefaultSpanDays      = 2;
inline constexpr int kMaximumSpanYears     = 10;
inline constexpr int kGeneratedIdSuffixLen = 10;

// name + "_" + ten random base-36 characters.
[[nodiscard]] auto GenerateTaskId(std::string_view name) -> std::string;

// Splits "a, b,,c" into {"a", "b", "c"}.
[[nodiscard]] auto SplitDependencies(std::string_view text) -> std::vector<std::string>;

/**
 * Brings every task into canonical form: derives missing or oversized
 * bounds, treats a zero time-of-day end as end of day, cleans dependency
 * lists, assigns ids, and numbers the visible tasks in list order.
 * Running it again over its own output changes nothing.
 */
[[nodiscard]] auto NormalizeTasks(std::vector<Task> tasks, NormalizeContext const& context = {}) -> TaskList;

// Stores a committed [start, end) as supplied bounds that normalize back to it exactly.
auto StoreCommittedRange(Task& task, DateTime start, DateTime end) -> void;

} // namespace GK
