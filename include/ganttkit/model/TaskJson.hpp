#pragma once
#include <ganttkit/core/Error.hpp>
#include <ganttkit/model/Task.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace GK {

/**
 * Reads an array of task objects. Recognized keys: id, name, start, end,
 * progress, dependencies (comma separated string or array), type, visible,
 * collapsed, color, custom_class. Unparseable start/end text is kept as a
 * missing bound so normalization can flag the task invalid; structural
 * problems (wrong JSON types) are errors.
 */
[[nodiscard]] auto ParseTasksJson(std::string_view payload) -> Expected<std::vector<Task>>;

// Writes supplied bounds as start/end and the normalized ones as start_at/end_at.
[[nodiscard]] auto SerializeTasks(std::vector<Task> const& tasks, int indent = 2) -> std::string;

} // namespace GK
