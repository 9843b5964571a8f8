#pragma once
#include <ganttkit/core/DateTime.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace GK {

enum class TaskType {
    Plain,
    Project,
    Tag
};

[[nodiscard]] auto to_string(TaskType type) -> std::string_view;
[[nodiscard]] auto ParseTaskType(std::string_view text) -> std::optional<TaskType>;

struct Task {
    std::string id;
    std::string name;

    // As supplied. A missing or malformed date is nullopt.
    std::optional<DateTime> start;
    std::optional<DateTime> end;

    // Normalized [start_at, end_at).
    DateTime start_at;
    DateTime end_at;

    int                      progress = 0;
    std::vector<std::string> dependencies;
    TaskType                 type = TaskType::Plain;
    std::optional<bool>      visible;
    bool                     collapsed = false;
    bool                     invalid   = false;

    // Row among visible tasks; unset for hidden ones.
    std::optional<std::size_t> index;

    std::string color;
    std::string custom_class;

    [[nodiscard]] auto is_visible() const -> bool { return visible.value_or(true); }
    [[nodiscard]] auto is_envelope() const -> bool { return type != TaskType::Plain; }
};

struct TaskList {
    std::vector<Task>        tasks;
    std::vector<std::size_t> visible;

    [[nodiscard]] auto find(std::string_view id) -> Task*;
    [[nodiscard]] auto find(std::string_view id) const -> Task const*;
    [[nodiscard]] auto position_of(std::string_view id) const -> std::optional<std::size_t>;
    [[nodiscard]] auto visible_task(std::size_t row) const -> Task const& { return tasks[visible[row]]; }
};

} // namespace GK
