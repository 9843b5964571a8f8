#include <ganttkit/model/Task.hpp>

namespace GK {

auto to_string(TaskType type) -> std::string_view {
    switch (type) {
    case TaskType::Plain:
        return "plain";
    case TaskType::Project:
        return "project";
    case TaskType::Tag:
        return "tag";
    }
    return "plain";
}

auto ParseTaskType(std::string_view text) -> std::optional<TaskType> {
    if (text.empty() || text == "plain" || text == "task")
        return TaskType::Plain;
    if (text == "project")
        return TaskType::Project;
    if (text == "tag")
        return TaskType::Tag;
    return std::nullopt;
}

auto TaskList::find(std::string_view id) -> Task* {
    for (auto& task : tasks) {
        if (task.id == id)
            return &task;
    }
    return nullptr;
}

auto TaskList::find(std::string_view id) const -> Task const* {
    for (auto const& task : tasks) {
        if (task.id == id)
            return &task;
    }
    return nullptr;
}

auto TaskList::position_of(std::string_view id) const -> std::optional<std::size_t> {
    for (std::size_t i = 0; i < tasks.size(); ++i) {
        if (tasks[i].id == id)
            return i;
    }
    return std::nullopt;
}

} // namespace GK
