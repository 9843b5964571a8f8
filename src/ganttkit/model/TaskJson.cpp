#include <ganttkit/model/TaskJson.hpp>
#include <ganttkit/model/TaskNormalizer.hpp>

#include <cmath>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

namespace GK {

namespace {

auto optional_string(nlohmann::json const& object, char const* key) -> Expected<std::optional<std::string>> {
    auto it = object.find(key);
    if (it == object.end() || it->is_null())
        return std::optional<std::string>{};
    if (it->is_string())
        return std::optional<std::string>{it->get<std::string>()};
    if (it->is_number_integer())
        return std::optional<std::string>{std::to_string(it->get<long long>())};
    return std::unexpected(Error{Error::Code::TypeMismatch, std::string{"task field '"} + key + "' must be a string"});
}

auto optional_bool(nlohmann::json const& object, char const* key) -> Expected<std::optional<bool>> {
    auto it = object.find(key);
    if (it == object.end() || it->is_null())
        return std::optional<bool>{};
    if (!it->is_boolean())
        return std::unexpected(Error{Error::Code::TypeMismatch, std::string{"task field '"} + key + "' must be a boolean"});
    return std::optional<bool>{it->get<bool>()};
}

auto parse_bound(std::optional<std::string> const& text) -> std::optional<DateTime> {
    if (!text)
        return std::nullopt;
    auto parsed = Calendar::Parse(*text);
    if (!parsed)
        return std::nullopt;
    return *parsed;
}

auto task_from_json(nlohmann::json const& object) -> Expected<Task> {
    if (!object.is_object())
        return std::unexpected(Error{Error::Code::MalformedInput, "task entry must be an object"});

    Task task;

    auto id    = optional_string(object, "id");
    auto name  = optional_string(object, "name");
    auto start = optional_string(object, "start");
    auto end   = optional_string(object, "end");
    for (auto const* field : {&id, &name, &start, &end}) {
        if (!*field)
            return std::unexpected(field->error());
    }
    task.id    = id->value_or(std::string{});
    task.name  = name->value_or(std::string{});
    task.start = parse_bound(*start);
    task.end   = parse_bound(*end);

    if (auto it = object.find("progress"); it != object.end() && !it->is_null()) {
        if (!it->is_number())
            return std::unexpected(Error{Error::Code::TypeMismatch, "task field 'progress' must be a number"});
        task.progress = static_cast<int>(std::lround(it->get<double>()));
    }

    if (auto it = object.find("dependencies"); it != object.end() && !it->is_null()) {
        if (it->is_string()) {
            task.dependencies = SplitDependencies(it->get<std::string>());
        } else if (it->is_array()) {
            for (auto const& entry : *it) {
                if (!entry.is_string())
                    return std::unexpected(Error{Error::Code::TypeMismatch, "dependency entries must be strings"});
                task.dependencies.push_back(entry.get<std::string>());
            }
        } else {
            return std::unexpected(Error{Error::Code::TypeMismatch, "task field 'dependencies' must be a string or array"});
        }
    }

    auto type = optional_string(object, "type");
    if (!type)
        return std::unexpected(type.error());
    if (*type) {
        auto parsed = ParseTaskType(**type);
        if (!parsed)
            return std::unexpected(Error{Error::Code::MalformedInput, "unknown task type: " + **type});
        task.type = *parsed;
    }

    auto visible   = optional_bool(object, "visible");
    auto collapsed = optional_bool(object, "collapsed");
    if (!visible)
        return std::unexpected(visible.error());
    if (!collapsed)
        return std::unexpected(collapsed.error());
    task.visible   = *visible;
    task.collapsed = collapsed->value_or(false);

    auto color       = optional_string(object, "color");
    auto customClass = optional_string(object, "custom_class");
    if (!color)
        return std::unexpected(color.error());
    if (!customClass)
        return std::unexpected(customClass.error());
    task.color        = color->value_or(std::string{});
    task.custom_class = customClass->value_or(std::string{});
    return task;
}

} // namespace

auto ParseTasksJson(std::string_view payload) -> Expected<std::vector<Task>> {
    auto json = nlohmann::json::parse(payload, nullptr, false);
    if (json.is_discarded())
        return std::unexpected(Error{Error::Code::MalformedInput, "invalid task list JSON"});
    if (json.is_object() && json.contains("tasks"))
        json = json["tasks"];
    if (!json.is_array())
        return std::unexpected(Error{Error::Code::MalformedInput, "task list must be an array"});

    std::vector<Task> tasks;
    tasks.reserve(json.size());
    for (std::size_t i = 0; i < json.size(); ++i) {
        auto task = task_from_json(json[i]);
        if (!task) {
            auto error = task.error();
            error.message = "task " + std::to_string(i) + ": " + error.message.value_or("");
            return std::unexpected(std::move(error));
        }
        tasks.push_back(std::move(*task));
    }
    return tasks;
}

auto SerializeTasks(std::vector<Task> const& tasks, int indent) -> std::string {
    auto array = nlohmann::json::array();
    for (auto const& task : tasks) {
        nlohmann::json entry{
            {"id", task.id},
            {"name", task.name},
            {"start_at", Calendar::ToString(task.start_at, true)},
            {"end_at", Calendar::ToString(task.end_at, true)},
            {"progress", task.progress},
            {"dependencies", task.dependencies},
            {"type", std::string{to_string(task.type)}},
            {"collapsed", task.collapsed},
            {"invalid", task.invalid},
        };
        entry["start"] = task.start ? nlohmann::json(Calendar::ToString(*task.start, true)) : nlohmann::json(nullptr);
        entry["end"]   = task.end ? nlohmann::json(Calendar::ToString(*task.end, true)) : nlohmann::json(nullptr);
        if (task.visible)
            entry["visible"] = *task.visible;
        if (task.index)
            entry["index"] = *task.index;
        if (!task.color.empty())
            entry["color"] = task.color;
        if (!task.custom_class.empty())
            entry["custom_class"] = task.custom_class;
        array.push_back(std::move(entry));
    }
    return array.dump(indent);
}

} // namespace GK
