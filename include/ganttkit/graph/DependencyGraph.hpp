#pragma once
#include <ganttkit/model/Task.hpp>

#include <string>
#include <string_view>
#include <vector>

#include <parallel_hashmap/phmap.h>

namespace GK {

/**
 * Forward (dependency -> dependents) and ancestor maps over a task list.
 * Ids referenced as dependencies need not exist as tasks. Traversals are
 * iterative and tolerate cycles.
 */
class DependencyGraph {
public:
    using IdList = std::vector<std::string>;

    DependencyGraph() = default;

    [[nodiscard]] static auto Build(std::vector<Task> const& tasks) -> DependencyGraph;

    // Direct dependents of id, in task-list order.
    [[nodiscard]] auto dependents(std::string_view id) const -> IdList const&;
    [[nodiscard]] auto has_dependents(std::string_view id) const -> bool;

    // Transitive dependents, breadth first, excluding id itself.
    [[nodiscard]] auto descendants(std::string_view id) const -> IdList;
    // Transitive dependencies, breadth first, excluding id itself.
    [[nodiscard]] auto ancestors(std::string_view id) const -> IdList;

    [[nodiscard]] auto edge_count() const -> std::size_t { return edgeCount_; }

private:
    auto traverse(phmap::flat_hash_map<std::string, IdList> const& edges, std::string_view id) const -> IdList;

    phmap::flat_hash_map<std::string, IdList> dependents_;
    phmap::flat_hash_map<std::string, IdList> ancestors_;
    std::size_t                               edgeCount_ = 0;
};

} // namespace GK
