#include <ganttkit/graph/DependencyGraph.hpp>

#include <algorithm>
#include <deque>

namespace GK {

namespace {

auto append_unique(DependencyGraph::IdList& list, std::string const& id) -> void {
    if (std::find(list.begin(), list.end(), id) == list.end())
        list.push_back(id);
}

} // namespace

auto DependencyGraph::Build(std::vector<Task> const& tasks) -> DependencyGraph {
    DependencyGraph graph;
    for (auto const& task : tasks) {
        for (auto const& dependency : task.dependencies) {
            append_unique(graph.dependents_[dependency], task.id);
            ++graph.edgeCount_;
        }
    }

    // Ancestors known so far are folded in as each edge is seen; traversal
    // fills in whatever list order left out.
    for (auto const& task : tasks) {
        for (auto const& dependency : task.dependencies) {
            auto& ancestors = graph.ancestors_[task.id];
            append_unique(ancestors, dependency);
            if (auto it = graph.ancestors_.find(dependency); it != graph.ancestors_.end() && dependency != task.id) {
                auto const inherited = it->second;
                for (auto const& ancestor : inherited)
                    append_unique(graph.ancestors_[task.id], ancestor);
            }
        }
    }
    return graph;
}

auto DependencyGraph::dependents(std::string_view id) const -> IdList const& {
    static IdList const empty;
    auto it = dependents_.find(std::string{id});
    return it == dependents_.end() ? empty : it->second;
}

auto DependencyGraph::has_dependents(std::string_view id) const -> bool {
    return !dependents(id).empty();
}

auto DependencyGraph::descendants(std::string_view id) const -> IdList {
    return traverse(dependents_, id);
}

auto DependencyGraph::ancestors(std::string_view id) const -> IdList {
    return traverse(ancestors_, id);
}

auto DependencyGraph::traverse(phmap::flat_hash_map<std::string, IdList> const& edges, std::string_view id) const -> IdList {
    IdList                           result;
    phmap::flat_hash_set<std::string> seen;
    std::deque<std::string>          queue;

    std::string const origin{id};
    seen.insert(origin);
    queue.push_back(origin);

    while (!queue.empty()) {
        auto const current = std::move(queue.front());
        queue.pop_front();
        auto it = edges.find(current);
        if (it == edges.end())
            continue;
        for (auto const& next : it->second) {
            if (!seen.insert(next).second)
                continue;
            result.push_back(next);
            queue.push_back(next);
        }
    }
    return result;
}

} // namespace GK
