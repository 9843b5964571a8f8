#include <ganttkit/graph/DependencyGraph.hpp>

#include <doctest/doctest.h>

#include <algorithm>
#include <string>
#include <vector>

using namespace GK;

namespace {

auto make_task(std::string id, std::vector<std::string> dependencies = {}) -> Task {
    Task task;
    task.id           = std::move(id);
    task.dependencies = std::move(dependencies);
    return task;
}

auto contains(DependencyGraph::IdList const& list, std::string const& id) -> bool {
    return std::find(list.begin(), list.end(), id) != list.end();
}

} // namespace

TEST_SUITE("graph.dependencies") {

TEST_CASE("Direct dependents follow task list order") {
    auto graph = DependencyGraph::Build({make_task("root"), make_task("b", {"root"}), make_task("a", {"root"}), make_task("c", {"a"})});
    CHECK(graph.dependents("root") == DependencyGraph::IdList{"b", "a"});
    CHECK(graph.dependents("a") == DependencyGraph::IdList{"c"});
    CHECK(graph.dependents("c").empty());
    CHECK(graph.has_dependents("root"));
    CHECK_FALSE(graph.has_dependents("b"));
    CHECK(graph.edge_count() == 3);
}

TEST_CASE("Transitive traversals exclude the origin") {
    auto graph = DependencyGraph::Build({make_task("root"), make_task("a", {"root"}), make_task("b", {"a"}), make_task("c", {"b"})});

    auto descendants = graph.descendants("root");
    CHECK(descendants == DependencyGraph::IdList{"a", "b", "c"});
    CHECK_FALSE(contains(descendants, "root"));

    auto ancestors = graph.ancestors("c");
    CHECK(ancestors.size() == 3);
    CHECK(contains(ancestors, "root"));
    CHECK(contains(ancestors, "a"));
    CHECK(contains(ancestors, "b"));
    CHECK_FALSE(contains(ancestors, "c"));
}

TEST_CASE("Ancestors are complete regardless of list order") {
    auto graph     = DependencyGraph::Build({make_task("c", {"b"}), make_task("b", {"a"}), make_task("a")});
    auto ancestors = graph.ancestors("c");
    CHECK(ancestors.size() == 2);
    CHECK(contains(ancestors, "a"));
    CHECK(contains(ancestors, "b"));
}

TEST_CASE("Cycles terminate") {
    auto graph = DependencyGraph::Build({make_task("a", {"c"}), make_task("b", {"a"}), make_task("c", {"b"})});

    auto descendants = graph.descendants("a");
    CHECK(descendants.size() == 2);
    CHECK(contains(descendants, "b"));
    CHECK(contains(descendants, "c"));

    auto ancestors = graph.ancestors("a");
    CHECK(ancestors.size() == 2);
    CHECK_FALSE(contains(ancestors, "a"));
}

TEST_CASE("Self dependency and unknown ids") {
    auto graph = DependencyGraph::Build({make_task("a", {"a", "ghost"})});
    CHECK(graph.descendants("a").empty());
    CHECK(graph.dependents("ghost") == DependencyGraph::IdList{"a"});
    CHECK(graph.descendants("missing").empty());
    CHECK(graph.ancestors("missing").empty());
}

TEST_CASE("Diamond reaches shared dependents once") {
    auto graph       = DependencyGraph::Build({make_task("top"), make_task("l", {"top"}), make_task("r", {"top"}), make_task("bottom", {"l", "r"})});
    auto descendants = graph.descendants("top");
    CHECK(descendants.size() == 3);
    CHECK(std::count(descendants.begin(), descendants.end(), "bottom") == 1);
}

}
