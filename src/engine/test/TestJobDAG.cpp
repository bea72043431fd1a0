#include "JobDAG.hpp"
#include "WorkflowParser.hpp"
#include <algorithm>
#include <cassert>
#include <iostream>
#include <type_traits>

namespace {

bool throws_graph_error(const std::string& yaml) {
    try {
        JobDAG::build_execution_plan(WorkflowParser::parse(yaml));
    } catch (const GraphError&) {
        return true;
    }
    return false;
}

size_t position(const std::vector<std::string>& order, const std::string& id) {
    return static_cast<size_t>(std::find(order.begin(), order.end(), id) - order.begin());
}

} // namespace

// Plans only come out of build_execution_plan, already validated
static_assert(!std::is_constructible<JobDAG, const Workflow&>::value, "JobDAG needs the factory");
static_assert(!std::is_copy_constructible<JobDAG>::value, "JobDAG is not copyable");

void test_diamond_ready_sets() {
    auto dag = JobDAG::build_execution_plan(WorkflowParser::parse(R"(
jobs:
  a:
    steps: [{run: echo a}]
  b:
    needs: a
    steps: [{run: echo b}]
  c:
    needs: a
    steps: [{run: echo c}]
  d:
    needs: [b, c]
    steps: [{run: echo d}]
)"));

    assert(dag->size() == 4);
    assert(dag->ready_set({}) == std::vector<std::string>({"a"}));
    assert(dag->ready_set({"a"}) == std::vector<std::string>({"b", "c"}));
    assert(dag->ready_set({"a", "b"}) == std::vector<std::string>({"c"}));
    assert(dag->ready_set({"a", "b", "c"}) == std::vector<std::string>({"d"}));
    assert(dag->ready_set({"a", "b", "c", "d"}).empty());

    auto deps = dag->dependencies("d");
    std::sort(deps.begin(), deps.end());
    assert(deps == std::vector<std::string>({"b", "c"}));
    assert(dag->dependents("a").size() == 2);

    auto order = dag->topological_order();
    assert(order.size() == 4);
    assert(order.front() == "a" && order.back() == "d");
    std::cout << "test_diamond_ready_sets passed.\n";
}

void test_topological_order_respects_edges() {
    auto dag = JobDAG::build_execution_plan(WorkflowParser::parse(R"(
jobs:
  deploy:
    needs: [test, package]
    steps: [{run: echo deploy}]
  package:
    needs: build
    steps: [{run: echo package}]
  test:
    needs: build
    steps: [{run: echo test}]
  build:
    steps: [{run: echo build}]
)"));

    auto order = dag->topological_order();
    for (const JobInstance* instance : dag->instances()) {
        for (const auto& dep : dag->dependencies(instance->id)) {
            assert(position(order, dep) < position(order, instance->id));
        }
    }
    // Declaration order breaks ties
    assert(position(order, "package") < position(order, "test"));
    std::cout << "test_topological_order_respects_edges passed.\n";
}

void test_unknown_need_and_cycles() {
    assert(throws_graph_error(R"(
jobs:
  a:
    needs: ghost
    steps: [{run: echo a}]
)"));

    assert(throws_graph_error(R"(
jobs:
  a:
    needs: c
    steps: [{run: echo a}]
  b:
    needs: a
    steps: [{run: echo b}]
  c:
    needs: b
    steps: [{run: echo c}]
)"));

    assert(throws_graph_error(R"(
jobs:
  self:
    needs: self
    steps: [{run: echo self}]
)"));

    try {
        JobDAG::build_execution_plan(WorkflowParser::parse(R"(
jobs:
  ok:
    steps: [{run: echo ok}]
  x:
    needs: [ok, y]
    steps: [{run: echo x}]
  y:
    needs: x
    steps: [{run: echo y}]
)"));
        assert(false);
    } catch (const GraphError& e) {
        std::string message = e.what();
        assert(message.find("x") != std::string::npos);
        assert(message.find("y") != std::string::npos);
    }
    std::cout << "test_unknown_need_and_cycles passed.\n";
}

void test_matrix_expansion() {
    MatrixConfig matrix;
    matrix.dimensions = {
        {"os", {"linux", "mac"}},
        {"version", {"1", "2", "3"}}
    };
    matrix.exclude = {{{"os", "mac"}, {"version", "1"}}};
    matrix.include = {
        {{"os", "linux"}, {"version", "3"}, {"experimental", "true"}},
        {{"os", "windows"}, {"version", "3"}}
    };

    auto combinations = JobDAG::expand_matrix(matrix);
    assert(combinations.size() == 6);

    // First dimension varies slowest
    assert(combinations[0].at("os") == "linux" && combinations[0].at("version") == "1");
    assert(combinations[1].at("os") == "linux" && combinations[1].at("version") == "2");
    assert(combinations[2].at("os") == "linux" && combinations[2].at("version") == "3");
    assert(combinations[3].at("os") == "mac" && combinations[3].at("version") == "2");

    // Matching include extends, the other one is appended
    assert(combinations[2].at("experimental") == "true");
    assert(combinations[0].count("experimental") == 0);
    assert(combinations[5].at("os") == "windows");
    std::cout << "test_matrix_expansion passed.\n";
}

void test_matrix_instances_and_edges() {
    auto dag = JobDAG::build_execution_plan(WorkflowParser::parse(R"(
jobs:
  build:
    strategy:
      matrix:
        os: [linux, mac]
        arch: [x64]
        include:
          - os: linux
            arch: x64
            label: lts
    steps: [{run: echo build}]
  publish:
    needs: build
    steps: [{run: echo publish}]
)"));

    assert(dag->size() == 3);
    auto builds = dag->instances_of("build");
    assert(builds.size() == 2);
    assert(builds[0]->id == "build (linux, x64, lts)");
    assert(builds[1]->id == "build (mac, x64)");
    assert(builds[0]->matrix.at("label") == "lts");
    assert(dag->instance("build (mac, x64)").matrix.at("os") == "mac");

    auto deps = dag->dependencies("publish");
    assert(deps.size() == 2);
    assert(dag->ready_set({"build (linux, x64, lts)"}).size() == 1);
    assert(dag->ready_set({"build (linux, x64, lts)", "build (mac, x64)"}) == std::vector<std::string>({"publish"}));

    bool threw = false;
    try {
        dag->instance("build");
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);
    (void)threw;
    std::cout << "test_matrix_instances_and_edges passed.\n";
}

void test_empty_matrix_rejected() {
    assert(throws_graph_error(R"(
jobs:
  build:
    strategy:
      matrix:
        os: [linux]
        exclude:
          - os: linux
    steps: [{run: echo build}]
)"));
    std::cout << "test_empty_matrix_rejected passed.\n";
}

void test_concurrency_group_interpolation() {
    auto dag = JobDAG::build_execution_plan(WorkflowParser::parse(R"(
env:
  STAGE: prod
jobs:
  deploy:
    concurrency: deploy-${{ env.STAGE }}-${{ matrix.region }}
    strategy:
      matrix:
        region: [eu, us]
    steps: [{run: echo deploy}]
  notify:
    steps: [{run: echo notify}]
)"));

    assert(dag->instance("deploy (eu)").concurrency_group == "deploy-prod-eu");
    assert(dag->instance("deploy (us)").concurrency_group == "deploy-prod-us");
    assert(dag->instance("notify").concurrency_group.empty());
    std::cout << "test_concurrency_group_interpolation passed.\n";
}

int main() {
    test_diamond_ready_sets();
    test_topological_order_respects_edges();
    test_unknown_need_and_cycles();
    test_matrix_expansion();
    test_matrix_instances_and_edges();
    test_empty_matrix_rejected();
    test_concurrency_group_interpolation();
    std::cout << "All JobDAG tests passed.\n";
    return 0;
}
