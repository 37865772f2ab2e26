#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include <pipedag/graph.hpp>

#include <algorithm>
#include <random>
#include <string>

using namespace pipedag;

using Nodes = std::vector<std::string>;

TEST_CASE("empty node set is a DAG whatever the edges") {
  auto mode = GENERATE(Traversal::Iterative, Traversal::Recursive);
  REQUIRE(is_acyclic({}, {}, mode));
  REQUIRE(is_acyclic({}, {{"A", "A"}, {"A", "B"}, {"B", "A"}}, mode));
}

TEST_CASE("single node without edges") {
  auto mode = GENERATE(Traversal::Iterative, Traversal::Recursive);
  REQUIRE(is_acyclic({"node-1"}, {}, mode));
}

TEST_CASE("self loop on a known node is a cycle") {
  auto mode = GENERATE(Traversal::Iterative, Traversal::Recursive);
  REQUIRE_FALSE(is_acyclic({"X"}, {{"X", "X"}}, mode));
  REQUIRE_FALSE(is_acyclic({"A", "X"}, {{"A", "X"}, {"X", "X"}}, mode));
}

TEST_CASE("self loop on an unknown node is ignored") {
  auto mode = GENERATE(Traversal::Iterative, Traversal::Recursive);
  REQUIRE(is_acyclic({"A"}, {{"Z", "Z"}}, mode));
}

TEST_CASE("mutual edge pair is a cycle") {
  auto mode = GENERATE(Traversal::Iterative, Traversal::Recursive);
  REQUIRE_FALSE(is_acyclic({"A", "B"}, {{"A", "B"}, {"B", "A"}}, mode));
}

TEST_CASE("chain and longer ring") {
  auto mode = GENERATE(Traversal::Iterative, Traversal::Recursive);
  Nodes n{"A", "B", "C"};
  REQUIRE(is_acyclic(n, {{"A", "B"}, {"B", "C"}}, mode));
  REQUIRE_FALSE(is_acyclic(n, {{"A", "B"}, {"B", "C"}, {"C", "A"}}, mode));
}

TEST_CASE("diamond is a DAG until it is closed") {
  auto mode = GENERATE(Traversal::Iterative, Traversal::Recursive);
  Nodes n{"A", "B", "C", "D"};
  EdgeList e{{"A", "B"}, {"A", "C"}, {"B", "D"}, {"C", "D"}};
  REQUIRE(is_acyclic(n, e, mode));
  e.emplace_back("D", "A");
  REQUIRE_FALSE(is_acyclic(n, e, mode));
}

TEST_CASE("disconnected components") {
  auto mode = GENERATE(Traversal::Iterative, Traversal::Recursive);
  Nodes n{"A", "B", "C", "D", "E", "F"};
  EdgeList e{{"A", "B"}, {"C", "D"}, {"E", "F"}};
  REQUIRE(is_acyclic(n, e, mode));

  e.emplace_back("F", "E");
  REQUIRE_FALSE(is_acyclic(n, e, mode));
}

TEST_CASE("edges to unknown ids never produce a cycle") {
  auto mode = GENERATE(Traversal::Iterative, Traversal::Recursive);
  Nodes n{"A", "B"};
  EdgeList e{{"A", "ghost"}, {"ghost", "A"}, {"B", "ghost"},
             {"ghost", "B"}, {"A", "B"},     {"phantom", "ghost"}};
  REQUIRE(is_acyclic(n, e, mode));

  auto res = check_dag(n, e, mode);
  REQUIRE(res.acyclic);
  REQUIRE(res.resolved_edges == 1);
}

TEST_CASE("multi-edges do not change the verdict") {
  auto mode = GENERATE(Traversal::Iterative, Traversal::Recursive);
  Nodes n{"A", "B", "C"};
  REQUIRE(is_acyclic(n, {{"A", "B"}, {"A", "B"}, {"B", "C"}, {"B", "C"}},
                     mode));
  REQUIRE_FALSE(is_acyclic(n, {{"A", "B"}, {"B", "A"}, {"B", "A"}}, mode));
  REQUIRE(check_dag(n, {{"A", "B"}, {"A", "B"}}, mode).resolved_edges == 2);
}

TEST_CASE("duplicate node ids collapse to one node") {
  auto mode = GENERATE(Traversal::Iterative, Traversal::Recursive);
  Nodes n{"A", "B", "A", "B", "A"};
  REQUIRE(is_acyclic(n, {{"A", "B"}}, mode));
  REQUIRE_FALSE(is_acyclic(n, {{"A", "B"}, {"B", "A"}}, mode));
}

TEST_CASE("validation is idempotent") {
  Nodes n{"A", "B", "C", "D"};
  EdgeList e{{"A", "B"}, {"B", "C"}, {"C", "D"}, {"D", "B"}};
  auto first = check_dag(n, e);
  auto second = check_dag(n, e);
  REQUIRE(first.acyclic == second.acyclic);
  REQUIRE(first.resolved_edges == second.resolved_edges);
  REQUIRE_FALSE(first.acyclic);
}

TEST_CASE("verdict does not depend on node or edge order") {
  Nodes n;
  for (int i = 0; i < 40; ++i)
    n.push_back("n" + std::to_string(i));
  EdgeList dag;
  for (int i = 0; i < 40; ++i)
    for (int j = i + 1; j < 40; j += 7)
      dag.emplace_back(n[i], n[j]);
  EdgeList cyclic = dag;
  cyclic.emplace_back("n39", "n3");

  std::mt19937 rng(1234);
  for (int round = 0; round < 25; ++round) {
    std::shuffle(n.begin(), n.end(), rng);
    std::shuffle(dag.begin(), dag.end(), rng);
    std::shuffle(cyclic.begin(), cyclic.end(), rng);
    for (auto mode : {Traversal::Iterative, Traversal::Recursive}) {
      REQUIRE(is_acyclic(n, dag, mode));
      REQUIRE_FALSE(is_acyclic(n, cyclic, mode));
    }
  }
}

TEST_CASE("both traversals agree on a back edge deep in a component") {
  Nodes n{"r", "a", "b", "c", "d", "x", "y"};
  EdgeList e{{"r", "a"}, {"a", "b"}, {"b", "c"}, {"c", "d"},
             {"r", "x"}, {"x", "y"}, {"y", "d"}, {"d", "b"}};
  REQUIRE(is_acyclic(n, e, Traversal::Iterative) ==
          is_acyclic(n, e, Traversal::Recursive));
  REQUIRE_FALSE(is_acyclic(n, e));
}

TEST_CASE("iterative traversal handles very deep graphs") {
  const int N = 200000;
  Nodes n;
  n.reserve(N);
  EdgeList e;
  e.reserve(N);
  for (int i = 0; i < N; ++i)
    n.push_back(std::to_string(i));
  for (int i = 0; i + 1 < N; ++i)
    e.emplace_back(n[i], n[i + 1]);

  auto chain = check_dag(n, e);
  REQUIRE(chain.acyclic);
  REQUIRE(chain.resolved_edges == static_cast<std::size_t>(N - 1));

  e.emplace_back(n[N - 1], n[0]);
  REQUIRE_FALSE(is_acyclic(n, e));
}

TEST_CASE("recursive mode stays off the call stack for deep graphs") {
  const std::size_t sizes[] = {kRecursionLimit, 150000};
  for (std::size_t N : sizes) {
    Nodes n;
    n.reserve(N);
    EdgeList e;
    for (std::size_t i = 0; i < N; ++i)
      n.push_back("n" + std::to_string(i));
    for (std::size_t i = 0; i + 1 < N; ++i)
      e.emplace_back(n[i], n[i + 1]);

    INFO(N);
    REQUIRE(is_acyclic(n, e, Traversal::Recursive));
    e.emplace_back(n[N - 1], n[0]);
    REQUIRE_FALSE(is_acyclic(n, e, Traversal::Recursive));
  }
}

TEST_CASE("traversal names") {
  REQUIRE(std::string(traversal_name(Traversal::Iterative)) == "iterative");
  REQUIRE(std::string(traversal_name(Traversal::Recursive)) == "recursive");
}
