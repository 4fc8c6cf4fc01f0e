#include <gtest/gtest.h>
#include <graph_loaders/graph_generator.hpp>
#include <traversal/engine.hpp>
#include <traversal/strategies.hpp>
#include "test_graphs.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <set>
#include <string>
#include <vector>

using traversal::AlgorithmResult;
using traversal::NodePath;
using traversal::PathStep;
using traversal::Strategy;

namespace {

const std::vector<Strategy> kAllStrategies = {
    Strategy::Dijkstra, Strategy::AStar, Strategy::Bfs, Strategy::Dfs
};

std::vector<PathStep> step_manually(Strategy strategy, const graph_model::Graph& g,
    const std::string& start, const std::string& end)
{
    auto engine = traversal::make_engine(strategy);
    engine->init(g, start, end);
    std::vector<PathStep> steps;
    while (auto s = engine->step())
        steps.push_back(std::move(*s));
    return steps;
}

// Bellman-Ford reference distances for undirected positive weights.
double reference_distance(const graph_model::Graph& g, const std::string& start, const std::string& end) {
    const double inf = std::numeric_limits<double>::infinity();
    std::map<std::string, double> dist;
    for (const auto& n : g.nodes) dist[n.id] = inf;
    dist[start] = 0;
    for (std::size_t round = 0; round < g.nodes.size(); ++round) {
        bool changed = false;
        for (const auto& e : g.edges) {
            if (dist[e.from] + e.weight < dist[e.to]) { dist[e.to] = dist[e.from] + e.weight; changed = true; }
            if (dist[e.to] + e.weight < dist[e.from]) { dist[e.from] = dist[e.to] + e.weight; changed = true; }
        }
        if (!changed) break;
    }
    return dist[end];
}

} // namespace

// ============== Concrete scenarios ==============

TEST(TraversalEngineTest, Dijkstra_TriangleTakesCheaperTwoHopPath) {
    AlgorithmResult r = traversal::run(Strategy::Dijkstra, test_graphs::triangle(), "a", "c");

    EXPECT_EQ(r.path, (NodePath{ "a", "b", "c" }));
    EXPECT_DOUBLE_EQ(r.distance, 2.0);
    ASSERT_FALSE(r.steps.empty());
    EXPECT_TRUE(r.steps.back().is_complete);
    EXPECT_EQ(r.steps.back().current_node, "c");
}

TEST(TraversalEngineTest, AStar_TriangleMatchesDijkstra) {
    AlgorithmResult r = traversal::run(Strategy::AStar, test_graphs::triangle(), "a", "c");
    EXPECT_EQ(r.path, (NodePath{ "a", "b", "c" }));
    EXPECT_DOUBLE_EQ(r.distance, 2.0);
}

TEST(TraversalEngineTest, Bfs_TriangleIgnoresWeights) {
    AlgorithmResult r = traversal::run(Strategy::Bfs, test_graphs::triangle(), "a", "c");
    EXPECT_EQ(r.path, (NodePath{ "a", "c" }));
    EXPECT_DOUBLE_EQ(r.distance, 5.0);
}

TEST(TraversalEngineTest, DisconnectedTarget_AllStrategiesReturnEmptyPath) {
    const auto g = test_graphs::disconnected();
    for (Strategy s : kAllStrategies) {
        SCOPED_TRACE(traversal::to_string(s));
        AlgorithmResult r = traversal::run(s, g, "start", "end");

        EXPECT_TRUE(r.path.empty());
        EXPECT_TRUE(std::isinf(r.distance));
        EXPECT_EQ(r.visited_nodes.count("end"), 0u);
        EXPECT_EQ(r.visited_nodes, (traversal::VisitedSet{ "start", "x" }));
        for (const auto& step : r.steps) EXPECT_FALSE(step.is_complete);
    }
}

// ============== Batch / incremental equivalence ==============

TEST(TraversalEngineTest, RunToCompletion_EqualsManualStepping) {
    const std::vector<graph_model::Graph> graphs = {
        test_graphs::triangle(),
        test_graphs::disconnected(),
        graph_loaders::generate_demo_graph(),
        graph_loaders::generate_random_graph(30, 0.15, 7),
        graph_loaders::generate_grid_graph(5, 6, 3),
    };
    for (const auto& g : graphs) {
        const std::string start = g.nodes.front().id;
        const std::string end = g.nodes.back().id;
        for (Strategy s : kAllStrategies) {
            SCOPED_TRACE(std::string(traversal::to_string(s)) + " on " + g.name);
            AlgorithmResult batch = traversal::run(s, g, start, end);
            std::vector<PathStep> manual = step_manually(s, g, start, end);
            EXPECT_EQ(batch.steps, manual);
        }
    }
}

TEST(TraversalEngineTest, RunToCompletion_AfterPartialSteppingCollectsRemainder) {
    const auto g = graph_loaders::generate_demo_graph();
    AlgorithmResult full = traversal::run(Strategy::Dijkstra, g, "node-0", "node-7");
    ASSERT_GT(full.steps.size(), 2u);

    auto engine = traversal::make_engine(Strategy::Dijkstra);
    engine->init(g, "node-0", "node-7");
    auto first = engine->step();
    auto second = engine->step();
    ASSERT_TRUE(first && second);
    AlgorithmResult rest = engine->run_to_completion();

    ASSERT_EQ(rest.steps.size() + 2, full.steps.size());
    EXPECT_EQ(*first, full.steps[0]);
    EXPECT_EQ(*second, full.steps[1]);
    EXPECT_EQ(rest.steps.front(), full.steps[2]);
    EXPECT_EQ(rest.path, full.path);
    EXPECT_EQ(rest.visited_nodes, full.visited_nodes);
}

// ============== Step sequence invariants ==============

TEST(TraversalEngineTest, VisitedGrowsMonotonically_AndNodesFinalizeOnce) {
    const auto g = graph_loaders::generate_random_graph(40, 0.1, 11);
    for (Strategy s : kAllStrategies) {
        SCOPED_TRACE(traversal::to_string(s));
        AlgorithmResult r = traversal::run(s, g, "node-0", "node-39");

        std::set<std::string> finalized;
        traversal::VisitedSet previous;
        for (const auto& step : r.steps) {
            EXPECT_TRUE(finalized.insert(step.current_node).second) << step.current_node;
            EXPECT_TRUE(std::includes(step.visited_nodes.begin(), step.visited_nodes.end(),
                previous.begin(), previous.end()));
            EXPECT_EQ(step.visited_nodes.count(step.current_node), 1u);
            previous = step.visited_nodes;
        }
    }
}

TEST(TraversalEngineTest, SnapshotPath_LeadsFromStartToCurrentNode) {
    const auto g = graph_loaders::generate_grid_graph(4, 4, 5);
    for (Strategy s : kAllStrategies) {
        SCOPED_TRACE(traversal::to_string(s));
        AlgorithmResult r = traversal::run(s, g, "node-0-0", "node-3-3");
        for (const auto& step : r.steps) {
            ASSERT_FALSE(step.path.empty());
            EXPECT_EQ(step.path.front(), "node-0-0");
            EXPECT_EQ(step.path.back(), step.current_node);
        }
        EXPECT_EQ(r.path.front(), "node-0-0");
        EXPECT_EQ(r.path.back(), "node-3-3");
    }
}

TEST(TraversalEngineTest, EarlierSnapshots_AreNotAffectedByLaterSteps) {
    auto engine = traversal::make_engine(Strategy::Dijkstra);
    engine->init(graph_loaders::generate_demo_graph(), "node-0", "node-7");

    auto first = engine->step();
    ASSERT_TRUE(first.has_value());
    const PathStep kept = *first;
    while (engine->step()) {
    }

    EXPECT_EQ(*first, kept);
    EXPECT_EQ(first->visited_nodes, traversal::VisitedSet{ "node-0" });
    for (const auto& [node, parent] : first->previous_nodes)
        EXPECT_FALSE(parent.has_value()) << node;
    EXPECT_GT(engine->visited_nodes().size(), 1u);
}

// ============== Optimality ==============

TEST(TraversalEngineTest, DijkstraAndAStar_FindMinimumWeightPaths) {
    for (std::uint32_t seed : { 1u, 2u, 3u, 4u, 5u, 6u }) {
        const auto g = test_graphs::admissible_random(35, 0.12, seed);
        const std::string start = "node-0";
        const std::string end = "node-" + std::to_string(g.nodes.size() - 1);
        const double expected = reference_distance(g, start, end);
        SCOPED_TRACE("seed " + std::to_string(seed));

        AlgorithmResult dijkstra = traversal::run(Strategy::Dijkstra, g, start, end);
        AlgorithmResult astar = traversal::run(Strategy::AStar, g, start, end);

        EXPECT_DOUBLE_EQ(dijkstra.distance, expected);
        EXPECT_DOUBLE_EQ(astar.distance, expected);
        EXPECT_LE(astar.visited_nodes.size(), g.nodes.size());
    }
}

TEST(TraversalEngineTest, ParallelEdges_DistanceIsMinimumWeight) {
    const auto g = test_graphs::make_graph(
        { { "a", 0, 0 }, { "b", 10, 0 }, { "c", 20, 0 } },
        { { "a", "b", 5 }, { "a", "b", 1 }, { "b", "c", 4 }, { "b", "c", 2 } });
    const double expected = reference_distance(g, "a", "c");
    ASSERT_DOUBLE_EQ(expected, 3.0);

    for (Strategy strategy : { Strategy::Dijkstra, Strategy::AStar }) {
        SCOPED_TRACE(traversal::to_string(strategy));
        AlgorithmResult r = traversal::run(strategy, g, "a", "c");
        EXPECT_EQ(r.path, (NodePath{ "a", "b", "c" }));
        EXPECT_DOUBLE_EQ(r.distance, expected);
    }
}

TEST(TraversalEngineTest, Dijkstra_SkipsStaleFrontierEntries) {
    // "a" is queued at 10 via s, then again at 2 via b; the 10 entry is stale.
    const auto g = test_graphs::make_graph(
        { { "s", 0, 0 }, { "a", 0, 0 }, { "b", 0, 0 }, { "t", 0, 0 } },
        { { "s", "a", 10 }, { "s", "b", 1 }, { "b", "a", 1 }, { "a", "t", 100 } });

    AlgorithmResult r = traversal::run(Strategy::Dijkstra, g, "s", "t");

    std::vector<std::string> order;
    for (const auto& step : r.steps) order.push_back(step.current_node);
    EXPECT_EQ(order, (std::vector<std::string>{ "s", "b", "a", "t" }));
    EXPECT_EQ(r.path, (NodePath{ "s", "b", "a", "t" }));
    EXPECT_DOUBLE_EQ(r.distance, 102.0);

    traversal::DijkstraEngine engine;
    engine.init(g, "s", "t");
    while (engine.step()) {
    }
    EXPECT_DOUBLE_EQ(engine.distance_to("a"), 2.0);
}

// ============== BFS / DFS specifics ==============

TEST(TraversalEngineTest, Bfs_MarksNeighborsVisitedWhenQueued) {
    AlgorithmResult r = traversal::run(Strategy::Bfs, test_graphs::triangle(), "a", "c");

    ASSERT_EQ(r.steps.size(), 3u);
    EXPECT_EQ(r.steps[0].current_node, "a");
    EXPECT_EQ(r.steps[0].visited_nodes, traversal::VisitedSet{ "a" });
    EXPECT_EQ(r.steps[1].current_node, "b");
    EXPECT_EQ(r.steps[1].visited_nodes, (traversal::VisitedSet{ "a", "b", "c" }));
    EXPECT_EQ(r.steps[1].previous_nodes.at("c"), std::optional<std::string>("a"));
    EXPECT_EQ(r.steps[2].current_node, "c");
    EXPECT_TRUE(r.steps[2].is_complete);
}

TEST(TraversalEngineTest, Dfs_ParentIsFirstDiscovererNotVisitor) {
    // s discovers a and b; a is explored first and also touches b, but b keeps s as parent.
    const auto g = test_graphs::make_graph(
        { { "s", 0, 0 }, { "a", 0, 0 }, { "b", 0, 0 }, { "t", 0, 0 } },
        { { "s", "a", 1 }, { "s", "b", 1 }, { "a", "b", 1 }, { "b", "t", 1 } });

    AlgorithmResult r = traversal::run(Strategy::Dfs, g, "s", "t");

    std::vector<std::string> order;
    for (const auto& step : r.steps) order.push_back(step.current_node);
    EXPECT_EQ(order, (std::vector<std::string>{ "s", "a", "b", "t" }));
    EXPECT_EQ(r.steps.back().previous_nodes.at("b"), std::optional<std::string>("s"));
    EXPECT_EQ(r.path, (NodePath{ "s", "b", "t" }));
}

// ============== Degenerate inputs and lifecycle ==============

TEST(TraversalEngineTest, MissingStart_FinalizesNothing) {
    for (Strategy s : kAllStrategies) {
        SCOPED_TRACE(traversal::to_string(s));
        AlgorithmResult r = traversal::run(s, test_graphs::triangle(), "ghost", "c");
        EXPECT_TRUE(r.steps.empty());
        EXPECT_TRUE(r.path.empty());
        EXPECT_TRUE(r.visited_nodes.empty());
    }
}

TEST(TraversalEngineTest, MissingEnd_ExploresWholeComponent) {
    for (Strategy s : kAllStrategies) {
        SCOPED_TRACE(traversal::to_string(s));
        AlgorithmResult r = traversal::run(s, test_graphs::triangle(), "a", "ghost");
        EXPECT_EQ(r.steps.size(), 3u);
        EXPECT_TRUE(r.path.empty());
        EXPECT_EQ(r.visited_nodes.size(), 3u);
    }
}

TEST(TraversalEngineTest, DanglingEdges_AreTolerated) {
    auto g = test_graphs::triangle();
    g.edges.push_back(graph_model::Edge{ "b", "ghost", 1 });
    for (Strategy s : kAllStrategies) {
        SCOPED_TRACE(traversal::to_string(s));
        AlgorithmResult r = traversal::run(s, g, "a", "c");
        EXPECT_FALSE(r.path.empty());
        EXPECT_EQ(r.visited_nodes.count("ghost"), 0u);
    }
}

TEST(TraversalEngineTest, StepPastCompletion_KeepsReturningNothing) {
    for (Strategy s : kAllStrategies) {
        SCOPED_TRACE(traversal::to_string(s));
        auto engine = traversal::make_engine(s);
        engine->init(test_graphs::triangle(), "a", "c");
        while (engine->step()) {
        }
        ASSERT_TRUE(engine->is_complete());
        const auto visited = engine->visited_nodes();
        const auto path = engine->final_path();

        EXPECT_FALSE(engine->step().has_value());
        EXPECT_FALSE(engine->step().has_value());
        EXPECT_EQ(engine->visited_nodes(), visited);
        EXPECT_EQ(engine->final_path(), path);
    }
}

TEST(TraversalEngineTest, StepBeforeInit_ReturnsNothing) {
    auto engine = traversal::make_engine(Strategy::Bfs);
    EXPECT_FALSE(engine->is_initialized());
    EXPECT_FALSE(engine->step().has_value());
    EXPECT_TRUE(engine->final_path().empty());
}

TEST(TraversalEngineTest, Reset_AllowsReuseWithNewRun) {
    const auto g = graph_loaders::generate_demo_graph();
    auto engine = traversal::make_engine(Strategy::AStar);

    engine->init(g, "node-0", "node-7");
    AlgorithmResult first = engine->run_to_completion();
    engine->reset();
    EXPECT_FALSE(engine->is_initialized());
    EXPECT_FALSE(engine->is_complete());
    EXPECT_TRUE(engine->visited_nodes().empty());

    engine->init(g, "node-0", "node-7");
    AlgorithmResult second = engine->run_to_completion();
    EXPECT_EQ(first, second);

    engine->init(test_graphs::triangle(), "a", "c");
    EXPECT_EQ(engine->run_to_completion().path, (NodePath{ "a", "b", "c" }));
}

// ============== Strategy helpers ==============

TEST(StrategyTest, MakeEngine_ReportsStrategy) {
    for (Strategy s : kAllStrategies)
        EXPECT_EQ(traversal::make_engine(s)->strategy(), s);
}

TEST(StrategyTest, ParseStrategy_AcceptsKnownNames) {
    EXPECT_EQ(traversal::parse_strategy("Dijkstra"), Strategy::Dijkstra);
    EXPECT_EQ(traversal::parse_strategy("a*"), Strategy::AStar);
    EXPECT_EQ(traversal::parse_strategy("ASTAR"), Strategy::AStar);
    EXPECT_EQ(traversal::parse_strategy("bfs"), Strategy::Bfs);
    EXPECT_EQ(traversal::parse_strategy("dfs"), Strategy::Dfs);
    EXPECT_FALSE(traversal::parse_strategy("greedy").has_value());
    EXPECT_TRUE(traversal::is_optimal(Strategy::AStar));
    EXPECT_FALSE(traversal::is_optimal(Strategy::Dfs));
}
