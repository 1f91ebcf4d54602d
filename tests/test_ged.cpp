// Copyright 2025 Siddhant Biradar
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include <gtest/gtest.h>
#include "graphdelta/cfg_builder.hpp"
#include "graphdelta/ged.hpp"

using namespace graphdelta;

namespace {

// Chain of `n` statements labelled prefix0, prefix1, ...
Graph chain(const std::string &prefix, size_t n, NodeType type = NodeType::Statement) {
    Graph g("chain");
    for (size_t i = 0; i < n; ++i) {
        g.add_node("n" + std::to_string(i), type, prefix + std::to_string(i));
        if (i > 0)
            g.add_edge("n" + std::to_string(i - 1), "n" + std::to_string(i),
                       EdgeType::ControlFlow);
    }
    return g;
}

std::vector<std::unique_ptr<GedStrategy>> all_strategies(const GedCosts &costs = GedCosts{}) {
    std::vector<std::unique_ptr<GedStrategy>> strategies;
    strategies.push_back(std::make_unique<AStarGed>(costs));
    for (int width : {1, 5, 10}) {
        BeamOptions options;
        options.beam_width = width;
        strategies.push_back(std::make_unique<BeamSearchGed>(costs, options));
    }
    strategies.push_back(std::make_unique<HybridGed>(costs));
    return strategies;
}

const char *SAMPLE =
    "def area(w, h):\n"
    "    if w < 0:\n"
    "        raise ValueError(w)\n"
    "    result = w * h\n"
    "    for i in range(3):\n"
    "        result += i\n"
    "    return result\n";

} // namespace

// ─── Cost model ────────────────────────────────────────────────

TEST(GedCostTest, SubstitutionCostTiers) {
    GedCosts costs;
    Node a{"a", NodeType::Statement, "x = 1", 0, "", -1, "", false, {}};
    Node same{"b", NodeType::Statement, "x = 1", 0, "", -1, "", false, {}};
    Node relabel{"c", NodeType::Statement, "x = 2", 0, "", -1, "", false, {}};
    Node retype{"d", NodeType::Branch, "x = 1", 0, "", -1, "", false, {}};

    EXPECT_DOUBLE_EQ(substitution_cost(a, same, costs), 0.0);
    EXPECT_DOUBLE_EQ(substitution_cost(a, relabel, costs), 0.5);
    EXPECT_DOUBLE_EQ(substitution_cost(a, retype, costs), 1.0);
}

TEST(GedCostTest, CacheClearsAtCapacity) {
    SubstitutionCostCache cache(2);
    cache.store(0, 0, 1.0);
    cache.store(0, 1, 0.5);
    EXPECT_EQ(cache.size(), 2u);

    cache.store(1, 1, 0.0);
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.evictions(), 1u);

    double cost = -1.0;
    EXPECT_FALSE(cache.lookup(0, 0, cost));
    ASSERT_TRUE(cache.lookup(1, 1, cost));
    EXPECT_DOUBLE_EQ(cost, 0.0);
}

TEST(GedCostTest, BudgetCountsExpansions) {
    SearchBudget budget(0.0, 3);
    budget.start();
    EXPECT_TRUE(budget.can_continue());
    budget.record_expansion();
    budget.record_expansion();
    budget.record_expansion();
    EXPECT_TRUE(budget.expansion_exhausted());
    EXPECT_FALSE(budget.time_exhausted());
    EXPECT_FALSE(budget.can_continue());
}

// ─── Identity and empty graphs ─────────────────────────────────

TEST(GedTest, IdentityIsZeroForEveryStrategy) {
    Cfg cfg = CfgBuilder().build(SAMPLE);
    for (const auto &strategy : all_strategies()) {
        GedResult result = strategy->compute(cfg, cfg);
        EXPECT_DOUBLE_EQ(result.distance, 0.0) << strategy->name();
        EXPECT_DOUBLE_EQ(result.normalized_distance, 0.0) << strategy->name();
        EXPECT_EQ(result.nodes_before, cfg.node_count());
        EXPECT_EQ(result.edges_after, cfg.edge_count());
    }
}

TEST(GedTest, IdentityWithDuplicateLabels) {
    Graph g("dup");
    for (int i = 0; i < 6; ++i) {
        g.add_node("n" + std::to_string(i), NodeType::Statement, i % 2 ? "merge" : "pass");
    }
    for (const auto &strategy : all_strategies()) {
        EXPECT_DOUBLE_EQ(strategy->compute(g, g).distance, 0.0) << strategy->name();
    }
    EXPECT_DOUBLE_EQ(greedy_bipartite_ged(g, g).distance, 0.0);
}

TEST(GedTest, EmptyGraphBoundary) {
    GedCosts costs;
    costs.node_insertion = 0.75;
    costs.node_deletion = 0.5;
    Graph empty;
    Graph g = chain("s", 4);

    for (const auto &strategy : all_strategies(costs)) {
        EXPECT_DOUBLE_EQ(strategy->compute(empty, g).distance, 4 * 0.75) << strategy->name();
        EXPECT_DOUBLE_EQ(strategy->compute(g, empty).distance, 4 * 0.5) << strategy->name();
        EXPECT_DOUBLE_EQ(strategy->compute(empty, empty).distance, 0.0) << strategy->name();
    }
}

TEST(GedTest, HybridReportsTrivialMethodForEmptyInput) {
    Graph empty;
    GedResult result = HybridGed().compute(empty, chain("s", 2));
    EXPECT_EQ(result.method, "trivial");
    EXPECT_DOUBLE_EQ(result.normalized_distance, 1.0);
}

// ─── Known distances ───────────────────────────────────────────

TEST(GedTest, OneExtraNodeCostsOneInsertion) {
    Graph before = chain("s", 3);
    Graph after = chain("s", 4);
    for (const auto &strategy : all_strategies()) {
        EXPECT_DOUBLE_EQ(strategy->compute(before, after).distance, 1.0) << strategy->name();
    }
}

TEST(GedTest, RelabelCostsHalfSubstitution) {
    Graph before = chain("s", 3);
    Graph after = chain("s", 3);
    after.add_node("n1", NodeType::Statement, "changed");
    for (const auto &strategy : all_strategies()) {
        EXPECT_DOUBLE_EQ(strategy->compute(before, after).distance, 0.5) << strategy->name();
    }
}

TEST(GedTest, AStarFindsOptimumOnSmallGraphs) {
    Graph before("b");
    before.add_node("a", NodeType::Statement, "x");
    before.add_node("b", NodeType::Branch, "if c");
    before.add_node("c", NodeType::Statement, "y");
    Graph after("a");
    after.add_node("a", NodeType::Branch, "if c");
    after.add_node("b", NodeType::Statement, "y");
    after.add_node("c", NodeType::Statement, "z");

    // b->a and c->b are free, a->c is a same-type relabel
    GedResult result = AStarGed().compute(before, after);
    EXPECT_DOUBLE_EQ(result.distance, 0.5);
    EXPECT_FALSE(result.timeout);
    EXPECT_EQ(result.method, "astar");
}

// ─── Beam monotonicity and ranges ──────────────────────────────

TEST(GedTest, WiderBeamNeverWorseThanGreedyBeam) {
    Cfg before = CfgBuilder().build(SAMPLE);
    Cfg after = CfgBuilder().build(
        "def area(w, h):\n"
        "    result = w * h\n"
        "    while result > 10:\n"
        "        result -= 1\n"
        "    print(result)\n"
        "    return result\n");

    BeamOptions narrow;
    narrow.beam_width = 1;
    double width_one = BeamSearchGed(GedCosts{}, narrow).compute(before, after).distance;

    for (int width : {2, 5, 20}) {
        BeamOptions options;
        options.beam_width = width;
        GedResult result = BeamSearchGed(GedCosts{}, options).compute(before, after);
        EXPECT_FALSE(result.timeout);
        EXPECT_LE(result.distance, width_one) << "width " << width;
    }
}

TEST(GedTest, NormalizedDistanceWithinMaxCost) {
    Graph before = chain("a", 5, NodeType::Statement);
    Graph after = chain("b", 8, NodeType::Loop);

    for (const auto &strategy : all_strategies()) {
        GedResult result = strategy->compute(before, after);
        EXPECT_GE(result.normalized_distance, 0.0) << strategy->name();
        EXPECT_LE(result.normalized_distance, 1.0) << strategy->name();
    }
    GedResult greedy = greedy_bipartite_ged(before, after);
    EXPECT_LE(greedy.normalized_distance, 1.0);
}

// ─── Limits and fallbacks ──────────────────────────────────────

TEST(GedTest, AStarIterationCapFlagsTimeout) {
    // Matching in id order costs 1.0; the optimum (x -> c, y -> b) costs 0.5
    Graph before("b");
    before.add_node("x", NodeType::Statement, "a");
    before.add_node("y", NodeType::Statement, "b");
    Graph after("a");
    after.add_node("x", NodeType::Statement, "b");
    after.add_node("y", NodeType::Statement, "c");

    AStarOptions options;
    options.max_iterations = 1;
    GedResult result = AStarGed(GedCosts{}, options).compute(before, after);
    EXPECT_TRUE(result.timeout);
    EXPECT_EQ(result.iterations, 1u);
    EXPECT_DOUBLE_EQ(result.distance, 0.5);

    GedResult unbounded = AStarGed().compute(before, after);
    EXPECT_FALSE(unbounded.timeout);
    EXPECT_DOUBLE_EQ(unbounded.distance, 0.5);
}

TEST(GedTest, LargeGraphsUseGreedyMatcher) {
    Graph before = chain("s", 120);
    Graph after = chain("s", 121);

    GedResult astar = AStarGed().compute(before, after);
    EXPECT_EQ(astar.method, "fast_heuristic");
    EXPECT_DOUBLE_EQ(astar.distance, 1.0);

    BeamOptions options;
    options.max_nodes = 100;
    GedResult beam = BeamSearchGed(GedCosts{}, options).compute(before, after);
    EXPECT_EQ(beam.method, "fast_heuristic");
}

TEST(GedTest, BeamBudgetTimeoutStillReturnsPath) {
    Graph before = chain("a", 10);
    Graph after = chain("b", 10);
    SearchBudget budget(0.0, 2);
    budget.start();

    BeamOptions options;
    options.beam_width = 10;
    GedResult result = BeamSearchGed(GedCosts{}, options).compute(before, after, budget);
    EXPECT_TRUE(result.timeout);
    EXPECT_DOUBLE_EQ(result.distance, 10 * 0.5);
}

TEST(GedTest, BeamBudgetRunningOutInGreedyPassFlagsTimeout) {
    Graph before = chain("a", 4);
    Graph after = chain("b", 4);

    // Width 2 needs 1 + 2 * 3 expansions; the width-1 pass then gets one more
    SearchBudget budget(0.0, 8);
    budget.start();

    BeamOptions options;
    options.beam_width = 2;
    GedResult result = BeamSearchGed(GedCosts{}, options).compute(before, after, budget);
    EXPECT_TRUE(result.timeout);
    EXPECT_DOUBLE_EQ(result.distance, 4 * 0.5);
}

TEST(GedTest, HybridWidthBuckets) {
    EXPECT_EQ(HybridGed::beam_width_for(5), 100);
    EXPECT_EQ(HybridGed::beam_width_for(20), 50);
    EXPECT_EQ(HybridGed::beam_width_for(49), 50);
    EXPECT_EQ(HybridGed::beam_width_for(50), 20);
    EXPECT_EQ(HybridGed::beam_width_for(150), 10);
    EXPECT_EQ(HybridGed::beam_width_for(200), 0);
}

TEST(GedTest, HybridReportsBeamSearch) {
    Graph before = chain("s", 4);
    Graph after = chain("s", 5);
    GedResult result = HybridGed().compute(before, after);
    EXPECT_EQ(result.method, "beam_search");
    EXPECT_EQ(result.beam_width, 100);
    EXPECT_EQ(result.note, "tiny");
    EXPECT_DOUBLE_EQ(result.distance, 1.0);
}

TEST(GedTest, HybridFallsBackToGreedyBeamOnTimeBudget) {
    Graph before = chain("a", 15);
    Graph after = chain("b", 15);

    HybridOptions options;
    options.time_budget_seconds = 1e-9;
    GedResult result = HybridGed(GedCosts{}, options).compute(before, after);

    EXPECT_EQ(result.method, "fast_heuristic");
    EXPECT_EQ(result.beam_width, 1);
    EXPECT_TRUE(result.timeout);
    EXPECT_EQ(result.note, "tiny_timeout");

    BeamOptions narrow;
    narrow.beam_width = 1;
    GedResult greedy = BeamSearchGed(GedCosts{}, narrow).compute(before, after);
    EXPECT_LE(result.distance, greedy.distance);
    EXPECT_EQ(result.nodes_before, 15u);
}

TEST(GedTest, HybridHugeGraphsUseGreedyMatcher) {
    Graph before = chain("s", 210);
    Graph after = chain("s", 210);
    GedResult result = HybridGed().compute(before, after);
    EXPECT_EQ(result.method, "fast_heuristic");
    EXPECT_EQ(result.note, "huge");
    EXPECT_DOUBLE_EQ(result.distance, 0.0);
}

// ─── Configuration ─────────────────────────────────────────────

TEST(GedConfigTest, MakeStrategy) {
    GedConfig config;
    EXPECT_EQ(make_strategy(config)->name(), "hybrid");
    config.strategy = GedStrategyKind::Beam;
    EXPECT_EQ(make_strategy(config)->name(), "beam_search");
    config.strategy = GedStrategyKind::AStar;
    EXPECT_EQ(make_strategy(config)->name(), "astar");

    GedStrategyKind kind;
    EXPECT_TRUE(ged_strategy_from_string("beam", kind));
    EXPECT_EQ(kind, GedStrategyKind::Beam);
    EXPECT_FALSE(ged_strategy_from_string("dijkstra", kind));
}

TEST(GedResultTest, ToJson) {
    GedResult result = BeamSearchGed().compute(chain("s", 2), chain("s", 3));
    json j = result.to_json();
    EXPECT_DOUBLE_EQ(j["distance"].get<double>(), 1.0);
    EXPECT_EQ(j["method"], "beam_search");
    EXPECT_EQ(j["nodes_before"], 2);
    EXPECT_EQ(j["nodes_after"], 3);
    EXPECT_EQ(j["edges_after"], 2);
    EXPECT_FALSE(j.contains("note"));
}
