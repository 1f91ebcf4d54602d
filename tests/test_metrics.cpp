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
#include "graphdelta/commands.hpp"
#include "graphdelta/graph_merger.hpp"
#include "graphdelta/metrics.hpp"
#include <memory>

using namespace graphdelta;

namespace {

const char *ADD = "def f(a,b): return a+b\n";
const char *GUARDED_ADD = "def f(a,b):\n if b==0: return 0\n return a+b\n";

const MetricRecord &record_for(const std::vector<MetricRecord> &records, GraphKind kind) {
    for (const auto &record : records) {
        if (record.kind == kind)
            return record;
    }
    throw std::runtime_error("missing record");
}

// A* that throws on the graphs with the given names
class FailingStrategy : public GedStrategy {
public:
    FailingStrategy(std::string runtime_on, std::string invariant_on)
        : runtime_on_(std::move(runtime_on)), invariant_on_(std::move(invariant_on)) {}

    GedResult compute(const Graph &g1, const Graph &g2) const override {
        if (g1.name() == runtime_on_)
            throw std::runtime_error("strategy failed on " + runtime_on_);
        if (g1.name() == invariant_on_)
            throw GraphInvariantError("dangling edge in " + invariant_on_);
        return inner_.compute(g1, g2);
    }

    std::string name() const override { return "failing"; }

private:
    std::string runtime_on_;
    std::string invariant_on_;
    AStarGed inner_;
};

std::vector<GedConfig> every_config() {
    std::vector<GedConfig> configs;
    GedConfig astar;
    astar.strategy = GedStrategyKind::AStar;
    configs.push_back(astar);
    for (int width : {1, 2, 10, 50}) {
        GedConfig beam;
        beam.strategy = GedStrategyKind::Beam;
        beam.beam.beam_width = width;
        configs.push_back(beam);
    }
    configs.push_back(GedConfig{});
    return configs;
}

} // namespace

// ─── End-to-end scenarios ──────────────────────────────────────

TEST(MetricsTest, IdenticalSourceHasZeroDistance) {
    for (const auto &config : every_config()) {
        CompareOptions options;
        options.ged = config;
        std::vector<MetricRecord> records = compare_sources(ADD, ADD, options);
        ASSERT_EQ(records.size(), all_metric_kinds().size());
        for (const auto &record : records) {
            EXPECT_TRUE(record.ok) << graph_kind_to_string(record.kind);
            EXPECT_DOUBLE_EQ(record.ged.distance, 0.0)
                << graph_kind_to_string(record.kind) << " / "
                << ged_strategy_to_string(config.strategy);
        }
    }
}

TEST(MetricsTest, GuardClauseGrowsCfgAndDfg) {
    std::vector<MetricRecord> records = compare_sources(ADD, GUARDED_ADD);

    const MetricRecord &cfg = record_for(records, GraphKind::Cfg);
    ASSERT_TRUE(cfg.ok);
    EXPECT_GT(cfg.ged.distance, 0.0);
    EXPECT_GE(cfg.ged.nodes_after, cfg.ged.nodes_before + 2);

    const MetricRecord &dfg = record_for(records, GraphKind::Dfg);
    ASSERT_TRUE(dfg.ok);
    EXPECT_GT(dfg.ged.distance, 0.0);

    // Same functions, same (absent) calls
    const MetricRecord &cg = record_for(records, GraphKind::CallGraph);
    EXPECT_DOUBLE_EQ(cg.ged.distance, 0.0);
    EXPECT_EQ(cg.counts.at("functions_before"), 1u);
    EXPECT_EQ(cg.counts.at("functions_after"), 1u);
}

TEST(MetricsTest, PdgIsSmallerThanItsParts) {
    Cfg cfg = CfgBuilder().build(GUARDED_ADD);
    Dfg dfg = SsaDfgBuilder().build(GUARDED_ADD);
    Pdg pdg = merge_pdg(cfg, dfg);
    EXPECT_LT(pdg.node_count(), cfg.node_count() + dfg.node_count());

    CompareOptions options;
    options.kinds = {GraphKind::Pdg};
    std::vector<MetricRecord> records = compare_sources(ADD, GUARDED_ADD, options);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].ged.nodes_after, pdg.node_count());
    EXPECT_EQ(records[0].counts.at("control_edges_after"), cfg.edge_count());
}

// ─── Options and records ───────────────────────────────────────

TEST(MetricsTest, KindsAreReportedInRequestOrder) {
    CompareOptions options;
    options.kinds = {GraphKind::CallGraph, GraphKind::Cfg};
    std::vector<MetricRecord> records = compare_sources("x = 1\n", "x = 2\n", options);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].kind, GraphKind::CallGraph);
    EXPECT_EQ(records[1].kind, GraphKind::Cfg);
}

TEST(MetricsTest, DfgCountsFollowVariant) {
    const char *source = "x = 0\nif c:\n    x = 1\nprint(x)\n";
    CompareOptions options;
    options.kinds = {GraphKind::Dfg};

    options.dfg_variant = DfgVariant::Ssa;
    MetricRecord ssa = compare_sources(source, source, options)[0];
    EXPECT_EQ(ssa.counts.at("phi_nodes_before"), 1u);

    options.dfg_variant = DfgVariant::Basic;
    MetricRecord basic = compare_sources(source, source, options)[0];
    EXPECT_EQ(basic.counts.at("phi_nodes_before"), 0u);
    EXPECT_EQ(basic.counts.at("variables_before"), 1u);
}

TEST(MetricsTest, SyntaxErrorIsAComparableGraph) {
    std::vector<MetricRecord> records = compare_sources(ADD, "def f(:\n");
    for (const auto &record : records) {
        EXPECT_TRUE(record.ok) << graph_kind_to_string(record.kind);
        EXPECT_GT(record.ged.distance, 0.0) << graph_kind_to_string(record.kind);
    }
}

TEST(MetricsTest, SourceMetricsFollowGraphKinds) {
    std::vector<MetricRecord> records = compare_sources(ADD, GUARDED_ADD);
    ASSERT_EQ(records.size(), 8u);
    EXPECT_EQ(records[5].kind, GraphKind::Ast);
    EXPECT_EQ(records[6].kind, GraphKind::Tokens);
    EXPECT_EQ(records[7].kind, GraphKind::Complexity);

    const MetricRecord &ast = records[5];
    EXPECT_EQ(ast.ged.method, "tree_edit_distance");
    EXPECT_GT(ast.ged.distance, 0.0);
    EXPECT_GT(ast.ged.nodes_after, ast.ged.nodes_before);
    EXPECT_DOUBLE_EQ(ast.deltas.at("try_blocks_delta"), 0.0);

    const MetricRecord &tokens = records[6];
    EXPECT_EQ(tokens.ged.method, "token_levenshtein");
    EXPECT_DOUBLE_EQ(tokens.ged.normalized_distance,
                     tokens.ged.distance / static_cast<double>(tokens.ged.nodes_before));

    // The guard adds one decision point
    const MetricRecord &complexity = records[7];
    EXPECT_EQ(complexity.ged.method, "cyclomatic_halstead");
    EXPECT_DOUBLE_EQ(complexity.ged.distance, 1.0);
    EXPECT_DOUBLE_EQ(complexity.deltas.at("cyclomatic_delta_total"), 1.0);
    EXPECT_GT(complexity.deltas.at("halstead_delta_volume"), 0.0);

    json j = complexity.to_json();
    EXPECT_EQ(j["kind"], "complexity");
    EXPECT_DOUBLE_EQ(j["cyclomatic_delta_max"].get<double>(), 1.0);
    EXPECT_EQ(j["functions_after"], 1);
}

// ─── Failure isolation ─────────────────────────────────────────

TEST(MetricsTest, OneKindFailingLeavesOthersIntact) {
    CompareOptions options;
    options.strategy = std::make_shared<FailingStrategy>("dfg", "");
    std::vector<MetricRecord> records = compare_sources(ADD, GUARDED_ADD, options);

    const MetricRecord &dfg = record_for(records, GraphKind::Dfg);
    EXPECT_FALSE(dfg.ok);
    EXPECT_EQ(dfg.error, "strategy failed on dfg");
    EXPECT_DOUBLE_EQ(dfg.ged.distance, FAILED_DISTANCE);
    EXPECT_DOUBLE_EQ(dfg.ged.normalized_distance, FAILED_DISTANCE);
    EXPECT_EQ(dfg.ged.method, "failed");

    const MetricRecord &cfg = record_for(records, GraphKind::Cfg);
    EXPECT_TRUE(cfg.ok);
    EXPECT_GT(cfg.ged.distance, 0.0);
    EXPECT_TRUE(record_for(records, GraphKind::CallGraph).ok);

    // Merged kinds compare their own graphs and do not need the DFG record
    const MetricRecord &pdg = record_for(records, GraphKind::Pdg);
    EXPECT_TRUE(pdg.ok);
    EXPECT_EQ(pdg.ged.method, "astar");
    EXPECT_TRUE(record_for(records, GraphKind::Cpg).ok);
}

TEST(MetricsTest, MergeFailureUsesWeightedFallback) {
    CompareOptions options;
    options.strategy = std::make_shared<FailingStrategy>("", "pdg");
    std::vector<MetricRecord> records = compare_sources(ADD, GUARDED_ADD, options);

    const MetricRecord &cfg = record_for(records, GraphKind::Cfg);
    const MetricRecord &dfg = record_for(records, GraphKind::Dfg);
    const MetricRecord &pdg = record_for(records, GraphKind::Pdg);
    ASSERT_TRUE(pdg.ok);
    EXPECT_EQ(pdg.ged.method, "weighted_approximation");
    EXPECT_EQ(pdg.ged.note, "merge failed: dangling edge in pdg");
    EXPECT_DOUBLE_EQ(pdg.ged.distance, weighted_approximation(cfg.ged, dfg.ged).distance);
}

TEST(MetricsTest, FallbackOnFailedDependencyFails) {
    CompareOptions options;
    options.kinds = {GraphKind::Pdg};
    options.strategy = std::make_shared<FailingStrategy>("dfg", "pdg");
    std::vector<MetricRecord> records = compare_sources(ADD, GUARDED_ADD, options);

    ASSERT_EQ(records.size(), 1u);
    EXPECT_FALSE(records[0].ok);
    EXPECT_DOUBLE_EQ(records[0].ged.distance, FAILED_DISTANCE);
    EXPECT_EQ(records[0].error, "dfg comparison failed: strategy failed on dfg");
}

TEST(MetricsTest, FailedRecordSerializesSentinel) {
    MetricRecord record;
    record.kind = GraphKind::Pdg;
    record.ok = false;
    record.error = "boom";
    record.ged.distance = FAILED_DISTANCE;

    json j = record.to_json();
    EXPECT_EQ(j["kind"], "pdg");
    EXPECT_EQ(j["ok"], false);
    EXPECT_EQ(j["error"], "boom");
    EXPECT_DOUBLE_EQ(j["distance"].get<double>(), -1.0);
}

TEST(MetricsTest, WeightedApproximation) {
    GedResult cfg;
    cfg.distance = 4.0;
    cfg.nodes_before = 10;
    cfg.nodes_after = 12;
    cfg.edges_before = 9;
    cfg.edges_after = 11;
    GedResult dfg;
    dfg.distance = 2.0;
    dfg.nodes_before = 10;
    dfg.nodes_after = 20;
    dfg.edges_before = 8;
    dfg.edges_after = 15;

    GedResult pdg = weighted_approximation(cfg, dfg);
    EXPECT_EQ(pdg.method, "weighted_approximation");
    EXPECT_DOUBLE_EQ(pdg.distance, 4.0 + 0.3 * 2.0);
    EXPECT_EQ(pdg.nodes_before, 17u);
    EXPECT_EQ(pdg.nodes_after, 26u);
    EXPECT_EQ(pdg.edges_after, 26u);

    MetricRecord cg;
    cg.kind = GraphKind::CallGraph;
    cg.ged.distance = 1.0;
    cg.counts = {{"functions_before", 2}, {"functions_after", 3},
                 {"calls_before", 1},     {"calls_after", 2}};
    GedResult cpg = weighted_approximation(cfg, dfg, &cg);
    EXPECT_DOUBLE_EQ(cpg.distance, 4.0 + 0.3 * 2.0 + 1.0);
    EXPECT_EQ(cpg.nodes_after, 29u);
    EXPECT_EQ(cpg.edges_before, 18u);
}

// ─── Configuration file ────────────────────────────────────────

TEST(ConfigTest, ApplyConfigOverlaysKeys) {
    CompareOptions options;
    json config = {{"strategy", "beam"},
                   {"beam_width", 7},
                   {"max_iterations", 50},
                   {"time_budget_seconds", 2.5},
                   {"costs", {{"insertion", 2.0}, {"substitution", 0.5}}},
                   {"dfg", "basic"},
                   {"kinds", {"cfg", "cg"}}};
    apply_config(config, options);

    EXPECT_EQ(options.ged.strategy, GedStrategyKind::Beam);
    EXPECT_EQ(options.ged.beam.beam_width, 7);
    EXPECT_EQ(options.ged.astar.max_iterations, 50u);
    EXPECT_DOUBLE_EQ(options.ged.hybrid.time_budget_seconds, 2.5);
    EXPECT_DOUBLE_EQ(options.ged.costs.node_insertion, 2.0);
    EXPECT_DOUBLE_EQ(options.ged.costs.node_deletion, 1.0);
    EXPECT_DOUBLE_EQ(options.ged.costs.node_substitution, 0.5);
    EXPECT_EQ(options.dfg_variant, DfgVariant::Basic);
    EXPECT_EQ(options.kinds, (std::vector<GraphKind>{GraphKind::Cfg, GraphKind::CallGraph}));
}

TEST(ConfigTest, UnknownNamesAreRejected) {
    CompareOptions options;
    EXPECT_THROW(apply_config({{"strategy", "dijkstra"}}, options), std::runtime_error);
    EXPECT_THROW(apply_config({{"dfg", "fancy"}}, options), std::runtime_error);
    EXPECT_THROW(parse_kinds({"cfg", "bogus"}), std::runtime_error);
}

TEST(ConfigTest, DumpProducesGraphJson) {
    json cfg = build_graph_json(GraphKind::Cfg, ADD, DfgVariant::Ssa);
    EXPECT_EQ(cfg["name"], "cfg");
    EXPECT_TRUE(cfg.contains("entry"));

    json cpg = build_graph_json(GraphKind::Cpg, ADD, DfgVariant::Ssa);
    EXPECT_EQ(cpg["name"], "cpg");
    EXPECT_FALSE(cpg["nodes"].empty());
}

TEST(ConfigTest, DumpCoversSourceMetrics) {
    json ast = build_graph_json(GraphKind::Ast, ADD, DfgVariant::Ssa);
    EXPECT_EQ(ast["type"], "module");
    EXPECT_EQ(ast["children"][0]["type"], "function_definition");

    json tokens = build_graph_json(GraphKind::Tokens, ADD, DfgVariant::Ssa);
    ASSERT_TRUE(tokens.is_array());
    EXPECT_EQ(tokens[0], "def");
    EXPECT_EQ(tokens[1], "f");

    json complexity = build_graph_json(GraphKind::Complexity, GUARDED_ADD, DfgVariant::Ssa);
    EXPECT_EQ(complexity["functions"]["f"], 2);
    EXPECT_EQ(complexity["total"], 2);
}
