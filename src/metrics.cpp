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

#include "graphdelta/metrics.hpp"
#include "graphdelta/callgraph_builder.hpp"
#include "graphdelta/cfg_builder.hpp"
#include "graphdelta/code_metrics.hpp"
#include "graphdelta/graph_merger.hpp"
#include <algorithm>
#include <cmath>
#include <memory>
#include <optional>
#include <stdexcept>

namespace graphdelta {

namespace {

// Graphs built on demand and shared between kinds
class GraphCache {
public:
    GraphCache(const std::string &source, DfgVariant variant) : source_(source), variant_(variant) {}

    const SourceTree &tree() {
        if (!tree_)
            tree_ = std::make_unique<SourceTree>(source_);
        return *tree_;
    }

    const Cfg &cfg() {
        if (!cfg_)
            cfg_ = CfgBuilder().build(tree());
        return *cfg_;
    }

    const Dfg &dfg() {
        if (!dfg_)
            dfg_ = build_dfg(tree(), variant_);
        return *dfg_;
    }

    const CallGraph &call_graph() {
        if (!call_graph_)
            call_graph_ = CallGraphBuilder().build(tree());
        return *call_graph_;
    }

    const SyntaxTreeNode &syntax_tree() {
        if (!syntax_tree_)
            syntax_tree_ = build_syntax_tree(tree());
        return *syntax_tree_;
    }

private:
    const std::string &source_;
    DfgVariant variant_;
    std::unique_ptr<SourceTree> tree_;
    std::optional<Cfg> cfg_;
    std::optional<Dfg> dfg_;
    std::optional<CallGraph> call_graph_;
    std::optional<SyntaxTreeNode> syntax_tree_;
};

void add_count(MetricRecord &record, const std::string &name, size_t before, size_t after) {
    record.counts[name + "_before"] = before;
    record.counts[name + "_after"] = after;
}

size_t count_of(const MetricRecord &record, const std::string &key) {
    auto it = record.counts.find(key);
    return it != record.counts.end() ? it->second : 0;
}

class Comparison {
public:
    Comparison(const std::string &before, const std::string &after, const CompareOptions &options)
        : before_(before, options.dfg_variant), after_(after, options.dfg_variant),
          strategy_(options.strategy ? options.strategy
                                     : std::shared_ptr<const GedStrategy>(make_strategy(options.ged))) {}

    MetricRecord run(GraphKind kind) {
        MetricRecord record;
        record.kind = kind;
        try {
            switch (kind) {
            case GraphKind::Cfg:
                record = cfg_record();
                break;
            case GraphKind::Dfg:
                record = dfg_record();
                break;
            case GraphKind::CallGraph:
                record = call_graph_record();
                break;
            case GraphKind::Pdg:
                record = pdg_record();
                break;
            case GraphKind::Cpg:
                record = cpg_record();
                break;
            case GraphKind::Ast:
                record = ast_record();
                break;
            case GraphKind::Tokens:
                record = tokens_record();
                break;
            case GraphKind::Complexity:
                record = complexity_record();
                break;
            }
        } catch (const std::exception &e) {
            record = MetricRecord();
            record.kind = kind;
            record.ok = false;
            record.error = e.what();
            record.ged.distance = FAILED_DISTANCE;
            record.ged.normalized_distance = FAILED_DISTANCE;
            record.ged.method = "failed";
        }
        done_[kind] = record;
        return record;
    }

private:
    GraphCache before_;
    GraphCache after_;
    std::shared_ptr<const GedStrategy> strategy_;
    std::map<GraphKind, MetricRecord> done_;

    // Record for `kind`, computed now unless it already succeeded
    const MetricRecord &require(GraphKind kind) {
        auto it = done_.find(kind);
        if (it == done_.end())
            run(kind);
        const MetricRecord &record = done_.at(kind);
        if (!record.ok) {
            throw std::runtime_error(std::string(graph_kind_to_string(kind)) +
                                     " comparison failed: " + record.error);
        }
        return record;
    }

    MetricRecord cfg_record() {
        MetricRecord record;
        record.kind = GraphKind::Cfg;
        const Cfg &before = before_.cfg();
        const Cfg &after = after_.cfg();
        record.ged = strategy_->compute(before, after);
        add_count(record, "scopes", before.scopes.size(), after.scopes.size());
        return record;
    }

    MetricRecord dfg_record() {
        MetricRecord record;
        record.kind = GraphKind::Dfg;
        const Dfg &before = before_.dfg();
        const Dfg &after = after_.dfg();
        record.ged = strategy_->compute(before, after);
        add_count(record, "variables", before.definitions.size(), after.definitions.size());
        add_count(record, "def_use_chains", before.def_use_chains().size(),
                  after.def_use_chains().size());
        add_count(record, "phi_nodes", before.phi_count(), after.phi_count());
        return record;
    }

    MetricRecord call_graph_record() {
        MetricRecord record;
        record.kind = GraphKind::CallGraph;
        const CallGraph &before = before_.call_graph();
        const CallGraph &after = after_.call_graph();
        record.ged = strategy_->compute(before, after);
        add_count(record, "functions", before.functions.size(), after.functions.size());
        add_count(record, "calls", before.call_count(), after.call_count());
        return record;
    }

    MetricRecord pdg_record() {
        MetricRecord record;
        record.kind = GraphKind::Pdg;
        try {
            Pdg before = merge_pdg(before_.cfg(), before_.dfg());
            Pdg after = merge_pdg(after_.cfg(), after_.dfg());
            record.ged = strategy_->compute(before, after);
            add_count(record, "control_edges", before.control_edges.size(),
                      after.control_edges.size());
            add_count(record, "data_edges", before.data_edges.size(), after.data_edges.size());
        } catch (const GraphInvariantError &e) {
            record.ged = weighted_approximation(require(GraphKind::Cfg).ged,
                                                require(GraphKind::Dfg).ged);
            record.ged.note = std::string("merge failed: ") + e.what();
        }
        return record;
    }

    MetricRecord cpg_record() {
        MetricRecord record;
        record.kind = GraphKind::Cpg;
        try {
            Cpg before = merge_cpg(before_.cfg(), before_.dfg(), before_.call_graph());
            Cpg after = merge_cpg(after_.cfg(), after_.dfg(), after_.call_graph());
            record.ged = strategy_->compute(before, after);
        } catch (const GraphInvariantError &e) {
            const MetricRecord &call_graph = require(GraphKind::CallGraph);
            record.ged = weighted_approximation(require(GraphKind::Cfg).ged,
                                                require(GraphKind::Dfg).ged, &call_graph);
            record.ged.note = std::string("merge failed: ") + e.what();
        }
        return record;
    }

    // ============ Source-level metrics ============

    MetricRecord ast_record() {
        MetricRecord record;
        record.kind = GraphKind::Ast;
        const SyntaxTreeNode &before = before_.syntax_tree();
        const SyntaxTreeNode &after = after_.syntax_tree();

        SearchBudget timer(0.0, 0);
        record.ged.distance = tree_edit_distance(before, after);
        record.ged.elapsed_seconds = timer.elapsed_seconds();
        record.ged.method = "tree_edit_distance";
        record.ged.nodes_before = before.size;
        record.ged.nodes_after = after.size;
        record.ged.normalized_distance =
            record.ged.distance / static_cast<double>(std::max<size_t>({before.size, after.size, 1}));

        record.deltas = exception_deltas(exception_profile(before_.tree()),
                                         exception_profile(after_.tree()));
        for (const auto &[name, value] : annotation_deltas(annotation_profile(before_.tree()),
                                                           annotation_profile(after_.tree()))) {
            record.deltas[name] = value;
        }
        record.deltas["ast_size_delta"] =
            std::fabs(static_cast<double>(after.size) - static_cast<double>(before.size));
        return record;
    }

    MetricRecord tokens_record() {
        MetricRecord record;
        record.kind = GraphKind::Tokens;
        std::vector<std::string> before = code_tokens(before_.tree());
        std::vector<std::string> after = code_tokens(after_.tree());

        SearchBudget timer(0.0, 0);
        record.ged.distance = static_cast<double>(token_edit_distance(before, after));
        record.ged.elapsed_seconds = timer.elapsed_seconds();
        record.ged.method = "token_levenshtein";
        record.ged.nodes_before = before.size();
        record.ged.nodes_after = after.size();
        record.ged.normalized_distance =
            record.ged.distance / static_cast<double>(std::max<size_t>(before.size(), 1));
        return record;
    }

    MetricRecord complexity_record() {
        MetricRecord record;
        record.kind = GraphKind::Complexity;
        CyclomaticComplexity cc_before = cyclomatic_complexity(before_.tree());
        CyclomaticComplexity cc_after = cyclomatic_complexity(after_.tree());
        HalsteadMetrics h_before = halstead_metrics(before_.tree());
        HalsteadMetrics h_after = halstead_metrics(after_.tree());

        int total_delta = cc_after.total - cc_before.total;
        record.ged.distance = std::abs(total_delta);
        record.ged.method = "cyclomatic_halstead";
        record.ged.normalized_distance =
            record.ged.distance / static_cast<double>(std::max({cc_before.total, cc_after.total, 1}));
        add_count(record, "functions", cc_before.functions.size(), cc_after.functions.size());

        record.deltas["cyclomatic_delta_average"] = cc_after.average - cc_before.average;
        record.deltas["cyclomatic_delta_max"] = cc_after.max - cc_before.max;
        record.deltas["cyclomatic_delta_total"] = total_delta;
        record.deltas["halstead_delta_difficulty"] = h_after.difficulty - h_before.difficulty;
        record.deltas["halstead_delta_volume"] = h_after.volume - h_before.volume;
        record.deltas["halstead_delta_effort"] = h_after.effort - h_before.effort;
        return record;
    }
};

} // namespace

json MetricRecord::to_json() const {
    json j = ged.to_json();
    j["kind"] = graph_kind_to_string(kind);
    j["ok"] = ok;
    if (!error.empty())
        j["error"] = error;
    for (const auto &[name, value] : counts) {
        j[name] = value;
    }
    for (const auto &[name, value] : deltas) {
        j[name] = value;
    }
    return j;
}

std::vector<MetricRecord> compare_sources(const std::string &before, const std::string &after,
                                          const CompareOptions &options) {
    Comparison comparison(before, after, options);
    std::vector<MetricRecord> records;
    records.reserve(options.kinds.size());
    for (GraphKind kind : options.kinds) {
        records.push_back(comparison.run(kind));
    }
    return records;
}

GedResult weighted_approximation(const GedResult &cfg, const GedResult &dfg,
                                 const MetricRecord *call_graph) {
    GedResult result;
    result.method = "weighted_approximation";

    double distance = std::max(cfg.distance, dfg.distance) +
                      WEIGHTED_MIN_FACTOR * std::min(cfg.distance, dfg.distance);
    double nodes_before = static_cast<double>(cfg.nodes_before) +
                          static_cast<double>(dfg.nodes_before) * DFG_OVERLAP_FACTOR;
    double nodes_after = static_cast<double>(cfg.nodes_after) +
                         static_cast<double>(dfg.nodes_after) * DFG_OVERLAP_FACTOR;
    result.edges_before = cfg.edges_before + dfg.edges_before;
    result.edges_after = cfg.edges_after + dfg.edges_after;
    result.elapsed_seconds = cfg.elapsed_seconds + dfg.elapsed_seconds;

    if (call_graph) {
        distance += call_graph->ged.distance;
        nodes_before += static_cast<double>(count_of(*call_graph, "functions_before"));
        nodes_after += static_cast<double>(count_of(*call_graph, "functions_after"));
        result.edges_before += count_of(*call_graph, "calls_before");
        result.edges_after += count_of(*call_graph, "calls_after");
        result.elapsed_seconds += call_graph->ged.elapsed_seconds;
    }

    result.nodes_before = static_cast<size_t>(nodes_before);
    result.nodes_after = static_cast<size_t>(nodes_after);
    result.distance = distance;
    size_t max_nodes = std::max<size_t>({result.nodes_before, result.nodes_after, 1});
    result.normalized_distance = distance / static_cast<double>(max_nodes);
    return result;
}

} // namespace graphdelta
