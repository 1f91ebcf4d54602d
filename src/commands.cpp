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

#include "graphdelta/commands.hpp"
#include "graphdelta/callgraph_builder.hpp"
#include "graphdelta/cfg_builder.hpp"
#include "graphdelta/code_metrics.hpp"
#include "graphdelta/graph_merger.hpp"
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace graphdelta {

// ============ Configuration ============

std::vector<GraphKind> parse_kinds(const std::vector<std::string> &names) {
    std::vector<GraphKind> kinds;
    for (const auto &name : names) {
        GraphKind kind;
        if (!graph_kind_from_string(name, kind)) {
            throw std::runtime_error("Unknown graph kind: " + name);
        }
        kinds.push_back(kind);
    }
    return kinds;
}

void apply_config(const json &config, CompareOptions &options) {
    GedConfig &ged = options.ged;

    if (config.contains("strategy")) {
        std::string name = config["strategy"].get<std::string>();
        if (!ged_strategy_from_string(name, ged.strategy))
            throw std::runtime_error("Unknown GED strategy in config: " + name);
    }
    if (config.contains("beam_width"))
        ged.beam.beam_width = config["beam_width"].get<int>();
    if (config.contains("max_iterations"))
        ged.astar.max_iterations = config["max_iterations"].get<size_t>();
    if (config.contains("astar_branching"))
        ged.astar.max_branching = config["astar_branching"].get<size_t>();
    if (config.contains("time_budget_seconds"))
        ged.hybrid.time_budget_seconds = config["time_budget_seconds"].get<double>();

    if (config.contains("costs")) {
        const json &costs = config["costs"];
        if (costs.contains("insertion"))
            ged.costs.node_insertion = costs["insertion"].get<double>();
        if (costs.contains("deletion"))
            ged.costs.node_deletion = costs["deletion"].get<double>();
        if (costs.contains("substitution"))
            ged.costs.node_substitution = costs["substitution"].get<double>();
    }

    if (config.contains("dfg")) {
        std::string name = config["dfg"].get<std::string>();
        if (!dfg_variant_from_string(name, options.dfg_variant))
            throw std::runtime_error("Unknown DFG variant in config: " + name);
    }
    if (config.contains("kinds"))
        options.kinds = parse_kinds(config["kinds"].get<std::vector<std::string>>());
}

bool load_config(const std::string &path, CompareOptions &options) {
    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            throw std::runtime_error("Failed to open file for reading: " + path);
        }
        json config;
        file >> config;
        apply_config(config, options);
        return true;
    } catch (const std::exception &e) {
        std::cerr << "Error loading config: " << e.what() << std::endl;
        return false;
    }
}

// ============ Commands ============

int cmd_compare(const std::string &before_path, const std::string &after_path,
                const CompareOptions &options, bool as_json) {
    std::string before, after;
    try {
        before = read_source_file(before_path);
        after = read_source_file(after_path);
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::vector<MetricRecord> records = compare_sources(before, after, options);

    if (as_json) {
        json j;
        j["before"] = before_path;
        j["after"] = after_path;
        json metrics = json::array();
        for (const auto &record : records) {
            metrics.push_back(record.to_json());
        }
        j["metrics"] = metrics;
        std::cout << j.dump(2) << std::endl;
        return 0;
    }

    std::cout << "Comparing " << before_path << " -> " << after_path << "\n" << std::endl;
    std::cout << std::left << std::setw(11) << "kind" << std::setw(12) << "distance"
              << std::setw(12) << "normalized" << std::setw(24) << "method" << std::setw(14)
              << "nodes" << "edges" << std::endl;

    for (const auto &record : records) {
        std::cout << std::left << std::setw(11) << graph_kind_to_string(record.kind);
        if (!record.ok) {
            std::cout << "failed: " << record.error << std::endl;
            continue;
        }
        const GedResult &ged = record.ged;
        std::string method = ged.method;
        if (ged.timeout)
            method += " (timeout)";
        std::cout << std::setw(12) << std::fixed << std::setprecision(2) << ged.distance
                  << std::setw(12) << std::setprecision(4) << ged.normalized_distance
                  << std::setw(24) << method << std::setw(14)
                  << (std::to_string(ged.nodes_before) + " -> " + std::to_string(ged.nodes_after))
                  << ged.edges_before << " -> " << ged.edges_after << std::endl;
        for (const auto &[name, value] : record.deltas) {
            if (value != 0.0)
                std::cout << "    " << name << ": " << std::setprecision(2) << value << std::endl;
        }
    }
    return 0;
}

int cmd_batch(const BatchConfig &config, const std::string &output_path) {
    std::cout << "Comparing " << config.before_dir << " -> " << config.after_dir << "..."
              << std::endl;

    BatchRunner runner(config);
    std::vector<FileComparison> results = runner.run();

    std::cout << "\nSummary (" << results.size() << " files):" << std::endl;
    for (const auto &[kind, summary] : BatchRunner::summarize(results)) {
        std::cout << "  " << std::left << std::setw(10) << graph_kind_to_string(kind)
                  << " count=" << summary.count << " failures=" << summary.failures
                  << std::fixed << std::setprecision(2) << " sum=" << summary.sum
                  << " avg=" << summary.average() << " max=" << summary.max << std::endl;
    }

    if (output_path.empty())
        return 0;

    try {
        runner.save_report(results, output_path);
        std::cout << "\nReport saved to: " << output_path << std::endl;
    } catch (const std::exception &e) {
        std::cerr << "Error saving report: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}

json build_graph_json(GraphKind kind, const std::string &source, DfgVariant variant) {
    SourceTree tree(source);
    switch (kind) {
    case GraphKind::Cfg:
        return CfgBuilder().build(tree).to_json();
    case GraphKind::Dfg:
        return build_dfg(tree, variant).to_json();
    case GraphKind::CallGraph:
        return CallGraphBuilder().build(tree).to_json();
    case GraphKind::Pdg:
        return merge_pdg(CfgBuilder().build(tree), build_dfg(tree, variant)).to_json();
    case GraphKind::Cpg:
        return merge_cpg(CfgBuilder().build(tree), build_dfg(tree, variant),
                         CallGraphBuilder().build(tree))
            .to_json();
    case GraphKind::Ast:
        return build_syntax_tree(tree).to_json();
    case GraphKind::Tokens:
        return code_tokens(tree);
    case GraphKind::Complexity:
    default: {
        CyclomaticComplexity cc = cyclomatic_complexity(tree);
        HalsteadMetrics halstead = halstead_metrics(tree);
        json j;
        j["functions"] = cc.functions;
        j["average"] = cc.average;
        j["max"] = cc.max;
        j["total"] = cc.total;
        j["halstead"] = {{"distinct_operators", halstead.distinct_operators},
                         {"distinct_operands", halstead.distinct_operands},
                         {"total_operators", halstead.total_operators},
                         {"total_operands", halstead.total_operands},
                         {"volume", halstead.volume},
                         {"difficulty", halstead.difficulty},
                         {"effort", halstead.effort}};
        return j;
    }
    }
}

int cmd_dump(GraphKind kind, const std::string &file_path, DfgVariant variant,
             const std::string &output_path) {
    try {
        json graph = build_graph_json(kind, read_source_file(file_path), variant);

        if (output_path.empty()) {
            std::cout << graph.dump(2) << std::endl;
            return 0;
        }

        std::ofstream out(output_path);
        if (!out.is_open()) {
            throw std::runtime_error("Failed to open file for writing: " + output_path);
        }
        out << graph.dump(2);
        std::cout << graph_kind_to_string(kind) << " written to: " << output_path << std::endl;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}

} // namespace graphdelta
