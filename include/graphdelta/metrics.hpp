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

#pragma once

#include "dfg_builder.hpp"
#include "ged.hpp"
#include "graph.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace graphdelta {

// Distance reported for a kind that failed
constexpr double FAILED_DISTANCE = -1.0;

// Share of DFG nodes assumed distinct from CFG nodes in the weighted estimate
constexpr double DFG_OVERLAP_FACTOR = 0.7;

// Weight of the smaller distance in the weighted estimate
constexpr double WEIGHTED_MIN_FACTOR = 0.3;

struct CompareOptions {
    std::vector<GraphKind> kinds = all_metric_kinds();
    DfgVariant dfg_variant = DfgVariant::Ssa;
    GedConfig ged;

    // Used instead of make_strategy(ged) when set; shared across threads
    std::shared_ptr<const GedStrategy> strategy;
};

// One kind's before/after comparison
struct MetricRecord {
    GraphKind kind = GraphKind::Cfg;
    bool ok = true;
    std::string error;
    GedResult ged;

    // Kind-specific counts, keyed "<name>_before" / "<name>_after"
    std::map<std::string, size_t> counts;

    // Changes between the sides, keyed by metric (ast and complexity kinds)
    std::map<std::string, double> deltas;

    json to_json() const;
};

// Build the requested graphs for both sides and compare them. A failure
// in one kind yields a FAILED_DISTANCE record for that kind only.
std::vector<MetricRecord> compare_sources(const std::string &before, const std::string &after,
                                          const CompareOptions &options = CompareOptions{});

// PDG estimate from CFG and DFG distances: max + 0.3 * min, with node
// counts estimated from the CFG plus 0.7 of the DFG. With a call graph
// record (CPG) its distance, functions and calls are added on top.
GedResult weighted_approximation(const GedResult &cfg, const GedResult &dfg,
                                 const MetricRecord *call_graph = nullptr);

} // namespace graphdelta
