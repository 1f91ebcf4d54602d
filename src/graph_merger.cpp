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

#include "graphdelta/graph_merger.hpp"
#include <set>
#include <utility>
#include <unordered_map>

namespace graphdelta {

Pdg merge_pdg(const Cfg &cfg, const Dfg &dfg) {
    Pdg pdg("pdg");

    // First CFG node (by id) for every label
    std::unordered_map<std::string, std::string> cfg_by_label;
    for (const auto &[id, node] : cfg.nodes()) {
        pdg.add_node(node);
        cfg_by_label.emplace(node.label, id);
    }

    // DFG id -> id in the merged graph
    std::unordered_map<std::string, std::string> remap;
    for (const auto &[id, node] : dfg.nodes()) {
        if (node.type == NodeType::Statement) {
            auto it = cfg_by_label.find(node.label);
            if (it != cfg_by_label.end()) {
                remap[id] = it->second;
                continue;
            }
        }
        if (pdg.has_node(id)) {
            throw GraphInvariantError("DFG node id collides with CFG node id: " + id);
        }
        pdg.add_node(node);
        remap[id] = id;
    }

    for (const auto &edge : cfg.edges()) {
        pdg.add_control_edge(edge);
    }

    // Distinct DFG edges can collapse onto one dependence after remapping
    std::set<std::pair<std::string, std::string>> seen;
    for (const auto &edge : dfg.edges()) {
        Edge mapped = edge;
        mapped.source = remap.at(edge.source);
        mapped.target = remap.at(edge.target);
        if (!seen.emplace(mapped.source, mapped.target).second)
            continue;
        mapped.attributes["origin"] = edge_type_to_string(edge.type);
        pdg.add_data_edge(std::move(mapped));
    }
    return pdg;
}

Cpg merge_cpg(const Pdg &pdg, const CallGraph &call_graph) {
    Cpg cpg("cpg");
    cpg.merge_from(pdg);
    cpg.merge_from(call_graph);
    return cpg;
}

Cpg merge_cpg(const Cfg &cfg, const Dfg &dfg, const CallGraph &call_graph) {
    return merge_cpg(merge_pdg(cfg, dfg), call_graph);
}

} // namespace graphdelta
