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

#include "graphdelta/graph.hpp"
#include <algorithm>
#include <fstream>
#include <set>
#include <tuple>

namespace graphdelta {

static json node_to_json(const Node &node) {
    json j;
    j["id"] = node.id;
    j["type"] = node_type_to_string(node.type);
    j["label"] = node.label;
    if (node.line > 0)
        j["line"] = node.line;
    if (!node.var_name.empty())
        j["var_name"] = node.var_name;
    if (node.version >= 0)
        j["version"] = node.version;
    if (!node.scope.empty())
        j["scope"] = node.scope;
    if (node.is_phi)
        j["is_phi"] = true;
    if (!node.extras.empty())
        j["extras"] = node.extras;
    return j;
}

static json edge_to_json(const Edge &edge) {
    json j;
    j["source"] = edge.source;
    j["target"] = edge.target;
    j["type"] = edge_type_to_string(edge.type);
    if (!edge.label.empty())
        j["label"] = edge.label;
    if (!edge.attributes.empty())
        j["attributes"] = edge.attributes;
    return j;
}

Graph::Graph(std::string name) : name_(std::move(name)) {}

void Graph::add_node(Node node) {
    std::string id = node.id;
    nodes_[id] = std::move(node);
}

const Node &Graph::add_node(const std::string &id, NodeType type, const std::string &label,
                            uint32_t line) {
    Node node;
    node.id = id;
    node.type = type;
    node.label = label;
    node.line = line;
    add_node(std::move(node));
    return nodes_.at(id);
}

void Graph::add_edge(Edge edge) {
    if (!has_node(edge.source)) {
        throw GraphInvariantError("Edge source not in graph '" + name_ + "': " + edge.source);
    }
    if (!has_node(edge.target)) {
        throw GraphInvariantError("Edge target not in graph '" + name_ + "': " + edge.target);
    }
    adjacency_[edge.source].push_back(edge.target);
    edges_.push_back(std::move(edge));
}

void Graph::add_edge(const std::string &source, const std::string &target, EdgeType type,
                     const std::string &label) {
    Edge edge;
    edge.source = source;
    edge.target = target;
    edge.type = type;
    edge.label = label;
    add_edge(std::move(edge));
}

bool Graph::has_node(const std::string &id) const { return nodes_.find(id) != nodes_.end(); }

bool Graph::has_edge(const Edge &edge) const {
    return std::find(edges_.begin(), edges_.end(), edge) != edges_.end();
}

const Node *Graph::find_node(const std::string &id) const {
    auto it = nodes_.find(id);
    return (it != nodes_.end()) ? &it->second : nullptr;
}

const Node &Graph::node(const std::string &id) const {
    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        throw GraphInvariantError("Unknown node in graph '" + name_ + "': " + id);
    }
    return it->second;
}

std::vector<std::string> Graph::successors(const std::string &id) const {
    auto it = adjacency_.find(id);
    if (it == adjacency_.end())
        return {};
    return it->second;
}

std::vector<std::string> Graph::predecessors(const std::string &id) const {
    std::vector<std::string> result;
    for (const auto &edge : edges_) {
        if (edge.target == id)
            result.push_back(edge.source);
    }
    return result;
}

json Graph::to_json() const {
    json j;
    j["name"] = name_;

    json nodes = json::array();
    for (const auto &[id, node] : nodes_) {
        nodes.push_back(node_to_json(node));
    }
    j["nodes"] = nodes;

    json edges = json::array();
    for (const auto &edge : edges_) {
        edges.push_back(edge_to_json(edge));
    }
    j["edges"] = edges;
    return j;
}

void Graph::save(const std::string &filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + filepath);
    }
    file << to_json().dump(2);
}

// ============ Cfg ============

json Cfg::to_json() const {
    json j = Graph::to_json();
    j["entry"] = entry;
    j["exits"] = exits;
    json scope_list = json::array();
    for (const auto &scope : scopes) {
        scope_list.push_back({{"name", scope.name}, {"entry", scope.entry}, {"exit", scope.exit}});
    }
    j["scopes"] = scope_list;
    return j;
}

// ============ Dfg ============

void Dfg::add_definition(const std::string &var, const std::string &node_id) {
    definitions[var].push_back(node_id);
}

void Dfg::add_use(const std::string &var, const std::string &node_id) {
    uses[var].push_back(node_id);
}

std::vector<std::pair<std::string, std::string>> Dfg::def_use_chains() const {
    std::vector<std::pair<std::string, std::string>> chains;
    for (const auto &edge : edges_) {
        if (edge.type == EdgeType::DefUse)
            chains.emplace_back(edge.source, edge.target);
    }
    return chains;
}

size_t Dfg::phi_count() const {
    return static_cast<size_t>(std::count_if(nodes_.begin(), nodes_.end(),
                                             [](const auto &entry) { return entry.second.is_phi; }));
}

json Dfg::to_json() const {
    json j = Graph::to_json();
    j["definitions"] = definitions;
    j["uses"] = uses;
    j["def_use_chains"] = def_use_chains().size();
    return j;
}

// ============ Pdg ============

void Pdg::add_control_edge(Edge edge) {
    edge.type = EdgeType::ControlDependence;
    add_edge(edge);
    control_edges.push_back(std::move(edge));
}

void Pdg::add_data_edge(Edge edge) {
    edge.type = EdgeType::DataDependence;
    add_edge(edge);
    data_edges.push_back(std::move(edge));
}

json Pdg::to_json() const {
    json j = Graph::to_json();
    j["control_edges"] = control_edges.size();
    j["data_edges"] = data_edges.size();
    return j;
}

// ============ CallGraph ============

size_t CallGraph::call_count() const {
    return static_cast<size_t>(std::count_if(edges_.begin(), edges_.end(), [](const Edge &edge) {
        return edge.type == EdgeType::Call;
    }));
}

json CallGraph::to_json() const {
    json j = Graph::to_json();
    j["functions"] = functions;
    j["calls"] = call_count();
    return j;
}

// ============ Cpg ============

void Cpg::merge_from(const Graph &other) {
    for (const auto &[id, node] : other.nodes()) {
        if (!has_node(id))
            add_node(node);
    }

    std::set<std::tuple<std::string, std::string, EdgeType>> seen;
    for (const auto &edge : edges_) {
        seen.emplace(edge.source, edge.target, edge.type);
    }
    for (const auto &edge : other.edges()) {
        if (seen.emplace(edge.source, edge.target, edge.type).second)
            add_edge(edge);
    }
}

} // namespace graphdelta
