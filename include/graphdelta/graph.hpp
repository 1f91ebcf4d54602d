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

#include "types.hpp"
#include <map>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace graphdelta {

using json = nlohmann::json;

// Thrown when a builder wires an edge to a node that does not exist
class GraphInvariantError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

using Attributes = std::map<std::string, std::string>;

struct Node {
    std::string id;
    NodeType type = NodeType::Statement;
    std::string label;

    // Payload set by the builders (0 / empty / -1 when not applicable)
    uint32_t line = 0;
    std::string var_name;
    int version = -1;
    std::string scope;
    bool is_phi = false;

    Attributes extras; // Kind-specific extras

    bool operator==(const Node &other) const { return id == other.id; }
    bool operator!=(const Node &other) const { return !(*this == other); }
};

struct Edge {
    std::string source;
    std::string target;
    EdgeType type = EdgeType::ControlFlow;
    std::string label;
    Attributes attributes;

    bool operator==(const Edge &other) const {
        return source == other.source && target == other.target && type == other.type;
    }
    bool operator!=(const Edge &other) const { return !(*this == other); }
};

class Graph {
public:
    explicit Graph(std::string name = "graph");
    virtual ~Graph() = default;

    Graph(const Graph &) = default;
    Graph &operator=(const Graph &) = default;
    Graph(Graph &&) = default;
    Graph &operator=(Graph &&) = default;

    const std::string &name() const { return name_; }

    // Insert or overwrite a node by id
    void add_node(Node node);

    // Convenience overload used by the builders
    const Node &add_node(const std::string &id, NodeType type, const std::string &label,
                         uint32_t line = 0);

    // Throws GraphInvariantError if either endpoint is missing
    void add_edge(Edge edge);
    void add_edge(const std::string &source, const std::string &target, EdgeType type,
                  const std::string &label = "");

    bool has_node(const std::string &id) const;
    bool has_edge(const Edge &edge) const;

    // Returns nullptr for an unknown id
    const Node *find_node(const std::string &id) const;

    // Throws GraphInvariantError for an unknown id
    const Node &node(const std::string &id) const;

    std::vector<std::string> successors(const std::string &id) const;

    // Linear scan over the edge list
    std::vector<std::string> predecessors(const std::string &id) const;

    // (|V|, |E|)
    std::pair<size_t, size_t> size() const { return {nodes_.size(), edges_.size()}; }
    size_t node_count() const { return nodes_.size(); }
    size_t edge_count() const { return edges_.size(); }
    bool empty() const { return nodes_.empty(); }

    // Nodes ordered by id
    const std::map<std::string, Node> &nodes() const { return nodes_; }
    const std::vector<Edge> &edges() const { return edges_; }

    // Structural record: {name, nodes[], edges[]}; kinds add their own keys
    virtual json to_json() const;

    // Save to file
    void save(const std::string &filepath) const;

protected:
    std::string name_;
    std::map<std::string, Node> nodes_;
    std::vector<Edge> edges_;
    std::unordered_map<std::string, std::vector<std::string>> adjacency_;
};

// Function or method body built inside a Cfg
struct CfgScope {
    std::string name; // Qualified name, e.g. "Parser.parse"
    std::string entry;
    std::string exit;
};

class Cfg : public Graph {
public:
    explicit Cfg(std::string name = "cfg") : Graph(std::move(name)) {}

    std::string entry;
    std::vector<std::string> exits;
    std::vector<CfgScope> scopes;

    json to_json() const override;
};

class Dfg : public Graph {
public:
    explicit Dfg(std::string name = "dfg") : Graph(std::move(name)) {}

    // Variable name -> ordered node ids
    std::map<std::string, std::vector<std::string>> definitions;
    std::map<std::string, std::vector<std::string>> uses;

    void add_definition(const std::string &var, const std::string &node_id);
    void add_use(const std::string &var, const std::string &node_id);

    // (definition, use) pairs judged reachable by the builder
    std::vector<std::pair<std::string, std::string>> def_use_chains() const;

    size_t phi_count() const;

    json to_json() const override;
};

class Pdg : public Graph {
public:
    explicit Pdg(std::string name = "pdg") : Graph(std::move(name)) {}

    std::vector<Edge> control_edges;
    std::vector<Edge> data_edges;

    // Adds to the edge list and to the matching partition
    void add_control_edge(Edge edge);
    void add_data_edge(Edge edge);

    json to_json() const override;
};

class CallGraph : public Graph {
public:
    explicit CallGraph(std::string name = "callgraph") : Graph(std::move(name)) {}

    // Qualified name -> node id
    std::map<std::string, std::string> functions;

    size_t call_count() const;

    json to_json() const override;
};

class Cpg : public Graph {
public:
    explicit Cpg(std::string name = "cpg") : Graph(std::move(name)) {}

    // Adds nodes not yet present and edges not yet present
    void merge_from(const Graph &other);
};

} // namespace graphdelta
