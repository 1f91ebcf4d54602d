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

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace graphdelta {

// ============================================================================
// String Pool - Intern strings to dense integer ids
// ============================================================================
class StringPool {
public:
    // Intern a string and return its index
    size_t intern(const std::string &str) {
        auto it = index_.find(str);
        if (it != index_.end()) {
            return it->second;
        }
        size_t idx = index_.size();
        index_.emplace(str, idx);
        return idx;
    }

    size_t size() const { return index_.size(); }

private:
    std::unordered_map<std::string, size_t> index_;
};

// Supported languages
enum class Language { Unknown, Python };

// Get language from file extension
inline Language language_from_extension(const std::string &ext) {
    if (ext == ".py")
        return Language::Python;
    return Language::Unknown;
}

// Node kinds across every graph flavour
enum class NodeType {
    Statement,
    Entry,
    Exit,
    Branch,
    Loop,
    Variable,
    Definition,
    Use,
    Function,
    Method,
    Class,
    AstNode,
    Type
};

inline const char *node_type_to_string(NodeType type) {
    switch (type) {
    case NodeType::Statement:
        return "statement";
    case NodeType::Entry:
        return "entry";
    case NodeType::Exit:
        return "exit";
    case NodeType::Branch:
        return "branch";
    case NodeType::Loop:
        return "loop";
    case NodeType::Variable:
        return "variable";
    case NodeType::Definition:
        return "definition";
    case NodeType::Use:
        return "use";
    case NodeType::Function:
        return "function";
    case NodeType::Method:
        return "method";
    case NodeType::Class:
        return "class";
    case NodeType::AstNode:
        return "ast_node";
    case NodeType::Type:
        return "type";
    default:
        return "unknown";
    }
}

// Edge kinds
enum class EdgeType {
    ControlFlow,
    TrueBranch,
    FalseBranch,
    DataFlow,
    DefUse,
    Call,
    Inherit,
    ControlDependence,
    DataDependence
};

inline const char *edge_type_to_string(EdgeType type) {
    switch (type) {
    case EdgeType::ControlFlow:
        return "control_flow";
    case EdgeType::TrueBranch:
        return "true_branch";
    case EdgeType::FalseBranch:
        return "false_branch";
    case EdgeType::DataFlow:
        return "data_flow";
    case EdgeType::DefUse:
        return "def_use";
    case EdgeType::Call:
        return "call";
    case EdgeType::Inherit:
        return "inherit";
    case EdgeType::ControlDependence:
        return "control_dependence";
    case EdgeType::DataDependence:
        return "data_dependence";
    default:
        return "unknown";
    }
}

// Comparison kinds: the program graphs, then the source-level metrics
enum class GraphKind { Cfg, Dfg, CallGraph, Pdg, Cpg, Ast, Tokens, Complexity };

inline const char *graph_kind_to_string(GraphKind kind) {
    switch (kind) {
    case GraphKind::Cfg:
        return "cfg";
    case GraphKind::Dfg:
        return "dfg";
    case GraphKind::CallGraph:
        return "callgraph";
    case GraphKind::Pdg:
        return "pdg";
    case GraphKind::Cpg:
        return "cpg";
    case GraphKind::Ast:
        return "ast";
    case GraphKind::Tokens:
        return "tokens";
    case GraphKind::Complexity:
        return "complexity";
    default:
        return "unknown";
    }
}

// Returns false for an unrecognised name
inline bool graph_kind_from_string(const std::string &name, GraphKind &kind) {
    if (name == "cfg")
        kind = GraphKind::Cfg;
    else if (name == "dfg")
        kind = GraphKind::Dfg;
    else if (name == "callgraph" || name == "cg")
        kind = GraphKind::CallGraph;
    else if (name == "pdg")
        kind = GraphKind::Pdg;
    else if (name == "cpg")
        kind = GraphKind::Cpg;
    else if (name == "ast")
        kind = GraphKind::Ast;
    else if (name == "tokens")
        kind = GraphKind::Tokens;
    else if (name == "complexity")
        kind = GraphKind::Complexity;
    else
        return false;
    return true;
}

// Program graph kinds, in report order
inline std::vector<GraphKind> all_graph_kinds() {
    return {GraphKind::Cfg, GraphKind::Dfg, GraphKind::CallGraph, GraphKind::Pdg, GraphKind::Cpg};
}

// Graph kinds followed by the source-level metrics
inline std::vector<GraphKind> all_metric_kinds() {
    std::vector<GraphKind> kinds = all_graph_kinds();
    kinds.insert(kinds.end(), {GraphKind::Ast, GraphKind::Tokens, GraphKind::Complexity});
    return kinds;
}

} // namespace graphdelta
