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
#include <functional>
#include <string>
#include <tree_sitter/api.h>
#include <vector>

// Forward declaration for the tree-sitter grammar
extern "C" {
const TSLanguage *tree_sitter_python();
}

namespace graphdelta {

// Maximum rendered length of a statement label
constexpr size_t LABEL_LIMIT = 50;

// Collapse whitespace runs and cut to `limit` characters ("..." suffix)
std::string truncate_label(const std::string &text, size_t limit = LABEL_LIMIT);

// Parsed Python source. Never throws on malformed input; check ok().
class SourceTree {
public:

    explicit SourceTree(const std::string &source);
    ~SourceTree();

    // Non-copyable
    SourceTree(const SourceTree &) = delete;
    SourceTree &operator=(const SourceTree &) = delete;

    // Movable
    SourceTree(SourceTree &&other) noexcept;
    SourceTree &operator=(SourceTree &&other) noexcept;

    // False when the tree holds an ERROR or missing node
    bool ok() const { return error_.empty(); }

    // "SyntaxError: line L, column C" (empty when ok)
    const std::string &error() const { return error_; }

    TSNode root() const;
    const std::string &source() const { return source_; }

    std::string text(TSNode node) const;

    // Named children of a block, comments dropped
    std::vector<TSNode> statements(TSNode block) const;

    // Label shared by the CFG and DFG builders for a statement node
    std::string statement_label(TSNode stmt) const;

    // Pre-order walk; returning false from the visitor skips the children
    void visit_nodes(TSNode node, const std::function<bool(TSNode)> &visitor) const;

    // 1-based line of a node
    static uint32_t line(TSNode node) { return ts_node_start_point(node).row + 1; }

    static TSNode field(TSNode node, const char *name);
    static bool is(TSNode node, const char *type);

    // Field "body", or the last named block child (except/finally clauses)
    static TSNode body(TSNode node);

    // Unwrap decorated_definition
    static TSNode definition(TSNode node);

private:

    TSParser *parser_ = nullptr;
    TSTree *tree_ = nullptr;
    std::string source_;
    std::string error_;

    void locate_error();
};

} // namespace graphdelta
