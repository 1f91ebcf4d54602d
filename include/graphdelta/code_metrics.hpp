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

#include "graph.hpp"
#include "source_tree.hpp"
#include <map>
#include <set>
#include <string>
#include <vector>

namespace graphdelta {

// ============ Syntax tree ============

// Named syntax node labelled by its tree-sitter type
struct SyntaxTreeNode {
    std::string label;
    std::vector<SyntaxTreeNode> children;
    size_t size = 1; // nodes in this subtree

    json to_json() const;
};

// Named nodes with comments dropped; a single "SyntaxError" node when the
// source does not parse
SyntaxTreeNode build_syntax_tree(const SourceTree &tree);

// Ordered tree edit distance: relabel costs 1, replacing a subtree costs
// the sizes of both sides
double tree_edit_distance(const SyntaxTreeNode &a, const SyntaxTreeNode &b);

// ============ Tokens ============

// Leaf token texts in source order; a string literal is one token
std::vector<std::string> code_tokens(const SourceTree &tree);

size_t token_edit_distance(const std::vector<std::string> &a, const std::vector<std::string> &b);

// ============ Complexity ============

struct CyclomaticComplexity {
    std::map<std::string, int> functions; // name -> complexity, last wins
    double average = 0.0;
    int max = 0;
    int total = 0;
};

CyclomaticComplexity cyclomatic_complexity(const SourceTree &tree);

struct HalsteadMetrics {
    size_t distinct_operators = 0; // n1
    size_t distinct_operands = 0;  // n2
    size_t total_operators = 0;    // N1
    size_t total_operands = 0;     // N2
    double volume = 0.0;
    double difficulty = 0.0;
    double effort = 0.0;
};

HalsteadMetrics halstead_metrics(const SourceTree &tree);

// ============ Exception handling and annotations ============

struct ExceptionProfile {
    int try_blocks = 0;
    int except_handlers = 0;
    int finally_blocks = 0;
    int else_blocks = 0;
    int raise_statements = 0;
    int generic_excepts = 0; // bare "except:"
    std::set<std::string> exception_types;
};

ExceptionProfile exception_profile(const SourceTree &tree);

struct AnnotationProfile {
    int annotated_args = 0;
    int return_annotations = 0;
    int variable_annotations = 0;
    std::set<std::string> type_names;
};

AnnotationProfile annotation_profile(const SourceTree &tree);

// Deltas keyed as reported in a metric record (after - before)
std::map<std::string, double> exception_deltas(const ExceptionProfile &before,
                                               const ExceptionProfile &after);
std::map<std::string, double> annotation_deltas(const AnnotationProfile &before,
                                                const AnnotationProfile &after);

} // namespace graphdelta
