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

#include "graphdelta/code_metrics.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <iterator>

namespace graphdelta {

namespace {

bool is_field(TSNode parent, const char *name, TSNode node) {
    TSNode child = SourceTree::field(parent, name);
    return !ts_node_is_null(child) && ts_node_eq(child, node);
}

const char *parent_type(TSNode node) {
    TSNode parent = ts_node_parent(node);
    return ts_node_is_null(parent) ? "" : ts_node_type(parent);
}

// "async def" / "async for" start with an anonymous async token
bool is_async(TSNode node) {
    return ts_node_child_count(node) > 0 && SourceTree::is(ts_node_child(node, 0), "async");
}

std::string operator_type(TSNode node) {
    TSNode op = SourceTree::field(node, "operator");
    return ts_node_is_null(op) ? "" : ts_node_type(op);
}

// `a and b and c` nests left; only the outermost node of a same-operator
// chain is one boolean operation
bool starts_boolean_chain(TSNode node) {
    TSNode parent = ts_node_parent(node);
    if (!SourceTree::is(parent, "boolean_operator"))
        return true;
    return operator_type(parent) != operator_type(node);
}

SyntaxTreeNode convert(TSNode node) {
    SyntaxTreeNode result;
    result.label = ts_node_type(node);
    uint32_t count = ts_node_named_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode child = ts_node_named_child(node, i);
        if (SourceTree::is(child, "comment"))
            continue;
        result.children.push_back(convert(child));
        result.size += result.children.back().size;
    }
    return result;
}

double forest_distance(const std::vector<SyntaxTreeNode> &a, const std::vector<SyntaxTreeNode> &b) {
    size_t m = a.size();
    size_t n = b.size();
    std::vector<std::vector<double>> dp(m + 1, std::vector<double>(n + 1, 0.0));

    for (size_t i = 1; i <= m; ++i)
        dp[i][0] = dp[i - 1][0] + static_cast<double>(a[i - 1].size);
    for (size_t j = 1; j <= n; ++j)
        dp[0][j] = dp[0][j - 1] + static_cast<double>(b[j - 1].size);

    for (size_t i = 1; i <= m; ++i) {
        for (size_t j = 1; j <= n; ++j) {
            double match = dp[i - 1][j - 1] + tree_edit_distance(a[i - 1], b[j - 1]);
            double remove = dp[i - 1][j] + static_cast<double>(a[i - 1].size);
            double insert = dp[i][j - 1] + static_cast<double>(b[j - 1].size);
            dp[i][j] = std::min({match, remove, insert});
        }
    }
    return dp[m][n];
}

// ============ Halstead classification ============

// Python operator spelled the way Halstead counts it; empty when the node
// is not an operator
std::string halstead_operator(TSNode node) {
    static const char *const arithmetic[] = {"+", "-", "*", "/", "%", "**", "//",
                                             "&", "|", "^", "<<", ">>"};
    static const char *const comparisons[] = {"==", "!=", "<", "<=", ">", ">=", "is", "is not"};

    auto one_of = [](const std::string &op, auto &table) {
        return std::find_if(std::begin(table), std::end(table), [&](const char *candidate) {
                   return op == candidate;
               }) != std::end(table);
    };

    std::string type = ts_node_type(node);
    TSNode parent = ts_node_parent(node);

    if (!ts_node_is_named(node)) {
        if (SourceTree::is(parent, "binary_operator") && is_field(parent, "operator", node))
            return one_of(type, arithmetic) ? type : "";
        if (SourceTree::is(parent, "augmented_assignment") && is_field(parent, "operator", node)) {
            std::string op = type.substr(0, type.size() - 1); // "+=" -> "+"
            return one_of(op, arithmetic) ? op : "";
        }
        if (SourceTree::is(parent, "comparison_operator"))
            return one_of(type, comparisons) ? type : "";
        if (SourceTree::is(parent, "unary_operator") && type == "~")
            return type;
        return "";
    }

    if (type == "boolean_operator")
        return starts_boolean_chain(node) ? operator_type(node) : "";
    if (type == "not_operator")
        return "not";
    if (type == "function_definition")
        return is_async(node) ? "" : "def";
    if (type == "class_definition")
        return "class";
    if (type == "if_statement" || type == "elif_clause")
        return "if";
    if (type == "for_statement")
        return is_async(node) ? "" : "for";
    if (type == "while_statement")
        return "while";
    if (type == "return_statement")
        return "return";
    return "";
}

// Identifiers that name a value rather than a definition, parameter,
// attribute, keyword, import or except target
bool is_operand_identifier(TSNode node) {
    TSNode parent = ts_node_parent(node);
    std::string type = parent_type(node);

    if (type == "function_definition" || type == "class_definition" ||
        type == "default_parameter" || type == "typed_default_parameter" ||
        type == "keyword_argument")
        return !is_field(parent, "name", node);
    if (type == "attribute")
        return !is_field(parent, "attribute", node);
    if (type == "parameters" || type == "lambda_parameters" || type == "typed_parameter" ||
        type == "dotted_name" || type == "aliased_import" || type == "global_statement" ||
        type == "nonlocal_statement")
        return false;
    if (type == "list_splat_pattern" || type == "dictionary_splat_pattern") {
        std::string owner = parent_type(parent);
        return owner != "parameters" && owner != "lambda_parameters" && owner != "typed_parameter";
    }
    if (type == "as_pattern_target") {
        TSNode pattern = ts_node_parent(parent);
        return !SourceTree::is(ts_node_parent(pattern), "except_clause") &&
               !SourceTree::is(ts_node_parent(pattern), "except_group_clause");
    }
    if (type == "except_clause" || type == "except_group_clause") {
        // Older grammars: except E as e
        TSNode previous = ts_node_prev_sibling(node);
        return !SourceTree::is(previous, "as");
    }
    return true;
}

bool is_literal(TSNode node) {
    static const char *const literals[] = {"integer", "float", "true", "false", "none",
                                           "concatenated_string"};
    const char *type = ts_node_type(node);
    for (const char *literal : literals) {
        if (std::strcmp(type, literal) == 0)
            return true;
    }
    return std::strcmp(type, "string") == 0 && std::strcmp(parent_type(node), "concatenated_string") != 0;
}

// ============ Annotation helpers ============

// Name, Generic[...] base or the attribute of module.Type
std::string type_name(const SourceTree &tree, TSNode annotation) {
    TSNode node = annotation;
    if (SourceTree::is(node, "type") && ts_node_named_child_count(node) > 0)
        node = ts_node_named_child(node, 0);

    if (SourceTree::is(node, "identifier"))
        return tree.text(node);
    if (SourceTree::is(node, "subscript")) {
        TSNode value = SourceTree::field(node, "value");
        return SourceTree::is(value, "identifier") ? tree.text(value) : "";
    }
    if (SourceTree::is(node, "generic_type") && ts_node_named_child_count(node) > 0) {
        TSNode base = ts_node_named_child(node, 0);
        return SourceTree::is(base, "identifier") ? tree.text(base) : "";
    }
    if (SourceTree::is(node, "attribute"))
        return tree.text(SourceTree::field(node, "attribute"));
    return "";
}

void add_type(const SourceTree &tree, TSNode annotation, AnnotationProfile &profile) {
    std::string name = type_name(tree, annotation);
    if (!name.empty())
        profile.type_names.insert(name);
}

bool is_splat(TSNode node) {
    return SourceTree::is(node, "list_splat_pattern") ||
           SourceTree::is(node, "dictionary_splat_pattern");
}

// Annotated ordinary positional parameters: not positional-only, not
// keyword-only and not *args / **kwargs
void count_parameters(const SourceTree &tree, TSNode params, AnnotationProfile &profile) {
    std::vector<TSNode> annotations;
    uint32_t count = ts_node_named_child_count(params);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode param = ts_node_named_child(params, i);
        if (SourceTree::is(param, "positional_separator")) {
            annotations.clear();
            continue;
        }
        if (SourceTree::is(param, "keyword_separator") || is_splat(param))
            break;
        if (SourceTree::is(param, "typed_parameter")) {
            if (ts_node_named_child_count(param) > 0 && is_splat(ts_node_named_child(param, 0)))
                break;
            annotations.push_back(SourceTree::field(param, "type"));
        } else if (SourceTree::is(param, "typed_default_parameter")) {
            annotations.push_back(SourceTree::field(param, "type"));
        }
    }
    profile.annotated_args += static_cast<int>(annotations.size());
    for (TSNode annotation : annotations)
        add_type(tree, annotation, profile);
}

// ============ Exception helpers ============

void add_handler(const SourceTree &tree, TSNode handler, ExceptionProfile &profile) {
    profile.except_handlers++;

    TSNode caught = {};
    bool found = false;
    uint32_t count = ts_node_named_child_count(handler);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode child = ts_node_named_child(handler, i);
        if (SourceTree::is(child, "block") || SourceTree::is(child, "comment"))
            continue;
        caught = child;
        found = true;
        break;
    }
    if (!found) {
        profile.generic_excepts++;
        return;
    }

    if (SourceTree::is(caught, "as_pattern") && ts_node_named_child_count(caught) > 0)
        caught = ts_node_named_child(caught, 0);
    if (SourceTree::is(caught, "parenthesized_expression") && ts_node_named_child_count(caught) > 0)
        caught = ts_node_named_child(caught, 0);

    if (SourceTree::is(caught, "identifier")) {
        profile.exception_types.insert(tree.text(caught));
    } else if (SourceTree::is(caught, "tuple")) {
        uint32_t elements = ts_node_named_child_count(caught);
        for (uint32_t i = 0; i < elements; ++i) {
            TSNode element = ts_node_named_child(caught, i);
            if (SourceTree::is(element, "identifier"))
                profile.exception_types.insert(tree.text(element));
        }
    }
}

size_t count_difference(const std::set<std::string> &from, const std::set<std::string> &minus) {
    size_t count = 0;
    for (const auto &name : from) {
        if (minus.find(name) == minus.end())
            count++;
    }
    return count;
}

} // namespace

// ============ Syntax tree ============

json SyntaxTreeNode::to_json() const {
    json j;
    j["type"] = label;
    if (!children.empty()) {
        json list = json::array();
        for (const auto &child : children)
            list.push_back(child.to_json());
        j["children"] = list;
    }
    return j;
}

SyntaxTreeNode build_syntax_tree(const SourceTree &tree) {
    if (!tree.ok()) {
        SyntaxTreeNode error;
        error.label = "SyntaxError";
        return error;
    }
    return convert(tree.root());
}

double tree_edit_distance(const SyntaxTreeNode &a, const SyntaxTreeNode &b) {
    double children = forest_distance(a.children, b.children);
    if (a.label == b.label)
        return children;
    return std::min(1.0 + children, static_cast<double>(a.size + b.size));
}

// ============ Tokens ============

std::vector<std::string> code_tokens(const SourceTree &tree) {
    std::vector<std::string> tokens;
    tree.visit_nodes(tree.root(), [&](TSNode node) {
        if (SourceTree::is(node, "comment"))
            return false;
        if (SourceTree::is(node, "string") || ts_node_child_count(node) == 0) {
            std::string text = tree.text(node);
            if (!text.empty())
                tokens.push_back(text);
            return false;
        }
        return true;
    });
    return tokens;
}

size_t token_edit_distance(const std::vector<std::string> &a, const std::vector<std::string> &b) {
    std::vector<size_t> previous(b.size() + 1);
    std::vector<size_t> current(b.size() + 1);
    for (size_t j = 0; j <= b.size(); ++j)
        previous[j] = j;

    for (size_t i = 1; i <= a.size(); ++i) {
        current[0] = i;
        for (size_t j = 1; j <= b.size(); ++j) {
            size_t substitute = previous[j - 1] + (a[i - 1] == b[j - 1] ? 0 : 1);
            current[j] = std::min({previous[j] + 1, current[j - 1] + 1, substitute});
        }
        std::swap(previous, current);
    }
    return previous[b.size()];
}

// ============ Complexity ============

CyclomaticComplexity cyclomatic_complexity(const SourceTree &tree) {
    CyclomaticComplexity result;
    if (!tree.ok())
        return result;

    tree.visit_nodes(tree.root(), [&](TSNode node) {
        if (!SourceTree::is(node, "function_definition"))
            return true;

        int complexity = 1;
        tree.visit_nodes(node, [&](TSNode child) {
            std::string type = ts_node_type(child);
            if (type == "if_statement" || type == "elif_clause" || type == "while_statement" ||
                type == "for_statement" || type == "except_clause" ||
                type == "except_group_clause" || type == "lambda") {
                complexity++;
            } else if (type == "boolean_operator" && starts_boolean_chain(child)) {
                complexity++;
            }
            return true;
        });
        result.functions[tree.text(SourceTree::field(node, "name"))] = complexity;
        return true;
    });

    for (const auto &[name, complexity] : result.functions) {
        result.total += complexity;
        result.max = std::max(result.max, complexity);
    }
    if (!result.functions.empty())
        result.average = static_cast<double>(result.total) / static_cast<double>(result.functions.size());
    return result;
}

HalsteadMetrics halstead_metrics(const SourceTree &tree) {
    HalsteadMetrics result;
    if (!tree.ok())
        return result;

    std::set<std::string> operators;
    std::set<std::string> operands;

    tree.visit_nodes(tree.root(), [&](TSNode node) {
        if (SourceTree::is(node, "comment"))
            return false;

        std::string op = halstead_operator(node);
        if (!op.empty()) {
            operators.insert(op);
            result.total_operators++;
        } else if (SourceTree::is(node, "identifier") && is_operand_identifier(node)) {
            operands.insert(tree.text(node));
            result.total_operands++;
        } else if (is_literal(node)) {
            operands.insert(tree.text(node));
            result.total_operands++;
        }
        return true;
    });

    result.distinct_operators = operators.size();
    result.distinct_operands = operands.size();
    if (result.distinct_operators == 0 || result.distinct_operands == 0)
        return result;

    double n1 = static_cast<double>(result.distinct_operators);
    double n2 = static_cast<double>(result.distinct_operands);
    double vocabulary = n1 + n2;
    double length = static_cast<double>(result.total_operators + result.total_operands);

    result.volume = length * std::log2(vocabulary);
    result.difficulty = (n1 / 2.0) * (static_cast<double>(result.total_operands) / n2);
    result.effort = result.difficulty * result.volume;
    return result;
}

// ============ Exception handling and annotations ============

ExceptionProfile exception_profile(const SourceTree &tree) {
    ExceptionProfile profile;
    if (!tree.ok())
        return profile;

    tree.visit_nodes(tree.root(), [&](TSNode node) {
        if (SourceTree::is(node, "raise_statement")) {
            profile.raise_statements++;
            return true;
        }
        if (!SourceTree::is(node, "try_statement"))
            return true;

        profile.try_blocks++;
        uint32_t count = ts_node_named_child_count(node);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode child = ts_node_named_child(node, i);
            if (SourceTree::is(child, "except_clause") || SourceTree::is(child, "except_group_clause"))
                add_handler(tree, child, profile);
            else if (SourceTree::is(child, "finally_clause"))
                profile.finally_blocks++;
            else if (SourceTree::is(child, "else_clause"))
                profile.else_blocks++;
        }
        return true;
    });
    return profile;
}

AnnotationProfile annotation_profile(const SourceTree &tree) {
    AnnotationProfile profile;
    if (!tree.ok())
        return profile;

    tree.visit_nodes(tree.root(), [&](TSNode node) {
        if (SourceTree::is(node, "function_definition")) {
            count_parameters(tree, SourceTree::field(node, "parameters"), profile);
            TSNode returns = SourceTree::field(node, "return_type");
            if (!ts_node_is_null(returns)) {
                profile.return_annotations++;
                add_type(tree, returns, profile);
            }
        } else if (SourceTree::is(node, "assignment")) {
            TSNode annotation = SourceTree::field(node, "type");
            if (!ts_node_is_null(annotation)) {
                profile.variable_annotations++;
                add_type(tree, annotation, profile);
            }
        }
        return true;
    });
    return profile;
}

std::map<std::string, double> exception_deltas(const ExceptionProfile &before,
                                               const ExceptionProfile &after) {
    double try_delta = after.try_blocks - before.try_blocks;
    double handler_delta = after.except_handlers - before.except_handlers;
    double added = static_cast<double>(count_difference(after.exception_types, before.exception_types));
    double removed = static_cast<double>(count_difference(before.exception_types, after.exception_types));

    std::map<std::string, double> deltas;
    deltas["try_blocks_delta"] = try_delta;
    deltas["except_handlers_delta"] = handler_delta;
    deltas["new_exception_types"] = added;
    deltas["removed_exception_types"] = removed;
    deltas["exception_specificity_change"] = after.generic_excepts - before.generic_excepts;
    deltas["finally_blocks_delta"] = after.finally_blocks - before.finally_blocks;
    deltas["raise_statements_delta"] = after.raise_statements - before.raise_statements;
    deltas["total_exception_changes"] = std::abs(try_delta) + std::abs(handler_delta) + added + removed;
    return deltas;
}

std::map<std::string, double> annotation_deltas(const AnnotationProfile &before,
                                                const AnnotationProfile &after) {
    double args = after.annotated_args - before.annotated_args;
    double returns = after.return_annotations - before.return_annotations;
    double variables = after.variable_annotations - before.variable_annotations;
    double added = static_cast<double>(count_difference(after.type_names, before.type_names));
    double removed = static_cast<double>(count_difference(before.type_names, after.type_names));

    std::map<std::string, double> deltas;
    deltas["annotated_args_delta"] = args;
    deltas["return_annotations_delta"] = returns;
    deltas["variable_annotations_delta"] = variables;
    deltas["new_types"] = added;
    deltas["removed_types"] = removed;
    deltas["total_type_changes"] =
        std::abs(args) + std::abs(returns) + std::abs(variables) + added + removed;
    return deltas;
}

} // namespace graphdelta
