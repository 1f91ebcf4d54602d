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

#include "dataflow_walker.hpp"
#include "graphdelta/dfg_builder.hpp"
#include <set>

namespace graphdelta {

// ============ Expression helpers ============

static bool is_comprehension(TSNode node) {
    return SourceTree::is(node, "list_comprehension") ||
           SourceTree::is(node, "set_comprehension") ||
           SourceTree::is(node, "dictionary_comprehension") ||
           SourceTree::is(node, "generator_expression");
}

static void collect_reads_bound(const SourceTree &tree, TSNode node,
                                const std::set<std::string> &bound, std::vector<NameRef> &out) {
    if (ts_node_is_null(node))
        return;

    if (SourceTree::is(node, "identifier")) {
        std::string name = tree.text(node);
        if (bound.count(name) == 0)
            out.push_back({name, SourceTree::line(node)});
        return;
    }
    if (SourceTree::is(node, "attribute")) {
        collect_reads_bound(tree, SourceTree::field(node, "object"), bound, out);
        return;
    }
    if (SourceTree::is(node, "keyword_argument")) {
        collect_reads_bound(tree, SourceTree::field(node, "value"), bound, out);
        return;
    }
    if (SourceTree::is(node, "lambda")) {
        std::set<std::string> inner = bound;
        for (const auto &name : parameter_names(tree, SourceTree::field(node, "parameters")))
            inner.insert(name);
        collect_reads_bound(tree, SourceTree::field(node, "body"), inner, out);
        return;
    }
    if (is_comprehension(node)) {
        std::set<std::string> inner = bound;
        uint32_t count = ts_node_named_child_count(node);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode child = ts_node_named_child(node, i);
            if (SourceTree::is(child, "for_in_clause")) {
                std::vector<NameRef> defs;
                std::vector<NameRef> ignored;
                collect_targets(tree, SourceTree::field(child, "left"), defs, ignored);
                for (const auto &def : defs)
                    inner.insert(def.name);
            }
        }
        for (uint32_t i = 0; i < count; ++i) {
            TSNode child = ts_node_named_child(node, i);
            if (SourceTree::is(child, "for_in_clause")) {
                collect_reads_bound(tree, SourceTree::field(child, "right"), inner, out);
            } else {
                collect_reads_bound(tree, child, inner, out);
            }
        }
        return;
    }
    if (SourceTree::is(node, "comment"))
        return;

    uint32_t count = ts_node_named_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        collect_reads_bound(tree, ts_node_named_child(node, i), bound, out);
    }
}

void collect_reads(const SourceTree &tree, TSNode expr, std::vector<NameRef> &out) {
    collect_reads_bound(tree, expr, {}, out);
}

void collect_targets(const SourceTree &tree, TSNode target, std::vector<NameRef> &defs,
                     std::vector<NameRef> &reads) {
    if (ts_node_is_null(target))
        return;

    if (SourceTree::is(target, "identifier")) {
        defs.push_back({tree.text(target), SourceTree::line(target)});
        return;
    }
    if (SourceTree::is(target, "pattern_list") || SourceTree::is(target, "tuple_pattern") ||
        SourceTree::is(target, "list_pattern") || SourceTree::is(target, "tuple") ||
        SourceTree::is(target, "list") || SourceTree::is(target, "expression_list") ||
        SourceTree::is(target, "parenthesized_expression") ||
        SourceTree::is(target, "list_splat_pattern") || SourceTree::is(target, "list_splat") ||
        SourceTree::is(target, "as_pattern_target")) {
        uint32_t count = ts_node_named_child_count(target);
        for (uint32_t i = 0; i < count; ++i) {
            collect_targets(tree, ts_node_named_child(target, i), defs, reads);
        }
        return;
    }
    // obj.attr, a[i] and anything else only read
    collect_reads(tree, target, reads);
}

std::vector<std::string> parameter_names(const SourceTree &tree, TSNode params) {
    std::vector<std::string> names;
    if (ts_node_is_null(params))
        return names;

    uint32_t count = ts_node_named_child_count(params);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode param = ts_node_named_child(params, i);
        TSNode name_node{};

        if (SourceTree::is(param, "identifier")) {
            name_node = param;
        } else if (SourceTree::is(param, "default_parameter") ||
                   SourceTree::is(param, "typed_default_parameter")) {
            name_node = SourceTree::field(param, "name");
        } else if (SourceTree::is(param, "typed_parameter") ||
                   SourceTree::is(param, "list_splat_pattern") ||
                   SourceTree::is(param, "dictionary_splat_pattern")) {
            if (ts_node_named_child_count(param) > 0)
                name_node = ts_node_named_child(param, 0);
            // typed_parameter may wrap *args / **kwargs
            if (SourceTree::is(name_node, "list_splat_pattern") ||
                SourceTree::is(name_node, "dictionary_splat_pattern")) {
                name_node = ts_node_named_child_count(name_node) > 0
                                ? ts_node_named_child(name_node, 0)
                                : TSNode{};
            }
        }

        if (SourceTree::is(name_node, "identifier"))
            names.push_back(tree.text(name_node));
    }
    return names;
}

// ============ DataFlowWalker ============

DataFlowWalker::DataFlowWalker(const SourceTree &tree, Dfg &dfg) : tree_(tree), dfg_(dfg) {
    scopes_.push_back({0, MODULE_SCOPE});
}

void DataFlowWalker::run() {
    if (!tree_.ok()) {
        dfg_.add_node(next_id(), NodeType::Statement, tree_.error());
        return;
    }
    walk_block(tree_.root());
    finish();
}

DataFlowWalker::Anchor DataFlowWalker::anchor_for(TSNode stmt) const {
    Anchor anchor;
    anchor.label = tree_.statement_label(stmt);
    anchor.line = SourceTree::line(stmt);
    return anchor;
}

const std::string &DataFlowWalker::anchor_id(Anchor &anchor) {
    if (anchor.id.empty()) {
        anchor.id = next_id();
        dfg_.add_node(anchor.id, NodeType::Statement, anchor.label, anchor.line);
    }
    return anchor.id;
}

void DataFlowWalker::link_definition(Anchor *anchor, const std::string &def_id) {
    if (anchor)
        dfg_.add_edge(anchor_id(*anchor), def_id, EdgeType::DataFlow);
}

void DataFlowWalker::link_use(const std::string &use_id, Anchor &anchor) {
    dfg_.add_edge(use_id, anchor_id(anchor), EdgeType::DataFlow);
}

void DataFlowWalker::read_all(TSNode expr, Anchor &anchor) {
    std::vector<NameRef> reads;
    collect_reads(tree_, expr, reads);
    for (const auto &ref : reads) {
        on_use(ref.name, ref.line, anchor);
    }
}

void DataFlowWalker::bind_targets(TSNode target, Anchor &anchor) {
    std::vector<NameRef> defs;
    std::vector<NameRef> reads;
    collect_targets(tree_, target, defs, reads);
    for (const auto &ref : reads) {
        on_use(ref.name, ref.line, anchor);
    }
    for (const auto &ref : defs) {
        on_definition(ref.name, ref.line, &anchor, false);
    }
}

void DataFlowWalker::walk_block(TSNode block) {
    for (TSNode stmt : tree_.statements(block)) {
        walk_statement(stmt);
    }
}

void DataFlowWalker::walk_statement(TSNode stmt) {
    if (SourceTree::is(stmt, "expression_statement")) {
        Anchor anchor = anchor_for(stmt);
        uint32_t count = ts_node_named_child_count(stmt);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode expr = ts_node_named_child(stmt, i);
            if (SourceTree::is(expr, "assignment")) {
                walk_assignment(expr, anchor);
            } else if (SourceTree::is(expr, "augmented_assignment")) {
                TSNode left = SourceTree::field(expr, "left");
                read_all(SourceTree::field(expr, "right"), anchor);
                if (SourceTree::is(left, "identifier"))
                    read_all(left, anchor);
                bind_targets(left, anchor);
            } else {
                read_all(expr, anchor);
            }
        }
        return;
    }

    if (SourceTree::is(stmt, "if_statement")) {
        std::vector<TSNode> alternatives;
        uint32_t count = ts_node_named_child_count(stmt);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode child = ts_node_named_child(stmt, i);
            if (SourceTree::is(child, "elif_clause") || SourceTree::is(child, "else_clause"))
                alternatives.push_back(child);
        }
        walk_conditional(stmt, alternatives, 0);
        return;
    }
    if (SourceTree::is(stmt, "for_statement")) {
        walk_for(stmt);
        return;
    }
    if (SourceTree::is(stmt, "while_statement")) {
        walk_while(stmt);
        return;
    }
    if (SourceTree::is(stmt, "try_statement")) {
        walk_try(stmt);
        return;
    }
    if (SourceTree::is(stmt, "with_statement")) {
        walk_with(stmt);
        return;
    }
    if (SourceTree::is(stmt, "function_definition") ||
        SourceTree::is(stmt, "decorated_definition")) {
        walk_function(stmt);
        return;
    }
    if (SourceTree::is(stmt, "class_definition")) {
        walk_class(stmt);
        return;
    }
    if (SourceTree::is(stmt, "import_statement") || SourceTree::is(stmt, "import_from_statement") ||
        SourceTree::is(stmt, "future_import_statement") || SourceTree::is(stmt, "pass_statement") ||
        SourceTree::is(stmt, "break_statement") || SourceTree::is(stmt, "continue_statement") ||
        SourceTree::is(stmt, "global_statement") || SourceTree::is(stmt, "nonlocal_statement")) {
        return;
    }

    // return, raise, assert, del and the rest only read
    Anchor anchor = anchor_for(stmt);
    read_all(stmt, anchor);
}

void DataFlowWalker::walk_assignment(TSNode assignment, Anchor &anchor) {
    // a = b = value chains nest on the right
    std::vector<TSNode> targets{SourceTree::field(assignment, "left")};
    TSNode right = SourceTree::field(assignment, "right");
    while (SourceTree::is(right, "assignment")) {
        targets.push_back(SourceTree::field(right, "left"));
        right = SourceTree::field(right, "right");
    }

    // Annotation without a value binds nothing
    if (ts_node_is_null(right))
        return;

    read_all(right, anchor);
    for (TSNode target : targets) {
        bind_targets(target, anchor);
    }
}

void DataFlowWalker::walk_conditional(TSNode clause, const std::vector<TSNode> &alternatives,
                                      size_t next) {
    Anchor anchor = anchor_for(clause);
    read_all(SourceTree::field(clause, "condition"), anchor);
    walk_block(SourceTree::field(clause, "consequence"));

    if (next < alternatives.size()) {
        TSNode alt = alternatives[next];
        if (SourceTree::is(alt, "elif_clause")) {
            walk_conditional(alt, alternatives, next + 1);
        } else {
            walk_block(SourceTree::body(alt));
        }
    }
}

void DataFlowWalker::walk_for(TSNode stmt) {
    Anchor anchor = anchor_for(stmt);
    read_all(SourceTree::field(stmt, "right"), anchor);
    bind_targets(SourceTree::field(stmt, "left"), anchor);
    walk_block(SourceTree::field(stmt, "body"));

    TSNode alternative = SourceTree::field(stmt, "alternative");
    if (!ts_node_is_null(alternative))
        walk_block(SourceTree::body(alternative));
}

void DataFlowWalker::walk_while(TSNode stmt) {
    Anchor anchor = anchor_for(stmt);
    read_all(SourceTree::field(stmt, "condition"), anchor);
    walk_block(SourceTree::field(stmt, "body"));

    TSNode alternative = SourceTree::field(stmt, "alternative");
    if (!ts_node_is_null(alternative))
        walk_block(SourceTree::body(alternative));
}

void DataFlowWalker::walk_try(TSNode stmt) {
    walk_block(SourceTree::field(stmt, "body"));

    uint32_t count = ts_node_named_child_count(stmt);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode child = ts_node_named_child(stmt, i);
        if (SourceTree::is(child, "except_clause") ||
            SourceTree::is(child, "except_group_clause")) {
            walk_except(child);
        } else if (SourceTree::is(child, "else_clause") ||
                   SourceTree::is(child, "finally_clause")) {
            walk_block(SourceTree::body(child));
        }
    }
}

void DataFlowWalker::walk_except(TSNode clause) {
    // Header text without the handler body
    std::vector<TSNode> header;
    uint32_t count = ts_node_named_child_count(clause);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode child = ts_node_named_child(clause, i);
        if (!SourceTree::is(child, "block") && !SourceTree::is(child, "comment"))
            header.push_back(child);
    }

    Anchor anchor;
    anchor.line = SourceTree::line(clause);
    anchor.label = "except";
    for (TSNode part : header)
        anchor.label += " " + tree_.text(part);
    anchor.label = truncate_label(anchor.label);

    for (size_t i = 0; i < header.size(); ++i) {
        TSNode part = header[i];
        if (SourceTree::is(part, "as_pattern")) {
            if (ts_node_named_child_count(part) > 0)
                read_all(ts_node_named_child(part, 0), anchor);
            bind_targets(SourceTree::field(part, "alias"), anchor);
        } else if (i > 0 && SourceTree::is(part, "identifier")) {
            // except E, name / except E as name on older grammars
            bind_targets(part, anchor);
        } else {
            read_all(part, anchor);
        }
    }

    walk_block(SourceTree::body(clause));
}

void DataFlowWalker::walk_with(TSNode stmt) {
    Anchor anchor = anchor_for(stmt);
    uint32_t count = ts_node_named_child_count(stmt);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode clause = ts_node_named_child(stmt, i);
        if (!SourceTree::is(clause, "with_clause"))
            continue;
        uint32_t items = ts_node_named_child_count(clause);
        for (uint32_t j = 0; j < items; ++j) {
            TSNode item = ts_node_named_child(clause, j);
            TSNode value = SourceTree::field(item, "value");
            if (SourceTree::is(value, "as_pattern")) {
                if (ts_node_named_child_count(value) > 0)
                    read_all(ts_node_named_child(value, 0), anchor);
                bind_targets(SourceTree::field(value, "alias"), anchor);
            } else {
                read_all(ts_node_is_null(value) ? item : value, anchor);
            }
        }
    }
    walk_block(SourceTree::field(stmt, "body"));
}

void DataFlowWalker::walk_function(TSNode stmt) {
    TSNode def = SourceTree::definition(stmt);
    if (!SourceTree::is(def, "function_definition")) {
        walk_class(def);
        return;
    }

    Anchor anchor = anchor_for(def);

    // Decorators and defaults are evaluated in the enclosing scope
    uint32_t count = ts_node_named_child_count(stmt);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode child = ts_node_named_child(stmt, i);
        if (SourceTree::is(child, "decorator"))
            read_all(child, anchor);
    }
    TSNode params = SourceTree::field(def, "parameters");
    uint32_t param_count = ts_node_named_child_count(params);
    for (uint32_t i = 0; i < param_count; ++i) {
        TSNode param = ts_node_named_child(params, i);
        if (SourceTree::is(param, "default_parameter") ||
            SourceTree::is(param, "typed_default_parameter"))
            read_all(SourceTree::field(param, "value"), anchor);
    }

    enter_function(tree_.text(SourceTree::field(def, "name")));
    for (const auto &name : parameter_names(tree_, params)) {
        on_definition(name, anchor.line, &anchor, true);
    }
    walk_block(SourceTree::field(def, "body"));
    leave_function();
}

void DataFlowWalker::walk_class(TSNode stmt) {
    Anchor anchor = anchor_for(stmt);
    read_all(SourceTree::field(stmt, "superclasses"), anchor);
    walk_block(SourceTree::field(stmt, "body"));
}

void DataFlowWalker::enter_function(const std::string &name) {
    scopes_.push_back({next_scope_id_++, "func_" + name});
}

void DataFlowWalker::leave_function() {
    if (scopes_.size() > 1)
        scopes_.pop_back();
}

} // namespace graphdelta
