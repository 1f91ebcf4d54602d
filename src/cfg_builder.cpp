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

#include "graphdelta/cfg_builder.hpp"
#include <deque>

namespace graphdelta {

namespace {

// Node ids a statement may continue from
using ExitSet = std::vector<std::string>;

struct PendingFunction {
    std::string qualified_name;
    TSNode node;
};

class CfgContext {
public:

    CfgContext(const SourceTree &tree, Cfg &cfg, bool expand_functions)
        : tree_(tree), cfg_(cfg), expand_functions_(expand_functions) {}

    void build() {
        if (!tree_.ok()) {
            std::string id = new_node(NodeType::Statement, tree_.error(), 0);
            cfg_.entry = id;
            cfg_.exits = {id};
            return;
        }

        std::string entry = new_node(NodeType::Entry, "entry", 0);
        ExitSet exits = visit_block(tree_.root(), {entry}, EdgeType::ControlFlow);
        std::string exit = new_node(NodeType::Exit, "exit", 0);
        connect(exits, exit, EdgeType::ControlFlow);
        cfg_.entry = entry;
        cfg_.exits = {exit};

        // Functions discovered while building may queue nested ones
        while (!pending_.empty()) {
            PendingFunction fn = pending_.front();
            pending_.pop_front();
            build_function(fn);
        }
    }

private:

    const SourceTree &tree_;
    Cfg &cfg_;
    bool expand_functions_;
    size_t counter_ = 0;
    std::string prefix_; // Qualified-name prefix of the scope being built
    std::deque<PendingFunction> pending_;

    std::string new_node(NodeType type, const std::string &label, uint32_t line) {
        std::string id = "n" + std::to_string(counter_++);
        cfg_.add_node(id, type, label, line);
        return id;
    }

    void connect(const ExitSet &from, const std::string &to, EdgeType type,
                 const std::string &label = "") {
        for (const auto &source : from) {
            cfg_.add_edge(source, to, type, label);
        }
    }

    void build_function(const PendingFunction &fn) {
        prefix_ = fn.qualified_name + ".";
        std::string entry = new_node(NodeType::Entry, "entry", SourceTree::line(fn.node));
        ExitSet exits =
            visit_block(SourceTree::field(fn.node, "body"), {entry}, EdgeType::ControlFlow);
        std::string exit =
            new_node(NodeType::Exit, "exit", ts_node_end_point(fn.node).row + 1);
        connect(exits, exit, EdgeType::ControlFlow);
        cfg_.scopes.push_back({fn.qualified_name, entry, exit});
    }

    // The first statement is entered through `entry_edge`, the rest by control flow
    ExitSet visit_block(TSNode block, const ExitSet &preds, EdgeType entry_edge) {
        ExitSet current = preds;
        EdgeType edge = entry_edge;
        for (TSNode stmt : tree_.statements(block)) {
            current = visit_statement(stmt, current, edge);
            edge = EdgeType::ControlFlow;
        }
        return current;
    }

    ExitSet visit_statement(TSNode stmt, const ExitSet &preds, EdgeType entry_edge) {
        TSNode def = SourceTree::definition(stmt);
        uint32_t line = SourceTree::line(stmt);

        if (SourceTree::is(def, "if_statement")) {
            std::vector<TSNode> alternatives;
            uint32_t count = ts_node_named_child_count(def);
            for (uint32_t i = 0; i < count; ++i) {
                TSNode child = ts_node_named_child(def, i);
                if (SourceTree::is(child, "elif_clause") || SourceTree::is(child, "else_clause"))
                    alternatives.push_back(child);
            }
            return visit_conditional(def, alternatives, 0, preds, entry_edge);
        }
        if (SourceTree::is(def, "while_statement") || SourceTree::is(def, "for_statement")) {
            return visit_loop(def, preds, entry_edge);
        }
        if (SourceTree::is(def, "try_statement")) {
            return visit_try(def, preds, entry_edge);
        }
        if (SourceTree::is(def, "with_statement")) {
            std::string header = new_node(NodeType::Statement, tree_.statement_label(def), line);
            connect(preds, header, entry_edge);
            return visit_block(SourceTree::field(def, "body"), {header}, EdgeType::ControlFlow);
        }
        if (SourceTree::is(def, "function_definition")) {
            std::string id = new_node(NodeType::Statement, tree_.statement_label(def), line);
            connect(preds, id, entry_edge);
            if (expand_functions_) {
                pending_.push_back({prefix_ + tree_.text(SourceTree::field(def, "name")), def});
            }
            return {id};
        }
        if (SourceTree::is(def, "class_definition")) {
            std::string id = new_node(NodeType::Statement, tree_.statement_label(def), line);
            connect(preds, id, entry_edge);
            if (expand_functions_) {
                queue_methods(def, prefix_);
            }
            return {id};
        }

        // return / break / continue and simple statements: one node, no propagation
        std::string id = new_node(NodeType::Statement, tree_.statement_label(def), line);
        connect(preds, id, entry_edge);
        return {id};
    }

    ExitSet visit_conditional(TSNode clause, const std::vector<TSNode> &alternatives,
                              size_t next, const ExitSet &preds, EdgeType entry_edge) {
        uint32_t line = SourceTree::line(clause);
        std::string branch = new_node(NodeType::Branch, tree_.statement_label(clause), line);
        connect(preds, branch, entry_edge);

        ExitSet exits =
            visit_block(SourceTree::field(clause, "consequence"), {branch}, EdgeType::TrueBranch);

        bool has_else = next < alternatives.size();
        if (has_else) {
            TSNode alt = alternatives[next];
            ExitSet else_exits;
            if (SourceTree::is(alt, "elif_clause")) {
                // elif is a nested if on the false edge
                else_exits = visit_conditional(alt, alternatives, next + 1, {branch},
                                               EdgeType::FalseBranch);
            } else {
                else_exits = visit_block(SourceTree::body(alt), {branch}, EdgeType::FalseBranch);
            }
            exits.insert(exits.end(), else_exits.begin(), else_exits.end());
        }

        std::string merge = new_node(NodeType::Statement, "merge", line);
        connect(exits, merge, EdgeType::ControlFlow);
        if (!has_else) {
            connect({branch}, merge, EdgeType::FalseBranch);
        }
        return {merge};
    }

    ExitSet visit_loop(TSNode stmt, const ExitSet &preds, EdgeType entry_edge) {
        uint32_t line = SourceTree::line(stmt);
        std::string header = new_node(NodeType::Loop, tree_.statement_label(stmt), line);
        connect(preds, header, entry_edge);

        ExitSet body_exits =
            visit_block(SourceTree::field(stmt, "body"), {header}, EdgeType::TrueBranch);
        connect(body_exits, header, EdgeType::ControlFlow, "back");

        std::string after = new_node(NodeType::Statement, "after_loop", line);
        connect({header}, after, EdgeType::FalseBranch);

        TSNode alternative = SourceTree::field(stmt, "alternative");
        if (!ts_node_is_null(alternative)) {
            return visit_block(SourceTree::body(alternative), {after}, EdgeType::ControlFlow);
        }
        return {after};
    }

    ExitSet visit_try(TSNode stmt, const ExitSet &preds, EdgeType entry_edge) {
        ExitSet exits = visit_block(SourceTree::field(stmt, "body"), preds, entry_edge);

        ExitSet handler_exits;
        TSNode else_clause{};
        TSNode finally_clause{};
        uint32_t count = ts_node_named_child_count(stmt);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode child = ts_node_named_child(stmt, i);
            if (SourceTree::is(child, "except_clause") ||
                SourceTree::is(child, "except_group_clause")) {
                // Handlers hang off the try's predecessors, not its statements
                ExitSet h = visit_block(SourceTree::body(child), preds, entry_edge);
                handler_exits.insert(handler_exits.end(), h.begin(), h.end());
            } else if (SourceTree::is(child, "else_clause")) {
                else_clause = child;
            } else if (SourceTree::is(child, "finally_clause")) {
                finally_clause = child;
            }
        }

        if (!ts_node_is_null(else_clause)) {
            exits = visit_block(SourceTree::body(else_clause), exits, EdgeType::ControlFlow);
        }
        exits.insert(exits.end(), handler_exits.begin(), handler_exits.end());

        if (!ts_node_is_null(finally_clause)) {
            return visit_block(SourceTree::body(finally_clause), exits, EdgeType::ControlFlow);
        }
        return exits;
    }

    void queue_methods(TSNode cls, const std::string &prefix) {
        std::string class_prefix = prefix + tree_.text(SourceTree::field(cls, "name")) + ".";
        for (TSNode stmt : tree_.statements(SourceTree::field(cls, "body"))) {
            TSNode def = SourceTree::definition(stmt);
            if (SourceTree::is(def, "function_definition")) {
                pending_.push_back({class_prefix + tree_.text(SourceTree::field(def, "name")), def});
            } else if (SourceTree::is(def, "class_definition")) {
                queue_methods(def, class_prefix);
            }
        }
    }
};

} // namespace

CfgBuilder::CfgBuilder(const CfgBuilderOptions &options) : options_(options) {}

Cfg CfgBuilder::build(const std::string &source) const {
    SourceTree tree(source);
    return build(tree);
}

Cfg CfgBuilder::build(const SourceTree &tree) const {
    Cfg cfg("cfg");
    CfgContext context(tree, cfg, options_.expand_functions);
    context.build();
    return cfg;
}

} // namespace graphdelta
