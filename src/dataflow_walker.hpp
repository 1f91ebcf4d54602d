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

#include "graphdelta/graph.hpp"
#include "graphdelta/source_tree.hpp"
#include <string>
#include <vector>

namespace graphdelta {

// A variable name at a source line
struct NameRef {
    std::string name;
    uint32_t line;
};

// Identifiers read by an expression. Attribute names, keyword-argument
// names and names bound inside lambdas or comprehensions are skipped.
void collect_reads(const SourceTree &tree, TSNode expr, std::vector<NameRef> &out);

// Names bound by an assignment target. Reads hidden in the target
// (`obj.attr = ...`, `a[i] = ...`) go to `reads`.
void collect_targets(const SourceTree &tree, TSNode target, std::vector<NameRef> &defs,
                     std::vector<NameRef> &reads);

// Parameter names of a `parameters` / `lambda_parameters` node
std::vector<std::string> parameter_names(const SourceTree &tree, TSNode params);

// Entry on the symbol-table stack
struct ScopeFrame {
    int id;
    std::string name; // "__module__" or "func_<name>"
};

// Shared statement walk for the DFG builders. Derived builders decide what
// a definition and a use turn into and how def-use edges are drawn.
class DataFlowWalker {
public:

    virtual ~DataFlowWalker() = default;

    // Walk the whole module, then draw def-use edges
    void run();

protected:

    // Statement whose anchor node is created on its first def or use
    struct Anchor {
        std::string label;
        uint32_t line = 0;
        std::string id;
    };

    DataFlowWalker(const SourceTree &tree, Dfg &dfg);

    std::string next_id() { return "d" + std::to_string(counter_++); }
    const ScopeFrame &scope() const { return scopes_.back(); }
    bool at_module_scope() const { return scopes_.size() == 1; }

    // Statement -> definition and use -> statement data-flow edges
    void link_definition(Anchor *anchor, const std::string &def_id);
    void link_use(const std::string &use_id, Anchor &anchor);

    void walk_block(TSNode block);
    void read_all(TSNode expr, Anchor &anchor);
    void bind_targets(TSNode target, Anchor &anchor);

    // if / elif chains; `next` indexes the elif/else clauses
    virtual void walk_conditional(TSNode clause, const std::vector<TSNode> &alternatives,
                                  size_t next);
    virtual void walk_for(TSNode stmt);

    // Scope push/pop around a function body
    virtual void enter_function(const std::string &name);
    virtual void leave_function();

    virtual void on_definition(const std::string &var, uint32_t line, Anchor *anchor,
                               bool is_param) = 0;
    virtual void on_use(const std::string &var, uint32_t line, Anchor &anchor) = 0;

    // Draw def-use edges once the walk is done
    virtual void finish() = 0;

    Anchor anchor_for(TSNode stmt) const;

    const SourceTree &tree_;
    Dfg &dfg_;

private:

    std::vector<ScopeFrame> scopes_;
    int next_scope_id_ = 1;
    size_t counter_ = 0;

    void walk_statement(TSNode stmt);
    void walk_assignment(TSNode assignment, Anchor &anchor);
    void walk_while(TSNode stmt);
    void walk_try(TSNode stmt);
    void walk_except(TSNode clause);
    void walk_with(TSNode stmt);
    void walk_function(TSNode stmt);
    void walk_class(TSNode stmt);

    const std::string &anchor_id(Anchor &anchor);
};

} // namespace graphdelta
