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

#include "graphdelta/dfg_builder.hpp"
#include "dataflow_walker.hpp"
#include <set>
#include <tuple>

namespace graphdelta {

namespace {

// Versions visible at a program point
struct VersionSnapshot {
    std::map<std::string, int> current;
    std::map<std::string, std::string> current_def; // var -> node id of that version
};

// Per-function version bookkeeping
struct VersionState {
    std::map<std::string, int> counter; // Monotonic, never rolled back
    VersionSnapshot visible;
};

struct VersionedDef {
    std::string id;
    uint32_t line;
};

struct VersionedUse {
    std::string id;
    std::string var;
    int version;
    uint32_t line;
    int scope_id;
};

class SsaDfgWalker : public DataFlowWalker {
public:

    SsaDfgWalker(const SourceTree &tree, Dfg &dfg) : DataFlowWalker(tree, dfg) {
        versions_.emplace_back();
    }

protected:

    void on_definition(const std::string &var, uint32_t line, Anchor *anchor,
                       bool is_param) override {
        int version = next_version(var);
        std::string label = "def " + var + "_" + std::to_string(version) + "@" +
                            std::to_string(line) + (is_param ? " (param)" : "");
        std::string id = add_definition_node(var, version, line, label, false, is_param);
        link_definition(anchor, id);
    }

    void on_use(const std::string &var, uint32_t line, Anchor &anchor) override {
        const auto &current = versions_.back().visible.current;
        auto it = current.find(var);
        int version = (it != current.end()) ? it->second : 0;

        Node node;
        node.id = next_id();
        node.type = NodeType::Use;
        node.label = "use " + var + "_" + std::to_string(version) + "@" + std::to_string(line);
        node.line = line;
        node.var_name = var;
        node.version = version;
        node.scope = scope().name;

        std::string id = node.id;
        dfg_.add_node(std::move(node));
        dfg_.add_use(var, id);
        uses_.push_back({id, var, version, line, scope().id});
        link_use(id, anchor);
    }

    void walk_conditional(TSNode clause, const std::vector<TSNode> &alternatives,
                          size_t next) override {
        Anchor anchor = anchor_for(clause);
        read_all(SourceTree::field(clause, "condition"), anchor);

        VersionSnapshot before = versions_.back().visible;
        walk_block(SourceTree::field(clause, "consequence"));
        VersionSnapshot then_state = versions_.back().visible;

        // The false path starts from the pre-branch versions
        versions_.back().visible = before;
        if (next < alternatives.size()) {
            TSNode alt = alternatives[next];
            if (SourceTree::is(alt, "elif_clause")) {
                walk_conditional(alt, alternatives, next + 1);
            } else {
                walk_block(SourceTree::body(alt));
            }
        }
        VersionSnapshot else_state = versions_.back().visible;

        std::set<std::string> vars;
        for (const auto &[var, version] : then_state.current)
            vars.insert(var);
        for (const auto &[var, version] : else_state.current)
            vars.insert(var);

        uint32_t line = SourceTree::line(clause);
        for (const auto &var : vars) {
            int then_version = lookup(then_state.current, var, 0);
            int else_version = lookup(else_state.current, var, 0);
            if (then_version == else_version)
                continue;
            add_phi(var, line, "if_merge",
                    {lookup(then_state.current_def, var, std::string()),
                     lookup(else_state.current_def, var, std::string())});
        }
    }

    // Loop-entry and loop-exit phi for each loop target; no fixed point
    void walk_for(TSNode stmt) override {
        Anchor anchor = anchor_for(stmt);
        uint32_t line = SourceTree::line(stmt);
        read_all(SourceTree::field(stmt, "right"), anchor);

        std::vector<NameRef> targets;
        std::vector<NameRef> reads;
        collect_targets(tree_, SourceTree::field(stmt, "left"), targets, reads);
        for (const auto &ref : reads)
            on_use(ref.name, ref.line, anchor);

        std::vector<std::string> entry_phis;
        for (const auto &target : targets) {
            std::string incoming =
                lookup(versions_.back().visible.current_def, target.name, std::string());
            std::string phi = add_phi(target.name, line, "for_loop", {incoming});
            link_definition(&anchor, phi);
            entry_phis.push_back(phi);
        }

        walk_block(SourceTree::field(stmt, "body"));

        for (size_t i = 0; i < targets.size(); ++i) {
            std::string body_def =
                lookup(versions_.back().visible.current_def, targets[i].name, std::string());
            add_phi(targets[i].name, line, "for_exit", {entry_phis[i], body_def});
        }

        TSNode alternative = SourceTree::field(stmt, "alternative");
        if (!ts_node_is_null(alternative))
            walk_block(SourceTree::body(alternative));
    }

    // Versions restart inside every function
    void enter_function(const std::string &name) override {
        DataFlowWalker::enter_function(name);
        versions_.emplace_back();
    }

    void leave_function() override {
        if (versions_.size() > 1)
            versions_.pop_back();
        DataFlowWalker::leave_function();
    }

    // Same scope, same version, earlier line
    void finish() override {
        for (const auto &use : uses_) {
            auto it = defs_.find(std::make_tuple(use.scope_id, use.var, use.version));
            if (it == defs_.end())
                continue;
            if (it->second.line < use.line)
                dfg_.add_edge(it->second.id, use.id, EdgeType::DefUse, use.var);
        }
    }

private:

    std::vector<VersionState> versions_;
    std::map<std::tuple<int, std::string, int>, VersionedDef> defs_;
    std::vector<VersionedUse> uses_;

    template <typename T>
    static T lookup(const std::map<std::string, T> &map, const std::string &key, T fallback) {
        auto it = map.find(key);
        return (it != map.end()) ? it->second : fallback;
    }

    int next_version(const std::string &var) {
        VersionState &state = versions_.back();
        int version = ++state.counter[var];
        state.visible.current[var] = version;
        return version;
    }

    std::string add_definition_node(const std::string &var, int version, uint32_t line,
                                    const std::string &label, bool is_phi,
                                    bool is_param = false) {
        Node node;
        node.id = next_id();
        node.type = NodeType::Definition;
        node.label = label;
        node.line = line;
        node.var_name = var;
        node.version = version;
        node.scope = scope().name;
        node.is_phi = is_phi;
        if (is_param)
            node.extras["param"] = "true";

        std::string id = node.id;
        dfg_.add_node(std::move(node));
        dfg_.add_definition(var, id);
        defs_[std::make_tuple(scope().id, var, version)] = {id, line};
        versions_.back().visible.current_def[var] = id;
        return id;
    }

    std::string add_phi(const std::string &var, uint32_t line, const std::string &context,
                        const std::vector<std::string> &incoming) {
        int version = next_version(var);
        std::string label = "phi " + var + "_" + std::to_string(version) + "@" +
                            std::to_string(line) + " (" + context + ")";
        std::string id = add_definition_node(var, version, line, label, true);

        std::set<std::string> linked;
        for (const auto &source : incoming) {
            if (source.empty() || !linked.insert(source).second)
                continue;
            dfg_.add_edge(source, id, EdgeType::DataFlow, "phi");
        }
        return id;
    }
};

} // namespace

Dfg SsaDfgBuilder::build(const std::string &source) const {
    SourceTree tree(source);
    return build(tree);
}

Dfg SsaDfgBuilder::build(const SourceTree &tree) const {
    Dfg dfg("dfg");
    SsaDfgWalker walker(tree, dfg);
    walker.run();
    return dfg;
}

} // namespace graphdelta
