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

namespace graphdelta {

namespace {

struct Occurrence {
    std::string id;
    uint32_t line;
    int scope_id;
};

class BasicDfgWalker : public DataFlowWalker {
public:

    BasicDfgWalker(const SourceTree &tree, Dfg &dfg) : DataFlowWalker(tree, dfg) {}

protected:

    void on_definition(const std::string &var, uint32_t line, Anchor *anchor,
                       bool is_param) override {
        Node node;
        node.id = next_id();
        node.type = NodeType::Definition;
        node.label = "def " + var + "@" + std::to_string(line) + (is_param ? " (param)" : "");
        node.line = line;
        node.var_name = var;
        node.scope = scope().name;
        if (is_param)
            node.extras["param"] = "true";

        std::string id = node.id;
        dfg_.add_node(std::move(node));
        dfg_.add_definition(var, id);
        defs_[var].push_back({id, line, scope().id});
        link_definition(anchor, id);
    }

    void on_use(const std::string &var, uint32_t line, Anchor &anchor) override {
        Node node;
        node.id = next_id();
        node.type = NodeType::Use;
        node.label = "use " + var + "@" + std::to_string(line);
        node.line = line;
        node.var_name = var;
        node.scope = scope().name;

        std::string id = node.id;
        dfg_.add_node(std::move(node));
        dfg_.add_use(var, id);
        uses_[var].push_back({id, line, scope().id});
        link_use(id, anchor);
    }

    // Every definition to every use it may reach
    void finish() override {
        for (const auto &[var, defs] : defs_) {
            auto it = uses_.find(var);
            if (it == uses_.end())
                continue;
            for (const auto &def : defs) {
                for (const auto &use : it->second) {
                    if (reachable(def, use))
                        dfg_.add_edge(def.id, use.id, EdgeType::DefUse, var);
                }
            }
        }
    }

private:

    std::map<std::string, std::vector<Occurrence>> defs_;
    std::map<std::string, std::vector<Occurrence>> uses_;

    static bool reachable(const Occurrence &def, const Occurrence &use) {
        if (def.scope_id == use.scope_id)
            return def.line < use.line;
        // Module-level definitions are visible inside every function
        return def.scope_id == 0;
    }
};

} // namespace

Dfg DfgBuilder::build(const std::string &source) const {
    SourceTree tree(source);
    return build(tree);
}

Dfg DfgBuilder::build(const SourceTree &tree) const {
    Dfg dfg("dfg");
    BasicDfgWalker walker(tree, dfg);
    walker.run();
    return dfg;
}

Dfg build_dfg(const SourceTree &tree, DfgVariant variant) {
    if (variant == DfgVariant::Basic)
        return DfgBuilder().build(tree);
    return SsaDfgBuilder().build(tree);
}

} // namespace graphdelta
