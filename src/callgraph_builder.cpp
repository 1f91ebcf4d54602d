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

#include "graphdelta/callgraph_builder.hpp"
#include <vector>

namespace graphdelta {

namespace {

// Enclosing class or function, popped once the walk leaves its byte range
struct Context {
    std::string name; // Qualified key for functions ("Class.method" for methods)
    bool is_class;
    uint32_t end_byte;
};

void pop_finished(std::vector<Context> &stack, TSNode node) {
    uint32_t start_byte = ts_node_start_byte(node);
    while (!stack.empty() && start_byte >= stack.back().end_byte) {
        stack.pop_back();
    }
}

// Key under which a function_definition is registered
std::string function_key(const SourceTree &tree, TSNode def, const std::vector<Context> &stack) {
    std::string name = tree.text(SourceTree::field(def, "name"));
    if (!stack.empty() && stack.back().is_class) {
        return stack.back().name + "." + name;
    }
    return name;
}

} // namespace

std::string resolve_callee(const SourceTree &tree, TSNode call) {
    TSNode func = SourceTree::field(call, "function");
    if (SourceTree::is(func, "identifier")) {
        return tree.text(func);
    }
    if (SourceTree::is(func, "attribute")) {
        TSNode object = SourceTree::field(func, "object");
        std::string attr = tree.text(SourceTree::field(func, "attribute"));
        if (SourceTree::is(object, "identifier")) {
            return tree.text(object) + "." + attr;
        }
        return attr;
    }
    return "";
}

CallGraph CallGraphBuilder::build(const std::string &source) const {
    SourceTree tree(source);
    return build(tree);
}

CallGraph CallGraphBuilder::build(const SourceTree &tree) const {
    CallGraph graph("callgraph");

    if (!tree.ok()) {
        graph.add_node("error", NodeType::Function, tree.error());
        graph.functions["error"] = "error";
        return graph;
    }

    // Pass 1: functions, methods and classes
    std::vector<Context> stack;
    tree.visit_nodes(tree.root(), [&](TSNode node) {
        pop_finished(stack, node);

        if (SourceTree::is(node, "class_definition")) {
            std::string name = tree.text(SourceTree::field(node, "name"));
            std::string id = "class_" + name;
            graph.add_node(id, NodeType::Class, name, SourceTree::line(node));
            stack.push_back({name, true, ts_node_end_byte(node)});
        } else if (SourceTree::is(node, "function_definition")) {
            std::string key = function_key(tree, node, stack);
            bool is_method = !stack.empty() && stack.back().is_class;
            if (is_method) {
                std::string id = "method_" + key;
                graph.add_node(id, NodeType::Method, key, SourceTree::line(node));
                graph.functions[key] = id;
                graph.add_edge("class_" + stack.back().name, id, EdgeType::Inherit, "defines");
            } else {
                std::string id = "func_" + key;
                graph.add_node(id, NodeType::Function, key, SourceTree::line(node));
                graph.functions[key] = id;
            }
            stack.push_back({key, false, ts_node_end_byte(node)});
        }
        return true;
    });

    // Pass 2: calls made inside a known function
    stack.clear();
    tree.visit_nodes(tree.root(), [&](TSNode node) {
        pop_finished(stack, node);

        if (SourceTree::is(node, "class_definition")) {
            stack.push_back({tree.text(SourceTree::field(node, "name")), true,
                             ts_node_end_byte(node)});
        } else if (SourceTree::is(node, "function_definition")) {
            stack.push_back({function_key(tree, node, stack), false, ts_node_end_byte(node)});
        } else if (SourceTree::is(node, "call")) {
            // Innermost enclosing function
            const Context *caller = nullptr;
            for (auto it = stack.rbegin(); it != stack.rend(); ++it) {
                if (!it->is_class) {
                    caller = &*it;
                    break;
                }
            }
            if (!caller)
                return true;

            auto caller_it = graph.functions.find(caller->name);
            auto callee_it = graph.functions.find(resolve_callee(tree, node));
            if (caller_it == graph.functions.end() || callee_it == graph.functions.end())
                return true;

            Edge edge;
            edge.source = caller_it->second;
            edge.target = callee_it->second;
            edge.type = EdgeType::Call;
            edge.label = "calls";
            if (!graph.has_edge(edge))
                graph.add_edge(std::move(edge));
        }
        return true;
    });

    return graph;
}

} // namespace graphdelta
