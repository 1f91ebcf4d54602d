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

#include <gtest/gtest.h>
#include "graphdelta/callgraph_builder.hpp"

using namespace graphdelta;

namespace {

bool calls(const CallGraph &g, const std::string &from, const std::string &to) {
    return g.has_edge({from, to, EdgeType::Call, "calls", {}});
}

} // namespace

// ─── Definitions ───────────────────────────────────────────────

TEST(CallGraphBuilderTest, FunctionsAndMethods) {
    CallGraph g = CallGraphBuilder().build(
        "def helper():\n    pass\n\n"
        "class Store:\n    def save(self):\n        pass\n");

    ASSERT_TRUE(g.has_node("func_helper"));
    ASSERT_TRUE(g.has_node("class_Store"));
    ASSERT_TRUE(g.has_node("method_Store.save"));

    EXPECT_EQ(g.node("func_helper").type, NodeType::Function);
    EXPECT_EQ(g.node("method_Store.save").type, NodeType::Method);
    EXPECT_EQ(g.node("method_Store.save").label, "Store.save");
    EXPECT_EQ(g.node("class_Store").type, NodeType::Class);

    EXPECT_TRUE(g.has_edge({"class_Store", "method_Store.save", EdgeType::Inherit, "", {}}));
    EXPECT_EQ(g.functions.size(), 2u);
    EXPECT_EQ(g.functions.at("Store.save"), "method_Store.save");
}

// ─── Call resolution ───────────────────────────────────────────

TEST(CallGraphBuilderTest, PlainCallIsResolved) {
    CallGraph g = CallGraphBuilder().build(
        "def a():\n    b()\n\n"
        "def b():\n    pass\n");
    EXPECT_TRUE(calls(g, "func_a", "func_b"));
    EXPECT_EQ(g.call_count(), 1u);
}

TEST(CallGraphBuilderTest, QualifiedCallIsResolved) {
    CallGraph g = CallGraphBuilder().build(
        "class Store:\n    def save(self):\n        pass\n\n"
        "def main():\n    Store.save(None)\n");
    EXPECT_TRUE(calls(g, "func_main", "method_Store.save"));
}

TEST(CallGraphBuilderTest, OtherAttributeCallUsesBareName) {
    CallGraph g = CallGraphBuilder().build(
        "def run():\n    pass\n\n"
        "def main(jobs):\n    jobs[0].run()\n");
    EXPECT_TRUE(calls(g, "func_main", "func_run"));
}

TEST(CallGraphBuilderTest, MethodCallerIsQualified) {
    CallGraph g = CallGraphBuilder().build(
        "def log():\n    pass\n\n"
        "class Store:\n    def save(self):\n        log()\n");
    EXPECT_TRUE(calls(g, "method_Store.save", "func_log"));
}

TEST(CallGraphBuilderTest, UnknownAndModuleLevelCallsAreDropped) {
    CallGraph g = CallGraphBuilder().build(
        "def a():\n    print('x')\n\n"
        "a()\n");
    EXPECT_EQ(g.call_count(), 0u);
}

TEST(CallGraphBuilderTest, RepeatedCallsDeduplicated) {
    CallGraph g = CallGraphBuilder().build(
        "def b():\n    pass\n\n"
        "def a():\n    b()\n    b()\n");
    EXPECT_EQ(g.call_count(), 1u);
}

TEST(CallGraphBuilderTest, SyntaxErrorGivesErrorNode) {
    CallGraph g = CallGraphBuilder().build("def (\n");
    ASSERT_EQ(g.node_count(), 1u);
    ASSERT_TRUE(g.has_node("error"));
    EXPECT_EQ(g.node("error").type, NodeType::Function);
    EXPECT_EQ(g.node("error").label.rfind("SyntaxError", 0), 0u);
}
