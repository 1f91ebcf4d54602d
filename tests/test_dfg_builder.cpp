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
#include "graphdelta/dfg_builder.hpp"

using namespace graphdelta;

namespace {

const Node *find_label(const Graph &g, const std::string &label) {
    for (const auto &[id, node] : g.nodes()) {
        if (node.label == label)
            return &node;
    }
    return nullptr;
}

// Sources of the def-use edges into `use_id`
std::vector<std::string> reaching_defs(const Dfg &dfg, const std::string &use_id) {
    std::vector<std::string> defs;
    for (const auto &[def, use] : dfg.def_use_chains()) {
        if (use == use_id)
            defs.push_back(def);
    }
    return defs;
}

} // namespace

// ─── Basic builder ─────────────────────────────────────────────

TEST(DfgBuilderTest, DefinitionReachesLaterUse) {
    Dfg dfg = DfgBuilder().build("x = 1\ny = x\n");

    const Node *def = find_label(dfg, "def x@1");
    const Node *use = find_label(dfg, "use x@2");
    ASSERT_NE(def, nullptr);
    ASSERT_NE(use, nullptr);
    EXPECT_EQ(def->type, NodeType::Definition);
    EXPECT_EQ(use->type, NodeType::Use);
    EXPECT_EQ(reaching_defs(dfg, use->id), (std::vector<std::string>{def->id}));

    EXPECT_EQ(dfg.definitions.at("x").size(), 1u);
    EXPECT_EQ(dfg.uses.at("x").size(), 1u);
}

TEST(DfgBuilderTest, StatementAnchorsUseStatementLabels) {
    Dfg dfg = DfgBuilder().build("x = 1\ny = x\n");

    const Node *stmt = find_label(dfg, "y = x");
    ASSERT_NE(stmt, nullptr);
    EXPECT_EQ(stmt->type, NodeType::Statement);

    const Node *use = find_label(dfg, "use x@2");
    const Node *def = find_label(dfg, "def y@2");
    Edge read{use->id, stmt->id, EdgeType::DataFlow, "", {}};
    Edge write{stmt->id, def->id, EdgeType::DataFlow, "", {}};
    EXPECT_TRUE(dfg.has_edge(read));
    EXPECT_TRUE(dfg.has_edge(write));
}

TEST(DfgBuilderTest, BasicLinksEveryReachingDefinition) {
    Dfg dfg = DfgBuilder().build("x = 1\nx = 2\nprint(x)\n");
    const Node *use = find_label(dfg, "use x@3");
    ASSERT_NE(use, nullptr);
    EXPECT_EQ(reaching_defs(dfg, use->id).size(), 2u);
}

TEST(DfgBuilderTest, ParametersAreDefinitions) {
    Dfg dfg = DfgBuilder().build("def f(a, b):\n    return a + b\n");

    const Node *a = find_label(dfg, "def a@1 (param)");
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a->extras.at("param"), "true");
    EXPECT_EQ(a->scope, "func_f");

    const Node *use = find_label(dfg, "use a@2");
    ASSERT_NE(use, nullptr);
    EXPECT_EQ(reaching_defs(dfg, use->id), (std::vector<std::string>{a->id}));
}

TEST(DfgBuilderTest, UseOnDefinitionLineIsNotReached) {
    Dfg dfg = DfgBuilder().build("def f(a, b): return a + b\n");
    EXPECT_NE(find_label(dfg, "use a@1"), nullptr);
    EXPECT_TRUE(dfg.def_use_chains().empty());
}

TEST(DfgBuilderTest, ModuleDefinitionVisibleInFunction) {
    Dfg dfg = DfgBuilder().build("LIMIT = 3\n\n\ndef check(v):\n    return v < LIMIT\n");
    const Node *def = find_label(dfg, "def LIMIT@1");
    const Node *use = find_label(dfg, "use LIMIT@5");
    ASSERT_NE(def, nullptr);
    ASSERT_NE(use, nullptr);
    EXPECT_EQ(reaching_defs(dfg, use->id), (std::vector<std::string>{def->id}));
}

TEST(DfgBuilderTest, AttributeNamesAreNotVariables) {
    Dfg dfg = DfgBuilder().build("obj.field = value\n");
    EXPECT_EQ(dfg.uses.count("field"), 0u);
    EXPECT_EQ(dfg.definitions.count("field"), 0u);
    EXPECT_EQ(dfg.uses.count("obj"), 1u);
    EXPECT_EQ(dfg.uses.count("value"), 1u);
}

TEST(DfgBuilderTest, AugmentedAssignmentReadsAndWrites) {
    Dfg dfg = DfgBuilder().build("n = 0\nn += 1\n");
    EXPECT_NE(find_label(dfg, "use n@2"), nullptr);
    EXPECT_NE(find_label(dfg, "def n@2"), nullptr);
}

TEST(DfgBuilderTest, SyntaxErrorGivesSingleNode) {
    Dfg dfg = DfgBuilder().build("x = (\n");
    ASSERT_EQ(dfg.node_count(), 1u);
    EXPECT_EQ(dfg.nodes().begin()->second.label.rfind("SyntaxError", 0), 0u);
}

// ─── SSA builder ───────────────────────────────────────────────

TEST(SsaDfgBuilderTest, VersionsIncreasePerDefinition) {
    Dfg dfg = SsaDfgBuilder().build("x = 1\nx = x + 1\nprint(x)\n");

    const Node *v1 = find_label(dfg, "def x_1@1");
    const Node *v2 = find_label(dfg, "def x_2@2");
    const Node *use1 = find_label(dfg, "use x_1@2");
    const Node *use2 = find_label(dfg, "use x_2@3");
    ASSERT_NE(v1, nullptr);
    ASSERT_NE(v2, nullptr);
    ASSERT_NE(use1, nullptr);
    ASSERT_NE(use2, nullptr);

    EXPECT_EQ(v2->version, 2);
    EXPECT_EQ(reaching_defs(dfg, use1->id), (std::vector<std::string>{v1->id}));
    EXPECT_EQ(reaching_defs(dfg, use2->id), (std::vector<std::string>{v2->id}));
}

TEST(SsaDfgBuilderTest, UseBeforeDefinitionIsVersionZero) {
    Dfg dfg = SsaDfgBuilder().build("print(y)\n");
    const Node *use = find_label(dfg, "use y_0@1");
    ASSERT_NE(use, nullptr);
    EXPECT_TRUE(reaching_defs(dfg, use->id).empty());
}

TEST(SsaDfgBuilderTest, IfElseReassignmentGetsOnePhi) {
    Dfg dfg = SsaDfgBuilder().build(
        "x = 0\nif c:\n    x = 1\nelse:\n    x = 2\nprint(x)\n");

    std::vector<const Node *> phis;
    for (const auto &[id, node] : dfg.nodes()) {
        if (node.is_phi)
            phis.push_back(&node);
    }
    ASSERT_EQ(phis.size(), 1u);
    const Node *phi = phis[0];
    EXPECT_EQ(phi->var_name, "x");
    EXPECT_EQ(phi->type, NodeType::Definition);
    EXPECT_EQ(dfg.phi_count(), 1u);

    // Both arms feed the phi
    const Node *then_def = find_label(dfg, "def x_2@3");
    const Node *else_def = find_label(dfg, "def x_3@5");
    ASSERT_NE(then_def, nullptr);
    ASSERT_NE(else_def, nullptr);
    EXPECT_TRUE(dfg.has_edge({then_def->id, phi->id, EdgeType::DataFlow, "phi", {}}));
    EXPECT_TRUE(dfg.has_edge({else_def->id, phi->id, EdgeType::DataFlow, "phi", {}}));

    // The use after the merge resolves to the phi only
    const Node *use = nullptr;
    for (const auto &[id, node] : dfg.nodes()) {
        if (node.type == NodeType::Use && node.var_name == "x" && node.line == 6)
            use = &node;
    }
    ASSERT_NE(use, nullptr);
    EXPECT_EQ(reaching_defs(dfg, use->id), (std::vector<std::string>{phi->id}));
}

TEST(SsaDfgBuilderTest, NoPhiWhenBranchesAgree) {
    Dfg dfg = SsaDfgBuilder().build("x = 0\nif c:\n    y = 1\nprint(x)\n");
    // y differs between the arms (defined vs. undefined), x does not
    for (const auto &[id, node] : dfg.nodes()) {
        if (node.is_phi)
            EXPECT_EQ(node.var_name, "y");
    }
}

TEST(SsaDfgBuilderTest, ForLoopPlacesEntryAndExitPhis) {
    Dfg dfg = SsaDfgBuilder().build("for i in items:\n    print(i)\n");

    size_t loop_phis = 0;
    size_t exit_phis = 0;
    for (const auto &[id, node] : dfg.nodes()) {
        if (!node.is_phi || node.var_name != "i")
            continue;
        if (node.label.find("(for_loop)") != std::string::npos)
            loop_phis++;
        if (node.label.find("(for_exit)") != std::string::npos)
            exit_phis++;
    }
    EXPECT_EQ(loop_phis, 1u);
    EXPECT_EQ(exit_phis, 1u);
}

TEST(SsaDfgBuilderTest, FunctionsVersionIndependently) {
    Dfg dfg = SsaDfgBuilder().build("x = 1\n\n\ndef f():\n    x = 2\n    return x\n");
    EXPECT_NE(find_label(dfg, "def x_1@1"), nullptr);
    EXPECT_NE(find_label(dfg, "def x_1@5"), nullptr);

    const Node *inner = find_label(dfg, "def x_1@5");
    const Node *use = find_label(dfg, "use x_1@6");
    ASSERT_NE(use, nullptr);
    EXPECT_EQ(reaching_defs(dfg, use->id), (std::vector<std::string>{inner->id}));
}

TEST(DfgVariantTest, Names) {
    DfgVariant variant = DfgVariant::Basic;
    EXPECT_TRUE(dfg_variant_from_string("enhanced", variant));
    EXPECT_EQ(variant, DfgVariant::Ssa);
    EXPECT_TRUE(dfg_variant_from_string("basic", variant));
    EXPECT_EQ(variant, DfgVariant::Basic);
    EXPECT_FALSE(dfg_variant_from_string("other", variant));
    EXPECT_STREQ(dfg_variant_to_string(DfgVariant::Ssa), "ssa");
}
