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

#include "graphdelta/source_tree.hpp"
#include <cctype>
#include <cstring>
#include <stdexcept>

namespace graphdelta {

std::string truncate_label(const std::string &text, size_t limit) {
    std::string out;
    out.reserve(text.size());
    bool pending_space = false;
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out += ' ';
            pending_space = false;
        }
        out += c;
    }
    if (limit <= 3)
        return out;

    // Limit counts characters; UTF-8 continuation bytes do not start one
    auto is_lead = [](char c) { return (static_cast<unsigned char>(c) & 0xC0) != 0x80; };
    size_t chars = 0;
    size_t cut = out.size();
    for (size_t i = 0; i < out.size(); ++i) {
        if (!is_lead(out[i]))
            continue;
        if (chars == limit - 3)
            cut = i;
        ++chars;
    }
    if (chars > limit) {
        out = out.substr(0, cut) + "...";
    }
    return out;
}

SourceTree::SourceTree(const std::string &source) : source_(source) {
    parser_ = ts_parser_new();
    if (!parser_) {
        throw std::runtime_error("Failed to create tree-sitter parser");
    }

    if (!ts_parser_set_language(parser_, tree_sitter_python())) {
        ts_parser_delete(parser_);
        parser_ = nullptr;
        throw std::runtime_error("Failed to set parser language");
    }

    tree_ = ts_parser_parse_string(parser_, nullptr, source_.c_str(),
                                   static_cast<uint32_t>(source_.size()));
    if (!tree_) {
        error_ = "SyntaxError: unable to parse source";
        return;
    }
    locate_error();
}

SourceTree::~SourceTree() {
    if (tree_) ts_tree_delete(tree_);
    if (parser_) ts_parser_delete(parser_);
}

SourceTree::SourceTree(SourceTree &&other) noexcept
    : parser_(other.parser_)
    , tree_(other.tree_)
    , source_(std::move(other.source_))
    , error_(std::move(other.error_)) {
    other.parser_ = nullptr;
    other.tree_ = nullptr;
}

SourceTree &SourceTree::operator=(SourceTree &&other) noexcept {
    if (this != &other) {
        if (tree_) ts_tree_delete(tree_);
        if (parser_) ts_parser_delete(parser_);

        parser_ = other.parser_;
        tree_ = other.tree_;
        source_ = std::move(other.source_);
        error_ = std::move(other.error_);

        other.parser_ = nullptr;
        other.tree_ = nullptr;
    }
    return *this;
}

void SourceTree::locate_error() {
    TSNode top = root();
    if (!ts_node_has_error(top))
        return;

    // First ERROR or MISSING node in document order
    TSNode culprit = top;
    bool found = false;
    visit_nodes(top, [&](TSNode node) {
        if (found)
            return false;
        if (ts_node_is_error(node) || ts_node_is_missing(node)) {
            culprit = node;
            found = true;
            return false;
        }
        return ts_node_has_error(node);
    });

    TSPoint where = ts_node_start_point(culprit);
    error_ = "SyntaxError: line " + std::to_string(where.row + 1) + ", column " +
             std::to_string(where.column + 1);
}

TSNode SourceTree::root() const {
    if (!tree_) {
        return TSNode{};
    }
    return ts_tree_root_node(tree_);
}

std::string SourceTree::text(TSNode node) const {
    if (ts_node_is_null(node))
        return "";
    uint32_t start = ts_node_start_byte(node);
    uint32_t end = ts_node_end_byte(node);
    if (start < source_.size() && end <= source_.size() && start <= end) {
        return source_.substr(start, end - start);
    }
    return "";
}

std::vector<TSNode> SourceTree::statements(TSNode block) const {
    std::vector<TSNode> result;
    if (ts_node_is_null(block))
        return result;
    uint32_t count = ts_node_named_child_count(block);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode child = ts_node_named_child(block, i);
        if (is(child, "comment"))
            continue;
        result.push_back(child);
    }
    return result;
}

std::string SourceTree::statement_label(TSNode stmt) const {
    stmt = definition(stmt);

    if (is(stmt, "if_statement") || is(stmt, "elif_clause")) {
        return truncate_label("if " + text(field(stmt, "condition")));
    }
    if (is(stmt, "while_statement")) {
        return truncate_label("while " + text(field(stmt, "condition")));
    }
    if (is(stmt, "for_statement")) {
        return truncate_label("for " + text(field(stmt, "left")));
    }
    if (is(stmt, "with_statement")) {
        uint32_t count = ts_node_named_child_count(stmt);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode child = ts_node_named_child(stmt, i);
            if (is(child, "with_clause"))
                return truncate_label("with " + text(child));
        }
        return "with";
    }
    if (is(stmt, "function_definition")) {
        return truncate_label("def " + text(field(stmt, "name")));
    }
    if (is(stmt, "class_definition")) {
        return truncate_label("class " + text(field(stmt, "name")));
    }
    return truncate_label(text(stmt));
}

void SourceTree::visit_nodes(TSNode node, const std::function<bool(TSNode)> &visitor) const {
    if (ts_node_is_null(node))
        return;

    // Iterative walk with an explicit stack
    std::vector<TSNode> stack;
    stack.push_back(node);

    while (!stack.empty()) {
        TSNode current = stack.back();
        stack.pop_back();

        if (!visitor(current))
            continue;

        uint32_t child_count = ts_node_child_count(current);
        // Add children in reverse order so they're processed in order
        for (uint32_t i = child_count; i > 0; --i) {
            stack.push_back(ts_node_child(current, i - 1));
        }
    }
}

TSNode SourceTree::field(TSNode node, const char *name) {
    if (ts_node_is_null(node))
        return node;
    return ts_node_child_by_field_name(node, name, static_cast<uint32_t>(std::strlen(name)));
}

bool SourceTree::is(TSNode node, const char *type) {
    return !ts_node_is_null(node) && std::strcmp(ts_node_type(node), type) == 0;
}

TSNode SourceTree::body(TSNode node) {
    TSNode result = field(node, "body");
    if (!ts_node_is_null(result))
        return result;
    uint32_t count = ts_node_named_child_count(node);
    for (uint32_t i = count; i > 0; --i) {
        TSNode child = ts_node_named_child(node, i - 1);
        if (is(child, "block"))
            return child;
    }
    return TSNode{};
}

TSNode SourceTree::definition(TSNode node) {
    if (is(node, "decorated_definition")) {
        TSNode inner = field(node, "definition");
        if (!ts_node_is_null(inner))
            return inner;
    }
    return node;
}

} // namespace graphdelta
