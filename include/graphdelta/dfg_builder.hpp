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

#include "graph.hpp"
#include "source_tree.hpp"
#include <string>

namespace graphdelta {

// Scope name of module-level code
constexpr const char *MODULE_SCOPE = "__module__";

enum class DfgVariant { Basic, Ssa };

inline const char *dfg_variant_to_string(DfgVariant variant) {
    return variant == DfgVariant::Basic ? "basic" : "ssa";
}

// Returns false for an unrecognised name
inline bool dfg_variant_from_string(const std::string &name, DfgVariant &variant) {
    if (name == "basic")
        variant = DfgVariant::Basic;
    else if (name == "ssa" || name == "enhanced")
        variant = DfgVariant::Ssa;
    else
        return false;
    return true;
}

// Non-SSA baseline. Every definition of a variable is linked to every use
// it may reach: same scope with an earlier line, or a module-level
// definition read from inside a function.
class DfgBuilder {
public:
    Dfg build(const std::string &source) const;
    Dfg build(const SourceTree &tree) const;
};

// SSA-inspired builder. Definitions carry per-scope versions, uses record
// the current version, and phi definitions are placed after if/else and
// around for loops. A use is linked to the definition of the same version
// in the same scope on an earlier line.
class SsaDfgBuilder {
public:
    Dfg build(const std::string &source) const;
    Dfg build(const SourceTree &tree) const;
};

// Dispatch on variant
Dfg build_dfg(const SourceTree &tree, DfgVariant variant);

} // namespace graphdelta
