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

// Statement tree -> call graph.
//
// Pass 1 collects functions ("func_<name>"), methods ("method_<Class.name>")
// and classes ("class_<Name>", with a "defines" edge to each method).
// Pass 2 resolves calls by name: `f()` -> "f", `Name.attr()` -> "Name.attr",
// any other `x.attr()` -> "attr". Calls that resolve to no known function,
// or that happen outside any function, are dropped.
class CallGraphBuilder {
public:
    CallGraph build(const std::string &source) const;
    CallGraph build(const SourceTree &tree) const;
};

// Callee name for a `call` node under the rules above ("" when unresolvable)
std::string resolve_callee(const SourceTree &tree, TSNode call);

} // namespace graphdelta
