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

struct CfgBuilderOptions {
    // Build an entry/exit sub-CFG for every function and method
    bool expand_functions = true;
};

// Statement tree -> control-flow graph.
//
// The module body is wired entry -> statements -> exit. A function
// definition is a single opaque "def <name>" node in the enclosing flow;
// its body gets its own entry/exit pair in the same graph.
class CfgBuilder {
public:

    explicit CfgBuilder(const CfgBuilderOptions &options = CfgBuilderOptions{});

    Cfg build(const std::string &source) const;
    Cfg build(const SourceTree &tree) const;

private:

    CfgBuilderOptions options_;
};

} // namespace graphdelta
