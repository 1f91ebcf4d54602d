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

#include "batch.hpp"
#include "metrics.hpp"
#include <string>
#include <vector>

namespace graphdelta {

// Command handlers
int cmd_compare(const std::string &before_path, const std::string &after_path,
                const CompareOptions &options, bool as_json);
int cmd_batch(const BatchConfig &config, const std::string &output_path);
int cmd_dump(GraphKind kind, const std::string &file_path, DfgVariant variant,
             const std::string &output_path);

// Helper functions
bool load_config(const std::string &path, CompareOptions &options);

// Overlay the keys present in `config` onto `options`; throws
// std::runtime_error on an unknown strategy, DFG variant or graph kind
void apply_config(const json &config, CompareOptions &options);

// Throws std::runtime_error naming the first unknown kind
std::vector<GraphKind> parse_kinds(const std::vector<std::string> &names);

// One kind for a source string, as written by --dump: the graph, the
// syntax tree, the token list or the complexity figures
json build_graph_json(GraphKind kind, const std::string &source, DfgVariant variant);

} // namespace graphdelta
