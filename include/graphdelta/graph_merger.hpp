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

namespace graphdelta {

// CFG + DFG -> PDG. DFG statement nodes whose label matches a CFG node are
// folded onto that node and their edges remapped; every other DFG node is
// added as is. CFG edges become control dependences, DFG edges data
// dependences.
Pdg merge_pdg(const Cfg &cfg, const Dfg &dfg);

// PDG + call graph -> CPG, deduplicated by node id and edge identity
Cpg merge_cpg(const Pdg &pdg, const CallGraph &call_graph);

// CFG + DFG + call graph -> CPG
Cpg merge_cpg(const Cfg &cfg, const Dfg &dfg, const CallGraph &call_graph);

} // namespace graphdelta
