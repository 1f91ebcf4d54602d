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

#include "graphdelta/ged.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace graphdelta {
namespace detail {

constexpr int32_t DELETED = -1;

// Both node sets flattened to index order (G1 by id), with interned
// type+label classes for the heuristic
class GedProblem {
public:
    GedProblem(const Graph &g1, const Graph &g2, const GedCosts &costs);

    size_t n1() const { return nodes1_.size(); }
    size_t n2() const { return nodes2_.size(); }
    const GedCosts &costs() const { return costs_; }

    const Node &node1(size_t i) const { return *nodes1_[i]; }
    const Node &node2(size_t j) const { return *nodes2_[j]; }

    uint32_t class1(size_t i) const { return class1_[i]; }
    uint32_t class2(size_t j) const { return class2_[j]; }
    uint32_t type1(size_t i) const { return type1_[i]; }
    uint32_t type2(size_t j) const { return type2_[j]; }
    size_t class_count() const { return class_count_; }
    size_t type_count() const { return type_count_; }

    // Memoized substitution cost of node1(i) -> node2(j)
    double sub(size_t i, size_t j) const;

    // Cost of the assignment i -> i for the shared prefix, the rest
    // deleted or inserted
    double identity_order_cost() const;

    // Complete a partial assignment greedily; `mapping` covers
    // G1 indices [0, mapping.size())
    double greedy_completion(std::vector<int32_t> mapping) const;

    // Exact cost of a complete assignment
    double assignment_cost(const std::vector<int32_t> &mapping) const;


private:
    GedCosts costs_;
    std::vector<const Node *> nodes1_;
    std::vector<const Node *> nodes2_;
    std::vector<uint32_t> class1_, class2_;
    std::vector<uint32_t> type1_, type2_;
    size_t class_count_ = 0;
    size_t type_count_ = 0;
    mutable SubstitutionCostCache cache_;
};

// Multiset counts of the unmapped nodes on each side. `exact` is the
// overlap of the type+label multisets, `typed` the overlap of the type
// multisets; both support O(1) what-if queries for one expansion.
class RemainingCounts {
public:
    // Counts for a state that mapped G1 indices [0, mapping.size())
    RemainingCounts(const GedProblem &problem, const std::vector<int32_t> &mapping);

    // Lower bound on the cost of finishing from here
    double heuristic() const;

    // heuristic() after mapping G1 node `i` to G2 node `j` (DELETED for a deletion)
    double heuristic_after(size_t i, int32_t j) const;

private:
    const GedProblem &problem_;
    std::vector<int> class_left1_, class_left2_;
    std::vector<int> type_left1_, type_left2_;
    size_t rem1_ = 0;
    size_t rem2_ = 0;
    size_t exact_ = 0;
    size_t typed_ = 0;

    double bound(size_t rem1, size_t rem2, size_t exact, size_t typed) const;
};

// Search node stored in an arena; the mapping is recovered through parents
struct SearchState {
    int32_t parent = -1;
    int32_t target = DELETED; // G2 index assigned to G1 index depth-1
    uint32_t depth = 0;       // G1 nodes assigned so far
    uint32_t matched = 0;     // G2 nodes consumed so far
    double g = 0.0;
    double f = 0.0;
};

// Mapping of the state at `index`, G1 order
std::vector<int32_t> recover_mapping(const std::vector<SearchState> &arena, int32_t index);

// Children of `parent` (already in the arena at `parent_index`), at most
// `branching` substitutions (0 = all) plus one deletion. A child that
// completes G1 has the remaining insertions folded into g and f.
std::vector<SearchState> expand_state(const GedProblem &problem,
                                      const std::vector<SearchState> &arena,
                                      int32_t parent_index, size_t branching);

// Result skeleton carrying the graph sizes
GedResult make_result(const Graph &g1, const Graph &g2, const std::string &method);

// Sets distance and normalized_distance
void finish_result(GedResult &result, double distance);

// Handles the empty-graph boundary; returns false when both sides have nodes
bool trivial_result(const Graph &g1, const Graph &g2, const GedCosts &costs,
                    GedResult &result);

} // namespace detail
} // namespace graphdelta
