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

#include "ged_internal.hpp"
#include <algorithm>
#include <chrono>
#include <queue>

namespace graphdelta {

namespace {

struct OpenEntry {
    double f;
    uint32_t depth;
    int32_t index;

    // Lowest f first, deeper states first on ties
    bool operator<(const OpenEntry &other) const {
        if (f != other.f)
            return f > other.f;
        if (depth != other.depth)
            return depth < other.depth;
        return index > other.index;
    }
};

} // namespace

AStarGed::AStarGed(const GedCosts &costs, const AStarOptions &options)
    : costs_(costs), options_(options) {}

GedResult AStarGed::compute(const Graph &g1, const Graph &g2) const {
    auto start = std::chrono::steady_clock::now();
    auto elapsed = [&]() {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    };

    GedResult result = detail::make_result(g1, g2, "astar");
    if (detail::trivial_result(g1, g2, costs_, result)) {
        result.elapsed_seconds = elapsed();
        return result;
    }

    if (std::max(g1.node_count(), g2.node_count()) > options_.max_nodes) {
        GedResult greedy = greedy_bipartite_ged(g1, g2, costs_);
        greedy.note = "graph exceeds A* node limit";
        greedy.elapsed_seconds = elapsed();
        return greedy;
    }

    detail::GedProblem problem(g1, g2, costs_);

    // Incumbent: the best complete assignment seen so far
    double best = std::min(problem.greedy_completion({}), problem.identity_order_cost());

    std::vector<detail::SearchState> arena;
    detail::SearchState root;
    root.f = detail::RemainingCounts(problem, {}).heuristic();
    arena.push_back(root);

    std::priority_queue<OpenEntry> open;
    open.push({root.f, 0, 0});

    size_t iterations = 0;
    while (!open.empty()) {
        OpenEntry top = open.top();
        if (top.f >= best)
            break;
        open.pop();

        if (iterations >= options_.max_iterations) {
            result.timeout = true;
            best = std::min(best, problem.greedy_completion(
                                      detail::recover_mapping(arena, top.index)));
            break;
        }
        iterations++;

        std::vector<detail::SearchState> children =
            detail::expand_state(problem, arena, top.index, options_.max_branching);
        for (const auto &child : children) {
            if (child.depth == problem.n1()) {
                best = std::min(best, child.g);
                continue;
            }
            if (child.f >= best)
                continue;
            int32_t index = static_cast<int32_t>(arena.size());
            arena.push_back(child);
            open.push({child.f, child.depth, index});
        }
    }

    detail::finish_result(result, best);
    result.iterations = iterations;
    result.elapsed_seconds = elapsed();
    return result;
}

} // namespace graphdelta
