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
#include <limits>

namespace graphdelta {

namespace {

struct BeamOutcome {
    double distance = 0.0;
    size_t iterations = 0;
    bool timeout = false;
};

// Level-by-level search keeping the `width` lowest-f states per depth
BeamOutcome beam_search(const detail::GedProblem &problem, size_t width, SearchBudget *budget) {
    BeamOutcome outcome;

    std::vector<detail::SearchState> arena;
    detail::SearchState root;
    root.f = detail::RemainingCounts(problem, {}).heuristic();
    arena.push_back(root);
    std::vector<int32_t> beam = {0};

    for (size_t depth = 0; depth < problem.n1(); depth++) {
        std::vector<detail::SearchState> pool;
        for (int32_t index : beam) {
            if (budget) {
                if (!budget->can_continue()) {
                    // Finish the most promising state greedily
                    auto best = std::min_element(beam.begin(), beam.end(),
                                                 [&](int32_t a, int32_t b) {
                                                     return arena[a].f < arena[b].f;
                                                 });
                    outcome.timeout = true;
                    outcome.distance = problem.greedy_completion(
                        detail::recover_mapping(arena, *best));
                    return outcome;
                }
                budget->record_expansion();
            }
            outcome.iterations++;

            std::vector<detail::SearchState> children =
                detail::expand_state(problem, arena, index, 0);
            pool.insert(pool.end(), children.begin(), children.end());
        }

        std::stable_sort(pool.begin(), pool.end(),
                         [](const detail::SearchState &a, const detail::SearchState &b) {
                             return a.f < b.f;
                         });
        if (pool.size() > width)
            pool.resize(width);

        beam.clear();
        for (const auto &state : pool) {
            beam.push_back(static_cast<int32_t>(arena.size()));
            arena.push_back(state);
        }
    }

    // Every surviving state is complete; g already includes the insertions
    outcome.distance = std::numeric_limits<double>::infinity();
    for (int32_t index : beam) {
        outcome.distance = std::min(outcome.distance, arena[index].g);
    }
    return outcome;
}

} // namespace

BeamSearchGed::BeamSearchGed(const GedCosts &costs, const BeamOptions &options)
    : costs_(costs), options_(options) {}

GedResult BeamSearchGed::compute(const Graph &g1, const Graph &g2) const {
    return run(g1, g2, nullptr);
}

GedResult BeamSearchGed::compute(const Graph &g1, const Graph &g2, SearchBudget &budget) const {
    return run(g1, g2, &budget);
}

GedResult BeamSearchGed::run(const Graph &g1, const Graph &g2, SearchBudget *budget) const {
    auto start = std::chrono::steady_clock::now();
    auto elapsed = [&]() {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    };

    GedResult result = detail::make_result(g1, g2, "beam_search");
    result.beam_width = options_.beam_width;
    if (detail::trivial_result(g1, g2, costs_, result)) {
        result.elapsed_seconds = elapsed();
        return result;
    }

    if (std::max(g1.node_count(), g2.node_count()) > options_.max_nodes) {
        GedResult greedy = greedy_bipartite_ged(g1, g2, costs_);
        greedy.note = "graph exceeds beam search node limit";
        greedy.elapsed_seconds = elapsed();
        return greedy;
    }

    detail::GedProblem problem(g1, g2, costs_);
    size_t width = static_cast<size_t>(std::max(options_.beam_width, 1));

    BeamOutcome outcome = beam_search(problem, width, budget);
    double best = outcome.distance;
    size_t iterations = outcome.iterations;
    bool timeout = outcome.timeout;

    // A wider beam may prune the path a width-1 beam keeps
    if (width > 1 && !timeout) {
        BeamOutcome narrow = beam_search(problem, 1, budget);
        best = std::min(best, narrow.distance);
        iterations += narrow.iterations;
        timeout = timeout || narrow.timeout;
    }
    best = std::min(best, problem.identity_order_cost());

    detail::finish_result(result, best);
    result.iterations = iterations;
    result.timeout = timeout;
    result.elapsed_seconds = elapsed();
    return result;
}

} // namespace graphdelta
