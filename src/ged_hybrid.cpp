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
#include <iostream>

namespace graphdelta {

namespace {

const char *size_category(size_t max_nodes) {
    if (max_nodes < 20)
        return "tiny";
    if (max_nodes < 50)
        return "small";
    if (max_nodes < 100)
        return "medium";
    if (max_nodes < 200)
        return "large";
    return "huge";
}

} // namespace

HybridGed::HybridGed(const GedCosts &costs, const HybridOptions &options)
    : costs_(costs), options_(options) {}

int HybridGed::beam_width_for(size_t max_nodes) {
    if (max_nodes < 20)
        return 100;
    if (max_nodes < 50)
        return 50;
    if (max_nodes < 100)
        return 20;
    if (max_nodes < 200)
        return 10;
    return 0;
}

GedResult HybridGed::compute(const Graph &g1, const Graph &g2) const {
    auto start = std::chrono::steady_clock::now();
    auto elapsed = [&]() {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    };

    GedResult result = detail::make_result(g1, g2, "hybrid");
    if (detail::trivial_result(g1, g2, costs_, result)) {
        result.elapsed_seconds = elapsed();
        return result;
    }

    size_t max_nodes = std::max(g1.node_count(), g2.node_count());
    std::string category = size_category(max_nodes);
    int width = beam_width_for(max_nodes);

    if (width == 0) {
        GedResult greedy = greedy_bipartite_ged(g1, g2, costs_);
        greedy.note = category;
        greedy.elapsed_seconds = elapsed();
        return greedy;
    }

    try {
        BeamOptions beam_options;
        beam_options.beam_width = width;
        BeamSearchGed beam(costs_, beam_options);

        SearchBudget budget(options_.time_budget_seconds, 0);
        budget.start();
        GedResult searched = beam.compute(g1, g2, budget);

        if (searched.timeout) {
            GedResult narrow = fallback(g1, g2, category + "_timeout");
            detail::finish_result(narrow, std::min(narrow.distance, searched.distance));
            narrow.iterations += searched.iterations;
            narrow.elapsed_seconds = elapsed();
            return narrow;
        }

        searched.note = category;
        searched.elapsed_seconds = elapsed();
        return searched;
    } catch (const std::exception &e) {
        GedResult narrow = fallback(g1, g2, category + "_error: " + e.what());
        narrow.elapsed_seconds = elapsed();
        return narrow;
    }
}

GedResult HybridGed::fallback(const Graph &g1, const Graph &g2, const std::string &reason) const {
    if (options_.verbose) {
        std::cerr << "Warning: GED fell back to beam width 1 (" << reason << ")\n";
    }

    BeamOptions narrow_options;
    narrow_options.beam_width = 1;
    GedResult narrow = BeamSearchGed(costs_, narrow_options).compute(g1, g2);
    narrow.method = "fast_heuristic";
    narrow.beam_width = 1;
    narrow.timeout = true;
    narrow.note = reason;
    return narrow;
}

} // namespace graphdelta
