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
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>

namespace graphdelta {

// ============================================================================
// Cost model
// ============================================================================

struct GedCosts {
    double node_insertion = 1.0;
    double node_deletion = 1.0;
    double node_substitution = 1.0;
};

// 0 when type and label match, half the substitution constant when only
// the type matches, the full constant otherwise
double substitution_cost(const Node &a, const Node &b, const GedCosts &costs);

// Memoized substitution costs for one comparison, keyed by node-index pair.
// Cleared wholesale once `capacity` entries are held.
class SubstitutionCostCache {
public:
    explicit SubstitutionCostCache(size_t capacity = 1u << 20) : capacity_(capacity) {}

    // Returns true and sets `cost` on a hit
    bool lookup(uint32_t i, uint32_t j, double &cost) const {
        auto it = entries_.find(key(i, j));
        if (it == entries_.end())
            return false;
        cost = it->second;
        return true;
    }

    void store(uint32_t i, uint32_t j, double cost) {
        if (entries_.size() >= capacity_) {
            entries_.clear();
            ++evictions_;
        }
        entries_[key(i, j)] = cost;
    }

    size_t size() const { return entries_.size(); }
    size_t capacity() const { return capacity_; }
    size_t evictions() const { return evictions_; }

private:
    static uint64_t key(uint32_t i, uint32_t j) {
        return (static_cast<uint64_t>(i) << 32) | static_cast<uint64_t>(j);
    }

    size_t capacity_;
    size_t evictions_ = 0;
    std::unordered_map<uint64_t, double> entries_;
};

// Wall-clock and expansion budget, checked cooperatively between expansions.
// A non-positive time limit or a zero expansion limit means unbounded.
class SearchBudget {
public:
    SearchBudget(double max_seconds, size_t max_expansions)
        : max_seconds_(max_seconds), max_expansions_(max_expansions) {}

    void start() {
        start_time_ = std::chrono::steady_clock::now();
        expansions_ = 0;
    }

    void record_expansion() { expansions_++; }

    bool can_continue() const { return !time_exhausted() && !expansion_exhausted(); }

    double elapsed_seconds() const {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration<double>(now - start_time_).count();
    }

    size_t expansions() const { return expansions_; }
    bool time_exhausted() const { return max_seconds_ > 0 && elapsed_seconds() >= max_seconds_; }
    bool expansion_exhausted() const {
        return max_expansions_ > 0 && expansions_ >= max_expansions_;
    }

private:
    double max_seconds_;
    size_t max_expansions_;
    size_t expansions_ = 0;
    std::chrono::steady_clock::time_point start_time_ = std::chrono::steady_clock::now();
};

// ============================================================================
// Results
// ============================================================================

struct GedResult {
    double distance = 0.0;
    double normalized_distance = 0.0; // distance / max(|V1|, |V2|)
    std::string method;
    int beam_width = 0;
    size_t iterations = 0;
    bool timeout = false;
    double elapsed_seconds = 0.0;

    size_t nodes_before = 0;
    size_t nodes_after = 0;
    size_t edges_before = 0;
    size_t edges_after = 0;

    std::string note; // Why a fallback was taken, if one was

    json to_json() const;
};

// ============================================================================
// Strategies
// ============================================================================

class GedStrategy {
public:
    virtual ~GedStrategy() = default;

    // g1 is the "before" graph, g2 the "after" graph
    virtual GedResult compute(const Graph &g1, const Graph &g2) const = 0;

    virtual std::string name() const = 0;
};

struct AStarOptions {
    size_t max_iterations = 10000;
    size_t max_branching = 5; // Substitution candidates per expansion
    size_t max_nodes = 100;   // Larger graphs use the greedy matcher
};

struct BeamOptions {
    int beam_width = 10;
    size_t max_nodes = 200; // Larger graphs use the greedy matcher
};

struct HybridOptions {
    double time_budget_seconds = 120.0;
    bool verbose = false;
};

// Best-first search on f = g + h with an admissible h
class AStarGed : public GedStrategy {
public:
    explicit AStarGed(const GedCosts &costs = GedCosts{},
                      const AStarOptions &options = AStarOptions{});

    GedResult compute(const Graph &g1, const Graph &g2) const override;
    std::string name() const override { return "astar"; }

private:
    GedCosts costs_;
    AStarOptions options_;
};

// Keeps the `beam_width` best states per depth
class BeamSearchGed : public GedStrategy {
public:
    explicit BeamSearchGed(const GedCosts &costs = GedCosts{},
                           const BeamOptions &options = BeamOptions{});

    GedResult compute(const Graph &g1, const Graph &g2) const override;

    // As compute(), stopping early once `budget` runs out (timeout = true)
    GedResult compute(const Graph &g1, const Graph &g2, SearchBudget &budget) const;

    std::string name() const override { return "beam_search"; }

private:
    GedCosts costs_;
    BeamOptions options_;

    GedResult run(const Graph &g1, const Graph &g2, SearchBudget *budget) const;
};

// Beam width picked from the larger node count, bounded by a wall-clock
// budget, falling back to width 1 on overrun or failure
class HybridGed : public GedStrategy {
public:
    explicit HybridGed(const GedCosts &costs = GedCosts{},
                       const HybridOptions &options = HybridOptions{});

    GedResult compute(const Graph &g1, const Graph &g2) const override;
    std::string name() const override { return "hybrid"; }

    // Beam width for a node count (0 = greedy fallback)
    static int beam_width_for(size_t max_nodes);

private:
    GedCosts costs_;
    HybridOptions options_;

    GedResult fallback(const Graph &g1, const Graph &g2, const std::string &reason) const;
};

// Sort both node sets by label and match within a lookahead window
GedResult greedy_bipartite_ged(const Graph &g1, const Graph &g2,
                               const GedCosts &costs = GedCosts{}, size_t window = 10);

// ============================================================================
// Configuration
// ============================================================================

enum class GedStrategyKind { AStar, Beam, Hybrid };

inline const char *ged_strategy_to_string(GedStrategyKind kind) {
    switch (kind) {
    case GedStrategyKind::AStar:
        return "astar";
    case GedStrategyKind::Beam:
        return "beam";
    case GedStrategyKind::Hybrid:
        return "hybrid";
    default:
        return "unknown";
    }
}

// Returns false for an unrecognised name
inline bool ged_strategy_from_string(const std::string &name, GedStrategyKind &kind) {
    if (name == "astar" || name == "a*")
        kind = GedStrategyKind::AStar;
    else if (name == "beam")
        kind = GedStrategyKind::Beam;
    else if (name == "hybrid")
        kind = GedStrategyKind::Hybrid;
    else
        return false;
    return true;
}

struct GedConfig {
    GedStrategyKind strategy = GedStrategyKind::Hybrid;
    GedCosts costs;
    AStarOptions astar;
    BeamOptions beam;
    HybridOptions hybrid;
};

std::unique_ptr<GedStrategy> make_strategy(const GedConfig &config);

} // namespace graphdelta
