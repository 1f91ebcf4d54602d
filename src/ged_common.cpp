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
#include <numeric>

namespace graphdelta {

double substitution_cost(const Node &a, const Node &b, const GedCosts &costs) {
    if (a.type == b.type && a.label == b.label)
        return 0.0;
    if (a.type == b.type)
        return 0.5 * costs.node_substitution;
    return costs.node_substitution;
}

json GedResult::to_json() const {
    json j;
    j["distance"] = distance;
    j["normalized_distance"] = normalized_distance;
    j["method"] = method;
    j["beam_width"] = beam_width;
    j["iterations"] = iterations;
    j["timeout"] = timeout;
    j["elapsed_seconds"] = elapsed_seconds;
    j["nodes_before"] = nodes_before;
    j["nodes_after"] = nodes_after;
    j["edges_before"] = edges_before;
    j["edges_after"] = edges_after;
    if (!note.empty())
        j["note"] = note;
    return j;
}

std::unique_ptr<GedStrategy> make_strategy(const GedConfig &config) {
    switch (config.strategy) {
    case GedStrategyKind::AStar:
        return std::make_unique<AStarGed>(config.costs, config.astar);
    case GedStrategyKind::Beam:
        return std::make_unique<BeamSearchGed>(config.costs, config.beam);
    case GedStrategyKind::Hybrid:
    default:
        return std::make_unique<HybridGed>(config.costs, config.hybrid);
    }
}

// ============ Greedy bipartite matcher ============

GedResult greedy_bipartite_ged(const Graph &g1, const Graph &g2, const GedCosts &costs,
                               size_t window) {
    auto start = std::chrono::steady_clock::now();
    GedResult result = detail::make_result(g1, g2, "fast_heuristic");
    if (detail::trivial_result(g1, g2, costs, result))
        return result;

    detail::GedProblem problem(g1, g2, costs);
    auto by_label = [](const detail::GedProblem &p, bool first) {
        std::vector<size_t> order(first ? p.n1() : p.n2());
        std::iota(order.begin(), order.end(), 0);
        std::sort(order.begin(), order.end(), [&](size_t a, size_t b) {
            const Node &x = first ? p.node1(a) : p.node2(a);
            const Node &y = first ? p.node1(b) : p.node2(b);
            if (x.label != y.label)
                return x.label < y.label;
            return x.id < y.id;
        });
        return order;
    };
    std::vector<size_t> order1 = by_label(problem, true);
    std::vector<size_t> order2 = by_label(problem, false);

    std::vector<bool> matched(problem.n2(), false);
    size_t matched_count = 0;
    size_t cursor = 0;
    double total = 0.0;

    for (size_t i : order1) {
        double best_cost = costs.node_deletion;
        size_t best_k = order2.size();
        size_t end = std::min(cursor + window, order2.size());
        for (size_t k = cursor; k < end; k++) {
            if (matched[k])
                continue;
            double cost = problem.sub(i, order2[k]);
            if (cost < best_cost) {
                best_cost = cost;
                best_k = k;
            }
        }
        total += best_cost;
        if (best_k < order2.size()) {
            matched[best_k] = true;
            matched_count++;
            cursor++;
        }
    }
    total += static_cast<double>(problem.n2() - matched_count) * costs.node_insertion;

    detail::finish_result(result, std::min(total, problem.identity_order_cost()));
    result.beam_width = 0;
    result.elapsed_seconds =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    return result;
}

namespace detail {

// ============ GedProblem ============

GedProblem::GedProblem(const Graph &g1, const Graph &g2, const GedCosts &costs)
    : costs_(costs) {
    StringPool classes;
    StringPool types;
    auto intern = [&](const Node &node, std::vector<uint32_t> &cls, std::vector<uint32_t> &typ) {
        std::string type_name = node_type_to_string(node.type);
        cls.push_back(static_cast<uint32_t>(classes.intern(type_name + '\x1f' + node.label)));
        typ.push_back(static_cast<uint32_t>(types.intern(type_name)));
    };

    for (const auto &[id, node] : g1.nodes()) {
        nodes1_.push_back(&node);
        intern(node, class1_, type1_);
    }
    for (const auto &[id, node] : g2.nodes()) {
        nodes2_.push_back(&node);
        intern(node, class2_, type2_);
    }
    class_count_ = classes.size();
    type_count_ = types.size();
}

double GedProblem::sub(size_t i, size_t j) const {
    double cost;
    if (cache_.lookup(static_cast<uint32_t>(i), static_cast<uint32_t>(j), cost))
        return cost;
    cost = substitution_cost(*nodes1_[i], *nodes2_[j], costs_);
    cache_.store(static_cast<uint32_t>(i), static_cast<uint32_t>(j), cost);
    return cost;
}

double GedProblem::identity_order_cost() const {
    std::vector<int32_t> mapping(n1(), DELETED);
    size_t shared = std::min(n1(), n2());
    for (size_t i = 0; i < shared; i++) {
        mapping[i] = static_cast<int32_t>(i);
    }
    return assignment_cost(mapping);
}

double GedProblem::greedy_completion(std::vector<int32_t> mapping) const {
    std::vector<bool> used(n2(), false);
    for (int32_t j : mapping) {
        if (j != DELETED)
            used[j] = true;
    }

    double pair_cost = costs_.node_deletion + costs_.node_insertion;
    for (size_t i = mapping.size(); i < n1(); i++) {
        int32_t best = DELETED;
        double best_cost = 0.0;
        for (size_t j = 0; j < n2(); j++) {
            if (used[j])
                continue;
            double cost = sub(i, j);
            if (best == DELETED || cost < best_cost) {
                best = static_cast<int32_t>(j);
                best_cost = cost;
            }
        }
        if (best != DELETED && best_cost <= pair_cost) {
            used[best] = true;
            mapping.push_back(best);
        } else {
            mapping.push_back(DELETED);
        }
    }
    return assignment_cost(mapping);
}

double GedProblem::assignment_cost(const std::vector<int32_t> &mapping) const {
    double cost = 0.0;
    size_t matched = 0;
    for (size_t i = 0; i < mapping.size(); i++) {
        if (mapping[i] == DELETED) {
            cost += costs_.node_deletion;
        } else {
            cost += sub(i, static_cast<size_t>(mapping[i]));
            matched++;
        }
    }
    cost += static_cast<double>(n2() - matched) * costs_.node_insertion;
    return cost;
}

// ============ RemainingCounts ============

RemainingCounts::RemainingCounts(const GedProblem &problem, const std::vector<int32_t> &mapping)
    : problem_(problem), class_left1_(problem.class_count(), 0),
      class_left2_(problem.class_count(), 0), type_left1_(problem.type_count(), 0),
      type_left2_(problem.type_count(), 0) {
    for (size_t i = mapping.size(); i < problem.n1(); i++) {
        class_left1_[problem.class1(i)]++;
        type_left1_[problem.type1(i)]++;
        rem1_++;
    }

    std::vector<bool> used(problem.n2(), false);
    for (int32_t j : mapping) {
        if (j != DELETED)
            used[j] = true;
    }
    for (size_t j = 0; j < problem.n2(); j++) {
        if (used[j])
            continue;
        class_left2_[problem.class2(j)]++;
        type_left2_[problem.type2(j)]++;
        rem2_++;
    }

    for (size_t c = 0; c < class_left1_.size(); c++) {
        exact_ += static_cast<size_t>(std::min(class_left1_[c], class_left2_[c]));
    }
    for (size_t t = 0; t < type_left1_.size(); t++) {
        typed_ += static_cast<size_t>(std::min(type_left1_[t], type_left2_[t]));
    }
}

double RemainingCounts::bound(size_t rem1, size_t rem2, size_t exact, size_t typed) const {
    const GedCosts &costs = problem_.costs();
    size_t overlap = std::min(rem1, rem2);
    double pair_cost = costs.node_deletion + costs.node_insertion;
    double same_type = std::min(0.5 * costs.node_substitution, pair_cost);
    double other = std::min(costs.node_substitution, pair_cost);

    return static_cast<double>(rem1 - overlap) * costs.node_deletion +
           static_cast<double>(rem2 - overlap) * costs.node_insertion +
           static_cast<double>(typed - exact) * same_type +
           static_cast<double>(overlap - typed) * other;
}

double RemainingCounts::heuristic() const { return bound(rem1_, rem2_, exact_, typed_); }

double RemainingCounts::heuristic_after(size_t i, int32_t j) const {
    uint32_t c1 = problem_.class1(i);
    uint32_t t1 = problem_.type1(i);
    size_t exact = exact_;
    size_t typed = typed_;

    if (j == DELETED) {
        if (class_left1_[c1] <= class_left2_[c1])
            exact--;
        if (type_left1_[t1] <= type_left2_[t1])
            typed--;
        return bound(rem1_ - 1, rem2_, exact, typed);
    }

    uint32_t c2 = problem_.class2(static_cast<size_t>(j));
    uint32_t t2 = problem_.type2(static_cast<size_t>(j));
    if (c1 == c2) {
        exact--;
    } else {
        if (class_left1_[c1] <= class_left2_[c1])
            exact--;
        if (class_left2_[c2] <= class_left1_[c2])
            exact--;
    }
    if (t1 == t2) {
        typed--;
    } else {
        if (type_left1_[t1] <= type_left2_[t1])
            typed--;
        if (type_left2_[t2] <= type_left1_[t2])
            typed--;
    }
    return bound(rem1_ - 1, rem2_ - 1, exact, typed);
}

// ============ Search states ============

std::vector<int32_t> recover_mapping(const std::vector<SearchState> &arena, int32_t index) {
    std::vector<int32_t> mapping(arena[index].depth, DELETED);
    while (index >= 0 && arena[index].depth > 0) {
        mapping[arena[index].depth - 1] = arena[index].target;
        index = arena[index].parent;
    }
    return mapping;
}

std::vector<SearchState> expand_state(const GedProblem &problem,
                                      const std::vector<SearchState> &arena,
                                      int32_t parent_index, size_t branching) {
    const SearchState &parent = arena[parent_index];
    std::vector<int32_t> mapping = recover_mapping(arena, parent_index);
    RemainingCounts counts(problem, mapping);

    std::vector<bool> used(problem.n2(), false);
    for (int32_t j : mapping) {
        if (j != DELETED)
            used[j] = true;
    }

    size_t i = parent.depth;
    std::vector<std::pair<double, int32_t>> candidates;
    for (size_t j = 0; j < problem.n2(); j++) {
        if (!used[j])
            candidates.emplace_back(problem.sub(i, j), static_cast<int32_t>(j));
    }
    std::sort(candidates.begin(), candidates.end());
    if (branching > 0 && candidates.size() > branching)
        candidates.resize(branching);

    const GedCosts &costs = problem.costs();
    bool last = (i + 1 == problem.n1());

    auto make_child = [&](int32_t target, double step) {
        SearchState child;
        child.parent = parent_index;
        child.target = target;
        child.depth = parent.depth + 1;
        child.matched = parent.matched + (target == DELETED ? 0 : 1);
        child.g = parent.g + step;
        if (last) {
            child.g += static_cast<double>(problem.n2() - child.matched) * costs.node_insertion;
            child.f = child.g;
        } else {
            child.f = child.g + counts.heuristic_after(i, target);
        }
        return child;
    };

    std::vector<SearchState> children;
    children.reserve(candidates.size() + 1);
    for (const auto &[cost, j] : candidates) {
        children.push_back(make_child(j, cost));
    }
    children.push_back(make_child(DELETED, costs.node_deletion));
    return children;
}

// ============ Results ============

GedResult make_result(const Graph &g1, const Graph &g2, const std::string &method) {
    GedResult result;
    result.method = method;
    result.nodes_before = g1.node_count();
    result.nodes_after = g2.node_count();
    result.edges_before = g1.edge_count();
    result.edges_after = g2.edge_count();
    return result;
}

void finish_result(GedResult &result, double distance) {
    result.distance = distance;
    size_t max_nodes = std::max(result.nodes_before, result.nodes_after);
    result.normalized_distance = max_nodes > 0 ? distance / static_cast<double>(max_nodes) : 0.0;
}

bool trivial_result(const Graph &g1, const Graph &g2, const GedCosts &costs,
                    GedResult &result) {
    if (!g1.empty() && !g2.empty())
        return false;

    result.method = "trivial";
    if (g1.empty() && g2.empty()) {
        finish_result(result, 0.0);
    } else if (g1.empty()) {
        finish_result(result, static_cast<double>(g2.node_count()) * costs.node_insertion);
    } else {
        finish_result(result, static_cast<double>(g1.node_count()) * costs.node_deletion);
    }
    return true;
}

} // namespace detail
} // namespace graphdelta
