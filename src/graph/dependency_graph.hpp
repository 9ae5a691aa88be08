/**
 * @file dependency_graph.hpp
 * @brief Directed graph over job names.
 *
 * Edge A → B means B needs A to finish first. Keeps forward adjacency for
 * successors and reverse adjacency for predecessors and ancestor queries.
 * Node and neighbour order follow insertion order, so every traversal is
 * deterministic for a given construction sequence.
 */

#pragma once

#include "core/types.hpp"

#include <cstddef>
#include <set>
#include <unordered_map>
#include <vector>

namespace pipeline_dag {

class DependencyGraph {
public:
    DependencyGraph() = default;

    // ── Construction ──────────────────────────
    void add_node(const JobName& name);
    /// Adds from → to. Both nodes must exist; duplicate edges are ignored.
    bool add_edge(const JobName& from, const JobName& to);

    // ── Queries ───────────────────────────────
    [[nodiscard]] bool has_node(const JobName& name) const;
    [[nodiscard]] bool has_edge(const JobName& from, const JobName& to) const;
    [[nodiscard]] const std::vector<JobName>& nodes() const noexcept;
    [[nodiscard]] std::vector<Edge> edges() const;
    [[nodiscard]] const std::vector<JobName>& successors(const JobName& name) const;
    [[nodiscard]] const std::vector<JobName>& predecessors(const JobName& name) const;
    [[nodiscard]] size_t in_degree(const JobName& name) const;
    [[nodiscard]] size_t out_degree(const JobName& name) const;
    [[nodiscard]] size_t node_count() const noexcept;
    [[nodiscard]] size_t edge_count() const noexcept;

    /// All nodes reachable by following edges backward (excludes `name`
    /// unless it sits on a cycle).
    [[nodiscard]] std::set<JobName> ancestors(const JobName& name) const;
    [[nodiscard]] std::set<JobName> descendants(const JobName& name) const;

    // ── Ordering ──────────────────────────────
    /// Kahn order. Shorter than node_count() when the graph has a cycle.
    [[nodiscard]] std::vector<JobName> topological_order() const;
    /// Kahn-style generation peeling. Empty when the graph has a cycle.
    [[nodiscard]] std::vector<std::vector<JobName>> generations() const;

    // ── Cycles ────────────────────────────────
    [[nodiscard]] bool has_cycle() const;
    /// Every simple cycle, each starting at its earliest member in node order.
    [[nodiscard]] std::vector<std::vector<JobName>> simple_cycles() const;

    // ── Paths ─────────────────────────────────
    /// Longest path by hop count. Empty when the graph has a cycle.
    [[nodiscard]] std::vector<JobName> longest_chain() const;

private:
    [[nodiscard]] size_t index_of(const JobName& name) const;
    [[nodiscard]] std::set<JobName> reachable(const JobName& start,
        const std::unordered_map<JobName, std::vector<JobName>>& adjacency) const;

    std::vector<JobName> nodes_;
    std::unordered_map<JobName, size_t> index_;
    std::unordered_map<JobName, std::vector<JobName>> adj_list_;       // forward edges
    std::unordered_map<JobName, std::vector<JobName>> reverse_adj_;    // backward edges
    size_t edge_count_{0};
};

}  // namespace pipeline_dag
