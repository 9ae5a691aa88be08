/**
 * @file dependency_graph.cpp
 * @brief DependencyGraph implementation: traversal, ordering and cycle search.
 *
 * Implements Kahn's algorithm for topological ordering and generation
 * peeling, DFS-based cycle detection and simple-cycle enumeration, ancestor
 * closure, and hop-count longest path. Everything runs on the internal
 * adjacency lists.
 */

#include "graph/dependency_graph.hpp"

#include <algorithm>
#include <queue>
#include <stack>
#include <unordered_set>

namespace pipeline_dag {

namespace {

const std::vector<JobName>& empty_neighbours() {
    static const std::vector<JobName> empty;
    return empty;
}

}  // namespace

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

void DependencyGraph::add_node(const JobName& name) {
    if (index_.contains(name)) return;
    index_.emplace(name, nodes_.size());
    nodes_.push_back(name);
    adj_list_[name];
    reverse_adj_[name];
}

bool DependencyGraph::add_edge(const JobName& from, const JobName& to) {
    if (!has_node(from) || !has_node(to)) return false;
    if (has_edge(from, to)) return false;

    adj_list_[from].push_back(to);
    reverse_adj_[to].push_back(from);
    ++edge_count_;
    return true;
}

// ─────────────────────────────────────────────
// Query Methods
// ─────────────────────────────────────────────

bool DependencyGraph::has_node(const JobName& name) const {
    return index_.contains(name);
}

bool DependencyGraph::has_edge(const JobName& from, const JobName& to) const {
    auto it = adj_list_.find(from);
    if (it == adj_list_.end()) return false;
    return std::find(it->second.begin(), it->second.end(), to) != it->second.end();
}

const std::vector<JobName>& DependencyGraph::nodes() const noexcept {
    return nodes_;
}

std::vector<Edge> DependencyGraph::edges() const {
    std::vector<Edge> result;
    result.reserve(edge_count_);
    for (const auto& from : nodes_) {
        for (const auto& to : successors(from)) {
            result.emplace_back(from, to);
        }
    }
    return result;
}

const std::vector<JobName>& DependencyGraph::successors(const JobName& name) const {
    auto it = adj_list_.find(name);
    if (it == adj_list_.end()) return empty_neighbours();
    return it->second;
}

const std::vector<JobName>& DependencyGraph::predecessors(const JobName& name) const {
    auto it = reverse_adj_.find(name);
    if (it == reverse_adj_.end()) return empty_neighbours();
    return it->second;
}

size_t DependencyGraph::in_degree(const JobName& name) const {
    return predecessors(name).size();
}

size_t DependencyGraph::out_degree(const JobName& name) const {
    return successors(name).size();
}

size_t DependencyGraph::node_count() const noexcept {
    return nodes_.size();
}

size_t DependencyGraph::edge_count() const noexcept {
    return edge_count_;
}

size_t DependencyGraph::index_of(const JobName& name) const {
    return index_.at(name);
}

std::set<JobName> DependencyGraph::reachable(
    const JobName& start,
    const std::unordered_map<JobName, std::vector<JobName>>& adjacency) const {
    std::set<JobName> seen;
    auto start_it = adjacency.find(start);
    if (start_it == adjacency.end()) return seen;

    std::queue<JobName> frontier;
    for (const auto& next : start_it->second) {
        if (seen.insert(next).second) frontier.push(next);
    }

    while (!frontier.empty()) {
        auto current = frontier.front();
        frontier.pop();
        if (auto it = adjacency.find(current); it != adjacency.end()) {
            for (const auto& next : it->second) {
                if (seen.insert(next).second) frontier.push(next);
            }
        }
    }

    return seen;
}

std::set<JobName> DependencyGraph::ancestors(const JobName& name) const {
    return reachable(name, reverse_adj_);
}

std::set<JobName> DependencyGraph::descendants(const JobName& name) const {
    return reachable(name, adj_list_);
}

// ─────────────────────────────────────────────
// Topological Ordering (Kahn's Algorithm)
// ─────────────────────────────────────────────

std::vector<JobName> DependencyGraph::topological_order() const {
    std::unordered_map<JobName, size_t> in_degree;
    for (const auto& name : nodes_) {
        in_degree[name] = predecessors(name).size();
    }

    std::queue<JobName> zero_in;
    for (const auto& name : nodes_) {
        if (in_degree[name] == 0) {
            zero_in.push(name);
        }
    }

    std::vector<JobName> order;
    order.reserve(nodes_.size());

    while (!zero_in.empty()) {
        auto current = zero_in.front();
        zero_in.pop();
        order.push_back(current);

        for (const auto& neighbor : successors(current)) {
            if (--in_degree[neighbor] == 0) {
                zero_in.push(neighbor);
            }
        }
    }

    return order;
}

std::vector<std::vector<JobName>> DependencyGraph::generations() const {
    std::unordered_map<JobName, size_t> in_degree;
    std::vector<JobName> current;
    for (const auto& name : nodes_) {
        in_degree[name] = predecessors(name).size();
        if (in_degree[name] == 0) current.push_back(name);
    }

    std::vector<std::vector<JobName>> result;
    size_t placed = 0;

    while (!current.empty()) {
        std::vector<JobName> next;
        for (const auto& name : current) {
            for (const auto& neighbor : successors(name)) {
                if (--in_degree[neighbor] == 0) {
                    next.push_back(neighbor);
                }
            }
        }
        std::sort(next.begin(), next.end(), [this](const JobName& a, const JobName& b) {
            return index_of(a) < index_of(b);
        });

        placed += current.size();
        result.push_back(std::move(current));
        current = std::move(next);
    }

    // Nodes on or behind a cycle never reach in-degree zero.
    if (placed != nodes_.size()) return {};
    return result;
}

// ─────────────────────────────────────────────
// Cycle Detection
// ─────────────────────────────────────────────

bool DependencyGraph::has_cycle() const {
    enum class Color : uint8_t { White, Gray, Black };
    std::unordered_map<JobName, Color> color;

    for (const auto& name : nodes_) {
        color[name] = Color::White;
    }

    for (const auto& start : nodes_) {
        if (color[start] != Color::White) continue;

        struct Frame {
            JobName node;
            size_t neighbor_idx;
        };

        std::stack<Frame> dfs_stack;
        dfs_stack.push({start, 0});
        color[start] = Color::Gray;

        while (!dfs_stack.empty()) {
            auto& [node, idx] = dfs_stack.top();

            const auto& neighbors = successors(node);
            if (idx >= neighbors.size()) {
                color[node] = Color::Black;
                dfs_stack.pop();
                continue;
            }

            const auto& neighbor = neighbors[idx];
            ++idx;

            if (color[neighbor] == Color::Gray) {
                return true;
            }
            if (color[neighbor] == Color::White) {
                color[neighbor] = Color::Gray;
                dfs_stack.push({neighbor, 0});
            }
        }
    }

    return false;
}

std::vector<std::vector<JobName>> DependencyGraph::simple_cycles() const {
    std::vector<std::vector<JobName>> cycles;

    for (size_t start_idx = 0; start_idx < nodes_.size(); ++start_idx) {
        const auto& start = nodes_[start_idx];

        // Restrict the search to the strongly connected component of `start`,
        // minus nodes already used as a start (their cycles are reported).
        auto forward = descendants(start);
        if (!forward.contains(start)) continue;
        auto backward = ancestors(start);
        std::unordered_set<JobName> allowed;
        for (const auto& name : forward) {
            if (backward.contains(name) && index_of(name) > start_idx) {
                allowed.insert(name);
            }
        }

        struct Frame {
            JobName node;
            size_t neighbor_idx;
        };

        std::vector<Frame> dfs_stack{{start, 0}};
        std::vector<JobName> path{start};
        std::unordered_set<JobName> on_stack{start};

        while (!dfs_stack.empty()) {
            auto& frame = dfs_stack.back();
            const auto& neighbors = successors(frame.node);

            if (frame.neighbor_idx >= neighbors.size()) {
                on_stack.erase(frame.node);
                path.pop_back();
                dfs_stack.pop_back();
                continue;
            }

            const auto& neighbor = neighbors[frame.neighbor_idx];
            ++frame.neighbor_idx;

            if (neighbor == start) {
                cycles.push_back(path);
                continue;
            }
            if (!allowed.contains(neighbor) || on_stack.contains(neighbor)) {
                continue;
            }

            on_stack.insert(neighbor);
            path.push_back(neighbor);
            dfs_stack.push_back({neighbor, 0});
        }
    }

    return cycles;
}

// ─────────────────────────────────────────────
// Longest Chain (hop count)
// ─────────────────────────────────────────────

std::vector<JobName> DependencyGraph::longest_chain() const {
    auto topo = topological_order();
    if (topo.empty() || topo.size() != nodes_.size()) return {};

    std::unordered_map<JobName, size_t> hops;
    std::unordered_map<JobName, JobName> pred;
    for (const auto& name : nodes_) {
        hops[name] = 1;
    }

    for (const auto& u : topo) {
        for (const auto& v : successors(u)) {
            if (hops[u] + 1 > hops[v]) {
                hops[v] = hops[u] + 1;
                pred[v] = u;
            }
        }
    }

    JobName end = topo.front();
    for (const auto& name : topo) {
        if (hops[name] > hops[end]) end = name;
    }

    std::vector<JobName> chain{end};
    for (auto it = pred.find(end); it != pred.end(); it = pred.find(it->second)) {
        chain.push_back(it->second);
    }
    std::reverse(chain.begin(), chain.end());
    return chain;
}

}  // namespace pipeline_dag
