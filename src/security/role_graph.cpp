/**
 * @file role_graph.cpp
 * @brief Role inheritance graph construction and traversal
 *
 * @copyright Copyright (c) 2025
 */

#include <tenantguard/security/role_graph.hpp>

#include <algorithm>
#include <deque>
#include <set>

namespace tenantguard::security {

namespace {

enum class visit_state : std::uint8_t { unvisited, on_stack, done };

/**
 * Depth-first search reporting every back edge as a cycle. Each cycle is
 * reported once, starting from the role that was entered first.
 */
void collect_cycles(const std::vector<role_graph::node>& nodes,
                    std::vector<policy_diagnostic>& diagnostics) {
    std::vector<visit_state> state(nodes.size(), visit_state::unvisited);
    std::vector<role_id> path;
    std::set<std::set<role_id>> reported;

    auto dfs = [&](auto&& self, role_id id) -> void {
        state[id] = visit_state::on_stack;
        path.push_back(id);

        for (auto parent : nodes[id].parents) {
            if (state[parent] == visit_state::on_stack) {
                auto begin = std::ranges::find(path, parent);
                std::vector<role_id> cycle(begin, path.end());
                std::set<role_id> members(cycle.begin(), cycle.end());
                if (reported.insert(members).second) {
                    policy_diagnostic diag;
                    diag.code = diagnostic_code::cycle_detected;
                    std::string chain;
                    for (auto member : cycle) {
                        diag.subjects.push_back(nodes[member].name);
                        chain += nodes[member].name + " -> ";
                    }
                    chain += nodes[parent].name;
                    diag.message = "role inheritance cycle: " + chain;
                    diagnostics.push_back(std::move(diag));
                }
            } else if (state[parent] == visit_state::unvisited) {
                self(self, parent);
            }
        }

        path.pop_back();
        state[id] = visit_state::done;
    };

    for (role_id id = 0; id < nodes.size(); ++id) {
        if (state[id] == visit_state::unvisited) {
            dfs(dfs, id);
        }
    }
}

} // namespace

auto role_graph::build(const std::vector<role_definition>& definitions,
                       std::vector<policy_diagnostic>& diagnostics)
    -> std::optional<role_graph> {
    const auto errors_before = diagnostics.size();
    role_graph graph;

    graph.nodes_.reserve(definitions.size());
    for (const auto& def : definitions) {
        if (graph.index_.contains(def.name)) {
            diagnostics.push_back({diagnostic_code::duplicate_role,
                                   "role '" + def.name + "' is declared twice",
                                   {def.name}});
            continue;
        }
        auto id = static_cast<role_id>(graph.nodes_.size());
        graph.index_.emplace(def.name, id);
        graph.nodes_.push_back({def.name, {}, def.idle_timeout, def.industry_role});
    }

    std::vector<bool> wired(graph.nodes_.size(), false);
    for (const auto& def : definitions) {
        auto self = graph.index_.at(def.name);
        if (wired[self]) {
            continue; // duplicate declaration
        }
        wired[self] = true;
        auto& parents = graph.nodes_[self].parents;
        for (const auto& parent_name : def.inherits) {
            auto it = graph.index_.find(parent_name);
            if (it == graph.index_.end()) {
                diagnostics.push_back(
                    {diagnostic_code::undefined_role,
                     "role '" + def.name + "' inherits undefined role '" +
                         parent_name + "'",
                     {def.name, parent_name}});
                continue;
            }
            if (std::ranges::find(parents, it->second) == parents.end()) {
                parents.push_back(it->second);
            }
        }
    }

    collect_cycles(graph.nodes_, diagnostics);

    if (diagnostics.size() != errors_before) {
        return std::nullopt;
    }

    // Kahn's algorithm over parent edges: ancestors first.
    std::vector<std::size_t> pending(graph.nodes_.size());
    std::vector<std::vector<role_id>> children(graph.nodes_.size());
    for (role_id id = 0; id < graph.nodes_.size(); ++id) {
        pending[id] = graph.nodes_[id].parents.size();
        for (auto parent : graph.nodes_[id].parents) {
            children[parent].push_back(id);
        }
    }

    std::deque<role_id> ready;
    for (role_id id = 0; id < graph.nodes_.size(); ++id) {
        if (pending[id] == 0) {
            ready.push_back(id);
        }
    }
    while (!ready.empty()) {
        auto id = ready.front();
        ready.pop_front();
        graph.topo_order_.push_back(id);
        for (auto child : children[id]) {
            if (--pending[child] == 0) {
                ready.push_back(child);
            }
        }
    }

    return graph;
}

auto role_graph::find(std::string_view name) const -> std::optional<role_id> {
    auto it = index_.find(std::string(name));
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto role_graph::ancestors(role_id id) const
    -> std::vector<std::pair<role_id, std::uint32_t>> {
    std::vector<std::pair<role_id, std::uint32_t>> result;
    std::vector<bool> seen(nodes_.size(), false);
    std::deque<std::pair<role_id, std::uint32_t>> queue;

    queue.emplace_back(id, 0);
    seen[id] = true;

    while (!queue.empty()) {
        auto [current, distance] = queue.front();
        queue.pop_front();
        result.emplace_back(current, distance);

        for (auto parent : nodes_[current].parents) {
            if (!seen[parent]) {
                seen[parent] = true;
                queue.emplace_back(parent, distance + 1);
            }
        }
    }
    return result;
}

} // namespace tenantguard::security
