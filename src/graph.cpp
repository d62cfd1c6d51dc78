#include "graph.hpp"
#include <algorithm>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <set>
#include <spdlog/spdlog.h>

namespace tristage {

using namespace spdlog;

CycleError::CycleError(std::vector<std::string> cycle)
    : std::runtime_error(
          fmt::format("circular dependency: {}", fmt::join(cycle, " -> "))),
      m_cycle(std::move(cycle)) {}

void ModuleGraph::add_module(ModuleNode node) {
    if (m_nodes.count(node.name)) {
        const auto& existing = m_nodes.at(node.name);
        throw std::runtime_error(
            fmt::format("module `{}` is already declared in `{}`", node.name,
                        existing.declared_in.string()));
    }
    std::string name = node.name;
    trace("adding module `{}` of type `{}`", name, node.type);
    m_nodes.emplace(name, std::move(node));
    m_order.push_back(std::move(name));
}

bool ModuleGraph::add_dependency(const std::string& from,
                                 const std::string& to) {
    if (!m_nodes.count(to))
        return false;

    auto& node = m_nodes.at(from);
    auto& deps = node.dependencies_names;
    if (std::find(deps.begin(), deps.end(), to) != deps.end()) {
        trace("edge {} -> {} already present", from, to);
        return true;
    }
    deps.push_back(to);
    m_nodes.at(to).dependents_names.push_back(from);
    trace("linked {} -> {}", from, to);
    return true;
}

std::vector<std::string> ModuleGraph::resolve() const {
    std::vector<std::string> resolved_list;
    std::map<std::string, bool> visited;
    std::vector<std::string> stack;

    for (const auto& name : m_order)
        visited[name] = false;

    for (const auto& name : m_order) {
        if (!visited[name])
            resolve_visit(name, resolved_list, visited, stack);
    }

    debug("module graph resolved, {} module(s)", resolved_list.size());
    for (size_t i = 0; i < resolved_list.size(); ++i)
        trace("{}. {}", i + 1, resolved_list[i]);
    return resolved_list;
}

void ModuleGraph::resolve_visit(const std::string& node_name,
                                std::vector<std::string>& resolved_list,
                                std::map<std::string, bool>& visited,
                                std::vector<std::string>& stack) const {
    visited[node_name] = true;
    stack.push_back(node_name);

    for (const std::string& dep_name : m_nodes.at(node_name).dependencies_names) {
        auto on_stack = std::find(stack.begin(), stack.end(), dep_name);
        if (on_stack != stack.end()) {
            std::vector<std::string> cycle(on_stack, stack.end());
            cycle.push_back(dep_name);
            error("circular dependency detected: {} -> {}", node_name, dep_name);
            throw CycleError(std::move(cycle));
        }
        if (!visited.at(dep_name))
            resolve_visit(dep_name, resolved_list, visited, stack);
    }

    stack.pop_back();
    resolved_list.push_back(node_name);
}

void ModuleGraph::visit_direct_deps(const std::string& name,
                                    const Visitor& visit) const {
    for (const auto& dep : m_nodes.at(name).dependencies_names)
        visit(*m_nodes.at(dep).module);
}

void ModuleGraph::visit_deps_depth_first(const std::string& name,
                                         const Visitor& visit) const {
    visit_deps_depth_first_if(
        name, [](const Module&) { return true; }, visit);
}

void ModuleGraph::visit_deps_depth_first_if(const std::string& name,
                                            const Predicate& pred,
                                            const Visitor& visit) const {
    std::set<std::string> visited;
    std::function<void(const std::string&)> walk =
        [&](const std::string& current) {
            for (const auto& dep : m_nodes.at(current).dependencies_names) {
                if (!visited.insert(dep).second)
                    continue;
                walk(dep);
                const Module& module = *m_nodes.at(dep).module;
                if (pred(module))
                    visit(module);
            }
        };
    walk(name);
}

} // namespace tristage
