#pragma once

#include "module.hpp"

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace tristage {

struct ModuleNode {
    std::string name;
    std::string type;
    std::unique_ptr<Module> module;
    std::filesystem::path declared_in; // File the module was declared in
    std::vector<std::string> declared_deps;     // As written in the declaration
    std::vector<std::string> dependencies_names; // Resolved edges, in order
    std::vector<std::string> dependents_names;   // Inverse of dependencies_names
};

// Circular dependency between modules. `cycle` lists the module names
// along the cycle, starting and ending with the same module.
class CycleError : public std::runtime_error {
public:
    CycleError(std::vector<std::string> cycle);

    inline const std::vector<std::string>& cycle() const {
        return m_cycle;
    }

private:
    std::vector<std::string> m_cycle;
};

class ModuleGraph {
public:
    using Visitor = std::function<void(const Module&)>;
    using Predicate = std::function<bool(const Module&)>;

    ModuleGraph(){};

    // Takes ownership of `node`. Throws std::runtime_error if a module with
    // the same name already exists.
    void add_module(ModuleNode node);

    // Adds the edge `from` -> `to`. Returns false if `to` is not a known
    // module. Duplicate edges are ignored.
    bool add_dependency(const std::string& from, const std::string& to);

    // Resolves a topological order in which every module comes after its
    // dependencies; ties are broken by declaration order. Throws CycleError
    // on circular dependencies.
    std::vector<std::string> resolve() const;

    bool contains(const std::string& name) const {
        return m_nodes.count(name) != 0;
    }
    const ModuleNode& node(const std::string& name) const {
        return m_nodes.at(name);
    }
    Module& module(const std::string& name) {
        return *m_nodes.at(name).module;
    }
    const Module& module(const std::string& name) const {
        return *m_nodes.at(name).module;
    }
    inline const std::vector<std::string>& declaration_order() const {
        return m_order;
    }
    size_t size() const {
        return m_order.size();
    }

    void visit_direct_deps(const std::string& name, const Visitor& visit) const;

    // Post-order walk over the transitive dependencies of `name`: a module is
    // visited after all of its own dependencies, and at most once.
    void visit_deps_depth_first(const std::string& name,
                                const Visitor& visit) const;
    void visit_deps_depth_first_if(const std::string& name,
                                   const Predicate& pred,
                                   const Visitor& visit) const;

private:
    void resolve_visit(const std::string& node_name,
                       std::vector<std::string>& resolved_list,
                       std::map<std::string, bool>& visited,
                       std::vector<std::string>& stack) const;

    std::map<std::string, ModuleNode> m_nodes;
    std::vector<std::string> m_order; // Declaration order
};

} // namespace tristage
