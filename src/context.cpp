#include "context.hpp"
#include "binary.hpp"
#include "orchestrator.hpp"
#include "package.hpp"
#include "rules.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/stopwatch.h>

using namespace spdlog;

namespace tristage {

std::string BuildError::to_string() const {
    if (module.empty())
        return message;
    return fmt::format("module `{}`: {}", module, message);
}

const std::string& ModuleContext::module_dir() const {
    return m_ctx.m_graph.module(m_module_name).dir();
}

const Config& ModuleContext::config() const {
    return m_ctx.m_config;
}

const PluginList& ModuleContext::plugins() const {
    return m_ctx.m_plugins;
}

Stage ModuleContext::stage() const {
    return m_ctx.m_stages.at(m_module_name);
}

void ModuleContext::visit_direct_deps(const ModuleGraph::Visitor& visit) const {
    m_ctx.m_graph.visit_direct_deps(m_module_name, visit);
}

void ModuleContext::visit_deps_depth_first_if(
    const ModuleGraph::Predicate& pred, const ModuleGraph::Visitor& visit) const {
    m_ctx.m_graph.visit_deps_depth_first_if(m_module_name, pred, visit);
}

void ModuleContext::build(BuildParams params) {
    try {
        m_ctx.m_actions.build(std::move(params));
    } catch (const std::invalid_argument& e) {
        report(e.what());
    }
}

void ModuleContext::report(std::string message) {
    trace("module error in `{}`: {}", m_module_name, message);
    m_failed = true;
    m_ctx.m_errors.push_back({m_module_name, std::move(message)});
}

const Config& SingletonContext::config() const {
    return m_ctx.m_config;
}

const StageMap& SingletonContext::stages() const {
    return m_ctx.m_stages;
}

void SingletonContext::visit_all_modules_if(
    const ModuleGraph::Predicate& pred, const ModuleGraph::Visitor& visit) const {
    for (const auto& name : m_ctx.m_order) {
        const Module& module = m_ctx.m_graph.module(name);
        if (pred(module))
            visit(module);
    }
}

void SingletonContext::set_build_dir(std::string dir) {
    m_ctx.m_actions.set_build_dir(std::move(dir));
}

const Rule& SingletonContext::add_rule(Rule rule) {
    return m_ctx.m_actions.add_rule(std::move(rule));
}

void SingletonContext::build(BuildParams params) {
    try {
        m_ctx.m_actions.build(std::move(params));
    } catch (const std::invalid_argument& e) {
        report({}, e.what());
    }
}

void SingletonContext::report(std::string module, std::string message) {
    trace("singleton error: {}", message);
    m_ctx.m_errors.push_back({std::move(module), std::move(message)});
}

Context::Context(Config config) : m_config(std::move(config)) {
    register_module_type(Package::module_type(m_config));
    register_module_type(Binary::module_type(m_config));
    register_module_type(Binary::core_module_type(m_config));
}

void Context::register_module_type(ModuleType type) {
    if (find_module_type(type.name))
        throw std::logic_error(
            fmt::format("module type `{}` registered twice", type.name));
    m_module_types.push_back(std::move(type));
}

const ModuleType* Context::find_module_type(std::string_view name) const {
    for (const auto& type : m_module_types) {
        if (type.name == name)
            return &type;
    }
    return nullptr;
}

void Context::link_dependencies() {
    for (const auto& name : m_graph.declaration_order()) {
        for (const auto& dep : m_graph.node(name).declared_deps) {
            if (!m_graph.add_dependency(name, dep))
                m_errors.push_back(
                    {name, fmt::format("depends on undefined module `{}`", dep)});
        }
    }
}

void Context::add_dynamic_dependencies() {
    for (const auto& name : m_graph.declaration_order()) {
        for (const auto& dep :
             m_graph.module(name).dynamic_dependencies(m_plugins)) {
            if (!m_graph.add_dependency(name, dep))
                m_errors.push_back(
                    {name, fmt::format("depends on undefined module `{}`", dep)});
        }
    }
}

void Context::generate_module_actions(const std::vector<std::string>& order) {
    for (const auto& name : order) {
        ModuleContext ctx{*this, name};
        try {
            m_graph.module(name).generate_build_actions(ctx);
        } catch (const std::exception& e) {
            ctx.module_errorf("{}", e.what());
        }
        trace("`{}` generated its actions{}", name,
              ctx.failed() ? " with errors" : "");
    }
}

std::vector<BuildError> Context::prepare_build_actions() {
    stopwatch sw;
    m_errors.clear();

    link_dependencies();

    // Must complete before any module reads the plugin list.
    m_plugins = PluginList::collect(m_graph);
    add_dynamic_dependencies();

    try {
        m_order = m_graph.resolve();
    } catch (const CycleError& e) {
        m_errors.push_back({e.cycle().front(), e.what()});
        return std::move(m_errors);
    }

    m_stages = StageMap::propagate(m_graph, m_order);

    rules::add_variables(m_actions, m_config);
    generate_module_actions(m_order);

    Orchestrator orchestrator{m_config};
    SingletonContext ctx{*this};
    orchestrator.generate_build_actions(ctx);

    debug("generated {} action(s) for {} module(s) in the {} stage in {}s",
          m_actions.builds().size(), m_graph.size(), stage_name(m_config.stage()),
          sw);
    return std::move(m_errors);
}

} // namespace tristage
