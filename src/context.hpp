#pragma once

#include "action.hpp"
#include "config.hpp"
#include "graph.hpp"
#include "module.hpp"
#include "plugins.hpp"
#include "stage.hpp"

#include <filesystem>
#include <fmt/format.h>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tristage {

// A configuration problem found during a generation run. `module` is empty
// for problems that don't belong to a single module.
struct BuildError {
    std::string module;
    std::string message;

    std::string to_string() const;
};

class Context;

// What a module sees while generating its actions.
class ModuleContext {
public:
    ModuleContext(Context& ctx, const std::string& module_name)
        : m_ctx(ctx), m_module_name(module_name){};

    inline const std::string& module_name() const {
        return m_module_name;
    }
    const std::string& module_dir() const;
    const Config& config() const;
    const PluginList& plugins() const;

    // Effective stage of this module after propagation.
    Stage stage() const;

    void visit_direct_deps(const ModuleGraph::Visitor& visit) const;
    void visit_deps_depth_first_if(const ModuleGraph::Predicate& pred,
                                   const ModuleGraph::Visitor& visit) const;

    // Malformed or conflicting actions are reported as module errors.
    void build(BuildParams params);

    template <typename... Args>
    void module_errorf(fmt::format_string<Args...> fmt, Args&&... args) {
        report(fmt::format(fmt, std::forward<Args>(args)...));
    }

    bool failed() const {
        return m_failed;
    }

private:
    void report(std::string message);

    Context& m_ctx;
    const std::string& m_module_name;
    bool m_failed{false};
};

// What the stage orchestrator sees once every module has generated its
// actions.
class SingletonContext {
public:
    SingletonContext(Context& ctx) : m_ctx(ctx){};

    const Config& config() const;
    const StageMap& stages() const;

    // Visits every module in dependency order.
    void visit_all_modules_if(const ModuleGraph::Predicate& pred,
                              const ModuleGraph::Visitor& visit) const;

    void set_build_dir(std::string dir);
    const Rule& add_rule(Rule rule);
    void build(BuildParams params);

    template <typename... Args>
    void errorf(fmt::format_string<Args...> fmt, Args&&... args) {
        report({}, fmt::format(fmt, std::forward<Args>(args)...));
    }
    template <typename... Args>
    void module_errorf(const Module& module, fmt::format_string<Args...> fmt,
                       Args&&... args) {
        report(module.name(), fmt::format(fmt, std::forward<Args>(args)...));
    }

private:
    void report(std::string module, std::string message);

    Context& m_ctx;
};

// Runs a whole generation: owns the configuration, the module graph and the
// actions emitted for it.
class Context {
public:
    explicit Context(Config config);
    // Module factories hold on to the configuration.
    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    void register_module_type(ModuleType type);
    const ModuleType* find_module_type(std::string_view name) const;
    inline const std::vector<ModuleType>& module_types() const {
        return m_module_types;
    }

    // Loads the top-level declarations file from the configuration, then
    // every file reachable through `subdirs`. Returns every problem found.
    std::vector<BuildError> parse_declarations();

    // Loads declarations from memory, as if read from `path`. The directory
    // of `path` relative to the source root becomes the module directory.
    std::vector<BuildError> parse_declarations_string(
        std::string_view text, const std::filesystem::path& path);

    // Runs every pass and the stage orchestrator. Returns every problem
    // found; actions are only meaningful if the result is empty.
    std::vector<BuildError> prepare_build_actions();

    inline const Config& config() const {
        return m_config;
    }
    inline const ModuleGraph& graph() const {
        return m_graph;
    }
    inline const ActionGraph& actions() const {
        return m_actions;
    }
    inline const PluginList& plugins() const {
        return m_plugins;
    }
    inline const StageMap& stages() const {
        return m_stages;
    }
    // Every declarations file read, top-level first.
    inline const std::vector<std::string>& declaration_files() const {
        return m_declaration_files;
    }

private:
    friend class ModuleContext;
    friend class SingletonContext;

    void load_file(const std::filesystem::path& path, bool top_level);
    void load_table(const toml::table& tbl, const std::filesystem::path& path,
                    bool top_level);
    void add_module(const toml::table& decl, const std::filesystem::path& path,
                    size_t index);
    void link_dependencies();
    void add_dynamic_dependencies();
    void generate_module_actions(const std::vector<std::string>& order);

    std::string module_dir_of(const std::filesystem::path& path) const;

    Config m_config;
    std::vector<ModuleType> m_module_types;
    ModuleGraph m_graph;
    ActionGraph m_actions;
    PluginList m_plugins;
    StageMap m_stages;
    std::vector<std::string> m_order; // Dependencies first
    std::vector<std::string> m_declaration_files;
    std::vector<BuildError> m_errors;
};

} // namespace tristage
