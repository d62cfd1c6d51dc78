#pragma once
#include "stage.hpp"
#include <functional>
#include <memory>
#include <set>
#include <string>
#include <toml++/toml.hpp>
#include <vector>

namespace tristage {

class ModuleContext;
class PluginList;

// Capability groups a module may expose. Passes query them through the
// accessors on `Module` instead of asking for a concrete module type.

// A module built in a particular stage.
class StageBearer {
public:
    virtual ~StageBearer() = default;
    virtual Stage declared_stage() const = 0;
};

// A module producing an archive other modules can import.
class PackageProducer {
public:
    virtual ~PackageProducer() = default;

    // Directory in which the archive lives; dependents pass it as -I / -L.
    virtual const std::string& pkg_root() const = 0;
    virtual const std::string& package_target() const = 0;
};

// A module with a test pipeline.
class TestProducer {
public:
    virtual ~TestProducer() = default;

    // The "tests passed" sentinel, or an empty string if the module's tests
    // aren't built.
    virtual const std::string& test_target() const = 0;
};

class PluginProvider {
public:
    virtual ~PluginProvider() = default;
    virtual const std::string& pkg_path() const = 0;
    virtual bool is_plugin() const = 0;
};

// A module linking an executable into $BinDir.
class BinaryProducer {
public:
    virtual ~BinaryProducer() = default;
    virtual bool is_primary_builder() const = 0;
};

class Module {
public:
    virtual ~Module() = default;

    inline const std::string& name() const {
        return m_name;
    }
    // Directory of the module relative to the source root, "." for the root.
    inline const std::string& dir() const {
        return m_dir;
    }
    void set_identity(std::string name, std::string dir);

    // Reads the type-specific properties of the module's declaration.
    // Throws std::runtime_error on unknown properties or mistyped values.
    virtual void parse(const toml::table& properties) = 0;

    // Dependencies that cannot be declared statically, computed once the
    // plugin discovery pass is complete.
    virtual std::vector<std::string>
    dynamic_dependencies(const PluginList& plugins) const;

    virtual void generate_build_actions(ModuleContext& ctx) = 0;

    virtual const StageBearer* stage_bearer() const {
        return nullptr;
    }
    virtual const PackageProducer* package_producer() const {
        return nullptr;
    }
    virtual const TestProducer* test_producer() const {
        return nullptr;
    }
    virtual const PluginProvider* plugin_provider() const {
        return nullptr;
    }
    virtual const BinaryProducer* binary_producer() const {
        return nullptr;
    }

private:
    std::string m_name;
    std::string m_dir{"."};
};

inline bool is_package_producer(const Module& module) {
    return module.package_producer() != nullptr;
}

inline bool is_plugin(const Module& module) {
    auto plugin = module.plugin_provider();
    return plugin && plugin->is_plugin();
}

// Typed access to the properties of a single module declaration. Every key
// that is read is remembered so that `finish` can reject unknown ones.
class PropertyReader {
public:
    PropertyReader(const toml::table& properties) : m_properties(properties){};

    std::string get_string(std::string_view key);
    bool get_bool(std::string_view key, bool default_value = false);
    std::vector<std::string> get_string_list(std::string_view key);

    // Throws if the declaration has a property that was never read.
    void finish() const;

private:
    const toml::node* lookup(std::string_view key);

    const toml::table& m_properties;
    std::set<std::string, std::less<>> m_used;
};

// Documentation of a single module property, rendered by `--docs`.
struct PropertyDoc {
    std::string name;
    std::string type;
    std::string description;
};

using ModuleFactory = std::function<std::unique_ptr<Module>()>;

struct ModuleType {
    std::string name;
    std::string description;
    std::vector<PropertyDoc> properties;
    ModuleFactory factory;
};

} // namespace tristage
