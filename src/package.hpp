#pragma once
#include "config.hpp"
#include "module.hpp"
#include <string>
#include <vector>

namespace tristage {

// A library package: compiled into an archive that other modules import by
// its package path.
class Package : public Module,
                public StageBearer,
                public PackageProducer,
                public TestProducer,
                public PluginProvider {
public:
    Package(const Config& config) : m_config(config){};

    void parse(const toml::table& properties) override;
    void generate_build_actions(ModuleContext& ctx) override;

    Stage declared_stage() const override {
        return Stage::Primary;
    }

    const std::string& pkg_root() const override {
        return m_pkg_root;
    }
    const std::string& package_target() const override {
        return m_archive_file;
    }
    const std::string& test_target() const override {
        return m_test_target;
    }
    const std::string& pkg_path() const override {
        return m_pkg_path;
    }
    bool is_plugin() const override {
        return m_plugin;
    }

    const StageBearer* stage_bearer() const override {
        return this;
    }
    const PackageProducer* package_producer() const override {
        return this;
    }
    const TestProducer* test_producer() const override {
        return this;
    }
    const PluginProvider* plugin_provider() const override {
        return this;
    }

    static ModuleType module_type(const Config& config);

private:
    // Import path of the package. Field: `pkg_path`
    std::string m_pkg_path;

    // Field: `srcs`
    std::vector<std::string> m_srcs;

    // Sources only compiled into the test archive. Field: `test_srcs`
    std::vector<std::string> m_test_srcs;

    // Linked into the primary builder. Field: `plugin`
    bool m_plugin{false};

    // The root dir in which the package archive is located. The full archive
    // path is "<pkg root>/<pkg path>.a".
    std::string m_pkg_root;

    std::string m_archive_file;
    std::string m_test_archive_file;
    std::string m_test_target;

    const Config& m_config;
};

} // namespace tristage
