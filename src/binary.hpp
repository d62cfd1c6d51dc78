#pragma once
#include "config.hpp"
#include "module.hpp"
#include <string>
#include <vector>

namespace tristage {

// An executable linked into $BinDir. One binary may be flagged as the primary
// builder: the tool that generates the main manifest.
class Binary : public Module,
               public StageBearer,
               public TestProducer,
               public BinaryProducer {
public:
    Binary(const Config& config, Stage stage)
        : m_config(config), m_stage(stage){};

    void parse(const toml::table& properties) override;

    // The primary builder depends on every plugin.
    std::vector<std::string>
    dynamic_dependencies(const PluginList& plugins) const override;

    void generate_build_actions(ModuleContext& ctx) override;

    Stage declared_stage() const override {
        return m_stage;
    }
    const std::string& test_target() const override {
        return m_test_target;
    }
    bool is_primary_builder() const override {
        return m_primary_builder;
    }

    const StageBearer* stage_bearer() const override {
        return this;
    }
    const TestProducer* test_producer() const override {
        return this;
    }
    const BinaryProducer* binary_producer() const override {
        return this;
    }

    // `binary` is built in the primary stage, `core_binary` by the mini
    // builder in the bootstrap stage.
    static ModuleType module_type(const Config& config);
    static ModuleType core_module_type(const Config& config);

private:
    // Field: `srcs`
    std::vector<std::string> m_srcs;

    // Field: `test_srcs`
    std::vector<std::string> m_test_srcs;

    // Field: `primary_builder`
    bool m_primary_builder{false};

    std::string m_test_archive_file;
    std::string m_test_target;

    const Config& m_config;
    Stage m_stage;
};

} // namespace tristage
