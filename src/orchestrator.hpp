#pragma once
#include "config.hpp"
#include <string>
#include <vector>

namespace tristage {

class SingletonContext;

// Wires the three stages of self-regeneration together. Runs once, after every
// module generated its actions.
//
// Each stage's manifest is produced into `$buildDir/.bootstrap/*.ninja.in`;
// the external stage chooser copies whichever one is current to
// `build.ninja.in`, from which the bootstrap command writes the
// `build.ninja` the execution engine actually reads. Timestamp files, touched
// whenever the inputs of an earlier stage change, send the chooser back to
// that stage:
//
//   bootstrap --(primary.ninja.in up to date)--> primary
//   primary   --(main.ninja.in up to date)-----> main
//   primary   --(primary timestamp newer)------> bootstrap
//   main      --(primary timestamp newer)------> bootstrap
//   main      --(main timestamp newer)---------> primary
class Orchestrator {
public:
    Orchestrator(const Config& config) : m_config(config){};

    void generate_build_actions(SingletonContext& ctx);

private:
    void bootstrap_stage(SingletonContext& ctx);
    void primary_stage(SingletonContext& ctx);
    void main_stage(SingletonContext& ctx);

    const Config& m_config;

    // Filled in by generate_build_actions before the per-stage wiring.
    std::string m_primary_builder_name;
    std::string m_primary_builder_file;
    std::vector<std::string> m_primary_builder_flags;
    std::string m_top_level_file;
    std::string m_mini_builder_file;

    // Everything built in the bootstrap stage: a change means the primary
    // stage manifest has to be regenerated.
    std::vector<std::string> m_rebootstrap_deps;

    // Everything built in the primary stage: a change means the main manifest
    // has to be regenerated.
    std::vector<std::string> m_primary_rebootstrap_deps;
};

} // namespace tristage
