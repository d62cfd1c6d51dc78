#include "test_helpers.hpp"
#include <algorithm>
#include <stdexcept>

namespace tristage::testing {

const BuildParams& Generation::produced(const std::string& output) const {
    auto params = ctx->actions().find_output(output);
    if (!params)
        throw std::runtime_error("nothing produces " + output);
    return *params;
}

bool Generation::has_error_for(const std::string& module) const {
    return std::any_of(errors.begin(), errors.end(),
                       [&](const BuildError& e) { return e.module == module; });
}

Config make_config(Stage stage, bool run_tests) {
    Config config{stage, std::string(top_level_file)};
    config.m_run_tests = run_tests;
    config.m_build_dir = "out";
    return config;
}

Generation generate(std::string_view declarations, Stage stage,
                    bool run_tests) {
    Generation gen;
    gen.ctx = std::make_unique<Context>(make_config(stage, run_tests));
    gen.errors = gen.ctx->parse_declarations_string(
        declarations, std::string(top_level_file));
    if (gen.errors.empty())
        gen.errors = gen.ctx->prepare_build_actions();
    return gen;
}

bool contains(const std::vector<std::string>& list, const std::string& item) {
    return std::find(list.begin(), list.end(), item) != list.end();
}

} // namespace tristage::testing
