#include "binary.hpp"
#include "context.hpp"
#include "emit.hpp"
#include "plugins.hpp"
#include "rules.hpp"
#include "utils.hpp"
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

using namespace spdlog;

namespace tristage {

void Binary::parse(const toml::table& properties) {
    PropertyReader reader{properties};
    m_srcs = reader.get_string_list("srcs");
    m_test_srcs = reader.get_string_list("test_srcs");
    m_primary_builder = reader.get_bool("primary_builder");
    reader.finish();
}

std::vector<std::string>
Binary::dynamic_dependencies(const PluginList& plugins) const {
    if (m_primary_builder)
        return plugins.names();
    return {};
}

void Binary::generate_build_actions(ModuleContext& ctx) {
    const auto& name = ctx.module_name();
    auto obj_dir = rules::module_obj_dir(name);
    auto archive_file = utils::join_path({obj_dir, name + ".a"});
    auto aout_file = utils::join_path({obj_dir, "a.out"});
    auto binary_file = utils::join_path({rules::bin_dir, name});
    std::string plugin_src;
    std::vector<std::string> gen_srcs;

    bool run_tests = m_config.run_tests() && !m_test_srcs.empty();
    if (run_tests) {
        auto test_root = rules::test_root(name);
        m_test_archive_file = utils::join_path({test_root, name + ".a"});
        m_test_target = test_sentinel(test_root);
    }

    if (m_primary_builder && !ctx.plugins().empty()) {
        plugin_src = utils::join_path(
            {obj_dir, "plugin" + m_config.toolchain().source_extension()});
        gen_srcs.push_back(plugin_src);
    }

    // See Package::generate_build_actions.
    if (m_config.stage() == ctx.stage()) {
        debug("{}: building in the {} stage", name, stage_name(ctx.stage()));

        if (!plugin_src.empty()) {
            std::vector<std::string> plugins;
            ctx.visit_deps_depth_first_if(is_plugin, [&](const Module& module) {
                plugins.push_back(module.plugin_provider()->pkg_path());
            });

            BuildParams gen;
            gen.rule = &rules::plugin_gen_src();
            gen.outputs = {plugin_src};
            gen.implicits = {"$pluginGenSrcCmd"};
            gen.args["plugins"] = fmt::format("{}", fmt::join(plugins, " "));
            ctx.build(std::move(gen));
        }

        std::vector<std::string> deps;
        if (run_tests)
            deps = build_test(ctx, rules::test_root(name), m_test_archive_file,
                              name, m_srcs, gen_srcs, m_test_srcs);

        build_package(ctx, name, archive_file, m_srcs, gen_srcs, deps);

        std::vector<std::string> lib_dir_flags;
        ctx.visit_deps_depth_first_if(is_package_producer, [&](const Module& module) {
            lib_dir_flags.push_back("-L " + module.package_producer()->pkg_root());
        });

        BuildParams link;
        link.rule = &rules::link();
        link.outputs = {aout_file};
        link.inputs = {archive_file};
        link.implicits = {"$linkCmd"};
        if (!lib_dir_flags.empty())
            link.args["libDirFlags"] =
                fmt::format("{}", fmt::join(lib_dir_flags, " "));
        ctx.build(std::move(link));

        BuildParams cp;
        cp.rule = &rules::cp();
        cp.outputs = {binary_file};
        cp.inputs = {aout_file};
        ctx.build(std::move(cp));
    } else if (m_config.stage() != Stage::Bootstrap) {
        debug("{}: placeholder, built in the {} stage", name,
              stage_name(ctx.stage()));
        if (run_tests)
            phony_target(ctx, m_test_target, m_test_srcs, {},
                         test_intermediates(ctx, rules::test_root(name),
                                            m_test_archive_file));
        phony_target(ctx, binary_file, m_srcs, gen_srcs,
                     {aout_file, archive_file});
    }
}

namespace {

std::vector<PropertyDoc> binary_properties() {
    return {
        {"name", "string",
         "Unique name of the module, and of the executable in $BinDir."},
        {"deps", "list of strings", "Packages this binary imports."},
        {"srcs", "list of strings",
         "Sources, relative to the directory of the declarations file."},
        {"test_srcs", "list of strings",
         "Sources only compiled into the test binary."},
        {"primary_builder", "boolean",
         "This binary generates the main manifest. At most one module may set "
         "it."},
    };
}

} // namespace

ModuleType Binary::module_type(const Config& config) {
    return {
        "binary",
        "An executable built once the bootstrap stage is complete.",
        binary_properties(),
        [config = &config]() {
            return std::make_unique<Binary>(*config, Stage::Primary);
        },
    };
}

ModuleType Binary::core_module_type(const Config& config) {
    return {
        "core_binary",
        "An executable built by the mini builder in the bootstrap stage. "
        "Everything it depends on is built in the bootstrap stage too.",
        binary_properties(),
        [config = &config]() {
            return std::make_unique<Binary>(*config, Stage::Bootstrap);
        },
    };
}

} // namespace tristage
