#include "package.hpp"
#include "context.hpp"
#include "emit.hpp"
#include "rules.hpp"
#include "utils.hpp"
#include <spdlog/spdlog.h>

using namespace spdlog;

namespace tristage {

void Package::parse(const toml::table& properties) {
    PropertyReader reader{properties};
    m_pkg_path = reader.get_string("pkg_path");
    m_srcs = reader.get_string_list("srcs");
    m_test_srcs = reader.get_string_list("test_srcs");
    m_plugin = reader.get_bool("plugin");
    reader.finish();
}

void Package::generate_build_actions(ModuleContext& ctx) {
    const auto& name = ctx.module_name();

    if (m_pkg_path.empty()) {
        ctx.module_errorf("module {} did not specify a valid pkg_path", name);
        return;
    }

    bool run_tests = m_config.run_tests() && !m_test_srcs.empty();

    m_pkg_root = rules::package_root(name);
    m_archive_file = utils::join_path({m_pkg_root, m_pkg_path + ".a"});
    if (run_tests) {
        auto test_root = rules::test_root(name);
        m_test_archive_file = utils::join_path({test_root, m_pkg_path + ".a"});
        m_test_target = test_sentinel(test_root);
    }

    // Only build the module in the stage that needs it. Building it in every
    // stage would make the builder depend on the manifest it generates.
    if (m_config.stage() == ctx.stage()) {
        debug("{}: building in the {} stage", name, stage_name(ctx.stage()));
        std::vector<std::string> deps;
        if (run_tests)
            deps = build_test(ctx, rules::test_root(name), m_test_archive_file,
                              m_pkg_path, m_srcs, {}, m_test_srcs);

        build_package(ctx, m_pkg_path, m_archive_file, m_srcs, {}, deps);
    } else if (m_config.stage() != Stage::Bootstrap) {
        debug("{}: placeholder, built in the {} stage", name,
              stage_name(ctx.stage()));
        if (run_tests)
            phony_target(ctx, m_test_target, m_test_srcs, {},
                         test_intermediates(ctx, rules::test_root(name),
                                            m_test_archive_file));
        phony_target(ctx, m_archive_file, m_srcs, {}, {});
    }
}

ModuleType Package::module_type(const Config& config) {
    return {
        "package",
        "A library package compiled into an archive that other modules "
        "import by its package path.",
        {
            {"name", "string", "Unique name of the module."},
            {"deps", "list of strings", "Modules this package imports."},
            {"pkg_path", "string",
             "Import path of the package. Required."},
            {"srcs", "list of strings",
             "Sources, relative to the directory of the declarations file."},
            {"test_srcs", "list of strings",
             "Sources only compiled into the test binary."},
            {"plugin", "boolean",
             "Link this package into the primary builder."},
        },
        [config = &config]() { return std::make_unique<Package>(*config); },
    };
}

} // namespace tristage
