#include "emit.hpp"
#include "context.hpp"
#include "rules.hpp"
#include "utils.hpp"
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

using namespace spdlog;

namespace tristage {

namespace {

std::string test_main_file(ModuleContext& ctx, const std::string& test_root) {
    return utils::join_path(
        {test_root, "test" + ctx.config().toolchain().source_extension()});
}

} // namespace

void build_package(ModuleContext& ctx, const std::string& pkg_path,
                   const std::string& archive_file,
                   const std::vector<std::string>& srcs,
                   const std::vector<std::string>& gen_srcs,
                   const std::vector<std::string>& order_deps) {
    auto src_files = utils::prefix_paths(srcs, rules::module_src_dir(ctx.module_dir()));
    src_files.insert(src_files.end(), gen_srcs.begin(), gen_srcs.end());

    std::vector<std::string> inc_flags;
    std::vector<std::string> deps{"$compileCmd"};
    ctx.visit_deps_depth_first_if(is_package_producer, [&](const Module& module) {
        auto dep = module.package_producer();
        inc_flags.push_back("-I " + dep->pkg_root());
        deps.push_back(dep->package_target());
    });

    BuildParams params;
    params.rule = &rules::compile();
    params.outputs = {archive_file};
    params.inputs = std::move(src_files);
    params.order_only = order_deps;
    params.implicits = std::move(deps);
    params.args["pkgPath"] = pkg_path;
    if (!inc_flags.empty())
        params.args["incFlags"] = fmt::format("{}", fmt::join(inc_flags, " "));

    trace("{}: compile {} from {} source(s)", ctx.module_name(), archive_file,
          params.inputs.size());
    ctx.build(std::move(params));
}

std::vector<std::string> build_test(ModuleContext& ctx,
                                    const std::string& test_root,
                                    const std::string& test_pkg_archive,
                                    const std::string& pkg_path,
                                    const std::vector<std::string>& srcs,
                                    const std::vector<std::string>& gen_srcs,
                                    const std::vector<std::string>& test_srcs) {
    if (test_srcs.empty())
        return {};

    auto src_dir = rules::module_src_dir(ctx.module_dir());
    auto test_files = utils::prefix_paths(test_srcs, src_dir);

    auto main_file = test_main_file(ctx, test_root);
    auto test_archive = utils::join_path({test_root, "test.a"});
    auto test_file = utils::join_path({test_root, "test"});
    auto test_passed = test_sentinel(test_root);

    auto all_srcs = srcs;
    all_srcs.insert(all_srcs.end(), test_srcs.begin(), test_srcs.end());
    build_package(ctx, pkg_path, test_pkg_archive, all_srcs, gen_srcs, {});

    BuildParams gen_main;
    gen_main.rule = &rules::test_main();
    gen_main.outputs = {main_file};
    gen_main.inputs = test_files;
    gen_main.implicits = {"$testMainCmd"};
    gen_main.args["pkg"] = pkg_path;
    ctx.build(std::move(gen_main));

    std::vector<std::string> lib_dir_flags{"-L " + test_root};
    ctx.visit_deps_depth_first_if(is_package_producer, [&](const Module& module) {
        lib_dir_flags.push_back("-L " + module.package_producer()->pkg_root());
    });

    BuildParams compile_main;
    compile_main.rule = &rules::compile();
    compile_main.outputs = {test_archive};
    compile_main.inputs = {main_file};
    compile_main.implicits = {"$compileCmd", test_pkg_archive};
    compile_main.args["pkgPath"] = "main";
    compile_main.args["incFlags"] = "-I " + test_root;
    ctx.build(std::move(compile_main));

    BuildParams link;
    link.rule = &rules::link();
    link.outputs = {test_file};
    link.inputs = {test_archive};
    link.implicits = {"$linkCmd"};
    link.args["libDirFlags"] = fmt::format("{}", fmt::join(lib_dir_flags, " "));
    ctx.build(std::move(link));

    BuildParams run;
    run.rule = &rules::test();
    run.outputs = {test_passed};
    run.inputs = {test_file};
    run.args["pkg"] = pkg_path;
    run.args["pkgSrcDir"] = src_dir;
    ctx.build(std::move(run));

    debug("{}: test pipeline for {} test source(s)", ctx.module_name(),
          test_srcs.size());
    return {test_passed};
}

std::string test_sentinel(std::string_view test_root) {
    return utils::join_path({test_root, "test.passed"});
}

std::vector<std::string> test_intermediates(ModuleContext& ctx,
                                            const std::string& test_root,
                                            const std::string& test_pkg_archive) {
    return {
        test_pkg_archive,
        test_main_file(ctx, test_root),
        utils::join_path({test_root, "test.a"}),
        utils::join_path({test_root, "test"}),
    };
}

void phony_target(ModuleContext& ctx, const std::string& target,
                  const std::vector<std::string>& srcs,
                  const std::vector<std::string>& gen_srcs,
                  const std::vector<std::string>& intermediates) {
    std::vector<std::string> dep_targets;
    ctx.visit_deps_depth_first_if(is_package_producer, [&](const Module& module) {
        dep_targets.push_back(module.package_producer()->package_target());
    });

    auto inputs = utils::prefix_paths(srcs, rules::module_src_dir(ctx.module_dir()));
    inputs.insert(inputs.end(), gen_srcs.begin(), gen_srcs.end());

    BuildParams params;
    params.rule = &rules::phony();
    params.outputs = {target};
    params.inputs = inputs;
    params.implicits = std::move(dep_targets);
    ctx.build(std::move(params));

    for (const auto& src : inputs) {
        BuildParams marker;
        marker.rule = &Rule::phony();
        marker.outputs = {src};
        ctx.build(std::move(marker));
    }

    for (const auto& intermediate : intermediates) {
        BuildParams marker;
        marker.rule = &Rule::phony();
        marker.outputs = {intermediate};
        ctx.build(std::move(marker));
    }

    trace("{}: placeholder for {} ({} source(s))", ctx.module_name(), target,
          inputs.size());
}

} // namespace tristage
