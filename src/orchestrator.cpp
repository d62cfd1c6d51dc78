#include "orchestrator.hpp"
#include "context.hpp"
#include "rules.hpp"
#include "utils.hpp"
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

using namespace spdlog;

namespace tristage {

namespace {

struct StageFiles {
    std::string main_ninja;
    std::string main_timestamp;
    std::string main_timestamp_dep;
    std::string primary_ninja;
    std::string primary_timestamp;
    std::string primary_timestamp_dep;
    std::string bootstrap_ninja;
    std::string chosen_ninja;
    std::string not_a_file;
};

StageFiles stage_files() {
    StageFiles files;
    files.main_ninja = utils::join_path({rules::bootstrap_dir, "main.ninja.in"});
    files.main_timestamp = files.main_ninja + ".timestamp";
    files.main_timestamp_dep = files.main_timestamp + ".d";
    files.primary_ninja =
        utils::join_path({rules::bootstrap_dir, "primary.ninja.in"});
    files.primary_timestamp = files.primary_ninja + ".timestamp";
    files.primary_timestamp_dep = files.primary_timestamp + ".d";
    files.bootstrap_ninja =
        utils::join_path({rules::bootstrap_dir, "bootstrap.ninja.in"});
    files.chosen_ninja = utils::join_path({rules::bootstrap_dir, "build.ninja.in"});
    files.not_a_file = utils::join_path({rules::bootstrap_dir, "notAFile"});
    return files;
}

std::string docs_file(std::string_view primary_builder) {
    return utils::join_path(
        {rules::bootstrap_dir, "docs", std::string(primary_builder) + ".html"});
}

void bare_phony(SingletonContext& ctx, std::vector<std::string> outputs) {
    BuildParams params;
    params.rule = &Rule::phony();
    params.outputs = std::move(outputs);
    ctx.build(std::move(params));
}

// Always dirty: depending on it makes the chooser run on every build.
void not_a_file(SingletonContext& ctx, const StageFiles& files) {
    bare_phony(ctx, {files.not_a_file});
}

void touch_if_stale(SingletonContext& ctx, const std::string& timestamp,
                    const std::string& timestamp_dep,
                    const std::vector<std::string>& deps) {
    BuildParams params;
    params.rule = &rules::touch();
    params.outputs = {timestamp};
    params.implicits = deps;
    params.args["depfile"] = timestamp_dep;
    params.args["generator"] = "true";
    ctx.build(std::move(params));
}

} // namespace

void Orchestrator::generate_build_actions(SingletonContext& ctx) {
    std::vector<const Module*> primary_builders;
    m_rebootstrap_deps.clear();
    m_primary_rebootstrap_deps.clear();

    ctx.visit_all_modules_if(
        [](const Module& module) { return module.binary_producer() != nullptr; },
        [&](const Module& module) {
            auto path = utils::join_path({rules::bin_dir, module.name()});
            if (ctx.stages().at(module.name()) == Stage::Bootstrap)
                m_rebootstrap_deps.push_back(path);
            else
                m_primary_rebootstrap_deps.push_back(path);
            if (module.binary_producer()->is_primary_builder())
                primary_builders.push_back(&module);
        });

    const auto& mini_builder = m_config.toolchain().mini_builder();
    m_primary_builder_flags.clear();
    switch (primary_builders.size()) {
    case 0:
        // no primary builder module: the mini builder acts as one in its
        // primary builder mode
        m_primary_builder_name = mini_builder;
        m_primary_builder_flags.push_back("-p");
        break;
    case 1:
        m_primary_builder_name = primary_builders[0]->name();
        break;
    default:
        ctx.errorf("multiple primary builder modules present:");
        for (const auto* module : primary_builders)
            ctx.module_errorf(*module, "<-- module {}", module->name());
        return;
    }

    m_primary_builder_file =
        utils::join_path({rules::bin_dir, m_primary_builder_name});
    m_mini_builder_file = utils::join_path({rules::bin_dir, mini_builder});
    if (m_config.run_tests())
        m_primary_builder_flags.push_back("-t");

    m_top_level_file = utils::join_path(
        {"$srcDir", m_config.top_level_file().filename().generic_string()});

    m_rebootstrap_deps.push_back(m_top_level_file);
    m_primary_rebootstrap_deps.push_back(m_top_level_file);
    m_primary_rebootstrap_deps.push_back(docs_file(m_primary_builder_name));

    // The ninja files have to depend on the test results, otherwise the
    // timestamps would always be newer and we would never leave the stage.
    ctx.visit_all_modules_if(
        [](const Module& module) { return module.test_producer() != nullptr; },
        [&](const Module& module) {
            const auto& target = module.test_producer()->test_target();
            if (target.empty())
                return;
            if (ctx.stages().at(module.name()) == Stage::Bootstrap)
                m_rebootstrap_deps.push_back(target);
            else
                m_primary_rebootstrap_deps.push_back(target);
        });

    debug("primary builder: {} ({}), {} bootstrap dep(s), {} primary dep(s)",
          m_primary_builder_name, m_primary_builder_file,
          m_rebootstrap_deps.size(), m_primary_rebootstrap_deps.size());

    switch (m_config.stage()) {
    case Stage::Bootstrap:
        bootstrap_stage(ctx);
        break;
    case Stage::Primary:
        primary_stage(ctx);
        break;
    case Stage::Main:
        main_stage(ctx);
        break;
    }

    auto files = stage_files();
    BuildParams finalize;
    finalize.rule = &rules::bootstrap();
    finalize.outputs = {"$buildDir/build.ninja"};
    finalize.inputs = {files.chosen_ninja};
    finalize.implicits = {"$bootstrapCmd"};
    ctx.build(std::move(finalize));
}

void Orchestrator::bootstrap_stage(SingletonContext& ctx) {
    auto files = stage_files();

    // every stage needs its own build dir, otherwise the cleanup of one stage
    // removes the outputs of another
    ctx.set_build_dir(std::string(rules::mini_bootstrap_dir));

    // Generate the manifest that builds the primary builder. The timestamp
    // and its deps let the later stages come back here.
    const Rule& primarybp = ctx.add_rule({
        "tristage.primarybp",
        fmt::format("{} --build-primary $runTests -m $bootstrapManifest "
                    "--timestamp $timestamp --timestampdep $timestampdep "
                    "-b $buildDir -d $outfile.d -o $outfile $in",
                    m_mini_builder_file),
        fmt::format("{} $outfile", m_config.toolchain().mini_builder()),
        "$outfile.d",
        false,
        {"runTests", "timestamp", "timestampdep", "outfile"},
    });

    BuildParams primary;
    primary.rule = &primarybp;
    primary.outputs = {files.primary_ninja, files.primary_timestamp};
    primary.inputs = {m_top_level_file};
    primary.implicits = m_rebootstrap_deps;
    primary.args["outfile"] = files.primary_ninja;
    primary.args["timestamp"] = files.primary_timestamp;
    primary.args["timestampdep"] = files.primary_timestamp_dep;
    if (m_config.run_tests())
        primary.args["runTests"] = "-t";
    ctx.build(std::move(primary));

    // Regenerate this manifest with the freshly built mini builder; if it
    // changed, the chooser stays in this stage.
    const Rule& minibp = ctx.add_rule({
        "tristage.minibp",
        fmt::format("{} $runTests -m $bootstrapManifest -b $buildDir "
                    "-d $out.d -o $out $in",
                    m_mini_builder_file),
        fmt::format("{} $out", m_config.toolchain().mini_builder()),
        "$out.d",
        true,
        {"runTests"},
    });

    BuildParams self;
    self.rule = &minibp;
    self.outputs = {files.bootstrap_ninja};
    self.inputs = {m_top_level_file};
    // $bootstrapManifest forces a regeneration when it is updated: the
    // chooser has already copied the new version, keeping the old timestamps
    self.implicits = {"$bootstrapManifest", m_mini_builder_file};
    if (m_config.run_tests())
        self.args["runTests"] = "-t";
    ctx.build(std::move(self));

    // A bootstrap manifest always hands off to the next stage.
    not_a_file(ctx, files);

    BuildParams choose;
    choose.rule = &rules::choose_stage();
    choose.outputs = {files.chosen_ninja};
    choose.inputs = {files.bootstrap_ninja, files.primary_ninja};
    choose.implicits = {"$chooseStageCmd", "$bootstrapManifest", files.not_a_file};
    choose.args["current"] = files.bootstrap_ninja;
    ctx.build(std::move(choose));
}

void Orchestrator::primary_stage(SingletonContext& ctx) {
    auto files = stage_files();
    auto docs = docs_file(m_primary_builder_name);
    auto flags = fmt::format("{}", fmt::join(m_primary_builder_flags, " "));

    ctx.set_build_dir(std::string(rules::bootstrap_dir));

    // The depfile lists every declarations file contributing to the main
    // manifest. The main manifest uses it to decide whether to touch the
    // timestamp and come back here.
    const Rule& bigbp = ctx.add_rule({
        "tristage.bigbp",
        fmt::format("{} {} -m $bootstrapManifest --timestamp $timestamp "
                    "--timestampdep $timestampdep -b $buildDir "
                    "-d $outfile.d -o $outfile $in",
                    m_primary_builder_file, flags),
        fmt::format("{} $outfile", m_primary_builder_name),
        "$outfile.d",
        false,
        {"timestamp", "timestampdep", "outfile"},
    });

    BuildParams main;
    main.rule = &bigbp;
    main.outputs = {files.main_ninja, files.main_timestamp};
    main.inputs = {m_top_level_file};
    main.implicits = m_primary_rebootstrap_deps;
    main.args["timestamp"] = files.main_timestamp;
    main.args["timestampdep"] = files.main_timestamp_dep;
    main.args["outfile"] = files.main_ninja;
    ctx.build(std::move(main));

    // Docs only depend on the primary builder: any relevant declaration
    // change rebuilds it anyway.
    const Rule& bigbp_docs = ctx.add_rule({
        "tristage.bigbpDocs",
        fmt::format("{} {} -b $buildDir --docs $out {}", m_primary_builder_file,
                    flags, m_top_level_file),
        fmt::format("{} docs $out", m_primary_builder_name),
        "",
        false,
        {},
    });

    BuildParams gen_docs;
    gen_docs.rule = &bigbp_docs;
    gen_docs.outputs = {docs};
    gen_docs.implicits = {m_primary_builder_file};
    ctx.build(std::move(gen_docs));

    // Newer than primary.ninja.in means the chooser goes back to the
    // bootstrap stage.
    touch_if_stale(ctx, files.primary_timestamp, files.primary_timestamp_dep,
                   m_rebootstrap_deps);

    not_a_file(ctx, files);

    BuildParams choose;
    choose.rule = &rules::choose_stage();
    choose.outputs = {files.chosen_ninja};
    choose.inputs = {files.bootstrap_ninja, files.primary_ninja, files.main_ninja};
    choose.implicits = {"$chooseStageCmd", "$bootstrapManifest", files.not_a_file,
                        files.primary_timestamp};
    choose.args["current"] = files.primary_ninja;
    ctx.build(std::move(choose));

    // keeps upgrades from deleting it during cleanup
    bare_phony(ctx, {files.bootstrap_ninja});
}

void Orchestrator::main_stage(SingletonContext& ctx) {
    auto files = stage_files();
    auto docs = docs_file(m_primary_builder_name);

    ctx.set_build_dir("${buildDir}");

    // Each timestamp has the same deps as its manifest (plus its own
    // depfile); touching it tells the chooser to switch to the stage that
    // regenerates that manifest.
    touch_if_stale(ctx, files.primary_timestamp, files.primary_timestamp_dep,
                   m_rebootstrap_deps);
    touch_if_stale(ctx, files.main_timestamp, files.main_timestamp_dep,
                   m_primary_rebootstrap_deps);

    BuildParams choose;
    choose.rule = &rules::choose_stage();
    choose.outputs = {files.chosen_ninja};
    choose.inputs = {files.bootstrap_ninja, files.primary_ninja, files.main_ninja};
    choose.implicits = {"$chooseStageCmd", "$bootstrapManifest",
                        files.primary_timestamp, files.main_timestamp};
    choose.args["current"] = files.main_ninja;
    choose.args["generator"] = "true";
    ctx.build(std::move(choose));

    bare_phony(ctx, {files.main_ninja, docs});

    if (m_primary_builder_name == m_config.toolchain().mini_builder()) {
        // standalone build: put the mini builder where it is easy to find
        BuildParams copy;
        copy.rule = &rules::cp();
        copy.outputs = {utils::join_path(
            {"$buildDir", "bin", m_config.toolchain().mini_builder()})};
        copy.inputs = {m_primary_builder_file};
        ctx.build(std::move(copy));
    }
}

} // namespace tristage
