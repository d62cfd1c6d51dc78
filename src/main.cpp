#include "builder.hpp"
#include "generators/ninja/ninja_gen.hpp"
#include "spdlog/spdlog.h"
#include <argparse/argparse.hpp>
#include <filesystem>
#include <iostream>

using namespace spdlog;

level::level_enum get_level_from_name(std::string_view name) {
    if (name == "trace")
        return level::trace;
    if (name == "debug")
        return level::debug;
    if (name == "info")
        return level::info;
    if (name == "warn")
        return level::warn;
    if (name == "error")
        return level::err;
    if (name == "critical")
        return level::critical;
    if (name == "off")
        return level::off;
    return level::info;
}

int main(int argc, char* argv[]) {
    set_pattern("%^%l%$: %v"); // `info: abcd` where `info` is colored green
    argparse::ArgumentParser program("tristage");
    program.add_description(
        "Generates the manifest for one stage of a self-bootstrapping build");

    program.add_argument("-l", "--log-level")
        .default_value("info")
        .choices("trace", "debug", "info", "warn", "error", "critical", "off");
    program.add_argument("-t")
        .help("Build and run the tests of every module")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-p")
        .help("Run as the primary builder, generating the main manifest")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--build-primary")
        .help("Generate the manifest that builds the primary builder")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-b").default_value(".").help("Build directory");
    program.add_argument("-m").help(
        "Bootstrap manifest (default: $srcDir/build.ninja.in)");
    program.add_argument("-o")
        .default_value("build.ninja")
        .help("Output manifest");
    program.add_argument("-d").help("Depfile for the output manifest");
    program.add_argument("--timestamp").help(
        "File touched after a successful run");
    program.add_argument("--timestampdep").help("Depfile for the timestamp");
    program.add_argument("--docs").help(
        "Write documentation of the module types here instead of a manifest");
    program.add_argument("file").help("Top-level declarations file");

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& err) {
        error(err.what());
        std::cerr << program;
        return 1;
    }

    // set logger level
    set_level(get_level_from_name(program.get<std::string>("--log-level")));

    bool main_stage = program.get<bool>("-p");
    bool primary_stage = program.get<bool>("--build-primary");
    if (main_stage && primary_stage) {
        error("-p and --build-primary cannot be used together");
        return 1;
    }

    tristage::Config config{
        main_stage      ? tristage::Stage::Main
        : primary_stage ? tristage::Stage::Primary
                        : tristage::Stage::Bootstrap,
        program.get<std::string>("file")};
    config.m_run_tests = program.get<bool>("-t");
    config.m_build_dir = program.get<std::string>("-b");
    if (auto manifest = program.present<std::string>("-m"))
        config.m_bootstrap_manifest = *manifest;

    tristage::BuildOptions options;
    options.out_file = program.get<std::string>("-o");
    options.depfile = program.present<std::string>("-d").value_or("");
    options.timestamp_file =
        program.present<std::string>("--timestamp").value_or("");
    options.timestamp_depfile =
        program.present<std::string>("--timestampdep").value_or("");
    options.docs_file = program.present<std::string>("--docs").value_or("");

    if (!std::filesystem::exists(config.top_level_file())) {
        error("declarations file `{}` not found",
              config.top_level_file().string());
        return 1;
    }

    try {
        tristage::Builder builder{std::move(config), std::move(options),
                                  std::make_unique<tristage::NinjaGenerator>()};
        return builder.run() ? 0 : 1;
    } catch (const std::exception& err) {
        error("generation failed: {}", err.what());
        return 1;
    }
}
