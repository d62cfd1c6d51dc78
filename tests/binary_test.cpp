#include "test_helpers.hpp"
#include <gtest/gtest.h>

using namespace tristage;
using namespace tristage::testing;

namespace {

constexpr auto& WITH_PLUGIN = R"(
[[module]]
type = "package"
name = "soong"
pkg_path = "example/soong"
srcs = ["soong.cc"]
plugin = true

[[module]]
type = "package"
name = "support"
pkg_path = "example/support"
srcs = ["support.cc"]

[[module]]
type = "binary"
name = "builder"
deps = ["support"]
srcs = ["main.cc"]
primary_builder = true
)";

const std::string OBJ = "$buildDir/.bootstrap/builder/obj";

} // namespace

TEST(BinaryTest, PluginsLinkedIntoPrimaryBuilder) {
    auto gen = generate(WITH_PLUGIN, Stage::Primary);
    ASSERT_TRUE(gen.errors.empty());

    ASSERT_EQ(gen.ctx->plugins().entries().size(), 1u);
    EXPECT_EQ(gen.ctx->plugins().entries()[0].name, "soong");
    // the plugin became a dependency of the primary builder
    EXPECT_EQ(gen.ctx->graph().node("builder").dependencies_names,
              (std::vector<std::string>{"support", "soong"}));

    const auto& plugin_gen = gen.produced(OBJ + "/plugin.cc");
    EXPECT_EQ(plugin_gen.rule->name, "tristage.pluginGenSrc");
    EXPECT_EQ(plugin_gen.args.at("plugins"), "example/soong");
    EXPECT_EQ(plugin_gen.implicits, (std::vector<std::string>{"$pluginGenSrcCmd"}));

    const auto& compile = gen.produced(OBJ + "/builder.a");
    EXPECT_EQ(compile.inputs,
              (std::vector<std::string>{"$srcDir/main.cc", OBJ + "/plugin.cc"}));
    EXPECT_EQ(compile.args.at("pkgPath"), "builder");
    EXPECT_EQ(compile.args.at("incFlags"),
              "-I $buildDir/.bootstrap/support/pkg -I $buildDir/.bootstrap/soong/pkg");
}

TEST(BinaryTest, LinkAndCopy) {
    auto gen = generate(WITH_PLUGIN, Stage::Primary);
    ASSERT_TRUE(gen.errors.empty());

    const auto& link = gen.produced(OBJ + "/a.out");
    EXPECT_EQ(link.rule->name, "tristage.link");
    EXPECT_EQ(link.inputs, (std::vector<std::string>{OBJ + "/builder.a"}));
    EXPECT_EQ(link.implicits, (std::vector<std::string>{"$linkCmd"}));
    EXPECT_EQ(link.args.at("libDirFlags"),
              "-L $buildDir/.bootstrap/support/pkg -L $buildDir/.bootstrap/soong/pkg");

    const auto& cp = gen.produced("$BinDir/builder");
    EXPECT_EQ(cp.rule->name, "tristage.cp");
    EXPECT_EQ(cp.inputs, (std::vector<std::string>{OBJ + "/a.out"}));
}

TEST(BinaryTest, NoPluginSourceWithoutPlugins) {
    auto gen = generate(R"(
[[module]]
type = "binary"
name = "builder"
srcs = ["main.cc"]
primary_builder = true
)",
                        Stage::Primary);
    ASSERT_TRUE(gen.errors.empty());
    EXPECT_TRUE(gen.actions().find_rule("tristage.pluginGenSrc").empty());
    EXPECT_EQ(gen.produced(OBJ + "/builder.a").inputs,
              (std::vector<std::string>{"$srcDir/main.cc"}));
    EXPECT_EQ(gen.produced(OBJ + "/a.out").args.count("libDirFlags"), 0u);
}

TEST(BinaryTest, OnlyPrimaryBuilderGetsPlugins) {
    auto gen = generate(R"(
[[module]]
type = "package"
name = "ext"
pkg_path = "ext"
plugin = true

[[module]]
type = "binary"
name = "tool"
srcs = ["tool.cc"]
)",
                        Stage::Primary);
    ASSERT_TRUE(gen.errors.empty());
    EXPECT_TRUE(gen.ctx->graph().node("tool").dependencies_names.empty());
    EXPECT_EQ(gen.actions().find_output("$buildDir/.bootstrap/tool/obj/plugin.cc"),
              nullptr);
}

TEST(BinaryTest, PlaceholderKeepsIntermediates) {
    auto gen = generate(WITH_PLUGIN, Stage::Main);
    ASSERT_TRUE(gen.errors.empty());
    EXPECT_TRUE(gen.actions().find_rule("tristage.link").empty());

    const auto& phony = gen.produced("$BinDir/builder");
    EXPECT_EQ(phony.rule->name, "tristage.phony");
    EXPECT_EQ(phony.inputs,
              (std::vector<std::string>{"$srcDir/main.cc", OBJ + "/plugin.cc"}));
    EXPECT_EQ(phony.implicits,
              (std::vector<std::string>{"$buildDir/.bootstrap/support/pkg/example/support.a",
                                        "$buildDir/.bootstrap/soong/pkg/example/soong.a"}));
    EXPECT_TRUE(gen.produced(OBJ + "/a.out").is_bare_phony());
    EXPECT_TRUE(gen.produced(OBJ + "/builder.a").is_bare_phony());
    EXPECT_TRUE(gen.produced(OBJ + "/plugin.cc").is_bare_phony());
}

TEST(BinaryTest, CoreBinaryBuiltInBootstrap) {
    auto gen = generate(R"(
[[module]]
type = "core_binary"
name = "minibp"
srcs = ["minibp.cc"]
)",
                        Stage::Bootstrap);
    ASSERT_TRUE(gen.errors.empty());
    EXPECT_EQ(gen.ctx->stages().at("minibp"), Stage::Bootstrap);
    EXPECT_EQ(gen.produced("$BinDir/minibp").rule->name, "tristage.cp");
}

TEST(BinaryTest, BinaryTests) {
    auto gen = generate(R"(
[[module]]
type = "binary"
name = "tool"
srcs = ["tool.cc"]
test_srcs = ["tool_test.cc"]
)",
                        Stage::Primary, true);
    ASSERT_TRUE(gen.errors.empty());

    const std::string root = "$buildDir/.bootstrap/tool/test";
    EXPECT_EQ(gen.produced(root + "/tool.a").args.at("pkgPath"), "tool");
    EXPECT_EQ(gen.produced(root + "/test.passed").rule->name, "tristage.test");
    EXPECT_EQ(gen.produced("$buildDir/.bootstrap/tool/obj/tool.a").order_only,
              (std::vector<std::string>{root + "/test.passed"}));
}
