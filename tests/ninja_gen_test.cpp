#include "generators/ninja/ninja_gen.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

using namespace tristage;
using namespace tristage::testing;

namespace {

std::string body(const std::string& code) {
    auto pos = code.find("ninja_required_version");
    return pos == std::string::npos ? code : code.substr(pos);
}

} // namespace

TEST(NinjaGenTest, EscapePath) {
    EXPECT_EQ(NinjaGenerator::escape_path("$srcDir/a b:c.cc"), "$srcDir/a$ b$:c.cc");
    EXPECT_EQ(NinjaGenerator::escape_value("a\nb"), "a$\nb");
}

TEST(NinjaGenTest, WritesStatements) {
    ActionGraph actions;
    actions.add_variable("srcDir", "src");
    actions.set_build_dir("out");
    const Rule& cc = actions.add_rule(
        {"cc", "cc $flags -o $out $in", "cc $out", "", false, {"flags"}});
    const Rule& regen = actions.add_rule(
        {"regen", "regen -o $out", "", "$out.d", true, {}});

    BuildParams compile;
    compile.rule = &cc;
    compile.outputs = {"a.o"};
    compile.inputs = {"my file.c"};
    compile.implicits = {"cc"};
    compile.order_only = {"gen.h"};
    compile.args["flags"] = "-O2";
    actions.build(compile);

    BuildParams self;
    self.rule = &regen;
    self.outputs = {"build.ninja"};
    actions.build(self);

    BuildParams marker;
    marker.rule = &Rule::phony();
    marker.outputs = {"c:d"};
    actions.build(marker);

    NinjaGenerator gen;
    gen.generate(actions);

    EXPECT_EQ(body(gen.code()), "ninja_required_version = 1.7.0\n"
                                "\n"
                                "srcDir = src\n"
                                "\n"
                                "builddir = out\n"
                                "\n"
                                "rule cc\n"
                                "    command = cc $flags -o $out $in\n"
                                "    description = cc $out\n"
                                "\n"
                                "rule regen\n"
                                "    command = regen -o $out\n"
                                "    depfile = $out.d\n"
                                "    generator = true\n"
                                "\n"
                                "build a.o: cc my$ file.c | cc || gen.h\n"
                                "    flags = -O2\n"
                                "\n"
                                "build build.ninja: regen\n"
                                "\n"
                                "build c$:d: phony\n"
                                "\n");
    EXPECT_EQ(gen.code().rfind("# ", 0), 0u);
}

TEST(NinjaGenTest, DeterministicAcrossRuns) {
    constexpr auto& decls = R"(
[[module]]
type = "package"
name = "lib"
pkg_path = "lib"
srcs = ["b.cc", "a.cc"]
test_srcs = ["lib_test.cc"]

[[module]]
type = "binary"
name = "tool"
deps = ["lib"]
srcs = ["tool.cc"]
primary_builder = true
)";
    for (auto stage : {Stage::Bootstrap, Stage::Primary, Stage::Main}) {
        auto first = generate(decls, stage, true);
        auto second = generate(decls, stage, true);
        ASSERT_TRUE(first.errors.empty());
        ASSERT_TRUE(second.errors.empty());

        NinjaGenerator a, b;
        a.generate(first.actions());
        b.generate(second.actions());
        EXPECT_EQ(a.code(), b.code()) << stage_name(stage);
    }
}

TEST(NinjaGenTest, BuiltinPhonyRuleNotWritten) {
    auto gen = generate(R"(
[[module]]
type = "package"
name = "lib"
pkg_path = "lib"
srcs = ["lib.cc"]
)",
                        Stage::Main);
    ASSERT_TRUE(gen.errors.empty());

    NinjaGenerator ninja;
    ninja.generate(gen.actions());
    const auto& code = ninja.code();
    EXPECT_EQ(code.find("rule phony"), std::string::npos);
    EXPECT_NE(code.find("rule tristage.phony\n"), std::string::npos);
    EXPECT_NE(code.find("build $srcDir/lib.cc: phony\n"), std::string::npos);
    EXPECT_NE(code.find("builddir = ${buildDir}\n"), std::string::npos);
}
