#include "test_helpers.hpp"
#include <gtest/gtest.h>

using namespace tristage;
using namespace tristage::testing;

namespace {

bool mentions(const std::vector<BuildError>& errors, const std::string& text) {
    for (const auto& err : errors) {
        if (err.to_string().find(text) != std::string::npos)
            return true;
    }
    return false;
}

std::vector<BuildError> load(Context& ctx, std::string_view text,
                             std::string path = std::string(top_level_file)) {
    return ctx.parse_declarations_string(text, path);
}

} // namespace

TEST(DeclarationsTest, ModulesInDeclarationOrder) {
    Context ctx{make_config(Stage::Primary)};
    auto errors = load(ctx, R"(
[[module]]
type = "package"
name = "zeta"
pkg_path = "zeta"

[[module]]
type = "binary"
name = "alpha"
deps = ["zeta"]
)");
    ASSERT_TRUE(errors.empty());
    EXPECT_EQ(ctx.graph().declaration_order(),
              (std::vector<std::string>{"zeta", "alpha"}));
    EXPECT_EQ(ctx.graph().node("alpha").type, "binary");
    EXPECT_EQ(ctx.graph().node("alpha").declared_deps,
              (std::vector<std::string>{"zeta"}));
    EXPECT_EQ(ctx.graph().module("zeta").dir(), ".");
}

TEST(DeclarationsTest, UnknownPropertyNamesTheModule) {
    Context ctx{make_config(Stage::Primary)};
    auto errors = load(ctx, R"([[module]]
type = "package"
name = "p"
pkg_path = "p"
sources = ["p.cc"]
)");
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].module, "p");
    EXPECT_NE(errors[0].message.find("src/build.toml:"), std::string::npos);
    EXPECT_NE(errors[0].message.find("unrecognized property `sources`"),
              std::string::npos);
    EXPECT_FALSE(ctx.graph().contains("p"));
}

TEST(DeclarationsTest, MistypedProperty) {
    Context ctx{make_config(Stage::Primary)};
    auto errors = load(ctx, R"(
[[module]]
type = "package"
name = "p"
pkg_path = "p"
srcs = "p.cc"
)");
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_TRUE(mentions(errors, "`srcs` is of type `string`, expected `array`"));
}

TEST(DeclarationsTest, SyntaxErrorHasPosition) {
    Context ctx{make_config(Stage::Primary)};
    auto errors = load(ctx, "[[module]\nname = \"p\"\n");
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_TRUE(errors[0].module.empty());
    EXPECT_EQ(errors[0].message.rfind("src/build.toml:1:", 0), 0u);
}

TEST(DeclarationsTest, UnknownAndMissingType) {
    Context ctx{make_config(Stage::Primary)};
    auto errors = load(ctx, R"(
[[module]]
type = "go_binary"
name = "a"

[[module]]
name = "b"

[[module]]
type = "package"
)");
    EXPECT_EQ(errors.size(), 3u);
    EXPECT_TRUE(mentions(errors, "unrecognized module type `go_binary`"));
    EXPECT_TRUE(mentions(errors, "module `b` has no `type`"));
    EXPECT_TRUE(mentions(errors, "module at index 2 has no `name`"));
    EXPECT_EQ(ctx.graph().size(), 0u);
}

TEST(DeclarationsTest, DuplicateName) {
    Context ctx{make_config(Stage::Primary)};
    auto errors = load(ctx, R"(
[[module]]
type = "package"
name = "p"
pkg_path = "p"

[[module]]
type = "binary"
name = "p"
)");
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_TRUE(mentions(errors, "module `p` is already declared in `src/build.toml`"));
    EXPECT_EQ(ctx.graph().node("p").type, "package");
}

TEST(DeclarationsTest, UnknownTopLevelKey) {
    Context ctx{make_config(Stage::Primary)};
    auto errors = load(ctx, "modules = []\n");
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_TRUE(mentions(errors, "unrecognized key `modules`"));
}

TEST(DeclarationsTest, ToolchainOverrides) {
    Context ctx{make_config(Stage::Primary)};
    auto errors = load(ctx, R"(
[toolchain]
compile_cmd = "$srcDir/tools/compile"
source_extension = ".cpp"
)");
    ASSERT_TRUE(errors.empty());
    const auto& toolchain = ctx.config().toolchain();
    EXPECT_EQ(toolchain.compile_cmd(), "$srcDir/tools/compile");
    EXPECT_EQ(toolchain.source_extension(), ".cpp");
    EXPECT_EQ(toolchain.link_cmd(), "link");
    EXPECT_EQ(toolchain.mini_builder(), "ministage");
}

TEST(DeclarationsTest, ToolchainErrors) {
    Context ctx{make_config(Stage::Primary)};
    auto errors = load(ctx, R"(
[toolchain]
linker = "ld"
)");
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_TRUE(mentions(errors, "unrecognized key `toolchain.linker`"));
}

TEST(DeclarationsTest, ToolchainOnlyInTopLevelFile) {
    Context ctx{make_config(Stage::Primary)};
    auto errors = load(ctx, "[toolchain]\nlink_cmd = \"ld\"\n", "src/lib/build.toml");
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_TRUE(mentions(errors, "unrecognized key `toolchain`"));
    EXPECT_EQ(ctx.config().toolchain().link_cmd(), "link");
}

TEST(DeclarationsTest, ModuleDirRelativeToSourceRoot) {
    Context ctx{make_config(Stage::Primary)};
    auto errors = load(ctx, R"(
[[module]]
type = "package"
name = "parser"
pkg_path = "example/parser"
srcs = ["parser.cc"]
)",
                       "src/lang/parser/build.toml");
    ASSERT_TRUE(errors.empty());
    EXPECT_EQ(ctx.graph().module("parser").dir(), "lang/parser");

    errors = ctx.prepare_build_actions();
    ASSERT_TRUE(errors.empty());
    const auto* compile =
        ctx.actions().find_output("$buildDir/.bootstrap/parser/pkg/example/parser.a");
    ASSERT_NE(compile, nullptr);
    EXPECT_EQ(compile->inputs,
              (std::vector<std::string>{"$srcDir/lang/parser/parser.cc"}));
}
