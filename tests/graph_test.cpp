#include "graph.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

using namespace tristage;
using namespace tristage::testing;

namespace {

std::string diamond() {
    return R"(
[[module]]
type = "package"
name = "a"
deps = ["b", "c"]
pkg_path = "a"

[[module]]
type = "package"
name = "b"
deps = ["d"]
pkg_path = "b"

[[module]]
type = "package"
name = "c"
deps = ["d"]
pkg_path = "c"

[[module]]
type = "package"
name = "d"
pkg_path = "d"
)";
}

} // namespace

TEST(GraphTest, ResolveListsDependenciesFirst) {
    auto gen = generate(diamond(), Stage::Primary);
    ASSERT_TRUE(gen.errors.empty());

    auto order = gen.ctx->graph().resolve();
    EXPECT_EQ(order, (std::vector<std::string>{"d", "b", "c", "a"}));
}

TEST(GraphTest, DepthFirstVisitsEachModuleOnce) {
    auto gen = generate(diamond(), Stage::Primary);
    ASSERT_TRUE(gen.errors.empty());

    std::vector<std::string> visited;
    gen.ctx->graph().visit_deps_depth_first(
        "a", [&](const Module& m) { visited.push_back(m.name()); });
    EXPECT_EQ(visited, (std::vector<std::string>{"d", "b", "c"}));
}

TEST(GraphTest, DirectDepsInDeclarationOrder) {
    auto gen = generate(diamond(), Stage::Primary);
    ASSERT_TRUE(gen.errors.empty());

    std::vector<std::string> visited;
    gen.ctx->graph().visit_direct_deps(
        "a", [&](const Module& m) { visited.push_back(m.name()); });
    EXPECT_EQ(visited, (std::vector<std::string>{"b", "c"}));
    EXPECT_EQ(gen.ctx->graph().node("d").dependents_names,
              (std::vector<std::string>{"b", "c"}));
}

TEST(GraphTest, CycleIsReported) {
    auto gen = generate(R"(
[[module]]
type = "package"
name = "a"
deps = ["b"]
pkg_path = "a"

[[module]]
type = "package"
name = "b"
deps = ["a"]
pkg_path = "b"
)",
                        Stage::Primary);
    ASSERT_EQ(gen.errors.size(), 1u);
    EXPECT_EQ(gen.errors[0].module, "a");
    EXPECT_EQ(gen.errors[0].message, "circular dependency: a -> b -> a");
    EXPECT_TRUE(gen.actions().builds().empty());
}

TEST(GraphTest, UndefinedDependency) {
    auto gen = generate(R"(
[[module]]
type = "package"
name = "a"
deps = ["ghost"]
pkg_path = "a"
)",
                        Stage::Primary);
    ASSERT_EQ(gen.errors.size(), 1u);
    EXPECT_EQ(gen.errors[0].to_string(),
              "module `a`: depends on undefined module `ghost`");
}

TEST(GraphTest, DuplicateEdgeIgnored) {
    auto gen = generate(R"(
[[module]]
type = "package"
name = "a"
deps = ["b", "b"]
pkg_path = "a"

[[module]]
type = "package"
name = "b"
pkg_path = "b"
)",
                        Stage::Primary);
    ASSERT_TRUE(gen.errors.empty());
    EXPECT_EQ(gen.ctx->graph().node("a").dependencies_names,
              (std::vector<std::string>{"b"}));
    const auto& compile = gen.produced("$buildDir/.bootstrap/a/pkg/a.a");
    EXPECT_EQ(compile.args.at("incFlags"), "-I $buildDir/.bootstrap/b/pkg");
}
