#include "action.hpp"
#include <gtest/gtest.h>

using namespace tristage;

class ActionGraphTest : public ::testing::Test {
protected:
    ActionGraph actions;
    const Rule* cc{nullptr};

    void SetUp() override {
        cc = &actions.add_rule(
            {"cc", "cc $flags -o $out $in", "cc $out", "", false, {"flags"}});
    }

    BuildParams compile(std::string out, std::string in) {
        BuildParams params;
        params.rule = cc;
        params.outputs = {std::move(out)};
        params.inputs = {std::move(in)};
        return params;
    }

    static BuildParams marker(std::string out) {
        BuildParams params;
        params.rule = &Rule::phony();
        params.outputs = {std::move(out)};
        return params;
    }
};

TEST_F(ActionGraphTest, RejectsUndeclaredArgument) {
    auto params = compile("a.o", "a.c");
    params.args["optimize"] = "-O2";
    EXPECT_THROW(actions.build(params), std::invalid_argument);
    EXPECT_TRUE(actions.builds().empty());
}

TEST_F(ActionGraphTest, DepfileAndGeneratorAlwaysAllowed) {
    auto params = compile("a.o", "a.c");
    params.args["flags"] = "-g";
    params.args["depfile"] = "a.o.d";
    params.args["generator"] = "true";
    EXPECT_NO_THROW(actions.build(params));
}

TEST_F(ActionGraphTest, RejectsDuplicateOutput) {
    actions.build(compile("a.o", "a.c"));
    EXPECT_THROW(actions.build(compile("a.o", "b.c")), std::invalid_argument);
    EXPECT_THROW(actions.build(marker("a.o")), std::invalid_argument);
    EXPECT_EQ(actions.builds().size(), 1u);
}

TEST_F(ActionGraphTest, RejectsMalformed) {
    BuildParams no_rule;
    no_rule.outputs = {"x"};
    EXPECT_THROW(actions.build(no_rule), std::invalid_argument);

    BuildParams no_outputs;
    no_outputs.rule = cc;
    no_outputs.inputs = {"a.c"};
    EXPECT_THROW(actions.build(no_outputs), std::invalid_argument);
}

TEST_F(ActionGraphTest, DuplicateMarkersDropped) {
    actions.build(marker("src/a.c"));
    actions.build(marker("src/a.c"));
    ASSERT_EQ(actions.builds().size(), 1u);
    EXPECT_TRUE(actions.builds()[0].is_bare_phony());
    EXPECT_EQ(actions.find_output("src/a.c"), &actions.builds()[0]);
}

TEST_F(ActionGraphTest, RulesInFirstUseOrder) {
    const Rule& ld = actions.add_rule({"ld", "ld -o $out $in", "", "", false, {}});
    BuildParams link;
    link.rule = &ld;
    link.outputs = {"a.out"};
    link.inputs = {"a.o"};
    actions.build(link);
    actions.build(compile("a.o", "a.c"));
    actions.build(compile("b.o", "b.c"));
    actions.build(marker("a.c"));

    ASSERT_EQ(actions.rules().size(), 2u);
    EXPECT_EQ(actions.rules()[0]->name, "ld");
    EXPECT_EQ(actions.rules()[1]->name, "cc");
    EXPECT_EQ(actions.find_rule("cc").size(), 2u);
}

TEST_F(ActionGraphTest, VariableReplaced) {
    actions.add_variable("srcDir", "a");
    actions.add_variable("buildDir", "out");
    actions.add_variable("srcDir", "b");
    ASSERT_EQ(actions.variables().size(), 2u);
    EXPECT_EQ(actions.variables()[0].first, "srcDir");
    EXPECT_EQ(actions.variables()[0].second, "b");
}
