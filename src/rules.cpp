#include "rules.hpp"
#include "config.hpp"
#include "utils.hpp"

namespace tristage::rules {

const Rule& compile() {
    static const Rule rule{
        "tristage.compile",
        "$compileCmd -o $out -p $pkgPath $incFlags $in",
        "compile $out",
        "",
        false,
        {"pkgPath", "incFlags"},
    };
    return rule;
}

const Rule& link() {
    static const Rule rule{
        "tristage.link",
        "$linkCmd -o $out $libDirFlags $in",
        "link $out",
        "",
        false,
        {"libDirFlags"},
    };
    return rule;
}

const Rule& test_main() {
    static const Rule rule{
        "tristage.testmain",
        "$testMainCmd -o $out -pkg $pkg $in",
        "testmain $out",
        "",
        false,
        {"pkg"},
    };
    return rule;
}

const Rule& plugin_gen_src() {
    static const Rule rule{
        "tristage.pluginGenSrc",
        "$pluginGenSrcCmd -o $out $plugins",
        "create $out",
        "",
        false,
        {"plugins"},
    };
    return rule;
}

const Rule& test() {
    static const Rule rule{
        "tristage.test",
        "(cd $pkgSrcDir && $$OLDPWD/$in) && touch $out",
        "test $pkg",
        "",
        false,
        {"pkg", "pkgSrcDir"},
    };
    return rule;
}

const Rule& cp() {
    static const Rule rule{
        "tristage.cp", "cp $in $out", "cp $out", "", false, {"generator"},
    };
    return rule;
}

const Rule& bootstrap() {
    static const Rule rule{
        "tristage.bootstrap",
        "$bootstrapCmd -i $in -b $buildDir",
        "bootstrap $in",
        "",
        true,
        {},
    };
    return rule;
}

const Rule& choose_stage() {
    static const Rule rule{
        "tristage.chooseStage",
        "$chooseStageCmd --current $current --bootstrap $bootstrapManifest "
        "-o $out $in",
        "choosing next stage",
        "",
        false,
        {"current", "generator"},
    };
    return rule;
}

const Rule& touch() {
    static const Rule rule{
        "tristage.touch", "touch $out", "touch $out", "", false,
        {"depfile", "generator"},
    };
    return rule;
}

const Rule& phony() {
    // the command is a comment: some ninja versions mishandle depfiles on
    // edges of the built-in phony rule
    static const Rule rule{
        "tristage.phony", "# phony $out", "phony $out", "", true, {"depfile"},
    };
    return rule;
}

void add_variables(ActionGraph& actions, const Config& config) {
    for (auto& [name, value] : config.variables())
        actions.add_variable(name, value);

    auto helper_bin = utils::join_path({bootstrap_dir, "bin"});
    actions.add_variable("BinDir", helper_bin);
    actions.add_variable("testMainCmd",
                         utils::join_path({helper_bin, "testmain"}));
    actions.add_variable("chooseStageCmd",
                         utils::join_path({helper_bin, "choosestage"}));
    actions.add_variable("pluginGenSrcCmd",
                         utils::join_path({helper_bin, "loadplugins"}));
}

std::string package_root(std::string_view module) {
    return utils::join_path({bootstrap_dir, module, "pkg"});
}

std::string test_root(std::string_view module) {
    return utils::join_path({bootstrap_dir, module, "test"});
}

std::string module_obj_dir(std::string_view module) {
    return utils::join_path({bootstrap_dir, module, "obj"});
}

std::string module_src_dir(std::string_view module_dir) {
    return utils::join_path({"$srcDir", module_dir});
}

} // namespace tristage::rules
