#pragma once
#include "action.hpp"
#include <string>
#include <string_view>

namespace tristage {

class Config;

namespace rules {

// Root of the intermediates of the primary stage, and of every module's
// package, test and object directories.
inline constexpr std::string_view bootstrap_dir = "$buildDir/.bootstrap";

// Root of the intermediates of the bootstrap stage.
inline constexpr std::string_view mini_bootstrap_dir = "$buildDir/.minibootstrap";

inline constexpr std::string_view bin_dir = "$BinDir";

const Rule& compile();
const Rule& link();
const Rule& test_main();
const Rule& plugin_gen_src();
const Rule& test();
const Rule& cp();
const Rule& bootstrap();
const Rule& choose_stage();
const Rule& touch();

// No-op rule used for placeholder actions. Unlike the built-in `phony`, it
// may have inputs whose timestamps matter.
const Rule& phony();

// Defines the toolchain and helper program variables the rules refer to.
void add_variables(ActionGraph& actions, const Config& config);

// `$buildDir/.bootstrap/<module>/pkg`: where the package archive lives and
// where dependents look for it.
std::string package_root(std::string_view module);

// `$buildDir/.bootstrap/<module>/test`: everything from package_root, plus
// the test-only code.
std::string test_root(std::string_view module);

std::string module_obj_dir(std::string_view module);

// Directory all of a module's source paths are relative to.
std::string module_src_dir(std::string_view module_dir);

} // namespace rules
} // namespace tristage
