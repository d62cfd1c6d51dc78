#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace tristage {

class ModuleContext;

// Compiles `srcs` (relative to the module's source directory) and `gen_srcs`
// into `archive_file`. Every package the module transitively depends on
// contributes an include flag and an implicit dependency on its archive.
// `order_deps` become order-only inputs.
void build_package(ModuleContext& ctx, const std::string& pkg_path,
                   const std::string& archive_file,
                   const std::vector<std::string>& srcs,
                   const std::vector<std::string>& gen_srcs,
                   const std::vector<std::string>& order_deps);

// Emits the test pipeline under `test_root` and returns the paths callers
// should depend on (the "tests passed" sentinel), or nothing if there are no
// test sources.
std::vector<std::string> build_test(ModuleContext& ctx,
                                    const std::string& test_root,
                                    const std::string& test_pkg_archive,
                                    const std::string& pkg_path,
                                    const std::vector<std::string>& srcs,
                                    const std::vector<std::string>& gen_srcs,
                                    const std::vector<std::string>& test_srcs);

// `<test_root>/test.passed`
std::string test_sentinel(std::string_view test_root);

// Files the test pipeline leaves under `test_root` besides the sentinel.
std::vector<std::string> test_intermediates(ModuleContext& ctx,
                                            const std::string& test_root,
                                            const std::string& test_pkg_archive);

// Stands in for `target` in stages that don't build it.
//
// The placeholder depends on the module's sources and on the archives of its
// package dependencies, so the manifest keeps tracking them. Every source
// also gets a built-in phony: when a source is deleted or renamed the
// regeneration that depends on it still runs instead of failing on a missing
// file. The same goes for `intermediates`, which would otherwise be removed
// as stale outputs by the next cleanup, forcing a rebuild.
void phony_target(ModuleContext& ctx, const std::string& target,
                  const std::vector<std::string>& srcs,
                  const std::vector<std::string>& gen_srcs,
                  const std::vector<std::string>& intermediates);

} // namespace tristage
