#pragma once
#include <filesystem>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <toml++/toml.hpp>
#include <vector>

namespace tristage::utils {

void replace_in_place(std::string& s, const std::string& search,
                      const std::string& replace);

std::string replace(std::string s, const std::string& search,
                    const std::string& replace);

std::string toml_type_to_str(toml::node_type type);

// Slash-joins path elements, skipping empty and "." elements. Works on paths
// that contain ninja variables such as `$buildDir`, which std::filesystem
// would happily mangle.
std::string join_path(std::initializer_list<std::string_view> elems);

// Returns a copy of `paths` with `prefix` joined in front of every element.
std::vector<std::string> prefix_paths(const std::vector<std::string>& paths,
                                      std::string_view prefix);

// Throws std::runtime_error if the file couldn't be written.
void write_file(const std::filesystem::path& path, std::string_view contents);

// Writes a make-style depfile: `target: dep1 dep2 ...`.
void write_depfile(const std::filesystem::path& path, std::string_view target,
                   const std::vector<std::string>& deps);

} // namespace tristage::utils
