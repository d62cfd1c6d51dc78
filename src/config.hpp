#pragma once
#include "stage.hpp"
#include <filesystem>
#include <string>
#include <toml++/toml.hpp>
#include <utility>
#include <vector>

namespace tristage {

// [toolchain]
class Toolchain {
public:
    Toolchain(){};

    // Throws std::runtime_error on unknown keys or non-string values.
    void parse(toml::node_view<const toml::node> toolchain);

    inline const std::string& compile_cmd() const {
        return m_compile_cmd;
    }
    inline const std::string& link_cmd() const {
        return m_link_cmd;
    }
    inline const std::string& bootstrap_cmd() const {
        return m_bootstrap_cmd;
    }
    inline const std::string& source_extension() const {
        return m_source_extension;
    }
    inline const std::string& mini_builder() const {
        return m_mini_builder;
    }

    // Compiles sources into an archive. Field: `compile_cmd`
    std::string m_compile_cmd{"compile"};

    // Links an archive into an executable. Field: `link_cmd`
    std::string m_link_cmd{"link"};

    // Turns build.ninja.in into build.ninja. Field: `bootstrap_cmd`
    std::string m_bootstrap_cmd{"$srcDir/bootstrap.sh"};

    // Extension of generated sources (test mains, plugin registration).
    // Field: `source_extension`
    std::string m_source_extension{".cc"};

    // Name of the hand-written builder in $BinDir. Field: `mini_builder`
    std::string m_mini_builder{"ministage"};
};

class Config {
public:
    Config(){};
    Config(Stage stage, std::filesystem::path top_level_file)
        : m_stage(stage), m_top_level_file(std::move(top_level_file)){};

    inline Stage stage() const {
        return m_stage;
    }
    inline bool run_tests() const {
        return m_run_tests;
    }
    inline const std::filesystem::path& top_level_file() const {
        return m_top_level_file;
    }
    // Directory containing the top-level declarations file, `$srcDir` in the
    // generated manifest.
    std::string src_dir() const;
    inline const std::string& build_dir() const {
        return m_build_dir;
    }
    std::string bootstrap_manifest() const;
    inline const Toolchain& toolchain() const {
        return m_toolchain;
    }

    // Top-level variables every generated manifest defines.
    std::vector<std::pair<std::string, std::string>> variables() const;

    Stage m_stage{Stage::Bootstrap};
    bool m_run_tests{false};
    std::filesystem::path m_top_level_file;
    std::string m_build_dir{"."};

    // Empty means the default, `$srcDir/build.ninja.in`.
    std::string m_bootstrap_manifest;

    // [toolchain] of the top-level declarations file
    Toolchain m_toolchain;
};

} // namespace tristage
