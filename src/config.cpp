#include "config.hpp"
#include "utils.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>

using namespace spdlog;

namespace tristage {

namespace {

void read_string(const toml::key& key, const toml::node& value,
                 std::string& out) {
    if (!value.is_string())
        throw std::runtime_error(
            fmt::format("`toolchain.{}` is of type `{}`, expected `string`",
                        key.str(), utils::toml_type_to_str(value.type())));
    out = value.as_string()->get();
}

} // namespace

void Toolchain::parse(toml::node_view<const toml::node> toolchain) {
    if (!toolchain)
        return;
    if (!toolchain.is_table())
        throw std::runtime_error(
            fmt::format("`toolchain` is of type `{}`, expected `table`",
                        utils::toml_type_to_str(toolchain.type())));

    for (auto&& [k, v] : *toolchain.as_table()) {
        if (k.str() == "compile_cmd")
            read_string(k, v, m_compile_cmd);
        else if (k.str() == "link_cmd")
            read_string(k, v, m_link_cmd);
        else if (k.str() == "bootstrap_cmd")
            read_string(k, v, m_bootstrap_cmd);
        else if (k.str() == "source_extension")
            read_string(k, v, m_source_extension);
        else if (k.str() == "mini_builder")
            read_string(k, v, m_mini_builder);
        else
            throw std::runtime_error(
                fmt::format("unrecognized key `toolchain.{}`", k.str()));
    }

    if (m_mini_builder.empty())
        throw std::runtime_error("`toolchain.mini_builder` cannot be empty");

    debug("toolchain: compile = `{}`, link = `{}`, bootstrap = `{}`, "
          "source extension = `{}`, mini builder = `{}`",
          m_compile_cmd, m_link_cmd, m_bootstrap_cmd, m_source_extension,
          m_mini_builder);
}

std::string Config::src_dir() const {
    auto dir = m_top_level_file.parent_path().generic_string();
    return dir.empty() ? "." : dir;
}

std::string Config::bootstrap_manifest() const {
    if (!m_bootstrap_manifest.empty())
        return m_bootstrap_manifest;
    return utils::join_path({"$srcDir", "build.ninja.in"});
}

std::vector<std::pair<std::string, std::string>> Config::variables() const {
    return {
        {"srcDir", src_dir()},
        {"buildDir", m_build_dir},
        {"compileCmd", m_toolchain.compile_cmd()},
        {"linkCmd", m_toolchain.link_cmd()},
        {"bootstrapCmd", m_toolchain.bootstrap_cmd()},
        {"bootstrapManifest", bootstrap_manifest()},
    };
}

} // namespace tristage
