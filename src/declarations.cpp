#include "context.hpp"
#include "utils.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>
#include <spdlog/stopwatch.h>

using namespace spdlog;

namespace tristage {

namespace {

std::string location(const std::filesystem::path& path,
                     const toml::source_region& source) {
    return fmt::format("{}:{}:{}", path.generic_string(), source.begin.line,
                       source.begin.column);
}

std::string parse_error_message(const std::filesystem::path& path,
                                 const toml::parse_error& err) {
    return fmt::format("{}: {}", location(path, err.source()),
                       err.description());
}

} // namespace

std::vector<BuildError> Context::parse_declarations() {
    stopwatch sw;
    m_errors.clear();
    load_file(m_config.top_level_file(), true);
    debug("{} declarations file(s) parsed in {}s, {} module(s)",
          m_declaration_files.size(), sw, m_graph.size());
    return std::move(m_errors);
}

std::vector<BuildError>
Context::parse_declarations_string(std::string_view text,
                                   const std::filesystem::path& path) {
    m_errors.clear();
    m_declaration_files.push_back(path.generic_string());
    try {
        auto tbl = toml::parse(text, path.generic_string());
        load_table(tbl, path, path == m_config.top_level_file());
    } catch (const toml::parse_error& err) {
        m_errors.push_back({"", parse_error_message(path, err)});
    }
    return std::move(m_errors);
}

void Context::load_file(const std::filesystem::path& path, bool top_level) {
    auto name = path.generic_string();
    if (std::find(m_declaration_files.begin(), m_declaration_files.end(),
                  name) != m_declaration_files.end()) {
        warn("`{}` is already loaded, skipping", name);
        return;
    }
    m_declaration_files.push_back(name);
    trace("loading `{}`", name);

    toml::table tbl;
    try {
        tbl = toml::parse_file(path.string());
    } catch (const toml::parse_error& err) {
        m_errors.push_back({"", parse_error_message(path, err)});
        return;
    }
    load_table(tbl, path, top_level);
}

void Context::load_table(const toml::table& tbl,
                         const std::filesystem::path& path, bool top_level) {
    for (auto&& [k, v] : tbl) {
        if (k.str() == "subdirs" || k.str() == "module")
            continue;
        if (k.str() == "toolchain" && top_level)
            continue;
        m_errors.push_back(
            {"", fmt::format("{}: unrecognized key `{}`",
                             location(path, k.source()), k.str())});
    }

    if (top_level) {
        try {
            m_config.m_toolchain.parse(tbl["toolchain"]);
        } catch (const std::runtime_error& e) {
            m_errors.push_back(
                {"", fmt::format("{}: {}", path.generic_string(), e.what())});
        }
    }

    auto modules = tbl["module"];
    if (modules) {
        if (!modules.is_array()) {
            m_errors.push_back(
                {"", fmt::format("{}: `module` is of type `{}`, expected an "
                                 "array of tables",
                                 path.generic_string(),
                                 utils::toml_type_to_str(modules.type()))});
        } else {
            size_t i = 0;
            for (const auto& decl : *modules.as_array()) {
                if (auto t = decl.as_table())
                    add_module(*t, path, i);
                else
                    m_errors.push_back(
                        {"", fmt::format("{}: module at index {} is of type "
                                         "`{}`, expected `table`",
                                         location(path, decl.source()), i,
                                         utils::toml_type_to_str(decl.type()))});
                ++i;
            }
        }
    }

    std::vector<std::string> subdirs;
    try {
        subdirs = PropertyReader{tbl}.get_string_list("subdirs");
    } catch (const std::runtime_error& e) {
        m_errors.push_back(
            {"", fmt::format("{}: {}", path.generic_string(), e.what())});
    }
    for (const auto& subdir : subdirs)
        load_file(path.parent_path() / subdir / path.filename(), false);
}

void Context::add_module(const toml::table& decl,
                         const std::filesystem::path& path, size_t index) {
    auto where = location(path, decl.source());

    std::string type_name, name;
    std::vector<std::string> deps;
    try {
        PropertyReader reader{decl};
        type_name = reader.get_string("type");
        name = reader.get_string("name");
        deps = reader.get_string_list("deps");
    } catch (const std::runtime_error& e) {
        m_errors.push_back({name, fmt::format("{}: {}", where, e.what())});
        return;
    }

    if (name.empty()) {
        m_errors.push_back(
            {"", fmt::format("{}: module at index {} has no `name`", where,
                             index)});
        return;
    }
    if (type_name.empty()) {
        m_errors.push_back(
            {name, fmt::format("{}: module `{}` has no `type`", where, name)});
        return;
    }
    auto type = find_module_type(type_name);
    if (!type) {
        m_errors.push_back(
            {name, fmt::format("{}: unrecognized module type `{}`", where,
                               type_name)});
        return;
    }

    toml::table properties = decl;
    properties.erase("type");
    properties.erase("name");
    properties.erase("deps");

    auto module = type->factory();
    module->set_identity(name, module_dir_of(path));
    try {
        module->parse(properties);
    } catch (const std::runtime_error& e) {
        m_errors.push_back({name, fmt::format("{}: {}", where, e.what())});
        return;
    }

    ModuleNode node;
    node.name = name;
    node.type = type_name;
    node.module = std::move(module);
    node.declared_in = path;
    node.declared_deps = std::move(deps);
    try {
        m_graph.add_module(std::move(node));
    } catch (const std::runtime_error& e) {
        m_errors.push_back({name, fmt::format("{}: {}", where, e.what())});
    }
}

std::string Context::module_dir_of(const std::filesystem::path& path) const {
    auto dir = path.parent_path();
    auto root = m_config.top_level_file().parent_path();
    if (!root.empty())
        dir = dir.lexically_relative(root);
    auto result = dir.generic_string();
    return result.empty() ? "." : result;
}

} // namespace tristage
