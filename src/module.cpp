#include "module.hpp"
#include "plugins.hpp"
#include "utils.hpp"
#include <fmt/format.h>

namespace tristage {

void Module::set_identity(std::string name, std::string dir) {
    m_name = std::move(name);
    m_dir = dir.empty() ? "." : std::move(dir);
}

std::vector<std::string>
Module::dynamic_dependencies(const PluginList& plugins) const {
    (void)plugins; // unused
    return {};
}

const toml::node* PropertyReader::lookup(std::string_view key) {
    m_used.emplace(key);
    return m_properties.get(key);
}

std::string PropertyReader::get_string(std::string_view key) {
    auto node = lookup(key);
    if (!node)
        return "";
    if (!node->is_string())
        throw std::runtime_error(
            fmt::format("`{}` is of type `{}`, expected `string`", key,
                        utils::toml_type_to_str(node->type())));
    return node->as_string()->get();
}

bool PropertyReader::get_bool(std::string_view key, bool default_value) {
    auto node = lookup(key);
    if (!node)
        return default_value;
    if (!node->is_boolean())
        throw std::runtime_error(
            fmt::format("`{}` is of type `{}`, expected `boolean`", key,
                        utils::toml_type_to_str(node->type())));
    return node->as_boolean()->get();
}

std::vector<std::string>
PropertyReader::get_string_list(std::string_view key) {
    std::vector<std::string> result;
    auto node = lookup(key);
    if (!node)
        return result;
    if (!node->is_array())
        throw std::runtime_error(
            fmt::format("`{}` is of type `{}`, expected `array`", key,
                        utils::toml_type_to_str(node->type())));

    size_t i = 0;
    for (const auto& elem : *node->as_array()) {
        if (!elem.is_string())
            throw std::runtime_error(fmt::format(
                "`{}` element at index {} is of type `{}`, expected `string`",
                key, i, utils::toml_type_to_str(elem.type())));
        result.push_back(elem.as_string()->get());
        ++i;
    }
    return result;
}

void PropertyReader::finish() const {
    for (auto&& [k, v] : m_properties) {
        if (!m_used.count(k.str()))
            throw std::runtime_error(
                fmt::format("unrecognized property `{}`", k.str()));
    }
}

} // namespace tristage
