#include "utils.hpp"
#include <fmt/format.h>
#include <fstream>
#include <sstream>

using namespace spdlog;

namespace tristage::utils {

void replace_in_place(std::string& s, const std::string& search,
                      const std::string& replace) {
    size_t pos = 0;
    while ((pos = s.find(search, pos)) != std::string::npos) {
        s.replace(pos, search.length(), replace);
        pos += replace.length();
    }
}

std::string replace(std::string s, const std::string& search,
                    const std::string& replace) {
    replace_in_place(s, search, replace);
    return s;
}

std::string toml_type_to_str(toml::node_type type) {
    std::stringstream ss;
    ss << type;
    return ss.str();
}

std::string join_path(std::initializer_list<std::string_view> elems) {
    std::string result;
    for (auto elem : elems) {
        // strip trailing slashes, but keep a lone "/"
        while (elem.size() > 1 && elem.back() == '/')
            elem.remove_suffix(1);
        if (elem.empty() || elem == ".")
            continue;
        if (result.empty()) {
            result = elem;
            continue;
        }
        while (!elem.empty() && elem.front() == '/')
            elem.remove_prefix(1);
        if (elem.empty())
            continue;
        if (result.back() != '/')
            result += '/';
        result += elem;
    }
    return result.empty() ? "." : result;
}

std::vector<std::string> prefix_paths(const std::vector<std::string>& paths,
                                      std::string_view prefix) {
    std::vector<std::string> result;
    result.reserve(paths.size());
    for (const auto& p : paths)
        result.push_back(join_path({prefix, p}));
    return result;
}

void write_file(const std::filesystem::path& path, std::string_view contents) {
    if (path.has_parent_path())
        std::filesystem::create_directories(path.parent_path());

    std::ofstream file(path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!file.is_open())
        throw std::runtime_error(
            fmt::format("failed to open `{}` for writing", path.string()));
    file << contents;
    file.close();
    if (file.fail())
        throw std::runtime_error(
            fmt::format("failed to write `{}`", path.string()));
    trace("wrote {} byte(s) to `{}`", contents.size(), path.string());
}

void write_depfile(const std::filesystem::path& path, std::string_view target,
                   const std::vector<std::string>& deps) {
    std::string contents{target};
    contents += ':';
    for (const auto& dep : deps) {
        contents += " \\\n ";
        contents += replace(dep, " ", "\\ ");
    }
    contents += '\n';
    write_file(path, contents);
}

} // namespace tristage::utils
