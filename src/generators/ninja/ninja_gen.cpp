#include "ninja_gen.hpp"
#include <fmt/core.h>
#include <spdlog/spdlog.h>

using namespace spdlog;

namespace tristage {

std::string NinjaGenerator::escape_path(std::string_view path) {
    std::string out;
    out.reserve(path.size());
    for (char c : path) {
        switch (c) {
        case ' ':
        case ':':
            out += '$';
            out += c;
            break;
        case '\n':
            out += "$\n";
            break;
        default:
            out += c;
        }
    }
    return out;
}

std::string NinjaGenerator::escape_value(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        if (c == '\n')
            out += "$\n";
        else
            out += c;
    }
    return out;
}

void NinjaGenerator::generate(const ActionGraph& actions) {
    m_code.clear();
    writeln("# ******************************************************************");
    writeln("# ***            This file was generated by tristage             ***");
    writeln("# ***                   Do not modify by hand                    ***");
    writeln("# ******************************************************************");
    writeln();
    writeln("ninja_required_version = 1.7.0");
    writeln();

    for (const auto& [name, value] : actions.variables())
        writeln(fmt::format("{} = {}", name, escape_value(value)));
    if (!actions.variables().empty())
        writeln();

    if (!actions.build_dir().empty()) {
        writeln(fmt::format("builddir = {}", escape_value(actions.build_dir())));
        writeln();
    }

    for (const Rule* rule : actions.rules())
        write_rule(*rule);

    for (const auto& params : actions.builds())
        write_build(params);

    trace("generated {} bytes of ninja for {} rule(s), {} build(s)",
          m_code.size(), actions.rules().size(), actions.builds().size());
}

void NinjaGenerator::write_rule(const Rule& rule) {
    writeln(fmt::format("rule {}", rule.name));
    writeln(fmt::format("    command = {}", escape_value(rule.command)));
    if (!rule.description.empty())
        writeln(fmt::format("    description = {}",
                            escape_value(rule.description)));
    if (!rule.depfile.empty())
        writeln(fmt::format("    depfile = {}", escape_value(rule.depfile)));
    if (rule.generator)
        writeln("    generator = true");
    writeln();
}

void NinjaGenerator::write_build(const BuildParams& params) {
    write("build");
    write_paths(params.outputs);
    write(fmt::format(": {}", params.rule->name));
    write_paths(params.inputs);
    if (!params.implicits.empty()) {
        write(" |");
        write_paths(params.implicits);
    }
    if (!params.order_only.empty()) {
        write(" ||");
        write_paths(params.order_only);
    }
    writeln();
    for (const auto& [name, value] : params.args)
        writeln(fmt::format("    {} = {}", name, escape_value(value)));
    writeln();
}

void NinjaGenerator::write_paths(const std::vector<std::string>& paths) {
    for (const auto& path : paths) {
        write(" ");
        write(escape_path(path));
    }
}

void NinjaGenerator::write(std::string_view code) {
    m_code.append(code);
}

void NinjaGenerator::writeln(std::string_view code) {
    m_code.append(code);
    m_code.push_back('\n');
}

} // namespace tristage
