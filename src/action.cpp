#include "action.hpp"
#include <algorithm>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

using namespace spdlog;

namespace tristage {

const Rule& Rule::phony() {
    static const Rule rule{"phony", "", "", "", false, {}, true};
    return rule;
}

bool BuildParams::is_bare_phony() const {
    return rule == &Rule::phony() && inputs.empty() && implicits.empty() &&
           order_only.empty() && args.empty();
}

void ActionGraph::add_variable(std::string name, std::string value) {
    for (auto& [k, v] : m_variables) {
        if (k == name) {
            v = std::move(value);
            return;
        }
    }
    m_variables.emplace_back(std::move(name), std::move(value));
}

const Rule& ActionGraph::add_rule(Rule rule) {
    m_owned_rules.push_back(std::move(rule));
    return m_owned_rules.back();
}

void ActionGraph::build(BuildParams params) {
    if (!params.rule)
        throw std::invalid_argument("build statement without a rule");
    if (params.outputs.empty())
        throw std::invalid_argument(fmt::format(
            "build statement for rule `{}` has no outputs", params.rule->name));

    for (const auto& [k, v] : params.args) {
        // depfile and generator may always be overridden per statement
        if (k == "depfile" || k == "generator")
            continue;
        const auto& vars = params.rule->variables;
        if (std::find(vars.begin(), vars.end(), k) == vars.end())
            throw std::invalid_argument(
                fmt::format("argument `{}` is not declared by rule `{}`", k,
                            params.rule->name));
    }

    bool bare = params.is_bare_phony();
    std::vector<std::string> outputs;
    for (const auto& out : params.outputs) {
        auto it = m_outputs.find(out);
        if (it == m_outputs.end()) {
            outputs.push_back(out);
            continue;
        }
        if (bare && m_builds[it->second].is_bare_phony()) {
            trace("dropping duplicate phony for `{}`", out);
            continue;
        }
        throw std::invalid_argument(
            fmt::format("multiple actions produce `{}`", out));
    }
    if (outputs.empty())
        return;
    params.outputs = std::move(outputs);

    if (!params.rule->builtin && m_used_rules.insert(params.rule).second)
        m_rules.push_back(params.rule);

    for (const auto& out : params.outputs)
        m_outputs.emplace(out, m_builds.size());
    m_builds.push_back(std::move(params));
}

const BuildParams* ActionGraph::find_output(const std::string& output) const {
    auto it = m_outputs.find(output);
    if (it == m_outputs.end())
        return nullptr;
    return &m_builds[it->second];
}

std::vector<const BuildParams*>
ActionGraph::find_rule(const std::string& rule_name) const {
    std::vector<const BuildParams*> result;
    for (const auto& b : m_builds) {
        if (b.rule->name == rule_name)
            result.push_back(&b);
    }
    return result;
}

} // namespace tristage
