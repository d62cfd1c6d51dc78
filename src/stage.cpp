#include "stage.hpp"
#include "graph.hpp"
#include <spdlog/spdlog.h>

using namespace spdlog;

namespace tristage {

std::string_view stage_name(Stage stage) {
    switch (stage) {
    case Stage::Bootstrap:
        return "bootstrap";
    case Stage::Primary:
        return "primary";
    case Stage::Main:
        return "main";
    }
    return "unknown";
}

std::optional<Stage> parse_stage(std::string_view name) {
    if (name == "bootstrap")
        return Stage::Bootstrap;
    if (name == "primary")
        return Stage::Primary;
    if (name == "main")
        return Stage::Main;
    return std::nullopt;
}

Stage StageMap::at(const std::string& module) const {
    return m_stages.at(module);
}

StageMap StageMap::propagate(const ModuleGraph& graph,
                             const std::vector<std::string>& order) {
    StageMap map;
    for (const auto& name : order) {
        if (auto bearer = graph.module(name).stage_bearer())
            map.m_stages[name] = bearer->declared_stage();
    }

    for (auto it = order.rbegin(); it != order.rend(); ++it) {
        auto stage = map.m_stages.find(*it);
        if (stage == map.m_stages.end() || stage->second != Stage::Bootstrap)
            continue;

        graph.visit_direct_deps(*it, [&](const Module& dep) {
            if (!dep.stage_bearer())
                return;
            auto& dep_stage = map.m_stages[dep.name()];
            if (dep_stage != Stage::Bootstrap) {
                trace("`{}` is needed by bootstrap module `{}`, moving it "
                      "from the {} stage",
                      dep.name(), *it, stage_name(dep_stage));
                dep_stage = Stage::Bootstrap;
            }
        });
    }
    return map;
}

} // namespace tristage
