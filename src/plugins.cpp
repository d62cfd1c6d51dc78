#include "plugins.hpp"
#include "graph.hpp"
#include <spdlog/spdlog.h>

using namespace spdlog;

namespace tristage {

std::vector<std::string> PluginList::names() const {
    std::vector<std::string> result;
    result.reserve(m_entries.size());
    for (const auto& entry : m_entries)
        result.push_back(entry.name);
    return result;
}

PluginList PluginList::collect(const ModuleGraph& graph) {
    std::vector<PluginInfo> entries;
    for (const auto& name : graph.declaration_order()) {
        const Module& module = graph.module(name);
        if (!is_plugin(module))
            continue;
        trace("found plugin `{}`", name);
        entries.push_back({name, module.plugin_provider()->pkg_path()});
    }
    debug("{} plugin(s) found", entries.size());
    return PluginList{std::move(entries)};
}

} // namespace tristage
