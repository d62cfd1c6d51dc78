#pragma once
#include <string>
#include <vector>

namespace tristage {

class ModuleGraph;

struct PluginInfo {
    std::string name;
    std::string pkg_path;
};

// Ordered, immutable list of the packages flagged as plugins. Built by the
// discovery pass before any module generates actions, then handed to the
// primary builder through the generation context.
class PluginList {
public:
    PluginList(){};
    explicit PluginList(std::vector<PluginInfo> entries)
        : m_entries(std::move(entries)){};

    inline const std::vector<PluginInfo>& entries() const {
        return m_entries;
    }
    inline bool empty() const {
        return m_entries.empty();
    }
    std::vector<std::string> names() const;

    // Walks the graph in declaration order, so the resulting list (and every
    // build argument derived from it) is stable across runs.
    static PluginList collect(const ModuleGraph& graph);

private:
    std::vector<PluginInfo> m_entries;
};

} // namespace tristage
