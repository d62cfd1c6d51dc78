#pragma once
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tristage {

class ModuleGraph;

// The three stages of self-construction, ordered by how early they run.
//
// Bootstrap: the mini builder generates a manifest that builds the primary
//            builder.
// Primary:   the primary builder is available and generates the main
//            manifest.
// Main:      the final project manifest is active.
enum class Stage {
    Bootstrap,
    Primary,
    Main,
};

std::string_view stage_name(Stage stage);

std::optional<Stage> parse_stage(std::string_view name);

// Effective stage of every stage-bearing module, computed once by
// `propagate_stages` and read-only afterwards.
class StageMap {
public:
    StageMap(){};

    // Throws std::out_of_range if `module` has no stage.
    Stage at(const std::string& module) const;
    bool contains(const std::string& module) const {
        return m_stages.count(module) != 0;
    }
    size_t size() const {
        return m_stages.size();
    }

    // Starts from every module's declared stage, then walks `order` (which
    // lists dependencies before their dependents) backwards, so a module is
    // always visited after everything that depends on it. Each Bootstrap
    // module forces its direct stage-bearing dependencies to Bootstrap,
    // which makes the infection transitive after the single walk.
    static StageMap propagate(const ModuleGraph& graph,
                              const std::vector<std::string>& order);

private:
    std::map<std::string, Stage> m_stages;
};

} // namespace tristage
