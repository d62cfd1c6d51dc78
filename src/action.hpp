#pragma once
#include <deque>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace tristage {

// A named command template. Variables listed in `variables` may be bound per
// build statement through BuildParams::args.
struct Rule {
    std::string name;
    std::string command;
    std::string description;
    std::string depfile;
    bool generator{false};
    std::vector<std::string> variables;

    // Rules built into the execution engine are never written out.
    bool builtin{false};

    // ninja's own `phony`: no command, only declares that its outputs exist.
    static const Rule& phony();
};

struct BuildParams {
    const Rule* rule{nullptr};
    std::vector<std::string> outputs;
    std::vector<std::string> inputs;
    std::vector<std::string> implicits;
    std::vector<std::string> order_only;
    std::map<std::string, std::string> args;

    // A built-in phony with nothing but outputs: marks a path as known.
    bool is_bare_phony() const;
};

// Everything a generation run emits, in emission order. This is the action
// sink the modules and the orchestrator write to, and what generators
// serialize.
class ActionGraph {
public:
    ActionGraph(){};

    void add_variable(std::string name, std::string value);

    // Registers a rule owned by the graph. The returned reference stays valid
    // for the lifetime of the graph.
    const Rule& add_rule(Rule rule);

    // Records a build statement. Throws std::invalid_argument if the params
    // are malformed (no rule, no outputs, undeclared argument) or if one of
    // the outputs is already produced by another statement. A bare phony for
    // a path that already has a bare phony is dropped.
    void build(BuildParams params);

    inline void set_build_dir(std::string dir) {
        m_build_dir = std::move(dir);
    }
    inline const std::string& build_dir() const {
        return m_build_dir;
    }
    inline const std::vector<std::pair<std::string, std::string>>&
    variables() const {
        return m_variables;
    }
    // Non-builtin rules referenced by at least one statement, in first-use
    // order.
    inline const std::vector<const Rule*>& rules() const {
        return m_rules;
    }
    inline const std::vector<BuildParams>& builds() const {
        return m_builds;
    }

    // The statement producing `output`, or nullptr.
    const BuildParams* find_output(const std::string& output) const;
    std::vector<const BuildParams*> find_rule(const std::string& rule_name) const;

private:
    std::vector<std::pair<std::string, std::string>> m_variables;
    std::deque<Rule> m_owned_rules;
    std::vector<const Rule*> m_rules;
    std::set<const Rule*> m_used_rules;
    std::vector<BuildParams> m_builds;
    std::map<std::string, size_t> m_outputs; // output -> index in m_builds
    std::string m_build_dir;
};

} // namespace tristage
