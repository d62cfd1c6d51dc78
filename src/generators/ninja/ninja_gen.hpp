#pragma once
#include "../generator.hpp"
#include <string_view>

namespace tristage {

class NinjaGenerator : public Generator {
public:
    NinjaGenerator(){};

    // Output depends only on the contents of `actions`, so two runs over the
    // same declarations produce byte-identical manifests.
    void generate(const ActionGraph& actions) override;
    std::string& code() override {
        return m_code;
    };

    // `$`, space and `:` are significant in paths on a build line.
    static std::string escape_path(std::string_view path);
    // Only `$` and newlines need escaping in a variable value.
    static std::string escape_value(std::string_view value);

private:
    void write_rule(const Rule& rule);
    void write_build(const BuildParams& params);
    void write_paths(const std::vector<std::string>& paths);
    void write(std::string_view code);
    void writeln(std::string_view code = "");

    std::string m_code;
};

} // namespace tristage
