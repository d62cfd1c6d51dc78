#pragma once
#include "config.hpp"
#include "context.hpp"
#include "generators/generator.hpp"
#include <memory>
#include <string>

namespace tristage {

// Where the results of a run go. Empty paths are not written.
struct BuildOptions {
    // Generated manifest.
    std::string out_file{"build.ninja"};
    // Depfile listing every declarations file read, target `out_file`.
    std::string depfile;
    // Touched after a successful run, with its own depfile.
    std::string timestamp_file;
    std::string timestamp_depfile;
    // If set, only the module type documentation is written, here.
    std::string docs_file;
};

// Drives a single generation: loads the declarations, runs every pass and
// writes the outputs. Nothing is written if any step reported an error.
class Builder {
public:
    Builder(Config config, BuildOptions options,
            std::unique_ptr<Generator> generator);

    // Logs every error and returns false on failure.
    bool run();

    inline const Context& context() const {
        return m_ctx;
    }

private:
    bool report(const std::vector<BuildError>& errors) const;
    void write_outputs();

    Context m_ctx;
    BuildOptions m_options;
    std::unique_ptr<Generator> m_generator;
};

} // namespace tristage
