#include "builder.hpp"
#include "docs.hpp"
#include "utils.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/stopwatch.h>

using namespace spdlog;

namespace tristage {

Builder::Builder(Config config, BuildOptions options,
                 std::unique_ptr<Generator> generator)
    : m_ctx(std::move(config)), m_options(std::move(options)),
      m_generator(std::move(generator)) {
    debug("builder for `{}` in the {} stage, build dir `{}`",
          m_ctx.config().top_level_file().generic_string(),
          stage_name(m_ctx.config().stage()), m_ctx.config().build_dir());
}

bool Builder::report(const std::vector<BuildError>& errors) const {
    for (const auto& err : errors)
        error(err.to_string());
    return errors.empty();
}

bool Builder::run() {
    stopwatch sw;

    if (!report(m_ctx.parse_declarations()))
        return false;

    if (!m_options.docs_file.empty()) {
        try {
            utils::write_file(m_options.docs_file,
                              generate_docs(m_ctx.config().toolchain().mini_builder(),
                                            m_ctx.module_types()));
        } catch (const std::exception& err) {
            error("couldn't write documentation: {}", err.what());
            return false;
        }
        info("wrote documentation to `{}`", m_options.docs_file);
        return true;
    }

    if (!report(m_ctx.prepare_build_actions()))
        return false;

    try {
        write_outputs();
    } catch (const std::exception& err) {
        error("couldn't write outputs: {}", err.what());
        return false;
    }

    debug("generation finished in {}s", sw);
    return true;
}

void Builder::write_outputs() {
    m_generator->generate(m_ctx.actions());
    utils::write_file(m_options.out_file, m_generator->code());
    trace("wrote `{}`", m_options.out_file);

    if (!m_options.depfile.empty())
        utils::write_depfile(m_options.depfile, m_options.out_file,
                             m_ctx.declaration_files());

    if (!m_options.timestamp_file.empty()) {
        utils::write_file(m_options.timestamp_file, "");
        if (!m_options.timestamp_depfile.empty())
            utils::write_depfile(m_options.timestamp_depfile,
                                 m_options.timestamp_file,
                                 m_ctx.declaration_files());
    }
}

} // namespace tristage
