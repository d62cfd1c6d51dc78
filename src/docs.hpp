#pragma once
#include "module.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace tristage {

// Renders an HTML page describing every registered module type and its
// properties.
std::string generate_docs(std::string_view builder_name,
                          const std::vector<ModuleType>& types);

} // namespace tristage
