#pragma once
#include "../action.hpp"
#include <string>

namespace tristage {

// Serializes an ActionGraph into the input format of an execution engine.
class Generator {
public:
    virtual ~Generator() = default;

    virtual void generate(const ActionGraph& actions) = 0;
    virtual std::string& code() = 0;
};

} // namespace tristage
