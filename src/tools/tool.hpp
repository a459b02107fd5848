#pragma once

#include <string>
#include <unordered_map>

namespace mathguard::tools {

// A capability offered to a function-calling model. Parameters arrive as
// flat strings keyed by the names declared in ParametersJson(); structured
// values (argument lists) are passed as JSON text and decoded by the tool.
class Tool {
public:
    virtual ~Tool() = default;

    virtual std::string Name() const = 0;
    virtual std::string Description() const = 0;
    // JSON Schema object describing the accepted parameters.
    virtual std::string ParametersJson() const = 0;
    // Returns the reply text for the model. Failures are reported in the
    // reply, never thrown.
    virtual std::string Execute(const std::unordered_map<std::string, std::string>& params) = 0;
};

}  // namespace mathguard::tools
