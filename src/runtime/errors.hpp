#pragma once

#include <stdexcept>
#include <string>

namespace mathguard::runtime {

// An error raised by the submission's own evaluation. `type` is the error
// class name reported to the caller ("ValueError", "ZeroDivisionError", ...).
class ScriptError : public std::runtime_error {
public:
    ScriptError(std::string type, const std::string& message)
        : std::runtime_error(type + ": " + message), type_(std::move(type)), message_(message) {}

    const std::string& type() const { return type_; }
    const std::string& message() const { return message_; }

private:
    std::string type_;
    std::string message_;
};

// The step budget ran out. Reported as a timeout, not as a script error.
class BudgetExceeded : public std::runtime_error {
public:
    explicit BudgetExceeded(const std::string& what) : std::runtime_error(what) {}
};

inline ScriptError TypeError(const std::string& message) { return ScriptError("TypeError", message); }
inline ScriptError ValueError(const std::string& message) { return ScriptError("ValueError", message); }
inline ScriptError IndexError(const std::string& message) { return ScriptError("IndexError", message); }
inline ScriptError KeyError(const std::string& message) { return ScriptError("KeyError", message); }
inline ScriptError NameError(const std::string& message) { return ScriptError("NameError", message); }
inline ScriptError AttributeError(const std::string& message) { return ScriptError("AttributeError", message); }
inline ScriptError OverflowError(const std::string& message) { return ScriptError("OverflowError", message); }
inline ScriptError MemoryError(const std::string& message) { return ScriptError("MemoryError", message); }
inline ScriptError ZeroDivisionError(const std::string& message) {
    return ScriptError("ZeroDivisionError", message);
}

}  // namespace mathguard::runtime
