#pragma once

#include <string>
#include <utility>

#include "runtime/builtins.hpp"
#include "runtime/errors.hpp"
#include "runtime/modules/modules.hpp"
#include "runtime/numeric.hpp"

namespace mathguard::runtime::modules {

inline void Define(MemberTable& table, const std::string& name, NativeFn fn) {
    table[name] = MakeBuiltin(name, std::move(fn));
}

// Real-number argument of a math-style function.
inline double RealArg(const Value& value) {
    if (!IsReal(value)) {
        throw TypeError("must be real number, not " + TypeName(value));
    }
    return ToDouble(value);
}

inline ScriptError DomainError() {
    return ValueError("math domain error");
}

inline ScriptError RangeError() {
    return OverflowError("math range error");
}

}  // namespace mathguard::runtime::modules
