#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "runtime/value.hpp"

namespace mathguard::runtime {

// Maps positional and keyword arguments of a native call onto named slots and
// reports arity errors the way script functions do.
class ArgReader {
public:
    ArgReader(std::string function, const CallArgs& args, std::vector<std::string> names, std::size_t required);

    bool Has(std::size_t index) const { return slots_[index] != nullptr; }
    const Value& Get(std::size_t index) const;
    Value Get(std::size_t index, const Value& fallback) const;
    // Present and not None.
    bool HasValue(std::size_t index) const { return Has(index) && !slots_[index]->IsNone(); }

private:
    std::string function_;
    std::vector<std::string> names_;
    std::vector<const Value*> slots_;
};

// Rejects keyword arguments for natives that take none.
void NoKeywords(const std::string& function, const CallArgs& args);
void ExpectCount(const std::string& function, const CallArgs& args, std::size_t min, std::size_t max);

// Every builtin the runtime implements, keyed by name. The namespace builder
// filters this table through the capability catalog.
std::map<std::string, Value> NativeBuiltins();

// Stable sort shared by sorted() and list.sort(); keys are computed once.
void SortValues(Interpreter& interp, std::vector<Value>& items, const Value& key, bool reverse);

// Bound method or value attribute of a non-module receiver; false when the
// receiver type has no such attribute.
bool LookupMethod(const Value& receiver, const std::string& name, Value& out);

// Type objects shared by builtins and modules.
Value FractionType();
Value DecimalType();

// int(x), float(x), str(x) conversions reused by modules.
Value ToIntValue(const Value& value);
Value ToFloatValue(const Value& value);
Value ParseFloatText(const std::string& text);

}  // namespace mathguard::runtime
