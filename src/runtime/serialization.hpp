#pragma once

#include <nlohmann/json.hpp>

#include "runtime/value.hpp"

namespace mathguard::runtime {

// Result encoding: ints in the 64-bit range as integers, larger ints as
// decimal strings, non-finite floats as "inf"/"-inf"/"nan", complex, Fraction
// and Decimal as their str() form, sequences and sets as arrays, dicts as
// objects with str() keys, None as null. Non-data values raise TypeError.
nlohmann::json ToJson(const Value& value);

// Entry-point arguments: null, booleans, numbers, strings, arrays (as lists)
// and objects (as dicts with string keys).
Value FromJson(const nlohmann::json& value);

}  // namespace mathguard::runtime
