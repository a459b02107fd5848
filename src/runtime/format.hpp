#pragma once

#include <string>

#include "runtime/value.hpp"

namespace mathguard::runtime {

// Shortest repr that round-trips: 0.1, 1e-05, 1e+16, inf, nan.
std::string FloatRepr(double value);
std::string ComplexRepr(std::complex<double> value);

// format(value, spec): the [[fill]align][sign][#][0][width][,|_][.precision][type]
// mini-language for numbers and strings.
std::string FormatWithSpec(const Value& value, const std::string& spec);

// "fmt % args" with %d %i %s %r %f %e %g %x %o %c %% and width/precision flags.
std::string PercentFormat(const std::string& format, const Value& args);

// str.format with automatic or numbered positional fields and named fields.
// Attribute and index field names are rejected with ValueError.
std::string StrFormat(const std::string& format, const CallArgs& args);

}  // namespace mathguard::runtime
