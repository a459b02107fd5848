#pragma once

#include <boost/multiprecision/cpp_int.hpp>

#include <string>

namespace mathguard::runtime {

enum class Rounding {
    kHalfEven,
    kHalfUp,
    kHalfDown,
    kUp,
    kDown,
    kCeiling,
    kFloor
};

// Accepts the module constant spellings ("ROUND_HALF_EVEN", ...).
bool ParseRounding(const std::string& name, Rounding& out);
const char* ToString(Rounding rounding);

struct DecimalContext {
    int precision = 28;
    Rounding rounding = Rounding::kHalfEven;
};

// Base-10 floating point value: (-1)^negative * coefficient * 10^exponent,
// plus infinities and quiet NaN. Arithmetic rounds to the context precision
// and reports exceptional conditions as ScriptError ("InvalidOperation",
// "DivisionByZero", "Overflow").
class Decimal {
public:
    using Int = boost::multiprecision::cpp_int;

    enum class Special { kFinite, kInfinity, kNaN };

    Decimal() = default;

    static Decimal FromInt(const Int& value);
    // Exact binary-to-decimal conversion, like Decimal(0.1).
    static Decimal FromDouble(double value);
    static Decimal Parse(const std::string& text);
    static Decimal FromParts(bool negative, Int coefficient, long long exponent);
    static Decimal Infinity(bool negative);
    static Decimal NaN();

    bool negative() const { return negative_; }
    const Int& coefficient() const { return coefficient_; }
    long long exponent() const { return exponent_; }
    bool IsNaN() const { return special_ == Special::kNaN; }
    bool IsInfinite() const { return special_ == Special::kInfinity; }
    bool IsFinite() const { return special_ == Special::kFinite; }
    bool IsZero() const { return IsFinite() && coefficient_ == 0; }
    // Exponent of the most significant digit.
    long long Adjusted() const;

    std::string ToString() const;
    std::string Repr() const;
    double ToDouble() const;
    // Truncates toward zero. Throws for infinities and NaN.
    Int ToInteger() const;
    void ToFraction(Int& numerator, Int& denominator) const;

    Decimal Negate() const;
    Decimal Abs() const;
    Decimal Plus(const DecimalContext& context) const;

    static Decimal Add(const Decimal& a, const Decimal& b, const DecimalContext& context);
    static Decimal Subtract(const Decimal& a, const Decimal& b, const DecimalContext& context);
    static Decimal Multiply(const Decimal& a, const Decimal& b, const DecimalContext& context);
    static Decimal Divide(const Decimal& a, const Decimal& b, const DecimalContext& context);
    // Truncating integer division and the matching remainder.
    static Decimal DivideInteger(const Decimal& a, const Decimal& b, const DecimalContext& context);
    static Decimal Remainder(const Decimal& a, const Decimal& b, const DecimalContext& context);
    static Decimal Power(const Decimal& base, const Decimal& exponent, const DecimalContext& context);

    // -1, 0 or 1; 2 when either side is NaN.
    static int Compare(const Decimal& a, const Decimal& b);

    Decimal Sqrt(const DecimalContext& context) const;
    Decimal Exp(const DecimalContext& context) const;
    Decimal Ln(const DecimalContext& context) const;
    Decimal Log10(const DecimalContext& context) const;
    Decimal Quantize(const Decimal& exp, Rounding rounding, const DecimalContext& context) const;
    // Rounds to the given exponent without a precision check.
    Decimal Rescale(long long exponent, Rounding rounding) const;
    Decimal ToIntegral(Rounding rounding) const;

private:
    Decimal Finish(const DecimalContext& context, bool inexact_tail = false) const;

    bool negative_ = false;
    Int coefficient_ = 0;
    long long exponent_ = 0;
    Special special_ = Special::kFinite;
};

// Number of decimal digits of a non-negative integer (1 for zero).
long long CountDigits(const Decimal::Int& value);
Decimal::Int Pow10(long long exponent);
// Base-10 value of a run of ASCII digits. Leading zeros are plain zeros
// (cpp_int's string constructor would read them as an octal prefix).
Decimal::Int ParseDigits(const std::string& digits);

}  // namespace mathguard::runtime
