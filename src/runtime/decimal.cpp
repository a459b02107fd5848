#include "runtime/decimal.hpp"

#include <boost/multiprecision/cpp_dec_float.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <ios>

#include "runtime/errors.hpp"

namespace mathguard::runtime {
namespace {

using Int = Decimal::Int;
using Float50 = boost::multiprecision::cpp_dec_float_50;

constexpr long long kMaxExponent = 999999;
constexpr long long kMinExponent = -999999;
// Bound on how far a coefficient may be shifted when aligning operands.
constexpr long long kMaxShift = 1000000;

ScriptError InvalidOperation(const char* condition = "InvalidOperation") {
    return ScriptError("InvalidOperation", std::string("[<class 'decimal.") + condition + "'>]");
}

ScriptError DivisionByZero() {
    return ScriptError("DivisionByZero", "[<class 'decimal.DivisionByZero'>]");
}

long long FloorDiv2(long long value) {
    return value >= 0 ? value / 2 : -((-value + 1) / 2);
}

// Drops `drop` trailing digits of a non-negative coefficient, rounding by
// `mode`. `sticky` marks non-zero digits already discarded past the tail.
Int RoundCoefficient(const Int& coefficient, long long drop, bool negative, Rounding mode, bool sticky) {
    if (drop <= 0) {
        return coefficient;
    }
    const Int divisor = Pow10(drop);
    Int quotient = coefficient / divisor;
    const Int rest = coefficient % divisor;
    if (rest == 0 && !sticky) {
        return quotient;
    }
    const Int twice = rest * 2;
    int half = twice < divisor ? -1 : (twice > divisor ? 1 : 0);
    if (half == 0 && sticky) {
        half = 1;
    }
    bool increment = false;
    switch (mode) {
        case Rounding::kHalfEven:
            increment = half > 0 || (half == 0 && (quotient % 2) != 0);
            break;
        case Rounding::kHalfUp:
            increment = half >= 0;
            break;
        case Rounding::kHalfDown:
            increment = half > 0;
            break;
        case Rounding::kUp:
            increment = true;
            break;
        case Rounding::kDown:
            increment = false;
            break;
        case Rounding::kCeiling:
            increment = !negative;
            break;
        case Rounding::kFloor:
            increment = negative;
            break;
    }
    if (increment) {
        ++quotient;
    }
    return quotient;
}

bool IsIntegral(const Decimal& value) {
    if (!value.IsFinite()) {
        return false;
    }
    if (value.exponent() >= 0 || value.coefficient() == 0) {
        return true;
    }
    if (-value.exponent() > CountDigits(value.coefficient())) {
        return false;
    }
    return value.coefficient() % Pow10(-value.exponent()) == 0;
}

Float50 ToFloat50(const Decimal& value) {
    return Float50(value.ToString());
}

Decimal FromFloat50(const Float50& value, const DecimalContext& context) {
    const auto text = value.str(context.precision + 8, std::ios_base::scientific);
    return Decimal::Parse(text).Plus(context);
}

// Trims trailing zeros while the exponent stays at or below `ideal`.
void StripToIdeal(Int& coefficient, long long& exponent, long long ideal) {
    while (exponent < ideal && coefficient != 0 && coefficient % 10 == 0) {
        coefficient /= 10;
        ++exponent;
    }
}

}  // namespace

bool ParseRounding(const std::string& name, Rounding& out) {
    if (name == "ROUND_HALF_EVEN") {
        out = Rounding::kHalfEven;
    } else if (name == "ROUND_HALF_UP") {
        out = Rounding::kHalfUp;
    } else if (name == "ROUND_HALF_DOWN") {
        out = Rounding::kHalfDown;
    } else if (name == "ROUND_UP") {
        out = Rounding::kUp;
    } else if (name == "ROUND_DOWN") {
        out = Rounding::kDown;
    } else if (name == "ROUND_CEILING") {
        out = Rounding::kCeiling;
    } else if (name == "ROUND_FLOOR") {
        out = Rounding::kFloor;
    } else {
        return false;
    }
    return true;
}

const char* ToString(Rounding rounding) {
    switch (rounding) {
        case Rounding::kHalfEven: return "ROUND_HALF_EVEN";
        case Rounding::kHalfUp: return "ROUND_HALF_UP";
        case Rounding::kHalfDown: return "ROUND_HALF_DOWN";
        case Rounding::kUp: return "ROUND_UP";
        case Rounding::kDown: return "ROUND_DOWN";
        case Rounding::kCeiling: return "ROUND_CEILING";
        case Rounding::kFloor: return "ROUND_FLOOR";
    }
    return "ROUND_HALF_EVEN";
}

long long CountDigits(const Int& value) {
    if (value == 0) {
        return 1;
    }
    const std::string text = value.str();
    return static_cast<long long>(text.size()) - (text[0] == '-' ? 1 : 0);
}

Int Pow10(long long exponent) {
    if (exponent < 0 || exponent > kMaxShift * 4) {
        throw ScriptError("Overflow", "[<class 'decimal.Overflow'>]");
    }
    return boost::multiprecision::pow(Int(10), static_cast<unsigned>(exponent));
}

Int ParseDigits(const std::string& digits) {
    Int value = 0;
    for (char c : digits) {
        value = value * 10 + (c - '0');
    }
    return value;
}

Decimal Decimal::FromInt(const Int& value) {
    Decimal out;
    out.negative_ = value < 0;
    out.coefficient_ = out.negative_ ? Int(-value) : value;
    return out;
}

Decimal Decimal::FromDouble(double value) {
    if (std::isnan(value)) {
        return NaN();
    }
    if (std::isinf(value)) {
        return Infinity(value < 0);
    }
    Decimal out;
    out.negative_ = std::signbit(value);
    int binary_exponent = 0;
    const double mantissa = std::frexp(std::fabs(value), &binary_exponent);
    auto bits = static_cast<unsigned long long>(std::ldexp(mantissa, 53));
    binary_exponent -= 53;
    while (bits != 0 && (bits & 1ULL) == 0) {
        bits >>= 1;
        ++binary_exponent;
    }
    Int coefficient = bits;
    if (binary_exponent >= 0) {
        out.coefficient_ = coefficient << binary_exponent;
        out.exponent_ = 0;
    } else {
        out.coefficient_ = coefficient * boost::multiprecision::pow(Int(5), static_cast<unsigned>(-binary_exponent));
        out.exponent_ = binary_exponent;
    }
    return out;
}

Decimal Decimal::Parse(const std::string& text) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    std::string body = text.substr(begin, end - begin);
    bool negative = false;
    if (!body.empty() && (body[0] == '+' || body[0] == '-')) {
        negative = body[0] == '-';
        body.erase(0, 1);
    }
    std::string lowered = body;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "inf" || lowered == "infinity") {
        return Infinity(negative);
    }
    if (lowered == "nan" || lowered == "snan") {
        return NaN();
    }

    std::string digits;
    long long fraction_digits = 0;
    bool seen_point = false;
    bool seen_digit = false;
    std::size_t i = 0;
    for (; i < body.size(); ++i) {
        const char c = body[i];
        if (std::isdigit(static_cast<unsigned char>(c))) {
            digits.push_back(c);
            seen_digit = true;
            if (seen_point) {
                ++fraction_digits;
            }
        } else if (c == '.' && !seen_point) {
            seen_point = true;
        } else if (c == '_' && seen_digit && i + 1 < body.size() &&
                   std::isdigit(static_cast<unsigned char>(body[i + 1]))) {
            continue;
        } else {
            break;
        }
    }
    if (!seen_digit) {
        throw InvalidOperation("ConversionSyntax");
    }
    long long exponent = 0;
    if (i < body.size()) {
        if (body[i] != 'e' && body[i] != 'E') {
            throw InvalidOperation("ConversionSyntax");
        }
        ++i;
        bool exponent_negative = false;
        if (i < body.size() && (body[i] == '+' || body[i] == '-')) {
            exponent_negative = body[i] == '-';
            ++i;
        }
        if (i >= body.size()) {
            throw InvalidOperation("ConversionSyntax");
        }
        for (; i < body.size(); ++i) {
            if (!std::isdigit(static_cast<unsigned char>(body[i]))) {
                throw InvalidOperation("ConversionSyntax");
            }
            if (exponent > 100000000000LL) {
                throw ScriptError("Overflow", "[<class 'decimal.Overflow'>]");
            }
            exponent = exponent * 10 + (body[i] - '0');
        }
        if (exponent_negative) {
            exponent = -exponent;
        }
    }
    Decimal out;
    out.negative_ = negative;
    out.coefficient_ = ParseDigits(digits);
    out.exponent_ = exponent - fraction_digits;
    if (out.coefficient_ != 0 && out.Adjusted() > kMaxExponent) {
        throw ScriptError("Overflow", "[<class 'decimal.Overflow'>]");
    }
    return out;
}

Decimal Decimal::FromParts(bool negative, Int coefficient, long long exponent) {
    Decimal out;
    out.negative_ = negative;
    out.coefficient_ = std::move(coefficient);
    out.exponent_ = exponent;
    return out;
}

Decimal Decimal::Infinity(bool negative) {
    Decimal out;
    out.negative_ = negative;
    out.special_ = Special::kInfinity;
    return out;
}

Decimal Decimal::NaN() {
    Decimal out;
    out.special_ = Special::kNaN;
    return out;
}

long long Decimal::Adjusted() const {
    return exponent_ + CountDigits(coefficient_) - 1;
}

std::string Decimal::ToString() const {
    if (IsNaN()) {
        return "NaN";
    }
    const std::string sign = negative_ ? "-" : "";
    if (IsInfinite()) {
        return sign + "Infinity";
    }
    const std::string digits = coefficient_.str();
    const long long length = static_cast<long long>(digits.size());
    const long long adjusted = exponent_ + length - 1;
    if (exponent_ <= 0 && adjusted >= -6) {
        if (exponent_ == 0) {
            return sign + digits;
        }
        const long long point = length + exponent_;
        if (point > 0) {
            return sign + digits.substr(0, static_cast<std::size_t>(point)) + "." +
                digits.substr(static_cast<std::size_t>(point));
        }
        return sign + "0." + std::string(static_cast<std::size_t>(-point), '0') + digits;
    }
    std::string out = sign + digits.substr(0, 1);
    if (length > 1) {
        out += "." + digits.substr(1);
    }
    out += adjusted >= 0 ? "E+" : "E-";
    out += std::to_string(adjusted >= 0 ? adjusted : -adjusted);
    return out;
}

std::string Decimal::Repr() const {
    return "Decimal('" + ToString() + "')";
}

double Decimal::ToDouble() const {
    if (IsNaN()) {
        return std::nan("");
    }
    return std::strtod(ToString().c_str(), nullptr);
}

Decimal::Int Decimal::ToInteger() const {
    if (IsNaN()) {
        throw ValueError("cannot convert NaN to integer");
    }
    if (IsInfinite()) {
        throw OverflowError("cannot convert Infinity to integer");
    }
    Int magnitude;
    if (exponent_ >= 0) {
        if (exponent_ > kMaxShift) {
            throw OverflowError("integer result too large");
        }
        magnitude = coefficient_ * Pow10(exponent_);
    } else if (-exponent_ > CountDigits(coefficient_)) {
        magnitude = 0;
    } else {
        magnitude = coefficient_ / Pow10(-exponent_);
    }
    return negative_ ? Int(-magnitude) : magnitude;
}

void Decimal::ToFraction(Int& numerator, Int& denominator) const {
    if (!IsFinite()) {
        throw IsNaN() ? ValueError("cannot convert NaN to integer ratio")
                      : OverflowError("cannot convert Infinity to integer ratio");
    }
    if (exponent_ >= 0) {
        if (exponent_ > kMaxShift) {
            throw OverflowError("integer result too large");
        }
        numerator = coefficient_ * Pow10(exponent_);
        denominator = 1;
    } else {
        if (-exponent_ > kMaxShift) {
            throw OverflowError("integer result too large");
        }
        numerator = coefficient_;
        denominator = Pow10(-exponent_);
    }
    if (negative_) {
        numerator = -numerator;
    }
}

Decimal Decimal::Negate() const {
    Decimal out = *this;
    if (!IsNaN()) {
        out.negative_ = !negative_;
    }
    return out;
}

Decimal Decimal::Abs() const {
    Decimal out = *this;
    out.negative_ = false;
    return out;
}

Decimal Decimal::Plus(const DecimalContext& context) const {
    return Finish(context);
}

Decimal Decimal::Finish(const DecimalContext& context, bool inexact_tail) const {
    if (!IsFinite()) {
        return *this;
    }
    Decimal out = *this;
    long long digits = CountDigits(out.coefficient_);
    if (inexact_tail && digits <= context.precision) {
        const long long pad = context.precision + 1 - digits;
        out.coefficient_ *= Pow10(pad);
        out.exponent_ -= pad;
        digits = context.precision + 1;
    }
    if (digits > context.precision) {
        const long long drop = digits - context.precision;
        out.coefficient_ = RoundCoefficient(out.coefficient_, drop, out.negative_, context.rounding, inexact_tail);
        out.exponent_ += drop;
        if (CountDigits(out.coefficient_) > context.precision) {
            out.coefficient_ /= 10;
            ++out.exponent_;
        }
    }
    if (out.coefficient_ != 0 && out.Adjusted() > kMaxExponent) {
        throw ScriptError("Overflow", "[<class 'decimal.Overflow'>]");
    }
    if (out.coefficient_ != 0 && out.Adjusted() < kMinExponent - context.precision) {
        out.coefficient_ = 0;
        out.exponent_ = kMinExponent - context.precision + 1;
    }
    return out;
}

Decimal Decimal::Add(const Decimal& a, const Decimal& b, const DecimalContext& context) {
    if (a.IsNaN() || b.IsNaN()) {
        return NaN();
    }
    if (a.IsInfinite() || b.IsInfinite()) {
        if (a.IsInfinite() && b.IsInfinite() && a.negative_ != b.negative_) {
            throw InvalidOperation();
        }
        return a.IsInfinite() ? a : b;
    }

    // An operand entirely below the other's last digit and rounding position
    // only decides rounding; replace it by a one-digit stand-in so alignment
    // never needs a huge shift.
    auto shrink = [&context](const Decimal& big, const Decimal& small) {
        if (big.coefficient_ == 0 || small.coefficient_ == 0) {
            return small;
        }
        const long long floor = std::min(big.exponent_, big.Adjusted() - context.precision) - 1;
        if (small.Adjusted() >= floor) {
            return small;
        }
        return FromParts(small.negative_, 1, floor - 1);
    };
    const Decimal lhs = shrink(b, a);
    const Decimal rhs = shrink(a, b);

    const long long exponent = std::min(lhs.exponent_, rhs.exponent_);
    if (lhs.exponent_ - exponent > kMaxShift || rhs.exponent_ - exponent > kMaxShift) {
        throw ScriptError("Overflow", "[<class 'decimal.Overflow'>]");
    }
    Int left = lhs.coefficient_ * Pow10(lhs.exponent_ - exponent);
    Int right = rhs.coefficient_ * Pow10(rhs.exponent_ - exponent);
    if (lhs.negative_) {
        left = -left;
    }
    if (rhs.negative_) {
        right = -right;
    }
    const Int sum = left + right;
    Decimal out;
    out.exponent_ = exponent;
    if (sum == 0) {
        out.negative_ = context.rounding == Rounding::kFloor ? (lhs.negative_ || rhs.negative_)
                                                             : (lhs.negative_ && rhs.negative_);
        out.coefficient_ = 0;
    } else {
        out.negative_ = sum < 0;
        out.coefficient_ = out.negative_ ? Int(-sum) : sum;
    }
    return out.Finish(context);
}

Decimal Decimal::Subtract(const Decimal& a, const Decimal& b, const DecimalContext& context) {
    return Add(a, b.Negate(), context);
}

Decimal Decimal::Multiply(const Decimal& a, const Decimal& b, const DecimalContext& context) {
    if (a.IsNaN() || b.IsNaN()) {
        return NaN();
    }
    const bool negative = a.negative_ != b.negative_;
    if (a.IsInfinite() || b.IsInfinite()) {
        if (a.IsZero() || b.IsZero()) {
            throw InvalidOperation();
        }
        return Infinity(negative);
    }
    return FromParts(negative, a.coefficient_ * b.coefficient_, a.exponent_ + b.exponent_).Finish(context);
}

Decimal Decimal::Divide(const Decimal& a, const Decimal& b, const DecimalContext& context) {
    if (a.IsNaN() || b.IsNaN()) {
        return NaN();
    }
    const bool negative = a.negative_ != b.negative_;
    if (a.IsInfinite()) {
        if (b.IsInfinite()) {
            throw InvalidOperation();
        }
        return Infinity(negative);
    }
    if (b.IsInfinite()) {
        return FromParts(negative, 0, kMinExponent - context.precision + 1);
    }
    if (b.IsZero()) {
        if (a.IsZero()) {
            throw InvalidOperation("DivisionUndefined");
        }
        throw DivisionByZero();
    }
    const long long ideal = a.exponent_ - b.exponent_;
    if (a.IsZero()) {
        return FromParts(negative, 0, ideal).Finish(context);
    }
    const long long shift = std::max<long long>(
        0, context.precision + CountDigits(b.coefficient_) - CountDigits(a.coefficient_) + 1);
    const Int numerator = a.coefficient_ * Pow10(shift);
    Int quotient = numerator / b.coefficient_;
    const Int rest = numerator % b.coefficient_;
    long long exponent = ideal - shift;
    if (rest == 0) {
        StripToIdeal(quotient, exponent, ideal);
        return FromParts(negative, quotient, exponent).Finish(context);
    }
    return FromParts(negative, quotient, exponent).Finish(context, true);
}

Decimal Decimal::DivideInteger(const Decimal& a, const Decimal& b, const DecimalContext& context) {
    if (a.IsNaN() || b.IsNaN()) {
        return NaN();
    }
    const bool negative = a.negative_ != b.negative_;
    if (a.IsInfinite()) {
        if (b.IsInfinite()) {
            throw InvalidOperation();
        }
        return Infinity(negative);
    }
    if (b.IsInfinite()) {
        return FromParts(negative, 0, 0);
    }
    if (b.IsZero()) {
        if (a.IsZero()) {
            throw InvalidOperation("DivisionUndefined");
        }
        throw DivisionByZero();
    }
    if (a.IsZero() || a.Adjusted() < b.Adjusted()) {
        return FromParts(negative, 0, 0);
    }
    if (a.Adjusted() - b.Adjusted() + 1 > context.precision) {
        throw InvalidOperation("DivisionImpossible");
    }
    const long long exponent = std::min(a.exponent_, b.exponent_);
    const Int left = a.coefficient_ * Pow10(a.exponent_ - exponent);
    const Int right = b.coefficient_ * Pow10(b.exponent_ - exponent);
    return FromParts(negative, left / right, 0);
}

Decimal Decimal::Remainder(const Decimal& a, const Decimal& b, const DecimalContext& context) {
    if (a.IsNaN() || b.IsNaN()) {
        return NaN();
    }
    if (a.IsInfinite()) {
        throw InvalidOperation();
    }
    if (b.IsInfinite()) {
        return a.Finish(context);
    }
    if (b.IsZero()) {
        throw InvalidOperation(a.IsZero() ? "DivisionUndefined" : "InvalidOperation");
    }
    const long long exponent = std::min(a.exponent_, b.exponent_);
    if (a.IsZero() || a.Adjusted() < b.Adjusted()) {
        if (a.exponent_ - exponent > kMaxShift) {
            throw ScriptError("Overflow", "[<class 'decimal.Overflow'>]");
        }
        return FromParts(a.negative_, a.coefficient_ * Pow10(a.exponent_ - exponent), exponent).Finish(context);
    }
    if (a.Adjusted() - b.Adjusted() + 1 > context.precision) {
        throw InvalidOperation("DivisionImpossible");
    }
    const Int left = a.coefficient_ * Pow10(a.exponent_ - exponent);
    const Int right = b.coefficient_ * Pow10(b.exponent_ - exponent);
    return FromParts(a.negative_, left % right, exponent).Finish(context);
}

Decimal Decimal::Power(const Decimal& base, const Decimal& exponent, const DecimalContext& context) {
    if (base.IsNaN() || exponent.IsNaN()) {
        return NaN();
    }
    if (exponent.IsInfinite() || base.IsInfinite()) {
        const double result = std::pow(base.ToDouble(), exponent.ToDouble());
        if (std::isnan(result)) {
            throw InvalidOperation();
        }
        return FromDouble(result);
    }

    if (IsIntegral(exponent)) {
        const Int n = exponent.ToInteger();
        if (base.IsZero()) {
            if (n == 0) {
                throw InvalidOperation();
            }
            if (n < 0) {
                throw DivisionByZero();
            }
            return FromParts(base.negative_ && (n % 2) != 0, 0, 0);
        }
        const Int magnitude = n < 0 ? Int(-n) : n;
        if (magnitude > Int(1000000000)) {
            const double log_size = std::log10(base.Abs().ToDouble()) * static_cast<double>(n);
            if (log_size > static_cast<double>(kMaxExponent)) {
                throw ScriptError("Overflow", "[<class 'decimal.Overflow'>]");
            }
            if (log_size < static_cast<double>(kMinExponent - context.precision)) {
                return FromParts(base.negative_ && (n % 2) != 0, 0, kMinExponent - context.precision + 1);
            }
        }
        DecimalContext working = context;
        working.precision = context.precision + static_cast<int>(CountDigits(magnitude)) + 3;
        working.rounding = Rounding::kHalfEven;
        Decimal result = FromInt(1);
        Decimal square = base;
        Int remaining = magnitude;
        while (remaining > 0) {
            if ((remaining & 1) != 0) {
                result = Multiply(result, square, working);
            }
            remaining >>= 1;
            if (remaining > 0) {
                square = Multiply(square, square, working);
            }
        }
        if (n < 0) {
            result = Divide(FromInt(1), result, working);
        }
        return result.Finish(context);
    }

    if (base.negative_ && !base.IsZero()) {
        throw InvalidOperation();
    }
    if (base.IsZero()) {
        if (exponent.negative_) {
            throw DivisionByZero();
        }
        return FromParts(false, 0, 0);
    }
    const Float50 result = boost::multiprecision::pow(ToFloat50(base), ToFloat50(exponent));
    return FromFloat50(result, context).Finish(context, true);
}

int Decimal::Compare(const Decimal& a, const Decimal& b) {
    if (a.IsNaN() || b.IsNaN()) {
        return 2;
    }
    const int sign_a = a.IsZero() ? 0 : (a.negative_ ? -1 : 1);
    const int sign_b = b.IsZero() ? 0 : (b.negative_ ? -1 : 1);
    if (a.IsInfinite() || b.IsInfinite()) {
        const int rank_a = a.IsInfinite() ? sign_a * 2 : sign_a;
        const int rank_b = b.IsInfinite() ? sign_b * 2 : sign_b;
        if (a.IsInfinite() && b.IsInfinite()) {
            return rank_a == rank_b ? 0 : (rank_a < rank_b ? -1 : 1);
        }
        if (a.IsInfinite()) {
            return sign_a;
        }
        return -sign_b;
    }
    if (sign_a != sign_b) {
        return sign_a < sign_b ? -1 : 1;
    }
    if (sign_a == 0) {
        return 0;
    }
    int magnitude = 0;
    if (a.Adjusted() != b.Adjusted()) {
        magnitude = a.Adjusted() < b.Adjusted() ? -1 : 1;
    } else {
        const long long exponent = std::min(a.exponent_, b.exponent_);
        const Int left = a.coefficient_ * Pow10(a.exponent_ - exponent);
        const Int right = b.coefficient_ * Pow10(b.exponent_ - exponent);
        magnitude = left == right ? 0 : (left < right ? -1 : 1);
    }
    return sign_a > 0 ? magnitude : -magnitude;
}

Decimal Decimal::Sqrt(const DecimalContext& context) const {
    if (IsNaN()) {
        return NaN();
    }
    if (IsZero()) {
        return FromParts(negative_, 0, FloorDiv2(exponent_));
    }
    if (negative_) {
        throw InvalidOperation();
    }
    if (IsInfinite()) {
        return *this;
    }
    const long long ideal = FloorDiv2(exponent_);
    Int coefficient = coefficient_;
    long long exponent = exponent_;
    if ((exponent & 1) != 0) {
        coefficient *= 10;
        --exponent;
    }
    const long long wanted = 2LL * context.precision + 2;
    const long long digits = CountDigits(coefficient);
    const long long pairs = std::max<long long>(0, (wanted - digits + 1) / 2);
    coefficient *= Pow10(2 * pairs);
    exponent -= 2 * pairs;
    Int root = boost::multiprecision::sqrt(coefficient);
    long long root_exponent = exponent / 2;
    if (root * root == coefficient) {
        StripToIdeal(root, root_exponent, ideal);
        return FromParts(false, root, root_exponent).Finish(context);
    }
    return FromParts(false, root, root_exponent).Finish(context, true);
}

Decimal Decimal::Exp(const DecimalContext& context) const {
    if (IsNaN()) {
        return NaN();
    }
    if (IsInfinite()) {
        return negative_ ? FromParts(false, 0, 0) : *this;
    }
    if (IsZero()) {
        return FromInt(1);
    }
    if (Adjusted() > 7) {
        if (negative_) {
            return FromParts(false, 0, kMinExponent - context.precision + 1);
        }
        throw ScriptError("Overflow", "[<class 'decimal.Overflow'>]");
    }
    return FromFloat50(boost::multiprecision::exp(ToFloat50(*this)), context).Finish(context, true);
}

Decimal Decimal::Ln(const DecimalContext& context) const {
    if (IsNaN()) {
        return NaN();
    }
    if (IsZero()) {
        return Infinity(true);
    }
    if (negative_) {
        throw InvalidOperation();
    }
    if (IsInfinite()) {
        return *this;
    }
    if (Compare(*this, FromInt(1)) == 0) {
        return FromInt(0);
    }
    // log(c * 10^e) = log(c) + e * log(10) keeps huge exponents inside the
    // range of the 50-digit float.
    const Float50 value = boost::multiprecision::log(Float50(coefficient_.str())) +
        Float50(exponent_) * boost::multiprecision::log(Float50(10));
    return FromFloat50(value, context).Finish(context, true);
}

Decimal Decimal::Log10(const DecimalContext& context) const {
    if (IsNaN()) {
        return NaN();
    }
    if (IsZero()) {
        return Infinity(true);
    }
    if (negative_) {
        throw InvalidOperation();
    }
    if (IsInfinite()) {
        return *this;
    }
    Int coefficient = coefficient_;
    long long exponent = exponent_;
    StripToIdeal(coefficient, exponent, kMaxShift);
    if (coefficient == 1) {
        return FromInt(exponent);
    }
    const Float50 value = boost::multiprecision::log10(Float50(coefficient_.str())) + Float50(exponent_);
    return FromFloat50(value, context).Finish(context, true);
}

Decimal Decimal::Rescale(long long exponent, Rounding rounding) const {
    if (!IsFinite()) {
        return *this;
    }
    if (exponent <= exponent_) {
        if (exponent_ - exponent > kMaxShift) {
            throw InvalidOperation();
        }
        return FromParts(negative_, coefficient_ * Pow10(exponent_ - exponent), exponent);
    }
    const long long digits = CountDigits(coefficient_);
    const long long drop = std::min(exponent - exponent_, digits + 2);
    return FromParts(negative_, RoundCoefficient(coefficient_, drop, negative_, rounding, false), exponent);
}

Decimal Decimal::Quantize(const Decimal& exp, Rounding rounding, const DecimalContext& context) const {
    if (IsNaN() || exp.IsNaN()) {
        return NaN();
    }
    if (IsInfinite() || exp.IsInfinite()) {
        if (IsInfinite() && exp.IsInfinite()) {
            return *this;
        }
        throw InvalidOperation();
    }
    const Decimal result = Rescale(exp.exponent_, rounding);
    if (CountDigits(result.coefficient_) > context.precision) {
        throw InvalidOperation();
    }
    return result;
}

Decimal Decimal::ToIntegral(Rounding rounding) const {
    if (!IsFinite() || exponent_ >= 0) {
        return *this;
    }
    return Rescale(0, rounding);
}

}  // namespace mathguard::runtime
