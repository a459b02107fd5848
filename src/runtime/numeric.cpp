#include "runtime/numeric.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <limits>

#include "runtime/errors.hpp"

namespace mathguard::runtime {
namespace {

using lang::BinaryOperator;

// Position of a number in the promotion order bool/int < Fraction < float
// < complex. Decimal sits outside the tower.
enum class Rank { kInt, kFraction, kFloat, kComplex, kDecimal };

Rank RankOf(const Value& value) {
    switch (value.kind()) {
        case ValueKind::kFraction: return Rank::kFraction;
        case ValueKind::kFloat: return Rank::kFloat;
        case ValueKind::kComplex: return Rank::kComplex;
        case ValueKind::kDecimal: return Rank::kDecimal;
        default: return Rank::kInt;
    }
}

BigInt AbsInt(const BigInt& value) {
    return value < 0 ? BigInt(-value) : value;
}

std::size_t BitLength(const BigInt& value) {
    if (value == 0) {
        return 0;
    }
    return static_cast<std::size_t>(boost::multiprecision::msb(AbsInt(value))) + 1;
}

BigInt FloorRational(const Rational& value) {
    return FloorDiv(numerator(value), denominator(value));
}

BigInt RoundHalfEven(const Rational& value) {
    const BigInt floor = FloorRational(value);
    const Rational diff = value - Rational(floor);
    const Rational half(BigInt(1), BigInt(2));
    if (diff > half) {
        return floor + 1;
    }
    if (diff < half) {
        return floor;
    }
    return (floor % 2 == 0) ? floor : BigInt(floor + 1);
}

std::size_t HashBigInt(const BigInt& value) {
    if (value >= std::numeric_limits<long long>::min() && value <= std::numeric_limits<long long>::max()) {
        return std::hash<long long>()(value.convert_to<long long>());
    }
    return std::hash<std::string>()(value.str());
}

bool IsIntegralDouble(double value) {
    return std::isfinite(value) && std::floor(value) == value;
}

// Sign of an infinite float or Decimal; 0 for finite values and NaN.
int InfiniteSign(const Value& value) {
    if (value.Is(ValueKind::kFloat) && std::isinf(value.AsFloat())) {
        return value.AsFloat() > 0 ? 1 : -1;
    }
    if (value.Is(ValueKind::kDecimal) && value.As<DecimalObject>().value.IsInfinite()) {
        return value.As<DecimalObject>().value.negative() ? -1 : 1;
    }
    return 0;
}

bool IsNaNValue(const Value& value) {
    if (value.Is(ValueKind::kFloat)) {
        return std::isnan(value.AsFloat());
    }
    if (value.Is(ValueKind::kDecimal)) {
        return value.As<DecimalObject>().value.IsNaN();
    }
    return false;
}

runtime::Decimal ToDecimal(const Value& value) {
    if (value.Is(ValueKind::kDecimal)) {
        return value.As<DecimalObject>().value;
    }
    return runtime::Decimal::FromInt(ToBigInt(value));
}

Value IntPower(const BigInt& base, const BigInt& exponent) {
    if (exponent < 0) {
        const double a = ToDouble(Value::Int(base));
        if (a == 0.0) {
            throw ZeroDivisionError("0.0 cannot be raised to a negative power");
        }
        return Value::Float(std::pow(a, exponent.convert_to<double>()));
    }
    if (base == 0) {
        return Value::Int(exponent == 0 ? 1 : 0);
    }
    if (base == 1) {
        return Value::Int(1);
    }
    if (base == -1) {
        return Value::Int(exponent % 2 == 0 ? 1 : -1);
    }
    if (exponent > BigInt(kMaxIntBits) ||
        (BitLength(base) - 1) * exponent.convert_to<std::size_t>() > kMaxIntBits) {
        throw OverflowError("integer result too large");
    }
    BigInt result = boost::multiprecision::pow(base, exponent.convert_to<unsigned>());
    CheckIntSize(result);
    return Value::Int(std::move(result));
}

Value FloatPower(double a, double b) {
    if (b == 0.0 || a == 1.0) {
        return Value::Float(1.0);
    }
    if (a == 0.0 && b < 0.0) {
        throw ZeroDivisionError("0.0 cannot be raised to a negative power");
    }
    if (a < 0.0 && std::isfinite(b) && !IsIntegralDouble(b)) {
        return Value::Complex(std::pow(std::complex<double>(a, 0.0), std::complex<double>(b, 0.0)));
    }
    const double result = std::pow(a, b);
    if (std::isinf(result) && std::isfinite(a) && std::isfinite(b)) {
        throw OverflowError("(34, 'Numerical result out of range')");
    }
    return Value::Float(result);
}

Value ComplexPower(std::complex<double> a, std::complex<double> b) {
    if (b == std::complex<double>(0.0, 0.0)) {
        return Value::Complex({1.0, 0.0});
    }
    if (a == std::complex<double>(0.0, 0.0)) {
        if (b.imag() != 0.0 || b.real() < 0.0) {
            throw ZeroDivisionError("0.0 to a negative or complex power");
        }
        return Value::Complex({0.0, 0.0});
    }
    if (b.imag() == 0.0 && IsIntegralDouble(b.real()) && std::fabs(b.real()) <= 100.0) {
        auto n = static_cast<long long>(std::fabs(b.real()));
        std::complex<double> result(1.0, 0.0);
        std::complex<double> square = a;
        while (n > 0) {
            if (n & 1) {
                result *= square;
            }
            square *= square;
            n >>= 1;
        }
        if (b.real() < 0.0) {
            result = std::complex<double>(1.0, 0.0) / result;
        }
        return Value::Complex(result);
    }
    const auto result = std::pow(a, b);
    if (std::isinf(result.real()) || std::isinf(result.imag())) {
        throw OverflowError("complex exponentiation");
    }
    return Value::Complex(result);
}

bool IntBinary(BinaryOperator op, const BigInt& a, const BigInt& b, Value& out) {
    switch (op) {
        case BinaryOperator::kAdd:
            out = Value::Int(a + b);
            return true;
        case BinaryOperator::kSub:
            out = Value::Int(a - b);
            return true;
        case BinaryOperator::kMult: {
            if (a != 0 && b != 0 && BitLength(a) + BitLength(b) > kMaxIntBits + 1) {
                throw OverflowError("integer result too large");
            }
            out = Value::Int(a * b);
            return true;
        }
        case BinaryOperator::kDiv: {
            if (b == 0) {
                throw ZeroDivisionError("division by zero");
            }
            const double result = RationalToDouble(Rational(a, b));
            if (std::isinf(result)) {
                throw OverflowError("integer division result too large for a float");
            }
            out = Value::Float(result);
            return true;
        }
        case BinaryOperator::kFloorDiv:
            if (b == 0) {
                throw ZeroDivisionError("integer division or modulo by zero");
            }
            out = Value::Int(FloorDiv(a, b));
            return true;
        case BinaryOperator::kMod:
            if (b == 0) {
                throw ZeroDivisionError("integer modulo by zero");
            }
            out = Value::Int(FloorMod(a, b));
            return true;
        case BinaryOperator::kPow:
            out = IntPower(a, b);
            return true;
        case BinaryOperator::kLShift: {
            if (b < 0) {
                throw ValueError("negative shift count");
            }
            if (a == 0) {
                out = Value::Int(0);
                return true;
            }
            if (b > BigInt(kMaxIntBits) || BitLength(a) + b.convert_to<std::size_t>() > kMaxIntBits) {
                throw OverflowError("integer result too large");
            }
            out = Value::Int(BigInt(a << b.convert_to<unsigned>()));
            return true;
        }
        case BinaryOperator::kRShift: {
            if (b < 0) {
                throw ValueError("negative shift count");
            }
            if (b > BigInt(BitLength(a))) {
                out = Value::Int(a < 0 ? -1 : 0);
                return true;
            }
            const auto shift = b.convert_to<unsigned>();
            if (a >= 0) {
                out = Value::Int(BigInt(a >> shift));
            } else {
                const BigInt magnitude = -a - 1;
                out = Value::Int(BigInt(-(magnitude >> shift) - 1));
            }
            return true;
        }
        case BinaryOperator::kBitAnd:
            out = Value::Int(BigInt(a & b));
            return true;
        case BinaryOperator::kBitOr:
            out = Value::Int(BigInt(a | b));
            return true;
        case BinaryOperator::kBitXor:
            out = Value::Int(BigInt(a ^ b));
            return true;
        case BinaryOperator::kMatMult:
            return false;
    }
    return false;
}

std::string FractionZero(const Rational& numerator_value) {
    return "Fraction(" + BigInt(numerator(numerator_value)).str() + ", 0)";
}

bool FractionBinary(BinaryOperator op, const Value& left, const Value& right, Value& out) {
    const Rational a = ToRational(left);
    const Rational b = ToRational(right);
    switch (op) {
        case BinaryOperator::kAdd:
            out = Value::Fraction(a + b);
            return true;
        case BinaryOperator::kSub:
            out = Value::Fraction(a - b);
            return true;
        case BinaryOperator::kMult:
            out = Value::Fraction(a * b);
            return true;
        case BinaryOperator::kDiv:
            if (b == 0) {
                throw ZeroDivisionError(FractionZero(a));
            }
            out = Value::Fraction(a / b);
            return true;
        case BinaryOperator::kFloorDiv:
            if (b == 0) {
                throw ZeroDivisionError(FractionZero(a));
            }
            out = Value::Int(FloorRational(a / b));
            return true;
        case BinaryOperator::kMod:
            if (b == 0) {
                throw ZeroDivisionError(FractionZero(a));
            }
            out = Value::Fraction(a - b * Rational(FloorRational(a / b)));
            return true;
        case BinaryOperator::kPow: {
            if (denominator(b) != 1) {
                out = FloatPower(RationalToDouble(a), RationalToDouble(b));
                return true;
            }
            const BigInt n = numerator(b);
            BigInt num = numerator(a);
            BigInt den = denominator(a);
            if (n < 0) {
                if (num == 0) {
                    throw ZeroDivisionError("Fraction(1, 0)");
                }
                std::swap(num, den);
            }
            const BigInt magnitude = AbsInt(n);
            const Value top = IntPower(num, magnitude);
            const Value bottom = IntPower(den, magnitude);
            out = MakeFraction(top.AsInt(), bottom.AsInt());
            return true;
        }
        default:
            return false;
    }
}

bool FloatBinary(BinaryOperator op, double a, double b, Value& out) {
    switch (op) {
        case BinaryOperator::kAdd:
            out = Value::Float(a + b);
            return true;
        case BinaryOperator::kSub:
            out = Value::Float(a - b);
            return true;
        case BinaryOperator::kMult:
            out = Value::Float(a * b);
            return true;
        case BinaryOperator::kDiv:
            if (b == 0.0) {
                throw ZeroDivisionError("float division by zero");
            }
            out = Value::Float(a / b);
            return true;
        case BinaryOperator::kFloorDiv:
            if (b == 0.0) {
                throw ZeroDivisionError("float floor division by zero");
            }
            out = Value::Float(FloatFloorDiv(a, b));
            return true;
        case BinaryOperator::kMod:
            if (b == 0.0) {
                throw ZeroDivisionError("float modulo");
            }
            out = Value::Float(FloatMod(a, b));
            return true;
        case BinaryOperator::kPow:
            out = FloatPower(a, b);
            return true;
        default:
            return false;
    }
}

bool ComplexBinary(BinaryOperator op, std::complex<double> a, std::complex<double> b, Value& out) {
    switch (op) {
        case BinaryOperator::kAdd:
            out = Value::Complex(a + b);
            return true;
        case BinaryOperator::kSub:
            out = Value::Complex(a - b);
            return true;
        case BinaryOperator::kMult:
            out = Value::Complex(a * b);
            return true;
        case BinaryOperator::kDiv:
            if (b == std::complex<double>(0.0, 0.0)) {
                throw ZeroDivisionError("complex division by zero");
            }
            out = Value::Complex(a / b);
            return true;
        case BinaryOperator::kPow:
            out = ComplexPower(a, b);
            return true;
        default:
            return false;
    }
}

bool DecimalBinary(BinaryOperator op, const Value& left, const Value& right, Value& out) {
    const DecimalContext context;
    const runtime::Decimal a = ToDecimal(left);
    const runtime::Decimal b = ToDecimal(right);
    switch (op) {
        case BinaryOperator::kAdd:
            out = Value::Decimal(runtime::Decimal::Add(a, b, context));
            return true;
        case BinaryOperator::kSub:
            out = Value::Decimal(runtime::Decimal::Subtract(a, b, context));
            return true;
        case BinaryOperator::kMult:
            out = Value::Decimal(runtime::Decimal::Multiply(a, b, context));
            return true;
        case BinaryOperator::kDiv:
            out = Value::Decimal(runtime::Decimal::Divide(a, b, context));
            return true;
        case BinaryOperator::kFloorDiv:
            out = Value::Decimal(runtime::Decimal::DivideInteger(a, b, context));
            return true;
        case BinaryOperator::kMod:
            out = Value::Decimal(runtime::Decimal::Remainder(a, b, context));
            return true;
        case BinaryOperator::kPow:
            out = Value::Decimal(runtime::Decimal::Power(a, b, context));
            return true;
        default:
            return false;
    }
}

}  // namespace

bool IsNumber(const Value& value) {
    switch (value.kind()) {
        case ValueKind::kBool:
        case ValueKind::kInt:
        case ValueKind::kFloat:
        case ValueKind::kComplex:
        case ValueKind::kFraction:
        case ValueKind::kDecimal:
            return true;
        default:
            return false;
    }
}

bool IsReal(const Value& value) {
    return IsNumber(value) && !value.Is(ValueKind::kComplex);
}

bool IsIntegral(const Value& value) {
    return value.Is(ValueKind::kInt) || value.Is(ValueKind::kBool);
}

BigInt ToBigInt(const Value& value) {
    if (value.Is(ValueKind::kInt)) {
        return value.AsInt();
    }
    if (value.Is(ValueKind::kBool)) {
        return value.AsBool() ? 1 : 0;
    }
    throw TypeError("'" + TypeName(value) + "' object cannot be interpreted as an integer");
}

long long ToInt64(const Value& value) {
    const BigInt result = ToBigInt(value);
    if (result < std::numeric_limits<long long>::min() || result > std::numeric_limits<long long>::max()) {
        throw OverflowError("Python int too large to convert to C long");
    }
    return result.convert_to<long long>();
}

double ToDouble(const Value& value) {
    switch (value.kind()) {
        case ValueKind::kBool:
            return value.AsBool() ? 1.0 : 0.0;
        case ValueKind::kInt: {
            const auto& number = value.AsInt();
            if (BitLength(number) <= 53) {
                return number.convert_to<double>();
            }
            const double result = std::strtod(number.str().c_str(), nullptr);
            if (std::isinf(result)) {
                throw OverflowError("int too large to convert to float");
            }
            return result;
        }
        case ValueKind::kFloat:
            return value.AsFloat();
        case ValueKind::kFraction: {
            const double result = RationalToDouble(value.As<FractionObject>().value);
            if (std::isinf(result)) {
                throw OverflowError("integer division result too large for a float");
            }
            return result;
        }
        case ValueKind::kDecimal:
            return value.As<DecimalObject>().value.ToDouble();
        default:
            throw TypeError("must be real number, not " + TypeName(value));
    }
}

std::complex<double> ToComplex(const Value& value) {
    if (value.Is(ValueKind::kComplex)) {
        return value.AsComplex();
    }
    if (!IsNumber(value)) {
        throw TypeError("must be real number, not " + TypeName(value));
    }
    return {ToDouble(value), 0.0};
}

Rational ToRational(const Value& value) {
    switch (value.kind()) {
        case ValueKind::kBool:
        case ValueKind::kInt:
            return Rational(ToBigInt(value));
        case ValueKind::kFraction:
            return value.As<FractionObject>().value;
        case ValueKind::kFloat: {
            const double number = value.AsFloat();
            if (std::isnan(number)) {
                throw ValueError("cannot convert NaN to integer ratio");
            }
            if (std::isinf(number)) {
                throw OverflowError("cannot convert Infinity to integer ratio");
            }
            return RationalFromDouble(number);
        }
        case ValueKind::kDecimal: {
            BigInt num;
            BigInt den;
            value.As<DecimalObject>().value.ToFraction(num, den);
            return Rational(num, den);
        }
        default:
            throw TypeError("must be real number, not " + TypeName(value));
    }
}

Rational RationalFromDouble(double value) {
    if (value == 0.0) {
        return Rational(0);
    }
    int exponent = 0;
    const double mantissa = std::frexp(std::fabs(value), &exponent);
    const auto scaled = static_cast<long long>(std::ldexp(mantissa, 53));
    exponent -= 53;
    BigInt num = scaled;
    Rational result;
    if (exponent >= 0) {
        result = Rational(BigInt(num << exponent));
    } else {
        result = Rational(num, BigInt(BigInt(1) << -exponent));
    }
    return value < 0 ? Rational(-result) : result;
}

double RationalToDouble(const Rational& value) {
    BigInt num = numerator(value);
    const BigInt den = denominator(value);
    if (num == 0) {
        return 0.0;
    }
    const bool negative = num < 0;
    if (negative) {
        num = -num;
    }
    const long long e = static_cast<long long>(boost::multiprecision::msb(num)) -
        static_cast<long long>(boost::multiprecision::msb(den));
    const long long shift = 55 - e;
    BigInt quotient;
    BigInt rest;
    if (shift >= 0) {
        const BigInt scaled = num << static_cast<unsigned>(shift);
        quotient = scaled / den;
        rest = scaled % den;
    } else {
        const BigInt scaled = den << static_cast<unsigned>(-shift);
        quotient = num / scaled;
        rest = num % scaled;
    }
    // One extra sticky bit keeps the final conversion correctly rounded.
    quotient <<= 1;
    if (rest != 0) {
        quotient |= 1;
    }
    const double result = std::ldexp(quotient.convert_to<unsigned long long>() * 1.0, static_cast<int>(-shift - 1));
    return negative ? -result : result;
}

Value MakeFraction(const BigInt& numerator_value, const BigInt& denominator_value) {
    if (denominator_value == 0) {
        throw ZeroDivisionError("Fraction(" + numerator_value.str() + ", 0)");
    }
    return Value::Fraction(Rational(numerator_value, denominator_value));
}

BigInt FloorDiv(const BigInt& a, const BigInt& b) {
    BigInt quotient = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --quotient;
    }
    return quotient;
}

BigInt FloorMod(const BigInt& a, const BigInt& b) {
    BigInt rest = a % b;
    if (rest != 0 && ((rest < 0) != (b < 0))) {
        rest += b;
    }
    return rest;
}

void CheckIntSize(const BigInt& value) {
    if (BitLength(value) > kMaxIntBits) {
        throw OverflowError("integer result too large");
    }
}

bool NumericBinary(BinaryOperator op, const Value& a, const Value& b, Value& out) {
    if (!IsNumber(a) || !IsNumber(b) || op == BinaryOperator::kMatMult) {
        return false;
    }
    const Rank left = RankOf(a);
    const Rank right = RankOf(b);

    if (left == Rank::kDecimal || right == Rank::kDecimal) {
        const bool left_ok = left == Rank::kDecimal || left == Rank::kInt;
        const bool right_ok = right == Rank::kDecimal || right == Rank::kInt;
        if (!left_ok || !right_ok) {
            return false;
        }
        return DecimalBinary(op, a, b, out);
    }

    const bool bitwise = op == BinaryOperator::kBitAnd || op == BinaryOperator::kBitOr ||
        op == BinaryOperator::kBitXor || op == BinaryOperator::kLShift || op == BinaryOperator::kRShift;
    if (bitwise) {
        if (left != Rank::kInt || right != Rank::kInt) {
            return false;
        }
        if (a.Is(ValueKind::kBool) && b.Is(ValueKind::kBool) && op != BinaryOperator::kLShift &&
            op != BinaryOperator::kRShift) {
            const bool x = a.AsBool();
            const bool y = b.AsBool();
            out = Value::Bool(op == BinaryOperator::kBitAnd ? (x && y) : op == BinaryOperator::kBitOr ? (x || y) : (x != y));
            return true;
        }
        return IntBinary(op, ToBigInt(a), ToBigInt(b), out);
    }

    const Rank rank = left > right ? left : right;
    switch (rank) {
        case Rank::kInt:
            return IntBinary(op, ToBigInt(a), ToBigInt(b), out);
        case Rank::kFraction:
            return FractionBinary(op, a, b, out);
        case Rank::kFloat:
            return FloatBinary(op, ToDouble(a), ToDouble(b), out);
        case Rank::kComplex:
            return ComplexBinary(op, ToComplex(a), ToComplex(b), out);
        case Rank::kDecimal:
            break;
    }
    return false;
}

Value NumericNegate(const Value& value) {
    switch (value.kind()) {
        case ValueKind::kBool:
        case ValueKind::kInt:
            return Value::Int(BigInt(-ToBigInt(value)));
        case ValueKind::kFloat:
            return Value::Float(-value.AsFloat());
        case ValueKind::kComplex:
            return Value::Complex(-value.AsComplex());
        case ValueKind::kFraction:
            return Value::Fraction(-value.As<FractionObject>().value);
        case ValueKind::kDecimal:
            return Value::Decimal(value.As<DecimalObject>().value.Negate().Plus(DecimalContext{}));
        default:
            throw TypeError("bad operand type for unary -: '" + TypeName(value) + "'");
    }
}

Value NumericAbs(const Value& value) {
    switch (value.kind()) {
        case ValueKind::kBool:
        case ValueKind::kInt:
            return Value::Int(AbsInt(ToBigInt(value)));
        case ValueKind::kFloat:
            return Value::Float(std::fabs(value.AsFloat()));
        case ValueKind::kComplex: {
            const double result = std::abs(value.AsComplex());
            if (std::isinf(result) && std::isfinite(value.AsComplex().real()) &&
                std::isfinite(value.AsComplex().imag())) {
                throw OverflowError("absolute value too large");
            }
            return Value::Float(result);
        }
        case ValueKind::kFraction:
            return Value::Fraction(abs(value.As<FractionObject>().value));
        case ValueKind::kDecimal:
            return Value::Decimal(value.As<DecimalObject>().value.Abs().Plus(DecimalContext{}));
        default:
            throw TypeError("bad operand type for abs(): '" + TypeName(value) + "'");
    }
}

int CompareReals(const Value& a, const Value& b) {
    if (IsNaNValue(a) || IsNaNValue(b)) {
        return 2;
    }
    if (IsIntegral(a) && IsIntegral(b)) {
        const BigInt x = ToBigInt(a);
        const BigInt y = ToBigInt(b);
        return x < y ? -1 : (x > y ? 1 : 0);
    }
    if (a.Is(ValueKind::kFloat) && b.Is(ValueKind::kFloat)) {
        const double x = a.AsFloat();
        const double y = b.AsFloat();
        return x < y ? -1 : (x > y ? 1 : 0);
    }
    if (a.Is(ValueKind::kDecimal) && b.Is(ValueKind::kDecimal)) {
        return runtime::Decimal::Compare(a.As<DecimalObject>().value, b.As<DecimalObject>().value);
    }
    const int inf_a = InfiniteSign(a);
    const int inf_b = InfiniteSign(b);
    if (inf_a != 0 || inf_b != 0) {
        return inf_a == inf_b ? 0 : (inf_a < inf_b ? -1 : 1);
    }
    const Rational x = ToRational(a);
    const Rational y = ToRational(b);
    return x < y ? -1 : (x > y ? 1 : 0);
}

bool NumbersEqual(const Value& a, const Value& b) {
    if (a.Is(ValueKind::kComplex) && b.Is(ValueKind::kComplex)) {
        return a.AsComplex() == b.AsComplex();
    }
    if (a.Is(ValueKind::kComplex) || b.Is(ValueKind::kComplex)) {
        const Value& complex = a.Is(ValueKind::kComplex) ? a : b;
        const Value& other = a.Is(ValueKind::kComplex) ? b : a;
        return complex.AsComplex().imag() == 0.0 &&
            CompareReals(Value::Float(complex.AsComplex().real()), other) == 0;
    }
    return CompareReals(a, b) == 0;
}

std::size_t HashNumber(const Value& value) {
    switch (value.kind()) {
        case ValueKind::kBool:
        case ValueKind::kInt:
            return HashBigInt(ToBigInt(value));
        case ValueKind::kFloat: {
            const double number = value.AsFloat();
            if (std::isnan(number)) {
                return 0x7ff8;
            }
            if (IsIntegralDouble(number)) {
                return HashBigInt(numerator(RationalFromDouble(number)));
            }
            return std::hash<double>()(number);
        }
        case ValueKind::kComplex: {
            const auto number = value.AsComplex();
            if (number.imag() == 0.0) {
                return HashNumber(Value::Float(number.real()));
            }
            return std::hash<double>()(number.real()) ^ (std::hash<double>()(number.imag()) * 1000003ULL);
        }
        case ValueKind::kFraction: {
            const auto& fraction = value.As<FractionObject>().value;
            if (denominator(fraction) == 1) {
                return HashBigInt(numerator(fraction));
            }
            return std::hash<double>()(RationalToDouble(fraction));
        }
        case ValueKind::kDecimal: {
            const auto& number = value.As<DecimalObject>().value;
            if (number.IsNaN()) {
                return 0x7ff8;
            }
            if (number.IsFinite() && number.Adjusted() < 10000 && number.exponent() > -10000) {
                const Rational exact = ToRational(value);
                if (denominator(exact) == 1) {
                    return HashBigInt(numerator(exact));
                }
            }
            return std::hash<double>()(number.ToDouble());
        }
        default:
            return 0;
    }
}

Value RoundNumber(const Value& value, const Value* ndigits) {
    const bool with_digits = ndigits && !ndigits->IsNone();
    switch (value.kind()) {
        case ValueKind::kBool:
        case ValueKind::kInt: {
            const BigInt number = ToBigInt(value);
            if (!with_digits) {
                return Value::Int(number);
            }
            const long long digits = ToInt64(*ndigits);
            if (digits >= 0) {
                return Value::Int(number);
            }
            if (-digits > static_cast<long long>(kMaxIntBits)) {
                return Value::Int(0);
            }
            const BigInt scale = boost::multiprecision::pow(BigInt(10), static_cast<unsigned>(-digits));
            return Value::Int(BigInt(RoundHalfEven(Rational(number, scale)) * scale));
        }
        case ValueKind::kFloat: {
            const double number = value.AsFloat();
            if (!with_digits) {
                if (std::isnan(number)) {
                    throw ValueError("cannot convert float NaN to integer");
                }
                if (std::isinf(number)) {
                    throw OverflowError("cannot convert float infinity to integer");
                }
                return Value::Int(numerator(RationalFromDouble(std::nearbyint(number))));
            }
            const long long digits = ToInt64(*ndigits);
            if (!std::isfinite(number) || number == 0.0 || digits > 330) {
                return Value::Float(number);
            }
            if (digits >= 0) {
                char buffer[768];
                std::snprintf(buffer, sizeof(buffer), "%.*f", static_cast<int>(digits), number);
                return Value::Float(std::strtod(buffer, nullptr));
            }
            if (digits < -330) {
                return Value::Float(std::copysign(0.0, number));
            }
            const BigInt scale = boost::multiprecision::pow(BigInt(10), static_cast<unsigned>(-digits));
            const BigInt rounded = RoundHalfEven(RationalFromDouble(number) / Rational(scale)) * scale;
            const double result = ToDouble(Value::Int(rounded));
            return Value::Float(result == 0.0 ? std::copysign(0.0, number) : result);
        }
        case ValueKind::kFraction: {
            const auto& fraction = value.As<FractionObject>().value;
            if (!with_digits) {
                return Value::Int(RoundHalfEven(fraction));
            }
            const long long digits = ToInt64(*ndigits);
            const BigInt scale = boost::multiprecision::pow(BigInt(10), static_cast<unsigned>(digits >= 0 ? digits : -digits));
            if (digits >= 0) {
                return MakeFraction(RoundHalfEven(fraction * Rational(scale)), scale);
            }
            return Value::Fraction(Rational(BigInt(RoundHalfEven(fraction / Rational(scale)) * scale)));
        }
        case ValueKind::kDecimal: {
            const auto& number = value.As<DecimalObject>().value;
            if (!with_digits) {
                if (number.IsNaN()) {
                    throw ValueError("cannot round a NaN");
                }
                if (number.IsInfinite()) {
                    throw OverflowError("cannot round an infinity");
                }
                return Value::Int(number.ToIntegral(Rounding::kHalfEven).ToInteger());
            }
            const long long digits = ToInt64(*ndigits);
            const auto exponent = runtime::Decimal::FromParts(false, 1, -digits);
            return Value::Decimal(number.Quantize(exponent, Rounding::kHalfEven, DecimalContext{}));
        }
        default:
            throw TypeError("type " + TypeName(value) + " doesn't define __round__ method");
    }
}

double FloatFloorDiv(double a, double b) {
    const double mod = FloatMod(a, b);
    const double div = (a - mod) / b;
    if (div == 0.0) {
        return std::copysign(0.0, a / b);
    }
    double floor = std::floor(div);
    if (div - floor > 0.5) {
        floor += 1.0;
    }
    return floor;
}

double FloatMod(double a, double b) {
    double mod = std::fmod(a, b);
    if (mod != 0.0) {
        if ((b < 0.0) != (mod < 0.0)) {
            mod += b;
        }
    } else {
        mod = std::copysign(0.0, b);
    }
    return mod;
}

}  // namespace mathguard::runtime
