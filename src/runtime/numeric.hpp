#pragma once

#include <complex>
#include <cstddef>
#include <string>

#include "lang/ast.hpp"
#include "runtime/value.hpp"

namespace mathguard::runtime {

// Results of ** and << above this many bits raise OverflowError.
constexpr std::size_t kMaxIntBits = 4 * 1000 * 1000;

// bool, int, float, complex, Fraction or Decimal.
bool IsNumber(const Value& value);
// Numbers without an imaginary part.
bool IsReal(const Value& value);
// bool or int.
bool IsIntegral(const Value& value);

// Throws TypeError ("'float' object cannot be interpreted as an integer").
BigInt ToBigInt(const Value& value);
// As ToBigInt, then OverflowError outside the 64-bit range.
long long ToInt64(const Value& value);
// Any real number; OverflowError for ints beyond the double range.
double ToDouble(const Value& value);
std::complex<double> ToComplex(const Value& value);
// Exact value of int, bool, Fraction, finite float or finite Decimal.
Rational ToRational(const Value& value);
// Exact conversion of a finite double.
Rational RationalFromDouble(double value);
double RationalToDouble(const Rational& value);

// Fraction results whose denominator is 1 stay Fractions; callers that want
// an int check themselves.
Value MakeFraction(const BigInt& numerator, const BigInt& denominator);

BigInt FloorDiv(const BigInt& a, const BigInt& b);
BigInt FloorMod(const BigInt& a, const BigInt& b);
// Throws OverflowError above kMaxIntBits.
void CheckIntSize(const BigInt& value);

// Arithmetic between two numbers. Returns false, leaving `out` untouched,
// when either operand is not a number or the pair has no numeric meaning.
bool NumericBinary(lang::BinaryOperator op, const Value& a, const Value& b, Value& out);
Value NumericNegate(const Value& value);
Value NumericAbs(const Value& value);

// -1, 0, 1 for ordered reals; 2 when unordered (NaN involved).
int CompareReals(const Value& a, const Value& b);
bool NumbersEqual(const Value& a, const Value& b);
std::size_t HashNumber(const Value& value);

// round(x[, ndigits]) with half-even ties.
Value RoundNumber(const Value& value, const Value* ndigits);

// Python's float division and floor rules on doubles.
double FloatFloorDiv(double a, double b);
double FloatMod(double a, double b);

}  // namespace mathguard::runtime
