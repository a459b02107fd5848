#include <boost/multiprecision/integer.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

#include "runtime/interpreter.hpp"
#include "runtime/modules/module_support.hpp"

namespace mathguard::runtime::modules {
namespace {

constexpr double kPi = 3.141592653589793;
constexpr double kE = 2.718281828459045;

// Maps an IEEE result back to Python's errors: NaN from non-NaN input is a
// domain error, infinity from finite input a range error.
double Checked(double input, double result, bool overflow_is_range = true) {
    if (std::isnan(result) && !std::isnan(input)) {
        throw DomainError();
    }
    if (std::isinf(result) && std::isfinite(input)) {
        if (overflow_is_range) {
            throw RangeError();
        }
        throw DomainError();
    }
    return result;
}

using UnaryDouble = double (*)(double);

void DefineUnary(MemberTable& table, const std::string& name, UnaryDouble fn, bool overflow_is_range = true) {
    Define(table, name, [name, fn, overflow_is_range](Interpreter&, CallArgs& args) {
        ExpectCount(name, args, 1, 1);
        const double x = RealArg(args.positional[0]);
        return Value::Float(Checked(x, fn(x), overflow_is_range));
    });
}

BigInt IntegerArg(const Value& value) {
    if (!IsIntegral(value)) {
        throw TypeError("'" + TypeName(value) + "' object cannot be interpreted as an integer");
    }
    return ToBigInt(value);
}

// Natural log that also handles ints beyond the double range.
double Log(const Value& value) {
    if (IsIntegral(value)) {
        const BigInt n = ToBigInt(value);
        if (n <= 0) {
            throw DomainError();
        }
        const std::size_t bits = boost::multiprecision::msb(n) + 1;
        if (bits > 1000) {
            const std::size_t shift = bits - 64;
            const double mantissa = BigInt(n >> shift).convert_to<double>();
            return std::log(mantissa) + static_cast<double>(shift) * std::log(2.0);
        }
    }
    const double x = RealArg(value);
    if (std::isnan(x)) {
        return x;
    }
    if (x <= 0.0) {
        throw DomainError();
    }
    return std::log(x);
}

Value ToIntegral(const Value& value, bool ceiling) {
    switch (value.kind()) {
        case ValueKind::kBool:
        case ValueKind::kInt:
            return Value::Int(ToBigInt(value));
        case ValueKind::kFraction: {
            const Rational& exact = value.As<FractionObject>().value;
            BigInt quotient = FloorDiv(numerator(exact), denominator(exact));
            if (ceiling && quotient * denominator(exact) != numerator(exact)) {
                quotient += 1;
            }
            return Value::Int(std::move(quotient));
        }
        case ValueKind::kDecimal: {
            const auto& decimal = value.As<DecimalObject>().value;
            return ToIntValue(Value::Decimal(decimal.ToIntegral(ceiling ? Rounding::kCeiling : Rounding::kFloor)));
        }
        default: {
            const double x = RealArg(value);
            return ToIntValue(Value::Float(ceiling ? std::ceil(x) : std::floor(x)));
        }
    }
}

double PythonPow(double x, double y) {
    if (x == 0.0 && y < 0.0 && std::isfinite(y)) {
        throw DomainError();
    }
    if (x < 0.0 && std::isfinite(x) && std::isfinite(y) && std::floor(y) != y) {
        throw DomainError();
    }
    const double result = std::pow(x, y);
    if (std::isinf(result) && std::isfinite(x) && std::isfinite(y)) {
        throw RangeError();
    }
    return result;
}

double Gamma(double x) {
    if (std::isnan(x)) {
        return x;
    }
    if (x == -HUGE_VAL || (x <= 0.0 && std::floor(x) == x)) {
        throw DomainError();
    }
    if (x == HUGE_VAL) {
        return x;
    }
    return Checked(x, std::tgamma(x));
}

double LogGamma(double x) {
    if (std::isnan(x)) {
        return x;
    }
    if (std::isinf(x)) {
        return HUGE_VAL;
    }
    if (x <= 0.0 && std::floor(x) == x) {
        throw DomainError();
    }
    return std::lgamma(x);
}

Value ExactSum(Interpreter& interp, const Value& iterable) {
    Rational total = 0;
    double special = 0.0;
    bool has_special = false;
    interp.ForEach(iterable, [&](const Value& item) {
        const double x = RealArg(item);
        if (!std::isfinite(x)) {
            special += x;
            has_special = true;
            return;
        }
        total += item.Is(ValueKind::kFloat) ? RationalFromDouble(x) : ToRational(item);
    });
    if (has_special) {
        if (std::isnan(special)) {
            throw ValueError("-inf + inf in fsum");
        }
        return Value::Float(special);
    }
    const double result = RationalToDouble(total);
    if (std::isinf(result)) {
        throw OverflowError("intermediate overflow in fsum");
    }
    return Value::Float(result);
}

BigInt FallingProduct(Interpreter& interp, const BigInt& n, const BigInt& k) {
    BigInt result = 1;
    for (BigInt i = 0; i < k; ++i) {
        interp.Step();
        result *= n - i;
        CheckIntSize(result);
    }
    return result;
}

double Isclose(double a, double b, double rel_tol, double abs_tol) {
    if (rel_tol < 0.0 || abs_tol < 0.0) {
        throw ValueError("tolerances must be non-negative");
    }
    if (a == b) {
        return 1.0;
    }
    if (std::isinf(a) || std::isinf(b)) {
        return 0.0;
    }
    const double diff = std::fabs(b - a);
    return (diff <= std::fabs(rel_tol * b) || diff <= std::fabs(rel_tol * a) || diff <= abs_tol) ? 1.0 : 0.0;
}

double Hypot(const std::vector<double>& coordinates) {
    double max = 0.0;
    bool has_nan = false;
    for (double x : coordinates) {
        if (std::isinf(x)) {
            return HUGE_VAL;
        }
        has_nan = has_nan || std::isnan(x);
        max = std::max(max, std::fabs(x));
    }
    if (has_nan) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    if (max == 0.0) {
        return 0.0;
    }
    double sum = 0.0;
    for (double x : coordinates) {
        const double scaled = x / max;
        sum += scaled * scaled;
    }
    return max * std::sqrt(sum);
}

}  // namespace

MemberTable MathMembers() {
    MemberTable table;
    table["pi"] = Value::Float(kPi);
    table["e"] = Value::Float(kE);
    table["tau"] = Value::Float(2.0 * kPi);
    table["inf"] = Value::Float(HUGE_VAL);
    table["nan"] = Value::Float(std::numeric_limits<double>::quiet_NaN());

    DefineUnary(table, "sqrt", [](double x) { return std::sqrt(x); });
    DefineUnary(table, "cbrt", [](double x) { return std::cbrt(x); });
    DefineUnary(table, "exp", [](double x) { return std::exp(x); });
    DefineUnary(table, "exp2", [](double x) { return std::exp2(x); });
    DefineUnary(table, "expm1", [](double x) { return std::expm1(x); });
    DefineUnary(table, "log1p", [](double x) { return x <= -1.0 ? std::nan("") : std::log1p(x); });
    DefineUnary(table, "sin", [](double x) { return std::sin(x); });
    DefineUnary(table, "cos", [](double x) { return std::cos(x); });
    DefineUnary(table, "tan", [](double x) { return std::tan(x); });
    DefineUnary(table, "asin", [](double x) { return std::asin(x); });
    DefineUnary(table, "acos", [](double x) { return std::acos(x); });
    DefineUnary(table, "atan", [](double x) { return std::atan(x); });
    DefineUnary(table, "sinh", [](double x) { return std::sinh(x); });
    DefineUnary(table, "cosh", [](double x) { return std::cosh(x); });
    DefineUnary(table, "tanh", [](double x) { return std::tanh(x); });
    DefineUnary(table, "asinh", [](double x) { return std::asinh(x); });
    DefineUnary(table, "acosh", [](double x) { return std::acosh(x); });
    DefineUnary(table, "atanh", [](double x) { return std::atanh(x); }, false);
    DefineUnary(table, "degrees", [](double x) { return x * (180.0 / kPi); });
    DefineUnary(table, "radians", [](double x) { return x * (kPi / 180.0); });
    DefineUnary(table, "fabs", [](double x) { return std::fabs(x); });
    DefineUnary(table, "erf", [](double x) { return std::erf(x); });
    DefineUnary(table, "erfc", [](double x) { return std::erfc(x); });
    DefineUnary(table, "gamma", Gamma);
    DefineUnary(table, "lgamma", LogGamma);

    Define(table, "isqrt", [](Interpreter&, CallArgs& args) {
        ExpectCount("isqrt", args, 1, 1);
        const BigInt n = IntegerArg(args.positional[0]);
        if (n < 0) {
            throw ValueError("isqrt() argument must be nonnegative");
        }
        return Value::Int(BigInt(boost::multiprecision::sqrt(n)));
    });
    Define(table, "pow", [](Interpreter&, CallArgs& args) {
        ExpectCount("pow", args, 2, 2);
        return Value::Float(PythonPow(RealArg(args.positional[0]), RealArg(args.positional[1])));
    });
    Define(table, "log", [](Interpreter&, CallArgs& args) {
        ExpectCount("log", args, 1, 2);
        const double value = Log(args.positional[0]);
        if (args.positional.size() == 1) {
            return Value::Float(value);
        }
        const double base = Log(args.positional[1]);
        if (base == 0.0) {
            throw ZeroDivisionError("float division by zero");
        }
        return Value::Float(value / base);
    });
    Define(table, "log2", [](Interpreter&, CallArgs& args) {
        ExpectCount("log2", args, 1, 1);
        const Value& x = args.positional[0];
        if (x.Is(ValueKind::kFloat) && x.AsFloat() > 0.0) {
            return Value::Float(std::log2(x.AsFloat()));
        }
        return Value::Float(Log(x) / std::log(2.0));
    });
    Define(table, "log10", [](Interpreter&, CallArgs& args) {
        ExpectCount("log10", args, 1, 1);
        const Value& x = args.positional[0];
        if (!IsIntegral(x) || ToBigInt(x) < BigInt(1) << 1000) {
            const double value = RealArg(x);
            if (value <= 0.0) {
                throw DomainError();
            }
            return Value::Float(std::log10(value));
        }
        return Value::Float(Log(x) / std::log(10.0));
    });
    Define(table, "atan2", [](Interpreter&, CallArgs& args) {
        ExpectCount("atan2", args, 2, 2);
        return Value::Float(std::atan2(RealArg(args.positional[0]), RealArg(args.positional[1])));
    });
    Define(table, "hypot", [](Interpreter&, CallArgs& args) {
        NoKeywords("hypot", args);
        std::vector<double> coordinates;
        for (const auto& value : args.positional) {
            coordinates.push_back(RealArg(value));
        }
        return Value::Float(Hypot(coordinates));
    });
    Define(table, "dist", [](Interpreter& interp, CallArgs& args) {
        ExpectCount("dist", args, 2, 2);
        const std::vector<Value> p = interp.Collect(args.positional[0]);
        const std::vector<Value> q = interp.Collect(args.positional[1]);
        if (p.size() != q.size()) {
            throw ValueError("both points must have the same number of dimensions");
        }
        std::vector<double> deltas;
        for (std::size_t i = 0; i < p.size(); ++i) {
            deltas.push_back(RealArg(p[i]) - RealArg(q[i]));
        }
        return Value::Float(Hypot(deltas));
    });
    Define(table, "floor", [](Interpreter&, CallArgs& args) {
        ExpectCount("floor", args, 1, 1);
        return ToIntegral(args.positional[0], false);
    });
    Define(table, "ceil", [](Interpreter&, CallArgs& args) {
        ExpectCount("ceil", args, 1, 1);
        return ToIntegral(args.positional[0], true);
    });
    Define(table, "trunc", [](Interpreter&, CallArgs& args) {
        ExpectCount("trunc", args, 1, 1);
        if (!IsReal(args.positional[0])) {
            throw TypeError("type " + TypeName(args.positional[0]) + " doesn't define __trunc__ method");
        }
        return ToIntValue(args.positional[0]);
    });
    Define(table, "copysign", [](Interpreter&, CallArgs& args) {
        ExpectCount("copysign", args, 2, 2);
        return Value::Float(std::copysign(RealArg(args.positional[0]), RealArg(args.positional[1])));
    });
    Define(table, "fmod", [](Interpreter&, CallArgs& args) {
        ExpectCount("fmod", args, 2, 2);
        const double x = RealArg(args.positional[0]);
        const double y = RealArg(args.positional[1]);
        if (std::isnan(x) || std::isnan(y)) {
            return Value::Float(std::nan(""));
        }
        if (std::isinf(x) || y == 0.0) {
            throw DomainError();
        }
        return Value::Float(std::fmod(x, y));
    });
    Define(table, "remainder", [](Interpreter&, CallArgs& args) {
        ExpectCount("remainder", args, 2, 2);
        const double x = RealArg(args.positional[0]);
        const double y = RealArg(args.positional[1]);
        if (std::isnan(x) || std::isnan(y)) {
            return Value::Float(std::nan(""));
        }
        if (std::isinf(x) || y == 0.0) {
            throw DomainError();
        }
        return Value::Float(std::remainder(x, y));
    });
    Define(table, "modf", [](Interpreter&, CallArgs& args) {
        ExpectCount("modf", args, 1, 1);
        const double x = RealArg(args.positional[0]);
        if (std::isinf(x)) {
            return Value::Tuple({Value::Float(std::copysign(0.0, x)), Value::Float(x)});
        }
        double integral = 0.0;
        const double fraction = std::modf(x, &integral);
        return Value::Tuple({Value::Float(fraction), Value::Float(integral)});
    });
    Define(table, "frexp", [](Interpreter&, CallArgs& args) {
        ExpectCount("frexp", args, 1, 1);
        const double x = RealArg(args.positional[0]);
        if (!std::isfinite(x) || x == 0.0) {
            return Value::Tuple({Value::Float(x), Value::Int(0LL)});
        }
        int exponent = 0;
        const double mantissa = std::frexp(x, &exponent);
        return Value::Tuple({Value::Float(mantissa), Value::Int(static_cast<long long>(exponent))});
    });
    Define(table, "ldexp", [](Interpreter&, CallArgs& args) {
        ExpectCount("ldexp", args, 2, 2);
        const double x = RealArg(args.positional[0]);
        const BigInt exponent = IntegerArg(args.positional[1]);
        if (x == 0.0 || !std::isfinite(x)) {
            return Value::Float(x);
        }
        if (exponent > 100000) {
            throw RangeError();
        }
        if (exponent < -100000) {
            return Value::Float(std::copysign(0.0, x));
        }
        const double result = std::ldexp(x, exponent.convert_to<int>());
        if (std::isinf(result)) {
            throw RangeError();
        }
        return Value::Float(result);
    });
    Define(table, "factorial", [](Interpreter& interp, CallArgs& args) {
        ExpectCount("factorial", args, 1, 1);
        const BigInt n = IntegerArg(args.positional[0]);
        if (n < 0) {
            throw ValueError("factorial() not defined for negative values");
        }
        return Value::Int(FallingProduct(interp, n, n));
    });
    Define(table, "gcd", [](Interpreter&, CallArgs& args) {
        NoKeywords("gcd", args);
        BigInt result = 0;
        for (const auto& value : args.positional) {
            result = boost::multiprecision::gcd(result, IntegerArg(value));
        }
        return Value::Int(result < 0 ? BigInt(-result) : result);
    });
    Define(table, "lcm", [](Interpreter&, CallArgs& args) {
        NoKeywords("lcm", args);
        BigInt result = 1;
        for (const auto& value : args.positional) {
            const BigInt n = IntegerArg(value);
            if (n == 0 || result == 0) {
                result = 0;
                continue;
            }
            result = boost::multiprecision::lcm(result, n);
            CheckIntSize(result);
        }
        return Value::Int(result < 0 ? BigInt(-result) : result);
    });
    Define(table, "comb", [](Interpreter& interp, CallArgs& args) {
        ExpectCount("comb", args, 2, 2);
        const BigInt n = IntegerArg(args.positional[0]);
        BigInt k = IntegerArg(args.positional[1]);
        if (n < 0) {
            throw ValueError("n must be a non-negative integer");
        }
        if (k < 0) {
            throw ValueError("k must be a non-negative integer");
        }
        if (k > n) {
            return Value::Int(0LL);
        }
        if (n - k < k) {
            k = n - k;
        }
        BigInt result = 1;
        for (BigInt i = 1; i <= k; ++i) {
            interp.Step();
            result = result * (n - k + i) / i;
            CheckIntSize(result);
        }
        return Value::Int(std::move(result));
    });
    Define(table, "perm", [](Interpreter& interp, CallArgs& args) {
        ExpectCount("perm", args, 1, 2);
        const BigInt n = IntegerArg(args.positional[0]);
        if (n < 0) {
            throw ValueError("n must be a non-negative integer");
        }
        const bool has_k = args.positional.size() > 1 && !args.positional[1].IsNone();
        const BigInt k = has_k ? IntegerArg(args.positional[1]) : n;
        if (k < 0) {
            throw ValueError("k must be a non-negative integer");
        }
        if (k > n) {
            return Value::Int(0LL);
        }
        return Value::Int(FallingProduct(interp, n, k));
    });
    Define(table, "fsum", [](Interpreter& interp, CallArgs& args) {
        ExpectCount("fsum", args, 1, 1);
        return ExactSum(interp, args.positional[0]);
    });
    Define(table, "prod", [](Interpreter& interp, CallArgs& args) {
        ArgReader reader("prod", args, {"iterable", "start"}, 1);
        Value total = reader.Get(1, Value::Int(1LL));
        interp.ForEach(reader.Get(0), [&](const Value& item) {
            total = interp.BinaryOp(lang::BinaryOperator::kMult, total, item);
        });
        return total;
    });
    Define(table, "isclose", [](Interpreter&, CallArgs& args) {
        ArgReader reader("isclose", args, {"a", "b", "rel_tol", "abs_tol"}, 2);
        const double rel_tol = reader.Has(2) ? RealArg(reader.Get(2)) : 1e-09;
        const double abs_tol = reader.Has(3) ? RealArg(reader.Get(3)) : 0.0;
        return Value::Bool(Isclose(RealArg(reader.Get(0)), RealArg(reader.Get(1)), rel_tol, abs_tol) != 0.0);
    });
    Define(table, "isfinite", [](Interpreter&, CallArgs& args) {
        ExpectCount("isfinite", args, 1, 1);
        return Value::Bool(std::isfinite(RealArg(args.positional[0])));
    });
    Define(table, "isinf", [](Interpreter&, CallArgs& args) {
        ExpectCount("isinf", args, 1, 1);
        return Value::Bool(std::isinf(RealArg(args.positional[0])));
    });
    Define(table, "isnan", [](Interpreter&, CallArgs& args) {
        ExpectCount("isnan", args, 1, 1);
        return Value::Bool(std::isnan(RealArg(args.positional[0])));
    });
    return table;
}

}  // namespace mathguard::runtime::modules
