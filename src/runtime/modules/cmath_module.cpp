#include <cmath>
#include <complex>
#include <limits>

#include "runtime/interpreter.hpp"
#include "runtime/modules/module_support.hpp"

namespace mathguard::runtime::modules {
namespace {

using Complex = std::complex<double>;
using ComplexFn = Complex (*)(const Complex&);

Complex ComplexArg(const Value& value) {
    if (!IsNumber(value)) {
        throw TypeError("must be real number, not " + TypeName(value));
    }
    return ToComplex(value);
}

bool IsFinite(const Complex& z) {
    return std::isfinite(z.real()) && std::isfinite(z.imag());
}

Complex Checked(const Complex& input, const Complex& result) {
    if (!IsFinite(input)) {
        return result;
    }
    if (std::isnan(result.real()) || std::isnan(result.imag())) {
        throw DomainError();
    }
    if (std::isinf(result.real()) || std::isinf(result.imag())) {
        throw RangeError();
    }
    return result;
}

void DefineComplex(MemberTable& table, const std::string& name, ComplexFn fn) {
    Define(table, name, [name, fn](Interpreter&, CallArgs& args) {
        ExpectCount(name, args, 1, 1);
        const Complex z = ComplexArg(args.positional[0]);
        return Value::Complex(Checked(z, fn(z)));
    });
}

Complex Log(const Complex& z) {
    if (z == Complex(0.0, 0.0)) {
        throw DomainError();
    }
    return std::log(z);
}

}  // namespace

MemberTable CmathMembers() {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    MemberTable table;
    table["pi"] = Value::Float(3.141592653589793);
    table["e"] = Value::Float(2.718281828459045);
    table["tau"] = Value::Float(6.283185307179586);
    table["inf"] = Value::Float(HUGE_VAL);
    table["nan"] = Value::Float(nan);
    table["infj"] = Value::Complex(Complex(0.0, HUGE_VAL));
    table["nanj"] = Value::Complex(Complex(0.0, nan));

    DefineComplex(table, "sqrt", [](const Complex& z) { return std::sqrt(z); });
    DefineComplex(table, "exp", [](const Complex& z) { return std::exp(z); });
    DefineComplex(table, "sin", [](const Complex& z) { return std::sin(z); });
    DefineComplex(table, "cos", [](const Complex& z) { return std::cos(z); });
    DefineComplex(table, "tan", [](const Complex& z) { return std::tan(z); });
    DefineComplex(table, "asin", [](const Complex& z) { return std::asin(z); });
    DefineComplex(table, "acos", [](const Complex& z) { return std::acos(z); });
    DefineComplex(table, "atan", [](const Complex& z) { return std::atan(z); });
    DefineComplex(table, "sinh", [](const Complex& z) { return std::sinh(z); });
    DefineComplex(table, "cosh", [](const Complex& z) { return std::cosh(z); });
    DefineComplex(table, "tanh", [](const Complex& z) { return std::tanh(z); });
    DefineComplex(table, "asinh", [](const Complex& z) { return std::asinh(z); });
    DefineComplex(table, "acosh", [](const Complex& z) { return std::acosh(z); });
    DefineComplex(table, "atanh", [](const Complex& z) { return std::atanh(z); });
    DefineComplex(table, "log10", [](const Complex& z) { return Log(z) / std::log(10.0); });

    Define(table, "log", [](Interpreter&, CallArgs& args) {
        ExpectCount("log", args, 1, 2);
        const Complex z = ComplexArg(args.positional[0]);
        Complex result = Log(z);
        if (args.positional.size() == 2) {
            const Complex base = Log(ComplexArg(args.positional[1]));
            if (base == Complex(0.0, 0.0)) {
                throw ZeroDivisionError("complex division by zero");
            }
            result /= base;
        }
        return Value::Complex(Checked(z, result));
    });
    Define(table, "phase", [](Interpreter&, CallArgs& args) {
        ExpectCount("phase", args, 1, 1);
        return Value::Float(std::arg(ComplexArg(args.positional[0])));
    });
    Define(table, "polar", [](Interpreter&, CallArgs& args) {
        ExpectCount("polar", args, 1, 1);
        const Complex z = ComplexArg(args.positional[0]);
        const double modulus = std::abs(z);
        if (std::isinf(modulus) && IsFinite(z)) {
            throw RangeError();
        }
        return Value::Tuple({Value::Float(modulus), Value::Float(std::arg(z))});
    });
    Define(table, "rect", [](Interpreter&, CallArgs& args) {
        ExpectCount("rect", args, 2, 2);
        const double r = RealArg(args.positional[0]);
        const double phi = RealArg(args.positional[1]);
        if (std::isinf(phi) && r != 0.0 && !std::isnan(r)) {
            throw DomainError();
        }
        return Value::Complex(std::polar(r, phi));
    });
    Define(table, "isclose", [](Interpreter&, CallArgs& args) {
        ArgReader reader("isclose", args, {"a", "b", "rel_tol", "abs_tol"}, 2);
        const Complex a = ComplexArg(reader.Get(0));
        const Complex b = ComplexArg(reader.Get(1));
        const double rel_tol = reader.Has(2) ? RealArg(reader.Get(2)) : 1e-09;
        const double abs_tol = reader.Has(3) ? RealArg(reader.Get(3)) : 0.0;
        if (rel_tol < 0.0 || abs_tol < 0.0) {
            throw ValueError("tolerances must be non-negative");
        }
        if (a == b) {
            return Value::Bool(true);
        }
        if (!IsFinite(a) || !IsFinite(b)) {
            return Value::Bool(false);
        }
        const double diff = std::abs(b - a);
        return Value::Bool(diff <= rel_tol * std::abs(b) || diff <= rel_tol * std::abs(a) || diff <= abs_tol);
    });
    Define(table, "isfinite", [](Interpreter&, CallArgs& args) {
        ExpectCount("isfinite", args, 1, 1);
        return Value::Bool(IsFinite(ComplexArg(args.positional[0])));
    });
    Define(table, "isinf", [](Interpreter&, CallArgs& args) {
        ExpectCount("isinf", args, 1, 1);
        const Complex z = ComplexArg(args.positional[0]);
        return Value::Bool(std::isinf(z.real()) || std::isinf(z.imag()));
    });
    Define(table, "isnan", [](Interpreter&, CallArgs& args) {
        ExpectCount("isnan", args, 1, 1);
        const Complex z = ComplexArg(args.positional[0]);
        return Value::Bool(std::isnan(z.real()) || std::isnan(z.imag()));
    });
    return table;
}

}  // namespace mathguard::runtime::modules
