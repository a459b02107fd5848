#include <cctype>
#include <cmath>
#include <string>

#include "runtime/interpreter.hpp"
#include "runtime/modules/module_support.hpp"

namespace mathguard::runtime {
namespace {

bool IsRationalInstance(const Value& value) {
    return IsIntegral(value) || value.Is(ValueKind::kFraction);
}

// Reads a run of digits with single underscores between them.
bool ReadDigits(const std::string& text, std::size_t& pos, std::string& out) {
    const std::size_t start = pos;
    while (pos < text.size()) {
        const char c = text[pos];
        if (std::isdigit(static_cast<unsigned char>(c))) {
            out.push_back(c);
            ++pos;
        } else if (c == '_' && pos > start && pos + 1 < text.size() &&
                   std::isdigit(static_cast<unsigned char>(text[pos + 1]))) {
            ++pos;
        } else {
            break;
        }
    }
    return pos > start;
}

// "[sign]num[/den]" or "[sign]digits[.digits][e[sign]digits]", surrounding
// whitespace allowed.
bool ParseFractionText(const std::string& original, Rational& out) {
    std::size_t begin = 0;
    std::size_t end = original.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(original[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(original[end - 1]))) {
        --end;
    }
    const std::string text = original.substr(begin, end - begin);
    std::size_t pos = 0;
    bool negative = false;
    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        negative = text[pos] == '-';
        ++pos;
    }
    std::string whole;
    const bool has_whole = ReadDigits(text, pos, whole);
    if (has_whole && pos < text.size() && text[pos] == '/') {
        ++pos;
        std::string den;
        if (!ReadDigits(text, pos, den) || pos != text.size()) {
            return false;
        }
        const BigInt denominator_value = ParseDigits(den);
        if (denominator_value == 0) {
            throw ZeroDivisionError("Fraction(" + ParseDigits(whole).str() + ", 0)");
        }
        out = Rational(ParseDigits(whole), denominator_value);
        if (negative) {
            out = -out;
        }
        return true;
    }
    std::string fraction;
    bool has_fraction = false;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        has_fraction = ReadDigits(text, pos, fraction);
    }
    if (!has_whole && !has_fraction) {
        return false;
    }
    long long exponent = 0;
    if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E')) {
        ++pos;
        bool exponent_negative = false;
        if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
            exponent_negative = text[pos] == '-';
            ++pos;
        }
        std::string digits;
        if (!ReadDigits(text, pos, digits) || digits.size() > 9) {
            return false;
        }
        exponent = std::stoll(digits);
        if (exponent_negative) {
            exponent = -exponent;
        }
    }
    if (pos != text.size()) {
        return false;
    }
    const std::string digits = whole + fraction;
    exponent -= static_cast<long long>(fraction.size());
    BigInt value = ParseDigits(digits);
    if (exponent >= 0) {
        value *= Pow10(exponent);
        CheckIntSize(value);
        out = Rational(value);
    } else {
        out = Rational(value, Pow10(-exponent));
    }
    if (negative) {
        out = -out;
    }
    return true;
}

Rational FromFloat(const Value& value) {
    const double number = value.AsFloat();
    if (std::isnan(number)) {
        throw ValueError("cannot convert NaN to integer ratio");
    }
    if (std::isinf(number)) {
        throw OverflowError("cannot convert Infinity to integer ratio");
    }
    return RationalFromDouble(number);
}

Rational FromDecimal(const Value& value) {
    const auto& decimal = value.As<DecimalObject>().value;
    if (decimal.IsNaN()) {
        throw ValueError("cannot convert NaN to integer ratio");
    }
    if (decimal.IsInfinite()) {
        throw OverflowError("cannot convert Infinity to integer ratio");
    }
    return ToRational(value);
}

Rational SingleArgument(const Value& value) {
    switch (value.kind()) {
        case ValueKind::kBool:
        case ValueKind::kInt:
        case ValueKind::kFraction:
            return ToRational(value);
        case ValueKind::kFloat:
            return FromFloat(value);
        case ValueKind::kDecimal:
            return FromDecimal(value);
        case ValueKind::kStr: {
            Rational out;
            if (!ParseFractionText(value.AsStr(), out)) {
                throw ValueError("Invalid literal for Fraction: " + Repr(value));
            }
            return out;
        }
        default:
            throw TypeError("argument should be a string or a Rational instance");
    }
}

Value Construct(Interpreter&, CallArgs& args) {
    ArgReader reader("Fraction", args, {"numerator", "denominator"}, 0);
    if (!reader.Has(0)) {
        return Value::Fraction(Rational(0));
    }
    if (!reader.HasValue(1)) {
        return Value::Fraction(SingleArgument(reader.Get(0)));
    }
    const Value& top = reader.Get(0);
    const Value& bottom = reader.Get(1);
    if (!IsRationalInstance(top) || !IsRationalInstance(bottom)) {
        throw TypeError("both arguments should be Rational instances");
    }
    const Rational a = ToRational(top);
    const Rational b = ToRational(bottom);
    if (b == 0) {
        throw ZeroDivisionError("Fraction(" + numerator(a).str() + ", 0)");
    }
    return Value::Fraction(a / b);
}

}  // namespace

Value FractionType() {
    static const Value type = [] {
        auto object = std::make_shared<TypeObject>();
        object->name = "Fraction";
        object->construct = Construct;
        object->matches = [](const Value& value) { return value.Is(ValueKind::kFraction); };
        object->attributes["from_float"] = MakeBuiltin("from_float", [](Interpreter&, CallArgs& args) {
            ExpectCount("from_float", args, 1, 1);
            const Value& value = args.positional[0];
            if (IsIntegral(value)) {
                return Value::Fraction(ToRational(value));
            }
            if (!value.Is(ValueKind::kFloat)) {
                throw TypeError("Fraction.from_float() only takes floats, not " + Repr(value) + " (" +
                                TypeName(value) + ")");
            }
            return Value::Fraction(FromFloat(value));
        });
        object->attributes["from_decimal"] = MakeBuiltin("from_decimal", [](Interpreter&, CallArgs& args) {
            ExpectCount("from_decimal", args, 1, 1);
            const Value& value = args.positional[0];
            if (IsIntegral(value)) {
                return Value::Fraction(ToRational(value));
            }
            if (!value.Is(ValueKind::kDecimal)) {
                throw TypeError("Fraction.from_decimal() only takes Decimals, not " + Repr(value) + " (" +
                                TypeName(value) + ")");
            }
            return Value::Fraction(FromDecimal(value));
        });
        return Value::FromObject(ValueKind::kType, std::move(object));
    }();
    return type;
}

namespace modules {

MemberTable FractionsMembers() {
    MemberTable table;
    table["Fraction"] = FractionType();
    return table;
}

}  // namespace modules
}  // namespace mathguard::runtime
