#include "runtime/format.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <vector>

#include "runtime/errors.hpp"
#include "runtime/numeric.hpp"
#include "runtime/text.hpp"

namespace mathguard::runtime {
namespace {

struct FormatSpec {
    std::string fill = " ";
    char align = 0;
    char sign = '-';
    bool alternate = false;
    bool zero = false;
    int width = -1;
    char grouping = 0;
    int precision = -1;
    char type = 0;
};

int ParseCount(const std::string& spec, std::size_t& i) {
    long long value = 0;
    while (i < spec.size() && std::isdigit(static_cast<unsigned char>(spec[i]))) {
        value = value * 10 + (spec[i] - '0');
        if (value > 100000) {
            throw ValueError("Too many decimal digits in format string");
        }
        ++i;
    }
    return static_cast<int>(value);
}

bool IsAlign(char c) {
    return c == '<' || c == '>' || c == '=' || c == '^';
}

FormatSpec ParseSpec(const std::string& spec) {
    FormatSpec out;
    std::size_t i = 0;
    // The fill may be a multi-byte character.
    std::size_t fill_length = 1;
    if (!spec.empty()) {
        const auto lead = static_cast<unsigned char>(spec[0]);
        fill_length = lead >= 0xF0 ? 4 : lead >= 0xE0 ? 3 : lead >= 0xC0 ? 2 : 1;
    }
    if (spec.size() > fill_length && IsAlign(spec[fill_length])) {
        out.fill = spec.substr(0, fill_length);
        out.align = spec[fill_length];
        i = fill_length + 1;
    } else if (!spec.empty() && IsAlign(spec[0])) {
        out.align = spec[0];
        i = 1;
    }
    if (i < spec.size() && (spec[i] == '+' || spec[i] == '-' || spec[i] == ' ')) {
        out.sign = spec[i];
        ++i;
    }
    if (i < spec.size() && spec[i] == '#') {
        out.alternate = true;
        ++i;
    }
    if (i < spec.size() && spec[i] == '0') {
        out.zero = true;
        ++i;
    }
    if (i < spec.size() && std::isdigit(static_cast<unsigned char>(spec[i]))) {
        out.width = ParseCount(spec, i);
    }
    if (i < spec.size() && (spec[i] == ',' || spec[i] == '_')) {
        out.grouping = spec[i];
        ++i;
    }
    if (i < spec.size() && spec[i] == '.') {
        ++i;
        if (i >= spec.size() || !std::isdigit(static_cast<unsigned char>(spec[i]))) {
            throw ValueError("Format specifier missing precision");
        }
        out.precision = ParseCount(spec, i);
    }
    if (i < spec.size()) {
        out.type = spec[i];
        ++i;
    }
    if (i != spec.size()) {
        throw ValueError("Invalid format specifier '" + spec + "'");
    }
    if (out.zero && out.align == 0) {
        out.fill = "0";
        out.align = '=';
    }
    return out;
}

std::string Repeat(const std::string& fill, std::size_t count) {
    std::string out;
    out.reserve(fill.size() * count);
    for (std::size_t i = 0; i < count; ++i) {
        out += fill;
    }
    return out;
}

// Pads `prefix + body` to the spec width. `prefix` (sign, 0x) stays in front
// of the padding for '=' alignment.
std::string Pad(const FormatSpec& spec, const std::string& prefix, const std::string& body, char default_align) {
    const std::size_t length = text::Length(prefix) + text::Length(body);
    if (spec.width < 0 || length >= static_cast<std::size_t>(spec.width)) {
        return prefix + body;
    }
    const std::size_t missing = static_cast<std::size_t>(spec.width) - length;
    const char align = spec.align ? spec.align : default_align;
    switch (align) {
        case '<':
            return prefix + body + Repeat(spec.fill, missing);
        case '^':
            return Repeat(spec.fill, missing / 2) + prefix + body + Repeat(spec.fill, missing - missing / 2);
        case '=':
            return prefix + Repeat(spec.fill, missing) + body;
        default:
            return Repeat(spec.fill, missing) + prefix + body;
    }
}

std::string Group(const std::string& digits, char separator, std::size_t every) {
    if (!separator || digits.size() <= every) {
        return digits;
    }
    std::string out;
    const std::size_t head = digits.size() % every;
    for (std::size_t i = 0; i < digits.size(); ++i) {
        if (i > 0 && (i - head) % every == 0 && i >= head) {
            out.push_back(separator);
        }
        out.push_back(digits[i]);
    }
    return out;
}

// Groups the integer part of a formatted number ("1234567.5" -> "1,234,567.5").
std::string GroupIntegerPart(const std::string& body, char separator) {
    if (!separator) {
        return body;
    }
    std::size_t end = 0;
    while (end < body.size() && std::isdigit(static_cast<unsigned char>(body[end]))) {
        ++end;
    }
    return Group(body.substr(0, end), separator, 3) + body.substr(end);
}

std::string SignPrefix(const FormatSpec& spec, bool negative) {
    if (negative) {
        return "-";
    }
    if (spec.sign == '+') {
        return "+";
    }
    if (spec.sign == ' ') {
        return " ";
    }
    return {};
}

std::string Printf(const char* format, int precision, double value) {
    std::vector<char> buffer(static_cast<std::size_t>(precision) + 400);
    const int written = std::snprintf(buffer.data(), buffer.size(), format, precision, value);
    if (written < 0) {
        throw ValueError("format failed");
    }
    if (static_cast<std::size_t>(written) >= buffer.size()) {
        buffer.resize(static_cast<std::size_t>(written) + 1);
        std::snprintf(buffer.data(), buffer.size(), format, precision, value);
    }
    return std::string(buffer.data(), static_cast<std::size_t>(written));
}

std::string Upper(std::string value) {
    for (auto& c : value) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return value;
}

// Formats a non-negative double body for the float presentation types.
std::string FloatBody(double magnitude, const FormatSpec& spec) {
    if (std::isnan(magnitude) || std::isinf(magnitude)) {
        std::string body = std::isnan(magnitude) ? "nan" : "inf";
        if (spec.type == 'E' || spec.type == 'F' || spec.type == 'G') {
            body = Upper(body);
        }
        return spec.type == '%' ? body + "%" : body;
    }
    const int precision = spec.precision < 0 ? 6 : spec.precision;
    switch (spec.type) {
        case 'e':
        case 'E': {
            std::string body = Printf(spec.alternate ? "%#.*e" : "%.*e", precision, magnitude);
            return spec.type == 'E' ? Upper(body) : body;
        }
        case 'f':
        case 'F':
            return Printf(spec.alternate ? "%#.*f" : "%.*f", precision, magnitude);
        case '%':
            return Printf(spec.alternate ? "%#.*f" : "%.*f", precision, magnitude * 100.0) + "%";
        case 'g':
        case 'G':
        case 'n': {
            const int digits = precision == 0 ? 1 : precision;
            std::string body = Printf(spec.alternate ? "%#.*g" : "%.*g", digits, magnitude);
            return spec.type == 'G' ? Upper(body) : body;
        }
        default: {
            if (spec.precision < 0) {
                return FloatRepr(magnitude);
            }
            const int digits = spec.precision == 0 ? 1 : spec.precision;
            std::string body = Printf("%.*g", digits, magnitude);
            if (body.find_first_of(".e") == std::string::npos) {
                body += ".0";
            }
            return body;
        }
    }
}

std::string FormatFloat(double value, const FormatSpec& spec) {
    const bool negative = std::signbit(value) && !std::isnan(value);
    std::string body = FloatBody(std::fabs(value), spec);
    body = GroupIntegerPart(body, spec.grouping);
    return Pad(spec, SignPrefix(spec, negative), body, '>');
}

std::string FormatInt(const BigInt& value, const FormatSpec& spec) {
    if (spec.precision >= 0) {
        throw ValueError("Precision not allowed in integer format specifier");
    }
    const bool negative = value < 0;
    const BigInt magnitude = negative ? BigInt(-value) : value;
    std::string prefix = SignPrefix(spec, negative);
    std::string body;
    switch (spec.type) {
        case 0:
        case 'd':
        case 'n':
            body = Group(magnitude.str(), spec.grouping, 3);
            break;
        case 'b':
        case 'o':
        case 'x':
        case 'X': {
            const unsigned base = spec.type == 'b' ? 2 : spec.type == 'o' ? 8 : 16;
            const char* digits = spec.type == 'X' ? "0123456789ABCDEF" : "0123456789abcdef";
            std::string reversed;
            BigInt rest = magnitude;
            do {
                reversed.push_back(digits[static_cast<unsigned>(rest % base)]);
                rest /= base;
            } while (rest != 0);
            body.assign(reversed.rbegin(), reversed.rend());
            if (spec.grouping == '_') {
                body = Group(body, '_', 4);
            } else if (spec.grouping == ',') {
                throw ValueError("Cannot specify ',' with '" + std::string(1, spec.type) + "'.");
            }
            if (spec.alternate) {
                prefix += spec.type == 'b' ? "0b" : spec.type == 'o' ? "0o" : spec.type == 'x' ? "0x" : "0X";
            }
            break;
        }
        case 'c': {
            if (negative || magnitude > 0x10FFFF) {
                throw OverflowError("%c arg not in range(0x110000)");
            }
            text::AppendUtf8(body, static_cast<char32_t>(magnitude.convert_to<unsigned long>()));
            return Pad(spec, {}, body, '<');
        }
        default:
            throw ValueError(std::string("Unknown format code '") + spec.type + "' for object of type 'int'");
    }
    return Pad(spec, prefix, body, '>');
}

std::string PlainDecimal(const Decimal& value) {
    const std::string digits = value.coefficient().str();
    const long long exponent = value.exponent();
    if (exponent >= 0) {
        return value.IsZero() ? "0" : digits + std::string(static_cast<std::size_t>(exponent), '0');
    }
    const long long point = static_cast<long long>(digits.size()) + exponent;
    if (point > 0) {
        return digits.substr(0, static_cast<std::size_t>(point)) + "." + digits.substr(static_cast<std::size_t>(point));
    }
    return "0." + std::string(static_cast<std::size_t>(-point), '0') + digits;
}

std::string FormatDecimal(const Decimal& value, const FormatSpec& spec) {
    const bool negative = value.negative() && !value.IsNaN();
    const Decimal magnitude = value.Abs();
    std::string body;
    if (!magnitude.IsFinite()) {
        body = magnitude.IsNaN() ? "NaN" : "Infinity";
        if (spec.type == '%') {
            body += "%";
        }
        return Pad(spec, SignPrefix(spec, negative), body, '>');
    }
    switch (spec.type) {
        case 0:
            if (spec.precision < 0) {
                body = magnitude.ToString();
                break;
            }
            [[fallthrough]];
        case 'g':
        case 'G': {
            Decimal rounded = magnitude;
            if (spec.precision >= 0) {
                DecimalContext context;
                context.precision = spec.precision == 0 ? 1 : spec.precision;
                rounded = magnitude.Plus(context);
            }
            const long long adjusted = rounded.Adjusted();
            const long long limit = spec.precision >= 0 ? spec.precision : static_cast<long long>(CountDigits(rounded.coefficient()));
            if (adjusted >= -6 && (rounded.exponent() <= 0 || adjusted < std::max<long long>(limit, 1))) {
                body = PlainDecimal(rounded);
            } else {
                body = rounded.ToString();
                for (auto& c : body) {
                    if (c == 'E') {
                        c = spec.type == 'G' ? 'E' : 'e';
                    }
                }
            }
            break;
        }
        case 'e':
        case 'E': {
            std::string digits;
            long long adjusted = 0;
            if (spec.precision < 0) {
                digits = magnitude.coefficient().str();
                adjusted = magnitude.Adjusted();
            } else {
                DecimalContext context;
                context.precision = spec.precision + 1;
                const Decimal rounded = magnitude.Plus(context);
                digits = rounded.coefficient().str();
                adjusted = rounded.Adjusted();
                if (static_cast<int>(digits.size()) < spec.precision + 1 && !rounded.IsZero()) {
                    digits += std::string(static_cast<std::size_t>(spec.precision + 1) - digits.size(), '0');
                } else if (rounded.IsZero()) {
                    digits = std::string(static_cast<std::size_t>(spec.precision + 1), '0');
                }
            }
            body = digits.substr(0, 1);
            if (digits.size() > 1 || spec.alternate) {
                body += "." + digits.substr(1);
            }
            body += spec.type == 'E' ? "E" : "e";
            body += adjusted < 0 ? "-" : "+";
            body += std::to_string(adjusted < 0 ? -adjusted : adjusted);
            break;
        }
        case 'f':
        case 'F':
        case '%': {
            Decimal scaled = magnitude;
            if (spec.type == '%') {
                scaled = Decimal::FromParts(false, magnitude.coefficient(), magnitude.exponent() + 2);
            }
            if (spec.precision >= 0) {
                scaled = scaled.Rescale(-spec.precision, Rounding::kHalfEven);
            }
            body = PlainDecimal(scaled);
            if (spec.type == '%') {
                body += "%";
            }
            break;
        }
        default:
            throw ValueError(std::string("Unknown format code '") + spec.type + "' for object of type 'Decimal'");
    }
    body = GroupIntegerPart(body, spec.grouping);
    return Pad(spec, SignPrefix(spec, negative), body, '>');
}

std::string FormatString(const std::string& value, const FormatSpec& spec) {
    if (spec.type != 0 && spec.type != 's') {
        throw ValueError(std::string("Unknown format code '") + spec.type + "' for object of type 'str'");
    }
    if (spec.sign != '-') {
        throw ValueError("Sign not allowed in string format specifier");
    }
    if (spec.align == '=') {
        throw ValueError("'=' alignment not allowed in string format specifier");
    }
    std::string body = value;
    if (spec.precision >= 0 && text::Length(body) > static_cast<std::size_t>(spec.precision)) {
        auto decoded = text::Decode(body);
        decoded.resize(static_cast<std::size_t>(spec.precision));
        body = text::Encode(decoded);
    }
    return Pad(spec, {}, body, '<');
}

bool IsFloatType(char type) {
    return type == 'e' || type == 'E' || type == 'f' || type == 'F' || type == 'g' || type == 'G' || type == '%';
}

std::string FormatComplex(std::complex<double> value, const FormatSpec& spec) {
    if (spec.type == 0 && spec.precision < 0) {
        return Pad(spec, {}, ComplexRepr(value), '>');
    }
    if (spec.type != 0 && spec.type != 'e' && spec.type != 'E' && spec.type != 'f' && spec.type != 'F' &&
        spec.type != 'g' && spec.type != 'G') {
        throw ValueError(std::string("Unknown format code '") + spec.type + "' for object of type 'complex'");
    }
    FormatSpec part = spec;
    part.width = -1;
    part.align = 0;
    if (part.type == 0) {
        part.type = 'g';
    }
    const std::string real = SignPrefix(spec, std::signbit(value.real())) + FloatBody(std::fabs(value.real()), part);
    const std::string imag = std::string(std::signbit(value.imag()) ? "-" : "+") +
        FloatBody(std::fabs(value.imag()), part) + "j";
    return Pad(spec, {}, real + imag, '>');
}

// Shortest digit string and decimal exponent that round-trip `value`.
void ShortestDigits(double value, std::string& digits, int& exponent) {
    char buffer[64];
    for (int precision = 1; precision <= 17; ++precision) {
        std::snprintf(buffer, sizeof(buffer), "%.*e", precision - 1, value);
        if (std::strtod(buffer, nullptr) == value) {
            break;
        }
    }
    const std::string text(buffer);
    const auto e = text.find('e');
    digits.clear();
    for (std::size_t i = 0; i < e; ++i) {
        if (std::isdigit(static_cast<unsigned char>(text[i]))) {
            digits.push_back(text[i]);
        }
    }
    while (digits.size() > 1 && digits.back() == '0') {
        digits.pop_back();
    }
    exponent = std::atoi(text.c_str() + e + 1);
}

std::string ComplexPart(double value) {
    std::string text = FloatRepr(value);
    if (text.size() > 2 && text.compare(text.size() - 2, 2, ".0") == 0) {
        text.erase(text.size() - 2);
    }
    return text;
}

const Value& PercentArgument(const std::vector<Value>& items, std::size_t& next) {
    if (next >= items.size()) {
        throw TypeError("not enough arguments for format string");
    }
    return items[next++];
}

}  // namespace

std::string FloatRepr(double value) {
    if (std::isnan(value)) {
        return "nan";
    }
    if (std::isinf(value)) {
        return value > 0 ? "inf" : "-inf";
    }
    const std::string sign = std::signbit(value) ? "-" : "";
    if (value == 0.0) {
        return sign + "0.0";
    }
    std::string digits;
    int exponent = 0;
    ShortestDigits(std::fabs(value), digits, exponent);
    const int count = static_cast<int>(digits.size());
    if (exponent >= -4 && exponent < 16) {
        if (exponent >= 0) {
            std::string integer = digits.substr(0, static_cast<std::size_t>(std::min(count, exponent + 1)));
            if (count < exponent + 1) {
                integer += std::string(static_cast<std::size_t>(exponent + 1 - count), '0');
            }
            const std::string fraction = count > exponent + 1 ? digits.substr(static_cast<std::size_t>(exponent + 1)) : "0";
            return sign + integer + "." + fraction;
        }
        return sign + "0." + std::string(static_cast<std::size_t>(-exponent - 1), '0') + digits;
    }
    std::string mantissa = digits.substr(0, 1);
    if (count > 1) {
        mantissa += "." + digits.substr(1);
    }
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "e%c%02d", exponent < 0 ? '-' : '+', exponent < 0 ? -exponent : exponent);
    return sign + mantissa + buffer;
}

std::string ComplexRepr(std::complex<double> value) {
    const std::string imag = ComplexPart(value.imag()) + "j";
    if (value.real() == 0.0 && !std::signbit(value.real())) {
        return imag;
    }
    const bool imag_negative = std::signbit(value.imag()) && !std::isnan(value.imag());
    return "(" + ComplexPart(value.real()) + (imag_negative ? "-" : "+") +
        ComplexPart(std::fabs(value.imag())) + "j)";
}

std::string FormatWithSpec(const Value& value, const std::string& spec_text) {
    if (spec_text.empty()) {
        return Str(value);
    }
    const FormatSpec spec = ParseSpec(spec_text);
    switch (value.kind()) {
        case ValueKind::kStr:
            return FormatString(value.AsStr(), spec);
        case ValueKind::kBool:
            if (spec.type == 0) {
                return Pad(spec, {}, Str(value), '>');
            }
            [[fallthrough]];
        case ValueKind::kInt:
            if (IsFloatType(spec.type)) {
                return FormatFloat(ToDouble(value), spec);
            }
            return FormatInt(ToBigInt(value), spec);
        case ValueKind::kFloat:
            if (spec.type != 0 && !IsFloatType(spec.type) && spec.type != 'n') {
                throw ValueError(std::string("Unknown format code '") + spec.type + "' for object of type 'float'");
            }
            return FormatFloat(value.AsFloat(), spec);
        case ValueKind::kComplex:
            return FormatComplex(value.AsComplex(), spec);
        case ValueKind::kFraction:
            if (spec.type == 0 && spec.precision < 0) {
                return Pad(spec, {}, Str(value), '>');
            }
            if (!IsFloatType(spec.type) && spec.type != 0) {
                throw ValueError(std::string("Unknown format code '") + spec.type + "' for object of type 'Fraction'");
            }
            return FormatFloat(ToDouble(value), spec);
        case ValueKind::kDecimal:
            return FormatDecimal(value.As<DecimalObject>().value, spec);
        default:
            throw TypeError("unsupported format string passed to " + TypeName(value) + ".__format__");
    }
}

std::string PercentFormat(const std::string& format, const Value& args) {
    std::vector<Value> items;
    const bool mapping = args.Is(ValueKind::kDict);
    if (args.Is(ValueKind::kTuple)) {
        items = args.As<TupleObject>().items;
    } else if (!mapping) {
        items.push_back(args);
    }
    std::size_t next = 0;
    std::string out;
    std::size_t i = 0;
    while (i < format.size()) {
        const char c = format[i];
        if (c != '%') {
            out.push_back(c);
            ++i;
            continue;
        }
        ++i;
        if (i >= format.size()) {
            throw ValueError("incomplete format");
        }
        const Value* argument = nullptr;
        Value keyed;
        if (format[i] == '(') {
            const auto close = format.find(')', i);
            if (close == std::string::npos) {
                throw ValueError("incomplete format key");
            }
            if (!mapping) {
                throw TypeError("format requires a mapping");
            }
            const auto key = Value::Str(format.substr(i + 1, close - i - 1));
            const auto* found = args.As<DictObject>().entries.Find(key);
            if (!found) {
                throw KeyError(Repr(key));
            }
            keyed = *found;
            argument = &keyed;
            i = close + 1;
        }
        FormatSpec spec;
        bool left = false;
        while (i < format.size() && std::string("-+ 0#").find(format[i]) != std::string::npos) {
            switch (format[i]) {
                case '-': left = true; break;
                case '+': spec.sign = '+'; break;
                case ' ': if (spec.sign != '+') spec.sign = ' '; break;
                case '0': spec.zero = true; break;
                case '#': spec.alternate = true; break;
            }
            ++i;
        }
        if (i < format.size() && format[i] == '*') {
            spec.width = static_cast<int>(ToInt64(PercentArgument(items, next)));
            ++i;
        } else if (i < format.size() && std::isdigit(static_cast<unsigned char>(format[i]))) {
            spec.width = ParseCount(format, i);
        }
        if (i < format.size() && format[i] == '.') {
            ++i;
            if (i < format.size() && format[i] == '*') {
                spec.precision = static_cast<int>(ToInt64(PercentArgument(items, next)));
                ++i;
            } else {
                spec.precision = ParseCount(format, i);
            }
        }
        if (i >= format.size()) {
            throw ValueError("incomplete format");
        }
        const char type = format[i++];
        if (type == '%') {
            out.push_back('%');
            continue;
        }
        if (!argument) {
            argument = &PercentArgument(items, next);
        }
        if (left) {
            spec.align = '<';
        } else if (spec.zero && type != 's' && type != 'r' && type != 'a' && type != 'c') {
            spec.fill = "0";
            spec.align = '=';
        } else {
            spec.align = '>';
        }
        switch (type) {
            case 's':
            case 'r':
            case 'a': {
                std::string body = type == 's' ? Str(*argument) : Repr(*argument);
                FormatSpec text_spec = spec;
                text_spec.sign = '-';
                text_spec.fill = " ";
                out += FormatString(body, text_spec);
                break;
            }
            case 'd':
            case 'i':
            case 'u': {
                if (!IsReal(*argument)) {
                    throw TypeError(std::string("%") + type + " format: a real number is required, not " + TypeName(*argument));
                }
                BigInt number;
                if (IsIntegral(*argument)) {
                    number = ToBigInt(*argument);
                } else {
                    const Rational exact = ToRational(*argument);
                    number = BigInt(numerator(exact) / denominator(exact));
                }
                const int precision = spec.precision;
                spec.precision = -1;
                std::string body = FormatInt(number, FormatSpec{});
                const bool negative = !body.empty() && body[0] == '-';
                if (negative) {
                    body.erase(0, 1);
                }
                if (precision > 0 && body.size() < static_cast<std::size_t>(precision)) {
                    body = std::string(static_cast<std::size_t>(precision) - body.size(), '0') + body;
                }
                out += Pad(spec, SignPrefix(spec, negative), body, '>');
                break;
            }
            case 'x':
            case 'X':
            case 'o': {
                if (!IsIntegral(*argument)) {
                    throw TypeError(std::string("%") + type + " format: an integer is required, not " + TypeName(*argument));
                }
                spec.type = type;
                spec.precision = -1;
                out += FormatInt(ToBigInt(*argument), spec);
                break;
            }
            case 'c': {
                std::string body;
                if (argument->Is(ValueKind::kStr) && text::Length(argument->AsStr()) == 1) {
                    body = argument->AsStr();
                } else if (IsIntegral(*argument)) {
                    const BigInt code = ToBigInt(*argument);
                    if (code < 0 || code > 0x10FFFF) {
                        throw OverflowError("%c arg not in range(0x110000)");
                    }
                    text::AppendUtf8(body, static_cast<char32_t>(code.convert_to<unsigned long>()));
                } else {
                    throw TypeError("%c requires an int or a unicode character, not " + TypeName(*argument));
                }
                spec.precision = -1;
                out += Pad(spec, {}, body, '>');
                break;
            }
            case 'e':
            case 'E':
            case 'f':
            case 'F':
            case 'g':
            case 'G': {
                if (!IsReal(*argument)) {
                    throw TypeError("must be real number, not " + TypeName(*argument));
                }
                spec.type = type;
                out += FormatFloat(ToDouble(*argument), spec);
                break;
            }
            default: {
                char buffer[64];
                std::snprintf(buffer, sizeof(buffer), "unsupported format character '%c' (0x%x) at index %zu",
                              type, static_cast<unsigned>(static_cast<unsigned char>(type)), i - 1);
                throw ValueError(buffer);
            }
        }
    }
    if (!mapping && next < items.size()) {
        throw TypeError("not all arguments converted during string formatting");
    }
    return out;
}

std::string StrFormat(const std::string& format, const CallArgs& args) {
    std::string out;
    std::size_t auto_index = 0;
    bool used_auto = false;
    bool used_manual = false;

    auto resolve = [&](const std::string& field) -> const Value& {
        if (field.find_first_of(".[") != std::string::npos) {
            throw ValueError("attribute and index access in format fields is not supported");
        }
        if (field.empty() || std::isdigit(static_cast<unsigned char>(field[0]))) {
            std::size_t index = 0;
            if (field.empty()) {
                if (used_manual) {
                    throw ValueError("cannot switch from manual field specification to automatic field numbering");
                }
                used_auto = true;
                index = auto_index++;
            } else {
                if (used_auto) {
                    throw ValueError("cannot switch from automatic field numbering to manual field specification");
                }
                used_manual = true;
                for (char c : field) {
                    if (!std::isdigit(static_cast<unsigned char>(c))) {
                        throw ValueError("invalid format field name '" + field + "'");
                    }
                    index = index * 10 + static_cast<std::size_t>(c - '0');
                    if (index > 1000000) {
                        throw ValueError("Too many decimal digits in format string");
                    }
                }
            }
            if (index >= args.positional.size()) {
                throw IndexError("Replacement index " + std::to_string(index) +
                                 " out of range for positional args tuple");
            }
            return args.positional[index];
        }
        for (const auto& [name, value] : args.keywords) {
            if (name == field) {
                return value;
            }
        }
        throw KeyError("'" + field + "'");
    };

    std::function<std::string(const std::string&, int)> expand;
    expand = [&](const std::string& source, int depth) -> std::string {
        std::string result;
        std::size_t i = 0;
        while (i < source.size()) {
            const char c = source[i];
            if (c == '{') {
                if (i + 1 < source.size() && source[i + 1] == '{') {
                    result.push_back('{');
                    i += 2;
                    continue;
                }
                if (depth > 1) {
                    throw ValueError("Max string recursion exceeded");
                }
                int level = 1;
                std::size_t j = i + 1;
                while (j < source.size() && level > 0) {
                    if (source[j] == '{') {
                        ++level;
                    } else if (source[j] == '}') {
                        --level;
                    }
                    if (level > 0) {
                        ++j;
                    }
                }
                if (j >= source.size()) {
                    throw ValueError("expected '}' before end of string");
                }
                const std::string field = source.substr(i + 1, j - i - 1);
                std::string name = field;
                std::string spec;
                char conversion = 0;
                const auto colon = field.find(':');
                if (colon != std::string::npos) {
                    name = field.substr(0, colon);
                    spec = field.substr(colon + 1);
                }
                const auto bang = name.find('!');
                if (bang != std::string::npos) {
                    if (bang + 2 != name.size()) {
                        throw ValueError("expected ':' after conversion specifier");
                    }
                    conversion = name[bang + 1];
                    name = name.substr(0, bang);
                }
                Value value = resolve(name);
                if (conversion == 'r' || conversion == 'a') {
                    value = Value::Str(Repr(value));
                } else if (conversion == 's') {
                    value = Value::Str(Str(value));
                } else if (conversion != 0) {
                    throw ValueError(std::string("Unknown conversion specifier ") + conversion);
                }
                result += FormatWithSpec(value, expand(spec, depth + 1));
                i = j + 1;
            } else if (c == '}') {
                if (i + 1 < source.size() && source[i + 1] == '}') {
                    result.push_back('}');
                    i += 2;
                    continue;
                }
                throw ValueError("Single '}' encountered in format string");
            } else {
                result.push_back(c);
                ++i;
            }
        }
        return result;
    };

    out = expand(format, 0);
    return out;
}

}  // namespace mathguard::runtime
