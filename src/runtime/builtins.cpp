#include "runtime/builtins.hpp"

#include <boost/multiprecision/integer.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <memory>
#include <utility>

#include "runtime/errors.hpp"
#include "runtime/interpreter.hpp"
#include "runtime/iterators.hpp"
#include "runtime/numeric.hpp"
#include "runtime/text.hpp"

namespace mathguard::runtime {
namespace {

std::string Strip(const std::string& text) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(begin, end - begin);
}

std::string Lower(std::string text) {
    for (auto& c : text) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return text;
}

int DigitValue(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'z') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'Z') {
        return c - 'A' + 10;
    }
    return 99;
}

// Digits with single underscores between them, as int() and float() accept.
bool StripUnderscores(const std::string& digits, std::string& out) {
    out.clear();
    for (std::size_t i = 0; i < digits.size(); ++i) {
        if (digits[i] == '_') {
            if (i == 0 || i + 1 == digits.size() || digits[i - 1] == '_' ||
                !std::isalnum(static_cast<unsigned char>(digits[i + 1]))) {
                return false;
            }
            continue;
        }
        out.push_back(digits[i]);
    }
    return true;
}

Value ParseIntText(const std::string& original, int base) {
    auto invalid = [&] {
        return ValueError("invalid literal for int() with base " + std::to_string(base) + ": " +
                          Repr(Value::Str(original)));
    };
    std::string text = Strip(original);
    bool negative = false;
    if (!text.empty() && (text[0] == '+' || text[0] == '-')) {
        negative = text[0] == '-';
        text.erase(0, 1);
    }
    int radix = base;
    if (text.size() >= 2 && text[0] == '0') {
        const char marker = static_cast<char>(std::tolower(static_cast<unsigned char>(text[1])));
        const int prefixed = marker == 'x' ? 16 : (marker == 'o' ? 8 : (marker == 'b' ? 2 : 0));
        if (prefixed != 0 && (base == 0 || base == prefixed)) {
            radix = prefixed;
            text.erase(0, 2);
            if (!text.empty() && text[0] == '_') {
                text.erase(0, 1);
            }
        }
    }
    if (radix == 0) {
        radix = 10;
        if (text.size() > 1 && text[0] == '0' && text.find_first_not_of("0_") != std::string::npos) {
            throw invalid();
        }
    }
    std::string digits;
    if (text.empty() || !StripUnderscores(text, digits) || digits.empty()) {
        throw invalid();
    }
    BigInt value = 0;
    for (char c : digits) {
        const int digit = DigitValue(c);
        if (digit >= radix) {
            throw invalid();
        }
        value = value * radix + digit;
    }
    return Value::Int(negative ? BigInt(-value) : value);
}

// Validates Python float syntax (underscores between digits allowed) and
// returns the plain text for strtod.
bool FloatSyntax(const std::string& text, std::string& plain) {
    if (!StripUnderscores(text, plain)) {
        return false;
    }
    std::size_t i = 0;
    if (i < plain.size() && (plain[i] == '+' || plain[i] == '-')) {
        ++i;
    }
    std::size_t digits = 0;
    while (i < plain.size() && std::isdigit(static_cast<unsigned char>(plain[i]))) {
        ++i;
        ++digits;
    }
    if (i < plain.size() && plain[i] == '.') {
        ++i;
        while (i < plain.size() && std::isdigit(static_cast<unsigned char>(plain[i]))) {
            ++i;
            ++digits;
        }
    }
    if (digits == 0) {
        return false;
    }
    if (i < plain.size() && (plain[i] == 'e' || plain[i] == 'E')) {
        ++i;
        if (i < plain.size() && (plain[i] == '+' || plain[i] == '-')) {
            ++i;
        }
        std::size_t exponent = 0;
        while (i < plain.size() && std::isdigit(static_cast<unsigned char>(plain[i]))) {
            ++i;
            ++exponent;
        }
        if (exponent == 0) {
            return false;
        }
    }
    return i == plain.size();
}

bool ParseSpecialFloat(const std::string& text, double& out) {
    std::string body = Lower(text);
    double sign = 1.0;
    if (!body.empty() && (body[0] == '+' || body[0] == '-')) {
        sign = body[0] == '-' ? -1.0 : 1.0;
        body.erase(0, 1);
    }
    if (body == "inf" || body == "infinity") {
        out = sign * HUGE_VAL;
        return true;
    }
    if (body == "nan") {
        out = std::copysign(std::nan(""), sign);
        return true;
    }
    return false;
}

Value ParseComplexText(const std::string& original) {
    auto invalid = [] { return ValueError("complex() arg is a malformed string"); };
    std::string text = Strip(original);
    if (text.size() >= 2 && text.front() == '(' && text.back() == ')') {
        text = Strip(text.substr(1, text.size() - 2));
    }
    if (text.empty()) {
        throw invalid();
    }
    auto parse_part = [&](const std::string& part, double& out) {
        if (part.empty() || part == "+" || part == "-") {
            out = part == "-" ? -1.0 : 1.0;
            return;
        }
        if (ParseSpecialFloat(part, out)) {
            return;
        }
        std::string plain;
        if (!FloatSyntax(part, plain)) {
            throw invalid();
        }
        out = std::strtod(plain.c_str(), nullptr);
    };
    const char last = static_cast<char>(std::tolower(static_cast<unsigned char>(text.back())));
    if (last != 'j') {
        double real = 0.0;
        if (!ParseSpecialFloat(text, real)) {
            std::string plain;
            if (!FloatSyntax(text, plain)) {
                throw invalid();
            }
            real = std::strtod(plain.c_str(), nullptr);
        }
        return Value::Complex({real, 0.0});
    }
    text.pop_back();
    std::size_t split = std::string::npos;
    for (std::size_t i = text.size(); i-- > 1;) {
        if ((text[i] == '+' || text[i] == '-') && text[i - 1] != 'e' && text[i - 1] != 'E') {
            split = i;
            break;
        }
    }
    double real = 0.0;
    double imag = 0.0;
    if (split == std::string::npos) {
        parse_part(text, imag);
    } else {
        const std::string real_text = text.substr(0, split);
        if (!ParseSpecialFloat(real_text, real)) {
            std::string plain;
            if (!FloatSyntax(real_text, plain)) {
                throw invalid();
            }
            real = std::strtod(plain.c_str(), nullptr);
        }
        parse_part(text.substr(split), imag);
    }
    return Value::Complex({real, imag});
}

Value MakeType(const std::string& name, NativeFn construct, std::function<bool(const Value&)> matches) {
    auto type = std::make_shared<TypeObject>();
    type->name = name;
    type->construct = std::move(construct);
    type->matches = std::move(matches);
    return Value::FromObject(ValueKind::kType, std::move(type));
}

std::function<bool(const Value&)> KindIs(ValueKind kind) {
    return [kind](const Value& value) { return value.Is(kind); };
}

Value NewSet(Interpreter& interp, ValueKind kind, const Value* iterable) {
    Value out = Value::Set(kind);
    if (iterable != nullptr) {
        auto& entries = out.As<SetObject>().entries;
        interp.ForEach(*iterable, [&](const Value& item) {
            entries.Set(item, Value());
            interp.CheckSize(entries.size());
        });
    }
    return out;
}

// dict(mapping) / dict(pairs) / dict.update semantics.
void UpdateDict(Interpreter& interp, DictStorage& entries, const Value& source) {
    if (source.Is(ValueKind::kDict)) {
        for (const auto& [key, value] : source.As<DictObject>().entries.Items()) {
            entries.Set(key, value);
        }
        return;
    }
    std::size_t index = 0;
    interp.ForEach(source, [&](const Value& item) {
        std::vector<Value> pair;
        try {
            pair = interp.Collect(item);
        } catch (const ScriptError& error) {
            if (error.type() != "TypeError") {
                throw;
            }
            throw TypeError("cannot convert dictionary update sequence element #" + std::to_string(index) +
                            " to a sequence");
        }
        if (pair.size() != 2) {
            throw ValueError("dictionary update sequence element #" + std::to_string(index) + " has length " +
                             std::to_string(pair.size()) + "; 2 is required");
        }
        entries.Set(pair[0], pair[1]);
        interp.CheckSize(entries.size());
        ++index;
    });
}

BigInt ModularInverse(const BigInt& value, const BigInt& modulus) {
    BigInt old_r = value;
    BigInt r = modulus;
    BigInt old_s = 1;
    BigInt s = 0;
    while (r != 0) {
        const BigInt quotient = old_r / r;
        BigInt next = old_r - quotient * r;
        old_r = r;
        r = next;
        next = old_s - quotient * s;
        old_s = s;
        s = next;
    }
    if (old_r != 1) {
        throw ValueError("base is not invertible for the given modulus");
    }
    return FloorMod(old_s, modulus);
}

Value Pow(Interpreter& interp, CallArgs& args) {
    ArgReader reader("pow", args, {"base", "exp", "mod"}, 2);
    if (!reader.HasValue(2)) {
        return interp.BinaryOp(lang::BinaryOperator::kPow, reader.Get(0), reader.Get(1));
    }
    if (!IsIntegral(reader.Get(0)) || !IsIntegral(reader.Get(1)) || !IsIntegral(reader.Get(2))) {
        throw TypeError("pow() 3rd argument not allowed unless all arguments are integers");
    }
    const BigInt modulus = ToBigInt(reader.Get(2));
    if (modulus == 0) {
        throw ValueError("pow() 3rd argument cannot be 0");
    }
    const BigInt magnitude = modulus < 0 ? BigInt(-modulus) : modulus;
    BigInt base = FloorMod(ToBigInt(reader.Get(0)), magnitude);
    BigInt exponent = ToBigInt(reader.Get(1));
    if (exponent < 0) {
        base = ModularInverse(base, magnitude);
        exponent = -exponent;
    }
    BigInt result = magnitude == 1 ? BigInt(0) : BigInt(boost::multiprecision::powm(base, exponent, magnitude));
    if (modulus < 0 && result != 0) {
        result += modulus;
    }
    return Value::Int(std::move(result));
}

Value Len(Interpreter&, CallArgs& args) {
    ExpectCount("len", args, 1, 1);
    const Value& value = args.positional[0];
    switch (value.kind()) {
        case ValueKind::kStr:
            return Value::Int(static_cast<long long>(text::Length(value.AsStr())));
        case ValueKind::kList:
        case ValueKind::kTuple:
            return Value::Int(static_cast<long long>(Items(value).size()));
        case ValueKind::kDict:
            return Value::Int(static_cast<long long>(value.As<DictObject>().entries.size()));
        case ValueKind::kSet:
        case ValueKind::kFrozenSet:
            return Value::Int(static_cast<long long>(value.As<SetObject>().entries.size()));
        case ValueKind::kRange:
            return Value::Int(value.As<RangeObject>().Length());
        default:
            throw TypeError("object of type '" + TypeName(value) + "' has no len()");
    }
}

Value Sum(Interpreter& interp, CallArgs& args) {
    ArgReader reader("sum", args, {"iterable", "start"}, 1);
    Value total = reader.Get(1, Value::Int(0LL));
    if (total.Is(ValueKind::kStr)) {
        throw TypeError("sum() can't sum strings [use ''.join(seq) instead]");
    }
    interp.ForEach(reader.Get(0), [&](const Value& item) {
        total = interp.BinaryOp(lang::BinaryOperator::kAdd, total, item);
    });
    return total;
}

Value MinMax(Interpreter& interp, CallArgs& args, bool maximum) {
    const std::string name = maximum ? "max" : "min";
    Value key;
    Value fallback;
    bool has_default = false;
    for (const auto& [keyword, value] : args.keywords) {
        if (keyword == "key") {
            key = value;
        } else if (keyword == "default") {
            fallback = value;
            has_default = true;
        } else {
            throw TypeError(name + "() got an unexpected keyword argument '" + keyword + "'");
        }
    }
    if (args.positional.empty()) {
        throw TypeError(name + " expected at least 1 argument, got 0");
    }
    std::vector<Value> candidates;
    if (args.positional.size() == 1) {
        candidates = interp.Collect(args.positional[0]);
    } else {
        if (has_default) {
            throw TypeError("Cannot specify a default for " + name + "() with multiple positional arguments");
        }
        candidates = args.positional;
    }
    if (candidates.empty()) {
        if (has_default) {
            return fallback;
        }
        throw ValueError(name + "() iterable argument is empty");
    }
    auto key_of = [&](const Value& item) {
        if (key.IsNone()) {
            return item;
        }
        CallArgs call;
        call.positional.push_back(item);
        return interp.Call(key, std::move(call));
    };
    std::size_t best = 0;
    Value best_key = key_of(candidates[0]);
    for (std::size_t i = 1; i < candidates.size(); ++i) {
        Value candidate_key = key_of(candidates[i]);
        const bool better = maximum ? interp.Less(best_key, candidate_key) : interp.Less(candidate_key, best_key);
        if (better) {
            best = i;
            best_key = std::move(candidate_key);
        }
    }
    return candidates[best];
}

Value Sorted(Interpreter& interp, CallArgs& args) {
    Value key;
    bool reverse = false;
    for (const auto& [keyword, value] : args.keywords) {
        if (keyword == "key") {
            key = value;
        } else if (keyword == "reverse") {
            reverse = Truthy(value);
        } else {
            throw TypeError("sort() got an unexpected keyword argument '" + keyword + "'");
        }
    }
    if (args.positional.size() != 1) {
        throw TypeError("sorted expected 1 argument, got " + std::to_string(args.positional.size()));
    }
    std::vector<Value> items = interp.Collect(args.positional[0]);
    SortValues(interp, items, key, reverse);
    return Value::List(std::move(items));
}

Value Reversed(Interpreter&, CallArgs& args) {
    ExpectCount("reversed", args, 1, 1);
    const Value& value = args.positional[0];
    std::vector<Value> items;
    std::string name = "list_reverseiterator";
    switch (value.kind()) {
        case ValueKind::kList:
        case ValueKind::kTuple:
            items.assign(Items(value).rbegin(), Items(value).rend());
            if (value.Is(ValueKind::kTuple)) {
                name = "reversed";
            }
            break;
        case ValueKind::kStr: {
            const std::u32string code_points = text::Decode(value.AsStr());
            for (auto it = code_points.rbegin(); it != code_points.rend(); ++it) {
                std::string item;
                text::AppendUtf8(item, *it);
                items.push_back(Value::Str(std::move(item)));
            }
            name = "reversed";
            break;
        }
        case ValueKind::kRange: {
            const auto& range = value.As<RangeObject>();
            for (long long i = range.Length(); i-- > 0;) {
                items.push_back(Value::Int(range.At(i)));
            }
            name = "range_iterator";
            break;
        }
        case ValueKind::kDict: {
            std::vector<Value> keys = value.As<DictObject>().entries.Keys();
            items.assign(keys.rbegin(), keys.rend());
            name = "dict_reversekeyiterator";
            break;
        }
        default:
            throw TypeError("'" + TypeName(value) + "' object is not reversible");
    }
    return MakeIterator(std::make_shared<VectorIterator>(name, std::move(items)));
}

Value Enumerate(Interpreter&, CallArgs& args) {
    ArgReader reader("enumerate", args, {"iterable", "start"}, 1);
    auto source = GetIterator(reader.Get(0));
    auto counter = std::make_shared<BigInt>(reader.Has(1) ? ToBigInt(reader.Get(1)) : BigInt(0));
    return MakeLambdaIterator("enumerate", [source, counter](Interpreter& interp, Value& out) {
        Value item;
        if (!interp.Next(*source, item)) {
            return false;
        }
        out = Value::Tuple({Value::Int(*counter), item});
        ++*counter;
        return true;
    });
}

Value Zip(Interpreter&, CallArgs& args) {
    bool strict = false;
    for (const auto& [keyword, value] : args.keywords) {
        if (keyword != "strict") {
            throw TypeError("zip() got an unexpected keyword argument '" + keyword + "'");
        }
        strict = Truthy(value);
    }
    std::vector<std::shared_ptr<Iterator>> sources;
    for (const auto& iterable : args.positional) {
        sources.push_back(GetIterator(iterable));
    }
    return MakeLambdaIterator("zip", [sources, strict](Interpreter& interp, Value& out) {
        if (sources.empty()) {
            return false;
        }
        std::vector<Value> row;
        row.reserve(sources.size());
        for (std::size_t i = 0; i < sources.size(); ++i) {
            Value item;
            if (interp.Next(*sources[i], item)) {
                row.push_back(std::move(item));
                continue;
            }
            if (strict) {
                if (i > 0) {
                    throw ValueError("zip() argument " + std::to_string(i + 1) + " is shorter than argument" +
                                     (i == 1 ? " 1" : "s 1-" + std::to_string(i)));
                }
                for (std::size_t k = 1; k < sources.size(); ++k) {
                    if (interp.Next(*sources[k], item)) {
                        throw ValueError("zip() argument " + std::to_string(k + 1) + " is longer than argument" +
                                         (k == 1 ? " 1" : "s 1-" + std::to_string(k)));
                    }
                }
            }
            return false;
        }
        out = Value::Tuple(std::move(row));
        return true;
    });
}

Value Map(Interpreter&, CallArgs& args) {
    NoKeywords("map", args);
    if (args.positional.size() < 2) {
        throw TypeError("map() must have at least two arguments.");
    }
    const Value function = args.positional[0];
    std::vector<std::shared_ptr<Iterator>> sources;
    for (std::size_t i = 1; i < args.positional.size(); ++i) {
        sources.push_back(GetIterator(args.positional[i]));
    }
    return MakeLambdaIterator("map", [function, sources](Interpreter& interp, Value& out) {
        CallArgs call;
        for (const auto& source : sources) {
            Value item;
            if (!interp.Next(*source, item)) {
                return false;
            }
            call.positional.push_back(std::move(item));
        }
        out = interp.Call(function, std::move(call));
        return true;
    });
}

Value Filter(Interpreter&, CallArgs& args) {
    ExpectCount("filter", args, 2, 2);
    const Value predicate = args.positional[0];
    auto source = GetIterator(args.positional[1]);
    return MakeLambdaIterator("filter", [predicate, source](Interpreter& interp, Value& out) {
        Value item;
        while (interp.Next(*source, item)) {
            bool keep = false;
            if (predicate.IsNone()) {
                keep = Truthy(item);
            } else {
                CallArgs call;
                call.positional.push_back(item);
                keep = Truthy(interp.Call(predicate, std::move(call)));
            }
            if (keep) {
                out = std::move(item);
                return true;
            }
        }
        return false;
    });
}

Value AllAny(Interpreter& interp, CallArgs& args, bool all) {
    ExpectCount(all ? "all" : "any", args, 1, 1);
    auto source = GetIterator(args.positional[0]);
    Value item;
    while (interp.Next(*source, item)) {
        if (Truthy(item) != all) {
            return Value::Bool(!all);
        }
    }
    return Value::Bool(all);
}

bool MatchesClass(const Value& value, const Value& classinfo) {
    if (classinfo.Is(ValueKind::kType)) {
        const auto& type = classinfo.As<TypeObject>();
        return type.matches && type.matches(value);
    }
    if (classinfo.Is(ValueKind::kTuple)) {
        for (const auto& item : Items(classinfo)) {
            if (MatchesClass(value, item)) {
                return true;
            }
        }
        return false;
    }
    throw TypeError("isinstance() arg 2 must be a type, a tuple of types, or a union");
}

Value RangeValue(Interpreter&, CallArgs& args) {
    NoKeywords("range", args);
    const auto count = args.positional.size();
    if (count == 0) {
        throw TypeError("range expected at least 1 argument, got 0");
    }
    if (count > 3) {
        throw TypeError("range expected at most 3 arguments, got " + std::to_string(count));
    }
    auto range = std::make_shared<RangeObject>();
    if (count == 1) {
        range->stop = ToInt64(args.positional[0]);
    } else {
        range->start = ToInt64(args.positional[0]);
        range->stop = ToInt64(args.positional[1]);
        if (count == 3) {
            range->step = ToInt64(args.positional[2]);
            if (range->step == 0) {
                throw ValueError("range() arg 3 must not be zero");
            }
        }
    }
    return Value::FromObject(ValueKind::kRange, std::move(range));
}

Value IntValue(Interpreter&, CallArgs& args) {
    ArgReader reader("int", args, {"x", "base"}, 0);
    if (!reader.Has(0)) {
        if (reader.Has(1)) {
            throw TypeError("int() missing string argument");
        }
        return Value::Int(0LL);
    }
    if (!reader.Has(1)) {
        return ToIntValue(reader.Get(0));
    }
    if (!reader.Get(0).Is(ValueKind::kStr)) {
        throw TypeError("int() can't convert non-string with explicit base");
    }
    const long long base = ToInt64(reader.Get(1));
    if (base != 0 && (base < 2 || base > 36)) {
        throw ValueError("int() base must be >= 2 and <= 36, or 0");
    }
    return ParseIntText(reader.Get(0).AsStr(), static_cast<int>(base));
}

Value ComplexValue(Interpreter&, CallArgs& args) {
    ArgReader reader("complex", args, {"real", "imag"}, 0);
    if (!reader.Has(0)) {
        return Value::Complex({0.0, reader.Has(1) ? ToComplex(reader.Get(1)).real() : 0.0});
    }
    const Value& real = reader.Get(0);
    if (real.Is(ValueKind::kStr)) {
        if (reader.Has(1)) {
            throw TypeError("complex() can't take second arg if first is a string");
        }
        return ParseComplexText(real.AsStr());
    }
    if (!IsNumber(real)) {
        throw TypeError("complex() first argument must be a string or a number, not '" + TypeName(real) + "'");
    }
    std::complex<double> value = ToComplex(real);
    if (reader.Has(1)) {
        const Value& imag = reader.Get(1);
        if (!IsNumber(imag)) {
            throw TypeError("complex() second argument must be a number, not '" + TypeName(imag) + "'");
        }
        const std::complex<double> extra = ToComplex(imag);
        value = {value.real() - extra.imag(), value.imag() + extra.real()};
    }
    return Value::Complex(value);
}

Value DictValue(Interpreter& interp, CallArgs& args) {
    if (args.positional.size() > 1) {
        throw TypeError("dict expected at most 1 argument, got " + std::to_string(args.positional.size()));
    }
    Value out = Value::Dict();
    auto& entries = out.As<DictObject>().entries;
    if (!args.positional.empty()) {
        UpdateDict(interp, entries, args.positional[0]);
    }
    for (const auto& [keyword, value] : args.keywords) {
        entries.Set(Value::Str(keyword), value);
    }
    return out;
}

Value DictFromKeys(Interpreter& interp, CallArgs& args) {
    ExpectCount("fromkeys", args, 1, 2);
    const Value value = args.positional.size() > 1 ? args.positional[1] : Value();
    Value out = Value::Dict();
    auto& entries = out.As<DictObject>().entries;
    interp.ForEach(args.positional[0], [&](const Value& key) {
        entries.Set(key, value);
        interp.CheckSize(entries.size());
    });
    return out;
}

std::map<std::string, Value> BuildBuiltins() {
    std::map<std::string, Value> table;
    auto add = [&table](const std::string& name, NativeFn fn) { table[name] = MakeBuiltin(name, std::move(fn)); };

    table["int"] = MakeType("int", IntValue, [](const Value& value) { return IsIntegral(value); });
    table["float"] = MakeType("float", [](Interpreter&, CallArgs& args) {
        ExpectCount("float", args, 0, 1);
        return args.positional.empty() ? Value::Float(0.0) : ToFloatValue(args.positional[0]);
    }, KindIs(ValueKind::kFloat));
    table["complex"] = MakeType("complex", ComplexValue, KindIs(ValueKind::kComplex));
    table["str"] = MakeType("str", [](Interpreter&, CallArgs& args) {
        ExpectCount("str", args, 0, 1);
        return Value::Str(args.positional.empty() ? std::string() : Str(args.positional[0]));
    }, KindIs(ValueKind::kStr));
    table["bool"] = MakeType("bool", [](Interpreter&, CallArgs& args) {
        ExpectCount("bool", args, 0, 1);
        return Value::Bool(!args.positional.empty() && Truthy(args.positional[0]));
    }, KindIs(ValueKind::kBool));
    table["list"] = MakeType("list", [](Interpreter& interp, CallArgs& args) {
        ExpectCount("list", args, 0, 1);
        return Value::List(args.positional.empty() ? std::vector<Value>{} : interp.Collect(args.positional[0]));
    }, KindIs(ValueKind::kList));
    table["tuple"] = MakeType("tuple", [](Interpreter& interp, CallArgs& args) {
        ExpectCount("tuple", args, 0, 1);
        if (!args.positional.empty() && args.positional[0].Is(ValueKind::kTuple)) {
            return args.positional[0];
        }
        return Value::Tuple(args.positional.empty() ? std::vector<Value>{} : interp.Collect(args.positional[0]));
    }, KindIs(ValueKind::kTuple));
    Value dict_type = MakeType("dict", DictValue, KindIs(ValueKind::kDict));
    dict_type.As<TypeObject>().attributes["fromkeys"] = MakeBuiltin("fromkeys", DictFromKeys, "dict");
    table["dict"] = dict_type;
    table["set"] = MakeType("set", [](Interpreter& interp, CallArgs& args) {
        ExpectCount("set", args, 0, 1);
        return NewSet(interp, ValueKind::kSet, args.positional.empty() ? nullptr : &args.positional[0]);
    }, KindIs(ValueKind::kSet));
    table["frozenset"] = MakeType("frozenset", [](Interpreter& interp, CallArgs& args) {
        ExpectCount("frozenset", args, 0, 1);
        return NewSet(interp, ValueKind::kFrozenSet, args.positional.empty() ? nullptr : &args.positional[0]);
    }, KindIs(ValueKind::kFrozenSet));
    table["range"] = MakeType("range", RangeValue, KindIs(ValueKind::kRange));

    add("len", Len);
    add("abs", [](Interpreter&, CallArgs& args) {
        ExpectCount("abs", args, 1, 1);
        return NumericAbs(args.positional[0]);
    });
    add("pow", Pow);
    add("round", [](Interpreter&, CallArgs& args) {
        ArgReader reader("round", args, {"number", "ndigits"}, 1);
        return RoundNumber(reader.Get(0), reader.Has(1) ? &reader.Get(1) : nullptr);
    });
    add("divmod", [](Interpreter& interp, CallArgs& args) {
        ExpectCount("divmod", args, 2, 2);
        const Value& a = args.positional[0];
        const Value& b = args.positional[1];
        if (!IsNumber(a) || !IsNumber(b)) {
            throw TypeError("unsupported operand type(s) for divmod(): '" + TypeName(a) + "' and '" +
                            TypeName(b) + "'");
        }
        Value quotient = interp.BinaryOp(lang::BinaryOperator::kFloorDiv, a, b);
        Value remainder = interp.BinaryOp(lang::BinaryOperator::kMod, a, b);
        return Value::Tuple({std::move(quotient), std::move(remainder)});
    });
    add("sum", Sum);
    add("min", [](Interpreter& interp, CallArgs& args) { return MinMax(interp, args, false); });
    add("max", [](Interpreter& interp, CallArgs& args) { return MinMax(interp, args, true); });
    add("sorted", Sorted);
    add("reversed", Reversed);
    add("enumerate", Enumerate);
    add("zip", Zip);
    add("map", Map);
    add("filter", Filter);
    add("all", [](Interpreter& interp, CallArgs& args) { return AllAny(interp, args, true); });
    add("any", [](Interpreter& interp, CallArgs& args) { return AllAny(interp, args, false); });
    add("isinstance", [](Interpreter&, CallArgs& args) {
        ExpectCount("isinstance", args, 2, 2);
        return Value::Bool(MatchesClass(args.positional[0], args.positional[1]));
    });
    return table;
}

}  // namespace

ArgReader::ArgReader(std::string function, const CallArgs& args, std::vector<std::string> names, std::size_t required)
    : function_(std::move(function)), names_(std::move(names)), slots_(names_.size(), nullptr) {
    if (args.positional.size() > names_.size()) {
        throw TypeError(function_ + "() takes at most " + std::to_string(names_.size()) + " argument" +
                        (names_.size() == 1 ? "" : "s") + " (" + std::to_string(args.positional.size()) +
                        " given)");
    }
    for (std::size_t i = 0; i < args.positional.size(); ++i) {
        slots_[i] = &args.positional[i];
    }
    for (const auto& [keyword, value] : args.keywords) {
        auto it = std::find(names_.begin(), names_.end(), keyword);
        if (it == names_.end()) {
            throw TypeError(function_ + "() got an unexpected keyword argument '" + keyword + "'");
        }
        const auto index = static_cast<std::size_t>(it - names_.begin());
        if (slots_[index] != nullptr) {
            throw TypeError("argument for " + function_ + "() given by name ('" + keyword + "') and position (" +
                            std::to_string(index + 1) + ")");
        }
        slots_[index] = &value;
    }
    for (std::size_t i = 0; i < required && i < names_.size(); ++i) {
        if (slots_[i] == nullptr) {
            throw TypeError(function_ + "() missing required argument '" + names_[i] + "' (pos " +
                            std::to_string(i + 1) + ")");
        }
    }
}

const Value& ArgReader::Get(std::size_t index) const {
    if (slots_[index] == nullptr) {
        throw TypeError(function_ + "() missing required argument '" + names_[index] + "' (pos " +
                        std::to_string(index + 1) + ")");
    }
    return *slots_[index];
}

Value ArgReader::Get(std::size_t index, const Value& fallback) const {
    return slots_[index] != nullptr ? *slots_[index] : fallback;
}

void NoKeywords(const std::string& function, const CallArgs& args) {
    if (!args.keywords.empty()) {
        throw TypeError(function + "() takes no keyword arguments");
    }
}

void ExpectCount(const std::string& function, const CallArgs& args, std::size_t min, std::size_t max) {
    NoKeywords(function, args);
    const std::size_t given = args.positional.size();
    if (given >= min && given <= max) {
        return;
    }
    if (min == 1 && max == 1) {
        throw TypeError(function + "() takes exactly one argument (" + std::to_string(given) + " given)");
    }
    if (given < min) {
        throw TypeError(function + " expected at least " + std::to_string(min) + " argument" +
                        (min == 1 ? "" : "s") + ", got " + std::to_string(given));
    }
    throw TypeError(function + " expected at most " + std::to_string(max) + " argument" + (max == 1 ? "" : "s") +
                    ", got " + std::to_string(given));
}

void SortValues(Interpreter& interp, std::vector<Value>& items, const Value& key, bool reverse) {
    std::vector<Value> keys;
    if (!key.IsNone()) {
        keys.reserve(items.size());
        for (const auto& item : items) {
            CallArgs call;
            call.positional.push_back(item);
            keys.push_back(interp.Call(key, std::move(call)));
        }
    }
    std::vector<std::size_t> order(items.size());
    for (std::size_t i = 0; i < order.size(); ++i) {
        order[i] = i;
    }
    const std::vector<Value>& compared = key.IsNone() ? items : keys;
    std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
        interp.Step();
        return reverse ? interp.Less(compared[b], compared[a]) : interp.Less(compared[a], compared[b]);
    });
    std::vector<Value> sorted;
    sorted.reserve(items.size());
    for (std::size_t index : order) {
        sorted.push_back(items[index]);
    }
    items = std::move(sorted);
}

std::map<std::string, Value> NativeBuiltins() {
    static const std::map<std::string, Value> table = BuildBuiltins();
    return table;
}

Value ToIntValue(const Value& value) {
    switch (value.kind()) {
        case ValueKind::kBool:
        case ValueKind::kInt:
            return Value::Int(ToBigInt(value));
        case ValueKind::kFloat: {
            const double number = value.AsFloat();
            if (std::isnan(number)) {
                throw ValueError("cannot convert float NaN to integer");
            }
            if (std::isinf(number)) {
                throw OverflowError("cannot convert float infinity to integer");
            }
            const Rational exact = RationalFromDouble(std::trunc(number));
            return Value::Int(BigInt(numerator(exact)));
        }
        case ValueKind::kFraction: {
            const Rational& exact = value.As<FractionObject>().value;
            return Value::Int(BigInt(numerator(exact) / denominator(exact)));
        }
        case ValueKind::kDecimal: {
            const auto& decimal = value.As<DecimalObject>().value;
            if (decimal.IsNaN()) {
                throw ValueError("cannot convert NaN to integer");
            }
            if (decimal.IsInfinite()) {
                throw OverflowError("cannot convert Infinity to integer");
            }
            return Value::Int(decimal.ToInteger());
        }
        case ValueKind::kStr:
            return ParseIntText(value.AsStr(), 10);
        default:
            throw TypeError("int() argument must be a string, a bytes-like object or a real number, not '" +
                            TypeName(value) + "'");
    }
}

Value ToFloatValue(const Value& value) {
    switch (value.kind()) {
        case ValueKind::kStr:
            return ParseFloatText(value.AsStr());
        case ValueKind::kBool:
        case ValueKind::kInt:
        case ValueKind::kFloat:
        case ValueKind::kFraction:
        case ValueKind::kDecimal:
            return Value::Float(ToDouble(value));
        default:
            throw TypeError("float() argument must be a string or a real number, not '" + TypeName(value) + "'");
    }
}

Value ParseFloatText(const std::string& original) {
    const std::string text = Strip(original);
    double special = 0.0;
    if (ParseSpecialFloat(text, special)) {
        return Value::Float(special);
    }
    std::string plain;
    if (!FloatSyntax(text, plain)) {
        throw ValueError("could not convert string to float: " + Repr(Value::Str(original)));
    }
    return Value::Float(std::strtod(plain.c_str(), nullptr));
}

}  // namespace mathguard::runtime
