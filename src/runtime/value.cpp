#include "runtime/value.hpp"

#include <algorithm>
#include <cstdio>
#include <functional>

#include "runtime/errors.hpp"
#include "runtime/format.hpp"
#include "runtime/numeric.hpp"
#include "runtime/text.hpp"

namespace mathguard::runtime {
namespace {

// Containers currently being printed; a container that reaches itself again
// prints as "[...]" / "{...}".
thread_local std::vector<const Object*> repr_stack;

class ReprGuard {
public:
    explicit ReprGuard(const Object* object) {
        reentered_ = std::find(repr_stack.begin(), repr_stack.end(), object) != repr_stack.end();
        if (!reentered_) {
            repr_stack.push_back(object);
        }
    }
    ~ReprGuard() {
        if (!reentered_) {
            repr_stack.pop_back();
        }
    }

    bool reentered() const { return reentered_; }

private:
    bool reentered_ = false;
};

std::string JoinRepr(const std::vector<Value>& items) {
    std::string out;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += Repr(items[i]);
    }
    return out;
}

std::string StringRepr(const std::string& value) {
    const bool has_single = value.find('\'') != std::string::npos;
    const bool has_double = value.find('"') != std::string::npos;
    const char quote = has_single && !has_double ? '"' : '\'';
    std::string out(1, quote);
    for (unsigned char c : value) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c == static_cast<unsigned char>(quote)) {
                    out.push_back('\\');
                    out.push_back(static_cast<char>(c));
                } else if (c < 0x20 || c == 0x7F) {
                    char buffer[8];
                    std::snprintf(buffer, sizeof(buffer), "\\x%02x", c);
                    out += buffer;
                } else {
                    out.push_back(static_cast<char>(c));
                }
        }
    }
    out.push_back(quote);
    return out;
}

std::size_t Combine(std::size_t seed, std::size_t value) {
    return seed ^ (value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
}

bool SequencesEqual(const std::vector<Value>& a, const std::vector<Value>& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (!Identical(a[i], b[i]) && !Equals(a[i], b[i])) {
            return false;
        }
    }
    return true;
}

}  // namespace

Value Value::Bool(bool value) {
    Value out;
    out.kind_ = ValueKind::kBool;
    out.data_ = value;
    return out;
}

Value Value::Int(BigInt value) {
    Value out;
    out.kind_ = ValueKind::kInt;
    out.data_ = std::move(value);
    return out;
}

Value Value::Int(long long value) {
    return Int(BigInt(value));
}

Value Value::Float(double value) {
    Value out;
    out.kind_ = ValueKind::kFloat;
    out.data_ = value;
    return out;
}

Value Value::Complex(std::complex<double> value) {
    Value out;
    out.kind_ = ValueKind::kComplex;
    out.data_ = value;
    return out;
}

Value Value::Str(std::string value) {
    auto object = std::make_shared<StrObject>();
    object->value = std::move(value);
    return FromObject(ValueKind::kStr, std::move(object));
}

Value Value::List(std::vector<Value> items) {
    auto object = std::make_shared<ListObject>();
    object->items = std::move(items);
    return FromObject(ValueKind::kList, std::move(object));
}

Value Value::Tuple(std::vector<Value> items) {
    auto object = std::make_shared<TupleObject>();
    object->items = std::move(items);
    return FromObject(ValueKind::kTuple, std::move(object));
}

Value Value::Dict() {
    return FromObject(ValueKind::kDict, std::make_shared<DictObject>());
}

Value Value::Set(ValueKind kind) {
    return FromObject(kind, std::make_shared<SetObject>());
}

Value Value::Fraction(Rational value) {
    auto object = std::make_shared<FractionObject>();
    object->value = std::move(value);
    return FromObject(ValueKind::kFraction, std::move(object));
}

Value Value::Decimal(const runtime::Decimal& value) {
    auto object = std::make_shared<DecimalObject>();
    object->value = value;
    return FromObject(ValueKind::kDecimal, std::move(object));
}

Value Value::FromObject(ValueKind kind, std::shared_ptr<Object> object) {
    Value out;
    out.kind_ = kind;
    out.data_ = std::move(object);
    return out;
}

const std::string& Value::AsStr() const {
    return As<StrObject>().value;
}

const Object* Value::identity() const {
    if (const auto* object = std::get_if<std::shared_ptr<Object>>(&data_)) {
        return object->get();
    }
    return nullptr;
}

Value* DictStorage::Find(const Value& key) {
    const auto index = IndexOf(key, Hash(key));
    return index < 0 ? nullptr : &entries_[static_cast<std::size_t>(index)].value;
}

const Value* DictStorage::Find(const Value& key) const {
    const auto index = IndexOf(key, Hash(key));
    return index < 0 ? nullptr : &entries_[static_cast<std::size_t>(index)].value;
}

void DictStorage::Set(const Value& key, Value value) {
    const auto hash = Hash(key);
    const auto index = IndexOf(key, hash);
    if (index >= 0) {
        entries_[static_cast<std::size_t>(index)].value = std::move(value);
        return;
    }
    entries_.push_back(Entry{key, std::move(value), hash, true});
    index_.emplace(hash, entries_.size() - 1);
    ++live_;
}

bool DictStorage::Erase(const Value& key) {
    const auto hash = Hash(key);
    const auto index = IndexOf(key, hash);
    if (index < 0) {
        return false;
    }
    const auto position = static_cast<std::size_t>(index);
    auto range = index_.equal_range(hash);
    for (auto it = range.first; it != range.second; ++it) {
        if (it->second == position) {
            index_.erase(it);
            break;
        }
    }
    entries_[position] = Entry{};
    entries_[position].live = false;
    --live_;
    if (entries_.size() > 32 && live_ * 2 < entries_.size()) {
        Compact();
    }
    return true;
}

bool DictStorage::PopLast(Value& key, Value& value) {
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        if (it->live) {
            key = it->key;
            value = it->value;
            Erase(key);
            return true;
        }
    }
    return false;
}

void DictStorage::Clear() {
    entries_.clear();
    index_.clear();
    live_ = 0;
}

std::vector<Value> DictStorage::Keys() const {
    std::vector<Value> out;
    out.reserve(live_);
    for (const auto& entry : entries_) {
        if (entry.live) {
            out.push_back(entry.key);
        }
    }
    return out;
}

std::vector<Value> DictStorage::Values() const {
    std::vector<Value> out;
    out.reserve(live_);
    for (const auto& entry : entries_) {
        if (entry.live) {
            out.push_back(entry.value);
        }
    }
    return out;
}

std::vector<std::pair<Value, Value>> DictStorage::Items() const {
    std::vector<std::pair<Value, Value>> out;
    out.reserve(live_);
    for (const auto& entry : entries_) {
        if (entry.live) {
            out.emplace_back(entry.key, entry.value);
        }
    }
    return out;
}

std::ptrdiff_t DictStorage::IndexOf(const Value& key, std::size_t hash) const {
    auto range = index_.equal_range(hash);
    for (auto it = range.first; it != range.second; ++it) {
        const auto& entry = entries_[it->second];
        if (entry.live && (Identical(entry.key, key) || Equals(entry.key, key))) {
            return static_cast<std::ptrdiff_t>(it->second);
        }
    }
    return -1;
}

void DictStorage::Compact() {
    std::vector<Entry> kept;
    kept.reserve(live_);
    index_.clear();
    for (auto& entry : entries_) {
        if (entry.live) {
            index_.emplace(entry.hash, kept.size());
            kept.push_back(std::move(entry));
        }
    }
    entries_ = std::move(kept);
}

long long RangeObject::Length() const {
    if (step > 0 && start < stop) {
        return (stop - start - 1) / step + 1;
    }
    if (step < 0 && start > stop) {
        return (start - stop - 1) / (-step) + 1;
    }
    return 0;
}

Value MakeBuiltin(std::string name, NativeFn fn, std::string owner) {
    auto object = std::make_shared<BuiltinObject>();
    object->name = std::move(name);
    object->fn = std::move(fn);
    object->owner = std::move(owner);
    return Value::FromObject(ValueKind::kBuiltin, std::move(object));
}

Value MakeIterator(std::shared_ptr<Iterator> iterator) {
    return Value::FromObject(ValueKind::kIterator, std::move(iterator));
}

std::string TypeName(const Value& value) {
    switch (value.kind()) {
        case ValueKind::kNone: return "NoneType";
        case ValueKind::kBool: return "bool";
        case ValueKind::kInt: return "int";
        case ValueKind::kFloat: return "float";
        case ValueKind::kComplex: return "complex";
        case ValueKind::kStr: return "str";
        case ValueKind::kList: return "list";
        case ValueKind::kTuple: return "tuple";
        case ValueKind::kDict: return "dict";
        case ValueKind::kSet: return "set";
        case ValueKind::kFrozenSet: return "frozenset";
        case ValueKind::kRange: return "range";
        case ValueKind::kFraction: return "Fraction";
        case ValueKind::kDecimal: return "Decimal";
        case ValueKind::kFunction: return "function";
        case ValueKind::kBuiltin: return "builtin_function_or_method";
        case ValueKind::kModule: return "module";
        case ValueKind::kType: return "type";
        case ValueKind::kIterator: return value.As<Iterator>().Name();
    }
    return "object";
}

bool Truthy(const Value& value) {
    switch (value.kind()) {
        case ValueKind::kNone: return false;
        case ValueKind::kBool: return value.AsBool();
        case ValueKind::kInt: return value.AsInt() != 0;
        case ValueKind::kFloat: return value.AsFloat() != 0.0;
        case ValueKind::kComplex: return value.AsComplex() != std::complex<double>(0.0, 0.0);
        case ValueKind::kStr: return !value.AsStr().empty();
        case ValueKind::kList: return !value.As<ListObject>().items.empty();
        case ValueKind::kTuple: return !value.As<TupleObject>().items.empty();
        case ValueKind::kDict: return value.As<DictObject>().entries.size() > 0;
        case ValueKind::kSet:
        case ValueKind::kFrozenSet: return value.As<SetObject>().entries.size() > 0;
        case ValueKind::kRange: return value.As<RangeObject>().Length() > 0;
        case ValueKind::kFraction: return value.As<FractionObject>().value != 0;
        case ValueKind::kDecimal: return !value.As<DecimalObject>().value.IsZero();
        default: return true;
    }
}

std::string Repr(const Value& value) {
    switch (value.kind()) {
        case ValueKind::kNone: return "None";
        case ValueKind::kBool: return value.AsBool() ? "True" : "False";
        case ValueKind::kInt: return value.AsInt().str();
        case ValueKind::kFloat: return FloatRepr(value.AsFloat());
        case ValueKind::kComplex: return ComplexRepr(value.AsComplex());
        case ValueKind::kStr: return StringRepr(value.AsStr());
        case ValueKind::kList: {
            ReprGuard guard(value.identity());
            if (guard.reentered()) {
                return "[...]";
            }
            return "[" + JoinRepr(value.As<ListObject>().items) + "]";
        }
        case ValueKind::kTuple: {
            const auto& items = value.As<TupleObject>().items;
            ReprGuard guard(value.identity());
            if (guard.reentered()) {
                return "(...)";
            }
            if (items.size() == 1) {
                return "(" + Repr(items[0]) + ",)";
            }
            return "(" + JoinRepr(items) + ")";
        }
        case ValueKind::kDict: {
            ReprGuard guard(value.identity());
            if (guard.reentered()) {
                return "{...}";
            }
            std::string out = "{";
            bool first = true;
            for (const auto& [key, item] : value.As<DictObject>().entries.Items()) {
                if (!first) {
                    out += ", ";
                }
                out += Repr(key) + ": " + Repr(item);
                first = false;
            }
            return out + "}";
        }
        case ValueKind::kSet:
        case ValueKind::kFrozenSet: {
            const auto keys = value.As<SetObject>().entries.Keys();
            const bool frozen = value.Is(ValueKind::kFrozenSet);
            if (keys.empty()) {
                return frozen ? "frozenset()" : "set()";
            }
            ReprGuard guard(value.identity());
            const std::string body = guard.reentered() ? "..." : JoinRepr(keys);
            return frozen ? "frozenset({" + body + "})" : "{" + body + "}";
        }
        case ValueKind::kRange: {
            const auto& range = value.As<RangeObject>();
            std::string out = "range(" + std::to_string(range.start) + ", " + std::to_string(range.stop);
            if (range.step != 1) {
                out += ", " + std::to_string(range.step);
            }
            return out + ")";
        }
        case ValueKind::kFraction: {
            const auto& fraction = value.As<FractionObject>().value;
            return "Fraction(" + BigInt(numerator(fraction)).str() + ", " + BigInt(denominator(fraction)).str() + ")";
        }
        case ValueKind::kDecimal: return value.As<DecimalObject>().value.Repr();
        case ValueKind::kFunction: return "<function " + value.As<FunctionObject>().name + ">";
        case ValueKind::kBuiltin: {
            const auto& builtin = value.As<BuiltinObject>();
            if (!builtin.owner.empty()) {
                return "<built-in method " + builtin.name + " of " + builtin.owner + " object>";
            }
            return "<built-in function " + builtin.name + ">";
        }
        case ValueKind::kModule: return "<module '" + value.As<ModuleObject>().name + "'>";
        case ValueKind::kType: return "<class '" + value.As<TypeObject>().name + "'>";
        case ValueKind::kIterator: return "<" + value.As<Iterator>().Name() + " object>";
    }
    return "<object>";
}

std::string Str(const Value& value) {
    switch (value.kind()) {
        case ValueKind::kStr: return value.AsStr();
        case ValueKind::kFraction: {
            const auto& fraction = value.As<FractionObject>().value;
            if (denominator(fraction) == 1) {
                return BigInt(numerator(fraction)).str();
            }
            return BigInt(numerator(fraction)).str() + "/" + BigInt(denominator(fraction)).str();
        }
        case ValueKind::kDecimal: return value.As<DecimalObject>().value.ToString();
        default: return Repr(value);
    }
}

std::size_t Hash(const Value& value) {
    switch (value.kind()) {
        case ValueKind::kNone: return 0x5bd1e995;
        case ValueKind::kBool:
        case ValueKind::kInt:
        case ValueKind::kFloat:
        case ValueKind::kComplex:
        case ValueKind::kFraction:
        case ValueKind::kDecimal:
            return HashNumber(value);
        case ValueKind::kStr: return std::hash<std::string>()(value.AsStr());
        case ValueKind::kTuple: {
            std::size_t seed = 0x345678;
            for (const auto& item : value.As<TupleObject>().items) {
                seed = Combine(seed, Hash(item));
            }
            return seed;
        }
        case ValueKind::kFrozenSet: {
            std::size_t seed = 0x1f2e3d;
            for (const auto& key : value.As<SetObject>().entries.Keys()) {
                seed ^= Hash(key) * 0x100000001b3ULL;
            }
            return seed;
        }
        case ValueKind::kRange: {
            const auto& range = value.As<RangeObject>();
            const auto length = range.Length();
            std::size_t seed = std::hash<long long>()(length);
            if (length > 0) {
                seed = Combine(seed, std::hash<long long>()(range.start));
                seed = Combine(seed, std::hash<long long>()(range.step));
            }
            return seed;
        }
        case ValueKind::kList:
        case ValueKind::kDict:
        case ValueKind::kSet:
            throw TypeError("unhashable type: '" + TypeName(value) + "'");
        default:
            return std::hash<const void*>()(value.identity());
    }
}

bool Identical(const Value& lhs, const Value& rhs) {
    if (lhs.kind() != rhs.kind()) {
        return false;
    }
    switch (lhs.kind()) {
        case ValueKind::kNone: return true;
        case ValueKind::kBool: return lhs.AsBool() == rhs.AsBool();
        case ValueKind::kInt: return lhs.AsInt() == rhs.AsInt();
        case ValueKind::kFloat: return lhs.AsFloat() == rhs.AsFloat();
        case ValueKind::kComplex: return lhs.AsComplex() == rhs.AsComplex();
        default: return lhs.identity() == rhs.identity();
    }
}

bool Equals(const Value& lhs, const Value& rhs) {
    if (IsNumber(lhs) && IsNumber(rhs)) {
        return NumbersEqual(lhs, rhs);
    }
    switch (lhs.kind()) {
        case ValueKind::kNone: return rhs.IsNone();
        case ValueKind::kStr: return rhs.Is(ValueKind::kStr) && lhs.AsStr() == rhs.AsStr();
        case ValueKind::kList:
            return rhs.Is(ValueKind::kList) &&
                SequencesEqual(lhs.As<ListObject>().items, rhs.As<ListObject>().items);
        case ValueKind::kTuple:
            return rhs.Is(ValueKind::kTuple) &&
                SequencesEqual(lhs.As<TupleObject>().items, rhs.As<TupleObject>().items);
        case ValueKind::kDict: {
            if (!rhs.Is(ValueKind::kDict)) {
                return false;
            }
            const auto& a = lhs.As<DictObject>().entries;
            const auto& b = rhs.As<DictObject>().entries;
            if (a.size() != b.size()) {
                return false;
            }
            for (const auto& [key, item] : a.Items()) {
                const auto* other = b.Find(key);
                if (!other || (!Identical(item, *other) && !Equals(item, *other))) {
                    return false;
                }
            }
            return true;
        }
        case ValueKind::kSet:
        case ValueKind::kFrozenSet: {
            if (!rhs.Is(ValueKind::kSet) && !rhs.Is(ValueKind::kFrozenSet)) {
                return false;
            }
            const auto& a = lhs.As<SetObject>().entries;
            const auto& b = rhs.As<SetObject>().entries;
            if (a.size() != b.size()) {
                return false;
            }
            for (const auto& key : a.Keys()) {
                if (!b.Find(key)) {
                    return false;
                }
            }
            return true;
        }
        case ValueKind::kRange: {
            if (!rhs.Is(ValueKind::kRange)) {
                return false;
            }
            const auto& a = lhs.As<RangeObject>();
            const auto& b = rhs.As<RangeObject>();
            const auto length = a.Length();
            if (length != b.Length()) {
                return false;
            }
            if (length == 0) {
                return true;
            }
            return a.start == b.start && (length == 1 || a.step == b.step);
        }
        default:
            return Identical(lhs, rhs);
    }
}

const std::vector<Value>& Items(const Value& sequence) {
    if (sequence.Is(ValueKind::kList)) {
        return sequence.As<ListObject>().items;
    }
    return sequence.As<TupleObject>().items;
}

}  // namespace mathguard::runtime
