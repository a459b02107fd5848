#pragma once

#include <boost/multiprecision/cpp_int.hpp>

#include <complex>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "lang/ast.hpp"
#include "runtime/decimal.hpp"

namespace mathguard::runtime {

using BigInt = boost::multiprecision::cpp_int;
using Rational = boost::multiprecision::cpp_rational;

class Interpreter;
struct Frame;

enum class ValueKind {
    kNone,
    kBool,
    kInt,
    kFloat,
    kComplex,
    kStr,
    kList,
    kTuple,
    kDict,
    kSet,
    kFrozenSet,
    kRange,
    kFraction,
    kDecimal,
    kFunction,
    kBuiltin,
    kModule,
    kType,
    kIterator
};

struct Object {
    virtual ~Object() = default;
};

class Value {
public:
    Value() = default;

    static Value Bool(bool value);
    static Value Int(BigInt value);
    static Value Int(long long value);
    static Value Float(double value);
    static Value Complex(std::complex<double> value);
    static Value Str(std::string value);
    static Value List(std::vector<Value> items = {});
    static Value Tuple(std::vector<Value> items = {});
    static Value Dict();
    static Value Set(ValueKind kind = ValueKind::kSet);
    static Value Fraction(Rational value);
    static Value Decimal(const runtime::Decimal& value);
    static Value FromObject(ValueKind kind, std::shared_ptr<Object> object);

    ValueKind kind() const { return kind_; }
    bool IsNone() const { return kind_ == ValueKind::kNone; }
    bool Is(ValueKind kind) const { return kind_ == kind; }

    bool AsBool() const { return std::get<bool>(data_); }
    const BigInt& AsInt() const { return std::get<BigInt>(data_); }
    double AsFloat() const { return std::get<double>(data_); }
    std::complex<double> AsComplex() const { return std::get<std::complex<double>>(data_); }
    const std::string& AsStr() const;

    template <class T>
    T& As() const {
        return static_cast<T&>(*std::get<std::shared_ptr<Object>>(data_));
    }
    template <class T>
    std::shared_ptr<T> Share() const {
        return std::static_pointer_cast<T>(std::get<std::shared_ptr<Object>>(data_));
    }
    const Object* identity() const;

private:
    ValueKind kind_ = ValueKind::kNone;
    std::variant<std::monostate, bool, BigInt, double, std::complex<double>, std::shared_ptr<Object>> data_;
};

struct CallArgs {
    std::vector<Value> positional;
    std::vector<std::pair<std::string, Value>> keywords;
};

using NativeFn = std::function<Value(Interpreter&, CallArgs&)>;

// Insertion-ordered hash table keyed by script values. Backs dict, set and
// frozenset.
class DictStorage {
public:
    Value* Find(const Value& key);
    const Value* Find(const Value& key) const;
    // Inserts, or replaces the value and keeps the original key.
    void Set(const Value& key, Value value);
    bool Erase(const Value& key);
    bool PopLast(Value& key, Value& value);
    void Clear();

    std::size_t size() const { return live_; }
    std::vector<Value> Keys() const;
    std::vector<Value> Values() const;
    std::vector<std::pair<Value, Value>> Items() const;

private:
    struct Entry {
        Value key;
        Value value;
        std::size_t hash = 0;
        bool live = true;
    };

    std::ptrdiff_t IndexOf(const Value& key, std::size_t hash) const;
    void Compact();

    std::vector<Entry> entries_;
    std::unordered_multimap<std::size_t, std::size_t> index_;
    std::size_t live_ = 0;
};

struct StrObject : Object {
    std::string value;
};

struct ListObject : Object {
    std::vector<Value> items;
};

struct TupleObject : Object {
    std::vector<Value> items;
};

struct DictObject : Object {
    DictStorage entries;
};

struct SetObject : Object {
    DictStorage entries;
};

struct RangeObject : Object {
    long long start = 0;
    long long stop = 0;
    long long step = 1;

    long long Length() const;
    long long At(long long index) const { return start + index * step; }
};

struct FractionObject : Object {
    Rational value;
};

struct DecimalObject : Object {
    runtime::Decimal value;
};

struct FunctionObject : Object {
    std::string name;
    const lang::Arguments* args = nullptr;
    // Exactly one of body (def) and expression (lambda) is set.
    const lang::Block* body = nullptr;
    const lang::Expr* expression = nullptr;
    std::vector<Value> defaults;
    std::vector<Value> kw_defaults;
    std::vector<bool> has_kw_default;
    std::shared_ptr<Frame> closure;
    std::shared_ptr<const std::set<std::string>> locals;
};

struct BuiltinObject : Object {
    std::string name;
    NativeFn fn;
    // Receiver type for bound methods ("list", "str", ...); empty otherwise.
    std::string owner;
    std::map<std::string, Value> attributes;
};

struct ModuleObject : Object {
    std::string name;
    std::map<std::string, Value> members;
};

struct TypeObject : Object {
    std::string name;
    NativeFn construct;
    std::function<bool(const Value&)> matches;
    std::map<std::string, Value> attributes;
};

class Iterator : public Object {
public:
    // Produces the next element into `out`; false once exhausted.
    virtual bool Next(Interpreter& interp, Value& out) = 0;
    virtual std::string Name() const = 0;
};

Value MakeBuiltin(std::string name, NativeFn fn, std::string owner = {});
Value MakeIterator(std::shared_ptr<Iterator> iterator);

// Python-visible type name used in error messages.
std::string TypeName(const Value& value);
bool Truthy(const Value& value);
std::string Repr(const Value& value);
std::string Str(const Value& value);
// Throws TypeError for unhashable values.
std::size_t Hash(const Value& value);
bool Equals(const Value& lhs, const Value& rhs);
bool Identical(const Value& lhs, const Value& rhs);

// Elements of list/tuple values.
const std::vector<Value>& Items(const Value& sequence);

}  // namespace mathguard::runtime
