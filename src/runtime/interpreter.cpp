#include "runtime/interpreter.hpp"

#include <algorithm>
#include <climits>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <utility>

#include "lang/parser.hpp"
#include "lang/scope.hpp"
#include "runtime/builtins.hpp"
#include "runtime/errors.hpp"
#include "runtime/format.hpp"
#include "runtime/iterators.hpp"
#include "runtime/numeric.hpp"
#include "runtime/text.hpp"
#include "utils/common.hpp"

namespace mathguard::runtime {
namespace {

// Nested evaluation guard for the native stack; script-level recursion is
// bounded separately by Limits::max_recursion_depth.
constexpr int kMaxEvalDepth = 3000;

class DepthGuard {
public:
    explicit DepthGuard(int& depth) : depth_(depth) { ++depth_; }
    ~DepthGuard() { --depth_; }

private:
    int& depth_;
};

ScriptError RecursionLimit() {
    return ScriptError("RecursionError", "maximum recursion depth exceeded");
}

ScriptError Unsupported(const std::string& what) {
    return ScriptError("SyntaxError", what + " is not supported");
}

std::string QuoteList(const std::vector<std::string>& names) {
    std::string out;
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (i > 0) {
            out += (i + 1 == names.size()) ? (names.size() > 2 ? ", and " : " and ") : ", ";
        }
        out += "'" + names[i] + "'";
    }
    return out;
}

std::string Plural(std::size_t count, const std::string& noun) {
    return std::to_string(count) + " " + noun + (count == 1 ? "" : "s");
}

bool IsSetKind(const Value& value) {
    return value.Is(ValueKind::kSet) || value.Is(ValueKind::kFrozenSet);
}

const std::string& IndexKindName(const Value& sequence) {
    static const std::string kList = "list";
    static const std::string kTuple = "tuple";
    static const std::string kStr = "string";
    static const std::string kRange = "range object";
    switch (sequence.kind()) {
        case ValueKind::kList: return kList;
        case ValueKind::kTuple: return kTuple;
        case ValueKind::kStr: return kStr;
        default: return kRange;
    }
}

// Clamps an arbitrary-precision slice bound into the 64-bit range; bounds
// that far out behave the same as the clamp.
long long SliceBound(const Value& value) {
    if (!IsIntegral(value)) {
        throw TypeError("slice indices must be integers or None or have an __index__ method");
    }
    const BigInt big = ToBigInt(value);
    constexpr long long kClamp = LLONG_MAX / 4;
    if (big > kClamp) {
        return kClamp;
    }
    if (big < -kClamp) {
        return -kClamp;
    }
    return big.convert_to<long long>();
}

struct SliceBounds {
    long long start = 0;
    long long step = 1;
    long long length = 0;
};

SliceBounds ResolveSlice(const Value& lower, const Value& upper, const Value& step, long long length) {
    SliceBounds out;
    if (!step.IsNone()) {
        out.step = SliceBound(step);
        if (out.step == 0) {
            throw ValueError("slice step cannot be zero");
        }
    }
    const bool backwards = out.step < 0;
    auto adjust = [&](const Value& bound, long long fallback) {
        if (bound.IsNone()) {
            return fallback;
        }
        long long index = SliceBound(bound);
        if (index < 0) {
            index += length;
            if (index < 0) {
                index = backwards ? -1 : 0;
            }
        } else if (index >= length) {
            index = backwards ? length - 1 : length;
        }
        return index;
    };
    out.start = adjust(lower, backwards ? length - 1 : 0);
    const long long stop = adjust(upper, backwards ? -1 : length);
    if (backwards) {
        out.length = stop < out.start ? (out.start - stop - 1) / (-out.step) + 1 : 0;
    } else {
        out.length = out.start < stop ? (stop - out.start - 1) / out.step + 1 : 0;
    }
    return out;
}

long long SequenceIndex(const Value& sequence, const Value& index, long long length) {
    if (!IsIntegral(index)) {
        throw TypeError(std::string(sequence.Is(ValueKind::kStr) ? "string" : TypeName(sequence)) +
                        " indices must be integers or slices, not " + TypeName(index));
    }
    const BigInt big = ToBigInt(index);
    BigInt position = big < 0 ? big + length : big;
    if (position < 0 || position >= length) {
        throw IndexError(IndexKindName(sequence) + " index out of range");
    }
    return position.convert_to<long long>();
}

bool RangeContains(const RangeObject& range, const BigInt& value) {
    const BigInt start = range.start;
    const BigInt stop = range.stop;
    const BigInt step = range.step;
    if (range.step > 0) {
        return value >= start && value < stop && (value - start) % step == 0;
    }
    return value <= start && value > stop && (start - value) % (-step) == 0;
}

// ascii(): repr with every non-ASCII code point escaped.
std::string AsciiRepr(const Value& value) {
    const std::string repr = Repr(value);
    if (text::IsAscii(repr)) {
        return repr;
    }
    std::string out;
    static const char* kHex = "0123456789abcdef";
    for (char32_t code : text::Decode(repr)) {
        if (code < 0x80) {
            out.push_back(static_cast<char>(code));
            continue;
        }
        int digits = code < 0x100 ? 2 : (code < 0x10000 ? 4 : 8);
        out += digits == 2 ? "\\x" : (digits == 4 ? "\\u" : "\\U");
        for (int shift = (digits - 1) * 4; shift >= 0; shift -= 4) {
            out.push_back(kHex[(code >> shift) & 0xF]);
        }
    }
    return out;
}

Value ParseIntLiteral(const std::string& digits, int base) {
    BigInt value = 0;
    for (char c : digits) {
        int digit = 0;
        if (c >= '0' && c <= '9') {
            digit = c - '0';
        } else if (c >= 'a' && c <= 'f') {
            digit = c - 'a' + 10;
        } else if (c >= 'A' && c <= 'F') {
            digit = c - 'A' + 10;
        } else {
            continue;
        }
        value = value * base + digit;
    }
    return Value::Int(std::move(value));
}

Value NewSet(ValueKind kind, const std::vector<Value>& items) {
    Value out = Value::Set(kind);
    auto& entries = out.As<SetObject>().entries;
    for (const auto& item : items) {
        entries.Set(item, Value());
    }
    return out;
}

Value SetOperation(lang::BinaryOperator op, const Value& left, const Value& right) {
    const auto& a = left.As<SetObject>().entries;
    const auto& b = right.As<SetObject>().entries;
    Value out = Value::Set(left.kind());
    auto& result = out.As<SetObject>().entries;
    switch (op) {
        case lang::BinaryOperator::kBitOr:
            for (const auto& key : a.Keys()) {
                result.Set(key, Value());
            }
            for (const auto& key : b.Keys()) {
                result.Set(key, Value());
            }
            break;
        case lang::BinaryOperator::kBitAnd:
            for (const auto& key : a.Keys()) {
                if (b.Find(key) != nullptr) {
                    result.Set(key, Value());
                }
            }
            break;
        case lang::BinaryOperator::kSub:
            for (const auto& key : a.Keys()) {
                if (b.Find(key) == nullptr) {
                    result.Set(key, Value());
                }
            }
            break;
        default:
            for (const auto& key : a.Keys()) {
                if (b.Find(key) == nullptr) {
                    result.Set(key, Value());
                }
            }
            for (const auto& key : b.Keys()) {
                if (a.Find(key) == nullptr) {
                    result.Set(key, Value());
                }
            }
            break;
    }
    return out;
}

bool IsSubset(const DictStorage& a, const DictStorage& b) {
    if (a.size() > b.size()) {
        return false;
    }
    for (const auto& key : a.Keys()) {
        if (b.Find(key) == nullptr) {
            return false;
        }
    }
    return true;
}

const lang::Block& EmptyBlock() {
    static const lang::Block kEmpty;
    return kEmpty;
}

}  // namespace

Interpreter::Interpreter(ExecutionNamespace ns, Limits limits)
    : namespace_(std::move(ns)),
      limits_(limits),
      globals_(std::make_shared<Frame>()),
      random_(std::random_device{}()) {}

Interpreter::~Interpreter() {
    for (auto& weak : closures_) {
        if (auto frame = weak.lock()) {
            frame->vars.clear();
        }
    }
    globals_->vars.clear();
}

void Interpreter::Run(const std::string& source) {
    modules_.push_back(std::make_unique<lang::Module>(lang::Parse(source)));
    Value result;
    switch (ExecBlock(modules_.back()->body, globals_, result)) {
        case Flow::kReturn:
            throw ScriptError("SyntaxError", "'return' outside function");
        case Flow::kBreak:
            throw ScriptError("SyntaxError", "'break' outside loop");
        case Flow::kContinue:
            throw ScriptError("SyntaxError", "'continue' not properly in loop");
        case Flow::kNormal:
            break;
    }
}

Value Interpreter::CallEntryPoint(const std::string& name, std::vector<Value> args) {
    auto it = globals_->vars.find(name);
    if (it == globals_->vars.end()) {
        throw NameError("entry point '" + name + "' is not defined");
    }
    CallArgs call;
    call.positional = std::move(args);
    const Value callee = it->second;
    return Call(callee, std::move(call));
}

void Interpreter::Step() {
    if (++steps_ > limits_.max_steps) {
        throw BudgetExceeded("step budget of " + std::to_string(limits_.max_steps) + " exhausted");
    }
}

void Interpreter::CheckSize(std::size_t size) const {
    if (size > limits_.max_collection_size) {
        throw MemoryError("collection size exceeds " + std::to_string(limits_.max_collection_size));
    }
}

bool Interpreter::Next(Iterator& iterator, Value& out) {
    Step();
    return iterator.Next(*this, out);
}

void Interpreter::ForEach(const Value& iterable, const std::function<void(const Value&)>& fn) {
    auto iterator = GetIterator(iterable);
    Value item;
    while (Next(*iterator, item)) {
        fn(item);
    }
}

std::vector<Value> Interpreter::Collect(const Value& iterable) {
    std::vector<Value> out;
    auto iterator = GetIterator(iterable);
    Value item;
    while (Next(*iterator, item)) {
        out.push_back(std::move(item));
        CheckSize(out.size());
    }
    return out;
}

// ---------------------------------------------------------------------------
// Statements

Interpreter::Flow Interpreter::ExecBlock(const lang::Block& block,
                                         const std::shared_ptr<Frame>& frame,
                                         Value& result) {
    for (const auto& stmt : block) {
        const Flow flow = Exec(*stmt, frame, result);
        if (flow != Flow::kNormal) {
            return flow;
        }
    }
    return Flow::kNormal;
}

Interpreter::Flow Interpreter::Exec(const lang::Stmt& stmt, const std::shared_ptr<Frame>& frame, Value& result) {
    using lang::StmtKind;
    Step();
    switch (stmt.kind) {
        case StmtKind::kExpr:
            Eval(*static_cast<const lang::ExprStmt&>(stmt).value, frame);
            return Flow::kNormal;
        case StmtKind::kAssign: {
            const auto& node = static_cast<const lang::AssignStmt&>(stmt);
            const Value value = Eval(*node.value, frame);
            for (const auto& target : node.targets) {
                Assign(*target, value, frame);
            }
            return Flow::kNormal;
        }
        case StmtKind::kAugAssign:
            AugAssign(static_cast<const lang::AugAssignStmt&>(stmt), frame);
            return Flow::kNormal;
        case StmtKind::kAnnAssign: {
            const auto& node = static_cast<const lang::AnnAssignStmt&>(stmt);
            if (node.value) {
                Assign(*node.target, Eval(*node.value, frame), frame);
            }
            return Flow::kNormal;
        }
        case StmtKind::kFunctionDef: {
            const auto& node = static_cast<const lang::FunctionDefStmt&>(stmt);
            if (!node.decorators.empty() || node.is_async) {
                throw Unsupported(lang::Describe(stmt));
            }
            StoreName(node.name, MakeFunction(node.name, node.args, &node.body, nullptr, frame), *frame);
            return Flow::kNormal;
        }
        case StmtKind::kReturn: {
            const auto& node = static_cast<const lang::ReturnStmt&>(stmt);
            result = node.value ? Eval(*node.value, frame) : Value();
            return Flow::kReturn;
        }
        case StmtKind::kIf: {
            const auto& node = static_cast<const lang::IfStmt&>(stmt);
            if (Truthy(Eval(*node.test, frame))) {
                return ExecBlock(node.body, frame, result);
            }
            return ExecBlock(node.orelse, frame, result);
        }
        case StmtKind::kFor:
            return ExecFor(static_cast<const lang::ForStmt&>(stmt), frame, result);
        case StmtKind::kWhile:
            return ExecWhile(static_cast<const lang::WhileStmt&>(stmt), frame, result);
        case StmtKind::kBreak:
            return Flow::kBreak;
        case StmtKind::kContinue:
            return Flow::kContinue;
        case StmtKind::kPass:
            return Flow::kNormal;
        case StmtKind::kImport:
            ExecImport(static_cast<const lang::ImportStmt&>(stmt), *frame);
            return Flow::kNormal;
        case StmtKind::kImportFrom:
            ExecImportFrom(static_cast<const lang::ImportFromStmt&>(stmt), *frame);
            return Flow::kNormal;
        default:
            throw Unsupported(lang::Describe(stmt));
    }
}

Interpreter::Flow Interpreter::ExecFor(const lang::ForStmt& stmt, const std::shared_ptr<Frame>& frame, Value& result) {
    if (stmt.is_async) {
        throw Unsupported(lang::Describe(stmt));
    }
    const Value iterable = Eval(*stmt.iter, frame);
    auto iterator = GetIterator(iterable);
    Value item;
    while (Next(*iterator, item)) {
        Assign(*stmt.target, item, frame);
        const Flow flow = ExecBlock(stmt.body, frame, result);
        if (flow == Flow::kBreak) {
            return Flow::kNormal;
        }
        if (flow == Flow::kReturn) {
            return flow;
        }
    }
    return ExecBlock(stmt.orelse, frame, result);
}

Interpreter::Flow Interpreter::ExecWhile(const lang::WhileStmt& stmt,
                                         const std::shared_ptr<Frame>& frame,
                                         Value& result) {
    while (true) {
        Step();
        if (!Truthy(Eval(*stmt.test, frame))) {
            break;
        }
        const Flow flow = ExecBlock(stmt.body, frame, result);
        if (flow == Flow::kBreak) {
            return Flow::kNormal;
        }
        if (flow == Flow::kReturn) {
            return flow;
        }
    }
    return ExecBlock(stmt.orelse, frame, result);
}

void Interpreter::ExecImport(const lang::ImportStmt& stmt, Frame& frame) {
    for (const auto& alias : stmt.names) {
        auto it = namespace_.modules.find(alias.name);
        if (it == namespace_.modules.end()) {
            throw ScriptError("ModuleNotFoundError", "No module named '" + alias.name + "'");
        }
        StoreName(alias.asname.empty() ? alias.name : alias.asname, it->second, frame);
    }
}

void Interpreter::ExecImportFrom(const lang::ImportFromStmt& stmt, Frame& frame) {
    if (stmt.level > 0) {
        throw ScriptError("ImportError", "attempted relative import with no known parent package");
    }
    auto it = namespace_.modules.find(stmt.module);
    if (it == namespace_.modules.end()) {
        throw ScriptError("ModuleNotFoundError", "No module named '" + stmt.module + "'");
    }
    const auto& module = it->second.As<ModuleObject>();
    for (const auto& alias : stmt.names) {
        if (alias.name == "*") {
            throw ScriptError("ImportError", "wildcard import from '" + stmt.module + "' is not supported");
        }
        auto member = module.members.find(alias.name);
        if (member == module.members.end()) {
            throw ScriptError("ImportError",
                              "cannot import name '" + alias.name + "' from '" + stmt.module + "'");
        }
        StoreName(alias.asname.empty() ? alias.name : alias.asname, member->second, frame);
    }
}

// ---------------------------------------------------------------------------
// Binding

void Interpreter::Assign(const lang::Expr& target, const Value& value, const std::shared_ptr<Frame>& frame) {
    using lang::ExprKind;
    switch (target.kind) {
        case ExprKind::kName:
            StoreName(static_cast<const lang::NameExpr&>(target).id, value, *frame);
            return;
        case ExprKind::kTuple:
        case ExprKind::kList: {
            const auto& elts = static_cast<const lang::SequenceExpr&>(target).elts;
            std::vector<Value> items = Collect(value);
            std::size_t star = elts.size();
            for (std::size_t i = 0; i < elts.size(); ++i) {
                if (elts[i]->kind == ExprKind::kStarred) {
                    if (star != elts.size()) {
                        throw ScriptError("SyntaxError", "multiple starred expressions in assignment");
                    }
                    star = i;
                }
            }
            if (star == elts.size()) {
                if (items.size() > elts.size()) {
                    throw ValueError("too many values to unpack (expected " + std::to_string(elts.size()) + ")");
                }
                if (items.size() < elts.size()) {
                    throw ValueError("not enough values to unpack (expected " + std::to_string(elts.size()) +
                                     ", got " + std::to_string(items.size()) + ")");
                }
                for (std::size_t i = 0; i < elts.size(); ++i) {
                    Assign(*elts[i], items[i], frame);
                }
                return;
            }
            const std::size_t fixed = elts.size() - 1;
            if (items.size() < fixed) {
                throw ValueError("not enough values to unpack (expected at least " + std::to_string(fixed) +
                                 ", got " + std::to_string(items.size()) + ")");
            }
            const std::size_t rest = items.size() - fixed;
            for (std::size_t i = 0; i < star; ++i) {
                Assign(*elts[i], items[i], frame);
            }
            std::vector<Value> starred(items.begin() + static_cast<std::ptrdiff_t>(star),
                                       items.begin() + static_cast<std::ptrdiff_t>(star + rest));
            Assign(*static_cast<const lang::StarredExpr&>(*elts[star]).value, Value::List(std::move(starred)), frame);
            for (std::size_t i = star + 1; i < elts.size(); ++i) {
                Assign(*elts[i], items[i - 1 + rest], frame);
            }
            return;
        }
        case ExprKind::kSubscript: {
            const auto& node = static_cast<const lang::SubscriptExpr&>(target);
            const Value object = Eval(*node.value, frame);
            if (node.slice->kind == ExprKind::kSlice) {
                AssignSlice(object, static_cast<const lang::SliceExpr&>(*node.slice), value, frame);
            } else {
                StoreSubscript(object, Eval(*node.slice, frame), value);
            }
            return;
        }
        case ExprKind::kStarred:
            throw ScriptError("SyntaxError", "starred assignment target must be in a list or tuple");
        default:
            throw Unsupported("assignment to " + lang::Describe(target));
    }
}

void Interpreter::StoreName(const std::string& name, const Value& value, Frame& frame) {
    Frame* target = &frame;
    while (target->locals && target->locals->count(name) == 0 && target->parent) {
        target = target->parent.get();
    }
    target->vars[name] = value;
}

void Interpreter::StoreSubscript(const Value& object, const Value& index, const Value& value) {
    switch (object.kind()) {
        case ValueKind::kList: {
            auto& items = object.As<ListObject>().items;
            if (!IsIntegral(index)) {
                throw TypeError("list indices must be integers or slices, not " + TypeName(index));
            }
            BigInt position = ToBigInt(index);
            if (position < 0) {
                position += items.size();
            }
            if (position < 0 || position >= items.size()) {
                throw IndexError("list assignment index out of range");
            }
            items[position.convert_to<std::size_t>()] = value;
            return;
        }
        case ValueKind::kDict: {
            auto& entries = object.As<DictObject>().entries;
            entries.Set(index, value);
            CheckSize(entries.size());
            return;
        }
        default:
            throw TypeError("'" + TypeName(object) + "' object does not support item assignment");
    }
}

void Interpreter::AssignSlice(const Value& object,
                              const lang::SliceExpr& slice,
                              const Value& value,
                              const std::shared_ptr<Frame>& frame) {
    const Value lower = slice.lower ? Eval(*slice.lower, frame) : Value();
    const Value upper = slice.upper ? Eval(*slice.upper, frame) : Value();
    const Value step = slice.step ? Eval(*slice.step, frame) : Value();
    if (!object.Is(ValueKind::kList)) {
        throw TypeError("'" + TypeName(object) + "' object does not support item assignment");
    }
    auto& items = object.As<ListObject>().items;
    std::vector<Value> replacement = Collect(value);
    const SliceBounds bounds = ResolveSlice(lower, upper, step, static_cast<long long>(items.size()));
    if (step.IsNone() || bounds.step == 1) {
        const long long stop = std::max(bounds.start, bounds.start + bounds.length);
        auto first = items.begin() + bounds.start;
        items.erase(first, items.begin() + stop);
        CheckSize(items.size() + replacement.size());
        items.insert(items.begin() + bounds.start, replacement.begin(), replacement.end());
        return;
    }
    if (static_cast<long long>(replacement.size()) != bounds.length) {
        throw ValueError("attempt to assign sequence of size " + std::to_string(replacement.size()) +
                         " to extended slice of size " + std::to_string(bounds.length));
    }
    for (long long i = 0; i < bounds.length; ++i) {
        items[static_cast<std::size_t>(bounds.start + i * bounds.step)] = replacement[static_cast<std::size_t>(i)];
    }
}

void Interpreter::AugAssign(const lang::AugAssignStmt& stmt, const std::shared_ptr<Frame>& frame) {
    using lang::BinaryOperator;
    auto combine = [&](const Value& current, const Value& operand) -> Value {
        if (current.Is(ValueKind::kList) && stmt.op == BinaryOperator::kAdd) {
            std::vector<Value> extra = Collect(operand);
            auto& items = current.As<ListObject>().items;
            CheckSize(items.size() + extra.size());
            items.insert(items.end(), extra.begin(), extra.end());
            return current;
        }
        if (current.Is(ValueKind::kList) && stmt.op == BinaryOperator::kMult && IsIntegral(operand)) {
            Value repeated = BinaryOp(stmt.op, current, operand);
            current.As<ListObject>().items = std::move(repeated.As<ListObject>().items);
            return current;
        }
        Value combined = BinaryOp(stmt.op, current, operand);
        if (current.Is(ValueKind::kSet) && combined.Is(ValueKind::kSet)) {
            current.As<SetObject>().entries = std::move(combined.As<SetObject>().entries);
            return current;
        }
        if (current.Is(ValueKind::kDict) && combined.Is(ValueKind::kDict)) {
            current.As<DictObject>().entries = std::move(combined.As<DictObject>().entries);
            return current;
        }
        return combined;
    };

    const lang::Expr& target = *stmt.target;
    switch (target.kind) {
        case lang::ExprKind::kName: {
            const auto& name = static_cast<const lang::NameExpr&>(target).id;
            const Value current = LookupName(name, *frame);
            const Value operand = Eval(*stmt.value, frame);
            StoreName(name, combine(current, operand), *frame);
            return;
        }
        case lang::ExprKind::kSubscript: {
            const auto& node = static_cast<const lang::SubscriptExpr&>(target);
            const Value object = Eval(*node.value, frame);
            if (node.slice->kind == lang::ExprKind::kSlice) {
                const auto& slice = static_cast<const lang::SliceExpr&>(*node.slice);
                const Value current = EvalSlice(object, slice, frame);
                const Value operand = Eval(*stmt.value, frame);
                AssignSlice(object, slice, combine(current, operand), frame);
                return;
            }
            const Value index = Eval(*node.slice, frame);
            const Value current = EvalSubscript(object, index);
            const Value operand = Eval(*stmt.value, frame);
            StoreSubscript(object, index, combine(current, operand));
            return;
        }
        default:
            throw Unsupported("augmented assignment to " + lang::Describe(target));
    }
}

Value Interpreter::LookupName(const std::string& name, const Frame& frame) const {
    const Frame* current = &frame;
    while (current != nullptr) {
        if (!current->locals) {
            auto it = current->vars.find(name);
            if (it != current->vars.end()) {
                return it->second;
            }
            break;
        }
        if (current->locals->count(name) != 0) {
            auto it = current->vars.find(name);
            if (it != current->vars.end()) {
                return it->second;
            }
            if (current == &frame) {
                throw ScriptError("UnboundLocalError",
                                  "cannot access local variable '" + name + "' where it is not associated with a value");
            }
            throw NameError("cannot access free variable '" + name +
                            "' where it is not associated with a value in enclosing scope");
        }
        current = current->parent.get();
    }
    auto builtin = namespace_.builtins.find(name);
    if (builtin != namespace_.builtins.end()) {
        return builtin->second;
    }
    throw NameError("name '" + name + "' is not defined");
}

// ---------------------------------------------------------------------------
// Calls

Value Interpreter::Call(const Value& callee, CallArgs args) {
    Step();
    switch (callee.kind()) {
        case ValueKind::kFunction:
            return CallFunction(callee.As<FunctionObject>(), args);
        case ValueKind::kBuiltin: {
            const auto& builtin = callee.As<BuiltinObject>();
            if (call_depth_ >= limits_.max_recursion_depth) {
                throw RecursionLimit();
            }
            DepthGuard guard(call_depth_);
            return builtin.fn(*this, args);
        }
        case ValueKind::kType: {
            const auto& type = callee.As<TypeObject>();
            if (!type.construct) {
                throw TypeError("cannot create '" + type.name + "' instances");
            }
            return type.construct(*this, args);
        }
        default:
            throw TypeError("'" + TypeName(callee) + "' object is not callable");
    }
}

Value Interpreter::CallFunction(const FunctionObject& function, CallArgs& args) {
    if (call_depth_ >= limits_.max_recursion_depth) {
        throw RecursionLimit();
    }
    DepthGuard guard(call_depth_);

    const lang::Arguments& spec = *function.args;
    const std::string& name = function.name;
    auto frame = std::make_shared<Frame>();
    frame->parent = function.closure;
    frame->locals = function.locals;
    auto& vars = frame->vars;

    const std::size_t declared = spec.positional.size();
    const std::size_t given = args.positional.size();
    if (given > declared && !spec.vararg) {
        const std::size_t required = declared - function.defaults.size();
        std::string takes = required == declared
            ? Plural(declared, "positional argument")
            : "from " + std::to_string(required) + " to " + Plural(declared, "positional argument");
        throw TypeError(name + "() takes " + takes + " but " + std::to_string(given) +
                        (given == 1 ? " was" : " were") + " given");
    }
    for (std::size_t i = 0; i < std::min(given, declared); ++i) {
        vars[spec.positional[i].name] = args.positional[i];
    }
    if (spec.vararg) {
        std::vector<Value> rest;
        if (given > declared) {
            rest.assign(args.positional.begin() + static_cast<std::ptrdiff_t>(declared), args.positional.end());
        }
        vars[spec.vararg->name] = Value::Tuple(std::move(rest));
    }
    Value extra;
    if (spec.kwarg) {
        extra = Value::Dict();
        vars[spec.kwarg->name] = extra;
    }

    for (auto& [keyword, value] : args.keywords) {
        bool bound = false;
        for (const auto& parameter : spec.positional) {
            if (parameter.name == keyword) {
                bound = true;
                break;
            }
        }
        if (!bound) {
            for (const auto& parameter : spec.kwonly) {
                if (parameter.name == keyword) {
                    bound = true;
                    break;
                }
            }
        }
        if (bound) {
            if (vars.count(keyword) != 0) {
                throw TypeError(name + "() got multiple values for argument '" + keyword + "'");
            }
            vars[keyword] = value;
            continue;
        }
        if (!extra.IsNone()) {
            auto& entries = extra.As<DictObject>().entries;
            const Value key = Value::Str(keyword);
            if (entries.Find(key) != nullptr) {
                throw TypeError(name + "() got multiple values for keyword argument '" + keyword + "'");
            }
            entries.Set(key, value);
            continue;
        }
        throw TypeError(name + "() got an unexpected keyword argument '" + keyword + "'");
    }

    std::vector<std::string> missing;
    const std::size_t first_default = declared - function.defaults.size();
    for (std::size_t i = 0; i < declared; ++i) {
        const auto& parameter = spec.positional[i].name;
        if (vars.count(parameter) != 0) {
            continue;
        }
        if (i >= first_default) {
            vars[parameter] = function.defaults[i - first_default];
        } else {
            missing.push_back(parameter);
        }
    }
    if (!missing.empty()) {
        throw TypeError(name + "() missing " + Plural(missing.size(), "required positional argument") + ": " +
                        QuoteList(missing));
    }
    for (std::size_t i = 0; i < spec.kwonly.size(); ++i) {
        const auto& parameter = spec.kwonly[i].name;
        if (vars.count(parameter) != 0) {
            continue;
        }
        if (function.has_kw_default[i]) {
            vars[parameter] = function.kw_defaults[i];
        } else {
            missing.push_back(parameter);
        }
    }
    if (!missing.empty()) {
        throw TypeError(name + "() missing " + Plural(missing.size(), "required keyword-only argument") + ": " +
                        QuoteList(missing));
    }

    if (function.expression != nullptr) {
        return Eval(*function.expression, frame);
    }
    Value result;
    switch (ExecBlock(*function.body, frame, result)) {
        case Flow::kReturn:
            return result;
        case Flow::kBreak:
            throw ScriptError("SyntaxError", "'break' outside loop");
        case Flow::kContinue:
            throw ScriptError("SyntaxError", "'continue' not properly in loop");
        case Flow::kNormal:
            break;
    }
    return Value();
}

Value Interpreter::MakeFunction(const std::string& name,
                                const lang::Arguments& args,
                                const lang::Block* body,
                                const lang::Expr* expression,
                                const std::shared_ptr<Frame>& frame) {
    auto function = std::make_shared<FunctionObject>();
    function->name = name;
    function->args = &args;
    function->body = body;
    function->expression = expression;
    for (const auto& value : args.defaults) {
        function->defaults.push_back(Eval(*value, frame));
    }
    for (const auto& value : args.kw_defaults) {
        function->has_kw_default.push_back(value != nullptr);
        function->kw_defaults.push_back(value ? Eval(*value, frame) : Value());
    }
    function->closure = frame;
    function->locals = LocalsFor(&args, [&args, body] {
        return lang::FunctionLocals(args, body != nullptr ? *body : EmptyBlock());
    });
    if (frame != globals_ && (closures_.empty() || closures_.back().lock() != frame)) {
        if (closures_.size() >= 4096) {
            closures_.erase(std::remove_if(closures_.begin(), closures_.end(),
                                           [](const std::weak_ptr<Frame>& weak) { return weak.expired(); }),
                            closures_.end());
        }
        closures_.push_back(frame);
    }
    return Value::FromObject(ValueKind::kFunction, std::move(function));
}

std::shared_ptr<const std::set<std::string>> Interpreter::LocalsFor(
    const void* node, const std::function<std::set<std::string>()>& build) {
    auto it = locals_cache_.find(node);
    if (it != locals_cache_.end()) {
        return it->second;
    }
    auto locals = std::make_shared<const std::set<std::string>>(build());
    locals_cache_.emplace(node, locals);
    return locals;
}

// ---------------------------------------------------------------------------
// Expressions

Value Interpreter::Eval(const lang::Expr& expr, const std::shared_ptr<Frame>& frame) {
    using lang::ExprKind;
    if (eval_depth_ >= kMaxEvalDepth) {
        throw RecursionLimit();
    }
    DepthGuard guard(eval_depth_);

    switch (expr.kind) {
        case ExprKind::kName:
            return LookupName(static_cast<const lang::NameExpr&>(expr).id, *frame);
        case ExprKind::kConstant:
            return EvalConstant(static_cast<const lang::ConstantExpr&>(expr));
        case ExprKind::kBinOp: {
            const auto& node = static_cast<const lang::BinOpExpr&>(expr);
            const Value left = Eval(*node.left, frame);
            const Value right = Eval(*node.right, frame);
            return BinaryOp(node.op, left, right);
        }
        case ExprKind::kUnaryOp: {
            const auto& node = static_cast<const lang::UnaryOpExpr&>(expr);
            return EvalUnary(node.op, Eval(*node.operand, frame));
        }
        case ExprKind::kBoolOp: {
            const auto& node = static_cast<const lang::BoolOpExpr&>(expr);
            Value value;
            for (const auto& operand : node.values) {
                value = Eval(*operand, frame);
                const bool truth = Truthy(value);
                if ((node.op == lang::BoolOperator::kAnd && !truth) || (node.op == lang::BoolOperator::kOr && truth)) {
                    return value;
                }
            }
            return value;
        }
        case ExprKind::kCompare:
            return EvalCompare(static_cast<const lang::CompareExpr&>(expr), frame);
        case ExprKind::kCall:
            return EvalCall(static_cast<const lang::CallExpr&>(expr), frame);
        case ExprKind::kAttribute: {
            const auto& node = static_cast<const lang::AttributeExpr&>(expr);
            return GetAttribute(Eval(*node.value, frame), node.attr);
        }
        case ExprKind::kSubscript: {
            const auto& node = static_cast<const lang::SubscriptExpr&>(expr);
            const Value object = Eval(*node.value, frame);
            if (node.slice->kind == ExprKind::kSlice) {
                return EvalSlice(object, static_cast<const lang::SliceExpr&>(*node.slice), frame);
            }
            return EvalSubscript(object, Eval(*node.slice, frame));
        }
        case ExprKind::kList:
            return Value::List(EvalElements(static_cast<const lang::SequenceExpr&>(expr).elts, frame));
        case ExprKind::kTuple:
            return Value::Tuple(EvalElements(static_cast<const lang::SequenceExpr&>(expr).elts, frame));
        case ExprKind::kSet:
            return NewSet(ValueKind::kSet, EvalElements(static_cast<const lang::SequenceExpr&>(expr).elts, frame));
        case ExprKind::kDict: {
            const auto& node = static_cast<const lang::DictExpr&>(expr);
            Value out = Value::Dict();
            auto& entries = out.As<DictObject>().entries;
            for (std::size_t i = 0; i < node.keys.size(); ++i) {
                if (!node.keys[i]) {
                    const Value mapping = Eval(*node.values[i], frame);
                    if (!mapping.Is(ValueKind::kDict)) {
                        throw TypeError("'" + TypeName(mapping) + "' object is not a mapping");
                    }
                    for (const auto& [key, value] : mapping.As<DictObject>().entries.Items()) {
                        entries.Set(key, value);
                    }
                } else {
                    const Value key = Eval(*node.keys[i], frame);
                    entries.Set(key, Eval(*node.values[i], frame));
                }
                CheckSize(entries.size());
            }
            return out;
        }
        case ExprKind::kListComp:
        case ExprKind::kSetComp:
        case ExprKind::kDictComp:
        case ExprKind::kGeneratorExp:
            return EvalComprehension(static_cast<const lang::ComprehensionExpr&>(expr), frame);
        case ExprKind::kLambda: {
            const auto& node = static_cast<const lang::LambdaExpr&>(expr);
            return MakeFunction("<lambda>", node.args, nullptr, node.body.get(), frame);
        }
        case ExprKind::kIfExp: {
            const auto& node = static_cast<const lang::IfExpExpr&>(expr);
            return Truthy(Eval(*node.test, frame)) ? Eval(*node.body, frame) : Eval(*node.orelse, frame);
        }
        case ExprKind::kStarred:
            throw ScriptError("SyntaxError", "can't use starred expression here");
        case ExprKind::kJoinedStr:
            return EvalJoinedStr(static_cast<const lang::JoinedStrExpr&>(expr), frame);
        default:
            throw Unsupported(lang::Describe(expr));
    }
}

Value Interpreter::EvalConstant(const lang::ConstantExpr& expr) {
    auto cached = constants_.find(&expr);
    if (cached != constants_.end()) {
        return cached->second;
    }
    Value value;
    switch (expr.constant) {
        case lang::ConstantKind::kNone:
            break;
        case lang::ConstantKind::kTrue:
            value = Value::Bool(true);
            break;
        case lang::ConstantKind::kFalse:
            value = Value::Bool(false);
            break;
        case lang::ConstantKind::kInt:
            value = ParseIntLiteral(expr.text, expr.base);
            break;
        case lang::ConstantKind::kFloat:
            value = Value::Float(std::strtod(expr.text.c_str(), nullptr));
            break;
        case lang::ConstantKind::kImaginary:
            value = Value::Complex({0.0, std::strtod(expr.text.c_str(), nullptr)});
            break;
        case lang::ConstantKind::kString:
            value = Value::Str(expr.text);
            break;
        case lang::ConstantKind::kEllipsis:
            throw Unsupported("Ellipsis");
    }
    constants_.emplace(&expr, value);
    return value;
}

std::vector<Value> Interpreter::EvalElements(const std::vector<lang::ExprPtr>& elts,
                                             const std::shared_ptr<Frame>& frame) {
    std::vector<Value> out;
    out.reserve(elts.size());
    for (const auto& element : elts) {
        if (element->kind == lang::ExprKind::kStarred) {
            std::vector<Value> items = Collect(Eval(*static_cast<const lang::StarredExpr&>(*element).value, frame));
            CheckSize(out.size() + items.size());
            out.insert(out.end(), std::make_move_iterator(items.begin()), std::make_move_iterator(items.end()));
        } else {
            out.push_back(Eval(*element, frame));
        }
    }
    return out;
}

Value Interpreter::EvalCall(const lang::CallExpr& expr, const std::shared_ptr<Frame>& frame) {
    const Value callee = Eval(*expr.func, frame);
    CallArgs args;
    args.positional = EvalElements(expr.args, frame);
    for (const auto& keyword : expr.keywords) {
        const Value value = Eval(*keyword.value, frame);
        if (!keyword.arg.empty()) {
            args.keywords.emplace_back(keyword.arg, value);
            continue;
        }
        if (!value.Is(ValueKind::kDict)) {
            throw TypeError("argument after ** must be a mapping, not " + TypeName(value));
        }
        for (const auto& [key, item] : value.As<DictObject>().entries.Items()) {
            if (!key.Is(ValueKind::kStr)) {
                throw TypeError("keywords must be strings");
            }
            args.keywords.emplace_back(key.AsStr(), item);
        }
    }
    return Call(callee, std::move(args));
}

Value Interpreter::EvalSubscript(const Value& object, const Value& index) {
    switch (object.kind()) {
        case ValueKind::kList:
        case ValueKind::kTuple: {
            const auto& items = Items(object);
            return items[static_cast<std::size_t>(SequenceIndex(object, index, static_cast<long long>(items.size())))];
        }
        case ValueKind::kStr: {
            const std::string& value = object.AsStr();
            if (text::IsAscii(value)) {
                return Value::Str(std::string(1, value[static_cast<std::size_t>(
                    SequenceIndex(object, index, static_cast<long long>(value.size())))]));
            }
            const std::u32string code_points = text::Decode(value);
            const long long position = SequenceIndex(object, index, static_cast<long long>(code_points.size()));
            std::string out;
            text::AppendUtf8(out, code_points[static_cast<std::size_t>(position)]);
            return Value::Str(std::move(out));
        }
        case ValueKind::kRange: {
            const auto& range = object.As<RangeObject>();
            return Value::Int(range.At(SequenceIndex(object, index, range.Length())));
        }
        case ValueKind::kDict: {
            const Value* found = object.As<DictObject>().entries.Find(index);
            if (found == nullptr) {
                throw KeyError(Repr(index));
            }
            return *found;
        }
        default:
            throw TypeError("'" + TypeName(object) + "' object is not subscriptable");
    }
}

Value Interpreter::EvalSlice(const Value& object, const lang::SliceExpr& slice, const std::shared_ptr<Frame>& frame) {
    const Value lower = slice.lower ? Eval(*slice.lower, frame) : Value();
    const Value upper = slice.upper ? Eval(*slice.upper, frame) : Value();
    const Value step = slice.step ? Eval(*slice.step, frame) : Value();

    auto pick = [](const std::vector<Value>& items, const SliceBounds& bounds) {
        std::vector<Value> out;
        out.reserve(static_cast<std::size_t>(bounds.length));
        for (long long i = 0; i < bounds.length; ++i) {
            out.push_back(items[static_cast<std::size_t>(bounds.start + i * bounds.step)]);
        }
        return out;
    };

    switch (object.kind()) {
        case ValueKind::kList:
        case ValueKind::kTuple: {
            const auto& items = Items(object);
            const SliceBounds bounds = ResolveSlice(lower, upper, step, static_cast<long long>(items.size()));
            std::vector<Value> out = pick(items, bounds);
            return object.Is(ValueKind::kList) ? Value::List(std::move(out)) : Value::Tuple(std::move(out));
        }
        case ValueKind::kStr: {
            const std::string& value = object.AsStr();
            std::string out;
            if (text::IsAscii(value)) {
                const SliceBounds bounds = ResolveSlice(lower, upper, step, static_cast<long long>(value.size()));
                out.reserve(static_cast<std::size_t>(bounds.length));
                for (long long i = 0; i < bounds.length; ++i) {
                    out.push_back(value[static_cast<std::size_t>(bounds.start + i * bounds.step)]);
                }
                return Value::Str(std::move(out));
            }
            const std::u32string code_points = text::Decode(value);
            const SliceBounds bounds = ResolveSlice(lower, upper, step, static_cast<long long>(code_points.size()));
            for (long long i = 0; i < bounds.length; ++i) {
                text::AppendUtf8(out, code_points[static_cast<std::size_t>(bounds.start + i * bounds.step)]);
            }
            return Value::Str(std::move(out));
        }
        case ValueKind::kRange: {
            const auto& range = object.As<RangeObject>();
            const SliceBounds bounds = ResolveSlice(lower, upper, step, range.Length());
            auto sliced = std::make_shared<RangeObject>();
            sliced->step = range.step * bounds.step;
            sliced->start = range.At(bounds.start);
            sliced->stop = sliced->start + bounds.length * sliced->step;
            return Value::FromObject(ValueKind::kRange, std::move(sliced));
        }
        default:
            throw TypeError("'" + TypeName(object) + "' object is not subscriptable");
    }
}

Value Interpreter::EvalCompare(const lang::CompareExpr& expr, const std::shared_ptr<Frame>& frame) {
    Value left = Eval(*expr.left, frame);
    for (std::size_t i = 0; i < expr.ops.size(); ++i) {
        Value right = Eval(*expr.comparators[i], frame);
        if (!Compare(expr.ops[i], left, right)) {
            return Value::Bool(false);
        }
        left = std::move(right);
    }
    return Value::Bool(true);
}

bool Interpreter::Compare(lang::CompareOperator op, const Value& left, const Value& right) {
    using lang::CompareOperator;
    switch (op) {
        case CompareOperator::kEq:
            return Equals(left, right);
        case CompareOperator::kNotEq:
            return !Equals(left, right);
        case CompareOperator::kIs:
            return Identical(left, right);
        case CompareOperator::kIsNot:
            return !Identical(left, right);
        case CompareOperator::kIn:
            return Contains(right, left);
        case CompareOperator::kNotIn:
            return !Contains(right, left);
        default:
            return OrderedCompare(op, left, right);
    }
}

bool Interpreter::Less(const Value& left, const Value& right) {
    return OrderedCompare(lang::CompareOperator::kLt, left, right);
}

bool Interpreter::OrderedCompare(lang::CompareOperator op, const Value& left, const Value& right) {
    using lang::CompareOperator;
    auto from_order = [op](int order) {
        switch (op) {
            case CompareOperator::kLt: return order < 0;
            case CompareOperator::kLtE: return order <= 0;
            case CompareOperator::kGt: return order > 0;
            default: return order >= 0;
        }
    };

    if (IsReal(left) && IsReal(right)) {
        const int order = CompareReals(left, right);
        return order != 2 && from_order(order);
    }
    if (left.Is(ValueKind::kStr) && right.Is(ValueKind::kStr)) {
        const int order = left.AsStr().compare(right.AsStr());
        return from_order(order < 0 ? -1 : (order > 0 ? 1 : 0));
    }
    if ((left.Is(ValueKind::kList) && right.Is(ValueKind::kList)) ||
        (left.Is(ValueKind::kTuple) && right.Is(ValueKind::kTuple))) {
        const auto& a = Items(left);
        const auto& b = Items(right);
        const std::size_t common = std::min(a.size(), b.size());
        for (std::size_t i = 0; i < common; ++i) {
            Step();
            if (!Identical(a[i], b[i]) && !Equals(a[i], b[i])) {
                return OrderedCompare(op, a[i], b[i]);
            }
        }
        return from_order(a.size() < b.size() ? -1 : (a.size() > b.size() ? 1 : 0));
    }
    if (IsSetKind(left) && IsSetKind(right)) {
        const auto& a = left.As<SetObject>().entries;
        const auto& b = right.As<SetObject>().entries;
        switch (op) {
            case CompareOperator::kLt: return a.size() < b.size() && IsSubset(a, b);
            case CompareOperator::kLtE: return IsSubset(a, b);
            case CompareOperator::kGt: return b.size() < a.size() && IsSubset(b, a);
            default: return IsSubset(b, a);
        }
    }
    throw TypeError(std::string("'") + lang::ToString(op) + "' not supported between instances of '" +
                    TypeName(left) + "' and '" + TypeName(right) + "'");
}

bool Interpreter::Contains(const Value& container, const Value& item) {
    switch (container.kind()) {
        case ValueKind::kStr:
            if (!item.Is(ValueKind::kStr)) {
                throw TypeError("'in <string>' requires string as left operand, not " + TypeName(item));
            }
            return container.AsStr().find(item.AsStr()) != std::string::npos;
        case ValueKind::kList:
        case ValueKind::kTuple:
            for (const auto& element : Items(container)) {
                Step();
                if (Identical(element, item) || Equals(element, item)) {
                    return true;
                }
            }
            return false;
        case ValueKind::kDict:
            return container.As<DictObject>().entries.Find(item) != nullptr;
        case ValueKind::kSet:
        case ValueKind::kFrozenSet:
            return container.As<SetObject>().entries.Find(item) != nullptr;
        case ValueKind::kRange: {
            const auto& range = container.As<RangeObject>();
            if (IsIntegral(item)) {
                return RangeContains(range, ToBigInt(item));
            }
            if (!IsReal(item) || (item.Is(ValueKind::kFloat) && !std::isfinite(item.AsFloat()))) {
                return false;
            }
            if (item.Is(ValueKind::kDecimal) && !item.As<DecimalObject>().value.IsFinite()) {
                return false;
            }
            const Rational exact = ToRational(item);
            return denominator(exact) == 1 && RangeContains(range, numerator(exact));
        }
        case ValueKind::kIterator: {
            auto& iterator = container.As<Iterator>();
            Value element;
            while (Next(iterator, element)) {
                if (Identical(element, item) || Equals(element, item)) {
                    return true;
                }
            }
            return false;
        }
        default:
            throw TypeError("argument of type '" + TypeName(container) + "' is not iterable");
    }
}

Value Interpreter::BinaryOp(lang::BinaryOperator op, const Value& left, const Value& right) {
    using lang::BinaryOperator;
    Value out;
    if (NumericBinary(op, left, right, out)) {
        return out;
    }
    switch (op) {
        case BinaryOperator::kAdd:
            if (left.Is(ValueKind::kStr) && right.Is(ValueKind::kStr)) {
                CheckSize(left.AsStr().size() + right.AsStr().size());
                return Value::Str(left.AsStr() + right.AsStr());
            }
            if ((left.Is(ValueKind::kList) && right.Is(ValueKind::kList)) ||
                (left.Is(ValueKind::kTuple) && right.Is(ValueKind::kTuple))) {
                const auto& a = Items(left);
                const auto& b = Items(right);
                CheckSize(a.size() + b.size());
                std::vector<Value> items;
                items.reserve(a.size() + b.size());
                items.insert(items.end(), a.begin(), a.end());
                items.insert(items.end(), b.begin(), b.end());
                return left.Is(ValueKind::kList) ? Value::List(std::move(items)) : Value::Tuple(std::move(items));
            }
            break;
        case BinaryOperator::kMult: {
            const bool left_sequence = left.Is(ValueKind::kStr) || left.Is(ValueKind::kList) || left.Is(ValueKind::kTuple);
            const bool right_sequence =
                right.Is(ValueKind::kStr) || right.Is(ValueKind::kList) || right.Is(ValueKind::kTuple);
            const Value* sequence = nullptr;
            const Value* count = nullptr;
            if (left_sequence && IsIntegral(right)) {
                sequence = &left;
                count = &right;
            } else if (right_sequence && IsIntegral(left)) {
                sequence = &right;
                count = &left;
            }
            if (sequence == nullptr) {
                if (left_sequence || right_sequence) {
                    const Value& other = left_sequence ? right : left;
                    throw TypeError("can't multiply sequence by non-int of type '" + TypeName(other) + "'");
                }
                break;
            }
            const BigInt times = ToBigInt(*count);
            const std::size_t unit = sequence->Is(ValueKind::kStr) ? sequence->AsStr().size() : Items(*sequence).size();
            std::size_t repeat = 0;
            if (times > 0 && unit > 0) {
                if (times > BigInt(limits_.max_collection_size / unit)) {
                    throw MemoryError("collection size exceeds " + std::to_string(limits_.max_collection_size));
                }
                repeat = times.convert_to<std::size_t>();
            }
            CheckSize(unit * repeat);
            if (sequence->Is(ValueKind::kStr)) {
                std::string text;
                text.reserve(unit * repeat);
                for (std::size_t i = 0; i < repeat; ++i) {
                    text += sequence->AsStr();
                }
                return Value::Str(std::move(text));
            }
            const auto& items = Items(*sequence);
            std::vector<Value> repeated;
            repeated.reserve(unit * repeat);
            for (std::size_t i = 0; i < repeat; ++i) {
                repeated.insert(repeated.end(), items.begin(), items.end());
            }
            return sequence->Is(ValueKind::kList) ? Value::List(std::move(repeated)) : Value::Tuple(std::move(repeated));
        }
        case BinaryOperator::kMod:
            if (left.Is(ValueKind::kStr)) {
                return Value::Str(PercentFormat(left.AsStr(), right));
            }
            break;
        case BinaryOperator::kBitOr:
            if (left.Is(ValueKind::kDict) && right.Is(ValueKind::kDict)) {
                Value merged = Value::Dict();
                auto& entries = merged.As<DictObject>().entries;
                for (const auto& [key, value] : left.As<DictObject>().entries.Items()) {
                    entries.Set(key, value);
                }
                for (const auto& [key, value] : right.As<DictObject>().entries.Items()) {
                    entries.Set(key, value);
                }
                return merged;
            }
            [[fallthrough]];
        case BinaryOperator::kBitAnd:
        case BinaryOperator::kBitXor:
        case BinaryOperator::kSub:
            if (IsSetKind(left) && IsSetKind(right)) {
                return SetOperation(op, left, right);
            }
            break;
        default:
            break;
    }
    const std::string symbol = op == BinaryOperator::kPow ? "** or pow()" : lang::ToString(op);
    throw TypeError("unsupported operand type(s) for " + symbol + ": '" + TypeName(left) + "' and '" +
                    TypeName(right) + "'");
}

Value Interpreter::EvalUnary(lang::UnaryOperator op, const Value& operand) {
    switch (op) {
        case lang::UnaryOperator::kNot:
            return Value::Bool(!Truthy(operand));
        case lang::UnaryOperator::kUSub:
            return NumericNegate(operand);
        case lang::UnaryOperator::kUAdd:
            if (operand.Is(ValueKind::kBool)) {
                return Value::Int(operand.AsBool() ? 1LL : 0LL);
            }
            if (operand.Is(ValueKind::kDecimal)) {
                return Value::Decimal(operand.As<DecimalObject>().value.Plus(DecimalContext{}));
            }
            if (IsNumber(operand)) {
                return operand;
            }
            throw TypeError("bad operand type for unary +: '" + TypeName(operand) + "'");
        case lang::UnaryOperator::kInvert:
            if (IsIntegral(operand)) {
                return Value::Int(BigInt(-(ToBigInt(operand) + 1)));
            }
            throw TypeError("bad operand type for unary ~: '" + TypeName(operand) + "'");
    }
    return Value();
}

Value Interpreter::EvalComprehension(const lang::ComprehensionExpr& expr, const std::shared_ptr<Frame>& frame) {
    using lang::ExprKind;
    auto inner = std::make_shared<Frame>();
    inner->parent = frame;
    inner->locals = LocalsFor(&expr, [&expr] { return lang::ComprehensionLocals(expr); });

    std::vector<Value> items;
    Value result;
    DictStorage* entries = nullptr;
    if (expr.kind == ExprKind::kSetComp) {
        result = Value::Set();
        entries = &result.As<SetObject>().entries;
    } else if (expr.kind == ExprKind::kDictComp) {
        result = Value::Dict();
        entries = &result.As<DictObject>().entries;
    }

    std::function<void(std::size_t)> generate = [&](std::size_t level) {
        if (level == expr.generators.size()) {
            if (expr.kind == ExprKind::kDictComp) {
                const Value key = Eval(*expr.element, inner);
                entries->Set(key, Eval(*expr.value, inner));
                CheckSize(entries->size());
            } else if (entries != nullptr) {
                entries->Set(Eval(*expr.element, inner), Value());
                CheckSize(entries->size());
            } else {
                items.push_back(Eval(*expr.element, inner));
                CheckSize(items.size());
            }
            return;
        }
        const lang::Comprehension& clause = expr.generators[level];
        if (clause.is_async) {
            throw Unsupported("asynchronous comprehension");
        }
        const Value iterable = Eval(*clause.iter, level == 0 ? frame : inner);
        auto iterator = GetIterator(iterable);
        Value item;
        while (Next(*iterator, item)) {
            Assign(*clause.target, item, inner);
            bool keep = true;
            for (const auto& condition : clause.ifs) {
                if (!Truthy(Eval(*condition, inner))) {
                    keep = false;
                    break;
                }
            }
            if (keep) {
                generate(level + 1);
            }
        }
    };
    generate(0);

    switch (expr.kind) {
        case ExprKind::kListComp:
            return Value::List(std::move(items));
        case ExprKind::kGeneratorExp:
            return MakeIterator(std::make_shared<VectorIterator>("generator", std::move(items)));
        default:
            return result;
    }
}

Value Interpreter::EvalJoinedStr(const lang::JoinedStrExpr& expr, const std::shared_ptr<Frame>& frame) {
    std::string out;
    for (const auto& part : expr.values) {
        if (part->kind == lang::ExprKind::kConstant) {
            out += static_cast<const lang::ConstantExpr&>(*part).text;
        } else if (part->kind == lang::ExprKind::kFormattedValue) {
            const auto& node = static_cast<const lang::FormattedValueExpr&>(*part);
            Value value = Eval(*node.value, frame);
            switch (node.conversion) {
                case 'r':
                    value = Value::Str(Repr(value));
                    break;
                case 's':
                    value = Value::Str(Str(value));
                    break;
                case 'a':
                    value = Value::Str(AsciiRepr(value));
                    break;
                default:
                    break;
            }
            std::string spec;
            if (node.format_spec) {
                spec = EvalJoinedStr(static_cast<const lang::JoinedStrExpr&>(*node.format_spec), frame).AsStr();
            }
            out += FormatWithSpec(value, spec);
        } else {
            out += Str(Eval(*part, frame));
        }
        CheckSize(out.size());
    }
    return Value::Str(std::move(out));
}

Value Interpreter::GetAttribute(const Value& object, const std::string& name) {
    if (!utils::IsDunder(name)) {
        switch (object.kind()) {
            case ValueKind::kModule: {
                const auto& module = object.As<ModuleObject>();
                auto it = module.members.find(name);
                if (it != module.members.end()) {
                    return it->second;
                }
                throw AttributeError("module '" + module.name + "' has no attribute '" + name + "'");
            }
            case ValueKind::kBuiltin: {
                const auto& attributes = object.As<BuiltinObject>().attributes;
                auto it = attributes.find(name);
                if (it != attributes.end()) {
                    return it->second;
                }
                break;
            }
            case ValueKind::kType: {
                const auto& type = object.As<TypeObject>();
                auto it = type.attributes.find(name);
                if (it != type.attributes.end()) {
                    return it->second;
                }
                throw AttributeError("type object '" + type.name + "' has no attribute '" + name + "'");
            }
            default: {
                Value out;
                if (LookupMethod(object, name, out)) {
                    return out;
                }
                break;
            }
        }
    }
    if (object.Is(ValueKind::kModule)) {
        throw AttributeError("module '" + object.As<ModuleObject>().name + "' has no attribute '" + name + "'");
    }
    throw AttributeError("'" + TypeName(object) + "' object has no attribute '" + name + "'");
}

}  // namespace mathguard::runtime
