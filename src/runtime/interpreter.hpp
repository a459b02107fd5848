#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <random>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "lang/ast.hpp"
#include "runtime/namespace.hpp"
#include "runtime/value.hpp"

namespace mathguard::runtime {

struct Limits {
    std::uint64_t max_steps = 50'000'000;
    int max_recursion_depth = 200;
    std::size_t max_collection_size = 10'000'000;
};

// One activation: the module frame (locals == nullptr) or a function or
// comprehension call. Names in `locals` never fall through to outer frames.
struct Frame {
    std::shared_ptr<Frame> parent;
    std::shared_ptr<const std::set<std::string>> locals;
    std::unordered_map<std::string, Value> vars;
};

// Tree-walking evaluator for one submission. Every name resolves through the
// frame chain, then the module globals, then the namespace builtins; nothing
// else is reachable. Not thread-safe: one instance per execution.
class Interpreter {
public:
    Interpreter(ExecutionNamespace ns, Limits limits);
    ~Interpreter();

    Interpreter(const Interpreter&) = delete;
    Interpreter& operator=(const Interpreter&) = delete;

    // Parses and runs the top-level statements. Throws lang::SyntaxError,
    // ScriptError or BudgetExceeded.
    void Run(const std::string& source);
    // Looks up a module-level function and calls it.
    Value CallEntryPoint(const std::string& name, std::vector<Value> args);

    Value Call(const Value& callee, CallArgs args);
    Value GetAttribute(const Value& object, const std::string& name);
    Value BinaryOp(lang::BinaryOperator op, const Value& left, const Value& right);
    Value UnaryOp(lang::UnaryOperator op, const Value& operand) { return EvalUnary(op, operand); }
    // object[index] for a non-slice index.
    Value GetItem(const Value& object, const Value& index) { return EvalSubscript(object, index); }
    bool Compare(lang::CompareOperator op, const Value& left, const Value& right);
    // Total order used by sorted/min/max; TypeError for unorderable pairs.
    bool Less(const Value& left, const Value& right);
    bool Contains(const Value& container, const Value& item);

    // Pulls one element, charging a step.
    bool Next(Iterator& iterator, Value& out);
    void ForEach(const Value& iterable, const std::function<void(const Value&)>& fn);
    std::vector<Value> Collect(const Value& iterable);

    // Charges one unit of the step budget.
    void Step();
    // MemoryError when a collection would grow past the configured size.
    void CheckSize(std::size_t size) const;

    const Limits& limits() const { return limits_; }
    std::mt19937_64& random() { return random_; }
    const ExecutionNamespace& names() const { return namespace_; }
    std::uint64_t steps() const { return steps_; }

private:
    enum class Flow { kNormal, kBreak, kContinue, kReturn };

    Flow ExecBlock(const lang::Block& block, const std::shared_ptr<Frame>& frame, Value& result);
    Flow Exec(const lang::Stmt& stmt, const std::shared_ptr<Frame>& frame, Value& result);
    Flow ExecFor(const lang::ForStmt& stmt, const std::shared_ptr<Frame>& frame, Value& result);
    Flow ExecWhile(const lang::WhileStmt& stmt, const std::shared_ptr<Frame>& frame, Value& result);
    void ExecImport(const lang::ImportStmt& stmt, Frame& frame);
    void ExecImportFrom(const lang::ImportFromStmt& stmt, Frame& frame);

    Value Eval(const lang::Expr& expr, const std::shared_ptr<Frame>& frame);
    Value EvalConstant(const lang::ConstantExpr& expr);
    Value EvalCall(const lang::CallExpr& expr, const std::shared_ptr<Frame>& frame);
    Value EvalSubscript(const Value& object, const Value& index);
    Value EvalSlice(const Value& object, const lang::SliceExpr& slice, const std::shared_ptr<Frame>& frame);
    Value EvalCompare(const lang::CompareExpr& expr, const std::shared_ptr<Frame>& frame);
    Value EvalComprehension(const lang::ComprehensionExpr& expr, const std::shared_ptr<Frame>& frame);
    Value EvalJoinedStr(const lang::JoinedStrExpr& expr, const std::shared_ptr<Frame>& frame);
    Value EvalUnary(lang::UnaryOperator op, const Value& operand);
    bool OrderedCompare(lang::CompareOperator op, const Value& left, const Value& right);
    void AugAssign(const lang::AugAssignStmt& stmt, const std::shared_ptr<Frame>& frame);
    void AssignSlice(const Value& object, const lang::SliceExpr& slice, const Value& value,
                     const std::shared_ptr<Frame>& frame);
    Value MakeFunction(const std::string& name,
                       const lang::Arguments& args,
                       const lang::Block* body,
                       const lang::Expr* expression,
                       const std::shared_ptr<Frame>& frame);
    std::vector<Value> EvalElements(const std::vector<lang::ExprPtr>& elts, const std::shared_ptr<Frame>& frame);

    void Assign(const lang::Expr& target, const Value& value, const std::shared_ptr<Frame>& frame);
    void StoreName(const std::string& name, const Value& value, Frame& frame);
    void StoreSubscript(const Value& object, const Value& index, const Value& value);
    Value LookupName(const std::string& name, const Frame& frame) const;

    Value CallFunction(const FunctionObject& function, CallArgs& args);
    std::shared_ptr<const std::set<std::string>> LocalsFor(const void* node,
                                                           const std::function<std::set<std::string>()>& build);

    ExecutionNamespace namespace_;
    Limits limits_;
    // Every parsed module stays alive as long as functions may refer to it.
    std::vector<std::unique_ptr<lang::Module>> modules_;
    std::shared_ptr<Frame> globals_;
    // Call frames captured by nested functions; cleared on destruction to
    // break frame <-> function cycles.
    std::vector<std::weak_ptr<Frame>> closures_;
    std::unordered_map<const void*, std::shared_ptr<const std::set<std::string>>> locals_cache_;
    std::unordered_map<const lang::Expr*, Value> constants_;
    std::uint64_t steps_ = 0;
    int call_depth_ = 0;
    int eval_depth_ = 0;
    std::mt19937_64 random_;
};

}  // namespace mathguard::runtime
