#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "lang/token.hpp"

namespace mathguard::lang {

// Every expression node the parser can produce. Consumers switch over the
// kind and static_cast to the node struct named in the comment.
enum class ExprKind {
    kName,           // NameExpr
    kConstant,       // ConstantExpr
    kBinOp,          // BinOpExpr
    kUnaryOp,        // UnaryOpExpr
    kBoolOp,         // BoolOpExpr
    kCompare,        // CompareExpr
    kCall,           // CallExpr
    kAttribute,      // AttributeExpr
    kSubscript,      // SubscriptExpr
    kSlice,          // SliceExpr
    kList,           // SequenceExpr
    kTuple,          // SequenceExpr
    kSet,            // SequenceExpr
    kDict,           // DictExpr
    kListComp,       // ComprehensionExpr
    kSetComp,        // ComprehensionExpr
    kDictComp,       // ComprehensionExpr
    kGeneratorExp,   // ComprehensionExpr
    kLambda,         // LambdaExpr
    kIfExp,          // IfExpExpr
    kStarred,        // StarredExpr
    kJoinedStr,      // JoinedStrExpr
    kFormattedValue, // FormattedValueExpr
    kNamedExpr,      // NamedExpr
    kAwait,          // WrapperExpr
    kYield,          // WrapperExpr
    kYieldFrom       // WrapperExpr
};

enum class StmtKind {
    kExpr,        // ExprStmt
    kAssign,      // AssignStmt
    kAugAssign,   // AugAssignStmt
    kAnnAssign,   // AnnAssignStmt
    kFunctionDef, // FunctionDefStmt
    kReturn,      // ReturnStmt
    kIf,          // IfStmt
    kFor,         // ForStmt
    kWhile,       // WhileStmt
    kBreak,       // Stmt
    kContinue,    // Stmt
    kPass,        // Stmt
    kImport,      // ImportStmt
    kImportFrom,  // ImportFromStmt
    kClassDef,    // ClassDefStmt
    kTry,         // TryStmt
    kWith,        // WithStmt
    kRaise,       // RaiseStmt
    kAssert,      // AssertStmt
    kDelete,      // DeleteStmt
    kGlobal,      // ScopeStmt
    kNonlocal     // ScopeStmt
};

enum class ExprContext { kLoad, kStore };

enum class BinaryOperator {
    kAdd, kSub, kMult, kMatMult, kDiv, kMod, kPow,
    kLShift, kRShift, kBitOr, kBitXor, kBitAnd, kFloorDiv
};

enum class UnaryOperator { kInvert, kNot, kUAdd, kUSub };

enum class BoolOperator { kAnd, kOr };

enum class CompareOperator { kEq, kNotEq, kLt, kLtE, kGt, kGtE, kIs, kIsNot, kIn, kNotIn };

enum class ConstantKind { kNone, kTrue, kFalse, kInt, kFloat, kImaginary, kString, kEllipsis };

const char* ToString(ExprKind kind);
const char* ToString(StmtKind kind);
const char* ToString(BinaryOperator op);
const char* ToString(UnaryOperator op);
const char* ToString(CompareOperator op);

struct Expr {
    Expr(ExprKind kind, SourceLocation loc) : kind(kind), loc(loc) {}
    virtual ~Expr() = default;

    ExprKind kind;
    SourceLocation loc;
};

struct Stmt {
    Stmt(StmtKind kind, SourceLocation loc) : kind(kind), loc(loc) {}
    virtual ~Stmt() = default;

    StmtKind kind;
    SourceLocation loc;
};

using ExprPtr = std::unique_ptr<Expr>;
using StmtPtr = std::unique_ptr<Stmt>;
using Block = std::vector<StmtPtr>;

struct NameExpr : Expr {
    NameExpr(SourceLocation loc, std::string id)
        : Expr(ExprKind::kName, loc), id(std::move(id)) {}

    std::string id;
    ExprContext ctx = ExprContext::kLoad;
};

struct ConstantExpr : Expr {
    ConstantExpr(SourceLocation loc, ConstantKind constant, std::string text = {})
        : Expr(ExprKind::kConstant, loc), constant(constant), text(std::move(text)) {}

    ConstantKind constant;
    // kInt: digits without prefix or underscores (in `base`).
    // kFloat/kImaginary: decimal text without underscores or the 'j' suffix.
    // kString: the decoded value.
    std::string text;
    int base = 10;
};

struct BinOpExpr : Expr {
    BinOpExpr(SourceLocation loc, BinaryOperator op, ExprPtr left, ExprPtr right)
        : Expr(ExprKind::kBinOp, loc), op(op), left(std::move(left)), right(std::move(right)) {}

    BinaryOperator op;
    ExprPtr left;
    ExprPtr right;
};

struct UnaryOpExpr : Expr {
    UnaryOpExpr(SourceLocation loc, UnaryOperator op, ExprPtr operand)
        : Expr(ExprKind::kUnaryOp, loc), op(op), operand(std::move(operand)) {}

    UnaryOperator op;
    ExprPtr operand;
};

struct BoolOpExpr : Expr {
    BoolOpExpr(SourceLocation loc, BoolOperator op)
        : Expr(ExprKind::kBoolOp, loc), op(op) {}

    BoolOperator op;
    std::vector<ExprPtr> values;
};

struct CompareExpr : Expr {
    CompareExpr(SourceLocation loc, ExprPtr left)
        : Expr(ExprKind::kCompare, loc), left(std::move(left)) {}

    ExprPtr left;
    std::vector<CompareOperator> ops;
    std::vector<ExprPtr> comparators;
};

struct Keyword {
    // Empty for `**mapping`.
    std::string arg;
    ExprPtr value;
    SourceLocation loc;
};

struct CallExpr : Expr {
    CallExpr(SourceLocation loc, ExprPtr func)
        : Expr(ExprKind::kCall, loc), func(std::move(func)) {}

    ExprPtr func;
    std::vector<ExprPtr> args;
    std::vector<Keyword> keywords;
};

struct AttributeExpr : Expr {
    AttributeExpr(SourceLocation loc, ExprPtr value, std::string attr)
        : Expr(ExprKind::kAttribute, loc), value(std::move(value)), attr(std::move(attr)) {}

    ExprPtr value;
    std::string attr;
    ExprContext ctx = ExprContext::kLoad;
};

struct SubscriptExpr : Expr {
    SubscriptExpr(SourceLocation loc, ExprPtr value, ExprPtr slice)
        : Expr(ExprKind::kSubscript, loc), value(std::move(value)), slice(std::move(slice)) {}

    ExprPtr value;
    ExprPtr slice;
    ExprContext ctx = ExprContext::kLoad;
};

struct SliceExpr : Expr {
    explicit SliceExpr(SourceLocation loc) : Expr(ExprKind::kSlice, loc) {}

    ExprPtr lower;
    ExprPtr upper;
    ExprPtr step;
};

// kList, kTuple and kSet.
struct SequenceExpr : Expr {
    SequenceExpr(ExprKind kind, SourceLocation loc) : Expr(kind, loc) {}

    std::vector<ExprPtr> elts;
    ExprContext ctx = ExprContext::kLoad;
};

struct DictExpr : Expr {
    explicit DictExpr(SourceLocation loc) : Expr(ExprKind::kDict, loc) {}

    // A null key marks a `**mapping` entry.
    std::vector<ExprPtr> keys;
    std::vector<ExprPtr> values;
};

struct Comprehension {
    ExprPtr target;
    ExprPtr iter;
    std::vector<ExprPtr> ifs;
    bool is_async = false;
};

// kListComp, kSetComp, kDictComp and kGeneratorExp. `value` is only set for
// dict comprehensions, where `element` is the key.
struct ComprehensionExpr : Expr {
    ComprehensionExpr(ExprKind kind, SourceLocation loc) : Expr(kind, loc) {}

    ExprPtr element;
    ExprPtr value;
    std::vector<Comprehension> generators;
};

struct Parameter {
    std::string name;
    ExprPtr annotation;
    SourceLocation loc;
};

struct Arguments {
    std::vector<Parameter> positional;
    // Defaults of the trailing positional parameters.
    std::vector<ExprPtr> defaults;
    std::optional<Parameter> vararg;
    std::vector<Parameter> kwonly;
    // One entry per kwonly parameter; null when it has no default.
    std::vector<ExprPtr> kw_defaults;
    std::optional<Parameter> kwarg;
};

struct LambdaExpr : Expr {
    explicit LambdaExpr(SourceLocation loc) : Expr(ExprKind::kLambda, loc) {}

    Arguments args;
    ExprPtr body;
};

struct IfExpExpr : Expr {
    IfExpExpr(SourceLocation loc, ExprPtr test, ExprPtr body, ExprPtr orelse)
        : Expr(ExprKind::kIfExp, loc),
          test(std::move(test)),
          body(std::move(body)),
          orelse(std::move(orelse)) {}

    ExprPtr test;
    ExprPtr body;
    ExprPtr orelse;
};

struct StarredExpr : Expr {
    StarredExpr(SourceLocation loc, ExprPtr value)
        : Expr(ExprKind::kStarred, loc), value(std::move(value)) {}

    ExprPtr value;
    ExprContext ctx = ExprContext::kLoad;
};

// f-string: a sequence of string constants and FormattedValueExpr parts.
struct JoinedStrExpr : Expr {
    explicit JoinedStrExpr(SourceLocation loc) : Expr(ExprKind::kJoinedStr, loc) {}

    std::vector<ExprPtr> values;
};

struct FormattedValueExpr : Expr {
    FormattedValueExpr(SourceLocation loc, ExprPtr value)
        : Expr(ExprKind::kFormattedValue, loc), value(std::move(value)) {}

    ExprPtr value;
    // 0, 'r', 's' or 'a'.
    char conversion = 0;
    // JoinedStrExpr or null.
    ExprPtr format_spec;
};

struct NamedExpr : Expr {
    NamedExpr(SourceLocation loc, ExprPtr target, ExprPtr value)
        : Expr(ExprKind::kNamedExpr, loc), target(std::move(target)), value(std::move(value)) {}

    ExprPtr target;
    ExprPtr value;
};

// kAwait, kYield and kYieldFrom. `value` may be null for a bare yield.
struct WrapperExpr : Expr {
    WrapperExpr(ExprKind kind, SourceLocation loc, ExprPtr value)
        : Expr(kind, loc), value(std::move(value)) {}

    ExprPtr value;
};

struct ExprStmt : Stmt {
    ExprStmt(SourceLocation loc, ExprPtr value)
        : Stmt(StmtKind::kExpr, loc), value(std::move(value)) {}

    ExprPtr value;
};

struct AssignStmt : Stmt {
    explicit AssignStmt(SourceLocation loc) : Stmt(StmtKind::kAssign, loc) {}

    std::vector<ExprPtr> targets;
    ExprPtr value;
};

struct AugAssignStmt : Stmt {
    AugAssignStmt(SourceLocation loc, ExprPtr target, BinaryOperator op, ExprPtr value)
        : Stmt(StmtKind::kAugAssign, loc),
          target(std::move(target)),
          op(op),
          value(std::move(value)) {}

    ExprPtr target;
    BinaryOperator op;
    ExprPtr value;
};

struct AnnAssignStmt : Stmt {
    AnnAssignStmt(SourceLocation loc, ExprPtr target, ExprPtr annotation)
        : Stmt(StmtKind::kAnnAssign, loc),
          target(std::move(target)),
          annotation(std::move(annotation)) {}

    ExprPtr target;
    ExprPtr annotation;
    ExprPtr value;
};

struct FunctionDefStmt : Stmt {
    FunctionDefStmt(SourceLocation loc, std::string name)
        : Stmt(StmtKind::kFunctionDef, loc), name(std::move(name)) {}

    std::string name;
    Arguments args;
    Block body;
    std::vector<ExprPtr> decorators;
    ExprPtr returns;
    bool is_async = false;
};

struct ReturnStmt : Stmt {
    explicit ReturnStmt(SourceLocation loc) : Stmt(StmtKind::kReturn, loc) {}

    ExprPtr value;
};

struct IfStmt : Stmt {
    IfStmt(SourceLocation loc, ExprPtr test)
        : Stmt(StmtKind::kIf, loc), test(std::move(test)) {}

    ExprPtr test;
    Block body;
    Block orelse;
};

struct ForStmt : Stmt {
    ForStmt(SourceLocation loc, ExprPtr target, ExprPtr iter)
        : Stmt(StmtKind::kFor, loc), target(std::move(target)), iter(std::move(iter)) {}

    ExprPtr target;
    ExprPtr iter;
    Block body;
    Block orelse;
    bool is_async = false;
};

struct WhileStmt : Stmt {
    WhileStmt(SourceLocation loc, ExprPtr test)
        : Stmt(StmtKind::kWhile, loc), test(std::move(test)) {}

    ExprPtr test;
    Block body;
    Block orelse;
};

struct Alias {
    // Dotted for `import a.b`.
    std::string name;
    std::string asname;
    SourceLocation loc;
};

struct ImportStmt : Stmt {
    explicit ImportStmt(SourceLocation loc) : Stmt(StmtKind::kImport, loc) {}

    std::vector<Alias> names;
};

struct ImportFromStmt : Stmt {
    explicit ImportFromStmt(SourceLocation loc) : Stmt(StmtKind::kImportFrom, loc) {}

    // Empty for `from . import x`.
    std::string module;
    // A single "*" alias for wildcard imports.
    std::vector<Alias> names;
    // Number of leading dots.
    int level = 0;
};

struct ClassDefStmt : Stmt {
    ClassDefStmt(SourceLocation loc, std::string name)
        : Stmt(StmtKind::kClassDef, loc), name(std::move(name)) {}

    std::string name;
    std::vector<ExprPtr> bases;
    std::vector<Keyword> keywords;
    Block body;
    std::vector<ExprPtr> decorators;
};

struct ExceptHandler {
    ExprPtr type;
    std::string name;
    Block body;
    SourceLocation loc;
};

struct TryStmt : Stmt {
    explicit TryStmt(SourceLocation loc) : Stmt(StmtKind::kTry, loc) {}

    Block body;
    std::vector<ExceptHandler> handlers;
    Block orelse;
    Block finalbody;
};

struct WithItem {
    ExprPtr context_expr;
    ExprPtr optional_vars;
};

struct WithStmt : Stmt {
    explicit WithStmt(SourceLocation loc) : Stmt(StmtKind::kWith, loc) {}

    std::vector<WithItem> items;
    Block body;
    bool is_async = false;
};

struct RaiseStmt : Stmt {
    explicit RaiseStmt(SourceLocation loc) : Stmt(StmtKind::kRaise, loc) {}

    ExprPtr exc;
    ExprPtr cause;
};

struct AssertStmt : Stmt {
    AssertStmt(SourceLocation loc, ExprPtr test)
        : Stmt(StmtKind::kAssert, loc), test(std::move(test)) {}

    ExprPtr test;
    ExprPtr msg;
};

struct DeleteStmt : Stmt {
    explicit DeleteStmt(SourceLocation loc) : Stmt(StmtKind::kDelete, loc) {}

    std::vector<ExprPtr> targets;
};

// kGlobal and kNonlocal.
struct ScopeStmt : Stmt {
    ScopeStmt(StmtKind kind, SourceLocation loc) : Stmt(kind, loc) {}

    std::vector<std::string> names;
};

struct Module {
    Block body;
};

// Short human-readable description used in rejection reasons, e.g.
// "class definition 'Foo'" or "call to 'sqrt'".
std::string Describe(const Expr& expr);
std::string Describe(const Stmt& stmt);

}  // namespace mathguard::lang
