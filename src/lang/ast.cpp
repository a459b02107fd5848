#include "lang/ast.hpp"

namespace mathguard::lang {

const char* ToString(ExprKind kind) {
    switch (kind) {
        case ExprKind::kName: return "Name";
        case ExprKind::kConstant: return "Constant";
        case ExprKind::kBinOp: return "BinOp";
        case ExprKind::kUnaryOp: return "UnaryOp";
        case ExprKind::kBoolOp: return "BoolOp";
        case ExprKind::kCompare: return "Compare";
        case ExprKind::kCall: return "Call";
        case ExprKind::kAttribute: return "Attribute";
        case ExprKind::kSubscript: return "Subscript";
        case ExprKind::kSlice: return "Slice";
        case ExprKind::kList: return "List";
        case ExprKind::kTuple: return "Tuple";
        case ExprKind::kSet: return "Set";
        case ExprKind::kDict: return "Dict";
        case ExprKind::kListComp: return "ListComp";
        case ExprKind::kSetComp: return "SetComp";
        case ExprKind::kDictComp: return "DictComp";
        case ExprKind::kGeneratorExp: return "GeneratorExp";
        case ExprKind::kLambda: return "Lambda";
        case ExprKind::kIfExp: return "IfExp";
        case ExprKind::kStarred: return "Starred";
        case ExprKind::kJoinedStr: return "JoinedStr";
        case ExprKind::kFormattedValue: return "FormattedValue";
        case ExprKind::kNamedExpr: return "NamedExpr";
        case ExprKind::kAwait: return "Await";
        case ExprKind::kYield: return "Yield";
        case ExprKind::kYieldFrom: return "YieldFrom";
    }
    return "Expr";
}

const char* ToString(StmtKind kind) {
    switch (kind) {
        case StmtKind::kExpr: return "Expr";
        case StmtKind::kAssign: return "Assign";
        case StmtKind::kAugAssign: return "AugAssign";
        case StmtKind::kAnnAssign: return "AnnAssign";
        case StmtKind::kFunctionDef: return "FunctionDef";
        case StmtKind::kReturn: return "Return";
        case StmtKind::kIf: return "If";
        case StmtKind::kFor: return "For";
        case StmtKind::kWhile: return "While";
        case StmtKind::kBreak: return "Break";
        case StmtKind::kContinue: return "Continue";
        case StmtKind::kPass: return "Pass";
        case StmtKind::kImport: return "Import";
        case StmtKind::kImportFrom: return "ImportFrom";
        case StmtKind::kClassDef: return "ClassDef";
        case StmtKind::kTry: return "Try";
        case StmtKind::kWith: return "With";
        case StmtKind::kRaise: return "Raise";
        case StmtKind::kAssert: return "Assert";
        case StmtKind::kDelete: return "Delete";
        case StmtKind::kGlobal: return "Global";
        case StmtKind::kNonlocal: return "Nonlocal";
    }
    return "Stmt";
}

const char* ToString(BinaryOperator op) {
    switch (op) {
        case BinaryOperator::kAdd: return "+";
        case BinaryOperator::kSub: return "-";
        case BinaryOperator::kMult: return "*";
        case BinaryOperator::kMatMult: return "@";
        case BinaryOperator::kDiv: return "/";
        case BinaryOperator::kMod: return "%";
        case BinaryOperator::kPow: return "**";
        case BinaryOperator::kLShift: return "<<";
        case BinaryOperator::kRShift: return ">>";
        case BinaryOperator::kBitOr: return "|";
        case BinaryOperator::kBitXor: return "^";
        case BinaryOperator::kBitAnd: return "&";
        case BinaryOperator::kFloorDiv: return "//";
    }
    return "?";
}

const char* ToString(UnaryOperator op) {
    switch (op) {
        case UnaryOperator::kInvert: return "~";
        case UnaryOperator::kNot: return "not";
        case UnaryOperator::kUAdd: return "+";
        case UnaryOperator::kUSub: return "-";
    }
    return "?";
}

const char* ToString(CompareOperator op) {
    switch (op) {
        case CompareOperator::kEq: return "==";
        case CompareOperator::kNotEq: return "!=";
        case CompareOperator::kLt: return "<";
        case CompareOperator::kLtE: return "<=";
        case CompareOperator::kGt: return ">";
        case CompareOperator::kGtE: return ">=";
        case CompareOperator::kIs: return "is";
        case CompareOperator::kIsNot: return "is not";
        case CompareOperator::kIn: return "in";
        case CompareOperator::kNotIn: return "not in";
    }
    return "?";
}

std::string Describe(const Expr& expr) {
    switch (expr.kind) {
        case ExprKind::kName:
            return "name '" + static_cast<const NameExpr&>(expr).id + "'";
        case ExprKind::kAttribute:
            return "attribute '" + static_cast<const AttributeExpr&>(expr).attr + "'";
        case ExprKind::kCall: {
            const auto& call = static_cast<const CallExpr&>(expr);
            if (call.func->kind == ExprKind::kName) {
                return "call to '" + static_cast<const NameExpr&>(*call.func).id + "'";
            }
            if (call.func->kind == ExprKind::kAttribute) {
                return "call to '" + static_cast<const AttributeExpr&>(*call.func).attr + "'";
            }
            return "call";
        }
        case ExprKind::kLambda: return "lambda";
        default:
            return std::string(ToString(expr.kind)) + " expression";
    }
}

std::string Describe(const Stmt& stmt) {
    switch (stmt.kind) {
        case StmtKind::kFunctionDef:
            return "function definition '" + static_cast<const FunctionDefStmt&>(stmt).name + "'";
        case StmtKind::kClassDef:
            return "class definition '" + static_cast<const ClassDefStmt&>(stmt).name + "'";
        case StmtKind::kImport: {
            const auto& import = static_cast<const ImportStmt&>(stmt);
            return import.names.empty() ? "import" : "import " + import.names.front().name;
        }
        case StmtKind::kImportFrom: {
            const auto& import = static_cast<const ImportFromStmt&>(stmt);
            return "from " + std::string(static_cast<std::size_t>(import.level), '.') +
                import.module + " import";
        }
        default:
            return std::string(ToString(stmt.kind)) + " statement";
    }
}

}  // namespace mathguard::lang
