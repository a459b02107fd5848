#include "lang/scope.hpp"

namespace mathguard::lang {
namespace {

std::string ImportBinding(const Alias& alias) {
    if (!alias.asname.empty()) {
        return alias.asname;
    }
    const auto dot = alias.name.find('.');
    return dot == std::string::npos ? alias.name : alias.name.substr(0, dot);
}

void CollectParameters(const Arguments& args, std::set<std::string>& out) {
    for (const auto& parameter : args.positional) {
        out.insert(parameter.name);
    }
    if (args.vararg) {
        out.insert(args.vararg->name);
    }
    for (const auto& parameter : args.kwonly) {
        out.insert(parameter.name);
    }
    if (args.kwarg) {
        out.insert(args.kwarg->name);
    }
}

void CollectBlockLocals(const Block& body, std::set<std::string>& out);

void CollectStmtLocals(const Stmt& stmt, std::set<std::string>& out) {
    switch (stmt.kind) {
        case StmtKind::kAssign:
            for (const auto& target : static_cast<const AssignStmt&>(stmt).targets) {
                CollectTargetNames(*target, out);
            }
            break;
        case StmtKind::kAugAssign:
            CollectTargetNames(*static_cast<const AugAssignStmt&>(stmt).target, out);
            break;
        case StmtKind::kAnnAssign: {
            const auto& assign = static_cast<const AnnAssignStmt&>(stmt);
            if (assign.value) {
                CollectTargetNames(*assign.target, out);
            }
            break;
        }
        case StmtKind::kFunctionDef:
            out.insert(static_cast<const FunctionDefStmt&>(stmt).name);
            break;
        case StmtKind::kClassDef:
            out.insert(static_cast<const ClassDefStmt&>(stmt).name);
            break;
        case StmtKind::kIf: {
            const auto& node = static_cast<const IfStmt&>(stmt);
            CollectBlockLocals(node.body, out);
            CollectBlockLocals(node.orelse, out);
            break;
        }
        case StmtKind::kFor: {
            const auto& node = static_cast<const ForStmt&>(stmt);
            CollectTargetNames(*node.target, out);
            CollectBlockLocals(node.body, out);
            CollectBlockLocals(node.orelse, out);
            break;
        }
        case StmtKind::kWhile: {
            const auto& node = static_cast<const WhileStmt&>(stmt);
            CollectBlockLocals(node.body, out);
            CollectBlockLocals(node.orelse, out);
            break;
        }
        case StmtKind::kImport:
            for (const auto& alias : static_cast<const ImportStmt&>(stmt).names) {
                out.insert(ImportBinding(alias));
            }
            break;
        case StmtKind::kImportFrom:
            for (const auto& alias : static_cast<const ImportFromStmt&>(stmt).names) {
                if (alias.name != "*") {
                    out.insert(ImportBinding(alias));
                }
            }
            break;
        case StmtKind::kTry: {
            const auto& node = static_cast<const TryStmt&>(stmt);
            CollectBlockLocals(node.body, out);
            for (const auto& handler : node.handlers) {
                if (!handler.name.empty()) {
                    out.insert(handler.name);
                }
                CollectBlockLocals(handler.body, out);
            }
            CollectBlockLocals(node.orelse, out);
            CollectBlockLocals(node.finalbody, out);
            break;
        }
        case StmtKind::kWith: {
            const auto& node = static_cast<const WithStmt&>(stmt);
            for (const auto& item : node.items) {
                if (item.optional_vars) {
                    CollectTargetNames(*item.optional_vars, out);
                }
            }
            CollectBlockLocals(node.body, out);
            break;
        }
        case StmtKind::kDelete:
            for (const auto& target : static_cast<const DeleteStmt&>(stmt).targets) {
                CollectTargetNames(*target, out);
            }
            break;
        default:
            break;
    }
}

void CollectBlockLocals(const Block& body, std::set<std::string>& out) {
    for (const auto& stmt : body) {
        CollectStmtLocals(*stmt, out);
    }
}

// Whole-tree walk used by CollectBoundNames.
class BindingCollector {
public:
    explicit BindingCollector(std::set<std::string>& out) : out_(out) {}

    void VisitBlock(const Block& body) {
        for (const auto& stmt : body) {
            VisitStmt(*stmt);
        }
    }

    void VisitStmt(const Stmt& stmt) {
        CollectStmtLocals(stmt, out_);
        switch (stmt.kind) {
            case StmtKind::kExpr:
                Visit(static_cast<const ExprStmt&>(stmt).value.get());
                break;
            case StmtKind::kAssign: {
                const auto& node = static_cast<const AssignStmt&>(stmt);
                for (const auto& target : node.targets) {
                    Visit(target.get());
                }
                Visit(node.value.get());
                break;
            }
            case StmtKind::kAugAssign: {
                const auto& node = static_cast<const AugAssignStmt&>(stmt);
                Visit(node.target.get());
                Visit(node.value.get());
                break;
            }
            case StmtKind::kAnnAssign: {
                const auto& node = static_cast<const AnnAssignStmt&>(stmt);
                Visit(node.target.get());
                Visit(node.annotation.get());
                Visit(node.value.get());
                break;
            }
            case StmtKind::kFunctionDef: {
                const auto& node = static_cast<const FunctionDefStmt&>(stmt);
                VisitArguments(node.args);
                for (const auto& decorator : node.decorators) {
                    Visit(decorator.get());
                }
                Visit(node.returns.get());
                VisitBlock(node.body);
                break;
            }
            case StmtKind::kClassDef: {
                const auto& node = static_cast<const ClassDefStmt&>(stmt);
                for (const auto& base : node.bases) {
                    Visit(base.get());
                }
                VisitBlock(node.body);
                break;
            }
            case StmtKind::kReturn:
                Visit(static_cast<const ReturnStmt&>(stmt).value.get());
                break;
            case StmtKind::kIf: {
                const auto& node = static_cast<const IfStmt&>(stmt);
                Visit(node.test.get());
                VisitBlock(node.body);
                VisitBlock(node.orelse);
                break;
            }
            case StmtKind::kFor: {
                const auto& node = static_cast<const ForStmt&>(stmt);
                Visit(node.iter.get());
                VisitBlock(node.body);
                VisitBlock(node.orelse);
                break;
            }
            case StmtKind::kWhile: {
                const auto& node = static_cast<const WhileStmt&>(stmt);
                Visit(node.test.get());
                VisitBlock(node.body);
                VisitBlock(node.orelse);
                break;
            }
            case StmtKind::kTry: {
                const auto& node = static_cast<const TryStmt&>(stmt);
                VisitBlock(node.body);
                for (const auto& handler : node.handlers) {
                    Visit(handler.type.get());
                    VisitBlock(handler.body);
                }
                VisitBlock(node.orelse);
                VisitBlock(node.finalbody);
                break;
            }
            case StmtKind::kWith: {
                const auto& node = static_cast<const WithStmt&>(stmt);
                for (const auto& item : node.items) {
                    Visit(item.context_expr.get());
                }
                VisitBlock(node.body);
                break;
            }
            default:
                break;
        }
    }

    void Visit(const Expr* expr) {
        if (!expr) {
            return;
        }
        switch (expr->kind) {
            case ExprKind::kBinOp: {
                const auto& node = static_cast<const BinOpExpr&>(*expr);
                Visit(node.left.get());
                Visit(node.right.get());
                break;
            }
            case ExprKind::kUnaryOp:
                Visit(static_cast<const UnaryOpExpr&>(*expr).operand.get());
                break;
            case ExprKind::kBoolOp:
                for (const auto& value : static_cast<const BoolOpExpr&>(*expr).values) {
                    Visit(value.get());
                }
                break;
            case ExprKind::kCompare: {
                const auto& node = static_cast<const CompareExpr&>(*expr);
                Visit(node.left.get());
                for (const auto& comparator : node.comparators) {
                    Visit(comparator.get());
                }
                break;
            }
            case ExprKind::kCall: {
                const auto& node = static_cast<const CallExpr&>(*expr);
                Visit(node.func.get());
                for (const auto& arg : node.args) {
                    Visit(arg.get());
                }
                for (const auto& keyword : node.keywords) {
                    Visit(keyword.value.get());
                }
                break;
            }
            case ExprKind::kAttribute:
                Visit(static_cast<const AttributeExpr&>(*expr).value.get());
                break;
            case ExprKind::kSubscript: {
                const auto& node = static_cast<const SubscriptExpr&>(*expr);
                Visit(node.value.get());
                Visit(node.slice.get());
                break;
            }
            case ExprKind::kSlice: {
                const auto& node = static_cast<const SliceExpr&>(*expr);
                Visit(node.lower.get());
                Visit(node.upper.get());
                Visit(node.step.get());
                break;
            }
            case ExprKind::kList:
            case ExprKind::kTuple:
            case ExprKind::kSet:
                for (const auto& element : static_cast<const SequenceExpr&>(*expr).elts) {
                    Visit(element.get());
                }
                break;
            case ExprKind::kDict: {
                const auto& node = static_cast<const DictExpr&>(*expr);
                for (const auto& key : node.keys) {
                    Visit(key.get());
                }
                for (const auto& value : node.values) {
                    Visit(value.get());
                }
                break;
            }
            case ExprKind::kListComp:
            case ExprKind::kSetComp:
            case ExprKind::kDictComp:
            case ExprKind::kGeneratorExp: {
                const auto& node = static_cast<const ComprehensionExpr&>(*expr);
                for (const auto& generator : node.generators) {
                    CollectTargetNames(*generator.target, out_);
                    Visit(generator.iter.get());
                    for (const auto& condition : generator.ifs) {
                        Visit(condition.get());
                    }
                }
                Visit(node.element.get());
                Visit(node.value.get());
                break;
            }
            case ExprKind::kLambda: {
                const auto& node = static_cast<const LambdaExpr&>(*expr);
                VisitArguments(node.args);
                Visit(node.body.get());
                break;
            }
            case ExprKind::kIfExp: {
                const auto& node = static_cast<const IfExpExpr&>(*expr);
                Visit(node.test.get());
                Visit(node.body.get());
                Visit(node.orelse.get());
                break;
            }
            case ExprKind::kStarred:
                Visit(static_cast<const StarredExpr&>(*expr).value.get());
                break;
            case ExprKind::kJoinedStr:
                for (const auto& value : static_cast<const JoinedStrExpr&>(*expr).values) {
                    Visit(value.get());
                }
                break;
            case ExprKind::kFormattedValue: {
                const auto& node = static_cast<const FormattedValueExpr&>(*expr);
                Visit(node.value.get());
                Visit(node.format_spec.get());
                break;
            }
            case ExprKind::kNamedExpr: {
                const auto& node = static_cast<const NamedExpr&>(*expr);
                CollectTargetNames(*node.target, out_);
                Visit(node.value.get());
                break;
            }
            case ExprKind::kAwait:
            case ExprKind::kYield:
            case ExprKind::kYieldFrom:
                Visit(static_cast<const WrapperExpr&>(*expr).value.get());
                break;
            default:
                break;
        }
    }

private:
    void VisitArguments(const Arguments& args) {
        CollectParameters(args, out_);
        for (const auto& value : args.defaults) {
            Visit(value.get());
        }
        for (const auto& value : args.kw_defaults) {
            Visit(value.get());
        }
    }

    std::set<std::string>& out_;
};

}  // namespace

void CollectTargetNames(const Expr& target, std::set<std::string>& out) {
    switch (target.kind) {
        case ExprKind::kName:
            out.insert(static_cast<const NameExpr&>(target).id);
            break;
        case ExprKind::kStarred:
            CollectTargetNames(*static_cast<const StarredExpr&>(target).value, out);
            break;
        case ExprKind::kTuple:
        case ExprKind::kList:
            for (const auto& element : static_cast<const SequenceExpr&>(target).elts) {
                CollectTargetNames(*element, out);
            }
            break;
        default:
            break;
    }
}

std::set<std::string> FunctionLocals(const Arguments& args, const Block& body) {
    std::set<std::string> locals;
    CollectParameters(args, locals);
    CollectBlockLocals(body, locals);
    return locals;
}

std::set<std::string> ComprehensionLocals(const ComprehensionExpr& comprehension) {
    std::set<std::string> locals;
    for (const auto& generator : comprehension.generators) {
        CollectTargetNames(*generator.target, locals);
    }
    return locals;
}

std::set<std::string> CollectBoundNames(const Module& module) {
    std::set<std::string> names;
    BindingCollector collector(names);
    collector.VisitBlock(module.body);
    return names;
}

}  // namespace mathguard::lang
