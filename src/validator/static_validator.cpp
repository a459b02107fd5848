#include "validator/static_validator.hpp"

#include <array>
#include <map>
#include <optional>
#include <set>
#include <vector>

#include "lang/parser.hpp"
#include "lang/scope.hpp"
#include "utils/common.hpp"

namespace mathguard::validator {
namespace {

using namespace mathguard::lang;

struct Violation {
    std::string reason;
    std::string construct;
    SourceLocation loc;
};

class Walker {
public:
    Walker(const catalog::CapabilityCatalog& catalog,
           const ValidatorOptions& options,
           std::set<std::string> bound)
        : catalog_(catalog), options_(options), bound_(std::move(bound)) {}

    ValidationOutcome Run(const Module& module) {
        CollectModuleAliases(module.body);
        VisitBlock(module.body);
        const std::array<RuleKind, 4> order = {
            RuleKind::kImport, RuleKind::kName, RuleKind::kCall, RuleKind::kConstruct};
        for (std::size_t i = 0; i < order.size(); ++i) {
            if (first_[i]) {
                return ValidationOutcome::Reject(order[i], first_[i]->reason, first_[i]->construct,
                                                 first_[i]->loc.line, first_[i]->loc.column);
            }
        }
        return ValidationOutcome::Accept();
    }

private:
    void Record(RuleKind rule, std::string reason, std::string construct, SourceLocation loc) {
        const auto index = static_cast<std::size_t>(rule) - static_cast<std::size_t>(RuleKind::kImport);
        if (!first_[index]) {
            first_[index] = Violation{std::move(reason), std::move(construct), loc};
        }
    }

    void CollectModuleAliases(const Block& body) {
        for (const auto& stmt : body) {
            if (stmt->kind == StmtKind::kImport) {
                for (const auto& alias : static_cast<const ImportStmt&>(*stmt).names) {
                    module_aliases_[alias.asname.empty() ? alias.name : alias.asname] = alias.name;
                }
            } else if (stmt->kind == StmtKind::kFunctionDef) {
                CollectModuleAliases(static_cast<const FunctionDefStmt&>(*stmt).body);
            } else if (stmt->kind == StmtKind::kIf) {
                const auto& node = static_cast<const IfStmt&>(*stmt);
                CollectModuleAliases(node.body);
                CollectModuleAliases(node.orelse);
            } else if (stmt->kind == StmtKind::kFor) {
                const auto& node = static_cast<const ForStmt&>(*stmt);
                CollectModuleAliases(node.body);
                CollectModuleAliases(node.orelse);
            } else if (stmt->kind == StmtKind::kWhile) {
                const auto& node = static_cast<const WhileStmt&>(*stmt);
                CollectModuleAliases(node.body);
                CollectModuleAliases(node.orelse);
            }
        }
    }

    // Identifiers that appear in binding positions (def names, parameters,
    // aliases) get the same dunder and forbidden-primitive treatment as loads.
    void CheckIdentifier(const std::string& name, SourceLocation loc) {
        if (utils::IsDunder(name)) {
            Record(RuleKind::kName, "use of dunder name '" + name + "' is not allowed",
                   "name '" + name + "'", loc);
        } else if (catalog_.IsForbiddenPrimitive(name)) {
            Record(RuleKind::kName, "use of forbidden primitive '" + name + "' is not allowed",
                   "name '" + name + "'", loc);
        }
    }

    void CheckArguments(const Arguments& args) {
        auto check = [this](const Parameter& parameter) {
            CheckIdentifier(parameter.name, parameter.loc);
            if (parameter.annotation) {
                Visit(*parameter.annotation);
            }
        };
        for (const auto& parameter : args.positional) {
            check(parameter);
        }
        if (args.vararg) {
            check(*args.vararg);
        }
        for (const auto& parameter : args.kwonly) {
            check(parameter);
        }
        if (args.kwarg) {
            check(*args.kwarg);
        }
        for (const auto& value : args.defaults) {
            Visit(*value);
        }
        for (const auto& value : args.kw_defaults) {
            if (value) {
                Visit(*value);
            }
        }
    }

    void EnterFunction(const char* what, SourceLocation loc, const std::string& construct) {
        ++function_depth_;
        if (function_depth_ > options_.max_function_depth) {
            Record(RuleKind::kConstruct,
                   std::string(what) + " nesting depth exceeds maximum (" +
                       std::to_string(options_.max_function_depth) + ")",
                   construct, loc);
        }
    }

    void VisitBlock(const Block& body) {
        for (const auto& stmt : body) {
            VisitStmt(*stmt);
        }
    }

    void VisitImport(const ImportStmt& stmt) {
        for (const auto& alias : stmt.names) {
            if (!catalog_.IsModuleAllowed(alias.name)) {
                Record(RuleKind::kImport, "import of module '" + alias.name + "' is not allowed",
                       "import " + alias.name, alias.loc);
            }
            if (!alias.asname.empty()) {
                CheckIdentifier(alias.asname, alias.loc);
            } else {
                CheckIdentifier(alias.name, alias.loc);
            }
        }
    }

    void VisitImportFrom(const ImportFromStmt& stmt) {
        const std::string construct = "from " + std::string(static_cast<std::size_t>(stmt.level), '.') +
            stmt.module + " import";
        if (stmt.level > 0) {
            Record(RuleKind::kImport, "relative import is not allowed", construct, stmt.loc);
            return;
        }
        if (!catalog_.IsModuleAllowed(stmt.module)) {
            Record(RuleKind::kImport, "import of module '" + stmt.module + "' is not allowed",
                   construct, stmt.loc);
            return;
        }
        for (const auto& alias : stmt.names) {
            if (alias.name == "*") {
                Record(RuleKind::kImport,
                       "wildcard import from module '" + stmt.module + "' is not allowed",
                       construct + " *", alias.loc);
                continue;
            }
            if (!catalog_.IsMemberAllowed(stmt.module, alias.name)) {
                Record(RuleKind::kImport,
                       "import of member '" + alias.name + "' from module '" + stmt.module +
                           "' is not allowed",
                       construct + " " + alias.name, alias.loc);
            }
            if (!alias.asname.empty()) {
                CheckIdentifier(alias.asname, alias.loc);
            }
        }
    }

    void VisitStmt(const Stmt& stmt) {
        switch (stmt.kind) {
            case StmtKind::kExpr:
                Visit(*static_cast<const ExprStmt&>(stmt).value);
                return;
            case StmtKind::kAssign: {
                const auto& node = static_cast<const AssignStmt&>(stmt);
                for (const auto& target : node.targets) {
                    VisitTarget(*target);
                }
                Visit(*node.value);
                return;
            }
            case StmtKind::kAugAssign: {
                const auto& node = static_cast<const AugAssignStmt&>(stmt);
                VisitTarget(*node.target);
                Visit(*node.value);
                return;
            }
            case StmtKind::kAnnAssign: {
                const auto& node = static_cast<const AnnAssignStmt&>(stmt);
                VisitTarget(*node.target);
                Visit(*node.annotation);
                if (node.value) {
                    Visit(*node.value);
                }
                return;
            }
            case StmtKind::kFunctionDef: {
                const auto& node = static_cast<const FunctionDefStmt&>(stmt);
                const std::string construct = Describe(stmt);
                CheckIdentifier(node.name, node.loc);
                if (node.is_async) {
                    Record(RuleKind::kConstruct, "async functions are not allowed", construct, node.loc);
                }
                if (!node.decorators.empty()) {
                    Record(RuleKind::kConstruct, "decorators are not allowed", construct,
                           node.decorators.front()->loc);
                    for (const auto& decorator : node.decorators) {
                        Visit(*decorator);
                    }
                }
                if (node.returns) {
                    Visit(*node.returns);
                }
                CheckArguments(node.args);
                EnterFunction("function", node.loc, construct);
                functions_.push_back(node.name);
                VisitBlock(node.body);
                functions_.pop_back();
                --function_depth_;
                return;
            }
            case StmtKind::kReturn: {
                const auto& node = static_cast<const ReturnStmt&>(stmt);
                if (node.value) {
                    Visit(*node.value);
                }
                return;
            }
            case StmtKind::kIf: {
                const auto& node = static_cast<const IfStmt&>(stmt);
                Visit(*node.test);
                VisitBlock(node.body);
                VisitBlock(node.orelse);
                return;
            }
            case StmtKind::kFor: {
                const auto& node = static_cast<const ForStmt&>(stmt);
                if (node.is_async) {
                    Record(RuleKind::kConstruct, "async loops are not allowed", Describe(stmt), node.loc);
                }
                VisitTarget(*node.target);
                Visit(*node.iter);
                VisitBlock(node.body);
                VisitBlock(node.orelse);
                return;
            }
            case StmtKind::kWhile: {
                const auto& node = static_cast<const WhileStmt&>(stmt);
                Visit(*node.test);
                VisitBlock(node.body);
                VisitBlock(node.orelse);
                return;
            }
            case StmtKind::kBreak:
            case StmtKind::kContinue:
            case StmtKind::kPass:
                return;
            case StmtKind::kImport:
                VisitImport(static_cast<const ImportStmt&>(stmt));
                return;
            case StmtKind::kImportFrom:
                VisitImportFrom(static_cast<const ImportFromStmt&>(stmt));
                return;
            case StmtKind::kClassDef:
                Record(RuleKind::kConstruct, "class definitions are not allowed", Describe(stmt), stmt.loc);
                return;
            case StmtKind::kGlobal:
                Record(RuleKind::kConstruct, "global declarations are not allowed", Describe(stmt), stmt.loc);
                return;
            case StmtKind::kNonlocal:
                Record(RuleKind::kConstruct, "nonlocal declarations are not allowed", Describe(stmt), stmt.loc);
                return;
            case StmtKind::kTry:
                Record(RuleKind::kConstruct, "try statements are not allowed", Describe(stmt), stmt.loc);
                return;
            case StmtKind::kWith:
                Record(RuleKind::kConstruct, "with statements are not allowed", Describe(stmt), stmt.loc);
                return;
            case StmtKind::kRaise:
                Record(RuleKind::kConstruct, "raise statements are not allowed", Describe(stmt), stmt.loc);
                return;
            case StmtKind::kAssert:
                Record(RuleKind::kConstruct, "assert statements are not allowed", Describe(stmt), stmt.loc);
                return;
            case StmtKind::kDelete:
                Record(RuleKind::kConstruct, "del statements are not allowed", Describe(stmt), stmt.loc);
                return;
            default:
                Record(RuleKind::kConstruct,
                       std::string("unsupported syntax node '") + ToString(stmt.kind) + "'",
                       Describe(stmt), stmt.loc);
                return;
        }
    }

    void VisitTarget(const Expr& target) {
        switch (target.kind) {
            case ExprKind::kName:
                CheckIdentifier(static_cast<const NameExpr&>(target).id, target.loc);
                return;
            case ExprKind::kTuple:
            case ExprKind::kList:
                for (const auto& element : static_cast<const SequenceExpr&>(target).elts) {
                    VisitTarget(*element);
                }
                return;
            case ExprKind::kStarred:
                VisitTarget(*static_cast<const StarredExpr&>(target).value);
                return;
            case ExprKind::kSubscript: {
                const auto& node = static_cast<const SubscriptExpr&>(target);
                Visit(*node.value);
                Visit(*node.slice);
                return;
            }
            case ExprKind::kAttribute: {
                const auto& node = static_cast<const AttributeExpr&>(target);
                CheckAttributeName(node);
                Record(RuleKind::kConstruct, "attribute assignment is not allowed", Describe(target),
                       target.loc);
                Visit(*node.value);
                return;
            }
            default:
                Record(RuleKind::kConstruct,
                       std::string("unsupported syntax node '") + ToString(target.kind) + "'",
                       Describe(target), target.loc);
                return;
        }
    }

    void CheckAttributeName(const AttributeExpr& node) {
        const std::string& attr = node.attr;
        if (utils::IsDunder(attr)) {
            Record(RuleKind::kName, "access to dunder attribute '" + attr + "' is not allowed",
                   Describe(node), node.loc);
            return;
        }
        if (catalog_.IsDangerousAttribute(attr)) {
            Record(RuleKind::kName, "access to dangerous attribute '" + attr + "' is not allowed",
                   Describe(node), node.loc);
            return;
        }
        if (node.value->kind != ExprKind::kName) {
            return;
        }
        const auto& base = static_cast<const NameExpr&>(*node.value).id;
        const auto alias = module_aliases_.find(base);
        if (alias != module_aliases_.end() && catalog_.IsModuleAllowed(alias->second) &&
            !catalog_.IsMemberAllowed(alias->second, attr)) {
            Record(RuleKind::kName,
                   "access to member '" + attr + "' of module '" + alias->second + "' is not allowed",
                   Describe(node), node.loc);
        }
    }

    void CheckLoadedName(const NameExpr& node) {
        const std::string& id = node.id;
        if (utils::IsDunder(id) || catalog_.IsForbiddenPrimitive(id)) {
            CheckIdentifier(id, node.loc);
            return;
        }
        if (bound_.count(id) == 0 && !catalog_.IsBuiltinAllowed(id)) {
            Record(RuleKind::kName, "name '" + id + "' is not defined", Describe(node), node.loc);
        }
    }

    // Root identifier of a call target, looking through attribute, subscript
    // and call chains: `a.b[0]().c` resolves to `a`.
    static const NameExpr* CallRoot(const Expr& func) {
        const Expr* current = &func;
        while (true) {
            switch (current->kind) {
                case ExprKind::kName:
                    return static_cast<const NameExpr*>(current);
                case ExprKind::kAttribute:
                    current = static_cast<const AttributeExpr*>(current)->value.get();
                    break;
                case ExprKind::kSubscript:
                    current = static_cast<const SubscriptExpr*>(current)->value.get();
                    break;
                case ExprKind::kCall:
                    current = static_cast<const CallExpr*>(current)->func.get();
                    break;
                default:
                    return nullptr;
            }
        }
    }

    void CheckCall(const CallExpr& node) {
        const std::string construct = Describe(node);
        if (node.func->kind == ExprKind::kAttribute) {
            const auto& attr = static_cast<const AttributeExpr&>(*node.func).attr;
            if (catalog_.IsForbiddenCallAttribute(attr)) {
                Record(RuleKind::kCall, "call to forbidden attribute '" + attr + "' is not allowed",
                       construct, node.loc);
            }
        }
        if (const auto* root = CallRoot(*node.func)) {
            if (catalog_.IsForbiddenPrimitive(root->id) || utils::IsDunder(root->id)) {
                Record(RuleKind::kCall, "call to forbidden primitive '" + root->id + "' is not allowed",
                       construct, node.loc);
            } else if (bound_.count(root->id) == 0 && !catalog_.IsBuiltinAllowed(root->id)) {
                Record(RuleKind::kCall, "call target '" + root->id + "' is not approved",
                       construct, node.loc);
            }
        }
        if (node.func->kind == ExprKind::kName && !functions_.empty()) {
            const auto& id = static_cast<const NameExpr&>(*node.func).id;
            if (id == functions_.back()) {
                Record(RuleKind::kConstruct, "recursion detected: function '" + id + "' calls itself",
                       construct, node.loc);
            }
        }
        for (const auto& keyword : node.keywords) {
            if (!keyword.arg.empty()) {
                CheckIdentifier(keyword.arg, keyword.loc);
            }
        }
    }

    void Visit(const Expr& expr) {
        switch (expr.kind) {
            case ExprKind::kName: {
                const auto& node = static_cast<const NameExpr&>(expr);
                if (node.ctx == ExprContext::kStore) {
                    CheckIdentifier(node.id, node.loc);
                } else {
                    CheckLoadedName(node);
                }
                return;
            }
            case ExprKind::kConstant:
                if (static_cast<const ConstantExpr&>(expr).constant == ConstantKind::kEllipsis) {
                    Record(RuleKind::kConstruct, "unsupported syntax node 'Ellipsis'", "Ellipsis", expr.loc);
                }
                return;
            case ExprKind::kBinOp: {
                const auto& node = static_cast<const BinOpExpr&>(expr);
                Visit(*node.left);
                Visit(*node.right);
                return;
            }
            case ExprKind::kUnaryOp:
                Visit(*static_cast<const UnaryOpExpr&>(expr).operand);
                return;
            case ExprKind::kBoolOp:
                for (const auto& value : static_cast<const BoolOpExpr&>(expr).values) {
                    Visit(*value);
                }
                return;
            case ExprKind::kCompare: {
                const auto& node = static_cast<const CompareExpr&>(expr);
                Visit(*node.left);
                for (const auto& comparator : node.comparators) {
                    Visit(*comparator);
                }
                return;
            }
            case ExprKind::kCall: {
                const auto& node = static_cast<const CallExpr&>(expr);
                CheckCall(node);
                Visit(*node.func);
                for (const auto& arg : node.args) {
                    Visit(*arg);
                }
                for (const auto& keyword : node.keywords) {
                    Visit(*keyword.value);
                }
                return;
            }
            case ExprKind::kAttribute: {
                // Base first, so the leftmost offending attribute of a chain is reported.
                const auto& node = static_cast<const AttributeExpr&>(expr);
                Visit(*node.value);
                CheckAttributeName(node);
                return;
            }
            case ExprKind::kSubscript: {
                const auto& node = static_cast<const SubscriptExpr&>(expr);
                Visit(*node.value);
                Visit(*node.slice);
                return;
            }
            case ExprKind::kSlice: {
                const auto& node = static_cast<const SliceExpr&>(expr);
                for (const auto* part : {node.lower.get(), node.upper.get(), node.step.get()}) {
                    if (part) {
                        Visit(*part);
                    }
                }
                return;
            }
            case ExprKind::kList:
            case ExprKind::kTuple:
            case ExprKind::kSet: {
                const auto& node = static_cast<const SequenceExpr&>(expr);
                for (const auto& element : node.elts) {
                    if (node.ctx == ExprContext::kStore) {
                        VisitTarget(*element);
                    } else {
                        Visit(*element);
                    }
                }
                return;
            }
            case ExprKind::kDict: {
                const auto& node = static_cast<const DictExpr&>(expr);
                for (std::size_t i = 0; i < node.values.size(); ++i) {
                    if (node.keys[i]) {
                        Visit(*node.keys[i]);
                    }
                    Visit(*node.values[i]);
                }
                return;
            }
            case ExprKind::kListComp:
            case ExprKind::kSetComp:
            case ExprKind::kDictComp:
            case ExprKind::kGeneratorExp: {
                const auto& node = static_cast<const ComprehensionExpr&>(expr);
                for (const auto& generator : node.generators) {
                    if (generator.is_async) {
                        Record(RuleKind::kConstruct, "async comprehensions are not allowed",
                               Describe(expr), expr.loc);
                    }
                    VisitTarget(*generator.target);
                    Visit(*generator.iter);
                    for (const auto& condition : generator.ifs) {
                        Visit(*condition);
                    }
                }
                Visit(*node.element);
                if (node.value) {
                    Visit(*node.value);
                }
                return;
            }
            case ExprKind::kLambda: {
                const auto& node = static_cast<const LambdaExpr&>(expr);
                CheckArguments(node.args);
                EnterFunction("lambda", node.loc, Describe(expr));
                Visit(*node.body);
                --function_depth_;
                return;
            }
            case ExprKind::kIfExp: {
                const auto& node = static_cast<const IfExpExpr&>(expr);
                Visit(*node.test);
                Visit(*node.body);
                Visit(*node.orelse);
                return;
            }
            case ExprKind::kStarred: {
                const auto& node = static_cast<const StarredExpr&>(expr);
                if (node.ctx == ExprContext::kStore) {
                    VisitTarget(*node.value);
                } else {
                    Visit(*node.value);
                }
                return;
            }
            case ExprKind::kJoinedStr:
                for (const auto& value : static_cast<const JoinedStrExpr&>(expr).values) {
                    Visit(*value);
                }
                return;
            case ExprKind::kFormattedValue: {
                const auto& node = static_cast<const FormattedValueExpr&>(expr);
                Visit(*node.value);
                if (node.format_spec) {
                    Visit(*node.format_spec);
                }
                return;
            }
            case ExprKind::kNamedExpr:
                Record(RuleKind::kConstruct, "assignment expressions are not allowed", Describe(expr), expr.loc);
                Visit(*static_cast<const NamedExpr&>(expr).value);
                return;
            case ExprKind::kYield:
            case ExprKind::kYieldFrom:
                Record(RuleKind::kConstruct, "yield expressions are not allowed", Describe(expr), expr.loc);
                return;
            case ExprKind::kAwait:
                Record(RuleKind::kConstruct, "await expressions are not allowed", Describe(expr), expr.loc);
                return;
            default:
                Record(RuleKind::kConstruct,
                       std::string("unsupported syntax node '") + ToString(expr.kind) + "'",
                       Describe(expr), expr.loc);
                return;
        }
    }

    const catalog::CapabilityCatalog& catalog_;
    const ValidatorOptions& options_;
    std::set<std::string> bound_;
    std::map<std::string, std::string> module_aliases_;
    std::vector<std::string> functions_;
    int function_depth_ = 0;
    std::array<std::optional<Violation>, 4> first_;
};

}  // namespace

const char* ToString(RuleKind rule) {
    switch (rule) {
        case RuleKind::kNone: return "none";
        case RuleKind::kSyntax: return "syntax";
        case RuleKind::kImport: return "import";
        case RuleKind::kName: return "name";
        case RuleKind::kCall: return "call";
        case RuleKind::kConstruct: return "construct";
    }
    return "unknown";
}

ValidationOutcome ValidationOutcome::Reject(RuleKind rule,
                                            std::string reason,
                                            std::string offending_construct,
                                            int line,
                                            int column) {
    ValidationOutcome outcome;
    outcome.accepted = false;
    outcome.rule = rule;
    outcome.reason = std::move(reason);
    outcome.offending_construct = std::move(offending_construct);
    outcome.line = line;
    outcome.column = column;
    return outcome;
}

StaticValidator::StaticValidator(const catalog::CapabilityCatalog& catalog, ValidatorOptions options)
    : catalog_(catalog), options_(options) {}

ValidationOutcome StaticValidator::Validate(const std::string& code) const {
    if (code.size() > options_.max_source_bytes) {
        return ValidationOutcome::Reject(
            RuleKind::kSyntax, "syntax error",
            "source exceeds maximum size (" + std::to_string(options_.max_source_bytes) + " bytes)", 0, 0);
    }
    Module module;
    try {
        ParserOptions parser_options;
        parser_options.max_depth = options_.max_nesting_depth;
        module = Parse(code, parser_options);
    } catch (const SyntaxError& e) {
        return ValidationOutcome::Reject(RuleKind::kSyntax, "syntax error", e.what(),
                                         e.location().line, e.location().column);
    }
    Walker walker(catalog_, options_, CollectBoundNames(module));
    return walker.Run(module);
}

ValidationOutcome Validate(const std::string& code) {
    static const StaticValidator validator;
    return validator.Validate(code);
}

}  // namespace mathguard::validator
