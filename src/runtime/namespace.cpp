#include "runtime/namespace.hpp"

#include <set>

#include "runtime/builtins.hpp"
#include "runtime/modules/modules.hpp"
#include "utils/common.hpp"

namespace mathguard::runtime {
namespace {

void CollectImports(const lang::Block& block, std::set<std::string>& out);

void CollectImports(const lang::Stmt& stmt, std::set<std::string>& out) {
    switch (stmt.kind) {
        case lang::StmtKind::kImport:
            for (const auto& alias : static_cast<const lang::ImportStmt&>(stmt).names) {
                out.insert(alias.name);
            }
            break;
        case lang::StmtKind::kImportFrom: {
            const auto& from = static_cast<const lang::ImportFromStmt&>(stmt);
            if (from.level == 0) {
                out.insert(from.module);
            }
            break;
        }
        case lang::StmtKind::kFunctionDef:
            CollectImports(static_cast<const lang::FunctionDefStmt&>(stmt).body, out);
            break;
        case lang::StmtKind::kIf: {
            const auto& branch = static_cast<const lang::IfStmt&>(stmt);
            CollectImports(branch.body, out);
            CollectImports(branch.orelse, out);
            break;
        }
        case lang::StmtKind::kFor: {
            const auto& loop = static_cast<const lang::ForStmt&>(stmt);
            CollectImports(loop.body, out);
            CollectImports(loop.orelse, out);
            break;
        }
        case lang::StmtKind::kWhile: {
            const auto& loop = static_cast<const lang::WhileStmt&>(stmt);
            CollectImports(loop.body, out);
            CollectImports(loop.orelse, out);
            break;
        }
        case lang::StmtKind::kTry: {
            const auto& guarded = static_cast<const lang::TryStmt&>(stmt);
            CollectImports(guarded.body, out);
            for (const auto& handler : guarded.handlers) {
                CollectImports(handler.body, out);
            }
            CollectImports(guarded.orelse, out);
            CollectImports(guarded.finalbody, out);
            break;
        }
        case lang::StmtKind::kWith:
            CollectImports(static_cast<const lang::WithStmt&>(stmt).body, out);
            break;
        default:
            break;
    }
}

void CollectImports(const lang::Block& block, std::set<std::string>& out) {
    for (const auto& stmt : block) {
        CollectImports(*stmt, out);
    }
}

}  // namespace

ExecutionNamespace BuildNamespace(const lang::Module& module, const catalog::CapabilityCatalog& catalog) {
    ExecutionNamespace ns;
    for (const auto& [name, value] : NativeBuiltins()) {
        if (catalog.IsBuiltinAllowed(name)) {
            ns.builtins.emplace(name, value);
        }
    }

    std::set<std::string> imported;
    CollectImports(module.body, imported);
    for (const auto& name : imported) {
        modules::MemberTable members;
        if (!catalog.IsModuleAllowed(name) || !modules::NativeModule(name, members)) {
            continue;
        }
        auto proxy = std::make_shared<ModuleObject>();
        proxy->name = name;
        for (auto& [member, value] : members) {
            if (!utils::IsDunder(member) && catalog.IsMemberAllowed(name, member)) {
                proxy->members.emplace(member, std::move(value));
            }
        }
        ns.modules.emplace(name, Value::FromObject(ValueKind::kModule, std::move(proxy)));
    }
    return ns;
}

std::vector<std::string> EnumerateNames(const ExecutionNamespace& ns) {
    std::vector<std::string> names;
    for (const auto& [name, value] : ns.builtins) {
        names.push_back(name);
    }
    for (const auto& [name, value] : ns.modules) {
        names.push_back(name);
        for (const auto& [member, member_value] : value.As<ModuleObject>().members) {
            names.push_back(name + "." + member);
        }
    }
    return names;
}

}  // namespace mathguard::runtime
