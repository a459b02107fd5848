#pragma once

#include <set>
#include <string>

#include "lang/ast.hpp"

namespace mathguard::lang {

// Names an assignment target binds: `a`, `(a, *b)`, `[x, y]`. Attribute and
// subscript targets bind nothing.
void CollectTargetNames(const Expr& target, std::set<std::string>& out);

// Local names of a function body: parameters plus every name the body binds
// directly (assignments, loop targets, nested def names, imports). Nested
// functions, lambdas and comprehensions have their own scopes and are skipped.
std::set<std::string> FunctionLocals(const Arguments& args, const Block& body);

// Names bound by the `for` clauses of a comprehension.
std::set<std::string> ComprehensionLocals(const ComprehensionExpr& comprehension);

// Every name the module binds anywhere, including nested functions, lambda
// parameters and comprehension targets. Import aliases are included.
std::set<std::string> CollectBoundNames(const Module& module);

}  // namespace mathguard::lang
