#pragma once

#include <map>
#include <string>

#include "catalog/capability_catalog.hpp"
#include "lang/ast.hpp"
#include "runtime/value.hpp"

namespace mathguard::runtime {

// The identifiers one execution can resolve beyond its own bindings:
// approved builtins and a proxy for every approved module the submission
// imports, holding only approved members.
struct ExecutionNamespace {
    std::map<std::string, Value> builtins;
    std::map<std::string, Value> modules;
};

ExecutionNamespace BuildNamespace(const lang::Module& module,
                                  const catalog::CapabilityCatalog& catalog = catalog::CapabilityCatalog::Default());

// Every identifier the namespace binds, as "name" for builtins and
// "module.member" for module members.
std::vector<std::string> EnumerateNames(const ExecutionNamespace& ns);

}  // namespace mathguard::runtime
