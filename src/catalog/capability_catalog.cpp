#include "catalog/capability_catalog.hpp"

#include "utils/common.hpp"

namespace mathguard::catalog {
namespace {

ModulePolicy Explicit(std::set<std::string> members) {
    ModulePolicy policy{};
    policy.members = std::move(members);
    return policy;
}

ModulePolicy AllMembers() {
    ModulePolicy policy{};
    policy.all_members = true;
    return policy;
}

}  // namespace

const CapabilityCatalog& CapabilityCatalog::Default() {
    static const CapabilityCatalog catalog;
    return catalog;
}

CapabilityCatalog::CapabilityCatalog() {
    modules_.emplace("math", Explicit({
        "pi", "e", "tau", "inf", "nan",
        "sqrt", "isqrt", "cbrt", "pow", "exp", "exp2", "expm1",
        "log", "log2", "log10", "log1p",
        "sin", "cos", "tan", "asin", "acos", "atan", "atan2",
        "sinh", "cosh", "tanh", "asinh", "acosh", "atanh",
        "degrees", "radians", "hypot", "dist",
        "floor", "ceil", "trunc", "fabs", "copysign", "fmod", "modf",
        "frexp", "ldexp", "remainder",
        "factorial", "gcd", "lcm", "comb", "perm", "fsum", "prod",
        "isclose", "isfinite", "isinf", "isnan",
        "erf", "erfc", "gamma", "lgamma"}));
    modules_.emplace("cmath", Explicit({
        "pi", "e", "tau", "inf", "nan", "infj", "nanj",
        "sqrt", "exp", "log", "log10",
        "sin", "cos", "tan", "asin", "acos", "atan",
        "sinh", "cosh", "tanh", "asinh", "acosh", "atanh",
        "phase", "polar", "rect",
        "isclose", "isfinite", "isinf", "isnan"}));
    modules_.emplace("fractions", Explicit({"Fraction"}));
    modules_.emplace("decimal", Explicit({
        "Decimal",
        "ROUND_HALF_UP", "ROUND_HALF_EVEN", "ROUND_HALF_DOWN",
        "ROUND_UP", "ROUND_DOWN", "ROUND_CEILING", "ROUND_FLOOR"}));
    modules_.emplace("itertools", AllMembers());
    modules_.emplace("functools", Explicit({"reduce", "partial"}));
    // attrgetter and methodcaller are attribute lookups by string: left out.
    modules_.emplace("operator", Explicit({
        "add", "sub", "mul", "truediv", "floordiv", "mod", "pow",
        "neg", "pos", "abs", "index",
        "eq", "ne", "lt", "le", "gt", "ge",
        "not_", "truth", "and_", "or_", "xor", "invert", "lshift", "rshift",
        "concat", "contains", "itemgetter"}));
    modules_.emplace("statistics", AllMembers());
    modules_.emplace("random", Explicit({
        "seed", "random", "uniform", "randint", "randrange",
        "choice", "choices", "shuffle", "sample",
        "gauss", "normalvariate", "expovariate"}));

    builtins_ = {
        "len", "range", "enumerate", "zip", "map", "filter",
        "sum", "abs", "min", "max", "pow", "round", "divmod",
        "sorted", "reversed", "all", "any",
        "int", "float", "complex", "str", "bool",
        "list", "tuple", "dict", "set", "frozenset",
        "isinstance"};

    forbidden_primitives_ = {
        "eval", "exec", "compile", "__import__", "reload",
        "getattr", "setattr", "delattr", "hasattr",
        "globals", "locals", "vars", "dir", "super", "memoryview",
        "open", "input", "breakpoint", "help", "exit", "quit",
        "os", "sys", "subprocess", "socket", "ctypes", "builtins",
        "importlib", "shutil", "pathlib", "io", "signal", "posix", "pty",
        "multiprocessing", "threading", "pickle", "marshal", "inspect", "gc"};

    dangerous_attributes_ = {
        "func_globals", "func_code", "func_closure",
        "gi_frame", "gi_code", "gi_yieldfrom",
        "cr_frame", "cr_code", "cr_await",
        "ag_frame", "ag_code",
        "f_globals", "f_locals", "f_builtins", "f_back", "f_code",
        "tb_frame", "tb_next", "co_code", "mro"};

    forbidden_call_attributes_ = {
        "system", "popen", "spawnl", "spawnle", "spawnlp", "spawnv", "spawnve", "spawnvp",
        "execl", "execle", "execlp", "execv", "execve", "execvp",
        "fork", "forkpty", "kill", "killpg",
        "listdir", "scandir", "unlink", "rmdir", "removedirs",
        "mkdir", "makedirs", "rename", "chmod", "chown", "symlink",
        "open", "read_text", "write_text", "read_bytes", "write_bytes",
        "urlopen", "connect", "bind", "listen", "accept", "socket",
        "load_module", "exec_module", "import_module", "reload",
        "eval", "exec", "compile", "getattr", "setattr", "delattr"};
}

bool CapabilityCatalog::IsModuleAllowed(const std::string& name) const {
    return modules_.find(name) != modules_.end();
}

bool CapabilityCatalog::IsMemberAllowed(const std::string& module, const std::string& member) const {
    const auto* policy = FindModule(module);
    if (!policy || member.empty() || utils::IsDunder(member)) {
        return false;
    }
    if (policy->all_members) {
        return true;
    }
    return policy->members.count(member) > 0;
}

bool CapabilityCatalog::IsBuiltinAllowed(const std::string& name) const {
    return builtins_.count(name) > 0;
}

bool CapabilityCatalog::IsForbiddenPrimitive(const std::string& name) const {
    return forbidden_primitives_.count(name) > 0;
}

bool CapabilityCatalog::IsDangerousAttribute(const std::string& name) const {
    return dangerous_attributes_.count(name) > 0;
}

bool CapabilityCatalog::IsForbiddenCallAttribute(const std::string& name) const {
    return forbidden_call_attributes_.count(name) > 0;
}

std::vector<std::string> CapabilityCatalog::ModuleNames() const {
    std::vector<std::string> names;
    for (const auto& [name, _] : modules_) {
        names.push_back(name);
    }
    return names;
}

const ModulePolicy* CapabilityCatalog::FindModule(const std::string& name) const {
    auto it = modules_.find(name);
    if (it == modules_.end()) {
        return nullptr;
    }
    return &it->second;
}

}  // namespace mathguard::catalog
