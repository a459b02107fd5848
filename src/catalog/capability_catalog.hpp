#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>

namespace mathguard::catalog {

// Member whitelist of one approved module. A fully-open module approves every
// non-dunder member the runtime implements for it.
struct ModulePolicy {
    bool all_members = false;
    std::set<std::string> members;
};

// The fixed whitelist of modules, module members and builtins a submission may
// use, plus the deny lists consulted by the static validator. Built once and
// never mutated; safe to share across threads without locking.
class CapabilityCatalog {
public:
    static const CapabilityCatalog& Default();

    bool IsModuleAllowed(const std::string& name) const;
    bool IsMemberAllowed(const std::string& module, const std::string& member) const;
    bool IsBuiltinAllowed(const std::string& name) const;

    // Dynamic evaluation, reflection, I/O and process-control names. Never
    // callable and never referencable, even when a submission rebinds them.
    bool IsForbiddenPrimitive(const std::string& name) const;
    // Non-dunder introspection attributes (frames, code objects, globals).
    bool IsDangerousAttribute(const std::string& name) const;
    // Attribute names that reach process, file, socket or loader facilities
    // when they end a call chain.
    bool IsForbiddenCallAttribute(const std::string& name) const;

    std::vector<std::string> ModuleNames() const;
    const ModulePolicy* FindModule(const std::string& name) const;
    const std::set<std::string>& Builtins() const { return builtins_; }

private:
    CapabilityCatalog();

    std::map<std::string, ModulePolicy> modules_;
    std::set<std::string> builtins_;
    std::set<std::string> forbidden_primitives_;
    std::set<std::string> dangerous_attributes_;
    std::set<std::string> forbidden_call_attributes_;
};

}  // namespace mathguard::catalog
