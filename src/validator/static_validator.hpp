#pragma once

#include <cstddef>
#include <string>

#include "catalog/capability_catalog.hpp"

namespace mathguard::validator {

// Rule categories in reporting priority: when several fire, the outcome names
// the first one in this order.
enum class RuleKind {
    kNone,
    kSyntax,
    kImport,
    kName,
    kCall,
    kConstruct
};

const char* ToString(RuleKind rule);

struct ValidationOutcome {
    bool accepted = true;
    RuleKind rule = RuleKind::kNone;
    std::string reason;
    std::string offending_construct;
    int line = 0;
    int column = 0;

    static ValidationOutcome Accept() { return {}; }
    static ValidationOutcome Reject(RuleKind rule,
                                    std::string reason,
                                    std::string offending_construct,
                                    int line,
                                    int column);
};

struct ValidatorOptions {
    std::size_t max_source_bytes = 64 * 1024;
    // def and lambda nesting combined.
    int max_function_depth = 2;
    int max_nesting_depth = 200;
};

// Static whitelist check of a submission. Never executes anything; the walk
// is linear in the size of the tree and keeps all state in per-call locals,
// so one instance may be shared between threads.
class StaticValidator {
public:
    explicit StaticValidator(const catalog::CapabilityCatalog& catalog = catalog::CapabilityCatalog::Default(),
                             ValidatorOptions options = {});

    ValidationOutcome Validate(const std::string& code) const;

    const ValidatorOptions& options() const { return options_; }

private:
    const catalog::CapabilityCatalog& catalog_;
    ValidatorOptions options_;
};

// Validates against the default catalog and options.
ValidationOutcome Validate(const std::string& code);

}  // namespace mathguard::validator
