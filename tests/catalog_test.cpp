#include <gtest/gtest.h>

#include "catalog/capability_catalog.hpp"

using mathguard::catalog::CapabilityCatalog;

TEST(CatalogTest, ApprovedModules) {
    const auto& catalog = CapabilityCatalog::Default();
    for (const char* name : {"math", "cmath", "fractions", "decimal", "itertools",
                             "functools", "operator", "statistics", "random"}) {
        EXPECT_TRUE(catalog.IsModuleAllowed(name)) << name;
    }
    for (const char* name : {"os", "sys", "subprocess", "socket", "builtins", "importlib", "numpy"}) {
        EXPECT_FALSE(catalog.IsModuleAllowed(name)) << name;
    }
    EXPECT_EQ(catalog.ModuleNames().size(), 9u);
}

TEST(CatalogTest, ExplicitMemberLists) {
    const auto& catalog = CapabilityCatalog::Default();
    EXPECT_TRUE(catalog.IsMemberAllowed("math", "sqrt"));
    EXPECT_TRUE(catalog.IsMemberAllowed("math", "pi"));
    EXPECT_FALSE(catalog.IsMemberAllowed("math", "nextafter"));
    EXPECT_TRUE(catalog.IsMemberAllowed("functools", "reduce"));
    EXPECT_FALSE(catalog.IsMemberAllowed("functools", "lru_cache"));
    EXPECT_FALSE(catalog.IsMemberAllowed("operator", "attrgetter"));
    EXPECT_FALSE(catalog.IsMemberAllowed("random", "SystemRandom"));
}

TEST(CatalogTest, OpenModulesStillRejectDunders) {
    const auto& catalog = CapabilityCatalog::Default();
    EXPECT_TRUE(catalog.IsMemberAllowed("itertools", "permutations"));
    EXPECT_TRUE(catalog.IsMemberAllowed("statistics", "median"));
    EXPECT_FALSE(catalog.IsMemberAllowed("itertools", "__loader__"));
    EXPECT_FALSE(catalog.IsMemberAllowed("statistics", "__dict__"));
    EXPECT_FALSE(catalog.IsMemberAllowed("os", "path"));
}

TEST(CatalogTest, Builtins) {
    const auto& catalog = CapabilityCatalog::Default();
    for (const char* name : {"len", "range", "sum", "sorted", "isinstance", "frozenset"}) {
        EXPECT_TRUE(catalog.IsBuiltinAllowed(name)) << name;
    }
    for (const char* name : {"print", "open", "eval", "getattr", "type", "object"}) {
        EXPECT_FALSE(catalog.IsBuiltinAllowed(name)) << name;
    }
}

TEST(CatalogTest, DenyLists) {
    const auto& catalog = CapabilityCatalog::Default();
    EXPECT_TRUE(catalog.IsForbiddenPrimitive("eval"));
    EXPECT_TRUE(catalog.IsForbiddenPrimitive("__import__"));
    EXPECT_TRUE(catalog.IsForbiddenPrimitive("getattr"));
    EXPECT_FALSE(catalog.IsForbiddenPrimitive("sum"));
    EXPECT_TRUE(catalog.IsDangerousAttribute("f_globals"));
    EXPECT_TRUE(catalog.IsDangerousAttribute("gi_frame"));
    EXPECT_FALSE(catalog.IsDangerousAttribute("real"));
    EXPECT_TRUE(catalog.IsForbiddenCallAttribute("system"));
    EXPECT_TRUE(catalog.IsForbiddenCallAttribute("popen"));
    EXPECT_FALSE(catalog.IsForbiddenCallAttribute("append"));
}

TEST(CatalogTest, DefaultIsASingleton) {
    EXPECT_EQ(&CapabilityCatalog::Default(), &CapabilityCatalog::Default());
}
