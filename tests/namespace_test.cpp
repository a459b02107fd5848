#include <gtest/gtest.h>

#include <algorithm>
#include <string>

#include "lang/parser.hpp"
#include "runtime/namespace.hpp"
#include "utils/common.hpp"

using mathguard::catalog::CapabilityCatalog;
using mathguard::runtime::BuildNamespace;
using mathguard::runtime::EnumerateNames;

namespace {

bool Contains(const std::vector<std::string>& names, const std::string& name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

}  // namespace

TEST(NamespaceTest, OnlyApprovedBuiltinsAreBound) {
    const auto ns = BuildNamespace(mathguard::lang::Parse("x = 1\n"));
    const auto& catalog = CapabilityCatalog::Default();
    for (const auto& [name, value] : ns.builtins) {
        EXPECT_TRUE(catalog.IsBuiltinAllowed(name)) << name;
    }
    EXPECT_EQ(ns.builtins.count("len"), 1u);
    EXPECT_EQ(ns.builtins.count("print"), 0u);
    EXPECT_EQ(ns.builtins.count("open"), 0u);
    EXPECT_TRUE(ns.modules.empty());
}

TEST(NamespaceTest, ImportedModulesGetFilteredProxies) {
    const auto ns = BuildNamespace(mathguard::lang::Parse(
        "import math\n"
        "def solve():\n"
        "    from fractions import Fraction\n"
        "    return Fraction(1)\n"));
    ASSERT_EQ(ns.modules.size(), 2u);
    const auto names = EnumerateNames(ns);
    EXPECT_TRUE(Contains(names, "math"));
    EXPECT_TRUE(Contains(names, "math.sqrt"));
    EXPECT_TRUE(Contains(names, "fractions.Fraction"));
    EXPECT_FALSE(Contains(names, "math.nextafter"));
}

TEST(NamespaceTest, EveryEnumeratedNameIsApproved) {
    const auto ns = BuildNamespace(mathguard::lang::Parse(
        "import math, cmath, fractions, decimal, itertools, functools, operator, statistics, random\n"));
    const auto& catalog = CapabilityCatalog::Default();
    EXPECT_EQ(ns.modules.size(), 9u);
    for (const auto& name : EnumerateNames(ns)) {
        EXPECT_FALSE(mathguard::utils::IsDunder(name)) << name;
        const auto dot = name.find('.');
        if (dot == std::string::npos) {
            EXPECT_TRUE(catalog.IsBuiltinAllowed(name) || catalog.IsModuleAllowed(name)) << name;
        } else {
            EXPECT_TRUE(catalog.IsMemberAllowed(name.substr(0, dot), name.substr(dot + 1))) << name;
        }
    }
}

TEST(NamespaceTest, UnknownModulesAreSkipped) {
    const auto ns = BuildNamespace(mathguard::lang::Parse("import os\nimport numpy\n"));
    EXPECT_TRUE(ns.modules.empty());
}

TEST(NamespaceTest, NamespacesAreIndependent) {
    const auto first = BuildNamespace(mathguard::lang::Parse("import math\n"));
    const auto second = BuildNamespace(mathguard::lang::Parse("import math\n"));
    EXPECT_NE(first.modules.at("math").identity(), second.modules.at("math").identity());
}
