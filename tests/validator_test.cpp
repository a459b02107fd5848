#include <gtest/gtest.h>

#include <string>

#include "validator/static_validator.hpp"

using mathguard::validator::RuleKind;
using mathguard::validator::StaticValidator;
using mathguard::validator::ValidationOutcome;
using mathguard::validator::ValidatorOptions;
using mathguard::validator::Validate;

namespace {

void ExpectRejected(const std::string& code, RuleKind rule, const std::string& fragment) {
    const ValidationOutcome outcome = Validate(code);
    EXPECT_FALSE(outcome.accepted) << code;
    EXPECT_EQ(outcome.rule, rule) << code << " -> " << outcome.reason;
    EXPECT_NE(outcome.reason.find(fragment), std::string::npos) << outcome.reason;
}

}  // namespace

TEST(ValidatorTest, AcceptsOrdinaryNumericCode) {
    const std::string code =
        "import math\n"
        "from fractions import Fraction\n"
        "from itertools import permutations\n"
        "\n"
        "def solve(n):\n"
        "    total = Fraction(0)\n"
        "    for p in permutations(range(n)):\n"
        "        total += Fraction(sum(p), math.factorial(n))\n"
        "    squares = [x * x for x in range(n) if x % 2 == 0]\n"
        "    while n > 0:\n"
        "        n -= 1\n"
        "    return total, max(squares, default=0)\n";
    const auto outcome = Validate(code);
    EXPECT_TRUE(outcome.accepted) << outcome.reason;
    EXPECT_EQ(outcome.rule, RuleKind::kNone);
}

TEST(ValidatorTest, RejectsForbiddenImports) {
    ExpectRejected("import os\n", RuleKind::kImport, "os");
    ExpectRejected("import sys as s\n", RuleKind::kImport, "sys");
    ExpectRejected("from subprocess import run\n", RuleKind::kImport, "subprocess");
    ExpectRejected("from math import *\n", RuleKind::kImport, "wildcard");
    ExpectRejected("from . import helper\n", RuleKind::kImport, "relative");
    ExpectRejected("from functools import lru_cache\n", RuleKind::kImport, "lru_cache");
}

TEST(ValidatorTest, ImportInsideFunctionIsChecked) {
    ExpectRejected("def solve():\n    import os\n    return 1\n", RuleKind::kImport, "os");
}

TEST(ValidatorTest, RejectsReflectionPrimitives) {
    ExpectRejected("def solve():\n    return getattr(1, 'real')\n", RuleKind::kName, "getattr");
    ExpectRejected("def solve():\n    return eval('1')\n", RuleKind::kName, "eval");
    ExpectRejected("def solve():\n    f = open\n    return 1\n", RuleKind::kName, "open");
}

TEST(ValidatorTest, RejectsDunderAccess) {
    ExpectRejected("def solve():\n    return (1).__class__\n", RuleKind::kName, "__class__");
    ExpectRejected("def solve():\n    return ().__class__.__bases__[0].__subclasses__()\n",
                   RuleKind::kName, "__class__");
    ExpectRejected("def solve():\n    return __builtins__\n", RuleKind::kName, "__builtins__");
}

TEST(ValidatorTest, RejectsDangerousAttributes) {
    ExpectRejected("def solve(g):\n    return g.gi_frame\n", RuleKind::kName, "gi_frame");
}

TEST(ValidatorTest, RejectsUnapprovedModuleMembers) {
    ExpectRejected("import math\ndef solve():\n    return math.nextafter(1, 2)\n", RuleKind::kName,
                   "nextafter");
}

TEST(ValidatorTest, RejectsUnknownNames) {
    ExpectRejected("def solve():\n    print(1)\n    return 1\n", RuleKind::kName, "print");
    ExpectRejected("def solve():\n    return undefined_thing\n", RuleKind::kName, "undefined_thing");
}

TEST(ValidatorTest, RejectsEvalReachedThroughAnAttribute) {
    ExpectRejected("def solve(x):\n    return x.eval('1')\n", RuleKind::kCall, "eval");
}

TEST(ValidatorTest, RejectsForbiddenCallAttributes) {
    ExpectRejected("def solve(x):\n    return x.system('ls')\n", RuleKind::kCall, "system");
}

TEST(ValidatorTest, RejectsDisallowedConstructs) {
    ExpectRejected("class A:\n    pass\n", RuleKind::kConstruct, "class");
    ExpectRejected("try:\n    x = 1\nfinally:\n    x = 2\n", RuleKind::kConstruct, "try");
    ExpectRejected("def solve():\n    global g\n    return 1\n", RuleKind::kConstruct, "global");
    ExpectRejected("def solve(x):\n    x.y = 1\n    return x\n", RuleKind::kConstruct, "attribute");
    ExpectRejected("def solve():\n    yield 1\n", RuleKind::kConstruct, "yield");
    ExpectRejected("async def solve():\n    return 1\n", RuleKind::kConstruct, "async");
}

TEST(ValidatorTest, RejectsDirectRecursion) {
    ExpectRejected("def f(n):\n    return 1 if n == 0 else n * f(n - 1)\n", RuleKind::kConstruct, "recursion");
}

TEST(ValidatorTest, LimitsFunctionNesting) {
    const std::string two_levels = "def a():\n    def b():\n        return 1\n    return b()\n";
    EXPECT_TRUE(Validate(two_levels).accepted);
    ExpectRejected("def a():\n    def b():\n        f = lambda x: x\n        return f(1)\n    return b()\n",
                   RuleKind::kConstruct, "nesting depth");
}

TEST(ValidatorTest, SyntaxErrorsAreReportedAsSyntax) {
    const auto outcome = Validate("def solve(:\n    return 1\n");
    EXPECT_FALSE(outcome.accepted);
    EXPECT_EQ(outcome.rule, RuleKind::kSyntax);
    EXPECT_EQ(outcome.line, 1);
    EXPECT_FALSE(outcome.offending_construct.empty());
}

TEST(ValidatorTest, OversizedSourceIsRejected) {
    ValidatorOptions options;
    options.max_source_bytes = 16;
    const StaticValidator validator(mathguard::catalog::CapabilityCatalog::Default(), options);
    const auto outcome = validator.Validate("x = 1 + 2 + 3 + 4 + 5\n");
    EXPECT_FALSE(outcome.accepted);
    EXPECT_EQ(outcome.rule, RuleKind::kSyntax);
}

TEST(ValidatorTest, ImportRuleOutranksConstructRule) {
    const auto outcome = Validate("class A:\n    pass\nimport os\n");
    EXPECT_FALSE(outcome.accepted);
    EXPECT_EQ(outcome.rule, RuleKind::kImport);
    EXPECT_EQ(outcome.line, 3);
}

TEST(ValidatorTest, RebindingABuiltinIsFine) {
    EXPECT_TRUE(Validate("def solve():\n    sum = 3\n    return sum\n").accepted);
}

TEST(ValidatorTest, RuleNames) {
    EXPECT_STREQ(mathguard::validator::ToString(RuleKind::kImport), "import");
    EXPECT_STREQ(mathguard::validator::ToString(RuleKind::kConstruct), "construct");
}

TEST(ValidatorTest, ImportInLoopElseBranchIsStillAnAlias) {
    ExpectRejected("for i in []:\n    pass\nelse:\n    import math\n"
                   "def solve():\n    return math.nextafter(1, 2)\n",
                   RuleKind::kName, "nextafter");
    ExpectRejected("def solve():\n    while False:\n        pass\n    else:\n        import math\n"
                   "    return math.nextafter(1, 2)\n",
                   RuleKind::kName, "nextafter");
}

TEST(ValidatorTest, RejectsDunderInsideNestedFunctions) {
    ExpectRejected("def solve():\n    def inner(x):\n        return x.__class__\n    return inner(1)\n",
                   RuleKind::kName, "__class__");
    ExpectRejected("def solve():\n    f = lambda x: x.__dict__\n    return f(1)\n", RuleKind::kName, "__dict__");
    ExpectRejected("def solve():\n    return [y for y in [lambda: ().__class__]]\n", RuleKind::kName,
                   "__class__");
}

TEST(ValidatorTest, MutualRecursionIsLeftToTheRuntimeDepthLimit) {
    const std::string code =
        "def ping(n):\n"
        "    return pong(n)\n"
        "\n"
        "def pong(n):\n"
        "    return ping(n)\n";
    EXPECT_TRUE(Validate(code).accepted);
}

TEST(ValidatorTest, LongFlatChainsAreRejectedAsSyntax) {
    std::string sum = "def solve():\n    return 1";
    std::string calls = "def solve(f):\n    return f";
    for (int i = 0; i < 30000; ++i) {
        sum += "+1";
        calls += "()";
    }
    sum += "\n";
    calls += "\n";
    ASSERT_LT(sum.size(), ValidatorOptions{}.max_source_bytes);
    ASSERT_LT(calls.size(), ValidatorOptions{}.max_source_bytes);

    const auto sum_outcome = Validate(sum);
    EXPECT_FALSE(sum_outcome.accepted);
    EXPECT_EQ(sum_outcome.rule, RuleKind::kSyntax);
    const auto call_outcome = Validate(calls);
    EXPECT_FALSE(call_outcome.accepted);
    EXPECT_EQ(call_outcome.rule, RuleKind::kSyntax);
}

TEST(ValidatorTest, ModerateChainsAreAccepted) {
    std::string sum = "def solve():\n    return 1";
    for (int i = 0; i < 100; ++i) {
        sum += " + 1";
    }
    EXPECT_TRUE(Validate(sum + "\n").accepted);
}
