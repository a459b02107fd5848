#include <gtest/gtest.h>

#include <string>

#include "lang/parser.hpp"
#include "lang/scope.hpp"

using namespace mathguard::lang;

TEST(ParserTest, FunctionDefinition) {
    const Module module = Parse("def solve(a, b=2, *rest, key=None, **extra):\n    return a + b\n");
    ASSERT_EQ(module.body.size(), 1u);
    ASSERT_EQ(module.body[0]->kind, StmtKind::kFunctionDef);
    const auto& def = static_cast<const FunctionDefStmt&>(*module.body[0]);
    EXPECT_EQ(def.name, "solve");
    ASSERT_EQ(def.args.positional.size(), 2u);
    EXPECT_EQ(def.args.positional[0].name, "a");
    EXPECT_EQ(def.args.defaults.size(), 1u);
    ASSERT_TRUE(def.args.vararg.has_value());
    EXPECT_EQ(def.args.vararg->name, "rest");
    ASSERT_EQ(def.args.kwonly.size(), 1u);
    ASSERT_TRUE(def.args.kwarg.has_value());
    ASSERT_EQ(def.body.size(), 1u);
    EXPECT_EQ(def.body[0]->kind, StmtKind::kReturn);
}

TEST(ParserTest, OperatorPrecedence) {
    const Module module = Parse("x = 1 + 2 * 3 ** 2\n");
    const auto& assign = static_cast<const AssignStmt&>(*module.body[0]);
    ASSERT_EQ(assign.value->kind, ExprKind::kBinOp);
    const auto& add = static_cast<const BinOpExpr&>(*assign.value);
    EXPECT_EQ(add.op, BinaryOperator::kAdd);
    ASSERT_EQ(add.right->kind, ExprKind::kBinOp);
    const auto& mul = static_cast<const BinOpExpr&>(*add.right);
    EXPECT_EQ(mul.op, BinaryOperator::kMult);
    ASSERT_EQ(mul.right->kind, ExprKind::kBinOp);
    EXPECT_EQ(static_cast<const BinOpExpr&>(*mul.right).op, BinaryOperator::kPow);
}

TEST(ParserTest, ChainedComparison) {
    const Module module = Parse("ok = 0 < x <= 10\n");
    const auto& assign = static_cast<const AssignStmt&>(*module.body[0]);
    ASSERT_EQ(assign.value->kind, ExprKind::kCompare);
    const auto& compare = static_cast<const CompareExpr&>(*assign.value);
    ASSERT_EQ(compare.ops.size(), 2u);
    EXPECT_EQ(compare.ops[0], CompareOperator::kLt);
    EXPECT_EQ(compare.ops[1], CompareOperator::kLtE);
}

TEST(ParserTest, ComprehensionsAndDisplays) {
    const Module module = Parse(
        "a = [i * i for i in range(10) if i % 2]\n"
        "b = {k: v for k, v in pairs}\n"
        "c = {1, 2}\n"
        "d = (x for x in a)\n"
        "e = {}\n");
    const auto kind_of = [&module](std::size_t index) {
        return static_cast<const AssignStmt&>(*module.body[index]).value->kind;
    };
    EXPECT_EQ(kind_of(0), ExprKind::kListComp);
    EXPECT_EQ(kind_of(1), ExprKind::kDictComp);
    EXPECT_EQ(kind_of(2), ExprKind::kSet);
    EXPECT_EQ(kind_of(3), ExprKind::kGeneratorExp);
    EXPECT_EQ(kind_of(4), ExprKind::kDict);
}

TEST(ParserTest, ImportForms) {
    const Module module = Parse("import math as m, cmath\nfrom fractions import Fraction as F\n");
    ASSERT_EQ(module.body.size(), 2u);
    const auto& plain = static_cast<const ImportStmt&>(*module.body[0]);
    ASSERT_EQ(plain.names.size(), 2u);
    EXPECT_EQ(plain.names[0].name, "math");
    EXPECT_EQ(plain.names[0].asname, "m");
    const auto& from = static_cast<const ImportFromStmt&>(*module.body[1]);
    EXPECT_EQ(from.module, "fractions");
    EXPECT_EQ(from.level, 0);
    ASSERT_EQ(from.names.size(), 1u);
    EXPECT_EQ(from.names[0].asname, "F");
}

TEST(ParserTest, ConstructsTheValidatorRejectsStillParse) {
    const Module module = Parse(
        "class A:\n    pass\n"
        "try:\n    x = 1\nexcept ValueError:\n    x = 2\n"
        "with ctx() as c:\n    pass\n"
        "global g\n"
        "del x\n");
    ASSERT_EQ(module.body.size(), 5u);
    EXPECT_EQ(module.body[0]->kind, StmtKind::kClassDef);
    EXPECT_EQ(module.body[1]->kind, StmtKind::kTry);
    EXPECT_EQ(module.body[2]->kind, StmtKind::kWith);
    EXPECT_EQ(module.body[3]->kind, StmtKind::kGlobal);
    EXPECT_EQ(module.body[4]->kind, StmtKind::kDelete);
}

TEST(ParserTest, FStringFieldsBecomeExpressions) {
    const Module module = Parse("s = f'{a + 1:>5} and {b!r}'\n");
    const auto& assign = static_cast<const AssignStmt&>(*module.body[0]);
    ASSERT_EQ(assign.value->kind, ExprKind::kJoinedStr);
    const auto& joined = static_cast<const JoinedStrExpr&>(*assign.value);
    int fields = 0;
    for (const auto& part : joined.values) {
        fields += part->kind == ExprKind::kFormattedValue;
    }
    EXPECT_EQ(fields, 2);
}

TEST(ParserTest, SyntaxErrors) {
    EXPECT_THROW(Parse("def f(:\n    pass\n"), SyntaxError);
    EXPECT_THROW(Parse("x = = 1\n"), SyntaxError);
    EXPECT_THROW(Parse("1 = x\n"), SyntaxError);
    EXPECT_THROW(Parse("if True\n    pass\n"), SyntaxError);
    EXPECT_THROW(Parse("for in x:\n    pass\n"), SyntaxError);
}

TEST(ParserTest, SyntaxErrorCarriesLocation) {
    try {
        Parse("x = 1\ny = (2 +)\n");
        FAIL() << "expected a syntax error";
    } catch (const SyntaxError& ex) {
        EXPECT_EQ(ex.location().line, 2);
    }
}

TEST(ParserTest, NestingDepthIsBounded) {
    ParserOptions options;
    options.max_depth = 50;
    const std::string deep = "x = " + std::string(100, '(') + "1" + std::string(100, ')') + "\n";
    EXPECT_THROW(Parse(deep, options), SyntaxError);
    const std::string shallow = "x = " + std::string(10, '(') + "1" + std::string(10, ')') + "\n";
    EXPECT_NO_THROW(Parse(shallow, options));
}

TEST(ParserTest, FlatChainsCountTowardsTheDepthLimit) {
    ParserOptions options;
    options.max_depth = 50;
    std::string sum = "x = 1";
    std::string calls = "x = f";
    std::string attributes = "x = a";
    std::string powers = "x = 2";
    for (int i = 0; i < 100; ++i) {
        sum += " + 1";
        calls += "()";
        attributes += ".b";
        powers += " ** 2";
    }
    EXPECT_THROW(Parse(sum + "\n", options), SyntaxError);
    EXPECT_THROW(Parse(calls + "\n", options), SyntaxError);
    EXPECT_THROW(Parse(attributes + "\n", options), SyntaxError);
    EXPECT_THROW(Parse(powers + "\n", options), SyntaxError);
    EXPECT_NO_THROW(Parse("x = 1 + 2 * 3 - f(4)[0].real + 5\n", options));
}

TEST(ScopeTest, CollectsBoundNamesEverywhere) {
    const Module module = Parse(
        "import math as m\n"
        "def solve(n):\n"
        "    total = 0\n"
        "    for i, j in pairs:\n"
        "        total += i\n"
        "    f = lambda q: q\n"
        "    return [k for k in range(n)]\n");
    const auto names = CollectBoundNames(module);
    for (const char* name : {"m", "solve", "n", "total", "i", "j", "f", "q", "k"}) {
        EXPECT_EQ(names.count(name), 1u) << name;
    }
    EXPECT_EQ(names.count("math"), 0u);
    EXPECT_EQ(names.count("pairs"), 0u);
}

TEST(ScopeTest, FunctionLocalsSkipNestedScopes) {
    const Module module = Parse(
        "def outer(a):\n"
        "    b = 1\n"
        "    def inner(c):\n"
        "        d = 2\n"
        "    return inner\n");
    const auto& def = static_cast<const FunctionDefStmt&>(*module.body[0]);
    const auto locals = FunctionLocals(def.args, def.body);
    EXPECT_EQ(locals.count("a"), 1u);
    EXPECT_EQ(locals.count("b"), 1u);
    EXPECT_EQ(locals.count("inner"), 1u);
    EXPECT_EQ(locals.count("c"), 0u);
    EXPECT_EQ(locals.count("d"), 0u);
}
