#include <gtest/gtest.h>

#include "run_helpers.hpp"

using mathguard::sandbox::WorkerStatus;
using mathguard::testing::Eval;
using mathguard::testing::EvalError;
using mathguard::testing::RunCode;

TEST(InterpreterTest, Arithmetic) {
    EXPECT_EQ(Eval("2 + 2"), "4");
    EXPECT_EQ(Eval("7 / 2"), "3.5");
    EXPECT_EQ(Eval("7 // 2"), "3");
    EXPECT_EQ(Eval("-7 // 2"), "-4");
    EXPECT_EQ(Eval("-7 % 3"), "2");
    EXPECT_EQ(Eval("2 ** -1"), "0.5");
    EXPECT_EQ(Eval("0.1 + 0.2"), "0.30000000000000004");
    EXPECT_EQ(Eval("(1 + 2j) * 1j"), "(-2+1j)");
    EXPECT_EQ(Eval("1 << 10"), "1024");
    EXPECT_EQ(Eval("True + True"), "2");
}

TEST(InterpreterTest, BigIntegersAreExact) {
    const auto response = RunCode("def solve():\n    return 2 ** 100\n");
    ASSERT_EQ(response.status, WorkerStatus::kValue);
    EXPECT_EQ(response.display, "1267650600228229401496703205376");
    EXPECT_EQ(response.value, "1267650600228229401496703205376");
}

TEST(InterpreterTest, Comparisons) {
    EXPECT_EQ(Eval("1 < 2 < 3"), "True");
    EXPECT_EQ(Eval("1 < 3 < 2"), "False");
    EXPECT_EQ(Eval("1 == 1.0"), "True");
    EXPECT_EQ(Eval("[1, 2] < [1, 3]"), "True");
    EXPECT_EQ(Eval("'b' in 'abc'"), "True");
    EXPECT_EQ(Eval("3 not in {1, 2}"), "True");
    EXPECT_EQ(Eval("None is None"), "True");
}

TEST(InterpreterTest, ControlFlow) {
    const std::string code =
        "def solve(n):\n"
        "    total = 0\n"
        "    for i in range(n):\n"
        "        if i % 3 == 0:\n"
        "            continue\n"
        "        if i > 10:\n"
        "            break\n"
        "        total += i\n"
        "    else:\n"
        "        total = -1\n"
        "    k = 0\n"
        "    while k < 5:\n"
        "        k += 2\n"
        "    return total, k\n";
    const auto response = RunCode(code, "solve", {20});
    ASSERT_EQ(response.status, WorkerStatus::kValue) << response.message;
    EXPECT_EQ(response.display, "(37, 6)");
}

TEST(InterpreterTest, FunctionsAndClosures) {
    const std::string code =
        "def make_adder(n):\n"
        "    def add(x):\n"
        "        return x + n\n"
        "    return add\n"
        "\n"
        "def combine(*values, scale=1, **extra):\n"
        "    return sum(values) * scale + len(extra)\n"
        "\n"
        "def solve():\n"
        "    add5 = make_adder(5)\n"
        "    square = lambda v: v * v\n"
        "    return add5(1), combine(1, 2, 3, scale=2, a=1), square(add5(2))\n";
    const auto response = RunCode(code);
    ASSERT_EQ(response.status, WorkerStatus::kValue) << response.message;
    EXPECT_EQ(response.display, "(6, 13, 49)");
}

TEST(InterpreterTest, DefaultArgumentsAreEvaluatedOnce) {
    const std::string code =
        "def push(x, acc=[]):\n"
        "    acc.append(x)\n"
        "    return len(acc)\n"
        "\n"
        "def solve():\n"
        "    push(1)\n"
        "    return push(2)\n";
    EXPECT_EQ(RunCode(code).display, "2");
}

TEST(InterpreterTest, UnpackingAndComprehensions) {
    EXPECT_EQ(Eval("[x * y for x in range(3) for y in range(2) if x]"), "[0, 1, 0, 2]");
    EXPECT_EQ(Eval("{k: k * k for k in (1, 2)}"), "{1: 1, 2: 4}");
    EXPECT_EQ(Eval("sorted({c for c in 'banana'})"), "['a', 'b', 'n']");
    EXPECT_EQ(Eval("sum(i for i in range(5))"), "10");
    const std::string code =
        "def solve():\n"
        "    a, *rest = [1, 2, 3, 4]\n"
        "    (b, c), d = (5, 6), 7\n"
        "    a, b = b, a\n"
        "    return a, b, rest, c, d\n";
    EXPECT_EQ(RunCode(code).display, "(5, 1, [2, 3, 4], 6, 7)");
}

TEST(InterpreterTest, SubscriptsAndSlices) {
    EXPECT_EQ(Eval("[1, 2, 3, 4, 5][1:4]"), "[2, 3, 4]");
    EXPECT_EQ(Eval("[1, 2, 3, 4, 5][::-2]"), "[5, 3, 1]");
    EXPECT_EQ(Eval("'hello'[-1]"), "'o'");
    EXPECT_EQ(Eval("(1, 2, 3)[-2:]"), "(2, 3)");
    const std::string code =
        "def solve():\n"
        "    xs = [0] * 5\n"
        "    xs[1:3] = [7, 8, 9]\n"
        "    grid = [[0] * 2 for _ in range(2)]\n"
        "    grid[1][0] = 4\n"
        "    d = {}\n"
        "    d['k'] = d.get('k', 0) + 1\n"
        "    return xs, grid, d\n";
    EXPECT_EQ(RunCode(code).display, "([0, 7, 8, 9, 0, 0], [[0, 0], [4, 0]], {'k': 1})");
}

TEST(InterpreterTest, ConditionalAndBooleanExpressions) {
    EXPECT_EQ(Eval("'yes' if 3 > 2 else 'no'"), "'yes'");
    EXPECT_EQ(Eval("0 or [] or 'x'"), "'x'");
    EXPECT_EQ(Eval("1 and 0"), "0");
    EXPECT_EQ(Eval("not []"), "True");
}

TEST(InterpreterTest, FStrings) {
    EXPECT_EQ(Eval("f'{1 + 1} and {3.14159:.2f}'"), "'2 and 3.14'");
    EXPECT_EQ(Eval("f'{\"x\"!r:>5}'"), "\"  'x'\"");
}

TEST(InterpreterTest, ScriptErrors) {
    EXPECT_EQ(EvalError("1 / 0"), "ZeroDivisionError: division by zero");
    EXPECT_EQ(EvalError("[][0]"), "IndexError: list index out of range");
    EXPECT_EQ(EvalError("int('abc')"), "ValueError: invalid literal for int() with base 10: 'abc'");
    EXPECT_EQ(EvalError("1 + 'a'"), "TypeError: unsupported operand type(s) for +: 'int' and 'str'");
}

TEST(InterpreterTest, ArgumentsArriveFromJson) {
    const std::string code =
        "def solve(n, label, flags, table):\n"
        "    return n * 2, label.upper(), flags[0], table['k']\n";
    const auto response = RunCode(code, "solve", {21, "abc", {true}, {{"k", 1.5}}});
    ASSERT_EQ(response.status, WorkerStatus::kValue) << response.message;
    EXPECT_EQ(response.display, "(42, 'ABC', True, 1.5)");
    EXPECT_EQ(response.value, nlohmann::json::parse("[42, \"ABC\", true, 1.5]"));
}

TEST(InterpreterTest, MissingEntryPoint) {
    const auto response = RunCode("def other():\n    return 1\n");
    ASSERT_EQ(response.status, WorkerStatus::kError);
    EXPECT_EQ(response.error_type, "NameError");
}

TEST(InterpreterTest, NoneIsNotAResult) {
    const auto response = RunCode("def solve():\n    pass\n");
    ASSERT_EQ(response.status, WorkerStatus::kError);
    EXPECT_EQ(response.error_type, "TypeError");
}

TEST(InterpreterTest, StepBudget) {
    const auto response = RunCode("def solve():\n    while True:\n        pass\n", "solve", nlohmann::json::array(),
                                  10'000);
    EXPECT_EQ(response.status, WorkerStatus::kBudgetExceeded);
}

TEST(InterpreterTest, MutualRecursionHitsTheDepthLimit) {
    const std::string code =
        "def ping(n):\n"
        "    return pong(n + 1)\n"
        "\n"
        "def pong(n):\n"
        "    return ping(n + 1)\n"
        "\n"
        "def solve():\n"
        "    return ping(0)\n";
    const auto response = RunCode(code);
    ASSERT_EQ(response.status, WorkerStatus::kError);
    EXPECT_EQ(response.error_type, "RecursionError");
}

TEST(InterpreterTest, UnknownModuleCannotBeImported) {
    const auto response = RunCode("import os\ndef solve():\n    return 1\n");
    ASSERT_EQ(response.status, WorkerStatus::kError);
    EXPECT_EQ(response.error_type, "ModuleNotFoundError");
}

TEST(InterpreterTest, SyntaxErrorsAreReported) {
    const auto response = RunCode("def solve(:\n    return 1\n");
    ASSERT_EQ(response.status, WorkerStatus::kError);
    EXPECT_EQ(response.error_type, "SyntaxError");
}
