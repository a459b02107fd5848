#include <gtest/gtest.h>

#include "run_helpers.hpp"

using mathguard::sandbox::WorkerStatus;
using mathguard::testing::Eval;
using mathguard::testing::EvalError;
using mathguard::testing::RunCode;

namespace {

const char kMath[] = "import math\n";
const char kCmath[] = "import cmath\n";
const char kFractions[] = "from fractions import Fraction\n";
const char kDecimal[] = "from decimal import Decimal, ROUND_HALF_UP\n";
const char kItertools[] = "import itertools\n";
const char kFunctools[] = "from functools import reduce, partial\n";
const char kOperator[] = "import operator\n";
const char kRandom[] = "import random\n";

}  // namespace

TEST(MathModuleTest, Basics) {
    EXPECT_EQ(Eval("math.sqrt(16)", kMath), "4.0");
    EXPECT_EQ(Eval("math.isqrt(10 ** 20 + 1)", kMath), "10000000000");
    EXPECT_EQ(Eval("math.factorial(20)", kMath), "2432902008176640000");
    EXPECT_EQ(Eval("math.comb(10, 3)", kMath), "120");
    EXPECT_EQ(Eval("math.perm(5, 2)", kMath), "20");
    EXPECT_EQ(Eval("math.gcd(12, 18, 30)", kMath), "6");
    EXPECT_EQ(Eval("math.lcm(4, 6)", kMath), "12");
    EXPECT_EQ(Eval("math.floor(-2.5)", kMath), "-3");
    EXPECT_EQ(Eval("math.ceil(2.1)", kMath), "3");
    EXPECT_EQ(Eval("math.fsum([0.1] * 10)", kMath), "1.0");
    EXPECT_EQ(Eval("math.prod([1, 2, 3, 4])", kMath), "24");
    EXPECT_EQ(Eval("math.log(8, 2)", kMath), "3.0");
    EXPECT_EQ(Eval("math.hypot(3, 4)", kMath), "5.0");
    EXPECT_EQ(Eval("math.isclose(math.pi, 3.14159, rel_tol=1e-5)", kMath), "True");
    EXPECT_EQ(Eval("math.gamma(5)", kMath), "24.0");
    EXPECT_EQ(Eval("math.modf(2.5)", kMath), "(0.5, 2.0)");
}

TEST(MathModuleTest, DomainErrors) {
    EXPECT_EQ(EvalError("math.sqrt(-1)", kMath), "ValueError: math domain error");
    EXPECT_EQ(EvalError("math.log(0)", kMath), "ValueError: math domain error");
    EXPECT_EQ(EvalError("math.exp(1000)", kMath), "OverflowError: math range error");
    EXPECT_EQ(EvalError("math.factorial(-1)", kMath), "ValueError: factorial() not defined for negative values");
}

TEST(MathModuleTest, FromImportAndAlias) {
    EXPECT_EQ(Eval("sqrt(9) + m.floor(1.5)", "from math import sqrt\nimport math as m\n"), "4.0");
}

TEST(CmathModuleTest, ComplexResults) {
    EXPECT_EQ(Eval("cmath.sqrt(-1)", kCmath), "1j");
    EXPECT_EQ(Eval("cmath.polar(1j)", kCmath), "(1.0, 1.5707963267948966)");
    EXPECT_EQ(Eval("cmath.phase(-1)", kCmath), "3.141592653589793");
}

TEST(FractionsModuleTest, ExactArithmetic) {
    EXPECT_EQ(Eval("Fraction(1, 3) + Fraction(1, 6)", kFractions), "Fraction(1, 2)");
    EXPECT_EQ(Eval("Fraction(3, 6)", kFractions), "Fraction(1, 2)");
    EXPECT_EQ(Eval("Fraction('0.25')", kFractions), "Fraction(1, 4)");
    EXPECT_EQ(Eval("Fraction(1, 3) * 3", kFractions), "Fraction(1, 1)");
    EXPECT_EQ(Eval("Fraction(1, 2) + 0.5", kFractions), "1.0");
    EXPECT_EQ(Eval("str(Fraction(-6, 4))", kFractions), "'-3/2'");
    EXPECT_EQ(Eval("Fraction(7, 2).numerator", kFractions), "7");
    EXPECT_EQ(Eval("Fraction(355, 113).limit_denominator(10)", kFractions), "Fraction(22, 7)");
    EXPECT_EQ(EvalError("Fraction(1, 0)", kFractions), "ZeroDivisionError: Fraction(1, 0)");
}

TEST(FractionsModuleTest, LeadingZeroDigitsAreDecimal) {
    EXPECT_EQ(Eval("Fraction('0.25')", kFractions), "Fraction(1, 4)");
    EXPECT_EQ(Eval("Fraction('0.10')", kFractions), "Fraction(1, 10)");
    EXPECT_EQ(Eval("Fraction('0.9')", kFractions), "Fraction(9, 10)");
    EXPECT_EQ(Eval("Fraction('-0.05')", kFractions), "Fraction(-1, 20)");
    EXPECT_EQ(Eval("Fraction('010/012')", kFractions), "Fraction(5, 6)");
}

TEST(FractionsModuleTest, JsonEncodingIsTheStringForm) {
    const auto response = RunCode(std::string(kFractions) + "def solve():\n    return Fraction(2, 3)\n");
    ASSERT_EQ(response.status, WorkerStatus::kValue);
    EXPECT_EQ(response.value, "2/3");
}

TEST(DecimalModuleTest, ExactDecimalArithmetic) {
    EXPECT_EQ(Eval("Decimal('0.1') + Decimal('0.2')", kDecimal), "Decimal('0.3')");
    EXPECT_EQ(Eval("Decimal('1.10') * 2", kDecimal), "Decimal('2.20')");
    EXPECT_EQ(Eval("Decimal('2.675').quantize(Decimal('0.01'), rounding=ROUND_HALF_UP)", kDecimal),
              "Decimal('2.68')");
    EXPECT_EQ(Eval("str(Decimal(10) / Decimal(4))", kDecimal), "'2.5'");
}

TEST(DecimalModuleTest, LeadingZeroDigitsAreDecimal) {
    EXPECT_EQ(Eval("str(Decimal('0.25'))", kDecimal), "'0.25'");
    EXPECT_EQ(Eval("Decimal('0.10')", kDecimal), "Decimal('0.10')");
    EXPECT_EQ(Eval("Decimal('0.9')", kDecimal), "Decimal('0.9')");
    EXPECT_EQ(Eval("Decimal('-0.05')", kDecimal), "Decimal('-0.05')");
    EXPECT_EQ(Eval("Decimal('0.25') * 4", kDecimal), "Decimal('1.00')");
    EXPECT_EQ(Eval("Decimal('007')", kDecimal), "Decimal('7')");
}

TEST(ItertoolsModuleTest, Combinatorics) {
    EXPECT_EQ(Eval("list(itertools.permutations([1, 2, 3], 2))", kItertools),
              "[(1, 2), (1, 3), (2, 1), (2, 3), (3, 1), (3, 2)]");
    EXPECT_EQ(Eval("list(itertools.combinations('abc', 2))", kItertools),
              "[('a', 'b'), ('a', 'c'), ('b', 'c')]");
    EXPECT_EQ(Eval("len(list(itertools.product(range(3), repeat=2)))", kItertools), "9");
    EXPECT_EQ(Eval("list(itertools.combinations_with_replacement([1, 2], 2))", kItertools),
              "[(1, 1), (1, 2), (2, 2)]");
}

TEST(ItertoolsModuleTest, IteratorTools) {
    EXPECT_EQ(Eval("list(itertools.islice(itertools.count(5, 2), 3))", kItertools), "[5, 7, 9]");
    EXPECT_EQ(Eval("list(itertools.accumulate([1, 2, 3, 4]))", kItertools), "[1, 3, 6, 10]");
    EXPECT_EQ(Eval("list(itertools.chain([1], (2, 3)))", kItertools), "[1, 2, 3]");
    EXPECT_EQ(Eval("list(itertools.chain.from_iterable([[1], [2]]))", kItertools), "[1, 2]");
    EXPECT_EQ(Eval("list(itertools.takewhile(lambda x: x < 3, [1, 2, 3, 1]))", kItertools), "[1, 2]");
    EXPECT_EQ(Eval("[(k, len(list(g))) for k, g in itertools.groupby('aabccc')]", kItertools),
              "[('a', 2), ('b', 1), ('c', 3)]");
    EXPECT_EQ(Eval("list(itertools.pairwise([1, 2, 3]))", kItertools), "[(1, 2), (2, 3)]");
    EXPECT_EQ(Eval("list(itertools.zip_longest([1, 2], [3], fillvalue=0))", kItertools), "[(1, 3), (2, 0)]");
    EXPECT_EQ(Eval("list(itertools.islice(itertools.cycle('ab'), 5))", kItertools), "['a', 'b', 'a', 'b', 'a']");
}

TEST(ItertoolsModuleTest, InfiniteIteratorsAreBoundedByTheStepBudget) {
    const auto response = RunCode(std::string(kItertools) + "def solve():\n    return list(itertools.count())\n",
                                  "solve", nlohmann::json::array(), 100'000);
    EXPECT_NE(response.status, WorkerStatus::kValue);
}

TEST(FunctoolsModuleTest, ReduceAndPartial) {
    EXPECT_EQ(Eval("reduce(lambda a, b: a * b, range(1, 6))", kFunctools), "120");
    EXPECT_EQ(Eval("reduce(lambda a, b: a + b, [], 7)", kFunctools), "7");
    EXPECT_EQ(Eval("partial(pow, 2)(10)", kFunctools), "1024");
    EXPECT_EQ(EvalError("reduce(lambda a, b: a + b, [])", kFunctools),
              "TypeError: reduce() of empty iterable with no initial value");
}

TEST(OperatorModuleTest, Functions) {
    EXPECT_EQ(Eval("operator.add(2, 3)", kOperator), "5");
    EXPECT_EQ(Eval("operator.itemgetter(1)([4, 5, 6])", kOperator), "5");
    EXPECT_EQ(Eval("operator.itemgetter(0, 2)('abc')", kOperator), "('a', 'c')");
    EXPECT_EQ(Eval("sorted([(1, 'b'), (2, 'a')], key=operator.itemgetter(1))", kOperator),
              "[(2, 'a'), (1, 'b')]");
    EXPECT_EQ(Eval("operator.not_(0)", kOperator), "True");
}

TEST(RandomModuleTest, SeededSequencesRepeat) {
    const std::string code =
        std::string(kRandom) +
        "def draw():\n"
        "    random.seed(42)\n"
        "    return [random.randint(1, 100) for _ in range(5)], random.random()\n"
        "\n"
        "def solve():\n"
        "    return draw() == draw()\n";
    EXPECT_EQ(RunCode(code).display, "True");
}

TEST(RandomModuleTest, RangesAreRespected) {
    const std::string code =
        std::string(kRandom) +
        "def solve():\n"
        "    random.seed(7)\n"
        "    ints = [random.randint(3, 5) for _ in range(200)]\n"
        "    floats = [random.uniform(-1, 1) for _ in range(200)]\n"
        "    picks = random.sample(range(10), 10)\n"
        "    return min(ints) >= 3 and max(ints) <= 5 and all(-1 <= f <= 1 for f in floats) and "
        "sorted(picks) == list(range(10))\n";
    EXPECT_EQ(RunCode(code).display, "True");
}

TEST(ModuleAccessTest, UnapprovedMembersAreNotExposed) {
    const auto response = RunCode(std::string(kMath) + "def solve():\n    return math.nextafter(1, 2)\n");
    ASSERT_EQ(response.status, WorkerStatus::kError);
    EXPECT_EQ(response.error_type, "AttributeError");
}
