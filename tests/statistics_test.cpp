#include <gtest/gtest.h>

#include "run_helpers.hpp"

using mathguard::testing::Eval;
using mathguard::testing::EvalError;

namespace {

const char kStats[] = "import statistics\nfrom fractions import Fraction\n";

}  // namespace

TEST(StatisticsTest, Averages) {
    EXPECT_EQ(Eval("statistics.mean([1, 2, 3])", kStats), "2");
    EXPECT_EQ(Eval("statistics.mean([1, 2, 3, 4])", kStats), "2.5");
    EXPECT_EQ(Eval("statistics.mean([Fraction(1, 2), Fraction(1, 4)])", kStats), "Fraction(3, 8)");
    EXPECT_EQ(Eval("statistics.fmean([3.5, 4.0, 5.25])", kStats), "4.25");
    EXPECT_EQ(Eval("statistics.harmonic_mean([40, 60])", kStats), "48.0");
}

TEST(StatisticsTest, Medians) {
    EXPECT_EQ(Eval("statistics.median([5, 1, 3])", kStats), "3");
    EXPECT_EQ(Eval("statistics.median([1, 2, 3, 4])", kStats), "2.5");
    EXPECT_EQ(Eval("statistics.median_low([1, 2, 3, 4])", kStats), "2");
    EXPECT_EQ(Eval("statistics.median_high([1, 2, 3, 4])", kStats), "3");
}

TEST(StatisticsTest, Modes) {
    EXPECT_EQ(Eval("statistics.mode([1, 1, 2, 3])", kStats), "1");
    EXPECT_EQ(Eval("statistics.mode('abbc')", kStats), "'b'");
    EXPECT_EQ(Eval("statistics.multimode('aabbbbccddddeeffffgg')", kStats), "['b', 'd', 'f']");
}

TEST(StatisticsTest, SpreadIsComputedExactly) {
    EXPECT_EQ(Eval("statistics.variance([2.75, 1.75, 1.25, 0.25, 0.5, 1.25, 3.5])", kStats),
              "1.3720238095238095");
    EXPECT_EQ(Eval("statistics.pvariance([0.0, 0.25, 0.25, 1.25, 1.5, 1.75, 2.75, 3.25])", kStats), "1.25");
    EXPECT_EQ(Eval("statistics.pvariance([Fraction(1, 4), Fraction(5, 4), Fraction(1, 2)])", kStats),
              "Fraction(13, 72)");
    EXPECT_EQ(Eval("statistics.stdev([1.5, 2.5, 2.5, 2.75, 3.25, 4.75])", kStats), "1.0810874155219827");
    EXPECT_EQ(Eval("statistics.variance([1, 2, 3, 4])", kStats), "1.6666666666666667");
    EXPECT_EQ(Eval("statistics.pstdev([2, 4, 4, 4, 5, 5, 7, 9])", kStats), "2.0");
}

TEST(StatisticsTest, Quantiles) {
    EXPECT_EQ(Eval("statistics.quantiles([1, 2, 3, 4])", kStats), "[1.25, 2.5, 3.75]");
    EXPECT_EQ(Eval("statistics.quantiles([1, 2, 3, 4], n=2, method='inclusive')", kStats), "[2.5]");
}

TEST(StatisticsTest, BivariateFunctions) {
    EXPECT_EQ(Eval("statistics.covariance([1, 2, 3], [1, 2, 3])", kStats), "1.0");
    EXPECT_EQ(Eval("statistics.correlation([1, 2, 3], [2, 4, 6])", kStats), "1.0");
    EXPECT_EQ(Eval("statistics.correlation([1, 2, 3], [3, 2, 1])", kStats), "-1.0");
    EXPECT_EQ(Eval("statistics.linear_regression([1, 2, 3], [2, 4, 6])", kStats), "(2.0, 0.0)");
}

TEST(StatisticsTest, Errors) {
    EXPECT_EQ(EvalError("statistics.mean([])", kStats), "StatisticsError: mean requires at least one data point");
    EXPECT_EQ(EvalError("statistics.variance([1])", kStats),
              "StatisticsError: variance requires at least two data points");
    EXPECT_EQ(EvalError("statistics.median([])", kStats), "StatisticsError: no median for empty data");
    EXPECT_EQ(EvalError("statistics.correlation([1, 1], [2, 3])", kStats),
              "StatisticsError: at least one of the inputs is constant");
}
