#include <gtest/gtest.h>

#include <cmath>
#include <limits>

#include "runtime/format.hpp"
#include "runtime/value.hpp"

using namespace mathguard::runtime;

TEST(FormatTest, FloatReprIsShortestRoundTrip) {
    EXPECT_EQ(FloatRepr(0.1), "0.1");
    EXPECT_EQ(FloatRepr(1.0), "1.0");
    EXPECT_EQ(FloatRepr(1e-5), "1e-05");
    EXPECT_EQ(FloatRepr(1e16), "1e+16");
    EXPECT_EQ(FloatRepr(123456789.0), "123456789.0");
    EXPECT_EQ(FloatRepr(-0.0), "-0.0");
    EXPECT_EQ(FloatRepr(std::numeric_limits<double>::infinity()), "inf");
    EXPECT_EQ(FloatRepr(std::nan("")), "nan");
}

TEST(FormatTest, ComplexRepr) {
    EXPECT_EQ(ComplexRepr({1.0, 2.0}), "(1+2j)");
    EXPECT_EQ(ComplexRepr({0.0, -1.5}), "-1.5j");
}

TEST(FormatTest, FormatSpecForNumbers) {
    EXPECT_EQ(FormatWithSpec(Value::Float(3.14159), ".2f"), "3.14");
    EXPECT_EQ(FormatWithSpec(Value::Int(1234567LL), ","), "1,234,567");
    EXPECT_EQ(FormatWithSpec(Value::Int(42LL), "08b"), "00101010");
    EXPECT_EQ(FormatWithSpec(Value::Int(255LL), "#x"), "0xff");
    EXPECT_EQ(FormatWithSpec(Value::Int(5LL), "+d"), "+5");
    EXPECT_EQ(FormatWithSpec(Value::Float(0.5), ".1%"), "50.0%");
    EXPECT_EQ(FormatWithSpec(Value::Float(12345.678), ".3e"), "1.235e+04");
    EXPECT_EQ(FormatWithSpec(Value::Float(2.0), ""), "2.0");
}

TEST(FormatTest, FormatSpecAlignment) {
    EXPECT_EQ(FormatWithSpec(Value::Str("ab"), ">5"), "   ab");
    EXPECT_EQ(FormatWithSpec(Value::Str("ab"), "*^6"), "**ab**");
    EXPECT_EQ(FormatWithSpec(Value::Int(7LL), "<3"), "7  ");
}

TEST(FormatTest, PercentFormatting) {
    EXPECT_EQ(PercentFormat("%d items", Value::Int(3LL)), "3 items");
    EXPECT_EQ(PercentFormat("%.3f", Value::Float(2.0)), "2.000");
    EXPECT_EQ(PercentFormat("%s/%r", Value::Tuple({Value::Str("a"), Value::Str("b")})), "a/'b'");
    EXPECT_EQ(PercentFormat("100%%", Value::Tuple()), "100%");
}

TEST(FormatTest, StrFormatFields) {
    CallArgs args;
    args.positional = {Value::Int(1LL), Value::Str("x")};
    EXPECT_EQ(StrFormat("{} {}", args), "1 x");
    EXPECT_EQ(StrFormat("{1}{0}", args), "x1");
    EXPECT_EQ(StrFormat("{0:>3}|{{}}", args), "  1|{}");
}
