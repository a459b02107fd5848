#include <gtest/gtest.h>

#include <cmath>
#include <limits>

#include "runtime/errors.hpp"
#include "runtime/serialization.hpp"
#include "runtime/value.hpp"

using namespace mathguard::runtime;

TEST(SerializationTest, Scalars) {
    EXPECT_EQ(ToJson(Value::Int(42LL)), nlohmann::json(42));
    EXPECT_EQ(ToJson(Value::Bool(true)), nlohmann::json(true));
    EXPECT_EQ(ToJson(Value::Float(2.5)), nlohmann::json(2.5));
    EXPECT_EQ(ToJson(Value::Str("hi")), nlohmann::json("hi"));
}

TEST(SerializationTest, IntegersOutside64BitsBecomeStrings) {
    const BigInt big = BigInt(1) << 70;
    EXPECT_EQ(ToJson(Value::Int(big)), nlohmann::json("1180591620717411303424"));
    EXPECT_EQ(ToJson(Value::Int(std::numeric_limits<long long>::min())),
              nlohmann::json(std::numeric_limits<long long>::min()));
}

TEST(SerializationTest, NonFiniteFloats) {
    EXPECT_EQ(ToJson(Value::Float(std::numeric_limits<double>::infinity())), nlohmann::json("inf"));
    EXPECT_EQ(ToJson(Value::Float(-std::numeric_limits<double>::infinity())), nlohmann::json("-inf"));
    EXPECT_EQ(ToJson(Value::Float(std::nan(""))), nlohmann::json("nan"));
}

TEST(SerializationTest, ExactTypesUseTheirStringForm) {
    EXPECT_EQ(ToJson(Value::Fraction(Rational(1, 3))), nlohmann::json("1/3"));
    EXPECT_EQ(ToJson(Value::Complex({1.0, 2.0})), nlohmann::json("(1+2j)"));
}

TEST(SerializationTest, Containers) {
    EXPECT_EQ(ToJson(Value::Tuple({Value::Int(1LL), Value::Str("a")})), nlohmann::json::parse("[1, \"a\"]"));
    Value dict = Value::Dict();
    dict.As<DictObject>().entries.Set(Value::Int(1LL), Value::List({Value::Float(0.5)}));
    EXPECT_EQ(ToJson(dict), nlohmann::json::parse("{\"1\": [0.5]}"));
}

TEST(SerializationTest, NoneBecomesNull) {
    EXPECT_EQ(ToJson(Value()), nlohmann::json(nullptr));
    const Value list = Value::List({Value::Int(1LL), Value()});
    EXPECT_EQ(ToJson(list), nlohmann::json::parse("[1, null]"));
}

TEST(SerializationTest, SelfReferenceIsDetected) {
    Value list = Value::List();
    list.As<ListObject>().items.push_back(list);
    try {
        ToJson(list);
        FAIL() << "expected a ValueError";
    } catch (const ScriptError& ex) {
        EXPECT_EQ(ex.type(), "ValueError");
        EXPECT_EQ(ex.message(), "Circular reference detected");
    }
    // Break the cycle so the list is released.
    list.As<ListObject>().items.clear();
}

TEST(SerializationTest, ArgumentsFromJson) {
    const Value args = FromJson(nlohmann::json::parse("[1, 2.5, \"s\", true, null, {\"k\": [1]}]"));
    ASSERT_TRUE(args.Is(ValueKind::kList));
    EXPECT_EQ(Repr(args), "[1, 2.5, 's', True, None, {'k': [1]}]");
}
