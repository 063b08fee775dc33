// tests/serialize_test.cpp
// Unit tests for typed and untyped payload conversion.

#include <gtest/gtest.h>
#include "test_support.hpp"

#include <any>
#include <cmath>
#include <map>
#include <optional>
#include <string>
#include <vector>

using namespace pulse;

TEST(SerializeTest, UntypedScalars) {
    Properties p{
        {"s", std::string("text")},
        {"c", "literal"},
        {"i", 42},
        {"l", 7L},
        {"u", 3u},
        {"d", 1.5},
        {"f", 0.5f},
        {"b", true},
        {"n", nullptr},
        {"e", std::any()},
    };
    Value v = serialize(p);
    ASSERT_TRUE(v.is_object());
    EXPECT_EQ(v.find("s")->as_string(), "text");
    EXPECT_EQ(v.find("c")->as_string(), "literal");
    EXPECT_EQ(v.find("i")->as_int(), 42);
    EXPECT_EQ(v.find("l")->as_int(), 7);
    EXPECT_EQ(v.find("u")->as_int(), 3);
    EXPECT_DOUBLE_EQ(v.find("d")->as_double(), 1.5);
    EXPECT_DOUBLE_EQ(v.find("f")->as_double(), 0.5);
    EXPECT_TRUE(v.find("b")->as_bool());
    EXPECT_TRUE(v.find("n")->is_null());
    EXPECT_TRUE(v.find("e")->is_null());
}

TEST(SerializeTest, UntypedNesting) {
    Properties inner{{"depth", 2}};
    Properties p{
        {"inner", inner},
        {"list", std::vector<std::any>{1, std::string("two"), inner}},
        {"value", Value::list({true})},
    };
    Value v = serialize(p);
    EXPECT_EQ(v.find("inner")->find("depth")->as_int(), 2);
    EXPECT_EQ(v.find("list")->size(), 3u);
    EXPECT_EQ(v.find("list")->as_list()[1].as_string(), "two");
    EXPECT_EQ(v.find("value")->as_list()[0], Value(true));
}

TEST(SerializeTest, UntypedUnsupportedTypeFails) {
    Properties p{{"handle", shop::Opaque{3}}};
    try {
        serialize(p);
        FAIL() << "expected PulseError";
    } catch (const PulseError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Serialization);
        EXPECT_NE(e.message().find("handle"), std::string::npos);
    }
}

TEST(SerializeTest, UntypedNestedFailureNamesPath) {
    Properties inner{{"bad", shop::Opaque{}}};
    Properties p{{"outer", inner}};
    try {
        serialize(p);
        FAIL() << "expected PulseError";
    } catch (const PulseError& e) {
        EXPECT_NE(e.message().find("outer.bad"), std::string::npos);
    }
}

TEST(SerializeTest, UntypedNonFiniteFails) {
    Properties p{{"ratio", std::nan("")}};
    EXPECT_THROW(serialize(p), PulseError);
}

TEST(SerializeTest, TypedBuiltins) {
    EXPECT_EQ(to_value(5), Value(5));
    EXPECT_EQ(to_value(true), Value(true));
    EXPECT_EQ(to_value(std::string("x")), Value("x"));
    EXPECT_EQ(to_value(std::vector<int>{1, 2}), Value::list({1, 2}));

    std::map<std::string, double> m{{"a", 1.0}};
    EXPECT_EQ(to_value(m), Value::object({{"a", 1.0}}));

    EXPECT_TRUE(to_value(std::optional<int>()).is_null());
    EXPECT_EQ(to_value(std::optional<int>(3)), Value(3));
}

TEST(SerializeTest, TypedNonFiniteFails) {
    EXPECT_THROW(to_value(std::nan("")), PulseError);
    EXPECT_THROW(to_value(shop::Ratio{INFINITY}), PulseError);
}

TEST(SerializeTest, TypedUserTypeViaAdl) {
    shop::Checkout c{"sku-1", 2, 9.5};
    Value v = to_value(c);
    EXPECT_EQ(v.find("sku")->as_string(), "sku-1");
    EXPECT_EQ(v.find("quantity")->as_int(), 2);
}

TEST(SerializeTest, TypedContainersOfUserTypes) {
    std::vector<shop::Checkout> cart{{"a", 1, 1.0}, {"b", 2, 2.0}};
    Value v = to_value(cart);
    ASSERT_EQ(v.size(), 2u);
    EXPECT_EQ(v.as_list()[1].find("sku")->as_string(), "b");
}

TEST(SerializeTest, TypedAndUntypedAgree) {
    shop::Checkout c{"sku-1", 2, 9.5};
    Properties p{{"sku", std::string("sku-1")}, {"quantity", 2}, {"price", 9.5}};
    EXPECT_EQ(to_value(c), serialize(p));
}
