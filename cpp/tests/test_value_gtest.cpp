// ==============================================================================
// test_value_gtest.cpp - Тесты Value (значения контекста)
// ==============================================================================

#include <factguard/value.hpp>

#include <cmath>
#include <gtest/gtest.h>
#include <limits>
#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <string>
#include <vector>

namespace factguard::test {

std::string to_json(const Value& value) {
    rapidjson::Document doc;
    value.to_rapidjson(doc, doc.GetAllocator());
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    doc.Accept(writer);
    return buffer.GetString();
}

// ==============================================================================
// format_number
// ==============================================================================

TEST(ValueTest, FormatNumber_IntegersWithoutFraction) {
    EXPECT_EQ(format_number(3), "3");
    EXPECT_EQ(format_number(-12), "-12");
    EXPECT_EQ(format_number(-0.0), "0");
}

TEST(ValueTest, FormatNumber_Fractions) {
    EXPECT_EQ(format_number(0.5), "0.5");
    EXPECT_EQ(format_number(0.25), "0.25");
    EXPECT_EQ(format_number(0.1 + 0.2), "0.3");
}

TEST(ValueTest, FormatNumber_NonFinite) {
    EXPECT_EQ(format_number(std::nan("")), "NaN");
    EXPECT_EQ(format_number(std::numeric_limits<double>::infinity()), "Infinity");
    EXPECT_EQ(format_number(-std::numeric_limits<double>::infinity()), "-Infinity");
}

// ==============================================================================
// Типы и строковая форма
// ==============================================================================

TEST(ValueTest, TypeName_PerAlternative) {
    EXPECT_STREQ(Value().type_name(), "null");
    EXPECT_STREQ(Value(true).type_name(), "boolean");
    EXPECT_STREQ(Value(1).type_name(), "number");
    EXPECT_STREQ(Value("s").type_name(), "string");
    EXPECT_STREQ(Value::make_array().type_name(), "array");
    EXPECT_STREQ(Value::make_object().type_name(), "object");
    EXPECT_STREQ(Value::make_function([](const std::vector<Value>&) { return Value(); })
                     .type_name(),
                 "function");
}

TEST(ValueTest, DisplayString_Primitives) {
    EXPECT_EQ(Value().to_display_string(), "null");
    EXPECT_EQ(Value(false).to_display_string(), "false");
    EXPECT_EQ(Value(2.5).to_display_string(), "2.5");
    EXPECT_EQ(Value("text").to_display_string(), "text");
}

TEST(ValueTest, DisplayString_ArrayJoinsWithCommaAndBlanksNull) {
    Value arr = Value::make_array();
    arr.push_back(Value(1));
    arr.push_back(Value());
    arr.push_back(Value("x"));
    EXPECT_EQ(arr.to_display_string(), "1,,x");
}

TEST(ValueTest, ArrayAndObjectMutators_IgnoreWrongType) {
    Value number(1);
    number.push_back(Value(2));
    number.set("k", Value(3));
    EXPECT_EQ(number.array_size(), 0u);
    EXPECT_EQ(number.get("k"), nullptr);
}

TEST(ValueTest, Object_SetAndGet) {
    Value time = Value::make_object();
    time.set("hour", Value(21));
    ASSERT_NE(time.get("hour"), nullptr);
    EXPECT_DOUBLE_EQ(time.get("hour")->as_number(), 21);
    EXPECT_EQ(time.get("minute"), nullptr);
}

TEST(ValueTest, Copy_SharesCompoundStorage) {
    // Массивы и записи копируются по ссылке
    Value a = Value::make_array();
    Value b = a;
    a.push_back(Value(1));
    EXPECT_EQ(b.array_size(), 1u);
    EXPECT_EQ(a.get_array(), b.get_array());
}

// ==============================================================================
// RapidJSON
// ==============================================================================

TEST(ValueTest, FromRapidJson_AllTypes) {
    rapidjson::Document doc;
    doc.Parse(R"({"n": 3, "s": "x", "b": true, "z": null, "a": [1, "two"]})");
    ASSERT_FALSE(doc.HasParseError());

    Value v = Value::from_rapidjson(doc);

    ASSERT_TRUE(v.is_object());
    EXPECT_DOUBLE_EQ(v.get("n")->as_number(), 3);
    EXPECT_EQ(v.get("s")->as_string(), "x");
    EXPECT_TRUE(v.get("b")->as_bool());
    EXPECT_TRUE(v.get("z")->is_null());
    EXPECT_EQ(v.get("a")->array_size(), 2u);
}

TEST(ValueTest, ToRapidJson_IntegersWrittenWithoutFraction) {
    EXPECT_EQ(to_json(Value(3)), "3");
    EXPECT_EQ(to_json(Value(0.5)), "0.5");
}

TEST(ValueTest, ToRapidJson_NonFiniteBecomesNull) {
    EXPECT_EQ(to_json(Value(std::nan(""))), "null");
}

TEST(ValueTest, ToRapidJson_FunctionPlaceholder) {
    Value fn = Value::make_function([](const std::vector<Value>&) { return Value(); });
    EXPECT_EQ(to_json(fn), "\"[function]\"");
}

TEST(ValueTest, ToRapidJson_Array) {
    Value arr = Value::make_array();
    arr.push_back(Value("a"));
    arr.push_back(Value(true));
    arr.push_back(Value());
    EXPECT_EQ(to_json(arr), R"(["a",true,null])");
}

}  // namespace factguard::test
