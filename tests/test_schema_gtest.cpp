// ==============================================================================
// test_schema_gtest.cpp - Тесты схемы и валидации значений (GoogleTest)
// ==============================================================================

#include "duet/schema.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace duet::schema::test {

namespace {

Schema make_budget() {
    return Schema("Budget", {
                                Field::number("income", "Monthly Income", 5000.0, 0.0, 1000000.0),
                                Field::number("rent", "Rent", 1500.0, 0.0),
                                Field::text("note", "Note"),
                                Field::boolean("autoSave", "Auto save", true),
                                Field::enumeration("priority", "Priority",
                                                   {"low", "medium", "high"}, "medium"),
                                Field::date("due", "Due date"),
                                Field::object("meta", "Metadata"),
                                Field::text("owner", "Owner", std::nullopt, true),
                            });
}

}  // namespace

// ==============================================================================
// Построение схемы
// ==============================================================================

TEST(SchemaTest, Construct_ValidFields_IndexesById) {
    Schema schema = make_budget();

    EXPECT_EQ(schema.name(), "Budget");
    EXPECT_EQ(schema.fields().size(), 8u);
    ASSERT_NE(schema.field_named("rent"), nullptr);
    EXPECT_EQ(schema.field_named("rent")->label, "Rent");
    EXPECT_EQ(schema.field_named("missing"), nullptr);
}

TEST(SchemaTest, Construct_DuplicateId_Throws) {
    EXPECT_THROW(Schema("Dup", {Field::text("a", "A"), Field::number("a", "A again")}),
                 SchemaError);
}

TEST(SchemaTest, Construct_EmptyId_Throws) {
    EXPECT_THROW(Schema("Empty", {Field::text("", "Nothing")}), SchemaError);
}

TEST(SchemaTest, Construct_MinGreaterThanMax_Throws) {
    EXPECT_THROW(Schema("Range", {Field::number("n", "N", std::nullopt, 10.0, 1.0)}),
                 SchemaError);
}

TEST(SchemaTest, Construct_EnumWithoutOptions_Throws) {
    EXPECT_THROW(Schema("Enum", {Field::enumeration("e", "E", {})}), SchemaError);
}

TEST(SchemaTest, Construct_DefaultOutOfRange_Throws) {
    EXPECT_THROW(Schema("Bad", {Field::number("n", "N", -5.0, 0.0)}), SchemaError);
}

TEST(SchemaTest, Construct_DefaultNotInOptions_Throws) {
    EXPECT_THROW(Schema("Bad", {Field::enumeration("e", "E", {"a", "b"}, "c")}), SchemaError);
}

TEST(SchemaTest, DefaultValues_OnlyFieldsWithDefaults) {
    Schema schema = make_budget();

    DataMap defaults = schema.default_values();

    EXPECT_EQ(defaults.size(), 4u);
    EXPECT_EQ(defaults.at("income"), Value(5000.0));
    EXPECT_EQ(defaults.at("autoSave"), Value(true));
    EXPECT_EQ(defaults.at("priority"), Value::make_enum("medium"));
    EXPECT_EQ(defaults.count("note"), 0u);
}

TEST(SchemaTest, ParseFieldKind_AcceptsAliases) {
    EXPECT_EQ(parse_field_kind("string"), FieldKind::Text);
    EXPECT_EQ(parse_field_kind("bool"), FieldKind::Boolean);
    EXPECT_EQ(parse_field_kind("object"), FieldKind::Object);
    EXPECT_FALSE(parse_field_kind("array").has_value());
}

// ==============================================================================
// validate
// ==============================================================================

TEST(SchemaTest, Validate_UnknownField_Fails) {
    auto result = make_budget().validate("bonus", Value(1));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error.kind, ErrorKind::UnknownField);
    EXPECT_EQ(result.error.field, "bonus");
}

TEST(SchemaTest, Validate_NumberBelowMin_OutOfRange) {
    auto result = make_budget().validate("income", Value(-1));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error.kind, ErrorKind::OutOfRange);
}

TEST(SchemaTest, Validate_NumberAboveMax_OutOfRange) {
    auto result = make_budget().validate("income", Value(2000000));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error.kind, ErrorKind::OutOfRange);
}

TEST(SchemaTest, Validate_NumberInRange_Ok) {
    auto result = make_budget().validate("income", Value(50));
    ASSERT_TRUE(result);
    EXPECT_EQ(result.value, Value(50));
}

TEST(SchemaTest, Validate_NumericText_CoercedToNumber) {
    auto result = make_budget().validate("rent", Value(" 1200.5 "));
    ASSERT_TRUE(result);
    EXPECT_EQ(result.value, Value(1200.5));
}

TEST(SchemaTest, Validate_NonNumericText_TypeMismatch) {
    auto result = make_budget().validate("rent", Value("twelve"));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error.kind, ErrorKind::TypeMismatch);
}

TEST(SchemaTest, Validate_PartialNumericText_TypeMismatch) {
    auto result = make_budget().validate("rent", Value("12abc"));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error.kind, ErrorKind::TypeMismatch);
}

TEST(SchemaTest, Validate_BooleanFromNumber_TypeMismatch) {
    auto result = make_budget().validate("autoSave", Value(1));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error.kind, ErrorKind::TypeMismatch);
}

TEST(SchemaTest, Validate_EnumFromText_CoercedToEnum) {
    auto result = make_budget().validate("priority", Value("high"));
    ASSERT_TRUE(result);
    EXPECT_EQ(result.value, Value::make_enum("high"));
}

TEST(SchemaTest, Validate_EnumNotInOptions_InvalidOption) {
    auto result = make_budget().validate("priority", Value("urgent"));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error.kind, ErrorKind::InvalidOption);
    EXPECT_NE(result.error.message.find("low, medium, high"), std::string::npos);
}

TEST(SchemaTest, Validate_TextFromEnum_CoercedToText) {
    auto result = make_budget().validate("note", Value::make_enum("x"));
    ASSERT_TRUE(result);
    EXPECT_EQ(result.value, Value("x"));
}

TEST(SchemaTest, Validate_DateFromText_TypeMismatch) {
    auto result = make_budget().validate("due", Value("2024-01-01"));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error.kind, ErrorKind::TypeMismatch);
}

TEST(SchemaTest, Validate_ObjectField_AcceptsComposite) {
    auto result = make_budget().validate("meta", Value::make_composite({{"k", Value("v")}}));
    EXPECT_TRUE(result);
}

TEST(SchemaTest, Validate_NullOnOptionalField_Ok) {
    auto result = make_budget().validate("note", Value());
    ASSERT_TRUE(result);
    EXPECT_TRUE(result.value.is_null());
}

TEST(SchemaTest, Validate_NullOnRequiredField_TypeMismatch) {
    auto result = make_budget().validate("owner", Value());
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error.kind, ErrorKind::TypeMismatch);
}

TEST(SchemaTest, Validate_DoesNotChangeSchema) {
    Schema schema = make_budget();
    auto before = schema.describe();

    (void)schema.validate("income", Value(-1));
    (void)schema.validate("income", Value(10));

    EXPECT_EQ(schema.describe(), before);
}

// ==============================================================================
// Ошибки и описание
// ==============================================================================

TEST(SchemaTest, ValidationError_Format_KindAndMessage) {
    ValidationError error{ErrorKind::OutOfRange, "income", "too small"};
    EXPECT_EQ(error.format(), "OutOfRange: too small");
}

TEST(SchemaTest, Describe_ListsFieldsAndConstraints) {
    std::string text = make_budget().describe();

    EXPECT_NE(text.find("Schema: Budget"), std::string::npos);
    EXPECT_NE(text.find("- income (Monthly Income): number, min 0, max 1000000, default 5000"),
              std::string::npos);
    EXPECT_NE(text.find("one of [low, medium, high]"), std::string::npos);
    EXPECT_NE(text.find("- owner (Owner): text, required"), std::string::npos);
    EXPECT_NE(text.find("/meta/<key>"), std::string::npos);
}

}  // namespace duet::schema::test
