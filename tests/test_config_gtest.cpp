// ==============================================================================
// test_config_gtest.cpp - Тесты загрузки схем из YAML и встроенных схем
// ==============================================================================

#include "duet/config.hpp"

#include <filesystem>
#include <gtest/gtest.h>
#include <string>
#include <variant>
#include <vector>

#ifndef CMAKE_SOURCE_DIR
#define CMAKE_SOURCE_DIR "."
#endif

namespace duet::config::test {

namespace {

std::filesystem::path fixture(const std::string& name) {
    return std::filesystem::path(CMAKE_SOURCE_DIR) / "tests" / "fixtures" / "schemas" / name;
}

}  // namespace

// ==============================================================================
// load_schema_file
// ==============================================================================

TEST(ConfigTest, LoadSchemaFile_ValidFile_AllFieldTypes) {
    // Act
    auto result = load_schema_file(fixture("trip.yml"));

    // Assert
    ASSERT_TRUE(result) << result.error;
    const Schema& schema = *result.schema;
    EXPECT_EQ(schema.name(), "Trip Planner");
    ASSERT_EQ(schema.fields().size(), 7u);

    const Field* destination = schema.field_named("destination");
    ASSERT_NE(destination, nullptr);
    EXPECT_EQ(destination->kind(), FieldKind::Text);
    EXPECT_TRUE(destination->required);

    const Field* budget = schema.field_named("budget");
    ASSERT_NE(budget, nullptr);
    const auto& range = std::get<NumberType>(budget->type);
    EXPECT_EQ(range.min, 0.0);
    EXPECT_EQ(range.max, 50000.0);
    EXPECT_EQ(budget->default_value, Value(2500));

    const Field* mode = schema.field_named("travelMode");
    ASSERT_NE(mode, nullptr);
    EXPECT_EQ(std::get<EnumType>(mode->type).options,
              (std::vector<std::string>{"car", "train", "plane"}));
    EXPECT_EQ(mode->default_value, Value::make_enum("train"));
}

TEST(ConfigTest, LoadSchemaFile_DateAndObjectDefaults) {
    auto result = load_schema_file(fixture("trip.yml"));
    ASSERT_TRUE(result) << result.error;

    DataMap defaults = result.schema->default_values();

    EXPECT_EQ(defaults.at("departure"), Value(from_epoch_seconds(1767225600)));
    EXPECT_EQ(defaults.at("insured"), Value(false));
    const Value& prefs = defaults.at("preferences");
    ASSERT_TRUE(prefs.is_composite());
    EXPECT_EQ(*prefs.get("seat"), Value("window"));
    EXPECT_EQ(*prefs.get("meals"), Value(2));
}

TEST(ConfigTest, LoadSchemaFile_FieldWithoutTypeOrLabel_DefaultsToTextAndId) {
    auto result = load_schema_file(fixture("trip.yml"));
    ASSERT_TRUE(result);

    const Field* notes = result.schema->field_named("notes");
    ASSERT_NE(notes, nullptr);
    EXPECT_EQ(notes->kind(), FieldKind::Text);
    EXPECT_EQ(notes->label, "notes");
    EXPECT_FALSE(notes->required);
}

TEST(ConfigTest, LoadSchemaFile_UnknownType_Fails) {
    auto result = load_schema_file(fixture("invalid_type.yml"));

    EXPECT_FALSE(result);
    EXPECT_EQ(result.schema, nullptr);
    EXPECT_NE(result.error.find("unknown type 'list'"), std::string::npos);
}

TEST(ConfigTest, LoadSchemaFile_DuplicateId_Fails) {
    auto result = load_schema_file(fixture("duplicate_id.yml"));

    EXPECT_FALSE(result);
    EXPECT_NE(result.error.find("duplicate field id 'amount'"), std::string::npos);
}

TEST(ConfigTest, LoadSchemaFile_DefaultNotInOptions_Fails) {
    auto result = load_schema_file(fixture("bad_default.yml"));

    EXPECT_FALSE(result);
    EXPECT_NE(result.error.find("invalid default for field 'level'"), std::string::npos);
}

TEST(ConfigTest, LoadSchemaFile_MissingFile_Fails) {
    auto result = load_schema_file(fixture("does_not_exist.yml"));

    EXPECT_FALSE(result);
    EXPECT_NE(result.error.find("cannot open schema file"), std::string::npos);
}

// ==============================================================================
// parse_schema_yaml
// ==============================================================================

TEST(ConfigTest, ParseSchemaYaml_MissingName_Untitled) {
    auto result = parse_schema_yaml("fields:\n  - id: a\n    type: number\n");

    ASSERT_TRUE(result) << result.error;
    EXPECT_EQ(result.schema->name(), "Untitled");
}

TEST(ConfigTest, ParseSchemaYaml_MissingFields_Fails) {
    auto result = parse_schema_yaml("name: Empty\n");

    EXPECT_FALSE(result);
    EXPECT_EQ(result.error, "schema file missing 'fields' list");
}

TEST(ConfigTest, ParseSchemaYaml_FieldWithoutId_Fails) {
    auto result = parse_schema_yaml("fields:\n  - type: text\n");

    EXPECT_FALSE(result);
    EXPECT_NE(result.error.find("field #1 missing 'id'"), std::string::npos);
}

TEST(ConfigTest, ParseSchemaYaml_BrokenYaml_Fails) {
    auto result = parse_schema_yaml("fields: [unclosed\n");

    EXPECT_FALSE(result);
    EXPECT_NE(result.error.find("YAML parse error"), std::string::npos);
}

TEST(ConfigTest, ParseSchemaYaml_DateDefaultOutOfRange_Fails) {
    auto result =
        parse_schema_yaml("fields:\n  - id: due\n    type: date\n    default: 1e300\n");

    EXPECT_FALSE(result);
    EXPECT_NE(result.error.find("field 'due': date default is out of range"), std::string::npos);
}

TEST(ConfigTest, ParseSchemaYaml_MinAboveMax_Fails) {
    auto result = parse_schema_yaml("fields:\n  - id: n\n    type: number\n    min: 5\n    max: 1\n");

    EXPECT_FALSE(result);
    EXPECT_NE(result.error.find("invalid schema"), std::string::npos);
}

// ==============================================================================
// Встроенные схемы
// ==============================================================================

TEST(ConfigTest, BudgetSchema_FieldsAndDefaults) {
    auto schema = budget_schema();
    ASSERT_NE(schema, nullptr);

    EXPECT_EQ(schema->name(), "Monthly Budget");
    EXPECT_EQ(schema->fields().size(), 7u);

    DataMap defaults = schema->default_values();
    EXPECT_EQ(defaults.at("income"), Value(5000));
    EXPECT_EQ(defaults.at("savings"), Value(500));
    EXPECT_EQ(defaults.at("autoSave"), Value(true));
    EXPECT_EQ(defaults.at("priority"), Value::make_enum("medium"));
}

TEST(ConfigTest, BudgetSchema_IncomeRange) {
    auto schema = budget_schema();

    EXPECT_EQ(schema->validate("income", Value(-1)).error.kind, ErrorKind::OutOfRange);
    EXPECT_TRUE(schema->validate("income", Value(50)));
}

TEST(ConfigTest, FitnessSchema_ActivityLevelHasNoDefault) {
    auto schema = fitness_schema();
    ASSERT_NE(schema, nullptr);

    EXPECT_EQ(schema->name(), "Fitness Tracker");
    EXPECT_EQ(schema->default_values().count("activityLevel"), 0u);
    EXPECT_EQ(schema->default_values().at("stepsGoal"), Value(10000));
}

TEST(ConfigTest, BuiltinSchema_ByName) {
    EXPECT_EQ(builtin_schema("budget"), budget_schema());
    EXPECT_EQ(builtin_schema("fitness"), fitness_schema());
    EXPECT_EQ(builtin_schema("garden"), nullptr);
}

}  // namespace duet::config::test
