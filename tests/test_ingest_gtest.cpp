// ==============================================================================
// test_ingest_gtest.cpp - Тесты разбора текста агента (GoogleTest)
// ==============================================================================

#include "duet/patch.hpp"

#include <gtest/gtest.h>
#include <string>

namespace duet::ingest::test {

namespace {

Schema make_schema() {
    return Schema("Plan", {
                              Field::number("income", "Income", 5000.0, 0.0),
                              Field::text("name", "Name"),
                              Field::date("due", "Due"),
                              Field::object("meta", "Meta"),
                          });
}

}  // namespace

// ==============================================================================
// Три формы
// ==============================================================================

TEST(IngestTest, OperationArray_Parsed) {
    // Arrange
    std::string text = R"([{"op": "replace", "path": "/income", "value": 6000},
                           {"op": "add", "path": "/name", "value": "Ann"}])";

    // Act
    auto result = parse_patch_text(text);

    // Assert
    ASSERT_TRUE(result) << result.error;
    ASSERT_EQ(result.operations.size(), 2u);
    EXPECT_EQ(result.operations[0], PatchOperation::replace("/income", Value(6000)));
    EXPECT_EQ(result.operations[1], PatchOperation::add("/name", Value("Ann")));
}

TEST(IngestTest, PatchWrapper_Parsed) {
    auto result = parse_patch_text(R"({"patch": [{"op": "replace", "path": "/income", "value": 1}]})");

    ASSERT_TRUE(result) << result.error;
    ASSERT_EQ(result.operations.size(), 1u);
    EXPECT_EQ(result.operations[0].path, "/income");
}

TEST(IngestTest, LegacyEdits_BecomeReplaceOperations) {
    auto result = parse_patch_text(
        R"({"edits": [{"field": "income", "value": 7000}, {"field": "name", "value": "Bo"}]})");

    ASSERT_TRUE(result) << result.error;
    ASSERT_EQ(result.operations.size(), 2u);
    EXPECT_EQ(result.operations[0], PatchOperation::replace("/income", Value(7000)));
    EXPECT_EQ(result.operations[1], PatchOperation::replace("/name", Value("Bo")));
}

TEST(IngestTest, EmptyArray_IsEmptyPatch) {
    auto result = parse_patch_text("[]");
    ASSERT_TRUE(result);
    EXPECT_TRUE(result.operations.empty());
}

// ==============================================================================
// Значения
// ==============================================================================

TEST(IngestTest, UnknownOp_KeptForValidation) {
    auto result = parse_patch_text(R"([{"op": "remove", "path": "/income"}])");

    ASSERT_TRUE(result);
    EXPECT_EQ(result.operations[0].kind, OpKind::Unsupported);
    EXPECT_EQ(result.operations[0].op, "remove");
    EXPECT_FALSE(result.operations[0].value.has_value());
}

TEST(IngestTest, NullValue_TreatedAsMissing) {
    auto result = parse_patch_text(R"([{"op": "replace", "path": "/name", "value": null}])");

    ASSERT_TRUE(result);
    EXPECT_FALSE(result.operations[0].value.has_value());
}

TEST(IngestTest, NestedObjectValue_DecodedAsComposite) {
    auto result = parse_patch_text(R"([{"op": "add", "path": "/meta", "value": {"k": "v"}}])");

    ASSERT_TRUE(result);
    ASSERT_TRUE(result.operations[0].value->is_composite());
    EXPECT_EQ(*result.operations[0].value->get("k"), Value("v"));
}

TEST(IngestTest, DateFieldNumber_DecodedAsEpochSeconds) {
    Schema schema = make_schema();

    auto result =
        parse_patch_text(R"([{"op": "replace", "path": "/due", "value": 86400}])", &schema);

    ASSERT_TRUE(result);
    ASSERT_TRUE(result.operations[0].value->is_date());
    EXPECT_EQ(result.operations[0].value->as_date(), from_epoch_seconds(86400));
}

TEST(IngestTest, DateFieldNumberOutOfRange_RejectedAsTypeMismatch) {
    // Arrange
    Schema schema = make_schema();
    std::string text = R"([{"op": "replace", "path": "/due", "value": 1e300}])";

    // Act
    auto result = parse_patch_text(text, &schema);

    // Assert
    ASSERT_TRUE(result) << result.error;
    ASSERT_TRUE(result.operations[0].value->is_number());
    auto validated = validate_operation(schema, result.operations[0]);
    ASSERT_FALSE(validated);
    EXPECT_EQ(validated.error.kind, ErrorKind::TypeMismatch);
    EXPECT_EQ(validated.error.field, "due");
}

TEST(IngestTest, WithoutSchema_NumberStaysNumber) {
    auto result = parse_patch_text(R"([{"op": "replace", "path": "/due", "value": 86400}])");

    ASSERT_TRUE(result);
    EXPECT_TRUE(result.operations[0].value->is_number());
}

// ==============================================================================
// Текст вокруг JSON
// ==============================================================================

TEST(IngestTest, FencedBlock_Extracted) {
    std::string text = "Sure, here is the change:\n"
                       "```json\n"
                       "[{\"op\": \"replace\", \"path\": \"/income\", \"value\": 4200}]\n"
                       "```\n"
                       "Let me know if you need anything else.";

    auto result = parse_patch_text(text);

    ASSERT_TRUE(result) << result.error;
    EXPECT_EQ(result.operations[0].value, Value(4200));
}

TEST(IngestTest, SurroundingProse_OuterSpanExtracted) {
    auto result = parse_patch_text(
        R"(Updating: {"edits": [{"field": "name", "value": "Cy"}]} done.)");

    ASSERT_TRUE(result) << result.error;
    EXPECT_EQ(result.operations[0].path, "/name");
}

// ==============================================================================
// Ошибки
// ==============================================================================

TEST(IngestTest, InvalidJson_Fails) {
    auto result = parse_patch_text("not json at all");

    EXPECT_FALSE(result);
    EXPECT_TRUE(result.operations.empty());
    EXPECT_NE(result.error.find("could not parse patch"), std::string::npos);
}

TEST(IngestTest, WrongShape_Fails) {
    auto result = parse_patch_text(R"({"changes": []})");
    EXPECT_FALSE(result);
}

TEST(IngestTest, OperationWithoutPath_Fails) {
    auto result = parse_patch_text(R"([{"op": "replace", "value": 1}])");
    EXPECT_FALSE(result);
}

TEST(IngestTest, ArrayValue_Fails) {
    auto result = parse_patch_text(R"([{"op": "replace", "path": "/name", "value": [1, 2]}])");
    EXPECT_FALSE(result);
}

}  // namespace duet::ingest::test
