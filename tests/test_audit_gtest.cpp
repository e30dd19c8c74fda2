// ==============================================================================
// test_audit_gtest.cpp - Тесты журнала аудита (GoogleTest)
// ==============================================================================

#include "duet/audit.hpp"

#include <gtest/gtest.h>
#include <rapidjson/document.h>
#include <string>

namespace duet::audit::test {

// ==============================================================================
// Source
// ==============================================================================

TEST(AuditTest, Source_ToStringAndParse) {
    EXPECT_STREQ(source_to_string(Source::User), "user");
    EXPECT_STREQ(source_to_string(Source::Llm), "llm");
    EXPECT_STREQ(source_to_string(Source::System), "system");

    EXPECT_EQ(parse_source("llm"), Source::Llm);
    EXPECT_EQ(parse_source("system"), Source::System);
    EXPECT_FALSE(parse_source("robot").has_value());
}

// ==============================================================================
// append / entries
// ==============================================================================

TEST(AuditTest, Append_AssignsIncreasingIds) {
    AuditLog log;
    EXPECT_EQ(log.last_sequence_id(), 0u);

    auto first = log.append({}, Source::User, PatchResult::succeeded(0));
    auto second = log.append({}, Source::Llm, PatchResult::succeeded(0));

    EXPECT_EQ(first.sequence_id, 1u);
    EXPECT_EQ(second.sequence_id, 2u);
    EXPECT_EQ(log.size(), 2u);
    EXPECT_EQ(log.last_sequence_id(), 2u);
}

TEST(AuditTest, Append_Success_RecordsAppliedCount) {
    AuditLog log;
    Patch ops{PatchOperation::replace("/a", Value(1)), PatchOperation::replace("/b", Value(2))};

    auto entry = log.append(ops, Source::Llm, PatchResult::succeeded(2));

    EXPECT_TRUE(entry.succeeded);
    EXPECT_EQ(entry.operations_applied, 2u);
    EXPECT_TRUE(entry.reason.empty());
    EXPECT_EQ(entry.operations, ops);
}

TEST(AuditTest, Append_Failure_RecordsReason) {
    AuditLog log;
    ValidationError error{ErrorKind::OutOfRange, "a", "too big"};

    auto entry = log.append({PatchOperation::replace("/a", Value(9))}, Source::User,
                            PatchResult::failed(error));

    EXPECT_FALSE(entry.succeeded);
    EXPECT_EQ(entry.operations_applied, 0u);
    EXPECT_EQ(entry.reason, "OutOfRange: too big");
    EXPECT_EQ(entry.operations.size(), 1u);
}

TEST(AuditTest, Entries_ReturnsSnapshotInOrder) {
    AuditLog log;
    log.append({}, Source::User, PatchResult::succeeded(0));

    auto snapshot = log.entries();
    log.append({}, Source::System, PatchResult::succeeded(0));

    EXPECT_EQ(snapshot.size(), 1u);
    auto all = log.entries();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_LT(all[0].sequence_id, all[1].sequence_id);
    EXPECT_LE(all[0].timestamp, all[1].timestamp);
}

TEST(AuditTest, Clear_KeepsSequenceCounter) {
    AuditLog log;
    log.append({}, Source::User, PatchResult::succeeded(0));
    log.append({}, Source::User, PatchResult::succeeded(0));

    log.clear();
    auto entry = log.append({}, Source::User, PatchResult::succeeded(0));

    EXPECT_EQ(log.size(), 1u);
    EXPECT_EQ(entry.sequence_id, 3u);
}

// ==============================================================================
// to_json
// ==============================================================================

TEST(AuditTest, ToJson_ContainsEntryFields) {
    // Arrange
    AuditLog log;
    log.append({PatchOperation::replace("/income", Value(6000))}, Source::Llm,
               PatchResult::succeeded(1));
    log.append({}, Source::User,
               PatchResult::failed({ErrorKind::MalformedInput, "", "could not parse patch"}));

    // Act
    rapidjson::Document doc;
    doc.Parse(log.to_json().c_str());

    // Assert
    ASSERT_FALSE(doc.HasParseError());
    ASSERT_TRUE(doc.IsArray());
    ASSERT_EQ(doc.Size(), 2u);

    const auto& ok = doc[0];
    EXPECT_EQ(ok["id"].GetUint64(), 1u);
    EXPECT_STREQ(ok["source"].GetString(), "llm");
    EXPECT_TRUE(ok["success"].GetBool());
    EXPECT_EQ(ok["applied"].GetUint64(), 1u);
    ASSERT_TRUE(ok["patch"].IsArray());
    EXPECT_STREQ(ok["patch"][0]["path"].GetString(), "/income");
    EXPECT_TRUE(ok["timestamp"].IsNumber());

    const auto& failed = doc[1];
    EXPECT_FALSE(failed["success"].GetBool());
    EXPECT_STREQ(failed["error"].GetString(), "MalformedInput: could not parse patch");
    EXPECT_EQ(failed["patch"].Size(), 0u);
    EXPECT_FALSE(failed.HasMember("applied"));
}

TEST(AuditTest, ToJson_Pretty_IsValidJson) {
    AuditLog log;
    log.append({}, Source::System, PatchResult::succeeded(0));

    std::string text = log.to_json(true);
    rapidjson::Document doc;
    doc.Parse(text.c_str());

    EXPECT_FALSE(doc.HasParseError());
    EXPECT_NE(text.find('\n'), std::string::npos);
}

}  // namespace duet::audit::test
