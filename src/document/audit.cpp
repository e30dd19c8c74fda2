// ==============================================================================
// audit.cpp - Журнал аудита патчей
// ==============================================================================

#include "duet/audit.hpp"

#include <atomic>
#include <chrono>
#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace duet {

const char* source_to_string(Source source) {
    switch (source) {
    case Source::User:
        return "user";
    case Source::Llm:
        return "llm";
    case Source::System:
        return "system";
    }
    return "unknown";
}

std::optional<Source> parse_source(std::string_view s) {
    if (s == "user") {
        return Source::User;
    }
    if (s == "llm") {
        return Source::Llm;
    }
    if (s == "system") {
        return Source::System;
    }
    return std::nullopt;
}

// ----------------------------------------------------------------------------
// AuditLog
// ----------------------------------------------------------------------------

AuditLog::AuditLog() : entries_(std::make_shared<const std::vector<AuditEntry>>()) {}

AuditEntry AuditLog::append(Patch operations, Source source, const PatchResult& result) {
    AuditEntry entry;
    entry.sequence_id = next_id_++;
    entry.timestamp = std::chrono::system_clock::now();
    entry.operations = std::move(operations);
    entry.source = source;
    entry.succeeded = result.success;
    if (result.success) {
        entry.operations_applied = result.operations_applied;
    } else {
        entry.reason = result.error.value_or("unknown error");
    }

    auto current = std::atomic_load(&entries_);
    auto next = std::make_shared<std::vector<AuditEntry>>(*current);
    next->push_back(entry);
    std::atomic_store(&entries_, std::shared_ptr<const std::vector<AuditEntry>>(std::move(next)));

    return entry;
}

std::vector<AuditEntry> AuditLog::entries() const {
    return *std::atomic_load(&entries_);
}

std::size_t AuditLog::size() const {
    return std::atomic_load(&entries_)->size();
}

void AuditLog::clear() {
    std::atomic_store(&entries_, std::make_shared<const std::vector<AuditEntry>>());
}

std::string AuditLog::to_json(bool pretty) const {
    auto snapshot = std::atomic_load(&entries_);

    rapidjson::Document doc;
    doc.SetArray();
    auto& alloc = doc.GetAllocator();

    for (const auto& entry : *snapshot) {
        rapidjson::Value obj(rapidjson::kObjectType);
        obj.AddMember("id", static_cast<std::uint64_t>(entry.sequence_id), alloc);
        obj.AddMember("timestamp", to_epoch_seconds(entry.timestamp), alloc);

        std::string source = source_to_string(entry.source);
        rapidjson::Value source_v;
        source_v.SetString(source.c_str(), static_cast<rapidjson::SizeType>(source.size()), alloc);
        obj.AddMember("source", source_v, alloc);

        rapidjson::Value ops;
        patch_to_rapidjson(entry.operations, ops, alloc);
        obj.AddMember("patch", ops, alloc);

        obj.AddMember("success", entry.succeeded, alloc);
        if (entry.succeeded) {
            obj.AddMember("applied", static_cast<std::uint64_t>(entry.operations_applied), alloc);
        } else {
            rapidjson::Value reason;
            reason.SetString(entry.reason.c_str(),
                             static_cast<rapidjson::SizeType>(entry.reason.size()), alloc);
            obj.AddMember("error", reason, alloc);
        }

        doc.PushBack(obj, alloc);
    }

    rapidjson::StringBuffer buffer;
    if (pretty) {
        rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
        doc.Accept(writer);
    } else {
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
        doc.Accept(writer);
    }
    return std::string(buffer.GetString(), buffer.GetSize());
}

}  // namespace duet
