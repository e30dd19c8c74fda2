// ==============================================================================
// codec.cpp - Сериализация снимка документа
// ==============================================================================
//
// Формат снимка: плоский JSON объект {"<field id>": <value>, ...}.
// Date записывается числом (epoch seconds), Enum строкой; тип восстанавливается
// по схеме при загрузке.
//
// ==============================================================================

#include "duet/storage.hpp"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <stdexcept>

namespace duet {

namespace {

void add_member(rapidjson::Document& doc, const std::string& key, const Value& value) {
    auto& alloc = doc.GetAllocator();
    rapidjson::Value name;
    name.SetString(key.c_str(), static_cast<rapidjson::SizeType>(key.size()), alloc);
    rapidjson::Value v;
    value.to_rapidjson(v, alloc);
    doc.AddMember(name, v, alloc);
}

}  // namespace

std::string encode_data(const DataMap& data, const DataMap& retained, bool pretty) {
    rapidjson::Document doc;
    doc.SetObject();

    for (const auto& [key, value] : retained) {
        if (data.count(key) == 0) {
            add_member(doc, key, value);
        }
    }
    for (const auto& [key, value] : data) {
        add_member(doc, key, value);
    }

    rapidjson::StringBuffer buffer;
    if (pretty) {
        rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
        writer.SetIndent(' ', 2);
        doc.Accept(writer);
    } else {
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
        doc.Accept(writer);
    }
    return std::string(buffer.GetString(), buffer.GetSize());
}

DecodeResult decode_data(const Schema& schema, std::string_view text) {
    DecodeResult result;

    rapidjson::Document doc;
    doc.Parse(text.data(), text.size());
    if (doc.HasParseError()) {
        result.error = std::string("invalid JSON: ") +
                       rapidjson::GetParseError_En(doc.GetParseError()) + " (offset " +
                       std::to_string(doc.GetErrorOffset()) + ")";
        return result;
    }
    if (!doc.IsObject()) {
        result.error = "snapshot is not a JSON object";
        return result;
    }

    for (auto it = doc.MemberBegin(); it != doc.MemberEnd(); ++it) {
        std::string key(it->name.GetString(), it->name.GetStringLength());
        const rapidjson::Value& json = it->value;

        Value candidate;
        try {
            candidate = Value::from_rapidjson(json);
        } catch (const std::invalid_argument&) {
            // Массивы не представимы в Value
            continue;
        }

        const Field* field = schema.field_named(key);
        if (field == nullptr) {
            result.retained[key] = std::move(candidate);
            continue;
        }

        if (field->kind() == FieldKind::Date && json.IsNumber()) {
            // Вне диапазона: остаётся Number, не проходит проверку и сохраняется в retained
            if (auto t = try_from_epoch_seconds(json.GetDouble())) {
                candidate = Value(*t);
            }
        } else if (field->kind() == FieldKind::Enum && json.IsString()) {
            candidate = Value::make_enum(candidate.as_text());
        }

        auto validated = schema.validate(key, candidate);
        if (validated) {
            result.data[key] = std::move(validated.value);
        } else {
            result.retained[key] = std::move(candidate);
        }
    }

    result.ok = true;
    return result;
}

}  // namespace duet
