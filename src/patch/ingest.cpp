// ==============================================================================
// ingest.cpp - Разбор текста агента в список патч-операций
// ==============================================================================
//
// Допустимые формы (первое структурное совпадение выигрывает):
// 1. [{"op": "replace", "path": "/income", "value": 6000}]
// 2. {"patch": [...]}
// 3. {"edits": [{"field": "income", "value": 6000}]}  (устаревший формат)
//
// ==============================================================================

#include "duet/patch.hpp"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <stdexcept>

namespace duet {

namespace {

/// Декодировать значение операции.
/// Для пути из одного сегмента, указывающего на Date поле, число - epoch seconds.
/// Число вне диапазона Timestamp остаётся Number и отклоняется проверкой как TypeMismatch.
Value decode_value(const rapidjson::Value& json, const std::string& path, const Schema* schema) {
    if (schema != nullptr && json.IsNumber()) {
        auto segments = split_pointer(path);
        if (segments.size() == 1) {
            const Field* field = schema->field_named(segments.front());
            if (field != nullptr && field->kind() == FieldKind::Date) {
                if (auto t = try_from_epoch_seconds(json.GetDouble())) {
                    return Value(*t);
                }
            }
        }
    }
    return Value::from_rapidjson(json);
}

/// Форма 1: массив объектов {op, path, value?}
bool parse_operation_array(const rapidjson::Value& json, const Schema* schema, Patch& out) {
    if (!json.IsArray()) {
        return false;
    }

    Patch ops;
    ops.reserve(json.Size());
    for (const auto& item : json.GetArray()) {
        if (!item.IsObject()) {
            return false;
        }
        auto op_it = item.FindMember("op");
        auto path_it = item.FindMember("path");
        if (op_it == item.MemberEnd() || !op_it->value.IsString() ||
            path_it == item.MemberEnd() || !path_it->value.IsString()) {
            return false;
        }

        std::string op(op_it->value.GetString(), op_it->value.GetStringLength());
        std::string path(path_it->value.GetString(), path_it->value.GetStringLength());

        // "value": null трактуется как отсутствие значения
        std::optional<Value> value;
        auto value_it = item.FindMember("value");
        if (value_it != item.MemberEnd() && !value_it->value.IsNull()) {
            value = decode_value(value_it->value, path, schema);
        }

        ops.push_back(PatchOperation::make(std::move(op), std::move(path), std::move(value)));
    }

    out = std::move(ops);
    return true;
}

/// Форма 3: {"edits": [{"field", "value"}]}
bool parse_legacy_edits(const rapidjson::Value& json, const Schema* schema, Patch& out) {
    if (!json.IsObject()) {
        return false;
    }
    auto edits_it = json.FindMember("edits");
    if (edits_it == json.MemberEnd() || !edits_it->value.IsArray()) {
        return false;
    }

    Patch ops;
    for (const auto& edit : edits_it->value.GetArray()) {
        if (!edit.IsObject()) {
            return false;
        }
        auto field_it = edit.FindMember("field");
        auto value_it = edit.FindMember("value");
        if (field_it == edit.MemberEnd() || !field_it->value.IsString() ||
            value_it == edit.MemberEnd()) {
            return false;
        }

        std::string path =
            "/" + std::string(field_it->value.GetString(), field_it->value.GetStringLength());
        Value value = decode_value(value_it->value, path, schema);
        ops.push_back(PatchOperation::replace(std::move(path), std::move(value)));
    }

    out = std::move(ops);
    return true;
}

/// Перебрать три формы для уже разобранного JSON
bool parse_shapes(const rapidjson::Value& json, const Schema* schema, Patch& out) {
    if (parse_operation_array(json, schema, out)) {
        return true;
    }

    if (json.IsObject()) {
        auto patch_it = json.FindMember("patch");
        if (patch_it != json.MemberEnd() &&
            parse_operation_array(patch_it->value, schema, out)) {
            return true;
        }
    }

    return parse_legacy_edits(json, schema, out);
}

/// Разобрать фрагмент текста как JSON и перебрать формы.
/// Массивы в значениях (нет типа Value) делают форму несовпавшей.
bool try_parse(std::string_view text, const Schema* schema, Patch& out, std::string& error) {
    rapidjson::Document doc;
    doc.Parse(text.data(), text.size());
    if (doc.HasParseError()) {
        error = std::string("invalid JSON: ") + rapidjson::GetParseError_En(doc.GetParseError()) +
                " (offset " + std::to_string(doc.GetErrorOffset()) + ")";
        return false;
    }

    try {
        if (parse_shapes(doc, schema, out)) {
            return true;
        }
    } catch (const std::invalid_argument& e) {
        error = e.what();
        return false;
    }

    error = "JSON does not match any patch format (operation array, {\"patch\": [...]} or "
            "{\"edits\": [...]})";
    return false;
}

/// Найти первый блок ```json ... ``` (или ``` ... ```)
std::optional<std::string_view> find_fenced_block(std::string_view text) {
    auto open = text.find("```");
    if (open == std::string_view::npos) {
        return std::nullopt;
    }
    auto body = text.find('\n', open);
    if (body == std::string_view::npos) {
        return std::nullopt;
    }
    auto close = text.find("```", body + 1);
    if (close == std::string_view::npos) {
        return std::nullopt;
    }
    return text.substr(body + 1, close - body - 1);
}

/// Найти внешний фрагмент, начинающийся с первой '[' или '{'
std::optional<std::string_view> find_outer_span(std::string_view text) {
    auto begin = text.find_first_of("[{");
    if (begin == std::string_view::npos) {
        return std::nullopt;
    }
    char close = text[begin] == '[' ? ']' : '}';
    auto end = text.find_last_of(close);
    if (end == std::string_view::npos || end <= begin) {
        return std::nullopt;
    }
    return text.substr(begin, end - begin + 1);
}

}  // namespace

PatchParseResult parse_patch_text(std::string_view text, const Schema* schema) {
    PatchParseResult result;

    std::string error;
    if (try_parse(text, schema, result.operations, error)) {
        result.ok = true;
        return result;
    }

    // Ответ агента может содержать пояснения вокруг JSON
    std::string fallback_error;
    if (auto block = find_fenced_block(text)) {
        if (try_parse(*block, schema, result.operations, fallback_error)) {
            result.ok = true;
            return result;
        }
    }
    if (auto span = find_outer_span(text)) {
        if (*span != text && try_parse(*span, schema, result.operations, fallback_error)) {
            result.ok = true;
            return result;
        }
    }

    result.ok = false;
    result.operations.clear();
    result.error = "could not parse patch: " + error;
    return result;
}

}  // namespace duet
