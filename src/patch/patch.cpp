// ==============================================================================
// patch.cpp - Патч-операции: пути, проверка, вложенное слияние
// ==============================================================================

#include "duet/patch.hpp"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace duet {

// ----------------------------------------------------------------------------
// PatchOperation
// ----------------------------------------------------------------------------

OpKind parse_op_kind(std::string_view s) {
    if (s == "replace") {
        return OpKind::Replace;
    }
    if (s == "add") {
        return OpKind::Add;
    }
    return OpKind::Unsupported;
}

PatchOperation PatchOperation::replace(std::string path, Value value) {
    return PatchOperation{OpKind::Replace, "replace", std::move(path), std::move(value)};
}

PatchOperation PatchOperation::add(std::string path, Value value) {
    return PatchOperation{OpKind::Add, "add", std::move(path), std::move(value)};
}

PatchOperation PatchOperation::make(std::string op, std::string path,
                                    std::optional<Value> value) {
    OpKind kind = parse_op_kind(op);
    return PatchOperation{kind, std::move(op), std::move(path), std::move(value)};
}

bool PatchOperation::operator==(const PatchOperation& other) const {
    return kind == other.kind && op == other.op && path == other.path && value == other.value;
}

// ----------------------------------------------------------------------------
// PatchResult
// ----------------------------------------------------------------------------

PatchResult PatchResult::succeeded(std::size_t applied) {
    PatchResult r;
    r.success = true;
    r.operations_applied = applied;
    return r;
}

PatchResult PatchResult::failed(const ValidationError& error) {
    PatchResult r;
    r.success = false;
    r.operations_applied = 0;
    r.error = error.format();
    r.error_kind = error.kind;
    return r;
}

// ----------------------------------------------------------------------------
// JSON Pointer
// ----------------------------------------------------------------------------

namespace {

/// Снять экранирование RFC 6901 (~1 -> /, ~0 -> ~)
std::string unescape_segment(std::string_view segment) {
    std::string result;
    result.reserve(segment.size());
    for (std::size_t i = 0; i < segment.size(); ++i) {
        if (segment[i] == '~' && i + 1 < segment.size()) {
            if (segment[i + 1] == '1') {
                result += '/';
                ++i;
                continue;
            }
            if (segment[i + 1] == '0') {
                result += '~';
                ++i;
                continue;
            }
        }
        result += segment[i];
    }
    return result;
}

}  // namespace

std::vector<std::string> split_pointer(std::string_view path) {
    std::vector<std::string> segments;
    std::size_t start = 0;
    while (start <= path.size()) {
        std::size_t end = path.find('/', start);
        if (end == std::string_view::npos) {
            end = path.size();
        }
        if (end > start) {
            segments.push_back(unescape_segment(path.substr(start, end - start)));
        }
        start = end + 1;
    }
    return segments;
}

// ----------------------------------------------------------------------------
// Фаза 1: проверка
// ----------------------------------------------------------------------------

ValidationResult validate_operation(const Schema& schema, const PatchOperation& op) {
    if (op.kind == OpKind::Unsupported) {
        return ValidationResult::failure(ErrorKind::UnsupportedOperation, op.path,
                                         "unsupported operation '" + op.op + "' for " + op.path);
    }

    if (!op.value) {
        return ValidationResult::failure(ErrorKind::MissingValue, op.path,
                                         "missing value for " + op.path);
    }

    if (op.path.empty() || op.path.front() != '/') {
        return ValidationResult::failure(ErrorKind::UnknownField, op.path,
                                         "path '" + op.path + "' must start with '/'");
    }

    auto segments = split_pointer(op.path);
    if (segments.empty()) {
        return ValidationResult::failure(ErrorKind::UnknownField, op.path,
                                         "path '" + op.path + "' does not name a field");
    }

    if (segments.size() == 1) {
        return schema.validate(segments.front(), *op.value);
    }

    // Вложенный путь: схема знает только поле верхнего уровня
    const Field* field = schema.field_named(segments.front());
    if (field == nullptr) {
        return ValidationResult::failure(ErrorKind::UnknownField, segments.front(),
                                         "unknown field '" + segments.front() + "'");
    }
    if (field->kind() != FieldKind::Object) {
        return ValidationResult::failure(ErrorKind::TypeMismatch, field->id,
                                         "field '" + field->id + "' is " +
                                             to_string(field->kind()) +
                                             " and has no nested keys (path " + op.path + ")");
    }
    if (!is_finite_value(*op.value)) {
        return ValidationResult::failure(ErrorKind::TypeMismatch, field->id,
                                         "non-finite number in " + op.path);
    }
    return ValidationResult::success(*op.value);
}

// ----------------------------------------------------------------------------
// Фаза 2: применение
// ----------------------------------------------------------------------------

namespace {

Value merge_from(const Value& current, const std::vector<std::string>& keys, std::size_t pos,
                 Value value) {
    const std::string& key = keys[pos];
    if (pos + 1 == keys.size()) {
        return current.with(key, std::move(value));
    }

    // Отсутствующий (или не-Composite) промежуточный узел заменяется пустым
    static const Value empty = Value::make_composite();
    const Value* child = current.get(key);
    const Value& base = (child != nullptr && child->is_composite()) ? *child : empty;
    return current.with(key, merge_from(base, keys, pos + 1, std::move(value)));
}

}  // namespace

Value merge_nested(const Value& current, const std::vector<std::string>& keys, Value value) {
    if (keys.empty()) {
        return value;
    }
    return merge_from(current, keys, 0, std::move(value));
}

void apply_operation(DataMap& working, const std::vector<std::string>& segments, Value coerced) {
    const std::string& field_id = segments.front();

    if (segments.size() == 1) {
        working[field_id] = std::move(coerced);
        return;
    }

    std::vector<std::string> keys(segments.begin() + 1, segments.end());
    auto it = working.find(field_id);
    Value current = (it != working.end()) ? it->second : Value::make_composite();
    working[field_id] = merge_nested(current, keys, std::move(coerced));
}

// ----------------------------------------------------------------------------
// Сериализация
// ----------------------------------------------------------------------------

void patch_to_rapidjson(const Patch& operations, rapidjson::Value& out,
                        rapidjson::Document::AllocatorType& alloc) {
    out.SetArray();
    for (const auto& op : operations) {
        rapidjson::Value obj(rapidjson::kObjectType);
        rapidjson::Value op_name;
        op_name.SetString(op.op.c_str(), static_cast<rapidjson::SizeType>(op.op.size()), alloc);
        obj.AddMember("op", op_name, alloc);

        rapidjson::Value path;
        path.SetString(op.path.c_str(), static_cast<rapidjson::SizeType>(op.path.size()), alloc);
        obj.AddMember("path", path, alloc);

        if (op.value) {
            rapidjson::Value v;
            op.value->to_rapidjson(v, alloc);
            obj.AddMember("value", v, alloc);
        }
        out.PushBack(obj, alloc);
    }
}

std::string patch_to_json(const Patch& operations) {
    rapidjson::Document doc;
    patch_to_rapidjson(operations, doc, doc.GetAllocator());

    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    doc.Accept(writer);
    return std::string(buffer.GetString(), buffer.GetSize());
}

}  // namespace duet
