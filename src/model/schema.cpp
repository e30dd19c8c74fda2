// ==============================================================================
// schema.cpp - Схема документа и валидация значений
// ==============================================================================

#include "duet/schema.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <sstream>

namespace duet {

// ----------------------------------------------------------------------------
// FieldKind
// ----------------------------------------------------------------------------

FieldKind field_kind(const FieldType& type) {
    switch (type.index()) {
    case 0:
        return FieldKind::Text;
    case 1:
        return FieldKind::Number;
    case 2:
        return FieldKind::Boolean;
    case 3:
        return FieldKind::Enum;
    case 4:
        return FieldKind::Date;
    default:
        return FieldKind::Object;
    }
}

std::string to_string(FieldKind kind) {
    switch (kind) {
    case FieldKind::Text:
        return "text";
    case FieldKind::Number:
        return "number";
    case FieldKind::Boolean:
        return "boolean";
    case FieldKind::Enum:
        return "enum";
    case FieldKind::Date:
        return "date";
    case FieldKind::Object:
        return "object";
    }
    return "unknown";
}

std::optional<FieldKind> parse_field_kind(std::string_view s) {
    if (s == "text" || s == "string") {
        return FieldKind::Text;
    }
    if (s == "number") {
        return FieldKind::Number;
    }
    if (s == "boolean" || s == "bool") {
        return FieldKind::Boolean;
    }
    if (s == "enum") {
        return FieldKind::Enum;
    }
    if (s == "date") {
        return FieldKind::Date;
    }
    if (s == "object") {
        return FieldKind::Object;
    }
    return std::nullopt;
}

// ----------------------------------------------------------------------------
// Field factories
// ----------------------------------------------------------------------------

Field Field::text(std::string id, std::string label, std::optional<std::string> default_value,
                  bool required) {
    Field f{std::move(id), std::move(label), TextType{}, std::nullopt, required};
    if (default_value) {
        f.default_value = Value(std::move(*default_value));
    }
    return f;
}

Field Field::number(std::string id, std::string label, std::optional<double> default_value,
                    std::optional<double> min, std::optional<double> max, bool required) {
    Field f{std::move(id), std::move(label), NumberType{min, max}, std::nullopt, required};
    if (default_value) {
        f.default_value = Value(*default_value);
    }
    return f;
}

Field Field::boolean(std::string id, std::string label, std::optional<bool> default_value,
                     bool required) {
    Field f{std::move(id), std::move(label), BooleanType{}, std::nullopt, required};
    if (default_value) {
        f.default_value = Value(*default_value);
    }
    return f;
}

Field Field::enumeration(std::string id, std::string label, std::vector<std::string> options,
                         std::optional<std::string> default_value, bool required) {
    Field f{std::move(id), std::move(label), EnumType{std::move(options)}, std::nullopt, required};
    if (default_value) {
        f.default_value = Value::make_enum(std::move(*default_value));
    }
    return f;
}

Field Field::date(std::string id, std::string label, std::optional<Timestamp> default_value,
                  bool required) {
    Field f{std::move(id), std::move(label), DateType{}, std::nullopt, required};
    if (default_value) {
        f.default_value = Value(*default_value);
    }
    return f;
}

Field Field::object(std::string id, std::string label, std::optional<Composite> default_value,
                    bool required) {
    Field f{std::move(id), std::move(label), ObjectType{}, std::nullopt, required};
    if (default_value) {
        f.default_value = Value(std::move(*default_value));
    }
    return f;
}

// ----------------------------------------------------------------------------
// Errors
// ----------------------------------------------------------------------------

const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::UnknownField:
        return "UnknownField";
    case ErrorKind::TypeMismatch:
        return "TypeMismatch";
    case ErrorKind::OutOfRange:
        return "OutOfRange";
    case ErrorKind::InvalidOption:
        return "InvalidOption";
    case ErrorKind::UnsupportedOperation:
        return "UnsupportedOperation";
    case ErrorKind::MissingValue:
        return "MissingValue";
    case ErrorKind::MalformedInput:
        return "MalformedInput";
    }
    return "Unknown";
}

std::string ValidationError::format() const {
    return std::string(error_kind_to_string(kind)) + ": " + message;
}

ValidationResult ValidationResult::success(Value v) {
    ValidationResult r;
    r.ok = true;
    r.value = std::move(v);
    return r;
}

ValidationResult ValidationResult::failure(ErrorKind kind, std::string field,
                                           std::string message) {
    ValidationResult r;
    r.ok = false;
    r.error.kind = kind;
    r.error.field = std::move(field);
    r.error.message = std::move(message);
    return r;
}

// ----------------------------------------------------------------------------
// Coercion
// ----------------------------------------------------------------------------

namespace {

/// Разобрать строку как конечное число; вся строка (без пробелов по краям)
/// должна быть числом
std::optional<double> parse_number_text(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return std::nullopt;
    }
    auto end = s.find_last_not_of(" \t\r\n");
    std::string trimmed = s.substr(begin, end - begin + 1);

    errno = 0;
    char* parse_end = nullptr;
    double v = std::strtod(trimmed.c_str(), &parse_end);
    if (errno == ERANGE || parse_end != trimmed.c_str() + trimmed.size()) {
        return std::nullopt;
    }
    if (!std::isfinite(v)) {
        return std::nullopt;
    }
    return v;
}

}  // namespace

std::optional<Value> coerce(const FieldType& type, const Value& candidate) {
    switch (field_kind(type)) {
    case FieldKind::Text:
        if (const auto* s = candidate.get_string_like()) {
            return Value(*s);
        }
        return std::nullopt;

    case FieldKind::Number:
        if (const auto* d = candidate.get_number()) {
            if (!std::isfinite(*d)) {
                return std::nullopt;
            }
            return candidate;
        }
        if (const auto* s = candidate.get_text()) {
            if (auto parsed = parse_number_text(*s)) {
                return Value(*parsed);
            }
        }
        return std::nullopt;

    case FieldKind::Boolean:
        if (candidate.is_bool()) {
            return candidate;
        }
        return std::nullopt;

    case FieldKind::Enum:
        if (const auto* s = candidate.get_string_like()) {
            return Value::make_enum(*s);
        }
        return std::nullopt;

    case FieldKind::Date:
        if (candidate.is_date()) {
            return candidate;
        }
        return std::nullopt;

    case FieldKind::Object:
        // Composite с NaN или бесконечностью нельзя сохранить в JSON
        if (candidate.is_composite() && is_finite_value(candidate)) {
            return candidate;
        }
        return std::nullopt;
    }
    return std::nullopt;
}

// ----------------------------------------------------------------------------
// Schema
// ----------------------------------------------------------------------------

Schema::Schema(std::string name, std::vector<Field> fields)
    : name_(std::move(name)), fields_(std::move(fields)) {
    for (std::size_t i = 0; i < fields_.size(); ++i) {
        const auto& field = fields_[i];

        if (field.id.empty()) {
            throw SchemaError("schema '" + name_ + "': field id must not be empty");
        }
        if (!index_.emplace(field.id, i).second) {
            throw SchemaError("schema '" + name_ + "': duplicate field id '" + field.id + "'");
        }

        if (const auto* num = std::get_if<NumberType>(&field.type)) {
            if (num->min && num->max && *num->min > *num->max) {
                throw SchemaError("schema '" + name_ + "': field '" + field.id +
                                  "' has min greater than max");
            }
        }
        if (const auto* en = std::get_if<EnumType>(&field.type)) {
            if (en->options.empty()) {
                throw SchemaError("schema '" + name_ + "': enum field '" + field.id +
                                  "' has no options");
            }
        }
    }

    // Default проверяется только после построения индекса: validate() ищет поле по id
    for (const auto& field : fields_) {
        if (!field.default_value) {
            continue;
        }
        auto result = validate(field.id, *field.default_value);
        if (!result) {
            throw SchemaError("schema '" + name_ + "': invalid default for field '" + field.id +
                              "': " + result.error.format());
        }
    }
}

const Field* Schema::field_named(std::string_view id) const {
    auto it = index_.find(std::string(id));
    if (it == index_.end()) {
        return nullptr;
    }
    return &fields_[it->second];
}

DataMap Schema::default_values() const {
    DataMap result;
    for (const auto& field : fields_) {
        if (field.default_value) {
            // Приводим default так же, как пользовательское значение
            auto coerced = validate(field.id, *field.default_value);
            result[field.id] = coerced ? coerced.value : *field.default_value;
        }
    }
    return result;
}

std::string Schema::describe() const {
    std::ostringstream out;
    out << "Schema: " << name_ << "\n";
    out << "Fields:\n";

    for (const auto& field : fields_) {
        out << "- " << field.id;
        if (!field.label.empty() && field.label != field.id) {
            out << " (" << field.label << ")";
        }
        out << ": " << to_string(field.kind());

        if (const auto* num = std::get_if<NumberType>(&field.type)) {
            if (num->min) {
                out << ", min " << format_number(*num->min);
            }
            if (num->max) {
                out << ", max " << format_number(*num->max);
            }
        } else if (const auto* en = std::get_if<EnumType>(&field.type)) {
            out << ", one of [";
            for (std::size_t i = 0; i < en->options.size(); ++i) {
                if (i > 0) {
                    out << ", ";
                }
                out << en->options[i];
            }
            out << "]";
        } else if (field.kind() == FieldKind::Date) {
            out << " (epoch seconds)";
        } else if (field.kind() == FieldKind::Object) {
            out << " (nested keys addressable as /" << field.id << "/<key>)";
        }

        if (field.default_value) {
            out << ", default " << field.default_value->to_display_string();
        }
        if (field.required) {
            out << ", required";
        }
        out << "\n";
    }

    return out.str();
}

ValidationResult Schema::validate(std::string_view field_id, const Value& candidate) const {
    const Field* field = field_named(field_id);
    if (field == nullptr) {
        return ValidationResult::failure(ErrorKind::UnknownField, std::string(field_id),
                                         "unknown field '" + std::string(field_id) + "'");
    }

    // Null очищает необязательное поле
    if (candidate.is_null()) {
        if (field->required) {
            return ValidationResult::failure(ErrorKind::TypeMismatch, field->id,
                                             "field '" + field->id +
                                                 "' is required and cannot be null");
        }
        return ValidationResult::success(Value());
    }

    auto coerced = coerce(field->type, candidate);
    if (!coerced) {
        return ValidationResult::failure(
            ErrorKind::TypeMismatch, field->id,
            "field '" + field->id + "' expects " + to_string(field->kind()) + ", got " +
                value_kind_to_string(candidate.kind()));
    }

    if (const auto* num = std::get_if<NumberType>(&field->type)) {
        double v = coerced->as_number();
        if (num->min && v < *num->min) {
            return ValidationResult::failure(ErrorKind::OutOfRange, field->id,
                                             "field '" + field->id + "' must be >= " +
                                                 format_number(*num->min) + " (got " +
                                                 format_number(v) + ")");
        }
        if (num->max && v > *num->max) {
            return ValidationResult::failure(ErrorKind::OutOfRange, field->id,
                                             "field '" + field->id + "' must be <= " +
                                                 format_number(*num->max) + " (got " +
                                                 format_number(v) + ")");
        }
    }

    if (const auto* en = std::get_if<EnumType>(&field->type)) {
        const auto& option = coerced->as_enum();
        if (std::find(en->options.begin(), en->options.end(), option) == en->options.end()) {
            std::string options;
            for (std::size_t i = 0; i < en->options.size(); ++i) {
                if (i > 0) {
                    options += ", ";
                }
                options += en->options[i];
            }
            return ValidationResult::failure(ErrorKind::InvalidOption, field->id,
                                             "field '" + field->id + "' must be one of [" +
                                                 options + "] (got '" + option + "')");
        }
    }

    return ValidationResult::success(std::move(*coerced));
}

}  // namespace duet
