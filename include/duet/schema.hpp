// ==============================================================================
// duet/schema.hpp - Схема документа: поля, типы, ограничения, валидация
// ==============================================================================
//
// Назначение:
// - FieldType (variant) и Field - объявление типизированного поля
// - Schema - упорядоченный неизменяемый набор полей
// - Таблица приведения значений к типу поля (coerce)
// - ValidationError / ValidationResult - типизированный результат проверки
//
// Schema неизменяема после конструирования и разделяется документами
// через std::shared_ptr<const Schema>.
//
// ==============================================================================

#ifndef DUET_SCHEMA_HPP
#define DUET_SCHEMA_HPP

#include <duet/value.hpp>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace duet {

/// Текущие значения документа: id поля -> значение
using DataMap = std::map<std::string, Value>;

// ============================================================================
// Field types
// ============================================================================

enum class FieldKind { Text, Number, Boolean, Enum, Date, Object };

struct TextType {};

/// Число с необязательными включительными границами
struct NumberType {
    std::optional<double> min;
    std::optional<double> max;
};

struct BooleanType {};

/// Перечисление; options упорядочены и не пусты
struct EnumType {
    std::vector<std::string> options;
};

struct DateType {};

/// Вложенный объект (Composite); единственный тип, допускающий вложенные пути
struct ObjectType {};

using FieldType = std::variant<TextType, NumberType, BooleanType, EnumType, DateType, ObjectType>;

/// Получить FieldKind для FieldType
FieldKind field_kind(const FieldType& type);

/// Преобразовать FieldKind в строку ("text", "number", ...)
std::string to_string(FieldKind kind);

/// Разобрать FieldKind из строки (nullopt если не распознан)
std::optional<FieldKind> parse_field_kind(std::string_view s);

// ============================================================================
// Field
// ============================================================================

/// Объявление поля схемы
struct Field {
    std::string id;                      // уникален в пределах Schema
    std::string label;                   // только для отображения
    FieldType type;                      // фиксирован при создании схемы
    std::optional<Value> default_value;  // проверяется при создании схемы
    bool required = false;

    FieldKind kind() const { return field_kind(type); }

    static Field text(std::string id, std::string label,
                      std::optional<std::string> default_value = std::nullopt,
                      bool required = false);

    static Field number(std::string id, std::string label,
                        std::optional<double> default_value = std::nullopt,
                        std::optional<double> min = std::nullopt,
                        std::optional<double> max = std::nullopt, bool required = false);

    static Field boolean(std::string id, std::string label,
                         std::optional<bool> default_value = std::nullopt, bool required = false);

    static Field enumeration(std::string id, std::string label, std::vector<std::string> options,
                             std::optional<std::string> default_value = std::nullopt,
                             bool required = false);

    static Field date(std::string id, std::string label,
                      std::optional<Timestamp> default_value = std::nullopt,
                      bool required = false);

    static Field object(std::string id, std::string label,
                        std::optional<Composite> default_value = std::nullopt,
                        bool required = false);
};

// ============================================================================
// Errors
// ============================================================================

/// Таксономия ошибок проверки и применения патчей
enum class ErrorKind {
    UnknownField,          // поле не объявлено схемой
    TypeMismatch,          // значение не приводится к типу поля
    OutOfRange,            // нарушена числовая граница
    InvalidOption,         // значение не входит в options
    UnsupportedOperation,  // op не replace/add
    MissingValue,          // операция без значения
    MalformedInput         // текст не соответствует ни одному формату
};

/// Преобразовать ErrorKind в строку ("UnknownField", ...)
const char* error_kind_to_string(ErrorKind kind);

/// Ошибка проверки
struct ValidationError {
    ErrorKind kind = ErrorKind::TypeMismatch;
    std::string field;    // id поля (или путь), может быть пустым
    std::string message;  // человекочитаемое описание

    /// Форматировать ошибку: "<Kind>: <message>"
    std::string format() const;
};

/// Результат проверки: приведённое значение или ошибка
struct ValidationResult {
    bool ok = false;
    Value value;  // приведённое значение (только при ok)
    ValidationError error;

    explicit operator bool() const { return ok; }

    static ValidationResult success(Value v);
    static ValidationResult failure(ErrorKind kind, std::string field, std::string message);
};

/// Ошибка конструирования схемы (дубликат id, неверный default, ...)
class SchemaError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// ============================================================================
// Coercion
// ============================================================================

/// Привести значение к типу поля по фиксированной таблице.
/// Никогда не бросает: nullopt означает TypeMismatch.
/// Null не обрабатывается здесь (см. Schema::validate).
std::optional<Value> coerce(const FieldType& type, const Value& candidate);

// ============================================================================
// Schema
// ============================================================================

class Schema {
public:
    /// Создать схему
    /// @throw SchemaError при дубликатах id, пустом id, пустых options,
    ///        min > max или default, не проходящем собственную проверку
    Schema(std::string name, std::vector<Field> fields);

    const std::string& name() const { return name_; }
    const std::vector<Field>& fields() const { return fields_; }

    /// Найти поле по id (nullptr если не объявлено)
    const Field* field_named(std::string_view id) const;

    /// Значения по умолчанию; поля без default отсутствуют в результате
    DataMap default_values() const;

    /// Человекочитаемое описание полей и ограничений (для промпта агента)
    std::string describe() const;

    /// Проверить значение для поля:
    /// 1. UnknownField если поле не объявлено
    /// 2. приведение к типу (TypeMismatch при неудаче)
    /// 3. OutOfRange для Number вне [min, max]
    /// 4. InvalidOption для Enum вне options
    ValidationResult validate(std::string_view field_id, const Value& candidate) const;

private:
    std::string name_;
    std::vector<Field> fields_;
    std::unordered_map<std::string, std::size_t> index_;
};

}  // namespace duet

#endif  // DUET_SCHEMA_HPP
