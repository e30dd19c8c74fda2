// ==============================================================================
// duet/value.hpp - Значения полей документа (Value)
// ==============================================================================
//
// Назначение:
// - Замкнутый набор типов значений поля: Null, Text, Number, Boolean,
//   Enum, Date, Composite
// - Неизменяемость: любое "изменение" создаёт новое значение
// - Конверсия из/в RapidJSON Value (Date сериализуется как epoch seconds)
//
// ==============================================================================

#ifndef DUET_VALUE_HPP
#define DUET_VALUE_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <rapidjson/document.h>

// GCC 13 generates false positives for -Wnull-dereference when using
// std::get on std::variant at high optimization levels.
// See: https://gcc.gnu.org/bugzilla/show_bug.cgi?id=108842
#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wnull-dereference"
#endif

namespace duet {

class Value;

/// Упорядоченное отображение ключ -> значение (вложенные объекты)
using Composite = std::map<std::string, Value>;

/// Момент времени для Date значений
using Timestamp = std::chrono::system_clock::time_point;

/// Тип значения (для диагностики и switch)
enum class ValueKind { Null, Text, Number, Boolean, Enum, Date, Composite };

/// Преобразовать ValueKind в строку
const char* value_kind_to_string(ValueKind kind);

// ----------------------------------------------------------------------------
// Value
// ----------------------------------------------------------------------------

/// Значение поля документа.
///
/// Null - явная отметка "пусто", отличная от отсутствия поля в документе.
/// Text и Enum оба хранят строку, но являются разными типами: Enum
/// появляется только после приведения к Enum полю (или при загрузке).
class Value {
public:
    struct Null {};

    /// Обёртка для enum-значения (отличает его от Text)
    struct EnumValue {
        std::string option;
    };

private:
    std::variant<Null, std::string, double, bool, EnumValue, Timestamp,
                 std::shared_ptr<const Composite>>
        data_;

public:
    // -------------------------------------------------------------------------
    // Конструкторы
    // -------------------------------------------------------------------------

    /// Создать Null значение
    Value() : data_(Null{}) {}

    /// Создать Boolean значение
    explicit Value(bool v) : data_(v) {}

    /// Создать Number значение
    explicit Value(double v) : data_(v) {}

    /// Создать Number значение из целого
    explicit Value(int v) : data_(static_cast<double>(v)) {}

    /// Создать Text значение
    explicit Value(std::string v) : data_(std::move(v)) {}

    /// Создать Text значение из C-строки
    explicit Value(const char* v) : data_(std::string(v)) {}

    /// Создать Date значение
    explicit Value(Timestamp v) : data_(v) {}

    /// Создать Composite значение
    explicit Value(Composite v) : data_(std::make_shared<const Composite>(std::move(v))) {}

    // -------------------------------------------------------------------------
    // Статические фабричные методы
    // -------------------------------------------------------------------------

    static Value make_null() { return Value(); }
    static Value make_text(std::string v) { return Value(std::move(v)); }
    static Value make_number(double v) { return Value(v); }
    static Value make_bool(bool v) { return Value(v); }
    static Value make_date(Timestamp v) { return Value(v); }
    static Value make_composite(Composite v = {}) { return Value(std::move(v)); }

    /// Создать Enum значение
    static Value make_enum(std::string option) {
        Value v;
        v.data_ = EnumValue{std::move(option)};
        return v;
    }

    // -------------------------------------------------------------------------
    // Проверка типа
    // -------------------------------------------------------------------------

    ValueKind kind() const;

    bool is_null() const { return std::holds_alternative<Null>(data_); }
    bool is_text() const { return std::holds_alternative<std::string>(data_); }
    bool is_number() const { return std::holds_alternative<double>(data_); }
    bool is_bool() const { return std::holds_alternative<bool>(data_); }
    bool is_enum() const { return std::holds_alternative<EnumValue>(data_); }
    bool is_date() const { return std::holds_alternative<Timestamp>(data_); }
    bool is_composite() const {
        return std::holds_alternative<std::shared_ptr<const Composite>>(data_);
    }

    // -------------------------------------------------------------------------
    // Доступ к значению (undefined behavior если тип не совпадает)
    // -------------------------------------------------------------------------

    const std::string& as_text() const { return std::get<std::string>(data_); }
    double as_number() const { return std::get<double>(data_); }
    bool as_bool() const { return std::get<bool>(data_); }
    const std::string& as_enum() const { return std::get<EnumValue>(data_).option; }
    Timestamp as_date() const { return std::get<Timestamp>(data_); }
    const Composite& as_composite() const {
        return *std::get<std::shared_ptr<const Composite>>(data_);
    }

    // -------------------------------------------------------------------------
    // Безопасный доступ (nullptr если тип не совпадает)
    // -------------------------------------------------------------------------

    const std::string* get_text() const { return std::get_if<std::string>(&data_); }
    const double* get_number() const { return std::get_if<double>(&data_); }
    const bool* get_bool() const { return std::get_if<bool>(&data_); }

    const std::string* get_enum() const {
        auto* ptr = std::get_if<EnumValue>(&data_);
        return ptr ? &ptr->option : nullptr;
    }

    const Timestamp* get_date() const { return std::get_if<Timestamp>(&data_); }

    const Composite* get_composite() const {
        auto* ptr = std::get_if<std::shared_ptr<const Composite>>(&data_);
        return ptr ? ptr->get() : nullptr;
    }

    /// Строковое содержимое Text или Enum (nullptr для остальных типов)
    const std::string* get_string_like() const;

    // -------------------------------------------------------------------------
    // Операции с Composite
    // -------------------------------------------------------------------------

    /// Получить вложенное значение по ключу (nullptr если нет или не Composite)
    const Value* get(const std::string& key) const;

    /// Проверить наличие ключа
    bool has(const std::string& key) const { return get(key) != nullptr; }

    /// Количество ключей (0 если не Composite)
    std::size_t size() const;

    /// Вернуть копию Composite с установленным ключом.
    /// Остальные ключи разделяются с исходным значением.
    /// Если значение не Composite, результат строится от пустого Composite.
    Value with(const std::string& key, Value v) const;

    // -------------------------------------------------------------------------
    // Сравнение
    // -------------------------------------------------------------------------

    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }

    // -------------------------------------------------------------------------
    // Конверсия из/в RapidJSON
    // -------------------------------------------------------------------------

    /// Конвертировать из RapidJSON Value.
    /// Числа -> Number, строки -> Text, объекты -> Composite.
    /// @throw std::invalid_argument для массивов (нет соответствующего типа)
    static Value from_rapidjson(const rapidjson::Value& json);

    /// Конвертировать в RapidJSON Value (Date -> epoch seconds)
    /// @throw std::runtime_error для не-конечных чисел
    void to_rapidjson(rapidjson::Value& out, rapidjson::Document::AllocatorType& alloc) const;

    /// Создать новый RapidJSON Document из этого Value
    rapidjson::Document to_rapidjson_document() const;

    /// Компактная JSON строка
    std::string to_json() const;

    /// Человекочитаемое представление (для describe/context/таблиц).
    /// Text и Enum без кавычек, Date в ISO 8601 UTC, Composite как JSON.
    std::string to_display_string() const;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// Date -> секунды с начала эпохи (дробные)
double to_epoch_seconds(Timestamp t);

/// Секунды с начала эпохи -> Date.
/// nullopt, если число не конечно или не помещается в Timestamp::duration.
std::optional<Timestamp> try_from_epoch_seconds(double seconds);

/// Секунды с начала эпохи -> Date.
/// Бросает std::out_of_range для значений вне диапазона Timestamp.
Timestamp from_epoch_seconds(double seconds);

/// true, если Value (включая вложенные Composite) не содержит NaN и бесконечностей
bool is_finite_value(const Value& value);

/// Форматировать Date как "YYYY-MM-DDTHH:MM:SSZ"
std::string format_timestamp(Timestamp t);

/// Форматировать число без лишних нулей: 5000 -> "5000", 12.5 -> "12.5"
std::string format_number(double v);

}  // namespace duet

#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic pop
#endif

#endif  // DUET_VALUE_HPP
