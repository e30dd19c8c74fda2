// ==============================================================================
// duet/patch.hpp - Патч-операции и движок применения
// ==============================================================================
//
// Назначение:
// - PatchOperation: {op, path, value} в духе RFC 6902, только replace/add
// - Разбор JSON Pointer путей ("/field/nested/key")
// - Проверка операции против схемы (фаза 1, без мутаций)
// - Рекурсивное слияние во вложенный Composite (фаза 2)
// - Разбор текста агента в список операций (три допустимых формата)
//
// Сам двухфазный алгоритм (validate-then-commit) живёт в Document::apply_patch.
//
// ==============================================================================

#ifndef DUET_PATCH_HPP
#define DUET_PATCH_HPP

#include <duet/schema.hpp>
#include <duet/value.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace duet {

// ============================================================================
// PatchOperation
// ============================================================================

/// Вид операции. Unsupported хранит любую другую строку op,
/// чтобы фаза 1 отвергла её, а журнал аудита воспроизвёл исходный патч.
enum class OpKind { Replace, Add, Unsupported };

/// Разобрать вид операции ("replace" / "add"; всё остальное Unsupported)
OpKind parse_op_kind(std::string_view s);

/// Одна операция патча
struct PatchOperation {
    OpKind kind = OpKind::Replace;
    std::string op;              // исходная строка op ("replace", "add", "remove", ...)
    std::string path;            // "/field" или "/field/nested/..."
    std::optional<Value> value;  // nullopt - значение отсутствует

    static PatchOperation replace(std::string path, Value value);
    static PatchOperation add(std::string path, Value value);

    /// Операция с произвольной строкой op (без значения, если не задано)
    static PatchOperation make(std::string op, std::string path,
                               std::optional<Value> value = std::nullopt);

    bool operator==(const PatchOperation& other) const;
    bool operator!=(const PatchOperation& other) const { return !(*this == other); }
};

/// Патч - упорядоченный список операций, применяемый атомарно
using Patch = std::vector<PatchOperation>;

// ============================================================================
// PatchResult
// ============================================================================

/// Результат применения патча.
/// При неудаче operations_applied всегда 0: частичного применения не бывает.
struct PatchResult {
    bool success = false;
    std::size_t operations_applied = 0;
    std::optional<std::string> error;       // ValidationError::format()
    std::optional<ErrorKind> error_kind;

    explicit operator bool() const { return success; }

    static PatchResult succeeded(std::size_t applied);
    static PatchResult failed(const ValidationError& error);
};

// ============================================================================
// JSON Pointer
// ============================================================================

/// Разбить путь на сегменты: "/a/b" -> {"a", "b"}.
/// Пустые сегменты пропускаются; "~1" -> "/", "~0" -> "~".
std::vector<std::string> split_pointer(std::string_view path);

// ============================================================================
// Фаза 1: проверка
// ============================================================================

/// Проверить одну операцию против схемы. Ничего не изменяет.
///
/// - UnsupportedOperation если kind не Replace/Add
/// - MissingValue если значение отсутствует
/// - UnknownField если путь пуст или первый сегмент не объявлен
/// - путь из одного сегмента: Schema::validate(field, value)
/// - путь глубже: поле должно иметь тип Object, значение не проверяется
///
/// @return приведённое значение при успехе
ValidationResult validate_operation(const Schema& schema, const PatchOperation& op);

// ============================================================================
// Фаза 2: применение
// ============================================================================

/// Установить значение по вложенному пути внутри Composite.
/// Промежуточные Composite создаются при отсутствии (или если там не Composite),
/// соседние ключи на каждом уровне сохраняются.
///
/// @param current текущее значение поля (любого типа)
/// @param keys сегменты пути после id поля (не пустой)
/// @return новое значение поля
Value merge_nested(const Value& current, const std::vector<std::string>& keys, Value value);

/// Применить уже проверенную операцию к рабочей копии данных
/// @param segments результат split_pointer(op.path), не пустой
void apply_operation(DataMap& working, const std::vector<std::string>& segments, Value coerced);

// ============================================================================
// Разбор текста агента
// ============================================================================

/// Результат разбора текста в патч
struct PatchParseResult {
    bool ok = false;
    Patch operations;
    std::string error;

    explicit operator bool() const { return ok; }
};

/// Разобрать текст в список операций. Форматы пробуются по порядку:
/// 1. массив операций [{"op", "path", "value"}, ...]
/// 2. объект {"patch": [...]}
/// 3. legacy объект {"edits": [{"field", "value"}, ...]} -> replace "/field"
/// Если текст целиком не JSON, пробуется первый блок ```json ... ``` и затем
/// внешний фрагмент [...] / {...}.
///
/// @param schema если задана, число для Date поля декодируется как epoch seconds
PatchParseResult parse_patch_text(std::string_view text, const Schema* schema = nullptr);

/// Записать операции как JSON массив в RapidJSON Value
void patch_to_rapidjson(const Patch& operations, rapidjson::Value& out,
                        rapidjson::Document::AllocatorType& alloc);

/// Сериализовать операции в компактную JSON строку (формат патча)
std::string patch_to_json(const Patch& operations);

}  // namespace duet

#endif  // DUET_PATCH_HPP
