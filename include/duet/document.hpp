// ==============================================================================
// duet/document.hpp - Документ, управляемый схемой
// ==============================================================================
//
// Назначение:
// - Document: текущие значения полей одной схемы + журнал аудита
// - Одиночные правки (edit / try_edit) и атомарные патчи (apply_patch)
// - Приём патчей из текста агента (apply_from_text)
// - Сохранение через Storage после каждого коммита
// - Уведомления подписчиков (update_counter + subscribe)
//
// Модель владения:
// - Schema разделяется многими документами (shared_ptr<const Schema>)
// - data хранится как shared_ptr<const DataMap> и заменяется целиком через
//   std::atomic_store, поэтому snapshot() никогда не видит половину патча
// - Один писатель: параллельные мутации сериализует вызывающий код
//
// ==============================================================================

#ifndef DUET_DOCUMENT_HPP
#define DUET_DOCUMENT_HPP

#include <duet/audit.hpp>
#include <duet/patch.hpp>
#include <duet/schema.hpp>
#include <duet/storage.hpp>
#include <duet/value.hpp>
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace duet {

// ----------------------------------------------------------------------------
// DocumentError
// ----------------------------------------------------------------------------

/// Исключение бросающих вариантов (edit, apply_patch_or_throw, apply_edits)
class DocumentError : public std::runtime_error {
public:
    explicit DocumentError(ValidationError error);

    const ValidationError& error() const { return error_; }

private:
    ValidationError error_;
};

/// Устаревшая форма правки: {field, value} -> replace "/field"
struct Edit {
    std::string field;
    Value value;
};

// ----------------------------------------------------------------------------
// Document
// ----------------------------------------------------------------------------

class Document {
public:
    /// Подписчик; получает новое значение update_counter
    using Observer = std::function<void(std::uint64_t)>;

    /// Создать документ. Если хранилище содержит снимок под storage_key,
    /// он загружается; иначе используются значения по умолчанию схемы.
    /// @throw std::invalid_argument если schema == nullptr
    Document(std::shared_ptr<const Schema> schema, std::string storage_key,
             std::shared_ptr<Storage> storage = nullptr);

    Document(const Document&) = delete;
    Document& operator=(const Document&) = delete;

    const Schema& schema() const { return *schema_; }
    const std::shared_ptr<const Schema>& schema_ptr() const { return schema_; }
    const std::string& storage_key() const { return storage_key_; }

    // -------------------------------------------------------------------------
    // Чтение
    // -------------------------------------------------------------------------

    /// Неизменяемый снимок текущих данных
    std::shared_ptr<const DataMap> snapshot() const;

    /// Значение поля (nullopt если поле не установлено)
    std::optional<Value> get(std::string_view field_id) const;

    /// Text/Enum значение или "" для прочих
    std::string get_string(std::string_view field_id) const;

    /// Number значение или 0
    double get_number(std::string_view field_id) const;

    /// Boolean значение или false
    bool get_bool(std::string_view field_id) const;

    /// Обязательные поля, которые отсутствуют или равны Null (в порядке схемы)
    std::vector<std::string> missing_required() const;

    /// Ошибка последней неудачной мутации; сбрасывается успешной
    const std::optional<ValidationError>& last_error() const { return last_error_; }

    /// Счётчик коммитов (ровно +1 на каждую успешную мутацию)
    std::uint64_t update_counter() const { return update_counter_.load(); }

    /// Удалась ли последняя запись в хранилище
    bool last_save_ok() const { return last_save_ok_; }

    // -------------------------------------------------------------------------
    // Одиночные правки (source = user)
    // -------------------------------------------------------------------------

    /// Установить одно поле
    /// @throw DocumentError если значение не прошло проверку
    void edit(const std::string& field_id, Value value);

    /// То же, что edit, но без исключения; ошибка доступна через last_error()
    bool try_edit(const std::string& field_id, Value value);

    /// Применить набор правок одним патчем (source = user)
    /// @throw DocumentError при любой ошибке; данные не изменяются
    void apply_edits(const std::vector<Edit>& edits);

    // -------------------------------------------------------------------------
    // Патчи
    // -------------------------------------------------------------------------

    /// Двухфазное применение: сначала проверка всех операций, затем
    /// применение к рабочей копии и атомарная замена данных.
    /// При любой ошибке данные не изменяются.
    PatchResult apply_patch(Patch operations, Source source = Source::Llm);

    /// Бросающий вариант apply_patch
    /// @return количество применённых операций
    /// @throw DocumentError при ошибке
    std::size_t apply_patch_or_throw(Patch operations, Source source = Source::Llm);

    /// Разобрать текст агента и применить патч.
    /// Неразобранный текст даёт MalformedInput и запись аудита без операций.
    PatchResult apply_from_text(std::string_view text, Source source = Source::Llm);

    /// Удалить снимок из хранилища и вернуть значения по умолчанию (source = system)
    void reset();

    // -------------------------------------------------------------------------
    // Недавно изменённые поля (подсветка в интерфейсе)
    // -------------------------------------------------------------------------

    bool was_recently_updated(const std::string& field_id) const;
    void clear_recently_updated(const std::string& field_id);
    void clear_all_recently_updated();
    const std::set<std::string>& recently_updated() const { return recently_updated_; }

    std::uint64_t highlight_trigger() const { return highlight_trigger_; }
    void trigger_highlights() { ++highlight_trigger_; }

    // -------------------------------------------------------------------------
    // Журнал аудита
    // -------------------------------------------------------------------------

    std::vector<AuditEntry> history() const { return audit_.entries(); }
    void clear_history() { audit_.clear(); }
    const AuditLog& audit_log() const { return audit_; }

    // -------------------------------------------------------------------------
    // Экспорт и подписки
    // -------------------------------------------------------------------------

    /// Данные как pretty JSON (Date как epoch seconds)
    std::string export_json() const;

    /// Подписаться на коммиты
    /// @return id подписки для unsubscribe
    std::size_t subscribe(Observer observer);

    /// Отписаться (неизвестный id игнорируется)
    void unsubscribe(std::size_t id);

private:
    PatchResult reject(Patch operations, Source source, ValidationError error);
    void commit(DataMap working, std::set<std::string> touched);
    void persist();
    void notify();

    std::shared_ptr<const Schema> schema_;
    std::string storage_key_;
    std::shared_ptr<Storage> storage_;

    std::shared_ptr<const DataMap> data_;
    DataMap retained_;  // ключи снимка вне схемы, переписываются при сохранении

    std::optional<ValidationError> last_error_;
    std::atomic<std::uint64_t> update_counter_{0};
    bool last_save_ok_ = true;

    std::set<std::string> recently_updated_;
    std::uint64_t highlight_trigger_ = 0;

    AuditLog audit_;

    std::map<std::size_t, Observer> observers_;
    std::size_t next_observer_id_ = 1;
};

/// Построить JSON Pointer для id поля ("/" и "~" экранируются)
std::string pointer_for_field(std::string_view field_id);

}  // namespace duet

#endif  // DUET_DOCUMENT_HPP
