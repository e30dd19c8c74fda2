// ==============================================================================
// duet/audit.hpp - Журнал аудита патчей
// ==============================================================================
//
// Назначение:
// - AuditEntry: одна попытка применения патча и её исход
// - AuditLog: append-only журнал, принадлежащий Document
//
// Записи хранятся в неизменяемом векторе за std::shared_ptr; append создаёт
// новую копию и публикует её через std::atomic_store, поэтому entries()
// безопасно вызывать в любой момент.
//
// ==============================================================================

#ifndef DUET_AUDIT_HPP
#define DUET_AUDIT_HPP

#include <duet/patch.hpp>
#include <duet/value.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace duet {

/// Кто инициировал изменение
enum class Source { User, Llm, System };

/// Преобразовать Source в строку ("user", "llm", "system")
const char* source_to_string(Source source);

/// Разобрать Source из строки
std::optional<Source> parse_source(std::string_view s);

/// Запись журнала. Никогда не изменяется после добавления.
struct AuditEntry {
    std::uint64_t sequence_id = 0;  // с 1, строго возрастает, не переиспользуется
    Timestamp timestamp;
    Patch operations;  // операции в том виде, в каком были поданы
    Source source = Source::User;

    bool succeeded = false;
    std::size_t operations_applied = 0;  // только при succeeded
    std::string reason;                  // только при !succeeded
};

class AuditLog {
public:
    AuditLog();

    /// Добавить запись об исходе патча
    /// @return добавленная запись
    AuditEntry append(Patch operations, Source source, const PatchResult& result);

    /// Снимок всех записей в порядке добавления
    std::vector<AuditEntry> entries() const;

    /// Количество записей
    std::size_t size() const;

    /// Удалить все записи. Нумерация продолжается с прежнего места.
    void clear();

    /// Последний выданный sequence_id (0 если записей ещё не было)
    std::uint64_t last_sequence_id() const { return next_id_ - 1; }

    /// Сериализовать журнал в JSON массив
    std::string to_json(bool pretty = false) const;

private:
    std::shared_ptr<const std::vector<AuditEntry>> entries_;
    std::uint64_t next_id_ = 1;
};

}  // namespace duet

#endif  // DUET_AUDIT_HPP
