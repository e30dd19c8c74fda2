// ==============================================================================
// duet/storage.hpp - Хранилище снимков документа
// ==============================================================================
//
// Назначение:
// - Storage: абстрактный key -> text интерфейс (save / load / remove)
// - MemoryStorage: in-memory реализация (тесты, одноразовые сессии)
// - FileStorage: один файл <dir>/<key>.json на ключ, запись через temp + rename
// - Кодек снимка: DataMap <-> JSON объект (Date как epoch seconds)
//
// ==============================================================================

#ifndef DUET_STORAGE_HPP
#define DUET_STORAGE_HPP

#include <duet/schema.hpp>
#include <duet/value.hpp>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace duet {

// ----------------------------------------------------------------------------
// Storage
// ----------------------------------------------------------------------------

/// Абстрактное хранилище. Ошибки записи не бросают исключений:
/// сохранение best-effort, результат возвращается как bool.
class Storage {
public:
    virtual ~Storage() = default;

    /// Сохранить текст под ключом
    /// @return false если запись не удалась
    virtual bool save(const std::string& key, std::string_view text) = 0;

    /// Загрузить текст по ключу (nullopt если ключа нет)
    virtual std::optional<std::string> load(const std::string& key) const = 0;

    /// Удалить ключ (отсутствующий ключ не ошибка)
    virtual void remove(const std::string& key) = 0;
};

/// Хранилище в памяти процесса
class MemoryStorage : public Storage {
public:
    bool save(const std::string& key, std::string_view text) override;
    std::optional<std::string> load(const std::string& key) const override;
    void remove(const std::string& key) override;

    /// Количество успешных save() (для проверки «не сохранять при ошибке»)
    std::size_t save_count() const { return save_count_; }

    bool contains(const std::string& key) const { return values_.count(key) > 0; }

private:
    std::map<std::string, std::string> values_;
    std::size_t save_count_ = 0;
};

/// Файловое хранилище: <directory>/<key>.json
class FileStorage : public Storage {
public:
    explicit FileStorage(std::filesystem::path directory);

    bool save(const std::string& key, std::string_view text) override;
    std::optional<std::string> load(const std::string& key) const override;
    void remove(const std::string& key) override;

    const std::filesystem::path& directory() const { return directory_; }

    /// Путь файла для ключа
    std::filesystem::path path_for(const std::string& key) const;

private:
    std::filesystem::path directory_;
};

// ----------------------------------------------------------------------------
// Кодек снимка
// ----------------------------------------------------------------------------

/// Результат декодирования снимка
struct DecodeResult {
    bool ok = false;
    DataMap data;      // значения, прошедшие проверку схемы
    DataMap retained;  // ключи вне схемы или не прошедшие проверку
    std::string error;

    explicit operator bool() const { return ok; }
};

/// Закодировать данные как JSON объект.
/// retained дописываются к data (data имеет приоритет при совпадении ключей).
/// @throw std::runtime_error для не-конечных чисел
std::string encode_data(const DataMap& data, const DataMap& retained = {}, bool pretty = false);

/// Декодировать JSON объект в данные документа, используя схему как подсказку:
/// Date поля принимают числа (epoch seconds), Enum поля принимают строки.
/// Значения-массивы пропускаются.
DecodeResult decode_data(const Schema& schema, std::string_view text);

}  // namespace duet

#endif  // DUET_STORAGE_HPP
