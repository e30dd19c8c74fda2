// ==============================================================================
// duet/output.hpp - Пользовательский вывод
// ==============================================================================
//
// Назначение:
// - Единственная точка записи в stdout/stderr (библиотека сама не пишет)
// - Сообщения с префиксами [+] [!] [x] [*] [~]
// - Цветной вывод (ANSI escape codes) при TTY
// - Pretty JSON через RapidJSON
// - Таблицы с Unicode box-drawing
// - Вывод в файл (--output)
//
// ==============================================================================

#ifndef DUET_OUTPUT_HPP
#define DUET_OUTPUT_HPP

#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Forward declarations для JSON
namespace rapidjson {
class CrtAllocator;
template <typename BaseAllocator>
class MemoryPoolAllocator;
template <typename Encoding, typename Allocator>
class GenericValue;
template <typename CharType>
struct UTF8;
using Value = GenericValue<UTF8<char>, MemoryPoolAllocator<CrtAllocator>>;
}  // namespace rapidjson

namespace duet::output {

enum class Stream { Stdout, Stderr };

enum class Color {
    Default,
    Green,   // Успех, информация
    Yellow,  // Предупреждения, подсветка изменённых полей
    Red,     // Ошибки
    Cyan,    // Отладка
    Magenta  // Трассировка
};

// ----------------------------------------------------------------------------
// Конфигурация вывода
// ----------------------------------------------------------------------------

struct OutputConfig {
    bool quiet = false;      // -q: подавить informational stderr
    int verbose = 0;         // -v: уровень подробности (0..2+)
    bool no_banner = false;  // --no-banner: скрыть баннер

    // Путь для вывода stdout (--output)
    std::optional<std::filesystem::path> output_path;
};

// ----------------------------------------------------------------------------
// Writer - единый слой вывода
// ----------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    /// Записать байты в поток
    void write(Stream s, std::string_view bytes);

    /// Записать строку с переводом строки
    void write_line(Stream s, std::string_view bytes);

    // Сообщения с префиксами
    // -------------------------------------------------------------------------

    /// "[+] <message>" в stderr (если не quiet)
    void info(std::string_view message);

    /// "[!] <message>" в stderr (если не quiet)
    void warn(std::string_view message);

    /// "[x] <message>" в stderr (всегда)
    void error(std::string_view message);

    /// "[*] <message>" в stderr (только при verbose > 0)
    void debug(std::string_view message);

    /// "[~] <message>" в stderr (только при verbose > 1)
    void trace(std::string_view message);

    // Цветной вывод
    // -------------------------------------------------------------------------

    /// Зелёная строка в stdout
    void green_line(std::string_view message);

    /// Жёлтая строка в stdout
    void yellow_line(std::string_view message);

    // JSON вывод
    // -------------------------------------------------------------------------

    /// Pretty JSON (с отступами) + newline в stdout
    void write_json_pretty(const rapidjson::Value& value);

    // Управление
    // -------------------------------------------------------------------------

    void flush();

    const OutputConfig& config() const { return config_; }

    /// Открыть файл для вывода (при output_path задан)
    bool open_output_file();

    void close_output_file();

    bool has_output_file() const { return output_file_ != nullptr; }

private:
    void write_impl(Stream s, std::string_view bytes);
    void write_prefixed(std::string_view prefix, std::string_view message, Color color);
    void write_colored(Stream s, std::string_view message, Color color);
    FILE* get_file(Stream s) const;

    OutputConfig config_;
    FILE* output_file_ = nullptr;
};

// ----------------------------------------------------------------------------
// Table - форматирование таблиц
// ----------------------------------------------------------------------------

class Table {
public:
    Table() = default;

    void set_headers(const std::vector<std::string>& headers);
    void add_row(const std::vector<std::string>& cells);

    /// Вывести таблицу через Writer в stdout
    void print(Writer& w) const;

    /// Вывести таблицу в строку
    std::string to_string() const;

    /// Количество строк (без заголовка)
    size_t row_count() const { return rows_.size(); }

private:
    std::vector<size_t> column_widths() const;
    std::string format_line(const std::vector<size_t>& widths, const char* left,
                            const char* middle, const char* right) const;
    std::string format_row(const std::vector<size_t>& widths,
                           const std::vector<std::string>& cells) const;

    std::vector<std::string> headers_;
    std::vector<std::vector<std::string>> rows_;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// Очистить значение для ячейки таблицы: \n \r \t -> пробел, схлопнуть пробелы,
/// обрезать до max_width символов с "..." (0 - без ограничения)
std::string format_cell(std::string_view field, size_t max_width);

/// Ширина строки на экране (количество UTF-8 code points)
size_t display_width(std::string_view s);

std::string ansi_color_code(Color color);
std::string ansi_reset_code();

/// Поддерживает ли поток цвета (TTY)
bool supports_color(Stream s);

}  // namespace duet::output

#endif  // DUET_OUTPUT_HPP
