// ==============================================================================
// duet/cli.hpp - CLI парсинг и команды
// ==============================================================================
//
// Назначение:
// - Парсинг argv (собственный парсер, без сторонних библиотек)
// - Генерация --help / --version
// - Диагностические ошибки CLI (exit code 2)
// - Разбор значений для `set` и команд REPL
//
// ==============================================================================

#ifndef DUET_CLI_HPP
#define DUET_CLI_HPP

#include <duet/audit.hpp>
#include <duet/value.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace duet::cli {

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    bool no_banner = false;  // --no-banner
    int verbose = 0;         // -v (повторяемый)
    bool quiet = false;      // -q

    std::optional<std::filesystem::path> schema_path;  // --schema <FILE>
    std::optional<std::string> demo;                   // --demo <budget|fitness>
    std::optional<std::filesystem::path> store;        // --store <DIR>
    std::string key = "default";                       // --key <KEY>
    std::optional<std::filesystem::path> output;       // -o, --output <FILE>
};

// ----------------------------------------------------------------------------
// Подкоманды
// ----------------------------------------------------------------------------

/// schema - описание схемы
struct SchemaCommand {};

/// context - контекст, который увидит агент
struct ContextCommand {};

/// show - таблица текущих значений
struct ShowCommand {};

/// export - pretty JSON данных
struct ExportCommand {};

/// set <FIELD> <VALUE> - одиночная правка (source = user)
struct SetCommand {
    std::string field;
    std::string value;
};

/// apply [<JSON>] [-f FILE] [--source SOURCE] - применить патч
/// Без JSON и -f патч читается из stdin.
struct ApplyCommand {
    std::optional<std::string> json;
    std::optional<std::filesystem::path> file;  // -f, --file
    Source source = Source::Llm;                // --source
};

/// reset - удалить снимок и вернуть значения по умолчанию
struct ResetCommand {};

/// repl - интерактивный режим
struct ReplCommand {};

/// help - показать справку
struct HelpCommand {
    std::optional<std::string> command;
};

/// version - показать версию
struct VersionCommand {};

using Command =
    std::variant<SchemaCommand, ContextCommand, ShowCommand, ExportCommand, SetCommand,
                 ApplyCommand, ResetCommand, ReplCommand, HelpCommand, VersionCommand>;

// ----------------------------------------------------------------------------
// Результат парсинга
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 1;
    std::string stderr_message;
};

struct ParseResult {
    bool ok = false;
    GlobalOptions global;
    Command command;
    CliDiagnostic diagnostic;
};

/// Парсить аргументы командной строки
ParseResult parse(int argc, char** argv);

/// Текст --help (общий или для подкоманды)
std::string render_help(const std::optional<std::string>& command = std::nullopt);

/// Текст --version
std::string render_version();

/// Разобрать значение из командной строки: "true"/"false" -> Boolean,
/// число целиком -> Number, иначе Text
Value parse_value_argument(std::string_view text);

// ----------------------------------------------------------------------------
// Константы
// ----------------------------------------------------------------------------

constexpr const char* VERSION = "0.1.0";

constexpr const char* ABOUT = "Schema-governed documents edited by humans and agents";

}  // namespace duet::cli

#endif  // DUET_CLI_HPP
