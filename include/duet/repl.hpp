// ==============================================================================
// duet/repl.hpp - Интерактивный редактор документа и его представления
// ==============================================================================
//
// Назначение:
// - Представления документа для вывода (таблица значений, журнал, контекст)
// - Repl: цикл команд view / context / schema / patch / set / history /
//   export / reset / help / quit поверх одного Document
//
// Весь вывод идёт через output::Writer.
//
// ==============================================================================

#ifndef DUET_REPL_HPP
#define DUET_REPL_HPP

#include <duet/bridge.hpp>
#include <duet/document.hpp>
#include <duet/output.hpp>
#include <istream>
#include <string>
#include <string_view>

namespace duet::app {

// ----------------------------------------------------------------------------
// Представления
// ----------------------------------------------------------------------------

/// Таблица: поле, подпись, тип, значение; недавно изменённые помечены "*"
void print_document(const Document& document, output::Writer& writer);

/// Таблица журнала аудита: id, время, источник, операции, результат
void print_history(const Document& document, output::Writer& writer);

/// Сообщить об исходе патча через Writer
void report_patch_result(const PatchResult& result, output::Writer& writer);

// ----------------------------------------------------------------------------
// Repl
// ----------------------------------------------------------------------------

class Repl {
public:
    Repl(Document& document, output::Writer& writer);

    /// Читать команды из in до quit или конца потока
    void run(std::istream& in);

    /// Выполнить одну команду. "patch" без аргумента читает патч из in.
    /// @return false если команда завершает сеанс
    bool execute(std::string_view line, std::istream& in);

    /// Текст справки по командам
    static std::string help_text();

private:
    void cmd_set(std::string_view args);
    void cmd_patch(std::string_view args, std::istream& in);

    Document& document_;
    output::Writer& writer_;
    DocumentBridge bridge_;
};

}  // namespace duet::app

#endif  // DUET_REPL_HPP
