// ==============================================================================
// main.cpp - Точка входа приложения
// ==============================================================================
//
// 1. Парсинг argv через cli
// 2. Создание Writer (output)
// 3. Загрузка схемы, хранилища и документа
// 4. Dispatch команды
// 5. Возврат exit code
//
// Исключения перехватываются только здесь, на границе приложения.
//
// ==============================================================================

#include "duet/bridge.hpp"
#include "duet/cli.hpp"
#include "duet/config.hpp"
#include "duet/document.hpp"
#include "duet/output.hpp"
#include "duet/platform.hpp"
#include "duet/repl.hpp"
#include "duet/storage.hpp"

#include <exception>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <type_traits>
#include <variant>

namespace {

constexpr const char* BANNER = R"(
     ____              __
    / __ \__  _____  / /_
   / / / / / / / _ \/ __/
  / /_/ / /_/ /  __/ /_
 /_____/\__,_/\___/\__/
)";

void print_banner(duet::output::Writer& writer, bool no_banner, bool quiet) {
    if (no_banner || quiet) {
        return;
    }
    writer.write(duet::output::Stream::Stderr, BANNER);
    writer.write_line(duet::output::Stream::Stderr, "");
}

// ----------------------------------------------------------------------------
// Открытие документа
// ----------------------------------------------------------------------------

/// Схема из --schema или встроенная (--demo, по умолчанию budget)
std::shared_ptr<const duet::Schema> resolve_schema(const duet::cli::GlobalOptions& global,
                                                   duet::output::Writer& writer) {
    using namespace duet;

    if (global.schema_path) {
        auto loaded = load_schema_file(*global.schema_path);
        if (!loaded) {
            writer.error(loaded.error);
            return nullptr;
        }
        writer.debug("loaded schema '" + loaded.schema->name() + "' from " +
                     platform::path_to_utf8(*global.schema_path));
        return loaded.schema;
    }

    std::string name = global.demo.value_or("budget");
    writer.debug("using built-in schema: " + name);
    return builtin_schema(name);
}

std::shared_ptr<duet::Storage> resolve_storage(const duet::cli::GlobalOptions& global,
                                               duet::output::Writer& writer) {
    if (global.store) {
        writer.debug("storing documents under " + duet::platform::path_to_utf8(*global.store));
        return std::make_shared<duet::FileStorage>(*global.store);
    }
    writer.trace("no --store given, changes are kept in memory only");
    return std::make_shared<duet::MemoryStorage>();
}

void warn_if_unsaved(const duet::Document& document, duet::output::Writer& writer) {
    if (!document.last_save_ok()) {
        writer.warn("could not save document '" + document.storage_key() + "'");
    }
}

// ----------------------------------------------------------------------------
// Выполнение команд
// ----------------------------------------------------------------------------

int run_set(const duet::cli::SetCommand& cmd, duet::Document& document,
            duet::output::Writer& writer) {
    duet::Value value = duet::cli::parse_value_argument(cmd.value);
    if (!document.try_edit(cmd.field, value)) {
        writer.error(document.last_error()->format());
        return 1;
    }
    writer.info("Set " + cmd.field + " = " + value.to_display_string());
    warn_if_unsaved(document, writer);
    return 0;
}

int run_apply(const duet::cli::ApplyCommand& cmd, duet::Document& document,
              duet::output::Writer& writer) {
    using namespace duet;

    std::string text;
    if (cmd.json) {
        text = *cmd.json;
    } else if (cmd.file) {
        auto content = platform::read_file(*cmd.file);
        if (!content) {
            writer.error("cannot read patch file: " + platform::path_to_utf8(*cmd.file));
            return 1;
        }
        text = std::move(*content);
    } else {
        writer.debug("reading patch from standard input");
        text.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }

    writer.trace("patch text: " + text);
    auto result = document.apply_from_text(text, cmd.source);
    app::report_patch_result(result, writer);
    if (!result) {
        return 1;
    }

    for (const auto& id : document.recently_updated()) {
        auto value = document.get(id);
        writer.debug(id + " = " + (value ? value->to_display_string() : "(not set)"));
    }
    warn_if_unsaved(document, writer);
    return 0;
}

int run(int argc, char** argv) {
    using namespace duet;

    cli::ParseResult parse_result = cli::parse(argc, argv);

    output::OutputConfig out_cfg;
    out_cfg.quiet = parse_result.global.quiet;
    out_cfg.verbose = parse_result.global.verbose;
    out_cfg.no_banner = parse_result.global.no_banner;
    out_cfg.output_path = parse_result.global.output;
    output::Writer writer(out_cfg);

    // Ошибки парсинга печатаются как есть, без [x]
    if (!parse_result.ok) {
        writer.write(output::Stream::Stderr, parse_result.diagnostic.stderr_message);
        return parse_result.diagnostic.exit_code;
    }

    if (out_cfg.output_path && !writer.has_output_file()) {
        writer.error("cannot open output file: " + platform::path_to_utf8(*out_cfg.output_path));
        return 1;
    }

    if (const auto* help = std::get_if<cli::HelpCommand>(&parse_result.command)) {
        writer.write(output::Stream::Stdout, cli::render_help(help->command));
        return 0;
    }
    if (std::holds_alternative<cli::VersionCommand>(parse_result.command)) {
        writer.write(output::Stream::Stdout, cli::render_version());
        return 0;
    }

    print_banner(writer, out_cfg.no_banner, out_cfg.quiet);

    auto schema = resolve_schema(parse_result.global, writer);
    if (!schema) {
        return 1;
    }
    auto storage = resolve_storage(parse_result.global, writer);
    Document document(schema, parse_result.global.key, storage);
    writer.debug("opened document '" + document.storage_key() + "'");

    return std::visit(
        [&](auto&& cmd) -> int {
            using T = std::decay_t<decltype(cmd)>;

            if constexpr (std::is_same_v<T, cli::SchemaCommand>) {
                writer.write(output::Stream::Stdout, schema->describe());
                return 0;
            } else if constexpr (std::is_same_v<T, cli::ContextCommand>) {
                DocumentBridge bridge(document);
                writer.write(output::Stream::Stdout, bridge.get_context());
                return 0;
            } else if constexpr (std::is_same_v<T, cli::ShowCommand>) {
                app::print_document(document, writer);
                return 0;
            } else if constexpr (std::is_same_v<T, cli::ExportCommand>) {
                writer.write_line(output::Stream::Stdout, document.export_json());
                return 0;
            } else if constexpr (std::is_same_v<T, cli::SetCommand>) {
                return run_set(cmd, document, writer);
            } else if constexpr (std::is_same_v<T, cli::ApplyCommand>) {
                return run_apply(cmd, document, writer);
            } else if constexpr (std::is_same_v<T, cli::ResetCommand>) {
                document.reset();
                writer.info("Restored default values for '" + document.storage_key() + "'");
                return 0;
            } else if constexpr (std::is_same_v<T, cli::ReplCommand>) {
                app::Repl repl(document, writer);
                repl.run(std::cin);
                return 0;
            } else {
                // Help/Version обработаны выше
                return 1;
            }
        },
        parse_result.command);
}

}  // namespace

// ----------------------------------------------------------------------------
// main
// ----------------------------------------------------------------------------

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "[x] " << e.what() << "\n";
        return 1;
    }
}
