// ==============================================================================
// repl.cpp - Интерактивный редактор документа
// ==============================================================================

#include "duet/repl.hpp"

#include "duet/cli.hpp"

#include <algorithm>
#include <cctype>

namespace duet::app {

namespace {

constexpr size_t VALUE_COLUMN_WIDTH = 60;

std::string_view trim(std::string_view s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

/// Разделить "cmd rest..." на команду и остаток
std::pair<std::string, std::string_view> split_command(std::string_view line) {
    auto space = line.find_first_of(" \t");
    std::string command(line.substr(0, space));
    std::transform(command.begin(), command.end(), command.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    std::string_view rest = space == std::string_view::npos ? std::string_view{}
                                                            : trim(line.substr(space + 1));
    return {command, rest};
}

std::string describe_type(const Field& field) {
    std::string kind = to_string(field.kind());
    if (field.required) {
        kind += ", required";
    }
    return kind;
}

}  // namespace

// ----------------------------------------------------------------------------
// Представления
// ----------------------------------------------------------------------------

void print_document(const Document& document, output::Writer& writer) {
    auto data = document.snapshot();

    output::Table table;
    table.set_headers({"", "Field", "Label", "Type", "Value"});
    for (const auto& field : document.schema().fields()) {
        auto it = data->find(field.id);
        std::string value = it == data->end() ? "(not set)" : it->second.to_display_string();
        table.add_row({document.was_recently_updated(field.id) ? "*" : "", field.id, field.label,
                       describe_type(field), output::format_cell(value, VALUE_COLUMN_WIDTH)});
    }

    writer.green_line("Document: " + document.schema().name());
    table.print(writer);

    auto missing = document.missing_required();
    if (!missing.empty()) {
        std::string list;
        for (const auto& id : missing) {
            list += list.empty() ? id : ", " + id;
        }
        writer.yellow_line("Missing required: " + list);
    }
}

void print_history(const Document& document, output::Writer& writer) {
    auto history = document.history();
    if (history.empty()) {
        writer.info("No patch history yet");
        return;
    }

    output::Table table;
    table.set_headers({"Id", "Time", "Source", "Operations", "Result"});
    for (const auto& entry : history) {
        std::string ops;
        for (const auto& op : entry.operations) {
            if (!ops.empty()) {
                ops += ", ";
            }
            ops += op.op + " " + op.path;
        }
        if (ops.empty()) {
            ops = "-";
        }

        std::string outcome = entry.succeeded
                                  ? "ok (" + std::to_string(entry.operations_applied) + ")"
                                  : "failed: " + entry.reason;

        table.add_row({std::to_string(entry.sequence_id), format_timestamp(entry.timestamp),
                       source_to_string(entry.source), output::format_cell(ops, 40),
                       output::format_cell(outcome, VALUE_COLUMN_WIDTH)});
    }
    table.print(writer);
}

void report_patch_result(const PatchResult& result, output::Writer& writer) {
    if (result) {
        writer.info("Applied " + std::to_string(result.operations_applied) + " operation(s)");
    } else {
        writer.error(result.error.value_or("unknown error"));
    }
}

// ----------------------------------------------------------------------------
// Repl
// ----------------------------------------------------------------------------

Repl::Repl(Document& document, output::Writer& writer)
    : document_(document), writer_(writer), bridge_(document, Source::Llm) {}

std::string Repl::help_text() {
    return "Commands:\n"
           "  view, v          Show current document state\n"
           "  context, c       Show the agent context\n"
           "  schema, s        Show schema description\n"
           "  patch, p [JSON]  Apply a JSON patch (prompts when JSON is omitted)\n"
           "  set <f> <v>      Set a field value (true/false, number or text)\n"
           "  history, h       Show patch history\n"
           "  export, e        Export document as JSON\n"
           "  reset            Restore default values\n"
           "  help, ?          Show this help\n"
           "  quit, q          Exit\n";
}

void Repl::run(std::istream& in) {
    print_document(document_, writer_);
    writer_.write(output::Stream::Stdout, help_text());

    std::string line;
    while (true) {
        writer_.write(output::Stream::Stdout, "> ");
        writer_.flush();
        if (!std::getline(in, line)) {
            writer_.write(output::Stream::Stdout, "\n");
            return;
        }
        if (!execute(line, in)) {
            return;
        }
    }
}

bool Repl::execute(std::string_view line, std::istream& in) {
    line = trim(line);
    if (line.empty()) {
        return true;
    }

    auto [command, args] = split_command(line);
    writer_.trace("repl command: " + command);

    if (command == "quit" || command == "exit" || command == "q") {
        writer_.info("Goodbye");
        return false;
    } else if (command == "view" || command == "show" || command == "v") {
        print_document(document_, writer_);
    } else if (command == "context" || command == "ctx" || command == "c") {
        writer_.write(output::Stream::Stdout, bridge_.get_context());
    } else if (command == "schema" || command == "s") {
        writer_.write(output::Stream::Stdout, document_.schema().describe());
    } else if (command == "patch" || command == "p") {
        cmd_patch(args, in);
    } else if (command == "set") {
        cmd_set(args);
    } else if (command == "history" || command == "h") {
        print_history(document_, writer_);
    } else if (command == "export" || command == "e") {
        writer_.write_line(output::Stream::Stdout, document_.export_json());
    } else if (command == "reset") {
        document_.reset();
        writer_.info("Restored default values");
    } else if (command == "help" || command == "?") {
        writer_.write(output::Stream::Stdout, help_text());
    } else {
        writer_.warn("Unknown command: " + command + ". Type 'help' for available commands.");
    }
    return true;
}

void Repl::cmd_set(std::string_view args) {
    auto space = args.find_first_of(" \t");
    if (args.empty() || space == std::string_view::npos) {
        writer_.warn("Usage: set <field> <value>");
        return;
    }

    std::string field(args.substr(0, space));
    Value value = cli::parse_value_argument(trim(args.substr(space + 1)));

    if (document_.try_edit(field, value)) {
        writer_.info("Set " + field + " = " + value.to_display_string());
        if (!document_.last_save_ok()) {
            writer_.warn("could not save document '" + document_.storage_key() + "'");
        }
    } else {
        writer_.error(document_.last_error()->format());
    }
}

void Repl::cmd_patch(std::string_view args, std::istream& in) {
    std::string text(args);
    if (text.empty()) {
        writer_.write(output::Stream::Stdout,
                      "Enter JSON patch (or 'cancel'):\n"
                      "Example: [{\"op\": \"replace\", \"path\": \"/income\", \"value\": 6000}]\n"
                      "patch> ");
        writer_.flush();
        if (!std::getline(in, text) || trim(text) == "cancel") {
            return;
        }
    }

    bridge_.apply_actions(text);
    report_patch_result(bridge_.last_result(), writer_);
    if (bridge_.last_result()) {
        print_document(document_, writer_);
        if (!document_.last_save_ok()) {
            writer_.warn("could not save document '" + document_.storage_key() + "'");
        }
    }
}

}  // namespace duet::app
