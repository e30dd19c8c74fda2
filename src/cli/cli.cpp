// ==============================================================================
// cli.cpp - CLI парсинг
// ==============================================================================

#include "duet/cli.hpp"

#include "duet/platform.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstring>

namespace duet::cli {

namespace {

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

std::string render_usage_error(const std::string& error_msg, const char* usage) {
    return error_msg + "\n\nUsage: " + usage + "\n\nFor more information, try '--help'.\n";
}

constexpr const char* MAIN_USAGE = "duet [OPTIONS] <COMMAND>";

/// Ошибка "нет значения у опции"
void missing_value(ParseResult& result, const char* option) {
    result.ok = false;
    result.diagnostic.exit_code = 2;
    result.diagnostic.stderr_message =
        render_usage_error(std::string("error: a value is required for '") + option +
                               "' but none was supplied",
                           MAIN_USAGE);
}

/// Попробовать разобрать глобальную опцию в позиции i.
/// @return true если аргумент распознан (i может сдвинуться на значение);
///         при ошибке result.diagnostic заполнен и result.ok = false
bool take_global(int& i, int argc, char** argv, ParseResult& result, bool& failed) {
    const char* arg = argv[i];
    auto& global = result.global;

    auto next_value = [&](const char* option) -> const char* {
        if (i + 1 >= argc) {
            missing_value(result, option);
            failed = true;
            return nullptr;
        }
        return argv[++i];
    };

    if (str_eq(arg, "--no-banner")) {
        global.no_banner = true;
    } else if (str_eq(arg, "-v")) {
        global.verbose++;
    } else if (str_eq(arg, "-vv")) {
        global.verbose += 2;
    } else if (str_eq(arg, "-q") || str_eq(arg, "--quiet")) {
        global.quiet = true;
    } else if (str_eq(arg, "--schema")) {
        if (const char* v = next_value("--schema <FILE>")) {
            global.schema_path = platform::path_from_utf8(v);
        }
    } else if (str_eq(arg, "--demo")) {
        if (const char* v = next_value("--demo <NAME>")) {
            if (!str_eq(v, "budget") && !str_eq(v, "fitness")) {
                result.diagnostic.exit_code = 2;
                result.diagnostic.stderr_message =
                    std::string("error: invalid value '") + v +
                    "' for '--demo <NAME>': must be one of: budget, fitness\n\n"
                    "For more information, try '--help'.\n";
                failed = true;
            } else {
                global.demo = v;
            }
        }
    } else if (str_eq(arg, "--store")) {
        if (const char* v = next_value("--store <DIR>")) {
            global.store = platform::path_from_utf8(v);
        }
    } else if (str_eq(arg, "--key")) {
        if (const char* v = next_value("--key <KEY>")) {
            global.key = v;
        }
    } else if (str_eq(arg, "-o") || str_eq(arg, "--output")) {
        if (const char* v = next_value("--output <FILE>")) {
            global.output = platform::path_from_utf8(v);
        }
    } else {
        return false;
    }
    return true;
}

void unexpected_argument(ParseResult& result, const char* arg, const char* usage) {
    result.ok = false;
    result.diagnostic.exit_code = 2;
    result.diagnostic.stderr_message =
        render_usage_error(std::string("error: unexpected argument '") + arg + "' found", usage);
}

}  // namespace

// ----------------------------------------------------------------------------
// render_version / render_help
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string("duet ") + VERSION + "\n";
}

std::string render_help(const std::optional<std::string>& command) {
    if (!command.has_value()) {
        return std::string(ABOUT) +
               "\n"
               "\n"
               "Usage: duet [OPTIONS] <COMMAND>\n"
               "\n"
               "Commands:\n"
               "  schema   Describe the schema fields and constraints\n"
               "  context  Print the context an agent would receive\n"
               "  show     Show current values as a table\n"
               "  export   Export current values as JSON\n"
               "  set      Set a single field\n"
               "  apply    Apply a JSON patch atomically\n"
               "  reset    Discard saved values and restore defaults\n"
               "  repl     Start the interactive editor\n"
               "  help     Print this message or the help of the given subcommand\n"
               "\n"
               "Options:\n"
               "      --schema <FILE>   Load the schema from a YAML file\n"
               "      --demo <NAME>     Use a built-in schema: budget or fitness (default: budget)\n"
               "      --store <DIR>     Persist the document under this directory\n"
               "      --key <KEY>       Storage key of the document (default: default)\n"
               "  -o, --output <FILE>   Write standard output to a file\n"
               "      --no-banner       Hide the banner\n"
               "  -v...                 Print verbose output\n"
               "  -q                    Suppress informational output\n"
               "  -h, --help            Print help\n"
               "  -V, --version         Print version\n"
               "\n"
               "Examples:\n"
               "\n"
               "    Raise the income of the budget demo:\n"
               "        ./duet --store .duet apply '[{\"op\": \"replace\", \"path\": \"/income\", "
               "\"value\": 6500}]'\n"
               "\n"
               "    Edit a document described by a schema file:\n"
               "        ./duet --schema trip.yml --store .duet --key trip repl\n";
    } else if (*command == "set") {
        return "Set a single field\n"
               "\n"
               "Usage: duet set <FIELD> <VALUE>\n"
               "\n"
               "Arguments:\n"
               "  <FIELD>  Field id\n"
               "  <VALUE>  New value: true/false, a number, or text\n"
               "\n"
               "Options:\n"
               "  -h, --help  Print help\n";
    } else if (*command == "apply") {
        return "Apply a JSON patch atomically\n"
               "\n"
               "Usage: duet apply [OPTIONS] [JSON]\n"
               "\n"
               "Arguments:\n"
               "  [JSON]  Patch text; read from standard input when omitted\n"
               "\n"
               "Options:\n"
               "  -f, --file <FILE>      Read the patch from a file\n"
               "      --source <SOURCE>  Audit source: user, llm or system (default: llm)\n"
               "  -h, --help             Print help\n";
    } else if (*command == "schema" || *command == "context" || *command == "show" ||
               *command == "export" || *command == "reset" || *command == "repl") {
        return "Usage: duet " + *command +
               "\n"
               "\n"
               "Options:\n"
               "  -h, --help  Print help\n";
    }
    return "error: unrecognized subcommand '" + *command + "'\n";
}

// ----------------------------------------------------------------------------
// parse_value_argument
// ----------------------------------------------------------------------------

Value parse_value_argument(std::string_view text) {
    if (text == "true") {
        return Value(true);
    }
    if (text == "false") {
        return Value(false);
    }

    std::string s(text);
    if (!s.empty()) {
        errno = 0;
        char* end = nullptr;
        double v = std::strtod(s.c_str(), &end);
        if (errno != ERANGE && end == s.c_str() + s.size() && std::isfinite(v)) {
            return Value(v);
        }
    }
    return Value(std::move(s));
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv) {
    ParseResult result;
    result.ok = false;
    result.command = HelpCommand{};

    if (argc < 2) {
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message = render_help(std::nullopt);
        return result;
    }

    bool failed = false;

    // Глобальные опции до подкоманды
    int cmd_idx = argc;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (take_global(i, argc, argv, result, failed)) {
            if (failed) {
                return result;
            }
            continue;
        }
        if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{};
            return result;
        }
        if (str_eq(arg, "-V") || str_eq(arg, "--version")) {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        }
        if (arg[0] == '-') {
            unexpected_argument(result, arg, MAIN_USAGE);
            return result;
        }
        cmd_idx = i;
        break;
    }

    if (cmd_idx >= argc) {
        result.ok = true;
        result.command = HelpCommand{};
        return result;
    }

    const char* cmd = argv[cmd_idx];
    std::vector<const char*> positional;
    ApplyCommand apply_cmd;

    // Аргументы подкоманды; глобальные опции допустимы и здесь
    for (int i = cmd_idx + 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (take_global(i, argc, argv, result, failed)) {
            if (failed) {
                return result;
            }
            continue;
        }
        if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{std::string(cmd)};
            return result;
        }
        if (str_eq(cmd, "apply") && (str_eq(arg, "-f") || str_eq(arg, "--file"))) {
            if (i + 1 >= argc) {
                missing_value(result, "--file <FILE>");
                return result;
            }
            apply_cmd.file = platform::path_from_utf8(argv[++i]);
            continue;
        }
        if (str_eq(cmd, "apply") && str_eq(arg, "--source")) {
            if (i + 1 >= argc) {
                missing_value(result, "--source <SOURCE>");
                return result;
            }
            const char* value = argv[++i];
            auto source = parse_source(value);
            if (!source) {
                result.diagnostic.exit_code = 2;
                result.diagnostic.stderr_message =
                    std::string("error: invalid value '") + value +
                    "' for '--source <SOURCE>': must be one of: user, llm, system\n\n"
                    "For more information, try '--help'.\n";
                return result;
            }
            apply_cmd.source = *source;
            continue;
        }
        // Патч начинается с '[' или '{', отрицательные числа для set допустимы
        if (arg[0] == '-' && arg[1] != '\0' && !(arg[1] >= '0' && arg[1] <= '9')) {
            unexpected_argument(result, arg, MAIN_USAGE);
            return result;
        }
        positional.push_back(arg);
    }

    auto no_positional = [&](Command command) {
        if (!positional.empty()) {
            unexpected_argument(result, positional.front(), MAIN_USAGE);
            return;
        }
        result.ok = true;
        result.command = std::move(command);
    };

    if (str_eq(cmd, "schema")) {
        no_positional(SchemaCommand{});
    } else if (str_eq(cmd, "context")) {
        no_positional(ContextCommand{});
    } else if (str_eq(cmd, "show")) {
        no_positional(ShowCommand{});
    } else if (str_eq(cmd, "export")) {
        no_positional(ExportCommand{});
    } else if (str_eq(cmd, "reset")) {
        no_positional(ResetCommand{});
    } else if (str_eq(cmd, "repl")) {
        no_positional(ReplCommand{});
    } else if (str_eq(cmd, "set")) {
        if (positional.size() != 2) {
            result.diagnostic.exit_code = 2;
            result.diagnostic.stderr_message =
                positional.size() < 2
                    ? render_usage_error(
                          "error: the following required arguments were not provided:\n"
                          "  <FIELD> <VALUE>",
                          "duet set <FIELD> <VALUE>")
                    : render_usage_error(
                          std::string("error: unexpected argument '") + positional[2] + "' found",
                          "duet set <FIELD> <VALUE>");
            return result;
        }
        result.ok = true;
        result.command = SetCommand{positional[0], positional[1]};
    } else if (str_eq(cmd, "apply")) {
        if (positional.size() > 1 || (!positional.empty() && apply_cmd.file)) {
            result.diagnostic.exit_code = 2;
            result.diagnostic.stderr_message = render_usage_error(
                "error: provide the patch either as an argument or with --file",
                "duet apply [OPTIONS] [JSON]");
            return result;
        }
        if (!positional.empty()) {
            apply_cmd.json = std::string(positional.front());
        }
        result.ok = true;
        result.command = apply_cmd;
    } else if (str_eq(cmd, "help")) {
        result.ok = true;
        if (!positional.empty()) {
            result.command = HelpCommand{std::string(positional.front())};
        } else {
            result.command = HelpCommand{};
        }
    } else {
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message =
            render_usage_error(std::string("error: unrecognized subcommand '") + cmd + "'",
                               MAIN_USAGE);
        return result;
    }

    if (!result.ok) {
        return result;
    }

    if (result.global.schema_path && result.global.demo) {
        result.ok = false;
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message =
            render_usage_error("error: the argument '--schema <FILE>' cannot be used with "
                               "'--demo <NAME>'",
                               MAIN_USAGE);
    }
    return result;
}

}  // namespace duet::cli
