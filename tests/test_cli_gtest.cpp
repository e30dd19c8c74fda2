// ==============================================================================
// test_cli_gtest.cpp - Тесты CLI модуля (GoogleTest)
// ==============================================================================

#include "duet/cli.hpp"

#include <filesystem>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace duet::cli::test {

// ==============================================================================
// Вспомогательные функции
// ==============================================================================

// Конвертация вектора строк в argc/argv
struct Args {
    std::vector<std::string> strings;
    std::vector<char*> ptrs;

    explicit Args(std::initializer_list<std::string> args) : strings(args) {
        for (auto& s : strings) {
            ptrs.push_back(s.data());
        }
        ptrs.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(strings.size()); }

    char** argv() { return ptrs.data(); }
};

// ==============================================================================
// help / version
// ==============================================================================

TEST(CliTest, Parse_NoArgs_HelpWithExit2) {
    Args args{"duet"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_NE(result.diagnostic.stderr_message.find("Usage: duet"), std::string::npos);
}

TEST(CliTest, Parse_Help_ReturnsHelpCommand) {
    // Arrange
    Args args{"duet", "--help"};

    // Act
    ParseResult result = parse(args.argc(), args.argv());

    // Assert
    EXPECT_TRUE(result.ok);
    EXPECT_TRUE(std::holds_alternative<HelpCommand>(result.command));
}

TEST(CliTest, Parse_SubcommandHelp_CarriesCommandName) {
    Args args{"duet", "apply", "-h"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    const auto* help = std::get_if<HelpCommand>(&result.command);
    ASSERT_NE(help, nullptr);
    EXPECT_EQ(help->command, "apply");
}

TEST(CliTest, Parse_Version_ReturnsVersionCommand) {
    Args args{"duet", "-V"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_TRUE(result.ok);
    EXPECT_TRUE(std::holds_alternative<VersionCommand>(result.command));
}

TEST(CliTest, RenderVersion_Format) {
    EXPECT_EQ(render_version(), "duet 0.1.0\n");
}

TEST(CliTest, RenderHelp_ListsCommandsAndOptions) {
    std::string help = render_help();

    for (const char* name : {"schema", "context", "show", "export", "set", "apply", "reset",
                             "repl", "--store", "--key", "--demo"}) {
        EXPECT_NE(help.find(name), std::string::npos) << name;
    }
}

TEST(CliTest, RenderHelp_ApplyMentionsSource) {
    EXPECT_NE(render_help(std::string("apply")).find("--source"), std::string::npos);
}

// ==============================================================================
// Глобальные опции
// ==============================================================================

TEST(CliTest, Parse_GlobalOptionsBeforeCommand) {
    Args args{"duet", "--no-banner", "-vv", "--demo", "fitness", "--store", "data", "--key",
              "mine", "show"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok) << result.diagnostic.stderr_message;
    EXPECT_TRUE(std::holds_alternative<ShowCommand>(result.command));
    EXPECT_TRUE(result.global.no_banner);
    EXPECT_EQ(result.global.verbose, 2);
    EXPECT_EQ(result.global.demo, "fitness");
    ASSERT_TRUE(result.global.store.has_value());
    EXPECT_EQ(result.global.store->string(), "data");
    EXPECT_EQ(result.global.key, "mine");
}

TEST(CliTest, Parse_GlobalOptionsAfterCommand) {
    Args args{"duet", "export", "-q", "-o", "out.json"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    EXPECT_TRUE(result.global.quiet);
    ASSERT_TRUE(result.global.output.has_value());
    EXPECT_EQ(result.global.output->string(), "out.json");
}

TEST(CliTest, Parse_Defaults) {
    Args args{"duet", "schema"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.global.key, "default");
    EXPECT_FALSE(result.global.store.has_value());
    EXPECT_FALSE(result.global.schema_path.has_value());
    EXPECT_EQ(result.global.verbose, 0);
}

TEST(CliTest, Parse_MissingOptionValue_Exit2) {
    Args args{"duet", "show", "--store"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_NE(result.diagnostic.stderr_message.find("a value is required"), std::string::npos);
}

TEST(CliTest, Parse_UnknownDemo_Exit2) {
    Args args{"duet", "--demo", "garden", "show"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
}

TEST(CliTest, Parse_SchemaWithDemo_Exit2) {
    Args args{"duet", "--schema", "trip.yml", "--demo", "budget", "show"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_NE(result.diagnostic.stderr_message.find("cannot be used with"), std::string::npos);
}

TEST(CliTest, Parse_UnknownFlag_Exit2) {
    Args args{"duet", "--frobnicate"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_NE(result.diagnostic.stderr_message.find("unexpected argument '--frobnicate'"),
              std::string::npos);
}

TEST(CliTest, Parse_UnknownSubcommand_Exit2) {
    Args args{"duet", "delete"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_NE(result.diagnostic.stderr_message.find("unrecognized subcommand 'delete'"),
              std::string::npos);
}

// ==============================================================================
// Подкоманды
// ==============================================================================

TEST(CliTest, Parse_Set_FieldAndValue) {
    Args args{"duet", "set", "rent", "-250"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok) << result.diagnostic.stderr_message;
    const auto* set = std::get_if<SetCommand>(&result.command);
    ASSERT_NE(set, nullptr);
    EXPECT_EQ(set->field, "rent");
    EXPECT_EQ(set->value, "-250");
}

TEST(CliTest, Parse_SetWrongArity_Exit2) {
    Args missing{"duet", "set", "rent"};
    Args extra{"duet", "set", "rent", "1", "2"};

    EXPECT_EQ(parse(missing.argc(), missing.argv()).diagnostic.exit_code, 2);
    EXPECT_FALSE(parse(extra.argc(), extra.argv()).ok);
}

TEST(CliTest, Parse_ApplyInline_DefaultSourceLlm) {
    Args args{"duet", "apply", R"([{"op":"replace","path":"/rent","value":1}])"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    const auto* apply = std::get_if<ApplyCommand>(&result.command);
    ASSERT_NE(apply, nullptr);
    ASSERT_TRUE(apply->json.has_value());
    EXPECT_EQ(apply->json->front(), '[');
    EXPECT_FALSE(apply->file.has_value());
    EXPECT_EQ(apply->source, Source::Llm);
}

TEST(CliTest, Parse_ApplyFileAndSource) {
    Args args{"duet", "apply", "--file", "patch.json", "--source", "user"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    const auto& apply = std::get<ApplyCommand>(result.command);
    ASSERT_TRUE(apply.file.has_value());
    EXPECT_EQ(apply.file->string(), "patch.json");
    EXPECT_FALSE(apply.json.has_value());
    EXPECT_EQ(apply.source, Source::User);
}

TEST(CliTest, Parse_ApplyNoPatch_ReadsStdin) {
    Args args{"duet", "apply"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    const auto& apply = std::get<ApplyCommand>(result.command);
    EXPECT_FALSE(apply.json.has_value());
    EXPECT_FALSE(apply.file.has_value());
}

TEST(CliTest, Parse_ApplyJsonAndFile_Exit2) {
    Args args{"duet", "apply", "-f", "patch.json", "[]"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
}

TEST(CliTest, Parse_ApplyInvalidSource_Exit2) {
    Args args{"duet", "apply", "--source", "robot", "[]"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
}

TEST(CliTest, Parse_ResetAndRepl) {
    Args reset{"duet", "reset"};
    Args repl{"duet", "repl"};

    EXPECT_TRUE(std::holds_alternative<ResetCommand>(parse(reset.argc(), reset.argv()).command));
    EXPECT_TRUE(std::holds_alternative<ReplCommand>(parse(repl.argc(), repl.argv()).command));
}

TEST(CliTest, Parse_ShowWithPositional_Exit2) {
    Args args{"duet", "show", "extra"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
}

// ==============================================================================
// parse_value_argument
// ==============================================================================

TEST(CliTest, ParseValueArgument_Booleans) {
    EXPECT_EQ(parse_value_argument("true"), Value(true));
    EXPECT_EQ(parse_value_argument("false"), Value(false));
}

TEST(CliTest, ParseValueArgument_Numbers) {
    EXPECT_EQ(parse_value_argument("42"), Value(42));
    EXPECT_EQ(parse_value_argument("-3.5"), Value(-3.5));
}

TEST(CliTest, ParseValueArgument_TextOtherwise) {
    EXPECT_EQ(parse_value_argument("high"), Value("high"));
    EXPECT_EQ(parse_value_argument("12 apples"), Value("12 apples"));
    EXPECT_EQ(parse_value_argument("True"), Value("True"));
    EXPECT_EQ(parse_value_argument(""), Value(""));
}

}  // namespace duet::cli::test
