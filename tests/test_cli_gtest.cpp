// ==============================================================================
// test_cli_gtest.cpp - Тесты CLI модуля (GoogleTest)
// ==============================================================================
//
// MOD-0002: cli
//
// TST-CLI-001..TST-CLI-008
//
// ==============================================================================

#include "unifilter/cli.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace unifilter::cli::test {

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
// TST-CLI-001: --help / --version
// ==============================================================================

TEST(CliTest, Parse_Help_ReturnsHelpCommand) {
    // Arrange
    Args args{"unifilter", "--help"};

    // Act
    ParseResult result = parse(args.argc(), args.argv());

    // Assert
    EXPECT_TRUE(result.ok);
    ASSERT_TRUE(std::holds_alternative<HelpCommand>(result.command));
    EXPECT_FALSE(std::get<HelpCommand>(result.command).command.has_value());
}

TEST(CliTest, Parse_Version_ReturnsVersionCommand) {
    Args args{"unifilter", "-V"};
    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_TRUE(result.ok);
    EXPECT_TRUE(std::holds_alternative<VersionCommand>(result.command));

    Args sub{"unifilter", "version"};
    EXPECT_TRUE(std::holds_alternative<VersionCommand>(parse(sub.argc(), sub.argv()).command));
}

TEST(CliTest, RenderVersion) {
    EXPECT_EQ(render_version(), "unifilter 1.0.0\n");
}

TEST(CliTest, RenderHelp_ListsCommands) {
    std::string help = render_help();

    EXPECT_EQ(help.rfind(ABOUT, 0), 0u);
    EXPECT_NE(help.find("  process  "), std::string::npos);
    EXPECT_NE(help.find("  lint     "), std::string::npos);
    EXPECT_NE(help.find("--num-threads <NUM_THREADS>"), std::string::npos);
    EXPECT_NE(render_help("process").find("--strategy <STRATEGY>"), std::string::npos);
    EXPECT_NE(render_help("lint").find("<PATTERNS_DIR>"), std::string::npos);
    EXPECT_EQ(render_help("bogus"), "error: unrecognized subcommand 'bogus'\n");
}

// ==============================================================================
// TST-CLI-002: без аргументов
// ==============================================================================

TEST(CliTest, Parse_NoArguments_PrintsHelpWithExit2) {
    Args args{"unifilter"};
    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_EQ(result.diagnostic.stderr_message, render_help());
}

// ==============================================================================
// TST-CLI-003: process
// ==============================================================================

TEST(CliTest, Parse_Process_AllOptions) {
    // Arrange
    Args args{"unifilter", "process", "a.txt", "-p", "patterns", "--config=my.yml",
              "-s", "drop", "-o", "out/list.txt", "--report", "r.jsonl",
              "--title", "My List", "--skip-errors", "b.txt"};

    // Act
    ParseResult result = parse(args.argc(), args.argv());

    // Assert
    ASSERT_TRUE(result.ok) << result.diagnostic.stderr_message;
    ASSERT_TRUE(std::holds_alternative<ProcessCommand>(result.command));
    const auto& cmd = std::get<ProcessCommand>(result.command);

    ASSERT_EQ(cmd.lists.size(), 2u);
    EXPECT_EQ(cmd.lists[0], std::filesystem::path("a.txt"));
    EXPECT_EQ(cmd.lists[1], std::filesystem::path("b.txt"));
    EXPECT_EQ(cmd.patterns, std::filesystem::path("patterns"));
    EXPECT_EQ(cmd.config, std::filesystem::path("my.yml"));
    EXPECT_EQ(cmd.strategy, rule::Strategy::Drop);
    EXPECT_EQ(cmd.output, std::filesystem::path("out/list.txt"));
    EXPECT_EQ(cmd.report, std::filesystem::path("r.jsonl"));
    EXPECT_EQ(cmd.title, std::string("My List"));
    EXPECT_TRUE(cmd.skip_errors);
}

TEST(CliTest, Parse_Process_DefaultsUnset) {
    Args args{"unifilter", "process"};
    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    const auto& cmd = std::get<ProcessCommand>(result.command);
    EXPECT_TRUE(cmd.lists.empty());
    EXPECT_FALSE(cmd.patterns.has_value());
    EXPECT_FALSE(cmd.config.has_value());
    EXPECT_FALSE(cmd.strategy.has_value());
    EXPECT_FALSE(cmd.skip_errors);
}

TEST(CliTest, Parse_Process_Help) {
    Args args{"unifilter", "process", "--help"};
    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    ASSERT_TRUE(std::holds_alternative<HelpCommand>(result.command));
    EXPECT_EQ(std::get<HelpCommand>(result.command).command, std::string("process"));
}

TEST(CliTest, Parse_Process_InvalidStrategy) {
    Args args{"unifilter", "process", "--strategy", "magic"};
    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_EQ(result.diagnostic.stderr_message.rfind(
                  "error: invalid value 'magic' for '--strategy <STRATEGY>'", 0),
              0u);
    EXPECT_NE(result.diagnostic.stderr_message.find(
                  "Usage: unifilter process [OPTIONS] [LIST]..."),
              std::string::npos);
}

TEST(CliTest, Parse_Process_MissingValue) {
    Args args{"unifilter", "process", "-o"};
    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.stderr_message.rfind(
                  "error: a value is required for '--output <FILE>' but none was supplied", 0),
              0u);
}

TEST(CliTest, Parse_Process_UnknownOption) {
    Args args{"unifilter", "process", "--fast"};
    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_EQ(result.diagnostic.stderr_message,
              "error: unexpected argument '--fast' found\n\n"
              "Usage: unifilter process [OPTIONS] [LIST]...\n\n"
              "For more information, try '--help'.\n");
}

// ==============================================================================
// TST-CLI-004: глобальные опции
// ==============================================================================

TEST(CliTest, Parse_GlobalOptions_BeforeAndAfterCommand) {
    Args args{"unifilter", "--no-banner", "--num-threads", "4", "process", "-vv", "-q"};
    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    EXPECT_TRUE(result.global.no_banner);
    EXPECT_EQ(result.global.num_threads, std::size_t{4});
    EXPECT_EQ(result.global.verbose, 2);
    EXPECT_TRUE(result.global.quiet);
}

TEST(CliTest, Parse_NumThreads_EqualsForm) {
    Args args{"unifilter", "--num-threads=0", "process"};
    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.global.num_threads, std::size_t{0});
}

TEST(CliTest, Parse_NumThreads_Invalid) {
    Args args{"unifilter", "--num-threads", "lots", "process"};
    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_EQ(result.diagnostic.stderr_message.rfind(
                  "error: invalid value 'lots' for '--num-threads <NUM_THREADS>'", 0),
              0u);
}

// ==============================================================================
// TST-CLI-005: lint
// ==============================================================================

TEST(CliTest, Parse_Lint) {
    Args args{"unifilter", "lint", "patterns/"};
    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    ASSERT_TRUE(std::holds_alternative<LintCommand>(result.command));
    EXPECT_EQ(std::get<LintCommand>(result.command).path, std::filesystem::path("patterns/"));
    EXPECT_FALSE(std::get<LintCommand>(result.command).json);
    EXPECT_FALSE(std::get<LintCommand>(result.command).full);
}

TEST(CliTest, Parse_Lint_JsonAndFull) {
    Args args{"unifilter", "lint", "--json", "patterns/", "--full"};
    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    const auto& lint = std::get<LintCommand>(result.command);
    EXPECT_TRUE(lint.json);
    EXPECT_TRUE(lint.full);
    EXPECT_EQ(lint.path, std::filesystem::path("patterns/"));
}

TEST(CliTest, Parse_Lint_MissingPath) {
    Args args{"unifilter", "lint"};
    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.diagnostic.stderr_message.find("<PATTERNS_DIR>"), std::string::npos);
}

TEST(CliTest, Parse_Lint_ExtraArgument) {
    Args args{"unifilter", "lint", "a", "b"};
    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.stderr_message.rfind("error: unexpected argument 'b' found", 0),
              0u);
}

// ==============================================================================
// TST-CLI-006: help <command>, неизвестные команды
// ==============================================================================

TEST(CliTest, Parse_HelpSubcommand) {
    Args args{"unifilter", "help", "lint"};
    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(std::get<HelpCommand>(result.command).command, std::string("lint"));
}

TEST(CliTest, Parse_UnknownSubcommand) {
    Args args{"unifilter", "merge"};
    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_EQ(result.diagnostic.stderr_message.rfind("error: unrecognized subcommand 'merge'", 0),
              0u);
}

TEST(CliTest, Parse_UnknownGlobalOption) {
    Args args{"unifilter", "--colour", "process"};
    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.diagnostic.stderr_message.find("Usage: unifilter [OPTIONS] <COMMAND>"),
              std::string::npos);
}

}  // namespace unifilter::cli::test
