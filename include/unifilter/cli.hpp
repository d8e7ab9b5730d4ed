// ==============================================================================
// unifilter/cli.hpp - MOD-0002: CLI парсинг и команды
// ==============================================================================
//
// MOD-0002 cli
//
// Назначение:
// - Парсинг argv
// - Генерация --help / --version
// - Диагностические ошибки CLI (exit code 2 для ошибок использования)
//
// ==============================================================================

#ifndef UNIFILTER_CLI_HPP
#define UNIFILTER_CLI_HPP

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <unifilter/translator.hpp>

namespace unifilter::cli {

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    bool no_banner = false;                  // --no-banner
    std::optional<std::size_t> num_threads;  // --num-threads (не задано = из конфигурации)
    int verbose = 0;                         // -v (repeatable)
    bool quiet = false;                      // -q
};

// ----------------------------------------------------------------------------
// Подкоманды
// ----------------------------------------------------------------------------

/// process - объединение списков фильтров
struct ProcessCommand {
    std::vector<std::filesystem::path> lists;       // positional
    std::optional<std::filesystem::path> patterns;  // -p, --patterns
    std::optional<std::filesystem::path> config;    // -c, --config
    std::optional<rule::Strategy> strategy;         // -s, --strategy
    std::optional<std::filesystem::path> output;    // -o, --output
    std::optional<std::filesystem::path> report;    // --report
    std::optional<std::string> title;               // --title
    bool skip_errors = false;                       // --skip-errors
};

/// lint - проверка базы синтаксических паттернов
struct LintCommand {
    std::filesystem::path path;
    bool json = false;  // --json: JSONL вместо таблицы
    bool full = false;  // --full: не обрезать матчеры и шаблоны
};

/// help - показать справку
struct HelpCommand {
    std::optional<std::string> command;
};

/// version - показать версию
struct VersionCommand {};

using Command = std::variant<ProcessCommand, LintCommand, HelpCommand, VersionCommand>;

// ----------------------------------------------------------------------------
// Диагностика CLI
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

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

/// Парсить аргументы командной строки
ParseResult parse(int argc, char** argv);

/// Текст --help (для конкретной команды или общий)
std::string render_help(const std::optional<std::string>& command = std::nullopt);

/// Текст --version
std::string render_version();

// ----------------------------------------------------------------------------
// Константы
// ----------------------------------------------------------------------------

constexpr const char* VERSION = "1.0.0";

/// Конфигурация по умолчанию (загружается, если существует)
constexpr const char* DEFAULT_CONFIG = "unifilter.yml";

constexpr const char* ABOUT = "Unify ad-blocking filter lists into one canonical list";

}  // namespace unifilter::cli

#endif  // UNIFILTER_CLI_HPP
