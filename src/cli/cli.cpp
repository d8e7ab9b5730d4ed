// ==============================================================================
// cli.cpp - MOD-0002: CLI парсинг
// ==============================================================================
//
// MOD-0002 cli
// Собственный слой CLI: формат help/ошибок в стиле clap
//
// ==============================================================================

#include "unifilter/cli.hpp"

#include "unifilter/platform.hpp"

#include <cstring>
#include <stdexcept>

namespace unifilter::cli {

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

namespace {

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

bool starts_with(const char* str, const char* prefix) {
    return std::strncmp(str, prefix, std::strlen(prefix)) == 0;
}

std::string render_usage_error(const std::string& error_msg, const char* usage) {
    return error_msg + "\n\n"
                       "Usage: " +
           std::string(usage) +
           "\n\n"
           "For more information, try '--help'.\n";
}

constexpr const char* USAGE_MAIN = "unifilter [OPTIONS] <COMMAND>";
constexpr const char* USAGE_PROCESS = "unifilter process [OPTIONS] [LIST]...";
constexpr const char* USAGE_LINT = "unifilter lint [OPTIONS] <PATTERNS_DIR>";

/// Разобрать неотрицательное целое; nullopt при ошибке
std::optional<std::size_t> parse_count(const char* text) {
    if (text == nullptr || *text == '\0') {
        return std::nullopt;
    }
    std::size_t value = 0;
    for (const char* p = text; *p != '\0'; ++p) {
        if (*p < '0' || *p > '9') {
            return std::nullopt;
        }
        value = value * 10 + static_cast<std::size_t>(*p - '0');
        if (value > 4096) {
            return std::nullopt;
        }
    }
    return value;
}

/// Глобальный флаг без значения (допустим до и после подкоманды)
bool apply_global_flag(const char* arg, GlobalOptions& global) {
    if (str_eq(arg, "--no-banner")) {
        global.no_banner = true;
        return true;
    }
    if (str_eq(arg, "-q")) {
        global.quiet = true;
        return true;
    }
    if (arg[0] == '-' && arg[1] == 'v') {
        // -v, -vv, -vvv
        int count = 0;
        for (const char* p = arg + 1; *p != '\0'; ++p) {
            if (*p != 'v') {
                return false;
            }
            ++count;
        }
        global.verbose += count;
        return true;
    }
    return false;
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// render_version
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string("unifilter ") + VERSION + "\n";
}

// ----------------------------------------------------------------------------
// render_help
// ----------------------------------------------------------------------------

std::string render_help(const std::optional<std::string>& command) {
    if (!command.has_value()) {
        return std::string(ABOUT) +
               "\n"
               "\n"
               "Usage: unifilter [OPTIONS] <COMMAND>\n"
               "\n"
               "Commands:\n"
               "  process  Validate, translate and merge filter lists into one list\n"
               "  lint     Load a syntax pattern database and print its patterns\n"
               "  help     Print this message or the help of the given subcommand(s)\n"
               "\n"
               "Options:\n"
               "      --no-banner                  Hide the banner\n"
               "      --num-threads <NUM_THREADS>  Limit the thread number (default: num of CPUs)\n"
               "  -v...                            Print verbose output\n"
               "  -q                               Suppress informational output\n"
               "  -h, --help                       Print help\n"
               "  -V, --version                    Print version\n"
               "\n"
               "Examples:\n"
               "\n"
               "    Merge two lists using the bundled patterns:\n"
               "        ./unifilter process lists/easylist.txt lists/adguard.txt -p patterns/\n"
               "\n"
               "    Drop untranslatable rules and write a diagnostics report:\n"
               "        ./unifilter process -c unifilter.yml -s drop --report report.jsonl\n"
               "\n"
               "    Check a pattern database:\n"
               "        ./unifilter lint patterns/\n";
    } else if (*command == "process") {
        return "Validate, translate and merge filter lists into one list\n"
               "\n"
               "Usage: unifilter process [OPTIONS] [LIST]...\n"
               "\n"
               "Arguments:\n"
               "  [LIST]...  Filter list files (default: filter_lists from the config)\n"
               "\n"
               "Options:\n"
               "  -p, --patterns <DIR>       Syntax pattern database directory\n"
               "  -c, --config <FILE>        Configuration file (default: unifilter.yml)\n"
               "  -s, --strategy <STRATEGY>  Handling of untranslatable rules: rewrite,\n"
               "                             comment_out_untranslatable, drop, passthrough\n"
               "  -o, --output <FILE>        Output list file\n"
               "      --report <FILE>        Write a JSONL report for every record\n"
               "      --title <TITLE>        Title of the unified list\n"
               "      --skip-errors          Skip unreadable lists and continue\n"
               "  -h, --help                 Print help\n";
    } else if (*command == "lint") {
        return "Load a syntax pattern database and print its patterns\n"
               "\n"
               "Usage: unifilter lint [OPTIONS] <PATTERNS_DIR>\n"
               "\n"
               "Arguments:\n"
               "  <PATTERNS_DIR>  Directory with pattern descriptors (*.yml, *.yaml, *.json)\n"
               "\n"
               "Options:\n"
               "      --json  Print one JSON object per pattern instead of a table\n"
               "      --full  Do not truncate matcher expressions and templates\n"
               "  -h, --help  Print help\n";
    } else if (*command == "help") {
        return "Print this message or the help of the given subcommand(s)\n"
               "\n"
               "Usage: unifilter help [COMMAND]\n";
    } else {
        return "error: unrecognized subcommand '" + *command + "'\n";
    }
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

    auto usage_error = [&](const std::string& message, const char* usage) {
        result.ok = false;
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message = render_usage_error(message, usage);
        return result;
    };

    // Значение опции: "--flag value" или "--flag=value"
    auto take_value = [&](int& i, const char* flag) -> const char* {
        const char* arg = argv[i];
        const std::size_t len = std::strlen(flag);
        if (std::strncmp(arg, flag, len) == 0 && arg[len] == '=') {
            return arg + len + 1;
        }
        if (i + 1 < argc) {
            ++i;
            return argv[i];
        }
        return nullptr;
    };

    auto missing_value = [](const char* flag, const char* name) {
        return "error: a value is required for '" + std::string(flag) + " <" + name +
               ">' but none was supplied";
    };

    // Глобальные опции до подкоманды
    int cmd_idx = argc;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (apply_global_flag(arg, result.global)) {
            continue;
        } else if (str_eq(arg, "--num-threads") || starts_with(arg, "--num-threads=")) {
            const char* value = take_value(i, "--num-threads");
            if (value == nullptr) {
                return usage_error(missing_value("--num-threads", "NUM_THREADS"), USAGE_MAIN);
            }
            auto n = parse_count(value);
            if (!n) {
                return usage_error("error: invalid value '" + std::string(value) +
                                       "' for '--num-threads <NUM_THREADS>'",
                                   USAGE_MAIN);
            }
            result.global.num_threads = *n;
        } else if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{};
            return result;
        } else if (str_eq(arg, "-V") || str_eq(arg, "--version")) {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        } else if (arg[0] == '-') {
            return usage_error("error: unexpected argument '" + std::string(arg) + "' found",
                               USAGE_MAIN);
        } else {
            cmd_idx = i;
            break;
        }
    }

    if (cmd_idx >= argc) {
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message = render_help(std::nullopt);
        return result;
    }

    const char* cmd = argv[cmd_idx];

    if (str_eq(cmd, "process")) {
        ProcessCommand process_cmd;
        for (int i = cmd_idx + 1; i < argc; ++i) {
            const char* arg = argv[i];

            if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
                result.ok = true;
                result.command = HelpCommand{"process"};
                return result;
            } else if (apply_global_flag(arg, result.global)) {
                continue;
            } else if (str_eq(arg, "-p") || str_eq(arg, "--patterns") ||
                       starts_with(arg, "--patterns=")) {
                const char* value = take_value(i, "--patterns");
                if (value == nullptr) {
                    return usage_error(missing_value("--patterns", "DIR"), USAGE_PROCESS);
                }
                process_cmd.patterns = platform::path_from_utf8(value);
            } else if (str_eq(arg, "-c") || str_eq(arg, "--config") ||
                       starts_with(arg, "--config=")) {
                const char* value = take_value(i, "--config");
                if (value == nullptr) {
                    return usage_error(missing_value("--config", "FILE"), USAGE_PROCESS);
                }
                process_cmd.config = platform::path_from_utf8(value);
            } else if (str_eq(arg, "-s") || str_eq(arg, "--strategy") ||
                       starts_with(arg, "--strategy=")) {
                const char* value = take_value(i, "--strategy");
                if (value == nullptr) {
                    return usage_error(missing_value("--strategy", "STRATEGY"), USAGE_PROCESS);
                }
                try {
                    process_cmd.strategy = rule::parse_strategy(value);
                } catch (const std::invalid_argument&) {
                    return usage_error("error: invalid value '" + std::string(value) +
                                           "' for '--strategy <STRATEGY>'\n"
                                           "  [possible values: rewrite, "
                                           "comment_out_untranslatable, drop, passthrough]",
                                       USAGE_PROCESS);
                }
            } else if (str_eq(arg, "-o") || str_eq(arg, "--output") ||
                       starts_with(arg, "--output=")) {
                const char* value = take_value(i, "--output");
                if (value == nullptr) {
                    return usage_error(missing_value("--output", "FILE"), USAGE_PROCESS);
                }
                process_cmd.output = platform::path_from_utf8(value);
            } else if (str_eq(arg, "--report") || starts_with(arg, "--report=")) {
                const char* value = take_value(i, "--report");
                if (value == nullptr) {
                    return usage_error(missing_value("--report", "FILE"), USAGE_PROCESS);
                }
                process_cmd.report = platform::path_from_utf8(value);
            } else if (str_eq(arg, "--title") || starts_with(arg, "--title=")) {
                const char* value = take_value(i, "--title");
                if (value == nullptr) {
                    return usage_error(missing_value("--title", "TITLE"), USAGE_PROCESS);
                }
                process_cmd.title = std::string(value);
            } else if (str_eq(arg, "--skip-errors")) {
                process_cmd.skip_errors = true;
            } else if (arg[0] == '-' && arg[1] != '\0') {
                return usage_error("error: unexpected argument '" + std::string(arg) + "' found",
                                   USAGE_PROCESS);
            } else {
                process_cmd.lists.push_back(platform::path_from_utf8(arg));
            }
        }

        result.ok = true;
        result.command = std::move(process_cmd);
    } else if (str_eq(cmd, "lint")) {
        LintCommand lint_cmd;
        bool have_path = false;
        for (int i = cmd_idx + 1; i < argc; ++i) {
            const char* arg = argv[i];

            if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
                result.ok = true;
                result.command = HelpCommand{"lint"};
                return result;
            } else if (str_eq(arg, "--json")) {
                lint_cmd.json = true;
            } else if (str_eq(arg, "--full")) {
                lint_cmd.full = true;
            } else if (apply_global_flag(arg, result.global)) {
                continue;
            } else if (arg[0] == '-') {
                return usage_error("error: unexpected argument '" + std::string(arg) + "' found",
                                   USAGE_LINT);
            } else if (have_path) {
                return usage_error("error: unexpected argument '" + std::string(arg) + "' found",
                                   USAGE_LINT);
            } else {
                lint_cmd.path = platform::path_from_utf8(arg);
                have_path = true;
            }
        }

        if (!have_path) {
            return usage_error(
                "error: the following required arguments were not provided:\n  <PATTERNS_DIR>",
                USAGE_LINT);
        }

        result.ok = true;
        result.command = std::move(lint_cmd);
    } else if (str_eq(cmd, "help")) {
        HelpCommand help_cmd;
        if (cmd_idx + 1 < argc) {
            help_cmd.command = std::string(argv[cmd_idx + 1]);
        }
        result.ok = true;
        result.command = help_cmd;
    } else if (str_eq(cmd, "version")) {
        result.ok = true;
        result.command = VersionCommand{};
    } else {
        return usage_error("error: unrecognized subcommand '" + std::string(cmd) + "'",
                           USAGE_MAIN);
    }

    return result;
}

}  // namespace unifilter::cli
