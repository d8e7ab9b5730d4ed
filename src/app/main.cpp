// ==============================================================================
// main.cpp - MOD-0001: Точка входа приложения
// ==============================================================================
//
// MOD-0001 app
//
// Точка входа:
// 1. Парсинг argv через MOD-0002 cli
// 2. Создание Writer (MOD-0003 output)
// 3. Dispatch команды
// 4. Возврат exit code (0 ok, 1 ошибка выполнения, 2 ошибка использования)
//
// Исключения перехватываются на границе app.
//
// ==============================================================================

#include "unifilter/cli.hpp"
#include "unifilter/config.hpp"
#include "unifilter/coordinator.hpp"
#include "unifilter/discovery.hpp"
#include "unifilter/list_reader.hpp"
#include "unifilter/list_writer.hpp"
#include "unifilter/output.hpp"
#include "unifilter/platform.hpp"
#include "unifilter/syntax_db.hpp"

#include <cstdint>
#include <exception>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <rapidjson/document.h>
#include <string>
#include <system_error>
#include <type_traits>
#include <variant>
#include <vector>

namespace {

// ----------------------------------------------------------------------------
// ASCII Banner (--no-banner)
// ----------------------------------------------------------------------------

constexpr const char* BANNER = R"(
    ██╗   ██╗███╗   ██╗██╗███████╗██╗██╗  ████████╗███████╗██████╗
    ██║   ██║████╗  ██║██║██╔════╝██║██║  ╚══██╔══╝██╔════╝██╔══██╗
    ██║   ██║██╔██╗ ██║██║█████╗  ██║██║     ██║   █████╗  ██████╔╝
    ██║   ██║██║╚██╗██║██║██╔══╝  ██║██║     ██║   ██╔══╝  ██╔══██╗
    ╚██████╔╝██║ ╚████║██║██║     ██║███████╗██║   ███████╗██║  ██║
     ╚═════╝ ╚═╝  ╚═══╝╚═╝╚═╝     ╚═╝╚══════╝╚═╝   ╚══════╝╚═╝  ╚═╝
)";

void print_banner(unifilter::output::Writer& writer, bool no_banner, bool quiet) {
    if (no_banner || quiet) {
        return;
    }
    writer.write(unifilter::output::Stream::Stderr, BANNER);
    writer.write_line(unifilter::output::Stream::Stderr, "");
}

/// Уровень журнала из конфигурации применяется, если -v/-q не заданы
unifilter::output::OutputConfig apply_log_level(unifilter::output::OutputConfig cfg,
                                                 unifilter::config::LogLevel level) {
    using unifilter::config::LogLevel;
    if (cfg.quiet || cfg.verbose > 0) {
        return cfg;
    }
    switch (level) {
    case LogLevel::Quiet:
        cfg.quiet = true;
        break;
    case LogLevel::Info:
        break;
    case LogLevel::Debug:
        cfg.verbose = 1;
        break;
    case LogLevel::Trace:
        cfg.verbose = 2;
        break;
    }
    return cfg;
}

std::string join(const std::vector<std::string>& items, const char* sep) {
    std::string out;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out += sep;
        }
        out += items[i];
    }
    return out;
}

// ----------------------------------------------------------------------------
// process
// ----------------------------------------------------------------------------

struct ListInput {
    std::string name;
    std::filesystem::path path;
};

void print_summary(unifilter::output::Writer& writer, const unifilter::process::ProcessStats& s) {
    using unifilter::output::Table;

    Table table;
    table.set_headers({"Outcome", "Rules"});
    table.set_align(1, Table::Align::Right);
    table.add_row({"valid", std::to_string(s.valid)});
    table.add_row({"needs translation", std::to_string(s.needs_translation)});
    table.add_row({"  translated", std::to_string(s.translated)});
    table.add_row({"unsupported", std::to_string(s.unsupported)});
    table.add_row({"untranslatable (strategy applied)", std::to_string(s.translation_failed)});
    table.add_row({"validation errors", std::to_string(s.validation_errors)});
    table.add_row({"translation errors", std::to_string(s.translation_errors)});
    table.add_row({"worker failures", std::to_string(s.worker_failures)});
    table.add_row({"included", std::to_string(s.included)});
    table.add_row({"excluded", std::to_string(s.excluded)});
    table.print(writer);
}

int run_process(const unifilter::cli::ProcessCommand& cmd,
                const unifilter::cli::GlobalOptions& global, unifilter::output::Writer& writer) {
    using namespace unifilter;

    // 1. Конфигурация
    const std::filesystem::path config_path =
        cmd.config.value_or(platform::path_from_utf8(cli::DEFAULT_CONFIG));
    std::error_code ec;
    if (cmd.config.has_value() && !std::filesystem::exists(config_path, ec)) {
        writer.error("configuration file not found: " + platform::path_to_utf8(config_path));
        return 1;
    }

    auto config_result = config::load_config(config_path);
    if (!config_result) {
        writer.error(config_result.error.format());
        return 1;
    }
    const config::AppConfig& cfg = config_result.config;

    // Уровень журнала из конфигурации: отдельный Writer с теми же флагами
    std::unique_ptr<output::Writer> level_writer;
    output::Writer* log = &writer;
    output::OutputConfig log_cfg = apply_log_level(writer.config(), cfg.log_level);
    if (log_cfg.quiet != writer.config().quiet || log_cfg.verbose != writer.config().verbose) {
        level_writer = std::make_unique<output::Writer>(log_cfg);
        log = level_writer.get();
    }

    if (cfg.from_file) {
        log->debug("loaded configuration from " + platform::path_to_utf8(config_path));
    }
    log->debug("host: " + platform::os_name() + ", " +
               std::to_string(platform::hardware_threads()) + " hardware threads");

    // 2. Флаги CLI поверх конфигурации
    const rule::Strategy strategy = cmd.strategy.value_or(cfg.translation_strategy);
    const std::size_t workers = global.num_threads.value_or(cfg.max_processing_workers);
    const std::filesystem::path patterns_dir = cmd.patterns.value_or(cfg.patterns_dir);
    const std::filesystem::path output_path = cmd.output.value_or(cfg.output_file);
    const std::optional<std::filesystem::path> report_path =
        cmd.report.has_value() ? cmd.report : cfg.report_file;

    // 3. Источники списков
    std::vector<ListInput> inputs;
    if (!cmd.lists.empty()) {
        io::DiscoveryOptions disc_opt;
        disc_opt.extensions = io::list_extensions();
        disc_opt.skip_errors = cmd.skip_errors;
        disc_opt.on_warning = [log](std::string_view message) { log->warn(message); };

        std::vector<std::filesystem::path> files;
        try {
            files = io::discover_files(cmd.lists, disc_opt);
        } catch (const std::exception& e) {
            log->error(e.what());
            return 1;
        }
        for (const auto& file : files) {
            inputs.push_back(ListInput{io::list_name_from_path(file), file});
        }
    } else {
        for (const auto& source : cfg.filter_lists) {
            inputs.push_back(ListInput{source.name, source.path});
        }
    }

    if (inputs.empty()) {
        log->error("no filter lists given (pass LIST paths or set filter_lists in the config)");
        return 1;
    }

    // 4. База синтаксических паттернов
    log->info("Loading syntax patterns from: " + platform::path_to_utf8(patterns_dir));
    auto db_result = rule::load(patterns_dir);
    if (!db_result) {
        log->error(db_result.error.format());
        return 1;
    }
    const rule::SyntaxDatabase& db = db_result.database;
    log->info("Loaded " + std::to_string(db.size()) + " syntax patterns (dialects: " +
              join(db.dialects(), ", ") + "; canonical: " + db.canonical_dialect() + ")");

    // 5. Чтение списков
    std::vector<rule::RuleRecord> records;
    std::size_t lists_read = 0;
    for (const auto& input : inputs) {
        auto read = io::read_list(input.path, input.name);
        if (!read) {
            if (cmd.skip_errors) {
                log->warn(read.error.format());
                continue;
            }
            log->error(read.error.format());
            return 1;
        }
        log->debug("read " + std::to_string(read.records.size()) + " records from '" +
                   input.name + "'");
        records.insert(records.end(), std::make_move_iterator(read.records.begin()),
                       std::make_move_iterator(read.records.end()));
        ++lists_read;
    }

    if (lists_read == 0) {
        log->error("none of the filter lists could be read");
        return 1;
    }
    log->info("Read " + std::to_string(records.size()) + " records from " +
              std::to_string(lists_read) + " lists");

    // 6. Обработка
    process::ProcessOptions options;
    options.strategy = strategy;
    options.workers = workers;

    process::ProcessResult processed;
    try {
        processed = process::process_all(std::move(records), db, options, *log);
    } catch (const std::system_error& e) {
        log->error(std::string("processing aborted: ") + e.what());
        return 1;
    }
    process::sort_by_origin(processed.records);

    const auto& stats = processed.stats;
    log->info("Processed " + std::to_string(stats.rules) + " rules with " +
              std::to_string(stats.workers_used) + " workers in " +
              std::to_string(stats.wall_time.count()) + " ms (strategy: " +
              rule::to_string(strategy) + ")");

    // 7. Итоговый список и отчёт
    output::ListOptions list_opt;
    list_opt.title = cmd.title.value_or(cfg.list_title);
    list_opt.version = cfg.list_version;
    list_opt.comment_marker = db.comment_marker();

    auto written = output::write_list(output_path, processed.records, list_opt);
    if (!written) {
        log->error(written.error.format());
        return 1;
    }

    if (report_path.has_value()) {
        auto report = output::write_report(*report_path, processed.records);
        if (!report) {
            log->error(report.error.format());
            return 1;
        }
        log->info("Wrote report for " + std::to_string(processed.records.size()) +
                  " records to " + platform::path_to_utf8(*report_path));
    }

    if (!log->config().quiet) {
        print_summary(*log, stats);
    }

    log->info("Wrote " + std::to_string(written.rule_count) + " rules (" +
              std::to_string(written.commented_count) + " commented out) to " +
              platform::path_to_utf8(output_path));
    return 0;
}

// ----------------------------------------------------------------------------
// lint
// ----------------------------------------------------------------------------

void print_pattern_json(unifilter::output::Writer& writer, const unifilter::rule::SyntaxDatabase& db,
                        const unifilter::rule::SyntaxPattern& p, std::size_t rank) {
    using namespace unifilter;

    rapidjson::Document doc;
    doc.SetObject();
    auto& alloc = doc.GetAllocator();
    auto add = [&doc, &alloc](const char* key, const std::string& value) {
        doc.AddMember(rapidjson::Value(key, alloc), rapidjson::Value(value.c_str(), alloc), alloc);
    };

    doc.AddMember("rank", static_cast<std::uint64_t>(rank), alloc);
    add("name", p.name);
    add("dialect", p.dialect);
    add("category", p.category);
    add("applies_to", rule::to_string(p.applies_to));
    add("matcher_type", rule::to_string(p.matcher.type()));
    add("expression", p.matcher.expression());
    doc.AddMember("ignore_case", p.matcher.ignore_case(), alloc);
    if (p.translation_template) {
        add("template", p.translation_template->text);
    }
    doc.AddMember("canonical", db.is_canonical(p), alloc);
    add("source", p.source);

    writer.write_json_line(doc);
}

int run_lint(const unifilter::cli::LintCommand& cmd, unifilter::output::Writer& writer) {
    using namespace unifilter;

    writer.info("Validating syntax patterns in: " + platform::path_to_utf8(cmd.path));

    auto result = rule::load(cmd.path);
    if (!result) {
        writer.error(result.error.format());
        return 1;
    }
    const rule::SyntaxDatabase& db = result.database;
    const bool full = cmd.full || writer.config().full_output;

    output::Table table;
    table.set_headers({"#", "Name", "Dialect", "Category", "Applies to", "Matcher", "Template"});
    table.set_align(0, output::Table::Align::Right);

    std::size_t rank = 0;
    for (auto kind : {rule::RecordKind::Rule, rule::RecordKind::Comment,
                      rule::RecordKind::Metadata}) {
        for (const auto& p : db.matchers_for(kind)) {
            ++rank;
            if (cmd.json) {
                print_pattern_json(writer, db, p, rank);
                continue;
            }
            std::string matcher = rule::to_string(p.matcher.type()) + " " +
                                  output::format_field_length(p.matcher.expression(), 40, full);
            std::string tpl =
                p.translation_template
                    ? output::format_field_length(p.translation_template->text, 30, full)
                    : (db.is_canonical(p) ? "(canonical)" : "-");
            table.add_row({std::to_string(rank), p.name, p.dialect, p.category,
                           rule::to_string(p.applies_to), matcher, tpl});
        }
    }

    if (table.row_count() > 0) {
        table.print(writer);
    }

    writer.info("Loaded " + std::to_string(db.size()) + " patterns from " +
                std::to_string(db.sources().size()) + " descriptors (canonical dialect: " +
                db.canonical_dialect() + ")");
    return 0;
}

// ----------------------------------------------------------------------------
// Главная функция выполнения (run)
// ----------------------------------------------------------------------------

int run(int argc, char** argv) {
    using namespace unifilter;

    // 1. Парсинг argv
    cli::ParseResult parse_result = cli::parse(argc, argv);

    // 2. Создание Writer
    output::OutputConfig out_cfg;
    out_cfg.quiet = parse_result.global.quiet;
    out_cfg.verbose = parse_result.global.verbose;
    out_cfg.no_banner = parse_result.global.no_banner;
    output::Writer writer(out_cfg);

    // 3. Ошибки парсинга выводятся без префикса [x]
    if (!parse_result.ok) {
        writer.write(output::Stream::Stderr, parse_result.diagnostic.stderr_message);
        return parse_result.diagnostic.exit_code;
    }

    // 4. Dispatch команды
    return std::visit(
        [&](auto&& cmd) -> int {
            using T = std::decay_t<decltype(cmd)>;

            if constexpr (std::is_same_v<T, cli::HelpCommand>) {
                std::string help_text = cli::render_help(cmd.command);
                if (cmd.command.has_value() && help_text.rfind("error:", 0) == 0) {
                    writer.write(output::Stream::Stderr, help_text);
                    return 2;
                }
                writer.write(output::Stream::Stdout, help_text);
                return 0;
            } else if constexpr (std::is_same_v<T, cli::VersionCommand>) {
                writer.write(output::Stream::Stdout, cli::render_version());
                return 0;
            } else if constexpr (std::is_same_v<T, cli::ProcessCommand>) {
                print_banner(writer, out_cfg.no_banner, out_cfg.quiet);
                return run_process(cmd, parse_result.global, writer);
            } else if constexpr (std::is_same_v<T, cli::LintCommand>) {
                print_banner(writer, out_cfg.no_banner, out_cfg.quiet);
                return run_lint(cmd, writer);
            } else {
                return 1;
            }
        },
        parse_result.command);
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// main
// ----------------------------------------------------------------------------

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        // Формат ошибки "[x] <err>"
        std::cerr << "[x] " << e.what() << "\n";
        return 1;
    } catch (...) {
        std::cerr << "[x] Unknown error occurred\n";
        return 1;
    }
}
