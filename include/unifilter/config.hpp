// ==============================================================================
// unifilter/config.hpp - MOD-0013: Application Configuration
// ==============================================================================
//
// MOD-0013 config
// yaml-cpp для разбора файла конфигурации
//
// Формат (все ключи необязательны):
//
//   settings:
//     log_level: info                 # quiet | info | debug | trace
//     output_file: output/unified_list.txt
//     report_file: output/report.jsonl
//     max_processing_workers: 0       # 0 = число аппаратных потоков
//     translation_strategy: comment_out_untranslatable
//     patterns_dir: patterns
//     list_title: Unified Filter List
//     list_version: 1.0.0
//   filter_lists:
//     easylist: lists/easylist.txt
//
// Отсутствующий файл -> значения по умолчанию. Флаги CLI имеют приоритет.
//
// ==============================================================================

#ifndef UNIFILTER_CONFIG_HPP
#define UNIFILTER_CONFIG_HPP

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <unifilter/translator.hpp>

namespace unifilter::config {

enum class LogLevel { Quiet, Info, Debug, Trace };

std::string to_string(LogLevel level);

/// @throw std::invalid_argument если строка не распознана
LogLevel parse_log_level(std::string_view s);

/// Именованный локальный список фильтров
struct FilterListSource {
    std::string name;
    std::filesystem::path path;
};

struct AppConfig {
    LogLevel log_level = LogLevel::Info;
    std::filesystem::path output_file = "output/unified_list.txt";
    std::optional<std::filesystem::path> report_file;
    std::size_t max_processing_workers = 0;
    rule::Strategy translation_strategy = rule::Strategy::CommentOut;
    std::filesystem::path patterns_dir = "patterns";
    std::string list_title = "Unified Filter List";
    std::string list_version = "1.0.0";

    /// В порядке объявления в файле
    std::vector<FilterListSource> filter_lists;

    /// Был ли загружен файл (false = значения по умолчанию)
    bool from_file = false;
};

struct ConfigError {
    std::string message;
    std::string path;

    /// "config error [<path>]: <message>"
    std::string format() const;
};

struct ConfigResult {
    bool ok = false;
    AppConfig config;
    ConfigError error;

    explicit operator bool() const { return ok; }
};

/// Загрузить конфигурацию из файла; отсутствующий файл даёт значения по умолчанию
ConfigResult load_config(const std::filesystem::path& path);

/// Разобрать YAML содержимое конфигурации (source - для сообщений об ошибках)
ConfigResult parse_config(std::string_view content, std::string_view source);

}  // namespace unifilter::config

#endif  // UNIFILTER_CONFIG_HPP
