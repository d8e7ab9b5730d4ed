// ==============================================================================
// unifilter/output.hpp - MOD-0003: Пользовательский вывод и журнал
// ==============================================================================
//
// MOD-0003 output
// RapidJSON для JSON сериализации
//
// Назначение:
// - Единственная точка записи в stdout/stderr
// - Журнал уровней error/warn/info/debug/trace (префиксы [x] [!] [+] [*] [~])
// - Прогресс обработки правил
// - Таблицы (Unicode box-drawing) и JSONL вывод
// - Цветные префиксы (ANSI escape codes) только для TTY
//
// Writer не является глобальным объектом: он создаётся в main и передаётся
// явно (в том числе в process::process_all). Writer не потокобезопасен,
// вызывающий код сериализует доступ к нему.
//
// ==============================================================================

#ifndef UNIFILTER_OUTPUT_HPP
#define UNIFILTER_OUTPUT_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

// Forward declarations для JSON
namespace rapidjson {
class CrtAllocator;
template <typename BaseAllocator>
class MemoryPoolAllocator;
template <typename Encoding, typename Allocator>
class GenericValue;
template <typename CharType>
struct UTF8;
using Value = GenericValue<UTF8<char>, MemoryPoolAllocator<CrtAllocator>>;
}  // namespace rapidjson

namespace unifilter::output {

enum class Stream { Stdout, Stderr };

/// Уровень сообщения журнала
enum class Level {
    Error,  // [x] печатается всегда
    Warn,   // [!] подавляется -q
    Info,   // [+] подавляется -q
    Debug,  // [*] verbose >= 1
    Trace   // [~] verbose >= 2
};

struct OutputConfig {
    bool quiet = false;        // -q
    int verbose = 0;           // -v, -vv
    bool no_banner = false;    // --no-banner
    bool full_output = false;  // не обрезать длинные поля таблиц
};

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    void write(Stream s, std::string_view bytes);
    void write_line(Stream s, std::string_view bytes);

    /// Будет ли сообщение уровня level напечатано
    bool enabled(Level level) const;

    /// "<prefix> <message>\n" в stderr, если уровень включён
    void log(Level level, std::string_view message);

    void error(std::string_view message) { log(Level::Error, message); }
    void warn(std::string_view message) { log(Level::Warn, message); }
    void info(std::string_view message) { log(Level::Info, message); }
    void debug(std::string_view message) { log(Level::Debug, message); }
    void trace(std::string_view message) { log(Level::Trace, message); }

    /// Компактный JSON + '\n' в stdout (JSONL)
    void write_json_line(const rapidjson::Value& value);

    // Прогресс: "[+] <label>: <current>/<total> (<pct>%)".
    // На TTY строка перерисовывается через '\r', иначе - строка на каждый tick.
    void progress_begin(std::string_view label, std::size_t total);
    void progress_tick(std::size_t current);
    void progress_end();

    bool progress_active() const { return progress_active_; }
    std::size_t progress_current() const { return progress_current_; }

    void flush();

    const OutputConfig& config() const { return config_; }

private:
    void finish_progress_line();

    OutputConfig config_;

    std::string progress_label_;
    std::size_t progress_total_ = 0;
    std::size_t progress_current_ = 0;
    bool progress_active_ = false;
    bool progress_inline_ = false;  // на экране незавершённая строка прогресса
};

// ----------------------------------------------------------------------------
// Table
// ----------------------------------------------------------------------------

class Table {
public:
    enum class Align { Left, Right };

    void set_headers(std::vector<std::string> headers);
    void add_row(std::vector<std::string> cells);

    /// Выравнивание столбца (по умолчанию Left)
    void set_align(std::size_t column, Align align);

    std::size_t row_count() const { return rows_.size(); }

    std::string to_string() const;

    /// Вывести таблицу в stdout
    void print(Writer& w) const;

private:
    std::vector<std::string> headers_;
    std::vector<std::vector<std::string>> rows_;
    std::vector<Align> align_;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// Префикс уровня: "[x]", "[!]", "[+]", "[*]", "[~]"
std::string_view level_prefix(Level level);

/// "<prefix> <message>\n" без цвета
std::string format_message(Level level, std::string_view message);

/// Нормализовать поле для ячейки таблицы: \n, \r, \t и повторные пробелы
/// заменяются одним пробелом; при full_output=false длинные строки
/// обрезаются до max_length с суффиксом "..."
std::string format_field_length(std::string_view field, std::size_t max_length,
                                bool full_output);

/// Поддерживает ли поток цвета (TTY check)
bool supports_color(Stream s);

}  // namespace unifilter::output

#endif  // UNIFILTER_OUTPUT_HPP
