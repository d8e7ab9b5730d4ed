// ==============================================================================
// unifilter/list_reader.hpp - MOD-0011: Filter List Reader
// ==============================================================================
//
// MOD-0011 io::list_reader
//
// Назначение:
// - Разбор текста списка фильтров построчно в RuleRecord
// - Классификация строк: rule / comment / metadata
//
// Правила разбора строки (по обрезанному тексту):
// - пустая строка                      -> нет записи
// - "! Key: value"                     -> metadata (key в нижнем регистре,
//                                         пробелы заменены на '_')
// - "!..."  "[Adblock..."              -> comment
// - "#..." кроме "##" "#@" "#?" "#$" "#%" -> comment
// - иначе                              -> rule (raw_rule обрезан, Unknown)
//
// ==============================================================================

#ifndef UNIFILTER_LIST_READER_HPP
#define UNIFILTER_LIST_READER_HPP

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <unifilter/record.hpp>

namespace unifilter::io {

// ----------------------------------------------------------------------------
// ReadError
// ----------------------------------------------------------------------------

enum class ReadErrorKind {
    FileNotFound,      // Файл не найден
    PermissionDenied,  // Нет доступа
    IoError            // Ошибка ввода-вывода
};

struct ReadError {
    ReadErrorKind kind = ReadErrorKind::IoError;
    std::string message;
    std::string path;

    /// "failed to read list '<path>' - <message>"
    std::string format() const;
};

struct ReadResult {
    bool ok = false;
    std::vector<rule::RuleRecord> records;
    ReadError error;

    explicit operator bool() const { return ok; }
};

// ----------------------------------------------------------------------------
// Parsing
// ----------------------------------------------------------------------------

/// Разобрать одну строку. Пустая строка не даёт записи.
std::optional<rule::RuleRecord> parse_line(std::size_t line_number, std::string_view text,
                                           std::string_view list_name);

/// Разобрать содержимое списка целиком (строки нумеруются с 1)
std::vector<rule::RuleRecord> parse_content(std::string_view content, std::string_view list_name);

/// Прочитать список с диска
ReadResult read_list(const std::filesystem::path& path, std::string_view list_name);

/// Имя списка по умолчанию: имя файла без расширения
std::string list_name_from_path(const std::filesystem::path& path);

}  // namespace unifilter::io

#endif  // UNIFILTER_LIST_READER_HPP
