// ==============================================================================
// unifilter/list_writer.hpp - MOD-0012: Unified List Writer
// ==============================================================================
//
// MOD-0012 output::list_writer
// RapidJSON для JSONL отчёта
//
// Назначение:
// - Генерация итогового списка фильтров из обработанных записей
// - JSONL отчёт по всем записям (включая ошибочные) для диагностики
//
// Формат списка:
//   ! Title / ! Version / ! Last Updated / ! Rule Count
//   ! Original List Titles (из metadata записей "title")
//   ! --- BEGIN RULES ---
//   активные правила (без повторов, отсортированы)
//   ! --- UNTRANSLATED/COMMENTED RULES ---  (если есть)
//   ! --- END RULES ---
//
// В список попадают только записи правил с included == true.
//
// ==============================================================================

#ifndef UNIFILTER_LIST_WRITER_HPP
#define UNIFILTER_LIST_WRITER_HPP

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>
#include <unifilter/record.hpp>

namespace unifilter::output {

struct ListOptions {
    std::string title = "Unified Filter List";
    std::string version = "1.0.0";

    /// Пусто = текущее время UTC
    std::string last_updated;

    /// Маркер комментария канонического диалекта
    std::string comment_marker = "!";
};

struct RenderedList {
    std::string text;
    std::size_t rule_count = 0;       // уникальные активные правила
    std::size_t commented_count = 0;  // уникальные закомментированные правила
};

struct WriteError {
    std::string message;
    std::string path;

    /// "failed to write '<path>' - <message>"
    std::string format() const;
};

struct WriteResult {
    bool ok = false;
    std::size_t rule_count = 0;
    std::size_t commented_count = 0;
    WriteError error;

    explicit operator bool() const { return ok; }
};

/// Сформировать текст итогового списка
RenderedList render_list(const std::vector<rule::RuleRecord>& records, const ListOptions& options);

/// Записать итоговый список в файл (каталоги создаются при необходимости)
WriteResult write_list(const std::filesystem::path& path,
                       const std::vector<rule::RuleRecord>& records, const ListOptions& options);

/// Одна JSON строка отчёта (без завершающего '\n')
std::string record_to_json(const rule::RuleRecord& record);

/// JSONL отчёт: одна строка на каждую запись
WriteResult write_report(const std::filesystem::path& path,
                         const std::vector<rule::RuleRecord>& records);

}  // namespace unifilter::output

#endif  // UNIFILTER_LIST_WRITER_HPP
