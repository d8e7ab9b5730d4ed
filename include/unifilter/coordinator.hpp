// ==============================================================================
// unifilter/coordinator.hpp - MOD-0010: Processing Coordinator
// ==============================================================================
//
// MOD-0010 process::coordinator
//
// Назначение:
// - Распределение записей правил по пулу рабочих потоков
// - Изоляция сбоев: исключение одной записи не прерывает пакет
// - Слияние результатов и статистика прохода
//
// Модель:
// - Пул фиксированного размера (std::thread), общий атомарный индекс
// - SyntaxDatabase разделяется по const& без блокировок
// - Список завершённых записей и Writer защищены одним мьютексом
// - Записи не-правила (comment, metadata) не диспетчеризуются и
//   добавляются в результат без изменений
// - Порядок результата - порядок завершения; sort_by_origin() упорядочивает
//   по (list_name, line_number)
//
// ==============================================================================

#ifndef UNIFILTER_COORDINATOR_HPP
#define UNIFILTER_COORDINATOR_HPP

#include <chrono>
#include <cstddef>
#include <functional>
#include <vector>
#include <unifilter/output.hpp>
#include <unifilter/record.hpp>
#include <unifilter/syntax_db.hpp>
#include <unifilter/translator.hpp>

namespace unifilter::process {

// ============================================================================
// Options / Stats
// ============================================================================

/// Обработка одной записи (validate + translate). Заменяемая точка для тестов.
using UnitFn =
    std::function<rule::RuleRecord(rule::RuleRecord, const rule::SyntaxDatabase&, rule::Strategy)>;

/// Уведомление о прогрессе: (завершено, всего)
using ProgressFn = std::function<void(std::size_t, std::size_t)>;

struct ProcessOptions {
    rule::Strategy strategy = rule::Strategy::CommentOut;

    /// Количество рабочих потоков; 0 = число аппаратных потоков
    std::size_t workers = 0;

    /// Уведомлять о прогрессе каждые N завершённых записей (0 = только финальное)
    std::size_t progress_interval = 1000;

    ProgressFn on_progress;

    /// Пусто = process_one
    UnitFn unit;
};

struct ProcessStats {
    std::size_t total = 0;
    std::size_t rules = 0;
    std::size_t non_rules = 0;

    // validation_status
    std::size_t valid = 0;
    std::size_t needs_translation = 0;
    std::size_t unsupported = 0;
    std::size_t errors = 0;

    // translation_status
    std::size_t translated = 0;
    std::size_t translation_failed = 0;

    // error_kind
    std::size_t validation_errors = 0;
    std::size_t translation_errors = 0;
    std::size_t worker_failures = 0;

    std::size_t included = 0;
    std::size_t excluded = 0;

    std::size_t workers_used = 0;
    std::chrono::milliseconds wall_time{0};
};

struct ProcessResult {
    std::vector<rule::RuleRecord> records;
    ProcessStats stats;
};

// ============================================================================
// API
// ============================================================================

/// Полная обработка одной записи правила: validate, затем translate
rule::RuleRecord process_one(rule::RuleRecord record, const rule::SyntaxDatabase& db,
                             rule::Strategy strategy);

/// Обработать все записи. Для N входных записей возвращает ровно N.
/// @throw std::system_error если пул потоков не удалось запустить
///        (уже запущенные потоки остановлены и дождались завершения)
ProcessResult process_all(std::vector<rule::RuleRecord> records, const rule::SyntaxDatabase& db,
                          const ProcessOptions& options, output::Writer& log);

/// Устойчивая сортировка по (list_name, line_number)
void sort_by_origin(std::vector<rule::RuleRecord>& records);

/// Пересчитать статистику по готовым записям (без workers_used/wall_time)
ProcessStats collect_stats(const std::vector<rule::RuleRecord>& records);

}  // namespace unifilter::process

#endif  // UNIFILTER_COORDINATOR_HPP
