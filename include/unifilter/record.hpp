// ==============================================================================
// unifilter/record.hpp - MOD-0006: Rule Record
// ==============================================================================
//
// MOD-0006 rule::record
//
// Назначение:
// - RuleRecord: единица работы конвейера (одна строка исходного списка)
// - Статусы валидации и трансляции
// - Преобразования enum <-> строка
//
// Инварианты:
// - validation_status записывается один раз за проход и не возвращается в Unknown
// - translation_status != NotApplicable только при validation_status
//   NeedsTranslation или Unsupported
// - processing_error непустой тогда и только тогда, когда один из статусов Error
//
// ==============================================================================

#ifndef UNIFILTER_RECORD_HPP
#define UNIFILTER_RECORD_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace unifilter::rule {

// ============================================================================
// Enums
// ============================================================================

/// Тип строки исходного списка
enum class RecordKind { Rule, Comment, Metadata };

/// Результат классификации правила
enum class ValidationStatus { Unknown, Valid, NeedsTranslation, Unsupported, Error };

/// Результат трансляции правила
enum class TranslationStatus { NotApplicable, Translated, Failed, Error };

/// Стадия, на которой правило получило статус Error
enum class ErrorKind { None, Validation, Translation, Worker };

// ============================================================================
// RuleRecord
// ============================================================================

struct RuleRecord {
    // Provenance (не меняется после разбора)
    std::string list_name;
    std::size_t line_number = 0;
    std::string original_line;

    RecordKind kind = RecordKind::Rule;

    /// Тело правила без декораций списка; после трансляции - итоговый текст
    std::string raw_rule;

    ValidationStatus validation_status = ValidationStatus::Unknown;
    TranslationStatus translation_status = TranslationStatus::NotApplicable;

    std::optional<std::string> processing_error;
    ErrorKind error_kind = ErrorKind::None;

    /// Пояснение к классификации (какой паттерн сработал и почему)
    std::string validation_notes;

    /// Имя паттерна, определившего результат валидации
    std::optional<std::string> matched_pattern;

    /// Попадает ли запись в итоговый список
    bool included = false;

    // Только для RecordKind::Metadata: "! Title: EasyList" -> ("title", "EasyList")
    std::string metadata_key;
    std::string metadata_value;
};

// ============================================================================
// Record helpers
// ============================================================================

/// Создать запись правила со статусом Unknown (как её отдаёт разбор списка)
RuleRecord make_rule(std::string list_name, std::size_t line_number, std::string raw_rule);

/// Перевести запись в статус Error по обеим стадиям.
/// Используется на границе единицы работы (ErrorKind::Worker).
void mark_failed(RuleRecord& record, ErrorKind kind, std::string message);

/// Есть ли у записи статус Error
bool has_error(const RuleRecord& record);

/// Ключ упорядочивания по происхождению: (list_name, line_number)
bool origin_less(const RuleRecord& a, const RuleRecord& b);

// ============================================================================
// Parse helpers
// ============================================================================

std::string to_string(RecordKind k);
std::string to_string(ValidationStatus s);
std::string to_string(TranslationStatus s);
std::string to_string(ErrorKind k);

/// @throw std::invalid_argument если строка не распознана
RecordKind parse_record_kind(std::string_view s);

}  // namespace unifilter::rule

#endif  // UNIFILTER_RECORD_HPP
