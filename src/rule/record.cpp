// ==============================================================================
// record.cpp - MOD-0006: Rule Record
// ==============================================================================

#include <stdexcept>
#include <tuple>
#include <unifilter/record.hpp>
#include <utility>

namespace unifilter::rule {

// ============================================================================
// Record helpers
// ============================================================================

RuleRecord make_rule(std::string list_name, std::size_t line_number, std::string raw_rule) {
    RuleRecord record;
    record.list_name = std::move(list_name);
    record.line_number = line_number;
    record.original_line = raw_rule;
    record.raw_rule = std::move(raw_rule);
    record.kind = RecordKind::Rule;
    return record;
}

void mark_failed(RuleRecord& record, ErrorKind kind, std::string message) {
    record.validation_status = ValidationStatus::Error;
    record.translation_status = TranslationStatus::Error;
    record.error_kind = kind;
    if (message.empty()) {
        message = "unknown failure";
    }
    record.processing_error = std::move(message);
    record.included = false;
}

bool has_error(const RuleRecord& record) {
    return record.validation_status == ValidationStatus::Error ||
           record.translation_status == TranslationStatus::Error;
}

bool origin_less(const RuleRecord& a, const RuleRecord& b) {
    return std::tie(a.list_name, a.line_number) < std::tie(b.list_name, b.line_number);
}

// ============================================================================
// String conversion
// ============================================================================

std::string to_string(RecordKind k) {
    switch (k) {
    case RecordKind::Rule:
        return "rule";
    case RecordKind::Comment:
        return "comment";
    case RecordKind::Metadata:
        return "metadata";
    }
    return "unknown";
}

std::string to_string(ValidationStatus s) {
    switch (s) {
    case ValidationStatus::Unknown:
        return "unknown";
    case ValidationStatus::Valid:
        return "valid";
    case ValidationStatus::NeedsTranslation:
        return "needs_translation";
    case ValidationStatus::Unsupported:
        return "unsupported";
    case ValidationStatus::Error:
        return "error";
    }
    return "unknown";
}

std::string to_string(TranslationStatus s) {
    switch (s) {
    case TranslationStatus::NotApplicable:
        return "not_applicable";
    case TranslationStatus::Translated:
        return "translated";
    case TranslationStatus::Failed:
        return "failed";
    case TranslationStatus::Error:
        return "error";
    }
    return "unknown";
}

std::string to_string(ErrorKind k) {
    switch (k) {
    case ErrorKind::None:
        return "none";
    case ErrorKind::Validation:
        return "validation";
    case ErrorKind::Translation:
        return "translation";
    case ErrorKind::Worker:
        return "worker";
    }
    return "unknown";
}

RecordKind parse_record_kind(std::string_view s) {
    if (s == "rule")
        return RecordKind::Rule;
    if (s == "comment")
        return RecordKind::Comment;
    if (s == "metadata")
        return RecordKind::Metadata;
    throw std::invalid_argument("unknown record kind, must be: rule, comment or metadata");
}

}  // namespace unifilter::rule
