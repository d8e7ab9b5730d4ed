// ==============================================================================
// validator.cpp - MOD-0008: Rule Validator Implementation
// ==============================================================================

#include <array>
#include <string>
#include <unifilter/validator.hpp>

namespace unifilter::rule {

namespace {

// Разделители косметических правил и скриптлетов; длинные раньше коротких
constexpr std::array<std::string_view, 10> COSMETIC_SEPARATORS = {
    "#@?#", "#@$#", "#@%#", "#@#", "#?#", "#$#", "#%#", "##^", "##+", "##"};

// Маркеры, которые сами по себе не образуют правило
constexpr std::array<std::string_view, 5> BARE_MARKERS = {"@@", "|", "||", "@@|", "@@||"};

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

std::string describe(const SyntaxPattern& p) {
    return p.dialect + " pattern '" + p.name + "' (" + p.category + ")";
}

}  // namespace

std::string_view trim_rule(std::string_view text) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && is_space(text[begin])) {
        ++begin;
    }
    while (end > begin && is_space(text[end - 1])) {
        --end;
    }
    return text.substr(begin, end - begin);
}

std::optional<std::string> check_structure(std::string_view rule_text) {
    std::string_view text = trim_rule(rule_text);

    if (text.empty()) {
        return std::string("empty rule body");
    }

    if (text.size() > MAX_RULE_LENGTH) {
        return "rule exceeds " + std::to_string(MAX_RULE_LENGTH) + " bytes";
    }

    for (char c : text) {
        auto uc = static_cast<unsigned char>(c);
        if (uc < 0x20 || uc == 0x7F) {
            return std::string("rule contains control characters");
        }
    }

    for (auto marker : BARE_MARKERS) {
        if (text == marker) {
            return "rule consists only of the '" + std::string(marker) + "' marker";
        }
    }

    for (auto sep : COSMETIC_SEPARATORS) {
        if (text.size() >= sep.size() && text.substr(text.size() - sep.size()) == sep) {
            return "empty selector after '" + std::string(sep) + "'";
        }
    }

    if (text.back() == '$') {
        return std::string("empty modifier list after '$'");
    }

    return std::nullopt;
}

RuleRecord validate(RuleRecord record, const SyntaxDatabase& db) {
    if (record.validation_status != ValidationStatus::Unknown) {
        return record;
    }

    if (record.kind != RecordKind::Rule) {
        record.validation_status = ValidationStatus::Error;
        record.error_kind = ErrorKind::Validation;
        record.processing_error = "record kind '" + to_string(record.kind) + "' is not a filter rule";
        record.validation_notes = "only rule records are classified";
        return record;
    }

    if (auto problem = check_structure(record.raw_rule)) {
        record.validation_status = ValidationStatus::Error;
        record.error_kind = ErrorKind::Validation;
        record.processing_error = *problem;
        record.validation_notes = "malformed rule";
        return record;
    }

    std::string_view text = trim_rule(record.raw_rule);

    for (const auto& pattern : db.matchers_for(record.kind)) {
        if (!pattern.matcher.matches(text)) {
            continue;
        }

        record.matched_pattern = pattern.name;

        if (db.is_canonical(pattern)) {
            record.validation_status = ValidationStatus::Valid;
            record.validation_notes = "matches " + describe(pattern);
        } else if (pattern.translation_template) {
            record.validation_status = ValidationStatus::NeedsTranslation;
            record.validation_notes = "matches translatable " + describe(pattern);
        } else {
            record.validation_status = ValidationStatus::Unsupported;
            record.validation_notes = "matches known unsupported " + describe(pattern);
        }

        if (!pattern.notes.empty()) {
            record.validation_notes += ". " + pattern.notes;
        }
        return record;
    }

    record.validation_status = ValidationStatus::Unsupported;
    record.validation_notes = "rule does not match any known syntax pattern";
    return record;
}

}  // namespace unifilter::rule
