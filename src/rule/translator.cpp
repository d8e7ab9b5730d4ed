// ==============================================================================
// translator.cpp - MOD-0009: Rule Translator Implementation
// ==============================================================================

#include <unifilter/translator.hpp>
#include <unifilter/validator.hpp>
#include <utility>

namespace unifilter::rule {

// ============================================================================
// Strategy
// ============================================================================

std::string to_string(Strategy s) {
    switch (s) {
    case Strategy::Rewrite:
        return "rewrite";
    case Strategy::CommentOut:
        return "comment_out_untranslatable";
    case Strategy::Drop:
        return "drop";
    case Strategy::Passthrough:
        return "passthrough";
    }
    return "unknown";
}

Strategy parse_strategy(std::string_view s) {
    if (s == "rewrite")
        return Strategy::Rewrite;
    if (s == "comment_out_untranslatable" || s == "comment_out")
        return Strategy::CommentOut;
    if (s == "drop" || s == "drop_untranslatable")
        return Strategy::Drop;
    if (s == "passthrough")
        return Strategy::Passthrough;
    throw std::invalid_argument(
        "unknown translation strategy, must be: rewrite, comment_out_untranslatable, drop or "
        "passthrough");
}

// ============================================================================
// Templates
// ============================================================================

std::string apply_template(const TranslationTemplate& tpl, const Captures& captures) {
    std::string out;
    out.reserve(tpl.text.size() + 32);

    for (const auto& part : tpl.parts) {
        if (!part.is_group) {
            out += part.literal;
            continue;
        }
        if (part.group >= captures.size()) {
            throw TranslationError("template '" + tpl.text + "' references group {" +
                                   std::to_string(part.group) + "}, only " +
                                   std::to_string(captures.size()) + " captured");
        }
        out += captures[part.group];
    }

    if (trim_rule(out).empty()) {
        throw TranslationError("template '" + tpl.text + "' produced an empty rule");
    }
    return out;
}

std::string comment_out(const RuleRecord& record, std::string_view comment_marker) {
    std::string text(comment_marker);
    text += " UNTRANSLATED (";
    text += to_string(record.validation_status);
    text += "): ";
    text += trim_rule(record.raw_rule);
    if (!record.validation_notes.empty()) {
        text += " # Reason: ";
        text += record.validation_notes;
    }
    return text;
}

// ============================================================================
// translate
// ============================================================================

namespace {

void fail_translation(RuleRecord& record, std::string message) {
    record.translation_status = TranslationStatus::Error;
    record.error_kind = ErrorKind::Translation;
    record.processing_error = std::move(message);
    record.included = false;
}

/// Применить шаблон паттерна, определившего NeedsTranslation
void rewrite(RuleRecord& record, const SyntaxDatabase& db) {
    if (!record.matched_pattern) {
        throw TranslationError("no pattern recorded for a rule that needs translation");
    }

    const SyntaxPattern* pattern = db.find(*record.matched_pattern);
    if (pattern == nullptr) {
        throw TranslationError("pattern '" + *record.matched_pattern +
                               "' not found in syntax database");
    }
    if (!pattern->translation_template) {
        throw TranslationError("pattern '" + pattern->name + "' has no translation template");
    }

    const std::string_view text = trim_rule(record.raw_rule);
    if (text.size() > MAX_RULE_LENGTH) {
        throw TranslationError("rule exceeds " + std::to_string(MAX_RULE_LENGTH) + " bytes");
    }

    auto captures = pattern->matcher.match(text);
    if (!captures) {
        throw TranslationError("pattern '" + pattern->name + "' no longer matches the rule");
    }

    record.raw_rule = apply_template(*pattern->translation_template, *captures);
    record.translation_status = TranslationStatus::Translated;
    record.included = true;
}

/// Разрешить запись без пути трансляции согласно стратегии
void apply_fallback(RuleRecord& record, const SyntaxDatabase& db, Strategy strategy) {
    record.translation_status = TranslationStatus::Failed;

    switch (strategy) {
    case Strategy::CommentOut:
        record.raw_rule = comment_out(record, db.comment_marker());
        record.included = true;
        break;
    case Strategy::Passthrough:
        record.included = true;
        break;
    case Strategy::Drop:
    case Strategy::Rewrite:
        record.included = false;
        break;
    }
}

}  // namespace

RuleRecord translate(RuleRecord record, const SyntaxDatabase& db, Strategy strategy) {
    switch (record.validation_status) {
    case ValidationStatus::Valid:
        record.translation_status = TranslationStatus::NotApplicable;
        record.included = true;
        return record;

    case ValidationStatus::Error:
        // Ошибка терминальна: трансляция не выполняется
        record.included = false;
        return record;

    case ValidationStatus::Unknown:
        // validation_status принадлежит валидатору и здесь не меняется
        fail_translation(record, "record was not validated before translation");
        return record;

    case ValidationStatus::NeedsTranslation:
    case ValidationStatus::Unsupported:
        break;
    }

    try {
        if (record.validation_status == ValidationStatus::NeedsTranslation) {
            rewrite(record, db);
        } else {
            apply_fallback(record, db, strategy);
        }
    } catch (const TranslationError& e) {
        fail_translation(record, e.what());
    } catch (const std::exception& e) {
        // regex_error (сложность), bad_alloc и т.п. - тоже ошибка этой записи
        fail_translation(record, std::string("translation failed: ") + e.what());
    }

    return record;
}

}  // namespace unifilter::rule
