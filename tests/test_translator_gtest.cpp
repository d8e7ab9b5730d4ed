// ==============================================================================
// test_translator_gtest.cpp - Тесты Rule Translator (GoogleTest)
// ==============================================================================
//
// MOD-0009: rule::translator
//
// ==============================================================================

#include "unifilter/syntax_db.hpp"
#include "unifilter/translator.hpp"
#include "unifilter/validator.hpp"

#include <filesystem>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>

#ifndef CMAKE_SOURCE_DIR
#define CMAKE_SOURCE_DIR "."
#endif

namespace unifilter::rule::test {

namespace {

const SyntaxDatabase& fixture_db() {
    static const SyntaxDatabase db = [] {
        auto result =
            load(std::filesystem::path(CMAKE_SOURCE_DIR) / "tests" / "fixtures" / "patterns");
        if (!result) {
            throw std::runtime_error(result.error.format());
        }
        return result.database;
    }();
    return db;
}

const SyntaxDatabase& bundled_db() {
    static const SyntaxDatabase db = [] {
        auto result = load(std::filesystem::path(CMAKE_SOURCE_DIR) / "patterns");
        if (!result) {
            throw std::runtime_error(result.error.format());
        }
        return result.database;
    }();
    return db;
}

RuleRecord resolve(const std::string& text, Strategy strategy = Strategy::CommentOut) {
    return translate(validate(make_rule("test", 3, text), fixture_db()), fixture_db(), strategy);
}

const char* CSS_INJECTION = "example.org#$#body { overflow: auto !important; }";

}  // namespace

// ==============================================================================
// Стратегии
// ==============================================================================

TEST(StrategyTest, ParseAndFormat) {
    EXPECT_EQ(parse_strategy("rewrite"), Strategy::Rewrite);
    EXPECT_EQ(parse_strategy("comment_out_untranslatable"), Strategy::CommentOut);
    EXPECT_EQ(parse_strategy("comment_out"), Strategy::CommentOut);
    EXPECT_EQ(parse_strategy("drop"), Strategy::Drop);
    EXPECT_EQ(parse_strategy("passthrough"), Strategy::Passthrough);
    EXPECT_EQ(to_string(Strategy::CommentOut), "comment_out_untranslatable");
    EXPECT_THROW(parse_strategy("translate_everything"), std::invalid_argument);
}

// ==============================================================================
// apply_template
// ==============================================================================

TEST(ApplyTemplateTest, SubstitutesGroups) {
    auto tpl = parse_template("{1}##{2}:has-text({3})");
    Captures captures = {"whole", "example.org", "div", "Sponsored"};

    EXPECT_EQ(apply_template(tpl, captures), "example.org##div:has-text(Sponsored)");
}

TEST(ApplyTemplateTest, GroupZeroIsWholeMatch) {
    auto tpl = parse_template("{0}$important");
    EXPECT_EQ(apply_template(tpl, Captures{"||a.com^"}), "||a.com^$important");
}

TEST(ApplyTemplateTest, MissingGroup_Throws) {
    auto tpl = parse_template("{1}{2}");
    EXPECT_THROW(apply_template(tpl, Captures{"x", "y"}), TranslationError);
}

TEST(ApplyTemplateTest, EmptyResult_Throws) {
    auto tpl = parse_template("{1}");
    EXPECT_THROW(apply_template(tpl, Captures{"~~", ""}), TranslationError);
}

// ==============================================================================
// translate
// ==============================================================================

TEST(TranslatorTest, ValidRule_IncludedUnchanged) {
    auto r = resolve("||ads.example.com^");

    EXPECT_EQ(r.translation_status, TranslationStatus::NotApplicable);
    EXPECT_TRUE(r.included);
    EXPECT_EQ(r.raw_rule, "||ads.example.com^");
}

TEST(TranslatorTest, NeedsTranslation_RewrittenByTemplate) {
    auto r = resolve("example.org#?#div:contains(Sponsored)");

    EXPECT_EQ(r.validation_status, ValidationStatus::NeedsTranslation);
    EXPECT_EQ(r.translation_status, TranslationStatus::Translated);
    EXPECT_EQ(r.raw_rule, "example.org##div:has-text(Sponsored)");
    EXPECT_EQ(r.original_line, "example.org#?#div:contains(Sponsored)");
    EXPECT_TRUE(r.included);
    EXPECT_FALSE(r.processing_error.has_value());
}

TEST(TranslatorTest, TemplateAppliesUnderAnyStrategy) {
    for (auto strategy :
         {Strategy::Rewrite, Strategy::CommentOut, Strategy::Drop, Strategy::Passthrough}) {
        auto r = resolve("example.org#?#div:contains(Sponsored)", strategy);
        EXPECT_EQ(r.translation_status, TranslationStatus::Translated) << to_string(strategy);
        EXPECT_TRUE(r.included) << to_string(strategy);
    }
}

TEST(TranslatorTest, Unsupported_CommentOut) {
    auto r = resolve(CSS_INJECTION, Strategy::CommentOut);

    EXPECT_EQ(r.translation_status, TranslationStatus::Failed);
    EXPECT_TRUE(r.included);
    EXPECT_EQ(r.raw_rule.rfind(std::string("! UNTRANSLATED (unsupported): ") + CSS_INJECTION, 0),
              0u);
    EXPECT_NE(r.raw_rule.find("# Reason: matches known unsupported"), std::string::npos);
    EXPECT_NE(r.raw_rule.find("CSS injection"), std::string::npos);
    EXPECT_EQ(r.original_line, CSS_INJECTION);
}

TEST(TranslatorTest, Unsupported_Passthrough) {
    auto r = resolve(CSS_INJECTION, Strategy::Passthrough);

    EXPECT_EQ(r.translation_status, TranslationStatus::Failed);
    EXPECT_TRUE(r.included);
    EXPECT_EQ(r.raw_rule, CSS_INJECTION);
}

TEST(TranslatorTest, Unsupported_DropAndRewriteExclude) {
    for (auto strategy : {Strategy::Drop, Strategy::Rewrite}) {
        auto r = resolve(CSS_INJECTION, strategy);
        EXPECT_EQ(r.translation_status, TranslationStatus::Failed) << to_string(strategy);
        EXPECT_FALSE(r.included) << to_string(strategy);
        EXPECT_FALSE(r.processing_error.has_value()) << to_string(strategy);
    }
}

TEST(TranslatorTest, UnknownRule_CommentedWithNoMatchReason) {
    auto r = resolve("totally unknown rule");

    EXPECT_EQ(r.raw_rule,
              "! UNTRANSLATED (unsupported): totally unknown rule # Reason: rule does not match "
              "any known syntax pattern");
}

TEST(TranslatorTest, EmptyTemplateResult_IsTranslationError) {
    auto r = resolve("~~");

    EXPECT_EQ(r.validation_status, ValidationStatus::NeedsTranslation);
    EXPECT_EQ(r.translation_status, TranslationStatus::Error);
    EXPECT_EQ(r.error_kind, ErrorKind::Translation);
    ASSERT_TRUE(r.processing_error.has_value());
    EXPECT_NE(r.processing_error->find("produced an empty rule"), std::string::npos);
    EXPECT_FALSE(r.included);
}

TEST(TranslatorTest, ValidationError_IsTerminal) {
    auto r = resolve("example.org##", Strategy::Passthrough);

    EXPECT_EQ(r.validation_status, ValidationStatus::Error);
    EXPECT_EQ(r.translation_status, TranslationStatus::NotApplicable);
    EXPECT_EQ(r.error_kind, ErrorKind::Validation);
    EXPECT_FALSE(r.included);
    EXPECT_EQ(r.raw_rule, "example.org##");
}

TEST(TranslatorTest, UnvalidatedRecord_IsTranslationError) {
    auto r = translate(make_rule("test", 1, "||a.com^"), fixture_db(), Strategy::CommentOut);

    // Статус валидации выставляет только валидатор
    EXPECT_EQ(r.validation_status, ValidationStatus::Unknown);
    EXPECT_EQ(r.translation_status, TranslationStatus::Error);
    EXPECT_EQ(r.error_kind, ErrorKind::Translation);
    EXPECT_FALSE(r.included);
}

TEST(TranslatorTest, MissingPattern_IsTranslationError) {
    RuleRecord r = make_rule("test", 1, "example.org#?#div:contains(x)");
    r.validation_status = ValidationStatus::NeedsTranslation;
    r.matched_pattern = "no-such-pattern";

    auto out = translate(r, fixture_db(), Strategy::CommentOut);

    EXPECT_EQ(out.translation_status, TranslationStatus::Error);
    ASSERT_TRUE(out.processing_error.has_value());
    EXPECT_NE(out.processing_error->find("no-such-pattern"), std::string::npos);
}

TEST(TranslatorTest, OversizedRule_NotPassedToMatcher) {
    RuleRecord r = make_rule("test", 1, "example.org#?#div:contains(" +
                                            std::string(MAX_RULE_LENGTH, 'x') + ")");
    r.validation_status = ValidationStatus::NeedsTranslation;
    r.matched_pattern = "foreign-contains";

    auto out = translate(r, fixture_db(), Strategy::CommentOut);

    EXPECT_EQ(out.translation_status, TranslationStatus::Error);
    ASSERT_TRUE(out.processing_error.has_value());
    EXPECT_NE(out.processing_error->find("rule exceeds 8192 bytes"), std::string::npos);
    EXPECT_FALSE(out.included);
}

TEST(TranslatorTest, CommentOut_UsesGivenMarker) {
    RuleRecord r = make_rule("test", 1, "  a b  ");
    r.validation_status = ValidationStatus::Unsupported;

    EXPECT_EQ(comment_out(r, "#"), "# UNTRANSLATED (unsupported): a b");
}

// ==============================================================================
// Поставляемая база patterns/
// ==============================================================================

struct BundledCase {
    const char* rule;
    ValidationStatus status;
    const char* pattern;
    const char* translated;  // nullptr: правило не переписывается
};

TEST(BundledPatternsTest, ClassifyAndTranslate) {
    const BundledCase cases[] = {
        {"||example.com^$empty", ValidationStatus::NeedsTranslation, "adguard-empty-modifier",
         "||example.com^$redirect=nooptext"},
        {"@@||example.com^$ghide", ValidationStatus::NeedsTranslation, "ubo-ghide-alias",
         "@@||example.com^$generichide"},
        {"example.com#?#div:contains(Sponsored)", ValidationStatus::NeedsTranslation,
         "adguard-contains", "example.com##div:has-text(Sponsored)"},
        {"example.com#@?#.banner", ValidationStatus::NeedsTranslation,
         "adguard-extended-css-exception", "example.com#@#.banner"},
        {"example.com#%#//scriptlet('abort-on-property-read', 'alert')",
         ValidationStatus::NeedsTranslation, "adguard-scriptlet",
         "example.com##+js('abort-on-property-read', 'alert')"},
        {"||example.com^$app=com.example.app", ValidationStatus::Unsupported,
         "adguard-unsupported-modifier", nullptr},
        {"example.com##^script:has-text(ads)", ValidationStatus::Unsupported, "ubo-html-filter",
         nullptr},
        {"||example.com^", ValidationStatus::Valid, "network-domain-anchor", nullptr},
    };

    for (const auto& c : cases) {
        SCOPED_TRACE(c.rule);
        auto validated = validate(make_rule("bundled", 1, c.rule), bundled_db());
        EXPECT_EQ(validated.validation_status, c.status);
        ASSERT_TRUE(validated.matched_pattern.has_value());
        EXPECT_EQ(*validated.matched_pattern, c.pattern);

        auto out = translate(validated, bundled_db(), Strategy::Drop);
        if (c.translated != nullptr) {
            EXPECT_EQ(out.translation_status, TranslationStatus::Translated);
            EXPECT_EQ(out.raw_rule, c.translated);
            EXPECT_TRUE(out.included);

            // Результат трансляции принадлежит каноническому диалекту
            auto again = validate(make_rule("bundled", 1, out.raw_rule), bundled_db());
            EXPECT_EQ(again.validation_status, ValidationStatus::Valid);
        } else if (c.status == ValidationStatus::Valid) {
            EXPECT_EQ(out.translation_status, TranslationStatus::NotApplicable);
            EXPECT_EQ(out.raw_rule, c.rule);
            EXPECT_TRUE(out.included);
        } else {
            EXPECT_EQ(out.translation_status, TranslationStatus::Failed);
            EXPECT_FALSE(out.included);
        }
    }
}

TEST(BundledPatternsTest, ScriptletArgumentsKeepTheirQuotes) {
    auto out = translate(validate(make_rule("bundled", 1,
                                            "example.com#%#//scriptlet(\"set-constant\", "
                                            "\"ads.enabled\", \"false\")"),
                                  bundled_db()),
                         bundled_db(), Strategy::Drop);

    EXPECT_EQ(out.translation_status, TranslationStatus::Translated);
    EXPECT_EQ(out.raw_rule, "example.com##+js(\"set-constant\", \"ads.enabled\", \"false\")");
}

}  // namespace unifilter::rule::test
