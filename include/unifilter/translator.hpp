// ==============================================================================
// unifilter/translator.hpp - MOD-0009: Rule Translator
// ==============================================================================
//
// MOD-0009 rule::translator
//
// Назначение:
// - Перевод правил NeedsTranslation в канонический диалект по шаблону
// - Стратегии для правил без пути трансляции (Unsupported / без шаблона)
// - Локальная изоляция ошибок: translate() никогда не бросает исключений
//
// Стратегии (применяются, если шаблона нет):
//   rewrite                     -> Failed, запись исключается
//   comment_out_untranslatable  -> Failed, правило закомментировано, включается
//   drop                        -> Failed, запись исключается
//   passthrough                 -> Failed, текст без изменений, включается
// Шаблон, если он есть у паттерна, применяется при любой стратегии.
//
// Записи со статусом Error не транслируются (статус терминален).
//
// ==============================================================================

#ifndef UNIFILTER_TRANSLATOR_HPP
#define UNIFILTER_TRANSLATOR_HPP

#include <stdexcept>
#include <string>
#include <string_view>
#include <unifilter/record.hpp>
#include <unifilter/syntax_db.hpp>

namespace unifilter::rule {

/// Стратегия для правил, которые нельзя перевести
enum class Strategy { Rewrite, CommentOut, Drop, Passthrough };

std::string to_string(Strategy s);

/// @throw std::invalid_argument если строка не распознана
Strategy parse_strategy(std::string_view s);

/// Ошибка применения шаблона. Бросается только apply_template и
/// перехватывается внутри translate().
class TranslationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Подставить группы совпадения в шаблон.
/// @throw TranslationError если шаблон ссылается на отсутствующую группу
std::string apply_template(const TranslationTemplate& tpl, const Captures& captures);

/// Текст закомментированного правила:
/// "<marker> UNTRANSLATED (<status>): <rule> # Reason: <notes>"
std::string comment_out(const RuleRecord& record, std::string_view comment_marker);

/// Разрешить запись: перевести, закомментировать, пропустить или исключить
RuleRecord translate(RuleRecord record, const SyntaxDatabase& db, Strategy strategy);

}  // namespace unifilter::rule

#endif  // UNIFILTER_TRANSLATOR_HPP
