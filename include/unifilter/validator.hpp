// ==============================================================================
// unifilter/validator.hpp - MOD-0008: Rule Validator
// ==============================================================================
//
// MOD-0008 rule::validator
//
// Назначение:
// - Классификация одной записи относительно SyntaxDatabase
// - Структурная предпроверка текста правила
//
// Правило классификации: паттерны перебираются в порядке ранга, первый
// совпавший определяет результат (без backtracking):
// - диалект паттерна канонический          -> Valid
// - не канонический, есть шаблон трансляции -> NeedsTranslation
// - не канонический, шаблона нет            -> Unsupported
// - ни один паттерн не совпал               -> Unsupported
// - предпроверка не пройдена                -> Error (processing_error задан)
//
// validate() - чистая функция: не бросает исключений, не пишет в журнал.
//
// ==============================================================================

#ifndef UNIFILTER_VALIDATOR_HPP
#define UNIFILTER_VALIDATOR_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unifilter/record.hpp>
#include <unifilter/syntax_db.hpp>

namespace unifilter::rule {

/// Предел длины правила в байтах (после trim). std::regex рекурсивен по
/// длине входа, более длинные правила не передаются матчерам.
constexpr std::size_t MAX_RULE_LENGTH = 8192;

/// Структурная предпроверка текста правила.
/// @return диагностическое сообщение, если правило некорректно
std::optional<std::string> check_structure(std::string_view rule_text);

/// Текст правила без ведущих и завершающих пробельных символов
std::string_view trim_rule(std::string_view text);

/// Классифицировать запись.
/// Запись, уже получившая статус в этом проходе (не Unknown), возвращается
/// без изменений.
RuleRecord validate(RuleRecord record, const SyntaxDatabase& db);

}  // namespace unifilter::rule

#endif  // UNIFILTER_VALIDATOR_HPP
