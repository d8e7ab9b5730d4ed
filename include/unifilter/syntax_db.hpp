// ==============================================================================
// unifilter/syntax_db.hpp - MOD-0007: Syntax Database
// ==============================================================================
//
// MOD-0007 rule::syntax_db
//
// Назначение:
// - Загрузка описаний диалектов (YAML/JSON) из директории
// - Matcher: распознаватель текста правила (regex/search/token/prefix/suffix/exact)
// - Шаблоны трансляции в канонический диалект
// - Упорядоченный доступ к паттернам по типу записи (matchers_for)
//
// Формат файла описания:
//
//   dialect: adguard            # диалект по умолчанию для паттернов файла
//   canonical: false            # ровно один диалект набора помечен canonical
//   comment_marker: "!"         # только для канонического диалекта
//   patterns:
//     - name: adguard-contains
//       category: cosmetic
//       applies_to: rule        # rule | comment | metadata, по умолчанию rule
//       priority: 10            # необязательно
//       matcher: { type: regex, expression: '^(.*)#\?#(.*):contains\((.*)\)$' }
//       template: "{1}##{2}:has-text({3})"
//       notes: "..."
//
// Порядок: файлы загружаются в лексикографическом порядке имён, паттерны -
// в порядке объявления. Ранг паттерна = явный priority или его порядковый
// номер в наборе; при равенстве ранга побеждает объявленный раньше.
// Два паттерна одного dialect+category с одинаковым явным priority -
// ошибка загрузки.
//
// После загрузки база неизменяема; разделяется между потоками по const&.
//
// ==============================================================================

#ifndef UNIFILTER_SYNTAX_DB_HPP
#define UNIFILTER_SYNTAX_DB_HPP

#include <cstddef>
#include <filesystem>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <unifilter/record.hpp>
#include <unordered_map>
#include <vector>

namespace unifilter::rule {

// ============================================================================
// Matcher
// ============================================================================

/// Тип распознавателя
enum class MatcherType {
    Regex,   // полное совпадение regex (ECMAScript)
    Search,  // поиск regex в любой позиции
    Token,   // подстрока
    Prefix,  // начало строки
    Suffix,  // конец строки
    Exact    // точное совпадение
};

/// Группы совпадения: [0] - совпавший фрагмент (для не-regex типов - весь текст),
/// [1..N] - группы regex
using Captures = std::vector<std::string>;

class Matcher {
public:
    Matcher() = default;

    /// @throw std::invalid_argument при пустом выражении
    /// @throw std::regex_error при некорректном regex
    Matcher(MatcherType type, std::string expression, bool ignore_case = false);

    MatcherType type() const { return type_; }
    const std::string& expression() const { return expression_; }
    bool ignore_case() const { return ignore_case_; }

    /// Число групп захвата (0 для не-regex типов)
    std::size_t group_count() const;

    /// Сопоставить текст правила; nullopt если не совпало
    std::optional<Captures> match(std::string_view text) const;

    bool matches(std::string_view text) const { return match(text).has_value(); }

private:
    MatcherType type_ = MatcherType::Exact;
    std::string expression_;
    bool ignore_case_ = false;
    std::string folded_;  // expression_ в нижнем регистре (для ignore_case)
    std::optional<std::regex> regex_;
};

// ============================================================================
// TranslationTemplate
// ============================================================================

/// Часть шаблона: литерал или ссылка на группу {N}
struct TemplatePart {
    bool is_group = false;
    std::string literal;
    std::size_t group = 0;
};

/// Разобранный шаблон трансляции.
/// {N} - группа N, {0} - весь совпавший текст, {{ и }} - литеральные скобки.
struct TranslationTemplate {
    std::string text;
    std::vector<TemplatePart> parts;
    std::size_t max_group = 0;
};

/// @throw std::invalid_argument при синтаксической ошибке шаблона
TranslationTemplate parse_template(std::string_view text);

// ============================================================================
// SyntaxPattern
// ============================================================================

struct SyntaxPattern {
    std::string name;
    std::string dialect;
    std::string category;
    RecordKind applies_to = RecordKind::Rule;

    Matcher matcher;
    std::optional<TranslationTemplate> translation_template;

    std::size_t priority = 0;           // эффективный ранг
    bool explicit_priority = false;     // priority задан в файле
    std::size_t declaration_index = 0;  // позиция в наборе загрузки

    std::string notes;
    std::string source;  // имя файла описания
};

std::string to_string(MatcherType t);

/// @throw std::invalid_argument если строка не распознана
MatcherType parse_matcher_type(std::string_view s);

// ============================================================================
// Errors
// ============================================================================

/// Ошибка построения базы синтаксиса (фатальна для прогона)
struct LoadError {
    std::string message;
    std::string path;

    std::string format() const;
};

/// Источник описания: имя (для сообщений и порядка) + содержимое YAML/JSON
struct DescriptorSource {
    std::string name;
    std::string content;
};

// ============================================================================
// SyntaxDatabase
// ============================================================================

class SyntaxDatabase {
public:
    SyntaxDatabase() = default;

    /// Упорядоченные паттерны для типа записи (ранг по возрастанию)
    const std::vector<SyntaxPattern>& matchers_for(RecordKind kind) const;

    /// Найти паттерн по имени; nullptr если не найден
    const SyntaxPattern* find(std::string_view name) const;

    const std::string& canonical_dialect() const { return canonical_dialect_; }
    const std::string& comment_marker() const { return comment_marker_; }

    bool is_canonical(const SyntaxPattern& pattern) const {
        return pattern.dialect == canonical_dialect_;
    }

    /// Общее число паттернов
    std::size_t size() const;

    bool empty() const { return size() == 0; }

    /// Имена диалектов набора (отсортированы)
    std::vector<std::string> dialects() const;

    /// Имена загруженных файлов описаний (в порядке загрузки)
    const std::vector<std::string>& sources() const { return sources_; }

private:
    friend class DatabaseBuilder;

    std::vector<SyntaxPattern>& bucket(RecordKind kind);

    std::vector<SyntaxPattern> rule_patterns_;
    std::vector<SyntaxPattern> comment_patterns_;
    std::vector<SyntaxPattern> metadata_patterns_;
    std::unordered_map<std::string, std::pair<RecordKind, std::size_t>> by_name_;

    std::string canonical_dialect_;
    std::string comment_marker_ = "!";
    std::vector<std::string> sources_;
};

/// Результат загрузки базы
struct LoadResult {
    bool ok = false;
    SyntaxDatabase database;
    LoadError error;

    explicit operator bool() const { return ok; }
};

/// Загрузить базу из директории файлов описаний (*.yml, *.yaml, *.json).
/// Ошибка, если директория отсутствует или пуста, описание некорректно,
/// priority конфликтует или канонический диалект не определён однозначно.
LoadResult load(const std::filesystem::path& directory);

/// Построить базу из описаний в памяти (порядок по DescriptorSource::name)
LoadResult load_from_sources(std::vector<DescriptorSource> sources);

}  // namespace unifilter::rule

#endif  // UNIFILTER_SYNTAX_DB_HPP
