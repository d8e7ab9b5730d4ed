// ==============================================================================
// syntax_db.cpp - MOD-0007: Syntax Database Implementation
// ==============================================================================
//
// Загрузка описаний диалектов (yaml-cpp), построение упорядоченных наборов
// паттернов, компиляция matcher-ов и шаблонов трансляции.
//
// ==============================================================================

#include <algorithm>
#include <cctype>
#include <fstream>
#include <map>
#include <set>
#include <sstream>
#include <stdexcept>
#include <tuple>
#include <unifilter/discovery.hpp>
#include <unifilter/platform.hpp>
#include <unifilter/syntax_db.hpp>
#include <yaml-cpp/yaml.h>

namespace unifilter::rule {

namespace {

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool ends_with(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

}  // namespace

// ============================================================================
// Matcher
// ============================================================================

std::string to_string(MatcherType t) {
    switch (t) {
    case MatcherType::Regex:
        return "regex";
    case MatcherType::Search:
        return "search";
    case MatcherType::Token:
        return "token";
    case MatcherType::Prefix:
        return "prefix";
    case MatcherType::Suffix:
        return "suffix";
    case MatcherType::Exact:
        return "exact";
    }
    return "unknown";
}

MatcherType parse_matcher_type(std::string_view s) {
    if (s == "regex")
        return MatcherType::Regex;
    if (s == "search")
        return MatcherType::Search;
    if (s == "token")
        return MatcherType::Token;
    if (s == "prefix")
        return MatcherType::Prefix;
    if (s == "suffix")
        return MatcherType::Suffix;
    if (s == "exact")
        return MatcherType::Exact;
    throw std::invalid_argument(
        "unknown matcher type, must be: regex, search, token, prefix, suffix or exact");
}

Matcher::Matcher(MatcherType type, std::string expression, bool ignore_case)
    : type_(type), expression_(std::move(expression)), ignore_case_(ignore_case) {
    if (expression_.empty()) {
        throw std::invalid_argument("matcher expression must not be empty");
    }

    folded_ = ignore_case_ ? to_lower(expression_) : expression_;

    if (type_ == MatcherType::Regex || type_ == MatcherType::Search) {
        auto flags = std::regex::ECMAScript;
        if (ignore_case_) {
            flags |= std::regex::icase;
        }
        regex_.emplace(expression_, flags);
    }
}

std::size_t Matcher::group_count() const {
    return regex_ ? regex_->mark_count() : 0;
}

std::optional<Captures> Matcher::match(std::string_view text) const {
    if (regex_) {
        std::cmatch m;
        const char* first = text.data();
        const char* last = text.data() + text.size();

        bool found = (type_ == MatcherType::Regex) ? std::regex_match(first, last, m, *regex_)
                                                   : std::regex_search(first, last, m, *regex_);
        if (!found) {
            return std::nullopt;
        }

        Captures captures;
        captures.reserve(m.size());
        for (std::size_t i = 0; i < m.size(); ++i) {
            captures.push_back(m[i].matched ? m[i].str() : std::string());
        }
        return captures;
    }

    std::string folded_text = ignore_case_ ? to_lower(text) : std::string(text);
    std::string_view hay = folded_text;

    bool found = false;
    switch (type_) {
    case MatcherType::Token:
        found = hay.find(folded_) != std::string_view::npos;
        break;
    case MatcherType::Prefix:
        found = hay.substr(0, folded_.size()) == folded_;
        break;
    case MatcherType::Suffix:
        found = ends_with(hay, folded_);
        break;
    case MatcherType::Exact:
        found = hay == folded_;
        break;
    case MatcherType::Regex:
    case MatcherType::Search:
        break;
    }

    if (!found) {
        return std::nullopt;
    }
    return Captures{std::string(text)};
}

// ============================================================================
// TranslationTemplate
// ============================================================================

TranslationTemplate parse_template(std::string_view text) {
    if (text.empty()) {
        throw std::invalid_argument("translation template must not be empty");
    }

    TranslationTemplate tpl;
    tpl.text = std::string(text);

    std::string literal;
    auto flush_literal = [&]() {
        if (!literal.empty()) {
            TemplatePart part;
            part.literal = std::move(literal);
            tpl.parts.push_back(std::move(part));
            literal.clear();
        }
    };

    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];

        if (c == '{') {
            if (i + 1 < text.size() && text[i + 1] == '{') {
                literal += '{';
                ++i;
                continue;
            }

            std::size_t close = text.find('}', i + 1);
            if (close == std::string_view::npos) {
                throw std::invalid_argument("unterminated placeholder at position " +
                                            std::to_string(i));
            }

            std::string_view digits = text.substr(i + 1, close - i - 1);
            if (digits.empty() || !std::all_of(digits.begin(), digits.end(), [](unsigned char d) {
                    return std::isdigit(d) != 0;
                })) {
                throw std::invalid_argument("placeholder must be a group number, got '{" +
                                            std::string(digits) + "}'");
            }

            flush_literal();
            TemplatePart part;
            part.is_group = true;
            part.group = static_cast<std::size_t>(std::stoul(std::string(digits)));
            tpl.max_group = std::max(tpl.max_group, part.group);
            tpl.parts.push_back(std::move(part));
            i = close;
            continue;
        }

        if (c == '}') {
            if (i + 1 < text.size() && text[i + 1] == '}') {
                literal += '}';
                ++i;
                continue;
            }
            throw std::invalid_argument("unmatched '}' at position " + std::to_string(i));
        }

        literal += c;
    }

    flush_literal();
    return tpl;
}

// ============================================================================
// Error formatting
// ============================================================================

std::string LoadError::format() const {
    std::ostringstream oss;
    oss << "syntax database error";
    if (!path.empty()) {
        oss << " [" << path << "]";
    }
    oss << ": " << message;
    return oss.str();
}

// ============================================================================
// SyntaxDatabase
// ============================================================================

std::vector<SyntaxPattern>& SyntaxDatabase::bucket(RecordKind kind) {
    switch (kind) {
    case RecordKind::Comment:
        return comment_patterns_;
    case RecordKind::Metadata:
        return metadata_patterns_;
    case RecordKind::Rule:
    default:
        return rule_patterns_;
    }
}

const std::vector<SyntaxPattern>& SyntaxDatabase::matchers_for(RecordKind kind) const {
    switch (kind) {
    case RecordKind::Comment:
        return comment_patterns_;
    case RecordKind::Metadata:
        return metadata_patterns_;
    case RecordKind::Rule:
    default:
        return rule_patterns_;
    }
}

const SyntaxPattern* SyntaxDatabase::find(std::string_view name) const {
    auto it = by_name_.find(std::string(name));
    if (it == by_name_.end()) {
        return nullptr;
    }
    const auto& patterns = matchers_for(it->second.first);
    return &patterns[it->second.second];
}

std::size_t SyntaxDatabase::size() const {
    return rule_patterns_.size() + comment_patterns_.size() + metadata_patterns_.size();
}

std::vector<std::string> SyntaxDatabase::dialects() const {
    std::set<std::string> names;
    for (const auto* patterns : {&rule_patterns_, &comment_patterns_, &metadata_patterns_}) {
        for (const auto& p : *patterns) {
            names.insert(p.dialect);
        }
    }
    names.insert(canonical_dialect_);
    return {names.begin(), names.end()};
}

// ============================================================================
// DatabaseBuilder
// ============================================================================

/// Накапливает паттерны из описаний и собирает неизменяемую базу.
/// Ошибки сообщаются исключениями и превращаются в LoadError в load_from_sources.
class DatabaseBuilder {
public:
    void add_source(const DescriptorSource& source) {
        YAML::Node root = YAML::Load(source.content);

        if (!root.IsMap()) {
            throw std::runtime_error("descriptor must be a mapping with 'dialect' and 'patterns'");
        }

        std::string file_dialect = root["dialect"].as<std::string>("");
        if (file_dialect.empty()) {
            throw std::runtime_error("descriptor is missing 'dialect'");
        }

        if (root["canonical"].as<bool>(false)) {
            if (canonical_ && *canonical_ != file_dialect) {
                throw std::runtime_error("conflicting canonical dialects: '" + *canonical_ +
                                         "' and '" + file_dialect + "'");
            }
            canonical_ = file_dialect;

            if (root["comment_marker"]) {
                std::string marker = root["comment_marker"].as<std::string>();
                if (marker.empty()) {
                    throw std::runtime_error("comment_marker must not be empty");
                }
                if (marker_ && *marker_ != marker) {
                    throw std::runtime_error("conflicting comment markers: '" + *marker_ +
                                             "' and '" + marker + "'");
                }
                marker_ = marker;
            }
        } else if (root["comment_marker"]) {
            throw std::runtime_error("comment_marker is only allowed for the canonical dialect");
        }

        const YAML::Node& patterns = root["patterns"];
        if (!patterns || patterns.IsNull()) {
            sources_.push_back(source.name);
            return;
        }
        if (!patterns.IsSequence()) {
            throw std::runtime_error("'patterns' must be a sequence");
        }

        std::size_t position = 0;
        for (const auto& node : patterns) {
            ++position;
            SyntaxPattern pattern = parse_pattern(node, file_dialect, source.name, position);
            register_pattern(std::move(pattern));
        }

        sources_.push_back(source.name);
    }

    SyntaxDatabase finish() {
        if (!canonical_) {
            throw std::runtime_error("no canonical dialect declared (set 'canonical: true')");
        }

        for (const auto& p : patterns_) {
            if (p.dialect == *canonical_ && p.translation_template) {
                throw std::runtime_error("pattern '" + p.name +
                                         "' of the canonical dialect must not declare a template");
            }
        }

        // Ранг по возрастанию, при равенстве - порядок объявления
        std::stable_sort(patterns_.begin(), patterns_.end(),
                         [](const SyntaxPattern& a, const SyntaxPattern& b) {
                             return std::tie(a.priority, a.declaration_index) <
                                    std::tie(b.priority, b.declaration_index);
                         });

        SyntaxDatabase db;
        db.canonical_dialect_ = *canonical_;
        db.comment_marker_ = marker_.value_or("!");
        db.sources_ = sources_;

        for (auto& p : patterns_) {
            auto& target = db.bucket(p.applies_to);
            db.by_name_[p.name] = {p.applies_to, target.size()};
            target.push_back(std::move(p));
        }
        patterns_.clear();

        return db;
    }

private:
    SyntaxPattern parse_pattern(const YAML::Node& node, const std::string& file_dialect,
                                const std::string& source, std::size_t position) {
        if (!node.IsMap()) {
            throw std::runtime_error("pattern #" + std::to_string(position) +
                                     " must be a mapping");
        }

        SyntaxPattern pattern;
        pattern.source = source;
        pattern.declaration_index = next_index_++;

        pattern.name = node["name"].as<std::string>("");
        if (pattern.name.empty()) {
            pattern.name = source + "#" + std::to_string(position);
        }
        const std::string where = "pattern '" + pattern.name + "'";

        pattern.dialect = node["dialect"].as<std::string>(file_dialect);
        pattern.category = node["category"].as<std::string>("general");
        pattern.notes = node["notes"].as<std::string>("");

        if (node["applies_to"]) {
            try {
                pattern.applies_to = parse_record_kind(node["applies_to"].as<std::string>());
            } catch (const std::invalid_argument& e) {
                throw std::runtime_error(where + ": " + e.what());
            }
        }

        if (node["priority"]) {
            long long value = node["priority"].as<long long>();
            if (value < 0) {
                throw std::runtime_error(where + ": priority must not be negative");
            }
            pattern.priority = static_cast<std::size_t>(value);
            pattern.explicit_priority = true;
        } else {
            pattern.priority = pattern.declaration_index;
        }

        const YAML::Node& matcher = node["matcher"];
        if (!matcher || !matcher.IsMap()) {
            throw std::runtime_error(where + ": missing 'matcher' mapping");
        }

        std::string type_str = matcher["type"].as<std::string>("regex");
        std::string expression = matcher["expression"].as<std::string>("");
        bool ignore_case = matcher["ignore_case"].as<bool>(false);

        try {
            pattern.matcher = Matcher(parse_matcher_type(type_str), expression, ignore_case);
        } catch (const std::regex_error& e) {
            throw std::runtime_error(where + ": invalid regex '" + expression + "': " + e.what());
        } catch (const std::invalid_argument& e) {
            throw std::runtime_error(where + ": " + e.what());
        }

        const YAML::Node& tpl_node =
            node["template"] ? node["template"] : node["translation_template"];
        if (tpl_node && !tpl_node.IsNull()) {
            try {
                pattern.translation_template = parse_template(tpl_node.as<std::string>());
            } catch (const std::invalid_argument& e) {
                throw std::runtime_error(where + ": invalid template: " + e.what());
            }

            std::size_t available = pattern.matcher.group_count();
            if (pattern.translation_template->max_group > available) {
                throw std::runtime_error(
                    where + ": template references group {" +
                    std::to_string(pattern.translation_template->max_group) + "} but matcher has " +
                    std::to_string(available) + " group(s)");
            }
        }

        return pattern;
    }

    void register_pattern(SyntaxPattern pattern) {
        if (!names_.insert(pattern.name).second) {
            throw std::runtime_error("duplicate pattern name '" + pattern.name + "'");
        }

        if (pattern.explicit_priority) {
            auto key = std::make_tuple(pattern.dialect, pattern.category, pattern.priority);
            auto [it, inserted] = explicit_priorities_.emplace(key, pattern.name);
            if (!inserted) {
                throw std::runtime_error(
                    "conflicting priority " + std::to_string(pattern.priority) + " for " +
                    pattern.dialect + "/" + pattern.category + ": patterns '" + it->second +
                    "' and '" + pattern.name + "'");
            }
        }

        patterns_.push_back(std::move(pattern));
    }

    std::vector<SyntaxPattern> patterns_;
    std::optional<std::string> canonical_;
    std::optional<std::string> marker_;
    std::set<std::string> names_;
    std::map<std::tuple<std::string, std::string, std::size_t>, std::string> explicit_priorities_;
    std::vector<std::string> sources_;
    std::size_t next_index_ = 0;
};

// ============================================================================
// Load functions
// ============================================================================

LoadResult load_from_sources(std::vector<DescriptorSource> sources) {
    LoadResult result;

    // Документированный порядок: по имени источника
    std::stable_sort(sources.begin(), sources.end(),
                     [](const DescriptorSource& a, const DescriptorSource& b) {
                         return a.name < b.name;
                     });

    DatabaseBuilder builder;
    for (const auto& source : sources) {
        try {
            builder.add_source(source);
        } catch (const YAML::Exception& e) {
            result.error = LoadError{e.what(), source.name};
            return result;
        } catch (const std::exception& e) {
            result.error = LoadError{e.what(), source.name};
            return result;
        }
    }

    try {
        result.database = builder.finish();
    } catch (const std::exception& e) {
        result.error = LoadError{e.what(), ""};
        return result;
    }

    result.ok = true;
    return result;
}

LoadResult load(const std::filesystem::path& directory) {
    LoadResult result;
    const std::string dir_str = platform::path_to_utf8(directory);

    std::error_code ec;
    if (!std::filesystem::is_directory(directory, ec)) {
        result.error = LoadError{"syntax patterns directory not found", dir_str};
        return result;
    }

    io::DiscoveryOptions opt;
    opt.extensions = io::descriptor_extensions();
    opt.recursive = false;

    std::vector<std::filesystem::path> files;
    try {
        files = io::discover_files({directory}, opt);
    } catch (const std::exception& e) {
        result.error = LoadError{e.what(), dir_str};
        return result;
    }

    if (files.empty()) {
        result.error = LoadError{"no pattern descriptors (*.yml, *.yaml, *.json) found", dir_str};
        return result;
    }

    std::vector<DescriptorSource> sources;
    sources.reserve(files.size());
    for (const auto& file : files) {
        std::ifstream in(file, std::ios::binary);
        if (!in) {
            result.error = LoadError{"failed to open descriptor", platform::path_to_utf8(file)};
            return result;
        }
        std::ostringstream content;
        content << in.rdbuf();
        sources.push_back(
            DescriptorSource{platform::path_to_utf8(file.filename()), content.str()});
    }

    return load_from_sources(std::move(sources));
}

}  // namespace unifilter::rule
