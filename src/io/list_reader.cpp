// ==============================================================================
// list_reader.cpp - MOD-0011: Filter List Reader Implementation
// ==============================================================================

#include <unifilter/list_reader.hpp>
#include <unifilter/platform.hpp>
#include <unifilter/validator.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <regex>
#include <sstream>
#include <system_error>

namespace unifilter::io {

namespace {

// ABP метаданные: "! Title: EasyList"
const std::regex& metadata_regex() {
    static const std::regex re(R"(^!\s*([A-Za-z][A-Za-z ]*?)\s*:\s*(\S.*)$)");
    return re;
}

// "#" начинает косметическое правило без доменов, если за ним идёт один из
// символов разделителя (##, #@#, #?#, #$#, #%#)
bool is_cosmetic_start(std::string_view text) {
    if (text.size() < 2) {
        return false;
    }
    const char c = text[1];
    return c == '#' || c == '@' || c == '?' || c == '$' || c == '%';
}

bool is_comment(std::string_view text) {
    if (text.front() == '!') {
        return true;
    }
    if (text.rfind("[Adblock", 0) == 0) {
        return true;
    }
    return text.front() == '#' && !is_cosmetic_start(text);
}

std::string normalize_key(std::string key) {
    std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) {
        return c == ' ' ? '_' : static_cast<char>(std::tolower(c));
    });
    return key;
}

}  // namespace

std::string ReadError::format() const {
    return "failed to read list '" + path + "' - " + message;
}

std::optional<rule::RuleRecord> parse_line(std::size_t line_number, std::string_view text,
                                           std::string_view list_name) {
    const std::string_view stripped = rule::trim_rule(text);
    if (stripped.empty()) {
        return std::nullopt;
    }

    rule::RuleRecord record;
    record.list_name = std::string(list_name);
    record.line_number = line_number;
    record.original_line = std::string(text);

    if (!is_comment(stripped)) {
        record.kind = rule::RecordKind::Rule;
        record.raw_rule = std::string(stripped);
        return record;
    }

    const std::string line(stripped);
    std::smatch m;
    if (line.front() == '!' && std::regex_match(line, m, metadata_regex())) {
        record.kind = rule::RecordKind::Metadata;
        record.metadata_key = normalize_key(m[1].str());
        record.metadata_value = std::string(rule::trim_rule(m[2].str()));
        return record;
    }

    record.kind = rule::RecordKind::Comment;
    return record;
}

std::vector<rule::RuleRecord> parse_content(std::string_view content,
                                            std::string_view list_name) {
    std::vector<rule::RuleRecord> records;

    // UTF-8 BOM
    if (content.size() >= 3 && content.substr(0, 3) == "\xEF\xBB\xBF") {
        content.remove_prefix(3);
    }

    std::size_t line_number = 0;
    std::size_t pos = 0;
    while (pos <= content.size()) {
        const std::size_t eol = content.find('\n', pos);
        std::string_view line = eol == std::string_view::npos
                                    ? content.substr(pos)
                                    : content.substr(pos, eol - pos);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        ++line_number;

        if (auto record = parse_line(line_number, line, list_name)) {
            records.push_back(std::move(*record));
        }

        if (eol == std::string_view::npos) {
            break;
        }
        pos = eol + 1;
    }

    return records;
}

ReadResult read_list(const std::filesystem::path& path, std::string_view list_name) {
    ReadResult result;
    const std::string path_str = platform::path_to_utf8(path);

    std::error_code ec;
    if (!std::filesystem::exists(path, ec) || ec) {
        result.error = ReadError{ReadErrorKind::FileNotFound, "file not found", path_str};
        return result;
    }
    if (std::filesystem::is_directory(path, ec)) {
        result.error = ReadError{ReadErrorKind::IoError, "path is a directory", path_str};
        return result;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        result.error = ReadError{ReadErrorKind::PermissionDenied, "failed to open file", path_str};
        return result;
    }

    std::ostringstream content;
    content << in.rdbuf();
    if (in.bad()) {
        result.error = ReadError{ReadErrorKind::IoError, "read error", path_str};
        return result;
    }

    result.records = parse_content(content.str(), list_name);
    result.ok = true;
    return result;
}

std::string list_name_from_path(const std::filesystem::path& path) {
    return platform::path_to_utf8(path.stem());
}

}  // namespace unifilter::io
