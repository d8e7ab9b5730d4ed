// ==============================================================================
// list_writer.cpp - MOD-0012: Unified List Writer Implementation
// ==============================================================================

#include <unifilter/list_writer.hpp>
#include <unifilter/platform.hpp>

#include <cstdint>
#include <ctime>
#include <fstream>
#include <set>
#include <system_error>

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace unifilter::output {

namespace {

std::string utc_now() {
    std::time_t now = std::time(nullptr);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &now);
#else
    gmtime_r(&now, &tm);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S UTC", &tm);
    return buf;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return !prefix.empty() && s.compare(0, prefix.size(), prefix) == 0;
}

bool ensure_parent(const std::filesystem::path& path, WriteError& error) {
    const auto parent = path.parent_path();
    if (parent.empty()) {
        return true;
    }
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        error = WriteError{"could not create output directory: " + ec.message(),
                           platform::path_to_utf8(parent)};
        return false;
    }
    return true;
}

void add_string(rapidjson::Value& obj, const char* name, const std::string& value,
                rapidjson::Document::AllocatorType& alloc) {
    obj.AddMember(rapidjson::StringRef(name),
                  rapidjson::Value(value.c_str(), static_cast<rapidjson::SizeType>(value.size()),
                                   alloc),
                  alloc);
}

}  // namespace

std::string WriteError::format() const {
    return "failed to write '" + path + "' - " + message;
}

// ============================================================================
// List
// ============================================================================

RenderedList render_list(const std::vector<rule::RuleRecord>& records,
                         const ListOptions& options) {
    std::set<std::string> active;
    std::set<std::string> commented;
    std::vector<std::string> titles;

    for (const auto& r : records) {
        if (r.kind == rule::RecordKind::Metadata) {
            if (r.metadata_key == "title" && !r.metadata_value.empty()) {
                titles.push_back(r.metadata_value + " (from " + r.list_name + ")");
            }
            continue;
        }
        if (r.kind != rule::RecordKind::Rule || !r.included || rule::has_error(r)) {
            continue;
        }
        if (starts_with(r.raw_rule, options.comment_marker)) {
            commented.insert(r.raw_rule);
        } else {
            active.insert(r.raw_rule);
        }
    }

    const std::string& m = options.comment_marker;
    RenderedList out;
    out.rule_count = active.size();
    out.commented_count = commented.size();

    std::string& text = out.text;
    text += m + " Title: " + options.title + "\n";
    text += m + " Version: " + options.version + "\n";
    text += m + " Last Updated: " +
            (options.last_updated.empty() ? utc_now() : options.last_updated) + "\n";
    text += m + " Rule Count: " + std::to_string(active.size()) + " unique rules\n";
    text += m + "\n";

    if (!titles.empty()) {
        text += m + " Original List Titles:\n";
        for (const auto& t : titles) {
            text += m + "  - " + t + "\n";
        }
        text += m + "\n";
    }

    text += m + " --- BEGIN RULES ---\n";
    text += m + "\n";
    for (const auto& rule_text : active) {
        text += rule_text + "\n";
    }

    if (!commented.empty()) {
        text += "\n" + m + "\n";
        text += m + " --- UNTRANSLATED/COMMENTED RULES ---\n";
        text += m + "\n";
        for (const auto& rule_text : commented) {
            text += rule_text + "\n";
        }
    }

    text += "\n" + m + "\n";
    text += m + " --- END RULES ---\n";
    return out;
}

WriteResult write_list(const std::filesystem::path& path,
                       const std::vector<rule::RuleRecord>& records, const ListOptions& options) {
    WriteResult result;
    if (!ensure_parent(path, result.error)) {
        return result;
    }

    RenderedList rendered = render_list(records, options);

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        result.error = WriteError{"could not open file", platform::path_to_utf8(path)};
        return result;
    }
    out.write(rendered.text.data(), static_cast<std::streamsize>(rendered.text.size()));
    out.flush();
    if (!out) {
        result.error = WriteError{"write error", platform::path_to_utf8(path)};
        return result;
    }

    result.ok = true;
    result.rule_count = rendered.rule_count;
    result.commented_count = rendered.commented_count;
    return result;
}

// ============================================================================
// Report
// ============================================================================

std::string record_to_json(const rule::RuleRecord& record) {
    rapidjson::Document doc;
    doc.SetObject();
    auto& alloc = doc.GetAllocator();

    add_string(doc, "list_name", record.list_name, alloc);
    doc.AddMember("line_number", static_cast<std::uint64_t>(record.line_number), alloc);
    add_string(doc, "kind", rule::to_string(record.kind), alloc);
    add_string(doc, "original_line", record.original_line, alloc);

    if (record.kind == rule::RecordKind::Metadata) {
        add_string(doc, "metadata_key", record.metadata_key, alloc);
        add_string(doc, "metadata_value", record.metadata_value, alloc);
    }

    if (record.kind == rule::RecordKind::Rule) {
        add_string(doc, "rule", record.raw_rule, alloc);
        add_string(doc, "validation_status", rule::to_string(record.validation_status), alloc);
        add_string(doc, "translation_status", rule::to_string(record.translation_status),
                   alloc);
        if (!record.validation_notes.empty()) {
            add_string(doc, "validation_notes", record.validation_notes, alloc);
        }
        if (record.matched_pattern) {
            add_string(doc, "matched_pattern", *record.matched_pattern, alloc);
        }
        if (record.processing_error) {
            add_string(doc, "processing_error", *record.processing_error, alloc);
            add_string(doc, "error_kind", rule::to_string(record.error_kind), alloc);
        }
        doc.AddMember("included", record.included, alloc);
    }

    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    doc.Accept(writer);
    return std::string(buffer.GetString(), buffer.GetSize());
}

WriteResult write_report(const std::filesystem::path& path,
                         const std::vector<rule::RuleRecord>& records) {
    WriteResult result;
    if (!ensure_parent(path, result.error)) {
        return result;
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        result.error = WriteError{"could not open file", platform::path_to_utf8(path)};
        return result;
    }

    for (const auto& r : records) {
        const std::string line = record_to_json(r);
        out.write(line.data(), static_cast<std::streamsize>(line.size()));
        out.put('\n');
        if (r.kind == rule::RecordKind::Rule && r.included) {
            ++result.rule_count;
        }
    }
    out.flush();
    if (!out) {
        result.error = WriteError{"write error", platform::path_to_utf8(path)};
        return result;
    }

    result.ok = true;
    return result;
}

}  // namespace unifilter::output
