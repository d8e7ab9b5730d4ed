// ==============================================================================
// test_list_writer_gtest.cpp - Тесты Unified List Writer (GoogleTest)
// ==============================================================================
//
// MOD-0012: output::list_writer
//
// ==============================================================================

#include "unifilter/list_writer.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <rapidjson/document.h>
#include <sstream>
#include <string>
#include <vector>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace unifilter::output::test {

using rule::RecordKind;
using rule::RuleRecord;

namespace {

RuleRecord included_rule(const std::string& list, std::size_t line, const std::string& text) {
    RuleRecord r = rule::make_rule(list, line, text);
    r.validation_status = rule::ValidationStatus::Valid;
    r.included = true;
    return r;
}

RuleRecord title(const std::string& list, const std::string& value) {
    RuleRecord r;
    r.list_name = list;
    r.line_number = 1;
    r.kind = RecordKind::Metadata;
    r.original_line = "! Title: " + value;
    r.metadata_key = "title";
    r.metadata_value = value;
    return r;
}

ListOptions fixed_options() {
    ListOptions options;
    options.title = "Test List";
    options.version = "2.1.0";
    options.last_updated = "2024-05-01 00:00:00 UTC";
    return options;
}

std::string read_file(const std::filesystem::path& p) {
    std::ifstream in(p, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

}  // namespace

class ListWriterTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir_;

    void SetUp() override {
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir_ = std::filesystem::temp_directory_path() /
                    (std::string("unifilter_writer_") + info->name() + "_" +
#ifdef _WIN32
                     std::to_string(GetCurrentProcessId())
#else
                     std::to_string(getpid())
#endif
                    );
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }
};

// ==============================================================================
// render_list
// ==============================================================================

TEST(RenderListTest, FullLayout) {
    std::vector<RuleRecord> records = {
        title("easylist", "EasyList"),
        included_rule("easylist", 5, "||b.example.com^"),
        included_rule("easylist", 6, "||a.example.com^"),
        included_rule("adguard", 2, "||a.example.com^"),
        included_rule("adguard", 3, "! UNTRANSLATED (unsupported): x##y"),
    };

    auto rendered = render_list(records, fixed_options());

    const std::string expected =
        "! Title: Test List\n"
        "! Version: 2.1.0\n"
        "! Last Updated: 2024-05-01 00:00:00 UTC\n"
        "! Rule Count: 2 unique rules\n"
        "!\n"
        "! Original List Titles:\n"
        "!  - EasyList (from easylist)\n"
        "!\n"
        "! --- BEGIN RULES ---\n"
        "!\n"
        "||a.example.com^\n"
        "||b.example.com^\n"
        "\n"
        "!\n"
        "! --- UNTRANSLATED/COMMENTED RULES ---\n"
        "!\n"
        "! UNTRANSLATED (unsupported): x##y\n"
        "\n"
        "!\n"
        "! --- END RULES ---\n";

    EXPECT_EQ(rendered.text, expected);
    EXPECT_EQ(rendered.rule_count, 2u);
    EXPECT_EQ(rendered.commented_count, 1u);
}

TEST(RenderListTest, ExcludedAndErroredRecordsOmitted) {
    RuleRecord excluded = rule::make_rule("l", 1, "||dropped.com^");
    excluded.validation_status = rule::ValidationStatus::Unsupported;

    RuleRecord failed = included_rule("l", 2, "||failed.com^");
    rule::mark_failed(failed, rule::ErrorKind::Worker, "worker failure: boom");
    failed.included = true;

    RuleRecord comment;
    comment.kind = RecordKind::Comment;
    comment.original_line = "! comment";

    auto rendered =
        render_list({excluded, failed, comment, included_rule("l", 3, "||kept.com^")},
                    fixed_options());

    EXPECT_EQ(rendered.rule_count, 1u);
    EXPECT_NE(rendered.text.find("||kept.com^\n"), std::string::npos);
    EXPECT_EQ(rendered.text.find("dropped"), std::string::npos);
    EXPECT_EQ(rendered.text.find("failed"), std::string::npos);
    EXPECT_EQ(rendered.text.find("COMMENTED RULES"), std::string::npos);
    EXPECT_EQ(rendered.text.find("Original List Titles"), std::string::npos);
}

TEST(RenderListTest, EmptyInput_StillHasHeaderAndMarkers) {
    auto rendered = render_list({}, fixed_options());

    EXPECT_EQ(rendered.rule_count, 0u);
    EXPECT_NE(rendered.text.find("! Rule Count: 0 unique rules\n"), std::string::npos);
    EXPECT_NE(rendered.text.find("! --- BEGIN RULES ---\n"), std::string::npos);
    EXPECT_NE(rendered.text.find("! --- END RULES ---\n"), std::string::npos);
}

TEST(RenderListTest, CustomCommentMarker) {
    ListOptions options = fixed_options();
    options.comment_marker = "#";

    auto rendered = render_list({included_rule("l", 1, "# UNTRANSLATED (unsupported): z")},
                                options);

    EXPECT_EQ(rendered.text.rfind("# Title: Test List\n", 0), 0u);
    EXPECT_EQ(rendered.commented_count, 1u);
    EXPECT_EQ(rendered.rule_count, 0u);
}

TEST(RenderListTest, LastUpdatedDefaultsToNow) {
    ListOptions options;
    auto rendered = render_list({}, options);

    EXPECT_NE(rendered.text.find("! Title: Unified Filter List\n"), std::string::npos);
    EXPECT_NE(rendered.text.find(" UTC\n"), std::string::npos);
}

// ==============================================================================
// write_list / write_report
// ==============================================================================

TEST_F(ListWriterTest, WriteList_CreatesParentDirectories) {
    auto path = test_dir_ / "nested" / "unified.txt";

    auto result = write_list(path, {included_rule("l", 1, "||a.com^")}, fixed_options());

    ASSERT_TRUE(result) << result.error.format();
    EXPECT_EQ(result.rule_count, 1u);
    EXPECT_EQ(read_file(path),
              render_list({included_rule("l", 1, "||a.com^")}, fixed_options()).text);
}

TEST_F(ListWriterTest, WriteList_UnwritablePathFails) {
    std::filesystem::create_directories(test_dir_);
    // Путь занят директорией
    std::filesystem::create_directories(test_dir_ / "taken");

    auto result = write_list(test_dir_ / "taken", {}, fixed_options());

    EXPECT_FALSE(result);
    EXPECT_EQ(result.error.format().rfind("failed to write '", 0), 0u);
}

TEST_F(ListWriterTest, WriteReport_OneJsonObjectPerRecord) {
    RuleRecord failed = rule::make_rule("adguard", 4, "example.org##");
    rule::mark_failed(failed, rule::ErrorKind::Validation, "empty selector after '##'");

    std::vector<RuleRecord> records = {
        title("easylist", "EasyList"),
        included_rule("easylist", 5, "||a.com^"),
        failed,
    };

    auto path = test_dir_ / "report.jsonl";
    auto result = write_report(path, records);

    ASSERT_TRUE(result) << result.error.format();
    EXPECT_EQ(result.rule_count, 1u);

    std::istringstream lines(read_file(path));
    std::vector<std::string> parsed;
    for (std::string line; std::getline(lines, line);) {
        parsed.push_back(line);
    }
    ASSERT_EQ(parsed.size(), 3u);

    rapidjson::Document meta;
    meta.Parse(parsed[0].c_str());
    ASSERT_FALSE(meta.HasParseError());
    EXPECT_STREQ(meta["kind"].GetString(), "metadata");
    EXPECT_STREQ(meta["metadata_key"].GetString(), "title");
    EXPECT_FALSE(meta.HasMember("validation_status"));

    rapidjson::Document err;
    err.Parse(parsed[2].c_str());
    ASSERT_FALSE(err.HasParseError());
    EXPECT_STREQ(err["list_name"].GetString(), "adguard");
    EXPECT_EQ(err["line_number"].GetUint64(), 4u);
    EXPECT_STREQ(err["validation_status"].GetString(), "error");
    EXPECT_STREQ(err["error_kind"].GetString(), "validation");
    EXPECT_STREQ(err["processing_error"].GetString(), "empty selector after '##'");
    EXPECT_FALSE(err["included"].GetBool());
}

TEST(RecordToJsonTest, RuleFields) {
    RuleRecord r = included_rule("easylist", 9, "||a.com^");
    r.matched_pattern = "domain-anchor";

    rapidjson::Document doc;
    doc.Parse(record_to_json(r).c_str());

    ASSERT_FALSE(doc.HasParseError());
    EXPECT_STREQ(doc["rule"].GetString(), "||a.com^");
    EXPECT_STREQ(doc["validation_status"].GetString(), "valid");
    EXPECT_STREQ(doc["translation_status"].GetString(), "not_applicable");
    EXPECT_STREQ(doc["matched_pattern"].GetString(), "domain-anchor");
    EXPECT_TRUE(doc["included"].GetBool());
    EXPECT_FALSE(doc.HasMember("processing_error"));
    EXPECT_FALSE(doc.HasMember("validation_notes"));
}

}  // namespace unifilter::output::test
