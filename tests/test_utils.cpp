// =============================================================================
// Core Utility Tests
// =============================================================================

#include <gtest/gtest.h>
#include <vectrix/core/utils.hpp>
#include <vectrix/core/status.hpp>
#include <vectrix/core/config.hpp>
#include <vectrix/core/logger.hpp>
#include <vectrix/core/json.hpp>
#include "test_support.hpp"

#include <cstdio>
#include <fstream>
#include <set>
#include <string>

using namespace vectrix;
using vectrix::testing_support::TempDir;

class UtilsTest : public ::testing::Test {};

TEST_F(UtilsTest, Trim) {
    EXPECT_EQ(trim("  a b \n"), "a b");
    EXPECT_EQ(ltrim("  a "), "a ");
    EXPECT_EQ(rtrim("  a "), "  a");
    EXPECT_EQ(trim(" \t "), "");
}

TEST_F(UtilsTest, SplitKeepsEmptyPartsForStringDelimiter) {
    std::vector<std::string> parts = split("a\n\nb\n\n\n\nc", std::string("\n\n"));
    EXPECT_EQ(parts, std::vector<std::string>({"a", "b", "", "c"}));
    EXPECT_EQ(split("abc", std::string("")), std::vector<std::string>({"abc"}));
}

TEST_F(UtilsTest, JoinAndReplace) {
    EXPECT_EQ(join({"a", "b", "c"}, ", "), "a, b, c");
    EXPECT_EQ(join({}, ","), "");
    EXPECT_EQ(replace_all("one\ntwo\nthree", "\n", " "), "one two three");
}

TEST_F(UtilsTest, TruncateSafeKeepsCodePointsWhole) {
    std::string text = "ab\xC3\xA9";   // "abé"
    EXPECT_EQ(truncate_safe(text, 3), "ab");
    EXPECT_EQ(truncate_safe(text, 4), text);
    EXPECT_EQ(truncate_safe(text, 10), text);
}

TEST_F(UtilsTest, Paths) {
    EXPECT_EQ(normalize_path("a//b/./c/../d"), "a/b/d");
    EXPECT_EQ(normalize_path("/x/../y"), "/y");
    EXPECT_EQ(join_path("a/", "/b"), "a/b");
    EXPECT_EQ(join_path("", "b"), "b");
    EXPECT_EQ(base_name("dir/sub/file.txt"), "file.txt");
    EXPECT_EQ(parent_path("dir/sub/file.txt"), "dir/sub");
    EXPECT_EQ(parent_path("file.txt"), "");
    EXPECT_EQ(file_extension("dir/Readme.MD"), "md");
    EXPECT_EQ(file_extension("dir/Makefile"), "");
}

TEST_F(UtilsTest, UuidFormat) {
    std::set<std::string> seen;
    for (int i = 0; i < 50; ++i) {
        std::string id = generate_uuid();
        ASSERT_EQ(id.size(), 36u);
        EXPECT_EQ(id[8], '-');
        EXPECT_EQ(id[14], '4');
        seen.insert(id);
    }
    EXPECT_EQ(seen.size(), 50u);
}

TEST_F(UtilsTest, DumpJsonReplacesInvalidUtf8) {
    Json j = {{"text", std::string("bad\xFF")}};
    std::string out;
    EXPECT_NO_THROW(out = dump_json(j));
    EXPECT_NE(out.find("bad"), std::string::npos);
}

// =============================================================================
// Status
// =============================================================================

class StatusTest : public ::testing::Test {};

TEST_F(StatusTest, WrapKeepsKindAndCause) {
    Status s = Status::fail(ErrorKind::IO, "disk full");
    Status wrapped = s.wrap("Error saving index");
    EXPECT_FALSE(wrapped.success);
    EXPECT_EQ(wrapped.kind, ErrorKind::IO);
    EXPECT_EQ(wrapped.error, "Error saving index: disk full");

    Status ok = Status::ok().wrap("ignored");
    EXPECT_TRUE(ok.success);
    EXPECT_TRUE(ok.error.empty());
}

TEST_F(StatusTest, KindNames) {
    EXPECT_STREQ(error_kind_name(ErrorKind::CONFLICT), "conflict");
    EXPECT_STREQ(error_kind_name(ErrorKind::NOT_FOUND), "not_found");
}

// =============================================================================
// Config
// =============================================================================

class ConfigTest : public ::testing::Test {
protected:
    Config config_{Json::parse(R"({
        "log_level": "debug",
        "chunking": {"chunk_size": 256, "keep_separators": false},
        "index": {"indexed": ["category", 3, "lang"]},
        "ratio": 0.5
    })")};
};

TEST_F(ConfigTest, DottedLookup) {
    EXPECT_EQ(config_.get_string("log_level", "info"), "debug");
    EXPECT_EQ(config_.get_int("chunking.chunk_size", 512), 256);
    EXPECT_FALSE(config_.get_bool("chunking.keep_separators", true));
    EXPECT_DOUBLE_EQ(config_.get_double("ratio", 0.0), 0.5);
    EXPECT_TRUE(config_.has("chunking"));
    EXPECT_FALSE(config_.has("chunking.chunk_overlap"));
}

TEST_F(ConfigTest, DefaultsOnMissingOrMistyped) {
    EXPECT_EQ(config_.get_int("chunking.chunk_overlap", 7), 7);
    EXPECT_EQ(config_.get_int("log_level", 3), 3);
    EXPECT_EQ(config_.get_string("log_level.deeper", "x"), "x");
}

TEST_F(ConfigTest, StringArraysSkipOtherTypes) {
    EXPECT_EQ(config_.get_string_array("index.indexed"),
              std::vector<std::string>({"category", "lang"}));
    EXPECT_TRUE(config_.get_string_array("missing").empty());
}

TEST_F(ConfigTest, SetStringCreatesParents) {
    Config config;
    config.set_string("embeddings.model", "m");
    EXPECT_EQ(config.get_string("embeddings.model", ""), "m");
}

TEST_F(ConfigTest, LoadStringRejectsNonObjects) {
    Config config;
    Status s = config.load_string("[1, 2]");
    EXPECT_FALSE(s.success);
    EXPECT_EQ(s.kind, ErrorKind::PARSE);

    s = config.load_string("{not json");
    EXPECT_FALSE(s.success);
    EXPECT_EQ(s.kind, ErrorKind::PARSE);
}

TEST_F(ConfigTest, LoadFile) {
    TempDir dir;
    ASSERT_FALSE(dir.path().empty());
    std::string path = dir.file("settings.json");
    {
        std::ofstream out(path);
        out << R"({"storage": {"backend": "sqlite"}})";
    }

    Config config;
    ASSERT_TRUE(config.load_file(path).success);
    EXPECT_EQ(config.get_string("storage.backend", "local"), "sqlite");

    Status s = config.load_file(dir.file("absent.json"));
    EXPECT_FALSE(s.success);
    EXPECT_EQ(s.kind, ErrorKind::IO);
}

// =============================================================================
// Logger
// =============================================================================

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        saved_level_ = Logger::instance().level();
    }
    void TearDown() override {
        Logger::instance().set_output(nullptr);
        Logger::instance().set_level(saved_level_);
    }

    LogLevel saved_level_;
};

TEST_F(LoggerTest, ParseLevelNames) {
    EXPECT_EQ(parse_log_level("DEBUG"), LogLevel::DEBUG);
    EXPECT_EQ(parse_log_level(" warning "), LogLevel::WARN);
    EXPECT_EQ(parse_log_level("off"), LogLevel::OFF);
    EXPECT_EQ(parse_log_level("loud", LogLevel::ERROR), LogLevel::ERROR);
}

TEST_F(LoggerTest, FiltersBelowLevel) {
    FILE* out = tmpfile();
    ASSERT_NE(out, nullptr);
    Logger::instance().set_output(out);
    Logger::instance().set_level(LogLevel::WARN);

    LOG_INFO("[Test] hidden %d", 1);
    LOG_WARN("[Test] shown %d", 2);
    fflush(out);

    rewind(out);
    std::string text;
    char buf[256];
    while (fgets(buf, sizeof(buf), out)) text += buf;
    fclose(out);
    Logger::instance().set_output(nullptr);

    EXPECT_EQ(text.find("hidden"), std::string::npos);
    EXPECT_NE(text.find("[Test] shown 2"), std::string::npos);
}
