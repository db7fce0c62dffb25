// =============================================================================
// Command Line Tests
// =============================================================================

#include <gtest/gtest.h>
#include <vectrix/cli/application.hpp>
#include <vectrix/core/logger.hpp>
#include "test_support.hpp"

#include <fstream>
#include <string>
#include <vector>

using namespace vectrix;
using vectrix::testing_support::TempDir;

class ApplicationTest : public ::testing::Test {
protected:
    void SetUp() override {
        saved_level_ = Logger::instance().level();
    }
    void TearDown() override {
        Logger::instance().set_level(saved_level_);
    }

    // argv built from `args`, program name first
    std::vector<char*> argv_of(const std::vector<std::string>& args) {
        storage_ = args;
        storage_.insert(storage_.begin(), "vectrix");
        std::vector<char*> argv;
        for (auto& arg : storage_) argv.push_back(&arg[0]);
        argv.push_back(nullptr);
        return argv;
    }

    bool parse(Application& app, const std::vector<std::string>& args, int& exit_code) {
        std::vector<char*> argv = argv_of(args);
        return app.parse_args(static_cast<int>(argv.size()) - 1, argv.data(), exit_code);
    }

    int run(const std::vector<std::string>& args) {
        Application app;
        std::vector<char*> argv = argv_of(args);
        return app.run(static_cast<int>(argv.size()) - 1, argv.data());
    }

    std::vector<std::string> storage_;
    LogLevel saved_level_;
};

TEST_F(ApplicationTest, QueryOptions) {
    Application app;
    int exit_code = -1;
    ASSERT_TRUE(parse(app, {"query", "idx", "what is bm25", "--keys", "keys.json",
                            "--document-count", "3", "--chunk-count", "7",
                            "--section-count", "2", "--tokens", "500",
                            "--format", "chunks", "--no-overlap", "--bm25"}, exit_code));
    EXPECT_EQ(exit_code, 0);

    const CliOptions& opts = app.options();
    EXPECT_EQ(opts.command, "query");
    EXPECT_EQ(opts.index, "idx");
    EXPECT_EQ(opts.query, "what is bm25");
    EXPECT_EQ(opts.keys_file, "keys.json");
    EXPECT_EQ(opts.document_count, 3u);
    EXPECT_EQ(opts.chunk_count, 7u);
    EXPECT_EQ(opts.section_count, 2u);
    EXPECT_EQ(opts.tokens, 500u);
    EXPECT_EQ(opts.format, "chunks");
    EXPECT_FALSE(opts.overlap);
    EXPECT_TRUE(opts.bm25);
}

TEST_F(ApplicationTest, Defaults) {
    Application app;
    int exit_code = -1;
    ASSERT_TRUE(parse(app, {"add", "idx", "-u", "a.md", "-u", "b.md"}, exit_code));

    const CliOptions& opts = app.options();
    EXPECT_EQ(opts.uris, std::vector<std::string>({"a.md", "b.md"}));
    EXPECT_EQ(opts.chunk_size, 0);
    EXPECT_EQ(opts.document_count, 10u);
    EXPECT_EQ(opts.chunk_count, 50u);
    EXPECT_EQ(opts.section_count, 1u);
    EXPECT_EQ(opts.tokens, 2000u);
    EXPECT_EQ(opts.format, "sections");
    EXPECT_TRUE(opts.overlap);
    EXPECT_FALSE(opts.bm25);
}

TEST_F(ApplicationTest, UsageErrors) {
    int exit_code = 0;
    {
        Application app;
        EXPECT_FALSE(parse(app, {"create"}, exit_code));
        EXPECT_EQ(exit_code, 2);
    }
    {
        Application app;
        EXPECT_FALSE(parse(app, {"query", "idx"}, exit_code));
        EXPECT_EQ(exit_code, 2);
    }
    {
        Application app;
        EXPECT_FALSE(parse(app, {"query", "idx", "q", "--format", "xml"}, exit_code));
        EXPECT_EQ(exit_code, 2);
    }
    {
        Application app;
        EXPECT_FALSE(parse(app, {"add", "idx", "--chunk-size", "zero"}, exit_code));
        EXPECT_EQ(exit_code, 2);
    }
    {
        Application app;
        EXPECT_FALSE(parse(app, {"add", "idx", "--keys"}, exit_code));
        EXPECT_EQ(exit_code, 2);
    }
}

TEST_F(ApplicationTest, HelpAndVersionExitCleanly) {
    int exit_code = -1;
    Application help;
    EXPECT_FALSE(parse(help, {"--help"}, exit_code));
    EXPECT_EQ(exit_code, 0);

    Application version;
    EXPECT_FALSE(parse(version, {"-v"}, exit_code));
    EXPECT_EQ(exit_code, 0);
}

TEST_F(ApplicationTest, CreateStatsDelete) {
    TempDir dir;
    ASSERT_FALSE(dir.path().empty());
    std::string index = dir.file("idx");

    EXPECT_EQ(run({"create", index, "--log-level", "off"}), 0);
    LocalFileStorage local;
    EXPECT_TRUE(local.path_exists(index + "/index.json"));
    EXPECT_TRUE(local.path_exists(index + "/catalog.json"));

    EXPECT_EQ(run({"stats", index, "--log-level", "off"}), 0);
    EXPECT_EQ(run({"delete", index, "--log-level", "off"}), 0);
    EXPECT_FALSE(local.path_exists(index));
}

TEST_F(ApplicationTest, CommandsNeedingKeysFailWithoutThem) {
    TempDir dir;
    ASSERT_FALSE(dir.path().empty());
    std::string index = dir.file("idx");
    ASSERT_EQ(run({"create", index, "--log-level", "off"}), 0);

    EXPECT_EQ(run({"add", index, "--uri", dir.file("missing.md"), "--log-level", "off"}), 1);
    EXPECT_EQ(run({"query", index, "anything", "--log-level", "off"}), 1);
}

TEST_F(ApplicationTest, SettingsFileSelectsSqliteStorage) {
    TempDir dir;
    ASSERT_FALSE(dir.path().empty());
    std::string settings = dir.file("settings.json");
    std::string db = dir.file("store.db");
    {
        std::ofstream out(settings);
        out << "{\"log_level\": \"off\", \"storage\": {\"backend\": \"sqlite\", \"sqlite_path\": \""
            << db << "\"}, \"index\": {\"indexed\": [\"lang\"]}}";
    }

    EXPECT_EQ(run({"create", "idx", "--config", settings}), 0);
    EXPECT_EQ(run({"stats", "idx", "--config", settings}), 0);

    LocalFileStorage local;
    EXPECT_TRUE(local.path_exists(db));
    EXPECT_FALSE(local.path_exists("idx/index.json"));
}

TEST_F(ApplicationTest, UnknownCommandFails) {
    EXPECT_EQ(run({"explode", "idx", "--log-level", "off"}), 1);
}
