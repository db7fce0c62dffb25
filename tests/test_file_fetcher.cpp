// =============================================================================
// File Fetcher Tests
// =============================================================================

#include <gtest/gtest.h>
#include <vectrix/documents/file_fetcher.hpp>
#include <vectrix/storage/virtual_file_storage.hpp>
#include "test_support.hpp"

#include <map>
#include <memory>
#include <string>

using namespace vectrix;
using vectrix::testing_support::TempDir;

class FileFetcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        storage_ = std::make_shared<VirtualFileStorage>();
        ASSERT_TRUE(storage_->create_folder("corpus/sub").success);
        ASSERT_TRUE(storage_->upsert_file("corpus/readme.md", "# Title").success);
        ASSERT_TRUE(storage_->upsert_file("corpus/sub/main.cpp", "int main() {}").success);
        ASSERT_TRUE(storage_->upsert_file("corpus/sub/LICENSE", "MIT").success);
    }

    FileFetcher::DocumentCallback collect(bool result = true) {
        return [this, result](const std::string& uri, const std::string& text,
                              const std::string& doc_type) {
            texts_[uri] = text;
            types_[uri] = doc_type;
            return result;
        };
    }

    std::shared_ptr<VirtualFileStorage> storage_;
    std::map<std::string, std::string> texts_;
    std::map<std::string, std::string> types_;
};

TEST_F(FileFetcherTest, SingleFile) {
    FileFetcher fetcher(storage_);
    bool all_ok = false;
    ASSERT_TRUE(fetcher.fetch("corpus/readme.md", collect(), all_ok).success);
    EXPECT_TRUE(all_ok);
    ASSERT_EQ(texts_.size(), 1u);
    EXPECT_EQ(texts_["corpus/readme.md"], "# Title");
    EXPECT_EQ(types_["corpus/readme.md"], "md");
}

TEST_F(FileFetcherTest, FoldersAreWalkedRecursively) {
    FileFetcher fetcher(storage_);
    bool all_ok = false;
    ASSERT_TRUE(fetcher.fetch("corpus", collect(), all_ok).success);
    EXPECT_TRUE(all_ok);
    EXPECT_EQ(texts_.size(), 3u);
    EXPECT_EQ(types_["corpus/sub/main.cpp"], "cpp");
    // No extension: the lowercased file name
    EXPECT_EQ(types_["corpus/sub/LICENSE"], "license");
}

TEST_F(FileFetcherTest, CallbackFailuresAreCounted) {
    FileFetcher fetcher(storage_);
    bool all_ok = true;
    ASSERT_TRUE(fetcher.fetch("corpus", collect(false), all_ok).success);
    EXPECT_FALSE(all_ok);
    EXPECT_EQ(texts_.size(), 3u);
}

TEST_F(FileFetcherTest, MissingPathYieldsNothing) {
    FileFetcher fetcher(storage_);
    bool all_ok = false;
    ASSERT_TRUE(fetcher.fetch("corpus/absent.txt", collect(), all_ok).success);
    EXPECT_TRUE(all_ok);
    EXPECT_TRUE(texts_.empty());
}

TEST_F(FileFetcherTest, WebUrisAreRejected) {
    FileFetcher fetcher(storage_);
    bool all_ok = true;
    Status s = fetcher.fetch("HTTPS://example.com/page", collect(), all_ok);
    EXPECT_FALSE(s.success);
    EXPECT_EQ(s.kind, ErrorKind::VALIDATION);
    EXPECT_TRUE(texts_.empty());
}

TEST_F(FileFetcherTest, DefaultsToLocalFiles) {
    TempDir dir;
    ASSERT_FALSE(dir.path().empty());
    LocalFileStorage local;
    ASSERT_TRUE(local.upsert_file(dir.file("notes.txt"), "local text").success);

    FileFetcher fetcher;
    bool all_ok = false;
    ASSERT_TRUE(fetcher.fetch(dir.path(), collect(), all_ok).success);
    ASSERT_EQ(texts_.size(), 1u);
    EXPECT_EQ(texts_.begin()->second, "local text");
    EXPECT_EQ(types_.begin()->second, "txt");
}
