// =============================================================================
// Shared test doubles
// =============================================================================
#ifndef vectrix_TESTS_TEST_SUPPORT_HPP
#define vectrix_TESTS_TEST_SUPPORT_HPP

#include <vectrix/embeddings/embeddings_model.hpp>
#include <vectrix/storage/virtual_file_storage.hpp>
#include <vectrix/storage/local_file_storage.hpp>
#include <vectrix/core/utils.hpp>

#include <cctype>
#include <cstdlib>
#include <functional>
#include <set>
#include <string>
#include <vector>
#include <unistd.h>

namespace vectrix {
namespace testing_support {

// Bag-of-words vectors: each lowercase word bumps one of DIMENSIONS buckets.
// Texts sharing words get similar vectors.
class HashingEmbeddings : public EmbeddingsModel {
public:
    static inline const size_t DIMENSIONS = 64;

    explicit HashingEmbeddings(size_t max_tokens = 8000) : max_tokens_(max_tokens), calls_(0) {}

    size_t max_tokens() const override { return max_tokens_; }

    EmbeddingsResponse create_embeddings(const std::vector<std::string>& inputs) override {
        ++calls_;
        batch_sizes_.push_back(inputs.size());
        std::vector<std::vector<float>> output;
        for (const auto& input : inputs) {
            output.push_back(embed(input));
        }
        return EmbeddingsResponse::success(output, "hashing");
    }

    static std::vector<float> embed(const std::string& text) {
        std::vector<float> v(DIMENSIONS, 0.0f);
        std::string word;
        for (size_t i = 0; i <= text.size(); ++i) {
            unsigned char c = i < text.size() ? static_cast<unsigned char>(text[i]) : ' ';
            if (std::isalnum(c)) {
                word += static_cast<char>(std::tolower(c));
            } else if (!word.empty()) {
                v[std::hash<std::string>()(word) % DIMENSIONS] += 1.0f;
                word.clear();
            }
        }
        // Keep empty texts off the zero vector
        v[0] += 0.01f;
        return v;
    }

    size_t calls() const { return calls_; }
    const std::vector<size_t>& batch_sizes() const { return batch_sizes_; }

private:
    size_t max_tokens_;
    size_t calls_;
    std::vector<size_t> batch_sizes_;
};

// Always answers with the configured failure.
class FailingEmbeddings : public EmbeddingsModel {
public:
    explicit FailingEmbeddings(EmbeddingsStatus status = EmbeddingsStatus::ERROR)
        : status_(status) {}

    size_t max_tokens() const override { return 8000; }

    EmbeddingsResponse create_embeddings(const std::vector<std::string>&) override {
        return EmbeddingsResponse::fail(status_, "service unavailable");
    }

private:
    EmbeddingsStatus status_;
};

// Returns one vector fewer than asked for.
class ShortEmbeddings : public EmbeddingsModel {
public:
    size_t max_tokens() const override { return 8000; }

    EmbeddingsResponse create_embeddings(const std::vector<std::string>& inputs) override {
        std::vector<std::vector<float>> output;
        for (size_t i = 1; i < inputs.size(); ++i) {
            output.push_back(HashingEmbeddings::embed(inputs[i]));
        }
        return EmbeddingsResponse::success(output);
    }
};

// VirtualFileStorage whose writes fail for paths containing a marker.
class FaultyStorage : public VirtualFileStorage {
public:
    void fail_writes_to(const std::string& marker) { write_markers_.insert(marker); }
    void fail_deletes_of(const std::string& marker) { delete_markers_.insert(marker); }
    void heal() { write_markers_.clear(); delete_markers_.clear(); }

    Status upsert_file(const std::string& path, const std::string& content) override {
        if (matches(write_markers_, path)) {
            return Status::fail(ErrorKind::IO, "injected write failure: " + path);
        }
        return VirtualFileStorage::upsert_file(path, content);
    }

    Status create_folder(const std::string& path) override {
        if (matches(write_markers_, path)) {
            return Status::fail(ErrorKind::IO, "injected mkdir failure: " + path);
        }
        return VirtualFileStorage::create_folder(path);
    }

    Status delete_file(const std::string& path) override {
        if (matches(delete_markers_, path)) {
            return Status::fail(ErrorKind::IO, "injected delete failure: " + path);
        }
        return VirtualFileStorage::delete_file(path);
    }

private:
    static bool matches(const std::set<std::string>& markers, const std::string& path) {
        for (const auto& marker : markers) {
            if (path.find(marker) != std::string::npos) return true;
        }
        return false;
    }

    std::set<std::string> write_markers_;
    std::set<std::string> delete_markers_;
};

// Scratch directory removed on destruction.
class TempDir {
public:
    TempDir() {
        char tmpl[] = "/tmp/vectrix_test_XXXXXX";
        char* dir = mkdtemp(tmpl);
        path_ = dir ? dir : "";
    }

    ~TempDir() {
        if (!path_.empty()) {
            LocalFileStorage storage;
            storage.delete_folder(path_);
        }
    }

    const std::string& path() const { return path_; }
    std::string file(const std::string& name) const { return join_path(path_, name); }

private:
    std::string path_;
};

} // namespace testing_support
} // namespace vectrix

#endif // vectrix_TESTS_TEST_SUPPORT_HPP
