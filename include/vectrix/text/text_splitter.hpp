/*
 * vectrix C++17 - Text Splitter
 *
 * Recursive separator-driven chunking into token-bounded chunks:
 *   1. split on the first remaining separator (" " cuts on token
 *      boundaries, no separators left bisects the text)
 *   2. drop fragments without alphanumeric content, recurse into
 *      fragments that are still too large
 *   3. greedily merge neighbours while they fit in chunk_size tokens
 *   4. attach up to chunk_overlap neighbour tokens to each chunk
 *
 * Offsets are byte offsets into the input, end_pos inclusive.
 */
#ifndef vectrix_TEXT_TEXT_SPLITTER_HPP
#define vectrix_TEXT_TEXT_SPLITTER_HPP

#include <vectrix/core/status.hpp>
#include <vectrix/text/tokenizer.hpp>
#include <memory>
#include <string>
#include <vector>

namespace vectrix {

struct TextChunk {
    std::string text;
    std::vector<int> tokens;
    size_t start_pos;
    size_t end_pos;
    std::vector<int> start_overlap;
    std::vector<int> end_overlap;

    TextChunk() : start_pos(0), end_pos(0) {}
};

struct TextSplitterConfig {
    std::vector<std::string> separators;    // Empty selects the doc_type defaults
    bool keep_separators;
    int chunk_size;                         // tokens
    int chunk_overlap;                      // tokens
    std::shared_ptr<Tokenizer> tokenizer;
    std::string doc_type;

    TextSplitterConfig()
        : keep_separators(false)
        , chunk_size(400)
        , chunk_overlap(40)
    {}
};

class TextSplitter {
public:
    // VALIDATION unless chunk_size >= 1, 0 <= chunk_overlap <= chunk_size
    // and a tokenizer is set.
    static Status create(const TextSplitterConfig& config, std::unique_ptr<TextSplitter>& out);

    std::vector<TextChunk> split(const std::string& text) const;

    const TextSplitterConfig& config() const { return config_; }

    // Default separators for a document type ("md", "py", "cpp", ...).
    static std::vector<std::string> separators_for(const std::string& doc_type);

private:
    explicit TextSplitter(const TextSplitterConfig& config);

    std::vector<TextChunk> recursive_split(const std::string& text,
                                           size_t separator_index,
                                           size_t start_pos) const;
    std::vector<TextChunk> combine_chunks(std::vector<TextChunk> chunks) const;
    std::vector<std::string> split_by_tokens(const std::string& text) const;

    TextSplitterConfig config_;
};

} // namespace vectrix

#endif // vectrix_TEXT_TEXT_SPLITTER_HPP
