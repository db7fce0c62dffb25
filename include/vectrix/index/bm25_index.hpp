/*
 * vectrix C++17 - BM25 Keyword Index
 *
 * Okapi BM25 over lowercase alphanumeric terms with English stop words
 * removed. Built per query over the candidate items' text.
 */
#ifndef vectrix_INDEX_BM25_INDEX_HPP
#define vectrix_INDEX_BM25_INDEX_HPP

#include <string>
#include <vector>
#include <unordered_map>
#include <unordered_set>

namespace vectrix {

struct Bm25Hit {
    size_t doc;         // Caller-supplied document handle
    double score;
};

class Bm25Index {
public:
    static constexpr double k1 = 1.2;
    static constexpr double b = 0.75;

    Bm25Index();

    void add_document(size_t doc, const std::string& text);

    // Computes average length and IDF. Called lazily by search().
    void build();

    // Documents with a positive score, best first, at most `limit`.
    std::vector<Bm25Hit> search(const std::string& query, size_t limit);

    size_t size() const { return documents_.size(); }

    static std::vector<std::string> tokenize(const std::string& text);

private:
    struct Document {
        size_t doc;
        std::unordered_map<std::string, unsigned> tf;
        size_t length;
    };

    static const std::unordered_set<std::string>& stop_words();
    double idf(const std::string& term) const;

    std::vector<Document> documents_;
    std::unordered_map<std::string, unsigned> doc_freq_;
    std::unordered_map<std::string, double> idf_;
    double avg_length_;
    bool built_;
};

} // namespace vectrix

#endif // vectrix_INDEX_BM25_INDEX_HPP
