/*
 * vectrix C++17 - Local Document Result
 *
 * A document matched by a query together with its matching chunks.
 * Renders the chunks back into token-bounded text sections.
 */
#ifndef vectrix_DOCUMENTS_LOCAL_DOCUMENT_RESULT_HPP
#define vectrix_DOCUMENTS_LOCAL_DOCUMENT_RESULT_HPP

#include <vectrix/documents/local_document.hpp>
#include <vectrix/index/types.hpp>
#include <string>
#include <vector>

namespace vectrix {

struct DocumentTextSection {
    std::string text;
    size_t token_count;
    double score;
    bool is_bm25;

    DocumentTextSection() : token_count(0), score(0.0), is_bm25(false) {}
};

class LocalDocumentResult : public LocalDocument {
public:
    LocalDocumentResult(LocalDocumentIndex* index,
                        const std::string& id,
                        const std::string& uri,
                        const std::vector<QueryResult>& chunks);

    const std::vector<QueryResult>& chunks() const { return chunks_; }

    // Mean chunk score.
    double score() const { return score_; }

    // Every chunk in document order, packed into sections of at most
    // `max_tokens` tokens.
    Status render_all_sections(size_t max_tokens, std::vector<DocumentTextSection>& out);

    // The `max_sections` best sections of at most `max_tokens` tokens.
    // With `overlapping_chunks`, gaps inside a section are marked with
    // "\n\n...\n\n" and sections are padded with the surrounding text.
    Status render_sections(size_t max_tokens,
                           size_t max_sections,
                           std::vector<DocumentTextSection>& out,
                           bool overlapping_chunks = true);

private:
    std::vector<QueryResult> chunks_;
    double score_;
};

} // namespace vectrix

#endif // vectrix_DOCUMENTS_LOCAL_DOCUMENT_RESULT_HPP
