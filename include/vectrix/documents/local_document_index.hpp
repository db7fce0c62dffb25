/*
 * vectrix C++17 - Local Document Index
 *
 * Item store specialised for whole documents. Each document is split into
 * chunks, every chunk is embedded and stored as one item whose metadata
 * carries documentId, startPos and endPos. Alongside index.json the folder
 * holds:
 *   catalog.json   uri <-> document id mapping
 *   <id>.txt       raw document text
 *   <id>.json      document metadata (when given)
 *
 * Catalog changes ride on the item store's transaction and are committed
 * together with it.
 */
#ifndef vectrix_DOCUMENTS_LOCAL_DOCUMENT_INDEX_HPP
#define vectrix_DOCUMENTS_LOCAL_DOCUMENT_INDEX_HPP

#include <vectrix/index/local_index.hpp>
#include <vectrix/embeddings/embeddings_model.hpp>
#include <vectrix/text/text_splitter.hpp>
#include <vectrix/text/tokenizer.hpp>
#include <vectrix/documents/local_document_result.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace vectrix {

struct DocumentCatalog {
    int version;
    int64_t count;
    std::map<std::string, std::string> uri_to_id;
    std::map<std::string, std::string> id_to_uri;

    DocumentCatalog() : version(1), count(0) {}
};

Json document_catalog_to_json(const DocumentCatalog& catalog);
Status parse_document_catalog(const Json& j, DocumentCatalog& out);

struct DocumentQueryOptions {
    size_t max_documents;
    size_t max_chunks;
    Json filter;
    bool is_bm25;

    DocumentQueryOptions() : max_documents(10), max_chunks(50), is_bm25(false) {}
};

struct DocumentCatalogStats {
    int version;
    size_t documents;
    size_t chunks;
    MetadataConfig metadata_config;

    DocumentCatalogStats() : version(1), documents(0), chunks(0) {}
};

struct LocalDocumentIndexConfig {
    std::string folder_path;
    std::shared_ptr<EmbeddingsModel> embeddings;    // Required for upsert and query
    std::shared_ptr<Tokenizer> tokenizer;           // Defaults to SimpleTokenizer
    std::shared_ptr<FileStorage> storage;           // Defaults to LocalFileStorage
    TextSplitterConfig chunking;

    LocalDocumentIndexConfig() {
        chunking.keep_separators = true;
        chunking.chunk_size = 512;
        chunking.chunk_overlap = 0;
    }
};

class LocalDocumentIndex : public LocalIndex {
public:
    static const char* const CATALOG_FILE;

    explicit LocalDocumentIndex(const LocalDocumentIndexConfig& config);
    ~LocalDocumentIndex() override;

    std::shared_ptr<EmbeddingsModel> embeddings() const { return embeddings_; }
    std::shared_ptr<Tokenizer> tokenizer() const { return tokenizer_; }
    const TextSplitterConfig& chunking_config() const { return chunking_; }

    // documentId, startPos and endPos are added to a non-empty indexed list.
    Status create_index(const CreateIndexConfig& config = CreateIndexConfig()) override;

    bool is_catalog_created();

    // `out` is left empty when the uri (or id) is not catalogued.
    Status get_document_id(const std::string& uri, std::string& out);
    Status get_document_uri(const std::string& document_id, std::string& out);

    Status get_catalog_stats(DocumentCatalogStats& out);

    // Replaces any document already stored under `uri`, keeping its id.
    // `doc_type` picks the splitter separators and defaults to the uri's
    // extension. Embeddings are generated before anything is written.
    Status upsert_document(const std::string& uri,
                           const std::string& text,
                           const std::string& doc_type = "",
                           const Json& metadata = Json(),
                           std::unique_ptr<LocalDocument>* out = nullptr);

    // No-op for an unknown uri.
    Status delete_document(const std::string& uri);

    // Best documents first, scored by the mean of their matching chunks.
    Status query_documents(const std::string& query,
                           const DocumentQueryOptions& options,
                           std::vector<LocalDocumentResult>& out);

    // Every catalogued document with all of its chunks at score 1.0.
    Status list_documents(std::vector<LocalDocumentResult>& out);

protected:
    Status load_index_data() override;
    Status load_item_text(const IndexItem& item, std::string& out) override;
    void prepare_update() override;
    Status persist_update() override;
    void commit_update() override;
    void discard_update() override;
    void reset_cache() override;

private:
    Status read_document_text(const std::string& document_id, std::string& out);
    // Deletes the chunk items of a document in the open transaction.
    Status delete_document_chunks(const std::string& document_id, size_t& removed);
    void restore_files(const std::map<std::string, std::string>& previous,
                       const std::vector<std::string>& created);
    Status embed_chunks(const std::vector<TextChunk>& chunks,
                        std::vector<std::vector<float>>& out);
    void group_by_document(const std::vector<QueryResult>& results,
                           std::vector<LocalDocumentResult>& out);

    std::shared_ptr<EmbeddingsModel> embeddings_;
    std::shared_ptr<Tokenizer> tokenizer_;
    TextSplitterConfig chunking_;

    std::unique_ptr<DocumentCatalog> catalog_;
    DocumentCatalog working_catalog_;
    std::map<std::string, std::string> pending_files_;     // file name -> content
    std::map<std::string, std::string> text_cache_;        // document id -> text
};

} // namespace vectrix

#endif // vectrix_DOCUMENTS_LOCAL_DOCUMENT_INDEX_HPP
