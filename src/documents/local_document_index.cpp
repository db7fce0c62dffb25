/*
 * vectrix C++17 - Local Document Index Implementation
 */
#include <vectrix/documents/local_document_index.hpp>
#include <vectrix/storage/storage_utils.hpp>
#include <vectrix/text/simple_tokenizer.hpp>
#include <vectrix/core/logger.hpp>
#include <vectrix/core/utils.hpp>
#include <algorithm>

namespace vectrix {

const char* const LocalDocumentIndex::CATALOG_FILE = "catalog.json";

// ============================================================================
// Catalog JSON
// ============================================================================

Json document_catalog_to_json(const DocumentCatalog& catalog) {
    Json j = Json::object();
    j["version"] = catalog.version;
    j["count"] = catalog.count;
    j["uriToId"] = catalog.uri_to_id;
    j["idToUri"] = catalog.id_to_uri;
    return j;
}

Status parse_document_catalog(const Json& j, DocumentCatalog& out) {
    if (!j.is_object()) {
        return Status::fail(ErrorKind::PARSE, "catalog must be an object");
    }
    try {
        DocumentCatalog catalog;
        catalog.version = j.value("version", 1);
        catalog.count = j.value("count", static_cast<int64_t>(0));
        if (j.contains("uriToId")) {
            catalog.uri_to_id = j["uriToId"].get<std::map<std::string, std::string>>();
        }
        if (j.contains("idToUri")) {
            catalog.id_to_uri = j["idToUri"].get<std::map<std::string, std::string>>();
        }
        out = catalog;
    } catch (const std::exception& e) {
        return Status::fail(ErrorKind::PARSE, std::string("malformed catalog: ") + e.what());
    }
    return Status::ok();
}

// ============================================================================
// Construction
// ============================================================================

LocalDocumentIndex::LocalDocumentIndex(const LocalDocumentIndexConfig& config)
    : LocalIndex(config.folder_path, config.storage)
    , embeddings_(config.embeddings)
    , tokenizer_(config.tokenizer)
    , chunking_(config.chunking)
{
    if (!tokenizer_) {
        tokenizer_ = chunking_.tokenizer ? chunking_.tokenizer
                                         : std::make_shared<SimpleTokenizer>();
    }
    chunking_.tokenizer = tokenizer_;
}

LocalDocumentIndex::~LocalDocumentIndex() {}

// ============================================================================
// Loading
// ============================================================================

bool LocalDocumentIndex::is_catalog_created() {
    return storage().path_exists(file_path(CATALOG_FILE));
}

Status LocalDocumentIndex::load_index_data() {
    Status s = LocalIndex::load_index_data();
    if (!s.success) return s;

    if (catalog_) {
        return Status::ok();
    }

    std::unique_ptr<DocumentCatalog> catalog(new DocumentCatalog());
    if (is_catalog_created()) {
        std::string text;
        s = storage().read_file(file_path(CATALOG_FILE), text);
        if (!s.success) {
            LOG_ERROR("[DocumentIndex] Failed to read catalog: %s", s.error.c_str());
            return s.wrap("Error loading document catalog");
        }

        Json parsed;
        try {
            parsed = Json::parse(text);
        } catch (const std::exception& e) {
            LOG_ERROR("[DocumentIndex] Failed to parse catalog: %s", e.what());
            return Status::fail(ErrorKind::PARSE,
                                "Error loading document catalog: " + std::string(e.what()));
        }
        s = parse_document_catalog(parsed, *catalog);
        if (!s.success) return s.wrap("Error loading document catalog");
    } else {
        s = storage().upsert_file(file_path(CATALOG_FILE), dump_json(document_catalog_to_json(*catalog)));
        if (!s.success) {
            LOG_ERROR("[DocumentIndex] Failed to create catalog: %s", s.error.c_str());
            return s.wrap("Error creating document catalog");
        }
        LOG_DEBUG("[DocumentIndex] Created empty catalog in %s", folder_path().c_str());
    }

    catalog_ = std::move(catalog);
    return Status::ok();
}

Status LocalDocumentIndex::read_document_text(const std::string& document_id, std::string& out) {
    auto it = text_cache_.find(document_id);
    if (it != text_cache_.end()) {
        out = it->second;
        return Status::ok();
    }

    Status s = storage().read_file(file_path(document_id + ".txt"), out);
    if (!s.success) return s;
    text_cache_[document_id] = out;
    return Status::ok();
}

Status LocalDocumentIndex::load_item_text(const IndexItem& item, std::string& out) {
    const Json& m = item.metadata;
    if (!m.is_object() || !m.contains("documentId") || !m["documentId"].is_string()) {
        return LocalIndex::load_item_text(item, out);
    }

    std::string text;
    Status s = read_document_text(m["documentId"].get<std::string>(), text);
    if (!s.success) return s;

    size_t start = m.value("startPos", static_cast<size_t>(0));
    size_t end = m.value("endPos", static_cast<size_t>(0));
    if (start >= text.size() || end < start) {
        out.clear();
    } else {
        out = text.substr(start, end - start + 1);
    }
    return Status::ok();
}

// ============================================================================
// Transaction hooks
// ============================================================================

void LocalDocumentIndex::prepare_update() {
    LocalIndex::prepare_update();
    working_catalog_ = *catalog_;
    pending_files_.clear();
}

Status LocalDocumentIndex::persist_update() {
    // Overwritten document files, put back if the commit fails
    std::map<std::string, std::string> previous;
    std::vector<std::string> created;

    Status s = Status::ok();
    for (const auto& kv : pending_files_) {
        std::string path = file_path(kv.first);
        if (storage().path_exists(path)) {
            std::string old_content;
            s = storage().read_file(path, old_content);
            if (!s.success) {
                s = s.wrap("Error reading " + kv.first);
                break;
            }
            previous[path] = old_content;
        } else {
            created.push_back(path);
        }

        s = storage().upsert_file(path, kv.second);
        if (!s.success) {
            s = s.wrap("Error saving " + kv.first);
            break;
        }
    }

    bool index_written = false;
    if (s.success) {
        s = LocalIndex::persist_update();
        index_written = s.success;
    }
    if (s.success) {
        s = storage().upsert_file(file_path(CATALOG_FILE), dump_json(document_catalog_to_json(working_catalog_)));
        if (!s.success) {
            LOG_ERROR("[DocumentIndex] Failed to save catalog: %s", s.error.c_str());
            s = s.wrap("Error saving document catalog");
        }
    }

    if (!s.success) {
        if (index_written) {
            Status restored = storage().upsert_file(file_path(index_name()),
                                                    dump_json(index_data_to_json(committed())));
            if (!restored.success) {
                LOG_WARN("[DocumentIndex] Could not restore %s: %s",
                         index_name().c_str(), restored.error.c_str());
            }
        }
        restore_files(previous, created);
    }
    return s;
}

void LocalDocumentIndex::restore_files(const std::map<std::string, std::string>& previous,
                                       const std::vector<std::string>& created) {
    for (const auto& kv : previous) {
        Status s = storage().upsert_file(kv.first, kv.second);
        if (!s.success) {
            LOG_WARN("[DocumentIndex] Could not restore %s: %s", kv.first.c_str(), s.error.c_str());
        }
    }
    for (const auto& path : created) {
        storage_utils::try_delete_file(storage(), path);
    }
}

void LocalDocumentIndex::commit_update() {
    catalog_.reset(new DocumentCatalog(working_catalog_));
    working_catalog_ = DocumentCatalog();
    pending_files_.clear();
    text_cache_.clear();
    LocalIndex::commit_update();
}

void LocalDocumentIndex::discard_update() {
    working_catalog_ = DocumentCatalog();
    pending_files_.clear();
    LocalIndex::discard_update();
}

void LocalDocumentIndex::reset_cache() {
    catalog_.reset();
    text_cache_.clear();
    LocalIndex::reset_cache();
}

// ============================================================================
// Lifecycle
// ============================================================================

Status LocalDocumentIndex::create_index(const CreateIndexConfig& config) {
    CreateIndexConfig cfg = config;
    std::vector<std::string>& indexed = cfg.metadata_config.indexed;
    if (!indexed.empty()) {
        const char* required[] = {"documentId", "startPos", "endPos"};
        for (const char* field : required) {
            if (std::find(indexed.begin(), indexed.end(), field) == indexed.end()) {
                indexed.push_back(field);
            }
        }
    }

    Status s = LocalIndex::create_index(cfg);
    if (!s.success) return s;

    s = load_index_data();
    if (!s.success) {
        LOG_ERROR("[DocumentIndex] Failed to create catalog in %s: %s",
                  folder_path().c_str(), s.error.c_str());
        Status cleanup = delete_index();
        if (!cleanup.success) {
            LOG_WARN("[DocumentIndex] Cleanup of %s failed: %s",
                     folder_path().c_str(), cleanup.error.c_str());
        }
        return Status::fail(ErrorKind::IO, "Error creating index: " + s.error);
    }
    return Status::ok();
}

// ============================================================================
// Catalog lookups
// ============================================================================

Status LocalDocumentIndex::get_document_id(const std::string& uri, std::string& out) {
    out.clear();
    Status s = load_index_data();
    if (!s.success) return s;

    auto it = catalog_->uri_to_id.find(uri);
    if (it != catalog_->uri_to_id.end()) {
        out = it->second;
    }
    return Status::ok();
}

Status LocalDocumentIndex::get_document_uri(const std::string& document_id, std::string& out) {
    out.clear();
    Status s = load_index_data();
    if (!s.success) return s;

    auto it = catalog_->id_to_uri.find(document_id);
    if (it != catalog_->id_to_uri.end()) {
        out = it->second;
    }
    return Status::ok();
}

Status LocalDocumentIndex::get_catalog_stats(DocumentCatalogStats& out) {
    IndexStats stats;
    Status s = get_index_stats(stats);
    if (!s.success) return s;
    s = load_index_data();
    if (!s.success) return s;

    out.version = catalog_->version;
    out.documents = static_cast<size_t>(catalog_->count);
    out.chunks = stats.items;
    out.metadata_config = stats.metadata_config;
    return Status::ok();
}

// ============================================================================
// Documents
// ============================================================================

Status LocalDocumentIndex::embed_chunks(const std::vector<TextChunk>& chunks,
                                        std::vector<std::vector<float>>& out) {
    out.clear();

    // Batches stay within the model's per-call token limit
    std::vector<std::vector<std::string>> batches;
    std::vector<std::string> current;
    size_t total_tokens = 0;
    size_t limit = embeddings_->max_tokens();
    for (const auto& chunk : chunks) {
        if (!current.empty() && total_tokens + chunk.tokens.size() > limit) {
            batches.push_back(current);
            current.clear();
            total_tokens = 0;
        }
        current.push_back(replace_all(chunk.text, "\n", " "));
        total_tokens += chunk.tokens.size();
    }
    if (!current.empty()) {
        batches.push_back(current);
    }

    for (const auto& batch : batches) {
        EmbeddingsResponse response = embeddings_->create_embeddings(batch);
        if (response.status != EmbeddingsStatus::SUCCESS) {
            LOG_ERROR("[DocumentIndex] Embeddings %s: %s",
                      embeddings_status_name(response.status), response.message.c_str());
            return Status::fail(ErrorKind::UPSTREAM, "Error generating embeddings: " + response.message);
        }
        if (response.output.size() != batch.size()) {
            LOG_ERROR("[DocumentIndex] Expected %zu embeddings, got %zu",
                      batch.size(), response.output.size());
            return Status::fail(ErrorKind::UPSTREAM,
                                "Error generating embeddings: expected " +
                                std::to_string(batch.size()) + " vectors, got " +
                                std::to_string(response.output.size()));
        }
        out.insert(out.end(), response.output.begin(), response.output.end());
    }
    return Status::ok();
}

Status LocalDocumentIndex::upsert_document(const std::string& uri,
                                           const std::string& text,
                                           const std::string& doc_type,
                                           const Json& metadata,
                                           std::unique_ptr<LocalDocument>* out) {
    if (!embeddings_) {
        return Status::fail(ErrorKind::STATE, "Embeddings model not configured.");
    }
    if (update_state() == UpdateState::UPDATING) {
        return Status::fail(ErrorKind::CONFLICT, "transaction already in progress");
    }
    if (!metadata.is_null() && !metadata.is_object()) {
        return Status::fail(ErrorKind::VALIDATION, "Document metadata must be an object");
    }

    Status s = load_index_data();
    if (!s.success) return s;

    TextSplitterConfig config = chunking_;
    config.doc_type = doc_type.empty() ? file_extension(uri) : doc_type;

    std::unique_ptr<TextSplitter> splitter;
    s = TextSplitter::create(config, splitter);
    if (!s.success) return s.wrap("Error adding document \"" + uri + "\"");

    std::vector<TextChunk> chunks = splitter->split(text);

    std::vector<std::vector<float>> vectors;
    s = embed_chunks(chunks, vectors);
    if (!s.success) return s.wrap("Error adding document \"" + uri + "\"");

    std::string document_id;
    s = get_document_id(uri, document_id);
    if (!s.success) return s;
    bool replacing = !document_id.empty();
    if (!replacing) {
        document_id = generate_uuid();
    }

    // Old chunks, new chunks, texts and catalog commit together
    s = begin_update();
    if (!s.success) return s;

    size_t removed = 0;
    if (replacing) {
        s = delete_document_chunks(document_id, removed);
    }

    for (size_t i = 0; s.success && i < chunks.size(); ++i) {
        IndexItem item;
        item.vector = vectors[i];
        item.metadata = metadata.is_object() ? metadata : Json::object();
        item.metadata.erase("isBm25");
        item.metadata["documentId"] = document_id;
        item.metadata["startPos"] = chunks[i].start_pos;
        item.metadata["endPos"] = chunks[i].end_pos;
        s = insert_item(item);
    }

    if (s.success) {
        if (metadata.is_object()) {
            pending_files_[document_id + ".json"] = dump_json(metadata);
        }
        pending_files_[document_id + ".txt"] = text;

        working_catalog_.uri_to_id[uri] = document_id;
        working_catalog_.id_to_uri[document_id] = uri;
        if (!replacing) {
            working_catalog_.count++;
        }
        s = end_update();
    }
    if (!s.success) {
        rollback_update();
        LOG_ERROR("[DocumentIndex] Failed to add %s: %s", uri.c_str(), s.error.c_str());
        return s.wrap("Error adding document \"" + uri + "\"");
    }

    if (replacing) {
        if (!metadata.is_object()) {
            storage_utils::try_delete_file(storage(), file_path(document_id + ".json"));
        }
        LOG_DEBUG("[DocumentIndex] Replaced %zu chunks of %s", removed, uri.c_str());
    }

    LOG_INFO("[DocumentIndex] Added %s as %s (%zu chunks)", uri.c_str(), document_id.c_str(), chunks.size());
    if (out) {
        out->reset(new LocalDocument(this, document_id, uri));
    }
    return Status::ok();
}

Status LocalDocumentIndex::delete_document(const std::string& uri) {
    if (update_state() == UpdateState::UPDATING) {
        return Status::fail(ErrorKind::CONFLICT, "transaction already in progress");
    }

    std::string document_id;
    Status s = get_document_id(uri, document_id);
    if (!s.success) return s;
    if (document_id.empty()) {
        return Status::ok();
    }

    s = begin_update();
    if (!s.success) return s;

    size_t removed = 0;
    s = delete_document_chunks(document_id, removed);
    if (s.success) {
        working_catalog_.uri_to_id.erase(uri);
        working_catalog_.id_to_uri.erase(document_id);
        working_catalog_.count--;
        s = end_update();
    }
    if (!s.success) {
        rollback_update();
        LOG_ERROR("[DocumentIndex] Failed to delete %s: %s", uri.c_str(), s.error.c_str());
        return s.wrap("Error deleting document \"" + uri + "\"");
    }

    s = storage().delete_file(file_path(document_id + ".txt"));
    if (!s.success) {
        LOG_ERROR("[DocumentIndex] Failed to remove text of %s: %s", uri.c_str(), s.error.c_str());
        return s.wrap("Error removing text file for document \"" + uri + "\" from disk");
    }
    storage_utils::try_delete_file(storage(), file_path(document_id + ".json"));

    LOG_INFO("[DocumentIndex] Deleted %s (%zu chunks)", uri.c_str(), removed);
    return Status::ok();
}

Status LocalDocumentIndex::delete_document_chunks(const std::string& document_id, size_t& removed) {
    removed = 0;
    Json filter = Json::object();
    filter["documentId"] = document_id;
    std::vector<IndexItem> owned;
    Status s = list_items_by_metadata(filter, owned);
    if (!s.success) return s;

    for (const auto& item : owned) {
        s = delete_item(item.id);
        if (!s.success) return s;
        ++removed;
    }
    return Status::ok();
}

void LocalDocumentIndex::group_by_document(const std::vector<QueryResult>& results,
                                           std::vector<LocalDocumentResult>& out) {
    std::vector<std::string> order;
    std::map<std::string, std::vector<QueryResult>> grouped;
    for (const auto& result : results) {
        const Json& m = result.item.metadata;
        if (!m.is_object() || !m.contains("documentId") || !m["documentId"].is_string()) {
            LOG_WARN("[DocumentIndex] Item %s has no documentId", result.item.id.c_str());
            continue;
        }
        std::string document_id = m["documentId"].get<std::string>();
        if (grouped.find(document_id) == grouped.end()) {
            order.push_back(document_id);
        }
        grouped[document_id].push_back(result);
    }

    for (const auto& document_id : order) {
        std::string uri;
        auto it = catalog_->id_to_uri.find(document_id);
        if (it != catalog_->id_to_uri.end()) {
            uri = it->second;
        }
        out.push_back(LocalDocumentResult(this, document_id, uri, grouped[document_id]));
    }
}

Status LocalDocumentIndex::query_documents(const std::string& query,
                                           const DocumentQueryOptions& options,
                                           std::vector<LocalDocumentResult>& out) {
    out.clear();
    if (!embeddings_) {
        return Status::fail(ErrorKind::STATE, "Embeddings model not configured.");
    }

    Status s = load_index_data();
    if (!s.success) return s;

    std::vector<std::string> inputs(1, replace_all(query, "\n", " "));
    EmbeddingsResponse response = embeddings_->create_embeddings(inputs);
    if (response.status != EmbeddingsStatus::SUCCESS) {
        LOG_ERROR("[DocumentIndex] Query embeddings %s: %s",
                  embeddings_status_name(response.status), response.message.c_str());
        return Status::fail(ErrorKind::UPSTREAM,
                            "Error generating embeddings for query: " + response.message);
    }
    if (response.output.empty()) {
        return Status::fail(ErrorKind::UPSTREAM,
                            "Error generating embeddings for query: no vector returned");
    }

    std::vector<QueryResult> results;
    s = query_items(response.output[0], options.max_chunks, results,
                    options.filter, query, options.is_bm25);
    if (!s.success) return s;

    group_by_document(results, out);

    std::stable_sort(out.begin(), out.end(),
                     [](const LocalDocumentResult& a, const LocalDocumentResult& b) {
                         return a.score() > b.score();
                     });
    if (out.size() > options.max_documents) {
        out.erase(out.begin() + options.max_documents, out.end());
    }

    LOG_DEBUG("[DocumentIndex] Query matched %zu chunks in %zu documents", results.size(), out.size());
    return Status::ok();
}

Status LocalDocumentIndex::list_documents(std::vector<LocalDocumentResult>& out) {
    out.clear();
    std::vector<IndexItem> items;
    Status s = list_items(items);
    if (!s.success) return s;

    std::vector<QueryResult> results;
    results.reserve(items.size());
    for (const auto& item : items) {
        results.push_back(QueryResult(item, 1.0));
    }
    group_by_document(results, out);
    return Status::ok();
}

} // namespace vectrix
