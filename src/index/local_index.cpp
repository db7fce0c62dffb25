/*
 * vectrix C++17 - Local Index Implementation
 */
#include <vectrix/index/local_index.hpp>
#include <vectrix/index/item_selector.hpp>
#include <vectrix/index/bm25_index.hpp>
#include <vectrix/storage/local_file_storage.hpp>
#include <vectrix/storage/storage_utils.hpp>
#include <vectrix/core/logger.hpp>
#include <vectrix/core/utils.hpp>
#include <algorithm>
#include <cmath>

namespace vectrix {

// ============================================================================
// Construction
// ============================================================================

LocalIndex::LocalIndex(const std::string& folder_path,
                       std::shared_ptr<FileStorage> storage,
                       const std::string& index_name)
    : folder_path_(folder_path)
    , index_name_(index_name)
    , storage_(storage ? storage : std::make_shared<LocalFileStorage>())
    , state_(UpdateState::IDLE)
{}

LocalIndex::~LocalIndex() {}

std::string LocalIndex::file_path(const std::string& name) const {
    return join_path(folder_path_, name);
}

// ============================================================================
// Loading
// ============================================================================

bool LocalIndex::is_index_created() {
    return storage_->path_exists(file_path(index_name_));
}

Status LocalIndex::load_index_data() {
    if (data_) {
        return Status::ok();
    }

    if (!is_index_created()) {
        return Status::fail(ErrorKind::STATE, "Index does not exist: " + folder_path_);
    }

    std::string text;
    Status s = storage_->read_file(file_path(index_name_), text);
    if (!s.success) {
        LOG_ERROR("[LocalIndex] Failed to read %s: %s", index_name_.c_str(), s.error.c_str());
        return s.wrap("Error loading index");
    }

    Json parsed;
    try {
        parsed = Json::parse(text);
    } catch (const std::exception& e) {
        LOG_ERROR("[LocalIndex] Failed to parse %s: %s", index_name_.c_str(), e.what());
        return Status::fail(ErrorKind::PARSE, "Error loading index: " + std::string(e.what()));
    }

    std::unique_ptr<IndexData> data(new IndexData());
    s = parse_index_data(parsed, *data);
    if (!s.success) {
        LOG_ERROR("[LocalIndex] Malformed %s: %s", index_name_.c_str(), s.error.c_str());
        return s.wrap("Error loading index");
    }

    LOG_DEBUG("[LocalIndex] Loaded %zu items from %s", data->items.size(), folder_path_.c_str());
    data_ = std::move(data);
    return Status::ok();
}

void LocalIndex::reset_cache() {
    data_.reset();
    discard_update();
    state_ = UpdateState::IDLE;
}

// ============================================================================
// Lifecycle
// ============================================================================

Status LocalIndex::create_index(const CreateIndexConfig& config) {
    if (is_index_created()) {
        if (!config.delete_if_exists) {
            return Status::fail(ErrorKind::CONFLICT, "Index already exists: " + folder_path_);
        }
        Status s = delete_index();
        if (!s.success) {
            return s.wrap("Error creating index");
        }
    }

    IndexData data;
    data.version = config.version;
    data.metadata_config = config.metadata_config;

    Status s = storage_->create_folder(folder_path_);
    if (s.success) {
        s = storage_->upsert_file(file_path(index_name_), dump_json(index_data_to_json(data)));
    }

    if (!s.success) {
        LOG_ERROR("[LocalIndex] Failed to create index at %s: %s",
                  folder_path_.c_str(), s.error.c_str());
        Status cleanup = storage_->delete_folder(folder_path_);
        if (!cleanup.success) {
            LOG_WARN("[LocalIndex] Cleanup of %s failed: %s",
                     folder_path_.c_str(), cleanup.error.c_str());
        }
        reset_cache();
        return Status::fail(ErrorKind::IO, "Error creating index: " + s.error);
    }

    reset_cache();
    data_.reset(new IndexData(data));
    LOG_INFO("[LocalIndex] Created index at %s (version %d, %zu indexed fields)",
             folder_path_.c_str(), data.version, data.metadata_config.indexed.size());
    return Status::ok();
}

Status LocalIndex::delete_index() {
    reset_cache();
    Status s = storage_->delete_folder(folder_path_);
    if (!s.success) {
        LOG_ERROR("[LocalIndex] Failed to delete %s: %s", folder_path_.c_str(), s.error.c_str());
        return s.wrap("Error deleting index");
    }
    LOG_INFO("[LocalIndex] Deleted index at %s", folder_path_.c_str());
    return Status::ok();
}

// ============================================================================
// Transactions
// ============================================================================

Status LocalIndex::begin_update() {
    if (state_ == UpdateState::UPDATING) {
        return Status::fail(ErrorKind::CONFLICT, "transaction already in progress");
    }

    Status s = load_index_data();
    if (!s.success) return s;

    working_ = *data_;
    working_ids_.clear();
    for (const auto& item : working_.items) {
        working_ids_.insert(item.id);
    }
    pending_metadata_.clear();
    obsolete_metadata_.clear();
    prepare_update();
    state_ = UpdateState::UPDATING;
    return Status::ok();
}

Status LocalIndex::end_update() {
    if (state_ != UpdateState::UPDATING) {
        return Status::fail(ErrorKind::STATE, "no transaction in progress");
    }

    Status s = persist_update();
    if (!s.success) {
        // Working copies are kept so the caller can retry or cancel
        LOG_ERROR("[LocalIndex] Commit failed: %s", s.error.c_str());
        return s;
    }

    std::set<std::string> obsolete;
    obsolete.swap(obsolete_metadata_);
    commit_update();
    state_ = UpdateState::IDLE;

    for (const auto& name : obsolete) {
        storage_utils::try_delete_file(*storage_, file_path(name));
    }
    return Status::ok();
}

Status LocalIndex::cancel_update() {
    if (state_ != UpdateState::UPDATING) {
        return Status::fail(ErrorKind::STATE, "no transaction in progress");
    }
    rollback_update();
    return Status::ok();
}

void LocalIndex::rollback_update() {
    if (state_ == UpdateState::UPDATING) {
        discard_update();
        state_ = UpdateState::IDLE;
    }
}

void LocalIndex::prepare_update() {}

Status LocalIndex::persist_update() {
    for (const auto& kv : pending_metadata_) {
        Status s = storage_->upsert_file(file_path(kv.first), kv.second);
        if (!s.success) {
            return s.wrap("Error saving metadata file " + kv.first);
        }
    }

    Status s = storage_->upsert_file(file_path(index_name_), dump_json(index_data_to_json(working_)));
    if (!s.success) {
        return s.wrap("Error saving index");
    }
    return Status::ok();
}

void LocalIndex::commit_update() {
    data_.reset(new IndexData());
    data_->version = working_.version;
    data_->metadata_config = working_.metadata_config;
    data_->items.swap(working_.items);
    clear_working();
}

void LocalIndex::discard_update() {
    clear_working();
}

void LocalIndex::clear_working() {
    working_ = IndexData();
    working_ids_.clear();
    pending_metadata_.clear();
    obsolete_metadata_.clear();
}

// ============================================================================
// Mutations
// ============================================================================

void LocalIndex::retire_metadata_file(const std::string& name) {
    if (name.empty()) return;
    // A side file written in this transaction was never persisted
    if (pending_metadata_.erase(name) == 0) {
        obsolete_metadata_.insert(name);
    }
}

Status LocalIndex::add_item_to_update(const IndexItem& item, bool unique, IndexItem* out) {
    if (item.vector.empty()) {
        return Status::fail(ErrorKind::VALIDATION, "Vector is required");
    }

    std::string id = item.id.empty() ? generate_uuid() : item.id;
    bool exists = working_ids_.count(id) > 0;
    if (unique && exists) {
        return Status::fail(ErrorKind::CONFLICT, "Item with id " + id + " already exists");
    }

    IndexItem stored;
    stored.id = id;
    stored.vector = item.vector;
    stored.norm = ItemSelector::normalize(item.vector);

    const std::vector<std::string>& indexed = working_.metadata_config.indexed;
    if (!indexed.empty() && item.metadata.is_object()) {
        stored.metadata = Json::object();
        for (const auto& key : indexed) {
            auto it = item.metadata.find(key);
            if (it != item.metadata.end()) {
                stored.metadata[key] = *it;
            }
        }
        stored.metadata_file = generate_uuid() + ".json";
        pending_metadata_[stored.metadata_file] = dump_json(item.metadata);
    } else {
        stored.metadata = item.metadata.is_object() ? item.metadata : Json::object();
    }

    if (exists) {
        for (auto& existing : working_.items) {
            if (existing.id == id) {
                retire_metadata_file(existing.metadata_file);
                existing = stored;
                break;
            }
        }
    } else {
        working_.items.push_back(stored);
        working_ids_.insert(id);
    }

    if (out) *out = stored;
    return Status::ok();
}

Status LocalIndex::insert_item(const IndexItem& item, IndexItem* out) {
    if (state_ == UpdateState::UPDATING) {
        return add_item_to_update(item, true, out);
    }

    Status s = begin_update();
    if (!s.success) return s;
    s = add_item_to_update(item, true, out);
    if (!s.success) {
        rollback_update();
        return s;
    }
    s = end_update();
    if (!s.success) {
        rollback_update();
    }
    return s;
}

Status LocalIndex::upsert_item(const IndexItem& item, IndexItem* out) {
    if (state_ == UpdateState::UPDATING) {
        return add_item_to_update(item, false, out);
    }

    Status s = begin_update();
    if (!s.success) return s;
    s = add_item_to_update(item, false, out);
    if (!s.success) {
        rollback_update();
        return s;
    }
    s = end_update();
    if (!s.success) {
        rollback_update();
    }
    return s;
}

LocalIndex::WorkingSnapshot LocalIndex::capture_working() const {
    WorkingSnapshot snapshot;
    snapshot.items = working_.items;
    snapshot.ids = working_ids_;
    snapshot.pending_metadata = pending_metadata_;
    snapshot.obsolete_metadata = obsolete_metadata_;
    return snapshot;
}

void LocalIndex::restore_working(WorkingSnapshot& snapshot) {
    working_.items.swap(snapshot.items);
    working_ids_.swap(snapshot.ids);
    pending_metadata_.swap(snapshot.pending_metadata);
    obsolete_metadata_.swap(snapshot.obsolete_metadata);
}

Status LocalIndex::insert_items_locked(const std::vector<IndexItem>& items,
                                       std::vector<IndexItem>* out) {
    std::vector<IndexItem> stored;
    stored.reserve(items.size());
    for (size_t i = 0; i < items.size(); ++i) {
        IndexItem added;
        Status s = add_item_to_update(items[i], true, &added);
        if (!s.success) {
            return s.wrap("batch item " + std::to_string(i));
        }
        stored.push_back(added);
    }
    if (out) out->swap(stored);
    return Status::ok();
}

Status LocalIndex::batch_insert_items(const std::vector<IndexItem>& items,
                                      std::vector<IndexItem>* out) {
    if (state_ == UpdateState::UPDATING) {
        WorkingSnapshot snapshot = capture_working();
        Status s = insert_items_locked(items, out);
        if (!s.success) {
            restore_working(snapshot);
            LOG_WARN("[LocalIndex] Batch insert rolled back: %s", s.error.c_str());
        }
        return s;
    }

    Status s = begin_update();
    if (!s.success) return s;
    s = insert_items_locked(items, out);
    if (!s.success) {
        rollback_update();
        LOG_WARN("[LocalIndex] Batch insert rolled back: %s", s.error.c_str());
        return s;
    }
    s = end_update();
    if (!s.success) {
        rollback_update();
    }
    return s;
}

Status LocalIndex::delete_item(const std::string& id) {
    bool auto_commit = state_ == UpdateState::IDLE;
    if (auto_commit) {
        Status s = begin_update();
        if (!s.success) return s;
    }

    if (working_ids_.count(id)) {
        for (auto it = working_.items.begin(); it != working_.items.end(); ++it) {
            if (it->id == id) {
                retire_metadata_file(it->metadata_file);
                working_.items.erase(it);
                break;
            }
        }
        working_ids_.erase(id);
    }

    if (!auto_commit) {
        return Status::ok();
    }
    Status s = end_update();
    if (!s.success) {
        rollback_update();
    }
    return s;
}

// ============================================================================
// Reads
// ============================================================================

Status LocalIndex::get_item(const std::string& id, IndexItem& out) {
    Status s = load_index_data();
    if (!s.success) return s;

    for (const auto& item : data_->items) {
        if (item.id == id) {
            out = item;
            return Status::ok();
        }
    }
    return Status::fail(ErrorKind::NOT_FOUND, "Item not found: " + id);
}

Status LocalIndex::list_items(std::vector<IndexItem>& out) {
    Status s = load_index_data();
    if (!s.success) return s;
    out = data_->items;
    return Status::ok();
}

Status LocalIndex::list_items_by_metadata(const Json& filter, std::vector<IndexItem>& out) {
    Status s = load_index_data();
    if (!s.success) return s;

    out.clear();
    for (const auto& item : data_->items) {
        if (ItemSelector::select(item.metadata, filter)) {
            out.push_back(item);
        }
    }
    return Status::ok();
}

Status LocalIndex::get_index_stats(IndexStats& out) {
    Status s = load_index_data();
    if (!s.success) return s;

    out.version = data_->version;
    out.metadata_config = data_->metadata_config;
    out.items = data_->items.size();
    return Status::ok();
}

Status LocalIndex::load_item_metadata(const IndexItem& item, Json& out) {
    if (item.metadata_file.empty()) {
        out = item.metadata;
        return Status::ok();
    }

    std::string text;
    Status s = storage_->read_file(file_path(item.metadata_file), text);
    if (!s.success) {
        LOG_ERROR("[LocalIndex] Failed to read metadata for item %s: %s",
                  item.id.c_str(), s.error.c_str());
        return s.wrap("Error loading metadata for item " + item.id);
    }

    try {
        out = Json::parse(text);
    } catch (const std::exception& e) {
        LOG_ERROR("[LocalIndex] Failed to parse metadata for item %s: %s", item.id.c_str(), e.what());
        return Status::fail(ErrorKind::PARSE,
                            "Error loading metadata for item " + item.id + ": " + e.what());
    }
    return Status::ok();
}

Status LocalIndex::load_item_text(const IndexItem& item, std::string& out) {
    Json metadata;
    Status s = load_item_metadata(item, metadata);
    if (!s.success) return s;

    std::vector<std::string> parts;
    if (metadata.is_object()) {
        for (auto it = metadata.begin(); it != metadata.end(); ++it) {
            if (it.value().is_string()) {
                parts.push_back(it.value().get<std::string>());
            }
        }
    }
    out = join(parts, " ");
    return Status::ok();
}

Status LocalIndex::query_items(const std::vector<float>& vector,
                               size_t top_k,
                               std::vector<QueryResult>& out,
                               const Json& filter,
                               const std::string& query_text,
                               bool is_bm25) {
    out.clear();
    Status s = load_index_data();
    if (!s.success) return s;

    const std::vector<IndexItem>& items = data_->items;

    std::vector<size_t> candidates;
    candidates.reserve(items.size());
    for (size_t i = 0; i < items.size(); ++i) {
        if (ItemSelector::select(items[i].metadata, filter)) {
            candidates.push_back(i);
        }
    }

    double norm = ItemSelector::normalize(vector);
    std::vector<std::pair<size_t, double>> scored;
    scored.reserve(candidates.size());
    for (size_t idx : candidates) {
        const IndexItem& item = items[idx];
        scored.push_back({idx, ItemSelector::normalized_cosine_similarity(vector, norm,
                                                                         item.vector, item.norm)});
    }

    std::stable_sort(scored.begin(), scored.end(),
                     [](const std::pair<size_t, double>& a, const std::pair<size_t, double>& b) {
                         if (std::isnan(a.second)) return false;
                         if (std::isnan(b.second)) return true;
                         return a.second > b.second;
                     });
    if (scored.size() > top_k) {
        scored.resize(top_k);
    }

    std::unordered_set<size_t> selected;
    for (const auto& entry : scored) {
        QueryResult result(items[entry.first], entry.second);
        s = load_item_metadata(result.item, result.item.metadata);
        if (!s.success) return s;
        selected.insert(entry.first);
        out.push_back(std::move(result));
    }

    if (!is_bm25 || trim(query_text).empty() || top_k == 0) {
        return Status::ok();
    }

    // Keyword pass over the filtered items the semantic pass left out
    Bm25Index bm25;
    for (size_t idx : candidates) {
        if (selected.count(idx)) continue;
        std::string text;
        s = load_item_text(items[idx], text);
        if (!s.success) return s.wrap("Error preparing keyword search");
        bm25.add_document(idx, text);
    }

    std::vector<Bm25Hit> hits = bm25.search(query_text, top_k);
    for (const auto& hit : hits) {
        QueryResult result(items[hit.doc], hit.score);
        s = load_item_metadata(result.item, result.item.metadata);
        if (!s.success) return s;
        if (!result.item.metadata.is_object()) {
            result.item.metadata = Json::object();
        }
        result.item.metadata["isBm25"] = true;
        out.push_back(std::move(result));
    }

    LOG_DEBUG("[LocalIndex] Query returned %zu semantic and %zu keyword results",
              scored.size(), hits.size());
    return Status::ok();
}

} // namespace vectrix
