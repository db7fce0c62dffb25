/*
 * vectrix C++17 - Local Index
 *
 * Transactional item store kept as index.json inside a storage folder.
 * The whole snapshot is loaded into memory on first use.
 *
 * Mutations happen inside an update transaction:
 *   IDLE --begin_update--> UPDATING --end_update/cancel_update--> IDLE
 * Single mutations called while IDLE open and commit their own transaction.
 */
#ifndef vectrix_INDEX_LOCAL_INDEX_HPP
#define vectrix_INDEX_LOCAL_INDEX_HPP

#include <vectrix/index/types.hpp>
#include <vectrix/storage/file_storage.hpp>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <unordered_set>
#include <vector>

namespace vectrix {

enum class UpdateState {
    IDLE,
    UPDATING
};

class LocalIndex {
public:
    // `storage` defaults to a LocalFileStorage over the working directory.
    explicit LocalIndex(const std::string& folder_path,
                        std::shared_ptr<FileStorage> storage = nullptr,
                        const std::string& index_name = "index.json");
    virtual ~LocalIndex();

    const std::string& folder_path() const { return folder_path_; }
    const std::string& index_name() const { return index_name_; }
    FileStorage& storage() { return *storage_; }
    std::shared_ptr<FileStorage> storage_ptr() const { return storage_; }

    // ---- Transactions ----
    Status begin_update();
    Status end_update();
    Status cancel_update();
    UpdateState update_state() const { return state_; }

    // ---- Lifecycle ----
    virtual Status create_index(const CreateIndexConfig& config = CreateIndexConfig());
    virtual Status delete_index();
    bool is_index_created();

    // ---- Items ----
    // Fails with VALIDATION on an empty vector and CONFLICT on a duplicate id.
    // A missing id is generated. `out` receives the stored item.
    Status insert_item(const IndexItem& item, IndexItem* out = nullptr);
    Status upsert_item(const IndexItem& item, IndexItem* out = nullptr);

    // All items or none, also inside an explicit transaction.
    Status batch_insert_items(const std::vector<IndexItem>& items,
                              std::vector<IndexItem>* out = nullptr);

    // No-op when the id is absent.
    Status delete_item(const std::string& id);

    // NOT_FOUND when the id is absent.
    Status get_item(const std::string& id, IndexItem& out);
    Status list_items(std::vector<IndexItem>& out);
    Status list_items_by_metadata(const Json& filter, std::vector<IndexItem>& out);

    // Cosine ranking of the items passing `filter`, best first, NaN scores last.
    // With `is_bm25` and a non-empty `query_text`, up to `top_k` keyword hits
    // from the remaining candidates are appended with metadata.isBm25 = true.
    Status query_items(const std::vector<float>& vector,
                       size_t top_k,
                       std::vector<QueryResult>& out,
                       const Json& filter = Json(),
                       const std::string& query_text = "",
                       bool is_bm25 = false);

    Status get_index_stats(IndexStats& out);

    // Full metadata of an item, reading its side file when it has one.
    Status load_item_metadata(const IndexItem& item, Json& out);

protected:
    // Loads index.json once. Overrides chain to this and add their own state.
    virtual Status load_index_data();

    // Text scored by the keyword pass. Defaults to the string values of the
    // item's full metadata.
    virtual Status load_item_text(const IndexItem& item, std::string& out);

    // Called once the working copy exists; overrides clone their own state.
    virtual void prepare_update();

    // Write everything the open transaction changed. Working state must stay
    // untouched so a failed commit can be retried or cancelled.
    virtual Status persist_update();

    // Swap working state in as the committed snapshot.
    virtual void commit_update();

    // Drop working state.
    virtual void discard_update();

    // Drop every cached snapshot (index deleted or recreated).
    virtual void reset_cache();

    // cancel_update without the state check, for operations that opened
    // their own transaction.
    void rollback_update();

    std::string file_path(const std::string& name) const;
    bool is_loaded() const { return data_ != nullptr; }
    const IndexData& committed() const { return *data_; }

private:
    LocalIndex(const LocalIndex&);
    LocalIndex& operator=(const LocalIndex&);

    // Working-copy state captured by batch_insert_items for rollback.
    struct WorkingSnapshot {
        std::vector<IndexItem> items;
        std::unordered_set<std::string> ids;
        std::map<std::string, std::string> pending_metadata;
        std::set<std::string> obsolete_metadata;
    };

    void clear_working();
    Status add_item_to_update(const IndexItem& item, bool unique, IndexItem* out);
    void retire_metadata_file(const std::string& name);
    WorkingSnapshot capture_working() const;
    void restore_working(WorkingSnapshot& snapshot);
    Status insert_items_locked(const std::vector<IndexItem>& items, std::vector<IndexItem>* out);

    std::string folder_path_;
    std::string index_name_;
    std::shared_ptr<FileStorage> storage_;

    std::unique_ptr<IndexData> data_;
    UpdateState state_;
    IndexData working_;
    std::unordered_set<std::string> working_ids_;
    std::map<std::string, std::string> pending_metadata_;  // side file -> JSON text
    std::set<std::string> obsolete_metadata_;              // side files to delete after commit
};

} // namespace vectrix

#endif // vectrix_INDEX_LOCAL_INDEX_HPP
