/*
 * vectrix C++17 - Index Types
 *
 * In-memory shapes of index.json and the values the item store hands back.
 */
#ifndef vectrix_INDEX_TYPES_HPP
#define vectrix_INDEX_TYPES_HPP

#include <vectrix/core/json.hpp>
#include <vectrix/core/status.hpp>
#include <string>
#include <vector>

namespace vectrix {

struct MetadataConfig {
    // Fields kept inline for filtering. Empty means all metadata stays inline.
    std::vector<std::string> indexed;
};

// A stored vector. `metadata` is a JSON object of scalars. When the store has
// indexed fields, it holds only those and `metadata_file` names the side file
// with the full metadata.
struct IndexItem {
    std::string id;
    std::vector<float> vector;
    double norm;
    Json metadata;
    std::string metadata_file;

    IndexItem() : norm(0.0), metadata(Json::object()) {}
};

struct IndexData {
    int version;
    MetadataConfig metadata_config;
    std::vector<IndexItem> items;

    IndexData() : version(1) {}
};

struct CreateIndexConfig {
    int version;
    bool delete_if_exists;
    MetadataConfig metadata_config;

    CreateIndexConfig() : version(1), delete_if_exists(false) {}
};

struct IndexStats {
    int version;
    MetadataConfig metadata_config;
    size_t items;

    IndexStats() : version(1), items(0) {}
};

struct QueryResult {
    IndexItem item;
    double score;

    QueryResult() : score(0.0) {}
    QueryResult(const IndexItem& i, double s) : item(i), score(s) {}

    // True for hits appended by the keyword pass. A non-boolean isBm25 counts as false.
    bool is_bm25() const {
        const Json& m = item.metadata;
        if (!m.is_object()) return false;
        auto it = m.find("isBm25");
        return it != m.end() && it->is_boolean() && it->get<bool>();
    }
};

// ============================================================================
// JSON mapping (index.json)
// ============================================================================

Json metadata_config_to_json(const MetadataConfig& config);
Json index_item_to_json(const IndexItem& item);
Json index_data_to_json(const IndexData& data);

// PARSE on a missing or mistyped field.
Status parse_metadata_config(const Json& j, MetadataConfig& out);
Status parse_index_item(const Json& j, IndexItem& out);
Status parse_index_data(const Json& j, IndexData& out);

} // namespace vectrix

#endif // vectrix_INDEX_TYPES_HPP
