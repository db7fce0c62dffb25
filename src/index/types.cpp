#include <vectrix/index/types.hpp>

namespace vectrix {

Json metadata_config_to_json(const MetadataConfig& config) {
    Json j = Json::object();
    if (!config.indexed.empty()) {
        j["indexed"] = config.indexed;
    }
    return j;
}

Json index_item_to_json(const IndexItem& item) {
    Json j;
    j["id"] = item.id;
    j["metadata"] = item.metadata.is_object() ? item.metadata : Json::object();
    j["vector"] = item.vector;
    j["norm"] = item.norm;
    if (!item.metadata_file.empty()) {
        j["metadataFile"] = item.metadata_file;
    }
    return j;
}

Json index_data_to_json(const IndexData& data) {
    Json items = Json::array();
    for (const auto& item : data.items) {
        items.push_back(index_item_to_json(item));
    }

    Json j;
    j["version"] = data.version;
    j["metadata_config"] = metadata_config_to_json(data.metadata_config);
    j["items"] = std::move(items);
    return j;
}

Status parse_metadata_config(const Json& j, MetadataConfig& out) {
    out = MetadataConfig();
    if (j.is_null()) {
        return Status::ok();
    }
    if (!j.is_object()) {
        return Status::fail(ErrorKind::PARSE, "metadata_config must be an object");
    }
    if (j.contains("indexed") && !j["indexed"].is_null()) {
        if (!j["indexed"].is_array()) {
            return Status::fail(ErrorKind::PARSE, "metadata_config.indexed must be an array");
        }
        for (const auto& field : j["indexed"]) {
            if (!field.is_string()) {
                return Status::fail(ErrorKind::PARSE, "metadata_config.indexed entries must be strings");
            }
            out.indexed.push_back(field.get<std::string>());
        }
    }
    return Status::ok();
}

Status parse_index_item(const Json& j, IndexItem& out) {
    out = IndexItem();
    if (!j.is_object()) {
        return Status::fail(ErrorKind::PARSE, "item must be an object");
    }
    if (!j.contains("id") || !j["id"].is_string()) {
        return Status::fail(ErrorKind::PARSE, "item is missing a string id");
    }
    out.id = j["id"].get<std::string>();

    if (!j.contains("vector") || !j["vector"].is_array()) {
        return Status::fail(ErrorKind::PARSE, "item " + out.id + " is missing its vector");
    }
    out.vector.reserve(j["vector"].size());
    for (const auto& v : j["vector"]) {
        if (!v.is_number()) {
            return Status::fail(ErrorKind::PARSE, "item " + out.id + " has a non-numeric vector entry");
        }
        out.vector.push_back(v.get<float>());
    }

    if (j.contains("norm") && j["norm"].is_number()) {
        out.norm = j["norm"].get<double>();
    }
    if (j.contains("metadata") && j["metadata"].is_object()) {
        out.metadata = j["metadata"];
    }
    if (j.contains("metadataFile") && j["metadataFile"].is_string()) {
        out.metadata_file = j["metadataFile"].get<std::string>();
    }
    return Status::ok();
}

Status parse_index_data(const Json& j, IndexData& out) {
    out = IndexData();
    if (!j.is_object()) {
        return Status::fail(ErrorKind::PARSE, "index root must be an object");
    }
    if (j.contains("version") && j["version"].is_number_integer()) {
        out.version = j["version"].get<int>();
    }

    Status s = parse_metadata_config(j.contains("metadata_config") ? j["metadata_config"] : Json(),
                                     out.metadata_config);
    if (!s.success) return s;

    if (j.contains("items")) {
        if (!j["items"].is_array()) {
            return Status::fail(ErrorKind::PARSE, "items must be an array");
        }
        out.items.reserve(j["items"].size());
        for (const auto& entry : j["items"]) {
            IndexItem item;
            s = parse_index_item(entry, item);
            if (!s.success) return s;
            out.items.push_back(std::move(item));
        }
    }
    return Status::ok();
}

} // namespace vectrix
