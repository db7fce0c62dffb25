#include <vectrix/documents/local_document.hpp>
#include <vectrix/documents/local_document_index.hpp>
#include <vectrix/core/logger.hpp>
#include <vectrix/core/utils.hpp>

namespace vectrix {

LocalDocument::LocalDocument(LocalDocumentIndex* index, const std::string& id, const std::string& uri)
    : index_(index)
    , id_(id)
    , uri_(uri)
    , text_loaded_(false)
    , metadata_loaded_(false)
{}

LocalDocument::~LocalDocument() {}

std::string LocalDocument::folder_path() const {
    return index_->folder_path();
}

Status LocalDocument::get_length(size_t& out) {
    std::string text;
    Status s = load_text(text);
    if (!s.success) return s;

    if (text.size() <= EXACT_LENGTH_LIMIT) {
        out = index_->tokenizer()->encode(text).size();
    } else {
        out = (text.size() + 3) / 4;
    }
    return Status::ok();
}

bool LocalDocument::has_metadata() {
    return index_->storage().path_exists(join_path(folder_path(), id_ + ".json"));
}

Status LocalDocument::load_metadata(Json& out) {
    if (!metadata_loaded_) {
        std::string json;
        Status s = index_->storage().read_file(join_path(folder_path(), id_ + ".json"), json);
        if (!s.success) {
            return s.wrap("Error reading metadata for document \"" + uri_ + "\"");
        }

        try {
            metadata_ = Json::parse(json);
        } catch (const std::exception& e) {
            LOG_ERROR("[Document] Bad metadata for %s: %s", uri_.c_str(), e.what());
            return Status::fail(ErrorKind::PARSE, "Error parsing metadata for document \"" +
                                uri_ + "\": " + e.what());
        }
        metadata_loaded_ = true;
    }

    out = metadata_;
    return Status::ok();
}

Status LocalDocument::load_text(std::string& out) {
    if (!text_loaded_) {
        Status s = index_->storage().read_file(join_path(folder_path(), id_ + ".txt"), text_);
        if (!s.success) {
            text_.clear();
            return s.wrap("Error reading text file for document \"" + uri_ + "\"");
        }
        text_loaded_ = true;
    }

    out = text_;
    return Status::ok();
}

} // namespace vectrix
