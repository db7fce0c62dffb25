/*
 * vectrix C++17 - Local Document
 *
 * Handle on one catalogued document. Text and metadata are read from the
 * index folder on first use and cached.
 */
#ifndef vectrix_DOCUMENTS_LOCAL_DOCUMENT_HPP
#define vectrix_DOCUMENTS_LOCAL_DOCUMENT_HPP

#include <vectrix/core/json.hpp>
#include <vectrix/core/status.hpp>
#include <string>

namespace vectrix {

class LocalDocumentIndex;

class LocalDocument {
public:
    // Texts up to this many bytes are tokenized for get_length.
    static const size_t EXACT_LENGTH_LIMIT = 40000;

    // `index` is not owned and must outlive the document.
    LocalDocument(LocalDocumentIndex* index, const std::string& id, const std::string& uri);
    virtual ~LocalDocument();

    const std::string& id() const { return id_; }
    const std::string& uri() const { return uri_; }
    std::string folder_path() const;

    // Token count, estimated as bytes / 4 for long texts.
    Status get_length(size_t& out);

    bool has_metadata();
    Status load_metadata(Json& out);
    Status load_text(std::string& out);

protected:
    LocalDocumentIndex* index_;

private:
    std::string id_;
    std::string uri_;
    bool text_loaded_;
    std::string text_;
    bool metadata_loaded_;
    Json metadata_;
};

} // namespace vectrix

#endif // vectrix_DOCUMENTS_LOCAL_DOCUMENT_HPP
