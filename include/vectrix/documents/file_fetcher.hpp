/*
 * vectrix C++17 - File Fetcher
 *
 * Feeds files to a document callback. A folder is walked recursively and
 * each file becomes one document whose type is its extension.
 */
#ifndef vectrix_DOCUMENTS_FILE_FETCHER_HPP
#define vectrix_DOCUMENTS_FILE_FETCHER_HPP

#include <vectrix/storage/file_storage.hpp>
#include <functional>
#include <memory>
#include <string>

namespace vectrix {

class FileFetcher {
public:
    // Return false to mark the document as failed. The walk continues.
    typedef std::function<bool(const std::string& uri,
                               const std::string& text,
                               const std::string& doc_type)> DocumentCallback;

    // `storage` defaults to a LocalFileStorage.
    explicit FileFetcher(std::shared_ptr<FileStorage> storage = nullptr);

    // `all_ok` is false when any callback returned false. A missing path
    // yields no documents. http(s) uris fail with VALIDATION.
    Status fetch(const std::string& uri, const DocumentCallback& on_document, bool& all_ok);

private:
    Status fetch_path(const std::string& path, const DocumentCallback& on_document, bool& all_ok);

    std::shared_ptr<FileStorage> storage_;
};

} // namespace vectrix

#endif // vectrix_DOCUMENTS_FILE_FETCHER_HPP
