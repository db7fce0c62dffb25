#ifndef vectrix_STORAGE_STORAGE_UTILS_HPP
#define vectrix_STORAGE_STORAGE_UTILS_HPP

#include <vectrix/storage/file_storage.hpp>
#include <string>

namespace vectrix {
namespace storage_utils {

Status ensure_folder_exists(FileStorage& storage, const std::string& folder);

// Known file type for the path's extension, or "" when unknown.
std::string get_file_type(const std::string& path);

// Map a MIME content type ("text/html; charset=utf-8") to a file type, or "".
std::string get_file_type_from_content_type(const std::string& content_type);

bool is_plain_text_type(const std::string& file_type);

// Deletes the file and reports the failure instead of propagating it.
Status try_delete_file(FileStorage& storage, const std::string& path);

} // namespace storage_utils
} // namespace vectrix

#endif // vectrix_STORAGE_STORAGE_UTILS_HPP
