/*
 * vectrix C++17 - File Storage
 *
 * Abstract storage an index folder lives on. Implementations:
 *   LocalFileStorage   - local filesystem
 *   VirtualFileStorage - in-memory entries
 *   SqliteFileStorage  - entries kept in a single SQLite database
 *
 * Every operation returns a Status; failures are ErrorKind::IO
 * (ErrorKind::NOT_FOUND when the path does not exist).
 */
#ifndef vectrix_STORAGE_FILE_STORAGE_HPP
#define vectrix_STORAGE_FILE_STORAGE_HPP

#include <vectrix/core/status.hpp>
#include <string>
#include <vector>

namespace vectrix {

enum class ListFilesFilter {
    FILES,
    FOLDERS,
    ALL
};

struct FileDetails {
    std::string name;
    std::string path;
    bool is_folder;
    std::string file_type;      // Extension-derived type, empty for folders and unknown types

    FileDetails() : is_folder(false) {}
};

class FileStorage {
public:
    virtual ~FileStorage() = default;

    // Fails if the file already exists.
    virtual Status create_file(const std::string& path, const std::string& content) = 0;

    // Creates any missing parent folders.
    virtual Status create_folder(const std::string& path) = 0;

    // No-op when the path does not exist.
    virtual Status delete_file(const std::string& path) = 0;

    // Recursive. No-op when the path does not exist.
    virtual Status delete_folder(const std::string& path) = 0;

    virtual Status get_details(const std::string& path, FileDetails& out) = 0;

    // Immediate children of `folder`.
    virtual Status list_files(const std::string& folder,
                              std::vector<FileDetails>& out,
                              ListFilesFilter filter = ListFilesFilter::ALL) = 0;

    virtual bool path_exists(const std::string& path) = 0;

    virtual Status read_file(const std::string& path, std::string& out) = 0;

    // Creates or replaces the file.
    virtual Status upsert_file(const std::string& path, const std::string& content) = 0;
};

} // namespace vectrix

#endif // vectrix_STORAGE_FILE_STORAGE_HPP
