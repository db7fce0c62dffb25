#ifndef vectrix_STORAGE_VIRTUAL_FILE_STORAGE_HPP
#define vectrix_STORAGE_VIRTUAL_FILE_STORAGE_HPP

#include <vectrix/storage/file_storage.hpp>
#include <map>

namespace vectrix {

// In-memory FileStorage. Paths are normalized before use; nothing
// survives the instance.
class VirtualFileStorage : public FileStorage {
public:
    Status create_file(const std::string& path, const std::string& content) override;
    Status create_folder(const std::string& path) override;
    Status delete_file(const std::string& path) override;
    Status delete_folder(const std::string& path) override;
    Status get_details(const std::string& path, FileDetails& out) override;
    Status list_files(const std::string& folder,
                      std::vector<FileDetails>& out,
                      ListFilesFilter filter = ListFilesFilter::ALL) override;
    bool path_exists(const std::string& path) override;
    Status read_file(const std::string& path, std::string& out) override;
    Status upsert_file(const std::string& path, const std::string& content) override;

private:
    struct StoredEntry {
        FileDetails details;
        std::string content;
    };

    static std::string key_for(const std::string& path);
    static FileDetails make_details(const std::string& key, bool is_folder);

    std::map<std::string, StoredEntry> entries_;
};

} // namespace vectrix

#endif // vectrix_STORAGE_VIRTUAL_FILE_STORAGE_HPP
