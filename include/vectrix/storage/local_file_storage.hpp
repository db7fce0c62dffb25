#ifndef vectrix_STORAGE_LOCAL_FILE_STORAGE_HPP
#define vectrix_STORAGE_LOCAL_FILE_STORAGE_HPP

#include <vectrix/storage/file_storage.hpp>

namespace vectrix {

// FileStorage over the local filesystem. Relative paths resolve against
// `root_folder` when one is given, otherwise against the working directory.
class LocalFileStorage : public FileStorage {
public:
    LocalFileStorage();
    explicit LocalFileStorage(const std::string& root_folder);

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
    std::string full_path(const std::string& path) const;
    Status remove_tree(const std::string& full);

    std::string root_folder_;
};

} // namespace vectrix

#endif // vectrix_STORAGE_LOCAL_FILE_STORAGE_HPP
