/*
 * vectrix C++17 - SQLite File Storage
 *
 * Keeps a whole index folder tree inside one SQLite database file.
 * Each file or folder is a row keyed by its normalized path.
 */
#ifndef vectrix_STORAGE_SQLITE_FILE_STORAGE_HPP
#define vectrix_STORAGE_SQLITE_FILE_STORAGE_HPP

#include <vectrix/storage/file_storage.hpp>
#include <sqlite3.h>
#include <cstdint>

namespace vectrix {

class SqliteFileStorage : public FileStorage {
public:
    SqliteFileStorage();
    ~SqliteFileStorage();

    // ":memory:" opens a private in-memory database.
    Status open(const std::string& db_path);
    void close();
    bool is_open() const { return db_ != nullptr; }

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
    SqliteFileStorage(const SqliteFileStorage&);
    SqliteFileStorage& operator=(const SqliteFileStorage&);

    bool exec_sql(const std::string& sql);
    bool init_tables();
    Status require_open() const;
    Status db_failure(const char* op) const;

    // exists/is_folder of a normalized key
    Status lookup(const std::string& key, bool& exists, bool& is_folder);
    Status write_file_row(const std::string& key, const std::string& content, bool replace);

    static std::string key_for(const std::string& path);
    static int64_t now_ms();

    sqlite3* db_;
};

} // namespace vectrix

#endif // vectrix_STORAGE_SQLITE_FILE_STORAGE_HPP
