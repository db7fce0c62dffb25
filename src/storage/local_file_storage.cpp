#include <vectrix/storage/local_file_storage.hpp>
#include <vectrix/storage/storage_utils.hpp>
#include <vectrix/core/logger.hpp>
#include <vectrix/core/utils.hpp>
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>
#include <dirent.h>
#include <sys/stat.h>
#include <unistd.h>

namespace vectrix {

static Status errno_failure(const std::string& what, const std::string& path) {
    int err = errno;
    ErrorKind kind = (err == ENOENT) ? ErrorKind::NOT_FOUND : ErrorKind::IO;
    return Status::fail(kind, what + " '" + path + "': " + strerror(err));
}

LocalFileStorage::LocalFileStorage() {}

LocalFileStorage::LocalFileStorage(const std::string& root_folder)
    : root_folder_(root_folder) {}

std::string LocalFileStorage::full_path(const std::string& path) const {
    if (root_folder_.empty()) {
        return path.empty() ? "." : path;
    }
    if (path.empty()) {
        return root_folder_;
    }
    return join_path(root_folder_, path);
}

Status LocalFileStorage::create_file(const std::string& path, const std::string& content) {
    std::string full = full_path(path);

    // "x" makes fopen fail when the file exists
    FILE* f = fopen(full.c_str(), "wbx");
    if (!f) {
        if (errno == EEXIST) {
            return Status::fail(ErrorKind::IO, "File already exists: " + path);
        }
        return errno_failure("Cannot create file", path);
    }
    size_t written = content.empty() ? 0 : fwrite(content.data(), 1, content.size(), f);
    bool closed = fclose(f) == 0;
    if (written != content.size() || !closed) {
        return Status::fail(ErrorKind::IO, "Failed writing file: " + path);
    }
    return Status::ok();
}

Status LocalFileStorage::create_folder(const std::string& path) {
    if (!create_directories(full_path(path))) {
        return errno_failure("Cannot create folder", path);
    }
    return Status::ok();
}

Status LocalFileStorage::delete_file(const std::string& path) {
    std::string full = full_path(path);
    struct stat st;
    if (stat(full.c_str(), &st) != 0) {
        return Status::ok();
    }
    if (S_ISDIR(st.st_mode)) {
        return Status::fail(ErrorKind::IO, "Cannot delete file: " + path + " is a folder");
    }
    if (unlink(full.c_str()) != 0 && errno != ENOENT) {
        return errno_failure("Cannot delete file", path);
    }
    return Status::ok();
}

Status LocalFileStorage::remove_tree(const std::string& full) {
    DIR* dir = opendir(full.c_str());
    if (!dir) {
        return errno_failure("Cannot open folder", full);
    }

    Status result;
    struct dirent* entry;
    while ((entry = readdir(dir)) != nullptr) {
        std::string name = entry->d_name;
        if (name == "." || name == "..") continue;

        std::string child = full + "/" + name;
        struct stat st;
        if (lstat(child.c_str(), &st) != 0) continue;

        if (S_ISDIR(st.st_mode)) {
            result = remove_tree(child);
        } else if (unlink(child.c_str()) != 0) {
            result = errno_failure("Cannot delete file", child);
        }
        if (!result.success) break;
    }
    closedir(dir);

    if (!result.success) return result;
    if (rmdir(full.c_str()) != 0) {
        return errno_failure("Cannot delete folder", full);
    }
    return Status::ok();
}

Status LocalFileStorage::delete_folder(const std::string& path) {
    std::string full = full_path(path);
    struct stat st;
    if (stat(full.c_str(), &st) != 0) {
        return Status::ok();
    }
    if (!S_ISDIR(st.st_mode)) {
        return Status::fail(ErrorKind::IO, "Cannot delete folder: " + path + " is a file");
    }
    Status s = remove_tree(full);
    if (!s.success) {
        LOG_ERROR("[LocalFileStorage] delete_folder failed: %s", s.error.c_str());
    }
    return s;
}

Status LocalFileStorage::get_details(const std::string& path, FileDetails& out) {
    struct stat st;
    if (stat(full_path(path).c_str(), &st) != 0) {
        return errno_failure("Path not found", path);
    }
    out = FileDetails();
    out.name = base_name(path);
    out.path = path;
    out.is_folder = S_ISDIR(st.st_mode);
    if (!out.is_folder) {
        out.file_type = storage_utils::get_file_type(path);
    }
    return Status::ok();
}

Status LocalFileStorage::list_files(const std::string& folder,
                                    std::vector<FileDetails>& out,
                                    ListFilesFilter filter) {
    out.clear();
    std::string full = full_path(folder);
    DIR* dir = opendir(full.c_str());
    if (!dir) {
        return errno_failure("Cannot list folder", folder);
    }

    struct dirent* entry;
    while ((entry = readdir(dir)) != nullptr) {
        std::string name = entry->d_name;
        if (name == "." || name == "..") continue;

        struct stat st;
        if (stat((full + "/" + name).c_str(), &st) != 0) continue;
        bool is_folder = S_ISDIR(st.st_mode);

        if ((filter == ListFilesFilter::FILES && is_folder) ||
            (filter == ListFilesFilter::FOLDERS && !is_folder)) {
            continue;
        }

        FileDetails details;
        details.name = name;
        details.path = join_path(folder, name);
        details.is_folder = is_folder;
        if (!is_folder) {
            details.file_type = storage_utils::get_file_type(name);
        }
        out.push_back(details);
    }
    closedir(dir);

    std::sort(out.begin(), out.end(),
              [](const FileDetails& a, const FileDetails& b) { return a.name < b.name; });
    return Status::ok();
}

bool LocalFileStorage::path_exists(const std::string& path) {
    return access(full_path(path).c_str(), F_OK) == 0;
}

Status LocalFileStorage::read_file(const std::string& path, std::string& out) {
    std::string full = full_path(path);
    struct stat st;
    if (stat(full.c_str(), &st) != 0) {
        return errno_failure("File not found", path);
    }
    if (S_ISDIR(st.st_mode)) {
        return Status::fail(ErrorKind::IO, "Cannot read file: " + path + " is a folder");
    }

    std::ifstream file(full, std::ios::binary);
    if (!file.is_open()) {
        return Status::fail(ErrorKind::IO, "Cannot open file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return Status::fail(ErrorKind::IO, "Failed reading file: " + path);
    }
    out = buffer.str();
    return Status::ok();
}

Status LocalFileStorage::upsert_file(const std::string& path, const std::string& content) {
    std::string full = full_path(path);
    std::ofstream file(full, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return errno_failure("Cannot write file", path);
    }
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.close();
    if (file.fail()) {
        return Status::fail(ErrorKind::IO, "Failed writing file: " + path);
    }
    return Status::ok();
}

} // namespace vectrix
