#include <vectrix/storage/virtual_file_storage.hpp>
#include <vectrix/storage/storage_utils.hpp>
#include <vectrix/core/utils.hpp>

namespace vectrix {

std::string VirtualFileStorage::key_for(const std::string& path) {
    std::string key = normalize_path(path);
    return key == "." ? "" : key;
}

FileDetails VirtualFileStorage::make_details(const std::string& key, bool is_folder) {
    FileDetails details;
    details.name = base_name(key);
    details.path = key;
    details.is_folder = is_folder;
    if (!is_folder) {
        details.file_type = storage_utils::get_file_type(key);
    }
    return details;
}

Status VirtualFileStorage::create_file(const std::string& path, const std::string& content) {
    std::string key = key_for(path);
    if (entries_.count(key)) {
        return Status::fail(ErrorKind::IO, "File already exists: " + key);
    }
    StoredEntry entry;
    entry.details = make_details(key, false);
    entry.content = content;
    entries_[key] = entry;
    return Status::ok();
}

Status VirtualFileStorage::create_folder(const std::string& path) {
    std::string key = key_for(path);
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        if (!it->second.details.is_folder) {
            return Status::fail(ErrorKind::IO, "Cannot create folder: " + key + " is a file");
        }
        return Status::ok();
    }

    // Register missing parents so listings see them
    std::string parent = parent_path(key);
    if (!parent.empty() && parent != "/" && !entries_.count(parent)) {
        Status s = create_folder(parent);
        if (!s.success) return s;
    }

    StoredEntry entry;
    entry.details = make_details(key, true);
    entries_[key] = entry;
    return Status::ok();
}

Status VirtualFileStorage::delete_file(const std::string& path) {
    std::string key = key_for(path);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return Status::ok();
    }
    if (it->second.details.is_folder) {
        return Status::fail(ErrorKind::IO, "Cannot delete file: " + key + " is a folder");
    }
    entries_.erase(it);
    return Status::ok();
}

Status VirtualFileStorage::delete_folder(const std::string& path) {
    std::string key = key_for(path);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return Status::ok();
    }
    if (!it->second.details.is_folder) {
        return Status::fail(ErrorKind::IO, "Cannot delete folder: " + key + " is a file");
    }

    std::string prefix = key.empty() ? "" : key + "/";
    for (auto e = entries_.begin(); e != entries_.end();) {
        if (e->first == key || starts_with(e->first, prefix)) {
            e = entries_.erase(e);
        } else {
            ++e;
        }
    }
    return Status::ok();
}

Status VirtualFileStorage::get_details(const std::string& path, FileDetails& out) {
    std::string key = key_for(path);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return Status::fail(ErrorKind::NOT_FOUND, "Path not found: " + key);
    }
    out = it->second.details;
    return Status::ok();
}

Status VirtualFileStorage::list_files(const std::string& folder,
                                      std::vector<FileDetails>& out,
                                      ListFilesFilter filter) {
    out.clear();
    std::string base = key_for(folder);
    if (!base.empty() && base != "/") {
        auto it = entries_.find(base);
        if (it == entries_.end()) {
            return Status::fail(ErrorKind::NOT_FOUND, "Folder not found: " + base);
        }
        if (!it->second.details.is_folder) {
            return Status::fail(ErrorKind::IO, "Cannot list files: " + base + " is a file");
        }
    }

    for (const auto& kv : entries_) {
        const FileDetails& details = kv.second.details;
        if ((filter == ListFilesFilter::FILES && details.is_folder) ||
            (filter == ListFilesFilter::FOLDERS && !details.is_folder)) {
            continue;
        }
        if (kv.first == base) continue;
        if (parent_path(kv.first) == base) {
            out.push_back(details);
        }
    }
    return Status::ok();
}

bool VirtualFileStorage::path_exists(const std::string& path) {
    return entries_.count(key_for(path)) > 0;
}

Status VirtualFileStorage::read_file(const std::string& path, std::string& out) {
    std::string key = key_for(path);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return Status::fail(ErrorKind::NOT_FOUND, "File not found: " + key);
    }
    if (it->second.details.is_folder) {
        return Status::fail(ErrorKind::IO, "Cannot read file: " + key + " is a folder");
    }
    out = it->second.content;
    return Status::ok();
}

Status VirtualFileStorage::upsert_file(const std::string& path, const std::string& content) {
    std::string key = key_for(path);
    auto it = entries_.find(key);
    if (it != entries_.end() && it->second.details.is_folder) {
        return Status::fail(ErrorKind::IO, "Cannot write file: " + key + " is a folder");
    }
    StoredEntry entry;
    entry.details = make_details(key, false);
    entry.content = content;
    entries_[key] = entry;
    return Status::ok();
}

} // namespace vectrix
