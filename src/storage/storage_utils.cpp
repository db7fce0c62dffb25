#include <vectrix/storage/storage_utils.hpp>
#include <vectrix/core/logger.hpp>
#include <vectrix/core/utils.hpp>
#include <algorithm>
#include <map>

namespace vectrix {
namespace storage_utils {

namespace {

const char* const BINARY_EXTENSIONS[] = {
    // images
    "png", "jpg", "jpeg", "gif", "bmp", "tiff", "tif", "webp", "svg", "heic", "heif",
    // video
    "mp4", "avi", "mov", "wmv", "flv", "mkv", "webm", "mpg", "mpeg", "3gp",
    // audio
    "mp3", "wav", "flac", "m4a", "aac", "ogg", "wma", "aiff", "alac",
    // 3d models
    "obj", "fbx", "stl", "dae", "ply", "3ds", "gltf", "glb",
    // archives
    "zip", "tar", "gz", "7z", "rar", "tgz",
    // system
    "exe", "dll", "bin", "iso", "dmg", "msi", "deb", "rpm", "apk", "appimage", "rom", "efi",
    // databases
    "sqlite", "sql", "mdb", "accdb"
};

const char* const DOCUMENT_EXTENSIONS[] = {
    "pdf", "doc", "docx", "xls", "xlsx", "ppt", "pptx", "rtf", "tex"
};

const char* const PLAIN_TEXT_EXTENSIONS[] = {
    "txt", "csv", "log", "md", "rst",
    "js", "ts", "jsx", "tsx", "py", "java", "c", "cpp", "cs", "php", "go", "rb", "rs",
    "swift", "kt", "dart", "sh", "bash", "ps1", "bat", "cmd", "html", "css", "scss",
    "sass", "less", "xml", "json", "yaml", "yml", "ini", "conf", "cfg", "env"
};

template <size_t N>
bool contains(const char* const (&table)[N], const std::string& ext) {
    return std::find_if(table, table + N,
                        [&](const char* e) { return ext == e; }) != table + N;
}

} // anonymous namespace

Status ensure_folder_exists(FileStorage& storage, const std::string& folder) {
    if (storage.path_exists(folder)) {
        return Status::ok();
    }
    return storage.create_folder(folder);
}

bool is_plain_text_type(const std::string& file_type) {
    return contains(PLAIN_TEXT_EXTENSIONS, file_type);
}

std::string get_file_type(const std::string& path) {
    std::string ext = file_extension(path);
    if (ext.empty()) return "";
    if (contains(BINARY_EXTENSIONS, ext) || contains(DOCUMENT_EXTENSIONS, ext) ||
        contains(PLAIN_TEXT_EXTENSIONS, ext)) {
        return ext;
    }
    return "";
}

std::string get_file_type_from_content_type(const std::string& content_type) {
    static const std::map<std::string, std::string> content_types = {
        {"text/html", "html"},
        {"text/plain", "txt"},
        {"text/css", "css"},
        {"text/javascript", "js"},
        {"application/json", "json"},
        {"application/xml", "xml"},
        {"application/javascript", "js"},
        {"application/pdf", "pdf"},
        {"image/jpeg", "jpg"},
        {"image/png", "png"},
        {"image/gif", "gif"},
        {"image/svg+xml", "svg"},
        {"application/zip", "zip"},
        {"application/octet-stream", "bin"},
        {"audio/mpeg", "mp3"},
        {"video/mp4", "mp4"},
        {"video/webm", "webm"},
        {"text/csv", "csv"},
    };

    // Drop parameters such as "; charset=utf-8"
    std::string mime = content_type;
    size_t semi = mime.find(';');
    if (semi != std::string::npos) mime = mime.substr(0, semi);
    mime = to_lower(trim(mime));
    auto it = content_types.find(mime);
    if (it != content_types.end()) {
        return it->second;
    }

    std::vector<std::string> parts = split(mime, '/');
    if (parts.size() == 2) {
        std::string sub = parts[1];
        size_t plus = sub.find('+');
        if (plus != std::string::npos) sub = sub.substr(0, plus);
        return get_file_type("x." + sub);
    }
    return "";
}

Status try_delete_file(FileStorage& storage, const std::string& path) {
    Status s = storage.delete_file(path);
    if (!s.success) {
        LOG_WARN("[Storage] Could not delete %s: %s", path.c_str(), s.error.c_str());
    }
    return s;
}

} // namespace storage_utils
} // namespace vectrix
