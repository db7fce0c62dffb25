#include <vectrix/documents/file_fetcher.hpp>
#include <vectrix/storage/local_file_storage.hpp>
#include <vectrix/core/logger.hpp>
#include <vectrix/core/utils.hpp>
#include <vector>

namespace vectrix {

FileFetcher::FileFetcher(std::shared_ptr<FileStorage> storage)
    : storage_(storage ? storage : std::make_shared<LocalFileStorage>())
{}

Status FileFetcher::fetch(const std::string& uri, const DocumentCallback& on_document, bool& all_ok) {
    all_ok = true;
    std::string lower = to_lower(uri);
    if (starts_with(lower, "http://") || starts_with(lower, "https://")) {
        return Status::fail(ErrorKind::VALIDATION, "Web pages are not supported: " + uri);
    }
    return fetch_path(uri, on_document, all_ok);
}

Status FileFetcher::fetch_path(const std::string& path, const DocumentCallback& on_document, bool& all_ok) {
    FileDetails details;
    Status s = storage_->get_details(path, details);
    if (!s.success) {
        if (s.kind == ErrorKind::NOT_FOUND) {
            LOG_WARN("[FileFetcher] Skipping missing path %s", path.c_str());
            return Status::ok();
        }
        return s;
    }

    if (details.is_folder) {
        std::vector<FileDetails> entries;
        s = storage_->list_files(path, entries);
        if (!s.success) return s.wrap("Error listing " + path);

        for (const auto& entry : entries) {
            s = fetch_path(entry.path, on_document, all_ok);
            if (!s.success) return s;
        }
        return Status::ok();
    }

    std::string text;
    s = storage_->read_file(path, text);
    if (!s.success) return s.wrap("Error reading " + path);

    std::string doc_type = file_extension(path);
    if (doc_type.empty()) {
        doc_type = to_lower(base_name(path));
    }

    LOG_DEBUG("[FileFetcher] %s (%zu bytes, type %s)", path.c_str(), text.size(), doc_type.c_str());
    if (!on_document(path, text, doc_type)) {
        all_ok = false;
    }
    return Status::ok();
}

} // namespace vectrix
