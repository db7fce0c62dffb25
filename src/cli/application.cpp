/*
 * vectrix C++17 - Application Implementation
 */
#include <vectrix/cli/application.hpp>
#include <vectrix/documents/local_document_index.hpp>
#include <vectrix/documents/file_fetcher.hpp>
#include <vectrix/embeddings/openai_embeddings.hpp>
#include <vectrix/storage/local_file_storage.hpp>
#include <vectrix/storage/sqlite_file_storage.hpp>
#include <vectrix/core/logger.hpp>
#include <vectrix/core/utils.hpp>

#include <iostream>
#include <cstdlib>
#include <cstring>
#include <cerrno>
#include <curl/curl.h>

namespace vectrix {

// ============================================================================
// Utility Functions
// ============================================================================

void print_usage(const char* prog) {
    std::cout << AppInfo::NAME << " - local vector database\n\n"
              << "Usage: " << prog << " <command> <index> [options]\n\n"
              << "Commands:\n"
              << "  create <index>            Create a new local index\n"
              << "  delete <index>            Delete an existing local index\n"
              << "  add <index>               Add files or folders to an index\n"
              << "  remove <index>            Remove documents from an index\n"
              << "  stats <index>             Print the stats for an index\n"
              << "  query <index> <query>     Query an index\n\n"
              << "Options:\n"
              << "  -k, --keys <file>         JSON file with the embeddings model keys\n"
              << "  -u, --uri <path>          Document to add or remove (repeatable)\n"
              << "  -l, --list <file>         File listing documents, one per line\n"
              << "  --chunk-size <n>          Chunk size in tokens (default 512)\n"
              << "  --document-count <n>      Max documents to return (default 10)\n"
              << "  --chunk-count <n>         Max chunks to return (default 50)\n"
              << "  --section-count <n>       Max sections to render (default 1)\n"
              << "  --tokens <n>              Max tokens per section (default 2000)\n"
              << "  -f, --format <fmt>        sections, stats or chunks (default sections)\n"
              << "  --overlap, --no-overlap   Pad sections with surrounding text (default on)\n"
              << "  -b, --bm25                Add keyword (BM25) matches to the results\n"
              << "  --config <file>           Settings file (log_level, chunking, storage)\n"
              << "  --log-level <level>       debug, info, warn, error or off\n"
              << "  -h, --help                Show this help message\n"
              << "  -v, --version             Show version\n\n"
              << "Example:\n"
              << "  " << prog << " add ./docs-index --keys keys.json --uri ./README.md\n";
}

void print_version() {
    std::cout << AppInfo::NAME << " v" << AppInfo::VERSION << "\n";
}

namespace {

bool parse_count(const char* text, long min_value, long& out) {
    errno = 0;
    char* end = nullptr;
    long value = strtol(text, &end, 10);
    if (errno != 0 || end == text || *end != '\0' || value < min_value) {
        return false;
    }
    out = value;
    return true;
}

} // anonymous namespace

// ============================================================================
// Argument parsing
// ============================================================================

Application::Application() {}

bool Application::parse_args(int argc, char* argv[], int& exit_code) {
    exit_code = 0;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        bool has_value = i + 1 < argc;

        if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            print_usage(argv[0]);
            return false;
        }
        if (strcmp(arg, "-v") == 0 || strcmp(arg, "--version") == 0) {
            print_version();
            return false;
        }
        if (strcmp(arg, "--overlap") == 0 || strcmp(arg, "-o") == 0) {
            options_.overlap = true;
            continue;
        }
        if (strcmp(arg, "--no-overlap") == 0) {
            options_.overlap = false;
            continue;
        }
        if (strcmp(arg, "--bm25") == 0 || strcmp(arg, "-b") == 0) {
            options_.bm25 = true;
            continue;
        }

        if (arg[0] == '-') {
            if (!has_value) {
                std::cerr << "Missing value for " << arg << "\n";
                exit_code = 2;
                return false;
            }
            const char* value = argv[++i];
            long number = 0;

            if (strcmp(arg, "--keys") == 0 || strcmp(arg, "-k") == 0) {
                options_.keys_file = value;
            } else if (strcmp(arg, "--uri") == 0 || strcmp(arg, "-u") == 0) {
                options_.uris.push_back(value);
            } else if (strcmp(arg, "--list") == 0 || strcmp(arg, "-l") == 0) {
                options_.list_file = value;
            } else if (strcmp(arg, "--config") == 0) {
                options_.config_file = value;
            } else if (strcmp(arg, "--log-level") == 0) {
                options_.log_level = value;
            } else if (strcmp(arg, "--format") == 0 || strcmp(arg, "-f") == 0) {
                options_.format = value;
                if (options_.format != "sections" && options_.format != "stats" &&
                    options_.format != "chunks") {
                    std::cerr << "Unknown format: " << value << "\n";
                    exit_code = 2;
                    return false;
                }
            } else if (strcmp(arg, "--chunk-size") == 0 && parse_count(value, 1, number)) {
                options_.chunk_size = static_cast<int>(number);
            } else if (strcmp(arg, "--document-count") == 0 && parse_count(value, 1, number)) {
                options_.document_count = static_cast<size_t>(number);
            } else if (strcmp(arg, "--chunk-count") == 0 && parse_count(value, 1, number)) {
                options_.chunk_count = static_cast<size_t>(number);
            } else if (strcmp(arg, "--section-count") == 0 && parse_count(value, 1, number)) {
                options_.section_count = static_cast<size_t>(number);
            } else if (strcmp(arg, "--tokens") == 0 && parse_count(value, 1, number)) {
                options_.tokens = static_cast<size_t>(number);
            } else {
                std::cerr << "Invalid option: " << arg << " " << value << "\n";
                exit_code = 2;
                return false;
            }
            continue;
        }

        positional.push_back(arg);
    }

    if (positional.size() < 2) {
        print_usage(argv[0]);
        exit_code = 2;
        return false;
    }

    options_.command = positional[0];
    options_.index = positional[1];
    if (options_.command == "query") {
        if (positional.size() < 3) {
            std::cerr << "query needs a query string\n";
            exit_code = 2;
            return false;
        }
        options_.query = positional[2];
    }
    return true;
}

// ============================================================================
// Setup
// ============================================================================

Status Application::setup_config() {
    if (options_.config_file.empty()) {
        return Status::ok();
    }
    Status s = config_.load_file(options_.config_file);
    if (!s.success) {
        return s.wrap("Error loading config " + options_.config_file);
    }
    return Status::ok();
}

void Application::setup_logging() {
    std::string level = options_.log_level.empty()
        ? config_.get_string("log_level", "warn")
        : options_.log_level;
    Logger::instance().set_level(parse_log_level(level, LogLevel::WARN));
}

Status Application::open_storage(std::shared_ptr<FileStorage>& out) {
    std::string backend = config_.get_string("storage.backend", "local");
    if (backend == "local") {
        out = std::make_shared<LocalFileStorage>();
        return Status::ok();
    }
    if (backend == "sqlite") {
        std::string path = config_.get_string("storage.sqlite_path", "vectrix.db");
        std::shared_ptr<SqliteFileStorage> storage = std::make_shared<SqliteFileStorage>();
        Status s = storage->open(path);
        if (!s.success) return s;
        LOG_INFO("[CLI] Using SQLite storage at %s", path.c_str());
        out = storage;
        return Status::ok();
    }
    return Status::fail(ErrorKind::VALIDATION, "Unknown storage backend: " + backend);
}

Status Application::load_embeddings(std::shared_ptr<EmbeddingsModel>& out) {
    if (options_.keys_file.empty()) {
        return Status::fail(ErrorKind::VALIDATION, "--keys is required for " + options_.command);
    }

    Config keys;
    Status s = keys.load_file(options_.keys_file);
    if (!s.success) return s.wrap("Error loading keys " + options_.keys_file);

    OpenAIEmbeddingsOptions opts = OpenAIEmbeddingsOptions::from_config(keys);
    if (!opts.api_key.empty() && opts.model.empty()) {
        opts.model = "text-embedding-ada-002";
        opts.max_tokens = 8000;
    }
    out = std::make_shared<OpenAIEmbeddings>(opts);
    return Status::ok();
}

Status Application::load_uri_list(std::vector<std::string>& out) {
    out = options_.uris;
    if (!options_.list_file.empty()) {
        LocalFileStorage files;
        std::string text;
        Status s = files.read_file(options_.list_file, text);
        if (!s.success) return s.wrap("Error reading list " + options_.list_file);

        for (const auto& line : split(text, '\n')) {
            std::string uri = trim(line);
            if (!uri.empty()) out.push_back(uri);
        }
    }
    if (out.empty()) {
        return Status::fail(ErrorKind::VALIDATION,
                            "specify one or more \"--uri <path>\" or a \"--list <file>\"");
    }
    return Status::ok();
}

Status Application::make_index(bool with_embeddings, std::unique_ptr<LocalDocumentIndex>& out) {
    LocalDocumentIndexConfig config;
    config.folder_path = options_.index;

    Status s = open_storage(config.storage);
    if (!s.success) return s;

    if (with_embeddings) {
        s = load_embeddings(config.embeddings);
        if (!s.success) return s;
    }

    // --chunk-size wins over the settings file
    config.chunking.chunk_size = options_.chunk_size > 0
        ? options_.chunk_size
        : static_cast<int>(config_.get_int("chunking.chunk_size", 512));
    config.chunking.chunk_overlap = static_cast<int>(config_.get_int("chunking.chunk_overlap", 0));
    config.chunking.keep_separators = config_.get_bool("chunking.keep_separators", true);

    out.reset(new LocalDocumentIndex(config));
    return Status::ok();
}

// ============================================================================
// Commands
// ============================================================================

Status Application::cmd_create() {
    std::unique_ptr<LocalDocumentIndex> index;
    Status s = make_index(false, index);
    if (!s.success) return s;

    std::cout << "creating index at " << options_.index << "\n";
    CreateIndexConfig config;
    config.delete_if_exists = true;
    config.metadata_config.indexed = config_.get_string_array("index.indexed");
    return index->create_index(config);
}

Status Application::cmd_delete() {
    std::unique_ptr<LocalDocumentIndex> index;
    Status s = make_index(false, index);
    if (!s.success) return s;

    std::cout << "deleting index at " << options_.index << "\n";
    return index->delete_index();
}

Status Application::cmd_add() {
    std::unique_ptr<LocalDocumentIndex> index;
    Status s = make_index(true, index);
    if (!s.success) return s;

    std::vector<std::string> uris;
    s = load_uri_list(uris);
    if (!s.success) return s;

    FileFetcher fetcher;
    size_t failures = 0;
    for (const auto& uri : uris) {
        std::cout << "fetching " << uri << "\n";
        bool all_ok = true;
        s = fetcher.fetch(uri, [&](const std::string& doc_uri,
                                   const std::string& text,
                                   const std::string& doc_type) {
            Status added = index->upsert_document(doc_uri, text, doc_type);
            if (!added.success) {
                std::cerr << "Error adding: " << doc_uri << "\n" << added.error << "\n";
                return false;
            }
            std::cout << "added " << doc_uri << "\n";
            return true;
        }, all_ok);

        if (!s.success) {
            std::cerr << "Error adding: " << uri << "\n" << s.error << "\n";
            ++failures;
        } else if (!all_ok) {
            ++failures;
        }
    }

    if (failures > 0) {
        return Status::fail(ErrorKind::UPSTREAM,
                            std::to_string(failures) + " of " + std::to_string(uris.size()) +
                            " paths could not be fully added");
    }
    return Status::ok();
}

Status Application::cmd_remove() {
    std::unique_ptr<LocalDocumentIndex> index;
    Status s = make_index(false, index);
    if (!s.success) return s;

    std::vector<std::string> uris;
    s = load_uri_list(uris);
    if (!s.success) return s;

    for (const auto& uri : uris) {
        std::cout << "removing " << uri << "\n";
        s = index->delete_document(uri);
        if (!s.success) return s;
    }
    return Status::ok();
}

Status Application::cmd_stats() {
    std::unique_ptr<LocalDocumentIndex> index;
    Status s = make_index(false, index);
    if (!s.success) return s;

    DocumentCatalogStats stats;
    s = index->get_catalog_stats(stats);
    if (!s.success) return s;

    Json out = Json::object();
    out["version"] = stats.version;
    out["documents"] = stats.documents;
    out["chunks"] = stats.chunks;
    out["metadata_config"] = metadata_config_to_json(stats.metadata_config);

    std::cout << "Index Stats\n" << out.dump(2) << "\n";
    return Status::ok();
}

Status Application::cmd_query() {
    std::unique_ptr<LocalDocumentIndex> index;
    Status s = make_index(true, index);
    if (!s.success) return s;

    DocumentQueryOptions query;
    query.max_documents = options_.document_count;
    query.max_chunks = options_.chunk_count;
    query.is_bm25 = options_.bm25;

    std::vector<LocalDocumentResult> results;
    s = index->query_documents(options_.query, query, results);
    if (!s.success) return s;

    for (auto& result : results) {
        std::cout << result.uri() << "\n"
                  << "score: " << result.score() << "\n"
                  << "chunks: " << result.chunks().size() << "\n";

        if (options_.format == "sections") {
            std::vector<DocumentTextSection> sections;
            s = result.render_sections(options_.tokens, options_.section_count, sections, options_.overlap);
            if (!s.success) return s;

            for (size_t i = 0; i < sections.size(); ++i) {
                const DocumentTextSection& section = sections[i];
                if (options_.section_count == 1) {
                    std::cout << "Section" << (section.is_bm25 ? " (keyword)" : "") << "\n";
                } else {
                    std::cout << "Section " << (i + 1) << (section.is_bm25 ? " (keyword)" : "") << "\n";
                }
                std::cout << "score: " << section.score << "\n"
                          << "tokens: " << section.token_count << "\n"
                          << section.text << "\n";
            }
        } else if (options_.format == "chunks") {
            std::string text;
            s = result.load_text(text);
            if (!s.success) return s;

            for (size_t i = 0; i < result.chunks().size(); ++i) {
                const QueryResult& chunk = result.chunks()[i];
                size_t start = chunk.item.metadata.value("startPos", static_cast<size_t>(0));
                size_t end = chunk.item.metadata.value("endPos", static_cast<size_t>(0));
                bool is_bm25 = chunk.is_bm25();

                std::cout << "Chunk " << (i + 1) << (is_bm25 ? " (keyword)" : "") << "\n"
                          << "score: " << chunk.score << "\n"
                          << "startPos: " << start << "\n"
                          << "endPos: " << end << "\n";
                if (start < text.size() && end >= start) {
                    std::cout << text.substr(start, end - start + 1) << "\n";
                }
            }
        }
    }
    return Status::ok();
}

// ============================================================================
// Entry
// ============================================================================

int Application::run(int argc, char* argv[]) {
    int exit_code = 0;
    if (!parse_args(argc, argv, exit_code)) {
        return exit_code;
    }

    Status s = setup_config();
    setup_logging();
    if (!s.success) {
        std::cerr << s.error << "\n";
        return 1;
    }

    curl_global_init(CURL_GLOBAL_DEFAULT);

    const std::string& cmd = options_.command;
    if (cmd == "create") {
        s = cmd_create();
    } else if (cmd == "delete") {
        s = cmd_delete();
    } else if (cmd == "add") {
        s = cmd_add();
    } else if (cmd == "remove") {
        s = cmd_remove();
    } else if (cmd == "stats") {
        s = cmd_stats();
    } else if (cmd == "query") {
        s = cmd_query();
    } else {
        print_usage(argv[0]);
        s = Status::fail(ErrorKind::VALIDATION, "Unknown command: " + cmd);
    }

    curl_global_cleanup();

    if (!s.success) {
        LOG_DEBUG("[CLI] %s failed (%s)", cmd.c_str(), error_kind_name(s.kind));
        std::cerr << s.error << "\n";
        return 1;
    }
    return 0;
}

} // namespace vectrix
