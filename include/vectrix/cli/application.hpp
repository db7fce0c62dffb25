/*
 * vectrix C++17 - Command Line Application
 *
 *   vectrix create <index>
 *   vectrix delete <index>
 *   vectrix add    <index> --keys <file> (--uri <path>... | --list <file>) [--chunk-size N]
 *   vectrix remove <index> (--uri <uri>... | --list <file>)
 *   vectrix stats  <index>
 *   vectrix query  <index> <query> --keys <file> [--document-count N] [--chunk-count N]
 *                  [--section-count N] [--tokens N] [--format sections|stats|chunks]
 *                  [--overlap|--no-overlap] [--bm25]
 *
 * Global: --config <file> --log-level <level>
 */
#ifndef vectrix_CLI_APPLICATION_HPP
#define vectrix_CLI_APPLICATION_HPP

#include <vectrix/core/config.hpp>
#include <vectrix/core/status.hpp>
#include <vectrix/storage/file_storage.hpp>
#include <memory>
#include <string>
#include <vector>

namespace vectrix {

class LocalDocumentIndex;
class EmbeddingsModel;

struct AppInfo {
    static constexpr const char* NAME = "vectrix";
    static constexpr const char* VERSION = "0.1.0";
};

void print_usage(const char* prog);
void print_version();

struct CliOptions {
    std::string command;
    std::string index;
    std::string query;
    std::string keys_file;
    std::string config_file;
    std::string log_level;
    std::vector<std::string> uris;
    std::string list_file;
    int chunk_size;                 // 0 when not given
    size_t document_count;
    size_t chunk_count;
    size_t section_count;
    size_t tokens;
    std::string format;
    bool overlap;
    bool bm25;

    CliOptions()
        : chunk_size(0)
        , document_count(10)
        , chunk_count(50)
        , section_count(1)
        , tokens(2000)
        , format("sections")
        , overlap(true)
        , bm25(false)
    {}
};

class Application {
public:
    Application();

    // Returns the process exit code.
    int run(int argc, char* argv[]);

    // false when the program should exit without running a command
    // (help, version or a usage error, reported through `exit_code`).
    bool parse_args(int argc, char* argv[], int& exit_code);

    const CliOptions& options() const { return options_; }

private:
    Status setup_config();
    void setup_logging();
    Status open_storage(std::shared_ptr<FileStorage>& out);
    Status load_embeddings(std::shared_ptr<EmbeddingsModel>& out);
    Status load_uri_list(std::vector<std::string>& out);
    Status make_index(bool with_embeddings, std::unique_ptr<LocalDocumentIndex>& out);

    Status cmd_create();
    Status cmd_delete();
    Status cmd_add();
    Status cmd_remove();
    Status cmd_stats();
    Status cmd_query();

    CliOptions options_;
    Config config_;
};

} // namespace vectrix

#endif // vectrix_CLI_APPLICATION_HPP
