/*
 * vectrix C++17 - Embeddings Model
 *
 * Interface for services that turn text into vectors.
 */
#ifndef vectrix_EMBEDDINGS_EMBEDDINGS_MODEL_HPP
#define vectrix_EMBEDDINGS_EMBEDDINGS_MODEL_HPP

#include <string>
#include <vector>

namespace vectrix {

enum class EmbeddingsStatus {
    SUCCESS,
    ERROR,
    RATE_LIMITED
};

const char* embeddings_status_name(EmbeddingsStatus status);

struct EmbeddingsResponse {
    EmbeddingsStatus status;
    std::vector<std::vector<float>> output;     // One vector per input, in input order
    std::string message;
    std::string model;

    EmbeddingsResponse() : status(EmbeddingsStatus::ERROR) {}

    static EmbeddingsResponse success(const std::vector<std::vector<float>>& output,
                                      const std::string& model = "") {
        EmbeddingsResponse r;
        r.status = EmbeddingsStatus::SUCCESS;
        r.output = output;
        r.model = model;
        return r;
    }

    static EmbeddingsResponse fail(EmbeddingsStatus status, const std::string& message) {
        EmbeddingsResponse r;
        r.status = status;
        r.message = message;
        return r;
    }
};

class EmbeddingsModel {
public:
    virtual ~EmbeddingsModel() = default;

    // Largest token total a single create_embeddings call accepts.
    virtual size_t max_tokens() const = 0;

    virtual EmbeddingsResponse create_embeddings(const std::vector<std::string>& inputs) = 0;
};

} // namespace vectrix

#endif // vectrix_EMBEDDINGS_EMBEDDINGS_MODEL_HPP
