/*
 * vectrix C++17 - OpenAI Embeddings
 *
 * EmbeddingsModel over the OpenAI /v1/embeddings API. The same request
 * shape is sent to Azure OpenAI deployments and to OSS servers that speak
 * the OpenAI protocol. The provider is picked from the options:
 * azure_api_key set -> Azure, oss_endpoint set -> OSS, otherwise OpenAI.
 */
#ifndef vectrix_EMBEDDINGS_OPENAI_EMBEDDINGS_HPP
#define vectrix_EMBEDDINGS_OPENAI_EMBEDDINGS_HPP

#include <vectrix/embeddings/embeddings_model.hpp>
#include <vectrix/core/config.hpp>
#include <vectrix/core/http_client.hpp>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace vectrix {

enum class EmbeddingsProvider {
    OPENAI,
    AZURE,
    OSS
};

struct OpenAIEmbeddingsOptions {
    // OpenAI
    std::string api_key;
    std::string model;
    std::string organization;
    std::string endpoint;               // Defaults to https://api.openai.com

    // Azure OpenAI
    std::string azure_api_key;
    std::string azure_endpoint;
    std::string azure_deployment;
    std::string azure_api_version;

    // OpenAI-compatible servers
    std::string oss_model;
    std::string oss_endpoint;

    int dimensions;                     // 0 leaves it to the service
    size_t max_tokens;
    std::vector<int> retry_policy;      // Delays in ms before each retry on HTTP 429
    bool log_requests;

    OpenAIEmbeddingsOptions()
        : azure_api_version("2023-05-15")
        , dimensions(0)
        , max_tokens(8000)
        , log_requests(false)
    {
        retry_policy.push_back(2000);
        retry_policy.push_back(5000);
    }

    // Reads the keys file layout: apiKey, model, organization, endpoint,
    // azureApiKey, azureEndpoint, azureDeployment, azureApiVersion,
    // ossModel, ossEndpoint, dimensions, maxTokens, retryPolicy, logRequests.
    static OpenAIEmbeddingsOptions from_config(const Config& cfg);

    EmbeddingsProvider provider() const;
};

class OpenAIEmbeddings : public EmbeddingsModel {
public:
    typedef std::function<HttpResponse(const std::string& url,
                                       const std::string& body,
                                       const std::map<std::string, std::string>& headers)> HttpPostFn;

    explicit OpenAIEmbeddings(const OpenAIEmbeddingsOptions& options);

    // Replace the transport (tests).
    void set_http_post(HttpPostFn post) { post_ = post; }

    // Replace the sleep between retries (tests).
    void set_sleep(std::function<void(int)> sleep) { sleep_ = sleep; }

    const OpenAIEmbeddingsOptions& options() const { return options_; }

    size_t max_tokens() const override { return options_.max_tokens; }
    EmbeddingsResponse create_embeddings(const std::vector<std::string>& inputs) override;

    std::string request_url() const;
    std::map<std::string, std::string> request_headers() const;
    Json request_body(const std::vector<std::string>& inputs) const;

private:
    EmbeddingsResponse parse_response(const HttpResponse& response) const;

    OpenAIEmbeddingsOptions options_;
    HttpClient http_;
    HttpPostFn post_;
    std::function<void(int)> sleep_;
};

} // namespace vectrix

#endif // vectrix_EMBEDDINGS_OPENAI_EMBEDDINGS_HPP
