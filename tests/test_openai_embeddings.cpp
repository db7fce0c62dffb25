// =============================================================================
// OpenAI Embeddings Tests
// =============================================================================

#include <gtest/gtest.h>
#include <vectrix/embeddings/openai_embeddings.hpp>

#include <map>
#include <string>
#include <vector>

using namespace vectrix;

namespace {

struct RecordedRequest {
    std::string url;
    Json body;
    std::map<std::string, std::string> headers;
};

HttpResponse respond(int status, const std::string& body) {
    HttpResponse response;
    response.status_code = status;
    response.body = body;
    return response;
}

} // anonymous namespace

class OpenAIEmbeddingsTest : public ::testing::Test {
protected:
    // Installs a transport that answers from `responses_` in order and
    // records every request.
    void attach(OpenAIEmbeddings& client) {
        client.set_http_post([this](const std::string& url,
                                    const std::string& body,
                                    const std::map<std::string, std::string>& headers) {
            RecordedRequest request;
            request.url = url;
            request.body = Json::parse(body);
            request.headers = headers;
            requests_.push_back(request);

            if (responses_.empty()) {
                return respond(500, "no response queued");
            }
            HttpResponse next = responses_.front();
            responses_.erase(responses_.begin());
            return next;
        });
        client.set_sleep([this](int ms) { sleeps_.push_back(ms); });
    }

    static OpenAIEmbeddingsOptions openai_options() {
        OpenAIEmbeddingsOptions options;
        options.api_key = "sk-test";
        options.model = "text-embedding-3-small";
        return options;
    }

    std::vector<HttpResponse> responses_;
    std::vector<RecordedRequest> requests_;
    std::vector<int> sleeps_;
};

TEST_F(OpenAIEmbeddingsTest, OpenAIRequestShape) {
    OpenAIEmbeddingsOptions options = openai_options();
    options.organization = "org-1";
    options.dimensions = 256;
    OpenAIEmbeddings client(options);
    attach(client);

    responses_.push_back(respond(200, R"({"model": "text-embedding-3-small",
        "data": [{"index": 0, "embedding": [0.5, 1.5]}]})"));

    EmbeddingsResponse response = client.create_embeddings({"hello"});
    ASSERT_EQ(response.status, EmbeddingsStatus::SUCCESS);
    EXPECT_EQ(response.model, "text-embedding-3-small");

    ASSERT_EQ(requests_.size(), 1u);
    const RecordedRequest& request = requests_[0];
    EXPECT_EQ(request.url, "https://api.openai.com/v1/embeddings");
    EXPECT_EQ(request.headers.at("Authorization"), "Bearer sk-test");
    EXPECT_EQ(request.headers.at("OpenAI-Organization"), "org-1");
    EXPECT_EQ(request.headers.at("Content-Type"), "application/json");
    EXPECT_EQ(request.body["model"], "text-embedding-3-small");
    EXPECT_EQ(request.body["input"], Json::array({"hello"}));
    EXPECT_EQ(request.body["dimensions"], 256);
}

TEST_F(OpenAIEmbeddingsTest, CustomEndpointDropsTrailingSlash) {
    OpenAIEmbeddingsOptions options = openai_options();
    options.endpoint = "http://localhost:8080/";
    OpenAIEmbeddings client(options);
    EXPECT_EQ(client.request_url(), "http://localhost:8080/v1/embeddings");
    EXPECT_FALSE(client.request_body({"x"}).contains("dimensions"));
}

TEST_F(OpenAIEmbeddingsTest, AzureRequestShape) {
    OpenAIEmbeddingsOptions options;
    options.azure_api_key = "azure-key";
    options.azure_endpoint = "https://example.openai.azure.com/";
    options.azure_deployment = "embed";
    OpenAIEmbeddings client(options);

    EXPECT_EQ(options.provider(), EmbeddingsProvider::AZURE);
    EXPECT_EQ(client.request_url(),
              "https://example.openai.azure.com/openai/deployments/embed/embeddings?api-version=2023-05-15");

    std::map<std::string, std::string> headers = client.request_headers();
    EXPECT_EQ(headers.at("api-key"), "azure-key");
    EXPECT_EQ(headers.count("Authorization"), 0u);
    EXPECT_FALSE(client.request_body({"x"}).contains("model"));
}

TEST_F(OpenAIEmbeddingsTest, OssRequestShape) {
    OpenAIEmbeddingsOptions options;
    options.oss_endpoint = "http://127.0.0.1:11434";
    options.oss_model = "nomic-embed-text";
    OpenAIEmbeddings client(options);

    EXPECT_EQ(options.provider(), EmbeddingsProvider::OSS);
    EXPECT_EQ(client.request_url(), "http://127.0.0.1:11434/v1/embeddings");
    EXPECT_EQ(client.request_body({"x"})["model"], "nomic-embed-text");
    EXPECT_EQ(client.request_headers().count("Authorization"), 0u);
}

TEST_F(OpenAIEmbeddingsTest, OutputFollowsIndexOrder) {
    OpenAIEmbeddings client(openai_options());
    attach(client);
    responses_.push_back(respond(200, R"({"data": [
        {"index": 1, "embedding": [2.0]},
        {"index": 0, "embedding": [1.0]}]})"));

    EmbeddingsResponse response = client.create_embeddings({"a", "b"});
    ASSERT_EQ(response.status, EmbeddingsStatus::SUCCESS);
    ASSERT_EQ(response.output.size(), 2u);
    EXPECT_EQ(response.output[0], std::vector<float>({1.0f}));
    EXPECT_EQ(response.output[1], std::vector<float>({2.0f}));
}

TEST_F(OpenAIEmbeddingsTest, RateLimitRetriesThenGivesUp) {
    OpenAIEmbeddingsOptions options = openai_options();
    options.retry_policy = {10, 20};
    OpenAIEmbeddings client(options);
    attach(client);
    responses_.push_back(respond(429, "slow down"));
    responses_.push_back(respond(429, "slow down"));
    responses_.push_back(respond(429, "slow down"));

    EmbeddingsResponse response = client.create_embeddings({"a"});
    EXPECT_EQ(response.status, EmbeddingsStatus::RATE_LIMITED);
    EXPECT_EQ(response.message, "The embeddings API returned a rate limit error.");
    EXPECT_EQ(requests_.size(), 3u);
    EXPECT_EQ(sleeps_, std::vector<int>({10, 20}));
}

TEST_F(OpenAIEmbeddingsTest, RateLimitRecovers) {
    OpenAIEmbeddings client(openai_options());
    attach(client);
    responses_.push_back(respond(429, ""));
    responses_.push_back(respond(200, R"({"data": [{"embedding": [0.1, 0.2]}]})"));

    EmbeddingsResponse response = client.create_embeddings({"a"});
    ASSERT_EQ(response.status, EmbeddingsStatus::SUCCESS);
    EXPECT_EQ(requests_.size(), 2u);
    EXPECT_EQ(sleeps_, std::vector<int>({2000}));
}

TEST_F(OpenAIEmbeddingsTest, ErrorStatusIsReported) {
    OpenAIEmbeddings client(openai_options());
    attach(client);
    responses_.push_back(respond(401, "invalid key"));

    EmbeddingsResponse response = client.create_embeddings({"a"});
    EXPECT_EQ(response.status, EmbeddingsStatus::ERROR);
    EXPECT_EQ(response.message, "The embeddings API returned an error status of 401: invalid key");
    EXPECT_TRUE(sleeps_.empty());
}

TEST_F(OpenAIEmbeddingsTest, TransportFailure) {
    OpenAIEmbeddings client(openai_options());
    attach(client);
    HttpResponse failed;
    failed.error = "Could not resolve host";
    responses_.push_back(failed);

    EmbeddingsResponse response = client.create_embeddings({"a"});
    EXPECT_EQ(response.status, EmbeddingsStatus::ERROR);
    EXPECT_EQ(response.message, "Request failed: Could not resolve host");
}

TEST_F(OpenAIEmbeddingsTest, MalformedBodies) {
    OpenAIEmbeddings client(openai_options());
    attach(client);
    responses_.push_back(respond(200, "not json"));
    responses_.push_back(respond(200, R"({"object": "list"})"));
    responses_.push_back(respond(200, R"({"data": [{"index": 4, "embedding": [1]}]})"));

    EXPECT_EQ(client.create_embeddings({"a"}).status, EmbeddingsStatus::ERROR);
    EXPECT_EQ(client.create_embeddings({"a"}).message, "Invalid response: missing data array");
    EXPECT_EQ(client.create_embeddings({"a"}).message,
              "Invalid response: embedding index out of range");
}

TEST_F(OpenAIEmbeddingsTest, OptionsFromKeysFile) {
    Config keys(Json::parse(R"({
        "apiKey": "sk-1",
        "model": "text-embedding-ada-002",
        "maxTokens": 4000,
        "dimensions": 512,
        "retryPolicy": [100, 200, 300],
        "logRequests": true
    })"));

    OpenAIEmbeddingsOptions options = OpenAIEmbeddingsOptions::from_config(keys);
    EXPECT_EQ(options.api_key, "sk-1");
    EXPECT_EQ(options.model, "text-embedding-ada-002");
    EXPECT_EQ(options.max_tokens, 4000u);
    EXPECT_EQ(options.dimensions, 512);
    EXPECT_EQ(options.retry_policy, std::vector<int>({100, 200, 300}));
    EXPECT_TRUE(options.log_requests);
    EXPECT_EQ(options.provider(), EmbeddingsProvider::OPENAI);

    OpenAIEmbeddingsOptions defaults = OpenAIEmbeddingsOptions::from_config(Config());
    EXPECT_EQ(defaults.max_tokens, 8000u);
    EXPECT_EQ(defaults.retry_policy, std::vector<int>({2000, 5000}));
    EXPECT_EQ(defaults.azure_api_version, "2023-05-15");
}

TEST_F(OpenAIEmbeddingsTest, StatusNames) {
    EXPECT_STREQ(embeddings_status_name(EmbeddingsStatus::RATE_LIMITED), "rate_limited");
    EXPECT_STREQ(embeddings_status_name(EmbeddingsStatus::SUCCESS), "success");
}
