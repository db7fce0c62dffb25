#include <vectrix/embeddings/openai_embeddings.hpp>
#include <vectrix/core/logger.hpp>
#include <vectrix/core/utils.hpp>

namespace vectrix {

const char* embeddings_status_name(EmbeddingsStatus status) {
    switch (status) {
        case EmbeddingsStatus::SUCCESS:      return "success";
        case EmbeddingsStatus::ERROR:        return "error";
        case EmbeddingsStatus::RATE_LIMITED: return "rate_limited";
    }
    return "unknown";
}

namespace {

std::string strip_trailing_slash(std::string url) {
    while (!url.empty() && url[url.length() - 1] == '/') {
        url = url.substr(0, url.length() - 1);
    }
    return url;
}

} // anonymous namespace

// ============================================================================
// Options
// ============================================================================

OpenAIEmbeddingsOptions OpenAIEmbeddingsOptions::from_config(const Config& cfg) {
    OpenAIEmbeddingsOptions opts;
    opts.api_key = cfg.get_string("apiKey", "");
    opts.model = cfg.get_string("model", "");
    opts.organization = cfg.get_string("organization", "");
    opts.endpoint = cfg.get_string("endpoint", "");

    opts.azure_api_key = cfg.get_string("azureApiKey", "");
    opts.azure_endpoint = cfg.get_string("azureEndpoint", "");
    opts.azure_deployment = cfg.get_string("azureDeployment", "");
    opts.azure_api_version = cfg.get_string("azureApiVersion", opts.azure_api_version);

    opts.oss_model = cfg.get_string("ossModel", "");
    opts.oss_endpoint = cfg.get_string("ossEndpoint", "");

    opts.dimensions = static_cast<int>(cfg.get_int("dimensions", 0));
    int64_t max_tokens = cfg.get_int("maxTokens", static_cast<int64_t>(opts.max_tokens));
    if (max_tokens > 0) {
        opts.max_tokens = static_cast<size_t>(max_tokens);
    }
    opts.log_requests = cfg.get_bool("logRequests", false);

    if (cfg.has("retryPolicy")) {
        opts.retry_policy.clear();
        for (int64_t delay : cfg.get_int_array("retryPolicy")) {
            opts.retry_policy.push_back(static_cast<int>(delay));
        }
    }
    return opts;
}

EmbeddingsProvider OpenAIEmbeddingsOptions::provider() const {
    if (!azure_api_key.empty()) return EmbeddingsProvider::AZURE;
    if (!oss_endpoint.empty()) return EmbeddingsProvider::OSS;
    return EmbeddingsProvider::OPENAI;
}

// ============================================================================
// Client
// ============================================================================

OpenAIEmbeddings::OpenAIEmbeddings(const OpenAIEmbeddingsOptions& options)
    : options_(options)
{
    post_ = [this](const std::string& url,
                   const std::string& body,
                   const std::map<std::string, std::string>& headers) {
        return http_.post_json(url, body, headers);
    };
    sleep_ = sleep_ms;

    if (options_.provider() == EmbeddingsProvider::OPENAI && options_.api_key.empty()) {
        LOG_WARN("[Embeddings] No API key configured (set apiKey in the keys file)");
    }
}

std::string OpenAIEmbeddings::request_url() const {
    switch (options_.provider()) {
        case EmbeddingsProvider::AZURE:
            return strip_trailing_slash(options_.azure_endpoint) + "/openai/deployments/" +
                   options_.azure_deployment + "/embeddings?api-version=" +
                   options_.azure_api_version;
        case EmbeddingsProvider::OSS:
            return strip_trailing_slash(options_.oss_endpoint) + "/v1/embeddings";
        case EmbeddingsProvider::OPENAI:
            break;
    }
    std::string base = options_.endpoint.empty() ? "https://api.openai.com" : options_.endpoint;
    return strip_trailing_slash(base) + "/v1/embeddings";
}

std::map<std::string, std::string> OpenAIEmbeddings::request_headers() const {
    std::map<std::string, std::string> headers;
    headers["Content-Type"] = "application/json";
    headers["User-Agent"] = "vectrix";

    EmbeddingsProvider provider = options_.provider();
    if (provider == EmbeddingsProvider::AZURE) {
        headers["api-key"] = options_.azure_api_key;
    } else if (!options_.api_key.empty()) {
        headers["Authorization"] = "Bearer " + options_.api_key;
        if (!options_.organization.empty()) {
            headers["OpenAI-Organization"] = options_.organization;
        }
    }
    return headers;
}

Json OpenAIEmbeddings::request_body(const std::vector<std::string>& inputs) const {
    Json request = Json::object();
    request["input"] = inputs;

    EmbeddingsProvider provider = options_.provider();
    if (provider == EmbeddingsProvider::OPENAI) {
        request["model"] = options_.model;
    } else if (provider == EmbeddingsProvider::OSS) {
        request["model"] = options_.oss_model;
    }
    if (options_.dimensions > 0) {
        request["dimensions"] = options_.dimensions;
    }
    return request;
}

EmbeddingsResponse OpenAIEmbeddings::create_embeddings(const std::vector<std::string>& inputs) {
    std::string url = request_url();
    std::string body = dump_json(request_body(inputs));
    std::map<std::string, std::string> headers = request_headers();

    if (options_.log_requests) {
        LOG_INFO("[Embeddings] POST %s (%zu inputs)", url.c_str(), inputs.size());
        for (size_t i = 0; i < inputs.size(); ++i) {
            LOG_INFO("[Embeddings] [%zu] %.200s%s", i, inputs[i].c_str(),
                     inputs[i].size() > 200 ? "..." : "");
        }
    }

    size_t attempt = 0;
    while (true) {
        HttpResponse response = post_(url, body, headers);

        if (response.status_code == 0) {
            LOG_ERROR("[Embeddings] Request to %s failed: %s", url.c_str(), response.error.c_str());
            return EmbeddingsResponse::fail(EmbeddingsStatus::ERROR,
                                            "Request failed: " + response.error);
        }

        if (response.status_code == 429) {
            if (attempt < options_.retry_policy.size()) {
                int delay = options_.retry_policy[attempt++];
                LOG_WARN("[Embeddings] Rate limited, retrying in %d ms (attempt %zu of %zu)",
                         delay, attempt, options_.retry_policy.size());
                sleep_(delay);
                continue;
            }
            LOG_ERROR("[Embeddings] Rate limited, retries exhausted");
            return EmbeddingsResponse::fail(EmbeddingsStatus::RATE_LIMITED,
                                            "The embeddings API returned a rate limit error.");
        }

        if (response.status_code >= 400) {
            LOG_ERROR("[Embeddings] HTTP %d: %.500s", response.status_code, response.body.c_str());
            return EmbeddingsResponse::fail(EmbeddingsStatus::ERROR,
                                            "The embeddings API returned an error status of " +
                                            std::to_string(response.status_code) + ": " +
                                            truncate_safe(response.body, 500));
        }

        return parse_response(response);
    }
}

EmbeddingsResponse OpenAIEmbeddings::parse_response(const HttpResponse& response) const {
    try {
        Json json = Json::parse(response.body);

        if (!json.contains("data") || !json["data"].is_array()) {
            return EmbeddingsResponse::fail(EmbeddingsStatus::ERROR,
                                            "Invalid response: missing data array");
        }

        const Json& data = json["data"];
        std::vector<std::vector<float>> output(data.size());
        for (size_t i = 0; i < data.size(); ++i) {
            const Json& entry = data[i];
            if (!entry.contains("embedding") || !entry["embedding"].is_array()) {
                return EmbeddingsResponse::fail(EmbeddingsStatus::ERROR,
                                                "Invalid response: missing embedding");
            }
            // Entries carry their input position
            size_t slot = i;
            if (entry.contains("index") && entry["index"].is_number_unsigned()) {
                slot = entry["index"].get<size_t>();
            }
            if (slot >= output.size()) {
                return EmbeddingsResponse::fail(EmbeddingsStatus::ERROR,
                                                "Invalid response: embedding index out of range");
            }
            output[slot] = entry["embedding"].get<std::vector<float>>();
        }

        std::string model = json.value("model", std::string());
        LOG_DEBUG("[Embeddings] Received %zu embeddings from %s", output.size(), model.c_str());
        return EmbeddingsResponse::success(output, model);
    } catch (const std::exception& e) {
        LOG_ERROR("[Embeddings] Failed to parse response: %s", e.what());
        return EmbeddingsResponse::fail(EmbeddingsStatus::ERROR,
                                        std::string("Failed to parse response: ") + e.what());
    }
}

} // namespace vectrix
