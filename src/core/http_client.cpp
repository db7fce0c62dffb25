#include <vectrix/core/http_client.hpp>
#include <vectrix/core/logger.hpp>
#include <curl/curl.h>

namespace vectrix {

static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    std::string* s = static_cast<std::string*>(userp);
    s->append(static_cast<char*>(contents), total);
    return total;
}

HttpClient::HttpClient() : timeout_seconds_(120) {}

HttpResponse HttpClient::post_json(const std::string& url,
                                   const std::string& body,
                                   const std::map<std::string, std::string>& headers) {
    HttpResponse response;

    CURL* curl = curl_easy_init();
    if (!curl) {
        response.error = "curl_easy_init failed";
        return response;
    }

    struct curl_slist* header_list = nullptr;
    bool has_content_type = false;
    for (const auto& h : headers) {
        if (h.first == "Content-Type") has_content_type = true;
        std::string line = h.first + ": " + h.second;
        header_list = curl_slist_append(header_list, line.c_str());
    }
    if (!has_content_type) {
        header_list = curl_slist_append(header_list, "Content-Type: application/json");
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_seconds_);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode code = curl_easy_perform(curl);
    if (code != CURLE_OK) {
        response.error = curl_easy_strerror(code);
        response.status_code = 0;
        LOG_DEBUG("[HttpClient] POST %s failed: %s", url.c_str(), response.error.c_str());
    } else {
        long status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        response.status_code = static_cast<int>(status);
    }

    curl_slist_free_all(header_list);
    curl_easy_cleanup(curl);
    return response;
}

} // namespace vectrix
