#ifndef vectrix_CORE_HTTP_CLIENT_HPP
#define vectrix_CORE_HTTP_CLIENT_HPP

#include <string>
#include <map>

namespace vectrix {

struct HttpResponse {
    int status_code;        // 0 when the request never completed
    std::string body;
    std::string error;

    HttpResponse() : status_code(0) {}
};

// Blocking libcurl client. One easy handle per request.
class HttpClient {
public:
    HttpClient();

    void set_timeout(long seconds) { timeout_seconds_ = seconds; }

    HttpResponse post_json(const std::string& url,
                           const std::string& body,
                           const std::map<std::string, std::string>& headers);

private:
    long timeout_seconds_;
};

} // namespace vectrix

#endif // vectrix_CORE_HTTP_CLIENT_HPP
