#pragma once
#include <string>
#include <vector>
#include <utility>
#include <atomic>

namespace cordbridge {

// Set a global abort flag checked by all in-flight transfers (~1s granularity).
// When the flag becomes true, in-flight HTTP requests abort promptly.
void http_set_abort_flag(const std::atomic<bool>* flag);

using Header = std::pair<std::string, std::string>;

struct HttpResponse {
    long status_code = 0;  // 0 = connection or protocol failure
    std::string body;
};

// Abstract HTTP client interface (injectable for testing)
class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual HttpResponse request(const std::string& method,
                                 const std::string& url,
                                 const std::string& body,
                                 const std::vector<Header>& headers,
                                 long timeout_seconds = 30) = 0;

    HttpResponse get(const std::string& url,
                     const std::vector<Header>& headers,
                     long timeout_seconds = 30) {
        return request("GET", url, "", headers, timeout_seconds);
    }

    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long timeout_seconds = 30) {
        return request("POST", url, body, headers, timeout_seconds);
    }
};

// Blocking HTTP/1.1 client over POSIX sockets + OpenSSL.
class SocketHttpClient : public HttpClient {
public:
    HttpResponse request(const std::string& method,
                         const std::string& url,
                         const std::string& body,
                         const std::vector<Header>& headers,
                         long timeout_seconds = 30) override;
};

struct ParsedUrl {
    bool tls = false;
    std::string host;
    std::string port;
    std::string path;  // includes leading / and query string
};

// Split scheme://host[:port]/path (https and wss imply TLS). Throws
// std::runtime_error on a URL without scheme.
ParsedUrl parse_url(const std::string& url);

} // namespace cordbridge
