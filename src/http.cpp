// Blocking HTTP/1.1 over POSIX sockets + OpenSSL. Used for Discord REST
// calls from the upstream worker thread; never called on the event loop.
#include "http.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>

#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <poll.h>
#include <fcntl.h>
#include <unistd.h>

#include <chrono>
#include <cstring>
#include <cerrno>
#include <cctype>
#include <cstdlib>
#include <string>
#include <stdexcept>
#include <iostream>
#include <algorithm>

namespace cordbridge {

static const std::atomic<bool>* g_abort_flag = nullptr;

void http_set_abort_flag(const std::atomic<bool>* flag) {
    g_abort_flag = flag;
}

static bool aborted() {
    return g_abort_flag && g_abort_flag->load(std::memory_order_relaxed);
}

ParsedUrl parse_url(const std::string& url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        throw std::runtime_error("http: invalid URL: " + url);
    }

    ParsedUrl out;
    std::string scheme = url.substr(0, scheme_end);
    out.tls = scheme == "https" || scheme == "wss";

    auto authority_start = scheme_end + 3;
    auto slash = url.find('/', authority_start);
    std::string authority = url.substr(authority_start,
        slash == std::string::npos ? std::string::npos : slash - authority_start);
    out.path = slash == std::string::npos ? "/" : url.substr(slash);

    auto colon = authority.find(':');
    out.host = authority.substr(0, colon);
    if (colon == std::string::npos) {
        out.port = out.tls ? "443" : "80";
    } else {
        out.port = authority.substr(colon + 1);
    }
    return out;
}

namespace {

using Clock = std::chrono::steady_clock;

// TCP socket with optional TLS on top. Reads block for at most one second
// at a time so the abort flag and the request deadline are honoured.
class Socket {
public:
    Socket() = default;
    ~Socket() {
        if (ssl_) {
            SSL_shutdown(ssl_);
            SSL_free(ssl_);
        }
        if (ctx_) SSL_CTX_free(ctx_);
        if (fd_ >= 0) ::close(fd_);
    }
    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    bool open(const ParsedUrl& url, Clock::time_point deadline, std::string& error) {
        if (!open_tcp(url, deadline, error)) return false;
        if (url.tls && !start_tls(url.host, error)) return false;
        set_slice_timeout(1);
        deadline_ = deadline;
        return true;
    }

    // >0 bytes read, 0 on orderly close, -1 on error, abort or deadline.
    ssize_t read(char* buf, size_t len) {
        for (;;) {
            if (aborted() || Clock::now() > deadline_) return -1;
            ssize_t n;
            if (ssl_) {
                n = SSL_read(ssl_, buf, static_cast<int>(len));
                if (n >= 0) return n;
                int err = SSL_get_error(ssl_, static_cast<int>(n));
                bool retry = err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE ||
                             (err == SSL_ERROR_SYSCALL && (errno == EAGAIN || errno == EWOULDBLOCK));
                if (!retry) return -1;
            } else {
                n = ::recv(fd_, buf, len, 0);
                if (n >= 0) return n;
                if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) return -1;
            }
        }
    }

    bool write(const std::string& data) {
        const char* p = data.data();
        size_t left = data.size();
        while (left > 0) {
            if (aborted() || Clock::now() > deadline_) return false;
            ssize_t n;
            if (ssl_) {
                n = SSL_write(ssl_, p, static_cast<int>(left));
                if (n <= 0) {
                    int err = SSL_get_error(ssl_, static_cast<int>(n));
                    if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) continue;
                    return false;
                }
            } else {
                n = ::send(fd_, p, left, MSG_NOSIGNAL);
                if (n < 0) {
                    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
                    return false;
                }
            }
            p += n;
            left -= static_cast<size_t>(n);
        }
        return true;
    }

private:
    bool open_tcp(const ParsedUrl& url, Clock::time_point deadline, std::string& error) {
        addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;
        addrinfo* addrs = nullptr;
        int rc = getaddrinfo(url.host.c_str(), url.port.c_str(), &hints, &addrs);
        if (rc != 0) {
            error = std::string("resolve failed: ") + gai_strerror(rc);
            return false;
        }

        for (addrinfo* ai = addrs; ai; ai = ai->ai_next) {
            int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd < 0) continue;
            if (connect_with_deadline(fd, ai, deadline)) {
                fd_ = fd;
                break;
            }
            ::close(fd);
        }
        freeaddrinfo(addrs);
        if (fd_ < 0) error = "connect failed";
        return fd_ >= 0;
    }

    static bool connect_with_deadline(int fd, const addrinfo* ai, Clock::time_point deadline) {
        int flags = fcntl(fd, F_GETFL, 0);
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
        bool ok = ::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0;
        if (!ok && errno == EINPROGRESS) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - Clock::now()).count();
            pollfd pfd{fd, POLLOUT, 0};
            if (remaining > 0 && ::poll(&pfd, 1, static_cast<int>(remaining)) == 1) {
                int err = 0;
                socklen_t len = sizeof(err);
                ok = getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) == 0 && err == 0;
            }
        }
        fcntl(fd, F_SETFL, flags);
        return ok;
    }

    bool start_tls(const std::string& host, std::string& error) {
        // Handshake I/O may block up to ten seconds; body reads use one-second slices.
        set_slice_timeout(10);
        ctx_ = SSL_CTX_new(TLS_client_method());
        if (!ctx_) {
            error = "TLS context creation failed";
            return false;
        }
        SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, nullptr);
        SSL_CTX_set_default_verify_paths(ctx_);
        SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION);

        ssl_ = SSL_new(ctx_);
        if (!ssl_) {
            error = "TLS session creation failed";
            return false;
        }
        SSL_set_fd(ssl_, fd_);
        SSL_set_tlsext_host_name(ssl_, host.c_str());
        SSL_set1_host(ssl_, host.c_str());
        if (SSL_connect(ssl_) != 1) {
            unsigned long code = ERR_get_error();
            char buf[256];
            ERR_error_string_n(code, buf, sizeof(buf));
            error = std::string("TLS handshake failed: ") + (code ? buf : "peer closed");
            return false;
        }
        return true;
    }

    void set_slice_timeout(long secs) {
        timeval tv{secs, 0};
        setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    }

    int fd_ = -1;
    SSL_CTX* ctx_ = nullptr;
    SSL* ssl_ = nullptr;
    Clock::time_point deadline_;
};

// Buffered reader over a Socket for the response side.
class ResponseReader {
public:
    explicit ResponseReader(Socket& sock) : sock_(sock) {}

    // One line without its CRLF. Returns false when the stream ends first.
    bool line(std::string& out) {
        for (;;) {
            auto nl = buf_.find('\n');
            if (nl != std::string::npos) {
                out.assign(buf_, 0, nl);
                if (!out.empty() && out.back() == '\r') out.pop_back();
                buf_.erase(0, nl + 1);
                return true;
            }
            if (!fill()) return false;
        }
    }

    bool exactly(size_t n, std::string& out) {
        while (buf_.size() < n) {
            if (!fill()) return false;
        }
        out.append(buf_, 0, n);
        buf_.erase(0, n);
        return true;
    }

    void rest(std::string& out) {
        while (fill()) {}
        out += buf_;
        buf_.clear();
    }

private:
    bool fill() {
        char chunk[4096];
        ssize_t n = sock_.read(chunk, sizeof(chunk));
        if (n <= 0) return false;
        buf_.append(chunk, static_cast<size_t>(n));
        return true;
    }

    Socket& sock_;
    std::string buf_;
};

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string serialize_request(const std::string& method, const ParsedUrl& url,
                              const std::string& body, const std::vector<Header>& headers) {
    std::string out = method + " " + url.path + " HTTP/1.1\r\nHost: " + url.host + "\r\n";
    for (const auto& h : headers) {
        if (lower(h.first) == "content-length") continue;
        out += h.first + ": " + h.second + "\r\n";
    }
    if (!body.empty() || method == "POST" || method == "PUT" || method == "PATCH") {
        out += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    }
    out += "Connection: close\r\n\r\n";
    out += body;
    return out;
}

// Status line and headers. Returns the status code, 0 on a malformed head.
long read_head(ResponseReader& reader, bool& chunked, long long& content_length) {
    chunked = false;
    content_length = -1;

    std::string status_line;
    if (!reader.line(status_line)) return 0;
    if (status_line.compare(0, 5, "HTTP/") != 0) return 0;
    auto sp = status_line.find(' ');
    if (sp == std::string::npos) return 0;
    long status = std::strtol(status_line.c_str() + sp + 1, nullptr, 10);
    if (status < 100 || status > 599) return 0;

    std::string line;
    while (reader.line(line) && !line.empty()) {
        auto colon = line.find(':');
        if (colon == std::string::npos) continue;
        std::string name = lower(line.substr(0, colon));
        std::string value = line.substr(colon + 1);
        value.erase(0, value.find_first_not_of(" \t"));
        if (name == "transfer-encoding") {
            chunked = lower(value).find("chunked") != std::string::npos;
        } else if (name == "content-length") {
            content_length = std::strtoll(value.c_str(), nullptr, 10);
        }
    }
    return status;
}

bool read_chunked(ResponseReader& reader, std::string& body) {
    std::string size_line;
    while (reader.line(size_line)) {
        size_t size = std::strtoul(size_line.c_str(), nullptr, 16);
        if (size == 0) return true;
        std::string crlf;
        if (!reader.exactly(size, body) || !reader.exactly(2, crlf)) return false;
    }
    return false;
}

} // namespace

HttpResponse SocketHttpClient::request(const std::string& method,
                                       const std::string& url,
                                       const std::string& body,
                                       const std::vector<Header>& headers,
                                       long timeout_seconds) {
    ParsedUrl target;
    try {
        target = parse_url(url);
    } catch (const std::exception& e) {
        std::cerr << "[http] " << e.what() << "\n";
        return {};
    }

    auto deadline = Clock::now() + std::chrono::seconds(timeout_seconds);
    Socket sock;
    std::string error;
    if (!sock.open(target, deadline, error)) {
        std::cerr << "[http] " << method << " " << target.host << ":" << target.port
                  << " " << error << "\n";
        return {};
    }
    if (!sock.write(serialize_request(method, target, body, headers))) {
        std::cerr << "[http] " << method << " " << target.host << " write failed\n";
        return {};
    }

    ResponseReader reader(sock);
    bool chunked = false;
    long long content_length = -1;
    long status = read_head(reader, chunked, content_length);
    if (status == 0) {
        std::cerr << "[http] " << method << " " << target.host << " bad response head\n";
        return {};
    }

    HttpResponse resp;
    resp.status_code = status;
    if (chunked) {
        if (!read_chunked(reader, resp.body)) {
            std::cerr << "[http] " << method << " " << target.host << " truncated chunked body\n";
        }
    } else if (content_length >= 0) {
        if (!reader.exactly(static_cast<size_t>(content_length), resp.body)) {
            std::cerr << "[http] " << method << " " << target.host << " truncated body\n";
        }
    } else {
        reader.rest(resp.body);
    }
    return resp;
}

} // namespace cordbridge
