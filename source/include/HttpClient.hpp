#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <boost/beast/http/verb.hpp>
#include <boost/asio/ssl/context.hpp>

#include <Logging.hpp>
#include <Retry.hpp>
#include <Utils.hpp>

namespace http = boost::beast::http;

using HeaderList = std::vector<std::pair<std::string, std::string>>;

struct HttpRequest {
    http::verb method = http::verb::get;
    std::string url;
    HeaderList headers;
    std::string content_type;
    std::string body;
    std::chrono::milliseconds timeout{ 15000 };
};

struct HttpResponse {
    unsigned status{};
    HeaderList headers;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }

    // first header with this name, compared case-insensitively
    std::optional<std::string> header(std::string_view name) const;
    std::vector<std::string> headers_named(std::string_view name) const;
};

// One request, one response. Implementations throw TransientNetworkError for
// anything that kept a response from arriving (DNS, connect, TLS, timeout).
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual HttpResponse send(const HttpRequest& request) = 0;
};

// HTTP/1.1 over Boost.Beast, plain or TLS depending on the URL scheme.
// Every call runs on its own io_context so it can be used from several threads at once.
class BeastHttpClient : public HttpTransport {
public:
    explicit BeastHttpClient(std::string user_agent = "seed-tools/1.0");

    HttpResponse send(const HttpRequest& request) override;

    static constexpr unsigned max_redirects = 3;
    static constexpr size_t max_body_size = 64 * 1024 * 1024;

private:
    HttpResponse send_once(const HttpRequest& request, const ParsedUrl& url);

    std::string user_agent_;
    boost::asio::ssl::context ssl_ctx_;
};

// throws TransientNetworkError for retryable statuses, ServiceError for any other non-2xx
void ensure_success(const HttpResponse& response, const std::string& what);

// send + ensure_success under the retry policy; for idempotent queries only
HttpResponse fetch(HttpTransport& transport, const HttpRequest& request, const RetryPolicy& retry,
                   Logger& log, const std::string& what);

// multipart/form-data body builder for uploads
class MultipartForm {
public:
    MultipartForm();

    MultipartForm& add_field(const std::string& name, const std::string& value);
    MultipartForm& add_file(const std::string& name, const std::string& filename, const std::string& content,
                            const std::string& content_type = "application/octet-stream");

    std::string content_type() const { return "multipart/form-data; boundary=" + boundary_; }
    std::string body() const { return body_ + "--" + boundary_ + "--\r\n"; }

    const std::string& boundary() const { return boundary_; }

private:
    std::string boundary_;
    std::string body_;
};
