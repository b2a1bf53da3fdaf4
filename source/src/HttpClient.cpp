#include <HttpClient.hpp>
#include <Errors.hpp>
#include <Retry.hpp>

#include <memory>
#include <random>
#include <sstream>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>

namespace beast = boost::beast;
namespace net   = boost::asio;
namespace ssl   = net::ssl;
using tcp       = net::ip::tcp;

namespace {

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() && to_lower(a) == to_lower(b);
}

bool is_redirect(unsigned status) {
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

// Drives one request through resolve -> connect -> [handshake] -> write -> read -> shutdown.
// Every step arms the stream deadline, so a stalled peer ends in beast::error::timeout.
template <typename Stream>
class HttpExchange : public std::enable_shared_from_this<HttpExchange<Stream>> {
public:
    template <typename... StreamArgs>
    HttpExchange(net::io_context& ioc, ParsedUrl url, http::request<http::string_body> req,
                 std::chrono::milliseconds timeout, StreamArgs&&... stream_args)
        : resolver_(ioc),
          stream_(std::forward<StreamArgs>(stream_args)...),
          url_(std::move(url)),
          req_(std::move(req)),
          timeout_(timeout)
    {
        parser_.body_limit(BeastHttpClient::max_body_size);
    }

    Stream& stream() { return stream_; }

    void start() {
        auto self = this->shared_from_this();

        resolver_.async_resolve(url_.host, url_.port,
            [self](beast::error_code ec, tcp::resolver::results_type results) {
                if (ec) return self->fail(ec, "resolve");
                self->on_resolve(results);
            });
    }

    bool failed() const { return failed_step_ != nullptr; }
    bool timed_out() const { return ec_ == beast::error::timeout; }

    std::string error_message() const {
        return std::string(failed_step_) + " " + url_.host + ":" + url_.port + ": " + ec_.message();
    }

    HttpResponse response() {
        auto res = parser_.release();

        HttpResponse out;
        out.status = res.result_int();
        for (const auto& field : res) {
            auto name = field.name_string();
            auto value = field.value();
            out.headers.emplace_back(std::string(name.data(), name.size()), std::string(value.data(), value.size()));
        }
        out.body = std::move(res.body());
        return out;
    }

private:
    void on_resolve(const tcp::resolver::results_type& results) {
        auto self = this->shared_from_this();

        beast::get_lowest_layer(stream_).expires_after(timeout_);
        beast::get_lowest_layer(stream_).async_connect(results,
            [self](beast::error_code ec, const tcp::resolver::results_type::endpoint_type&) {
                if (ec) return self->fail(ec, "connect");
                self->on_connect();
            });
    }

    void on_connect() {
        if constexpr (std::is_same_v<Stream, beast::ssl_stream<beast::tcp_stream>>) {
            auto self = this->shared_from_this();

            beast::get_lowest_layer(stream_).expires_after(timeout_);
            stream_.async_handshake(ssl::stream_base::client,
                [self](beast::error_code ec) {
                    if (ec) return self->fail(ec, "handshake");
                    self->do_write();
                });
        } else {
            do_write();
        }
    }

    void do_write() {
        auto self = this->shared_from_this();

        beast::get_lowest_layer(stream_).expires_after(timeout_);
        http::async_write(stream_, req_,
            [self](beast::error_code ec, std::size_t) {
                if (ec) return self->fail(ec, "write");
                self->do_read();
            });
    }

    void do_read() {
        auto self = this->shared_from_this();

        beast::get_lowest_layer(stream_).expires_after(timeout_);
        http::async_read(stream_, buffer_, parser_,
            [self](beast::error_code ec, std::size_t) {
                if (ec) return self->fail(ec, "read");
                self->do_shutdown();
            });
    }

    // the response is complete at this point; a peer that drops the connection
    // instead of closing it cleanly (stream_truncated, eof) changes nothing
    void do_shutdown() {
        if constexpr (std::is_same_v<Stream, beast::ssl_stream<beast::tcp_stream>>) {
            auto self = this->shared_from_this();

            beast::get_lowest_layer(stream_).expires_after(timeout_);
            stream_.async_shutdown([self](beast::error_code) {
                beast::get_lowest_layer(self->stream_).close();
            });
        } else {
            beast::error_code ec;
            stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
        }
    }

    void fail(beast::error_code ec, const char* step) {
        ec_ = ec;
        failed_step_ = step;
        beast::get_lowest_layer(stream_).close();
    }

    tcp::resolver resolver_;
    Stream stream_;
    beast::flat_buffer buffer_;

    ParsedUrl url_;
    http::request<http::string_body> req_;
    http::response_parser<http::string_body> parser_;
    std::chrono::milliseconds timeout_;

    beast::error_code ec_;
    const char* failed_step_{ nullptr };
};

template <typename Stream>
HttpResponse finish(net::io_context& ioc, const std::shared_ptr<HttpExchange<Stream>>& exchange) {
    exchange->start();
    ioc.run();

    if (exchange->failed()) {
        throw TransientNetworkError(exchange->timed_out() ? "timed out: " + exchange->error_message()
                                                          : exchange->error_message());
    }
    return exchange->response();
}

ParsedUrl resolve_location(const ParsedUrl& base, const std::string& location) {
    if (location.find("://") != std::string::npos) return parse_url(location);

    ParsedUrl next = base;
    if (!location.empty() && location.front() == '/') {
        next.target = location;
    } else {
        auto slash = base.target.find_last_of('/');
        next.target = base.target.substr(0, slash + 1) + location;
    }
    return next;
}

}

std::optional<std::string> HttpResponse::header(std::string_view name) const {
    for (const auto& [key, value] : headers) {
        if (iequals(key, name)) return value;
    }
    return std::nullopt;
}

std::vector<std::string> HttpResponse::headers_named(std::string_view name) const {
    std::vector<std::string> out;
    for (const auto& [key, value] : headers) {
        if (iequals(key, name)) out.push_back(value);
    }
    return out;
}

BeastHttpClient::BeastHttpClient(std::string user_agent)
    : user_agent_(std::move(user_agent)),
      ssl_ctx_(ssl::context::tlsv12_client)
{
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(ssl::verify_peer);
}

HttpResponse BeastHttpClient::send(const HttpRequest& request) {
    auto url = parse_url(request.url);
    HttpRequest current = request;

    for (unsigned redirects = 0;; ++redirects) {
        auto response = send_once(current, url);

        auto location = response.header("Location");
        if (!is_redirect(response.status) || !location || redirects == max_redirects) return response;

        url = resolve_location(url, *location);

        // 303, and 301/302 after a POST, continue as a plain GET
        if (response.status == 303 || ((response.status == 301 || response.status == 302) && current.method == http::verb::post)) {
            current.method = http::verb::get;
            current.body.clear();
            current.content_type.clear();
        }
    }
}

HttpResponse BeastHttpClient::send_once(const HttpRequest& request, const ParsedUrl& url) {
    if (url.host.empty()) throw ServiceError("invalid URL '" + request.url + "'");

    http::request<http::string_body> req{ request.method, url.target, 11 };

    bool default_port = (url.is_tls() && url.port == "443") || (!url.is_tls() && url.port == "80");
    req.set(http::field::host, default_port ? url.host : url.host + ":" + url.port);
    req.set(http::field::user_agent, user_agent_);
    req.set(http::field::accept, "*/*");

    for (const auto& [name, value] : request.headers) req.set(name, value);

    if (!request.content_type.empty()) req.set(http::field::content_type, request.content_type);
    if (!request.body.empty() || request.method == http::verb::post) {
        req.body() = request.body;
        req.prepare_payload();
    }

    net::io_context ioc;

    if (url.is_tls()) {
        using Stream = beast::ssl_stream<beast::tcp_stream>;
        auto exchange = std::make_shared<HttpExchange<Stream>>(ioc, url, std::move(req), request.timeout, ioc, ssl_ctx_);

        // Set SNI hostname (many trackers require this)
        if (!SSL_set_tlsext_host_name(exchange->stream().native_handle(), url.host.c_str())) {
            throw TransientNetworkError("cannot set SNI host name for " + url.host);
        }
        exchange->stream().set_verify_callback(ssl::host_name_verification(url.host));

        return finish(ioc, exchange);
    }

    auto exchange = std::make_shared<HttpExchange<beast::tcp_stream>>(ioc, url, std::move(req), request.timeout, ioc);
    return finish(ioc, exchange);
}

void ensure_success(const HttpResponse& response, const std::string& what) {
    if (response.ok()) return;

    std::string message = what + " returned HTTP " + std::to_string(response.status);
    if (is_transient_status(response.status)) throw TransientNetworkError(message, response.status);
    throw ServiceError(message, response.status);
}

HttpResponse fetch(HttpTransport& transport, const HttpRequest& request, const RetryPolicy& retry,
                   Logger& log, const std::string& what) {
    return with_retry(retry, log, what, [&] {
        auto response = transport.send(request);
        ensure_success(response, what);
        return response;
    });
}

MultipartForm::MultipartForm() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dist;

    std::ostringstream oss;
    oss << "----seedtools" << std::hex << dist(gen) << dist(gen);
    boundary_ = oss.str();
}

MultipartForm& MultipartForm::add_field(const std::string& name, const std::string& value) {
    body_ += "--" + boundary_ + "\r\n";
    body_ += "Content-Disposition: form-data; name=\"" + name + "\"\r\n\r\n";
    body_ += value;
    body_ += "\r\n";
    return *this;
}

MultipartForm& MultipartForm::add_file(const std::string& name, const std::string& filename, const std::string& content,
                                       const std::string& content_type) {
    body_ += "--" + boundary_ + "\r\n";
    body_ += "Content-Disposition: form-data; name=\"" + name + "\"; filename=\"" + filename + "\"\r\n";
    body_ += "Content-Type: " + content_type + "\r\n\r\n";
    body_ += content;
    body_ += "\r\n";
    return *this;
}
