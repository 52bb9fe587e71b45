#pragma once
#include <conduit/core/config.h>
#include <conduit/net/auth.h>
#include <conduit/net/body_source.h>
#include <conduit/net/connection_pool.h>
#include <conduit/net/cookie_jar.h>
#include <conduit/net/data_pipe.h>
#include <conduit/net/header_map.h>
#include <conduit/net/network_stream.h>
#include <conduit/net/response.h>
#include <conduit/net/tls_stream.h>
#include <conduit/net/uri.h>
#include <chrono>
#include <exception>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace conduit::net {

class DecodeChunked;

enum class Method {
    GET, POST, PUT, DELETE_METHOD, HEAD, OPTIONS, PATCH
};

std::string method_to_string(Method method);
Method string_to_method(const std::string& str);

// Per-request settings. Copied when a request starts; later changes do not
// affect a request already in flight.
struct RequestConfig {
    std::chrono::milliseconds timeout = core::config::kDefaultTimeout;
    bool keep_alive = core::config::kDefaultKeepAlive;
    unsigned max_redirects = core::config::kDefaultMaxRedirects;
    size_t max_content_length = core::config::kDefaultMaxContentLength;  // 0 = unlimited
    size_t max_headers_length = core::config::kDefaultMaxHeadersLength;  // 0 = unlimited
    size_t buffer_size = core::config::kDefaultBufferSize;
    unsigned verbosity = core::config::kDefaultVerbosity;
    std::shared_ptr<Authenticator> authenticator;
    TlsOptions tls;
    // Keep POST on 301/302 instead of switching to GET.
    bool strict_redirects = false;
    std::string user_agent = core::config::kDefaultUserAgent;
};

// HTTP/1.1 client. One logical request (redirects, one auth retry, one
// stale-connection retry) runs on the calling thread; concurrent requests
// need one HttpRequest each. Idle connections go to the pool.
class HttpRequest {
public:
    explicit HttpRequest(RequestConfig config = {});

    HttpRequest(const HttpRequest&) = delete;
    HttpRequest& operator=(const HttpRequest&) = delete;

    RequestConfig& config() { return config_; }
    const RequestConfig& config() const { return config_; }

    // Sent with every request
    HeaderMap& headers() { return headers_; }
    CookieJar& cookies() { return cookies_; }

    // Defaults to ConnectionPool::shared()
    void set_pool(ConnectionPool& pool) { pool_ = &pool; }
    ConnectionPool& pool() const { return *pool_; }

    Response get(const std::string& uri, const QueryParams& params = {});
    Response post(const std::string& uri, const std::string& data,
                  const std::string& content_type = "application/octet-stream");
    Response post(const std::string& uri, std::unique_ptr<BodySource> body,
                  const std::string& content_type = "application/octet-stream");
    // application/x-www-form-urlencoded
    Response post(const std::string& uri, const QueryParams& form);

    Response exec(Method method, const std::string& uri,
                  std::unique_ptr<BodySource> body = nullptr,
                  const std::string& content_type = {});
    Response exec(Method method, const std::string& uri, const std::string& data,
                  const std::string& content_type = "application/octet-stream");

private:
    enum class Stage {
        Connect,
        Send,
        ReceiveHeaders,
        ReceiveBody,
        Complete,
        StaleRetry,
    };

    struct Continue {
        Stage next;
    };
    struct Done {
        Response response;
    };
    struct Fail {
        std::exception_ptr error;
    };
    using StepResult = std::variant<Continue, Done, Fail>;

    enum class Framing {
        None,        // HEAD, 204, 304
        Length,      // Content-Length
        Chunked,
        UntilClose,  // no framing: body ends when the peer closes
    };

    struct Exchange {
        RequestConfig config;
        HeaderMap user_headers;
        Method method = Method::GET;
        Uri uri;
        std::unique_ptr<BodySource> body;
        std::string content_type;
        bool body_started = false;

        HeaderMap auth_headers;
        bool auth_attempted = false;
        std::vector<RedirectEntry> history;

        std::unique_ptr<NetworkStream> stream;
        std::string pool_key;
        bool reused = false;
        bool stale_retried = false;
        bool force_fresh = false;

        Response response;
        std::string header_bytes;
        Buffer pending;  // bytes read past the header block
        bool got_response_bytes = false;
        std::unique_ptr<DataPipe> pipe;
        DecodeChunked* dechunk = nullptr;  // owned by pipe
        Framing framing = Framing::None;
        size_t remaining = 0;
        bool clean = true;  // no stray bytes around the body
        bool reusable = false;
    };

    Response run(Exchange& ex);
    StepResult step(Exchange& ex, Stage stage);

    Stage connect(Exchange& ex);
    Stage send(Exchange& ex);
    Stage receive_headers(Exchange& ex);
    Stage receive_body(Exchange& ex);
    StepResult complete(Exchange& ex);
    Stage stale_retry(Exchange& ex);

    std::string build_header_block(const Exchange& ex);
    void send_body(Exchange& ex);
    bool parse_header_block(Exchange& ex, size_t header_end, size_t separator_len);
    void setup_body(Exchange& ex);
    bool body_complete(const Exchange& ex) const;
    void handle_received(Exchange& ex, const BufferChunk& chunk);
    void feed(Exchange& ex, const BufferChunk& chunk);
    void drain(Exchange& ex);
    void release_connection(Exchange& ex, bool reusable);
    bool can_retry_stale(const Exchange& ex) const;

    RequestConfig config_;
    HeaderMap headers_;
    CookieJar cookies_;
    ConnectionPool* pool_;
};

} // namespace conduit::net
