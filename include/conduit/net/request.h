#pragma once
#include <conduit/net/buffer.h>
#include <conduit/net/ftp_request.h>
#include <conduit/net/http_request.h>
#include <memory>
#include <string>

namespace conduit::net {

// Routes get/post/exec to the HTTP or FTP engine by URI scheme. Options
// set through config() apply to both.
class Request {
public:
    explicit Request(RequestConfig config = {});

    RequestConfig& config() { return config_; }
    const RequestConfig& config() const { return config_; }

    // HTTP only
    HeaderMap& headers() { return http_.headers(); }
    CookieJar& cookies() { return http_.cookies(); }
    void set_pool(ConnectionPool& pool) { http_.set_pool(pool); }

    Response get(const std::string& uri, const QueryParams& params = {});
    Response post(const std::string& uri, const std::string& data,
                  const std::string& content_type = "application/octet-stream");
    Response post(const std::string& uri, std::unique_ptr<BodySource> body,
                  const std::string& content_type = "application/octet-stream");
    Response post(const std::string& uri, const QueryParams& form);
    Response exec(Method method, const std::string& uri,
                  std::unique_ptr<BodySource> body = nullptr,
                  const std::string& content_type = {});

    HttpRequest& http() { return http_; }
    FtpRequest& ftp() { return ftp_; }

private:
    enum class Route {
        Http,
        Ftp,
    };

    Route route(const std::string& uri);

    RequestConfig config_;
    HttpRequest http_;
    FtpRequest ftp_;
};

// One-shot helpers on a default Request; the body of the response.
Buffer get_content(const std::string& uri);
Buffer post_content(const std::string& uri, const std::string& data,
                    const std::string& content_type = "application/octet-stream");

} // namespace conduit::net
