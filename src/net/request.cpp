#include <conduit/net/request.h>
#include <conduit/net/errors.h>

namespace conduit::net {

Request::Request(RequestConfig config) : config_(std::move(config)) {}

Request::Route Request::route(const std::string& uri) {
    auto parsed = Uri::parse(uri);
    if (!parsed) {
        throw RequestException("Can't parse URI: " + uri);
    }
    if (parsed->scheme == "http" || parsed->scheme == "https") {
        http_.config() = config_;
        return Route::Http;
    }
    if (parsed->scheme == "ftp") {
        ftp_.config() = config_;
        return Route::Ftp;
    }
    throw RequestException("Unsupported scheme: " + parsed->scheme);
}

Response Request::get(const std::string& uri, const QueryParams& params) {
    if (route(uri) == Route::Http) {
        return http_.get(uri, params);
    }
    if (!params.empty()) {
        throw RequestException("Operation not supported for ftp: query parameters");
    }
    return ftp_.get(uri);
}

Response Request::post(const std::string& uri, const std::string& data,
                       const std::string& content_type) {
    if (route(uri) == Route::Http) {
        return http_.post(uri, data, content_type);
    }
    return ftp_.post(uri, data);
}

Response Request::post(const std::string& uri, std::unique_ptr<BodySource> body,
                       const std::string& content_type) {
    if (route(uri) == Route::Http) {
        return http_.post(uri, std::move(body), content_type);
    }
    return ftp_.post(uri, std::move(body));
}

Response Request::post(const std::string& uri, const QueryParams& form) {
    if (route(uri) == Route::Http) {
        return http_.post(uri, form);
    }
    throw RequestException("Operation not supported for ftp: form post");
}

Response Request::exec(Method method, const std::string& uri,
                       std::unique_ptr<BodySource> body, const std::string& content_type) {
    if (route(uri) == Route::Http) {
        return http_.exec(method, uri, std::move(body), content_type);
    }
    switch (method) {
        case Method::GET:
            if (body) {
                throw RequestException("Operation not supported for ftp: GET with a body");
            }
            return ftp_.get(uri);
        case Method::POST:
            return ftp_.post(uri, std::move(body));
        default:
            throw RequestException("Operation not supported for ftp: " + method_to_string(method));
    }
}

Buffer get_content(const std::string& uri) {
    Request request;
    return std::move(request.get(uri).body);
}

Buffer post_content(const std::string& uri, const std::string& data, const std::string& content_type) {
    Request request;
    return std::move(request.post(uri, data, content_type).body);
}

} // namespace conduit::net
