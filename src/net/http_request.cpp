#include <conduit/net/http_request.h>
#include <conduit/net/decode_chunked.h>
#include <conduit/net/decompressor.h>
#include <conduit/net/errors.h>
#include <conduit/core/diagnostics.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <system_error>
#include <vector>

namespace conduit::net {

namespace {

std::string to_lower(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) s.remove_suffix(1);
    return s;
}

// Comma-separated header value contains token (case-insensitive)
bool has_token(const std::string& value, std::string_view token) {
    std::string_view rest = value;
    while (!rest.empty()) {
        const auto comma = rest.find(',');
        if (to_lower(trim(rest.substr(0, comma))) == token) {
            return true;
        }
        if (comma == std::string_view::npos) break;
        rest.remove_prefix(comma + 1);
    }
    return false;
}

// Position of the blank line ending a header block. Accepts bare LF line
// endings as well.
bool find_header_end(const std::string& data, size_t& end, size_t& separator_len) {
    const auto crlf = data.find("\r\n\r\n");
    const auto lf = data.find("\n\n");
    if (crlf == std::string::npos && lf == std::string::npos) {
        return false;
    }
    if (lf != std::string::npos && (crlf == std::string::npos || lf < crlf)) {
        end = lf;
        separator_len = 2;
    } else {
        end = crlf;
        separator_len = 4;
    }
    return true;
}

void print_lines(std::string_view text, const char* prefix) {
    while (!text.empty()) {
        const auto nl = text.find('\n');
        std::string_view line = trim(text.substr(0, nl));
        if (!line.empty()) {
            std::cout << prefix << line << "\n";
        }
        if (nl == std::string_view::npos) break;
        text.remove_prefix(nl + 1);
    }
    std::cout.flush();
}

bool same_origin(const Uri& a, const Uri& b) {
    return a.scheme == b.scheme && a.host == b.host && a.port == b.port;
}

} // anonymous namespace

std::string method_to_string(Method method) {
    switch (method) {
        case Method::GET:           return "GET";
        case Method::POST:          return "POST";
        case Method::PUT:           return "PUT";
        case Method::DELETE_METHOD: return "DELETE";
        case Method::HEAD:          return "HEAD";
        case Method::OPTIONS:       return "OPTIONS";
        case Method::PATCH:         return "PATCH";
    }
    return "GET";
}

Method string_to_method(const std::string& str) {
    std::string upper = str;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "GET")     return Method::GET;
    if (upper == "POST")    return Method::POST;
    if (upper == "PUT")     return Method::PUT;
    if (upper == "DELETE")  return Method::DELETE_METHOD;
    if (upper == "HEAD")    return Method::HEAD;
    if (upper == "OPTIONS") return Method::OPTIONS;
    if (upper == "PATCH")   return Method::PATCH;

    throw RequestException("Unsupported HTTP method: " + str);
}

HttpRequest::HttpRequest(RequestConfig config)
    : config_(std::move(config)), pool_(&ConnectionPool::shared()) {}

// ---------------------------------------------------------------------------
// Public entry points
// ---------------------------------------------------------------------------

Response HttpRequest::get(const std::string& uri, const QueryParams& params) {
    if (params.empty()) {
        return exec(Method::GET, uri);
    }
    auto parsed = Uri::parse(uri);
    if (!parsed) {
        throw RequestException("Can't parse URI: " + uri);
    }
    const std::string encoded = encode_form(params);
    parsed->query = parsed->query.empty() ? encoded : parsed->query + "&" + encoded;
    return exec(Method::GET, parsed->to_string());
}

Response HttpRequest::post(const std::string& uri, const std::string& data,
                           const std::string& content_type) {
    return exec(Method::POST, uri, body_from_string(data), content_type);
}

Response HttpRequest::post(const std::string& uri, std::unique_ptr<BodySource> body,
                           const std::string& content_type) {
    return exec(Method::POST, uri, std::move(body), content_type);
}

Response HttpRequest::post(const std::string& uri, const QueryParams& form) {
    return exec(Method::POST, uri, body_from_string(encode_form(form)),
                "application/x-www-form-urlencoded");
}

Response HttpRequest::exec(Method method, const std::string& uri, const std::string& data,
                           const std::string& content_type) {
    return exec(method, uri, body_from_string(data), content_type);
}

Response HttpRequest::exec(Method method, const std::string& uri,
                           std::unique_ptr<BodySource> body, const std::string& content_type) {
    auto parsed = Uri::parse(uri);
    if (!parsed) {
        throw RequestException("Can't parse URI: " + uri);
    }
    if (parsed->scheme != "http" && parsed->scheme != "https") {
        throw RequestException("Unsupported scheme for an HTTP request: " + parsed->scheme);
    }

    Exchange ex;
    ex.config = config_;
    if (ex.config.buffer_size == 0) {
        ex.config.buffer_size = core::config::kDefaultBufferSize;
    }
    if (!ex.config.authenticator && !parsed->username.empty()) {
        ex.config.authenticator =
            std::make_shared<BasicAuthentication>(parsed->username, parsed->password);
    }
    // Credentials live in the authenticator from here on; the URI is logged
    // and ends up in the response history.
    parsed->username.clear();
    parsed->password.clear();
    ex.user_headers = headers_;
    ex.method = method;
    ex.uri = std::move(*parsed);
    ex.body = std::move(body);
    ex.content_type = content_type;

    core::DiagnosticEmitter::shared().debug("http", "request",
                                            method_to_string(method) + " " + ex.uri.to_string(false));
    return run(ex);
}

// ---------------------------------------------------------------------------
// State machine driver
// ---------------------------------------------------------------------------

Response HttpRequest::run(Exchange& ex) {
    Stage stage = Stage::Connect;
    while (true) {
        StepResult result = step(ex, stage);
        if (auto* next = std::get_if<Continue>(&result)) {
            stage = next->next;
            continue;
        }
        if (auto* done = std::get_if<Done>(&result)) {
            return std::move(done->response);
        }
        if (ex.stream) {
            ex.stream->close();
            ex.stream.reset();
        }
        std::rethrow_exception(std::get<Fail>(result).error);
    }
}

HttpRequest::StepResult HttpRequest::step(Exchange& ex, Stage stage) {
    try {
        switch (stage) {
            case Stage::Connect:        return Continue{connect(ex)};
            case Stage::Send:           return Continue{send(ex)};
            case Stage::ReceiveHeaders: return Continue{receive_headers(ex)};
            case Stage::ReceiveBody:    return Continue{receive_body(ex)};
            case Stage::Complete:       return complete(ex);
            case Stage::StaleRetry:     return Continue{stale_retry(ex)};
        }
        throw std::logic_error("unknown request stage");
    } catch (...) {
        return Fail{std::current_exception()};
    }
}

// ---------------------------------------------------------------------------
// Stages
// ---------------------------------------------------------------------------

HttpRequest::Stage HttpRequest::connect(Exchange& ex) {
    const bool tls = ex.uri.scheme == "https";
    ex.pool_key = ConnectionPool::make_key(ex.uri.scheme, ex.uri.host, ex.uri.port,
                                           tls ? ex.config.tls.fingerprint() : std::string());
    ex.reused = false;
    ex.stream.reset();

    if (ex.config.keep_alive && !ex.force_fresh) {
        ex.stream = pool_->checkout(ex.pool_key);
        ex.reused = ex.stream != nullptr;
    }
    ex.force_fresh = false;

    if (!ex.stream) {
        ex.stream = make_stream(ex.uri.scheme, ex.config.tls);
        ex.stream->connect(ex.uri.host, ex.uri.port, ex.config.timeout);
    }
    ex.stream->set_read_timeout(ex.config.timeout);
    return Stage::Send;
}

HttpRequest::Stage HttpRequest::send(Exchange& ex) {
    ex.got_response_bytes = false;
    const std::string head = build_header_block(ex);
    if (ex.config.verbosity >= 1) {
        print_lines(head, "> ");
    }

    try {
        ex.stream->send(head);
        send_body(ex);
    } catch (const NetworkException& e) {
        if (!can_retry_stale(ex)) {
            throw;
        }
        core::DiagnosticEmitter::shared().warning("http", "send",
                                                  "reused connection failed: " + std::string(e.what()));
        return Stage::StaleRetry;
    }
    return Stage::ReceiveHeaders;
}

HttpRequest::Stage HttpRequest::receive_headers(Exchange& ex) {
    ex.response = Response{};
    ex.pipe.reset();
    ex.dechunk = nullptr;
    ex.header_bytes.clear();
    std::vector<uint8_t> buf(ex.config.buffer_size);

    const size_t max_headers = ex.config.max_headers_length;
    while (true) {
        size_t end = 0;
        size_t separator_len = 0;
        if (find_header_end(ex.header_bytes, end, separator_len)) {
            if (max_headers != 0 && end > max_headers) {
                throw RequestException("Response headers too long (limit " +
                                       std::to_string(max_headers) + " bytes)");
            }
            if (parse_header_block(ex, end, separator_len)) {
                break;
            }
            continue;  // interim 1xx response; the rest is already in header_bytes
        }
        if (max_headers != 0 && ex.header_bytes.size() > max_headers) {
            throw RequestException("Response headers too long (limit " +
                                   std::to_string(max_headers) + " bytes)");
        }

        size_t n = 0;
        try {
            n = ex.stream->receive(buf.data(), buf.size());
        } catch (const NetworkException& e) {
            if (!can_retry_stale(ex)) {
                throw;
            }
            core::DiagnosticEmitter::shared().warning("http", "receive",
                                                      "reused connection failed: " + std::string(e.what()));
            return Stage::StaleRetry;
        }
        if (n == 0) {
            if (can_retry_stale(ex)) {
                core::DiagnosticEmitter::shared().warning("http", "receive",
                                                          "reused connection closed by server");
                return Stage::StaleRetry;
            }
            throw NetworkException("Server closed the connection before the response headers were complete");
        }
        ex.got_response_bytes = true;
        ex.header_bytes.append(reinterpret_cast<const char*>(buf.data()), n);
    }

    setup_body(ex);
    return Stage::ReceiveBody;
}

HttpRequest::Stage HttpRequest::receive_body(Exchange& ex) {
    for (const auto& chunk : ex.pending.chunks()) {
        handle_received(ex, chunk);
    }
    ex.pending.clear();

    std::vector<uint8_t> buf(ex.config.buffer_size);
    bool peer_closed = false;
    while (!body_complete(ex)) {
        const size_t n = ex.stream->receive(buf.data(), buf.size());
        if (n == 0) {
            if (ex.framing == Framing::UntilClose) {
                peer_closed = true;
                break;
            }
            throw NetworkException("Server closed the connection before the response body was complete");
        }
        handle_received(ex, BufferChunk(buf.data(), n));
        if (ex.config.verbosity >= 2) {
            std::cout << "< " << ex.response.body.length() << " bytes of body received\n";
            std::cout.flush();
        }
    }

    ex.pipe->flush();
    drain(ex);

    if (ex.dechunk && ex.dechunk->excess_bytes() > 0) {
        ex.clean = false;
    }

    const auto connection = ex.response.headers.get("Connection");
    bool keep = ex.config.keep_alive && ex.clean && !peer_closed && ex.framing != Framing::UntilClose;
    if (connection && has_token(*connection, "close")) {
        keep = false;
    }
    if (ex.response.http_version == "HTTP/1.0" && !(connection && has_token(*connection, "keep-alive"))) {
        keep = false;
    }
    ex.reusable = keep && ex.stream && ex.stream->is_connected();
    return Stage::Complete;
}

HttpRequest::StepResult HttpRequest::complete(Exchange& ex) {
    Response& resp = ex.response;
    auto& log = core::DiagnosticEmitter::shared();

    if (resp.status == 401 && ex.config.authenticator && !ex.auth_attempted) {
        ex.auth_attempted = true;
        if (!ex.body || !ex.body_started || ex.body->rewind()) {
            ex.auth_headers = ex.config.authenticator->auth_headers(ex.uri.host);
            log.info("http", "auth", "retrying " + ex.uri.to_string() + " with credentials");
            if (ex.reusable) {
                ex.reused = true;
                return Continue{Stage::Send};
            }
            release_connection(ex, false);
            return Continue{Stage::Connect};
        }
    }

    const auto location = resp.headers.get("Location");
    if (resp.is_redirect() && location && ex.history.size() < ex.config.max_redirects) {
        auto target = ex.uri.resolve(*location);
        if (!target) {
            throw RequestException("Can't resolve redirect location: " + *location);
        }
        if (target->scheme != "http" && target->scheme != "https") {
            throw RequestException("Redirect to unsupported scheme: " + target->to_string(false));
        }
        target->username.clear();
        target->password.clear();

        Method next_method = ex.method;
        if (resp.status == 303 && ex.method != Method::HEAD) {
            next_method = Method::GET;
        }
        if ((resp.status == 301 || resp.status == 302) && ex.method == Method::POST &&
            !ex.config.strict_redirects) {
            next_method = Method::GET;
        }
        const bool drop_body = next_method == Method::GET || next_method == Method::HEAD;
        const bool body_ok = drop_body || !ex.body || !ex.body_started || ex.body->rewind();

        if (body_ok) {
            release_connection(ex, ex.reusable);
            ex.history.push_back(RedirectEntry{ex.uri, resp.status});
            log.info("http", "redirect",
                     std::to_string(resp.status) + " " + ex.uri.to_string(false) + " -> " +
                         target->to_string(false));

            if (!same_origin(ex.uri, *target)) {
                ex.auth_headers.clear();
            }
            if (drop_body) {
                ex.body.reset();
                ex.content_type.clear();
                ex.body_started = false;
            }
            ex.method = next_method;
            ex.uri = std::move(*target);
            return Continue{Stage::Connect};
        }
        log.warning("http", "redirect", "request body can't be resent; returning " +
                                            std::to_string(resp.status));
    }

    release_connection(ex, ex.reusable);
    resp.uri = ex.uri;
    resp.history = std::move(ex.history);
    return Done{std::move(resp)};
}

HttpRequest::Stage HttpRequest::stale_retry(Exchange& ex) {
    ex.stale_retried = true;
    if (ex.stream) {
        ex.stream->close();
        ex.stream.reset();
    }
    if (ex.body && ex.body_started && !ex.body->rewind()) {
        throw NetworkException("Connection to " + ex.uri.host_header() +
                               " was lost and the request body can't be resent");
    }
    ex.force_fresh = true;
    return Stage::Connect;
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

bool HttpRequest::can_retry_stale(const Exchange& ex) const {
    return ex.reused && !ex.stale_retried && !ex.got_response_bytes;
}

std::string HttpRequest::build_header_block(const Exchange& ex) {
    std::ostringstream oss;

    oss << method_to_string(ex.method) << " " << ex.uri.path_and_query() << " HTTP/1.1\r\n";
    oss << "Host: " << ex.uri.host_header() << "\r\n";

    if (!ex.user_headers.has("User-Agent")) {
        oss << "User-Agent: " << ex.config.user_agent << "\r\n";
    }
    if (!ex.user_headers.has("Accept-Encoding")) {
        oss << "Accept-Encoding: gzip, deflate\r\n";
    }
    if (!ex.user_headers.has("Connection")) {
        oss << "Connection: " << (ex.config.keep_alive ? "keep-alive" : "close") << "\r\n";
    }

    const std::string cookie = cookies_.get_cookie_header(ex.uri.host, ex.uri.path,
                                                          ex.uri.scheme == "https");
    if (!cookie.empty() && !ex.user_headers.has("Cookie")) {
        oss << "Cookie: " << cookie << "\r\n";
    }

    for (const auto& [name, value] : ex.user_headers) {
        // Framing and the target host are ours to set
        if (HeaderMap::name_equals(name, "Host") || HeaderMap::name_equals(name, "Content-Length") ||
            HeaderMap::name_equals(name, "Transfer-Encoding") || ex.auth_headers.has(name)) {
            continue;
        }
        oss << name << ": " << value << "\r\n";
    }
    for (const auto& [name, value] : ex.auth_headers) {
        oss << name << ": " << value << "\r\n";
    }

    if (ex.body) {
        if (!ex.content_type.empty() && !ex.user_headers.has("Content-Type")) {
            oss << "Content-Type: " << ex.content_type << "\r\n";
        }
        if (auto length = ex.body->length()) {
            oss << "Content-Length: " << *length << "\r\n";
        } else {
            oss << "Transfer-Encoding: chunked\r\n";
        }
    } else if (ex.method == Method::POST || ex.method == Method::PUT || ex.method == Method::PATCH) {
        oss << "Content-Length: 0\r\n";
    }

    oss << "\r\n";
    return oss.str();
}

void HttpRequest::send_body(Exchange& ex) {
    if (!ex.body) {
        return;
    }
    if (ex.body_started && !ex.body->rewind()) {
        throw RequestException("Request body can't be sent again");
    }
    ex.body_started = true;

    const auto declared = ex.body->length();
    size_t sent = 0;
    while (auto chunk = ex.body->next_chunk()) {
        if (chunk->empty()) {
            continue;
        }
        if (!declared) {
            char size_line[32];
            char* ptr = std::to_chars(size_line, size_line + sizeof(size_line) - 2, chunk->size(), 16).ptr;
            *ptr++ = '\r';
            *ptr++ = '\n';
            ex.stream->send(reinterpret_cast<const uint8_t*>(size_line), static_cast<size_t>(ptr - size_line));
            ex.stream->send(chunk->data(), chunk->size());
            ex.stream->send("\r\n");
        } else {
            ex.stream->send(chunk->data(), chunk->size());
        }
        sent += chunk->size();
        if (ex.config.verbosity >= 2) {
            std::cout << "> " << sent << " bytes of body sent\n";
            std::cout.flush();
        }
    }

    if (!declared) {
        ex.stream->send("0\r\n\r\n");
    } else if (sent != *declared) {
        throw RequestException("Request body is " + std::to_string(sent) + " bytes, declared " +
                               std::to_string(*declared));
    }
}

bool HttpRequest::parse_header_block(Exchange& ex, size_t header_end, size_t separator_len) {
    const std::string block = ex.header_bytes.substr(0, header_end);
    std::string leftover = ex.header_bytes.substr(header_end + separator_len);

    if (ex.config.verbosity >= 1) {
        print_lines(block, "< ");
    }

    Response resp;
    std::string_view rest = block;
    bool first = true;
    while (!rest.empty()) {
        const auto nl = rest.find('\n');
        std::string_view line = rest.substr(0, nl);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        if (first) {
            if (!parse_status_line(line, resp)) {
                throw NetworkException("Can't parse status line: " + std::string(line));
            }
            first = false;
        } else if (!line.empty()) {
            parse_header_line(line, resp.headers);
        }
        if (nl == std::string_view::npos) break;
        rest.remove_prefix(nl + 1);
    }
    if (first) {
        throw NetworkException("Empty response header block");
    }

    if (resp.status >= 100 && resp.status < 200 && resp.status != 101) {
        core::DiagnosticEmitter::shared().debug("http", "headers",
                                                "skipping interim " + std::to_string(resp.status));
        ex.header_bytes = std::move(leftover);
        return false;
    }

    for (const auto& value : resp.headers.get_all("Set-Cookie")) {
        cookies_.set_from_header(value, ex.uri.host, ex.uri.path);
    }

    ex.response = std::move(resp);
    ex.header_bytes.clear();
    ex.pending.clear();
    if (!leftover.empty()) {
        ex.pending.put(leftover);
    }
    return true;
}

void HttpRequest::setup_body(Exchange& ex) {
    const Response& resp = ex.response;
    ex.pipe = std::make_unique<DataPipe>();
    ex.dechunk = nullptr;
    ex.remaining = 0;
    ex.clean = true;

    if (ex.method == Method::HEAD || resp.status == 204 || resp.status == 304 ||
        (resp.status >= 100 && resp.status < 200)) {
        ex.framing = Framing::None;
        return;
    }

    const auto transfer_encoding = resp.headers.get("Transfer-Encoding");
    const auto content_encoding = resp.headers.get("Content-Encoding");
    const auto content_length = resp.headers.get("Content-Length");

    if (transfer_encoding && has_token(*transfer_encoding, "chunked")) {
        auto stage = std::make_unique<DecodeChunked>();
        ex.dechunk = stage.get();
        ex.pipe->insert(std::move(stage));
        ex.framing = Framing::Chunked;
    } else if (content_length) {
        const std::string_view text = trim(*content_length);
        size_t value = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc{} || ptr != text.data() + text.size()) {
            throw NetworkException("Invalid Content-Length: " + *content_length);
        }
        ex.framing = Framing::Length;
        ex.remaining = value;
        const size_t limit = ex.config.max_content_length;
        if (!content_encoding && limit != 0 && value > limit) {
            throw RequestException("ContentLength " + std::to_string(value) +
                                   " exceeds max_content_length " + std::to_string(limit));
        }
    } else {
        ex.framing = Framing::UntilClose;
    }

    if (content_encoding) {
        const std::string encoding = to_lower(trim(*content_encoding));
        const size_t limit = ex.config.max_content_length;
        if (encoding == "gzip" || encoding == "x-gzip") {
            ex.pipe->insert(std::make_unique<Decompressor>(Decompressor::Format::Auto, limit));
        } else if (encoding == "deflate") {
            ex.pipe->insert(std::make_unique<Decompressor>(Decompressor::Format::Deflate, limit));
        } else if (encoding != "identity") {
            core::DiagnosticEmitter::shared().warning("http", "headers",
                                                      "unsupported Content-Encoding passed through: " + encoding);
        }
    }
}

bool HttpRequest::body_complete(const Exchange& ex) const {
    switch (ex.framing) {
        case Framing::None:       return true;
        case Framing::Length:     return ex.remaining == 0;
        case Framing::Chunked:    return ex.dechunk->done();
        case Framing::UntilClose: return false;
    }
    return true;
}

void HttpRequest::handle_received(Exchange& ex, const BufferChunk& chunk) {
    switch (ex.framing) {
        case Framing::None:
            // Bytes after a bodiless response: the connection is out of step
            ex.clean = false;
            return;
        case Framing::Length: {
            const size_t take = std::min(ex.remaining, chunk.size());
            if (take < chunk.size()) {
                ex.clean = false;
            }
            ex.remaining -= take;
            feed(ex, chunk.slice(0, take));
            return;
        }
        case Framing::Chunked:
            if (ex.dechunk->done()) {
                ex.clean = false;
                return;
            }
            feed(ex, chunk);
            return;
        case Framing::UntilClose:
            feed(ex, chunk);
            return;
    }
}

void HttpRequest::feed(Exchange& ex, const BufferChunk& chunk) {
    ex.pipe->put(chunk);
    drain(ex);
}

void HttpRequest::drain(Exchange& ex) {
    for (auto& chunk : ex.pipe->get_chunks()) {
        ex.response.body.put(std::move(chunk));
    }
    const size_t limit = ex.config.max_content_length;
    if (limit != 0 && ex.response.body.length() > limit) {
        throw RequestException("ContentLength > max_content_length (" + std::to_string(limit) + ")");
    }
}

void HttpRequest::release_connection(Exchange& ex, bool reusable) {
    if (!ex.stream) {
        return;
    }
    if (reusable && ex.config.keep_alive) {
        pool_->checkin(ex.pool_key, std::move(ex.stream));
    } else {
        ex.stream->close();
    }
    ex.stream.reset();
}

} // namespace conduit::net
