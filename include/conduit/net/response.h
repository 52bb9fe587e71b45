#pragma once
#include <conduit/net/buffer.h>
#include <conduit/net/header_map.h>
#include <conduit/net/uri.h>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace conduit::net {

struct RedirectEntry {
    Uri uri;
    uint16_t status = 0;
};

struct Response {
    uint16_t status = 0;
    std::string status_text;
    std::string http_version;  // "HTTP/1.1"
    HeaderMap headers;
    Buffer body;
    Uri uri;                              // final URI, after redirects
    std::vector<RedirectEntry> history;   // earlier hops, oldest first

    std::string body_as_string() const { return body.to_string(); }

    bool is_redirect() const;
};

bool is_redirect_status(int status_code);

// "HTTP/1.1 200 OK" into version, status and reason. False when malformed.
bool parse_status_line(std::string_view line, Response& out);

// "Name: value" appended to headers. False when the line has no colon.
bool parse_header_line(std::string_view line, HeaderMap& headers);

} // namespace conduit::net
