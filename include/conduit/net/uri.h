#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace conduit::net {

struct Uri {
    std::string scheme;    // lower-case
    std::string username;  // percent-decoded
    std::string password;  // percent-decoded
    std::string host;      // lower-case, IPv6 without brackets
    uint16_t port = 0;     // scheme default when the URI has none
    std::string path = "/";
    std::string query;     // without '?'
    std::string fragment;  // without '#'

    // Absolute URI with an authority ("scheme://[user[:pass]@]host[:port]/...").
    static std::optional<Uri> parse(std::string_view input);

    // RFC 3986 reference resolution against this URI.
    std::optional<Uri> resolve(std::string_view reference) const;

    static uint16_t default_port(const std::string& scheme);
    bool has_default_port() const { return port == default_port(scheme); }

    // "/path?query", as sent on an HTTP request line
    std::string path_and_query() const;
    // host[:port], the port only when it is not the default
    std::string host_header() const;
    // Without with_credentials the userinfo is left out; use that form for
    // anything that is logged.
    std::string to_string(bool with_credentials = true) const;
};

using QueryParams = std::vector<std::pair<std::string, std::string>>;

// Percent-encode everything outside the RFC 3986 unreserved set.
std::string url_encode(std::string_view input);
std::string url_decode(std::string_view input);

// application/x-www-form-urlencoded: "k1=v1&k2=v2" with url_encode'd parts.
std::string encode_form(const QueryParams& params);

// Remove "." and ".." segments.
std::string normalize_path(const std::string& input);

} // namespace conduit::net
