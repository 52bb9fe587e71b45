#pragma once
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace conduit::net {

struct Cookie {
    std::string name;
    std::string value;
    std::string domain;
    std::string path = "/";
    bool secure = false;
    bool http_only = false;
    int64_t expires_at = 0;  // epoch seconds; 0 for a session cookie
};

class CookieJar {
public:
    // Parse and store cookies from a Set-Cookie header value. Without a
    // Path attribute the cookie is scoped to the directory of request_path.
    void set_from_header(const std::string& header_value, const std::string& request_domain,
                         const std::string& request_path = "/");

    // Cookie header value for a request, empty when nothing matches
    std::string get_cookie_header(const std::string& domain, const std::string& path,
                                  bool is_secure) const;

    std::vector<Cookie> cookies() const;

    void clear();
    size_t size() const;

private:
    // Insert or replace by name and path; an expired cookie deletes.
    void store(Cookie cookie);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<Cookie>> cookies_;  // by domain

    static bool domain_matches(const std::string& cookie_domain, const std::string& request_domain);
    static bool path_matches(const std::string& cookie_path, const std::string& request_path);
};

} // namespace conduit::net
