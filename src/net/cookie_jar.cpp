#include <conduit/net/cookie_jar.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <ctime>
#include <string_view>
#include <system_error>
#include <utility>

namespace conduit::net {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

std::string to_lower(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

// "name=value" split at the first '='; value empty when there is none.
std::pair<std::string_view, std::string_view> split_pair(std::string_view item) {
    const auto eq = item.find('=');
    if (eq == std::string_view::npos) {
        return {trim(item), {}};
    }
    return {trim(item.substr(0, eq)), trim(item.substr(eq + 1))};
}

std::string default_path(const std::string& request_path) {
    if (request_path.empty() || request_path.front() != '/') {
        return "/";
    }
    const auto slash = request_path.rfind('/');
    if (slash == 0) {
        return "/";
    }
    return request_path.substr(0, slash);
}

int64_t now_seconds() {
    return static_cast<int64_t>(std::time(nullptr));
}

// HTTP date, "Thu, 01 Dec 2025 00:00:00 GMT". 0 when unparsable.
int64_t parse_http_date(const std::string& text) {
    std::tm tm{};
    if (!strptime(text.c_str(), "%a, %d %b %Y %H:%M:%S", &tm)) {
        return 0;
    }
    return static_cast<int64_t>(timegm(&tm));
}

} // anonymous namespace

void CookieJar::set_from_header(const std::string& header_value,
                                const std::string& request_domain,
                                const std::string& request_path) {
    std::string_view rest = header_value;
    auto next_item = [&rest]() {
        const auto semi = rest.find(';');
        std::string_view item = rest.substr(0, semi);
        rest = semi == std::string_view::npos ? std::string_view{} : rest.substr(semi + 1);
        return item;
    };

    const std::string_view first = next_item();
    if (first.find('=') == std::string_view::npos) {
        return;
    }
    const auto [name, value] = split_pair(first);
    if (name.empty()) {
        return;
    }

    Cookie cookie;
    cookie.name = std::string(name);
    cookie.value = std::string(value);
    cookie.domain = to_lower(request_domain);
    cookie.path = default_path(request_path);

    bool has_max_age = false;
    while (!rest.empty()) {
        const auto [attr, attr_value] = split_pair(next_item());
        const std::string key = to_lower(attr);

        if (key == "domain") {
            std::string domain = to_lower(attr_value);
            if (!domain.empty() && domain.front() == '.') {
                domain.erase(0, 1);
            }
            // Only a parent of the request host (or the host itself)
            if (!domain.empty() && domain_matches(domain, cookie.domain)) {
                cookie.domain = std::move(domain);
            }
        } else if (key == "path") {
            if (!attr_value.empty() && attr_value.front() == '/') {
                cookie.path = std::string(attr_value);
            }
        } else if (key == "secure") {
            cookie.secure = true;
        } else if (key == "httponly") {
            cookie.http_only = true;
        } else if (key == "max-age") {
            int64_t seconds = 0;
            auto [ptr, ec] = std::from_chars(attr_value.data(), attr_value.data() + attr_value.size(), seconds);
            if (ec == std::errc{} && ptr == attr_value.data() + attr_value.size()) {
                cookie.expires_at = seconds <= 0 ? 1 : now_seconds() + seconds;
                has_max_age = true;
            }
        } else if (key == "expires" && !has_max_age) {
            // Max-Age wins over Expires wherever it appears
            cookie.expires_at = parse_http_date(std::string(attr_value));
        }
    }

    store(std::move(cookie));
}

void CookieJar::store(Cookie cookie) {
    const bool expired = cookie.expires_at > 0 && cookie.expires_at <= now_seconds();

    std::lock_guard<std::mutex> lock(mutex_);
    auto& list = cookies_[cookie.domain];
    auto it = std::find_if(list.begin(), list.end(), [&](const Cookie& c) {
        return c.name == cookie.name && c.path == cookie.path;
    });

    if (expired) {
        // A past expiry deletes the stored cookie of that name
        if (it != list.end()) {
            list.erase(it);
        }
        if (list.empty()) {
            cookies_.erase(cookie.domain);
        }
    } else if (it != list.end()) {
        *it = std::move(cookie);
    } else {
        list.push_back(std::move(cookie));
    }
}

std::string CookieJar::get_cookie_header(const std::string& domain, const std::string& path,
                                         bool is_secure) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string result;
    const std::string domain_lower = to_lower(domain);
    const int64_t now = now_seconds();

    for (const auto& [cookie_domain, domain_cookies] : cookies_) {
        if (!domain_matches(cookie_domain, domain_lower)) continue;

        for (const auto& cookie : domain_cookies) {
            if (!path_matches(cookie.path, path)) continue;
            if (cookie.secure && !is_secure) continue;
            if (cookie.expires_at > 0 && cookie.expires_at <= now) continue;

            if (!result.empty()) result += "; ";
            result += cookie.name + "=" + cookie.value;
        }
    }
    return result;
}

std::vector<Cookie> CookieJar::cookies() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Cookie> result;
    for (const auto& [_, domain_cookies] : cookies_) {
        result.insert(result.end(), domain_cookies.begin(), domain_cookies.end());
    }
    return result;
}

void CookieJar::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    cookies_.clear();
}

size_t CookieJar::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& [_, domain_cookies] : cookies_) {
        count += domain_cookies.size();
    }
    return count;
}

bool CookieJar::domain_matches(const std::string& cookie_domain,
                               const std::string& request_domain) {
    if (cookie_domain == request_domain) return true;
    // request_domain ends with .cookie_domain
    if (request_domain.size() > cookie_domain.size()) {
        auto pos = request_domain.size() - cookie_domain.size();
        if (request_domain[pos - 1] == '.' &&
            request_domain.compare(pos, std::string::npos, cookie_domain) == 0) {
            return true;
        }
    }
    return false;
}

bool CookieJar::path_matches(const std::string& cookie_path,
                             const std::string& request_path) {
    if (cookie_path == "/" || cookie_path == request_path) return true;
    if (request_path.rfind(cookie_path, 0) != 0) return false;
    // "/docs" matches "/docs/x" but not "/docsx"
    return cookie_path.back() == '/' || request_path[cookie_path.size()] == '/';
}

} // namespace conduit::net
