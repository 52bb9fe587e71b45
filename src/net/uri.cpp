#include <conduit/net/uri.h>
#include <conduit/core/config.h>
#include <algorithm>
#include <cctype>

namespace conduit::net {

namespace {

constexpr char hex_digits[] = "0123456789ABCDEF";

bool is_unreserved(char c) {
    return (c >= 'A' && c <= 'Z') ||
           (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') ||
           c == '-' || c == '.' || c == '_' || c == '~';
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

std::string to_lower(std::string_view input) {
    std::string result(input);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool valid_scheme(std::string_view scheme) {
    if (scheme.empty() || !std::isalpha(static_cast<unsigned char>(scheme.front()))) {
        return false;
    }
    return std::all_of(scheme.begin(), scheme.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
    });
}

// Directory part of an absolute path, with the trailing slash.
std::string directory_of(const std::string& path) {
    const size_t slash = path.rfind('/');
    if (slash == std::string::npos) {
        return "/";
    }
    return path.substr(0, slash + 1);
}

} // anonymous namespace

std::string url_encode(std::string_view input) {
    std::string result;
    result.reserve(input.size());

    for (unsigned char c : input) {
        if (is_unreserved(static_cast<char>(c))) {
            result += static_cast<char>(c);
        } else {
            result += '%';
            result += hex_digits[(c >> 4) & 0xF];
            result += hex_digits[c & 0xF];
        }
    }
    return result;
}

std::string url_decode(std::string_view input) {
    std::string result;
    result.reserve(input.size());

    for (size_t i = 0; i < input.size(); ++i) {
        if (input[i] == '%' && i + 2 < input.size()) {
            int hi = hex_value(input[i + 1]);
            int lo = hex_value(input[i + 2]);
            if (hi >= 0 && lo >= 0) {
                result += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        result += input[i];
    }
    return result;
}

std::string encode_form(const QueryParams& params) {
    std::string result;
    for (const auto& [name, value] : params) {
        if (!result.empty()) {
            result += '&';
        }
        result += url_encode(name);
        result += '=';
        result += url_encode(value);
    }
    return result;
}

std::string normalize_path(const std::string& input) {
    if (input.empty()) {
        return "";
    }

    const bool absolute = input.front() == '/';
    const bool trailing_slash =
        input.size() > 1 &&
        (input.back() == '/' || input.ends_with("/.") || input.ends_with("/.."));

    std::vector<std::string> segments;
    size_t pos = 0;
    while (pos <= input.size()) {
        const size_t slash = input.find('/', pos);
        const std::string segment =
            (slash == std::string::npos) ? input.substr(pos) : input.substr(pos, slash - pos);

        if (!segment.empty() && segment != ".") {
            if (segment == "..") {
                if (!segments.empty() && segments.back() != "..") {
                    segments.pop_back();
                } else if (!absolute) {
                    segments.push_back(segment);
                }
            } else {
                segments.push_back(segment);
            }
        }

        if (slash == std::string::npos) {
            break;
        }
        pos = slash + 1;
    }

    std::string normalized = absolute ? "/" : "";
    for (const auto& segment : segments) {
        if (!normalized.empty() && normalized.back() != '/') {
            normalized += '/';
        }
        normalized += segment;
    }

    if (trailing_slash && !normalized.empty() && normalized.back() != '/') {
        normalized += '/';
    }
    return normalized;
}

// ---------------------------------------------------------------------------
// Uri
// ---------------------------------------------------------------------------

uint16_t Uri::default_port(const std::string& scheme) {
    if (scheme == "http") return 80;
    if (scheme == "https") return 443;
    if (scheme == "ftp") return core::config::kFtpDefaultPort;
    return 0;
}

std::optional<Uri> Uri::parse(std::string_view input) {
    // Trim surrounding whitespace
    while (!input.empty() && std::isspace(static_cast<unsigned char>(input.front()))) {
        input.remove_prefix(1);
    }
    while (!input.empty() && std::isspace(static_cast<unsigned char>(input.back()))) {
        input.remove_suffix(1);
    }

    const size_t scheme_end = input.find("://");
    if (scheme_end == std::string_view::npos || !valid_scheme(input.substr(0, scheme_end))) {
        return std::nullopt;
    }

    Uri uri;
    uri.scheme = to_lower(input.substr(0, scheme_end));
    std::string_view rest = input.substr(scheme_end + 3);

    if (const size_t hash = rest.find('#'); hash != std::string_view::npos) {
        uri.fragment = std::string(rest.substr(hash + 1));
        rest = rest.substr(0, hash);
    }

    const size_t authority_end = rest.find_first_of("/?");
    std::string_view authority = rest.substr(0, authority_end);
    std::string_view tail =
        authority_end == std::string_view::npos ? std::string_view{} : rest.substr(authority_end);

    if (const size_t at = authority.rfind('@'); at != std::string_view::npos) {
        std::string_view userinfo = authority.substr(0, at);
        authority = authority.substr(at + 1);
        const size_t colon = userinfo.find(':');
        uri.username = url_decode(userinfo.substr(0, colon));
        if (colon != std::string_view::npos) {
            uri.password = url_decode(userinfo.substr(colon + 1));
        }
    }

    std::string_view port_text;
    if (!authority.empty() && authority.front() == '[') {
        const size_t close = authority.find(']');
        if (close == std::string_view::npos) {
            return std::nullopt;
        }
        uri.host = to_lower(authority.substr(1, close - 1));
        std::string_view after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after.front() != ':') {
                return std::nullopt;
            }
            port_text = after.substr(1);
        }
    } else {
        const size_t colon = authority.rfind(':');
        uri.host = to_lower(authority.substr(0, colon));
        if (colon != std::string_view::npos) {
            port_text = authority.substr(colon + 1);
        }
    }
    if (uri.host.empty()) {
        return std::nullopt;
    }

    uri.port = default_port(uri.scheme);
    if (!port_text.empty()) {
        unsigned long value = 0;
        for (char c : port_text) {
            if (c < '0' || c > '9') {
                return std::nullopt;
            }
            value = value * 10 + static_cast<unsigned long>(c - '0');
            if (value > 65535UL) {
                return std::nullopt;
            }
        }
        uri.port = static_cast<uint16_t>(value);
    }

    const size_t question = tail.find('?');
    if (question != std::string_view::npos) {
        uri.query = std::string(tail.substr(question + 1));
        tail = tail.substr(0, question);
    }
    uri.path = tail.empty() ? "/" : std::string(tail);
    return uri;
}

std::optional<Uri> Uri::resolve(std::string_view reference) const {
    const size_t colon = reference.find(':');
    const size_t first_delim = reference.find_first_of("/?#");
    if (colon != std::string_view::npos && (first_delim == std::string_view::npos || colon < first_delim) &&
        valid_scheme(reference.substr(0, colon))) {
        return parse(reference);
    }
    if (reference.starts_with("//")) {
        return parse(scheme + ":" + std::string(reference));
    }

    Uri result = *this;
    result.fragment.clear();

    std::string_view ref = reference;
    if (const size_t hash = ref.find('#'); hash != std::string_view::npos) {
        result.fragment = std::string(ref.substr(hash + 1));
        ref = ref.substr(0, hash);
    }
    if (ref.empty()) {
        return result;
    }

    std::string_view ref_path = ref;
    std::optional<std::string> ref_query;
    if (const size_t question = ref.find('?'); question != std::string_view::npos) {
        ref_query = std::string(ref.substr(question + 1));
        ref_path = ref.substr(0, question);
    }

    if (ref_path.empty()) {
        result.query = ref_query.value_or(query);
        return result;
    }

    if (ref_path.front() == '/') {
        result.path = normalize_path(std::string(ref_path));
    } else {
        result.path = normalize_path(directory_of(path) + std::string(ref_path));
    }
    if (result.path.empty() || result.path.front() != '/') {
        result.path = "/" + result.path;
    }
    result.query = ref_query.value_or("");
    return result;
}

std::string Uri::path_and_query() const {
    std::string result = path.empty() ? "/" : path;
    if (!query.empty()) {
        result += '?';
        result += query;
    }
    return result;
}

std::string Uri::host_header() const {
    std::string result = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    if (!has_default_port()) {
        result += ':';
        result += std::to_string(port);
    }
    return result;
}

std::string Uri::to_string(bool with_credentials) const {
    std::string result = scheme + "://";
    if (with_credentials && !username.empty()) {
        result += url_encode(username);
        if (!password.empty()) {
            result += ':';
            result += url_encode(password);
        }
        result += '@';
    }
    result += host_header();
    result += path_and_query();
    if (!fragment.empty()) {
        result += '#';
        result += fragment;
    }
    return result;
}

} // namespace conduit::net
