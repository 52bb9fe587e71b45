#include <conduit/net/response.h>
#include <charconv>
#include <system_error>

namespace conduit::net {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) s.remove_suffix(1);
    return s;
}

} // anonymous namespace

bool is_redirect_status(int status_code) {
    switch (status_code) {
        case 301:
        case 302:
        case 303:
        case 307:
        case 308:
            return true;
        default:
            return false;
    }
}

bool Response::is_redirect() const {
    return is_redirect_status(status);
}

bool parse_status_line(std::string_view line, Response& out) {
    line = trim(line);
    if (line.substr(0, 5) != "HTTP/") {
        return false;
    }

    const auto sp1 = line.find(' ');
    if (sp1 == std::string_view::npos) {
        return false;
    }
    std::string_view code_part = line.substr(sp1 + 1);
    const auto sp2 = code_part.find(' ');
    std::string_view reason;
    if (sp2 != std::string_view::npos) {
        reason = trim(code_part.substr(sp2 + 1));
        code_part = code_part.substr(0, sp2);
    }

    unsigned code = 0;
    auto [ptr, ec] = std::from_chars(code_part.data(), code_part.data() + code_part.size(), code);
    if (ec != std::errc{} || ptr != code_part.data() + code_part.size() || code < 100 || code > 999) {
        return false;
    }

    out.http_version = std::string(line.substr(0, sp1));
    out.status = static_cast<uint16_t>(code);
    out.status_text = std::string(reason);
    return true;
}

bool parse_header_line(std::string_view line, HeaderMap& headers) {
    const auto colon = line.find(':');
    if (colon == std::string_view::npos || colon == 0) {
        return false;
    }
    headers.append(std::string(trim(line.substr(0, colon))),
                   std::string(trim(line.substr(colon + 1))));
    return true;
}

} // namespace conduit::net
