#include <conduit/net/auth.h>

#include <openssl/evp.h>

#include <utility>
#include <vector>

namespace conduit::net {

std::string base64_encode(const std::string& input) {
    if (input.empty()) {
        return {};
    }
    // 4 output bytes per 3 input bytes, plus the terminating NUL
    std::vector<unsigned char> out(4 * ((input.size() + 2) / 3) + 1);
    const int written = EVP_EncodeBlock(out.data(),
                                        reinterpret_cast<const unsigned char*>(input.data()),
                                        static_cast<int>(input.size()));
    return std::string(reinterpret_cast<const char*>(out.data()), static_cast<size_t>(written));
}

BasicAuthentication::BasicAuthentication(std::string user, std::string password)
    : user_(std::move(user)), password_(std::move(password)) {}

HeaderMap BasicAuthentication::auth_headers(const std::string&) const {
    HeaderMap headers;
    headers.set("Authorization", "Basic " + base64_encode(user_ + ":" + password_));
    return headers;
}

} // namespace conduit::net
