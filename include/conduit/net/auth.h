#pragma once
#include <conduit/net/header_map.h>
#include <string>

namespace conduit::net {

// Credential provider consulted after a 401 (HTTP) or for the login of a
// URI without credentials (FTP).
class Authenticator {
public:
    virtual ~Authenticator() = default;

    // Headers to attach to the retried request for host.
    virtual HeaderMap auth_headers(const std::string& host) const = 0;
    virtual std::string user_name() const = 0;
    virtual std::string password() const = 0;
};

class BasicAuthentication : public Authenticator {
public:
    BasicAuthentication(std::string user, std::string password);

    HeaderMap auth_headers(const std::string& host) const override;
    std::string user_name() const override { return user_; }
    std::string password() const override { return password_; }

private:
    std::string user_;
    std::string password_;
};

std::string base64_encode(const std::string& input);

} // namespace conduit::net
