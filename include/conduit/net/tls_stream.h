#pragma once
#include <conduit/net/network_stream.h>
#include <memory>
#include <string>

typedef struct ssl_ctx_st SSL_CTX;
typedef struct ssl_st SSL;

namespace conduit::net {

struct TlsOptions {
    enum class FileType {
        Pem,
        Der,
    };

    bool verify_peer = false;
    std::string ca_cert;    // extra CA bundle, used when verify_peer is set
    std::string key_file;   // may also hold the certificate (PEM)
    FileType key_type = FileType::Pem;
    std::string cert_file;  // may also hold the key (PEM)
    FileType cert_type = FileType::Pem;

    // Bit 0: key_file set, bit 1: cert_file set.
    unsigned have_files() const;

    // Identifies the settings in connection pool keys; streams opened with
    // different options are never shared.
    std::string fingerprint() const;
};

// Runs OpenSSL's global initialisation exactly once per process.
void init_openssl_once();

class TlsStream : public SocketStream {
public:
    explicit TlsStream(TlsOptions options = {});
    ~TlsStream() override;

    const TlsOptions& options() const { return options_; }

protected:
    void on_connected(const std::string& host, uint16_t port) override;
    void on_close() override;
    IoResult raw_send(const uint8_t* data, size_t len) override;
    IoResult raw_receive(uint8_t* buf, size_t len) override;
    std::unique_ptr<SocketStream> wrap_accepted(int fd) override;

private:
    void create_context(bool server);
    void load_key_material();
    void verify_peer(const std::string& host);
    void accept_handshake();
    IoResult map_error(int rc, const char* op);

    TlsOptions options_;
    SSL_CTX* ctx_ = nullptr;
    SSL* ssl_ = nullptr;
    bool handshake_done_ = false;
};

// "https" gives a TlsStream with the given options; "http" and "ftp" give a
// TcpStream. Any other scheme throws RequestException.
std::unique_ptr<NetworkStream> make_stream(const std::string& scheme, const TlsOptions& tls = {});

} // namespace conduit::net
