#include <conduit/net/tls_stream.h>
#include <conduit/net/errors.h>
#include <conduit/core/diagnostics.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <pthread.h>
#include <signal.h>

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <mutex>
#include <string>
#include <utility>

namespace conduit::net {

namespace {

// OpenSSL writes through write(2), which raises SIGPIPE on a vanished peer.
// Blocks the signal on the calling thread for the scope of one SSL call
// and discards a SIGPIPE that call left pending; the host's handler and
// other threads are untouched.
class ScopedSigpipeBlock {
public:
    ScopedSigpipeBlock() {
        sigset_t block;
        sigemptyset(&block);
        sigaddset(&block, SIGPIPE);
        pthread_sigmask(SIG_BLOCK, &block, &saved_mask_);
        sigset_t pending;
        sigpending(&pending);
        already_pending_ = sigismember(&pending, SIGPIPE) == 1;
    }

    ~ScopedSigpipeBlock() {
        const int saved_errno = errno;
        if (!already_pending_) {
            sigset_t pending;
            sigpending(&pending);
            if (sigismember(&pending, SIGPIPE) == 1) {
                sigset_t pipe_only;
                sigemptyset(&pipe_only);
                sigaddset(&pipe_only, SIGPIPE);
                const timespec no_wait{0, 0};
                sigtimedwait(&pipe_only, nullptr, &no_wait);
            }
        }
        pthread_sigmask(SIG_SETMASK, &saved_mask_, nullptr);
        errno = saved_errno;
    }

    ScopedSigpipeBlock(const ScopedSigpipeBlock&) = delete;
    ScopedSigpipeBlock& operator=(const ScopedSigpipeBlock&) = delete;

private:
    sigset_t saved_mask_;
    bool already_pending_ = false;
};

std::string openssl_error_text() {
    const unsigned long code = ERR_get_error();
    ERR_clear_error();
    if (code == 0) {
        return "unknown error";
    }
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return buf;
}

int to_ssl_filetype(TlsOptions::FileType type) {
    return type == TlsOptions::FileType::Der ? SSL_FILETYPE_ASN1 : SSL_FILETYPE_PEM;
}

const char* filetype_name(TlsOptions::FileType type) {
    return type == TlsOptions::FileType::Der ? "der" : "pem";
}

bool is_ip_literal(const std::string& host) {
    in6_addr addr6{};
    in_addr addr4{};
    return inet_pton(AF_INET, host.c_str(), &addr4) == 1 ||
           inet_pton(AF_INET6, host.c_str(), &addr6) == 1;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// TlsOptions
// ---------------------------------------------------------------------------

unsigned TlsOptions::have_files() const {
    unsigned r = 0;
    if (!key_file.empty()) r |= 1;
    if (!cert_file.empty()) r |= 2;
    return r;
}

std::string TlsOptions::fingerprint() const {
    std::string fp = verify_peer ? "verify" : "noverify";
    fp += ";ca=" + ca_cert;
    fp += ";key=" + key_file + ":" + filetype_name(key_type);
    fp += ";cert=" + cert_file + ":" + filetype_name(cert_type);
    return fp;
}

void init_openssl_once() {
    static std::once_flag once;
    std::call_once(once, []() {
        OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr);
    });
}

// ---------------------------------------------------------------------------
// TlsStream
// ---------------------------------------------------------------------------

TlsStream::TlsStream(TlsOptions options) : options_(std::move(options)) {
    init_openssl_once();
}

TlsStream::~TlsStream() {
    close();
    if (ctx_) {
        SSL_CTX_free(ctx_);
        ctx_ = nullptr;
    }
}

void TlsStream::create_context(bool server) {
    if (ctx_) {
        SSL_CTX_free(ctx_);
    }
    ctx_ = SSL_CTX_new(server ? TLS_server_method() : TLS_client_method());
    if (!ctx_) {
        throw ConnectError("SSL_CTX_new() failed: " + openssl_error_text());
    }
#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
    SSL_CTX_set_options(ctx_, SSL_OP_IGNORE_UNEXPECTED_EOF);
#endif

    if (!server && options_.verify_peer) {
        if (SSL_CTX_set_default_verify_paths(ctx_) != 1) {
            throw ConnectError("SSL_CTX_set_default_verify_paths() failed");
        }
        if (!options_.ca_cert.empty() &&
            SSL_CTX_load_verify_locations(ctx_, options_.ca_cert.c_str(), nullptr) != 1) {
            throw ConnectError("Can't load CA certificate " + options_.ca_cert + ": " +
                               openssl_error_text());
        }
        SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, nullptr);
    }
    load_key_material();
}

void TlsStream::load_key_material() {
    std::string key = options_.key_file;
    std::string cert = options_.cert_file;
    TlsOptions::FileType key_type = options_.key_type;
    TlsOptions::FileType cert_type = options_.cert_type;

    switch (options_.have_files()) {
        case 0b11:
            break;
        case 0b01:
            cert = key;
            cert_type = key_type;
            break;
        case 0b10:
            key = cert;
            key_type = cert_type;
            break;
        default:
            return;
    }

    if (SSL_CTX_use_PrivateKey_file(ctx_, key.c_str(), to_ssl_filetype(key_type)) != 1) {
        throw ConnectError("Can't load private key " + key + ": " + openssl_error_text());
    }
    if (SSL_CTX_use_certificate_file(ctx_, cert.c_str(), to_ssl_filetype(cert_type)) != 1) {
        throw ConnectError("Can't load certificate " + cert + ": " + openssl_error_text());
    }
}

void TlsStream::on_connected(const std::string& host, uint16_t port) {
    create_context(false);

    ssl_ = SSL_new(ctx_);
    if (!ssl_) {
        throw ConnectError("SSL_new() failed: " + openssl_error_text());
    }
    if (!is_ip_literal(host)) {
        SSL_set_tlsext_host_name(ssl_, host.c_str());
    }
    SSL_set_fd(ssl_, fd_);

    // The handshake reads from a blocking socket; bound it by the connect
    // timeout.
    set_read_timeout(timeout_);

    ScopedSigpipeBlock no_sigpipe;
    const int rc = SSL_connect(ssl_);
    if (rc != 1) {
        const int ssl_error = SSL_get_error(ssl_, rc);
        std::string reason = ssl_error == SSL_ERROR_WANT_READ || ssl_error == SSL_ERROR_WANT_WRITE
                                 ? std::string("timed out")
                                 : openssl_error_text();
        if (options_.verify_peer && SSL_get_verify_result(ssl_) != X509_V_OK) {
            reason = X509_verify_cert_error_string(SSL_get_verify_result(ssl_));
        }
        throw ConnectError("TLS handshake with " + host + ":" + std::to_string(port) +
                           " failed: " + reason);
    }
    handshake_done_ = true;

    if (options_.verify_peer) {
        verify_peer(host);
    }
    core::DiagnosticEmitter::shared().debug("tls", "handshake",
                                            std::string(SSL_get_version(ssl_)) + " with " + host);
}

void TlsStream::verify_peer(const std::string& host) {
    if (SSL_get_verify_result(ssl_) != X509_V_OK) {
        throw ConnectError("TLS certificate verification failed: " +
                           std::string(X509_verify_cert_error_string(SSL_get_verify_result(ssl_))));
    }

    X509* peer_cert = SSL_get_peer_certificate(ssl_);
    if (!peer_cert) {
        throw ConnectError("TLS certificate verification failed: missing peer certificate");
    }

    const int host_ok = is_ip_literal(host)
                            ? X509_check_ip_asc(peer_cert, host.c_str(), 0)
                            : X509_check_host(peer_cert, host.c_str(), host.size(), 0, nullptr);
    X509_free(peer_cert);
    if (host_ok != 1) {
        throw ConnectError("TLS certificate verification failed: hostname mismatch for " + host);
    }
}

void TlsStream::accept_handshake() {
    if (options_.have_files() == 0) {
        throw NetworkException("TLS accept needs a key or certificate file");
    }
    try {
        create_context(true);
    } catch (const ConnectError& e) {
        throw NetworkException(e.what());
    }

    ssl_ = SSL_new(ctx_);
    if (!ssl_) {
        throw NetworkException("SSL_new() failed: " + openssl_error_text());
    }
    SSL_set_fd(ssl_, fd_);

    ScopedSigpipeBlock no_sigpipe;
    const int rc = SSL_accept(ssl_);
    if (rc != 1) {
        throw NetworkException("TLS accept failed: " + openssl_error_text());
    }
    handshake_done_ = true;
}

std::unique_ptr<SocketStream> TlsStream::wrap_accepted(int fd) {
    auto stream = std::make_unique<TlsStream>(options_);
    stream->adopt(fd);
    stream->accept_handshake();
    return stream;
}

void TlsStream::on_close() {
    if (ssl_) {
        if (handshake_done_) {
            ScopedSigpipeBlock no_sigpipe;
            SSL_shutdown(ssl_);
        }
        SSL_free(ssl_);
        ssl_ = nullptr;
    }
    handshake_done_ = false;
    ERR_clear_error();
}

SocketStream::IoResult TlsStream::map_error(int rc, const char* op) {
    IoResult result;
    const int ssl_error = SSL_get_error(ssl_, rc);
    switch (ssl_error) {
        case SSL_ERROR_ZERO_RETURN:
            result.status = IoStatus::Closed;
            break;
        case SSL_ERROR_WANT_READ:
        case SSL_ERROR_WANT_WRITE:
            // blocking socket: only a socket timeout gets us here
            result.status = IoStatus::Timeout;
            break;
        case SSL_ERROR_SYSCALL:
            if (errno == 0) {
                result.status = IoStatus::Closed;
            } else if (errno == EAGAIN || errno == EWOULDBLOCK) {
                result.status = IoStatus::Timeout;
            } else {
                result.status = IoStatus::Failed;
                result.error = std::string(op) + " failed: " + std::strerror(errno);
            }
            break;
        default:
            result.status = IoStatus::Failed;
            result.error = std::string(op) + " failed: " + openssl_error_text();
            break;
    }
    ERR_clear_error();
    return result;
}

SocketStream::IoResult TlsStream::raw_send(const uint8_t* data, size_t len) {
    if (!ssl_) {
        return IoResult{IoStatus::Failed, 0, "SSL_write() without a TLS session"};
    }
    const int chunk = static_cast<int>(std::min<size_t>(len, 1 << 20));
    ScopedSigpipeBlock no_sigpipe;
    errno = 0;
    const int rc = SSL_write(ssl_, data, chunk);
    if (rc > 0) {
        return IoResult{IoStatus::Ok, static_cast<size_t>(rc), {}};
    }
    IoResult result = map_error(rc, "SSL_write()");
    if (result.status == IoStatus::Closed) {
        result.status = IoStatus::Failed;
        result.error = "SSL_write() failed: connection closed by peer";
    }
    return result;
}

SocketStream::IoResult TlsStream::raw_receive(uint8_t* buf, size_t len) {
    if (!ssl_) {
        return IoResult{IoStatus::Failed, 0, "SSL_read() without a TLS session"};
    }
    const int chunk = static_cast<int>(std::min<size_t>(len, 1 << 20));
    errno = 0;
    const int rc = SSL_read(ssl_, buf, chunk);
    if (rc > 0) {
        return IoResult{IoStatus::Ok, static_cast<size_t>(rc), {}};
    }
    return map_error(rc, "SSL_read()");
}

// ---------------------------------------------------------------------------
// make_stream
// ---------------------------------------------------------------------------

std::unique_ptr<NetworkStream> make_stream(const std::string& scheme, const TlsOptions& tls) {
    if (scheme == "https") {
        return std::make_unique<TlsStream>(tls);
    }
    if (scheme == "http" || scheme == "ftp") {
        return std::make_unique<TcpStream>();
    }
    throw RequestException("Unsupported scheme: " + scheme);
}

} // namespace conduit::net
