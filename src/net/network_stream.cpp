#include <conduit/net/network_stream.h>
#include <conduit/net/errors.h>
#include <conduit/core/diagnostics.h>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <string>

namespace conduit::net {

namespace {

std::string errno_text(int err) {
    return std::string(std::strerror(err));
}

bool set_nonblocking(int fd, bool nonblocking, std::string& err) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        err = "fcntl(F_GETFL) failed: " + errno_text(errno);
        return false;
    }

    const int target_flags = nonblocking ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    if (fcntl(fd, F_SETFL, target_flags) < 0) {
        err = "fcntl(F_SETFL) failed: " + errno_text(errno);
        return false;
    }
    return true;
}

timeval to_timeval(std::chrono::milliseconds timeout) {
    timeval tv{};
    if (timeout.count() > 0) {
        tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
        tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    }
    return tv;
}

bool set_socket_timeout(int fd, int option, std::chrono::milliseconds timeout, std::string& err) {
    const timeval tv = to_timeval(timeout);
    if (setsockopt(fd, SOL_SOCKET, option, &tv, sizeof(tv)) < 0) {
        err = "setsockopt() failed: " + errno_text(errno);
        return false;
    }
    return true;
}

// Non-blocking connect bounded by timeout; leaves the socket blocking.
bool connect_with_timeout(int fd, const sockaddr* addr, socklen_t addr_len,
                          std::chrono::milliseconds timeout, std::string& err) {
    if (!set_nonblocking(fd, true, err)) {
        return false;
    }

    int rc = ::connect(fd, addr, addr_len);
    if (rc < 0 && errno != EINPROGRESS) {
        err = "connect() failed: " + errno_text(errno);
        return false;
    }

    if (rc < 0) {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLOUT;

        const int wait_ms = timeout.count() > 0 ? static_cast<int>(timeout.count()) : -1;
        do {
            rc = ::poll(&pfd, 1, wait_ms);
        } while (rc < 0 && errno == EINTR);

        if (rc == 0) {
            err = "connect() timed out";
            return false;
        }
        if (rc < 0) {
            err = "poll() failed while connecting: " + errno_text(errno);
            return false;
        }

        int socket_error = 0;
        socklen_t socket_error_len = sizeof(socket_error);
        if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &socket_error, &socket_error_len) < 0) {
            err = "getsockopt(SO_ERROR) failed: " + errno_text(errno);
            return false;
        }
        if (socket_error != 0) {
            err = "connect() failed: " + errno_text(socket_error);
            return false;
        }
    }

    return set_nonblocking(fd, false, err);
}

std::string endpoint(const std::string& host, uint16_t port) {
    return host + ":" + std::to_string(port);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// SocketStream
// ---------------------------------------------------------------------------

SocketStream::~SocketStream() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void SocketStream::close() {
    if (fd_ < 0) {
        return;
    }
    on_close();
    ::shutdown(fd_, SHUT_RDWR);
    ::close(fd_);
    fd_ = -1;
    connected_ = false;
}

void SocketStream::open(int family) {
    close();
    fd_ = ::socket(family, SOCK_STREAM, 0);
    if (fd_ < 0) {
        throw NetworkException("socket() failed: " + errno_text(errno));
    }
}

void SocketStream::adopt(int fd) {
    close();
    fd_ = fd;
    connected_ = true;
}

void SocketStream::connect(const std::string& host, uint16_t port,
                           std::chrono::milliseconds timeout) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* results = nullptr;
    const std::string port_str = std::to_string(port);
    const int gai_rc = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &results);
    if (gai_rc != 0) {
        throw ConnectError("Can't resolve name when connect to " + endpoint(host, port) + ": " +
                           gai_strerror(gai_rc));
    }

    timeout_ = timeout;
    auto& log = core::DiagnosticEmitter::shared();
    std::string last_error = "no usable address";
    for (addrinfo* addr = results; addr != nullptr; addr = addr->ai_next) {
        close();
        fd_ = ::socket(addr->ai_family, addr->ai_socktype, addr->ai_protocol);
        if (fd_ < 0) {
            last_error = "socket() failed: " + errno_text(errno);
            log.warning("net", "connect", last_error);
            continue;
        }

        std::string err;
        if (!connect_with_timeout(fd_, addr->ai_addr, addr->ai_addrlen, timeout, err) ||
            !set_socket_timeout(fd_, SO_SNDTIMEO, timeout, err)) {
            log.warning("net", "connect", endpoint(host, port) + ": " + err);
            last_error = err;
            close();
            continue;
        }

        connected_ = true;
        break;
    }
    freeaddrinfo(results);

    if (!is_connected()) {
        throw ConnectError("Can't connect to " + endpoint(host, port) + ": " + last_error);
    }
    log.debug("net", "connect", "connected to " + endpoint(host, port));

    try {
        on_connected(host, port);
    } catch (...) {
        close();
        throw;
    }
}

void SocketStream::on_connected(const std::string&, uint16_t) {}

SocketStream::IoResult SocketStream::raw_send(const uint8_t* data, size_t len) {
    IoResult result;
    while (true) {
        const ssize_t rc = ::send(fd_, data, len, MSG_NOSIGNAL);
        if (rc >= 0) {
            result.bytes = static_cast<size_t>(rc);
            return result;
        }
        if (errno == EINTR) {
            continue;
        }
        result.status = (errno == EAGAIN || errno == EWOULDBLOCK) ? IoStatus::Timeout : IoStatus::Failed;
        result.error = "send() failed: " + errno_text(errno);
        return result;
    }
}

SocketStream::IoResult SocketStream::raw_receive(uint8_t* buf, size_t len) {
    IoResult result;
    while (true) {
        const ssize_t rc = ::recv(fd_, buf, len, 0);
        if (rc > 0) {
            result.bytes = static_cast<size_t>(rc);
            return result;
        }
        if (rc == 0) {
            result.status = IoStatus::Closed;
            return result;
        }
        if (errno == EINTR) {
            continue;
        }
        result.status = (errno == EAGAIN || errno == EWOULDBLOCK) ? IoStatus::Timeout : IoStatus::Failed;
        result.error = "recv() failed: " + errno_text(errno);
        return result;
    }
}

size_t SocketStream::send(const uint8_t* data, size_t len) {
    if (!is_connected()) {
        throw NetworkException("Can't send to a closed stream");
    }

    size_t written = 0;
    while (written < len) {
        const IoResult r = raw_send(data + written, len - written);
        switch (r.status) {
            case IoStatus::Ok:
                written += r.bytes;
                break;
            case IoStatus::Timeout:
                close();
                throw TimeoutException("Timeout sending data");
            case IoStatus::Closed:
                close();
                throw NetworkException("Connection closed while sending data");
            case IoStatus::Failed:
                close();
                throw NetworkException(r.error);
        }
    }
    return written;
}

size_t SocketStream::receive(uint8_t* buf, size_t len) {
    if (!is_connected()) {
        throw NetworkException("Can't receive from a closed stream");
    }

    const IoResult r = raw_receive(buf, len);
    switch (r.status) {
        case IoStatus::Ok:
            return r.bytes;
        case IoStatus::Closed:
            return 0;
        case IoStatus::Timeout:
            close();
            throw TimeoutException("Timeout receiving data");
        case IoStatus::Failed:
            break;
    }
    close();
    throw NetworkException(r.error);
}

void SocketStream::set_read_timeout(std::chrono::milliseconds timeout) {
    if (fd_ < 0) {
        return;
    }
    std::string err;
    if (!set_socket_timeout(fd_, SO_RCVTIMEO, timeout, err)) {
        throw NetworkException(err);
    }
}

void SocketStream::set_reuse_addr(bool yes) {
    if (fd_ < 0) {
        open(AF_INET);
    }
    const int value = yes ? 1 : 0;
    if (setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &value, sizeof(value)) < 0) {
        throw NetworkException("setsockopt(SO_REUSEADDR) failed: " + errno_text(errno));
    }
}

void SocketStream::bind(const std::string& host, uint16_t port) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE;

    addrinfo* results = nullptr;
    const std::string port_str = std::to_string(port);
    const int gai_rc = getaddrinfo(host.empty() ? nullptr : host.c_str(), port_str.c_str(),
                                   &hints, &results);
    if (gai_rc != 0) {
        throw NetworkException("Can't resolve bind address " + endpoint(host, port) + ": " +
                               gai_strerror(gai_rc));
    }

    int family = results->ai_family;
    bool reuse = false;
    if (fd_ >= 0) {
        // set_reuse_addr() opened an AF_INET handle ahead of time
        int value = 0;
        socklen_t value_len = sizeof(value);
        reuse = getsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &value, &value_len) == 0 && value != 0;
        sockaddr_storage bound{};
        socklen_t bound_len = sizeof(bound);
        if (getsockname(fd_, reinterpret_cast<sockaddr*>(&bound), &bound_len) == 0) {
            family = bound.ss_family;
        }
    }

    addrinfo* chosen = nullptr;
    for (addrinfo* addr = results; addr != nullptr; addr = addr->ai_next) {
        if (addr->ai_family == family) {
            chosen = addr;
            break;
        }
    }
    if (chosen == nullptr) {
        chosen = results;
    }

    if (fd_ < 0 || chosen->ai_family != family) {
        open(chosen->ai_family);
        if (reuse) {
            set_reuse_addr(true);
        }
    }

    const int rc = ::bind(fd_, chosen->ai_addr, chosen->ai_addrlen);
    const int bind_errno = errno;
    freeaddrinfo(results);
    if (rc < 0) {
        close();
        throw NetworkException("Can't bind to " + endpoint(host, port) + ": " + errno_text(bind_errno));
    }
}

void SocketStream::listen(int backlog) {
    if (fd_ < 0) {
        throw NetworkException("listen() on a closed stream");
    }
    if (::listen(fd_, backlog) < 0) {
        throw NetworkException("listen() failed: " + errno_text(errno));
    }
}

std::unique_ptr<NetworkStream> SocketStream::accept() {
    if (fd_ < 0) {
        throw NetworkException("accept() on a closed stream");
    }
    int client = -1;
    do {
        client = ::accept(fd_, nullptr, nullptr);
    } while (client < 0 && errno == EINTR);

    if (client < 0) {
        throw NetworkException("accept() failed: " + errno_text(errno));
    }
    return wrap_accepted(client);
}

uint16_t SocketStream::local_port() const {
    if (fd_ < 0) {
        return 0;
    }
    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
        return 0;
    }
    if (addr.ss_family == AF_INET6) {
        return ntohs(reinterpret_cast<const sockaddr_in6*>(&addr)->sin6_port);
    }
    return ntohs(reinterpret_cast<const sockaddr_in*>(&addr)->sin_port);
}

// ---------------------------------------------------------------------------
// TcpStream
// ---------------------------------------------------------------------------

void TcpStream::on_connected(const std::string&, uint16_t) {
    const int one = 1;
    setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
}

std::unique_ptr<SocketStream> TcpStream::wrap_accepted(int fd) {
    auto stream = std::make_unique<TcpStream>();
    stream->adopt(fd);
    return stream;
}

} // namespace conduit::net
