#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace conduit::net {

// Blocking byte stream over one socket. A stream is Closed (no handle),
// Open (handle, not connected) or Connected. close() is idempotent.
class NetworkStream {
public:
    virtual ~NetworkStream() = default;

    virtual bool is_open() const = 0;
    virtual bool is_connected() const = 0;
    virtual void close() = 0;

    // Resolve host and try every address in order; the first that connects
    // within timeout wins. Throws ConnectError when none does.
    virtual void connect(const std::string& host, uint16_t port,
                         std::chrono::milliseconds timeout) = 0;

    // Write all of data. Throws NetworkException or TimeoutException and
    // closes the stream on failure.
    virtual size_t send(const uint8_t* data, size_t len) = 0;

    // Read up to len bytes; 0 means the peer closed. Throws
    // TimeoutException when the read timeout expires, NetworkException on
    // other failures; either closes the stream.
    virtual size_t receive(uint8_t* buf, size_t len) = 0;

    // Server role
    virtual void bind(const std::string& host, uint16_t port) = 0;
    virtual void listen(int backlog) = 0;
    virtual std::unique_ptr<NetworkStream> accept() = 0;
    virtual void set_reuse_addr(bool yes) = 0;
    virtual uint16_t local_port() const = 0;

    // 0 disables the timeout.
    virtual void set_read_timeout(std::chrono::milliseconds timeout) = 0;

    size_t send(const std::string& data) {
        return send(reinterpret_cast<const uint8_t*>(data.data()), data.size());
    }
};

// Socket-handle bookkeeping shared by the plain and TLS streams. Variants
// customise the byte transport through the protected hooks.
class SocketStream : public NetworkStream {
public:
    SocketStream() = default;
    ~SocketStream() override;

    SocketStream(const SocketStream&) = delete;
    SocketStream& operator=(const SocketStream&) = delete;

    bool is_open() const override { return fd_ >= 0; }
    bool is_connected() const override { return fd_ >= 0 && connected_; }
    void close() override;

    void connect(const std::string& host, uint16_t port,
                 std::chrono::milliseconds timeout) override;
    using NetworkStream::send;
    size_t send(const uint8_t* data, size_t len) override;
    size_t receive(uint8_t* buf, size_t len) override;

    void bind(const std::string& host, uint16_t port) override;
    void listen(int backlog) override;
    std::unique_ptr<NetworkStream> accept() override;
    void set_reuse_addr(bool yes) override;
    uint16_t local_port() const override;

    void set_read_timeout(std::chrono::milliseconds timeout) override;

    int native_handle() const { return fd_; }

protected:
    enum class IoStatus {
        Ok,
        Closed,
        Timeout,
        Failed,
    };

    struct IoResult {
        IoStatus status = IoStatus::Ok;
        size_t bytes = 0;
        std::string error;
    };

    // Called once the TCP connection is up; throws ConnectError on failure.
    virtual void on_connected(const std::string& host, uint16_t port);
    // Called before the handle is closed.
    virtual void on_close() {}
    virtual IoResult raw_send(const uint8_t* data, size_t len);
    virtual IoResult raw_receive(uint8_t* buf, size_t len);
    // Build a connected stream of the same variant around an accepted handle.
    virtual std::unique_ptr<SocketStream> wrap_accepted(int fd) = 0;

    void open(int family);
    void adopt(int fd);

    int fd_ = -1;
    bool connected_ = false;
    std::chrono::milliseconds timeout_{0};  // last connect() timeout
};

class TcpStream : public SocketStream {
public:
    TcpStream() = default;
    ~TcpStream() override = default;

protected:
    void on_connected(const std::string& host, uint16_t port) override;
    std::unique_ptr<SocketStream> wrap_accepted(int fd) override;
};

} // namespace conduit::net
