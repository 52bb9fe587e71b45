#pragma once
#include <conduit/net/buffer.h>
#include <conduit/net/decode_chunked.h>
#include <conduit/net/errors.h>
#include <conduit/net/header_map.h>
#include <conduit/net/network_stream.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace conduit::test {

// One request as seen by the server side of a test.
struct ReceivedRequest {
    std::string method;
    std::string target;
    net::HeaderMap headers;
    std::string body;
    bool chunked = false;
};

inline std::string read_until(net::NetworkStream& stream, std::string& carry, const std::string& marker) {
    uint8_t buf[4096];
    while (carry.find(marker) == std::string::npos) {
        const size_t n = stream.receive(buf, sizeof(buf));
        if (n == 0) {
            return {};
        }
        carry.append(reinterpret_cast<const char*>(buf), n);
    }
    const size_t end = carry.find(marker) + marker.size();
    std::string result = carry.substr(0, end);
    carry.erase(0, end);
    return result;
}

// Read one HTTP request. carry keeps bytes that belong to the next request
// on the same connection. nullopt when the client closed first.
inline std::optional<ReceivedRequest> read_request(net::NetworkStream& stream, std::string& carry) {
    const std::string head = read_until(stream, carry, "\r\n\r\n");
    if (head.empty()) {
        return std::nullopt;
    }

    ReceivedRequest req;
    size_t line_end = head.find("\r\n");
    const std::string request_line = head.substr(0, line_end);
    const size_t sp1 = request_line.find(' ');
    const size_t sp2 = request_line.rfind(' ');
    req.method = request_line.substr(0, sp1);
    req.target = request_line.substr(sp1 + 1, sp2 - sp1 - 1);

    size_t pos = line_end + 2;
    while (pos < head.size()) {
        line_end = head.find("\r\n", pos);
        const std::string line = head.substr(pos, line_end - pos);
        pos = line_end + 2;
        if (line.empty()) {
            break;
        }
        const size_t colon = line.find(':');
        std::string value = line.substr(colon + 1);
        while (!value.empty() && value.front() == ' ') {
            value.erase(0, 1);
        }
        req.headers.append(line.substr(0, colon), value);
    }

    uint8_t buf[4096];
    if (auto te = req.headers.get("Transfer-Encoding"); te && *te == "chunked") {
        req.chunked = true;
        net::DecodeChunked dechunk;
        dechunk.put(net::BufferChunk::from_string(carry));
        carry.clear();
        while (!dechunk.done()) {
            const size_t n = stream.receive(buf, sizeof(buf));
            if (n == 0) {
                break;
            }
            dechunk.put(net::BufferChunk(buf, n));
        }
        while (!dechunk.empty()) {
            req.body += dechunk.get().to_string();
        }
    } else if (auto cl = req.headers.get("Content-Length")) {
        const size_t length = std::stoul(*cl);
        while (carry.size() < length) {
            const size_t n = stream.receive(buf, sizeof(buf));
            if (n == 0) {
                break;
            }
            carry.append(reinterpret_cast<const char*>(buf), n);
        }
        req.body = carry.substr(0, length);
        carry.erase(0, std::min(length, carry.size()));
    }
    return req;
}

inline std::string http_response(int status, const std::string& reason, const std::string& body,
                                 const std::vector<std::string>& extra_headers = {}) {
    std::string out = "HTTP/1.1 " + std::to_string(status) + " " + reason + "\r\n";
    for (const auto& header : extra_headers) {
        out += header + "\r\n";
    }
    out += "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n";
    out += body;
    return out;
}

// Accepts connections on 127.0.0.1 with an ephemeral port and hands each
// one, in turn, to the handler on the server thread. The handler gets the
// zero-based index of the connection. Server-side reads give up after
// kServerReadTimeout so a client that keeps a connection open cannot hang
// stop().
class LoopbackServer {
public:
    using Handler = std::function<void(LoopbackServer& server, net::NetworkStream& client, size_t index)>;

    static constexpr std::chrono::milliseconds kServerReadTimeout{5000};

    explicit LoopbackServer(Handler handler,
                            std::unique_ptr<net::NetworkStream> listener = nullptr)
        : handler_(std::move(handler)),
          listener_(listener ? std::move(listener) : std::make_unique<net::TcpStream>()) {
        listener_->set_reuse_addr(true);
        listener_->bind("127.0.0.1", 0);
        listener_->listen(16);
        port_ = listener_->local_port();
        thread_ = std::thread([this]() { run(); });
    }

    ~LoopbackServer() { stop(); }

    LoopbackServer(const LoopbackServer&) = delete;
    LoopbackServer& operator=(const LoopbackServer&) = delete;

    uint16_t port() const { return port_; }

    std::string url(const std::string& path = "/", const std::string& scheme = "http") const {
        return scheme + "://127.0.0.1:" + std::to_string(port_) + path;
    }

    size_t connections() const { return connections_.load(); }

    std::vector<ReceivedRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    void record(ReceivedRequest req) {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(std::move(req));
    }

    void stop() {
        if (!thread_.joinable()) {
            return;
        }
        stopping_ = true;
        // Wake the blocking accept()
        try {
            net::TcpStream poke;
            poke.connect("127.0.0.1", port_, std::chrono::milliseconds(1000));
            poke.close();
        } catch (const net::NetError&) {
        }
        thread_.join();
        listener_->close();
    }

private:
    void run() {
        while (!stopping_) {
            std::unique_ptr<net::NetworkStream> client;
            try {
                client = listener_->accept();
            } catch (const net::NetError&) {
                if (stopping_) {
                    break;
                }
                continue;
            }
            if (stopping_) {
                break;
            }
            const size_t index = connections_++;
            try {
                client->set_read_timeout(kServerReadTimeout);
                handler_(*this, *client, index);
            } catch (const net::NetError&) {
                // the client went away mid-script
            }
            client->close();
        }
    }

    Handler handler_;
    std::unique_ptr<net::NetworkStream> listener_;
    uint16_t port_ = 0;
    std::thread thread_;
    std::atomic<bool> stopping_{false};
    std::atomic<size_t> connections_{0};
    mutable std::mutex mutex_;
    std::vector<ReceivedRequest> requests_;
};

} // namespace conduit::test
