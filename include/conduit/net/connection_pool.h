#pragma once
#include <conduit/core/config.h>
#include <conduit/net/network_stream.h>
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace conduit::net {

// Idle keep-alive connections, keyed by destination. An idle stream belongs
// to the pool; checkout() hands it to exactly one caller.
class ConnectionPool {
public:
    explicit ConnectionPool(size_t max_per_key = core::config::kPoolMaxPerKey,
                            size_t max_total = core::config::kPoolMaxTotal,
                            std::chrono::seconds idle_timeout = core::config::kPoolIdleTimeout);
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    // "scheme|host|port|tls-fingerprint", host lower-cased.
    static std::string make_key(const std::string& scheme, const std::string& host,
                                uint16_t port, const std::string& tls_fingerprint = {});

    // Most recently returned idle stream for key, or nullptr if none.
    std::unique_ptr<NetworkStream> checkout(const std::string& key);

    // Return a stream. Streams that are no longer connected are closed
    // instead of stored.
    void checkin(const std::string& key, std::unique_ptr<NetworkStream> stream);

    // Close all pooled connections
    void clear();

    size_t size(const std::string& key) const;
    size_t size() const;

    static ConnectionPool& shared();

private:
    struct PooledConnection {
        std::unique_ptr<NetworkStream> stream;
        std::chrono::steady_clock::time_point returned_at;
    };

    using Evicted = std::vector<std::unique_ptr<NetworkStream>>;

    void evict_idle_locked(Evicted& evicted);
    size_t total_count_locked() const;

    size_t max_per_key_;
    size_t max_total_;
    std::chrono::seconds idle_timeout_;
    std::unordered_map<std::string, std::deque<PooledConnection>> pools_;
    mutable std::mutex mutex_;
};

} // namespace conduit::net
