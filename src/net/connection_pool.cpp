#include <conduit/net/connection_pool.h>
#include <conduit/core/diagnostics.h>

#include <algorithm>
#include <cctype>

namespace conduit::net {

namespace {

// Closing a TLS stream may write; do it after the lock is released.
void close_all(std::vector<std::unique_ptr<NetworkStream>>& streams) {
    for (auto& stream : streams) {
        if (stream) {
            stream->close();
        }
    }
    streams.clear();
}

} // anonymous namespace

ConnectionPool::ConnectionPool(size_t max_per_key, size_t max_total,
                               std::chrono::seconds idle_timeout)
    : max_per_key_(max_per_key),
      max_total_(max_total),
      idle_timeout_(idle_timeout) {}

ConnectionPool::~ConnectionPool() {
    clear();
}

std::string ConnectionPool::make_key(const std::string& scheme, const std::string& host,
                                     uint16_t port, const std::string& tls_fingerprint) {
    std::string lower_host = host;
    std::transform(lower_host.begin(), lower_host.end(), lower_host.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return scheme + "|" + lower_host + "|" + std::to_string(port) + "|" + tls_fingerprint;
}

std::unique_ptr<NetworkStream> ConnectionPool::checkout(const std::string& key) {
    Evicted evicted;
    std::unique_ptr<NetworkStream> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        evict_idle_locked(evicted);

        auto it = pools_.find(key);
        if (it != pools_.end()) {
            // LIFO: take from the back (most recently added)
            while (!it->second.empty()) {
                PooledConnection conn = std::move(it->second.back());
                it->second.pop_back();
                if (!conn.stream->is_connected()) {
                    evicted.push_back(std::move(conn.stream));
                    continue;
                }
                result = std::move(conn.stream);
                break;
            }
            if (it->second.empty()) {
                pools_.erase(it);
            }
        }
    }
    close_all(evicted);

    if (result) {
        core::DiagnosticEmitter::shared().debug("pool", "checkout", "reusing connection to " + key);
    }
    return result;
}

void ConnectionPool::checkin(const std::string& key, std::unique_ptr<NetworkStream> stream) {
    if (!stream) {
        return;
    }
    if (!stream->is_connected() || max_per_key_ == 0 || max_total_ == 0) {
        stream->close();
        return;
    }

    Evicted evicted;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        evict_idle_locked(evicted);

        auto& pool = pools_[key];

        // If at capacity, remove the oldest (front)
        if (pool.size() >= max_per_key_) {
            evicted.push_back(std::move(pool.front().stream));
            pool.pop_front();
        }

        pool.push_back(PooledConnection{std::move(stream), std::chrono::steady_clock::now()});

        while (total_count_locked() > max_total_) {
            auto oldest_pool_it = pools_.end();
            auto oldest_returned_at = std::chrono::steady_clock::time_point::max();

            for (auto it = pools_.begin(); it != pools_.end(); ++it) {
                if (it->second.empty()) continue;
                const auto& candidate = it->second.front();
                if (candidate.returned_at < oldest_returned_at) {
                    oldest_returned_at = candidate.returned_at;
                    oldest_pool_it = it;
                }
            }

            if (oldest_pool_it == pools_.end()) {
                break;
            }

            evicted.push_back(std::move(oldest_pool_it->second.front().stream));
            oldest_pool_it->second.pop_front();
            if (oldest_pool_it->second.empty()) {
                pools_.erase(oldest_pool_it);
            }
        }
    }
    close_all(evicted);
}

void ConnectionPool::clear() {
    Evicted evicted;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [key, pool] : pools_) {
            (void)key;
            for (auto& conn : pool) {
                evicted.push_back(std::move(conn.stream));
            }
        }
        pools_.clear();
    }
    close_all(evicted);
}

size_t ConnectionPool::size(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pools_.find(key);
    if (it == pools_.end()) {
        return 0;
    }
    return it->second.size();
}

size_t ConnectionPool::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_count_locked();
}

ConnectionPool& ConnectionPool::shared() {
    static ConnectionPool pool;
    return pool;
}

void ConnectionPool::evict_idle_locked(Evicted& evicted) {
    const auto now = std::chrono::steady_clock::now();
    for (auto it = pools_.begin(); it != pools_.end();) {
        auto& pool = it->second;
        while (!pool.empty()) {
            auto idle_for = now - pool.front().returned_at;
            if (idle_for <= idle_timeout_) {
                break;
            }
            evicted.push_back(std::move(pool.front().stream));
            pool.pop_front();
        }

        if (pool.empty()) {
            it = pools_.erase(it);
        } else {
            ++it;
        }
    }
}

size_t ConnectionPool::total_count_locked() const {
    size_t total = 0;
    for (const auto& [key, pool] : pools_) {
        (void)key;
        total += pool.size();
    }
    return total;
}

} // namespace conduit::net
