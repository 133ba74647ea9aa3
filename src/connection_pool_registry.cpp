#include "scanpool/connection/connection_pool_registry.hpp"

#include <utility>

namespace scanpool {

    ConnectionPoolRegistry::ConnectionPoolRegistry(
        std::shared_ptr<Connector> connector,
        std::size_t max_connections_per_host)
        : connector_(std::move(connector)),
          capacity_(std::make_shared<std::atomic<std::size_t>>(
              max_connections_per_host)) {}

    std::shared_ptr<ConnectionPool> ConnectionPoolRegistry::get_or_create_pool(
        const EndpointKey& key) {
        std::lock_guard<std::mutex> lk(mu_);
        auto& slot = pools_[key];
        if (!slot) {
            slot = std::make_shared<ConnectionPool>(key, connector_, capacity_);
        }
        return slot;
    }

    AcquireResult ConnectionPoolRegistry::acquire(const EndpointKey& key) {
        return get_or_create_pool(key)->acquire();
    }

    void ConnectionPoolRegistry::release(const EndpointKey& key,
                                         PooledConnection conn, bool reuse) {
        std::shared_ptr<ConnectionPool> pool;
        {
            std::lock_guard<std::mutex> lk(mu_);
            auto it = pools_.find(key);
            if (it != pools_.end()) pool = it->second;
        }

        if (!pool) {
            conn.close();
            return;
        }
        pool->release(std::move(conn), reuse);
    }

    void ConnectionPoolRegistry::clear(const EndpointFilter& filter) {
        std::lock_guard<std::mutex> lk(mu_);
        for (auto& [key, pool] : pools_) {
            if (filter.empty() || filter.matches(key)) pool->close_all();
        }
    }

    std::map<std::string, EndpointStats> ConnectionPoolRegistry::stats()
        const {
        std::map<std::string, EndpointStats> out;
        std::lock_guard<std::mutex> lk(mu_);
        for (auto const& [key, pool] : pools_) {
            out.emplace(key.label(), pool->stats());
        }
        return out;
    }

    void ConnectionPoolRegistry::set_max_connections_per_host(
        std::size_t n) noexcept {
        capacity_->store(n, std::memory_order_release);
    }

    std::size_t ConnectionPoolRegistry::max_connections_per_host()
        const noexcept {
        return capacity_->load(std::memory_order_acquire);
    }

    std::size_t ConnectionPoolRegistry::pool_count() const {
        std::lock_guard<std::mutex> lk(mu_);
        return pools_.size();
    }

}  // namespace scanpool
