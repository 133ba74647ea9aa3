#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "scanpool/config.hpp"
#include "scanpool/connection/connection_pool.hpp"
#include "scanpool/connection/connection_pool_types.hpp"
#include "scanpool/endpoint.hpp"

namespace scanpool {

    /**
     * Owns one ConnectionPool per endpoint key.
     *
     * LIFECYCLE:
     * - One registry per process, created at startup by whoever owns the
     *   optimization layer and passed by reference to its users
     * - Pools are created lazily and only emptied, never removed, by clear()
     *
     * LOCKING:
     * - mu_ guards the key -> pool map and is held only for lookup-or-insert,
     *   clear() and stats(); never across a pool's acquire/release
     * - Each pool has its own lock, so different endpoints never contend
     * - Lock order is always registry then pool
     */
    class ConnectionPoolRegistry {
       public:
        explicit ConnectionPoolRegistry(
            std::shared_ptr<Connector> connector,
            std::size_t max_connections_per_host =
                kDefaultMaxConnectionsPerHost);

        ConnectionPoolRegistry(const ConnectionPoolRegistry&) = delete;
        ConnectionPoolRegistry& operator=(const ConnectionPoolRegistry&) =
            delete;

        /// @brief Find the pool for key, creating it under the registry lock
        /// if absent. The returned pool is always fully constructed.
        std::shared_ptr<ConnectionPool> get_or_create_pool(
            const EndpointKey& key);

        AcquireResult acquire(const EndpointKey& key);

        /// @brief Return conn to the pool for key. A connection for a key the
        /// registry never saw is closed.
        void release(const EndpointKey& key, PooledConnection conn,
                     bool reuse);

        /// @brief Close idle connections of every pool matching filter. An
        /// empty filter matches every pool.
        void clear(const EndpointFilter& filter = {});

        /// @brief Counters per endpoint label ("https://host:443").
        /// @note `active` counts idle connections only.
        std::map<std::string, EndpointStats> stats() const;

        /// @brief Takes effect on the next acquire/release of every pool.
        void set_max_connections_per_host(std::size_t n) noexcept;
        std::size_t max_connections_per_host() const noexcept;

        std::size_t pool_count() const;

       private:
        std::shared_ptr<Connector> connector_;
        CapacitySlot capacity_;

        mutable std::mutex mu_;
        std::unordered_map<EndpointKey, std::shared_ptr<ConnectionPool>>
            pools_;
    };

}  // namespace scanpool
