#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

#include "scanpool/connection/connection_pool_types.hpp"
#include "scanpool/connection/pooled_connection.hpp"
#include "scanpool/connection/transport.hpp"
#include "scanpool/endpoint.hpp"

namespace scanpool {

    /**
     * Idle connections for one endpoint key.
     *
     * SAFETY:
     * - All public methods are thread-safe
     * - One mutex guards the idle stack and every counter; connection
     *   creation and liveness probes of idle connections run under it
     *
     * INVARIANTS:
     * 1. created_ - closed_ - in_use_ == idle_.size()
     * 2. idle_.size() <= capacity at the time of the last push
     * 3. A connection is either in idle_ or checked out, never both
     *
     * CAPACITY:
     * - A new connection is only created while in_use_ + idle_.size() is
     *   below the shared capacity; otherwise acquire() reports exhaustion
     * - Lowering the capacity does not close open connections, the surplus
     *   is closed as it is released
     */
    class ConnectionPool {
       public:
        ConnectionPool(EndpointKey key, std::shared_ptr<Connector> connector,
                       CapacitySlot capacity);

        ConnectionPool(const ConnectionPool&) = delete;
        ConnectionPool& operator=(const ConnectionPool&) = delete;

        ~ConnectionPool();

        /// @brief Hand out the most recently released live connection, or
        /// open a new one while under capacity.
        /// @return A connection, std::nullopt when exhausted, or the
        /// connector's error when opening a new connection failed.
        AcquireResult acquire();

        /// @brief Return a checked-out connection.
        /// @param reuse False closes the connection unconditionally.
        void release(PooledConnection conn, bool reuse);

        /// @brief Close every idle connection. Checked-out connections are
        /// untouched and may still be released here afterwards.
        void close_all();

        EndpointStats stats() const;

        const EndpointKey& key() const noexcept { return key_; }

        std::size_t idle_count() const;
        std::size_t in_use_count() const;

        /// @brief Open connections attributed to this pool.
        std::size_t open_count() const;

       private:
        std::size_t capacity_() const noexcept;

        /// @brief Account for a checked-out connection that is being closed
        void retire_in_use_locked_() noexcept;

        EndpointKey key_;
        std::shared_ptr<Connector> connector_;
        CapacitySlot capacity_slot_;

        mutable std::mutex mu_;
        std::vector<PooledConnection> idle_;  ///< back() is reused first

        std::uint64_t created_{0};
        std::uint64_t reused_{0};
        std::uint64_t failed_{0};
        std::uint64_t closed_{0};
        std::size_t in_use_{0};
        std::uint64_t next_id_{1};
    };

}  // namespace scanpool
