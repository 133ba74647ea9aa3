#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>

#include "scanpool/connection/pooled_connection.hpp"
#include "scanpool/result.hpp"

namespace scanpool {

    /// @brief Outcome of an acquire: a connection, or std::nullopt when the
    /// pool is exhausted. An Error means creating a new connection failed.
    using AcquireResult = Result<std::optional<PooledConnection>>;

    /// @brief Capacity slot shared by every pool of a registry. Pools read
    /// it at acquire/release time, so changes apply on the next call.
    using CapacitySlot = std::shared_ptr<std::atomic<std::size_t>>;

    /// @brief Snapshot of one pool's counters.
    struct EndpointStats {
        std::uint64_t created{0};  ///< Connections opened by this pool
        std::uint64_t reused{0};   ///< Idle connections handed out again
        std::uint64_t failed{0};   ///< Connections dropped by a failed probe
        std::size_t active{0};     ///< Idle connections at snapshot time

        friend bool operator==(EndpointStats const&,
                               EndpointStats const&) = default;
    };

}  // namespace scanpool
