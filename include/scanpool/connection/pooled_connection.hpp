#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <utility>

#include "scanpool/connection/transport.hpp"
#include "scanpool/endpoint.hpp"
#include "scanpool/log.hpp"

namespace scanpool {

    /**
     * @brief One live transport plus the bookkeeping a pool needs.
     *
     * Move-only: ownership passes from a pool's idle set to the caller and
     * back, and never exists in two places at once.
     */
    class PooledConnection {
       public:
        using clock_type = std::chrono::steady_clock;

        PooledConnection() = default;

        PooledConnection(EndpointKey key, TransportPtr transport,
                         std::uint64_t id)
            : key_(std::move(key)),
              transport_(std::move(transport)),
              id_(id),
              created_(clock_type::now()),
              last_used_(created_) {}

        PooledConnection(PooledConnection&&) noexcept = default;
        PooledConnection& operator=(PooledConnection&&) noexcept = default;
        PooledConnection(const PooledConnection&) = delete;
        PooledConnection& operator=(const PooledConnection&) = delete;

        ~PooledConnection() { close(); }

        Transport* operator->() const noexcept { return transport_.get(); }
        Transport* transport() const noexcept { return transport_.get(); }

        explicit operator bool() const noexcept {
            return transport_ != nullptr;
        }

        const EndpointKey& endpoint() const noexcept { return key_; }
        std::uint64_t id() const noexcept { return id_; }
        clock_type::time_point created() const noexcept { return created_; }
        clock_type::time_point last_used() const noexcept { return last_used_; }

        void touch() noexcept { last_used_ = clock_type::now(); }

        /// @brief Liveness probe. Fails closed: a closed transport, a bad
        /// descriptor or a probe that throws all count as dead.
        bool is_live() const noexcept {
            if (!transport_) return false;
            try {
                return transport_->is_open() && transport_->probe();
            } catch (const std::exception& e) {
                log::get()->debug("liveness probe for {} threw: {}",
                                  key_.label(), e.what());
                return false;
            }
        }

        /// @brief Close and drop the transport. Safe to call twice.
        void close() noexcept {
            if (!transport_) return;
            transport_->close();
            transport_.reset();
        }

       private:
        EndpointKey key_{};
        TransportPtr transport_;
        std::uint64_t id_{0};
        clock_type::time_point created_{};
        clock_type::time_point last_used_{};
    };

}  // namespace scanpool
