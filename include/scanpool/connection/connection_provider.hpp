#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string_view>

#include "scanpool/connection/connection_pool_registry.hpp"
#include "scanpool/connection/pooled_connection.hpp"
#include "scanpool/connection/transport.hpp"
#include "scanpool/endpoint.hpp"
#include "scanpool/result.hpp"

namespace scanpool {

    class ConnectionProvider;

    /**
     * @brief A connection checked out from a ConnectionProvider.
     *
     * Move-only. Hands the connection back to its provider on destruction or
     * on release(): with reuse, unless mark_failed() was called or the peer
     * closed the connection.
     *
     * @note The provider must outlive every lease it handed out.
     */
    class Lease {
       public:
        Lease() = default;

        Lease(Lease&& other) noexcept { move_from(std::move(other)); }

        Lease& operator=(Lease&& other) noexcept {
            if (this != &other) {
                release();
                move_from(std::move(other));
            }
            return *this;
        }

        Lease(Lease const&) = delete;
        Lease& operator=(Lease const&) = delete;

        ~Lease() { release(); }

        Transport* operator->() const noexcept { return conn_.transport(); }
        Transport* get() const noexcept { return conn_.transport(); }

        explicit operator bool() const noexcept { return get() != nullptr; }

        EndpointKey const& endpoint() const noexcept {
            return conn_.endpoint();
        }

        std::uint64_t id() const noexcept { return conn_.id(); }

        /// @brief True when the connection came out of a pool rather than
        /// being opened for this lease alone.
        bool pooled() const noexcept { return pooled_; }

        /// @brief Do not reuse this connection once it is handed back.
        void mark_failed() noexcept { failed_ = true; }

        /// @brief Hand the connection back now. The lease becomes empty.
        void release() noexcept;

       private:
        friend class ConnectionProvider;

        Lease(ConnectionProvider* owner, PooledConnection conn, bool pooled)
            : owner_(owner), conn_(std::move(conn)), pooled_(pooled) {}

        void move_from(Lease&& other) noexcept {
            owner_ = other.owner_;
            conn_ = std::move(other.conn_);
            pooled_ = other.pooled_;
            failed_ = other.failed_;
            other.owner_ = nullptr;
            other.failed_ = false;
        }

        ConnectionProvider* owner_{nullptr};
        PooledConnection conn_;
        bool pooled_{false};
        bool failed_{false};
    };

    /**
     * @brief Where the HTTP layer gets its connections from. Picked once, at
     * construction of the caller.
     */
    class ConnectionProvider {
       public:
        virtual ~ConnectionProvider() = default;

        /// @brief Check out a connection to key.
        /// @return A lease, or the connection-creation error.
        virtual Result<Lease> lease(const EndpointKey& key) = 0;

        virtual std::string_view name() const noexcept = 0;

       protected:
        friend class Lease;

        static Lease make_lease(ConnectionProvider* owner, PooledConnection conn,
                                bool pooled) {
            return Lease(owner, std::move(conn), pooled);
        }

        /// @brief Take back a connection handed out by lease().
        virtual void give_back(PooledConnection conn, bool pooled,
                               bool reuse) = 0;
    };

    /**
     * @brief Leases from a ConnectionPoolRegistry.
     *
     * When the endpoint's pool is exhausted a fresh connection is opened with
     * the fallback connector. It is closed, never pooled, when handed back.
     */
    class PooledConnectionProvider final : public ConnectionProvider {
       public:
        /// @param usage_counter Optional shared tally of pooled leases, bumped
        /// alongside pooled_leases(). Must outlive the provider.
        PooledConnectionProvider(
            ConnectionPoolRegistry& registry,
            std::shared_ptr<Connector> fallback,
            std::atomic<std::uint64_t>* usage_counter = nullptr);

        Result<Lease> lease(const EndpointKey& key) override;

        std::string_view name() const noexcept override { return "pooled"; }

        /// @brief Leases served out of the registry.
        std::uint64_t pooled_leases() const noexcept {
            return pooled_leases_.load(std::memory_order_relaxed);
        }

        /// @brief Leases served by the fallback connector on exhaustion.
        std::uint64_t fallback_leases() const noexcept {
            return fallback_leases_.load(std::memory_order_relaxed);
        }

       protected:
        void give_back(PooledConnection conn, bool pooled,
                       bool reuse) override;

       private:
        ConnectionPoolRegistry& registry_;
        std::shared_ptr<Connector> fallback_;
        std::atomic<std::uint64_t>* usage_counter_;
        std::atomic<std::uint64_t> pooled_leases_{0};
        std::atomic<std::uint64_t> fallback_leases_{0};
    };

    /// @brief Opens a new connection per lease and closes it on return.
    class DirectConnectionProvider final : public ConnectionProvider {
       public:
        explicit DirectConnectionProvider(std::shared_ptr<Connector> connector);

        Result<Lease> lease(const EndpointKey& key) override;

        std::string_view name() const noexcept override { return "direct"; }

       protected:
        void give_back(PooledConnection conn, bool pooled,
                       bool reuse) override;

       private:
        std::shared_ptr<Connector> connector_;
    };

}  // namespace scanpool
