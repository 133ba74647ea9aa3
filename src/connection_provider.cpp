#include "scanpool/connection/connection_provider.hpp"

#include <exception>
#include <optional>
#include <utility>

#include "scanpool/log.hpp"

namespace scanpool {

    void Lease::release() noexcept {
        if (!owner_ || !conn_) return;

        ConnectionProvider* owner = owner_;
        owner_ = nullptr;
        const EndpointKey key = conn_.endpoint();

        // A connection the server closed is retired, not counted as failed
        const bool reuse = !failed_ && conn_->is_open();
        try {
            owner->give_back(std::move(conn_), pooled_, reuse);
        } catch (const std::exception& e) {
            log::get()->warn("returning connection to {} failed: {}",
                             key.label(), e.what());
        }
        failed_ = false;
    }

    PooledConnectionProvider::PooledConnectionProvider(
        ConnectionPoolRegistry& registry, std::shared_ptr<Connector> fallback,
        std::atomic<std::uint64_t>* usage_counter)
        : registry_(registry),
          fallback_(std::move(fallback)),
          usage_counter_(usage_counter) {}

    Result<Lease> PooledConnectionProvider::lease(const EndpointKey& key) {
        auto acquired = registry_.acquire(key);
        if (acquired.has_error()) {
            return Result<Lease>::err(std::move(acquired).error());
        }

        std::optional<PooledConnection> conn = std::move(acquired).value();
        if (conn) {
            pooled_leases_.fetch_add(1, std::memory_order_relaxed);
            if (usage_counter_) {
                usage_counter_->fetch_add(1, std::memory_order_relaxed);
            }
            return Result<Lease>::ok(make_lease(this, std::move(*conn), true));
        }

        log::get()->debug("pool for {} exhausted, opening unpooled connection",
                          key.label());
        auto transport = fallback_->connect(key);
        if (transport.has_error()) {
            return Result<Lease>::err(std::move(transport).error());
        }

        fallback_leases_.fetch_add(1, std::memory_order_relaxed);
        return Result<Lease>::ok(make_lease(
            this, PooledConnection(key, std::move(transport).value(), 0),
            false));
    }

    void PooledConnectionProvider::give_back(PooledConnection conn,
                                             bool pooled, bool reuse) {
        if (!pooled) {
            conn.close();
            return;
        }
        const EndpointKey key = conn.endpoint();
        registry_.release(key, std::move(conn), reuse);
    }

    DirectConnectionProvider::DirectConnectionProvider(
        std::shared_ptr<Connector> connector)
        : connector_(std::move(connector)) {}

    Result<Lease> DirectConnectionProvider::lease(const EndpointKey& key) {
        auto transport = connector_->connect(key);
        if (transport.has_error()) {
            return Result<Lease>::err(std::move(transport).error());
        }
        return Result<Lease>::ok(make_lease(
            this, PooledConnection(key, std::move(transport).value(), 0),
            false));
    }

    void DirectConnectionProvider::give_back(PooledConnection conn, bool,
                                             bool) {
        conn.close();
    }

}  // namespace scanpool
