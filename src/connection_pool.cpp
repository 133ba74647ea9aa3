#include "scanpool/connection/connection_pool.hpp"

#include <utility>

#include "scanpool/log.hpp"

namespace scanpool {

    ConnectionPool::ConnectionPool(EndpointKey key,
                                   std::shared_ptr<Connector> connector,
                                   CapacitySlot capacity)
        : key_(std::move(key)),
          connector_(std::move(connector)),
          capacity_slot_(std::move(capacity)) {}

    ConnectionPool::~ConnectionPool() { close_all(); }

    std::size_t ConnectionPool::capacity_() const noexcept {
        return capacity_slot_ ? capacity_slot_->load(std::memory_order_acquire)
                              : 0;
    }

    void ConnectionPool::retire_in_use_locked_() noexcept {
        if (in_use_ > 0) --in_use_;
        ++closed_;
    }

    AcquireResult ConnectionPool::acquire() {
        std::lock_guard<std::mutex> lk(mu_);

        // Prefer the most recently released connection
        while (!idle_.empty()) {
            PooledConnection conn = std::move(idle_.back());
            idle_.pop_back();

            if (conn.is_live()) {
                ++reused_;
                ++in_use_;
                conn.touch();
                return AcquireResult::ok(std::move(conn));
            }

            ++failed_;
            ++closed_;
            log::get()->debug("dropping stale idle connection #{} to {}",
                              conn.id(), key_.label());
            conn.close();
        }

        const std::size_t open = in_use_ + idle_.size();
        if (open >= capacity_()) {
            return AcquireResult::ok(std::nullopt);
        }

        auto transport = connector_->connect(key_);
        if (transport.has_error()) {
            return AcquireResult::err(std::move(transport).error());
        }

        ++created_;
        ++in_use_;
        return AcquireResult::ok(
            PooledConnection(key_, std::move(transport).value(), next_id_++));
    }

    void ConnectionPool::release(PooledConnection conn, bool reuse) {
        if (!conn) return;

        if (conn.endpoint() != key_) {
            log::get()->debug(
                "connection to {} released to pool {}, closing it",
                conn.endpoint().label(), key_.label());
            conn.close();
            return;
        }

        const bool live = reuse && conn.is_live();

        std::lock_guard<std::mutex> lk(mu_);
        if (!reuse) {
            retire_in_use_locked_();
            conn.close();
            return;
        }

        if (!live) {
            ++failed_;
            retire_in_use_locked_();
            conn.close();
            return;
        }

        if (idle_.size() < capacity_()) {
            if (in_use_ > 0) --in_use_;
            conn.touch();
            idle_.push_back(std::move(conn));
            return;
        }

        // Pool is full, close the surplus instead of growing
        retire_in_use_locked_();
        conn.close();
    }

    void ConnectionPool::close_all() {
        std::vector<PooledConnection> drained;
        {
            std::lock_guard<std::mutex> lk(mu_);
            drained.swap(idle_);
            closed_ += drained.size();
        }

        for (auto& conn : drained) conn.close();
    }

    EndpointStats ConnectionPool::stats() const {
        std::lock_guard<std::mutex> lk(mu_);
        EndpointStats out;
        out.created = created_;
        out.reused = reused_;
        out.failed = failed_;
        out.active = idle_.size();
        return out;
    }

    std::size_t ConnectionPool::idle_count() const {
        std::lock_guard<std::mutex> lk(mu_);
        return idle_.size();
    }

    std::size_t ConnectionPool::in_use_count() const {
        std::lock_guard<std::mutex> lk(mu_);
        return in_use_;
    }

    std::size_t ConnectionPool::open_count() const {
        std::lock_guard<std::mutex> lk(mu_);
        return in_use_ + idle_.size();
    }

}  // namespace scanpool
