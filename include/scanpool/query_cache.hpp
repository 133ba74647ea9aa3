#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>

namespace scanpool {

    /**
     * @brief Bounded memo table for query results.
     *
     * Eviction is FIFO: once full, the entry inserted first goes first,
     * however often it was hit.
     *
     * Thread-safe. compute() runs without the lock held, so two threads
     * missing on the same key may both compute it; the first insert wins.
     */
    template <typename Key, typename Value, typename Hash = std::hash<Key>>
    class QueryCache {
       public:
        explicit QueryCache(std::size_t capacity) : capacity_(capacity) {}

        QueryCache(const QueryCache&) = delete;
        QueryCache& operator=(const QueryCache&) = delete;

        template <typename Compute>
        Value get_or_compute(const Key& key, Compute&& compute) {
            {
                std::lock_guard<std::mutex> lk(mu_);
                auto it = entries_.find(key);
                if (it != entries_.end()) {
                    hits_.fetch_add(1, std::memory_order_relaxed);
                    return it->second;
                }
            }
            misses_.fetch_add(1, std::memory_order_relaxed);

            Value value = std::forward<Compute>(compute)();

            std::lock_guard<std::mutex> lk(mu_);
            if (capacity_ == 0) return value;
            if (entries_.find(key) != entries_.end()) return value;

            while (entries_.size() >= capacity_) evict_oldest_locked_();
            entries_.emplace(key, value);
            order_.push_back(key);
            return value;
        }

        std::optional<Value> find(const Key& key) const {
            std::lock_guard<std::mutex> lk(mu_);
            auto it = entries_.find(key);
            if (it == entries_.end()) return std::nullopt;
            return it->second;
        }

        /// @brief Shrinking evicts the oldest entries right away.
        void set_capacity(std::size_t capacity) {
            std::lock_guard<std::mutex> lk(mu_);
            capacity_ = capacity;
            while (entries_.size() > capacity_) evict_oldest_locked_();
        }

        std::size_t capacity() const {
            std::lock_guard<std::mutex> lk(mu_);
            return capacity_;
        }

        std::size_t size() const {
            std::lock_guard<std::mutex> lk(mu_);
            return entries_.size();
        }

        void clear() {
            std::lock_guard<std::mutex> lk(mu_);
            entries_.clear();
            order_.clear();
        }

        std::uint64_t hits() const noexcept {
            return hits_.load(std::memory_order_relaxed);
        }

        std::uint64_t misses() const noexcept {
            return misses_.load(std::memory_order_relaxed);
        }

       private:
        void evict_oldest_locked_() {
            if (order_.empty()) return;
            entries_.erase(order_.front());
            order_.pop_front();
        }

        mutable std::mutex mu_;
        std::size_t capacity_;
        std::unordered_map<Key, Value, Hash> entries_;
        std::deque<Key> order_;
        std::atomic<std::uint64_t> hits_{0};
        std::atomic<std::uint64_t> misses_{0};
    };

}  // namespace scanpool
