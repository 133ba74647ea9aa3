#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "scanpool/config.hpp"
#include "scanpool/connection/connection_pool_registry.hpp"
#include "scanpool/connection/connection_provider.hpp"
#include "scanpool/connection/transport.hpp"
#include "scanpool/query_cache.hpp"
#include "scanpool/worker/worker_pool.hpp"

namespace scanpool {

    /// @brief Value of one configuration key. std::monostate means "unset"
    /// and is accepted for thread_pool_size only.
    using ConfigValue = std::variant<std::monostate, std::int64_t, bool>;

    std::string to_string(const ConfigValue& value);

    using QueryResultCache = QueryCache<std::string, std::string>;

    namespace flags {
        inline constexpr std::string_view kHttpConnectionPool =
            "http_connection_pool";
        inline constexpr std::string_view kThreadPool = "thread_pool";
        inline constexpr std::string_view kQueryCache = "query_cache";
        inline constexpr std::string_view kMemoryOptimization =
            "memory_optimization";
        inline constexpr std::string_view kNetworkOptimization =
            "network_optimization";
        inline constexpr std::string_view kCodeOptimization =
            "code_optimization";
    }  // namespace flags

    /// @brief Read-only snapshot for logs and the CLI.
    struct OptimizationStats {
        std::map<std::string, bool> flags;
        std::map<std::string, ConfigValue> config;
        std::map<std::string, EndpointStats> endpoints;
        std::uint64_t cache_hits{0};
        std::uint64_t cache_misses{0};
        std::uint64_t thread_pool_usage_count{0};
        std::uint64_t http_pool_usage_count{0};
        /// Zero until a flag was first enabled.
        std::chrono::duration<double> elapsed{0};

        /// @brief Hits over lookups, 0 when nothing was looked up.
        double cache_hit_ratio() const noexcept {
            const std::uint64_t total = cache_hits + cache_misses;
            return total == 0 ? 0.0
                              : static_cast<double>(cache_hits) /
                                    static_cast<double>(total);
        }
    };

    /**
     * Facade that switches the pooling, batching and caching layers on and
     * off and reports how they were used.
     *
     * LIFECYCLE:
     * - Construct exactly one at process startup and hand references to the
     *   HTTP and orchestration layers
     * - Owns the ConnectionPoolRegistry, the WorkerPool and the query cache;
     *   nothing of this is reachable through globals
     *
     * CONFIGURATION:
     * - set_flag()/set_config() reject unknown names and mistyped values by
     *   returning false, with nothing applied
     * - All flags start disabled, all keys start at their defaults
     *
     * Thread-safe.
     */
    class OptimizationCoordinator {
       public:
        explicit OptimizationCoordinator(std::shared_ptr<Connector> connector,
                                         WorkerPoolConfiguration worker_cfg = {});

        OptimizationCoordinator(const OptimizationCoordinator&) = delete;
        OptimizationCoordinator& operator=(const OptimizationCoordinator&) =
            delete;

        static const std::vector<std::string>& flag_names();
        static const std::vector<std::string>& config_keys();

        /// @return False for an unknown flag.
        bool set_flag(std::string_view name, bool enabled = true);
        bool is_enabled(std::string_view name) const;

        /// @return False for an unknown key or a value of the wrong type or
        /// range. Nothing is applied in that case.
        bool set_config(std::string_view key, ConfigValue value);

        /// @brief Parse text from the command line by the key's type, then
        /// set_config(). Booleans take true/false/yes/no/1/0, integers take
        /// decimal digits, thread_pool_size also takes "none" or "".
        bool set_config_text(std::string_view key, std::string_view text);

        std::optional<ConfigValue> config(std::string_view key) const;

        /// @return True only if every flag was enabled.
        bool enable_all();

        /// @brief Disable every flag, drop the query cache and close all idle
        /// pooled connections.
        void disable_all();

        std::map<std::string, bool> flags() const;
        std::map<std::string, ConfigValue> config_snapshot() const;
        OptimizationSettings settings() const;

        /// @brief Pooled provider when http_connection_pool is on, direct
        /// provider otherwise. The result must not outlive the coordinator.
        std::unique_ptr<ConnectionProvider> make_connection_provider();

        /// @brief WorkerPool::run() with the configured thread count applied
        /// when thread_pool is on.
        BatchResult run_batch(std::int64_t requested, UnitOfWork unit,
                              std::function<void()> cleanup = {},
                              bool propagate_first_error = true,
                              std::stop_token interrupt = {});

        /// @brief Look key up in the query cache, computing and storing it on
        /// a miss. Without query_cache enabled compute() just runs.
        std::string cached_query(const std::string& key,
                                 const std::function<std::string()>& compute);

        ConnectionPoolRegistry& registry() noexcept { return registry_; }
        WorkerPool& worker_pool() noexcept { return worker_pool_; }

        /// @brief Null while query_cache is off.
        std::shared_ptr<QueryResultCache> query_cache() const;

        OptimizationStats stats() const;

        /// @brief Write stats() through the library logger at info level.
        void log_statistics() const;

       private:
        bool enabled_locked_(std::string_view name) const;
        std::optional<ConfigValue> config_locked_(std::string_view key) const;

        std::shared_ptr<Connector> connector_;
        ConnectionPoolRegistry registry_;
        WorkerPool worker_pool_;

        mutable std::mutex mu_;
        std::map<std::string, bool, std::less<>> flags_;
        OptimizationSettings settings_;
        std::shared_ptr<QueryResultCache> cache_;
        std::optional<std::chrono::steady_clock::time_point> enabled_since_;

        std::atomic<std::uint64_t> thread_pool_usage_{0};
        std::atomic<std::uint64_t> http_pool_usage_{0};
    };

}  // namespace scanpool
