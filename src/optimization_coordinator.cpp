#include "scanpool/optimization_coordinator.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <utility>

#include "scanpool/log.hpp"

namespace scanpool {

    namespace {

        enum class ConfigKind {
            PositiveInt,
            OptionalPositiveInt,
            Bool,
        };

        const std::map<std::string, ConfigKind, std::less<>>& config_kinds() {
            static const std::map<std::string, ConfigKind, std::less<>> kinds{
                {"max_connections_per_host", ConfigKind::PositiveInt},
                {"thread_pool_size", ConfigKind::OptionalPositiveInt},
                {"query_cache_size", ConfigKind::PositiveInt},
                {"enable_http2", ConfigKind::Bool},
                {"enable_compression", ConfigKind::Bool},
                {"enable_dns_cache", ConfigKind::Bool},
            };
            return kinds;
        }

        bool accepts(ConfigKind kind, const ConfigValue& value) {
            switch (kind) {
                case ConfigKind::PositiveInt:
                    return std::holds_alternative<std::int64_t>(value) &&
                           std::get<std::int64_t>(value) > 0;
                case ConfigKind::OptionalPositiveInt:
                    return std::holds_alternative<std::monostate>(value) ||
                           (std::holds_alternative<std::int64_t>(value) &&
                            std::get<std::int64_t>(value) > 0);
                case ConfigKind::Bool:
                    return std::holds_alternative<bool>(value);
            }
            return false;
        }

        std::string lower(std::string_view s) {
            std::string out(s);
            std::transform(out.begin(), out.end(), out.begin(),
                           [](unsigned char c) { return std::tolower(c); });
            return out;
        }

        std::optional<ConfigValue> parse_config_text(ConfigKind kind,
                                                     std::string_view text) {
            const std::string t = lower(text);

            if (kind == ConfigKind::Bool) {
                if (t == "true" || t == "yes" || t == "1") return ConfigValue{true};
                if (t == "false" || t == "no" || t == "0")
                    return ConfigValue{false};
                return std::nullopt;
            }

            if (kind == ConfigKind::OptionalPositiveInt &&
                (t.empty() || t == "none")) {
                return ConfigValue{std::monostate{}};
            }

            std::int64_t n = 0;
            const char* first = t.data();
            const char* last = t.data() + t.size();
            auto [ptr, ec] = std::from_chars(first, last, n);
            if (ec != std::errc() || ptr != last || t.empty()) {
                return std::nullopt;
            }
            return ConfigValue{n};
        }

    }  // namespace

    std::string to_string(const ConfigValue& value) {
        if (std::holds_alternative<std::monostate>(value)) return "none";
        if (std::holds_alternative<bool>(value)) {
            return std::get<bool>(value) ? "true" : "false";
        }
        return std::to_string(std::get<std::int64_t>(value));
    }

    OptimizationCoordinator::OptimizationCoordinator(
        std::shared_ptr<Connector> connector,
        WorkerPoolConfiguration worker_cfg)
        : connector_(std::move(connector)),
          registry_(connector_, kDefaultMaxConnectionsPerHost),
          worker_pool_(worker_cfg) {
        for (auto const& name : flag_names()) flags_.emplace(name, false);
    }

    const std::vector<std::string>& OptimizationCoordinator::flag_names() {
        static const std::vector<std::string> names{
            std::string(flags::kHttpConnectionPool),
            std::string(flags::kThreadPool),
            std::string(flags::kQueryCache),
            std::string(flags::kMemoryOptimization),
            std::string(flags::kNetworkOptimization),
            std::string(flags::kCodeOptimization),
        };
        return names;
    }

    const std::vector<std::string>& OptimizationCoordinator::config_keys() {
        static const std::vector<std::string> keys{
            "max_connections_per_host", "thread_pool_size",
            "query_cache_size",         "enable_http2",
            "enable_compression",       "enable_dns_cache",
        };
        return keys;
    }

    bool OptimizationCoordinator::set_flag(std::string_view name,
                                           bool enabled) {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = flags_.find(name);
        if (it == flags_.end()) {
            log::get()->debug("unknown optimization '{}'", name);
            return false;
        }

        it->second = enabled;
        if (!enabled) return true;

        if (!enabled_since_) enabled_since_ = std::chrono::steady_clock::now();

        if (name == flags::kHttpConnectionPool) {
            registry_.set_max_connections_per_host(
                static_cast<std::size_t>(settings_.max_connections_per_host));
            log::get()->info("HTTP connection pool enabled ({} per host)",
                             settings_.max_connections_per_host);
        } else if (name == flags::kThreadPool) {
            log::get()->info("thread pool enabled (size: {})",
                             settings_.thread_pool_size
                                 ? std::to_string(*settings_.thread_pool_size)
                                 : std::string("auto"));
        } else if (name == flags::kQueryCache) {
            cache_ = std::make_shared<QueryResultCache>(
                static_cast<std::size_t>(settings_.query_cache_size));
            log::get()->info("query cache enabled ({} entries)",
                             settings_.query_cache_size);
        }
        return true;
    }

    bool OptimizationCoordinator::enabled_locked_(std::string_view name) const {
        auto it = flags_.find(name);
        return it != flags_.end() && it->second;
    }

    bool OptimizationCoordinator::is_enabled(std::string_view name) const {
        std::lock_guard<std::mutex> lk(mu_);
        return enabled_locked_(name);
    }

    bool OptimizationCoordinator::set_config(std::string_view key,
                                             ConfigValue value) {
        auto const& kinds = config_kinds();
        auto kind = kinds.find(key);
        if (kind == kinds.end()) {
            log::get()->debug("unknown optimization setting '{}'", key);
            return false;
        }
        if (!accepts(kind->second, value)) {
            log::get()->debug("rejected {}={}", key, to_string(value));
            return false;
        }

        std::lock_guard<std::mutex> lk(mu_);
        if (key == "max_connections_per_host") {
            settings_.max_connections_per_host = std::get<std::int64_t>(value);
            if (enabled_locked_(flags::kHttpConnectionPool)) {
                registry_.set_max_connections_per_host(
                    static_cast<std::size_t>(
                        settings_.max_connections_per_host));
            }
        } else if (key == "thread_pool_size") {
            if (std::holds_alternative<std::monostate>(value)) {
                settings_.thread_pool_size.reset();
            } else {
                settings_.thread_pool_size = std::get<std::int64_t>(value);
            }
        } else if (key == "query_cache_size") {
            settings_.query_cache_size = std::get<std::int64_t>(value);
            if (cache_) {
                cache_->set_capacity(
                    static_cast<std::size_t>(settings_.query_cache_size));
            }
        } else if (key == "enable_http2") {
            settings_.enable_http2 = std::get<bool>(value);
        } else if (key == "enable_compression") {
            settings_.enable_compression = std::get<bool>(value);
        } else if (key == "enable_dns_cache") {
            settings_.enable_dns_cache = std::get<bool>(value);
        }
        return true;
    }

    bool OptimizationCoordinator::set_config_text(std::string_view key,
                                                  std::string_view text) {
        auto const& kinds = config_kinds();
        auto kind = kinds.find(key);
        if (kind == kinds.end()) return false;

        auto value = parse_config_text(kind->second, text);
        if (!value) {
            log::get()->debug("cannot parse '{}' for {}", text, key);
            return false;
        }
        return set_config(key, std::move(*value));
    }

    std::optional<ConfigValue> OptimizationCoordinator::config_locked_(
        std::string_view key) const {
        if (key == "max_connections_per_host") {
            return ConfigValue{settings_.max_connections_per_host};
        }
        if (key == "thread_pool_size") {
            if (!settings_.thread_pool_size) return ConfigValue{std::monostate{}};
            return ConfigValue{*settings_.thread_pool_size};
        }
        if (key == "query_cache_size") {
            return ConfigValue{settings_.query_cache_size};
        }
        if (key == "enable_http2") return ConfigValue{settings_.enable_http2};
        if (key == "enable_compression") {
            return ConfigValue{settings_.enable_compression};
        }
        if (key == "enable_dns_cache") {
            return ConfigValue{settings_.enable_dns_cache};
        }
        return std::nullopt;
    }

    std::optional<ConfigValue> OptimizationCoordinator::config(
        std::string_view key) const {
        std::lock_guard<std::mutex> lk(mu_);
        return config_locked_(key);
    }

    bool OptimizationCoordinator::enable_all() {
        bool all = true;
        for (auto const& name : flag_names()) {
            if (!set_flag(name, true)) all = false;
        }
        return all;
    }

    void OptimizationCoordinator::disable_all() {
        {
            std::lock_guard<std::mutex> lk(mu_);
            for (auto& [_, on] : flags_) on = false;
            cache_.reset();
        }
        registry_.clear();
        log::get()->info("all optimizations disabled");
    }

    std::map<std::string, bool> OptimizationCoordinator::flags() const {
        std::lock_guard<std::mutex> lk(mu_);
        return std::map<std::string, bool>(flags_.begin(), flags_.end());
    }

    std::map<std::string, ConfigValue>
    OptimizationCoordinator::config_snapshot() const {
        std::lock_guard<std::mutex> lk(mu_);
        std::map<std::string, ConfigValue> out;
        for (auto const& key : config_keys()) {
            if (auto v = config_locked_(key)) out.emplace(key, *v);
        }
        return out;
    }

    OptimizationSettings OptimizationCoordinator::settings() const {
        std::lock_guard<std::mutex> lk(mu_);
        return settings_;
    }

    std::unique_ptr<ConnectionProvider>
    OptimizationCoordinator::make_connection_provider() {
        if (is_enabled(flags::kHttpConnectionPool)) {
            return std::make_unique<PooledConnectionProvider>(
                registry_, connector_, &http_pool_usage_);
        }
        return std::make_unique<DirectConnectionProvider>(connector_);
    }

    BatchResult OptimizationCoordinator::run_batch(
        std::int64_t requested, UnitOfWork unit, std::function<void()> cleanup,
        bool propagate_first_error, std::stop_token interrupt) {
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (enabled_locked_(flags::kThreadPool)) {
                thread_pool_usage_.fetch_add(1, std::memory_order_relaxed);
                if (settings_.thread_pool_size) {
                    requested = *settings_.thread_pool_size;
                }
            }
        }
        return worker_pool_.run(requested, std::move(unit), std::move(cleanup),
                                propagate_first_error, std::move(interrupt));
    }

    std::string OptimizationCoordinator::cached_query(
        const std::string& key, const std::function<std::string()>& compute) {
        std::shared_ptr<QueryResultCache> cache = query_cache();
        if (!cache) return compute();
        return cache->get_or_compute(key, compute);
    }

    std::shared_ptr<QueryResultCache> OptimizationCoordinator::query_cache()
        const {
        std::lock_guard<std::mutex> lk(mu_);
        return enabled_locked_(flags::kQueryCache) ? cache_ : nullptr;
    }

    OptimizationStats OptimizationCoordinator::stats() const {
        OptimizationStats out;
        {
            std::lock_guard<std::mutex> lk(mu_);
            out.flags =
                std::map<std::string, bool>(flags_.begin(), flags_.end());
            for (auto const& key : config_keys()) {
                if (auto v = config_locked_(key)) out.config.emplace(key, *v);
            }
            if (cache_) {
                out.cache_hits = cache_->hits();
                out.cache_misses = cache_->misses();
            }
            if (enabled_since_) {
                out.elapsed = std::chrono::steady_clock::now() - *enabled_since_;
            }
        }
        out.endpoints = registry_.stats();
        out.thread_pool_usage_count =
            thread_pool_usage_.load(std::memory_order_relaxed);
        out.http_pool_usage_count =
            http_pool_usage_.load(std::memory_order_relaxed);
        return out;
    }

    void OptimizationCoordinator::log_statistics() const {
        const OptimizationStats s = stats();
        auto logger = log::get();

        auto state = [&s](std::string_view name) {
            auto it = s.flags.find(std::string(name));
            return it != s.flags.end() && it->second ? "enabled" : "disabled";
        };

        logger->info("=== optimization statistics ===");
        logger->info("thread pool usage count: {}", s.thread_pool_usage_count);
        logger->info("HTTP connection pool usage count: {}",
                     s.http_pool_usage_count);
        logger->info("query cache hit ratio: {}/{} ({:.2f}%)", s.cache_hits,
                     s.cache_hits + s.cache_misses,
                     s.cache_hit_ratio() * 100.0);
        logger->info("total runtime: {:.2f}s", s.elapsed.count());
        for (auto const& [label, ep] : s.endpoints) {
            logger->info("{}: created={} reused={} failed={} active={}", label,
                         ep.created, ep.reused, ep.failed, ep.active);
        }
        logger->info("optimizations: thread pool={}, HTTP connection pool={}, "
                     "query cache={}",
                     state(flags::kThreadPool),
                     state(flags::kHttpConnectionPool),
                     state(flags::kQueryCache));
        logger->info("===============================");
    }

}  // namespace scanpool
