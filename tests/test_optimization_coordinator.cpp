#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>
#include <sstream>
#include <string>
#include <thread>
#include <variant>

#include "scanpool/log.hpp"
#include "scanpool/optimization_coordinator.hpp"
#include "test_support.hpp"

using namespace scanpool;
using scanpool::test::FakeConnector;

namespace {

    const EndpointKey kKey = make_endpoint("a.com", 80, false);

    // Route the library logger into a string for the duration of a test.
    class CapturedLog {
       public:
        CapturedLog() {
            auto sink =
                std::make_shared<spdlog::sinks::ostream_sink_mt>(out_);
            sink->set_pattern("%l %v");
            auto logger = std::make_shared<spdlog::logger>(
                log::kLoggerName, std::move(sink));
            logger->set_level(spdlog::level::debug);
            log::set_logger(logger);
        }

        ~CapturedLog() { log::set_logger(nullptr); }

        std::string text() const { return out_.str(); }

       private:
        std::ostringstream out_;
    };

}  // namespace

TEST(OptimizationCoordinatorTest, EverythingStartsDisabled) {
    OptimizationCoordinator coord(std::make_shared<FakeConnector>());

    auto flags = coord.flags();
    EXPECT_EQ(flags.size(), 6u);
    for (auto const& [name, on] : flags) EXPECT_FALSE(on) << name;

    auto cfg = coord.config_snapshot();
    EXPECT_EQ(std::get<std::int64_t>(cfg.at("max_connections_per_host")), 10);
    EXPECT_TRUE(std::holds_alternative<std::monostate>(cfg.at("thread_pool_size")));
    EXPECT_EQ(std::get<std::int64_t>(cfg.at("query_cache_size")), 100);
    EXPECT_TRUE(std::get<bool>(cfg.at("enable_http2")));
    EXPECT_TRUE(std::get<bool>(cfg.at("enable_compression")));
    EXPECT_TRUE(std::get<bool>(cfg.at("enable_dns_cache")));
    EXPECT_EQ(coord.query_cache(), nullptr);
}

TEST(OptimizationCoordinatorTest, UnknownFlagIsRejected) {
    OptimizationCoordinator coord(std::make_shared<FakeConnector>());
    EXPECT_FALSE(coord.set_flag("turbo_mode"));
    EXPECT_FALSE(coord.is_enabled("turbo_mode"));
    EXPECT_TRUE(coord.set_flag(flags::kThreadPool));
    EXPECT_TRUE(coord.is_enabled(flags::kThreadPool));
    EXPECT_TRUE(coord.set_flag(flags::kThreadPool, false));
    EXPECT_FALSE(coord.is_enabled(flags::kThreadPool));
}

TEST(OptimizationCoordinatorTest, ConfigRejectsWrongTypesWithoutApplying) {
    OptimizationCoordinator coord(std::make_shared<FakeConnector>());

    EXPECT_FALSE(coord.set_config("max_connections_per_host", true));
    EXPECT_FALSE(coord.set_config("max_connections_per_host", std::int64_t{0}));
    EXPECT_FALSE(coord.set_config("max_connections_per_host", std::monostate{}));
    EXPECT_FALSE(coord.set_config("enable_http2", std::int64_t{1}));
    EXPECT_FALSE(coord.set_config("query_cache_size", std::int64_t{-5}));
    EXPECT_FALSE(coord.set_config("no_such_key", std::int64_t{1}));

    EXPECT_EQ(coord.settings().max_connections_per_host, 10);
    EXPECT_EQ(coord.settings().query_cache_size, 100);
    EXPECT_TRUE(coord.settings().enable_http2);
    EXPECT_FALSE(coord.config("no_such_key").has_value());
}

TEST(OptimizationCoordinatorTest, ThreadPoolSizeAcceptsUnset) {
    OptimizationCoordinator coord(std::make_shared<FakeConnector>());

    EXPECT_TRUE(coord.set_config("thread_pool_size", std::int64_t{4}));
    EXPECT_EQ(coord.settings().thread_pool_size.value_or(0), 4);
    EXPECT_TRUE(coord.set_config("thread_pool_size", std::monostate{}));
    EXPECT_FALSE(coord.settings().thread_pool_size.has_value());
}

TEST(OptimizationCoordinatorTest, ConfigFromText) {
    OptimizationCoordinator coord(std::make_shared<FakeConnector>());

    EXPECT_TRUE(coord.set_config_text("max_connections_per_host", "25"));
    EXPECT_TRUE(coord.set_config_text("enable_compression", "no"));
    EXPECT_TRUE(coord.set_config_text("enable_dns_cache", "FALSE"));
    EXPECT_TRUE(coord.set_config_text("thread_pool_size", "8"));
    EXPECT_TRUE(coord.set_config_text("thread_pool_size", "none"));

    EXPECT_FALSE(coord.set_config_text("max_connections_per_host", "ten"));
    EXPECT_FALSE(coord.set_config_text("max_connections_per_host", "12abc"));
    EXPECT_FALSE(coord.set_config_text("query_cache_size", ""));
    EXPECT_FALSE(coord.set_config_text("enable_http2", "maybe"));
    EXPECT_FALSE(coord.set_config_text("unknown", "1"));

    auto s = coord.settings();
    EXPECT_EQ(s.max_connections_per_host, 25);
    EXPECT_FALSE(s.enable_compression);
    EXPECT_FALSE(s.enable_dns_cache);
    EXPECT_FALSE(s.thread_pool_size.has_value());
}

TEST(OptimizationCoordinatorTest, PoolCapacityFollowsConfigWhileEnabled) {
    OptimizationCoordinator coord(std::make_shared<FakeConnector>());

    EXPECT_TRUE(coord.set_config("max_connections_per_host", std::int64_t{3}));
    EXPECT_EQ(coord.registry().max_connections_per_host(), 10u);

    EXPECT_TRUE(coord.set_flag(flags::kHttpConnectionPool));
    EXPECT_EQ(coord.registry().max_connections_per_host(), 3u);

    EXPECT_TRUE(coord.set_config("max_connections_per_host", std::int64_t{5}));
    EXPECT_EQ(coord.registry().max_connections_per_host(), 5u);
}

TEST(OptimizationCoordinatorTest, ProviderFollowsPoolFlag) {
    auto conn = std::make_shared<FakeConnector>();
    OptimizationCoordinator coord(conn);

    EXPECT_EQ(coord.make_connection_provider()->name(), "direct");

    ASSERT_TRUE(coord.set_flag(flags::kHttpConnectionPool));
    auto provider = coord.make_connection_provider();
    EXPECT_EQ(provider->name(), "pooled");

    {
        auto lease = provider->lease(kKey);
        ASSERT_TRUE(lease.has_value());
    }
    {
        auto lease = provider->lease(kKey);
        ASSERT_TRUE(lease.has_value());
    }

    auto stats = coord.stats();
    EXPECT_EQ(stats.http_pool_usage_count, 2u);
    EXPECT_EQ(stats.endpoints.at(kKey.label()).created, 1u);
    EXPECT_EQ(stats.endpoints.at(kKey.label()).reused, 1u);
    EXPECT_EQ(conn->created(), 1u);
}

TEST(OptimizationCoordinatorTest, DisableAllClearsFlagsCacheAndPools) {
    auto conn = std::make_shared<FakeConnector>();
    OptimizationCoordinator coord(conn);
    ASSERT_TRUE(coord.enable_all());
    for (auto const& [name, on] : coord.flags()) EXPECT_TRUE(on) << name;
    ASSERT_NE(coord.query_cache(), nullptr);

    {
        auto provider = coord.make_connection_provider();
        auto lease = provider->lease(kKey);
        ASSERT_TRUE(lease.has_value());
    }
    EXPECT_EQ(coord.stats().endpoints.at(kKey.label()).active, 1u);

    coord.disable_all();
    for (auto const& [name, on] : coord.flags()) EXPECT_FALSE(on) << name;
    EXPECT_EQ(coord.query_cache(), nullptr);
    EXPECT_EQ(coord.stats().endpoints.at(kKey.label()).active, 0u);
    EXPECT_EQ(conn->open_count(), 0u);
}

TEST(OptimizationCoordinatorTest, CachedQueryCountsHitsWhenEnabled) {
    OptimizationCoordinator coord(std::make_shared<FakeConnector>());
    int computed = 0;
    auto compute = [&] { return std::to_string(++computed); };

    // Disabled: always computes, nothing counted
    EXPECT_EQ(coord.cached_query("q", compute), "1");
    EXPECT_EQ(coord.cached_query("q", compute), "2");
    EXPECT_EQ(coord.stats().cache_misses, 0u);

    ASSERT_TRUE(coord.set_flag(flags::kQueryCache));
    EXPECT_EQ(coord.cached_query("q", compute), "3");
    EXPECT_EQ(coord.cached_query("q", compute), "3");

    auto stats = coord.stats();
    EXPECT_EQ(stats.cache_hits, 1u);
    EXPECT_EQ(stats.cache_misses, 1u);
    EXPECT_DOUBLE_EQ(stats.cache_hit_ratio(), 0.5);
}

TEST(OptimizationCoordinatorTest, CacheSizeChangeShrinksLiveCache) {
    OptimizationCoordinator coord(std::make_shared<FakeConnector>());
    ASSERT_TRUE(coord.set_flag(flags::kQueryCache));
    for (int i = 0; i < 10; ++i) {
        coord.cached_query("q" + std::to_string(i), [] { return std::string("r"); });
    }

    ASSERT_TRUE(coord.set_config("query_cache_size", std::int64_t{4}));
    EXPECT_EQ(coord.query_cache()->size(), 4u);
}

TEST(OptimizationCoordinatorTest, ThreadPoolSizeOverridesBatchWidth) {
    OptimizationCoordinator coord(std::make_shared<FakeConnector>());
    auto unit = [](const WorkerContext&) { return Status::ok(); };

    BatchResult plain = coord.run_batch(3, unit);
    EXPECT_EQ(plain.effective_workers, 3u);
    EXPECT_EQ(coord.stats().thread_pool_usage_count, 0u);

    ASSERT_TRUE(coord.set_config("thread_pool_size", std::int64_t{2}));
    ASSERT_TRUE(coord.set_flag(flags::kThreadPool));
    BatchResult sized = coord.run_batch(3, unit);
    EXPECT_EQ(sized.effective_workers, 2u);
    EXPECT_EQ(coord.stats().thread_pool_usage_count, 1u);
}

TEST(OptimizationCoordinatorTest, ElapsedStartsAtFirstEnable) {
    OptimizationCoordinator coord(std::make_shared<FakeConnector>());
    EXPECT_EQ(coord.stats().elapsed.count(), 0.0);

    ASSERT_TRUE(coord.set_flag(flags::kCodeOptimization));
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    EXPECT_GT(coord.stats().elapsed.count(), 0.0);
}

TEST(OptimizationCoordinatorTest, LogStatisticsReportsHitRatio) {
    CapturedLog captured;
    OptimizationCoordinator coord(std::make_shared<FakeConnector>());
    ASSERT_TRUE(coord.set_flag(flags::kQueryCache));
    coord.cached_query("q", [] { return std::string("r"); });
    coord.cached_query("q", [] { return std::string("r"); });

    coord.log_statistics();

    const std::string text = captured.text();
    EXPECT_NE(text.find("query cache hit ratio: 1/2 (50.00%)"),
              std::string::npos)
        << text;
    EXPECT_NE(text.find("query cache=enabled"), std::string::npos) << text;
}
