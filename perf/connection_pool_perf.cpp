#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

#include "scanpool/connection/tcp_transport.hpp"
#include "scanpool/optimization_coordinator.hpp"
#include "scanpool/page_client.hpp"
#include "test_support.hpp"

using namespace scanpool;
using Server = scanpool::test::HttpTestServer;

static void print_result(const char* label, int iters,
                         std::chrono::nanoseconds total,
                         std::chrono::nanoseconds min,
                         std::chrono::nanoseconds max) {
    const double total_ms =
        std::chrono::duration<double, std::milli>(total).count();
    const double avg_ms = total_ms / iters;
    const double min_ms =
        std::chrono::duration<double, std::milli>(min).count();
    const double max_ms =
        std::chrono::duration<double, std::milli>(max).count();

    std::cout << "\n[ PERF ] " << label << "\n"
              << "        iters=" << iters << std::fixed
              << std::setprecision(2) << " total_ms=" << total_ms
              << " avg_ms=" << avg_ms << " min_ms=" << min_ms
              << " max_ms=" << max_ms << "\n";
}

static void time_fetches(const char* label, PageClient& client,
                         const std::string& url, int iters) {
    using clock = std::chrono::steady_clock;
    std::chrono::nanoseconds total{0};
    std::chrono::nanoseconds min = std::chrono::nanoseconds::max();
    std::chrono::nanoseconds max{0};

    for (int i = 0; i < iters; ++i) {
        const auto t0 = clock::now();
        auto r = client.get(url);
        const auto t1 = clock::now();
        ASSERT_TRUE(r.has_value()) << r.error().message;

        const auto dt = std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0);
        total += dt;
        min = std::min(min, dt);
        max = std::max(max, dt);
    }
    print_result(label, iters, total, min, max);
}

TEST(ConnectionPoolPerf, PooledVersusDirectSequential) {
    constexpr int iters = 200;
    Server srv(Server::Behavior::KeepAlive);
    OptimizationCoordinator coord(std::make_shared<TcpConnector>());

    {
        auto direct = coord.make_connection_provider();
        PageClient client(*direct, "scanpool-perf");
        time_fetches("direct provider, one connection per fetch", client,
                     srv.url("/health"), iters);
    }

    ASSERT_TRUE(coord.set_flag(flags::kHttpConnectionPool));
    {
        auto pooled = coord.make_connection_provider();
        PageClient client(*pooled, "scanpool-perf");
        time_fetches("pooled provider, keep-alive reuse", client,
                     srv.url("/health"), iters);
    }

    auto s = coord.stats().endpoints.at(srv.endpoint().label());
    EXPECT_EQ(s.created, 1u);
    EXPECT_EQ(s.reused, static_cast<std::uint64_t>(iters - 1));
    coord.disable_all();
}

TEST(ConnectionPoolPerf, PooledBatchAcrossWorkers) {
    constexpr int per_worker = 50;
    constexpr std::int64_t workers = 8;
    Server srv(Server::Behavior::KeepAlive);
    OptimizationCoordinator coord(std::make_shared<TcpConnector>());
    ASSERT_TRUE(coord.set_flag(flags::kHttpConnectionPool));
    ASSERT_TRUE(coord.set_flag(flags::kThreadPool));

    auto provider = coord.make_connection_provider();
    PageClient client(*provider, "scanpool-perf");
    const std::string url = srv.url("/health");
    std::atomic<int> failures{0};

    const auto t0 = std::chrono::steady_clock::now();
    BatchResult r = coord.run_batch(workers, [&](const WorkerContext&) {
        for (int i = 0; i < per_worker; ++i) {
            if (!client.get(url).has_value()) failures.fetch_add(1);
        }
        return Status::ok();
    });
    const auto dt = std::chrono::steady_clock::now() - t0;

    EXPECT_TRUE(r.ok());
    EXPECT_EQ(failures.load(), 0);

    const int total = static_cast<int>(r.effective_workers) * per_worker;
    print_result("pooled batch across workers", total,
                 std::chrono::duration_cast<std::chrono::nanoseconds>(dt),
                 std::chrono::nanoseconds{0},
                 std::chrono::duration_cast<std::chrono::nanoseconds>(dt));

    auto s = coord.stats().endpoints.at(srv.endpoint().label());
    EXPECT_LE(s.created, 10u);
    coord.log_statistics();
    coord.disable_all();
}
