#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include "scanpool/worker/worker_pool.hpp"

using namespace scanpool;
using namespace std::chrono_literals;

namespace {

    // Eight workers on any host, so batch sizes below are never clamped.
    WorkerPoolConfiguration test_cfg() {
        WorkerPoolConfiguration cfg;
        cfg.hardware_multiplier = 64;
        cfg.max_threads = 8;
        return cfg;
    }

    // Spin until the batch is stopped, bounded so a broken stop never hangs.
    Status wait_for_stop(const WorkerContext& ctx) {
        const auto deadline = std::chrono::steady_clock::now() + 5s;
        while (!ctx.stop.stop_requested()) {
            if (std::chrono::steady_clock::now() > deadline) {
                return Status::err(Error::Code::UnitFailure, "never stopped");
            }
            std::this_thread::sleep_for(1ms);
        }
        return Status::err(Error::Code::Interrupted, "stopped");
    }

}  // namespace

TEST(WorkerPoolTest, AllUnitsSucceed) {
    WorkerPool pool(test_cfg());
    std::atomic<int> runs{0};
    int cleanups = 0;

    BatchResult r = pool.run(
        5,
        [&](const WorkerContext& ctx) {
            EXPECT_EQ(ctx.total, 5u);
            runs.fetch_add(1);
            return Status::ok();
        },
        [&] { ++cleanups; });

    EXPECT_TRUE(r.ok());
    EXPECT_EQ(r.requested_workers, 5u);
    EXPECT_EQ(r.effective_workers, 5u);
    ASSERT_EQ(r.outcomes.size(), 5u);
    EXPECT_EQ(r.count(OutcomeKind::Success), 5u);
    EXPECT_FALSE(r.any_failed);
    EXPECT_EQ(runs.load(), 5);
    EXPECT_EQ(cleanups, 1);
    EXPECT_EQ(r.phase, BatchPhase::Done);
    EXPECT_FALSE(pool.multi_thread_mode());
}

TEST(WorkerPoolTest, OutcomesAreIndexAligned) {
    WorkerPool pool(test_cfg());

    BatchResult r = pool.run(4, [](const WorkerContext& ctx) {
        // Finish in reverse index order
        std::this_thread::sleep_for(std::chrono::milliseconds(5 * (4 - ctx.index)));
        return Status::ok();
    });

    ASSERT_EQ(r.outcomes.size(), 4u);
    for (std::size_t i = 0; i < r.outcomes.size(); ++i) {
        EXPECT_EQ(r.outcomes[i].worker, i);
    }
}

TEST(WorkerPoolTest, FailureIsIsolatedWithoutPropagation) {
    WorkerPool pool(test_cfg());
    int cleanups = 0;

    BatchResult r = pool.run(
        5,
        [](const WorkerContext& ctx) {
            if (ctx.index == 2) {
                return Status::err(Error::Code::UnitFailure, "unit 2 broke");
            }
            return Status::ok();
        },
        [&] { ++cleanups; }, false);

    EXPECT_TRUE(r.ok());
    EXPECT_TRUE(r.any_failed);
    ASSERT_EQ(r.outcomes.size(), 5u);
    EXPECT_TRUE(r.outcomes[2].failed());
    EXPECT_EQ(r.count(OutcomeKind::Success), 4u);
    EXPECT_EQ(cleanups, 1);
}

TEST(WorkerPoolTest, FailurePropagatesAfterCleanup) {
    WorkerPool pool(test_cfg());
    std::mutex mu;
    std::vector<std::string> events;

    BatchResult r = pool.run(
        5,
        [&](const WorkerContext& ctx) -> Status {
            if (ctx.index == 2) throw std::runtime_error("unit 2 broke");
            return Status::ok();
        },
        [&] {
            std::lock_guard<std::mutex> lk(mu);
            events.push_back("cleanup");
        },
        true);

    ASSERT_TRUE(r.error.has_value());
    EXPECT_EQ(r.error->code, Error::Code::UnitFailure);
    EXPECT_EQ(r.error->message, "unit 2 broke");
    EXPECT_EQ(r.count(OutcomeKind::Success), 4u);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events.front(), "cleanup");
}

TEST(WorkerPoolTest, FirstFailureByIndexWins) {
    WorkerPool pool(test_cfg());

    BatchResult r = pool.run(4, [](const WorkerContext& ctx) {
        if (ctx.index == 1) {
            std::this_thread::sleep_for(30ms);
            return Status::err(Error::Code::Timeout, "slow one");
        }
        if (ctx.index == 3) {
            return Status::err(Error::Code::SendFailed, "fast one");
        }
        return Status::ok();
    });

    ASSERT_TRUE(r.error.has_value());
    EXPECT_EQ(r.error->code, Error::Code::Timeout);
    EXPECT_EQ(r.error->message, "slow one");
}

TEST(WorkerPoolTest, ExternalInterruptCancelsBatch) {
    WorkerPool pool(test_cfg());
    std::stop_source interrupt;
    int cleanups = 0;

    std::thread trigger([&] {
        std::this_thread::sleep_for(50ms);
        interrupt.request_stop();
    });

    BatchResult r =
        pool.run(3, wait_for_stop, [&] { ++cleanups; }, false,
                 interrupt.get_token());
    trigger.join();

    ASSERT_TRUE(r.error.has_value());
    EXPECT_EQ(r.error->code, Error::Code::Interrupted);
    EXPECT_EQ(r.count(OutcomeKind::Cancelled), 3u);
    EXPECT_FALSE(r.any_failed);
    EXPECT_EQ(cleanups, 1);
    EXPECT_FALSE(pool.multi_thread_mode());
}

TEST(WorkerPoolTest, InterruptBeforeStartRunsNoUnit) {
    WorkerPool pool(test_cfg());
    std::stop_source interrupt;
    interrupt.request_stop();
    std::atomic<int> runs{0};
    int cleanups = 0;

    BatchResult r = pool.run(
        4,
        [&](const WorkerContext&) {
            runs.fetch_add(1);
            return Status::ok();
        },
        [&] { ++cleanups; }, false, interrupt.get_token());

    EXPECT_EQ(runs.load(), 0);
    EXPECT_EQ(r.count(OutcomeKind::Cancelled), 4u);
    ASSERT_TRUE(r.error.has_value());
    EXPECT_EQ(r.error->code, Error::Code::Interrupted);
    EXPECT_EQ(cleanups, 1);
}

TEST(WorkerPoolTest, IntentionalAbortStopsSiblings) {
    WorkerPool pool(test_cfg());
    const auto start = std::chrono::steady_clock::now();

    BatchResult r = pool.run(
        4,
        [](const WorkerContext& ctx) {
            if (ctx.index == 0) {
                return Status::err(Error::Code::UserQuit, "user quit");
            }
            return wait_for_stop(ctx);
        },
        {}, false);

    EXPECT_LT(std::chrono::steady_clock::now() - start, 4s);
    ASSERT_TRUE(r.error.has_value());
    EXPECT_EQ(r.error->code, Error::Code::UserQuit);
    EXPECT_TRUE(r.outcomes[0].aborted());
    for (std::size_t i = 1; i < r.outcomes.size(); ++i) {
        EXPECT_TRUE(r.outcomes[i].cancelled()) << "worker " << i;
    }
}

TEST(WorkerPoolTest, InterruptReportedByUnitStopsSiblings) {
    WorkerPool pool(test_cfg());
    int cleanups = 0;
    const auto start = std::chrono::steady_clock::now();

    BatchResult r = pool.run(
        3,
        [](const WorkerContext& ctx) {
            if (ctx.index == 0) {
                return Status::err(Error::Code::Interrupted, "ctrl-c");
            }
            return wait_for_stop(ctx);
        },
        [&] { ++cleanups; }, false);

    EXPECT_LT(std::chrono::steady_clock::now() - start, 4s);
    EXPECT_FALSE(r.ok());
    ASSERT_TRUE(r.error.has_value());
    EXPECT_EQ(r.error->code, Error::Code::Interrupted);
    EXPECT_EQ(r.error->message, "ctrl-c");
    EXPECT_EQ(r.count(OutcomeKind::Cancelled), 3u);
    EXPECT_FALSE(r.any_failed);
    EXPECT_EQ(cleanups, 1);
}

TEST(WorkerPoolTest, InterruptReportedByUnitOutranksFailure) {
    WorkerPool pool(test_cfg());

    BatchResult r = pool.run(
        2,
        [](const WorkerContext& ctx) {
            if (ctx.index == 0) {
                return Status::err(Error::Code::UnitFailure, "plain");
            }
            return Status::err(Error::Code::Interrupted, "ctrl-c");
        },
        {}, true);

    ASSERT_TRUE(r.error.has_value());
    EXPECT_EQ(r.error->code, Error::Code::Interrupted);
    EXPECT_EQ(r.error->message, "ctrl-c");
}

TEST(WorkerPoolTest, NonStandardThrowIsRecordedAsFailure) {
    WorkerPool pool(test_cfg());
    int cleanups = 0;

    BatchResult r = pool.run(
        2,
        [](const WorkerContext& ctx) -> Status {
            if (ctx.index == 1) throw 42;
            return Status::ok();
        },
        [&] { ++cleanups; }, true);

    EXPECT_TRUE(r.outcomes[0].succeeded());
    ASSERT_TRUE(r.outcomes[1].failed());
    EXPECT_EQ(r.outcomes[1].error->code, Error::Code::UnitFailure);
    EXPECT_TRUE(r.any_failed);
    ASSERT_TRUE(r.error.has_value());
    EXPECT_EQ(r.error->code, Error::Code::UnitFailure);
    EXPECT_EQ(cleanups, 1);
}

TEST(WorkerPoolTest, NonStandardThrowFromCleanupIsContained) {
    WorkerPool pool(test_cfg());
    struct NotAnException {};

    BatchResult r = pool.run(
        2, [](const WorkerContext&) { return Status::ok(); },
        [] { throw NotAnException{}; });

    EXPECT_TRUE(r.ok());
    EXPECT_EQ(r.count(OutcomeKind::Success), 2u);
    EXPECT_EQ(r.phase, BatchPhase::Done);
}

TEST(WorkerPoolTest, AbortOutranksPlainFailure) {
    WorkerPool pool(test_cfg());

    BatchResult r = pool.run(3, [](const WorkerContext& ctx) {
        if (ctx.index == 0) {
            return Status::err(Error::Code::UnitFailure, "plain");
        }
        if (ctx.index == 2) {
            return Status::err(Error::Code::SkipTarget, "skip");
        }
        return Status::ok();
    });

    ASSERT_TRUE(r.error.has_value());
    EXPECT_EQ(r.error->code, Error::Code::SkipTarget);
}

TEST(WorkerPoolTest, ThrowingCleanupDoesNotMaskResult) {
    WorkerPool pool(test_cfg());

    BatchResult r = pool.run(
        2, [](const WorkerContext&) { return Status::ok(); },
        [] { throw std::runtime_error("cleanup failed"); });

    EXPECT_TRUE(r.ok());
    EXPECT_EQ(r.count(OutcomeKind::Success), 2u);
    EXPECT_EQ(r.phase, BatchPhase::Done);
}

TEST(WorkerPoolTest, WorkerCountIsClamped) {
    WorkerPool pool(test_cfg());
    EXPECT_EQ(pool.effective_workers(0), 1u);
    EXPECT_EQ(pool.effective_workers(-7), 1u);
    EXPECT_EQ(pool.effective_workers(3), 3u);
    EXPECT_EQ(pool.effective_workers(1000), 8u);

    WorkerPool defaults;
    EXPECT_GE(defaults.max_workers(), 1u);
    EXPECT_LE(defaults.max_workers(), 32u);
    EXPECT_EQ(defaults.effective_workers(100000), defaults.max_workers());
}

TEST(WorkerPoolTest, NonPositiveRequestRunsOneUnit) {
    WorkerPool pool(test_cfg());
    std::atomic<int> runs{0};

    BatchResult r = pool.run(0, [&](const WorkerContext&) {
        runs.fetch_add(1);
        return Status::ok();
    });

    EXPECT_EQ(r.effective_workers, 1u);
    EXPECT_EQ(runs.load(), 1);
}

TEST(WorkerPoolTest, MultiThreadModeTracksBatch) {
    WorkerPool pool(test_cfg());
    std::atomic<bool> during_multi{false};
    std::atomic<bool> during_single{true};

    (void)pool.run(2, [&](const WorkerContext&) {
        if (pool.multi_thread_mode()) during_multi = true;
        return Status::ok();
    });
    (void)pool.run(1, [&](const WorkerContext&) {
        during_single = pool.multi_thread_mode();
        return Status::ok();
    });

    EXPECT_TRUE(during_multi.load());
    EXPECT_FALSE(during_single.load());
    EXPECT_FALSE(pool.multi_thread_mode());
    EXPECT_EQ(pool.batches_run(), 2u);
}
