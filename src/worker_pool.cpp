#include "scanpool/worker/worker_pool.hpp"

#include <algorithm>
#include <atomic>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <exception>
#include <thread>
#include <utility>

#include "scanpool/log.hpp"

namespace net = boost::asio;

namespace scanpool {

    namespace {

        void advance(BatchResult& batch, BatchPhase next) {
            log::get()->debug("batch phase {} -> {}", to_string(batch.phase),
                              to_string(next));
            batch.phase = next;
        }

        void run_cleanup(const std::function<void()>& cleanup) noexcept {
            if (!cleanup) return;
            try {
                cleanup();
            } catch (const std::exception& e) {
                log::get()->warn("error occurred during thread cleanup: '{}'",
                                 e.what());
            } catch (...) {
                log::get()->warn(
                    "error occurred during thread cleanup: unknown exception");
            }
        }

        /// @param stopped_by Worker whose outcome first stopped the batch,
        /// or batch.outcomes.size() when no unit did.
        std::optional<Error> pick_error(const BatchResult& batch,
                                        bool interrupted,
                                        std::size_t stopped_by,
                                        bool propagate) {
            if (interrupted) {
                return Error{Error::Code::Interrupted, "batch interrupted"};
            }
            if (stopped_by < batch.outcomes.size()) {
                auto const& o = batch.outcomes[stopped_by];
                if (o.error && o.error->code == Error::Code::Interrupted) {
                    return o.error;
                }
            }
            for (auto const& o : batch.outcomes) {
                if (o.aborted()) return o.error;
            }
            if (propagate) {
                for (auto const& o : batch.outcomes) {
                    if (o.failed()) return o.error;
                }
            }
            return std::nullopt;
        }

    }  // namespace

    const char* to_string(BatchPhase phase) {
        switch (phase) {
            case BatchPhase::Idle:
                return "Idle";
            case BatchPhase::Dispatching:
                return "Dispatching";
            case BatchPhase::Collecting:
                return "Collecting";
            case BatchPhase::CleaningUp:
                return "CleaningUp";
            case BatchPhase::Done:
                return "Done";
        }
        return "Unknown";
    }

    WorkerPool::WorkerPool(WorkerPoolConfiguration cfg) : cfg_(cfg) {}

    std::size_t WorkerPool::max_workers() const noexcept {
        std::size_t hw = std::thread::hardware_concurrency();
        if (hw == 0) hw = 1;
        const std::size_t ceiling = std::max<std::size_t>(cfg_.max_threads, 1);
        return std::min(hw * cfg_.hardware_multiplier, ceiling);
    }

    std::size_t WorkerPool::effective_workers(
        std::int64_t requested) const noexcept {
        if (requested <= 0) return 1;
        return std::clamp<std::size_t>(static_cast<std::size_t>(requested), 1,
                                       std::max<std::size_t>(max_workers(), 1));
    }

    BatchResult WorkerPool::run(std::int64_t requested, UnitOfWork unit,
                                std::function<void()> cleanup,
                                bool propagate_first_error,
                                std::stop_token interrupt) {
        BatchResult batch;
        batch.requested_workers =
            requested > 0 ? static_cast<std::size_t>(requested) : 0;
        batch.effective_workers = effective_workers(requested);
        batches_run_.fetch_add(1, std::memory_order_relaxed);

        const std::size_t total = batch.effective_workers;
        const bool multi = total > 1;
        if (multi) {
            multi_thread_batches_.fetch_add(1, std::memory_order_acq_rel);
            if (cfg_.announce_start) {
                log::get()->info("starting {} threads", total);
            }
        }

        // External interrupts and cancellations reported by units land here
        std::stop_source stop;
        std::atomic<std::size_t> stopped_by{total};
        std::stop_callback forward_interrupt(interrupt,
                                             [&stop] { stop.request_stop(); });

        batch.outcomes.resize(total);
        {
            net::thread_pool workers(total);

            advance(batch, BatchPhase::Dispatching);
            for (std::size_t i = 0; i < total; ++i) {
                net::post(workers, [&, i] {
                    SupervisedTask task(i, total, unit);
                    Outcome out = task.run(stop.get_token());
                    if (out.error && is_cancellation(out.error->code) &&
                        stop.request_stop()) {
                        stopped_by.store(i, std::memory_order_relaxed);
                    }
                    batch.outcomes[i] = std::move(out);
                });
            }

            advance(batch, BatchPhase::Collecting);
            workers.join();
        }

        if (multi) {
            multi_thread_batches_.fetch_sub(1, std::memory_order_acq_rel);
        }

        batch.any_failed =
            std::any_of(batch.outcomes.begin(), batch.outcomes.end(),
                        [](Outcome const& o) { return o.failed(); });

        advance(batch, BatchPhase::CleaningUp);
        run_cleanup(cleanup);

        const bool interrupted = interrupt.stop_requested();
        batch.error = pick_error(batch, interrupted, stopped_by.load(),
                                 propagate_first_error);

        advance(batch, BatchPhase::Done);
        return batch;
    }

}  // namespace scanpool
