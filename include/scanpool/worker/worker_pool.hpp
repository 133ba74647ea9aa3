#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <stop_token>
#include <vector>

#include "scanpool/config.hpp"
#include "scanpool/error.hpp"
#include "scanpool/worker/supervised_task.hpp"

namespace scanpool {

    /// @brief Progress of one batch. Only ever moves forward.
    enum class BatchPhase {
        Idle,
        Dispatching,
        Collecting,
        CleaningUp,
        Done,
    };

    const char* to_string(BatchPhase phase);

    /// @brief Aggregate result of one WorkerPool::run() call.
    struct BatchResult {
        std::size_t requested_workers{0};
        std::size_t effective_workers{0};
        /// Index-aligned with the worker index.
        std::vector<Outcome> outcomes;
        bool any_failed{false};
        /// The error surfaced to the caller, if any: the external interrupt,
        /// else the first intentional abort, else (when propagating) the
        /// first failure in worker-index order.
        std::optional<Error> error;
        BatchPhase phase{BatchPhase::Idle};

        bool ok() const noexcept { return !error.has_value(); }

        std::size_t count(OutcomeKind kind) const noexcept {
            std::size_t n = 0;
            for (auto const& o : outcomes) {
                if (o.kind == kind) ++n;
            }
            return n;
        }
    };

    /**
     * Bounded fan-out/fan-in executor.
     *
     * Every run() gets its own set of threads, one per effective worker, and
     * returns only after each unit has an outcome and cleanup has run once.
     *
     * CANCELLATION:
     * - The interrupt token passed to run() and any intentional abort from a
     *   unit request stop on the batch
     * - Units that have not started by then are recorded as Cancelled
     * - Running units see the request through WorkerContext::stop
     * - Either way run() reports the cancellation in BatchResult::error,
     *   whatever propagate_first_error says
     *
     * multi_thread_mode() is true while at least one batch with more than one
     * effective worker is running on this pool.
     */
    class WorkerPool {
       public:
        explicit WorkerPool(WorkerPoolConfiguration cfg = {});

        WorkerPool(const WorkerPool&) = delete;
        WorkerPool& operator=(const WorkerPool&) = delete;

        /// @brief The worker count a request of `requested` turns into:
        /// at least 1, at most min(hardware threads * multiplier, ceiling).
        std::size_t effective_workers(std::int64_t requested) const noexcept;

        /// @brief Largest worker count a batch may use on this host.
        std::size_t max_workers() const noexcept;

        /**
         * @brief Run one unit of work per effective worker.
         * @param requested Requested worker count, clamped.
         * @param unit Called once per worker with its context.
         * @param cleanup Called exactly once after every unit has an outcome.
         * A throwing cleanup is logged and does not change the result.
         * @param propagate_first_error Surface the first plain failure in
         * BatchResult::error. Cancellations are surfaced regardless.
         * @param interrupt External interrupt for this batch.
         */
        BatchResult run(std::int64_t requested, UnitOfWork unit,
                        std::function<void()> cleanup = {},
                        bool propagate_first_error = true,
                        std::stop_token interrupt = {});

        bool multi_thread_mode() const noexcept {
            return multi_thread_batches_.load(std::memory_order_acquire) > 0;
        }

        std::uint64_t batches_run() const noexcept {
            return batches_run_.load(std::memory_order_relaxed);
        }

       private:
        WorkerPoolConfiguration cfg_;
        std::atomic<int> multi_thread_batches_{0};
        std::atomic<std::uint64_t> batches_run_{0};
    };

}  // namespace scanpool
