#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <stop_token>

#include "scanpool/error.hpp"
#include "scanpool/result.hpp"

namespace scanpool {

    /// @brief What a unit of work sees about the batch it runs in.
    struct WorkerContext {
        std::size_t index{0};
        std::size_t total{1};
        /// Requested on external interrupt or when a sibling aborts on
        /// purpose. Long-running units should poll it.
        std::stop_token stop;
    };

    /// @brief A unit of work. Report failures through the returned Status;
    /// anything thrown is recorded as UnitFailure.
    using UnitOfWork = std::function<Status(const WorkerContext&)>;

    enum class OutcomeKind {
        Success,
        Failure,
        Cancelled,
    };

    inline const char* to_string(OutcomeKind kind) {
        switch (kind) {
            case OutcomeKind::Success:
                return "Success";
            case OutcomeKind::Failure:
                return "Failure";
            case OutcomeKind::Cancelled:
                return "Cancelled";
        }
        return "Unknown";
    }

    /// @brief Exactly one per submitted unit.
    struct Outcome {
        std::size_t worker{0};
        OutcomeKind kind{OutcomeKind::Cancelled};
        /// Set for Failure, and for Cancelled when the unit itself
        /// reported the interrupt.
        std::optional<Error> error;

        bool succeeded() const noexcept { return kind == OutcomeKind::Success; }
        bool failed() const noexcept { return kind == OutcomeKind::Failure; }
        bool cancelled() const noexcept {
            return kind == OutcomeKind::Cancelled;
        }

        /// @brief True for a failure the user raised on purpose.
        bool aborted() const noexcept {
            return failed() && error && is_intentional_abort(error->code);
        }
    };

    /**
     * @brief Runs one unit of work and turns whatever happens into an Outcome.
     *
     * Plain failures are logged at error level with the worker index.
     * Intentional aborts and interrupts are not.
     */
    class SupervisedTask {
       public:
        SupervisedTask(std::size_t index, std::size_t total, UnitOfWork unit);

        /// @brief Run the unit unless stop was already requested, in which
        /// case the unit is never started and the outcome is Cancelled.
        Outcome run(std::stop_token stop) const noexcept;

        std::size_t index() const noexcept { return index_; }

       private:
        Outcome fail(Error error) const noexcept;

        std::size_t index_;
        std::size_t total_;
        UnitOfWork unit_;
    };

}  // namespace scanpool
