#include "scanpool/worker/supervised_task.hpp"

#include <exception>
#include <utility>

#include "scanpool/log.hpp"

namespace scanpool {

    SupervisedTask::SupervisedTask(std::size_t index, std::size_t total,
                                   UnitOfWork unit)
        : index_(index), total_(total), unit_(std::move(unit)) {}

    Outcome SupervisedTask::fail(Error error) const noexcept {
        if (error.code == Error::Code::Interrupted) {
            return Outcome{index_, OutcomeKind::Cancelled, std::move(error)};
        }

        if (is_intentional_abort(error.code)) {
            log::get()->debug("thread {}: {} requested", index_,
                              to_string(error.code));
        } else {
            log::get()->error("thread {}: '{}'", index_, error.message);
        }
        return Outcome{index_, OutcomeKind::Failure, std::move(error)};
    }

    Outcome SupervisedTask::run(std::stop_token stop) const noexcept {
        if (stop.stop_requested()) {
            return Outcome{index_, OutcomeKind::Cancelled, std::nullopt};
        }

        if (!unit_) {
            return fail(Error{Error::Code::UnitFailure, "no unit of work"});
        }

        const WorkerContext ctx{index_, total_, std::move(stop)};
        try {
            Status st = unit_(ctx);
            if (st.has_error()) return fail(std::move(st).error());
        } catch (const std::exception& e) {
            return fail(Error{Error::Code::UnitFailure, e.what()});
        } catch (...) {
            return fail(Error{Error::Code::UnitFailure, "unknown exception"});
        }
        return Outcome{index_, OutcomeKind::Success, std::nullopt};
    }

}  // namespace scanpool
