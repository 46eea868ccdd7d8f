#include "jobwatch/OperationTracker.hpp"
#include "jobwatch/ItemReconciler.hpp"

#include <utility>

namespace jobwatch {

OperationTracker::OperationTracker(Operation op, std::vector<Item> &items)
    : op_(std::move(op)), items_(&items) {}

bool OperationTracker::hasTimedOut(std::int64_t nowMs) const {
    return op_.maxDurationMs > 0 && nowMs - op_.startedAtMs > op_.maxDurationMs;
}

TickOutcome OperationTracker::onPollFailure() {
    if (!isActive())
        return TickOutcome::Continue;
    ++op_.consecutiveErrorCount;
    if (op_.consecutiveErrorCount >= op_.maxConsecutiveErrors)
        return TickOutcome::Abort;
    return TickOutcome::Continue;
}

void OperationTracker::setControlPending(bool pending) {
    if (controlPending_ && !pending)
        mirrorFence_ = pollsIssued_;
    controlPending_ = pending;
}

TickOutcome OperationTracker::onPollSuccess(const ProgressSnapshot &snapshot,
                                            bool &itemsChanged,
                                            std::uint64_t pollSeq) {
    itemsChanged = false;
    if (!isActive())
        return TickOutcome::Continue;
    op_.consecutiveErrorCount = 0;
    last_ = snapshot;

    if (snapshot.status == RemoteStatus::Completed ||
        snapshot.status == RemoteStatus::Error)
        return TickOutcome::Terminal;

    itemsChanged = reconcileItems(*items_, snapshot.items);

    if (controlPending_ || pollSeq <= mirrorFence_)
        return TickOutcome::Continue;
    const bool remotePaused =
        snapshot.paused || snapshot.status == RemoteStatus::Paused;
    if (remotePaused && op_.status == OperationStatus::Running) {
        op_.status = OperationStatus::Paused;
        return TickOutcome::Paused;
    }
    if (!remotePaused && op_.status == OperationStatus::Paused) {
        op_.status = OperationStatus::Running;
        return TickOutcome::Resumed;
    }
    return TickOutcome::Continue;
}

bool OperationTracker::markPaused() {
    if (op_.status != OperationStatus::Running)
        return false;
    op_.status = OperationStatus::Paused;
    return true;
}

bool OperationTracker::markResumed() {
    if (op_.status != OperationStatus::Paused)
        return false;
    op_.status = OperationStatus::Running;
    return true;
}

bool OperationTracker::abort(AbortReason reason) {
    const OperationStatus next = (reason == AbortReason::Timeout)
                                     ? OperationStatus::TimedOut
                                     : OperationStatus::Error;
    if (!canTransition(op_.status, next))
        return false;
    op_.status = next;
    return true;
}

} // namespace jobwatch
