// Per-operation polling policy: error budget, wall-clock budget, pause
// mirroring and terminal detection. Holds no timers; the caller drives it one
// poll result at a time.
#pragma once
#include "OperationTypes.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace jobwatch {

enum class TickOutcome {
    Continue, // keep polling
    Paused,   // backend now reports paused
    Resumed,  // backend no longer reports paused
    Terminal, // snapshot is terminal; hand over to the finalizer
    Abort     // error budget exhausted
};

class OperationTracker {
public:
    // `items` is the caller's list and must outlive the tracker.
    OperationTracker(Operation op, std::vector<Item> &items);

    const Operation &operation() const { return op_; }
    Operation &operation() { return op_; }
    std::vector<Item> &items() { return *items_; }
    const std::vector<Item> &items() const { return *items_; }
    const std::optional<ProgressSnapshot> &lastSnapshot() const {
        return last_;
    }

    bool isActive() const { return !isTerminal(op_.status); }
    bool hasTimedOut(std::int64_t nowMs) const;

    // A failed or malformed poll. Returns Abort once the consecutive error
    // count reaches the operation's limit.
    TickOutcome onPollFailure();

    // Numbers an outgoing poll. Pass the value back with its reply.
    std::uint64_t beginPoll() { return ++pollsIssued_; }

    // A well-formed poll. Resets the error counter, reconciles items unless
    // the snapshot is terminal (the finalizer owns the final pass) and
    // mirrors the backend pause flag while no control request is pending.
    // Polls issued before the last settled control request are never
    // mirrored: their pause flag predates it.
    TickOutcome onPollSuccess(const ProgressSnapshot &snapshot,
                              bool &itemsChanged, std::uint64_t pollSeq);

    // Acknowledged control requests. Return false if the current status
    // does not allow the transition.
    bool markPaused();
    bool markResumed();

    // Clearing the flag also fences off every poll issued so far.
    void setControlPending(bool pending);
    bool controlPending() const { return controlPending_; }

    // Forces a terminal status without touching items.
    bool abort(AbortReason reason);

private:
    Operation op_;
    std::vector<Item> *items_ = nullptr; // not owned
    std::optional<ProgressSnapshot> last_;
    bool controlPending_ = false;
    std::uint64_t pollsIssued_ = 0;
    std::uint64_t mirrorFence_ = 0; // last poll issued before a control settled
};

} // namespace jobwatch
