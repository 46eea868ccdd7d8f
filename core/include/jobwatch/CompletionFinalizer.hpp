// Applies the terminal snapshot of an operation exactly once.
#pragma once
#include "OperationRegistry.hpp"
#include "OperationTypes.hpp"

#include <functional>
#include <vector>

namespace jobwatch {

class CompletionFinalizer {
public:
    using TerminalSink = std::function<void(const TerminalSummary &)>;

    CompletionFinalizer(OperationRegistry &registry, TerminalSink sink);

    // Reconciles `last` one final time, converges every item that never
    // reached a terminal state to the operation's overall outcome, emits one
    // terminal notification and releases the class slot.
    // Returns false without side effects when the operation was already
    // finalized or aborted, or when `last` is not a terminal snapshot.
    bool finalize(Operation &op, std::vector<Item> &items,
                  const ProgressSnapshot &last);

    static TerminalSummary summarize(const Operation &op,
                                     const std::vector<Item> &items);

private:
    OperationRegistry &registry_;
    TerminalSink sink_;
};

} // namespace jobwatch
