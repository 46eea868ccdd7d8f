#include "jobwatch/CompletionFinalizer.hpp"
#include "jobwatch/ItemReconciler.hpp"

#include <utility>

namespace jobwatch {

CompletionFinalizer::CompletionFinalizer(OperationRegistry &registry,
                                         TerminalSink sink)
    : registry_(registry), sink_(std::move(sink)) {}

bool CompletionFinalizer::finalize(Operation &op, std::vector<Item> &items,
                                   const ProgressSnapshot &last) {
    if (op.finalized || isTerminal(op.status))
        return false;
    if (last.status != RemoteStatus::Completed &&
        last.status != RemoteStatus::Error)
        return false;
    op.finalized = true;

    (void)reconcileItems(items, last.items);

    // Fast jobs may only report aggregate completion; converge the rest.
    const bool ok = (last.status == RemoteStatus::Completed);
    for (Item &item : items) {
        if (item.terminalReached)
            continue;
        item.status = ok ? ItemStatus::Completed : ItemStatus::Error;
        if (ok)
            item.progress = 100;
        item.terminalReached = true;
    }

    op.status = ok ? OperationStatus::Completed : OperationStatus::Error;
    TerminalSummary summary = summarize(op, items);
    summary.errorMessage = last.errorMessage;

    registry_.release(op.handle);
    if (sink_)
        sink_(summary);
    return true;
}

TerminalSummary CompletionFinalizer::summarize(const Operation &op,
                                               const std::vector<Item> &items) {
    TerminalSummary s;
    s.operationId = op.id;
    s.cls = op.cls;
    s.status = op.status;
    s.totalCount = static_cast<int>(items.size());
    for (const Item &item : items) {
        if (item.status == ItemStatus::Completed)
            ++s.successCount;
        else if (item.status == ItemStatus::Error)
            ++s.failureCount;
    }
    return s;
}

} // namespace jobwatch
