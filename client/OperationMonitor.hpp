// Polling loop for one remote operation. Owns the poll timer, talks to the
// transport and turns tracker outcomes into signals. One instance per
// operation; the service creates and disposes them.
#pragma once
#include "PollHandle.hpp"
#include "jobwatch/CompletionFinalizer.hpp"
#include "jobwatch/OperationRegistry.hpp"
#include "jobwatch/OperationTracker.hpp"
#include "jobwatch/OperationTransport.hpp"

#include <QObject>
#include <QString>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

class OperationMonitor : public QObject {
    Q_OBJECT
public:
    using Clock = std::function<qint64()>;

    // `transport` and `registry` are not owned. `items` is the caller's list;
    // the monitor is its only writer until the operation ends.
    OperationMonitor(jobwatch::OperationTransport *transport,
                     jobwatch::OperationRegistry &registry,
                     jobwatch::Operation op, std::vector<jobwatch::Item> &items,
                     bool immediateFirstPoll, QObject *parent = nullptr);
    ~OperationMonitor() override;

    void setClock(Clock clock) { clock_ = std::move(clock); }

    bool start();
    // Stops polling without touching status or the registry. Idempotent.
    void stop();
    // User stop: aborts locally and asks the backend to stop the job.
    bool cancel();

    // Rejected (false) unless the status allows it and no other control
    // request is in flight.
    bool requestPause();
    bool requestResume();

    bool isPolling() const { return running_; }
    const jobwatch::Operation &operation() const { return tracker_.operation(); }
    const std::optional<jobwatch::ProgressSnapshot> &lastSnapshot() const {
        return tracker_.lastSnapshot();
    }

signals:
    void tick(const jobwatch::ProgressSnapshot &snapshot);
    void itemsChanged();
    void paused();
    void resumed();
    void terminal(const jobwatch::TerminalSummary &summary);
    void aborted(jobwatch::AbortReason reason, const QString &message);
    // A pause/resume request was refused by the backend.
    void controlFailed(const QString &message);

private:
    void scheduleNext(int delayMs);
    void pollOnce();
    void onProgress(const jobwatch::ProgressReply &reply, std::uint64_t seq);
    void onControlReply(bool pause, const jobwatch::AckReply &reply);
    bool accepts(quint64 generation) const;
    bool abortWith(jobwatch::AbortReason reason, const QString &message);

    jobwatch::OperationTransport *transport_ = nullptr; // not owned
    jobwatch::OperationRegistry &registry_;
    jobwatch::OperationTracker tracker_;
    jobwatch::CompletionFinalizer finalizer_;
    PollHandle poll_;
    Clock clock_;
    bool immediateFirstPoll_ = false;
    bool running_ = false;
    bool started_ = false;
    bool inFlight_ = false;
    // Bumped on stop/abort; replies tagged with an older value are dropped.
    quint64 generation_ = 0;
};
