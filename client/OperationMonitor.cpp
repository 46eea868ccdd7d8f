#include "OperationMonitor.hpp"

#include <QDateTime>
#include <QLoggingCategory>
#include <QPointer>

Q_LOGGING_CATEGORY(jwMonitor, "jobwatch.monitor")

using namespace jobwatch;

OperationMonitor::OperationMonitor(OperationTransport *transport,
                                   OperationRegistry &registry, Operation op,
                                   std::vector<Item> &items,
                                   bool immediateFirstPoll, QObject *parent)
    : QObject(parent), transport_(transport), registry_(registry),
      tracker_(std::move(op), items),
      finalizer_(registry,
                 [this](const TerminalSummary &summary) {
                     emit terminal(summary);
                 }),
      poll_(this), clock_([] { return QDateTime::currentMSecsSinceEpoch(); }),
      immediateFirstPoll_(immediateFirstPoll) {}

OperationMonitor::~OperationMonitor() { stop(); }

bool OperationMonitor::start() {
    if (started_ || !transport_)
        return false;
    started_ = true;
    running_ = true;
    const Operation &op = tracker_.operation();
    qCInfo(jwMonitor) << "polling started"
                      << "class=" << toString(op.cls)
                      << "id=" << QString::fromStdString(op.id)
                      << "intervalMs=" << op.pollIntervalMs
                      << "maxErrors=" << op.maxConsecutiveErrors
                      << "maxDurationMs=" << op.maxDurationMs
                      << "immediate=" << immediateFirstPoll_;
    scheduleNext(immediateFirstPoll_ ? 0 : op.pollIntervalMs);
    return true;
}

void OperationMonitor::stop() {
    if (!running_)
        return;
    running_ = false;
    ++generation_;
    poll_.cancel();
    qCInfo(jwMonitor) << "polling stopped"
                      << "id=" << QString::fromStdString(tracker_.operation().id)
                      << "status=" << toString(tracker_.operation().status);
}

bool OperationMonitor::accepts(quint64 generation) const {
    return running_ && generation == generation_ &&
           registry_.isCurrent(tracker_.operation().handle);
}

void OperationMonitor::scheduleNext(int delayMs) {
    if (!running_)
        return;
    poll_.arm(delayMs, [this] { pollOnce(); });
}

void OperationMonitor::pollOnce() {
    if (!running_ || inFlight_)
        return;
    const Operation &op = tracker_.operation();
    if (!registry_.isCurrent(op.handle)) {
        qCWarning(jwMonitor) << "registry slot lost; stopping"
                             << "id=" << QString::fromStdString(op.id);
        stop();
        return;
    }
    if (tracker_.hasTimedOut(clock_())) {
        abortWith(AbortReason::Timeout,
                  QStringLiteral("Operation timed out after %1 ms")
                      .arg(op.maxDurationMs));
        return;
    }

    inFlight_ = true;
    const quint64 generation = generation_;
    const std::uint64_t seq = tracker_.beginPoll();
    QPointer<OperationMonitor> self(this);
    transport_->fetchProgress(op.id, [self, generation,
                                      seq](const ProgressReply &r) {
        if (!self)
            return;
        self->inFlight_ = false;
        if (!self->accepts(generation)) {
            qCDebug(jwMonitor) << "discarding stale poll result"
                               << "id="
                               << QString::fromStdString(
                                      self->tracker_.operation().id);
            return;
        }
        self->onProgress(r, seq);
    });
}

void OperationMonitor::onProgress(const ProgressReply &reply,
                                  std::uint64_t seq) {
    const Operation &op = tracker_.operation();
    if (!reply.ok) {
        const TickOutcome outcome = tracker_.onPollFailure();
        qCInfo(jwMonitor) << "poll failed"
                          << "id=" << QString::fromStdString(op.id)
                          << "failure=" << toString(reply.failure)
                          << "errors=" << op.consecutiveErrorCount << "/"
                          << op.maxConsecutiveErrors
                          << "error=" << QString::fromStdString(reply.error);
        if (outcome == TickOutcome::Abort) {
            abortWith(AbortReason::PersistentError,
                      QStringLiteral("Lost contact with the worker: %1")
                          .arg(QString::fromStdString(reply.error)));
            return;
        }
        scheduleNext(op.pollIntervalMs);
        return;
    }

    bool changed = false;
    const TickOutcome outcome =
        tracker_.onPollSuccess(reply.snapshot, changed, seq);
    emit tick(reply.snapshot);
    if (changed && running_)
        emit itemsChanged();
    if (!running_)
        return; // a subscriber stopped or canceled us

    switch (outcome) {
    case TickOutcome::Terminal: {
        running_ = false;
        ++generation_;
        poll_.cancel();
        if (!finalizer_.finalize(tracker_.operation(), tracker_.items(),
                                 reply.snapshot)) {
            qCWarning(jwMonitor) << "terminal snapshot not applied"
                                 << "id=" << QString::fromStdString(op.id);
            return;
        }
        qCInfo(jwMonitor) << "operation finished"
                          << "id=" << QString::fromStdString(op.id)
                          << "status=" << toString(op.status);
        return;
    }
    case TickOutcome::Paused:
        qCInfo(jwMonitor) << "backend reports paused"
                          << "id=" << QString::fromStdString(op.id);
        emit paused();
        break;
    case TickOutcome::Resumed:
        qCInfo(jwMonitor) << "backend reports running"
                          << "id=" << QString::fromStdString(op.id);
        emit resumed();
        break;
    case TickOutcome::Continue:
    case TickOutcome::Abort:
        break;
    }
    scheduleNext(op.pollIntervalMs);
}

bool OperationMonitor::abortWith(AbortReason reason, const QString &message) {
    if (!tracker_.abort(reason))
        return false;
    running_ = false;
    ++generation_;
    poll_.cancel();
    const Operation &op = tracker_.operation();
    registry_.release(op.handle);
    qCWarning(jwMonitor) << "operation aborted"
                         << "id=" << QString::fromStdString(op.id)
                         << "reason=" << toString(reason)
                         << "status=" << toString(op.status)
                         << "message=" << message;
    emit aborted(reason, message);
    return true;
}

bool OperationMonitor::cancel() {
    if (!running_)
        return false;
    const std::string id = tracker_.operation().id;
    if (!abortWith(AbortReason::Canceled, QStringLiteral("Canceled by user")))
        return false;
    transport_->stopOperation(id, [id](const AckReply &r) {
        if (r.ok)
            qCInfo(jwMonitor) << "remote stop acknowledged"
                              << "id=" << QString::fromStdString(id);
        else
            qCWarning(jwMonitor) << "remote stop failed"
                                 << "id=" << QString::fromStdString(id)
                                 << "error=" << QString::fromStdString(r.error);
    });
    return true;
}

bool OperationMonitor::requestPause() {
    const Operation &op = tracker_.operation();
    if (!running_ || tracker_.controlPending() ||
        op.status != OperationStatus::Running) {
        qCInfo(jwMonitor) << "pause rejected"
                          << "id=" << QString::fromStdString(op.id)
                          << "status=" << toString(op.status)
                          << "pending=" << tracker_.controlPending();
        return false;
    }
    tracker_.setControlPending(true);
    const quint64 generation = generation_;
    QPointer<OperationMonitor> self(this);
    qCInfo(jwMonitor) << "pause requested"
                      << "id=" << QString::fromStdString(op.id);
    transport_->pauseOperation(op.id, [self, generation](const AckReply &r) {
        if (self && self->accepts(generation))
            self->onControlReply(true, r);
    });
    return true;
}

bool OperationMonitor::requestResume() {
    const Operation &op = tracker_.operation();
    if (!running_ || tracker_.controlPending() ||
        op.status != OperationStatus::Paused) {
        qCInfo(jwMonitor) << "resume rejected"
                          << "id=" << QString::fromStdString(op.id)
                          << "status=" << toString(op.status)
                          << "pending=" << tracker_.controlPending();
        return false;
    }
    tracker_.setControlPending(true);
    const quint64 generation = generation_;
    QPointer<OperationMonitor> self(this);
    qCInfo(jwMonitor) << "resume requested"
                      << "id=" << QString::fromStdString(op.id);
    transport_->resumeOperation(op.id, [self, generation](const AckReply &r) {
        if (self && self->accepts(generation))
            self->onControlReply(false, r);
    });
    return true;
}

void OperationMonitor::onControlReply(bool pause, const AckReply &reply) {
    tracker_.setControlPending(false);
    const Operation &op = tracker_.operation();
    if (!reply.ok) {
        qCWarning(jwMonitor) << (pause ? "pause" : "resume") << "refused"
                             << "id=" << QString::fromStdString(op.id)
                             << "error=" << QString::fromStdString(reply.error);
        emit controlFailed(QString::fromStdString(reply.error));
        return;
    }
    if (pause ? tracker_.markPaused() : tracker_.markResumed()) {
        qCInfo(jwMonitor) << (pause ? "paused" : "resumed")
                          << "id=" << QString::fromStdString(op.id);
        if (pause)
            emit paused();
        else
            emit resumed();
    }
}
