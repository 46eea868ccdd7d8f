#include "OperationService.hpp"
#include "EngineMetaTypes.hpp"
#include "OperationMonitor.hpp"

#include <QDateTime>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(jwService, "jobwatch.service")

using namespace jobwatch;

namespace {

void resetItems(std::vector<Item> &items, ItemStatus status) {
    for (Item &item : items) {
        item.status = status;
        item.progress = 0;
        item.stage.clear();
        item.terminalReached = false;
    }
}

} // namespace

OperationService::OperationService(OperationTransport *transport,
                                   ClientSettings settings, QObject *parent)
    : QObject(parent), transport_(transport), settings_(std::move(settings)),
      clock_([] { return QDateTime::currentMSecsSinceEpoch(); }) {
    jobwatchclient::registerEngineMetaTypes();
}

OperationService::~OperationService() {
    for (auto &kv : monitors_) {
        if (kv.second)
            kv.second->stop();
    }
}

OperationMonitor *OperationService::monitorFor(OperationClass cls) const {
    auto it = monitors_.find(cls);
    return it == monitors_.end() ? nullptr : it->second.data();
}

void OperationService::retire(OperationClass cls) {
    auto it = monitors_.find(cls);
    if (it == monitors_.end())
        return;
    if (it->second) {
        it->second->stop();
        it->second->deleteLater();
    }
    monitors_.erase(it);
}

bool OperationService::startOperation(OperationClass cls,
                                      std::vector<Item> &items,
                                      const StartRequest &request,
                                      OperationHandle &out, EngineError &err) {
    if (!transport_) {
        err = {ErrorKind::StartFailed, "No transport configured"};
        return false;
    }
    if (cls == OperationClass::Auth) {
        err = {ErrorKind::InvalidInput,
               "Authentication is driven by the auth controller"};
        return false;
    }
    if (items.empty()) {
        err = {ErrorKind::InvalidInput, "No files selected"};
        return false;
    }
    OperationHandle handle;
    if (!registry_.tryAcquire(cls, handle, err)) {
        qCInfo(jwService) << "start rejected"
                          << "class=" << toString(cls)
                          << "reason=" << QString::fromStdString(err.message);
        return false;
    }
    retire(cls);

    StartRequest req = request;
    if (req.files.empty()) {
        for (const Item &item : items)
            req.files.push_back(item.path);
    }
    if (req.outputDir.empty())
        req.outputDir = settings_.defaultOutputDir.toStdString();

    resetItems(items, ItemStatus::Starting);
    out = handle;
    qCInfo(jwService) << "start requested"
                      << "class=" << toString(cls)
                      << "items=" << items.size()
                      << "serial=" << handle.serial;

    QPointer<OperationService> self(this);
    std::vector<Item> *list = &items;
    pendingStarts_[cls] = list;
    transport_->startOperation(
        cls, req, [self, cls, handle, list](const StartReply &reply) {
            if (self)
                self->onStartReply(cls, handle, *list, reply);
        });
    return true;
}

void OperationService::onStartReply(OperationClass cls,
                                    const OperationHandle &handle,
                                    std::vector<Item> &items,
                                    const StartReply &reply) {
    if (!registry_.isCurrent(handle)) {
        qCInfo(jwService) << "discarding stale start reply"
                          << "class=" << toString(cls)
                          << "serial=" << handle.serial;
        return;
    }
    pendingStarts_.erase(cls);
    if (!reply.ok || reply.operationId.empty()) {
        registry_.release(handle);
        resetItems(items, ItemStatus::Pending);
        const QString message = reply.error.empty()
                                    ? QStringLiteral("Start request failed")
                                    : QString::fromStdString(reply.error);
        qCWarning(jwService) << "start failed"
                             << "class=" << toString(cls)
                             << "failure=" << toString(reply.failure)
                             << "error=" << message;
        emit aborted(cls, AbortReason::StartFailed, message);
        return;
    }

    const qint64 now = clock_();
    if (!registry_.bindOperationId(handle, reply.operationId, now)) {
        qCWarning(jwService) << "slot changed before bind"
                             << "class=" << toString(cls);
        return;
    }
    const OperationPolicy policy = settings_.policyFor(cls);
    Operation op;
    op.id = reply.operationId;
    op.cls = cls;
    op.handle = handle;
    op.startedAtMs = now;
    op.pollIntervalMs = policy.pollIntervalMs;
    op.maxConsecutiveErrors = policy.maxConsecutiveErrors;
    op.maxDurationMs = policy.maxDurationMs;

    auto *monitor = new OperationMonitor(transport_, registry_, op, items,
                                         policy.immediateFirstPoll, this);
    monitor->setClock(clock_);
    connect(monitor, &OperationMonitor::tick, this,
            [this, cls](const ProgressSnapshot &s) { emit tick(cls, s); });
    connect(monitor, &OperationMonitor::itemsChanged, this,
            [this, cls] { emit itemsChanged(cls); });
    connect(monitor, &OperationMonitor::paused, this,
            [this, cls] { emit paused(cls); });
    connect(monitor, &OperationMonitor::resumed, this,
            [this, cls] { emit resumed(cls); });
    connect(monitor, &OperationMonitor::controlFailed, this,
            [this, cls](const QString &m) { emit controlFailed(cls, m); });
    connect(monitor, &OperationMonitor::terminal, this,
            &OperationService::terminal);
    connect(monitor, &OperationMonitor::aborted, this,
            [this, cls](AbortReason reason, const QString &m) {
                emit aborted(cls, reason, m);
            });
    monitors_[cls] = monitor;

    qCInfo(jwService) << "operation started"
                      << "class=" << toString(cls)
                      << "id=" << QString::fromStdString(op.id);
    monitor->start();
    emit started(cls, QString::fromStdString(op.id));
}

bool OperationService::pause(OperationClass cls) {
    OperationMonitor *m = monitorFor(cls);
    return m && m->requestPause();
}

bool OperationService::resume(OperationClass cls) {
    OperationMonitor *m = monitorFor(cls);
    return m && m->requestResume();
}

bool OperationService::cancel(OperationClass cls) {
    OperationMonitor *m = monitorFor(cls);
    if (m)
        return m->cancel();
    // Start request still in flight: drop the slot so its reply is ignored.
    if (registry_.isActive(cls)) {
        registry_.release(cls);
        auto it = pendingStarts_.find(cls);
        if (it != pendingStarts_.end()) {
            resetItems(*it->second, ItemStatus::Pending);
            pendingStarts_.erase(it);
        }
        qCInfo(jwService) << "pending start canceled"
                          << "class=" << toString(cls);
        emit aborted(cls, AbortReason::Canceled,
                     QStringLiteral("Canceled by user"));
        return true;
    }
    return false;
}

bool OperationService::isPolling(OperationClass cls) const {
    OperationMonitor *m = monitorFor(cls);
    return m && m->isPolling();
}

std::optional<ProgressSnapshot>
OperationService::currentSnapshot(OperationClass cls) const {
    OperationMonitor *m = monitorFor(cls);
    if (!m)
        return std::nullopt;
    return m->lastSnapshot();
}

std::optional<Operation>
OperationService::currentOperation(OperationClass cls) const {
    OperationMonitor *m = monitorFor(cls);
    if (!m)
        return std::nullopt;
    return m->operation();
}
