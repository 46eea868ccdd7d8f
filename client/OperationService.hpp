// Entry point for collaborators: starts remote operations, one per class at a
// time, and relays their progress as signals.
#pragma once
#include "ClientSettings.hpp"
#include "OperationMonitor.hpp"
#include "jobwatch/OperationRegistry.hpp"
#include "jobwatch/OperationTransport.hpp"
#include "jobwatch/OperationTypes.hpp"

#include <QObject>
#include <QPointer>
#include <QString>
#include <functional>
#include <map>
#include <optional>
#include <vector>

class OperationService : public QObject {
    Q_OBJECT
public:
    using Clock = std::function<qint64()>;

    // The transport is not owned and must outlive the service.
    OperationService(jobwatch::OperationTransport *transport,
                     ClientSettings settings, QObject *parent = nullptr);
    ~OperationService() override;

    // Takes the class slot and sends the start request. Returns false with
    // ErrorKind::AlreadyActive (no network call) when the class is busy, or
    // InvalidInput for an empty item list. A start request that fails later
    // is reported through aborted(cls, StartFailed, ...).
    // `items` must stay alive until terminal() or aborted() for that class.
    bool startOperation(jobwatch::OperationClass cls,
                        std::vector<jobwatch::Item> &items,
                        const jobwatch::StartRequest &request,
                        jobwatch::OperationHandle &out,
                        jobwatch::EngineError &err);

    bool pause(jobwatch::OperationClass cls);
    bool resume(jobwatch::OperationClass cls);
    bool cancel(jobwatch::OperationClass cls);

    bool isPolling(jobwatch::OperationClass cls) const;
    // Latest snapshot of the current (or most recently finished) operation.
    std::optional<jobwatch::ProgressSnapshot>
    currentSnapshot(jobwatch::OperationClass cls) const;
    std::optional<jobwatch::Operation>
    currentOperation(jobwatch::OperationClass cls) const;

    jobwatch::OperationRegistry &registry() { return registry_; }
    const ClientSettings &settings() const { return settings_; }
    void setClock(Clock clock) { clock_ = std::move(clock); }

signals:
    void started(jobwatch::OperationClass cls, const QString &operationId);
    void tick(jobwatch::OperationClass cls,
              const jobwatch::ProgressSnapshot &snapshot);
    void itemsChanged(jobwatch::OperationClass cls);
    void paused(jobwatch::OperationClass cls);
    void resumed(jobwatch::OperationClass cls);
    void controlFailed(jobwatch::OperationClass cls, const QString &message);
    void terminal(const jobwatch::TerminalSummary &summary);
    void aborted(jobwatch::OperationClass cls, jobwatch::AbortReason reason,
                 const QString &message);

private:
    void onStartReply(jobwatch::OperationClass cls,
                      const jobwatch::OperationHandle &handle,
                      std::vector<jobwatch::Item> &items,
                      const jobwatch::StartReply &reply);
    OperationMonitor *monitorFor(jobwatch::OperationClass cls) const;
    void retire(jobwatch::OperationClass cls);

    jobwatch::OperationTransport *transport_ = nullptr; // not owned
    ClientSettings settings_;
    jobwatch::OperationRegistry registry_;
    std::map<jobwatch::OperationClass, QPointer<OperationMonitor>> monitors_;
    // Item lists of start requests still waiting for their reply.
    std::map<jobwatch::OperationClass, std::vector<jobwatch::Item> *>
        pendingStarts_;
    Clock clock_;
};
