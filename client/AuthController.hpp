// Drives the interactive account handshake against the worker. Holds the
// registry's auth slot while a submission is in flight and owns the backoff
// timer for "database is locked" retries.
#pragma once
#include "jobwatch/AuthHandshake.hpp"
#include "jobwatch/OperationRegistry.hpp"
#include "jobwatch/OperationTransport.hpp"

#include <QObject>
#include <QString>
#include <QTimer>

class AuthController : public QObject {
    Q_OBJECT
public:
    AuthController(jobwatch::OperationTransport *transport,
                   jobwatch::OperationRegistry &registry,
                   int retryBackoffMs = jobwatch::AuthHandshake::kDefaultBackoffUnitMs,
                   QObject *parent = nullptr);

    jobwatch::AuthPhase phase() const { return handshake_.phase(); }
    int retryCount() const { return handshake_.retryCount(); }
    bool busy() const { return handshake_.requestPending(); }

    // Each returns false without a network call when the input is invalid,
    // the phase does not expect it or another submission is in flight.
    bool submitCredentials(const jobwatch::AuthCredentials &credentials,
                           jobwatch::EngineError &err);
    bool submitCode(const std::string &code, jobwatch::EngineError &err);
    bool submitPassword(const std::string &password, jobwatch::EngineError &err);

    // Best-effort remote session clear; always ends disconnected.
    void disconnectAccount();

signals:
    void phaseChanged(jobwatch::AuthPhase phase);
    void retryScheduled(int attempt, int delayMs);
    void failed(const jobwatch::EngineError &error);
    void connected();

private:
    bool acquireSlot(jobwatch::EngineError &err);
    void releaseSlot();
    void sendPending();
    void onReply(const jobwatch::AuthReply &reply);
    void publishPhase();

    jobwatch::OperationTransport *transport_ = nullptr; // not owned
    jobwatch::OperationRegistry &registry_;
    jobwatch::AuthHandshake handshake_;
    jobwatch::OperationHandle slot_;
    QTimer retryTimer_;
    jobwatch::AuthCredentials credentials_;
    std::string code_;
    std::string password_;
    jobwatch::AuthPhase lastPublished_ = jobwatch::AuthPhase::Disconnected;
    quint64 generation_ = 0;
};
