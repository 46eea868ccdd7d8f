#include "AuthController.hpp"
#include "EngineMetaTypes.hpp"
#include "jobwatch/RuntimeLogging.hpp"

#include <QLoggingCategory>
#include <QPointer>

Q_LOGGING_CATEGORY(jwAuth, "jobwatch.auth")

using namespace jobwatch;

AuthController::AuthController(OperationTransport *transport,
                               OperationRegistry &registry, int retryBackoffMs,
                               QObject *parent)
    : QObject(parent), transport_(transport), registry_(registry),
      handshake_(retryBackoffMs) {
    jobwatchclient::registerEngineMetaTypes();
    retryTimer_.setSingleShot(true);
    connect(&retryTimer_, &QTimer::timeout, this, [this] { sendPending(); });
}

bool AuthController::acquireSlot(EngineError &err) {
    if (!transport_) {
        err = {ErrorKind::Rejected, "No transport configured"};
        return false;
    }
    if (slot_.valid() && registry_.isCurrent(slot_)) {
        err = {ErrorKind::AlreadyActive, "A sign-in request is already in progress"};
        return false;
    }
    return registry_.tryAcquire(OperationClass::Auth, slot_, err);
}

void AuthController::releaseSlot() {
    if (slot_.valid())
        registry_.release(slot_);
    slot_ = OperationHandle{};
}

void AuthController::publishPhase() {
    const AuthPhase now = handshake_.phase();
    if (now == lastPublished_)
        return;
    lastPublished_ = now;
    qCInfo(jwAuth) << "phase" << toString(now);
    emit phaseChanged(now);
}

bool AuthController::submitCredentials(const AuthCredentials &credentials,
                                       EngineError &err) {
    if (!acquireSlot(err))
        return false;
    if (!handshake_.submitCredentials(credentials, err)) {
        releaseSlot();
        qCInfo(jwAuth) << "credentials rejected"
                       << "reason=" << QString::fromStdString(err.message);
        return false;
    }
    credentials_ = credentials;
    qCInfo(jwAuth) << "connect"
                   << "apiId=" << QString::fromStdString(credentials.apiId)
                   << "apiHash=" << QString::fromStdString(redacted(credentials.apiHash))
                   << "phone=" << QString::fromStdString(redacted(credentials.phoneNumber, 4));
    publishPhase();
    sendPending();
    return true;
}

bool AuthController::submitCode(const std::string &code, EngineError &err) {
    if (!acquireSlot(err))
        return false;
    if (!handshake_.submitCode(code, err)) {
        releaseSlot();
        qCInfo(jwAuth) << "code rejected"
                       << "reason=" << QString::fromStdString(err.message);
        return false;
    }
    code_ = code;
    qCInfo(jwAuth) << "verify code"
                   << "code=" << QString::fromStdString(redacted(code));
    sendPending();
    return true;
}

bool AuthController::submitPassword(const std::string &password,
                                    EngineError &err) {
    if (!acquireSlot(err))
        return false;
    if (!handshake_.submitPassword(password, err)) {
        releaseSlot();
        qCInfo(jwAuth) << "password rejected"
                       << "reason=" << QString::fromStdString(err.message);
        return false;
    }
    password_ = password;
    qCInfo(jwAuth) << "verify password"
                   << "password=" << QString::fromStdString(redacted(password));
    sendPending();
    return true;
}

void AuthController::sendPending() {
    const quint64 generation = generation_;
    QPointer<AuthController> self(this);
    auto done = [self, generation](const AuthReply &reply) {
        if (!self || generation != self->generation_) {
            qCDebug(jwAuth) << "discarding stale auth reply";
            return;
        }
        self->onReply(reply);
    };
    switch (handshake_.pendingRequest()) {
    case AuthHandshake::Request::Connect:
        transport_->connectAccount(credentials_, done);
        break;
    case AuthHandshake::Request::Code:
        transport_->verifyCode(code_, done);
        break;
    case AuthHandshake::Request::Password:
        transport_->verifyPassword(password_, done);
        break;
    case AuthHandshake::Request::None:
        break;
    }
}

void AuthController::onReply(const AuthReply &reply) {
    const AuthHandshake::Step step = handshake_.onReply(reply);
    switch (step.kind) {
    case AuthHandshake::Step::Kind::RetryLater:
        qCInfo(jwAuth) << "backend busy; retrying"
                       << "attempt=" << handshake_.retryCount()
                       << "delayMs=" << step.retryDelayMs;
        emit retryScheduled(handshake_.retryCount(), step.retryDelayMs);
        retryTimer_.start(step.retryDelayMs);
        return;
    case AuthHandshake::Step::Kind::Advanced:
        releaseSlot();
        password_.clear();
        publishPhase();
        if (handshake_.phase() == AuthPhase::Connected)
            emit connected();
        return;
    case AuthHandshake::Step::Kind::Failed:
        releaseSlot();
        password_.clear();
        qCWarning(jwAuth) << "auth step failed"
                          << "kind=" << toString(step.error.kind)
                          << "phase=" << toString(handshake_.phase())
                          << "error=" << QString::fromStdString(step.error.message);
        publishPhase();
        emit failed(step.error);
        return;
    case AuthHandshake::Step::Kind::Ignored:
        return;
    }
}

void AuthController::disconnectAccount() {
    ++generation_;
    retryTimer_.stop();
    handshake_.reset();
    releaseSlot();
    code_.clear();
    password_.clear();
    qCInfo(jwAuth) << "disconnect requested";
    if (transport_) {
        transport_->clearSession([](const AckReply &r) {
            if (!r.ok)
                qCWarning(jwAuth) << "clear session failed"
                                  << "error=" << QString::fromStdString(r.error);
        });
    }
    publishPhase();
}
