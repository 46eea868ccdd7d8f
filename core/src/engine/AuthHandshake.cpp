#include "jobwatch/AuthHandshake.hpp"

#include <cctype>

namespace jobwatch {

namespace {

bool blank(const std::string &s) {
    for (char c : s) {
        if (!std::isspace(static_cast<unsigned char>(c)))
            return false;
    }
    return true;
}

} // namespace

const char *toString(AuthPhase phase) {
    switch (phase) {
    case AuthPhase::Disconnected:
        return "disconnected";
    case AuthPhase::Connecting:
        return "connecting";
    case AuthPhase::AwaitingCode:
        return "awaitingCode";
    case AuthPhase::AwaitingPassword:
        return "awaitingPassword";
    case AuthPhase::Connected:
        return "connected";
    }
    return "unknown";
}

AuthHandshake::AuthHandshake(int backoffUnitMs, int maxLockedRetries)
    : backoffUnitMs_(backoffUnitMs > 0 ? backoffUnitMs : kDefaultBackoffUnitMs),
      maxLockedRetries_(maxLockedRetries > 0 ? maxLockedRetries
                                             : kDefaultMaxLockedRetries) {}

bool AuthHandshake::isValidCode(const std::string &code) {
    if (code.size() != 5)
        return false;
    for (char c : code) {
        if (c < '0' || c > '9')
            return false;
    }
    return true;
}

bool AuthHandshake::submitCredentials(const AuthCredentials &credentials,
                                      EngineError &err) {
    if (pending_ != Request::None || phase_ != AuthPhase::Disconnected) {
        err = {ErrorKind::Rejected,
               std::string("Cannot connect while ") + toString(phase_)};
        return false;
    }
    std::string missing;
    if (blank(credentials.apiId))
        missing += "API ID";
    if (blank(credentials.apiHash))
        missing += missing.empty() ? "API Hash" : ", API Hash";
    if (blank(credentials.phoneNumber))
        missing += missing.empty() ? "Phone Number" : ", Phone Number";
    if (!missing.empty()) {
        err = {ErrorKind::InvalidInput, "Please fill in: " + missing};
        return false;
    }
    phase_ = AuthPhase::Connecting;
    pending_ = Request::Connect;
    retryCount_ = 0;
    return true;
}

bool AuthHandshake::submitCode(const std::string &code, EngineError &err) {
    if (pending_ != Request::None || phase_ != AuthPhase::AwaitingCode) {
        err = {ErrorKind::Rejected, "No verification code was requested"};
        return false;
    }
    if (!isValidCode(code)) {
        err = {ErrorKind::InvalidInput, "Verification code should be 5 digits"};
        return false;
    }
    pending_ = Request::Code;
    return true;
}

bool AuthHandshake::submitPassword(const std::string &password,
                                   EngineError &err) {
    if (pending_ != Request::None || phase_ != AuthPhase::AwaitingPassword) {
        err = {ErrorKind::Rejected, "No 2FA password was requested"};
        return false;
    }
    if (blank(password)) {
        err = {ErrorKind::InvalidInput, "Please enter your 2FA password"};
        return false;
    }
    pending_ = Request::Password;
    return true;
}

AuthHandshake::Step AuthHandshake::failStep(AuthPhase back,
                                            const AuthReply &reply) {
    Step step;
    step.kind = Step::Kind::Failed;
    step.error.kind = (reply.failure == TransportFailure::Network)
                          ? ErrorKind::Transport
                          : ErrorKind::Rejected;
    step.error.message =
        reply.error.empty() ? std::string("Request failed") : reply.error;
    phase_ = back;
    pending_ = Request::None;
    return step;
}

AuthHandshake::Step AuthHandshake::onReply(const AuthReply &reply) {
    Step step;
    switch (pending_) {
    case Request::None:
        return step;

    case Request::Connect:
        if (reply.ok) {
            pending_ = Request::None;
            if (reply.needsCode)
                phase_ = AuthPhase::AwaitingCode;
            else if (reply.needsPassword)
                phase_ = AuthPhase::AwaitingPassword;
            else
                phase_ = AuthPhase::Connected;
            step.kind = Step::Kind::Advanced;
            return step;
        }
        if (reply.failure == TransportFailure::ResourceLocked) {
            ++retryCount_;
            if (retryCount_ < maxLockedRetries_) {
                step.kind = Step::Kind::RetryLater;
                step.retryDelayMs = retryCount_ * backoffUnitMs_;
                return step;
            }
            step = failStep(AuthPhase::Disconnected, reply);
            step.error.kind = ErrorKind::TransientAuth;
            step.error.message =
                "Database is locked. Please try again in a moment.";
            return step;
        }
        return failStep(AuthPhase::Disconnected, reply);

    case Request::Code:
        if (!reply.ok)
            return failStep(AuthPhase::AwaitingCode, reply);
        pending_ = Request::None;
        phase_ = reply.needsPassword ? AuthPhase::AwaitingPassword
                                     : AuthPhase::Connected;
        step.kind = Step::Kind::Advanced;
        return step;

    case Request::Password:
        if (!reply.ok)
            return failStep(AuthPhase::AwaitingPassword, reply);
        pending_ = Request::None;
        phase_ = AuthPhase::Connected;
        step.kind = Step::Kind::Advanced;
        return step;
    }
    return step;
}

void AuthHandshake::reset() {
    phase_ = AuthPhase::Disconnected;
    pending_ = Request::None;
    retryCount_ = 0;
}

} // namespace jobwatch
