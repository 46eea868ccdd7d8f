// State machine of the interactive remote-authentication handshake:
// credentials -> optional code -> optional second factor -> connected.
// Pure: the caller performs the transport calls and owns the backoff timer.
#pragma once
#include "OperationTransport.hpp"
#include "OperationTypes.hpp"

#include <string>

namespace jobwatch {

enum class AuthPhase {
    Disconnected,
    Connecting,
    AwaitingCode,
    AwaitingPassword,
    Connected
};

const char *toString(AuthPhase phase);

class AuthHandshake {
public:
    enum class Request { None, Connect, Code, Password };

    struct Step {
        enum class Kind {
            Advanced,   // phase changed (or stayed) after a successful reply
            RetryLater, // transient failure; resubmit after retryDelayMs
            Failed,     // surfaced failure; phase is back to the prior step
            Ignored     // no request pending
        };
        Kind kind = Kind::Ignored;
        int retryDelayMs = 0;
        EngineError error;
    };

    static constexpr int kDefaultBackoffUnitMs = 1000;
    static constexpr int kDefaultMaxLockedRetries = 3;

    explicit AuthHandshake(int backoffUnitMs = kDefaultBackoffUnitMs,
                           int maxLockedRetries = kDefaultMaxLockedRetries);

    AuthPhase phase() const { return phase_; }
    int retryCount() const { return retryCount_; }
    Request pendingRequest() const { return pending_; }
    bool requestPending() const { return pending_ != Request::None; }

    // Validate input and move to the submitting state. Never transition on
    // invalid input; `err` is ErrorKind::InvalidInput in that case.
    bool submitCredentials(const AuthCredentials &credentials,
                           EngineError &err);
    bool submitCode(const std::string &code, EngineError &err);
    bool submitPassword(const std::string &password, EngineError &err);

    Step onReply(const AuthReply &reply);

    // Back to disconnected, clearing retries and any pending request.
    void reset();

    // Exactly five ASCII digits.
    static bool isValidCode(const std::string &code);

private:
    int backoffUnitMs_;
    int maxLockedRetries_;
    AuthPhase phase_ = AuthPhase::Disconnected;
    Request pending_ = Request::None;
    int retryCount_ = 0;

    Step failStep(AuthPhase back, const AuthReply &reply);
};

} // namespace jobwatch
