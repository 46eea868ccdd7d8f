// Abstract transport to the worker process. Concrete implementations (HTTP,
// mock) must honour this API so the engine stays decoupled from the wire.
// All calls are asynchronous: `done` is invoked exactly once, possibly before
// the call returns, with a normalized reply.
#pragma once
#include "OperationTypes.hpp"

#include <functional>
#include <string>

namespace jobwatch {

struct StartReply {
    bool ok = false;
    std::string operationId;
    TransportFailure failure = TransportFailure::None;
    std::string error;
};

struct ProgressReply {
    bool ok = false;
    ProgressSnapshot snapshot;
    TransportFailure failure = TransportFailure::None;
    std::string error;
};

struct AckReply {
    bool ok = false;
    TransportFailure failure = TransportFailure::None;
    std::string error;
};

struct AuthReply {
    bool ok = false;
    bool needsCode = false;
    bool needsPassword = false;
    TransportFailure failure = TransportFailure::None;
    std::string error;
};

class OperationTransport {
public:
    using StartCB = std::function<void(const StartReply &)>;
    using ProgressCB = std::function<void(const ProgressReply &)>;
    using AckCB = std::function<void(const AckReply &)>;
    using AuthCB = std::function<void(const AuthReply &)>;

    virtual ~OperationTransport() = default;

    // Remote jobs
    virtual void startOperation(OperationClass cls, const StartRequest &req,
                                StartCB done) = 0;
    virtual void fetchProgress(const std::string &operationId,
                               ProgressCB done) = 0;
    virtual void pauseOperation(const std::string &operationId,
                                AckCB done) = 0;
    virtual void resumeOperation(const std::string &operationId,
                                 AckCB done) = 0;
    // Hard stop of a remote job (user cancel).
    virtual void stopOperation(const std::string &operationId, AckCB done) = 0;

    // Interactive authentication
    virtual void connectAccount(const AuthCredentials &credentials,
                                AuthCB done) = 0;
    virtual void verifyCode(const std::string &code, AuthCB done) = 0;
    virtual void verifyPassword(const std::string &password, AuthCB done) = 0;
    virtual void clearSession(AckCB done) = 0;

    // Worker liveness
    virtual void checkHealth(AckCB done) = 0;
};

} // namespace jobwatch
