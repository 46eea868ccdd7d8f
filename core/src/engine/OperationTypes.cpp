#include "jobwatch/OperationTypes.hpp"

#include <cctype>

namespace jobwatch {

namespace {

std::string lowered(const std::string &in) {
    std::string out = in;
    for (char &c : out)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

} // namespace

const char *toString(OperationClass cls) {
    switch (cls) {
    case OperationClass::Convert:
        return "convert";
    case OperationClass::Patch:
        return "patch";
    case OperationClass::Publish:
        return "publish";
    case OperationClass::Auth:
        return "auth";
    }
    return "unknown";
}

const char *toString(ItemStatus status) {
    switch (status) {
    case ItemStatus::Pending:
        return "pending";
    case ItemStatus::Starting:
        return "starting";
    case ItemStatus::Processing:
        return "processing";
    case ItemStatus::Completed:
        return "completed";
    case ItemStatus::Error:
        return "error";
    }
    return "unknown";
}

const char *toString(OperationStatus status) {
    switch (status) {
    case OperationStatus::Running:
        return "running";
    case OperationStatus::Paused:
        return "paused";
    case OperationStatus::Completed:
        return "completed";
    case OperationStatus::Error:
        return "error";
    case OperationStatus::TimedOut:
        return "timedOut";
    }
    return "unknown";
}

const char *toString(RemoteStatus status) {
    switch (status) {
    case RemoteStatus::Running:
        return "running";
    case RemoteStatus::Paused:
        return "paused";
    case RemoteStatus::Completed:
        return "completed";
    case RemoteStatus::Error:
        return "error";
    }
    return "unknown";
}

const char *toString(AbortReason reason) {
    switch (reason) {
    case AbortReason::PersistentError:
        return "persistent-error";
    case AbortReason::Timeout:
        return "timeout";
    case AbortReason::Canceled:
        return "canceled";
    case AbortReason::StartFailed:
        return "start-failed";
    }
    return "unknown";
}

const char *toString(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:
        return "none";
    case ErrorKind::Transport:
        return "transport";
    case ErrorKind::PersistentError:
        return "persistent-error";
    case ErrorKind::RemoteJob:
        return "remote-job";
    case ErrorKind::Timeout:
        return "timeout";
    case ErrorKind::AlreadyActive:
        return "already-active";
    case ErrorKind::TransientAuth:
        return "transient-auth";
    case ErrorKind::StartFailed:
        return "start-failed";
    case ErrorKind::Canceled:
        return "canceled";
    case ErrorKind::InvalidInput:
        return "invalid-input";
    case ErrorKind::Rejected:
        return "rejected";
    }
    return "unknown";
}

const char *toString(TransportFailure failure) {
    switch (failure) {
    case TransportFailure::None:
        return "none";
    case TransportFailure::Network:
        return "network";
    case TransportFailure::Malformed:
        return "malformed";
    case TransportFailure::Rejected:
        return "rejected";
    case TransportFailure::ResourceLocked:
        return "resource-locked";
    }
    return "unknown";
}

std::optional<OperationClass> operationClassFromString(const std::string &name) {
    const std::string n = lowered(name);
    if (n == "convert")
        return OperationClass::Convert;
    if (n == "patch" || n == "hex-edit" || n == "hexedit")
        return OperationClass::Patch;
    if (n == "publish")
        return OperationClass::Publish;
    if (n == "auth")
        return OperationClass::Auth;
    return std::nullopt;
}

std::optional<ItemStatus> itemStatusFromString(const std::string &name) {
    const std::string n = lowered(name);
    if (n == "pending" || n == "queued" || n == "waiting")
        return ItemStatus::Pending;
    if (n == "starting" || n == "initializing")
        return ItemStatus::Starting;
    if (n == "processing" || n == "converting" || n == "running" ||
        n == "uploading")
        return ItemStatus::Processing;
    if (n == "completed" || n == "done" || n == "success")
        return ItemStatus::Completed;
    if (n == "error" || n == "failed")
        return ItemStatus::Error;
    return std::nullopt;
}

bool isTerminal(ItemStatus status) {
    return status == ItemStatus::Completed || status == ItemStatus::Error;
}

bool isTerminal(OperationStatus status) {
    return status == OperationStatus::Completed ||
           status == OperationStatus::Error ||
           status == OperationStatus::TimedOut;
}

bool canTransition(OperationStatus from, OperationStatus to) {
    if (isTerminal(from) || from == to)
        return false;
    if (from == OperationStatus::Running)
        return true;
    // Paused: back to running, or straight to a terminal status.
    return to != OperationStatus::Paused;
}

OperationPolicy defaultPolicyFor(OperationClass cls) {
    OperationPolicy p;
    switch (cls) {
    case OperationClass::Convert:
        p.pollIntervalMs = 2000;
        p.maxConsecutiveErrors = 3;
        p.maxDurationMs = 30LL * 60 * 1000;
        break;
    case OperationClass::Patch:
        p.pollIntervalMs = 250;
        p.maxConsecutiveErrors = 8;
        p.maxDurationMs = 10LL * 60 * 1000;
        p.immediateFirstPoll = true;
        break;
    case OperationClass::Publish:
        p.pollIntervalMs = 2000;
        p.maxConsecutiveErrors = 3;
        p.maxDurationMs = 60LL * 60 * 1000;
        break;
    case OperationClass::Auth:
        // Auth never polls; the limits only bound a stuck handshake.
        p.pollIntervalMs = 1000;
        p.maxConsecutiveErrors = 3;
        p.maxDurationMs = 5LL * 60 * 1000;
        break;
    }
    return p;
}

} // namespace jobwatch
