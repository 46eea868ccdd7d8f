// Basic types shared between the engine, the transports and the client layer.
// Kept as plain structs so collaborators can copy snapshots freely.
#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace jobwatch {

// Operation kind; doubles as the mutual-exclusion key of the registry.
enum class OperationClass { Convert, Patch, Publish, Auth };

enum class ItemStatus { Pending, Starting, Processing, Completed, Error };

// Local lifecycle of an operation.
//  - Running: polling, backend working
//  - Paused: polling, backend acknowledged a pause
//  - Completed / Error / TimedOut: terminal, nothing leaves these
enum class OperationStatus { Running, Paused, Completed, Error, TimedOut };

// Operation-level status as reported by the backend, after normalization.
enum class RemoteStatus { Running, Paused, Completed, Error };

enum class AbortReason { PersistentError, Timeout, Canceled, StartFailed };

enum class ErrorKind {
    None,
    Transport,       // one failed/malformed poll (absorbed up to threshold)
    PersistentError, // too many consecutive transport errors
    RemoteJob,       // backend reported error for the job or an item
    Timeout,
    AlreadyActive,   // class slot taken, rejected before any network call
    TransientAuth,   // resource-locked during auth, retried then surfaced
    StartFailed,
    Canceled,
    InvalidInput,
    Rejected         // non-transient failure reported by the backend
};

struct EngineError {
    ErrorKind kind = ErrorKind::None;
    std::string message;

    explicit operator bool() const { return kind != ErrorKind::None; }
};

// Failure classification of a single transport call.
enum class TransportFailure {
    None,
    Network,       // connection/HTTP level failure
    Malformed,     // body could not be normalized
    Rejected,      // backend answered success=false
    ResourceLocked // backend store busy ("database is locked")
};

// One unit of work (a file). The list is owned by the caller; the engine keeps
// a non-owning reference and mutates entries in place.
struct Item {
    int index = 0;    // join key with backend snapshots; never reassigned
    std::string path; // local file, sent to the worker on start
    ItemStatus status = ItemStatus::Pending;
    int progress = 0; // 0..100
    std::string stage;
    bool terminalReached = false; // once true the item is frozen
};

// Backend view of one item at a poll instant. Progress and stage are optional
// so "not reported" is distinguishable from "reported 0 / empty".
struct ItemSnapshot {
    ItemStatus status = ItemStatus::Processing;
    std::optional<int> progress;
    std::optional<std::string> stage;
};

// Canonical progress shape; produced only at the transport boundary.
struct ProgressSnapshot {
    RemoteStatus status = RemoteStatus::Running;
    bool paused = false;
    bool canPause = false;
    int progress = 0;
    std::string currentStage;
    std::map<int, ItemSnapshot> items;
    int completedCount = 0;
    int failedCount = 0;
    int totalCount = 0;
    std::optional<std::string> errorMessage;
};

// Issued by the registry; identifies one acquisition of a class slot.
struct OperationHandle {
    OperationClass cls = OperationClass::Convert;
    std::uint64_t serial = 0; // 0 = invalid

    bool valid() const { return serial != 0; }
};

// Polling limits for one operation class.
struct OperationPolicy {
    int pollIntervalMs = 2000;
    int maxConsecutiveErrors = 3;
    std::int64_t maxDurationMs = 30 * 60 * 1000;
    bool immediateFirstPoll = false;
};

struct Operation {
    std::string id; // opaque, issued by the backend
    OperationClass cls = OperationClass::Convert;
    OperationHandle handle;
    std::int64_t startedAtMs = 0;
    OperationStatus status = OperationStatus::Running;
    int consecutiveErrorCount = 0;
    int pollIntervalMs = 2000;
    int maxConsecutiveErrors = 3;
    std::int64_t maxDurationMs = 30 * 60 * 1000;
    bool finalized = false;
};

// Aggregate carried by the single terminal notification of an operation.
struct TerminalSummary {
    std::string operationId;
    OperationClass cls = OperationClass::Convert;
    OperationStatus status = OperationStatus::Completed;
    int successCount = 0;
    int failureCount = 0;
    int totalCount = 0;
    std::optional<std::string> errorMessage;
};

// Parameters of a start request. Options are class specific
// (e.g. "quality" for convert, "pack_name" for publish).
struct StartRequest {
    std::vector<std::string> files;
    std::string outputDir;
    std::map<std::string, std::string> options;
};

struct AuthCredentials {
    std::string apiId;
    std::string apiHash;
    std::string phoneNumber;
};

const char *toString(OperationClass cls);
const char *toString(ItemStatus status);
const char *toString(OperationStatus status);
const char *toString(RemoteStatus status);
const char *toString(AbortReason reason);
const char *toString(ErrorKind kind);
const char *toString(TransportFailure failure);

std::optional<OperationClass> operationClassFromString(const std::string &name);
// Accepts the backend's vocabulary ("failed", "converting", ...) as well.
std::optional<ItemStatus> itemStatusFromString(const std::string &name);

bool isTerminal(ItemStatus status);
bool isTerminal(OperationStatus status);
// Legal lifecycle edges; terminal statuses have none.
bool canTransition(OperationStatus from, OperationStatus to);

// Defaults per class, derived from how quickly each kind of job finishes.
OperationPolicy defaultPolicyFor(OperationClass cls);

} // namespace jobwatch
