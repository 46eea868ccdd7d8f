// Process-wide table of in-flight operations, one slot per operation class.
#pragma once
#include "OperationTypes.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace jobwatch {

class OperationRegistry {
public:
    struct Entry {
        OperationHandle handle;
        std::string operationId;  // empty until the start request succeeds
        std::int64_t startedAtMs = 0;
    };

    // Takes the slot for `cls`. Fails with ErrorKind::AlreadyActive when an
    // operation of the same class is still registered. Other classes are
    // unaffected.
    bool tryAcquire(OperationClass cls, OperationHandle &out, EngineError &err);

    // Frees the slot. Safe to call repeatedly or on an empty slot.
    void release(OperationClass cls);
    // Frees the slot only if it still belongs to `handle`; a late release
    // from an older acquisition must not drop a newer operation.
    bool release(const OperationHandle &handle);

    // Records the backend id once the remote job exists.
    bool bindOperationId(const OperationHandle &handle, const std::string &id,
                         std::int64_t startedAtMs);

    bool isActive(OperationClass cls) const;
    // True while `handle` still owns its class slot. Used to discard results
    // that arrive after an abort.
    bool isCurrent(const OperationHandle &handle) const;
    std::optional<Entry> entryFor(OperationClass cls) const;
    std::optional<Entry> findByOperationId(const std::string &id) const;
    std::vector<OperationClass> activeClasses() const;

private:
    std::unordered_map<int, Entry> slots_; // keyed by class
    std::uint64_t nextSerial_ = 1;
};

} // namespace jobwatch
