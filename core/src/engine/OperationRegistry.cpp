#include "jobwatch/OperationRegistry.hpp"

#include <algorithm>

namespace jobwatch {

namespace {

int slotKey(OperationClass cls) { return static_cast<int>(cls); }

} // namespace

bool OperationRegistry::tryAcquire(OperationClass cls, OperationHandle &out,
                                   EngineError &err) {
    if (slots_.count(slotKey(cls)) > 0) {
        err.kind = ErrorKind::AlreadyActive;
        err.message = std::string("An operation of class '") + toString(cls) +
                      "' is already active";
        return false;
    }
    Entry e;
    e.handle.cls = cls;
    e.handle.serial = nextSerial_++;
    slots_.emplace(slotKey(cls), e);
    out = e.handle;
    return true;
}

void OperationRegistry::release(OperationClass cls) {
    slots_.erase(slotKey(cls));
}

bool OperationRegistry::release(const OperationHandle &handle) {
    if (!isCurrent(handle))
        return false;
    slots_.erase(slotKey(handle.cls));
    return true;
}

bool OperationRegistry::bindOperationId(const OperationHandle &handle,
                                        const std::string &id,
                                        std::int64_t startedAtMs) {
    auto it = slots_.find(slotKey(handle.cls));
    if (it == slots_.end() || it->second.handle.serial != handle.serial)
        return false;
    it->second.operationId = id;
    it->second.startedAtMs = startedAtMs;
    return true;
}

bool OperationRegistry::isActive(OperationClass cls) const {
    return slots_.count(slotKey(cls)) > 0;
}

bool OperationRegistry::isCurrent(const OperationHandle &handle) const {
    if (!handle.valid())
        return false;
    auto it = slots_.find(slotKey(handle.cls));
    return it != slots_.end() && it->second.handle.serial == handle.serial;
}

std::optional<OperationRegistry::Entry>
OperationRegistry::entryFor(OperationClass cls) const {
    auto it = slots_.find(slotKey(cls));
    if (it == slots_.end())
        return std::nullopt;
    return it->second;
}

std::optional<OperationRegistry::Entry>
OperationRegistry::findByOperationId(const std::string &id) const {
    if (id.empty())
        return std::nullopt;
    for (const auto &kv : slots_) {
        if (kv.second.operationId == id)
            return kv.second;
    }
    return std::nullopt;
}

std::vector<OperationClass> OperationRegistry::activeClasses() const {
    std::vector<OperationClass> out;
    out.reserve(slots_.size());
    for (const auto &kv : slots_)
        out.push_back(kv.second.handle.cls);
    std::sort(out.begin(), out.end(), [](OperationClass a, OperationClass b) {
        return slotKey(a) < slotKey(b);
    });
    return out;
}

} // namespace jobwatch
