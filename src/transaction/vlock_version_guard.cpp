#include "transaction/vlock_version_guard.hpp"
#include "storage/vlock_record_store.hpp"
#include "vlock_logger.hpp"

namespace vlock {

ReadResult VersionGuard::beginRead(const Key& key) const {
    ReadResult result;
    auto record = store_.get(key);
    if (!record) {
        result.status = ConflictResult::notFound(key);
        result.version = NO_VERSION;
        return result;
    }
    result.status = ConflictResult::success(record->version, key);
    result.payload = std::move(record->payload);
    result.version = record->version;
    return result;
}

ConflictResult VersionGuard::tryCommit(const Key& key, Version expected_version, const Payload& payload) {
    ConflictResult result = store_.compareAndSet(key, expected_version, payload);
    if (!result.ok()) {
        VLOCK_LOG_DEBUG("optimistic commit rejected: ", result);
    }
    return result;
}

ConflictResult VersionGuard::tryCommitAll(const std::vector<WriteIntent>& intents,
                                          std::vector<Version>* new_versions) {
    ConflictResult result = store_.applyBatch(intents, new_versions);
    if (!result.ok()) {
        VLOCK_LOG_DEBUG("optimistic batch commit rejected: ", result);
    }
    return result;
}

} // namespace vlock
