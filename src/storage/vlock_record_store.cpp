#include "storage/vlock_record_store.hpp"
#include "vlock_logger.hpp"
#include <algorithm>

namespace vlock {

std::optional<Record> RecordStore::get(const Key& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = data_.find(key);
    if (it == data_.end()) {
        return std::nullopt;
    }
    return it->second;
}

ConflictResult RecordStore::compareAndSet(const Key& key, Version expected_version, const Payload& payload) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    Version current = currentVersionLocked(key);
    if (current != expected_version) {
        VLOCK_LOG_DEBUGF("compareAndSet mismatch on key {}: expected {}, actual {}", key, expected_version, current);
        return ConflictResult::versionMismatch(key, expected_version, current);
    }
    return ConflictResult::success(writeLocked(key, payload), key);
}

Version RecordStore::forceSet(const Key& key, const Payload& payload) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return writeLocked(key, payload);
}

ConflictResult RecordStore::applyBatch(const std::vector<WriteIntent>& intents,
                                       std::vector<Version>* new_versions) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    // 第一阶段：校验，不修改任何数据
    for (const auto& intent : intents) {
        if (!intent.conditional) {
            continue;
        }
        Version current = currentVersionLocked(intent.key);
        if (current != intent.expected_version) {
            VLOCK_LOG_DEBUGF("batch rejected on key {}: expected {}, actual {}",
                             intent.key, intent.expected_version, current);
            return ConflictResult::versionMismatch(intent.key, intent.expected_version, current);
        }
    }

    // 第二阶段：写入
    if (new_versions) {
        new_versions->clear();
        new_versions->reserve(intents.size());
    }
    ConflictResult result = ConflictResult::success(NO_VERSION);
    for (const auto& intent : intents) {
        Version v = writeLocked(intent.key, intent.payload);
        if (new_versions) {
            new_versions->push_back(v);
        }
        result.key = intent.key;
        result.version = v;
    }
    return result;
}

void RecordStore::restore(const Record& record) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = data_.find(record.key);
    // 版本号不能回退
    if (it != data_.end() && it->second.version >= record.version) {
        VLOCK_LOG_WARNINGF("skip restoring key {} at version {}, store already at {}",
                           record.key, record.version, it->second.version);
        return;
    }
    data_[record.key] = record;
}

bool RecordStore::exists(const Key& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return data_.find(key) != data_.end();
}

size_t RecordStore::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return data_.size();
}

std::vector<Key> RecordStore::keys() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<Key> keys;
    keys.reserve(data_.size());
    for (const auto& pair : data_) {
        keys.push_back(pair.first);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

std::vector<Record> RecordStore::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<Record> records;
    records.reserve(data_.size());
    for (const auto& pair : data_) {
        records.push_back(pair.second);
    }
    return records;
}

void RecordStore::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    data_.clear();
}

Version RecordStore::currentVersionLocked(const Key& key) const {
    auto it = data_.find(key);
    return it == data_.end() ? NO_VERSION : it->second.version;
}

Version RecordStore::writeLocked(const Key& key, const Payload& payload) {
    Record& record = data_[key];
    record.key = key;
    record.payload = payload;
    record.version += 1;
    return record.version;
}

} // namespace vlock
