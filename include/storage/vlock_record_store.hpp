#pragma once

#include "../vlock_core.hpp"
#include "../vlock_result.hpp"
#include <optional>
#include <shared_mutex>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace vlock {

// RecordStore类，独占所有记录数据
// 所有写入都经过 compareAndSet/forceSet/applyBatch，三者在同一把写锁内完成比较与写入
class RecordStore {
private:
    std::unordered_map<Key, Record> data_;
    mutable std::shared_mutex mutex_;

public:
    RecordStore() = default;
    ~RecordStore() = default;

    // 禁止拷贝和移动
    RecordStore(const RecordStore&) = delete;
    RecordStore& operator=(const RecordStore&) = delete;
    RecordStore(RecordStore&&) = delete;
    RecordStore& operator=(RecordStore&&) = delete;

    // 读取当前记录，键不存在时返回空
    std::optional<Record> get(const Key& key) const;

    // 原子比较并写入：期望版本与当前版本一致时写入并递增版本号
    // 不存在的键当前版本视为0
    ConflictResult compareAndSet(const Key& key, Version expected_version, const Payload& payload);

    // 无条件写入，仅用于已持有排他锁的提交，返回新版本号
    Version forceSet(const Key& key, const Payload& payload);

    // 批量写入：先校验所有条件写，全部通过后再一次性写入，否则不做任何修改
    // 成功时 version 为最后一个写入键的新版本号，new_versions 按 intents 顺序填充
    ConflictResult applyBatch(const std::vector<WriteIntent>& intents,
                              std::vector<Version>* new_versions = nullptr);

    // 从快照恢复记录，保留原版本号
    void restore(const Record& record);

    // 容器操作
    bool exists(const Key& key) const;
    size_t size() const;
    std::vector<Key> keys() const;
    std::vector<Record> snapshot() const;
    // 仅用于工具和测试，清空后版本号从1重新开始
    void clear();

private:
    // 调用方需持有写锁
    Version currentVersionLocked(const Key& key) const;
    Version writeLocked(const Key& key, const Payload& payload);
};

} // namespace vlock
