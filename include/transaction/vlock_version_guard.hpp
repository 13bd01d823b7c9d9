#pragma once

#include "../vlock_core.hpp"
#include "../vlock_result.hpp"
#include <vector>

namespace vlock {
class RecordStore;

// VersionGuard类，乐观并发控制：先写者胜，读不阻塞
// 冲突时不做任何重试，由调用方通过ConflictPolicy决定
class VersionGuard {
private:
    RecordStore& store_;

public:
    explicit VersionGuard(RecordStore& store) : store_(store) {}
    ~VersionGuard() = default;

    VersionGuard(const VersionGuard&) = delete;
    VersionGuard& operator=(const VersionGuard&) = delete;

    // 读取记录和版本号，不加锁；键不存在时版本号为0，状态为NOT_FOUND
    ReadResult beginRead(const Key& key) const;

    // 单键提交，委托给compareAndSet
    ConflictResult tryCommit(const Key& key, Version expected_version, const Payload& payload);

    // 多键提交，全部成功或全部不生效
    ConflictResult tryCommitAll(const std::vector<WriteIntent>& intents,
                                std::vector<Version>* new_versions = nullptr);
};

} // namespace vlock
