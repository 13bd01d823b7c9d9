#pragma once

#include "vlock_core.hpp"
#include <string>
#include <ostream>

namespace vlock {

// 冲突结果类型
enum class ConflictKind {
    SUCCESS = 0,
    VERSION_MISMATCH = 1,     // 乐观提交时版本号不一致
    LOCK_TIMEOUT = 2,         // 等待锁超时
    LOCK_HELD_BY_OTHER = 3,   // 锁被其他事务持有
    NOT_FOUND = 4,            // 键不存在
    CANCELLED = 5,            // 等待被取消
    INVALID_STATE = 6         // 事务已处于终止状态
};

const char* conflictKindToString(ConflictKind kind);

// 所有读写操作返回的带标签结果，不通过异常传递冲突
struct ConflictResult {
    ConflictKind kind;
    Key key;
    Version version;            // SUCCESS: 新版本号
    Version expected;           // VERSION_MISMATCH: 期望版本号
    Version actual;             // VERSION_MISMATCH: 实际版本号
    TransactionID holder;       // LOCK_HELD_BY_OTHER: 当前持有者
    Milliseconds waited;        // LOCK_TIMEOUT: 实际等待时长
    TransactionState state;     // INVALID_STATE: 事务所处的终止状态

    ConflictResult()
        : kind(ConflictKind::SUCCESS), version(NO_VERSION), expected(NO_VERSION),
          actual(NO_VERSION), holder(NO_TX), waited(0), state(TransactionState::ACTIVE) {}

    bool ok() const { return kind == ConflictKind::SUCCESS; }

    static ConflictResult success(Version new_version, const Key& key = Key());
    static ConflictResult versionMismatch(const Key& key, Version expected, Version actual);
    static ConflictResult lockTimeout(const Key& key, Milliseconds waited);
    static ConflictResult lockHeldByOther(const Key& key, TransactionID holder);
    static ConflictResult notFound(const Key& key);
    static ConflictResult cancelled(const Key& key);
    static ConflictResult invalidState(TransactionState state);

    std::string toString() const;
};

std::ostream& operator<<(std::ostream& os, const ConflictResult& result);

// 读取结果
struct ReadResult {
    ConflictResult status;      // SUCCESS 或 NOT_FOUND 表示读取成功
    Payload payload;
    Version version;            // 键不存在时为 NO_VERSION

    ReadResult() : version(NO_VERSION) {}

    bool found() const { return status.kind == ConflictKind::SUCCESS; }
    // NOT_FOUND 也是一次成功的读取，期望版本号为0
    bool ok() const { return found() || status.kind == ConflictKind::NOT_FOUND; }
};

} // namespace vlock
