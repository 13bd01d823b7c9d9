#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <memory>
#include <chrono>

namespace vlock {

// 基础类型定义
using Key = std::string;
using Payload = std::string;
using Version = uint64_t;
using TransactionID = uint64_t;
using Timestamp = std::chrono::steady_clock::time_point;
using Milliseconds = std::chrono::milliseconds;

const TransactionID NO_TX = 0;
// 键不存在时的期望版本号
const Version NO_VERSION = 0;

// 读取模式
enum class ReadMode {
    OPTIMISTIC = 0,     // 乐观读：记录版本号，提交时校验
    PESSIMISTIC = 1     // 悲观读：读取前获取排他锁
};

// 锁模式
enum class LockMode {
    SHARED = 0,
    EXCLUSIVE = 1
};

// 事务状态
enum class TransactionState {
    ACTIVE = 0,
    COMMITTED = 1,
    ROLLED_BACK = 2
};

// 记录结构
struct Record {
    Key key;
    Payload payload;
    Version version;

    Record() : version(NO_VERSION) {}
    Record(const Key& k, const Payload& p, Version v) : key(k), payload(p), version(v) {}
};

// 提交时的写意图
struct WriteIntent {
    Key key;
    Payload payload;
    Version expected_version;   // 条件写时的期望版本
    bool conditional;           // false 表示无条件写（已持有排他锁）

    WriteIntent() : expected_version(NO_VERSION), conditional(true) {}
    WriteIntent(const Key& k, const Payload& p, Version expected, bool cond)
        : key(k), payload(p), expected_version(expected), conditional(cond) {}
};

inline const char* readModeToString(ReadMode mode) {
    switch (mode) {
        case ReadMode::OPTIMISTIC:
            return "optimistic";
        case ReadMode::PESSIMISTIC:
            return "pessimistic";
        default:
            return "unknown";
    }
}

inline const char* lockModeToString(LockMode mode) {
    return mode == LockMode::EXCLUSIVE ? "exclusive" : "shared";
}

inline const char* transactionStateToString(TransactionState state) {
    switch (state) {
        case TransactionState::ACTIVE:
            return "ACTIVE";
        case TransactionState::COMMITTED:
            return "COMMITTED";
        case TransactionState::ROLLED_BACK:
            return "ROLLED_BACK";
        default:
            return "UNKNOWN";
    }
}

} // namespace vlock
