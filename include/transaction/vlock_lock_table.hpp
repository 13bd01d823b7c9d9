#pragma once

#include "../vlock_core.hpp"
#include "../vlock_result.hpp"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace vlock {

// 单个持有者的锁信息
struct LockInfo {
    Key key;
    TransactionID holder;
    LockMode mode;
    Timestamp acquired_at;
};

// LockTable类，悲观并发控制，按键加锁
// 独占所有锁项；不做死锁检测，多键加锁的调用方必须按全局统一的顺序加锁
class LockTable {
private:
    struct LockEntry {
        LockMode mode;
        std::unordered_map<TransactionID, Timestamp> holders;  // 持有者 -> 获得时间
    };

    // 只保护授予/释放判定，不在锁内执行调用方逻辑
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::unordered_map<Key, LockEntry> locks_;

public:
    LockTable() = default;
    ~LockTable() = default;

    // 禁止拷贝和移动
    LockTable(const LockTable&) = delete;
    LockTable& operator=(const LockTable&) = delete;
    LockTable(LockTable&&) = delete;
    LockTable& operator=(LockTable&&) = delete;

    /**
     * acquire - 获取锁，最多阻塞timeout
     * @param key 键
     * @param holder 事务ID，不能为NO_TX
     * @param mode 锁模式
     * @param timeout 等待时长，0表示不等待
     * @param cancel_flag 取消标志，置位后配合interruptWaiters使等待立即返回CANCELLED
     * @return SUCCESS; timeout为0且冲突时LOCK_HELD_BY_OTHER; 超时LOCK_TIMEOUT; 取消CANCELLED
     *
     * 同一持有者重复获取直接成功；共享锁的唯一持有者可升级为排他锁
     */
    ConflictResult acquire(const Key& key, TransactionID holder, LockMode mode,
                           Milliseconds timeout, const std::atomic<bool>* cancel_flag = nullptr);

    // 获取排他锁
    ConflictResult acquire(const Key& key, TransactionID holder, Milliseconds timeout,
                           const std::atomic<bool>* cancel_flag = nullptr) {
        return acquire(key, holder, LockMode::EXCLUSIVE, timeout, cancel_flag);
    }

    // 释放锁；holder未持有时返回LOCK_HELD_BY_OTHER且不影响实际持有者
    ConflictResult release(const Key& key, TransactionID holder);

    // 释放holder持有的全部锁，用于回滚和失效持有者回收，返回释放数量
    size_t releaseAll(TransactionID holder);

    // 唤醒所有等待者，使其重新检查取消标志
    void interruptWaiters();

    // 回收持有时间超过lease的锁，返回回收数量
    size_t evictExpired(Milliseconds lease);

    // 查询
    std::vector<LockInfo> holders(const Key& key) const;
    std::vector<Key> heldKeys(TransactionID holder) const;
    bool isLocked(const Key& key) const;
    bool isHeldBy(const Key& key, TransactionID holder) const;
    size_t lockCount() const;

private:
    // 调用方需持有mutex_；无法授予时通过blocker返回一个冲突持有者
    bool tryGrantLocked(const Key& key, TransactionID holder, LockMode mode,
                        Timestamp now, TransactionID& blocker);
};

} // namespace vlock
