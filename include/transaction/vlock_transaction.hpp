#ifndef VLOCK_TRANSACTION_HPP
#define VLOCK_TRANSACTION_HPP

#include "../vlock_core.hpp"
#include "../vlock_result.hpp"
#include <atomic>
#include <map>
#include <mutex>
#include <set>
#include <vector>

namespace vlock {
class VersionGuard;
class LockTable;

// 事务上下文：ACTIVE -> {COMMITTED, ROLLED_BACK}，终止后不可复用
// 只保存键和期望版本号，不持有存储内部的引用
// 读写提交由单个线程调用；rollback 可以从其他线程调用以取消正在等待的加锁
class TransactionContext {
public:
    TransactionContext(TransactionID transaction_id, VersionGuard& guard, LockTable& lock_table,
                       Milliseconds lock_timeout);
    // 仍处于ACTIVE时自动回滚
    ~TransactionContext();

    TransactionContext(const TransactionContext&) = delete;
    TransactionContext& operator=(const TransactionContext&) = delete;

    TransactionID id() const { return transaction_id_; }
    TransactionState state() const;
    bool isActive() const;

    // 乐观读记录版本号；悲观读先加排他锁，加锁失败则整个事务隐式回滚
    ReadResult read(const Key& key, ReadMode mode);
    ReadResult read(const Key& key, ReadMode mode, Milliseconds lock_timeout);

    // 缓冲写入，提交前不影响存储；未读过的键在此时做一次乐观读
    ConflictResult write(const Key& key, const Payload& payload);

    // 原子提交全部写入；任一键版本冲突则整体回滚；所有路径都会释放锁
    ConflictResult commit();

    // 丢弃写入并释放锁；已终止时返回INVALID_STATE，不重复释放
    ConflictResult rollback();

    // 提交成功后各键的新版本号，未写入的键返回NO_VERSION
    Version committedVersion(const Key& key) const;

    std::vector<Key> lockedKeys() const;
    size_t pendingWrites() const;

private:
    struct ReadEntry {
        ReadMode mode;
        Version version;    // 读取时观察到的版本号，提交时作为期望版本
    };

    // 调用方需持有mutex_
    void finishLocked(TransactionState final_state);
    // 键有缓冲写入时填充result并返回true；调用方需持有mutex_
    bool readBufferedLocked(const Key& key, ReadResult& result) const;

    const TransactionID transaction_id_;
    VersionGuard& guard_;
    LockTable& lock_table_;
    const Milliseconds lock_timeout_;

    mutable std::mutex mutex_;
    TransactionState state_;
    std::atomic<bool> cancel_requested_;

    std::map<Key, ReadEntry> read_set_;
    std::set<Key> locked_keys_;
    std::map<Key, Payload> write_set_;
    std::map<Key, Version> committed_versions_;
};

} // namespace vlock

#endif // VLOCK_TRANSACTION_HPP
