#ifndef VLOCK_TRANSACTION_MANAGER_HPP
#define VLOCK_TRANSACTION_MANAGER_HPP

#include "../vlock_core.hpp"
#include "vlock_transaction.hpp"
#include "vlock_version_guard.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace vlock {
class RecordStore;
class LockTable;

// 事务管理器，负责分配事务ID、跟踪活跃事务和回收失效持有者的锁
class TransactionManager {
public:
    TransactionManager(RecordStore& store, LockTable& lock_table, Milliseconds lock_timeout);
    // 回滚仍存活的事务，之后这些上下文只会返回INVALID_STATE
    ~TransactionManager();

    TransactionManager(const TransactionManager&) = delete;
    TransactionManager& operator=(const TransactionManager&) = delete;

    // 开始事务
    std::shared_ptr<TransactionContext> begin();

    // 查询事务是否活跃
    bool isActive(TransactionID transaction_id) const;
    std::vector<TransactionID> getActiveTransactions() const;

    // 外部存活检测判定持有者失效时调用：回滚仍存活的上下文，否则直接释放其锁
    bool abortHolder(TransactionID transaction_id);

    // 回收持有超过lease的锁
    size_t reapExpiredLocks(Milliseconds lease);

    TransactionID peekNextTransactionID() const {
        return transaction_id_generator_.load();
    }

    VersionGuard& versionGuard() { return guard_; }

private:
    // 调用方需持有active_transactions_mutex_
    void purgeFinishedLocked();

    TransactionID nextTransactionId() {
        return transaction_id_generator_.fetch_add(1);
    }

    VersionGuard guard_;
    LockTable& lock_table_;
    const Milliseconds lock_timeout_;

    std::atomic<TransactionID> transaction_id_generator_{1};

    mutable std::mutex active_transactions_mutex_;
    std::unordered_map<TransactionID, std::weak_ptr<TransactionContext>> active_transactions_;
};

} // namespace vlock

#endif // VLOCK_TRANSACTION_MANAGER_HPP
