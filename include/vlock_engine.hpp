#pragma once

#include "vlock_core.hpp"
#include "vlock_config.hpp"
#include "vlock_conflict_policy.hpp"
#include "vlock_result.hpp"
#include "storage/vlock_record_store.hpp"
#include "transaction/vlock_lock_table.hpp"
#include "transaction/vlock_transaction.hpp"
#include "transaction/vlock_transaction_manager.hpp"
#include <functional>
#include <memory>
#include <utility>

namespace vlock {

// 并发控制层入口，持有存储、锁表和事务管理器
class Engine {
public:
    // 事务体：返回非SUCCESS时事务被回滚，结果交给冲突策略判断
    using TransactionBody = std::function<ConflictResult(TransactionContext&)>;

    explicit Engine(const Config& config = Config());
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    std::shared_ptr<TransactionContext> begin();

    // 开始事务并读取key
    std::pair<std::shared_ptr<TransactionContext>, ReadResult> open(const Key& key,
                                                                    ReadMode mode = ReadMode::OPTIMISTIC);

    ConflictResult commit(TransactionContext& context);
    ConflictResult rollback(TransactionContext& context);

    // 在新事务中执行body并提交，按策略重试；policy为空时使用默认策略
    ConflictResult runOptimistic(const TransactionBody& body, ConflictPolicy* policy = nullptr);

    // 使用配置中的snapshot_file
    bool saveSnapshot() const;
    bool loadSnapshot();

    // 按配置的租约回收锁
    size_t reapExpiredLocks();

    RecordStore& store() { return store_; }
    LockTable& lockTable() { return lock_table_; }
    TransactionManager& transactions() { return transaction_manager_; }
    ConflictPolicy& defaultPolicy() { return *default_policy_; }
    const Config& config() const { return config_; }

private:
    const Config config_;
    RecordStore store_;
    LockTable lock_table_;
    TransactionManager transaction_manager_;
    std::unique_ptr<ConflictPolicy> default_policy_;
};

} // namespace vlock
