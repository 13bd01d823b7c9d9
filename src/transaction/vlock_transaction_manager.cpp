#include "transaction/vlock_transaction_manager.hpp"
#include "transaction/vlock_lock_table.hpp"
#include "storage/vlock_record_store.hpp"
#include "vlock_logger.hpp"
#include <algorithm>

namespace vlock {

TransactionManager::TransactionManager(RecordStore& store, LockTable& lock_table, Milliseconds lock_timeout)
    : guard_(store), lock_table_(lock_table), lock_timeout_(lock_timeout) {
}

TransactionManager::~TransactionManager() {
    std::vector<std::shared_ptr<TransactionContext>> live;
    {
        std::lock_guard<std::mutex> lock(active_transactions_mutex_);
        for (const auto& pair : active_transactions_) {
            auto context = pair.second.lock();
            if (context) {
                live.push_back(std::move(context));
            }
        }
        active_transactions_.clear();
    }

    // 上下文引用的版本守卫和锁表即将销毁，必须在此之前终止
    for (const auto& context : live) {
        if (!context->isActive()) {
            continue;
        }
        ConflictResult result = context->rollback();
        if (result.ok()) {
            VLOCK_LOG_WARNINGF("tx {} still active at shutdown, rolled back", context->id());
        }
    }
}

std::shared_ptr<TransactionContext> TransactionManager::begin() {
    TransactionID txid = nextTransactionId();
    auto context = std::make_shared<TransactionContext>(txid, guard_, lock_table_, lock_timeout_);

    std::lock_guard<std::mutex> lock(active_transactions_mutex_);
    purgeFinishedLocked();
    active_transactions_.emplace(txid, context);
    return context;
}

bool TransactionManager::isActive(TransactionID txid) const {
    std::shared_ptr<TransactionContext> context;
    {
        std::lock_guard<std::mutex> lock(active_transactions_mutex_);
        auto it = active_transactions_.find(txid);
        if (it == active_transactions_.end()) {
            return false;
        }
        context = it->second.lock();
    }
    return context && context->isActive();
}

std::vector<TransactionID> TransactionManager::getActiveTransactions() const {
    std::vector<std::pair<TransactionID, std::shared_ptr<TransactionContext>>> candidates;
    {
        std::lock_guard<std::mutex> lock(active_transactions_mutex_);
        candidates.reserve(active_transactions_.size());
        for (const auto& pair : active_transactions_) {
            candidates.emplace_back(pair.first, pair.second.lock());
        }
    }

    std::vector<TransactionID> active_txids;
    for (const auto& candidate : candidates) {
        if (candidate.second && candidate.second->isActive()) {
            active_txids.push_back(candidate.first);
        }
    }
    std::sort(active_txids.begin(), active_txids.end());
    return active_txids;
}

bool TransactionManager::abortHolder(TransactionID txid) {
    std::shared_ptr<TransactionContext> context;
    {
        std::lock_guard<std::mutex> lock(active_transactions_mutex_);
        auto it = active_transactions_.find(txid);
        if (it != active_transactions_.end()) {
            context = it->second.lock();
        }
    }

    if (context && context->isActive()) {
        VLOCK_LOG_WARNINGF("aborting tx {} on liveness signal", txid);
        return context->rollback().ok();
    }

    // 上下文已不存在，只剩下遗留的锁
    size_t released = lock_table_.releaseAll(txid);
    if (released > 0) {
        VLOCK_LOG_WARNINGF("released {} abandoned locks held by tx {}", released, txid);
    }
    return released > 0;
}

size_t TransactionManager::reapExpiredLocks(Milliseconds lease) {
    if (lease <= Milliseconds(0)) {
        return 0;
    }
    return lock_table_.evictExpired(lease);
}

void TransactionManager::purgeFinishedLocked() {
    for (auto it = active_transactions_.begin(); it != active_transactions_.end();) {
        if (it->second.expired()) {
            it = active_transactions_.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace vlock
