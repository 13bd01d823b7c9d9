#include "transaction/vlock_transaction.hpp"
#include "transaction/vlock_version_guard.hpp"
#include "transaction/vlock_lock_table.hpp"
#include "vlock_logger.hpp"

namespace vlock {

static ReadResult failedRead(const ConflictResult& status) {
    ReadResult result;
    result.status = status;
    return result;
}

TransactionContext::TransactionContext(TransactionID transaction_id, VersionGuard& guard,
                                       LockTable& lock_table, Milliseconds lock_timeout)
    : transaction_id_(transaction_id), guard_(guard), lock_table_(lock_table),
      lock_timeout_(lock_timeout), state_(TransactionState::ACTIVE), cancel_requested_(false) {
}

TransactionContext::~TransactionContext() {
    if (isActive()) {
        VLOCK_LOG_WARNINGF("tx {} destroyed while active, rolling back", transaction_id_);
        rollback();
    }
}

TransactionState TransactionContext::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool TransactionContext::isActive() const {
    return state() == TransactionState::ACTIVE;
}

ReadResult TransactionContext::read(const Key& key, ReadMode mode) {
    return read(key, mode, lock_timeout_);
}

ReadResult TransactionContext::read(const Key& key, ReadMode mode, Milliseconds lock_timeout) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != TransactionState::ACTIVE) {
            return failedRead(ConflictResult::invalidState(state_));
        }

        // 悲观读必须先持有锁，即使该键已有缓冲的写入
        if (mode == ReadMode::OPTIMISTIC || locked_keys_.count(key) > 0) {
            ReadResult buffered;
            if (readBufferedLocked(key, buffered)) {
                return buffered;
            }
            ReadResult result = guard_.beginRead(key);
            // 首次读取的版本号决定提交时的期望版本
            read_set_.emplace(key, ReadEntry{ReadMode::OPTIMISTIC, result.version});
            return result;
        }
    }

    // 等锁期间不持有上下文的锁，允许其他线程rollback
    ConflictResult acquired = lock_table_.acquire(key, transaction_id_, LockMode::EXCLUSIVE,
                                                  lock_timeout, &cancel_requested_);

    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != TransactionState::ACTIVE) {
        // 等锁期间已被回滚，刚拿到的锁不再属于任何活跃事务
        if (acquired.ok()) {
            ConflictResult released = lock_table_.release(key, transaction_id_);
            if (!released.ok()) {
                VLOCK_LOG_DEBUG("tx ", transaction_id_, " lock on ", key, " already gone: ", released);
            }
        }
        return failedRead(ConflictResult::cancelled(key));
    }

    if (!acquired.ok()) {
        VLOCK_LOG_WARNING("tx ", transaction_id_, " rolled back, pessimistic read failed: ", acquired);
        finishLocked(TransactionState::ROLLED_BACK);
        return failedRead(acquired);
    }

    locked_keys_.insert(key);
    ReadResult result = guard_.beginRead(key);
    auto entry = read_set_.find(key);
    if (entry == read_set_.end()) {
        read_set_.emplace(key, ReadEntry{ReadMode::PESSIMISTIC, result.version});
    } else {
        // 已观察过的键保留首次读取的版本号，锁被回收时据此校验
        entry->second.mode = ReadMode::PESSIMISTIC;
    }

    ReadResult buffered;
    if (readBufferedLocked(key, buffered)) {
        return buffered;
    }
    return result;
}

bool TransactionContext::readBufferedLocked(const Key& key, ReadResult& result) const {
    auto pending = write_set_.find(key);
    if (pending == write_set_.end()) {
        return false;
    }
    result.version = read_set_.at(key).version;
    result.payload = pending->second;
    result.status = ConflictResult::success(result.version, key);
    return true;
}

ConflictResult TransactionContext::write(const Key& key, const Payload& payload) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != TransactionState::ACTIVE) {
        return ConflictResult::invalidState(state_);
    }

    if (read_set_.find(key) == read_set_.end()) {
        ReadResult current = guard_.beginRead(key);
        read_set_.emplace(key, ReadEntry{ReadMode::OPTIMISTIC, current.version});
    }
    write_set_[key] = payload;
    return ConflictResult::success(NO_VERSION, key);
}

ConflictResult TransactionContext::commit() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != TransactionState::ACTIVE) {
        VLOCK_LOG_ERRORF("tx {} commit called in state {}", transaction_id_, transactionStateToString(state_));
        return ConflictResult::invalidState(state_);
    }

    ConflictResult result = ConflictResult::success(NO_VERSION);
    bool applied = false;
    try {
        std::vector<WriteIntent> intents;
        intents.reserve(write_set_.size());
        for (const auto& pair : write_set_) {
            const ReadEntry& entry = read_set_.at(pair.first);
            // 仍持有排他锁的键直接写入；锁已被回收时退化为版本校验
            bool exclusive = entry.mode == ReadMode::PESSIMISTIC
                             && lock_table_.isHeldBy(pair.first, transaction_id_);
            intents.emplace_back(pair.first, pair.second, entry.version, !exclusive);
        }

        std::vector<Version> new_versions;
        if (!intents.empty()) {
            result = guard_.tryCommitAll(intents, &new_versions);
        }
        applied = result.ok();
        if (applied) {
            for (size_t i = 0; i < new_versions.size(); ++i) {
                committed_versions_[intents[i].key] = new_versions[i];
            }
        }
    } catch (const std::exception& e) {
        VLOCK_LOG_ERROR("tx ", transaction_id_, " commit failed: ", e.what());
        finishLocked(applied ? TransactionState::COMMITTED : TransactionState::ROLLED_BACK);
        throw;
    }

    if (!applied) {
        VLOCK_LOG_DEBUG("tx ", transaction_id_, " rolled back on commit: ", result);
        finishLocked(TransactionState::ROLLED_BACK);
        return result;
    }

    VLOCK_LOG_DEBUGF("tx {} committed {} writes", transaction_id_, committed_versions_.size());
    finishLocked(TransactionState::COMMITTED);
    return result;
}

ConflictResult TransactionContext::rollback() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != TransactionState::ACTIVE) {
        // 已终止的上下文不再访问锁表，所属引擎可能已经销毁
        VLOCK_LOG_DEBUGF("tx {} rollback ignored, already {}", transaction_id_, transactionStateToString(state_));
        return ConflictResult::invalidState(state_);
    }
    cancel_requested_.store(true);
    finishLocked(TransactionState::ROLLED_BACK);
    // 唤醒可能正在等锁的read，使其看到取消标志
    lock_table_.interruptWaiters();
    return ConflictResult::success(NO_VERSION);
}

Version TransactionContext::committedVersion(const Key& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = committed_versions_.find(key);
    return it == committed_versions_.end() ? NO_VERSION : it->second;
}

std::vector<Key> TransactionContext::lockedKeys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<Key>(locked_keys_.begin(), locked_keys_.end());
}

size_t TransactionContext::pendingWrites() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return write_set_.size();
}

void TransactionContext::finishLocked(TransactionState final_state) {
    state_ = final_state;
    read_set_.clear();
    write_set_.clear();
    locked_keys_.clear();
    // 锁表是锁存在与否的唯一依据，按持有者整体释放
    lock_table_.releaseAll(transaction_id_);
}

} // namespace vlock
