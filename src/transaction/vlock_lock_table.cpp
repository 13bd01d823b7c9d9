#include "transaction/vlock_lock_table.hpp"
#include "vlock_logger.hpp"
#include <algorithm>
#include <stdexcept>

namespace vlock {

using Clock = std::chrono::steady_clock;

static Milliseconds elapsedSince(Timestamp start) {
    return std::chrono::duration_cast<Milliseconds>(Clock::now() - start);
}

// 超长的等待时间截断到时钟上限，避免时间点溢出
static Timestamp deadlineAfter(Timestamp start, Milliseconds timeout) {
    if (timeout <= Milliseconds(0)) {
        return start;
    }
    const auto remaining = std::chrono::duration_cast<Milliseconds>(Timestamp::max() - start);
    if (timeout >= remaining) {
        return Timestamp::max();
    }
    return start + timeout;
}

static bool isCancelled(const std::atomic<bool>* cancel_flag) {
    return cancel_flag != nullptr && cancel_flag->load();
}

ConflictResult LockTable::acquire(const Key& key, TransactionID holder, LockMode mode,
                                  Milliseconds timeout, const std::atomic<bool>* cancel_flag) {
    if (holder == NO_TX) {
        throw std::invalid_argument("lock holder must be a valid transaction id");
    }

    const Timestamp start = Clock::now();
    const Timestamp deadline = deadlineAfter(start, timeout);

    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        if (isCancelled(cancel_flag)) {
            VLOCK_LOG_DEBUGF("tx {} lock wait on key {} cancelled", holder, key);
            return ConflictResult::cancelled(key);
        }

        TransactionID blocker = NO_TX;
        if (tryGrantLocked(key, holder, mode, Clock::now(), blocker)) {
            VLOCK_LOG_DEBUGF("tx {} acquired {} lock on key {}", holder, lockModeToString(mode), key);
            return ConflictResult::success(NO_VERSION, key);
        }

        if (timeout <= Milliseconds(0)) {
            return ConflictResult::lockHeldByOther(key, blocker);
        }

        if (cv_.wait_until(lock, deadline) == std::cv_status::timeout) {
            // 超时前最后再尝试一次
            if (!isCancelled(cancel_flag) && tryGrantLocked(key, holder, mode, Clock::now(), blocker)) {
                return ConflictResult::success(NO_VERSION, key);
            }
            Milliseconds waited = elapsedSince(start);
            VLOCK_LOG_DEBUGF("tx {} timed out after {}ms waiting for key {} held by tx {}",
                             holder, waited.count(), key, blocker);
            return ConflictResult::lockTimeout(key, waited);
        }
    }
}

ConflictResult LockTable::release(const Key& key, TransactionID holder) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = locks_.find(key);
    if (it == locks_.end()) {
        VLOCK_LOG_ERRORF("tx {} released key {} which is not locked", holder, key);
        return ConflictResult::lockHeldByOther(key, NO_TX);
    }

    LockEntry& entry = it->second;
    if (entry.holders.erase(holder) == 0) {
        TransactionID actual = entry.holders.begin()->first;
        VLOCK_LOG_ERRORF("tx {} released key {} owned by tx {}", holder, key, actual);
        return ConflictResult::lockHeldByOther(key, actual);
    }
    if (entry.holders.empty()) {
        locks_.erase(it);
    }
    cv_.notify_all();
    return ConflictResult::success(NO_VERSION, key);
}

size_t LockTable::releaseAll(TransactionID holder) {
    size_t released = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = locks_.begin(); it != locks_.end();) {
            if (it->second.holders.erase(holder) > 0) {
                ++released;
            }
            if (it->second.holders.empty()) {
                it = locks_.erase(it);
            } else {
                ++it;
            }
        }
    }
    if (released > 0) {
        cv_.notify_all();
    }
    return released;
}

void LockTable::interruptWaiters() {
    // 持锁通知，避免等待者在检查取消标志后、进入等待前错过唤醒
    std::lock_guard<std::mutex> lock(mutex_);
    cv_.notify_all();
}

size_t LockTable::evictExpired(Milliseconds lease) {
    size_t evicted = 0;
    const Timestamp now = Clock::now();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = locks_.begin(); it != locks_.end();) {
            auto& holders = it->second.holders;
            for (auto h = holders.begin(); h != holders.end();) {
                if (now - h->second >= lease) {
                    VLOCK_LOG_WARNINGF("evicting lock on key {} held by tx {} beyond lease {}ms",
                                       it->first, h->first, lease.count());
                    h = holders.erase(h);
                    ++evicted;
                } else {
                    ++h;
                }
            }
            if (holders.empty()) {
                it = locks_.erase(it);
            } else {
                ++it;
            }
        }
    }
    if (evicted > 0) {
        cv_.notify_all();
    }
    return evicted;
}

std::vector<LockInfo> LockTable::holders(const Key& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<LockInfo> result;
    auto it = locks_.find(key);
    if (it == locks_.end()) {
        return result;
    }
    for (const auto& pair : it->second.holders) {
        result.push_back(LockInfo{key, pair.first, it->second.mode, pair.second});
    }
    return result;
}

std::vector<Key> LockTable::heldKeys(TransactionID holder) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Key> keys;
    for (const auto& pair : locks_) {
        if (pair.second.holders.count(holder) > 0) {
            keys.push_back(pair.first);
        }
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

bool LockTable::isLocked(const Key& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return locks_.find(key) != locks_.end();
}

bool LockTable::isHeldBy(const Key& key, TransactionID holder) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = locks_.find(key);
    return it != locks_.end() && it->second.holders.count(holder) > 0;
}

size_t LockTable::lockCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& pair : locks_) {
        count += pair.second.holders.size();
    }
    return count;
}

bool LockTable::tryGrantLocked(const Key& key, TransactionID holder, LockMode mode,
                               Timestamp now, TransactionID& blocker) {
    auto it = locks_.find(key);
    if (it == locks_.end()) {
        LockEntry entry;
        entry.mode = mode;
        entry.holders.emplace(holder, now);
        locks_.emplace(key, std::move(entry));
        return true;
    }

    LockEntry& entry = it->second;
    if (entry.holders.count(holder) > 0) {
        // 重入
        if (entry.mode == LockMode::EXCLUSIVE || mode == LockMode::SHARED) {
            return true;
        }
        // 共享锁升级，只有唯一持有者才能升级
        if (entry.holders.size() == 1) {
            entry.mode = LockMode::EXCLUSIVE;
            return true;
        }
        for (const auto& pair : entry.holders) {
            if (pair.first != holder) {
                blocker = pair.first;
                break;
            }
        }
        return false;
    }

    if (mode == LockMode::SHARED && entry.mode == LockMode::SHARED) {
        entry.holders.emplace(holder, now);
        return true;
    }
    blocker = entry.holders.begin()->first;
    return false;
}

} // namespace vlock
