#include "vlock_engine.hpp"
#include "persist/vlock_snapshot.hpp"
#include "vlock_logger.hpp"
#include <thread>

namespace vlock {

Engine::Engine(const Config& config)
    : config_(config),
      transaction_manager_(store_, lock_table_, config.lockTimeout()),
      default_policy_(std::make_unique<DefaultConflictPolicy>(config)) {
    VLOCK_LOG_DEBUGF("engine created, lock_timeout={}ms, max_retries={}",
                     config_.lock_timeout_ms, config_.max_optimistic_retries);
}

Engine::~Engine() = default;

std::shared_ptr<TransactionContext> Engine::begin() {
    return transaction_manager_.begin();
}

std::pair<std::shared_ptr<TransactionContext>, ReadResult> Engine::open(const Key& key, ReadMode mode) {
    auto context = begin();
    ReadResult result = context->read(key, mode);
    return {context, result};
}

ConflictResult Engine::commit(TransactionContext& context) {
    return context.commit();
}

ConflictResult Engine::rollback(TransactionContext& context) {
    return context.rollback();
}

ConflictResult Engine::runOptimistic(const TransactionBody& body, ConflictPolicy* policy) {
    ConflictPolicy& effective = policy ? *policy : *default_policy_;

    for (int attempt = 1;; ++attempt) {
        auto context = begin();
        ConflictResult result = body(*context);
        if (result.ok()) {
            result = context->commit();
        } else if (context->isActive()) {
            ConflictResult rolled_back = context->rollback();
            if (!rolled_back.ok()) {
                VLOCK_LOG_DEBUG("tx ", context->id(), " already finished: ", rolled_back);
            }
        }
        if (result.ok()) {
            return result;
        }

        RetryDecision decision = effective.decide(result, attempt);
        if (!decision.shouldRetry()) {
            VLOCK_LOG_DEBUG("tx ", context->id(), " gave up after attempt ", attempt, ": ", result);
            return result;
        }
        VLOCK_LOG_DEBUGF("tx {} conflict on attempt {}, retrying in {}ms",
                         context->id(), attempt, decision.delay.count());
        if (decision.delay.count() > 0) {
            std::this_thread::sleep_for(decision.delay);
        }
    }
}

bool Engine::saveSnapshot() const {
    return SnapshotPersistence::saveToFile(store_, config_.snapshot_file);
}

bool Engine::loadSnapshot() {
    return SnapshotPersistence::loadFromFile(store_, config_.snapshot_file);
}

size_t Engine::reapExpiredLocks() {
    return transaction_manager_.reapExpiredLocks(config_.lockLease());
}

} // namespace vlock
