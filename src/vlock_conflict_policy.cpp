#include "vlock_conflict_policy.hpp"
#include "vlock_logger.hpp"
#include <algorithm>

namespace vlock {

DefaultConflictPolicy::DefaultConflictPolicy(int max_retries, Milliseconds base, Milliseconds max_delay,
                                             Milliseconds jitter, uint64_t seed)
    : max_retries_(std::max(max_retries, 0)), base_(base), max_(std::max(base, max_delay)),
      jitter_(jitter), rng_(seed) {
}

DefaultConflictPolicy::DefaultConflictPolicy(const Config& config)
    : DefaultConflictPolicy(config.max_optimistic_retries,
                            Config::toMilliseconds(config.backoff_base_ms),
                            Config::toMilliseconds(config.backoff_max_ms),
                            Config::toMilliseconds(config.backoff_jitter_ms)) {
}

RetryDecision DefaultConflictPolicy::decide(const ConflictResult& result, int attempt) {
    // 锁冲突需要调用方判断，不自动重试
    if (result.kind != ConflictKind::VERSION_MISMATCH) {
        return RetryDecision::giveUp();
    }
    if (attempt > max_retries_) {
        VLOCK_LOG_DEBUGF("giving up on key {} after {} attempts", result.key, attempt);
        return RetryDecision::giveUp();
    }

    Milliseconds delay = backoff(attempt);
    if (jitter_.count() > 0) {
        std::uniform_int_distribution<int64_t> dist(0, jitter_.count());
        std::lock_guard<std::mutex> lock(rng_mutex_);
        int64_t extra = dist(rng_);
        if (extra > Milliseconds::max().count() - delay.count()) {
            extra = Milliseconds::max().count() - delay.count();
        }
        delay += Milliseconds(extra);
    }
    return RetryDecision::retry(delay);
}

Milliseconds DefaultConflictPolicy::backoff(int attempt) const {
    if (attempt < 1) {
        attempt = 1;
    }
    // 超过上限后停止翻倍，避免溢出
    int64_t delay = base_.count();
    for (int i = 1; i < attempt && delay < max_.count(); ++i) {
        if (delay > max_.count() / 2) {
            delay = max_.count();
            break;
        }
        delay *= 2;
    }
    return Milliseconds(std::min<int64_t>(delay, max_.count()));
}

} // namespace vlock
