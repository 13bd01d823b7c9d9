#pragma once

#include "vlock_core.hpp"
#include "vlock_result.hpp"
#include "vlock_config.hpp"
#include <mutex>
#include <random>

namespace vlock {

// 重试决策
struct RetryDecision {
    enum class Action {
        RETRY,
        GIVE_UP
    };

    Action action;
    Milliseconds delay;

    RetryDecision() : action(Action::GIVE_UP), delay(0) {}

    static RetryDecision retry(Milliseconds delay) {
        RetryDecision decision;
        decision.action = Action::RETRY;
        decision.delay = delay;
        return decision;
    }

    static RetryDecision giveUp() { return RetryDecision(); }

    bool shouldRetry() const { return action == Action::RETRY; }
};

// 冲突策略接口，由调用方使用，存储层不依赖
class ConflictPolicy {
public:
    virtual ~ConflictPolicy() = default;

    // attempt 从1开始，表示刚刚失败的是第几次尝试
    virtual RetryDecision decide(const ConflictResult& result, int attempt) = 0;
};

// 默认策略：VERSION_MISMATCH 指数退避加抖动重试，其他冲突一律放弃
class DefaultConflictPolicy : public ConflictPolicy {
private:
    int max_retries_;
    Milliseconds base_;
    Milliseconds max_;
    Milliseconds jitter_;

    std::mutex rng_mutex_;
    std::mt19937_64 rng_;

public:
    DefaultConflictPolicy(int max_retries, Milliseconds base, Milliseconds max_delay,
                          Milliseconds jitter, uint64_t seed = std::random_device{}());
    explicit DefaultConflictPolicy(const Config& config);

    RetryDecision decide(const ConflictResult& result, int attempt) override;

    // 不含抖动的退避时长
    Milliseconds backoff(int attempt) const;

    int maxRetries() const { return max_retries_; }
};

} // namespace vlock
