#pragma once

#include "vlock_core.hpp"
#include "vlock_conflict_policy.hpp"
#include <atomic>
#include <string>

namespace vlock {
class Engine;

// 压测线程数上限
constexpr size_t MAX_WORKLOAD_THREADS = 1024;

// vlock_cli的命令行选项
struct CliOptions {
    std::string config_file;
    bool show_help = false;
    bool show_version = false;
    size_t threads = 4;
    size_t ops = 1000;
    ReadMode mode = ReadMode::OPTIMISTIC;
    Key key = "counter";
    bool use_snapshot = false;
    std::string log_level;
    std::string log_file;
};

// 参数错误时抛出std::invalid_argument
CliOptions parseArguments(int argc, char* argv[]);

// 统计重试决策的策略装饰器
class CountingPolicy : public ConflictPolicy {
public:
    explicit CountingPolicy(ConflictPolicy& inner) : inner_(inner) {}

    RetryDecision decide(const ConflictResult& result, int attempt) override;

    uint64_t conflicts() const { return conflicts_.load(); }
    uint64_t giveUps() const { return give_ups_.load(); }

private:
    ConflictPolicy& inner_;
    std::atomic<uint64_t> conflicts_{0};
    std::atomic<uint64_t> give_ups_{0};
};

struct WorkloadStats {
    std::atomic<uint64_t> committed{0};
    std::atomic<uint64_t> failed{0};
    std::atomic<uint64_t> lock_timeouts{0};
    std::atomic<uint64_t> lock_busy{0};      // 不等待加锁时锁已被占用
};

// 每个worker对options.key做options.ops次递增，stop置位后提前退出
void runOptimisticWorker(Engine& engine, const CliOptions& options, CountingPolicy& policy,
                         WorkloadStats& stats, const std::atomic<bool>& stop);
void runPessimisticWorker(Engine& engine, const CliOptions& options, WorkloadStats& stats,
                          const std::atomic<bool>& stop);

} // namespace vlock
