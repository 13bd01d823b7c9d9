#include "vlock_workload.hpp"
#include "vlock_engine.hpp"
#include <chrono>
#include <stdexcept>
#include <thread>

namespace vlock {

// 只接受十进制非负整数
static size_t parseCount(const std::string& flag, const std::string& value) {
    if (value.empty() || value[0] == '-' || value[0] == '+') {
        throw std::invalid_argument(flag + " 需要非负整数: " + value);
    }
    size_t pos = 0;
    unsigned long long parsed = 0;
    try {
        parsed = std::stoull(value, &pos);
    } catch (const std::exception& e) {
        throw std::invalid_argument(flag + " 的值无效: " + value + " (" + e.what() + ")");
    }
    if (pos != value.size()) {
        throw std::invalid_argument(flag + " 的值无效: " + value);
    }
    return static_cast<size_t>(parsed);
}

CliOptions parseArguments(int argc, char* argv[]) {
    CliOptions options;

    auto requireValue = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) {
            throw std::invalid_argument(flag + " 需要指定参数");
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            options.show_help = true;
        } else if (arg == "-v" || arg == "--version") {
            options.show_version = true;
        } else if (arg == "-c" || arg == "--config") {
            options.config_file = requireValue(i, arg);
        } else if (arg == "-t" || arg == "--threads") {
            options.threads = parseCount(arg, requireValue(i, arg));
        } else if (arg == "-n" || arg == "--ops") {
            options.ops = parseCount(arg, requireValue(i, arg));
        } else if (arg == "-m" || arg == "--mode") {
            std::string mode = requireValue(i, arg);
            if (mode == "optimistic") {
                options.mode = ReadMode::OPTIMISTIC;
            } else if (mode == "pessimistic") {
                options.mode = ReadMode::PESSIMISTIC;
            } else {
                throw std::invalid_argument("未知的模式: " + mode);
            }
        } else if (arg == "-k" || arg == "--key") {
            options.key = requireValue(i, arg);
        } else if (arg == "-s" || arg == "--snapshot") {
            options.use_snapshot = true;
        } else if (arg == "-l" || arg == "--log-level") {
            options.log_level = requireValue(i, arg);
        } else if (arg == "-f" || arg == "--log-file") {
            options.log_file = requireValue(i, arg);
        } else {
            throw std::invalid_argument("未知选项: " + arg);
        }
    }
    if (options.threads == 0 || options.threads > MAX_WORKLOAD_THREADS) {
        throw std::invalid_argument("线程数必须在1到" + std::to_string(MAX_WORKLOAD_THREADS) + "之间");
    }
    return options;
}

RetryDecision CountingPolicy::decide(const ConflictResult& result, int attempt) {
    if (result.kind == ConflictKind::VERSION_MISMATCH) {
        conflicts_++;
    }
    RetryDecision decision = inner_.decide(result, attempt);
    if (!decision.shouldRetry()) {
        give_ups_++;
    }
    return decision;
}

static int64_t parseCounter(const ReadResult& read) {
    return read.found() ? std::stoll(read.payload) : 0;
}

void runOptimisticWorker(Engine& engine, const CliOptions& options, CountingPolicy& policy,
                         WorkloadStats& stats, const std::atomic<bool>& stop) {
    for (size_t i = 0; i < options.ops && !stop; ++i) {
        ConflictResult result = engine.runOptimistic([&](TransactionContext& tx) {
            ReadResult read = tx.read(options.key, ReadMode::OPTIMISTIC);
            if (!read.ok()) {
                return read.status;
            }
            return tx.write(options.key, std::to_string(parseCounter(read) + 1));
        }, &policy);
        if (result.ok()) {
            stats.committed++;
        } else {
            stats.failed++;
        }
    }
}

void runPessimisticWorker(Engine& engine, const CliOptions& options, WorkloadStats& stats,
                          const std::atomic<bool>& stop) {
    for (size_t i = 0; i < options.ops && !stop;) {
        auto opened = engine.open(options.key, ReadMode::PESSIMISTIC);
        auto& tx = *opened.first;
        const ReadResult& read = opened.second;
        if (!read.ok()) {
            // 锁等待失败时事务已隐式回滚，重新开始
            if (read.status.kind == ConflictKind::LOCK_TIMEOUT) {
                stats.lock_timeouts++;
            } else if (read.status.kind == ConflictKind::LOCK_HELD_BY_OTHER) {
                // lock_timeout_ms为0时不等待，稍后再试
                stats.lock_busy++;
                std::this_thread::sleep_for(std::chrono::microseconds(100));
            } else {
                stats.failed++;
                ++i;
            }
            continue;
        }
        if (!tx.write(options.key, std::to_string(parseCounter(read) + 1)).ok()) {
            stats.failed++;
            ++i;
            continue;
        }
        if (engine.commit(tx).ok()) {
            stats.committed++;
        } else {
            stats.failed++;
        }
        ++i;
    }
}

} // namespace vlock
