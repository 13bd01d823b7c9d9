#include "vlock_engine.hpp"
#include "vlock_logger.hpp"
#include "vlock_workload.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

namespace vlock {

std::atomic<bool> g_should_exit{false};

void signalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_should_exit = true;
    }
}

void printHelp() {
    std::cout << "vlock_cli - 乐观/悲观并发控制压测工具\n" << std::endl;
    std::cout << "用法: vlock_cli [选项]\n" << std::endl;
    std::cout << "选项:" << std::endl;
    std::cout << "  -c, --config <file>     使用指定的配置文件" << std::endl;
    std::cout << "  -t, --threads <num>     并发线程数（默认：4）" << std::endl;
    std::cout << "  -n, --ops <num>         每个线程的递增次数（默认：1000）" << std::endl;
    std::cout << "  -m, --mode <mode>       optimistic 或 pessimistic（默认：optimistic）" << std::endl;
    std::cout << "  -k, --key <key>         计数器键名（默认：counter）" << std::endl;
    std::cout << "  -s, --snapshot          开始前加载快照，结束后保存快照" << std::endl;
    std::cout << "  -l, --log-level <level> 设置日志等级（debug, info, warning, error, critical）" << std::endl;
    std::cout << "  -f, --log-file <file>   设置日志文件路径" << std::endl;
    std::cout << "  -v, --version           显示版本信息" << std::endl;
    std::cout << "  -h, --help              显示帮助信息" << std::endl;
    std::cout << "\n示例:" << std::endl;
    std::cout << "  vlock_cli -t 8 -n 500 -m pessimistic" << std::endl;
    std::cout << "  vlock_cli -c vlock.conf -s" << std::endl;
}

void printVersion() {
    std::cout << "vlock v0.1.0" << std::endl;
}

int run(int argc, char* argv[]) {
    CliOptions options;
    try {
        options = parseArguments(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "错误: " << e.what() << std::endl;
        printHelp();
        return 1;
    }

    if (options.show_help) {
        printHelp();
        return 0;
    }
    if (options.show_version) {
        printVersion();
        return 0;
    }

    Config config;
    if (!options.config_file.empty() && !config.loadFromFile(options.config_file)) {
        return 1;
    }
    // 命令行参数优先于配置文件
    if (!options.log_level.empty() && !config.setOption("log_level", options.log_level)) {
        return 1;
    }
    if (!options.log_file.empty()) {
        config.log_file = options.log_file;
    }
    if (!config.applyLogging()) {
        return 1;
    }

    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    Engine engine(config);
    if (options.use_snapshot && !engine.loadSnapshot()) {
        VLOCK_LOG_WARNING("没有可用的快照，从空存储开始: ", config.snapshot_file);
    }

    auto before = engine.store().get(options.key);
    int64_t initial = 0;
    try {
        initial = before ? std::stoll(before->payload) : 0;
    } catch (const std::exception& e) {
        VLOCK_LOG_ERROR("键 ", options.key, " 的值不是整数: ", before->payload, " (", e.what(), ")");
        return 1;
    }

    VLOCK_LOG_INFO("开始压测: mode=", readModeToString(options.mode), ", threads=", options.threads,
                   ", ops=", options.ops, ", key=", options.key);

    CountingPolicy policy(engine.defaultPolicy());
    WorkloadStats stats;
    auto start = std::chrono::steady_clock::now();
    std::vector<std::thread> workers;
    try {
        for (size_t t = 0; t < options.threads; ++t) {
            if (options.mode == ReadMode::OPTIMISTIC) {
                workers.emplace_back(runOptimisticWorker, std::ref(engine), std::cref(options),
                                     std::ref(policy), std::ref(stats), std::cref(g_should_exit));
            } else {
                workers.emplace_back(runPessimisticWorker, std::ref(engine), std::cref(options),
                                     std::ref(stats), std::cref(g_should_exit));
            }
        }
    } catch (const std::system_error& e) {
        VLOCK_LOG_ERROR("无法创建第", workers.size() + 1, "个工作线程: ", e.what());
        g_should_exit = true;
        for (auto& worker : workers) {
            worker.join();
        }
        return 1;
    }
    for (auto& worker : workers) {
        worker.join();
    }
    auto elapsed = std::chrono::duration_cast<Milliseconds>(std::chrono::steady_clock::now() - start);

    auto after = engine.store().get(options.key);
    int64_t final_value = after ? std::stoll(after->payload) : 0;
    Version final_version = after ? after->version : NO_VERSION;

    std::cout << "committed:      " << stats.committed.load() << std::endl;
    std::cout << "failed:         " << stats.failed.load() << std::endl;
    std::cout << "conflicts:      " << policy.conflicts() << std::endl;
    std::cout << "gave up:        " << policy.giveUps() << std::endl;
    std::cout << "lock timeouts:  " << stats.lock_timeouts.load() << std::endl;
    std::cout << "lock busy:      " << stats.lock_busy.load() << std::endl;
    std::cout << "final value:    " << final_value << " (version " << final_version << ")" << std::endl;
    std::cout << "elapsed:        " << elapsed.count() << "ms" << std::endl;

    bool consistent = final_value == initial + static_cast<int64_t>(stats.committed.load());
    if (!consistent) {
        VLOCK_LOG_ERROR("lost update detected: expected ", initial + static_cast<int64_t>(stats.committed.load()),
                        ", got ", final_value);
    }

    if (options.use_snapshot && !engine.saveSnapshot()) {
        return 1;
    }
    return consistent ? 0 : 2;
}

} // namespace vlock

int main(int argc, char* argv[]) {
    return vlock::run(argc, argv);
}
