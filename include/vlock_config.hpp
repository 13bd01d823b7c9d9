#pragma once

#include "vlock_core.hpp"
#include <string>

namespace vlock {

// 并发控制层配置
struct Config {
    // 悲观读默认等待时长
    uint64_t lock_timeout_ms = 1000;
    // 乐观冲突的最大重试次数
    int max_optimistic_retries = 5;
    // 重试退避：base * 2^(attempt-1)，上限max，再加[0, jitter]的随机抖动
    uint64_t backoff_base_ms = 10;
    uint64_t backoff_max_ms = 1000;
    uint64_t backoff_jitter_ms = 10;
    // 锁租约，超过后可被回收；0表示不回收
    uint64_t lock_lease_ms = 0;

    std::string snapshot_file = "vlock.snap";
    std::string log_level = "info";
    std::string log_file;   // 为空则不输出到文件

    // 超出Milliseconds范围的值截断到最大值
    static Milliseconds toMilliseconds(uint64_t value);
    Milliseconds lockTimeout() const;
    Milliseconds lockLease() const;

    // 解析配置文件，每行"key value"，#开头为注释
    bool loadFromFile(const std::string& config_file);

    // 设置单个配置项，未知键或非法值返回false
    bool setOption(const std::string& key, const std::string& value);

    // 检查取值组合是否合法
    bool validate() const;

    // 将日志相关配置应用到Logger
    bool applyLogging() const;
};

} // namespace vlock
