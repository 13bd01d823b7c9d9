#include "vlock_config.hpp"
#include "vlock_logger.hpp"
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace vlock {

static uint64_t parseUnsigned(const std::string& value) {
    if (value.empty() || value[0] == '-') {
        throw std::invalid_argument("expected a non-negative integer: " + value);
    }
    size_t pos = 0;
    unsigned long long parsed = std::stoull(value, &pos);
    if (pos != value.size()) {
        throw std::invalid_argument("trailing characters in integer: " + value);
    }
    return static_cast<uint64_t>(parsed);
}

// 取值需能放进有符号类型T
template <typename T>
static uint64_t parseBounded(const std::string& value) {
    uint64_t parsed = parseUnsigned(value);
    if (parsed > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
        throw std::out_of_range("value exceeds " + std::to_string(std::numeric_limits<T>::max()) + ": " + value);
    }
    return parsed;
}

static uint64_t parseMilliseconds(const std::string& value) {
    return parseBounded<Milliseconds::rep>(value);
}

Milliseconds Config::toMilliseconds(uint64_t value) {
    const uint64_t max_ms = static_cast<uint64_t>(std::numeric_limits<Milliseconds::rep>::max());
    return Milliseconds(static_cast<Milliseconds::rep>(value > max_ms ? max_ms : value));
}

Milliseconds Config::lockTimeout() const {
    return toMilliseconds(lock_timeout_ms);
}

Milliseconds Config::lockLease() const {
    return toMilliseconds(lock_lease_ms);
}

bool Config::loadFromFile(const std::string& config_file) {
    std::ifstream file(config_file);
    if (!file.is_open()) {
        VLOCK_LOG_ERROR("无法打开配置文件: ", config_file);
        return false;
    }

    std::string line;
    int line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        // 跳过注释和空行
        size_t first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos || line[first] == '#') {
            continue;
        }

        std::istringstream iss(line);
        std::string key, value;
        if (!(iss >> key)) {
            continue;
        }
        iss >> value;  // 值允许为空，例如 log_file
        if (!setOption(key, value)) {
            VLOCK_LOG_ERROR("配置文件 ", config_file, " 第", line_no, "行无效: ", line);
            return false;
        }
    }

    return validate();
}

bool Config::setOption(const std::string& key, const std::string& value) {
    try {
        if (key == "lock_timeout_ms") {
            lock_timeout_ms = parseMilliseconds(value);
        } else if (key == "max_optimistic_retries") {
            max_optimistic_retries = static_cast<int>(parseBounded<int>(value));
        } else if (key == "backoff_base_ms") {
            backoff_base_ms = parseMilliseconds(value);
        } else if (key == "backoff_max_ms") {
            backoff_max_ms = parseMilliseconds(value);
        } else if (key == "backoff_jitter_ms") {
            backoff_jitter_ms = parseMilliseconds(value);
        } else if (key == "lock_lease_ms") {
            lock_lease_ms = parseMilliseconds(value);
        } else if (key == "snapshot_file") {
            snapshot_file = value;
        } else if (key == "log_level") {
            LogLevel level;
            if (!Logger::parseLogLevel(value, level)) {
                VLOCK_LOG_ERROR("未知的日志等级: ", value);
                return false;
            }
            log_level = value;
        } else if (key == "log_file") {
            log_file = value;
        } else {
            VLOCK_LOG_ERROR("未知的配置项: ", key);
            return false;
        }
    } catch (const std::exception& e) {
        VLOCK_LOG_ERROR("配置项 ", key, " 的值无效: ", value, " (", e.what(), ")");
        return false;
    }
    return true;
}

bool Config::validate() const {
    if (backoff_max_ms < backoff_base_ms) {
        VLOCK_LOG_ERROR("backoff_max_ms (", backoff_max_ms, ") 小于 backoff_base_ms (", backoff_base_ms, ")");
        return false;
    }
    const uint64_t max_ms = static_cast<uint64_t>(std::numeric_limits<Milliseconds::rep>::max());
    if (lock_timeout_ms > max_ms || backoff_base_ms > max_ms || backoff_max_ms > max_ms
        || backoff_jitter_ms > max_ms || lock_lease_ms > max_ms) {
        VLOCK_LOG_ERROR("毫秒配置项不能超过 ", max_ms);
        return false;
    }
    if (max_optimistic_retries < 0) {
        VLOCK_LOG_ERROR("max_optimistic_retries 不能为负数");
        return false;
    }
    return true;
}

bool Config::applyLogging() const {
    LogLevel level;
    if (!Logger::parseLogLevel(log_level, level)) {
        VLOCK_LOG_ERROR("未知的日志等级: ", log_level);
        return false;
    }
    Logger::getInstance().setLogLevel(level);
    if (!log_file.empty() && !Logger::getInstance().setLogFile(log_file)) {
        VLOCK_LOG_ERROR("无法打开日志文件: ", log_file);
        return false;
    }
    return true;
}

} // namespace vlock
