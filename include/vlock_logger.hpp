#ifndef VLOCK_LOGGER_HPP
#define VLOCK_LOGGER_HPP

#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <chrono>
#include <ctime>
#include <mutex>
#include <atomic>
#include <iomanip>
#include <algorithm>
#include <cctype>

namespace vlock {

// 日志等级枚举
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3,
    CRITICAL = 4
};

// 日志系统类，进程内单例
class Logger {
public:
    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    void setLogLevel(LogLevel level) {
        log_level_.store(level);
    }

    LogLevel getLogLevel() const {
        return log_level_.load();
    }

    // 解析日志等级字符串，无法识别时返回false且不修改level
    static bool parseLogLevel(const std::string& name, LogLevel& level) {
        std::string lower = name;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lower == "debug") {
            level = LogLevel::DEBUG;
        } else if (lower == "info") {
            level = LogLevel::INFO;
        } else if (lower == "warning" || lower == "warn") {
            level = LogLevel::WARNING;
        } else if (lower == "error") {
            level = LogLevel::ERROR;
        } else if (lower == "critical") {
            level = LogLevel::CRITICAL;
        } else {
            return false;
        }
        return true;
    }

    // 设置日志文件路径
    bool setLogFile(const std::string& file_path) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (log_file_.is_open()) {
            log_file_.close();
        }
        log_file_.open(file_path, std::ios::out | std::ios::app);
        log_to_file_ = log_file_.is_open();
        return log_to_file_;
    }

    void closeLogFile() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (log_file_.is_open()) {
            log_file_.close();
        }
        log_to_file_ = false;
    }

    void setConsoleOutput(bool enable) {
        console_output_.store(enable);
    }

    bool isEnabled(LogLevel level) const {
        return level >= log_level_.load();
    }

    // 参数直接拼接
    template<typename... Args>
    void log(LogLevel level, Args&&... args) {
        if (!isEnabled(level)) {
            return;
        }
        std::ostringstream ss;
        writePrefix(ss, level);
        (ss << ... << std::forward<Args>(args));
        emit(level, ss.str());
    }

    // 支持{}占位符
    template<typename... Args>
    void logf(LogLevel level, const std::string& format, Args&&... args) {
        if (!isEnabled(level)) {
            return;
        }
        std::ostringstream ss;
        writePrefix(ss, level);
        size_t pos = 0;
        (formatOne(ss, format, pos, std::forward<Args>(args)), ...);
        ss << format.substr(std::min(pos, format.size()));
        emit(level, ss.str());
    }

    template<typename... Args>
    void debug(Args&&... args) { log(LogLevel::DEBUG, std::forward<Args>(args)...); }

    template<typename... Args>
    void info(Args&&... args) { log(LogLevel::INFO, std::forward<Args>(args)...); }

    template<typename... Args>
    void warning(Args&&... args) { log(LogLevel::WARNING, std::forward<Args>(args)...); }

    template<typename... Args>
    void error(Args&&... args) { log(LogLevel::ERROR, std::forward<Args>(args)...); }

    template<typename... Args>
    void critical(Args&&... args) { log(LogLevel::CRITICAL, std::forward<Args>(args)...); }

    template<typename... Args>
    void debugf(const std::string& format, Args&&... args) {
        logf(LogLevel::DEBUG, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void infof(const std::string& format, Args&&... args) {
        logf(LogLevel::INFO, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warningf(const std::string& format, Args&&... args) {
        logf(LogLevel::WARNING, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void errorf(const std::string& format, Args&&... args) {
        logf(LogLevel::ERROR, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void criticalf(const std::string& format, Args&&... args) {
        logf(LogLevel::CRITICAL, format, std::forward<Args>(args)...);
    }

    static const char* levelToString(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG:
                return "DEBUG";
            case LogLevel::INFO:
                return "INFO";
            case LogLevel::WARNING:
                return "WARNING";
            case LogLevel::ERROR:
                return "ERROR";
            case LogLevel::CRITICAL:
                return "CRITICAL";
            default:
                return "UNKNOWN";
        }
    }

private:
    Logger() : log_level_(LogLevel::INFO), console_output_(true), log_to_file_(false) {}

    ~Logger() {
        if (log_file_.is_open()) {
            log_file_.close();
        }
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    // 时间戳和等级前缀
    void writePrefix(std::ostringstream& ss, LogLevel level) const {
        auto now = std::chrono::system_clock::now();
        auto now_c = std::chrono::system_clock::to_time_t(now);
        std::tm now_tm{};
        localtime_r(&now_c, &now_tm);
        auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

        ss << "[" << std::put_time(&now_tm, "%Y-%m-%d %H:%M:%S") << "."
           << std::setw(3) << std::setfill('0') << now_ms.count() << "] "
           << "[" << levelToString(level) << "] ";
    }

    // 用一个参数替换下一个{}，没有占位符时丢弃参数
    template<typename T>
    static void formatOne(std::ostringstream& ss, const std::string& format, size_t& pos, T&& arg) {
        if (pos >= format.size()) {
            return;
        }
        size_t placeholder_pos = format.find("{}", pos);
        if (placeholder_pos == std::string::npos) {
            ss << format.substr(pos);
            pos = format.size();
            return;
        }
        ss << format.substr(pos, placeholder_pos - pos) << std::forward<T>(arg);
        pos = placeholder_pos + 2;
    }

    void emit(LogLevel level, const std::string& entry) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (console_output_.load()) {
            std::ostream& out = (level >= LogLevel::ERROR) ? std::cerr : std::cout;
            out << entry << std::endl;
        }
        if (log_to_file_ && log_file_.is_open()) {
            log_file_ << entry << std::endl;
        }
    }

    std::atomic<LogLevel> log_level_;
    std::atomic<bool> console_output_;
    bool log_to_file_;
    std::ofstream log_file_;
    std::mutex mutex_;
};

// 全局日志宏
#define VLOCK_LOG_DEBUG(...) ::vlock::Logger::getInstance().debug(__VA_ARGS__)
#define VLOCK_LOG_INFO(...) ::vlock::Logger::getInstance().info(__VA_ARGS__)
#define VLOCK_LOG_WARNING(...) ::vlock::Logger::getInstance().warning(__VA_ARGS__)
#define VLOCK_LOG_ERROR(...) ::vlock::Logger::getInstance().error(__VA_ARGS__)
#define VLOCK_LOG_CRITICAL(...) ::vlock::Logger::getInstance().critical(__VA_ARGS__)

// 格式化版本日志宏
#define VLOCK_LOG_DEBUGF(...) ::vlock::Logger::getInstance().debugf(__VA_ARGS__)
#define VLOCK_LOG_INFOF(...) ::vlock::Logger::getInstance().infof(__VA_ARGS__)
#define VLOCK_LOG_WARNINGF(...) ::vlock::Logger::getInstance().warningf(__VA_ARGS__)
#define VLOCK_LOG_ERRORF(...) ::vlock::Logger::getInstance().errorf(__VA_ARGS__)
#define VLOCK_LOG_CRITICALF(...) ::vlock::Logger::getInstance().criticalf(__VA_ARGS__)

} // namespace vlock

#endif // VLOCK_LOGGER_HPP
