#ifndef TCACHE_LOGGER_HPP
#define TCACHE_LOGGER_HPP

#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <chrono>
#include <mutex>
#include <iomanip>
#include <algorithm>
#include <cctype>
#include <ctime>

namespace tcache {

// 日志等级枚举
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3,
    CRITICAL = 4
};

// 将配置中的日志等级字符串转换为枚举，无法识别时返回false
inline bool parseLogLevel(const std::string& str, LogLevel& level) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") {
        level = LogLevel::DEBUG;
    } else if (lower == "info") {
        level = LogLevel::INFO;
    } else if (lower == "warning") {
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

// 日志系统类
class Logger {
public:
    // 获取单例实例
    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    // 设置日志等级
    void setLogLevel(LogLevel level) {
        log_level_ = level;
    }

    LogLevel getLogLevel() const {
        return log_level_;
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

    // 关闭日志文件
    void closeLogFile() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (log_file_.is_open()) {
            log_file_.close();
            log_to_file_ = false;
        }
    }

    // 设置是否输出到控制台
    void setConsoleOutput(bool enable) {
        console_output_ = enable;
    }

    // 日志输出方法，参数直接拼接
    template<typename... Args>
    void log(LogLevel level, Args&&... args) {
        if (level < log_level_) {
            return;
        }
        std::stringstream ss;
        writePrefix(ss, level);
        printArgs(ss, std::forward<Args>(args)...);
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

    // 将日志等级转换为字符串
    static std::string levelToString(LogLevel level) {
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

    // 时间戳和等级前缀：[2024-01-01 12:00:00.123] [INFO]
    void writePrefix(std::stringstream& ss, LogLevel level) {
        auto now = std::chrono::system_clock::now();
        auto now_c = std::chrono::system_clock::to_time_t(now);
        std::tm now_tm;
        localtime_r(&now_c, &now_tm);
        auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

        ss << "[" << std::put_time(&now_tm, "%Y-%m-%d %H:%M:%S") << "."
           << std::setw(3) << std::setfill('0') << now_ms.count() << "] ";
        ss << "[" << levelToString(level) << "] ";
    }

    void emit(LogLevel level, const std::string& entry) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (console_output_) {
            std::ostream& out = (level >= LogLevel::ERROR) ? std::cerr : std::cout;
            out << entry << std::endl;
        }

        if (log_to_file_ && log_file_.is_open()) {
            log_file_ << entry << std::endl;
        }
    }

    // 将所有参数直接转为字符串并拼接（不格式化）
    template<typename T, typename... Args>
    void printArgs(std::stringstream& ss, T&& arg, Args&&... args) {
        ss << std::forward<T>(arg);
        if constexpr (sizeof...(args) > 0) {
            printArgs(ss, std::forward<Args>(args)...);
        }
    }

    void printArgs(std::stringstream& /*unused*/) {}

    LogLevel log_level_;
    bool console_output_;
    bool log_to_file_;
    std::ofstream log_file_;
    std::mutex mutex_;
};

// 全局日志宏，方便使用
#define TCACHE_LOG_DEBUG(...) ::tcache::Logger::getInstance().debug(__VA_ARGS__)
#define TCACHE_LOG_INFO(...) ::tcache::Logger::getInstance().info(__VA_ARGS__)
#define TCACHE_LOG_WARNING(...) ::tcache::Logger::getInstance().warning(__VA_ARGS__)
#define TCACHE_LOG_ERROR(...) ::tcache::Logger::getInstance().error(__VA_ARGS__)
#define TCACHE_LOG_CRITICAL(...) ::tcache::Logger::getInstance().critical(__VA_ARGS__)

} // namespace tcache

#endif // TCACHE_LOGGER_HPP
