/**
 * @file logger.h
 * @brief 轻量级日志
 *
 * - 级别 TRACE..FATAL，可从配置字符串解析
 * - 控制台（彩色，WARN 及以上写 stderr）与追加模式文件输出
 * - 时间戳 / 级别 / 通道名 / 位置前缀
 * - 多线程可同时写入
 */

#ifndef PYBOX_CORE_LOGGER_H
#define PYBOX_CORE_LOGGER_H

#include <string>
#include <fstream>
#include <iostream>
#include <sstream>
#include <ctime>
#include <chrono>
#include <iomanip>
#include <mutex>
#include <memory>
#include <vector>
#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <algorithm>
#include <cctype>

namespace pybox {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO  = 2,
    WARN  = 3,
    ERROR = 4,
    FATAL = 5,
    OFF   = 6
};

inline const char* level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        default: return "?????";
    }
}

/**
 * @brief 解析配置中的级别名（大小写不敏感），未知名字返回 false
 */
inline bool parse_log_level(const std::string &name, LogLevel &out) {
    std::string s = name;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "trace") out = LogLevel::TRACE;
    else if (s == "debug") out = LogLevel::DEBUG;
    else if (s == "info") out = LogLevel::INFO;
    else if (s == "warn" || s == "warning") out = LogLevel::WARN;
    else if (s == "error") out = LogLevel::ERROR;
    else if (s == "fatal") out = LogLevel::FATAL;
    else if (s == "off") out = LogLevel::OFF;
    else return false;
    return true;
}

inline const char* level_to_color(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "\033[90m";
        case LogLevel::DEBUG: return "\033[36m";
        case LogLevel::INFO:  return "\033[32m";
        case LogLevel::WARN:  return "\033[33m";
        case LogLevel::ERROR: return "\033[31m";
        case LogLevel::FATAL: return "\033[35;1m";
        default: return "";
    }
}

/**
 * @brief 日志输出目标
 */
class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(LogLevel level, const std::string &line) = 0;
    virtual void flush() = 0;
};

class ConsoleSink : public LogSink {
private:
    bool use_color_;

public:
    explicit ConsoleSink(bool use_color = true) : use_color_(use_color) {}

    void write(LogLevel level, const std::string &line) override {
        std::ostream &out = (level >= LogLevel::WARN) ? std::cerr : std::cout;
        if (use_color_) {
            out << level_to_color(level) << line << "\033[0m\n";
        } else {
            out << line << '\n';
        }
    }

    void flush() override {
        std::cout.flush();
        std::cerr.flush();
    }
};

class FileSink : public LogSink {
private:
    std::ofstream file_;

public:
    explicit FileSink(const std::string &path) {
        file_.open(path, std::ios::app);
    }

    bool is_open() const { return file_.is_open(); }

    void write(LogLevel level, const std::string &line) override {
        if (!file_.is_open()) return;
        file_ << line << '\n';
        // 错误立即落盘，便于运维排查
        if (level >= LogLevel::ERROR) file_.flush();
    }

    void flush() override {
        if (file_.is_open()) file_.flush();
    }
};

/**
 * @brief 命名日志通道
 *
 * 没有 sink 时所有调用都是空操作。
 */
class Logger {
private:
    std::string name_;
    std::atomic<LogLevel> level_;
    std::vector<std::shared_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
    bool show_location_;

    static std::string timestamp() {
        auto now = std::chrono::system_clock::now();
        std::time_t t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;
        std::tm tm_buf{};
        localtime_r(&t, &tm_buf);

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

    static const char* basename(const char *path) {
        const char *slash = std::strrchr(path, '/');
        return slash ? slash + 1 : path;
    }

public:
    explicit Logger(const std::string &name)
        : name_(name), level_(LogLevel::INFO), show_location_(false) {}

    Logger& set_level(LogLevel level) { level_ = level; return *this; }
    Logger& show_location(bool show) { show_location_ = show; return *this; }

    LogLevel level() const { return level_; }
    const std::string& name() const { return name_; }
    bool enabled(LogLevel level) const { return level >= level_.load(); }

    Logger& add_sink(std::shared_ptr<LogSink> sink) {
        std::lock_guard<std::mutex> lock(mutex_);
        sinks_.push_back(std::move(sink));
        return *this;
    }

    Logger& add_console(bool use_color = true) {
        return add_sink(std::make_shared<ConsoleSink>(use_color));
    }

    /**
     * @brief 添加文件输出，打不开时返回 false 且不添加
     */
    bool add_file(const std::string &path) {
        auto sink = std::make_shared<FileSink>(path);
        if (!sink->is_open()) return false;
        add_sink(sink);
        return true;
    }

    void clear_sinks() {
        std::lock_guard<std::mutex> lock(mutex_);
        sinks_.clear();
    }

    void flush() {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto &sink : sinks_) sink->flush();
    }

    void log(LogLevel level, const char *file, int line, const std::string &message) {
        if (!enabled(level)) return;

        std::ostringstream oss;
        oss << "[" << timestamp() << "] [" << level_to_string(level) << "] ["
            << name_ << "] ";
        if (show_location_ && file) {
            oss << "[" << basename(file) << ":" << line << "] ";
        }
        oss << message;
        const std::string formatted = oss.str();

        std::lock_guard<std::mutex> lock(mutex_);
        for (auto &sink : sinks_) sink->write(level, formatted);
    }

    void logf(LogLevel level, const char *file, int line, const char *fmt, ...) {
        if (!enabled(level)) return;

        char buffer[4096];
        va_list args;
        va_start(args, fmt);
        std::vsnprintf(buffer, sizeof(buffer), fmt, args);
        va_end(args);

        log(level, file, line, buffer);
    }
};

/**
 * @brief 流式日志，析构时提交
 */
class LogStream {
private:
    Logger &logger_;
    LogLevel level_;
    const char *file_;
    int line_;
    std::ostringstream stream_;

public:
    LogStream(Logger &logger, LogLevel level, const char *file, int line)
        : logger_(logger), level_(level), file_(file), line_(line) {}

    ~LogStream() {
        logger_.log(level_, file_, line_, stream_.str());
    }

    template<typename T>
    LogStream& operator<<(const T &value) {
        stream_ << value;
        return *this;
    }
};

} // namespace pybox

#define LOGGER_TRACE(logger) pybox::LogStream(logger, pybox::LogLevel::TRACE, __FILE__, __LINE__)
#define LOGGER_DEBUG(logger) pybox::LogStream(logger, pybox::LogLevel::DEBUG, __FILE__, __LINE__)
#define LOGGER_INFO(logger)  pybox::LogStream(logger, pybox::LogLevel::INFO,  __FILE__, __LINE__)
#define LOGGER_WARN(logger)  pybox::LogStream(logger, pybox::LogLevel::WARN,  __FILE__, __LINE__)
#define LOGGER_ERROR(logger) pybox::LogStream(logger, pybox::LogLevel::ERROR, __FILE__, __LINE__)
#define LOGGER_FATAL(logger) pybox::LogStream(logger, pybox::LogLevel::FATAL, __FILE__, __LINE__)

#endif // PYBOX_CORE_LOGGER_H
