/**
 * @file sandbox_logger.h
 * @brief 沙箱日志通道
 *
 * - main：请求生命周期与状态迁移
 * - policy：策略判定、未锁定版本的安装
 * - exec：执行上下文、子进程、资源限制与回收
 */

#ifndef PYBOX_CORE_SANDBOX_LOGGER_H
#define PYBOX_CORE_SANDBOX_LOGGER_H

#include "logger.h"
#include <string>

namespace pybox {

class SandboxLogger {
private:
    Logger main_logger_;
    Logger policy_logger_;
    Logger exec_logger_;

    void setup(Logger &logger, LogLevel level, bool console,
               const std::string &log_dir, const char *file_name) {
        logger.clear_sinks();
        logger.set_level(level).show_location(level <= LogLevel::DEBUG);
        if (console) {
            logger.add_console(true);
        }
        if (!log_dir.empty()) {
            logger.add_file(log_dir + "/" + file_name);
        }
    }

public:
    SandboxLogger()
        : main_logger_("main"),
          policy_logger_("policy"),
          exec_logger_("exec") {}

    /**
     * @brief 初始化全部通道
     *
     * @param level   最低级别
     * @param console 是否输出到控制台
     * @param log_dir 为空时不写文件；否则写 main.log / policy.log / exec.log
     */
    void init(LogLevel level, bool console, const std::string &log_dir = "") {
        setup(main_logger_, level, console, log_dir, "main.log");
        setup(policy_logger_, level, console, log_dir, "policy.log");
        setup(exec_logger_, level, console, log_dir, "exec.log");
    }

    Logger& main()   { return main_logger_; }
    Logger& policy() { return policy_logger_; }
    Logger& exec()   { return exec_logger_; }

    void flush_all() {
        main_logger_.flush();
        policy_logger_.flush();
        exec_logger_.flush();
    }
};

inline SandboxLogger& sandbox_log() {
    static SandboxLogger instance;
    return instance;
}

} // namespace pybox

// 主通道
#define SLOG_DEBUG LOGGER_DEBUG(pybox::sandbox_log().main())
#define SLOG_INFO  LOGGER_INFO(pybox::sandbox_log().main())
#define SLOG_WARN  LOGGER_WARN(pybox::sandbox_log().main())
#define SLOG_ERROR LOGGER_ERROR(pybox::sandbox_log().main())

// 策略通道
#define PLOG_DEBUG LOGGER_DEBUG(pybox::sandbox_log().policy())
#define PLOG_INFO  LOGGER_INFO(pybox::sandbox_log().policy())
#define PLOG_WARN  LOGGER_WARN(pybox::sandbox_log().policy())

// 执行通道
#define XLOG_TRACE LOGGER_TRACE(pybox::sandbox_log().exec())
#define XLOG_DEBUG LOGGER_DEBUG(pybox::sandbox_log().exec())
#define XLOG_INFO  LOGGER_INFO(pybox::sandbox_log().exec())
#define XLOG_WARN  LOGGER_WARN(pybox::sandbox_log().exec())
#define XLOG_ERROR LOGGER_ERROR(pybox::sandbox_log().exec())

#define XLOG_INFOF(fmt, ...) pybox::sandbox_log().exec().logf(pybox::LogLevel::INFO, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#endif // PYBOX_CORE_SANDBOX_LOGGER_H
