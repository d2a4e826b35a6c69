/**
 * @file error.h
 * @brief 沙箱统一错误类型
 *
 * 所有跨模块的失败都以值的形式返回：
 * - ErrorCode 分类（输入、策略、用户代码、资源、内部）
 * - Error 携带消息、源码位置和上下文
 * - Result<T> 承载值或错误
 */

#ifndef PYBOX_CORE_ERROR_H
#define PYBOX_CORE_ERROR_H

#include <string>
#include <variant>
#include <optional>
#include <stdexcept>
#include <sstream>
#include <ostream>
#include <utility>

namespace pybox {

//==============================================================================
// 错误码
//==============================================================================

enum class ErrorCode {
    OK = 0,

    // 请求校验 (1xx)
    MALFORMED_INPUT = 100,
    FORMATTING_VIOLATION = 101,
    INVALID_PACKAGE_NAME = 102,

    // 策略 (2xx)，永远不会进入执行阶段
    POLICY_DENIED = 200,
    APPROVAL_REQUIRED = 201,

    // 用户代码 (3xx)
    SYNTAX_ERROR = 300,
    RUNTIME_ERROR = 301,

    // 资源 (4xx)
    TIMEOUT = 400,
    RESOURCE_LIMIT_EXCEEDED = 401,

    // 文件 (5xx)
    FILE_NOT_FOUND = 500,
    FILE_READ_ERROR = 501,
    FILE_WRITE_ERROR = 502,

    // 配置 (6xx)
    CONFIG_PARSE_ERROR = 600,
    CONFIG_INVALID_VALUE = 601,

    // 沙箱内部 (9xx)
    SYSTEM_ERROR = 900,
    FORK_FAILED = 901,
    EXEC_FAILED = 902,
    PIPE_FAILED = 903,
    WAIT_FAILED = 904,
    WORKDIR_FAILED = 905,
    UNKNOWN_ERROR = 999
};

inline const char* error_code_str(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::MALFORMED_INPUT: return "MALFORMED_INPUT";
        case ErrorCode::FORMATTING_VIOLATION: return "FORMATTING_VIOLATION";
        case ErrorCode::INVALID_PACKAGE_NAME: return "INVALID_PACKAGE_NAME";
        case ErrorCode::POLICY_DENIED: return "POLICY_DENIED";
        case ErrorCode::APPROVAL_REQUIRED: return "APPROVAL_REQUIRED";
        case ErrorCode::SYNTAX_ERROR: return "SYNTAX_ERROR";
        case ErrorCode::RUNTIME_ERROR: return "RUNTIME_ERROR";
        case ErrorCode::TIMEOUT: return "TIMEOUT";
        case ErrorCode::RESOURCE_LIMIT_EXCEEDED: return "RESOURCE_LIMIT_EXCEEDED";
        case ErrorCode::FILE_NOT_FOUND: return "FILE_NOT_FOUND";
        case ErrorCode::FILE_READ_ERROR: return "FILE_READ_ERROR";
        case ErrorCode::FILE_WRITE_ERROR: return "FILE_WRITE_ERROR";
        case ErrorCode::CONFIG_PARSE_ERROR: return "CONFIG_PARSE_ERROR";
        case ErrorCode::CONFIG_INVALID_VALUE: return "CONFIG_INVALID_VALUE";
        case ErrorCode::SYSTEM_ERROR: return "SYSTEM_ERROR";
        case ErrorCode::FORK_FAILED: return "FORK_FAILED";
        case ErrorCode::EXEC_FAILED: return "EXEC_FAILED";
        case ErrorCode::PIPE_FAILED: return "PIPE_FAILED";
        case ErrorCode::WAIT_FAILED: return "WAIT_FAILED";
        case ErrorCode::WORKDIR_FAILED: return "WORKDIR_FAILED";
        default: return "UNKNOWN_ERROR";
    }
}

inline std::ostream& operator<<(std::ostream &os, ErrorCode code) {
    return os << error_code_str(code);
}

/**
 * @brief 是否属于沙箱自身故障（而不是用户输入或用户代码的问题）
 */
inline bool is_internal_code(ErrorCode code) {
    int v = static_cast<int>(code);
    return v >= 500;
}

//==============================================================================
// Error
//==============================================================================

class Error {
private:
    ErrorCode code_;
    std::string message_;
    std::string file_;
    int line_;
    std::string context_;

public:
    Error() : code_(ErrorCode::OK), line_(0) {}

    Error(ErrorCode code, const std::string &message = "")
        : code_(code), message_(message), line_(0) {}

    Error(ErrorCode code, const std::string &message,
          const char *file, int line)
        : code_(code), message_(message), file_(file ? file : ""), line_(line) {}

    Error& with_context(const std::string &ctx) {
        context_ = ctx;
        return *this;
    }

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }
    const std::string& file() const { return file_; }
    int line() const { return line_; }
    const std::string& context() const { return context_; }

    bool ok() const { return code_ == ErrorCode::OK; }
    bool internal() const { return is_internal_code(code_); }

    std::string to_string() const {
        std::ostringstream oss;
        oss << "[" << error_code_str(code_) << "]";
        if (!message_.empty()) oss << " " << message_;
        if (!context_.empty()) oss << " (context: " << context_ << ")";
        if (!file_.empty() && line_ > 0) {
            size_t pos = file_.find_last_of('/');
            oss << " at " << (pos == std::string::npos ? file_ : file_.substr(pos + 1))
                << ":" << line_;
        }
        return oss.str();
    }
};

//==============================================================================
// Result<T>
//==============================================================================

/**
 * @brief 值或错误
 *
 *   Result<ValidatedRequest> r = validator.validate(req);
 *   if (!r.ok()) return reject(r.error());
 *   use(r.value());
 */
template<typename T>
class Result {
private:
    std::variant<T, Error> data_;

public:
    Result(const T &value) : data_(value) {}
    Result(T &&value) : data_(std::move(value)) {}
    Result(const Error &err) : data_(err) {}
    Result(Error &&err) : data_(std::move(err)) {}
    Result(ErrorCode code, const std::string &msg = "")
        : data_(Error(code, msg)) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    bool is_error() const { return std::holds_alternative<Error>(data_); }
    explicit operator bool() const { return ok(); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const & { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    T value_or(const T &fallback) const {
        return ok() ? std::get<T>(data_) : fallback;
    }

    Error& error() & { return std::get<Error>(data_); }
    const Error& error() const & { return std::get<Error>(data_); }

    /**
     * @brief 取值，失败时抛出 std::runtime_error（仅用于测试和命令行入口）
     */
    const T& unwrap() const & {
        if (is_error()) {
            throw std::runtime_error(error().to_string());
        }
        return value();
    }

    T unwrap() && {
        if (is_error()) {
            throw std::runtime_error(error().to_string());
        }
        return std::get<T>(std::move(data_));
    }
};

template<>
class Result<void> {
private:
    std::optional<Error> error_;

public:
    Result() = default;
    Result(const Error &err) : error_(err) {}
    Result(Error &&err) : error_(std::move(err)) {}
    Result(ErrorCode code, const std::string &msg = "")
        : error_(Error(code, msg)) {}

    bool ok() const { return !error_.has_value(); }
    bool is_error() const { return error_.has_value(); }
    explicit operator bool() const { return ok(); }

    Error& error() { return *error_; }
    const Error& error() const { return *error_; }
};

inline Result<void> Ok() {
    return Result<void>();
}

template<typename T = void>
Result<T> Err(ErrorCode code, const std::string &message = "") {
    return Result<T>(Error(code, message));
}

} // namespace pybox

//==============================================================================
// 宏
//==============================================================================

#define PYBOX_ERROR(code, msg) \
    pybox::Error(code, msg, __FILE__, __LINE__)

#define PYBOX_TRY(expr) \
    do { \
        auto _pybox_result = (expr); \
        if (_pybox_result.is_error()) { \
            return _pybox_result.error(); \
        } \
    } while (0)

#define PYBOX_ENSURE(cond, code, msg) \
    do { \
        if (!(cond)) { \
            return PYBOX_ERROR(code, msg); \
        } \
    } while (0)

#endif // PYBOX_CORE_ERROR_H
