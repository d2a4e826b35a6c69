/**
 * @file types.h
 * @brief 核心数据结构
 *
 * - ExecutionRequest: 入口处创建的不可变请求
 * - ExecutionLimits: 单次执行的资源上限
 * - PolicyDecision: 策略判定
 * - Traceback / ExecutionOutcome: 分类后的执行结果
 */

#ifndef PYBOX_CORE_TYPES_H
#define PYBOX_CORE_TYPES_H

#include "error.h"

#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <cstdint>

namespace pybox {

//==============================================================================
// 请求
//==============================================================================

enum class RequestKind {
    CODE,
    PACKAGE_INSTALL
};

inline const char* request_kind_str(RequestKind kind) {
    return kind == RequestKind::CODE ? "CODE" : "PACKAGE_INSTALL";
}

/**
 * @brief 一次执行请求，创建后只读
 */
class ExecutionRequest {
private:
    std::string payload_;
    RequestKind kind_;
    std::optional<std::string> declared_version_;
    std::chrono::system_clock::time_point submitted_at_;

    ExecutionRequest(std::string payload, RequestKind kind,
                     std::optional<std::string> version)
        : payload_(std::move(payload)), kind_(kind),
          declared_version_(std::move(version)),
          submitted_at_(std::chrono::system_clock::now()) {}

public:
    static ExecutionRequest code(const std::string &source) {
        return ExecutionRequest(source, RequestKind::CODE, std::nullopt);
    }

    static ExecutionRequest package(const std::string &name,
                                    const std::optional<std::string> &version = std::nullopt) {
        return ExecutionRequest(name, RequestKind::PACKAGE_INSTALL, version);
    }

    const std::string& payload() const { return payload_; }
    RequestKind kind() const { return kind_; }
    const std::optional<std::string>& declared_version() const { return declared_version_; }
    std::chrono::system_clock::time_point submitted_at() const { return submitted_at_; }
};

/**
 * @brief 通过校验的请求
 *
 * 包安装时 version 已规范化：空串和 "latest" 视为未指定。
 */
struct ValidatedRequest {
    ExecutionRequest request;
    std::optional<std::string> version;

    RequestKind kind() const { return request.kind(); }
    const std::string& payload() const { return request.payload(); }
};

//==============================================================================
// 资源限制
//==============================================================================

struct ExecutionLimits {
    int64_t timeout_ms = 5000;          ///< 墙钟时间
    int64_t memory_limit_kb = 512 * 1024;
    int64_t cpu_time_limit_ms = 10000;
    int64_t max_processes = 64;         ///< 仅在 cgroup 可用时生效
    int64_t max_output_bytes = 65536;   ///< stdout / stderr 各自的捕获上限
    int64_t max_file_size_kb = 16 * 1024;
};

//==============================================================================
// 策略
//==============================================================================

enum class PolicyVerdict {
    ALLOW,
    DENY,
    REQUIRES_APPROVAL
};

inline const char* verdict_str(PolicyVerdict v) {
    switch (v) {
        case PolicyVerdict::ALLOW: return "ALLOW";
        case PolicyVerdict::DENY: return "DENY";
        case PolicyVerdict::REQUIRES_APPROVAL: return "REQUIRES_APPROVAL";
    }
    return "UNKNOWN";
}

struct PolicyDecision {
    PolicyVerdict verdict = PolicyVerdict::DENY;
    std::string reason;
    std::string matched_rule;   ///< 命中的规则，未命中为空
    bool unpinned = false;      ///< 安装请求未指定版本

    static PolicyDecision allow(const std::string &reason) {
        return {PolicyVerdict::ALLOW, reason, "", false};
    }
    static PolicyDecision deny(const std::string &reason, const std::string &rule) {
        return {PolicyVerdict::DENY, reason, rule, false};
    }
    static PolicyDecision approval(const std::string &reason, const std::string &rule) {
        return {PolicyVerdict::REQUIRES_APPROVAL, reason, rule, false};
    }
};

//==============================================================================
// 结果
//==============================================================================

enum class RequestState {
    RECEIVED,
    VALIDATED,
    POLICY_CHECKED,
    EXECUTING,
    CLASSIFIED,
    REJECTED
};

inline const char* state_str(RequestState s) {
    switch (s) {
        case RequestState::RECEIVED: return "RECEIVED";
        case RequestState::VALIDATED: return "VALIDATED";
        case RequestState::POLICY_CHECKED: return "POLICY_CHECKED";
        case RequestState::EXECUTING: return "EXECUTING";
        case RequestState::CLASSIFIED: return "CLASSIFIED";
        case RequestState::REJECTED: return "REJECTED";
    }
    return "UNKNOWN";
}

enum class OutcomeStatus {
    SUCCESS,
    SYNTAX_ERROR,
    RUNTIME_ERROR,
    POLICY_VIOLATION,
    TIMEOUT,
    RESOURCE_LIMIT_EXCEEDED,
    INTERNAL_ERROR,
    INVALID_INPUT
};

inline const char* status_str(OutcomeStatus s) {
    switch (s) {
        case OutcomeStatus::SUCCESS: return "SUCCESS";
        case OutcomeStatus::SYNTAX_ERROR: return "SYNTAX_ERROR";
        case OutcomeStatus::RUNTIME_ERROR: return "RUNTIME_ERROR";
        case OutcomeStatus::POLICY_VIOLATION: return "POLICY_VIOLATION";
        case OutcomeStatus::TIMEOUT: return "TIMEOUT";
        case OutcomeStatus::RESOURCE_LIMIT_EXCEEDED: return "RESOURCE_LIMIT_EXCEEDED";
        case OutcomeStatus::INTERNAL_ERROR: return "INTERNAL_ERROR";
        case OutcomeStatus::INVALID_INPUT: return "INVALID_INPUT";
    }
    return "UNKNOWN";
}

inline std::ostream& operator<<(std::ostream &os, OutcomeStatus s) {
    return os << status_str(s);
}

struct TraceFrame {
    std::string file;
    int line = 0;
    std::string function;   ///< 语法错误没有函数名
    std::string source;
};

/**
 * @brief 结构化的 Python 诊断
 *
 * 运行时错误取异常链中最后一段 traceback；语法错误没有调用帧，
 * 只有一个位置帧，line / column 指向出错处（column 从 1 开始，未知为 0）。
 */
struct Traceback {
    std::string exception_type;
    std::string message;
    std::vector<TraceFrame> frames;
    int line = 0;
    int column = 0;
};

struct ExecutionOutcome {
    OutcomeStatus status = OutcomeStatus::INTERNAL_ERROR;
    ErrorCode error_code = ErrorCode::OK;
    std::string message;
    std::string stdout_data;
    std::string stderr_data;
    bool stdout_truncated = false;
    bool stderr_truncated = false;
    std::optional<Traceback> traceback;
    int64_t duration_ms = 0;
    std::string context_id;
    RequestState final_state = RequestState::REJECTED;

    bool success() const { return status == OutcomeStatus::SUCCESS; }
};

} // namespace pybox

#endif // PYBOX_CORE_TYPES_H
