/**
 * @file classifier.h
 * @brief 执行结果分类
 *
 * 把执行层的原始结果映射为 ExecutionOutcome。判定顺序：
 *   1. 超时 -> TIMEOUT
 *   2. 资源超限 -> RESOURCE_LIMIT_EXCEEDED
 *   3. 正常退出 -> SUCCESS
 *   4. 没有 traceback 头的 SyntaxError / IndentationError / TabError -> SYNTAX_ERROR
 *   5. traceback -> RUNTIME_ERROR（MemoryError、ENOMEM、EFBIG 归为资源超限）
 *   6. 其余非零退出或信号 -> RUNTIME_ERROR
 *
 * stderr 是用户可控的文本，只做匹配，不做任何解释执行。
 */

#ifndef PYBOX_CORE_CLASSIFIER_H
#define PYBOX_CORE_CLASSIFIER_H

#include "core/error.h"
#include "core/types.h"
#include "core/utils.h"
#include "sandbox/sandbox.h"

#include <cctype>
#include <cstdlib>
#include <optional>
#include <string>
#include <vector>

namespace pybox {

namespace detail {

constexpr const char* TRACEBACK_HEADER = "Traceback (most recent call last):";

inline bool is_caret_line(const std::string &line) {
    std::string t = trim(line);
    return !t.empty() && t.find_first_not_of("^~ ") == std::string::npos;
}

inline bool is_indented(const std::string &line) {
    return !line.empty() && (line[0] == ' ' || line[0] == '\t');
}

/**
 * @brief 解析 `  File "main.py", line 3, in f`，函数名部分可选
 */
inline bool parse_frame_line(const std::string &line, TraceFrame &frame) {
    const std::string prefix = "File \"";
    std::string t = trim(line);
    if (!starts_with(t, prefix)) return false;

    size_t quote = t.find("\", line ", prefix.size());
    if (quote == std::string::npos) return false;
    frame.file = t.substr(prefix.size(), quote - prefix.size());

    size_t num_start = quote + 8;
    size_t num_end = num_start;
    while (num_end < t.size() && std::isdigit(static_cast<unsigned char>(t[num_end]))) {
        ++num_end;
    }
    if (num_end == num_start) return false;
    frame.line = std::atoi(t.substr(num_start, num_end - num_start).c_str());

    const std::string in = ", in ";
    if (t.compare(num_end, in.size(), in) == 0) {
        frame.function = t.substr(num_end + in.size());
    }
    return true;
}

/**
 * @brief 拆分异常行 "Type: message"；没有冒号时整行为类型
 */
inline void parse_exception_line(const std::string &line, Traceback &tb) {
    size_t colon = line.find(": ");
    if (colon == std::string::npos) {
        std::string t = trim(line);
        if (!t.empty() && t.back() == ':') t.pop_back();
        tb.exception_type = t;
        tb.message.clear();
    } else {
        tb.exception_type = line.substr(0, colon);
        tb.message = line.substr(colon + 2);
    }
}

inline bool is_syntax_type(const std::string &type) {
    return type == "SyntaxError" || type == "IndentationError" || type == "TabError";
}

inline std::vector<std::string> non_empty_tail(const std::vector<std::string> &lines) {
    std::vector<std::string> out(lines);
    while (!out.empty() && trim(out.back()).empty()) out.pop_back();
    return out;
}

} // namespace detail

/**
 * @brief 解析编译期语法错误（stderr 中没有 traceback 头）
 *
 *   File "/tmp/pybox_ctx_1_x/main.py", line 1
 *     def f(:
 *           ^
 * SyntaxError: invalid syntax
 */
inline std::optional<Traceback> parse_syntax_error(const std::string &stderr_text) {
    auto lines = detail::non_empty_tail(split_lines(stderr_text));
    if (lines.empty()) return std::nullopt;
    for (const auto &l : lines) {
        if (l == detail::TRACEBACK_HEADER) return std::nullopt;
    }

    Traceback tb;
    detail::parse_exception_line(lines.back(), tb);
    if (!detail::is_syntax_type(tb.exception_type)) return std::nullopt;

    for (size_t i = lines.size() - 1; i-- > 0;) {
        TraceFrame frame;
        if (!detail::parse_frame_line(lines[i], frame)) continue;

        tb.line = frame.line;
        size_t next = i + 1;
        if (next + 1 < lines.size() && !detail::is_caret_line(lines[next])) {
            const std::string &shown = lines[next];
            size_t indent = shown.find_first_not_of(' ');
            frame.source = trim(shown);
            if (detail::is_caret_line(lines[next + 1]) && indent != std::string::npos) {
                size_t caret = lines[next + 1].find_first_of("^~");
                if (caret != std::string::npos && caret >= indent) {
                    tb.column = static_cast<int>(caret - indent) + 1;
                }
            }
        }
        tb.frames.push_back(frame);
        break;
    }
    return tb;
}

/**
 * @brief 解析运行时 traceback，异常链只取最后一段
 */
inline std::optional<Traceback> parse_traceback(const std::string &stderr_text) {
    auto lines = detail::non_empty_tail(split_lines(stderr_text));

    size_t header = lines.size();
    for (size_t i = lines.size(); i-- > 0;) {
        if (lines[i] == detail::TRACEBACK_HEADER) {
            header = i;
            break;
        }
    }
    if (header == lines.size()) return std::nullopt;

    Traceback tb;
    size_t i = header + 1;
    for (; i < lines.size(); ++i) {
        const std::string &line = lines[i];
        if (!detail::is_indented(line)) break;

        TraceFrame frame;
        if (detail::parse_frame_line(line, frame)) {
            tb.frames.push_back(frame);
            continue;
        }
        std::string t = trim(line);
        if (tb.frames.empty() || detail::is_caret_line(line) ||
            starts_with(t, "[Previous line repeated")) {
            continue;
        }
        if (tb.frames.back().source.empty()) {
            tb.frames.back().source = t;
        }
    }
    if (i >= lines.size()) return std::nullopt;

    detail::parse_exception_line(lines[i], tb);
    for (++i; i < lines.size(); ++i) {
        tb.message += "\n" + lines[i];
    }
    if (!tb.frames.empty()) {
        tb.line = tb.frames.back().line;
    }
    return tb;
}

/**
 * @brief 最内层帧是 raise 语句：异常由代码主动抛出，而不是解释器或系统调用失败
 *
 * 裸 raise（在 except 中重新抛出）不算。
 */
inline bool raised_explicitly(const Traceback &tb) {
    return !tb.frames.empty() && starts_with(tb.frames.back().source, "raise ");
}

/**
 * @brief MemoryError 以及 errno 12 (ENOMEM) / 27 (EFBIG) 的 OSError
 */
inline bool is_resource_exhaustion(const Traceback &tb) {
    if (raised_explicitly(tb)) return false;
    if (tb.exception_type == "MemoryError") return true;
    return starts_with(tb.message, "[Errno 12]") || starts_with(tb.message, "[Errno 27]");
}

class ResultClassifier {
private:
    static std::string last_line(const std::string &text) {
        auto lines = detail::non_empty_tail(split_lines(text));
        if (lines.empty()) return "";
        std::string t = trim(lines.back());
        if (t.size() > 200) t = t.substr(0, 200) + "...";
        return t;
    }

    static std::string describe(const Traceback &tb) {
        return tb.message.empty() ? tb.exception_type : tb.exception_type + ": " + tb.message;
    }

public:
    ExecutionOutcome classify(const sandbox::RawExecutionResult &raw) const {
        using sandbox::RunStatus;

        ExecutionOutcome o;
        o.context_id = raw.context_id;
        o.stdout_data = raw.stdout_data;
        o.stderr_data = raw.stderr_data;
        o.stdout_truncated = raw.stdout_truncated;
        o.stderr_truncated = raw.stderr_truncated;
        o.duration_ms = raw.wall_time_ms;

        if (raw.status == RunStatus::TIME_LIMIT) {
            o.status = OutcomeStatus::TIMEOUT;
            o.error_code = ErrorCode::TIMEOUT;
            o.message = raw.message;
            return o;
        }
        if (sandbox::is_limit_breach(raw.status)) {
            o.status = OutcomeStatus::RESOURCE_LIMIT_EXCEEDED;
            o.error_code = ErrorCode::RESOURCE_LIMIT_EXCEEDED;
            o.message = raw.message;
            return o;
        }
        if (raw.status == RunStatus::OK) {
            o.status = OutcomeStatus::SUCCESS;
            o.error_code = ErrorCode::OK;
            return o;
        }

        if (auto syntax = parse_syntax_error(raw.stderr_data)) {
            o.status = OutcomeStatus::SYNTAX_ERROR;
            o.error_code = ErrorCode::SYNTAX_ERROR;
            o.message = describe(*syntax) + " (line " + std::to_string(syntax->line) + ")";
            o.traceback = std::move(syntax);
            return o;
        }

        if (auto tb = parse_traceback(raw.stderr_data)) {
            o.message = describe(*tb);
            if (is_resource_exhaustion(*tb)) {
                o.status = OutcomeStatus::RESOURCE_LIMIT_EXCEEDED;
                o.error_code = ErrorCode::RESOURCE_LIMIT_EXCEEDED;
            } else {
                o.status = OutcomeStatus::RUNTIME_ERROR;
                o.error_code = ErrorCode::RUNTIME_ERROR;
            }
            o.traceback = std::move(tb);
            return o;
        }

        o.status = OutcomeStatus::RUNTIME_ERROR;
        o.error_code = ErrorCode::RUNTIME_ERROR;
        o.message = raw.message.empty() ? "abnormal termination" : raw.message;
        std::string tail = last_line(raw.stderr_data);
        if (!tail.empty()) o.message += ": " + tail;
        return o;
    }

    /**
     * @brief 沙箱自身的故障，不与用户代码错误混淆
     */
    ExecutionOutcome internal_error(const Error &error, const std::string &context_id = "") const {
        ExecutionOutcome o;
        o.status = OutcomeStatus::INTERNAL_ERROR;
        o.error_code = error.code();
        o.message = error.message();
        o.context_id = context_id.empty() ? error.context() : context_id;
        return o;
    }
};

} // namespace pybox

#endif // PYBOX_CORE_CLASSIFIER_H
