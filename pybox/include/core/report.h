/**
 * @file report.h
 * @brief 执行结果输出
 *
 * 结果文件格式：若干行头部，随后是转义后的 XML 详情
 *
 *   status RUNTIME_ERROR
 *   error RUNTIME_ERROR
 *   time 37
 *   context ctx_1234_1
 *   details
 *   <outcome ...>...</outcome>
 */

#ifndef PYBOX_CORE_REPORT_H
#define PYBOX_CORE_REPORT_H

#include <string>
#include <sstream>
#include <fstream>
#include <ostream>
#include <cerrno>
#include <cstring>

#include "core/error.h"
#include "core/types.h"
#include "core/utils.h"

namespace pybox {

namespace detail {

inline void write_traceback(std::ostream &out, const Traceback &tb) {
    out << "<traceback type=\"" << htmlspecialchars(tb.exception_type) << "\""
        << " message=\"" << htmlspecialchars(tb.message) << "\""
        << " line=\"" << tb.line << "\""
        << " column=\"" << tb.column << "\">";
    for (const auto &f : tb.frames) {
        out << "<frame file=\"" << htmlspecialchars(f.file) << "\""
            << " line=\"" << f.line << "\""
            << " function=\"" << htmlspecialchars(f.function) << "\">"
            << htmlspecialchars(f.source) << "</frame>";
    }
    out << "</traceback>" << std::endl;
}

} // namespace detail

/**
 * @brief 输出完整报告
 */
inline void write_outcome(std::ostream &out, const ExecutionOutcome &o) {
    out << "status " << status_str(o.status) << "\n";
    out << "error " << error_code_str(o.error_code) << "\n";
    out << "time " << o.duration_ms << "\n";
    out << "context " << o.context_id << "\n";
    out << "details\n";

    out << "<outcome status=\"" << status_str(o.status) << "\""
        << " error=\"" << error_code_str(o.error_code) << "\""
        << " time=\"" << o.duration_ms << "\""
        << " state=\"" << state_str(o.final_state) << "\">" << std::endl;
    out << "<message>" << htmlspecialchars(o.message) << "</message>" << std::endl;
    out << "<stdout truncated=\"" << (o.stdout_truncated ? 1 : 0) << "\">"
        << htmlspecialchars(o.stdout_data) << "</stdout>" << std::endl;
    out << "<stderr truncated=\"" << (o.stderr_truncated ? 1 : 0) << "\">"
        << htmlspecialchars(o.stderr_data) << "</stderr>" << std::endl;
    if (o.traceback) {
        detail::write_traceback(out, *o.traceback);
    }
    out << "</outcome>" << std::endl;
}

inline std::string format_outcome(const ExecutionOutcome &o) {
    std::ostringstream oss;
    write_outcome(oss, o);
    return oss.str();
}

/**
 * @brief 写入结果文件（覆盖已有文件）
 */
inline Result<void> write_outcome_file(const std::string &path, const ExecutionOutcome &o) {
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        return PYBOX_ERROR(ErrorCode::FILE_WRITE_ERROR,
                           "cannot open " + path + ": " + std::strerror(errno));
    }
    write_outcome(out, o);
    out.flush();
    if (!out) {
        return PYBOX_ERROR(ErrorCode::FILE_WRITE_ERROR, "write to " + path + " failed");
    }
    return Ok();
}

} // namespace pybox

#endif // PYBOX_CORE_REPORT_H
