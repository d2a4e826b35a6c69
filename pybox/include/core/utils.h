/**
 * @file utils.h
 * @brief 工具函数
 *
 * - 字符串处理
 * - 文件读写
 * - 可执行文件查找
 */

#ifndef PYBOX_CORE_UTILS_H
#define PYBOX_CORE_UTILS_H

#include "error.h"

#include <string>
#include <vector>
#include <sstream>
#include <fstream>
#include <cstring>
#include <cstdlib>
#include <climits>
#include <cctype>
#include <cerrno>
#include <algorithm>
#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>

namespace pybox {

//==============================================================================
// 字符串处理
//==============================================================================

inline std::string trim(const std::string &s) {
    size_t b = s.find_first_not_of(" \t\r\n\f\v");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n\f\v");
    return s.substr(b, e - b + 1);
}

inline std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

inline bool starts_with(const std::string &s, const std::string &prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

/**
 * @brief 按 '\n' 切行，去掉行尾 '\r'，末尾空行不计
 */
inline std::vector<std::string> split_lines(const std::string &s) {
    std::vector<std::string> lines;
    std::string cur;
    std::istringstream iss(s);
    while (std::getline(iss, cur)) {
        if (!cur.empty() && cur.back() == '\r') cur.pop_back();
        lines.push_back(cur);
    }
    return lines;
}

/**
 * @brief 包名规范化（PEP 503）：小写，连续的 '-' '_' '.' 合并为 '-'
 */
inline std::string normalize_package_name(const std::string &name) {
    std::string out;
    out.reserve(name.size());
    bool in_sep = false;
    for (unsigned char c : name) {
        if (c == '-' || c == '_' || c == '.') {
            if (!in_sep) out += '-';
            in_sep = true;
        } else {
            out += static_cast<char>(std::tolower(c));
            in_sep = false;
        }
    }
    return out;
}

template <class T>
inline std::string to_string(const T &v) {
    std::ostringstream sout;
    sout << v;
    return sout.str();
}

/**
 * @brief 报告转义
 *
 * 除 XML 特殊字符外，其它控制字符写成 \xNN，避免用户输出破坏报告格式。
 */
inline std::string htmlspecialchars(const std::string &s) {
    static const char hex[] = "0123456789abcdef";
    std::string r;
    r.reserve(s.size());
    for (unsigned char c : s) {
        switch (c) {
            case '&':  r += "&amp;"; break;
            case '<':  r += "&lt;"; break;
            case '>':  r += "&gt;"; break;
            case '"':  r += "&quot;"; break;
            case '\n': case '\t': r += static_cast<char>(c); break;
            default:
                if (c < 0x20 || c == 0x7f) {
                    r += "\\x";
                    r += hex[c >> 4];
                    r += hex[c & 0xf];
                } else {
                    r += static_cast<char>(c);
                }
                break;
        }
    }
    return r;
}

//==============================================================================
// 文件
//==============================================================================

inline std::string get_realpath(const std::string &path) {
    char real[PATH_MAX + 1];
    if (realpath(path.c_str(), real) == nullptr) {
        return "";
    }
    return real;
}

inline bool file_exists(const std::string &path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

inline bool is_executable(const std::string &path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
           access(path.c_str(), X_OK) == 0;
}

/**
 * @brief 在 PATH 中查找可执行文件；带 '/' 的名字按路径检查
 */
inline std::string find_executable(const std::string &name) {
    if (name.find('/') != std::string::npos) {
        return is_executable(name) ? name : "";
    }
    const char *env = std::getenv("PATH");
    std::string path = env ? env : "/usr/local/bin:/usr/bin:/bin";
    std::istringstream iss(path);
    std::string dir;
    while (std::getline(iss, dir, ':')) {
        if (dir.empty()) continue;
        std::string candidate = dir + "/" + name;
        if (is_executable(candidate)) return candidate;
    }
    return "";
}

inline Result<std::string> read_file(const std::string &path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return Error(ErrorCode::FILE_NOT_FOUND, "cannot open " + path);
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    if (in.bad()) {
        return Error(ErrorCode::FILE_READ_ERROR, "cannot read " + path);
    }
    return oss.str();
}

/**
 * @brief 以给定权限新建文件并写入，文件已存在时失败
 */
inline Result<void> write_new_file(const std::string &path, const std::string &content,
                                   mode_t mode = 0600) {
    int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, mode);
    if (fd < 0) {
        return PYBOX_ERROR(ErrorCode::FILE_WRITE_ERROR,
                           "open " + path + ": " + std::strerror(errno));
    }
    size_t done = 0;
    while (done < content.size()) {
        ssize_t n = write(fd, content.data() + done, content.size() - done);
        if (n < 0) {
            if (errno == EINTR) continue;
            int saved = errno;
            close(fd);
            return PYBOX_ERROR(ErrorCode::FILE_WRITE_ERROR,
                               "write " + path + ": " + std::strerror(saved));
        }
        done += static_cast<size_t>(n);
    }
    if (close(fd) != 0) {
        return PYBOX_ERROR(ErrorCode::FILE_WRITE_ERROR,
                           "close " + path + ": " + std::strerror(errno));
    }
    return Ok();
}

} // namespace pybox

#endif // PYBOX_CORE_UTILS_H
