/**
 * @file test_helpers.h
 * @brief 测试公用工具
 */

#ifndef PYBOX_TESTS_TEST_HELPERS_H
#define PYBOX_TESTS_TEST_HELPERS_H

#include <string>
#include <vector>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>
#include <dirent.h>
#include <unistd.h>

#include "pybox.h"

namespace pybox {
namespace test {

/**
 * @brief 查找可用的 python3，找不到返回空串（相关测试跳过）
 */
inline std::string find_python() {
    for (const char *candidate : {"/usr/bin/python3", "/usr/local/bin/python3"}) {
        if (is_executable(candidate)) return candidate;
    }
    return find_executable("python3");
}

/**
 * @brief 测试用配置：不使用 cgroup，缩短超时
 */
inline SandboxSettings test_settings(const std::string &python) {
    SandboxSettings s;
    s.execution.python = python;
    s.execution.use_cgroup = false;
    s.execution.code_limits.timeout_ms = 4000;
    s.execution.package_limits.timeout_ms = 20000;
    s.execution.pip.retries = 0;
    s.execution.pip.timeout_s = 2;
    return s;
}

/**
 * @brief /proc/<pid>/stat 的状态字段，进程不存在时返回 0
 */
inline char process_state(pid_t pid) {
    std::ifstream in("/proc/" + std::to_string(pid) + "/stat");
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    size_t paren = content.rfind(')');
    if (paren == std::string::npos || paren + 2 >= content.size()) return 0;
    return content[paren + 2];
}

/// 进程已不存在，或只剩等待回收的僵尸
inline bool process_gone(pid_t pid) {
    char state = process_state(pid);
    return state == 0 || state == 'Z' || state == 'X';
}

/**
 * @brief 命令行参数中含有 token 的宿主进程（僵尸除外）
 *
 * 沙箱内的进程处于独立的 PID 命名空间，只能按命令行识别。
 */
inline std::vector<pid_t> processes_with_arg(const std::string &token) {
    std::vector<pid_t> out;
    DIR *dir = opendir("/proc");
    if (!dir) return out;
    while (struct dirent *e = readdir(dir)) {
        std::string name = e->d_name;
        if (name.empty() || name.find_first_not_of("0123456789") != std::string::npos) continue;
        std::ifstream in("/proc/" + name + "/cmdline");
        std::string cmdline((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        std::istringstream args(cmdline);
        std::string arg;
        while (std::getline(args, arg, '\0')) {
            if (arg == token) {
                pid_t pid = static_cast<pid_t>(std::stol(name));
                if (!process_gone(pid)) out.push_back(pid);
                break;
            }
        }
    }
    closedir(dir);
    return out;
}

/// 等待带 token 的进程全部退出，超时返回 false
inline bool wait_processes_gone(const std::string &token, int timeout_ms = 2000) {
    for (int waited = 0; ; waited += 50) {
        if (processes_with_arg(token).empty()) return true;
        if (waited >= timeout_ms) return false;
        usleep(50 * 1000);
    }
}

/**
 * @brief work_root 下以 pybox_ 开头的目录
 */
inline std::vector<std::string> leftover_work_dirs(const std::string &root) {
    std::vector<std::string> out;
    DIR *dir = opendir(root.c_str());
    if (!dir) return out;
    while (struct dirent *e = readdir(dir)) {
        std::string name = e->d_name;
        if (name.compare(0, 6, "pybox_") == 0) out.push_back(name);
    }
    closedir(dir);
    return out;
}

/**
 * @brief 在 /tmp 下创建独立的临时目录，析构时删除
 */
class TempDir {
private:
    std::string path_;

public:
    TempDir() {
        char tmpl[] = "/tmp/pybox_test_XXXXXX";
        char *p = mkdtemp(tmpl);
        path_ = p ? p : "";
    }

    ~TempDir() {
        if (!path_.empty()) {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
        }
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::string& path() const { return path_; }
};

} // namespace test
} // namespace pybox

#endif // PYBOX_TESTS_TEST_HELPERS_H
