/**
 * @file cgroup.h
 * @brief cgroups v2 资源控制
 *
 * cgroup 只在宿主把子树委派给本进程时可用（systemd-run --scope
 * --property=Delegate=yes，或容器内可写的 /sys/fs/cgroup）。布局：
 *
 *   <委派根>/
 *   ├── service/       ← 沙箱服务进程自身
 *   └── executions/    ← 每个执行上下文一个子 cgroup
 *       ├── ctx_<pid>_1/
 *       └── ...
 *
 * 不可用时执行层退回到 rlimit + 进程组，并在日志中说明。
 */

#ifndef PYBOX_SANDBOX_CGROUP_H
#define PYBOX_SANDBOX_CGROUP_H

#include <string>
#include <fstream>
#include <sstream>
#include <mutex>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <thread>
#include <chrono>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/vfs.h>
#include <linux/magic.h>

#include "core/error.h"

namespace pybox {
namespace sandbox {

struct CgroupLimits {
    uint64_t memory_max = 0;    ///< bytes，0 表示不限制
    uint64_t pids_max = 0;      ///< 0 表示不限制
};

struct CgroupStats {
    uint64_t memory_peak = 0;   ///< bytes
    uint64_t cpu_usage_usec = 0;
    uint64_t pids_peak = 0;
    bool oom_killed = false;
    bool pids_limited = false;  ///< 曾因 pids.max 拒绝 fork
};

/**
 * @brief cgroup v2 是否挂载在 /sys/fs/cgroup
 */
inline bool is_cgroup_v2_available() {
    struct statfs buf;
    if (statfs("/sys/fs/cgroup", &buf) != 0) {
        return false;
    }
    return buf.f_type == CGROUP2_SUPER_MAGIC;
}

/**
 * @brief 当前进程所在的 cgroup（相对 /sys/fs/cgroup），v2 格式 "0::/path"
 */
inline std::string self_cgroup_path() {
    std::ifstream in("/proc/self/cgroup");
    std::string line;
    while (std::getline(in, line)) {
        if (line.compare(0, 3, "0::") == 0) {
            return line.substr(3);
        }
    }
    return "";
}

namespace detail {

inline Result<void> write_control(const std::string &path, const std::string &value) {
    std::ofstream out(path);
    if (!out) {
        return Error(ErrorCode::FILE_WRITE_ERROR, "cannot open " + path);
    }
    out << value;
    out.flush();
    if (!out) {
        return Error(ErrorCode::FILE_WRITE_ERROR, "write to " + path + " failed");
    }
    return Ok();
}

inline std::string read_control(const std::string &path) {
    std::ifstream in(path);
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

/**
 * @brief 从 "key value" 形式的统计文件中取一个值
 */
inline uint64_t stat_value(const std::string &content, const std::string &key) {
    std::istringstream iss(content);
    std::string k;
    uint64_t v;
    while (iss >> k >> v) {
        if (k == key) return v;
    }
    return 0;
}

} // namespace detail

/**
 * @brief 单个执行上下文的 cgroup
 *
 * 析构时杀死组内所有进程并删除目录。
 */
class CgroupController {
private:
    std::string path_;
    bool created_ = false;

public:
    CgroupController(const std::string &parent, const std::string &name)
        : path_(parent + "/" + name) {}

    ~CgroupController() {
        if (created_) {
            Result<void> r = destroy();
            (void)r;  // 析构中无法上报；目录残留不影响后续执行
        }
    }

    CgroupController(const CgroupController&) = delete;
    CgroupController& operator=(const CgroupController&) = delete;

    Result<void> create() {
        if (mkdir(path_.c_str(), 0755) != 0 && errno != EEXIST) {
            return Error(ErrorCode::FILE_WRITE_ERROR,
                         "cannot create cgroup " + path_ + ": " + std::strerror(errno));
        }
        created_ = true;
        return Ok();
    }

    Result<void> apply_limits(const CgroupLimits &limits) {
        if (limits.memory_max > 0) {
            PYBOX_TRY(detail::write_control(path_ + "/memory.max",
                                            std::to_string(limits.memory_max)));
            // 没有 swap 控制器时该文件不存在，忽略
            Result<void> swap = detail::write_control(path_ + "/memory.swap.max", "0");
            (void)swap;
        }
        if (limits.pids_max > 0) {
            PYBOX_TRY(detail::write_control(path_ + "/pids.max",
                                            std::to_string(limits.pids_max)));
        }
        return Ok();
    }

    Result<void> add_process(pid_t pid) {
        return detail::write_control(path_ + "/cgroup.procs", std::to_string(pid));
    }

    CgroupStats stats() const {
        CgroupStats s;
        std::string peak = detail::read_control(path_ + "/memory.peak");
        if (!peak.empty()) s.memory_peak = std::strtoull(peak.c_str(), nullptr, 10);
        s.oom_killed = detail::stat_value(
            detail::read_control(path_ + "/memory.events"), "oom_kill") > 0;
        s.cpu_usage_usec = detail::stat_value(
            detail::read_control(path_ + "/cpu.stat"), "usage_usec");
        std::string pids_peak = detail::read_control(path_ + "/pids.peak");
        if (!pids_peak.empty()) s.pids_peak = std::strtoull(pids_peak.c_str(), nullptr, 10);
        s.pids_limited = detail::stat_value(
            detail::read_control(path_ + "/pids.events"), "max") > 0;
        return s;
    }

    /**
     * @brief 杀死组内所有进程（包括 setsid 逃出进程组的）
     */
    Result<void> kill_all() {
        return detail::write_control(path_ + "/cgroup.kill", "1");
    }

    /**
     * @brief 杀死所有进程，等待组变空后删除目录
     */
    Result<void> destroy() {
        if (!created_) return Ok();
        Result<void> killed = kill_all();
        (void)killed;
        for (int i = 0; i < 100; ++i) {
            if (rmdir(path_.c_str()) == 0 || errno == ENOENT) {
                created_ = false;
                return Ok();
            }
            if (errno != EBUSY) break;
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
        return Error(ErrorCode::SYSTEM_ERROR,
                     "cannot remove cgroup " + path_ + ": " + std::strerror(errno));
    }

    const std::string& path() const { return path_; }
};

/**
 * @brief 委派子树的管理
 *
 * initialize() 把当前进程移到 service/，然后在根上开启控制器
 * （cgroup v2 不允许有进程的 cgroup 同时向子 cgroup 分配控制器）。
 */
class CgroupManager {
private:
    std::string executions_parent_;
    bool initialized_ = false;
    std::mutex mutex_;

    CgroupManager() = default;

public:
    static CgroupManager& instance() {
        static CgroupManager mgr;
        return mgr;
    }

    Result<void> initialize() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (initialized_) return Ok();

        if (!is_cgroup_v2_available()) {
            return Error(ErrorCode::SYSTEM_ERROR, "cgroup v2 is not mounted");
        }

        std::string self = self_cgroup_path();
        std::string base = "/sys/fs/cgroup" + (self == "/" ? std::string() : self);

        std::string service = base + "/service";
        if (mkdir(service.c_str(), 0755) != 0 && errno != EEXIST) {
            return Error(ErrorCode::FILE_WRITE_ERROR, "cannot create " + service);
        }
        PYBOX_TRY(detail::write_control(service + "/cgroup.procs", std::to_string(getpid())));
        PYBOX_TRY(detail::write_control(base + "/cgroup.subtree_control", "+memory +pids"));

        std::string executions = base + "/executions";
        if (mkdir(executions.c_str(), 0755) != 0 && errno != EEXIST) {
            return Error(ErrorCode::FILE_WRITE_ERROR, "cannot create " + executions);
        }
        PYBOX_TRY(detail::write_control(executions + "/cgroup.subtree_control",
                                        "+memory +pids"));

        executions_parent_ = executions;
        initialized_ = true;
        return Ok();
    }

    bool is_initialized() {
        std::lock_guard<std::mutex> lock(mutex_);
        return initialized_;
    }

    std::string executions_parent() {
        std::lock_guard<std::mutex> lock(mutex_);
        return executions_parent_;
    }
};

} // namespace sandbox
} // namespace pybox

#endif // PYBOX_SANDBOX_CGROUP_H
