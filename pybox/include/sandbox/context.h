/**
 * @file context.h
 * @brief 执行上下文
 *
 * 一次请求独占一个上下文：唯一 id、临时工作目录、资源上限，
 * 以及绑定后的子进程组和 cgroup。启用文件系统隔离时还有一个与工作目录同级的
 * 新根挂载点（<work_dir>.root）。析构时无条件回收：
 *   1. SIGKILL 整个进程组，cgroup 存在时 cgroup.kill
 *   2. 回收属于该进程组的子进程（子收割者模式下包括孤儿后代）
 *   3. 删除 cgroup、工作目录和新根挂载点
 */

#ifndef PYBOX_SANDBOX_CONTEXT_H
#define PYBOX_SANDBOX_CONTEXT_H

#include <atomic>
#include <chrono>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <memory>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

#include <signal.h>
#include <unistd.h>
#include <sys/prctl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>

#include "core/error.h"
#include "core/sandbox_logger.h"
#include "core/types.h"
#include "sandbox/cgroup.h"

namespace pybox {
namespace sandbox {

namespace fs = std::filesystem;

/**
 * @brief 让本进程成为子收割者，setsid 以外的孤儿后代都会重新挂到本进程下
 */
inline bool enable_subreaper() {
    return prctl(PR_SET_CHILD_SUBREAPER, 1, 0, 0, 0) == 0;
}

class ExecutionContext {
private:
    std::string id_;
    ExecutionLimits limits_;
    std::string work_dir_;
    std::string root_dir_;
    std::chrono::steady_clock::time_point started_at_;
    std::chrono::steady_clock::time_point ended_at_;
    pid_t process_group_ = -1;
    std::unique_ptr<CgroupController> cgroup_;
    bool released_ = false;

    static std::atomic<uint64_t> counter_;

    ExecutionContext(std::string id, const ExecutionLimits &limits, std::string work_dir)
        : id_(std::move(id)), limits_(limits), work_dir_(std::move(work_dir)),
          started_at_(std::chrono::steady_clock::now()), ended_at_(started_at_) {}

    static std::vector<pid_t> cgroup_members(const CgroupController &cg) {
        std::vector<pid_t> pids;
        std::istringstream iss(detail::read_control(cg.path() + "/cgroup.procs"));
        pid_t pid;
        while (iss >> pid) pids.push_back(pid);
        return pids;
    }

    // 用户代码可能把目录改成不可写，删除前先恢复权限
    static void make_removable(const fs::path &root) {
        std::error_code ec;
        fs::permissions(root, fs::perms::owner_all, fs::perm_options::add, ec);
        for (fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec), end;
             !ec && it != end; it.increment(ec)) {
            std::error_code ignored;
            if (it->is_directory(ignored) && !it->is_symlink(ignored)) {
                fs::permissions(it->path(), fs::perms::owner_all, fs::perm_options::add, ignored);
            }
        }
    }

    void remove_dir(const std::string &dir) {
        if (dir.empty()) return;
        std::error_code ec;
        fs::remove_all(dir, ec);
        if (ec) {
            make_removable(dir);
            ec.clear();
            fs::remove_all(dir, ec);
        }
        if (ec) {
            XLOG_ERROR << "[" << id_ << "] cannot remove " << dir << ": " << ec.message();
        } else {
            XLOG_DEBUG << "[" << id_ << "] removed " << dir;
        }
    }

public:
    /**
     * @brief 生成从不重复的上下文 id
     */
    static std::string next_id() {
        return "ctx_" + std::to_string(getpid()) + "_" + std::to_string(++counter_);
    }

    /**
     * @brief 创建上下文和临时工作目录（mkdtemp，权限 0700）
     *
     * @param use_cgroup 为 true 且 CgroupManager 已初始化时创建独立 cgroup；
     *                   cgroup 创建失败只记录警告
     */
    static Result<std::unique_ptr<ExecutionContext>> acquire(const std::string &work_root,
                                                             const ExecutionLimits &limits,
                                                             bool use_cgroup) {
        std::string id = next_id();
        // 新根里按原路径绑定工作目录，路径中不能有符号链接
        std::error_code ec;
        fs::path root = fs::canonical(work_root, ec);
        if (ec) {
            return PYBOX_ERROR(ErrorCode::WORKDIR_FAILED, work_root + ": " + ec.message());
        }
        std::string tmpl = root.string() + "/pybox_" + id + "_XXXXXX";
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        if (mkdtemp(buf.data()) == nullptr) {
            return PYBOX_ERROR(ErrorCode::WORKDIR_FAILED,
                               "mkdtemp under " + root.string() + ": " + std::strerror(errno));
        }

        std::unique_ptr<ExecutionContext> ctx(new ExecutionContext(id, limits, buf.data()));

        auto &mgr = CgroupManager::instance();
        if (use_cgroup && mgr.is_initialized()) {
            auto cg = std::make_unique<CgroupController>(mgr.executions_parent(), id);
            Result<void> created = cg->create();
            if (created.ok()) {
                CgroupLimits cl;
                cl.memory_max = static_cast<uint64_t>(limits.memory_limit_kb) * 1024;
                cl.pids_max = static_cast<uint64_t>(limits.max_processes);
                created = cg->apply_limits(cl);
            }
            if (created.ok()) {
                ctx->cgroup_ = std::move(cg);
            } else {
                XLOG_WARN << "[" << id << "] running without cgroup: "
                          << created.error().to_string();
            }
        }

        XLOG_DEBUG << "[" << id << "] acquired " << ctx->work_dir_;
        return ctx;
    }

    ~ExecutionContext() {
        release();
    }

    ExecutionContext(const ExecutionContext&) = delete;
    ExecutionContext& operator=(const ExecutionContext&) = delete;

    const std::string& id() const { return id_; }
    const std::string& work_dir() const { return work_dir_; }
    const std::string& root_dir() const { return root_dir_; }

    /**
     * @brief 创建新根的挂载点；挂载只存在于子进程的 mount 命名空间，宿主上始终是空目录
     */
    Result<std::string> prepare_root() {
        if (!root_dir_.empty()) return root_dir_;
        std::string dir = work_dir_ + ".root";
        if (mkdir(dir.c_str(), 0700) != 0) {
            return PYBOX_ERROR(ErrorCode::WORKDIR_FAILED,
                               "mkdir " + dir + ": " + std::strerror(errno));
        }
        root_dir_ = dir;
        return root_dir_;
    }

    const ExecutionLimits& limits() const { return limits_; }
    CgroupController* cgroup() { return cgroup_.get(); }
    pid_t process_group() const { return process_group_; }

    void bind_process_group(pid_t pgid) { process_group_ = pgid; }

    void mark_started() { started_at_ = std::chrono::steady_clock::now(); }
    void mark_ended() { ended_at_ = std::chrono::steady_clock::now(); }

    int64_t elapsed_ms() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(ended_at_ - started_at_).count();
    }

    /**
     * @brief 杀死并回收该上下文的全部进程，可重复调用
     */
    void terminate() {
        std::vector<pid_t> escaped;
        if (cgroup_) {
            escaped = cgroup_members(*cgroup_);
            Result<void> killed = cgroup_->kill_all();
            if (!killed.ok()) {
                XLOG_WARN << "[" << id_ << "] " << killed.error().to_string();
            }
        }
        if (process_group_ > 0) {
            if (killpg(process_group_, SIGKILL) != 0 && errno != ESRCH) {
                XLOG_WARN << "[" << id_ << "] killpg(" << process_group_ << "): "
                          << std::strerror(errno);
            }
            // 只回收本进程组内的子进程，不影响并发的其它上下文
            while (true) {
                pid_t r = waitpid(-process_group_, nullptr, 0);
                if (r > 0) continue;
                if (r < 0 && errno == EINTR) continue;
                break;
            }
        }
        for (pid_t pid : escaped) {
            while (waitpid(pid, nullptr, 0) < 0 && errno == EINTR) {
            }
        }
    }

    /**
     * @brief 回收进程、cgroup 和工作目录，可重复调用
     */
    void release() {
        if (released_) return;
        released_ = true;

        terminate();
        if (cgroup_) {
            Result<void> destroyed = cgroup_->destroy();
            if (!destroyed.ok()) {
                XLOG_WARN << "[" << id_ << "] " << destroyed.error().to_string();
            }
            cgroup_.reset();
        }
        remove_dir(work_dir_);
        remove_dir(root_dir_);
        XLOG_DEBUG << "[" << id_ << "] released";
    }
};

inline std::atomic<uint64_t> ExecutionContext::counter_{0};

} // namespace sandbox
} // namespace pybox

#endif // PYBOX_SANDBOX_CONTEXT_H
