/**
 * @file sandbox.h
 * @brief 子进程执行器
 *
 * 在一个 ExecutionContext 里启动一个程序并等待结束：
 * - 子进程自成进程组，stdin 为 /dev/null，stdout/stderr 经管道捕获
 * - rlimit（地址空间、CPU、文件大小、core）、seccomp
 * - 可用时在独立的用户 / PID / mount / IPC / UTS（代码执行再加网络）命名空间中运行，
 *   新根只含系统目录的只读绑定、私有 /tmp 和本上下文的工作目录
 * - 墙钟超时后 SIGKILL 整个进程组
 * - exec 之前的失败通过 close-on-exec 错误管道报告给父进程
 *
 * fork 之后子进程只做系统调用：argv/envp、seccomp 程序都在父进程准备好。
 */

#ifndef PYBOX_SANDBOX_SANDBOX_H
#define PYBOX_SANDBOX_SANDBOX_H

#include <string>
#include <vector>
#include <chrono>
#include <cerrno>
#include <cstring>
#include <cstdint>
#include <algorithm>

#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>

#include "core/error.h"
#include "core/sandbox_logger.h"
#include "core/types.h"
#include "sandbox/cgroup.h"
#include "sandbox/context.h"
#include "sandbox/namespace.h"
#include "sandbox/seccomp.h"

namespace pybox {
namespace sandbox {

//==============================================================================
// 执行结果
//==============================================================================

enum class RunStatus {
    OK,
    RUNTIME_ERROR,      ///< 非零退出码
    KILLED_BY_SIGNAL,
    TIME_LIMIT,         ///< 墙钟超时
    CPU_LIMIT,
    MEMORY_LIMIT,
    OUTPUT_LIMIT,       ///< 写文件超过 RLIMIT_FSIZE
    PROCESS_LIMIT,
    SECCOMP_VIOLATION
};

inline const char* run_status_str(RunStatus status) {
    switch (status) {
        case RunStatus::OK: return "OK";
        case RunStatus::RUNTIME_ERROR: return "RUNTIME_ERROR";
        case RunStatus::KILLED_BY_SIGNAL: return "KILLED_BY_SIGNAL";
        case RunStatus::TIME_LIMIT: return "TIME_LIMIT";
        case RunStatus::CPU_LIMIT: return "CPU_LIMIT";
        case RunStatus::MEMORY_LIMIT: return "MEMORY_LIMIT";
        case RunStatus::OUTPUT_LIMIT: return "OUTPUT_LIMIT";
        case RunStatus::PROCESS_LIMIT: return "PROCESS_LIMIT";
        case RunStatus::SECCOMP_VIOLATION: return "SECCOMP_VIOLATION";
    }
    return "UNKNOWN";
}

inline std::ostream& operator<<(std::ostream &os, RunStatus status) {
    return os << run_status_str(status);
}

inline bool is_limit_breach(RunStatus status) {
    return status == RunStatus::CPU_LIMIT || status == RunStatus::MEMORY_LIMIT ||
           status == RunStatus::OUTPUT_LIMIT || status == RunStatus::PROCESS_LIMIT;
}

struct RawExecutionResult {
    std::string context_id;
    RunStatus status = RunStatus::OK;
    int exit_code = -1;
    int signal = 0;
    std::string stdout_data;
    std::string stderr_data;
    bool stdout_truncated = false;
    bool stderr_truncated = false;
    int64_t wall_time_ms = 0;
    int64_t cpu_time_ms = 0;
    int64_t memory_kb = 0;
    std::string message;
};

//==============================================================================
// 有界输出缓冲
//==============================================================================

/**
 * @brief 只保留开头和结尾的输出缓冲
 *
 * 超过上限时中间部分替换为截断标记。Python 的 traceback 在 stderr 末尾，
 * 保留结尾保证截断后仍能分类。
 */
class BoundedBuffer {
private:
    size_t head_cap_;
    size_t tail_cap_;
    std::string head_;
    std::string tail_;
    uint64_t total_ = 0;

public:
    explicit BoundedBuffer(size_t limit)
        : head_cap_(limit / 2), tail_cap_(limit - limit / 2) {}

    void append(const char *data, size_t n) {
        total_ += n;
        size_t to_head = std::min(n, head_cap_ - head_.size());
        head_.append(data, to_head);
        if (to_head == n) return;

        tail_.append(data + to_head, n - to_head);
        if (tail_.size() > 2 * tail_cap_) {
            tail_.erase(0, tail_.size() - tail_cap_);
        }
    }

    bool truncated() const { return total_ > head_cap_ + tail_cap_; }
    uint64_t total() const { return total_; }

    std::string str() const {
        if (!truncated()) return head_ + tail_;
        uint64_t dropped = total_ - head_cap_ - tail_cap_;
        return head_ + "\n... [" + std::to_string(dropped) + " bytes truncated] ...\n" +
               tail_.substr(tail_.size() - tail_cap_);
    }
};

//==============================================================================
// 配置
//==============================================================================

struct SandboxConfig {
    std::string program;                ///< 绝对路径
    std::vector<std::string> args;      ///< 不含 argv[0]
    std::vector<std::string> env;       ///< 完整环境，不继承父进程
    bool use_seccomp = true;
    bool block_inet = true;
    bool lock_session = true;           ///< 禁止 setsid / setpgid
    NamespaceOptions namespaces;

    SandboxConfig& set_program(const std::string &p) { program = p; return *this; }
    SandboxConfig& add_arg(const std::string &a) { args.push_back(a); return *this; }
    SandboxConfig& add_env(const std::string &k, const std::string &v) {
        env.push_back(k + "=" + v);
        return *this;
    }
};

//==============================================================================
// 执行器
//==============================================================================

class Sandbox {
private:
    /// 子进程通过错误管道报告的失败阶段
    enum ChildStage : int {
        STAGE_PDEATHSIG = 1,
        STAGE_STDIO,
        STAGE_NAMESPACE,
        STAGE_ROOTFS,
        STAGE_CHDIR,
        STAGE_RLIMIT,
        STAGE_SECCOMP,
        STAGE_EXEC
    };

    struct ChildReport {
        int stage;
        int err;
    };

    struct ChildPlan {
        std::vector<char*> argv;
        std::vector<char*> envp;
        SeccompFilter filter;
        NamespacePlan ns;
        int devnull = -1;
        int out_w = -1;
        int err_w = -1;
        int sync_r = -1;
        int report_w = -1;
    };

    const SandboxConfig &config_;
    ExecutionContext &ctx_;

    static const char* stage_str(int stage) {
        switch (stage) {
            case STAGE_PDEATHSIG: return "prctl(PR_SET_PDEATHSIG)";
            case STAGE_STDIO: return "stdio redirect";
            case STAGE_NAMESPACE: return "namespace setup";
            case STAGE_ROOTFS: return "root filesystem setup";
            case STAGE_CHDIR: return "chdir to working directory";
            case STAGE_RLIMIT: return "setrlimit";
            case STAGE_SECCOMP: return "seccomp";
            case STAGE_EXEC: return "execve";
        }
        return "child setup";
    }

    [[noreturn]] static void child_fail(int fd, int stage) {
        ChildReport rep{stage, errno};
        ssize_t n = write(fd, &rep, sizeof(rep));
        (void)n;
        _exit(127);
    }

    static bool set_limit(int resource, rlim_t soft, rlim_t hard) {
        struct rlimit rl;
        rl.rlim_cur = soft;
        rl.rlim_max = hard;
        return setrlimit(resource, &rl) == 0;
    }

    /**
     * @brief 子进程：只调用系统调用，任何失败都写入错误管道后退出
     */
    [[noreturn]] static void child_exec(ChildPlan &plan, const SandboxConfig &config,
                                        const ExecutionContext &ctx) {
        setpgid(0, 0);

        sigset_t all;
        sigemptyset(&all);
        sigprocmask(SIG_SETMASK, &all, nullptr);
        signal(SIGPIPE, SIG_DFL);

        // 父进程退出时一并结束
        if (prctl(PR_SET_PDEATHSIG, SIGKILL, 0, 0, 0) != 0) {
            child_fail(plan.report_w, STAGE_PDEATHSIG);
        }

        // 等父进程把自己加入 cgroup
        char go;
        while (read(plan.sync_r, &go, 1) < 0 && errno == EINTR) {
        }

        if (!enter_namespaces(plan.ns)) {
            child_fail(plan.report_w, STAGE_NAMESPACE);
        }

        if (dup2(plan.devnull, STDIN_FILENO) < 0 ||
            dup2(plan.out_w, STDOUT_FILENO) < 0 ||
            dup2(plan.err_w, STDERR_FILENO) < 0) {
            child_fail(plan.report_w, STAGE_STDIO);
        }

        if (!enter_rootfs(plan.ns)) {
            child_fail(plan.report_w, STAGE_ROOTFS);
        }

        if (chdir(ctx.work_dir().c_str()) != 0) {
            child_fail(plan.report_w, STAGE_CHDIR);
        }

        const ExecutionLimits &l = ctx.limits();
        rlim_t cpu = static_cast<rlim_t>((l.cpu_time_limit_ms + 999) / 1000);
        rlim_t mem = static_cast<rlim_t>(l.memory_limit_kb) * 1024;
        rlim_t fsize = static_cast<rlim_t>(l.max_file_size_kb) * 1024;
        if (!set_limit(RLIMIT_CPU, cpu, cpu + 1) ||
            !set_limit(RLIMIT_AS, mem, mem) ||
            !set_limit(RLIMIT_FSIZE, fsize, fsize) ||
            !set_limit(RLIMIT_CORE, 0, 0)) {
            child_fail(plan.report_w, STAGE_RLIMIT);
        }

        if (config.use_seccomp && !plan.filter.apply()) {
            child_fail(plan.report_w, STAGE_SECCOMP);
        }

        execve(config.program.c_str(), plan.argv.data(), plan.envp.data());
        child_fail(plan.report_w, STAGE_EXEC);
    }

    static void close_fd(int &fd) {
        if (fd >= 0) {
            close(fd);
            fd = -1;
        }
    }

    /**
     * @brief 把管道里当前可读的数据全部读入缓冲，返回 false 表示已到 EOF
     */
    static bool drain(int fd, BoundedBuffer &buf) {
        char chunk[16384];
        while (true) {
            ssize_t n = read(fd, chunk, sizeof(chunk));
            if (n > 0) {
                buf.append(chunk, static_cast<size_t>(n));
                continue;
            }
            if (n == 0) return false;
            if (errno == EINTR) continue;
            return errno == EAGAIN || errno == EWOULDBLOCK;
        }
    }

    /**
     * @brief 在 deadline 前读取输出，直到两个管道都关闭或 stop() 为真
     */
    template<typename StopFn>
    static void pump(int &out_r, int &err_r, BoundedBuffer &out, BoundedBuffer &err,
                     std::chrono::steady_clock::time_point deadline, StopFn stop) {
        while (out_r >= 0 || err_r >= 0) {
            if (stop()) return;
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline) return;

            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            int wait_ms = static_cast<int>(std::min<int64_t>(remaining.count() + 1, 20));

            struct pollfd fds[2];
            int n = 0;
            if (out_r >= 0) fds[n++] = {out_r, POLLIN, 0};
            if (err_r >= 0) fds[n++] = {err_r, POLLIN, 0};
            int ready = poll(fds, n, wait_ms);
            if (ready < 0 && errno != EINTR) return;
            if (ready <= 0) continue;

            for (int i = 0; i < n; ++i) {
                if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
                if (fds[i].fd == out_r) {
                    if (!drain(out_r, out)) close_fd(out_r);
                } else {
                    if (!drain(err_r, err)) close_fd(err_r);
                }
            }
        }
    }

    static bool child_exited(pid_t pid) {
        siginfo_t info;
        std::memset(&info, 0, sizeof(info));
        // WNOWAIT：进程保持僵尸状态，进程组 id 不会被复用
        if (waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT) != 0) {
            return errno == ECHILD;
        }
        return info.si_pid == pid;
    }

public:
    Sandbox(const SandboxConfig &config, ExecutionContext &ctx)
        : config_(config), ctx_(ctx) {}

    Result<RawExecutionResult> run() {
        RawExecutionResult result;
        result.context_id = ctx_.id();
        const ExecutionLimits &limits = ctx_.limits();

        ChildPlan plan;
        std::vector<std::string> argv_store;
        argv_store.push_back(config_.program);
        argv_store.insert(argv_store.end(), config_.args.begin(), config_.args.end());
        for (auto &a : argv_store) plan.argv.push_back(&a[0]);
        plan.argv.push_back(nullptr);
        std::vector<std::string> env_store = config_.env;
        for (auto &e : env_store) plan.envp.push_back(&e[0]);
        plan.envp.push_back(nullptr);
        plan.filter = create_execution_filter(config_.block_inet, config_.lock_session);
        plan.filter.build();
        plan.ns = plan_namespaces(config_.namespaces);

        int out_pipe[2] = {-1, -1};
        int err_pipe[2] = {-1, -1};
        int sync_pipe[2] = {-1, -1};
        int report_pipe[2] = {-1, -1};
        auto close_all = [&]() {
            for (int *p : {out_pipe, err_pipe, sync_pipe, report_pipe}) {
                close_fd(p[0]);
                close_fd(p[1]);
            }
            close_fd(plan.devnull);
        };

        plan.devnull = open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (plan.devnull < 0 ||
            pipe2(out_pipe, O_CLOEXEC) != 0 || pipe2(err_pipe, O_CLOEXEC) != 0 ||
            pipe2(sync_pipe, O_CLOEXEC) != 0 || pipe2(report_pipe, O_CLOEXEC) != 0) {
            int saved = errno;
            close_all();
            return PYBOX_ERROR(ErrorCode::PIPE_FAILED, std::strerror(saved));
        }
        plan.out_w = out_pipe[1];
        plan.err_w = err_pipe[1];
        plan.sync_r = sync_pipe[0];
        plan.report_w = report_pipe[1];

        ctx_.mark_started();
        auto start = std::chrono::steady_clock::now();

        pid_t pid = spawn_in_namespaces(plan.ns);
        if (pid < 0) {
            int saved = errno;
            close_all();
            return PYBOX_ERROR(ErrorCode::FORK_FAILED, std::strerror(saved));
        }
        if (pid == 0) {
            child_exec(plan, config_, ctx_);
        }

        // 父子都调用 setpgid，避免父进程在子进程设置前 killpg
        setpgid(pid, pid);
        ctx_.bind_process_group(pid);

        close_fd(out_pipe[1]);
        close_fd(err_pipe[1]);
        close_fd(sync_pipe[0]);
        close_fd(report_pipe[1]);
        close_fd(plan.devnull);

        if (CgroupController *cg = ctx_.cgroup()) {
            Result<void> added = cg->add_process(pid);
            if (!added.ok()) {
                XLOG_WARN << "[" << ctx_.id() << "] " << added.error().to_string();
            }
        }
        ssize_t w = write(sync_pipe[1], "x", 1);
        (void)w;  // 写失败说明子进程已退出，错误会从报告管道或退出状态体现
        close_fd(sync_pipe[1]);

        // exec 成功时报告管道因 O_CLOEXEC 关闭，读到 EOF
        ChildReport rep{0, 0};
        ssize_t got;
        while ((got = read(report_pipe[0], &rep, sizeof(rep))) < 0 && errno == EINTR) {
        }
        close_fd(report_pipe[0]);
        if (got == static_cast<ssize_t>(sizeof(rep))) {
            close_all();
            ctx_.terminate();
            ctx_.mark_ended();
            ErrorCode code = rep.stage == STAGE_CHDIR ? ErrorCode::WORKDIR_FAILED
                           : rep.stage == STAGE_EXEC ? ErrorCode::EXEC_FAILED
                           : ErrorCode::SYSTEM_ERROR;
            return PYBOX_ERROR(code, std::string(stage_str(rep.stage)) + " failed: " +
                                     std::strerror(rep.err) + " (" + config_.program + ")");
        }

        XLOG_DEBUG << "[" << ctx_.id() << "] started pid " << pid << ": " << config_.program;

        int out_r = out_pipe[0];
        int err_r = err_pipe[0];
        fcntl(out_r, F_SETFL, fcntl(out_r, F_GETFL) | O_NONBLOCK);
        fcntl(err_r, F_SETFL, fcntl(err_r, F_GETFL) | O_NONBLOCK);

        size_t cap = static_cast<size_t>(limits.max_output_bytes);
        BoundedBuffer out(cap), err(cap);
        auto deadline = start + std::chrono::milliseconds(limits.timeout_ms);

        bool exited = false;
        pump(out_r, err_r, out, err, deadline, [&]() {
            exited = child_exited(pid);
            return exited;
        });
        // 管道都关闭但进程还在运行：继续等到退出或超时
        while (!exited && std::chrono::steady_clock::now() < deadline) {
            exited = child_exited(pid);
            if (!exited) usleep(2000);
        }
        bool timed_out = !exited;

        // 结束仍在运行的后代，它们可能持有管道写端
        if (killpg(pid, SIGKILL) != 0 && errno != ESRCH) {
            XLOG_WARN << "[" << ctx_.id() << "] killpg: " << std::strerror(errno);
        }
        if (CgroupController *cg = ctx_.cgroup()) {
            Result<void> killed = cg->kill_all();
            (void)killed;  // 上下文释放时会再次尝试并记录
        }

        int status = 0;
        struct rusage usage;
        std::memset(&usage, 0, sizeof(usage));
        while (wait4(pid, &status, 0, &usage) < 0) {
            if (errno != EINTR) {
                int saved = errno;
                close_fd(out_r);
                close_fd(err_r);
                return PYBOX_ERROR(ErrorCode::WAIT_FAILED, std::strerror(saved));
            }
        }

        // setsid 逃逸的后代可能仍然持有管道，排空时间有限
        auto drain_deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(200);
        pump(out_r, err_r, out, err, drain_deadline, []() { return false; });
        close_fd(out_r);
        close_fd(err_r);

        ctx_.mark_ended();
        result.wall_time_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        result.cpu_time_ms = usage.ru_utime.tv_sec * 1000 + usage.ru_utime.tv_usec / 1000 +
                             usage.ru_stime.tv_sec * 1000 + usage.ru_stime.tv_usec / 1000;
        result.memory_kb = usage.ru_maxrss;
        result.stdout_data = out.str();
        result.stderr_data = err.str();
        result.stdout_truncated = out.truncated();
        result.stderr_truncated = err.truncated();

        CgroupStats cg_stats;
        if (CgroupController *cg = ctx_.cgroup()) {
            cg_stats = cg->stats();
            if (cg_stats.memory_peak > 0) {
                result.memory_kb = static_cast<int64_t>(cg_stats.memory_peak / 1024);
            }
        }

        analyze(result, status, timed_out, cg_stats, limits);

        XLOG_INFO << "[" << ctx_.id() << "] " << run_status_str(result.status)
                  << " exit=" << result.exit_code << " signal=" << result.signal
                  << " wall=" << result.wall_time_ms << "ms cpu=" << result.cpu_time_ms
                  << "ms mem=" << result.memory_kb << "KB";
        return result;
    }

    /**
     * @brief 根据等待状态和资源统计判定运行结果
     */
    static void analyze(RawExecutionResult &result, int status, bool timed_out,
                        const CgroupStats &cg, const ExecutionLimits &limits) {
        if (WIFEXITED(status)) {
            result.exit_code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            result.signal = WTERMSIG(status);
        }

        if (timed_out) {
            result.status = RunStatus::TIME_LIMIT;
            result.message = "wall clock limit of " + std::to_string(limits.timeout_ms) +
                             "ms exceeded";
            return;
        }
        if (cg.oom_killed) {
            result.status = RunStatus::MEMORY_LIMIT;
            result.message = "killed by the out-of-memory handler";
            return;
        }

        if (WIFEXITED(status)) {
            if (result.exit_code == 0) {
                result.status = RunStatus::OK;
            } else if (cg.pids_limited) {
                result.status = RunStatus::PROCESS_LIMIT;
                result.message = "process limit of " + std::to_string(limits.max_processes) +
                                 " reached";
            } else {
                result.status = RunStatus::RUNTIME_ERROR;
                result.message = "exit code " + std::to_string(result.exit_code);
            }
            return;
        }

        switch (result.signal) {
            case SIGXCPU:
                result.status = RunStatus::CPU_LIMIT;
                result.message = "CPU time limit exceeded";
                break;
            case SIGKILL:
                if (result.cpu_time_ms >= limits.cpu_time_limit_ms) {
                    result.status = RunStatus::CPU_LIMIT;
                    result.message = "CPU time limit exceeded";
                } else if (result.memory_kb >= limits.memory_limit_kb) {
                    result.status = RunStatus::MEMORY_LIMIT;
                    result.message = "memory limit exceeded";
                } else {
                    result.status = RunStatus::KILLED_BY_SIGNAL;
                    result.message = "killed by signal " + std::to_string(result.signal);
                }
                break;
            case SIGXFSZ:
                result.status = RunStatus::OUTPUT_LIMIT;
                result.message = "file size limit exceeded";
                break;
            case SIGSYS:
                result.status = RunStatus::SECCOMP_VIOLATION;
                result.message = "blocked system call";
                break;
            default:
                result.status = RunStatus::KILLED_BY_SIGNAL;
                result.message = std::string("killed by signal ") +
                                 std::to_string(result.signal) + " (" +
                                 strsignal(result.signal) + ")";
        }
    }
};

inline void check_sandbox_features() {
    SLOG_INFO << "=== Sandbox Feature Check ===";
    SLOG_INFO << "seccomp-bpf: available (kernel 3.5+)";
    if (is_cgroup_v2_available()) {
        SLOG_INFO << "cgroups v2: available";
    } else {
        SLOG_WARN << "cgroups v2: not available, memory/pids accounting falls back to rlimit";
    }
    if (is_namespace_available()) {
        SLOG_INFO << "namespaces (user, pid, mount, net): available";
    } else {
        SLOG_WARN << "namespaces: not available, relying on seccomp filter and process groups";
    }
}

} // namespace sandbox
} // namespace pybox

#endif // PYBOX_SANDBOX_SANDBOX_H
