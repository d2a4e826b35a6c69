/**
 * @file namespace.h
 * @brief 命名空间隔离
 *
 * 子进程由 clone 直接创建在新的 PID / mount / IPC / UTS 命名空间中，代码执行时
 * 再加网络命名空间（只有未启用的 lo）。非 root 时同时创建用户命名空间，并把
 * 自身 uid/gid 映射为同一值。
 *
 * 子进程是新 PID 命名空间的 1 号进程：它退出或被杀死时内核结束命名空间内的
 * 全部进程，setsid 之后的后代也不例外。
 *
 * 文件系统：新根是一个 tmpfs，系统目录只读绑定，/tmp 是私有 tmpfs，只有本上下文
 * 的工作目录以原路径读写绑定进来，然后 pivot_root（失败时 chroot）。
 *
 * fork 之后子进程只能调用异步信号安全的函数，所以全部路径和映射内容在父进程里
 * 提前准备好（NamespacePlan），子进程只做系统调用。
 */

#ifndef PYBOX_SANDBOX_NAMESPACE_H
#define PYBOX_SANDBOX_NAMESPACE_H

#include <set>
#include <string>
#include <vector>
#include <cerrno>
#include <climits>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <sched.h>
#include <signal.h>
#include <fcntl.h>
#include <unistd.h>
#include <sys/mount.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <sys/wait.h>

#include "core/utils.h"

namespace pybox {
namespace sandbox {

//==============================================================================
// 挂载点
//==============================================================================

enum class MountType {
    DIR,        ///< 创建目录（已存在不算错误）
    FILE,       ///< 创建空文件，作为设备文件的绑定点
    SYMLINK,    ///< 还原宿主上的符号链接，如 /bin -> usr/bin
    TMPFS,
    BIND,
    BIND_RO,
    PROC
};

struct MountPoint {
    MountType type;
    std::string target;         ///< 新根下的完整路径（已带根前缀）
    std::string source;         ///< BIND: 宿主路径；SYMLINK: 链接内容；TMPFS: 挂载选项
    unsigned long flags = 0;    ///< BIND_RO 重新挂载时需要保留的原挂载标志
    bool optional = false;      ///< 失败时跳过

    static MountPoint dir(const std::string &target) {
        return {MountType::DIR, target, "", 0, false};
    }
    static MountPoint file(const std::string &target) {
        return {MountType::FILE, target, "", 0, false};
    }
    static MountPoint symlink(const std::string &content, const std::string &target) {
        return {MountType::SYMLINK, target, content, 0, false};
    }
    static MountPoint tmpfs(const std::string &target, const std::string &options) {
        return {MountType::TMPFS, target, options, 0, false};
    }
    static MountPoint bind(const std::string &source, const std::string &target) {
        return {MountType::BIND, target, source, 0, false};
    }
    static MountPoint bind_ro(const std::string &source, const std::string &target,
                              unsigned long flags) {
        return {MountType::BIND_RO, target, source, flags, false};
    }
    static MountPoint proc(const std::string &target) {
        // 容器里 /proc 有遮蔽路径时内核拒绝新挂载，此时新根里没有 /proc
        return {MountType::PROC, target, "", 0, true};
    }
};

//==============================================================================
// 计划
//==============================================================================

/**
 * @brief 一次执行需要的隔离
 */
struct NamespaceOptions {
    bool enabled = false;
    bool network = false;                   ///< 新网络命名空间，无外网
    std::string root;                       ///< 新根的挂载点，为空时共享宿主文件系统
    std::string work_dir;                   ///< 以原路径读写绑定
    std::vector<std::string> read_only;     ///< 额外只读绑定（解释器前缀等）
    std::vector<std::string> writable;      ///< 额外读写绑定（安装目标）
    bool writable_system = false;           ///< 系统目录（/etc 除外）读写绑定，安装到解释器环境
    int64_t tmp_size_kb = 64 * 1024;
};

struct NamespacePlan {
    int clone_flags = 0;        ///< 0 表示普通 fork
    bool as_root = false;
    std::string uid_map;
    std::string gid_map;
    std::string root;
    std::vector<MountPoint> mounts;
};

namespace detail {

inline const std::vector<std::string>& system_dirs() {
    static const std::vector<std::string> dirs = {
        "/usr", "/bin", "/sbin", "/lib", "/lib32", "/lib64", "/libx32", "/etc"
    };
    return dirs;
}

inline const std::vector<std::string>& device_files() {
    static const std::vector<std::string> devices = {
        "/dev/null", "/dev/zero", "/dev/full", "/dev/random", "/dev/urandom"
    };
    return devices;
}

/**
 * @brief 宿主挂载上已有的标志；用户命名空间里只读重挂载必须带上它们
 */
inline unsigned long locked_mount_flags(const std::string &path) {
    struct statvfs st;
    if (statvfs(path.c_str(), &st) != 0) return 0;
    unsigned long flags = 0;
    if (st.f_flag & ST_NOSUID) flags |= MS_NOSUID;
    if (st.f_flag & ST_NODEV) flags |= MS_NODEV;
    if (st.f_flag & ST_NOEXEC) flags |= MS_NOEXEC;
    if (st.f_flag & ST_NOATIME) flags |= MS_NOATIME;
    if (st.f_flag & ST_NODIRATIME) flags |= MS_NODIRATIME;
    if (st.f_flag & ST_RELATIME) flags |= MS_RELATIME;
    return flags;
}

inline std::string canonical_path(const std::string &path) {
    char buf[PATH_MAX];
    if (realpath(path.c_str(), buf) == nullptr) return "";
    return buf;
}

inline bool under(const std::string &path, const std::string &dir) {
    return path == dir || starts_with(path, dir + "/");
}

/**
 * @brief 在父进程中拼装挂载序列
 */
class RootfsBuilder {
private:
    std::string root_;
    std::vector<MountPoint> mounts_;
    std::set<std::string> created_;
    std::vector<std::string> bound_;     ///< 已绑定的宿主路径（规范化后）

    void make_parents(const std::string &path) {
        size_t pos = 0;
        while ((pos = path.find('/', pos + 1)) != std::string::npos) {
            make_dir(path.substr(0, pos));
        }
    }

    void make_dir(const std::string &path) {
        if (created_.insert(path).second) {
            mounts_.push_back(MountPoint::dir(root_ + path));
        }
    }

public:
    explicit RootfsBuilder(const std::string &root) : root_(root) {
        mounts_.push_back(MountPoint::tmpfs(root_, "mode=0755,size=1m"));
    }

    bool covered(const std::string &path) const {
        for (const auto &b : bound_) {
            if (under(path, b)) return true;
        }
        return false;
    }

    /**
     * @brief 以原路径绑定宿主目录；顶层符号链接原样重建
     */
    void bind(const std::string &path, bool read_only) {
        struct stat st;
        if (lstat(path.c_str(), &st) != 0) return;

        if (S_ISLNK(st.st_mode)) {
            char buf[PATH_MAX];
            ssize_t n = readlink(path.c_str(), buf, sizeof(buf) - 1);
            if (n <= 0) return;
            make_parents(path);
            mounts_.push_back(MountPoint::symlink(std::string(buf, static_cast<size_t>(n)),
                                                  root_ + path));
            return;
        }
        if (!S_ISDIR(st.st_mode)) return;

        // 可写绑定总是叠在已有只读绑定之上
        std::string canonical = canonical_path(path);
        if (canonical.empty() || (read_only && covered(canonical))) return;

        make_parents(canonical);
        make_dir(canonical);
        if (read_only) {
            mounts_.push_back(MountPoint::bind_ro(canonical, root_ + canonical,
                                                  locked_mount_flags(canonical)));
        } else {
            mounts_.push_back(MountPoint::bind(canonical, root_ + canonical));
        }
        bound_.push_back(canonical);
    }

    void devices() {
        make_dir("/dev");
        for (const auto &dev : device_files()) {
            if (access(dev.c_str(), F_OK) != 0) continue;
            mounts_.push_back(MountPoint::file(root_ + dev));
            mounts_.push_back(MountPoint::bind(dev, root_ + dev));
        }
        make_dir("/dev/shm");
        mounts_.push_back(MountPoint::tmpfs(root_ + "/dev/shm", "mode=1777,size=16m"));
    }

    void tmp(int64_t size_kb) {
        make_dir("/tmp");
        mounts_.push_back(MountPoint::tmpfs(root_ + "/tmp",
                                            "mode=1777,size=" + std::to_string(size_kb) + "k"));
    }

    void proc() {
        make_dir("/proc");
        mounts_.push_back(MountPoint::proc(root_ + "/proc"));
    }

    std::vector<MountPoint> take() { return std::move(mounts_); }
};

inline bool write_proc_self(const char *file, const std::string &content) {
    int fd = open(file, O_WRONLY | O_CLOEXEC);
    if (fd < 0) return false;
    ssize_t n = write(fd, content.data(), content.size());
    close(fd);
    return n == static_cast<ssize_t>(content.size());
}

inline bool apply_mount(const MountPoint &mp) {
    const char *target = mp.target.c_str();
    switch (mp.type) {
        case MountType::DIR:
            return mkdir(target, 0755) == 0 || errno == EEXIST;

        case MountType::FILE: {
            int fd = open(target, O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
            if (fd < 0) return false;
            close(fd);
            return true;
        }

        case MountType::SYMLINK:
            return ::symlink(mp.source.c_str(), target) == 0 || errno == EEXIST;

        case MountType::TMPFS:
            return mount("tmpfs", target, "tmpfs", MS_NOSUID | MS_NODEV, mp.source.c_str()) == 0;

        case MountType::BIND:
            return mount(mp.source.c_str(), target, nullptr, MS_BIND | MS_REC, nullptr) == 0;

        case MountType::BIND_RO:
            if (mount(mp.source.c_str(), target, nullptr, MS_BIND | MS_REC, nullptr) != 0) {
                return false;
            }
            return mount(nullptr, target, nullptr,
                         MS_BIND | MS_REMOUNT | MS_RDONLY | mp.flags, nullptr) == 0;

        case MountType::PROC:
            return mount("proc", target, "proc", MS_NOSUID | MS_NODEV | MS_NOEXEC, nullptr) == 0;
    }
    return false;
}

} // namespace detail

/**
 * @brief 在父进程中准备命名空间和新根
 */
inline NamespacePlan plan_namespaces(const NamespaceOptions &opt) {
    NamespacePlan plan;
    if (!opt.enabled) return plan;

    plan.as_root = geteuid() == 0;
    plan.uid_map = std::to_string(geteuid()) + " " + std::to_string(geteuid()) + " 1\n";
    plan.gid_map = std::to_string(getegid()) + " " + std::to_string(getegid()) + " 1\n";
    plan.clone_flags = CLONE_NEWNS | CLONE_NEWPID | CLONE_NEWIPC | CLONE_NEWUTS;
    if (opt.network) plan.clone_flags |= CLONE_NEWNET;
    if (!plan.as_root) plan.clone_flags |= CLONE_NEWUSER;

    if (opt.root.empty()) return plan;

    detail::RootfsBuilder rootfs(opt.root);
    for (const auto &dir : detail::system_dirs()) {
        rootfs.bind(dir, dir == "/etc" || !opt.writable_system);
    }
    rootfs.devices();
    rootfs.tmp(opt.tmp_size_kb);
    for (const auto &dir : opt.read_only) {
        rootfs.bind(dir, true);
    }
    for (const auto &dir : opt.writable) {
        rootfs.bind(dir, false);
    }
    rootfs.bind(opt.work_dir, false);
    rootfs.proc();

    plan.root = opt.root;
    plan.mounts = rootfs.take();
    return plan;
}

/**
 * @brief 按计划 clone 子进程；clone_flags 为 0 时等同 fork
 */
inline pid_t spawn_in_namespaces(const NamespacePlan &plan) {
    if (plan.clone_flags == 0) return fork();
    return static_cast<pid_t>(
        syscall(SYS_clone, plan.clone_flags | SIGCHLD, nullptr, nullptr, nullptr, 0));
}

/**
 * @brief 在子进程中调用：写入 uid/gid 映射、设置主机名，失败返回 false（errno 有效）
 */
inline bool enter_namespaces(const NamespacePlan &plan) {
    if (plan.clone_flags == 0) return true;
    if (!plan.as_root) {
        if (!detail::write_proc_self("/proc/self/setgroups", "deny") ||
            !detail::write_proc_self("/proc/self/uid_map", plan.uid_map) ||
            !detail::write_proc_self("/proc/self/gid_map", plan.gid_map)) {
            return false;
        }
    }
    static const char hostname[] = "pybox";
    return sethostname(hostname, sizeof(hostname) - 1) == 0;
}

/**
 * @brief 在子进程中调用：挂载新根并切换过去，失败返回 false（errno 有效）
 */
inline bool enter_rootfs(const NamespacePlan &plan) {
    if (plan.root.empty()) return true;
    if (mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) != 0) {
        return false;
    }
    for (const auto &mp : plan.mounts) {
        if (!detail::apply_mount(mp) && !mp.optional) return false;
    }
    if (chdir(plan.root.c_str()) != 0) {
        return false;
    }
    if (syscall(SYS_pivot_root, ".", ".") == 0) {
        // 旧根叠在新根下面，分离后不可再访问
        if (umount2(".", MNT_DETACH) != 0) return false;
    } else if (chroot(".") != 0) {
        return false;
    }
    return chdir("/") == 0;
}

/**
 * @brief 探测当前环境能否创建完整的命名空间（含新根所需的挂载操作）
 *
 * 结果在进程内缓存。
 */
inline bool is_namespace_available() {
    static const bool available = []() {
        NamespaceOptions opt;
        opt.enabled = true;
        opt.network = true;
        NamespacePlan plan = plan_namespaces(opt);
        unsigned long usr_flags = detail::locked_mount_flags("/usr");

        pid_t pid = spawn_in_namespaces(plan);
        if (pid < 0) {
            return false;
        }
        if (pid == 0) {
            if (!enter_namespaces(plan) ||
                mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) != 0 ||
                mount("tmpfs", "/tmp", "tmpfs", MS_NOSUID | MS_NODEV, "size=16k") != 0 ||
                mount("/usr", "/usr", nullptr, MS_BIND | MS_REC, nullptr) != 0 ||
                mount(nullptr, "/usr", nullptr,
                      MS_BIND | MS_REMOUNT | MS_RDONLY | usr_flags, nullptr) != 0) {
                _exit(1);
            }
            _exit(0);
        }
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        return WIFEXITED(status) && WEXITSTATUS(status) == 0;
    }();
    return available;
}

} // namespace sandbox
} // namespace pybox

#endif // PYBOX_SANDBOX_NAMESPACE_H
