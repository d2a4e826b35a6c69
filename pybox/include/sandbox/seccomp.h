/**
 * @file seccomp.h
 * @brief seccomp-bpf 系统调用过滤
 *
 * 解释器和 pip 需要的系统调用面很大，白名单维护成本过高，因此这里采用
 * 黑名单：默认放行，只拦截网络套接字和少数可用于逃逸或影响宿主的调用。
 * 被拦截的调用返回错误码而不是杀进程，用户代码会看到普通的 Python 异常。
 */

#ifndef PYBOX_SANDBOX_SECCOMP_H
#define PYBOX_SANDBOX_SECCOMP_H

#include <vector>
#include <cstdint>
#include <cstddef>
#include <cerrno>

#include <sys/prctl.h>
#include <sys/socket.h>
#include <sys/syscall.h>
#include <linux/seccomp.h>
#include <linux/filter.h>
#include <linux/audit.h>

namespace pybox {
namespace sandbox {

enum class SeccompAction {
    ALLOW,
    KILL,
    ERRNO
};

/**
 * @brief 参数条件，只比较参数的低 32 位
 */
struct ArgCondition {
    unsigned int arg_index;
    uint32_t value;
    uint32_t mask;      ///< 0 表示全等比较
};

struct SeccompRule {
    int syscall_nr;
    SeccompAction action;
    int errno_val;
    std::vector<ArgCondition> conditions;   ///< 全部满足才命中

    SeccompRule(int nr, SeccompAction act, int err = 0)
        : syscall_nr(nr), action(act), errno_val(err) {}

    SeccompRule& when(unsigned int arg, uint32_t value) {
        conditions.push_back({arg, value, 0});
        return *this;
    }
};

struct BPF {
    static sock_filter stmt(uint16_t code, uint32_t k) {
        return {code, 0, 0, k};
    }

    static sock_filter jump(uint16_t code, uint32_t k, uint8_t jt, uint8_t jf) {
        return {code, jt, jf, k};
    }

    static sock_filter load_syscall_nr() {
        return stmt(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, nr));
    }

    static sock_filter load_arch() {
        return stmt(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, arch));
    }

    static sock_filter load_arg_lo(unsigned int arg) {
#if __BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__
        return stmt(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, args) + arg * 8);
#else
        return stmt(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, args) + arg * 8 + 4);
#endif
    }

    static sock_filter ret(uint32_t action) {
        return stmt(BPF_RET | BPF_K, action);
    }
};

/**
 * @brief 黑名单过滤器
 *
 * 程序结构：架构检查 -> (x86_64) 拒绝 x32 调用号 -> 逐条规则 -> 默认放行。
 * 每条规则是一个独立块：比较调用号，不等则跳过整块；随后依次检查参数，
 * 任一不满足也跳过整块；全部满足时返回该规则的动作。
 */
class SeccompFilter {
private:
    std::vector<SeccompRule> rules_;
    std::vector<sock_filter> program_;

#if defined(__x86_64__)
    static constexpr uint32_t NATIVE_AUDIT_ARCH = AUDIT_ARCH_X86_64;
#elif defined(__aarch64__)
    static constexpr uint32_t NATIVE_AUDIT_ARCH = AUDIT_ARCH_AARCH64;
#else
    #error "Unsupported architecture"
#endif

    static uint32_t to_ret(SeccompAction action, int errno_val) {
        switch (action) {
            case SeccompAction::ALLOW: return SECCOMP_RET_ALLOW;
            case SeccompAction::ERRNO: return SECCOMP_RET_ERRNO | (errno_val & SECCOMP_RET_DATA);
            case SeccompAction::KILL:
            default: return SECCOMP_RET_KILL_PROCESS;
        }
    }

    void emit_rule(const SeccompRule &rule) {
        size_t body = 1;
        for (const auto &c : rule.conditions) {
            body += c.mask ? 3 : 2;
        }

        program_.push_back(BPF::load_syscall_nr());
        program_.push_back(BPF::jump(BPF_JMP | BPF_JEQ | BPF_K,
                                     static_cast<uint32_t>(rule.syscall_nr),
                                     0, static_cast<uint8_t>(body)));
        size_t used = 0;
        for (const auto &c : rule.conditions) {
            program_.push_back(BPF::load_arg_lo(c.arg_index));
            ++used;
            if (c.mask) {
                program_.push_back(BPF::stmt(BPF_ALU | BPF_AND | BPF_K, c.mask));
                ++used;
            }
            ++used;
            program_.push_back(BPF::jump(BPF_JMP | BPF_JEQ | BPF_K, c.value,
                                         0, static_cast<uint8_t>(body - used)));
        }
        program_.push_back(BPF::ret(to_ret(rule.action, rule.errno_val)));
    }

public:
    SeccompFilter& add(const SeccompRule &rule) {
        rules_.push_back(rule);
        return *this;
    }

    SeccompFilter& deny(int syscall_nr, int errno_val = EPERM) {
        return add(SeccompRule(syscall_nr, SeccompAction::ERRNO, errno_val));
    }

    void build() {
        program_.clear();

        program_.push_back(BPF::load_arch());
        program_.push_back(BPF::jump(BPF_JMP | BPF_JEQ | BPF_K, NATIVE_AUDIT_ARCH, 1, 0));
        program_.push_back(BPF::ret(SECCOMP_RET_KILL_PROCESS));

#if defined(__x86_64__)
        program_.push_back(BPF::load_syscall_nr());
        program_.push_back(BPF::jump(BPF_JMP | BPF_JGE | BPF_K, 0x40000000u, 0, 1));
        program_.push_back(BPF::ret(SECCOMP_RET_ERRNO | ENOSYS));
#endif

        for (const auto &rule : rules_) {
            emit_rule(rule);
        }
        program_.push_back(BPF::ret(SECCOMP_RET_ALLOW));
    }

    /**
     * @brief 安装到当前进程（在子进程 exec 前调用），失败时 errno 有效
     */
    bool apply() {
        if (program_.empty()) build();

        if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) < 0) {
            return false;
        }
        struct sock_fprog prog;
        prog.len = static_cast<unsigned short>(program_.size());
        prog.filter = program_.data();
        return prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, &prog) == 0;
    }

    size_t size() const { return program_.size(); }
    size_t rule_count() const { return rules_.size(); }

    /// 是否有无条件拒绝该系统调用的规则
    bool blocks(int syscall_nr) const {
        for (const auto &rule : rules_) {
            if (rule.syscall_nr == syscall_nr && rule.conditions.empty() &&
                rule.action != SeccompAction::ALLOW) {
                return true;
            }
        }
        return false;
    }
};

//==============================================================================
// 预置过滤器
//==============================================================================

/**
 * @brief 执行用户代码和安装器时的过滤器
 *
 * @param block_inet   为 true 时 AF_INET / AF_INET6 套接字返回 EACCES（代码执行）；
 *                     安装器需要访问包索引，传 false。AF_PACKET 始终拒绝。
 * @param lock_session 为 true 时 setsid / setpgid 返回 EPERM，后代无法离开进程组。
 *                     子进程在安装过滤器之前已经自成进程组。
 *
 * io_uring 始终拒绝：IORING_OP_SOCKET 不经过 socket(2)，会绕开上面的地址族规则。
 */
inline SeccompFilter create_execution_filter(bool block_inet, bool lock_session = false) {
    SeccompFilter filter;

    if (block_inet) {
        filter.add(SeccompRule(__NR_socket, SeccompAction::ERRNO, EACCES).when(0, AF_INET));
        filter.add(SeccompRule(__NR_socket, SeccompAction::ERRNO, EACCES).when(0, AF_INET6));
    }
    filter.add(SeccompRule(__NR_socket, SeccompAction::ERRNO, EACCES).when(0, AF_PACKET));

    for (int nr : {
             __NR_ptrace, __NR_mount, __NR_umount2, __NR_pivot_root, __NR_chroot,
             __NR_setns, __NR_unshare, __NR_kexec_load, __NR_init_module,
             __NR_finit_module, __NR_delete_module, __NR_reboot, __NR_swapon,
             __NR_swapoff, __NR_bpf, __NR_perf_event_open, __NR_keyctl,
             __NR_add_key, __NR_request_key, __NR_process_vm_readv,
             __NR_process_vm_writev, __NR_userfaultfd, __NR_io_uring_setup,
             __NR_io_uring_enter, __NR_io_uring_register}) {
        filter.deny(nr);
    }
    if (lock_session) {
        filter.deny(__NR_setsid).deny(__NR_setpgid);
    }
    return filter;
}

} // namespace sandbox
} // namespace pybox

#endif // PYBOX_SANDBOX_SECCOMP_H
