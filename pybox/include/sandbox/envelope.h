/**
 * @file envelope.h
 * @brief 执行封套
 *
 * 把一个已通过策略的请求变成一次受限的子进程执行：
 * 代码请求写入 main.py 后用解释器运行；安装请求运行 pip，
 * 索引地址固定为配置的 registry。每次执行独占一个 ExecutionContext，
 * 返回前上下文已经回收。
 *
 * 命名空间可用时每次执行有自己的根文件系统：系统目录和解释器前缀只读，
 * /tmp 私有，只有本次的工作目录可写；安装请求另外可写安装目标
 * （未配置目标时可写解释器环境）。
 */

#ifndef PYBOX_SANDBOX_ENVELOPE_H
#define PYBOX_SANDBOX_ENVELOPE_H

#include <algorithm>
#include <filesystem>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

#include "core/config.h"
#include "core/error.h"
#include "core/sandbox_logger.h"
#include "core/types.h"
#include "core/utils.h"
#include "sandbox/context.h"
#include "sandbox/namespace.h"
#include "sandbox/sandbox.h"

namespace pybox {
namespace sandbox {

/**
 * @brief 执行层接口，协调器通过它执行请求（测试中可替换）
 */
class Envelope {
public:
    virtual ~Envelope() = default;

    /**
     * @brief 执行请求
     *
     * decision 不是 ALLOW 时拒绝执行。只有沙箱自身的故障返回错误，
     * 用户代码的任何结果（包括超时、超限）都是正常返回值。
     */
    virtual Result<RawExecutionResult> run(const ValidatedRequest &request,
                                           const PolicyDecision &decision) = 0;
};

class ExecutionEnvelope : public Envelope {
private:
    static constexpr const char* SCRIPT_NAME = "main.py";
    static constexpr const char* SAFE_PATH = "/usr/local/bin:/usr/bin:/bin";

    ExecutionSettings settings_;
    std::string python_;
    bool namespaces_ = false;
    std::vector<std::string> python_prefixes_;
    std::string resolver_dir_;      ///< /etc/resolv.conf 指向 /etc 之外时的所在目录

    static std::string parent_of(const std::string &path) {
        return std::filesystem::path(path).parent_path().string();
    }

    /// 解释器前缀：符号链接本身所在的前缀（venv）和解析后的前缀
    void collect_python_prefixes() {
        std::error_code ec;
        for (const std::string &bin : {parent_of(python_),
                                       parent_of(std::filesystem::canonical(python_, ec).string())}) {
            if (bin.empty()) continue;
            std::string prefix = parent_of(std::filesystem::weakly_canonical(bin, ec).string());
            if (ec || prefix.empty() || prefix == "/") continue;
            if (std::find(python_prefixes_.begin(), python_prefixes_.end(), prefix) ==
                python_prefixes_.end()) {
                python_prefixes_.push_back(prefix);
            }
        }
        std::string resolv = std::filesystem::canonical("/etc/resolv.conf", ec).string();
        if (!ec && resolv.compare(0, 5, "/etc/") != 0) {
            resolver_dir_ = parent_of(resolv);
        }
    }

    Result<NamespaceOptions> plan_isolation(const ValidatedRequest &request,
                                            const ExecutionLimits &limits,
                                            ExecutionContext &ctx) const {
        NamespaceOptions ns;
        if (!namespaces_) return ns;

        bool code = request.kind() == RequestKind::CODE;
        ns.enabled = true;
        ns.network = code && settings_.isolate_network;
        if (!settings_.isolate_filesystem) return ns;

        Result<std::string> root = ctx.prepare_root();
        if (!root.ok()) return root.error();
        ns.root = root.value();
        ns.work_dir = ctx.work_dir();
        ns.tmp_size_kb = std::max<int64_t>(limits.max_file_size_kb, 1024);
        ns.read_only = python_prefixes_;

        const std::string &target = settings_.pip.target;
        std::error_code ec;
        if (code) {
            if (!target.empty() && std::filesystem::is_directory(target, ec)) {
                ns.read_only.push_back(target);
            }
            return ns;
        }
        if (!resolver_dir_.empty()) ns.read_only.push_back(resolver_dir_);
        if (target.empty()) {
            ns.writable_system = true;
            return ns;
        }
        std::filesystem::create_directories(target, ec);
        if (ec) {
            return PYBOX_ERROR(ErrorCode::WORKDIR_FAILED,
                               "cannot create install target " + target + ": " + ec.message());
        }
        ns.writable.push_back(target);
        return ns;
    }

    std::string package_spec(const ValidatedRequest &request) const {
        if (!request.version) return request.payload();
        return request.payload() + "==" + *request.version;
    }

    void build_command(const ValidatedRequest &request, SandboxConfig &config) const {
        config.set_program(python_);
        if (request.kind() == RequestKind::CODE) {
            config.add_arg("-B").add_arg("-u").add_arg(SCRIPT_NAME);
            return;
        }
        const PipSettings &pip = settings_.pip;
        config.add_arg("-m").add_arg("pip").add_arg("install")
              .add_arg("--no-cache-dir")
              .add_arg("--disable-pip-version-check")
              .add_arg("--no-input")
              .add_arg("--retries").add_arg(std::to_string(pip.retries))
              .add_arg("--timeout").add_arg(std::to_string(pip.timeout_s))
              .add_arg("--index-url").add_arg(pip.index_url);
        if (!pip.target.empty()) {
            config.add_arg("--target").add_arg(pip.target);
        }
        config.add_arg(package_spec(request));
    }

    void build_environment(const ExecutionContext &ctx, SandboxConfig &config) const {
        config.add_env("PATH", SAFE_PATH)
              .add_env("HOME", ctx.work_dir())
              .add_env("TMPDIR", ctx.work_dir())
              .add_env("LANG", "C.UTF-8")
              .add_env("PYTHONDONTWRITEBYTECODE", "1")
              .add_env("PIP_CONFIG_FILE", "/dev/null");
        if (!settings_.pip.target.empty()) {
            config.add_env("PYTHONPATH", settings_.pip.target);
        }
    }

public:
    explicit ExecutionEnvelope(const ExecutionSettings &settings)
        : settings_(settings) {
        python_ = settings_.python;
        if (python_.find('/') == std::string::npos) {
            python_ = find_executable(python_);
        }
        if (settings_.isolate_network || settings_.isolate_filesystem) {
            namespaces_ = is_namespace_available();
            if (!namespaces_) {
                XLOG_WARN << "namespaces unavailable, executions share the host filesystem "
                             "and rely on the seccomp filter";
            }
        }
        if (!python_.empty()) collect_python_prefixes();
    }

    const std::string& python() const { return python_; }
    bool network_namespace() const { return namespaces_ && settings_.isolate_network; }
    bool filesystem_isolated() const { return namespaces_ && settings_.isolate_filesystem; }

    Result<RawExecutionResult> run(const ValidatedRequest &request,
                                   const PolicyDecision &decision) override {
        if (decision.verdict != PolicyVerdict::ALLOW) {
            return PYBOX_ERROR(ErrorCode::SYSTEM_ERROR,
                               std::string("refusing to execute a request with verdict ") +
                               verdict_str(decision.verdict));
        }
        if (python_.empty() || !is_executable(python_)) {
            return PYBOX_ERROR(ErrorCode::EXEC_FAILED,
                               "python interpreter not found: " + settings_.python);
        }

        const ExecutionLimits &limits = settings_.limits_for(request.kind());
        auto acquired = ExecutionContext::acquire(settings_.work_root, limits, settings_.use_cgroup);
        if (!acquired.ok()) return acquired.error();
        std::unique_ptr<ExecutionContext> ctx = std::move(acquired).value();

        XLOG_INFO << "[" << ctx->id() << "] " << request_kind_str(request.kind())
                  << " timeout=" << limits.timeout_ms << "ms memory=" << limits.memory_limit_kb
                  << "KB cpu=" << limits.cpu_time_limit_ms << "ms"
                  << (ctx->cgroup() ? " cgroup" : "");

        if (request.kind() == RequestKind::CODE) {
            Result<void> written = write_new_file(ctx->work_dir() + "/" + SCRIPT_NAME,
                                                  request.payload());
            if (!written.ok()) return written.error().with_context(ctx->id());
        }

        Result<NamespaceOptions> isolation = plan_isolation(request, limits, *ctx);
        if (!isolation.ok()) return isolation.error().with_context(ctx->id());

        SandboxConfig config;
        build_command(request, config);
        build_environment(*ctx, config);
        config.block_inet = request.kind() == RequestKind::CODE;
        config.lock_session = config.block_inet;
        config.namespaces = isolation.value();

        Sandbox sandbox(config, *ctx);
        Result<RawExecutionResult> result = sandbox.run();
        if (!result.ok()) {
            result.error().with_context(ctx->id());
        }

        // 返回前回收进程组、cgroup 和工作目录
        ctx->release();
        return result;
    }
};

} // namespace sandbox
} // namespace pybox

#endif // PYBOX_SANDBOX_ENVELOPE_H
