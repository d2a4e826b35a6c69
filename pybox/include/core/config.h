/**
 * @file config.h
 * @brief 沙箱配置
 *
 * 所有配置项都有内置默认值，配置文件只需写要覆盖的部分。
 * 未知键被忽略；类型不对或取值越界的键返回 CONFIG_INVALID_VALUE。
 */

#ifndef PYBOX_CORE_CONFIG_H
#define PYBOX_CORE_CONFIG_H

#include "core/error.h"
#include "core/logger.h"
#include "core/types.h"
#include "core/yaml_config.h"

#include <string>
#include <vector>
#include <cstdint>

namespace pybox {

struct PipSettings {
    std::string index_url = "https://pypi.org/simple";
    int64_t retries = 1;
    int64_t timeout_s = 15;
    std::string target;     ///< 为空时装到解释器自己的环境
};

struct ExecutionSettings {
    std::string work_root = "/tmp";
    std::string python = "/usr/bin/python3";
    bool isolate_network = true;
    bool isolate_filesystem = true;     ///< 私有根文件系统和 PID 命名空间
    bool use_cgroup = true;
    bool reap_descendants = true;

    ExecutionLimits code_limits;
    ExecutionLimits package_limits = default_package_limits();
    PipSettings pip;

    static ExecutionLimits default_package_limits() {
        ExecutionLimits l;
        l.timeout_ms = 60000;
        l.memory_limit_kb = 1024 * 1024;
        l.cpu_time_limit_ms = 120000;
        l.max_processes = 256;
        l.max_output_bytes = 65536;
        l.max_file_size_kb = 512 * 1024;
        return l;
    }

    const ExecutionLimits& limits_for(RequestKind kind) const {
        return kind == RequestKind::CODE ? code_limits : package_limits;
    }
};

struct ValidatorSettings {
    int64_t max_payload_bytes = 65536;
    int64_t max_package_name_length = 100;
    std::string package_name_pattern = "^[A-Za-z0-9][A-Za-z0-9._-]*$";
    std::vector<std::string> fence_markers = {"```", "~~~"};
};

struct PolicySettings {
    std::vector<std::string> deny = {
        "crypto-locker", "pythonapi", "python-api", "system", "snake"
    };
    /// "re:" 前缀为正则，否则为 shell 通配符
    std::vector<std::string> deny_patterns;
    std::vector<std::string> suspicious = {
        "cryptography", "crypto", "requests", "urllib3", "socket", "subprocess"
    };
    std::string version_pattern =
        "^[0-9]+(\\.[0-9]+){0,3}((a|b|rc)[0-9]+)?(\\.post[0-9]+)?(\\.dev[0-9]+)?$";
};

struct LoggingSettings {
    LogLevel level = LogLevel::INFO;
    bool console = true;
    std::string dir;
};

struct SandboxSettings {
    ExecutionSettings execution;
    ValidatorSettings validator;
    PolicySettings policy;
    LoggingSettings logging;
};

//==============================================================================
// 读取
//==============================================================================

namespace detail {

/**
 * @brief 逐项读取配置，保留第一个错误
 */
class SettingsReader {
private:
    yaml::YamlNodePtr root_;
    std::optional<Error> error_;

    void fail(const std::string &path, const std::string &what) {
        if (!error_) {
            error_ = Error(ErrorCode::CONFIG_INVALID_VALUE, path + ": " + what);
        }
    }

public:
    explicit SettingsReader(yaml::YamlNodePtr root) : root_(std::move(root)) {}

    const std::optional<Error>& error() const { return error_; }

    void read_int(const std::string &path, int64_t &target, int64_t min_value) {
        auto node = root_->at(path);
        if (!node || node->is_null()) return;
        int64_t v = 0;
        if (!node->to_int(v)) {
            fail(path, "expected an integer, got '" + node->as_string() + "'");
        } else if (v < min_value) {
            fail(path, "must be at least " + std::to_string(min_value));
        } else {
            target = v;
        }
    }

    void read_bool(const std::string &path, bool &target) {
        auto node = root_->at(path);
        if (!node || node->is_null()) return;
        if (!node->to_bool(target)) {
            fail(path, "expected true or false");
        }
    }

    void read_string(const std::string &path, std::string &target, bool allow_empty) {
        auto node = root_->at(path);
        if (!node || node->is_null()) return;
        if (!node->is_scalar()) {
            fail(path, "expected a string");
        } else if (!allow_empty && node->text().empty()) {
            fail(path, "must not be empty");
        } else {
            target = node->text();
        }
    }

    void read_list(const std::string &path, std::vector<std::string> &target) {
        auto node = root_->at(path);
        if (!node) return;
        if (node->is_null()) {
            target.clear();
        } else if (!node->is_list()) {
            fail(path, "expected a list");
        } else {
            target = node->as_string_list();
        }
    }

    void read_limits(const std::string &prefix, ExecutionLimits &limits) {
        read_int(prefix + ".timeout_ms", limits.timeout_ms, 1);
        int64_t memory_mb = limits.memory_limit_kb / 1024;
        read_int(prefix + ".memory_mb", memory_mb, 16);
        limits.memory_limit_kb = memory_mb * 1024;
        read_int(prefix + ".cpu_time_ms", limits.cpu_time_limit_ms, 1);
        read_int(prefix + ".max_processes", limits.max_processes, 1);
        read_int(prefix + ".max_output_bytes", limits.max_output_bytes, 64);
        read_int(prefix + ".max_file_size_kb", limits.max_file_size_kb, 1);
    }
};

} // namespace detail

/**
 * @brief 在默认值基础上应用 YAML 树
 */
inline Result<SandboxSettings> settings_from_yaml(const yaml::YamlNodePtr &root) {
    SandboxSettings s;
    if (!root || root->is_null()) return s;
    if (!root->is_map()) {
        return Error(ErrorCode::CONFIG_INVALID_VALUE, "top level must be a map");
    }

    detail::SettingsReader r(root);

    ExecutionSettings &ex = s.execution;
    r.read_string("execution.work_root", ex.work_root, false);
    r.read_string("execution.python", ex.python, false);
    r.read_bool("execution.isolate_network", ex.isolate_network);
    r.read_bool("execution.isolate_filesystem", ex.isolate_filesystem);
    r.read_bool("execution.use_cgroup", ex.use_cgroup);
    r.read_bool("execution.reap_descendants", ex.reap_descendants);
    r.read_limits("execution.code", ex.code_limits);
    r.read_limits("execution.package", ex.package_limits);
    r.read_string("execution.pip.index_url", ex.pip.index_url, false);
    r.read_int("execution.pip.retries", ex.pip.retries, 0);
    r.read_int("execution.pip.timeout_s", ex.pip.timeout_s, 1);
    r.read_string("execution.pip.target", ex.pip.target, true);

    ValidatorSettings &va = s.validator;
    r.read_int("validator.max_payload_bytes", va.max_payload_bytes, 1);
    r.read_int("validator.max_package_name_length", va.max_package_name_length, 1);
    r.read_string("validator.package_name_pattern", va.package_name_pattern, false);
    r.read_list("validator.fence_markers", va.fence_markers);

    PolicySettings &po = s.policy;
    r.read_list("policy.deny", po.deny);
    r.read_list("policy.deny_patterns", po.deny_patterns);
    r.read_list("policy.suspicious", po.suspicious);
    r.read_string("policy.version_pattern", po.version_pattern, false);

    std::string level;
    r.read_string("logging.level", level, false);
    if (!level.empty() && !parse_log_level(level, s.logging.level)) {
        return Error(ErrorCode::CONFIG_INVALID_VALUE, "logging.level: unknown level '" + level + "'");
    }
    r.read_bool("logging.console", s.logging.console);
    r.read_string("logging.dir", s.logging.dir, true);

    if (r.error()) return *r.error();

    if (ex.work_root.front() != '/') {
        return Error(ErrorCode::CONFIG_INVALID_VALUE, "execution.work_root must be an absolute path");
    }
    return s;
}

inline Result<SandboxSettings> parse_settings(const std::string &content) {
    auto root = yaml::parse_yaml(content);
    if (!root.ok()) return root.error();
    return settings_from_yaml(root.value());
}

inline Result<SandboxSettings> load_settings(const std::string &path) {
    auto root = yaml::load_yaml(path);
    if (!root.ok()) return root.error();
    auto settings = settings_from_yaml(root.value());
    if (!settings.ok()) settings.error().with_context(path);
    return settings;
}

} // namespace pybox

#endif // PYBOX_CORE_CONFIG_H
