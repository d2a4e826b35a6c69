/**
 * @file policy.h
 * @brief 策略引擎
 *
 * 纯判定逻辑，不做任何 I/O（日志除外）。规则对象构造后只读，
 * reload() 以原子方式整体替换，正在进行的 decide() 继续使用它取到的快照。
 *
 * 判定顺序：
 *   deny 列表 -> deny 模式 -> 版本格式 -> suspicious 列表 -> ALLOW
 */

#ifndef PYBOX_CORE_POLICY_H
#define PYBOX_CORE_POLICY_H

#include "core/config.h"
#include "core/error.h"
#include "core/sandbox_logger.h"
#include "core/types.h"
#include "core/utils.h"

#include <fnmatch.h>

#include <memory>
#include <regex>
#include <set>
#include <string>
#include <vector>

namespace pybox {

/**
 * @brief 包名匹配模式
 */
struct NamePattern {
    enum class Kind { GLOB, REGEX };

    Kind kind;
    std::string text;   ///< 原始写法，作为 matched_rule 返回
    std::string glob;
    std::regex regex;

    bool matches(const std::string &normalized) const {
        if (kind == Kind::GLOB) {
            return fnmatch(glob.c_str(), normalized.c_str(), 0) == 0;
        }
        return std::regex_search(normalized, regex);
    }
};

/**
 * @brief 不可变的规则集
 *
 * 列表中的名字在构造时已规范化，匹配与大小写、分隔符写法无关。
 */
class PolicyRules {
private:
    std::set<std::string> deny_;
    std::vector<NamePattern> deny_patterns_;
    std::set<std::string> suspicious_;
    std::regex version_pattern_;
    std::string version_pattern_text_;

    PolicyRules() = default;

public:
    static Result<std::shared_ptr<const PolicyRules>> build(const PolicySettings &settings) {
        std::shared_ptr<PolicyRules> rules(new PolicyRules());
        for (const auto &name : settings.deny) {
            rules->deny_.insert(normalize_package_name(trim(name)));
        }
        for (const auto &name : settings.suspicious) {
            rules->suspicious_.insert(normalize_package_name(trim(name)));
        }
        try {
            for (const auto &raw : settings.deny_patterns) {
                NamePattern p;
                p.text = raw;
                if (starts_with(raw, "re:")) {
                    p.kind = NamePattern::Kind::REGEX;
                    p.regex = std::regex(raw.substr(3),
                                         std::regex::ECMAScript | std::regex::icase);
                } else {
                    p.kind = NamePattern::Kind::GLOB;
                    p.glob = normalize_package_name(raw);
                }
                rules->deny_patterns_.push_back(std::move(p));
            }
            rules->version_pattern_ = std::regex(settings.version_pattern, std::regex::ECMAScript);
            rules->version_pattern_text_ = settings.version_pattern;
        } catch (const std::regex_error &e) {
            return Error(ErrorCode::CONFIG_INVALID_VALUE,
                         "policy pattern: " + std::string(e.what()));
        }
        return std::shared_ptr<const PolicyRules>(rules);
    }

    bool denied(const std::string &normalized) const { return deny_.count(normalized) != 0; }
    bool suspicious(const std::string &normalized) const { return suspicious_.count(normalized) != 0; }

    const NamePattern* matching_pattern(const std::string &normalized) const {
        for (const auto &p : deny_patterns_) {
            if (p.matches(normalized)) return &p;
        }
        return nullptr;
    }

    bool version_valid(const std::string &version) const {
        return std::regex_match(version, version_pattern_);
    }

    size_t deny_count() const { return deny_.size() + deny_patterns_.size(); }
    size_t suspicious_count() const { return suspicious_.size(); }
};

class PolicyEngine {
private:
    std::shared_ptr<const PolicyRules> rules_;

    PolicyDecision decide_package(const PolicyRules &rules, const ValidatedRequest &req) const {
        const std::string name = normalize_package_name(req.payload());

        if (rules.denied(name)) {
            return PolicyDecision::deny("package '" + req.payload() + "' is on the deny list",
                                        "deny:" + name);
        }
        if (const NamePattern *p = rules.matching_pattern(name)) {
            return PolicyDecision::deny("package '" + req.payload() + "' matches deny pattern '" +
                                        p->text + "'", "deny-pattern:" + p->text);
        }
        if (req.version && !rules.version_valid(*req.version)) {
            return PolicyDecision::deny("version '" + *req.version + "' is not an exact release",
                                        "version-pin");
        }

        PolicyDecision d = rules.suspicious(name)
            ? PolicyDecision::approval("package '" + req.payload() + "' needs explicit approval",
                                       "suspicious:" + name)
            : PolicyDecision::allow("no rule matched");
        d.unpinned = !req.version.has_value();
        return d;
    }

public:
    explicit PolicyEngine(std::shared_ptr<const PolicyRules> rules)
        : rules_(std::move(rules)) {}

    /**
     * @brief 整体替换规则集
     */
    void reload(std::shared_ptr<const PolicyRules> rules) {
        std::atomic_store(&rules_, std::move(rules));
    }

    std::shared_ptr<const PolicyRules> snapshot() const {
        return std::atomic_load(&rules_);
    }

    PolicyDecision decide(const ValidatedRequest &req) const {
        if (req.kind() == RequestKind::CODE) {
            // 代码目前没有规则，隔离由执行层负责
            return PolicyDecision::allow("no code rules");
        }

        auto rules = snapshot();
        if (!rules) {
            return PolicyDecision::deny("no policy rules loaded", "fail-closed");
        }

        PolicyDecision d = decide_package(*rules, req);
        if (d.verdict == PolicyVerdict::ALLOW && d.unpinned) {
            PLOG_WARN << "unpinned install of '" << req.payload()
                      << "': resolving latest release from the index";
        }
        PLOG_INFO << "package '" << req.payload() << "' -> " << verdict_str(d.verdict)
                  << (d.matched_rule.empty() ? "" : " [" + d.matched_rule + "]");
        return d;
    }
};

} // namespace pybox

#endif // PYBOX_CORE_POLICY_H
