/**
 * @file policy_test.cpp
 * @brief 策略引擎测试
 */

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

#include "pybox.h"

using namespace pybox;

namespace {

ValidatedRequest package(const std::string &name,
                         const std::optional<std::string> &version = std::nullopt) {
    return ValidatedRequest{ExecutionRequest::package(name, version), version};
}

std::shared_ptr<const PolicyRules> rules_from(const PolicySettings &s) {
    return PolicyRules::build(s).unwrap();
}

} // namespace

class PolicyEngineTest : public ::testing::Test {
protected:
    PolicySettings settings;
    std::unique_ptr<PolicyEngine> engine;

    void SetUp() override {
        settings.deny_patterns = {"*-backdoor", "re:^(py)?keylog"};
        engine = std::make_unique<PolicyEngine>(rules_from(settings));
    }

    PolicyVerdict verdict(const std::string &name,
                          const std::optional<std::string> &version = std::nullopt) {
        return engine->decide(package(name, version)).verdict;
    }
};

TEST(NormalizeTest, Pep503) {
    EXPECT_EQ(normalize_package_name("Foo__Bar.baz"), "foo-bar-baz");
    EXPECT_EQ(normalize_package_name("crypto-locker"), "crypto-locker");
    EXPECT_EQ(normalize_package_name("Crypto._-Locker"), "crypto-locker");
}

// 测试：deny 列表与大小写、分隔符写法无关，与版本无关
TEST_F(PolicyEngineTest, DenyListIgnoresSpelling) {
    for (const char *name : {"crypto-locker", "Crypto_Locker", "crypto.locker", "SYSTEM", "snake"}) {
        PolicyDecision d = engine->decide(package(name));
        EXPECT_EQ(d.verdict, PolicyVerdict::DENY) << name;
        EXPECT_EQ(d.matched_rule.compare(0, 5, "deny:"), 0) << d.matched_rule;
    }
    EXPECT_EQ(verdict("snake", std::string("1.0")), PolicyVerdict::DENY);
    EXPECT_EQ(engine->decide(package("Python_API")).matched_rule, "deny:python-api");
}

// 测试：通配符和正则模式
TEST_F(PolicyEngineTest, DenyPatterns) {
    PolicyDecision glob = engine->decide(package("evil_backdoor"));
    EXPECT_EQ(glob.verdict, PolicyVerdict::DENY);
    EXPECT_EQ(glob.matched_rule, "deny-pattern:*-backdoor");

    PolicyDecision re = engine->decide(package("PyKeylogger"));
    EXPECT_EQ(re.verdict, PolicyVerdict::DENY);
    EXPECT_EQ(re.matched_rule, "deny-pattern:re:^(py)?keylog");

    EXPECT_EQ(verdict("backdoor-scanner"), PolicyVerdict::ALLOW);
}

// 测试：版本必须是确切的发布号
TEST_F(PolicyEngineTest, VersionPin) {
    EXPECT_EQ(verdict("numpy", std::string("1.26.4")), PolicyVerdict::ALLOW);
    EXPECT_EQ(verdict("numpy", std::string("2.0rc1")), PolicyVerdict::ALLOW);
    EXPECT_EQ(verdict("numpy", std::string("1.0.post1")), PolicyVerdict::ALLOW);

    PolicyDecision range = engine->decide(package("numpy", std::string(">=1.0")));
    EXPECT_EQ(range.verdict, PolicyVerdict::DENY);
    EXPECT_EQ(range.matched_rule, "version-pin");
    EXPECT_EQ(verdict("numpy", std::string("1.0; rm -rf /")), PolicyVerdict::DENY);
    EXPECT_EQ(verdict("numpy", std::string("1.0 --index-url http://x")), PolicyVerdict::DENY);
}

// 测试：suspicious 列表需要审批
TEST_F(PolicyEngineTest, SuspiciousRequiresApproval) {
    PolicyDecision d = engine->decide(package("Requests"));
    EXPECT_EQ(d.verdict, PolicyVerdict::REQUIRES_APPROVAL);
    EXPECT_EQ(d.matched_rule, "suspicious:requests");
    EXPECT_EQ(verdict("subprocess", std::string("1.0")), PolicyVerdict::REQUIRES_APPROVAL);
}

// 测试：未指定版本的安装被标记
TEST_F(PolicyEngineTest, UnpinnedFlag) {
    EXPECT_TRUE(engine->decide(package("numpy")).unpinned);
    EXPECT_FALSE(engine->decide(package("numpy", std::string("1.0"))).unpinned);
    EXPECT_TRUE(engine->decide(package("requests")).unpinned);
}

TEST_F(PolicyEngineTest, CodeIsAllowed) {
    ValidatedRequest code{ExecutionRequest::code("print(1)"), std::nullopt};
    EXPECT_EQ(engine->decide(code).verdict, PolicyVerdict::ALLOW);
}

TEST_F(PolicyEngineTest, OsIsNotDenied) {
    EXPECT_EQ(verdict("os"), PolicyVerdict::ALLOW);
}

// 测试：reload 整体替换，旧快照不受影响
TEST_F(PolicyEngineTest, ReloadSwapsRules) {
    auto before = engine->snapshot();

    PolicySettings strict;
    strict.deny = {"numpy"};
    strict.suspicious.clear();
    engine->reload(rules_from(strict));

    EXPECT_EQ(verdict("numpy"), PolicyVerdict::DENY);
    EXPECT_EQ(verdict("requests"), PolicyVerdict::ALLOW);
    EXPECT_FALSE(before->denied("numpy"));
    EXPECT_TRUE(before->suspicious("requests"));
}

TEST_F(PolicyEngineTest, ConcurrentDecideDuringReload) {
    std::atomic<bool> stop{false};
    std::atomic<int> bad{0};
    std::vector<std::thread> readers;
    for (int i = 0; i < 4; ++i) {
        readers.emplace_back([&]() {
            while (!stop) {
                // crypto-locker 在两套规则里都被拒绝
                if (verdict("crypto-locker") != PolicyVerdict::DENY) ++bad;
            }
        });
    }
    PolicySettings other;
    other.deny = {"crypto-locker", "numpy"};
    for (int i = 0; i < 200; ++i) {
        engine->reload(rules_from(i % 2 ? settings : other));
    }
    stop = true;
    for (auto &t : readers) t.join();
    EXPECT_EQ(bad.load(), 0);
}

TEST(PolicyFailClosedTest, NoRulesDenies) {
    PolicyEngine engine(nullptr);
    PolicyDecision d = engine.decide(package("numpy", std::string("1.0")));
    EXPECT_EQ(d.verdict, PolicyVerdict::DENY);
    EXPECT_EQ(d.matched_rule, "fail-closed");
}

TEST(PolicyRulesTest, BadRegexIsConfigError) {
    PolicySettings s;
    s.deny_patterns = {"re:(unclosed"};
    auto r = PolicyRules::build(s);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code(), ErrorCode::CONFIG_INVALID_VALUE);
}
