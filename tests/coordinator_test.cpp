/**
 * @file coordinator_test.cpp
 * @brief 协调器状态机测试（执行层用替身）
 */

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <vector>

#include "pybox.h"

using namespace pybox;
using sandbox::RawExecutionResult;
using sandbox::RunStatus;

namespace {

class RecordingEnvelope : public sandbox::Envelope {
public:
    int calls = 0;
    std::vector<ValidatedRequest> requests;
    std::vector<PolicyDecision> decisions;
    Result<RawExecutionResult> next = RawExecutionResult();
    bool throw_next = false;

    Result<RawExecutionResult> run(const ValidatedRequest &request,
                                   const PolicyDecision &decision) override {
        ++calls;
        requests.push_back(request);
        decisions.push_back(decision);
        if (throw_next) throw std::runtime_error("envelope exploded");
        return next;
    }
};

class ApproveAll : public ApprovalGate {
public:
    int calls = 0;
    bool approve(const ValidatedRequest &, const PolicyDecision &) override {
        ++calls;
        return true;
    }
};

RawExecutionResult successful_run(const std::string &out) {
    RawExecutionResult raw;
    raw.context_id = "ctx_fake_1";
    raw.status = RunStatus::OK;
    raw.exit_code = 0;
    raw.stdout_data = out;
    return raw;
}

} // namespace

class CoordinatorTest : public ::testing::Test {
protected:
    std::shared_ptr<RecordingEnvelope> envelope = std::make_shared<RecordingEnvelope>();

    std::unique_ptr<SandboxCoordinator> make(std::shared_ptr<ApprovalGate> gate =
                                                 std::make_shared<DenyAllApprovals>()) {
        return std::make_unique<SandboxCoordinator>(
            RequestValidator::create(ValidatorSettings()).unwrap(),
            std::make_shared<PolicyEngine>(PolicyRules::build(PolicySettings()).unwrap()),
            envelope, gate);
    }
};

// 测试：带 markdown 代码块的输入在执行前被拒绝
TEST_F(CoordinatorTest, FencedCodeNeverExecutes) {
    auto c = make();
    ExecutionOutcome o = c->execute_code("```python\nprint(1)\n```");
    EXPECT_EQ(o.status, OutcomeStatus::INVALID_INPUT);
    EXPECT_EQ(o.error_code, ErrorCode::FORMATTING_VIOLATION);
    EXPECT_EQ(o.final_state, RequestState::REJECTED);
    EXPECT_TRUE(o.context_id.empty());
    EXPECT_EQ(envelope->calls, 0);
}

TEST_F(CoordinatorTest, BadPackageNameRejectedBeforePolicy) {
    auto c = make();
    ExecutionOutcome o = c->install_package("some/evil;rm -rf");
    EXPECT_EQ(o.status, OutcomeStatus::INVALID_INPUT);
    EXPECT_EQ(o.error_code, ErrorCode::INVALID_PACKAGE_NAME);
    EXPECT_EQ(envelope->calls, 0);
}

TEST_F(CoordinatorTest, DeniedPackageNeverExecutes) {
    auto c = make();
    for (const char *name : {"snake", "Crypto_Locker"}) {
        ExecutionOutcome o = c->install_package(name, std::string("1.0"));
        EXPECT_EQ(o.status, OutcomeStatus::POLICY_VIOLATION) << name;
        EXPECT_EQ(o.error_code, ErrorCode::POLICY_DENIED) << name;
        EXPECT_EQ(o.final_state, RequestState::REJECTED);
    }
    EXPECT_EQ(envelope->calls, 0);
}

// 测试：默认审批全部拒绝
TEST_F(CoordinatorTest, SuspiciousPackageNeedsApproval) {
    auto c = make();
    ExecutionOutcome o = c->install_package("requests");
    EXPECT_EQ(o.status, OutcomeStatus::POLICY_VIOLATION);
    EXPECT_EQ(o.error_code, ErrorCode::APPROVAL_REQUIRED);
    EXPECT_EQ(envelope->calls, 0);
}

TEST_F(CoordinatorTest, ApprovedPackageExecutes) {
    auto gate = std::make_shared<ApproveAll>();
    auto c = make(gate);
    envelope->next = successful_run("Successfully installed requests\n");

    ExecutionOutcome o = c->install_package("requests", std::string("2.31.0"));
    EXPECT_EQ(gate->calls, 1);
    ASSERT_EQ(envelope->calls, 1);
    EXPECT_EQ(envelope->decisions[0].verdict, PolicyVerdict::ALLOW);
    EXPECT_NE(envelope->decisions[0].reason.find("approved"), std::string::npos);
    EXPECT_EQ(o.status, OutcomeStatus::SUCCESS);
    EXPECT_EQ(o.final_state, RequestState::CLASSIFIED);
}

// 测试：os 不在任何列表中，走执行路径
TEST_F(CoordinatorTest, InstallOsIsNotPolicyViolation) {
    auto c = make();
    envelope->next = successful_run("");
    ExecutionOutcome o = c->install_package("os");
    EXPECT_NE(o.status, OutcomeStatus::POLICY_VIOLATION);
    ASSERT_EQ(envelope->calls, 1);
    EXPECT_TRUE(envelope->decisions[0].unpinned);
    EXPECT_EQ(envelope->requests[0].payload(), "os");
}

TEST_F(CoordinatorTest, VersionPassedToEnvelope) {
    auto c = make();
    envelope->next = successful_run("");
    c->install_package("numpy", std::string("latest"));
    c->install_package("numpy", std::string("1.26.4"));
    ASSERT_EQ(envelope->calls, 2);
    EXPECT_FALSE(envelope->requests[0].version.has_value());
    EXPECT_EQ(envelope->requests[1].version.value_or(""), "1.26.4");
}

TEST_F(CoordinatorTest, CodeOutcomeFromClassifier) {
    auto c = make();
    envelope->next = successful_run("2\n");
    ExecutionOutcome o = c->execute_code("print(1+1)");
    EXPECT_EQ(o.status, OutcomeStatus::SUCCESS);
    EXPECT_EQ(o.stdout_data, "2\n");
    EXPECT_EQ(o.context_id, "ctx_fake_1");
    EXPECT_EQ(o.final_state, RequestState::CLASSIFIED);
    EXPECT_GE(o.duration_ms, 0);
}

// 测试：执行层故障是 INTERNAL_ERROR，不是用户错误
TEST_F(CoordinatorTest, EnvelopeFailureIsInternal) {
    auto c = make();
    envelope->next = Error(ErrorCode::FORK_FAILED, "Resource temporarily unavailable");
    ExecutionOutcome o = c->execute_code("print(1)");
    EXPECT_EQ(o.status, OutcomeStatus::INTERNAL_ERROR);
    EXPECT_EQ(o.error_code, ErrorCode::FORK_FAILED);
    EXPECT_EQ(o.final_state, RequestState::CLASSIFIED);
}

TEST_F(CoordinatorTest, ExceptionBecomesInternalError) {
    auto c = make();
    envelope->throw_next = true;
    ExecutionOutcome o = c->execute_code("print(1)");
    EXPECT_EQ(o.status, OutcomeStatus::INTERNAL_ERROR);
    EXPECT_NE(o.message.find("envelope exploded"), std::string::npos);
}

TEST(CoordinatorCreateTest, MissingInterpreterIsConfigError) {
    SandboxSettings s;
    s.execution.python = "definitely-not-a-python-binary";
    s.execution.isolate_network = false;
    s.execution.reap_descendants = false;
    auto c = SandboxCoordinator::create(s);
    ASSERT_FALSE(c.ok());
    EXPECT_EQ(c.error().code(), ErrorCode::CONFIG_INVALID_VALUE);
}

TEST(CoordinatorCreateTest, BadPolicyPatternIsConfigError) {
    SandboxSettings s;
    s.policy.version_pattern = "(";
    auto c = SandboxCoordinator::create(s);
    ASSERT_FALSE(c.ok());
    EXPECT_EQ(c.error().code(), ErrorCode::CONFIG_INVALID_VALUE);
}
