/**
 * @file coordinator.h
 * @brief 沙箱协调器
 *
 * 每个请求走一遍状态机：
 *
 *   RECEIVED -> VALIDATED -> POLICY_CHECKED -> EXECUTING -> CLASSIFIED
 *        \             \
 *         +-------------+--> REJECTED（校验失败、DENY、未获批准）
 *
 * REJECTED 不创建执行上下文。任何请求都恰好得到一个 ExecutionOutcome。
 * 协调器本身无可变状态，可以在多个线程中同时调用。
 */

#ifndef PYBOX_CORE_COORDINATOR_H
#define PYBOX_CORE_COORDINATOR_H

#include "core/classifier.h"
#include "core/config.h"
#include "core/error.h"
#include "core/policy.h"
#include "core/sandbox_logger.h"
#include "core/types.h"
#include "core/validator.h"
#include "sandbox/context.h"
#include "sandbox/envelope.h"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <exception>
#include <memory>
#include <optional>
#include <string>

namespace pybox {

/**
 * @brief 外部审批接口，处理 REQUIRES_APPROVAL 判定
 */
class ApprovalGate {
public:
    virtual ~ApprovalGate() = default;
    virtual bool approve(const ValidatedRequest &request, const PolicyDecision &decision) = 0;
};

/**
 * @brief 默认审批：全部拒绝
 */
class DenyAllApprovals : public ApprovalGate {
public:
    bool approve(const ValidatedRequest &, const PolicyDecision &) override {
        return false;
    }
};

class SandboxCoordinator {
private:
    RequestValidator validator_;
    std::shared_ptr<PolicyEngine> policy_;
    std::shared_ptr<sandbox::Envelope> envelope_;
    std::shared_ptr<ApprovalGate> approvals_;
    ResultClassifier classifier_;

    /// 单个请求的状态跟踪
    class Tracker {
    private:
        std::string label_;
        RequestState state_ = RequestState::RECEIVED;
        std::chrono::steady_clock::time_point received_;

    public:
        explicit Tracker(std::string label)
            : label_(std::move(label)), received_(std::chrono::steady_clock::now()) {
            SLOG_DEBUG << label_ << " " << state_str(state_);
        }

        void advance(RequestState next) {
            SLOG_DEBUG << label_ << " " << state_str(state_) << " -> " << state_str(next);
            state_ = next;
        }

        RequestState state() const { return state_; }

        int64_t elapsed_ms() const {
            return std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - received_).count();
        }

        ExecutionOutcome finish(ExecutionOutcome outcome) {
            outcome.final_state = state_;
            outcome.duration_ms = elapsed_ms();
            SLOG_INFO << label_ << " " << state_str(state_) << " " << status_str(outcome.status)
                      << (outcome.error_code == ErrorCode::OK
                          ? "" : std::string(" [") + error_code_str(outcome.error_code) + "]")
                      << " " << outcome.duration_ms << "ms";
            return outcome;
        }
    };

    static std::string label_for(const ExecutionRequest &req) {
        if (req.kind() == RequestKind::CODE) {
            return "code(" + std::to_string(req.payload().size()) + " bytes)";
        }
        // 包名此时尚未校验，只取前 64 个字节用于日志
        return "install(" + req.payload().substr(0, 64) + ")";
    }

    static ExecutionOutcome rejected(OutcomeStatus status, ErrorCode code, const std::string &message) {
        ExecutionOutcome o;
        o.status = status;
        o.error_code = code;
        o.message = message;
        return o;
    }

    ExecutionOutcome process(const ExecutionRequest &req, Tracker &tracker) {
        Result<ValidatedRequest> validated = validator_.validate(req);
        if (!validated.ok()) {
            tracker.advance(RequestState::REJECTED);
            const Error &e = validated.error();
            SLOG_WARN << "rejected input: " << e.message();
            return rejected(OutcomeStatus::INVALID_INPUT, e.code(), e.message());
        }
        tracker.advance(RequestState::VALIDATED);
        const ValidatedRequest &request = validated.value();

        PolicyDecision decision = policy_->decide(request);
        tracker.advance(RequestState::POLICY_CHECKED);

        if (decision.verdict == PolicyVerdict::REQUIRES_APPROVAL) {
            if (!approvals_ || !approvals_->approve(request, decision)) {
                tracker.advance(RequestState::REJECTED);
                return rejected(OutcomeStatus::POLICY_VIOLATION, ErrorCode::APPROVAL_REQUIRED,
                                decision.reason);
            }
            PLOG_INFO << "'" << request.payload() << "' approved externally ["
                      << decision.matched_rule << "]";
            bool unpinned = decision.unpinned;
            decision = PolicyDecision::allow("approved externally: " + decision.reason);
            decision.unpinned = unpinned;
        }
        if (decision.verdict == PolicyVerdict::DENY) {
            tracker.advance(RequestState::REJECTED);
            return rejected(OutcomeStatus::POLICY_VIOLATION, ErrorCode::POLICY_DENIED,
                            decision.reason);
        }

        tracker.advance(RequestState::EXECUTING);
        Result<sandbox::RawExecutionResult> raw = envelope_->run(request, decision);
        tracker.advance(RequestState::CLASSIFIED);
        if (!raw.ok()) {
            SLOG_ERROR << "sandbox failure: " << raw.error().to_string();
            return classifier_.internal_error(raw.error());
        }
        return classifier_.classify(raw.value());
    }

public:
    SandboxCoordinator(RequestValidator validator,
                       std::shared_ptr<PolicyEngine> policy,
                       std::shared_ptr<sandbox::Envelope> envelope,
                       std::shared_ptr<ApprovalGate> approvals = std::make_shared<DenyAllApprovals>())
        : validator_(std::move(validator)), policy_(std::move(policy)),
          envelope_(std::move(envelope)), approvals_(std::move(approvals)) {}

    /**
     * @brief 按配置组装校验器、策略引擎和执行封套
     *
     * reap_descendants 打开时本进程成为子收割者，逃出进程组的孤儿也能被回收。
     */
    static Result<std::unique_ptr<SandboxCoordinator>> create(
            const SandboxSettings &settings,
            std::shared_ptr<ApprovalGate> approvals = std::make_shared<DenyAllApprovals>()) {
        auto validator = RequestValidator::create(settings.validator);
        if (!validator.ok()) return validator.error();
        auto rules = PolicyRules::build(settings.policy);
        if (!rules.ok()) return rules.error();

        if (settings.execution.reap_descendants && !sandbox::enable_subreaper()) {
            SLOG_WARN << "cannot enable child subreaper mode: " << std::strerror(errno);
        }

        auto envelope = std::make_shared<sandbox::ExecutionEnvelope>(settings.execution);
        if (envelope->python().empty()) {
            return PYBOX_ERROR(ErrorCode::CONFIG_INVALID_VALUE,
                               "execution.python: '" + settings.execution.python +
                               "' not found in PATH");
        }

        std::unique_ptr<SandboxCoordinator> coordinator(new SandboxCoordinator(
            std::move(validator).value(),
            std::make_shared<PolicyEngine>(rules.value()),
            envelope,
            std::move(approvals)));
        SLOG_INFO << "sandbox ready: python=" << envelope->python()
                  << " deny rules=" << rules.value()->deny_count()
                  << " suspicious=" << rules.value()->suspicious_count();
        return coordinator;
    }

    ExecutionOutcome execute_code(const std::string &code) {
        return handle(ExecutionRequest::code(code));
    }

    ExecutionOutcome install_package(const std::string &name,
                                     const std::optional<std::string> &version = std::nullopt) {
        return handle(ExecutionRequest::package(name, version));
    }

    /**
     * @brief 处理一个请求，永不抛出
     */
    ExecutionOutcome handle(const ExecutionRequest &req) {
        Tracker tracker(label_for(req));
        try {
            return tracker.finish(process(req, tracker));
        } catch (const std::exception &e) {
            SLOG_ERROR << "unexpected exception: " << e.what();
            ExecutionOutcome o = classifier_.internal_error(
                Error(ErrorCode::UNKNOWN_ERROR, std::string("unexpected exception: ") + e.what()));
            return tracker.finish(std::move(o));
        }
    }

    PolicyEngine& policy() { return *policy_; }
};

} // namespace pybox

#endif // PYBOX_CORE_COORDINATOR_H
