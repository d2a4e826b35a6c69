/**
 * @file validator.h
 * @brief 请求校验
 *
 * 在消耗任何执行资源之前拒绝结构上非法的请求。这里不解析也不运行代码。
 *
 * 检查顺序：
 * 1. 载荷非空（仅空白视为空）、不超过大小上限、不含 NUL
 * 2. 代码：任何一行（去掉行首空白后）以代码围栏标记开头即为格式违规
 * 3. 包名：长度上限与字符集
 */

#ifndef PYBOX_CORE_VALIDATOR_H
#define PYBOX_CORE_VALIDATOR_H

#include "core/config.h"
#include "core/error.h"
#include "core/types.h"
#include "core/utils.h"

#include <regex>
#include <string>
#include <vector>

namespace pybox {

class RequestValidator {
private:
    ValidatorSettings settings_;
    std::regex name_pattern_;

    RequestValidator(const ValidatorSettings &settings, std::regex pattern)
        : settings_(settings), name_pattern_(std::move(pattern)) {}

    Result<void> check_payload(const ExecutionRequest &req) const {
        const std::string &p = req.payload();
        if (trim(p).empty()) {
            return Error(ErrorCode::MALFORMED_INPUT, "payload is empty");
        }
        if (static_cast<int64_t>(p.size()) > settings_.max_payload_bytes) {
            return Error(ErrorCode::MALFORMED_INPUT,
                         "payload is " + std::to_string(p.size()) + " bytes, limit is " +
                         std::to_string(settings_.max_payload_bytes));
        }
        if (p.find('\0') != std::string::npos) {
            return Error(ErrorCode::MALFORMED_INPUT, "payload contains a NUL byte");
        }
        return Ok();
    }

    Result<void> check_code(const std::string &code) const {
        int number = 0;
        for (const auto &line : split_lines(code)) {
            ++number;
            size_t first = line.find_first_not_of(" \t");
            if (first == std::string::npos) continue;
            for (const auto &marker : settings_.fence_markers) {
                if (!marker.empty() && line.compare(first, marker.size(), marker) == 0) {
                    return Error(ErrorCode::FORMATTING_VIOLATION,
                                 "line " + std::to_string(number) +
                                 " starts with rich-text fence '" + marker +
                                 "'; submit plain source only");
                }
            }
        }
        return Ok();
    }

    Result<void> check_package_name(const std::string &name) const {
        if (static_cast<int64_t>(name.size()) > settings_.max_package_name_length) {
            return Error(ErrorCode::INVALID_PACKAGE_NAME,
                         "package name longer than " +
                         std::to_string(settings_.max_package_name_length) + " characters");
        }
        if (!std::regex_match(name, name_pattern_)) {
            return Error(ErrorCode::INVALID_PACKAGE_NAME,
                         "package name may only contain letters, digits, '-', '_' and '.'");
        }
        return Ok();
    }

public:
    /**
     * @brief 按配置构造，名字模式不是合法正则时返回 CONFIG_INVALID_VALUE
     */
    static Result<RequestValidator> create(const ValidatorSettings &settings) {
        try {
            return RequestValidator(settings, std::regex(settings.package_name_pattern,
                                                         std::regex::ECMAScript));
        } catch (const std::regex_error &e) {
            return Error(ErrorCode::CONFIG_INVALID_VALUE,
                         "validator.package_name_pattern: " + std::string(e.what()));
        }
    }

    Result<ValidatedRequest> validate(const ExecutionRequest &req) const {
        PYBOX_TRY(check_payload(req));

        std::optional<std::string> version;
        if (req.kind() == RequestKind::CODE) {
            PYBOX_TRY(check_code(req.payload()));
        } else {
            PYBOX_TRY(check_package_name(req.payload()));
            if (req.declared_version()) {
                std::string v = trim(*req.declared_version());
                if (!v.empty() && to_lower(v) != "latest") {
                    version = v;
                }
            }
        }
        return ValidatedRequest{req, version};
    }
};

} // namespace pybox

#endif // PYBOX_CORE_VALIDATOR_H
