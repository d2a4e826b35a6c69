/**
 * @file pybox.h
 * @brief pybox 主头文件
 *
 * 使用方式：
 *   #include "pybox.h"
 *
 *   auto settings = pybox::load_settings("config/sandbox.yml");
 *   auto sandbox = pybox::SandboxCoordinator::create(settings.value());
 *   pybox::ExecutionOutcome o = sandbox.value()->execute_code("print(1+1)");
 */

#ifndef PYBOX_H
#define PYBOX_H

// 核心模块
#include "core/error.h"
#include "core/types.h"
#include "core/utils.h"
#include "core/logger.h"
#include "core/sandbox_logger.h"
#include "core/yaml_config.h"
#include "core/config.h"
#include "core/validator.h"
#include "core/policy.h"
#include "core/classifier.h"
#include "core/coordinator.h"
#include "core/report.h"

// 沙箱
#include "sandbox/cgroup.h"
#include "sandbox/seccomp.h"
#include "sandbox/namespace.h"
#include "sandbox/context.h"
#include "sandbox/sandbox.h"
#include "sandbox/envelope.h"

namespace pybox {

/**
 * @brief 按配置初始化日志
 */
inline void init_logging(const LoggingSettings &logging) {
    sandbox_log().init(logging.level, logging.console, logging.dir);
}

} // namespace pybox

#endif // PYBOX_H
