#pragma once

#include <nlohmann/json.hpp>
#include "config.hpp"
#include "docker/engine.hpp"
#include "sandbox/python_runner.hpp"

namespace sandbox {

/**
 * @brief 收集排查运行器故障所需的信息
 * 包括配置的引擎地址、socket 文件的状态、代理环境变量、以及引擎的版本信息。
 * 只读，不会抛出异常：任何一步失败都记录在返回的报告中。
 * @param factory 创建容器引擎客户端的工厂
 */
nlohmann::json diagnostics(const runner_config &config, const engine_factory &factory = make_docker_client);

}  // namespace sandbox
