#pragma once

#include <map>
#include <string>
#include <vector>
#include "config.hpp"

namespace sandbox {

/**
 * @brief 容器内的工作目录，也是 tmpfs 的挂载点
 */
extern const char *WORK_DIR;

/**
 * @brief 保存 Base64 编码后的用户代码的环境变量名
 */
extern const char *CODE_ENV_NAME;

/**
 * @brief 在容器内执行用户代码的命令
 */
struct exec_command {
    /**
     * @brief 完整的参数列表，argv[0] 为 timeout
     */
    std::vector<std::string> argv;

    /**
     * @brief 需要额外设置的环境变量
     */
    std::map<std::string, std::string> env;
};

/**
 * @brief 容器内 Python 引导脚本的源代码
 * 引导脚本从环境变量解码用户代码，写入 /tmp/main.py，切换到 /tmp，
 * 以 __main__ 模块执行用户代码，之后把工作目录中新建的文件复制回 /tmp。
 */
extern const char *BOOTSTRAP_SOURCE;

/**
 * @brief 构造容器内执行用户代码的命令
 * 用户代码通过环境变量传递，避免经过 shell 转义。
 * 外层的 timeout -s SIGKILL 在超过 config.timeout_sec 秒后杀死整个进程组，
 * 这是权威的时间限制，不依赖 python_runner 的轮询截止时间。
 * @param code 用户代码
 * @return argv 和环境变量
 */
exec_command build_exec_command(const std::string &code, const runner_config &config);

}  // namespace sandbox
