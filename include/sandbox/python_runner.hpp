#pragma once

#include <functional>
#include <memory>
#include <string>
#include "config.hpp"
#include "docker/engine.hpp"
#include "sandbox/request.hpp"

namespace sandbox {

/**
 * @brief 一次运行中容器所处的状态
 * UNAVAILABLE -> CREATED -> STARTED -> UPLOADED -> EXECUTING -> COMPLETED | TIMED_OUT | FAILED -> REMOVED
 */
enum class container_state {
    UNAVAILABLE,
    CREATED,
    STARTED,
    UPLOADED,
    EXECUTING,
    COMPLETED,
    TIMED_OUT,
    FAILED,
    REMOVED
};

const char *to_string(container_state state);

/**
 * @brief 根据配置创建容器引擎客户端
 * @throw runner_unavailable 引擎地址不受支持或 socket 不可用
 */
typedef std::function<std::unique_ptr<docker::engine>(const runner_config &)> engine_factory;

/**
 * @brief 默认的引擎工厂，创建 docker::client
 */
std::unique_ptr<docker::engine> make_docker_client(const runner_config &config);

/**
 * @brief 运行用户代码的容器参数
 * init 进程只是 sleep，用户代码通过 exec 执行；没有网络，丢弃所有 capability，/tmp 为 tmpfs
 */
docker::container_options build_container_options(const runner_config &config);

/**
 * @brief 在容器内执行用户代码的 exec 参数
 */
docker::exec_options build_exec_options(const std::string &code, const runner_config &config);

/**
 * @brief 在一次性容器中运行用户提交的 Python 代码
 *
 * 每次运行恰好创建一个容器和最多一个 exec 进程，无论结果如何，
 * 容器都会在 run 返回之前被删除。不同的运行之间不共享任何可变状态，
 * 因此同一个 python_runner 可以被多个 worker 线程同时使用。
 *
 * run 是阻塞的：所有容器引擎调用都是同步的，最长可能阻塞 timeout_sec + 2 秒以上，
 * 调用方必须在 worker 线程中调用，并且自行限制并发运行的数量。
 */
struct python_runner {
    /**
     * @param config 运行时使用的配置，在构造时复制
     * @param factory 创建容器引擎客户端的工厂，在输入检查通过之后才会调用
     */
    explicit python_runner(const runner_config &config, engine_factory factory = make_docker_client);

    /**
     * @brief 运行一次用户代码
     * 超时不是错误，返回的 run_result 中 timed_out 为 true。
     * @throw validation_error 代码或附加文件不合法，此时不会访问容器引擎
     * @throw runner_unavailable 运行器被禁用、容器引擎不可达或镜像不可用
     * @throw runner_error 容器创建之后的任何步骤失败
     */
    run_result run(const run_request &request);

    /**
     * @brief 同 run，但是将三类失败转换为 run_failure 返回
     */
    run_outcome try_run(const run_request &request);

    const runner_config &config() const;

private:
    /**
     * @brief 容器创建之后的步骤：启动、上传、执行、等待、收集输出
     */
    run_result execute(docker::engine &engine, const std::string &container_id, const std::string &code, const std::string &archive, container_state &state);

    void pull_image(docker::engine &engine);

    std::string create_container(docker::engine &engine);

    runner_config cfg;
    engine_factory factory;
};

}  // namespace sandbox
