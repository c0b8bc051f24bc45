#pragma once

#include <functional>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>
#include "common/concurrent_queue.hpp"
#include "config.hpp"
#include "sandbox/python_runner.hpp"

/**
 * serve 模式相关函数
 * 主线程从标准输入逐行读取运行请求放入 task_queue，
 * 每个 worker 从 task_queue 取出请求，在一次性容器中运行，然后写回一行响应。
 *
 * worker 的数量就是同时运行的容器数量的上限：python_runner::run 是阻塞的，
 * 一个 worker 同一时间只能运行一个请求。
 */
namespace sandbox {

/**
 * @brief 写出一行响应，必须是线程安全的
 */
typedef std::function<void(const nlohmann::json &response)> response_writer;

/**
 * @brief 停止所有的 worker
 * 调用该函数后，worker 完成手上的运行后退出，不再处理队列中剩余的请求。
 * 可以在信号处理函数中调用。
 */
void stop_workers();

/**
 * @brief 处理一行运行请求
 * 请求格式为 {"id": any, "code": str, "files": [...]}。
 * 响应总是带有请求中的 id：成功时为运行结果加上 "ok": true，失败时为 run_failure。
 * @param line 一行 JSON 文本
 * @param cache 运行前检查配置文件是否被修改
 * @param factory 创建容器引擎客户端的工厂
 */
nlohmann::json handle_request_line(const std::string &line, config_cache &cache, const engine_factory &factory);

/**
 * @brief 启动 worker 线程
 * worker 在队列关闭且为空、或者 stop_workers 被调用之后退出。
 * @param worker_id worker 编号，只用于日志
 * @param task_queue 主线程发送请求行的队列
 * @return 产生的线程
 */
std::thread start_worker(size_t worker_id, concurrent_queue<std::string> &task_queue, config_cache &cache, const engine_factory &factory, response_writer writer);

}  // namespace sandbox
