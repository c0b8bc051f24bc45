#pragma once

#include <string>

namespace sandbox::docker {

/**
 * @brief 解析后的容器引擎地址
 */
struct engine_host {
    enum class transport {
        UNIX,
        TCP
    };

    transport kind;

    /**
     * @brief 规范化后的地址，比如 unix:///var/run/docker.sock
     */
    std::string normalized;

    /**
     * @brief Unix socket 的文件路径，仅当 kind 为 UNIX 时有效
     */
    std::string socket_path;

    /**
     * @brief 发送 HTTP 请求时使用的 URL 前缀
     * 对于 Unix socket，主机名没有意义，固定为 http://localhost
     */
    std::string base_url;
};

/**
 * @brief 规范化容器引擎地址
 * 空地址使用默认地址；/path 规范化为 unix:///path；unix://path 规范化为 unix:///path
 */
std::string normalize_host(const std::string &host);

/**
 * @brief 解析容器引擎地址
 * 支持 unix://、http+unix://、tcp://、http://、https://
 * @throw runner_unavailable 地址格式不受支持
 */
engine_host parse_host(const std::string &host);

/**
 * @brief 检查 Unix socket 是否存在并且确实是 socket 文件
 * 对 TCP 地址不做检查
 * @throw runner_unavailable socket 不存在、不是 socket 或无法访问
 */
void ensure_socket(const engine_host &host);

}  // namespace sandbox::docker
