#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <vector>
#include "config.hpp"
#include "docker/engine.hpp"
#include "docker/host.hpp"

namespace sandbox::docker {

/**
 * @brief 通过 libcurl 访问 Docker Engine HTTP API 的客户端
 * 支持 Unix socket 和 TCP。每个请求使用独立的 CURL 句柄，
 * 因此同一个 client 可以被多个线程同时使用，但通常每次运行创建一个 client。
 * 使用前必须在主线程调用过 curl_global_init。
 */
struct client : public engine {
    /**
     * @brief 创建客户端，检查控制 socket 是否可用
     * @throw runner_unavailable 地址不受支持或 socket 不可用
     */
    explicit client(const runner_config &config);

    nlohmann::json version() override;

    void pull_image(const std::string &image) override;

    std::string create_container(const container_options &options) override;

    void start_container(const std::string &container_id) override;

    bool put_archive(const std::string &container_id, const std::string &path, const std::string &archive) override;

    std::string create_exec(const std::string &container_id, const exec_options &options) override;

    exec_output start_exec(const std::string &exec_id, std::chrono::milliseconds deadline, size_t max_bytes) override;

    exec_state inspect_exec(const std::string &exec_id) override;

    void kill_container(const std::string &container_id) override;

    void remove_container(const std::string &container_id) override;

    void get_archive(const std::string &container_id, const std::string &path, const archive_sink &sink) override;

    /**
     * @brief 所有请求的 URL 前缀，包含 API 版本
     */
    std::string base_url() const;

private:
    typedef std::vector<std::pair<std::string, std::string>> query_list;

    struct response {
        long status = 0;
        std::string body;

        /**
         * @brief 是否因为超时而中止
         */
        bool timed_out = false;
    };

    struct request {
        std::string method;
        std::string path;
        query_list query;
        const std::string *body = nullptr;
        std::string content_type;

        /**
         * @brief 成功响应的响应体交给 sink，为空时保存在 response::body 中
         */
        archive_sink sink;

        std::chrono::milliseconds timeout;

        /**
         * @brief 超时时不抛出异常，而是设置 response::timed_out
         */
        bool allow_timeout = false;
    };

    response perform(const request &req) const;

    /**
     * @brief 执行请求，状态码不小于 400 时抛出 engine_error
     */
    response perform_checked(const request &req) const;

    request make_request(const std::string &method, const std::string &path) const;

    engine_host addr;
    std::string api_prefix;
    std::chrono::milliseconds request_timeout;
};

/**
 * @brief 从 Docker 错误响应体中提取 message 字段
 */
std::string error_message(const std::string &body);

/**
 * @brief 将镜像引用拆分为 fromImage 和 tag 两部分
 * 比如 python:3.12-slim 得到 {python, 3.12-slim}；没有 tag 时 tag 为 latest；带 digest 的引用不拆分
 */
std::pair<std::string, std::string> split_image_reference(const std::string &image);

}  // namespace sandbox::docker
