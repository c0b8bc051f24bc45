#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace sandbox::docker {

/**
 * @brief 创建容器的参数
 */
struct container_options {
    std::string image;

    /**
     * @brief 容器的 init 进程
     */
    std::vector<std::string> cmd;

    std::string working_dir;

    /**
     * @brief 运行用户，格式为 uid:gid
     */
    std::string user;

    std::map<std::string, std::string> env;

    /**
     * @brief 网络模式，"none" 表示没有任何网络
     */
    std::string network_mode = "none";

    /**
     * @brief 挂载点到 tmpfs 挂载选项的映射
     */
    std::map<std::string, std::string> tmpfs;

    long long memory_bytes = 0;

    /**
     * @brief CPU 限制，以 10^-9 个核心为单位
     */
    long long nano_cpus = 0;

    long long pids_limit = 0;

    std::vector<std::string> cap_drop;

    std::vector<std::string> security_opt;
};

void to_json(nlohmann::json &j, const container_options &options);

/**
 * @brief 在容器内创建 exec 进程的参数
 */
struct exec_options {
    std::vector<std::string> cmd;

    std::map<std::string, std::string> env;

    std::string working_dir;

    std::string user;
};

void to_json(nlohmann::json &j, const exec_options &options);

/**
 * @brief exec 进程的输出
 */
struct exec_output {
    std::string stdout_bytes;
    std::string stderr_bytes;

    /**
     * @brief 输出是否因为超过字节上限而被截断
     */
    bool stdout_overflowed = false;
    bool stderr_overflowed = false;

    /**
     * @brief 输出流是否自然结束；为 false 表示在截止时间到达时输出流仍未关闭
     */
    bool complete = true;
};

/**
 * @brief exec 进程的状态
 */
struct exec_state {
    bool running = false;

    /**
     * @brief 退出码，进程未结束或引擎未报告时为空
     */
    std::optional<int> exit_code;
};

/**
 * @brief 归档数据的接收函数，每收到一段数据调用一次，可以抛出异常来中止传输
 */
typedef std::function<void(const char *data, size_t size)> archive_sink;

/**
 * @brief 容器引擎的抽象接口
 * 所有函数都是阻塞的，不能在事件循环线程中调用。
 * 引擎返回错误状态码时抛出 engine_error，无法连接到引擎时抛出 network_error。
 */
struct engine {
    virtual ~engine();

    /**
     * @brief 查询容器引擎的版本信息
     */
    virtual nlohmann::json version() = 0;

    /**
     * @brief 拉取镜像，阻塞直到拉取完成
     */
    virtual void pull_image(const std::string &image) = 0;

    /**
     * @brief 创建容器（不启动）
     * @return 容器 id
     */
    virtual std::string create_container(const container_options &options) = 0;

    virtual void start_container(const std::string &container_id) = 0;

    /**
     * @brief 将 tar 归档解压到容器内的 path 目录
     * @return 引擎是否确认上传成功
     */
    virtual bool put_archive(const std::string &container_id, const std::string &path, const std::string &archive) = 0;

    /**
     * @brief 在运行中的容器内创建 exec 进程（不启动）
     * @return exec id
     */
    virtual std::string create_exec(const std::string &container_id, const exec_options &options) = 0;

    /**
     * @brief 启动 exec 进程并读取输出直到输出流关闭或者 deadline 到达
     * @param deadline 读取输出的最长时间
     * @param max_bytes 每个流最多保留的字节数
     */
    virtual exec_output start_exec(const std::string &exec_id, std::chrono::milliseconds deadline, size_t max_bytes) = 0;

    virtual exec_state inspect_exec(const std::string &exec_id) = 0;

    /**
     * @brief 向容器发送 SIGKILL
     */
    virtual void kill_container(const std::string &container_id) = 0;

    /**
     * @brief 强制删除容器，无论容器是否在运行
     */
    virtual void remove_container(const std::string &container_id) = 0;

    /**
     * @brief 读取容器内 path 目录的 tar 归档
     * @param sink 接收数据，sink 抛出的异常会中止传输并原样抛出
     */
    virtual void get_archive(const std::string &container_id, const std::string &path, const archive_sink &sink) = 0;
};

}  // namespace sandbox::docker
