#pragma once

#include <ctime>
#include <filesystem>
#include <functional>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>

namespace sandbox {

/**
 * @brief 默认的容器引擎控制 socket 地址
 */
extern const char *DEFAULT_DOCKER_HOST;

/**
 * @brief Python 运行器的全部配置
 * 配置的来源优先级：默认值 < 配置文件 < 环境变量 < 命令行参数
 */
struct runner_config {
    /**
     * @brief 管理员是否启用了运行器，为 false 时所有运行请求返回 runner_unavailable
     */
    bool enabled = true;

    /**
     * @brief 运行用户代码的镜像，必须包含 python 以及 coreutils 的 timeout
     */
    std::string image = "python:3.12-slim";

    /**
     * @brief 是否在每次运行前拉取镜像
     */
    bool auto_pull = false;

    /**
     * @brief 容器引擎的地址，支持 unix:///path、/path、tcp://host:port
     */
    std::string docker_host = DEFAULT_DOCKER_HOST;

    /**
     * @brief 容器引擎 API 版本，比如 v1.41；为空或 auto 时不带版本前缀
     */
    std::string docker_api_version = "auto";

    /**
     * @brief 用户程序的墙上时钟时间限制（秒）
     */
    unsigned timeout_sec = 3;

    unsigned memory_mb = 128;

    /**
     * @brief CPU 限制，单位为核心数，可以是小数
     */
    double cpus = 0.5;

    /**
     * @brief 容器内最大进程（线程）数
     */
    unsigned pids_limit = 64;

    /**
     * @brief /tmp 内存文件系统的大小限制（MB）
     */
    unsigned tmpfs_mb = 16;

    /**
     * @brief stdout、stderr 各自最多保留的字符数
     */
    size_t max_output_chars = 20000;

    size_t max_code_bytes = 20000;

    /**
     * @brief 输入附加文件以及输出文件的最大数量
     */
    size_t max_files = 10;

    /**
     * @brief 单个输入附加文件以及单个输出文件的最大字节数
     */
    size_t max_file_bytes = 65536;

    /**
     * @brief 从容器取回的 /tmp 归档的最大字节数
     */
    size_t max_archive_bytes = 5 * 1024 * 1024;

    /**
     * @brief 容器内运行用户，格式为 uid:gid，必须是非特权的数字用户
     */
    std::string run_user = "65534:65534";

    /**
     * @brief 从环境变量 RUNNER_* 覆盖配置
     * @throw std::invalid_argument 环境变量的值无法解析
     */
    void apply_environment();

    /**
     * @brief 检查配置取值是否合理
     * @throw std::invalid_argument 配置不合理
     */
    void validate() const;

    /**
     * @brief 解析 run_user 中的 uid 和 gid
     */
    unsigned run_uid() const;
    unsigned run_gid() const;
};

void from_json(const nlohmann::json &j, runner_config &config);

void to_json(nlohmann::json &j, const runner_config &config);

/**
 * @brief 依次应用配置文件和环境变量得到配置
 * @param config_path 配置文件路径，为空时只使用默认值和环境变量
 */
runner_config load_config(const std::filesystem::path &config_path);

/**
 * @brief 带修改时间的配置缓存
 * 配置文件被修改后，下一次 refresh_if_stale 会重新加载配置。
 * 该对象由调用方持有并按引用传递，可以被多个线程同时使用。
 */
struct config_cache {
    /**
     * @param path 配置文件路径，为空时不读取文件
     * @param overrides 在每次加载后应用的覆盖（通常来自命令行参数）
     */
    explicit config_cache(const std::filesystem::path &path, std::function<void(runner_config &)> overrides = nullptr);

    /**
     * @brief 如果配置文件的修改时间发生变化，则重新加载配置
     * 重新加载失败时保留旧配置并记录日志
     * @return 是否重新加载了配置
     */
    bool refresh_if_stale();

    /**
     * @brief 当前配置的副本
     */
    runner_config get() const;

    /**
     * @brief 当前配置对应的配置文件修改时间
     */
    time_t source_mtime() const;

private:
    runner_config load() const;

    std::filesystem::path path;
    std::function<void(runner_config &)> overrides;
    mutable std::mutex mut;
    runner_config value;
    time_t mtime;
};

}  // namespace sandbox
