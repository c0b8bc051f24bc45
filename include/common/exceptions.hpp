#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <ostream>
#include <string>
#include <stdexcept>

namespace sandbox {

/**
 * @brief 运行失败的种类
 * 调用方根据种类决定返回给用户的状态码
 */
enum class error_kind {
    /**
     * @brief 用户输入不合法（代码过大、文件路径非法等），调用方修正输入后可以重试
     */
    VALIDATION,

    /**
     * @brief 沙箱当前无法提供服务（被禁用、容器引擎不可达、镜像拉取失败）
     */
    UNAVAILABLE,

    /**
     * @brief 运行已经开始但中途失败（上传失败、输出过大、引擎异常）
     */
    EXECUTION_FAILURE
};

const char *to_string(error_kind kind);

/**
 * @brief 将错误种类映射为 HTTP 状态码：400、503、500
 */
int http_status(error_kind kind);

struct sandbox_exception : std::exception {
    sandbox_exception();
    explicit sandbox_exception(const std::string &message);

    /**
     * @brief 输出异常信息以及抛出位置的调用栈，用于错误日志
     */
    friend std::ostream &operator<<(std::ostream &os, const sandbox_exception &ex);

    const char *what() const noexcept override;

    /**
     * @brief 该异常跨越沙箱边界时属于哪一类失败
     */
    virtual error_kind kind() const;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示用户提交的代码或附加文件不合法
 * 在创建任何容器之前抛出
 */
struct validation_error : public sandbox_exception {
    validation_error();
    explicit validation_error(const std::string &message);

    error_kind kind() const override;
};

/**
 * @brief 表示沙箱暂时不可用
 * 比如容器引擎的 socket 不存在、镜像无法拉取、运行器被管理员禁用
 */
struct runner_unavailable : public sandbox_exception {
    runner_unavailable();
    explicit runner_unavailable(const std::string &message);

    error_kind kind() const override;
};

/**
 * @brief 表示一次运行在执行过程中失败
 * 容器已经创建，引擎可达，但是操作失败
 */
struct runner_error : public sandbox_exception {
    runner_error();
    explicit runner_error(const std::string &message);

    error_kind kind() const override;
};

/**
 * @brief 表示网络错误，通常由 CURL 产生
 * 只在容器引擎客户端内部使用，不会跨越沙箱边界
 */
struct network_error : public sandbox_exception {
    network_error();
    explicit network_error(const std::string &message);

    error_kind kind() const override;
};

/**
 * @brief 表示容器引擎返回了错误的 HTTP 状态码
 */
struct engine_error : public sandbox_exception {
    engine_error(long status, const std::string &message);

    error_kind kind() const override;

    /**
     * @brief 容器引擎返回的 HTTP 状态码
     */
    long status;
};

}  // namespace sandbox
