#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "common/exceptions.hpp"

namespace sandbox {

/**
 * @brief 调用方提交的附加文件，未经检查
 */
struct raw_file {
    /**
     * @brief 相对于容器工作目录的路径
     */
    std::string path;

    std::string content;
};

/**
 * @brief 一次运行请求
 * 运行请求在通过 sanitize_files 和 validate_code 检查之前不可信
 */
struct run_request {
    /**
     * @brief 用户提交的 Python 代码
     */
    std::string code;

    /**
     * @brief 用户代码可以读取的附加文件，按提交顺序排列
     */
    std::vector<raw_file> files;
};

/**
 * @brief 从 JSON 解析运行请求
 * 格式为 {"code": str, "files": [{"path": str, "content": str}]}
 * @throw validation_error JSON 结构不符合要求
 */
void from_json(const nlohmann::json &j, run_request &request);

/**
 * @brief 用户程序生成的一个文件
 */
struct output_file {
    /**
     * @brief 相对于容器工作目录的路径
     */
    std::string path;

    /**
     * @brief 返回的内容字节数（截断之后）
     */
    size_t size;

    /**
     * @brief 根据扩展名推断的媒体类型
     */
    std::string mime;

    std::string content_base64;
};

/**
 * @brief 一次运行的结果
 * 超时不是错误：timed_out 为 true 时 stdout_text 和 stderr_text 仍然包含已经捕获的输出
 */
struct run_result {
    std::string stdout_text;

    std::string stderr_text;

    /**
     * @brief 用户程序的退出码，引擎没有报告退出码时为空
     * 被强制杀死时为 137
     */
    std::optional<int> exit_code;

    bool timed_out = false;

    /**
     * @brief 从创建容器开始到容器被删除为止经过的毫秒数
     */
    long long duration_ms = 0;

    std::vector<output_file> files;
};

void to_json(nlohmann::json &j, const output_file &file);

void to_json(nlohmann::json &j, const run_result &result);

/**
 * @brief 一次失败的运行
 */
struct run_failure {
    error_kind kind;

    std::string message;
};

void to_json(nlohmann::json &j, const run_failure &failure);

/**
 * @brief 运行的结果或者失败原因，调用方通过 std::visit 穷举处理
 */
using run_outcome = std::variant<run_result, run_failure>;

}  // namespace sandbox
