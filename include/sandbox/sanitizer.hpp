#pragma once

#include <string>
#include <vector>
#include "config.hpp"
#include "sandbox/request.hpp"

namespace sandbox {

struct sanitized_file;

/**
 * @brief 检查附加文件的数量、大小和路径
 * 纯函数，没有副作用；任何一项不满足都会立即失败
 * @param files 调用方提交的附加文件
 * @param config 提供 max_files 和 max_file_bytes
 * @return 检查通过的附加文件，顺序与输入一致
 * @throw validation_error 数量过多、内容过大或路径不安全
 */
std::vector<sanitized_file> sanitize_files(const std::vector<raw_file> &files, const runner_config &config);

/**
 * @brief 检查用户代码
 * @throw validation_error 代码为空、不是合法文本或超过 max_code_bytes
 */
void validate_code(const std::string &code, const runner_config &config);

/**
 * @brief 规范化并检查附加文件路径
 * 路径必须是相对路径，不能包含 ".." 段，且只能由字母、数字、'.'、'-'、'_'、'/' 组成，
 * 并以字母或数字开头。反斜杠被视为 '/'。
 * @return 规范化后的路径
 * @throw validation_error 路径不安全
 */
std::string safe_path(const std::string &path);

/**
 * @brief 通过检查的附加文件
 * 只能由 sanitize_files 构造：path 一定是安全的相对路径，content 一定不超过字节上限
 */
struct sanitized_file {
    const std::string &path() const;

    const std::string &content() const;

private:
    sanitized_file(std::string path, std::string content);

    friend std::vector<sanitized_file> sanitize_files(const std::vector<raw_file> &files, const runner_config &config);

    std::string file_path;
    std::string file_content;
};

}  // namespace sandbox
