#pragma once

#include <string>
#include <vector>
#include "config.hpp"
#include "sandbox/sanitizer.hpp"

namespace sandbox {

/**
 * @brief 用户代码在容器工作目录中的文件名
 */
extern const char *ENTRY_PROGRAM_NAME;

/**
 * @brief turtle 模块在容器工作目录中的文件名
 * 用户代码 import turtle 时会优先加载工作目录中的这个文件，而不是标准库的 turtle
 */
extern const char *TURTLE_MODULE_NAME;

/**
 * @brief turtle 模块的源代码
 * 模拟 turtle 的基本绘图 API，记录线段，并在解释器正常退出时将线段写入 turtle.svg
 */
extern const char *TURTLE_MODULE_SOURCE;

/**
 * @brief 将用户代码、turtle 模块和附加文件打包为 tar 归档
 * 归档中的时间戳都为 0，相同输入得到相同的字节序列。
 * 附加文件的上级目录会作为目录条目加入归档，所有条目的属主为 config.run_user，
 * 以便用户程序可以修改这些文件。
 * @param code 已经通过 validate_code 检查的代码
 * @param files 已经通过 sanitize_files 检查的附加文件
 * @return tar 归档的字节序列
 */
std::string build_archive(const std::string &code, const std::vector<sanitized_file> &files, const runner_config &config);

}  // namespace sandbox
