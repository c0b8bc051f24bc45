#pragma once

#include <ctime>
#include <filesystem>
#include <string>

namespace sandbox {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 * @throw std::system_error 文件无法打开时
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 检查字符串是否是合法的 UTF-8 编码
 * 拒绝过长编码、代理对区间 (U+D800~U+DFFF) 以及超过 U+10FFFF 的码点
 */
bool utf8_check_is_valid(const std::string &string);

/**
 * @brief 将任意字节序列解码为合法的 UTF-8 字符串
 * 非法的字节序列（按最大非法子序列）被替换为 U+FFFD，不会抛出异常
 */
std::string utf8_decode_lossy(const std::string &bytes);

/**
 * @brief 合法 UTF-8 字符串的码点数
 */
size_t utf8_length(const std::string &string);

/**
 * @brief 保留合法 UTF-8 字符串的前 max_chars 个码点
 */
std::string utf8_prefix(const std::string &string, size_t max_chars);

time_t last_write_time(const std::filesystem::path &path);

}  // namespace sandbox
