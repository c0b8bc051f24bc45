#pragma once

#include <string>
#include <vector>
#include "config.hpp"
#include "sandbox/request.hpp"

namespace sandbox {

/**
 * @brief 输出被截断时追加在末尾的标记
 */
extern const char *TRUNCATION_MARKER;

/**
 * @brief 读取 stdout、stderr 时每个流最多保留的字节数
 * 足够容纳 max_chars + 1 个码点，max_chars 过大时饱和为 SIZE_MAX
 */
size_t output_byte_limit(size_t max_chars);

/**
 * @brief 将用户程序的输出解码为文本并截断
 * 非法的 UTF-8 字节被替换为 U+FFFD，不会抛出异常。
 * 超过 max_chars 个码点时保留前 max_chars 个码点并追加 TRUNCATION_MARKER。
 * @param bytes stdout 或 stderr 的原始字节
 * @param overflowed 原始字节在读取时是否已经被丢弃了一部分
 */
std::string truncate_output(const std::string &bytes, size_t max_chars, bool overflowed = false);

/**
 * @brief 根据扩展名推断文件的媒体类型，不区分大小写
 */
std::string mime_for(const std::string &path);

/**
 * @brief 将容器 /tmp 归档中的条目名转换为相对于工作目录的路径
 * 去掉开头的 "./" 和 "/"，再去掉 "tmp/" 前缀。
 */
std::string output_name(const std::string &entry_name);

/**
 * @brief 有大小上限的归档接收缓冲区
 * 作为 docker::archive_sink 使用，累计字节数超过上限时中止传输
 */
struct archive_buffer {
    explicit archive_buffer(size_t limit);

    /**
     * @throw runner_error 累计字节数超过上限
     */
    void append(const char *data, size_t size);

    const std::string &data() const;

private:
    size_t limit;
    std::string buffer;
};

/**
 * @brief 从用户程序运行结束后的 /tmp 归档中提取输出文件
 * 跳过非普通文件、main.py 和 turtle.py；最多收集 config.max_files 个文件，
 * 每个文件最多保留 config.max_file_bytes 字节。
 * @throw runner_error 归档格式损坏
 */
std::vector<output_file> collect_files(const std::string &archive, const runner_config &config);

}  // namespace sandbox
