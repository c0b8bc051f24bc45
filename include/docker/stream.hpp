#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace sandbox::docker {

/**
 * @brief 解码容器引擎的 stdout/stderr 多路复用流
 * 引擎在非 TTY 模式下将输出分帧：每帧以 8 字节头开始，
 * 第 1 字节为流编号（0 stdin、1 stdout、2 stderr），第 5~8 字节为大端序的负载长度。
 * 数据可以分多次喂入，帧可以跨越多次 feed。
 */
struct stream_demuxer {
    /**
     * @param limit 每个流最多保留的字节数，超出部分被丢弃并标记 overflowed
     */
    explicit stream_demuxer(size_t limit = SIZE_MAX);

    void feed(const char *data, size_t size);

    void feed(const std::string &data);

    std::string stdout_bytes;
    std::string stderr_bytes;

    /**
     * @brief 是否有输出因为超过 limit 而被丢弃
     */
    bool stdout_overflowed = false;
    bool stderr_overflowed = false;

private:
    void append(uint8_t stream, const char *data, size_t size);

    size_t limit;
    std::string header;
    uint8_t current_stream = 1;
    size_t remaining = 0;
};

}  // namespace sandbox::docker
