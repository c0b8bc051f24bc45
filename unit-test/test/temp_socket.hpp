#pragma once

#include <filesystem>

namespace sandbox::test {

/**
 * @brief 在临时目录中创建一个正在监听的 Unix socket 文件，析构时删除
 * 用于测试 socket 文件检查，不会接受任何连接
 */
struct temp_socket {
    explicit temp_socket(const std::filesystem::path &path);
    ~temp_socket();

    temp_socket(const temp_socket &) = delete;
    temp_socket &operator=(const temp_socket &) = delete;

    const std::filesystem::path path;

private:
    int fd;
};

}  // namespace sandbox::test
