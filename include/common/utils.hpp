#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace sandbox {

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 根据 key 来查找环境变量
 * @return 环境变量的值，不存在时返回 std::nullopt
 */
std::optional<std::string> get_env(const std::string &key);

/**
 * @brief 设置环境变量
 * @param key 环境变量的键
 * @param value 环境变量的值
 * @param replace 若为真，则覆盖已有的环境变量值
 */
void set_env(const std::string &key, const std::string &value, bool replace = true);

/**
 * @brief 删除环境变量
 */
void unset_env(const std::string &key);

/**
 * @brief 将 "1"、"true"、"yes"、"on"（不区分大小写）解释为真
 */
bool parse_bool(const std::string &value);

/**
 * @brief 计时器，使用单调时钟，不受系统时间调整影响
 */
struct elapsed_time {

    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace sandbox
