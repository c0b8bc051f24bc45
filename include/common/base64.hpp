#pragma once

#include <string>

namespace sandbox {

/**
 * @brief 标准 Base64 编码（RFC 4648，带 '=' 填充，不换行）
 */
std::string base64_encode(const std::string &bytes);

/**
 * @brief 标准 Base64 解码
 * @throw std::invalid_argument 输入不是合法的 Base64
 */
std::string base64_decode(const std::string &text);

}  // namespace sandbox
