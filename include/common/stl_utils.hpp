#pragma once

/**
 * @brief 配合 std::visit 使用，将多个 lambda 合并为一个重载集
 * @code{.cpp}
 *     std::visit(overloaded{
 *         [](const run_result &result) { ... },
 *         [](const run_failure &failure) { ... }}, outcome);
 * @endcode
 */
template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };

template <class... Ts>
overloaded(Ts...)->overloaded<Ts...>;
