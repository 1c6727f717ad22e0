#pragma once

namespace grader {

/**
 * @brief 配合 std::visit 使用，将多个 lambda 组合为一个 visitor
 */
template <typename... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

template <typename... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

}  // namespace grader
