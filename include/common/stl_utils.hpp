#pragma once

#include <string>
#include <vector>

template <typename ContainerT>
void append(ContainerT &a, const ContainerT &b) {
    a.insert(a.end(), b.begin(), b.end());
}

template <typename ContainerA, typename ContainerB, typename TransformFn>
void append(ContainerA &a, const ContainerB &b, TransformFn &&fn) {
    for (auto &value : b) {
        a.push_back(fn(value));
    }
}

/**
 * @brief 计算字符串中 pos 位置所在的行号（从 1 开始）
 */
size_t line_of(const std::string &text, size_t pos);

/**
 * @brief 连续空白折叠为单个字符后的文本
 */
struct collapsed_text {
    std::string text;

    /**
     * @brief offsets[i] 为 text[i] 在原文中的位置
     */
    std::vector<size_t> offsets;
};

/**
 * @brief 将每一段连续空白折叠为一个字符，含换行的折叠为 '\n'，否则折叠为 ' '
 */
collapsed_text collapse_whitespace(const std::string &text);

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };

template <class... Ts>
overloaded(Ts...)->overloaded<Ts...>;
