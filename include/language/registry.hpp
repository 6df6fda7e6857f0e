#pragma once

#include <map>
#include <string>
#include <vector>
#include "language/language.hpp"

namespace runner {

/**
 * @brief 语言表，以小写语言名为键
 * 构造完成后只读，可以被多个执行线程同时访问
 */
struct language_registry {
    language_registry() = default;
    explicit language_registry(std::vector<language_spec> languages);

    /**
     * @brief 根据语言名查找语言配置，不区分大小写
     * @param name 语言名，比如 "Python"
     * @throw unsupported_language 语言不在表中
     */
    const language_spec &resolve(const std::string &name) const;

    bool contains(const std::string &name) const;

    /**
     * @brief 所有支持的语言名，按字典序排列
     */
    std::vector<std::string> supported_languages() const;

    /**
     * @brief 内置的语言表
     * 见 languages.cpp
     */
    static const language_registry &builtin();

private:
    std::map<std::string, language_spec> languages;
};

/**
 * @brief 内置语言的配置
 */
std::vector<language_spec> builtin_languages();

}  // namespace runner
