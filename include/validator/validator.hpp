#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "language/language.hpp"

namespace runner {

/**
 * @brief 一次违规
 */
struct violation {
    /**
     * @brief 违规的代码片段，比如被拒绝的模块名 "os" 或者匹配到的 "eval("
     */
    std::string token;

    /**
     * @brief 违反的规则描述
     */
    std::string rule;

    /**
     * @brief 所在行号，从 1 开始
     */
    std::size_t line = 0;
};

std::string to_string(const violation &v);

bool operator==(const violation &a, const violation &b);

struct validation_result {
    bool valid = true;

    /**
     * @brief 所有违规，导入规则的违规在前，禁止规则的违规在后，各自按源代码顺序排列
     */
    std::vector<violation> violations;

    /**
     * @brief 所有违规的文字描述
     */
    std::vector<std::string> messages() const;
};

/**
 * @brief 从源代码中提取出的一次导入
 */
struct imported_name {
    /**
     * @brief 模块名、头文件名或者包路径
     */
    std::string name;

    std::size_t line = 0;

    /**
     * @brief 导入的目标是否为字符串字面量
     * 比如 require(name) 的参数是变量，无法静态确定导入的模块
     */
    bool literal = true;
};

/**
 * @brief 按照语言的导入语法提取所有导入
 * 纯文本分析，不解析语法，因此注释和字符串中的导入语句也会被提取
 * @param code 源代码
 * @param syntax 导入语法
 * @return 按源代码顺序排列的导入
 */
std::vector<imported_name> extract_imports(const std::string &code, import_syntax syntax);

/**
 * @brief 检查源代码的导入是否都在白名单中
 */
std::vector<violation> check_import_rule(const std::string &code, import_syntax syntax, const import_rule &rule);

/**
 * @brief 检查源代码中是否出现了禁止的模式
 * 与导入无关，直接在源代码原文上匹配
 */
std::vector<violation> check_deny_rule(const std::string &code, const deny_rule &rule);

/**
 * @brief 对源代码进行静态检查，收集所有违规而不是在第一处违规时停止
 * 静态检查只是第一道防线，真正的边界是运行时的资源限制
 * @param code 源代码
 * @param spec 语言配置
 */
validation_result validate(const std::string &code, const language_spec &spec);

}  // namespace runner
