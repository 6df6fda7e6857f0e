#pragma once

#include <map>
#include <optional>
#include <regex>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace runner {

/**
 * @brief 解释执行的语言，不需要编译阶段
 * 比如 Python、JavaScript、Ruby
 */
struct interpreted_family {
    /**
     * @brief 运行命令模板，比如 "python3 {source}"
     */
    std::string run_command;
};

/**
 * @brief 编译为本地可执行文件的语言
 * 比如 C、C++、Rust，编译产物为工作目录下的 program
 */
struct native_family {
    std::string compile_command;
    std::string run_command;
};

/**
 * @brief 编译为 JVM 字节码的语言
 * 源文件名必须和代码中唯一的 public 类型名一致
 */
struct jvm_family {
    std::string compile_command;
    std::string run_command;
};

typedef std::variant<interpreted_family, native_family, jvm_family> language_family;

/**
 * @brief 导入语句的语法，决定了静态检查如何从源代码中提取导入的模块名
 */
enum class import_syntax {
    PYTHON,      // import a, b.c / from a import b
    GO,          // import "x" / import ( "x" "y" )
    C_INCLUDE,   // #include <x> / #include "x"
    JAVA,        // import [static] a.b.C;
    RUST,        // use a::b; / extern crate a;
    JAVASCRIPT,  // require('x') / import ... from 'x' / import 'x'
    RUBY,        // require 'x' / require_relative 'x'
    PHP          // require/include[_once] 'x'
};

/**
 * @brief 允许导入的模块，比较顶层模块名（Python）或者完整导入路径（Go）
 */
struct allowed_imports {
    std::set<std::string> names;
};

/**
 * @brief 允许包含的头文件，完全匹配
 */
struct allowed_headers {
    std::set<std::string> names;
};

/**
 * @brief 允许导入的包前缀
 * 导入路径等于前缀，或者在分隔符（. 或 ::）处延续前缀时被接受
 */
struct allowed_packages {
    std::set<std::string> prefixes;
};

/**
 * @brief 允许 require 的模块，完全匹配
 * 参数不是字符串字面量的 require 一律拒绝
 */
struct allowed_requires {
    std::set<std::string> names;
};

typedef std::variant<allowed_imports, allowed_headers, allowed_packages, allowed_requires> import_rule;

/**
 * @brief 禁止出现在源代码中的模式
 */
struct denied_pattern {
    /**
     * @brief 正则表达式的原文，用于报告违规
     */
    std::string pattern;

    /**
     * @brief 违规时展示给用户的描述，比如 "eval"
     */
    std::string description;

    std::regex regex;
};

/**
 * @brief 构造一个禁止模式
 * @param pattern ECMAScript 正则表达式
 * @param description 违规描述
 */
denied_pattern deny(const std::string &pattern, const std::string &description);

struct deny_rule {
    std::vector<denied_pattern> patterns;
};

/**
 * @brief 语言的安全策略
 * 每种语言恰好有一条导入规则和一条禁止规则（可能为空）
 */
struct security_policy {
    import_rule imports;
    deny_rule denied;
};

/**
 * @brief 一种语言的编译、运行和安全配置
 * 在程序启动时加载，之后只读
 */
struct language_spec {
    /**
     * @brief 语言名，小写，比如 "python"、"cpp"
     */
    std::string name;

    /**
     * @brief 源文件后缀，包含 "."，比如 ".py"
     */
    std::string extension;

    language_family family;

    import_syntax syntax;

    security_policy policy;

    /**
     * @brief 容器后端使用的镜像
     */
    std::string container_image;

    /**
     * @brief 是否对程序设置地址空间上限
     * JVM、V8 和 Go 运行时启动时会预留大量虚拟内存，设置 RLIMIT_AS 会导致无法启动，
     * 这些语言的内存通过运行时参数（比如 -Xmx）以及 RLIMIT_DATA 限制。
     */
    bool limit_address_space = true;

    /**
     * @brief 不限制地址空间时，数据段上限在内存限制之外额外留给运行时的空间（MB）
     * 运行时自身的线程栈、JIT 代码和堆外缓冲区都计入数据段
     */
    int runtime_memory_overhead = 0;

    /**
     * @brief 运行时需要的环境变量模板，格式为 KEY=VALUE，支持与命令模板相同的占位符
     * 比如 "GOMEMLIMIT={memory}MiB"
     */
    std::vector<std::string> environment;

    /**
     * @brief 语言运行时需要的进程（线程）数下限，实际上限取该值与配置的较大者
     */
    int min_proc_limit = 0;

    /**
     * @brief 是否需要编译阶段，由语言族决定
     */
    bool needs_compile() const;

    bool is_jvm() const;

    /**
     * @brief 编译命令模板，解释型语言返回空
     */
    std::optional<std::string> compile_command() const;

    std::string run_command() const;
};

/**
 * @brief 命令模板中占位符的取值
 */
struct command_context {
    /**
     * @brief 源文件名（不含目录），替换 {source}
     */
    std::string source;

    /**
     * @brief JVM 主类名，替换 {class}
     */
    std::string main_class;

    /**
     * @brief 内存限制（MB），替换 {memory}
     */
    int memory_limit = 0;
};

/**
 * @brief 展开命令模板并按空白分割为参数列表
 * 命令不经过 shell 执行，因此模板中不能包含引号或者重定向
 * @param command 命令模板，比如 "g++ -O2 -o program {source}"
 * @param ctx 占位符的取值
 * @return argv
 */
std::vector<std::string> expand_command(const std::string &command, const command_context &ctx);

/**
 * @brief 展开环境变量模板，值中的空白保持不变
 */
std::vector<std::string> expand_environment(const std::vector<std::string> &environment, const command_context &ctx);

}  // namespace runner
