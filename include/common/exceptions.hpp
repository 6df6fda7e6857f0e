#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace runner {

/**
 * @brief 执行引擎所有异常的基类
 * 构造时记录调用栈，便于在日志中定位错误来源
 */
struct runner_exception : std::exception {
    runner_exception();
    explicit runner_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const runner_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示执行引擎的内部错误
 * 比如无法创建子进程、无法写入源文件，与用户提交的代码无关
 */
struct internal_error : public runner_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 请求的语言不在语言表中
 * 在创建工作目录之前就会抛出
 */
struct unsupported_language : public runner_exception {
    const std::string language;

    explicit unsupported_language(const std::string &language);
};

/**
 * @brief 静态检查拒绝了用户代码
 */
struct validation_error : public runner_exception {
    const std::vector<std::string> violations;

    explicit validation_error(const std::vector<std::string> &violations);
};

/**
 * @brief Java 源代码中找不到 public 类型声明，无法确定源文件名
 */
struct no_public_type_found : public runner_exception {
    explicit no_public_type_found(const std::string &language);
};

/**
 * @brief 隔离后端不可用（比如容器运行时没有安装或者没有启动）
 */
struct backend_unavailable : public runner_exception {
    explicit backend_unavailable(const std::string &message);
};

}  // namespace runner
