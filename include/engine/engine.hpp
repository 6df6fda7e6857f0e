#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "engine/backend.hpp"
#include "engine/execution.hpp"
#include "language/registry.hpp"
#include "validator/validator.hpp"

namespace runner {

/**
 * @brief 代码执行引擎
 * 语言表只读，后端线程安全，因此同一个引擎可以被多个线程同时调用
 */
struct execution_engine {
    /**
     * @param registry 语言表，生命周期必须长于引擎
     * @param backend 隔离后端
     * @param run_dir 工作目录的根目录
     * @param defaults 请求没有指定限制时使用的默认限制
     */
    execution_engine(const language_registry &registry, std::unique_ptr<isolation_backend> &&backend, std::filesystem::path run_dir, execution_limits defaults);

    /**
     * @brief 执行一次请求
     * 1. 检查代码和输入的长度以及编码
     * 2. 查找语言配置
     * 3. 静态检查，不通过时不会创建工作目录，也不会启动任何进程
     * 4. 创建工作目录并写入源文件
     * 5. 通过隔离后端编译并运行
     * 6. 转换结果，删除工作目录
     * 所有异常都会被转换为执行结果，调用方不会收到异常
     */
    execution_result execute(const execution_request &request) const;

    /**
     * @brief 只进行静态检查，不执行代码
     * @throw unsupported_language 语言不在表中
     */
    validation_result validate(const std::string &code, const std::string &language) const;

    std::vector<std::string> supported_languages() const;

    const isolation_backend &backend() const;

private:
    execution_result execute_checked(const execution_request &request) const;

    const language_registry &registry;
    std::unique_ptr<isolation_backend> isolation;
    std::filesystem::path run_dir;
    execution_limits defaults;
};

}  // namespace runner
