#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "common/status.hpp"
#include "validator/validator.hpp"

namespace runner {

/**
 * @brief 一次代码执行请求
 */
struct execution_request {
    /**
     * @brief 源代码，最长 MAX_SOURCE_SIZE 字节
     */
    std::string code;

    /**
     * @brief 语言名，不区分大小写
     */
    std::string language;

    /**
     * @brief 标准输入数据，最长 MAX_STDIN_SIZE 字节
     */
    std::string input_data;

    /**
     * @brief 本次执行的时间限制（秒），小于等于 0 时使用引擎的默认值
     */
    double time_limit = -1;

    /**
     * @brief 本次执行的内存限制（MB），小于等于 0 时使用引擎的默认值
     */
    int memory_limit = -1;
};

/**
 * @brief 执行时的资源限制
 */
struct execution_limits {
    /**
     * @brief 编译和运行阶段各自的时钟时间限制，单位为秒
     */
    double time_limit;

    /**
     * @brief 内存限制，单位为 MB
     */
    int memory_limit;

    /**
     * @brief 文件大小限制，单位为 KB
     */
    int file_limit;

    int proc_limit;

    /**
     * @brief 输出保存上限，单位为 KB
     */
    int stream_size;

    /**
     * @brief 用请求中的限制覆盖默认值
     */
    execution_limits with(const execution_request &request) const;
};

/**
 * @brief 从全局配置读取默认的资源限制
 */
execution_limits default_limits();

/**
 * @brief 一次代码执行的结果
 * 调用方只根据 status 即可决定如何展示
 */
struct execution_result {
    std::string output;
    std::string error;

    /**
     * @brief 时钟时间，单位为秒；超时时等于时间限制
     */
    double execution_time = 0;

    runner::status status = runner::status::SYSTEM_ERROR;

    /**
     * @brief 程序的退出码，程序没有运行时为空
     */
    std::optional<int> exit_code;

    /**
     * @brief 杀死程序的信号，正常退出时为空
     */
    std::optional<int> signal;

    /**
     * @brief 静态检查的违规列表，只有 status 为 VALIDATION_ERROR 时非空
     */
    std::vector<violation> violations;

    /**
     * @brief 运行阶段的内存峰值，单位为 KB
     */
    int64_t memory_used = 0;

    /**
     * @brief 运行阶段的 CPU 时间，单位为秒
     */
    double cpu_time = 0;

    bool output_truncated = false;
    bool error_truncated = false;
};

void to_json(nlohmann::json &j, const violation &v);

void to_json(nlohmann::json &j, const execution_result &result);

/**
 * @brief 从批量模式的一行 JSON 中读取请求
 * @throw std::invalid_argument 缺少 code 或 language 字段
 */
void from_json(const nlohmann::json &j, execution_request &request);

}  // namespace runner
