#pragma once

#include <future>
#include <memory>
#include "engine/execution.hpp"

namespace runner::message {

/**
 * @brief 提交给 worker 的执行任务
 */
struct execution_task {
    /**
     * @brief 任务的序号，用于日志
     */
    std::size_t id;

    execution_request request;

    /**
     * @brief worker 执行完成后通过 promise 返回结果
     */
    std::shared_ptr<std::promise<execution_result>> result;
};

}  // namespace runner::message
