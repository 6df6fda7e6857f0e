#pragma once

#include <atomic>
#include <future>
#include <thread>
#include <vector>
#include "common/concurrent_queue.hpp"
#include "common/messages.hpp"
#include "engine/engine.hpp"

/**
 * 执行服务相关函数
 * 主线程通过 submit 把请求放入任务队列，worker 线程不断从队列中取出任务，
 * 调用执行引擎并通过 promise 返回结果。
 * 同时运行的执行数量不会超过 worker 数量。
 */
namespace runner {

struct worker_pool {
    /**
     * @brief 启动 worker 线程
     * @param engine 执行引擎，生命周期必须长于 worker_pool
     * @param workers worker 线程数，至少为 1
     */
    worker_pool(const execution_engine &engine, std::size_t workers);

    worker_pool(const worker_pool &) = delete;
    worker_pool &operator=(const worker_pool &) = delete;

    /**
     * @brief 停止所有的 worker
     */
    ~worker_pool();

    /**
     * @brief 提交一个执行请求
     * @return 执行结果的 future
     * @throw internal_error worker 已经停止
     */
    std::future<execution_result> submit(const execution_request &request);

    /**
     * @brief 停止所有的 worker
     * 调用该函数后不再接受新请求，已经在队列中的请求会执行完成，然后等待所有线程退出。
     * 可以重复调用
     */
    void stop();

    std::size_t size() const;

private:
    void worker_loop(std::size_t worker_id);

    const execution_engine &engine;
    concurrent_queue<message::execution_task> task_queue;
    std::vector<std::thread> threads;
    std::atomic<std::size_t> task_id{0};
};

}  // namespace runner
