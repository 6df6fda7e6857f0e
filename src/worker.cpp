#include "worker.hpp"
#include <glog/logging.h>
#include <algorithm>
#include "common/exceptions.hpp"

namespace runner {
using namespace std;

worker_pool::worker_pool(const execution_engine &engine, size_t workers)
    : engine(engine) {
    workers = max<size_t>(workers, 1);
    for (size_t i = 0; i < workers; ++i)
        threads.emplace_back([this, i] { worker_loop(i); });
    LOG(INFO) << "Started " << workers << " worker(s)";
}

worker_pool::~worker_pool() {
    stop();
}

future<execution_result> worker_pool::submit(const execution_request &request) {
    auto promise = make_shared<std::promise<execution_result>>();
    auto result = promise->get_future();
    if (!task_queue.push({task_id++, request, promise}))
        throw internal_error("worker pool has been stopped");
    return result;
}

void worker_pool::stop() {
    task_queue.close();
    for (auto &thread : threads)
        if (thread.joinable()) thread.join();
}

size_t worker_pool::size() const {
    return threads.size();
}

void worker_pool::worker_loop(size_t worker_id) {
    LOG(INFO) << "Worker " << worker_id << " started";

    message::execution_task task;
    while (task_queue.pop(task)) {
        DLOG(INFO) << "Worker " << worker_id << " executing task " << task.id << " (" << task.request.language << ")";
        // execute 只在内存不足之类的情况下抛出异常
        try {
            task.result->set_value(engine.execute(task.request));
        } catch (std::exception &ex) {
            LOG(ERROR) << "Worker " << worker_id << " failed to deliver result of task " << task.id << ", " << ex.what();
            task.result->set_exception(current_exception());
        }
    }

    LOG(INFO) << "Worker " << worker_id << " stopped";
}

}  // namespace runner
