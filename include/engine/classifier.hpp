#pragma once

#include "engine/backend.hpp"
#include "engine/execution.hpp"

namespace runner {

/**
 * @brief 将隔离后端的原始结果转换为执行结果
 * 1. 后端出错：SYSTEM_ERROR
 * 2. 编译超时：TIMEOUT
 * 3. 编译器以非零退出码结束：COMPILATION_ERROR，编译器输出保存在 error 中
 * 4. 运行超时（时钟时间超限或者收到 SIGXCPU）：TIMEOUT，执行时间等于时间限制
 * 5. 程序以非零退出码结束或者被信号杀死：RUNTIME_ERROR
 * 6. 否则为 SUCCESS
 * 静态检查拒绝的代码不会到达这里
 */
execution_result classify(const raw_outcome &outcome, const execution_limits &limits);

}  // namespace runner
