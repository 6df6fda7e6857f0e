#pragma once

#include <string>

namespace runner {

/**
 * @brief 表示一次代码执行的结果状态
 * 这是一个封闭的枚举，调用方仅根据这个状态即可决定如何展示结果
 */
enum class status {
    /**
     * @brief 程序正常结束且退出码为 0
     */
    SUCCESS = 0,

    /**
     * @brief 编译器以非零退出码结束，或者源代码不满足语言的结构要求
     * 此时不会运行程序，编译器的输出保存在 error 中
     */
    COMPILATION_ERROR = 1,

    /**
     * @brief 程序以非零退出码结束，或者因为信号崩溃
     * 内存超限时，分配失败导致的崩溃也会被报告为运行时错误
     */
    RUNTIME_ERROR = 2,

    /**
     * @brief 程序运行时间超出限制，已经被强制终止
     * 包括时钟时间超限和 CPU 时间超限（SIGXCPU）
     */
    TIMEOUT = 3,

    /**
     * @brief 静态检查拒绝了代码，程序没有被编译或运行
     */
    VALIDATION_ERROR = 4,

    /**
     * @brief 内部错误，与用户代码无关
     * 比如无法创建子进程、无法写入源文件、容器运行时不可用、语言不受支持
     */
    SYSTEM_ERROR = 5
};

/**
 * @brief 获得状态在 JSON 中的名称，比如 "compilation_error"
 */
const char *get_status_name(status);

}  // namespace runner
