#pragma once

#include "sandbox/run_options.hpp"

namespace runner {

/**
 * @brief 根据传入的设置运行指定的程序，并等待其结束
 * 可以在多个线程中同时调用
 * 1. 创建 stdin、stdout、stderr 管道，以及一个 close-on-exec 的错误管道
 * 2. 调用 fork 创建子进程
 *    1. 对于子进程
 *       1. 通过 rlimit 限制地址空间（或数据段）、CPU 时间、文件大小、进程数，禁止 core dump
 *       2. 将子进程分离到一个独立的进程组，以便我们可以杀死进程组内所有进程
 *       3. 切换工作目录，重定向标准输入输出，清理环境变量后 exec
 *       4. 任何一步失败都会写入错误管道并以 127 退出
 *    2. 对于父进程
 *       1. 读取错误管道，若有数据则子进程启动失败
 *       2. 写入 stdin，读取 stdout 和 stderr，超出 stream_size 的部分被丢弃
 *       3. 超过时钟时间限制后先发送 SIGTERM，100ms 后发送 SIGKILL 给整个进程组
 *       4. 子进程结束后杀死进程组内残留的进程
 * 3. 通过 wait4 得到退出状态、CPU 时间和内存峰值
 *    若因为信号终止，且为 SIGXCPU 则 CPU 时间超限
 * @param opt 运行参数
 * @return 运行结果
 * @throw internal_error 无法创建管道、无法 fork，或者子进程无法启动命令
 */
run_result runit(const run_options &opt);

}  // namespace runner
