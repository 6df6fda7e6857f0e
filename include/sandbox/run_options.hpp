#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace runner {

/**
 * @brief 启动受限子进程的参数
 */
struct run_options {
    /**
     * @brief 要执行的命令及其参数，不经过 shell
     * command[0] 在 PATH 中查找
     */
    std::vector<std::string> command;

    /**
     * @brief 子进程的工作目录
     */
    std::filesystem::path work_dir;

    /**
     * @brief 通过管道写入子进程 stdin 的数据
     */
    std::string stdin_data;

    /**
     * @brief 时钟时间限制，单位为秒，超时后杀死整个进程组
     */
    double wall_limit = 0;

    /**
     * @brief CPU 时间限制，单位为秒，小于等于 0 表示不限制
     * 软限制为向上取整的秒数，硬限制比软限制多 1 秒，
     * 到达软限制时内核发送 SIGXCPU，到达硬限制时发送 SIGKILL
     */
    double cpu_limit = 0;

    /**
     * @brief 地址空间上限，单位为字节，小于等于 0 表示不限制
     */
    int64_t memory_limit = -1;

    /**
     * @brief 数据段上限（RLIMIT_DATA），单位为字节，小于等于 0 表示不限制
     * 只统计可写的私有映射，不统计 PROT_NONE 的预留，
     * 因此适用于启动时预留大量虚拟内存的运行时
     */
    int64_t data_limit = -1;

    /**
     * @brief 能写入的单个文件大小上限，单位为字节，小于等于 0 表示不限制
     */
    int64_t file_limit = -1;

    /**
     * @brief 进程数上限，小于等于 0 表示不限制
     * 注意 RLIMIT_NPROC 统计的是当前用户的所有进程
     */
    int nproc = -1;

    bool no_core_dumps = true;

    /**
     * @brief stdout 和 stderr 各自最多保存的字节数，小于 0 表示不限制
     */
    int64_t stream_size = -1;

    /**
     * @brief 是否保留当前进程的全部环境变量
     * 否则只保留 PATH、HOME 和 LANG
     */
    bool preserve_sys_env = false;

    /**
     * @brief 额外的环境变量，格式为 KEY=VALUE
     */
    std::vector<std::string> env;
};

/**
 * @brief 子进程的运行结果
 */
struct run_result {
    /**
     * @brief 退出码，被信号杀死时为 128 + 信号值
     */
    int exitcode = 0;

    /**
     * @brief 杀死子进程的信号，正常退出时为 0
     */
    int signal = 0;

    /**
     * @brief 是否因为时钟时间超限被杀死
     */
    bool timed_out = false;

    /**
     * @brief 是否因为 CPU 时间超限被杀死（SIGXCPU）
     */
    bool cpu_exceeded = false;

    /**
     * @brief 时钟时间，单位为秒
     */
    double wall_time = 0;

    /**
     * @brief 用户态和内核态 CPU 时间之和，单位为秒
     */
    double cpu_time = 0;

    /**
     * @brief 内存峰值（RSS），单位为 KB
     */
    int64_t memory = 0;

    std::string output;
    std::string error;
    bool output_truncated = false;
    bool error_truncated = false;

    bool succeeded() const {
        return !timed_out && !cpu_exceeded && signal == 0 && exitcode == 0;
    }
};

}  // namespace runner
