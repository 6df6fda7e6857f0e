#pragma once

#include <sys/types.h>
#include "sandbox/run_options.hpp"

namespace runner {

/**
 * @brief 子进程设置限制时失败的步骤及 errno
 * 由子进程写入错误管道，父进程读取后报告
 */
struct limit_failure {
    int stage = 0;
    int err = 0;
};

enum limit_stage {
    STAGE_RLIMIT_CPU = 1,
    STAGE_RLIMIT_AS,
    STAGE_RLIMIT_DATA,
    STAGE_RLIMIT_FSIZE,
    STAGE_RLIMIT_NPROC,
    STAGE_RLIMIT_CORE,
    STAGE_SETSID,
    STAGE_CHDIR,
    STAGE_REDIRECT,
    STAGE_SIGNALS,
    STAGE_EXEC
};

const char *limit_stage_name(int stage);

/**
 * Limit current process resources usage.
 *
 * Called in the forked child before exec, so only async-signal-safe
 * functions may be used here. On failure the failing stage and errno
 * are stored in failure and false is returned.
 *
 * The command is put in a separate session, so the command and all its
 * child processes can be killed off with one signal.
 */
bool set_restrictions(const run_options &opt, limit_failure &failure) noexcept;

/**
 * Kill a whole process group: first try to kill graciously, then hard.
 * Don't report an already exited process group as error.
 */
void terminate_process_group(pid_t pgid);

/**
 * Send SIGKILL to every process left in the process group.
 */
void kill_process_group(pid_t pgid);

}  // namespace runner
