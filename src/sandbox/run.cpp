#include "sandbox/run.hpp"
#include <errno.h>
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <string.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include <boost/algorithm/string/join.hpp>
#include <map>
#include <mutex>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "sandbox/limits.hpp"

extern char **environ;

namespace runner {
using namespace std;

const int BUF_SIZE = 4096;

const int PIPE_IN = 1;
const int PIPE_OUT = 0;

// 子进程退出后，最多再等待多久来读完管道中剩余的数据
const double DRAIN_TIMEOUT = 1.0;

// 等待子进程数据时的轮询间隔
const int POLL_INTERVAL_MS = 10;

template <typename... Args>
[[noreturn]] void error(int err, Args &&... args) {
    throw internal_error(fmt::format("{}: {}", fmt::format(args...), strerror(err)));
}

static void ignore_sigpipe() {
    static once_flag flag;
    call_once(flag, [] {
        // 子进程提前退出时，向 stdin 管道写入会触发 SIGPIPE
        struct sigaction sigact;
        memset(&sigact, 0, sizeof(sigact));
        sigact.sa_handler = SIG_IGN;
        if (sigaction(SIGPIPE, &sigact, nullptr) != 0)
            LOG(WARNING) << "could not ignore SIGPIPE: " << strerror(errno);
    });
}

static void close_fd(int &fd) {
    if (fd >= 0 && close(fd) != 0)
        LOG(WARNING) << "closing fd " << fd << ": " << strerror(errno);
    fd = -1;
}

static vector<string> build_environment(const run_options &opt) {
    map<string, string> vars;
    auto put = [&](const string &entry) {
        auto idx = entry.find('=');
        if (idx == string::npos) return;
        vars[entry.substr(0, idx)] = entry.substr(idx + 1);
    };

    if (opt.preserve_sys_env) {
        for (char **env = environ; env && *env; ++env) put(*env);
    } else {
        for (const char *key : {"PATH", "HOME", "LANG"}) {
            const char *value = getenv(key);
            if (value) vars[key] = value;
        }
    }

    for (auto &entry : opt.env) put(entry);

    vector<string> result;
    for (auto &[key, value] : vars) result.push_back(key + "=" + value);
    return result;
}

/**
 * 在 fork 之后、exec 之前运行，只能调用 async-signal-safe 的函数
 */
[[noreturn]] static void run_child(const run_options &opt, int child_pipefd[3][2], int errpipe[2], char **args, char **envp) {
    limit_failure failure;

    auto fail = [&](int stage) {
        failure.stage = stage;
        failure.err = errno;
        ssize_t ignored = write(errpipe[PIPE_IN], &failure, sizeof(failure));
        (void)ignored;
        _exit(127);
    };

    // 恢复默认的信号处理和信号掩码，忽略的信号会被 exec 继承
    {
        struct sigaction sigact;
        memset(&sigact, 0, sizeof(sigact));
        sigact.sa_handler = SIG_DFL;
        sigset_t emptymask;
        sigemptyset(&emptymask);
        if (sigaction(SIGPIPE, &sigact, nullptr) != 0 ||
            sigprocmask(SIG_SETMASK, &emptymask, nullptr) != 0)
            fail(STAGE_SIGNALS);
    }

    // 将管道连接到 stdin/stdout/stderr
    if (dup2(child_pipefd[0][PIPE_OUT], STDIN_FILENO) < 0 ||
        dup2(child_pipefd[1][PIPE_IN], STDOUT_FILENO) < 0 ||
        dup2(child_pipefd[2][PIPE_IN], STDERR_FILENO) < 0)
        fail(STAGE_REDIRECT);

    if (!set_restrictions(opt, failure)) {
        ssize_t ignored = write(errpipe[PIPE_IN], &failure, sizeof(failure));
        (void)ignored;
        _exit(127);
    }

    execvpe(args[0], args, envp);
    fail(STAGE_EXEC);
    _exit(127);
}

/**
 * @brief 读取一次管道数据，超出 stream_size 的部分被丢弃
 * @return 管道是否仍然打开
 */
static bool pump_pipe(int fd, int64_t stream_size, string &buffer, bool &truncated) {
    char buf[BUF_SIZE];
    while (true) {
        ssize_t nread = read(fd, buf, BUF_SIZE);
        if (nread == -1) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
            error(errno, "copying data from fd {}", fd);
        }
        if (nread == 0) return false;  // EOF

        size_t keep = nread;
        if (stream_size >= 0) {
            size_t room = buffer.size() < (size_t)stream_size ? stream_size - buffer.size() : 0;
            if (room < keep) {
                keep = room;
                /* Throw away data if we're at the output limit, but
                   keep draining so that the child does not block */
                if (!truncated) LOG(INFO) << "child fd " << fd << " limit reached";
                truncated = true;
            }
        }
        buffer.append(buf, keep);
    }
}

static void decode_status(int status, run_result &result) {
    if (WIFEXITED(status)) {
        result.exitcode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signal = WTERMSIG(status);
        result.exitcode = result.signal + 128;
        if (result.signal == SIGXCPU) {
            result.cpu_exceeded = true;
            LOG(WARNING) << "Time Limit Exceeded (cpu time)";
        } else if (!result.timed_out) {
            LOG(WARNING) << "Command terminated with signal (" << result.signal << ", " << strsignal(result.signal) << ")";
        }
    } else {
        throw internal_error(fmt::format("unknown status: {:x}", status));
    }
}

run_result runit(const run_options &opt) {
    if (opt.command.empty())
        throw internal_error("empty command");

    ignore_sigpipe();

#ifndef RLIMIT_NPROC
    if (opt.nproc > 0)
        LOG(WARNING) << "RLIMIT_NPROC is not supported on this platform, process count is not limited";
#endif

    // 在 fork 之前准备好 argv 和 envp，子进程中不能分配内存
    vector<string> command = opt.command;
    vector<char *> args;
    for (auto &arg : command) args.push_back(arg.data());
    args.push_back(nullptr);

    vector<string> environment = build_environment(opt);
    vector<char *> envp;
    for (auto &entry : environment) envp.push_back(entry.data());
    envp.push_back(nullptr);

    int child_pipefd[3][2] = {{-1, -1}, {-1, -1}, {-1, -1}};
    int errpipe[2] = {-1, -1};
    defer {
        for (auto &fds : child_pipefd) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
        close_fd(errpipe[0]);
        close_fd(errpipe[1]);
    };

    // 所有管道都设置 O_CLOEXEC，避免并发执行的其他子进程继承这些管道
    for (int i = 0; i < 3; i++) {
        if (pipe2(child_pipefd[i], O_CLOEXEC) != 0) error(errno, "creating pipe for fd {}", i);
    }
    if (pipe2(errpipe, O_CLOEXEC) != 0) error(errno, "creating error pipe");

    if (DEBUG)
        LOG(INFO) << "running " << boost::algorithm::join(opt.command, " ") << " in " << opt.work_dir;

    int status = 0;
    struct rusage usage;
    memset(&usage, 0, sizeof(usage));
    bool reaped = false;

    elapsed_time timer;
    pid_t child_pid = fork();
    if (child_pid == -1)
        error(errno, "unable to fork");
    if (child_pid == 0)
        run_child(opt, child_pipefd, errpipe, args.data(), envp.data());

    // 因为异常离开时，杀死并回收子进程
    defer {
        if (reaped) return;
        kill_process_group(child_pid);
        while (waitpid(child_pid, nullptr, 0) == -1 && errno == EINTR)
            ;
    };

    /* Close unused file descriptors */
    close_fd(child_pipefd[0][PIPE_OUT]);
    close_fd(child_pipefd[1][PIPE_IN]);
    close_fd(child_pipefd[2][PIPE_IN]);
    close_fd(errpipe[PIPE_IN]);

    {
        limit_failure failure;
        ssize_t nread;
        do {
            nread = read(errpipe[PIPE_OUT], &failure, sizeof(failure));
        } while (nread == -1 && errno == EINTR);

        if (nread > 0) {
            while (waitpid(child_pid, &status, 0) == -1 && errno == EINTR)
                ;
            reaped = true;
            throw internal_error(fmt::format("unable to start command {}: {}: {}",
                                             opt.command[0], limit_stage_name(failure.stage), strerror(failure.err)));
        }
    }

    int &stdin_fd = child_pipefd[0][PIPE_IN];
    int &stdout_fd = child_pipefd[1][PIPE_OUT];
    int &stderr_fd = child_pipefd[2][PIPE_OUT];
    for (int fd : {stdin_fd, stdout_fd, stderr_fd}) {
        int flags = fcntl(fd, F_GETFL);
        if (flags == -1 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1)
            error(errno, "fcntl, setting flags");
    }

    run_result result;
    size_t stdin_written = 0;
    if (opt.stdin_data.empty()) close_fd(stdin_fd);

    auto pump_outputs = [&](const struct pollfd *fds, size_t n) {
        for (size_t i = 0; i < n; ++i) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            if (fds[i].fd == stdout_fd && !pump_pipe(stdout_fd, opt.stream_size, result.output, result.output_truncated))
                close_fd(stdout_fd);
            else if (fds[i].fd == stderr_fd && !pump_pipe(stderr_fd, opt.stream_size, result.error, result.error_truncated))
                close_fd(stderr_fd);
        }
    };

    while (!reaped) {
        pid_t pid = wait4(child_pid, &status, WNOHANG, &usage);
        if (pid == -1 && errno != EINTR) error(errno, "waiting on child");
        if (pid == child_pid) {
            reaped = true;
            break;
        }

        double remaining = opt.wall_limit - timer.seconds();
        if (opt.wall_limit > 0 && remaining <= 0) {
            LOG(WARNING) << "timelimit exceeded (hard wall time): aborting command";
            result.timed_out = true;
            terminate_process_group(child_pid);
            while ((pid = wait4(child_pid, &status, 0, &usage)) == -1 && errno == EINTR)
                ;
            if (pid == -1) error(errno, "waiting on child");
            reaped = true;
            break;
        }

        struct pollfd fds[3];
        size_t n = 0;
        if (stdin_fd >= 0) fds[n++] = {stdin_fd, POLLOUT, 0};
        if (stdout_fd >= 0) fds[n++] = {stdout_fd, POLLIN, 0};
        if (stderr_fd >= 0) fds[n++] = {stderr_fd, POLLIN, 0};

        int timeout = POLL_INTERVAL_MS;
        if (opt.wall_limit > 0) timeout = max(1, (int)min<double>(timeout, remaining * 1000));
        int r = poll(fds, n, timeout);
        if (r == -1) {
            if (errno == EINTR) continue;
            error(errno, "waiting for child data");
        }
        if (r == 0) continue;

        for (size_t i = 0; i < n; ++i) {
            if (fds[i].fd != stdin_fd || !fds[i].revents) continue;
            if (fds[i].revents & (POLLERR | POLLHUP)) {
                // 子进程已经关闭了 stdin
                close_fd(stdin_fd);
                break;
            }
            ssize_t nwritten = write(stdin_fd, opt.stdin_data.data() + stdin_written, opt.stdin_data.size() - stdin_written);
            if (nwritten == -1) {
                if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) break;
                if (errno != EPIPE) LOG(WARNING) << "writing stdin of child: " << strerror(errno);
                close_fd(stdin_fd);
                break;
            }
            stdin_written += nwritten;
            if (stdin_written == opt.stdin_data.size()) close_fd(stdin_fd);
        }
        pump_outputs(fds, n);
    }

    result.wall_time = timer.seconds();

    // 子进程已经结束，杀死它 fork 出来的、仍然留在进程组里的进程
    kill_process_group(child_pid);
    close_fd(stdin_fd);

    elapsed_time drain_timer;
    while ((stdout_fd >= 0 || stderr_fd >= 0) && drain_timer.seconds() < DRAIN_TIMEOUT) {
        struct pollfd fds[2];
        size_t n = 0;
        if (stdout_fd >= 0) fds[n++] = {stdout_fd, POLLIN, 0};
        if (stderr_fd >= 0) fds[n++] = {stderr_fd, POLLIN, 0};
        int r = poll(fds, n, POLL_INTERVAL_MS);
        if (r == -1 && errno != EINTR) error(errno, "draining child data");
        if (r > 0) pump_outputs(fds, n);
    }
    if (stdout_fd >= 0 || stderr_fd >= 0)
        LOG(WARNING) << "output pipes of " << opt.command[0] << " are still open, some process escaped the process group";

    decode_status(status, result);
    result.cpu_time = usage.ru_utime.tv_sec + usage.ru_utime.tv_usec / 1e6 +
                      usage.ru_stime.tv_sec + usage.ru_stime.tv_usec / 1e6;
    result.memory = usage.ru_maxrss;
    return result;
}

}  // namespace runner
