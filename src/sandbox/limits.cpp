#include "sandbox/limits.hpp"
#include <glog/logging.h>
#include <errno.h>
#include <math.h>
#include <signal.h>
#include <string.h>
#include <sys/resource.h>
#include <time.h>
#include <unistd.h>
#include <algorithm>

namespace runner {
using namespace std;

const struct timespec killdelay = {0, 100000000L};  // 0.1s

// RLIMIT_CPU 的上限，单位为秒
const double MAX_CPU_SECONDS = 1e9;

const char *limit_stage_name(int stage) {
    switch (stage) {
        case STAGE_RLIMIT_CPU: return "setrlimit(RLIMIT_CPU)";
        case STAGE_RLIMIT_AS: return "setrlimit(RLIMIT_AS)";
        case STAGE_RLIMIT_DATA: return "setrlimit(RLIMIT_DATA)";
        case STAGE_RLIMIT_FSIZE: return "setrlimit(RLIMIT_FSIZE)";
        case STAGE_RLIMIT_NPROC: return "setrlimit(RLIMIT_NPROC)";
        case STAGE_RLIMIT_CORE: return "setrlimit(RLIMIT_CORE)";
        case STAGE_SETSID: return "setsid";
        case STAGE_CHDIR: return "chdir";
        case STAGE_REDIRECT: return "redirect";
        case STAGE_SIGNALS: return "reset signals";
        case STAGE_EXEC: return "exec";
        default: return "unknown";
    }
}

static bool set_rlimit(int resource, rlim_t cur, rlim_t max, int stage, limit_failure &failure) noexcept {
    struct rlimit lim;
    lim.rlim_cur = cur;
    lim.rlim_max = max;
    if (setrlimit(resource, &lim) != 0) {
        failure.stage = stage;
        failure.err = errno;
        return false;
    }
    return true;
}

bool set_restrictions(const run_options &opt, limit_failure &failure) noexcept {
    if (opt.cpu_limit > 0) {
        /* Setting the real hard limit one second
           higher: at the soft limit the kernel will send SIGXCPU at
           the hard limit a SIGKILL. The SIGXCPU can be caught, but is
           not by default and gives us a reliable way to detect if the
           CPU-time limit was reached. */
        rlim_t cputime_limit = (rlim_t)min(ceil(opt.cpu_limit), MAX_CPU_SECONDS);
        if (!set_rlimit(RLIMIT_CPU, cputime_limit, cputime_limit + 1, STAGE_RLIMIT_CPU, failure))
            return false;
    }

    if (opt.memory_limit > 0 &&
        !set_rlimit(RLIMIT_AS, opt.memory_limit, opt.memory_limit, STAGE_RLIMIT_AS, failure))
        return false;

    if (opt.data_limit > 0 &&
        !set_rlimit(RLIMIT_DATA, opt.data_limit, opt.data_limit, STAGE_RLIMIT_DATA, failure))
        return false;

    if (opt.file_limit > 0 &&
        !set_rlimit(RLIMIT_FSIZE, opt.file_limit, opt.file_limit + 1, STAGE_RLIMIT_FSIZE, failure))
        return false;

#ifdef RLIMIT_NPROC
    if (opt.nproc > 0 &&
        !set_rlimit(RLIMIT_NPROC, opt.nproc, opt.nproc, STAGE_RLIMIT_NPROC, failure))
        return false;
#endif

    if (opt.no_core_dumps &&
        !set_rlimit(RLIMIT_CORE, 0, 0, STAGE_RLIMIT_CORE, failure))
        return false;

    // run the command in a separate process group,
    // so the command and all its child processes can be killed
    // off with one signal
    if (setsid() == -1) {
        failure = {STAGE_SETSID, errno};
        return false;
    }

    if (!opt.work_dir.empty() && chdir(opt.work_dir.c_str()) != 0) {
        failure = {STAGE_CHDIR, errno};
        return false;
    }

    return true;
}

void terminate_process_group(pid_t pgid) {
    LOG(INFO) << "sending SIGTERM to process group " << pgid;
    if (kill(-pgid, SIGTERM) != 0 && errno != ESRCH)
        LOG(ERROR) << "unable to send SIGTERM to process group " << pgid << ": " << strerror(errno);

    /* Prefer nanosleep over sleep because of higher resolution and
       it does not interfere with signals. */
    nanosleep(&killdelay, nullptr);

    kill_process_group(pgid);
}

void kill_process_group(pid_t pgid) {
    if (kill(-pgid, SIGKILL) != 0 && errno != ESRCH)
        LOG(ERROR) << "unable to send SIGKILL to process group " << pgid << ": " << strerror(errno);
}

}  // namespace runner
