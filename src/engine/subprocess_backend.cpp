#include <glog/logging.h>
#include <algorithm>
#include "engine/backend.hpp"
#include "sandbox/run.hpp"

namespace runner {
using namespace std;

// 编译器本身需要较大的地址空间，编译阶段的地址空间和数据段上限不低于该值（MB）
const int COMPILE_MEMORY_FLOOR = 2048;

string subprocess_backend::name() const {
    return "subprocess";
}

run_options subprocess_backend::make_options(const workspace &ws, const language_spec &spec, const execution_limits &limits, const string &command, const string &input) {
    command_context ctx{ws.source_name(), ws.main_class(), limits.memory_limit};
    run_options opt;
    opt.command = expand_command(command, ctx);
    opt.env = expand_environment(spec.environment, ctx);
    opt.work_dir = ws.dir();
    opt.stdin_data = input;
    opt.wall_limit = limits.time_limit;
    opt.cpu_limit = limits.time_limit;
    if (spec.limit_address_space)
        opt.memory_limit = (int64_t)limits.memory_limit << 20;
    else
        opt.data_limit = (int64_t)(limits.memory_limit + spec.runtime_memory_overhead) << 20;
    opt.file_limit = (int64_t)limits.file_limit << 10;
    if (limits.proc_limit > 0)
        opt.nproc = max(limits.proc_limit, spec.min_proc_limit);
    opt.no_core_dumps = true;
    opt.stream_size = (int64_t)limits.stream_size << 10;
    return opt;
}

raw_outcome subprocess_backend::run(const workspace &ws, const language_spec &spec, const execution_limits &limits, const string &input) const {
    raw_outcome outcome;

    if (auto compile_command = spec.compile_command()) {
        run_options opt = make_options(ws, spec, limits, *compile_command, "");
        if (opt.memory_limit > 0)
            opt.memory_limit = max<int64_t>(opt.memory_limit, (int64_t)COMPILE_MEMORY_FLOOR << 20);
        if (opt.data_limit > 0)
            opt.data_limit = max<int64_t>(opt.data_limit, (int64_t)COMPILE_MEMORY_FLOOR << 20);
        outcome.compile = runit(opt);
        if (!outcome.compile->succeeded()) {
            LOG(INFO) << "Compilation of " << ws.source_name() << " failed with exit code " << outcome.compile->exitcode;
            return outcome;
        }
    }

    outcome.run = runit(make_options(ws, spec, limits, spec.run_command(), input));
    return outcome;
}

}  // namespace runner
