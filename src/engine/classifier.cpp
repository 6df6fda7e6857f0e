#include "engine/classifier.hpp"
#include <fmt/format.h>

namespace runner {
using namespace std;

static bool exceeded_time(const run_result &result) {
    return result.timed_out || result.cpu_exceeded;
}

execution_result classify(const raw_outcome &outcome, const execution_limits &limits) {
    execution_result result;

    if (!outcome.fault.empty()) {
        result.status = status::SYSTEM_ERROR;
        result.error = outcome.fault;
        return result;
    }

    if (outcome.compile) {
        const run_result &compile = *outcome.compile;
        if (exceeded_time(compile)) {
            result.status = status::TIMEOUT;
            result.error = compile.error.empty() ? fmt::format("Compilation timed out after {} seconds", limits.time_limit) : compile.error;
            result.execution_time = limits.time_limit;
            return result;
        }
        if (!compile.succeeded()) {
            result.status = status::COMPILATION_ERROR;
            // 有的编译器（比如 javac）把诊断信息输出到 stdout
            result.error = compile.error + compile.output;
            result.execution_time = compile.wall_time;
            result.exit_code = compile.exitcode;
            if (compile.signal) result.signal = compile.signal;
            result.error_truncated = compile.error_truncated;
            return result;
        }
    }

    if (!outcome.run) {
        result.status = status::SYSTEM_ERROR;
        result.error = "program was not run";
        return result;
    }

    const run_result &run = *outcome.run;
    result.output = run.output;
    result.error = run.error;
    result.output_truncated = run.output_truncated;
    result.error_truncated = run.error_truncated;
    result.memory_used = run.memory;
    result.cpu_time = run.cpu_time;
    result.execution_time = run.wall_time;

    if (exceeded_time(run)) {
        result.status = status::TIMEOUT;
        result.execution_time = limits.time_limit;
        if (result.error.empty())
            result.error = fmt::format("Execution timed out after {} seconds", limits.time_limit);
        return result;
    }

    result.exit_code = run.exitcode;
    if (run.signal) {
        result.signal = run.signal;
        result.status = status::RUNTIME_ERROR;
    } else if (run.exitcode != 0) {
        result.status = status::RUNTIME_ERROR;
    } else {
        result.status = status::SUCCESS;
    }
    return result;
}

}  // namespace runner
