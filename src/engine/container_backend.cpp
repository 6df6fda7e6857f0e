#include <fmt/format.h>
#include <glog/logging.h>
#include <boost/algorithm/string/join.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <algorithm>
#include <cmath>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "engine/backend.hpp"
#include "sandbox/run.hpp"

namespace runner {
using namespace std;

// 容器启动所需的额外时间，单位为秒
const double CONTAINER_STARTUP_TIME = 10;

// 检查容器运行时是否可用的时间限制，单位为秒
const double CONTAINER_PROBE_TIME = 5;

// 单核 CPU 的 50%
const int CONTAINER_CPU_QUOTA = 50000;

// docker run 自身出错时的退出码
const int CONTAINER_RUNTIME_ERROR = 125;

container_backend::container_backend(string runtime)
    : runtime(move(runtime)) {}

string container_backend::name() const {
    return "container";
}

bool container_backend::available() const {
    if (!command_exists(runtime)) return false;

    run_options opt;
    opt.command = {runtime, "version", "--format", "{{.Server.Version}}"};
    opt.wall_limit = CONTAINER_PROBE_TIME;
    opt.preserve_sys_env = true;
    try {
        run_result result = runit(opt);
        if (!result.succeeded())
            LOG(INFO) << runtime << " is not usable: " << result.error;
        return result.succeeded();
    } catch (internal_error &e) {
        LOG(WARNING) << "Unable to probe container runtime " << runtime << ": " << e.what();
        return false;
    }
}

static string shell_command(const string &command, const command_context &ctx) {
    return boost::algorithm::join(expand_command(command, ctx), " ");
}

string container_backend::marker(const string &id, const string &kind) {
    return fmt::format("__code_runner_{}_{}__", kind, id);
}

/**
 * @brief 在 timeout 下运行一个阶段，rc 保存退出码
 * 被 timeout 杀死（退出码 137 且已用完时间）时向 stderr 写入超时标记
 */
static string limited_phase(const string &command, int seconds, const string &timeout_marker) {
    return fmt::format("s=$(date +%s); timeout -s KILL {0} {1}; rc=$?; "
                       "if [ $rc -eq 137 ] && [ $(($(date +%s) - s)) -ge {0} ]; then echo {2} >&2; fi",
                       seconds, command, timeout_marker);
}

string container_backend::make_script(const workspace &ws, const language_spec &spec, const execution_limits &limits, const string &id) {
    command_context ctx{ws.source_name(), ws.main_class(), limits.memory_limit};
    int seconds = max(1, (int)ceil(limits.time_limit));
    string timeout_marker = marker(id, "timeout");

    string script = fmt::format("echo {} >&2; cp /app/{} /build/ && cd /build || exit $?; ",
                                marker(id, "started"), ws.source_name());
    if (auto compile_command = spec.compile_command()) {
        script += limited_phase(shell_command(*compile_command, ctx), seconds, timeout_marker);
        script += fmt::format("; if [ $rc -ne 0 ]; then echo {} >&2; exit $rc; fi; ", marker(id, "compile_failed"));
    }
    script += limited_phase(shell_command(spec.run_command(), ctx), seconds, timeout_marker);
    script += "; exit $rc";
    return script;
}

/**
 * @brief 从 stderr 中删除标记所在的行
 * @return 是否找到了标记
 */
static bool take_marker(string &error, const string &marker) {
    auto pos = error.find(marker);
    if (pos == string::npos) return false;
    size_t length = marker.size();
    if (pos + length < error.size() && error[pos + length] == '\n') ++length;
    error.erase(pos, length);
    return true;
}

raw_outcome container_backend::make_outcome(run_result result, const language_spec &spec, const string &id) {
    raw_outcome outcome;
    bool started = take_marker(result.error, marker(id, "started"));
    // 容器内的程序也可能以 125 退出，只有脚本没有启动时才是容器运行时的错误
    if (!result.timed_out && !started && result.exitcode == CONTAINER_RUNTIME_ERROR) {
        outcome.fault = "container runtime error: " + result.error;
        return outcome;
    }

    if (take_marker(result.error, marker(id, "timeout")))
        result.timed_out = true;

    if (spec.needs_compile() && take_marker(result.error, marker(id, "compile_failed"))) {
        outcome.compile = result;
        return outcome;
    }

    if (spec.needs_compile())
        outcome.compile = run_result();
    outcome.run = result;
    return outcome;
}

vector<string> container_backend::make_command(const workspace &ws, const language_spec &spec, const execution_limits &limits, const string &container_name, const string &script) const {
    vector<string> command = {
        runtime, "run", "--rm", "-i",
        "--name", container_name,
        "--network", "none",
        "--memory", fmt::format("{}m", limits.memory_limit),
        "--memory-swap", fmt::format("{}m", limits.memory_limit),
        "--cpu-quota", std::to_string(CONTAINER_CPU_QUOTA),
        "--ulimit", fmt::format("fsize={}", (int64_t)limits.file_limit << 10),
        "--ulimit", "core=0",
        "--read-only",
        "--tmpfs", "/build:rw,exec,size=256m",
        "--tmpfs", "/tmp:rw,size=64m",
        "-e", "HOME=/build",
        "-v", ws.dir().string() + ":/app:ro",
        "-w", "/build"};
    for (auto &entry : expand_environment(spec.environment, {ws.source_name(), ws.main_class(), limits.memory_limit})) {
        command.push_back("-e");
        command.push_back(entry);
    }
    if (limits.proc_limit > 0) {
        command.push_back("--pids-limit");
        command.push_back(std::to_string(max(limits.proc_limit, spec.min_proc_limit)));
    }
    command.insert(command.end(), {spec.container_image, "sh", "-c", script});
    return command;
}

raw_outcome container_backend::run(const workspace &ws, const language_spec &spec, const execution_limits &limits, const string &input) const {
    static thread_local boost::uuids::random_generator uuid_generator;
    string id = boost::uuids::to_string(uuid_generator());
    string container_name = "code-runner-" + id;

    run_options opt;
    opt.command = make_command(ws, spec, limits, container_name, make_script(ws, spec, limits, id));
    opt.work_dir = ws.dir();
    opt.stdin_data = input;
    // 每个阶段在容器内由 timeout 限制，这里只是为了防止容器运行时本身卡住
    opt.wall_limit = limits.time_limit * (spec.needs_compile() ? 2 : 1) + CONTAINER_STARTUP_TIME;
    opt.stream_size = (int64_t)limits.stream_size << 10;
    opt.preserve_sys_env = true;

    run_result result = runit(opt);

    if (result.timed_out) {
        // 杀死 docker 客户端不会停止容器，必须按名称强制删除
        run_options rm;
        rm.command = {runtime, "rm", "-f", container_name};
        rm.wall_limit = CONTAINER_STARTUP_TIME;
        rm.preserve_sys_env = true;
        run_result removed = runit(rm);
        if (!removed.succeeded())
            LOG(ERROR) << "Unable to remove container " << container_name << ": " << removed.error;
    }

    return make_outcome(move(result), spec, id);
}

}  // namespace runner
