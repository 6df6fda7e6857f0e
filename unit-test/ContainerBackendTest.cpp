#include <unistd.h>
#include <algorithm>
#include "gtest/gtest.h"
#include "engine/backend.hpp"
#include "language/registry.hpp"

using namespace std;
using namespace std::filesystem;
using namespace runner;

class ContainerBackendTest : public ::testing::Test {
protected:
    path root;
    execution_limits limits{3, 256, 1024, 32, 64};

    void SetUp() override {
        root = temp_directory_path() / ("code-runner-container-test-" + to_string(getpid()));
        remove_all(root);
    }

    void TearDown() override {
        remove_all(root);
    }

    const language_spec &language(const string &name) {
        return language_registry::builtin().resolve(name);
    }

    static bool contains_sequence(const vector<string> &command, const vector<string> &sequence) {
        return search(command.begin(), command.end(), sequence.begin(), sequence.end()) != command.end();
    }
};

TEST_F(ContainerBackendTest, CommandIsolatesContainer) {
    workspace ws = workspace::acquire(root, language("python"), "print(1)");
    container_backend backend;
    vector<string> command = backend.make_command(ws, language("python"), limits, "code-runner-test", "exec python3 main.py");

    ASSERT_GE(command.size(), 4);
    EXPECT_EQ(command[0], "docker");
    EXPECT_EQ(command[1], "run");
    EXPECT_TRUE(contains_sequence(command, {"--name", "code-runner-test"}));
    EXPECT_TRUE(contains_sequence(command, {"--network", "none"}));
    EXPECT_TRUE(contains_sequence(command, {"--memory", "256m"}));
    EXPECT_TRUE(contains_sequence(command, {"--memory-swap", "256m"}));
    EXPECT_TRUE(contains_sequence(command, {"--pids-limit", "32"}));
    EXPECT_TRUE(contains_sequence(command, {"-v", ws.dir().string() + ":/app:ro"}));
    EXPECT_NE(find(command.begin(), command.end(), "--read-only"), command.end());
    EXPECT_NE(find(command.begin(), command.end(), "--rm"), command.end());

    vector<string> tail(command.end() - 4, command.end());
    vector<string> expected = {"python:3.9-slim", "sh", "-c", "exec python3 main.py"};
    EXPECT_EQ(tail, expected);
}

TEST_F(ContainerBackendTest, LanguageProcessMinimumRaisesPidsLimit) {
    workspace ws = workspace::acquire(root, language("go"), "package main\nfunc main() {}\n");
    container_backend backend;
    vector<string> command = backend.make_command(ws, language("go"), limits, "name", "true");
    EXPECT_TRUE(contains_sequence(command, {"--pids-limit", "256"}));
}

TEST_F(ContainerBackendTest, NoPidsLimitWhenProcessCountIsUnlimited) {
    workspace ws = workspace::acquire(root, language("python"), "print(1)");
    container_backend backend;
    execution_limits unlimited = limits;
    unlimited.proc_limit = -1;
    vector<string> command = backend.make_command(ws, language("python"), unlimited, "name", "true");
    EXPECT_EQ(find(command.begin(), command.end(), "--pids-limit"), command.end());
}

TEST_F(ContainerBackendTest, RuntimeEnvironmentIsPassedToContainer) {
    workspace ws = workspace::acquire(root, language("go"), "package main\nfunc main() {}\n");
    container_backend backend;
    vector<string> command = backend.make_command(ws, language("go"), limits, "name", "true");
    EXPECT_TRUE(contains_sequence(command, {"-e", "GOMEMLIMIT=256MiB"}));
}

TEST_F(ContainerBackendTest, InterpretedScript) {
    workspace ws = workspace::acquire(root, language("javascript"), "console.log(1)");
    string script = container_backend::make_script(ws, language("javascript"), limits, "ID");
    EXPECT_EQ(script,
              "echo __code_runner_started_ID__ >&2; cp /app/main.js /build/ && cd /build || exit $?; "
              "s=$(date +%s); timeout -s KILL 3 node --max-old-space-size=256 main.js; rc=$?; "
              "if [ $rc -eq 137 ] && [ $(($(date +%s) - s)) -ge 3 ]; then echo __code_runner_timeout_ID__ >&2; fi; "
              "exit $rc");
}

TEST_F(ContainerBackendTest, CompiledScriptLimitsEachPhase) {
    workspace ws = workspace::acquire(root, language("cpp"), "int main() {}");
    string script = container_backend::make_script(ws, language("cpp"), limits, "ID");
    EXPECT_EQ(script,
              "echo __code_runner_started_ID__ >&2; cp /app/main.cpp /build/ && cd /build || exit $?; "
              "s=$(date +%s); timeout -s KILL 3 g++ -O2 -std=c++17 -o program main.cpp; rc=$?; "
              "if [ $rc -eq 137 ] && [ $(($(date +%s) - s)) -ge 3 ]; then echo __code_runner_timeout_ID__ >&2; fi; "
              "if [ $rc -ne 0 ]; then echo __code_runner_compile_failed_ID__ >&2; exit $rc; fi; "
              "s=$(date +%s); timeout -s KILL 3 ./program; rc=$?; "
              "if [ $rc -eq 137 ] && [ $(($(date +%s) - s)) -ge 3 ]; then echo __code_runner_timeout_ID__ >&2; fi; "
              "exit $rc");
}

TEST_F(ContainerBackendTest, FractionalTimeLimitRoundsUp) {
    workspace ws = workspace::acquire(root, language("python"), "print(1)");
    execution_limits fractional = limits;
    fractional.time_limit = 0.5;
    string script = container_backend::make_script(ws, language("python"), fractional, "ID");
    EXPECT_NE(script.find("timeout -s KILL 1 python3 main.py"), string::npos);
}

TEST_F(ContainerBackendTest, JvmScriptUsesMainClass) {
    workspace ws = workspace::acquire(root, language("java"), "public class Solution { }");
    string script = container_backend::make_script(ws, language("java"), limits, "ID");
    EXPECT_NE(script.find("cp /app/Solution.java /build/"), string::npos);
    EXPECT_NE(script.find("java -Xmx256m -cp . Solution"), string::npos);
}

static run_result exited(int exitcode, const string &error) {
    run_result result;
    result.exitcode = exitcode;
    result.error = error;
    return result;
}

TEST_F(ContainerBackendTest, ProgramOutputWithoutMarkers) {
    string started = container_backend::marker("ID", "started");
    raw_outcome outcome = container_backend::make_outcome(exited(0, started + "\nwarning\n"), language("python"), "ID");
    EXPECT_TRUE(outcome.fault.empty());
    EXPECT_FALSE(outcome.compile);
    ASSERT_TRUE(outcome.run);
    EXPECT_EQ(outcome.run->error, "warning\n");
}

TEST_F(ContainerBackendTest, ProgramExitingWith125IsNotRuntimeFault) {
    string started = container_backend::marker("ID", "started");
    raw_outcome outcome = container_backend::make_outcome(exited(125, started + "\n"), language("python"), "ID");
    EXPECT_TRUE(outcome.fault.empty());
    ASSERT_TRUE(outcome.run);
    EXPECT_EQ(outcome.run->exitcode, 125);
}

TEST_F(ContainerBackendTest, RuntimeErrorBeforeScriptStartsIsFault) {
    raw_outcome outcome = container_backend::make_outcome(
        exited(125, "docker: Error response from daemon: pull access denied.\n"), language("python"), "ID");
    EXPECT_NE(outcome.fault.find("pull access denied"), string::npos);
    EXPECT_FALSE(outcome.run);
}

TEST_F(ContainerBackendTest, CompileFailureMarker) {
    string error = container_backend::marker("ID", "started") + "\nmain.cpp:1: error\n" +
                   container_backend::marker("ID", "compile_failed") + "\n";
    raw_outcome outcome = container_backend::make_outcome(exited(1, error), language("cpp"), "ID");
    ASSERT_TRUE(outcome.compile);
    EXPECT_EQ(outcome.compile->error, "main.cpp:1: error\n");
    EXPECT_FALSE(outcome.run);
}

TEST_F(ContainerBackendTest, TimeoutMarkerInRunPhase) {
    string error = container_backend::marker("ID", "started") + "\n" + container_backend::marker("ID", "timeout") + "\n";
    raw_outcome outcome = container_backend::make_outcome(exited(137, error), language("cpp"), "ID");
    ASSERT_TRUE(outcome.compile);
    EXPECT_TRUE(outcome.compile->succeeded());
    ASSERT_TRUE(outcome.run);
    EXPECT_TRUE(outcome.run->timed_out);
    EXPECT_EQ(outcome.run->error, "");
}

TEST_F(ContainerBackendTest, TimeoutMarkerInCompilePhase) {
    string error = container_backend::marker("ID", "started") + "\n" + container_backend::marker("ID", "timeout") + "\n" +
                   container_backend::marker("ID", "compile_failed") + "\n";
    raw_outcome outcome = container_backend::make_outcome(exited(137, error), language("rust"), "ID");
    ASSERT_TRUE(outcome.compile);
    EXPECT_TRUE(outcome.compile->timed_out);
    EXPECT_FALSE(outcome.run);
}

TEST_F(ContainerBackendTest, MissingRuntimeIsUnavailable) {
    container_backend backend("code-runner-no-such-runtime");
    EXPECT_FALSE(backend.available());
}

TEST(SelectBackendTest, Subprocess) {
    EXPECT_EQ(select_backend("subprocess")->name(), "subprocess");
}

TEST(SelectBackendTest, Auto) {
    string name = select_backend("auto")->name();
    EXPECT_TRUE(name == "container" || name == "subprocess") << name;
}

TEST(SelectBackendTest, UnknownPreferenceThrows) {
    EXPECT_THROW(select_backend("vm"), invalid_argument);
}
