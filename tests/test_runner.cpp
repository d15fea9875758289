// test_runner.cpp
// Tests for the worker invocation and the process-backed Runner
//
// Framework: GoogleTest
// Workers are /bin/sh snippets so the suite runs without the real worker.

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "designex/logger.hpp"
#include "designex/runner.hpp"
#include "test_support.hpp"

using namespace designex;
using namespace designex::testutil;
using namespace std::chrono_literals;

namespace {

JobInvocation shellJob(const std::string& script, std::chrono::milliseconds timeout = 10s) {
    JobInvocation invocation;
    invocation.command = {"/bin/sh", "-c", script};
    invocation.input = "/tmp/in_original.png";
    invocation.styledOutput = "/tmp/in_styled.png";
    invocation.blendedOutput = "/tmp/in_blended.png";
    invocation.style = "Modern";
    invocation.modelPath = "/models/sam.pth";
    invocation.styleLibraryPath = "/etc/style_library.json";
    invocation.timeout = timeout;
    invocation.label = "test";
    return invocation;
}

}

// ============================================================================
// Invocation
// ============================================================================

TEST(JobInvocation, ArgumentsFollowWorkerContract) {
    JobInvocation invocation = shellJob("true");
    invocation.command = {"python3", "seg.py"};

    std::vector<std::string> expected = {
        "python3", "seg.py",
        "--input", "/tmp/in_original.png",
        "--output_styled", "/tmp/in_styled.png",
        "--output_blended", "/tmp/in_blended.png",
        "--style", "Modern",
        "--model", "/models/sam.pth",
        "--style_library", "/etc/style_library.json"
    };
    EXPECT_EQ(invocation.arguments(), expected);

    invocation.blendAlpha = 0.75f;
    expected.push_back("--blend_alpha");
    expected.push_back("0.75");
    EXPECT_EQ(invocation.arguments(), expected);
}

TEST(JobInvocation, BlendAlphaFormatting) {
    EXPECT_EQ(formatBlendAlpha(0.5f), "0.5");
    EXPECT_EQ(formatBlendAlpha(0.3f), "0.3");
    EXPECT_EQ(formatBlendAlpha(0.0f), "0.0");
    EXPECT_EQ(formatBlendAlpha(1.0f), "1.0");
}

TEST(JobState, TerminalStates) {
    EXPECT_FALSE(isTerminal(JobState::Created));
    EXPECT_FALSE(isTerminal(JobState::Running));
    EXPECT_TRUE(isTerminal(JobState::Completed));
    EXPECT_TRUE(isTerminal(JobState::TimedOut));
    EXPECT_TRUE(isTerminal(JobState::Failed));
    EXPECT_TRUE(isTerminal(JobState::Interrupted));
    EXPECT_STREQ(toString(JobState::TimedOut), "timed_out");
}

TEST(JobResult, TailKeepsLastLines) {
    JobResult result;
    result.log = {"a", "b", "c", "d"};
    EXPECT_EQ(result.tail(2), (std::vector<std::string>{"c", "d"}));
    EXPECT_EQ(result.tail(10).size(), 4u);
}

// ============================================================================
// Terminal states
// ============================================================================

TEST(Runner, ExitZeroCompletes) {
    Runner runner;
    JobResult result = runner.run(shellJob("exit 0"));

    EXPECT_EQ(result.state, JobState::Completed);
    ASSERT_TRUE(result.exitCode.has_value());
    EXPECT_EQ(*result.exitCode, 0);
    EXPECT_TRUE(result.ok());
    EXPECT_GT(result.pid, 0);
    EXPECT_FALSE(processAlive(result.pid));
}

TEST(Runner, ExitOneFails) {
    Runner runner;
    JobResult result = runner.run(shellJob("exit 1"));

    EXPECT_EQ(result.state, JobState::Failed);
    ASSERT_TRUE(result.exitCode.has_value());
    EXPECT_EQ(*result.exitCode, 1);
    EXPECT_FALSE(result.ok());
}

TEST(Runner, SignalDeathReportsShellStyleCode) {
    Runner runner;
    JobResult result = runner.run(shellJob("kill -TERM $$"));

    EXPECT_EQ(result.state, JobState::Failed);
    ASSERT_TRUE(result.exitCode.has_value());
    EXPECT_EQ(*result.exitCode, 128 + SIGTERM);
}

TEST(Runner, SleepPastTimeoutIsKilled) {
    Runner runner;
    auto start = std::chrono::steady_clock::now();
    JobResult result = runner.run(shellJob("sleep 5", 200ms));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(result.state, JobState::TimedOut);
    EXPECT_FALSE(result.exitCode.has_value());
    EXPECT_LT(elapsed, 3s);
    EXPECT_GE(result.elapsed, 200ms);
    EXPECT_FALSE(processAlive(result.pid));
}

TEST(Runner, TimeoutKillsBackgroundChildrenToo) {
    // The pipe only reaches EOF once the backgrounded sleep is gone as well
    Runner runner;
    auto start = std::chrono::steady_clock::now();
    JobResult result = runner.run(shellJob("sleep 30 & echo started; wait", 300ms));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(result.state, JobState::TimedOut);
    EXPECT_LT(elapsed, 10s);
    ASSERT_FALSE(result.log.empty());
    EXPECT_EQ(result.log.front(), "started");
}

TEST(Runner, ShutdownFlagInterrupts) {
    std::atomic<bool> shutdown{false};
    Runner runner(&shutdown);

    std::thread trigger([&] {
        std::this_thread::sleep_for(150ms);
        shutdown.store(true);
    });
    auto start = std::chrono::steady_clock::now();
    JobResult result = runner.run(shellJob("sleep 5"));
    auto elapsed = std::chrono::steady_clock::now() - start;
    trigger.join();

    EXPECT_EQ(result.state, JobState::Interrupted);
    EXPECT_LT(elapsed, 3s);
    EXPECT_FALSE(processAlive(result.pid));
}

TEST(Runner, ShutdownBeforeStartSpawnsNothing) {
    TempDir dir;
    std::atomic<bool> shutdown{true};
    Runner runner(&shutdown);
    fs::path marker = dir / "started";

    JobResult result = runner.run(shellJob("touch '" + marker.string() + "'"));

    EXPECT_EQ(result.state, JobState::Interrupted);
    EXPECT_EQ(result.pid, -1);
    EXPECT_FALSE(result.exitCode.has_value());
    EXPECT_TRUE(result.log.empty());
    EXPECT_FALSE(fs::exists(marker));
}

TEST(Runner, OversizedTimeoutIsCappedNotExpired) {
    Runner runner;
    JobResult result = runner.run(shellJob("sleep 0.2; exit 0", std::chrono::hours(24 * 365 * 1000)));

    EXPECT_EQ(result.state, JobState::Completed);
    EXPECT_GE(result.elapsed, 200ms);
}

TEST(Runner, LeftoverChildIsSweptAfterNormalExit) {
    // The worker exits at once; its backgrounded sleep still holds the pipe
    Runner runner;
    auto start = std::chrono::steady_clock::now();
    JobResult result = runner.run(shellJob("sleep 30 & echo done; exit 0"));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(result.state, JobState::Completed);
    ASSERT_TRUE(result.exitCode.has_value());
    EXPECT_EQ(*result.exitCode, 0);
    EXPECT_LT(elapsed, 10s);
    EXPECT_EQ(result.log, (std::vector<std::string>{"done"}));
}

TEST(Runner, MissingExecutableFailsWithoutExitCode) {
    JobInvocation invocation = shellJob("unused");
    invocation.command = {"/nonexistent/designex-worker"};

    Runner runner;
    JobResult result = runner.run(invocation);

    EXPECT_EQ(result.state, JobState::Failed);
    EXPECT_FALSE(result.exitCode.has_value());
    EXPECT_FALSE(result.error.empty());
}

TEST(Runner, EmptyCommandFails) {
    JobInvocation invocation = shellJob("unused");
    invocation.command.clear();

    Runner runner;
    JobResult result = runner.run(invocation);
    EXPECT_EQ(result.state, JobState::Failed);
}

// ============================================================================
// Output capture
// ============================================================================

TEST(Runner, CapturesCombinedOutputInOrder) {
    Runner runner;
    JobResult result = runner.run(shellJob("echo one; echo two 1>&2; echo three"));

    ASSERT_EQ(result.state, JobState::Completed);
    EXPECT_EQ(result.log, (std::vector<std::string>{"one", "two", "three"}));
}

TEST(Runner, KeepsUnterminatedLastLine) {
    Runner runner;
    JobResult result = runner.run(shellJob("printf 'first\\nno newline'"));

    EXPECT_EQ(result.log, (std::vector<std::string>{"first", "no newline"}));
}

TEST(Runner, OutputIsKeptWhenJobFails) {
    Runner runner;
    JobResult result = runner.run(shellJob("echo 'model not found' 1>&2; exit 3"));

    EXPECT_EQ(result.state, JobState::Failed);
    EXPECT_EQ(*result.exitCode, 3);
    EXPECT_EQ(result.log, (std::vector<std::string>{"model not found"}));
}

TEST(Runner, LargeOutputDoesNotStallTheChild) {
    // Far more than a pipe buffer; would deadlock if output were read after exit
    Runner runner;
    JobResult result = runner.run(shellJob("i=0; while [ $i -lt 5000 ]; do echo line-$i; i=$((i+1)); done", 20s));

    ASSERT_EQ(result.state, JobState::Completed);
    ASSERT_EQ(result.log.size(), 5000u);
    EXPECT_EQ(result.log.front(), "line-0");
    EXPECT_EQ(result.log.back(), "line-4999");
}

TEST(Runner, WorkerReceivesFlags) {
    TempDir dir;
    JobInvocation invocation = shellJob("unused");
    invocation.command = shellWorker(dir.path(), "echo_args.sh", "for a in \"$@\"; do echo \"$a\"; done");
    invocation.blendAlpha = 0.25f;

    Runner runner;
    JobResult result = runner.run(invocation);

    ASSERT_EQ(result.state, JobState::Completed);
    std::vector<std::string> argv = invocation.arguments();
    std::vector<std::string> flags(argv.begin() + 2, argv.end());
    EXPECT_EQ(result.log, flags);
}

TEST(Runner, WorkerLinesAreLoggedWithJobLabel) {
    LogLevel saved = Logger::level();
    std::ostringstream captured;
    Logger::setStream(&captured);
    Logger::setLevel(LogLevel::INFO);

    JobInvocation invocation = shellJob("echo 'loading checkpoint'");
    invocation.label = "20250101_120000_000042_abcdef";
    Runner runner;
    JobResult result = runner.run(invocation);

    Logger::setStream(nullptr);
    Logger::setLevel(saved);

    ASSERT_EQ(result.state, JobState::Completed);
    EXPECT_NE(captured.str().find("[20250101_120000_000042_abcdef] worker: loading checkpoint"),
              std::string::npos) << captured.str();
}

// ============================================================================
// Concurrency
// ============================================================================

TEST(Runner, ConcurrentJobsKeepTheirOwnOutput) {
    Runner runner;
    constexpr int kJobs = 8;
    std::vector<JobResult> results(kJobs);
    std::vector<std::thread> threads;

    for (int i = 0; i < kJobs; ++i) {
        threads.emplace_back([&, i] {
            results[i] = runner.run(shellJob("sleep 0.1; echo token-" + std::to_string(i)));
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    for (int i = 0; i < kJobs; ++i) {
        EXPECT_EQ(results[i].state, JobState::Completed) << "job " << i;
        EXPECT_EQ(results[i].log, (std::vector<std::string>{"token-" + std::to_string(i)})) << "job " << i;
    }
}
