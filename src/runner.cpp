/*
 * designex - Exterior Design Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "designex/runner.hpp"
#include "designex/config.hpp"
#include "designex/logger.hpp"
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <functional>
#include <locale>
#include <mutex>
#include <sstream>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace designex {

namespace {

class UniqueFd {
public:
    UniqueFd() noexcept = default;
    explicit UniqueFd(int fd) noexcept : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;
    UniqueFd(UniqueFd&& other) noexcept : fd_(other.release()) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }

    [[nodiscard]] int get() const noexcept { return fd_; }
    int release() noexcept {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }
    void reset(int fd = -1) noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_ = -1;
};

std::string errnoMessage(const char* what) {
    return std::string(what) + ": " + std::strerror(errno);
}

// Owns the child until it is reaped. The child leads its own process group so
// anything it forks is killed along with it.
class ChildProcess {
public:
    ChildProcess() = default;
    ~ChildProcess() {
        if (pid_ > 0 && !reaped_) {
            killGroup();
            (void)waitBlocking();
        }
    }

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    bool spawn(const std::vector<std::string>& args, UniqueFd& output, std::string& error) {
        if (args.empty()) {
            error = "Empty worker command";
            return false;
        }

        int outPipe[2];
        if (::pipe2(outPipe, O_CLOEXEC) != 0) {
            error = errnoMessage("pipe2");
            return false;
        }
        UniqueFd readEnd(outPipe[0]);
        UniqueFd writeEnd(outPipe[1]);

        // Closed by a successful exec; carries errno otherwise
        int execPipe[2];
        if (::pipe2(execPipe, O_CLOEXEC) != 0) {
            error = errnoMessage("pipe2");
            return false;
        }
        UniqueFd execRead(execPipe[0]);
        UniqueFd execWrite(execPipe[1]);

        std::vector<char*> argv;
        argv.reserve(args.size() + 1);
        for (const auto& arg : args) {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr);

        pid_t pid = ::fork();
        if (pid < 0) {
            error = errnoMessage("fork");
            return false;
        }

        if (pid == 0) {
            // Child: async-signal-safe calls only
            ::setpgid(0, 0);
            int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
            if (devnull >= 0) {
                ::dup2(devnull, STDIN_FILENO);
            }
            ::dup2(writeEnd.get(), STDOUT_FILENO);
            ::dup2(writeEnd.get(), STDERR_FILENO);
            ::execvp(argv[0], argv.data());
            int code = errno;
            ssize_t ignored = ::write(execWrite.get(), &code, sizeof(code));
            (void)ignored;
            ::_exit(127);
        }

        ::setpgid(pid, pid);
        pid_ = pid;
        writeEnd.reset();
        execWrite.reset();

        int childErrno = 0;
        ssize_t n;
        do {
            n = ::read(execRead.get(), &childErrno, sizeof(childErrno));
        } while (n < 0 && errno == EINTR);

        if (n == static_cast<ssize_t>(sizeof(childErrno))) {
            (void)waitBlocking();
            error = "Failed to exec '" + args.front() + "': " + std::strerror(childErrno);
            return false;
        }

        output = std::move(readEnd);
        return true;
    }

    // True once the child has exited. The zombie is left in place so its pid,
    // and with it the process group id, cannot be handed to another job
    // before the group is swept.
    bool exited(std::string& error) {
        while (true) {
            siginfo_t info;
            std::memset(&info, 0, sizeof(info));
            if (::waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOHANG | WNOWAIT) == 0) {
                return info.si_pid == pid_;
            }
            if (errno == EINTR) {
                continue;
            }
            error = errnoMessage("waitid");
            return false;
        }
    }

    int waitBlocking() noexcept {
        int status = 0;
        while (!reaped_) {
            pid_t r = ::waitpid(pid_, &status, 0);
            if (r == pid_ || (r < 0 && errno != EINTR)) {
                reaped_ = true;
            }
        }
        return status;
    }

    void killGroup() noexcept {
        if (pid_ > 0 && !reaped_) {
            ::kill(-pid_, SIGKILL);
        }
    }

    [[nodiscard]] pid_t pid() const noexcept { return pid_; }

private:
    pid_t pid_ = -1;
    bool reaped_ = false;
};

// Joins the output reader, killing the child first so the pipe reaches EOF.
class ReaderGuard {
public:
    ReaderGuard(std::thread& thread, ChildProcess& child) noexcept : thread_(thread), child_(child) {}
    ~ReaderGuard() { join(); }

    ReaderGuard(const ReaderGuard&) = delete;
    ReaderGuard& operator=(const ReaderGuard&) = delete;

    void join() noexcept {
        if (thread_.joinable()) {
            child_.killGroup();
            thread_.join();
        }
    }

private:
    std::thread& thread_;
    ChildProcess& child_;
};

void readOutput(UniqueFd fd, const std::string& label, std::vector<std::string>& lines, std::mutex& mutex) {
    setThreadName("Output-" + label);

    auto emit = [&](std::string line) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        LOG_INFO("[" + label + "] worker: " + line);
        std::lock_guard<std::mutex> lock(mutex);
        lines.push_back(std::move(line));
    };

    std::string pending;
    char buffer[4096];
    while (true) {
        ssize_t n = ::read(fd.get(), buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_WARN("[" + label + "] output read failed: " + std::strerror(errno));
            break;
        }
        if (n == 0) {
            break;
        }
        pending.append(buffer, static_cast<std::size_t>(n));

        std::size_t start = 0;
        std::size_t newline;
        while ((newline = pending.find('\n', start)) != std::string::npos) {
            emit(pending.substr(start, newline - start));
            start = newline + 1;
        }
        pending.erase(0, start);
    }

    if (!pending.empty()) {
        emit(std::move(pending));
    }
}

}

std::vector<std::string> JobInvocation::arguments() const {
    std::vector<std::string> args = command;
    args.insert(args.end(), {
        "--input", input.string(),
        "--output_styled", styledOutput.string(),
        "--output_blended", blendedOutput.string(),
        "--style", style,
        "--model", modelPath.string(),
        "--style_library", styleLibraryPath.string()
    });
    if (blendAlpha) {
        args.push_back("--blend_alpha");
        args.push_back(formatBlendAlpha(*blendAlpha));
    }
    return args;
}

std::vector<std::string> JobResult::tail(std::size_t lines) const {
    if (log.size() <= lines) {
        return log;
    }
    return std::vector<std::string>(log.end() - static_cast<std::ptrdiff_t>(lines), log.end());
}

std::string formatBlendAlpha(float alpha) {
    std::ostringstream ss;
    ss.imbue(std::locale::classic());
    ss << alpha;
    std::string text = ss.str();
    if (text.find_first_of(".en") == std::string::npos) {
        text += ".0";
    }
    return text;
}

Runner::Runner(const std::atomic<bool>* shutdownFlag, std::chrono::milliseconds pollInterval) noexcept
    : shutdownFlag_(shutdownFlag), pollInterval_(pollInterval) {
}

bool Runner::shutdownRequested() const noexcept {
    return shutdownFlag_ && shutdownFlag_->load();
}

JobResult Runner::run(const JobInvocation& invocation) {
    JobResult result;
    const std::string label = invocation.label.empty() ? "job" : invocation.label;
    const auto startTime = std::chrono::steady_clock::now();
    auto finish = [&](JobState state) {
        result.state = state;
        result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - startTime);
    };

    std::vector<std::string> args = invocation.arguments();
    if (Logger::enabled(LogLevel::DEBUG)) {
        std::string commandLine;
        for (const auto& arg : args) {
            if (!commandLine.empty()) commandLine += " ";
            commandLine += arg;
        }
        LOG_DEBUG("[" + label + "] exec: " + commandLine);
    }

    if (shutdownRequested()) {
        LOG_WARN("[" + label + "] shutdown requested, worker not started");
        finish(JobState::Interrupted);
        return result;
    }

    ChildProcess child;
    UniqueFd output;
    if (!child.spawn(args, output, result.error)) {
        LOG_ERROR("[" + label + "] failed to start worker: " + result.error);
        finish(JobState::Failed);
        return result;
    }
    result.pid = child.pid();
    result.state = JobState::Running;
    LOG_INFO("[" + label + "] worker started (pid " + std::to_string(result.pid) + ")");

    std::mutex logMutex;
    std::vector<std::string> lines;
    std::thread reader(readOutput, std::move(output), label, std::ref(lines), std::ref(logMutex));
    ReaderGuard readerGuard(reader, child);

    const auto timeout = std::min(invocation.timeout, std::chrono::milliseconds(kMaxJobTimeout));
    const auto deadline = startTime + timeout;
    JobState terminal = JobState::Running;

    while (true) {
        std::string waitError;
        if (child.exited(waitError)) {
            break;
        }
        if (!waitError.empty()) {
            LOG_ERROR("[" + label + "] " + waitError);
            result.error = waitError;
            terminal = JobState::Failed;
            break;
        }
        if (shutdownRequested()) {
            LOG_WARN("[" + label + "] shutdown requested, killing worker");
            terminal = JobState::Interrupted;
            break;
        }
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            LOG_WARN("[" + label + "] worker exceeded " + std::to_string(timeout.count()) +
                     "ms, killing");
            terminal = JobState::TimedOut;
            break;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(pollInterval_, remaining));
    }

    // The child is not reaped yet, so the group id is still ours: kill the
    // group, drain the pipe, then collect the exit status
    readerGuard.join();
    const int status = child.waitBlocking();
    {
        std::lock_guard<std::mutex> lock(logMutex);
        result.log = std::move(lines);
    }

    if (terminal == JobState::Running) {
        if (WIFEXITED(status)) {
            result.exitCode = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            result.exitCode = 128 + WTERMSIG(status);
        }
        terminal = (result.exitCode && *result.exitCode == 0) ? JobState::Completed : JobState::Failed;
    }
    finish(terminal);

    const std::string elapsed = std::to_string(result.elapsed.count()) + "ms";
    switch (result.state) {
        case JobState::Completed:
            LOG_INFO("[" + label + "] worker completed in " + elapsed);
            break;
        case JobState::Failed:
            LOG_WARN("[" + label + "] worker failed" +
                     (result.exitCode ? " with exit code " + std::to_string(*result.exitCode) : std::string()) +
                     " after " + elapsed);
            break;
        default:
            LOG_WARN("[" + label + "] worker " + toString(result.state) + " after " + elapsed);
            break;
    }
    return result;
}

}
