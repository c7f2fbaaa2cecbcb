/*
 * multibench - Contention-aware benchmark orchestration
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "multibench/supervisor.hpp"
#include "multibench/errors.hpp"
#include "multibench/logger.hpp"
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <map>
#include <new>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace multibench {

namespace {

// argv/envp storage kept alive in the parent so the child only touches
// pointers between fork and exec.
struct ExecImage {
    std::vector<std::string> args;
    std::vector<std::string> env;
    std::vector<char*> argv;
    std::vector<char*> envp;

    explicit ExecImage(const JobSpec& job) : args(job.argv) {
        std::map<std::string, std::string> merged;
        for (char** e = environ; e && *e; ++e) {
            std::string entry(*e);
            auto eq = entry.find('=');
            if (eq == std::string::npos) continue;
            merged[entry.substr(0, eq)] = entry.substr(eq + 1);
        }
        for (const auto& [name, value] : job.envOverlay) {
            merged[name] = value;
        }
        env.reserve(merged.size());
        for (const auto& [name, value] : merged) {
            env.push_back(name + "=" + value);
        }

        for (auto& a : args) argv.push_back(a.data());
        argv.push_back(nullptr);
        for (auto& e : env) envp.push_back(e.data());
        envp.push_back(nullptr);
    }
};

void closeFd(int& fd) noexcept {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Waits for pid, retrying on EINTR. Returns the raw status or -1.
int waitFor(pid_t pid) noexcept {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return -1;
        }
    }
    return status;
}

// fork + execvpe with stdout redirected to stdoutFd (when >= 0). exec
// failures travel back over a close-on-exec pipe so they surface here
// instead of as a child exiting with 127.
pid_t spawn(const JobSpec& job, int stdoutFd) {
    if (job.argv.empty()) {
        throw LaunchError("Cannot launch an empty command line");
    }

    ExecImage image(job);

    int status[2];
    if (::pipe2(status, O_CLOEXEC) != 0) {
        throw LaunchError("pipe2 failed: " + std::string(std::strerror(errno)));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        ::close(status[0]);
        ::close(status[1]);
        throw LaunchError("fork failed for " + job.argv.front() + ": " + std::strerror(err));
    }

    if (pid == 0) {
        ::close(status[0]);
        if (stdoutFd >= 0 && ::dup2(stdoutFd, STDOUT_FILENO) < 0) {
            int err = errno;
            (void)!::write(status[1], &err, sizeof(err));
            ::_exit(127);
        }
        ::execvpe(image.argv[0], image.argv.data(), image.envp.data());
        int err = errno;
        (void)!::write(status[1], &err, sizeof(err));
        ::_exit(127);
    }

    ::close(status[1]);
    int childErr = 0;
    ssize_t n;
    do {
        n = ::read(status[0], &childErr, sizeof(childErr));
    } while (n < 0 && errno == EINTR);
    ::close(status[0]);

    if (n == static_cast<ssize_t>(sizeof(childErr))) {
        (void)waitFor(pid);
        throw LaunchError("Failed to launch " + job.argv.front() + ": " + std::strerror(childErr));
    }

    return pid;
}

class ChildProcess final : public ProcessHandle {
public:
    ChildProcess(pid_t pid, std::shared_ptr<std::vector<pid_t>> pending) noexcept
        : pid_(pid), pending_(std::move(pending)) {}

    ~ChildProcess() override {
        if (!signaled_) {
            (void)terminate();
        }
    }

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    [[nodiscard]] pid_t pid() const noexcept override { return pid_; }

    bool terminate() noexcept override {
        if (signaled_) {
            return false;
        }
        signaled_ = true;

        bool delivered = ::kill(pid_, SIGTERM) == 0;
        if (!delivered) {
            int err = errno;
            LOG_DEBUG("SIGTERM to pid " + std::to_string(pid_) + " not delivered: " + std::strerror(err));
        }
        try {
            pending_->push_back(pid_);
        } catch (const std::bad_alloc&) {
            LOG_WARN("Cannot track pid " + std::to_string(pid_) + " for reaping; it stays a zombie until exit");
        }
        return delivered;
    }

private:
    pid_t pid_;
    bool signaled_ = false;
    std::shared_ptr<std::vector<pid_t>> pending_;
};

}

DummyGroup::~DummyGroup() {
    (void)terminateAll();
}

void DummyGroup::add(std::unique_ptr<ProcessHandle> handle) {
    if (handle) {
        handles_.push_back(std::move(handle));
    }
}

std::size_t DummyGroup::terminateAll() noexcept {
    std::size_t delivered = 0;
    for (auto& handle : handles_) {
        if (handle->terminate()) {
            ++delivered;
        }
    }
    handles_.clear();
    return delivered;
}

ProcessSupervisor::ProcessSupervisor()
    : pending_(std::make_shared<std::vector<pid_t>>()) {
}

ProcessSupervisor::~ProcessSupervisor() {
    reap();
    if (!pending_->empty()) {
        LOG_DEBUG(std::to_string(pending_->size()) + " terminated dummies still exiting");
    }
}

std::unique_ptr<ProcessHandle> ProcessSupervisor::launch(const JobSpec& job) {
    int devnull = ::open("/dev/null", O_WRONLY | O_CLOEXEC);
    if (devnull < 0) {
        throw LaunchError("Cannot open /dev/null: " + std::string(std::strerror(errno)));
    }

    pid_t pid;
    try {
        pid = spawn(job, devnull);
    } catch (...) {
        ::close(devnull);
        throw;
    }
    ::close(devnull);

    LOG_DEBUG(std::string(roleName(job.role)) + " job started (pid " + std::to_string(pid) + "): " + describe(job));
    return std::make_unique<ChildProcess>(pid, pending_);
}

TimingResult ProcessSupervisor::run(const JobSpec& job, OutputMode mode) {
    TimingResult result;

    int out[2] = {-1, -1};
    if (mode == OutputMode::Capture && ::pipe2(out, O_CLOEXEC) != 0) {
        throw LaunchError("pipe2 failed: " + std::string(std::strerror(errno)));
    }

    pid_t pid;
    try {
        pid = spawn(job, out[1]);
    } catch (...) {
        closeFd(out[0]);
        closeFd(out[1]);
        throw;
    }
    closeFd(out[1]);
    LOG_DEBUG(std::string(roleName(job.role)) + " job started (pid " + std::to_string(pid) + "): " + describe(job));

    if (out[0] >= 0) {
        char buf[4096];
        while (true) {
            ssize_t n = ::read(out[0], buf, sizeof(buf));
            if (n > 0) {
                result.output.append(buf, static_cast<std::size_t>(n));
            } else if (n == 0) {
                break;
            } else if (errno != EINTR) {
                result.error = "Reading timing output failed: " + std::string(std::strerror(errno));
                break;
            }
        }
        closeFd(out[0]);
    }

    int status = waitFor(pid);
    if (status < 0) {
        int err = errno;
        result.error = "waitpid failed: " + std::string(std::strerror(err));
        return result;
    }

    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
        result.ok = result.exitCode == 0 && result.error.empty();
        if (result.exitCode != 0) {
            result.error = "exited with status " + std::to_string(result.exitCode);
        }
    } else if (WIFSIGNALED(status)) {
        result.signal = WTERMSIG(status);
        result.error = "killed by signal " + std::to_string(result.signal);
    }
    return result;
}

void ProcessSupervisor::reap() noexcept {
    auto& pending = *pending_;
    pending.erase(std::remove_if(pending.begin(), pending.end(), [](pid_t pid) {
        int status = 0;
        pid_t r = ::waitpid(pid, &status, WNOHANG);
        // r == 0: still running; ECHILD: already collected elsewhere
        return r == pid || (r < 0 && errno == ECHILD);
    }), pending.end());
}

}
