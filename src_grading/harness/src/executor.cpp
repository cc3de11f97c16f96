// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2025 Cortex Lattice contributors

#include "cortex_grading/executor.hpp"
#include "cortex_grading/errors.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace {

using cortex::grading::ExecutionOutcome;
using cortex::grading::Value;
using Clock = std::chrono::steady_clock;

[[noreturn]] void throw_errno(const char* what) {
    throw std::system_error(errno, std::generic_category(), what);
}

class FileDescriptor {
public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) noexcept : fd_{fd} {}
    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;
    ~FileDescriptor() { close(); }

    [[nodiscard]] int get() const noexcept { return fd_; }

    void close() noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_{-1};
};

/**
 * Owns a forked worker until it is reaped. Destruction kills and reaps a worker that is still
 * owned, which disarms the deadline on every exit path out of execute().
 */
class WorkerProcess {
public:
    explicit WorkerProcess(pid_t pid) noexcept : pid_{pid} {}
    WorkerProcess(const WorkerProcess&) = delete;
    WorkerProcess& operator=(const WorkerProcess&) = delete;
    ~WorkerProcess() { terminate(); }

    void terminate() noexcept {
        if (pid_ <= 0) {
            return;
        }
        ::kill(-pid_, SIGKILL);
        ::kill(pid_, SIGKILL);
        reap();
    }

    void reap() noexcept {
        if (pid_ <= 0) {
            return;
        }
        int status = 0;
        while (::waitpid(pid_, &status, 0) == -1 && errno == EINTR) {
        }
        status_ = status;
        pid_ = -1;
    }

    /// Reaps the worker if it exits before `until`; returns false when it is still running.
    bool reap_until(Clock::time_point until) noexcept {
        while (pid_ > 0) {
            int status = 0;
            const pid_t rc = ::waitpid(pid_, &status, WNOHANG);
            if (rc == pid_ || (rc == -1 && errno != EINTR)) {
                status_ = status;
                pid_ = -1;
                return true;
            }
            if (Clock::now() >= until) {
                return false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds{1});
        }
        return true;
    }

    [[nodiscard]] int status() const noexcept { return status_; }

private:
    pid_t pid_{-1};
    int status_{0};
};

bool write_all(int fd, const std::uint8_t* data, std::size_t size) noexcept {
    while (size > 0) {
        const ssize_t written = ::write(fd, data, size);
        if (written == -1) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        data += written;
        size -= static_cast<std::size_t>(written);
    }
    return true;
}

double to_milliseconds(std::chrono::nanoseconds duration) {
    return std::chrono::duration<double, std::milli>(duration).count();
}

Value fault_report(const std::string& kind, const std::string& message,
                   const std::string& traceback = {}) {
    return Value{
        {"status", "faulted"},
        {"kind", kind},
        {"message", message},
        {"traceback", traceback},
    };
}

// Runs in the forked worker; never returns.
[[noreturn]] void run_worker(const cortex::grading::Invocable& callable,
                             const Value& arguments,
                             int result_fd,
                             const cortex::grading::SandboxedExecutor::Config& config) noexcept {
    ::setpgid(0, 0);
    if (config.memory_limit_bytes) {
        rlimit limit{};
        limit.rlim_cur = static_cast<rlim_t>(*config.memory_limit_bytes);
        limit.rlim_max = static_cast<rlim_t>(*config.memory_limit_bytes);
        ::setrlimit(RLIMIT_AS, &limit);
    }

    Value report;
    const auto started = Clock::now();
    try {
        callable.after_fork_child();
        Value output = callable.invoke(arguments);
        report = Value{{"status", "returned"}, {"output", std::move(output)}};
    } catch (const cortex::grading::CandidateFault& fault) {
        report = fault_report(fault.kind(), fault.what(), fault.traceback());
    } catch (const std::bad_alloc&) {
        report = fault_report("MemoryError", "out of memory");
    } catch (const std::exception& ex) {
        report = fault_report("Exception", ex.what());
    } catch (...) {
        report = fault_report("Exception", "unknown exception");
    }
    report["elapsed_ns"] =
        std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - started).count();

    int exit_code = 0;
    try {
        callable.flush_output();
        std::vector<std::uint8_t> bytes;
        try {
            bytes = Value::to_cbor(report);
        } catch (const Value::exception& ex) {
            auto fallback = fault_report("SerializationError", ex.what());
            fallback["elapsed_ns"] = report["elapsed_ns"];
            bytes = Value::to_cbor(fallback);
        }
        if (!write_all(result_fd, bytes.data(), bytes.size())) {
            exit_code = 1;
        }
    } catch (const std::exception&) {
        exit_code = 1;
    }

    std::fflush(nullptr);
    ::_exit(exit_code);
}

std::string describe_wait_status(int status) {
    std::ostringstream oss;
    if (WIFSIGNALED(status)) {
        const int signal = WTERMSIG(status);
        const char* name = ::strsignal(signal);
        oss << "worker terminated by signal " << signal;
        if (name != nullptr) {
            oss << " (" << name << ")";
        }
    } else if (WIFEXITED(status)) {
        oss << "worker exited with status " << WEXITSTATUS(status)
            << " before reporting a result";
    } else {
        oss << "worker ended abnormally (wait status " << status << ")";
    }
    return oss.str();
}

void apply_report(ExecutionOutcome& outcome, const Value& report) {
    if (const auto it = report.find("elapsed_ns"); it != report.end() && it->is_number()) {
        outcome.elapsed_ms = to_milliseconds(std::chrono::nanoseconds{it->get<std::int64_t>()});
    }
    if (report.value("status", std::string{}) == "returned") {
        outcome.status = ExecutionOutcome::Status::Returned;
        outcome.output = report.value("output", Value{});
        return;
    }
    outcome.status = ExecutionOutcome::Status::Faulted;
    outcome.fault_kind = report.value("kind", std::string{"Exception"});
    outcome.fault_message = report.value("message", std::string{});
    outcome.traceback = report.value("traceback", std::string{});
}

}  // namespace

namespace cortex::grading {

std::string format_seconds(std::chrono::milliseconds duration) {
    const auto count = duration.count();
    if (count % 1000 == 0) {
        return std::to_string(count / 1000);
    }
    std::ostringstream oss;
    oss << static_cast<double>(count) / 1000.0;
    return oss.str();
}

std::string ExecutionOutcome::describe_fault() const {
    switch (status) {
        case Status::Returned:
            return {};
        case Status::TimedOut:
            return "Timeout: execution exceeded " + format_seconds(deadline) + " seconds";
        case Status::Faulted:
            if (fault_message.empty()) {
                return fault_kind;
            }
            return fault_kind + ": " + fault_message;
    }
    return {};
}

SandboxedExecutor::SandboxedExecutor(Config config) : config_{std::move(config)} {
    if (config_.deadline < std::chrono::milliseconds{1}) {
        throw std::invalid_argument("execution deadline must be at least 1 ms, got " +
                                    std::to_string(config_.deadline.count()) + " ms");
    }
}

ExecutionOutcome SandboxedExecutor::execute(const Invocable& callable,
                                            const Value& arguments) const {
    ExecutionOutcome outcome;
    outcome.deadline = config_.deadline;

    std::array<int, 2> fds{-1, -1};
    if (::pipe2(fds.data(), O_CLOEXEC) == -1) {
        throw_errno("pipe2()");
    }
    FileDescriptor read_end{fds[0]};
    FileDescriptor write_end{fds[1]};

    // Buffered output must not be duplicated into the worker.
    std::cout.flush();
    std::cerr.flush();
    std::fflush(nullptr);

    callable.before_fork();
    const auto started = Clock::now();
    const pid_t pid = ::fork();
    if (pid == -1) {
        const int fork_errno = errno;
        callable.after_fork_parent();
        throw std::system_error(fork_errno, std::generic_category(), "fork()");
    }
    if (pid == 0) {
        read_end.close();
        run_worker(callable, arguments, write_end.get(), config_);
    }
    callable.after_fork_parent();
    write_end.close();

    WorkerProcess worker{pid};
    const auto deadline_at = started + config_.deadline;

    std::vector<std::uint8_t> payload;
    std::array<std::uint8_t, 1 << 16> buffer{};
    bool timed_out = false;
    bool oversized = false;

    pollfd pfd{};
    pfd.fd = read_end.get();
    pfd.events = POLLIN;
    for (;;) {
        const auto remaining = deadline_at - Clock::now();
        if (remaining <= Clock::duration::zero()) {
            timed_out = true;
            break;
        }
        const auto wait_ms = std::min<std::chrono::milliseconds::rep>(
            std::chrono::ceil<std::chrono::milliseconds>(remaining).count(),
            std::numeric_limits<int>::max());
        pfd.revents = 0;
        const int rc = ::poll(&pfd, 1, static_cast<int>(wait_ms));
        if (rc == -1) {
            if (errno == EINTR) {
                continue;
            }
            throw_errno("poll()");
        }
        if (rc == 0) {
            continue;
        }

        const ssize_t received = ::read(read_end.get(), buffer.data(), buffer.size());
        if (received == -1) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            throw_errno("read()");
        }
        if (received == 0) {
            break;
        }
        if (payload.size() + static_cast<std::size_t>(received) > config_.max_result_bytes) {
            oversized = true;
            break;
        }
        payload.insert(payload.end(), buffer.begin(), buffer.begin() + received);
    }

    // The pipe closed; a worker that lingers past the deadline anyway is treated as hung.
    if (!timed_out && !oversized && !worker.reap_until(deadline_at)) {
        timed_out = true;
    }
    const auto wall_elapsed = Clock::now() - started;
    worker.terminate();
    outcome.elapsed_ms = to_milliseconds(wall_elapsed);

    if (timed_out) {
        outcome.status = ExecutionOutcome::Status::TimedOut;
        spdlog::debug("worker {} timed out after {} ms", pid, config_.deadline.count());
        return outcome;
    }
    if (oversized) {
        outcome.status = ExecutionOutcome::Status::Faulted;
        outcome.fault_kind = "OutputLimitExceeded";
        outcome.fault_message =
            "result exceeds " + std::to_string(config_.max_result_bytes) + " bytes";
        return outcome;
    }
    if (payload.empty()) {
        outcome.status = ExecutionOutcome::Status::Faulted;
        outcome.fault_kind = "Crash";
        outcome.fault_message = describe_wait_status(worker.status());
        spdlog::debug("worker {} crashed: {}", pid, outcome.fault_message);
        return outcome;
    }

    try {
        apply_report(outcome, Value::from_cbor(payload));
    } catch (const Value::exception& ex) {
        outcome.status = ExecutionOutcome::Status::Faulted;
        outcome.fault_kind = "Crash";
        outcome.fault_message = describe_wait_status(worker.status()) +
                                " (unreadable result: " + ex.what() + ")";
    }
    return outcome;
}

}  // namespace cortex::grading
