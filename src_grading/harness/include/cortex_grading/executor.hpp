// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2025 Cortex Lattice contributors

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "candidate.hpp"
#include "value.hpp"

namespace cortex::grading {

/**
 * \brief What one invocation of candidate code produced.
 *
 * `output` is meaningful only for Returned; `fault_kind`, `fault_message` and `traceback` only
 * for Faulted. `elapsed_ms` is always recorded.
 */
struct ExecutionOutcome {
    enum class Status : std::uint8_t {
        Returned,
        TimedOut,
        Faulted,
    } status{Status::Faulted};

    Value output{};
    std::string fault_kind;
    std::string fault_message;
    std::string traceback;
    std::chrono::milliseconds deadline{0};
    double elapsed_ms{0.0};

    [[nodiscard]] bool returned() const noexcept { return status == Status::Returned; }

    /// "Timeout: execution exceeded 2 seconds", "<kind>: <message>", or empty when Returned.
    [[nodiscard]] std::string describe_fault() const;
};

/**
 * \brief Runs one invocation of candidate code under a wall-clock deadline.
 *
 * Every call forks a dedicated worker process which invokes the callable and reports the result
 * (CBOR over a pipe). The parent polls the pipe until the deadline; a worker that misses it is
 * killed together with its process group and reaped before execute() returns, so nothing carries
 * over to the next test case. Faults never propagate as exceptions: raising candidates, crashing
 * workers and oversized results all come back as Faulted outcomes.
 *
 * Only OS failures of the executor itself (pipe(), fork(), poll()) throw std::system_error.
 * The calling process must be single-threaded while execute() runs.
 */
class SandboxedExecutor {
public:
    struct Config {
        std::chrono::milliseconds deadline{std::chrono::seconds{2}};
        std::optional<std::uint64_t> memory_limit_bytes{};  ///< RLIMIT_AS of the worker
        std::size_t max_result_bytes{64U << 20U};
    };

    SandboxedExecutor() = default;
    /// Throws std::invalid_argument for a deadline below 1 ms.
    explicit SandboxedExecutor(Config config);

    [[nodiscard]] ExecutionOutcome execute(const Invocable& callable, const Value& arguments) const;

    [[nodiscard]] const Config& config() const noexcept { return config_; }

private:
    Config config_{};
};

/// "2" for whole seconds, "1.5" otherwise.
[[nodiscard]] std::string format_seconds(std::chrono::milliseconds duration);

}  // namespace cortex::grading
