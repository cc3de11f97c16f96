// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2025 Cortex Lattice contributors

#include <charconv>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "cortex_grading/engine.hpp"
#include "cortex_grading/python_bridge.hpp"
#include "cortex_grading/report_writer.hpp"

using cortex::grading::ComparisonMode;
using cortex::grading::Engine;
using cortex::grading::ReportWriter;
using cortex::grading::RunReport;

namespace {

constexpr int kExitAllPassed = 0;
constexpr int kExitNotPassed = 1;
constexpr int kExitUsage = 2;
constexpr int kExitInternal = 3;

constexpr std::int64_t kMaxTimeoutSeconds = 24 * 60 * 60;

struct Args {
    std::filesystem::path problem_dir{"/code/problem"};
    std::filesystem::path solution_path{"/code/solution.py"};
    std::chrono::milliseconds timeout{std::chrono::seconds{2}};
    std::optional<std::uint64_t> memory_limit_bytes{};
    std::optional<ComparisonMode> comparison{};
    std::filesystem::path report_path{};  // empty: stdout
    std::filesystem::path html_path{};    // empty: no HTML report
    std::optional<std::string> log_level{};
    bool help{false};
};

void print_usage(const char* argv0) {
    std::cerr
        << "Cortex Grader\n"
        << "Usage:\n"
        << "  " << argv0 << " [problem_dir] [solution_file]\n"
        << "                 [--timeout <seconds>] [--memory-limit <MiB>] [--comparison <mode>]\n"
        << "                 [--report <path>] [--html <path>] [--log-level <level>]\n"
        << "\n"
        << "Options:\n"
        << "  problem_dir    Directory holding problem.yaml (default: /code/problem).\n"
        << "  solution_file  Candidate Python source (default: /code/solution.py).\n"
        << "  --timeout      Per test case deadline in seconds, fractions allowed (default: 2).\n"
        << "  --memory-limit Address space limit of each test case worker in MiB.\n"
        << "  --comparison   'ordered' or 'unordered'; overrides the problem definition.\n"
        << "  --report       Write the JSON report to this path instead of stdout.\n"
        << "  --html         Also write an HTML report to this path.\n"
        << "  --log-level    trace, debug, info, warn, error, critical or off (default: warn).\n"
        << "  -h, --help     Show this help message.\n"
        << "\n"
        << "Exit status is 0 iff the pipeline completed and every test case passed.\n"
        << std::endl;
}

bool arg_eq(std::string_view a, std::string_view b) {
    return a == b;
}

std::chrono::milliseconds parse_timeout(std::string_view raw) {
    double seconds = 0.0;
    const auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), seconds);
    if (ec != std::errc{} || ptr != raw.data() + raw.size() || !std::isfinite(seconds) ||
        seconds <= 0.0) {
        throw std::runtime_error("--timeout expects a positive number of seconds, got '" +
                                 std::string{raw} + "'");
    }
    if (seconds > static_cast<double>(kMaxTimeoutSeconds)) {
        throw std::runtime_error("--timeout must not exceed " + std::to_string(kMaxTimeoutSeconds) +
                                 " seconds, got '" + std::string{raw} + "'");
    }
    const std::chrono::milliseconds timeout{std::llround(seconds * 1000.0)};
    if (timeout.count() < 1) {
        throw std::runtime_error("--timeout must be at least 0.001 seconds, got '" +
                                 std::string{raw} + "'");
    }
    return timeout;
}

std::uint64_t parse_mebibytes(std::string_view raw) {
    std::uint64_t mebibytes = 0;
    const auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), mebibytes);
    if (ec != std::errc{} || ptr != raw.data() + raw.size() || mebibytes == 0) {
        throw std::runtime_error("--memory-limit expects a positive number of MiB, got '" +
                                 std::string{raw} + "'");
    }
    return mebibytes << 20U;
}

Args parse_args(int argc, char** argv) {
    Args args;
    std::vector<std::string_view> positional;

    auto value_of = [&](int& i, std::string_view option) -> std::string_view {
        if (i + 1 >= argc) {
            throw std::runtime_error(std::string{option} + " expects a value");
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string_view tok = argv[i];
        if (arg_eq(tok, "-h") || arg_eq(tok, "--help")) {
            args.help = true;
            break;
        } else if (arg_eq(tok, "--timeout")) {
            args.timeout = parse_timeout(value_of(i, tok));
        } else if (arg_eq(tok, "--memory-limit")) {
            args.memory_limit_bytes = parse_mebibytes(value_of(i, tok));
        } else if (arg_eq(tok, "--comparison")) {
            const auto raw = value_of(i, tok);
            args.comparison = cortex::grading::parse_comparison_mode(raw);
            if (!args.comparison) {
                throw std::runtime_error("--comparison expects 'ordered' or 'unordered', got '" +
                                         std::string{raw} + "'");
            }
        } else if (arg_eq(tok, "--report")) {
            args.report_path = std::filesystem::path(value_of(i, tok));
        } else if (arg_eq(tok, "--html")) {
            args.html_path = std::filesystem::path(value_of(i, tok));
        } else if (arg_eq(tok, "--log-level")) {
            args.log_level = std::string{value_of(i, tok)};
        } else if (tok.size() > 1 && tok.front() == '-') {
            throw std::runtime_error("Unknown option '" + std::string{tok} + "'");
        } else {
            positional.push_back(tok);
        }
    }

    if (positional.size() > 2) {
        throw std::runtime_error("Expected at most two paths (problem_dir, solution_file)");
    }
    if (!positional.empty()) {
        args.problem_dir = std::filesystem::path(positional[0]);
    }
    if (positional.size() == 2) {
        args.solution_path = std::filesystem::path(positional[1]);
    }

    return args;
}

void configure_logging(const std::optional<std::string>& level) {
    auto logger = spdlog::stderr_color_mt("cortex_grader");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::warn);
    spdlog::cfg::load_env_levels();
    if (level) {
        const auto parsed = spdlog::level::from_str(*level);
        if (parsed == spdlog::level::off && *level != "off") {
            throw std::runtime_error("Unknown log level '" + *level + "'");
        }
        spdlog::set_level(parsed);
    }
}

} // namespace

int main(int argc, char** argv) {
    Args args;
    try {
        args = parse_args(argc, argv);
        if (args.help) {
            print_usage(argv[0]);
            return kExitAllPassed;
        }
        configure_logging(args.log_level);
    } catch (const std::exception& ex) {
        std::cerr << "ERROR: " << ex.what() << "\n";
        print_usage(argv[0]);
        return kExitUsage;
    }

    try {
        cortex::grading::python_bridge::Session session(
            cortex::grading::python_bridge::Session::Config{});
        std::string diag;
        if (!session.init(diag)) {
            spdlog::critical("{}", diag);
            RunReport report;
            report.error = "Unexpected error: " + diag;
            ReportWriter{}.write_json(std::cout, report);
            return kExitNotPassed;
        }

        cortex::grading::python_bridge::SolutionLoader loader(session);
        Engine engine(Engine::Config{
                          .deadline = args.timeout,
                          .memory_limit_bytes = args.memory_limit_bytes,
                          .comparison_override = args.comparison,
                      },
                      loader);

        const RunReport report = engine.run(args.problem_dir, args.solution_path);

        ReportWriter writer;
        if (args.report_path.empty()) {
            writer.write_json(std::cout, report);
        } else {
            writer.write_json(args.report_path, report);
        }
        if (!args.html_path.empty()) {
            writer.write_html(args.html_path, report);
        }
        std::cout.flush();

        return report.all_passed() ? kExitAllPassed : kExitNotPassed;
    } catch (const std::exception& ex) {
        spdlog::critical("grader aborted: {}", ex.what());
        std::cerr << "ERROR: " << ex.what() << "\n";
        return kExitInternal;
    }
}
