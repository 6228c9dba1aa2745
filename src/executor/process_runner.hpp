/**
 * @file process_runner.hpp
 * @brief Child process execution with deadline and cancellation enforcement.
 *
 * The child runs in its own process group so that a timeout or cancellation
 * can kill it together with anything it spawned. The child is always reaped
 * before run() returns.
 */

#pragma once

#include "core/types.hpp"

#include <filesystem>
#include <stop_token>
#include <string>
#include <vector>

namespace cloudlet {

struct ProcessSpec {
    std::vector<std::string> argv;          ///< argv[0] is looked up on PATH if it has no '/'
    std::filesystem::path working_dir;      ///< Empty = inherit
    std::vector<std::string> extra_env;     ///< "KEY=value" entries added to the inherited environment
    Bytes stdin_data;
};

enum class ProcessStatus : uint8_t {
    Exited,
    Signaled,
    TimedOut,
    Cancelled,
    SpawnFailed
};

[[nodiscard]] constexpr std::string_view to_string(ProcessStatus status) noexcept {
    switch (status) {
        case ProcessStatus::Exited:      return "exited";
        case ProcessStatus::Signaled:    return "signaled";
        case ProcessStatus::TimedOut:    return "timed_out";
        case ProcessStatus::Cancelled:   return "cancelled";
        case ProcessStatus::SpawnFailed: return "spawn_failed";
    }
    return "unknown";
}

struct ProcessOutcome {
    ProcessStatus status{ProcessStatus::SpawnFailed};
    int exit_code{-1};
    int signal{0};
    Bytes stdout_data;
    std::string stderr_text;
    bool output_truncated{false};
    std::string error;                      ///< SpawnFailed only
};

class ProcessRunner {
public:
    explicit ProcessRunner(uint64_t max_output_bytes = 1048576);

    [[nodiscard]] ProcessOutcome run(const ProcessSpec& spec,
                                     SteadyTime deadline,
                                     std::stop_token stop) const;

private:
    uint64_t max_output_bytes_;
};

/// Resolve a program name against PATH; returns an empty path if not found.
[[nodiscard]] std::filesystem::path find_executable(const std::string& program);

}  // namespace cloudlet
