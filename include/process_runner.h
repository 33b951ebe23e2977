#pragma once

#include <string>
#include <vector>
#include <map>
#include <chrono>
#include <filesystem>
#include <sys/types.h>

namespace runbox {

enum class RunStatus {
    Exited,       // Process ran to completion (any exit code or signal)
    TimedOut,     // Deadline hit, process group killed
    SpawnFailed   // Command could not be started
};

const char* run_status_name(RunStatus status);

struct RunRequest {
    std::vector<std::string> command;
    std::filesystem::path working_dir;
    std::chrono::seconds timeout{30};
    bool allow_network = false;
    std::map<std::string, std::string> environment;  // Set on top of the inherited env
};

struct RunOutcome {
    RunStatus status = RunStatus::SpawnFailed;
    int exit_code = -1;               // 128 + signal when killed by a signal
    int term_signal = 0;
    pid_t pid = -1;
    std::string stdout_output;
    std::string stderr_output;        // Filtered for presentation
    std::string raw_stderr;
    std::string error_message;
    std::chrono::milliseconds wall_time{0};
    bool output_truncated = false;

    bool succeeded() const { return status == RunStatus::Exited && exit_code == 0; }

    // Throws TimeoutError, SpawnError or ExecutionError unless succeeded()
    void raise_if_failed() const;
};

struct RunnerLimits {
    std::chrono::seconds min_timeout{1};
    std::chrono::seconds max_timeout{60};
    size_t max_output_bytes = 10 * 1024 * 1024;
};

// Runs one external command with a wall-clock deadline.
// Stateless; concurrent calls on one instance are safe.
class ProcessRunner {
public:
    explicit ProcessRunner(const RunnerLimits& limits = RunnerLimits{});

    // Blocks the calling thread until the command exits or the clamped
    // deadline fires. Never throws for process failures; inspect the outcome.
    RunOutcome run(const RunRequest& request) const;

    std::chrono::seconds clamp_timeout(std::chrono::seconds requested) const;

    const RunnerLimits& limits() const { return limits_; }

    // Child environment as "KEY=VALUE" entries. With network disabled every
    // proxy variable of `base` is dropped, not merely left unset.
    static std::vector<std::string> build_environment(
        bool allow_network,
        const std::map<std::string, std::string>& overrides,
        char** base);

    // Drop blank lines and known-noisy interpreter diagnostics
    static std::string filter_stderr(const std::string& stderr_text);

    static const std::vector<std::string>& proxy_variables();

private:
    RunnerLimits limits_;
};

} // namespace runbox
