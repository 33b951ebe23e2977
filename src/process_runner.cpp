#include "process_runner.h"
#include "errors.h"
#include "constants.h"
#include <sys/wait.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <cerrno>
#include <cstring>
#include <algorithm>
#include <sstream>
#include <thread>

extern char** environ;

namespace runbox {

namespace {

using Clock = std::chrono::steady_clock;

// Written by the child to the status pipe when it cannot reach exec
struct SpawnFailure {
    int stage;   // 0 = chdir, 1 = exec
    int error;
};

// Both ends carry O_CLOEXEC so only the dup2'd copies reach the command
struct Pipe {
    int fds[2] = {-1, -1};

    bool open() { return ::pipe2(fds, O_CLOEXEC) == 0; }
    int read_end() const { return fds[0]; }
    int write_end() const { return fds[1]; }

    void close_read() { close_fd(fds[0]); }
    void close_write() { close_fd(fds[1]); }

    ~Pipe() {
        close_read();
        close_write();
    }

    static void close_fd(int& fd) {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }
};

// Append what is available on `fd`, keeping at most `cap` bytes.
// Returns false once the write side is closed.
bool drain(int fd, std::string& sink, size_t cap, bool& truncated) {
    char buffer[PIPE_BUFFER_SIZE];
    ssize_t n = ::read(fd, buffer, sizeof(buffer));
    if (n > 0) {
        size_t room = sink.size() < cap ? cap - sink.size() : 0;
        size_t take = std::min(room, static_cast<size_t>(n));
        sink.append(buffer, take);
        if (take < static_cast<size_t>(n)) {
            truncated = true;
        }
        return true;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
        return true;
    }
    return false;
}

bool has_exited(pid_t pid);

// Poll both output pipes until they close or `until` passes.
// Returns true if both closed. Once `leader` has exited, background
// descendants still holding the pipes are killed so they cannot keep the
// call waiting for the deadline.
bool pump_output(Pipe& out, Pipe& err, RunOutcome& outcome, size_t cap,
                 Clock::time_point until, pid_t leader) {
    bool out_open = true;
    bool err_open = true;
    bool group_killed = false;

    while (out_open || err_open) {
        auto now = Clock::now();
        if (now >= until) {
            return false;
        }
        if (leader > 0 && !group_killed && has_exited(leader)) {
            ::killpg(leader, SIGKILL);
            group_killed = true;
        }
        int wait_ms = static_cast<int>(std::min<long long>(
            std::chrono::duration_cast<std::chrono::milliseconds>(until - now).count() + 1, 100));

        pollfd fds[2];
        nfds_t count = 0;
        if (out_open) fds[count++] = {out.read_end(), POLLIN, 0};
        if (err_open) fds[count++] = {err.read_end(), POLLIN, 0};

        int ready = ::poll(fds, count, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) continue;
            return false;
        }

        for (nfds_t i = 0; i < count; ++i) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) {
                continue;
            }
            if (fds[i].fd == out.read_end()) {
                out_open = drain(fds[i].fd, outcome.stdout_output, cap, outcome.output_truncated);
            } else {
                err_open = drain(fds[i].fd, outcome.raw_stderr, cap, outcome.output_truncated);
            }
        }
    }
    return true;
}

// Exit check that leaves the child unreaped, so its pid keeps naming the group
bool has_exited(pid_t pid) {
    siginfo_t info;
    std::memset(&info, 0, sizeof(info));
    while (::waitid(P_PID, pid, &info, WEXITED | WNOHANG | WNOWAIT) == -1) {
        if (errno != EINTR) {
            return true;
        }
    }
    return info.si_pid == pid;
}

bool reap(pid_t pid, int& status) {
    while (::waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            return false;
        }
    }
    return true;
}

std::vector<char*> to_argv(const std::vector<std::string>& items) {
    std::vector<char*> argv;
    argv.reserve(items.size() + 1);
    for (const auto& item : items) {
        argv.push_back(const_cast<char*>(item.c_str()));
    }
    argv.push_back(nullptr);
    return argv;
}

} // namespace

const char* run_status_name(RunStatus status) {
    switch (status) {
        case RunStatus::Exited: return "exited";
        case RunStatus::TimedOut: return "timed_out";
        case RunStatus::SpawnFailed: return "spawn_failed";
    }
    return "unknown";
}

void RunOutcome::raise_if_failed() const {
    switch (status) {
        case RunStatus::TimedOut:
            throw TimeoutError("Execution timed out",
                               stderr_output.empty() ? error_message : stderr_output);
        case RunStatus::SpawnFailed:
            throw SpawnError("Failed to start process", error_message);
        case RunStatus::Exited:
            if (exit_code != 0) {
                std::string details = stderr_output;
                if (details.empty()) {
                    details = "Process exited with code " + std::to_string(exit_code);
                }
                throw ExecutionError("Error executing code", exit_code, details);
            }
            break;
    }
}

ProcessRunner::ProcessRunner(const RunnerLimits& limits) : limits_(limits) {}

std::chrono::seconds ProcessRunner::clamp_timeout(std::chrono::seconds requested) const {
    return std::clamp(requested, limits_.min_timeout, limits_.max_timeout);
}

const std::vector<std::string>& ProcessRunner::proxy_variables() {
    static const std::vector<std::string> names = {
        "HTTP_PROXY", "HTTPS_PROXY", "ALL_PROXY",
        "http_proxy", "https_proxy", "all_proxy",
    };
    return names;
}

std::vector<std::string> ProcessRunner::build_environment(
    bool allow_network,
    const std::map<std::string, std::string>& overrides,
    char** base
) {
    const auto& proxies = proxy_variables();
    std::vector<std::string> entries;

    for (char** entry = base; entry && *entry; ++entry) {
        std::string item(*entry);
        std::string name = item.substr(0, item.find('='));

        if (!allow_network &&
            std::find(proxies.begin(), proxies.end(), name) != proxies.end()) {
            continue;
        }
        if (overrides.count(name)) {
            continue;
        }
        entries.push_back(item);
    }

    for (const auto& [name, value] : overrides) {
        entries.push_back(name + "=" + value);
    }
    return entries;
}

std::string ProcessRunner::filter_stderr(const std::string& stderr_text) {
    std::istringstream lines(stderr_text);
    std::string line;
    std::string filtered;

    while (std::getline(lines, line)) {
        bool blank = line.find_first_not_of(" \t\r") == std::string::npos;
        if (blank ||
            line.find("DEPRECATION") != std::string::npos ||
            line.find("Python 2.7") != std::string::npos ||
            line.find("WARNING") != std::string::npos) {
            continue;
        }
        if (!filtered.empty()) filtered += "\n";
        filtered += line;
    }
    return filtered;
}

RunOutcome ProcessRunner::run(const RunRequest& request) const {
    RunOutcome outcome;
    auto start = Clock::now();
    auto timeout = clamp_timeout(request.timeout);
    auto deadline = start + timeout;

    auto finish = [&]() {
        outcome.stderr_output = filter_stderr(outcome.raw_stderr);
        outcome.wall_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            Clock::now() - start);
        return outcome;
    };

    if (request.command.empty()) {
        outcome.error_message = "Empty command";
        return finish();
    }

    // Everything the child touches is prepared before fork
    std::vector<std::string> env_entries =
        build_environment(request.allow_network, request.environment, environ);
    std::vector<char*> envp = to_argv(env_entries);
    std::vector<char*> argv = to_argv(request.command);
    std::string working_dir = request.working_dir.string();

    Pipe out, err, status;
    if (!out.open() || !err.open() || !status.open()) {
        outcome.error_message = std::string("Failed to create pipes: ") + std::strerror(errno);
        return finish();
    }

    pid_t pid = ::fork();
    if (pid == -1) {
        outcome.error_message = std::string("Failed to fork process: ") + std::strerror(errno);
        return finish();
    }

    if (pid == 0) {
        // Child: own process group so a timeout kill reaches every descendant
        ::setpgid(0, 0);

        // The server blocks its shutdown signals and ignores SIGPIPE; both
        // survive exec, so the command starts from default dispositions
        sigset_t empty;
        sigemptyset(&empty);
        ::sigprocmask(SIG_SETMASK, &empty, nullptr);
        ::signal(SIGPIPE, SIG_DFL);

        int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
        }
        ::dup2(out.write_end(), STDOUT_FILENO);
        ::dup2(err.write_end(), STDERR_FILENO);

        SpawnFailure failure{0, 0};
        if (::chdir(working_dir.c_str()) != 0) {
            failure = {0, errno};
        } else {
            ::execvpe(argv[0], argv.data(), envp.data());
            failure = {1, errno};
        }
        ssize_t written = ::write(status.write_end(), &failure, sizeof(failure));
        (void)written;
        ::_exit(127);
    }

    // Parent
    outcome.pid = pid;
    ::setpgid(pid, pid);  // mirror the child's call; EACCES after exec is fine
    out.close_write();
    err.close_write();
    status.close_write();

    // The status pipe closes on successful exec (CLOEXEC) or carries the errno
    SpawnFailure failure{0, 0};
    ssize_t got;
    do {
        got = ::read(status.read_end(), &failure, sizeof(failure));
    } while (got == -1 && errno == EINTR);

    if (got == static_cast<ssize_t>(sizeof(failure))) {
        int wait_status = 0;
        reap(pid, wait_status);
        outcome.status = RunStatus::SpawnFailed;
        outcome.error_message = std::string(failure.stage == 0 ? "chdir " : "exec ") +
                                (failure.stage == 0 ? working_dir : request.command[0]) +
                                ": " + std::strerror(failure.error);
        return finish();
    }

    bool pipes_closed = pump_output(out, err, outcome, limits_.max_output_bytes, deadline, pid);
    bool timed_out = !pipes_closed && Clock::now() >= deadline;

    while (!timed_out && !has_exited(pid)) {
        if (Clock::now() >= deadline) {
            timed_out = true;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    // On timeout this stops the command itself; otherwise it takes out
    // descendants still running in the background
    ::killpg(pid, SIGKILL);

    if (timed_out) {
        ::kill(pid, SIGKILL);  // in case the group change raced with exec
        pump_output(out, err, outcome, limits_.max_output_bytes,
                    Clock::now() + std::chrono::seconds(1), -1);
    }

    int wait_status = 0;
    if (!reap(pid, wait_status)) {
        outcome.status = RunStatus::SpawnFailed;
        outcome.error_message = std::string("Failed to wait for child process: ") +
                                std::strerror(errno);
        return finish();
    }

    if (timed_out) {
        outcome.status = RunStatus::TimedOut;
        outcome.term_signal = SIGKILL;
        outcome.error_message = "Process exceeded " + std::to_string(timeout.count()) +
                                "s timeout";
    } else if (WIFEXITED(wait_status)) {
        outcome.status = RunStatus::Exited;
        outcome.exit_code = WEXITSTATUS(wait_status);
    } else if (WIFSIGNALED(wait_status)) {
        outcome.status = RunStatus::Exited;
        outcome.term_signal = WTERMSIG(wait_status);
        outcome.exit_code = 128 + outcome.term_signal;
    }

    return finish();
}

} // namespace runbox
