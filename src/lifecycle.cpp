#include "lifecycle.h"
#include "errors.h"
#include "file_utils.h"
#include "constants.h"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

namespace runbox {

const char* execution_state_name(ExecutionState state) {
    switch (state) {
        case ExecutionState::Creating: return "CREATING";
        case ExecutionState::Running: return "RUNNING";
        case ExecutionState::Collecting: return "COLLECTING";
        case ExecutionState::Responding: return "RESPONDING";
        case ExecutionState::Cleaning: return "CLEANING";
        case ExecutionState::Done: return "DONE";
        case ExecutionState::Error: return "ERROR";
    }
    return "UNKNOWN";
}

// Runs CLEANING when the request scope unwinds, whatever the path
class LifecycleCoordinator::CleanupGuard {
public:
    CleanupGuard(LifecycleCoordinator& owner, const Workspace& workspace)
        : owner_(owner), workspace_(workspace) {}

    ~CleanupGuard() { owner_.clean(workspace_); }

    CleanupGuard(const CleanupGuard&) = delete;
    CleanupGuard& operator=(const CleanupGuard&) = delete;

private:
    LifecycleCoordinator& owner_;
    Workspace workspace_;
};

LifecycleCoordinator::LifecycleCoordinator(WorkspaceManager& workspaces,
                                           TokenRegistry& registry,
                                           const ProcessRunner& runner,
                                           LifecycleOptions options)
    : workspaces_(workspaces), registry_(registry), runner_(runner),
      options_(std::move(options)) {}

void LifecycleCoordinator::transition(const std::string& workspace_id,
                                      ExecutionState state) const {
    std::cout << "[Lifecycle] " << (workspace_id.empty() ? "-" : workspace_id)
              << ": " << execution_state_name(state) << std::endl;
    if (observer_) {
        observer_(workspace_id, state);
    }
}

ExecutionResult LifecycleCoordinator::execute(const ExecutionRequest& request) {
    if (request.code.empty()) {
        throw ValidationError("No valid code provided");
    }

    auto started = std::chrono::steady_clock::now();
    transition("", ExecutionState::Creating);

    Workspace workspace;
    try {
        workspace = workspaces_.create("exec");
    } catch (const std::exception& e) {
        std::cerr << "[Lifecycle] Workspace creation failed: " << e.what() << std::endl;
        transition("", ExecutionState::Error);
        throw;
    }

    CleanupGuard guard(*this, workspace);
    ExecutionResult result;

    try {
        fs::path script = workspace.root / ("script_" + workspace.id + ".py");
        {
            std::ofstream out(script, std::ios::binary);
            out << request.code;
            if (!out) {
                throw ResourceError("Failed to write script", script.string());
            }
        }

        transition(workspace.id, ExecutionState::Running);
        RunRequest run;
        run.command = {options_.interpreter, script.string()};
        run.working_dir = workspace.root;
        run.timeout = request.timeout;
        run.allow_network = request.allow_network;

        RunOutcome outcome = runner_.run(run);
        std::cout << "[Lifecycle] " << workspace.id << ": process "
                  << run_status_name(outcome.status)
                  << " (exit=" << outcome.exit_code
                  << ", wall=" << outcome.wall_time.count() << "ms)" << std::endl;
        outcome.raise_if_failed();

        transition(workspace.id, ExecutionState::Collecting);
        result.generated_files = collect(workspace, script);

        transition(workspace.id, ExecutionState::Responding);
        result.output = outcome.stdout_output.empty() ? EMPTY_OUTPUT_MESSAGE
                                                      : outcome.stdout_output;
        result.success = true;
        result.executed_at = std::chrono::system_clock::now();
        result.wall_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
    } catch (const std::exception& e) {
        std::cerr << "[Lifecycle] " << workspace.id << ": " << e.what() << std::endl;
        transition(workspace.id, ExecutionState::Error);
        throw;
    }

    return result;
}

std::vector<GeneratedFile> LifecycleCoordinator::collect(const Workspace& workspace,
                                                         const fs::path& script) {
    std::vector<GeneratedFile> files;

    std::error_code ec;
    for (fs::directory_iterator it(workspace.root, ec), end; !ec && it != end; it.increment(ec)) {
        const fs::path& path = it->path();

        // Symlinks are skipped: a token must never reach outside the workspace
        std::error_code st_ec;
        if (it->symlink_status(st_ec).type() != fs::file_type::regular) {
            continue;
        }
        if (path == script || path.extension() == ".py") {
            continue;
        }

        std::uintmax_t size = fs::file_size(path, st_ec);
        if (st_ec) {
            continue;
        }

        TokenEntry entry = registry_.mint(path, workspace, options_.artifact_ttl);
        files.push_back(describe(entry, size));
    }

    if (ec) {
        std::cerr << "[Lifecycle] Directory read error for " << workspace.id
                  << ": " << ec.message() << std::endl;
    }

    std::sort(files.begin(), files.end(), [](const GeneratedFile& a, const GeneratedFile& b) {
        return a.filename < b.filename;
    });
    return files;
}

GeneratedFile LifecycleCoordinator::describe(const TokenEntry& entry, std::uintmax_t size) const {
    GeneratedFile file;
    file.filename = entry.file_path.filename().string();
    file.download_url = options_.download_prefix + entry.token;
    file.expires_at = entry.expires_at;
    file.mime_type = FileUtils::get_mime_type(file.filename);
    file.size = size;
    return file;
}

void LifecycleCoordinator::clean(const Workspace& workspace) noexcept {
    transition(workspace.id, ExecutionState::Cleaning);

    try {
        std::error_code ec;
        std::vector<fs::path> entries;
        for (fs::directory_iterator it(workspace.root, ec), end; !ec && it != end; it.increment(ec)) {
            entries.push_back(it->path());
        }

        // Files still backing a download stay; everything else goes
        for (const auto& path : entries) {
            if (registry_.is_referenced(path)) {
                continue;
            }
            std::error_code rm_ec;
            fs::remove_all(path, rm_ec);
            if (rm_ec) {
                std::cerr << "[Lifecycle] Failed to remove " << path
                          << ": " << rm_ec.message() << std::endl;
            }
        }

        std::error_code probe_ec;
        bool gone = !fs::exists(workspace.root, probe_ec) && !probe_ec;
        bool empty = !gone && fs::is_empty(workspace.root, probe_ec) && !probe_ec;

        if (gone || empty) {
            registry_.reclaim(workspace, workspaces_);
            std::cout << "[Lifecycle] Cleaned up workspace " << workspace.id << std::endl;
        } else {
            workspaces_.release(workspace);
            std::cout << "[Lifecycle] Workspace " << workspace.id
                      << " kept for pending downloads" << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "[Lifecycle] Cleanup failed for " << workspace.id
                  << ": " << e.what() << std::endl;
        workspaces_.release(workspace);
    }

    transition(workspace.id, ExecutionState::Done);
}

HostedFile LifecycleCoordinator::host(const std::string& filename, const std::string& data) {
    std::string name = FileUtils::sanitize_filename(filename);
    if (name.empty()) {
        throw ValidationError("No file uploaded");
    }
    if (data.empty()) {
        throw ValidationError("Uploaded file is empty");
    }
    if (data.size() > options_.max_upload_bytes) {
        throw PayloadTooLargeError("File exceeds " +
                                   std::to_string(options_.max_upload_bytes / (1024 * 1024)) +
                                   "MB limit");
    }

    transition("", ExecutionState::Creating);
    Workspace workspace;
    try {
        workspace = workspaces_.create("host");
    } catch (const std::exception& e) {
        std::cerr << "[Lifecycle] Workspace creation failed: " << e.what() << std::endl;
        transition("", ExecutionState::Error);
        throw;
    }

    CleanupGuard guard(*this, workspace);
    HostedFile hosted;

    try {
        fs::path target = workspace.root / name;
        {
            std::ofstream out(target, std::ios::binary);
            out.write(data.data(), static_cast<std::streamsize>(data.size()));
            if (!out) {
                throw ResourceError("Failed to store upload", target.string());
            }
        }

        transition(workspace.id, ExecutionState::Collecting);
        TokenEntry entry = registry_.mint(target, workspace, options_.artifact_ttl);
        hosted = describe(entry, data.size());

        transition(workspace.id, ExecutionState::Responding);
        std::cout << "[Lifecycle] Hosted " << name << " ("
                  << FileUtils::format_file_size(data.size()) << ")" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[Lifecycle] " << workspace.id << ": " << e.what() << std::endl;
        transition(workspace.id, ExecutionState::Error);
        throw;
    }

    return hosted;
}

OpenedDownload LifecycleCoordinator::open_download(const std::string& token) {
    OpenedDownload download = registry_.open(token);

    switch (download.status) {
        case ResolveStatus::Found:
            return download;

        case ResolveStatus::Expired: {
            const Workspace& workspace = download.entry.workspace;
            registry_.revoke(token);
            if (workspaces_.is_released(workspace.id) &&
                !registry_.has_live_tokens(workspace.id)) {
                reclaim_quietly(workspace, "expired download");
            }
            throw ExpiredError("Download link has expired");
        }

        case ResolveStatus::NotFound:
            break;
    }

    if (download.file_missing) {
        reclaim_quietly(download.entry.workspace, "download error");
        throw NotFoundError("File not found");
    }
    throw NotFoundError("Invalid or expired download token");
}

void LifecycleCoordinator::reclaim_quietly(const Workspace& workspace,
                                           const std::string& reason) noexcept {
    try {
        if (registry_.reclaim(workspace, workspaces_)) {
            std::cout << "[Lifecycle] Cleaned up workspace " << workspace.id
                      << " after " << reason << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "[Lifecycle] Cleanup failed for " << workspace.id
                  << ": " << e.what() << std::endl;
    }
}

std::string LifecycleCoordinator::interpreter_version() const {
    RunRequest probe;
    probe.command = {options_.interpreter, "--version"};
    probe.working_dir = workspaces_.base_dir();
    probe.timeout = std::chrono::seconds(VERSION_PROBE_TIMEOUT_SECONDS);

    RunOutcome outcome = runner_.run(probe);
    outcome.raise_if_failed();

    // Python 2 reports its version on stderr
    std::string version = outcome.stdout_output.empty() ? outcome.raw_stderr
                                                        : outcome.stdout_output;
    size_t end = version.find_last_not_of(" \t\r\n");
    return end == std::string::npos ? "" : version.substr(0, end + 1);
}

} // namespace runbox
