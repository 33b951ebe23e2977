#pragma once

#include "workspace.h"
#include "token_registry.h"
#include "process_runner.h"
#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <functional>

namespace runbox {

enum class ExecutionState {
    Creating,
    Running,
    Collecting,
    Responding,
    Cleaning,
    Done,
    Error
};

const char* execution_state_name(ExecutionState state);

struct ExecutionRequest {
    std::string code;
    std::chrono::seconds timeout{30};
    bool allow_network = false;
};

// Descriptor of one downloadable artifact
struct GeneratedFile {
    std::string filename;
    std::string download_url;
    std::chrono::system_clock::time_point expires_at;
    std::string mime_type;
    std::uintmax_t size = 0;
};

using HostedFile = GeneratedFile;

struct ExecutionResult {
    std::string output;
    bool success = false;
    std::vector<GeneratedFile> generated_files;
    std::chrono::system_clock::time_point executed_at;
    std::chrono::milliseconds wall_time{0};
};

struct LifecycleOptions {
    std::string interpreter = "python3";
    std::chrono::milliseconds artifact_ttl = std::chrono::minutes(5);
    std::string download_prefix = "/download/";
    size_t max_upload_bytes = 20 * 1024 * 1024;
};

// Drives one request through
//   CREATING -> RUNNING -> COLLECTING -> RESPONDING -> CLEANING -> DONE
// with ERROR reachable from the first four states. CLEANING runs on every
// path, including exceptions. It deletes whatever no live token references
// and destroys the workspace once it is empty; a workspace that still backs
// downloads is released to the expiry sweeper instead.
//
// All per-request state lives on the calling thread's stack, so one
// coordinator serves any number of concurrent requests.
class LifecycleCoordinator {
public:
    using StateObserver = std::function<void(const std::string& workspace_id, ExecutionState)>;

    LifecycleCoordinator(WorkspaceManager& workspaces,
                         TokenRegistry& registry,
                         const ProcessRunner& runner,
                         LifecycleOptions options = LifecycleOptions{});

    // Throws ValidationError, ResourceError, SpawnError, TimeoutError or
    // ExecutionError; the workspace has been cleaned by the time it does.
    ExecutionResult execute(const ExecutionRequest& request);

    // Store an uploaded file and mint a single token for it
    HostedFile host(const std::string& filename, const std::string& data);

    // Open the file behind a token for streaming. Throws NotFoundError or
    // ExpiredError. A token whose file vanished force-reclaims its workspace.
    OpenedDownload open_download(const std::string& token);

    // "<interpreter> --version", trimmed
    std::string interpreter_version() const;

    // Called on every state change; set before serving requests
    void set_state_observer(StateObserver observer) { observer_ = std::move(observer); }

    const LifecycleOptions& options() const { return options_; }

private:
    class CleanupGuard;

    void transition(const std::string& workspace_id, ExecutionState state) const;
    std::vector<GeneratedFile> collect(const Workspace& workspace,
                                       const std::filesystem::path& script);
    GeneratedFile describe(const TokenEntry& entry, std::uintmax_t size) const;
    void clean(const Workspace& workspace) noexcept;
    void reclaim_quietly(const Workspace& workspace, const std::string& reason) noexcept;

    WorkspaceManager& workspaces_;
    TokenRegistry& registry_;
    const ProcessRunner& runner_;
    LifecycleOptions options_;
    StateObserver observer_;
};

} // namespace runbox
