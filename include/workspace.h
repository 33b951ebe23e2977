#pragma once

#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <chrono>
#include <filesystem>

namespace runbox {

// Disposable directory scoped to one execution or upload request
struct Workspace {
    std::string id;
    std::filesystem::path root;
    std::chrono::system_clock::time_point created_at;
};

// Creates, tracks and destroys workspaces below one base directory.
//
// Every workspace is destroyed exactly once: destroy() is idempotent and
// only the call that actually removes the directory returns true. A
// workspace whose removal failed stays tracked so a later sweep retries it.
class WorkspaceManager {
public:
    explicit WorkspaceManager(const std::filesystem::path& base_dir);

    // Allocate a fresh directory named "<prefix>_<random hex>".
    // Throws ResourceError if the directory cannot be created.
    Workspace create(const std::string& prefix = "exec");

    // Recursively remove the workspace. No-op (false) if already destroyed.
    // Throws ResourceError if the tree could not be removed.
    bool destroy(const Workspace& workspace);

    // The owning request is finished; the sweeper may reclaim it once no
    // live token references it.
    void release(const Workspace& workspace);

    std::vector<Workspace> released() const;
    bool is_released(const std::string& workspace_id) const;
    bool is_active(const std::string& workspace_id) const;
    size_t active_count() const;

    // Remove leftover workspace directories from a previous run
    size_t purge_stale();

    const std::filesystem::path& base_dir() const { return base_dir_; }

private:
    struct Tracked {
        Workspace workspace;
        bool released = false;
    };

    std::filesystem::path base_dir_;
    mutable std::mutex mutex_;
    std::map<std::string, Tracked> active_;
};

} // namespace runbox
