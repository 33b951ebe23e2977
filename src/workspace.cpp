#include "workspace.h"
#include "errors.h"
#include "file_utils.h"
#include "constants.h"
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

namespace runbox {

WorkspaceManager::WorkspaceManager(const fs::path& base_dir) : base_dir_(base_dir) {
    std::error_code ec;
    fs::create_directories(base_dir_, ec);
    if (ec) {
        throw ResourceError("Failed to create workspace base directory",
                            base_dir_.string() + ": " + ec.message());
    }
}

Workspace WorkspaceManager::create(const std::string& prefix) {
    Workspace workspace;
    workspace.id = prefix + "_" + FileUtils::random_hex(WORKSPACE_ID_BYTES);
    workspace.root = base_dir_ / workspace.id;
    workspace.created_at = std::chrono::system_clock::now();

    // create_directory reports false for an existing path; an id collision
    // must not hand out somebody else's directory
    std::error_code ec;
    bool created = fs::create_directory(workspace.root, ec);
    if (ec || !created) {
        throw ResourceError("Failed to create workspace",
                            workspace.root.string() + ": " +
                            (ec ? ec.message() : "already exists"));
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_[workspace.id] = Tracked{workspace, false};
    }
    return workspace;
}

bool WorkspaceManager::destroy(const Workspace& workspace) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = active_.find(workspace.id);
    if (it == active_.end()) {
        return false;
    }

    std::error_code ec;
    fs::remove_all(it->second.workspace.root, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        throw ResourceError("Failed to remove workspace",
                            it->second.workspace.root.string() + ": " + ec.message());
    }

    active_.erase(it);
    return true;
}

void WorkspaceManager::release(const Workspace& workspace) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(workspace.id);
    if (it != active_.end()) {
        it->second.released = true;
    }
}

std::vector<Workspace> WorkspaceManager::released() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Workspace> result;
    for (const auto& [id, tracked] : active_) {
        if (tracked.released) {
            result.push_back(tracked.workspace);
        }
    }
    return result;
}

bool WorkspaceManager::is_released(const std::string& workspace_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(workspace_id);
    return it != active_.end() && it->second.released;
}

bool WorkspaceManager::is_active(const std::string& workspace_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.count(workspace_id) > 0;
}

size_t WorkspaceManager::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.size();
}

size_t WorkspaceManager::purge_stale() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;

    std::error_code ec;
    for (fs::directory_iterator it(base_dir_, ec), end; !ec && it != end; it.increment(ec)) {
        std::string name = it->path().filename().string();
        bool ours = name.rfind("exec_", 0) == 0 || name.rfind("host_", 0) == 0;
        if (!ours || active_.count(name)) {
            continue;
        }

        std::error_code rm_ec;
        fs::remove_all(it->path(), rm_ec);
        if (rm_ec) {
            std::cerr << "[Workspace] Failed to purge " << it->path()
                      << ": " << rm_ec.message() << std::endl;
        } else {
            removed++;
        }
    }

    if (ec) {
        std::cerr << "[Workspace] Failed to scan " << base_dir_
                  << ": " << ec.message() << std::endl;
    }
    if (removed > 0) {
        std::cout << "[Workspace] Purged " << removed << " stale workspace(s)" << std::endl;
    }
    return removed;
}

} // namespace runbox
