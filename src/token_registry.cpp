#include "token_registry.h"
#include "file_utils.h"
#include "constants.h"
#include <iostream>

namespace runbox {

TokenEntry TokenRegistry::mint(const std::filesystem::path& file,
                                const Workspace& workspace,
                                std::chrono::milliseconds ttl) {
    TokenEntry entry;
    entry.file_path = file;
    entry.workspace = workspace;
    entry.expires_at = Clock::now() + ttl;

    std::lock_guard<std::mutex> lock(mutex_);
    do {
        entry.token = FileUtils::random_hex(TOKEN_BYTES);
    } while (tokens_.count(entry.token));

    tokens_[entry.token] = entry;
    std::cout << "[Registry] Minted token " << entry.token.substr(0, 8) << "... for "
              << workspace.id << "/" << file.filename().string() << std::endl;
    return entry;
}

Resolution TokenRegistry::resolve(const std::string& token, Clock::time_point now) const {
    Resolution resolution;

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tokens_.find(token);
    if (it == tokens_.end()) {
        return resolution;
    }

    resolution.entry = it->second;
    resolution.status = is_expired(it->second, now) ? ResolveStatus::Expired
                                                    : ResolveStatus::Found;
    return resolution;
}

OpenedDownload TokenRegistry::open(const std::string& token, Clock::time_point now) const {
    OpenedDownload download;

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tokens_.find(token);
    if (it == tokens_.end()) {
        return download;
    }

    download.entry = it->second;
    if (is_expired(it->second, now)) {
        download.status = ResolveStatus::Expired;
        return download;
    }

    auto stream = std::make_unique<std::ifstream>(it->second.file_path, std::ios::binary);
    if (!stream->is_open()) {
        download.file_missing = true;
        return download;
    }

    download.status = ResolveStatus::Found;
    download.stream = std::move(stream);
    return download;
}

bool TokenRegistry::revoke(const std::string& token) {
    std::lock_guard<std::mutex> lock(mutex_);
    return tokens_.erase(token) > 0;
}

size_t TokenRegistry::revoke_all(const std::string& workspace_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return revoke_all_locked(workspace_id);
}

size_t TokenRegistry::revoke_all_locked(const std::string& workspace_id) {
    size_t removed = 0;
    for (auto it = tokens_.begin(); it != tokens_.end();) {
        if (it->second.workspace.id == workspace_id) {
            it = tokens_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    return removed;
}

bool TokenRegistry::reclaim(const Workspace& workspace, WorkspaceManager& workspaces) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        revoke_all_locked(workspace.id);
    }
    // No token reaches the workspace any more; a download that opened its
    // file before the revoke keeps reading through its own descriptor
    return workspaces.destroy(workspace);
}

std::vector<TokenEntry> TokenRegistry::take_expired(Clock::time_point now) {
    std::vector<TokenEntry> expired;

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = tokens_.begin(); it != tokens_.end();) {
        if (is_expired(it->second, now)) {
            expired.push_back(it->second);
            it = tokens_.erase(it);
        } else {
            ++it;
        }
    }
    return expired;
}

bool TokenRegistry::is_referenced(const std::filesystem::path& file, Clock::time_point now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [token, entry] : tokens_) {
        if (entry.file_path == file && !is_expired(entry, now)) {
            return true;
        }
    }
    return false;
}

bool TokenRegistry::has_live_tokens(const std::string& workspace_id, Clock::time_point now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [token, entry] : tokens_) {
        if (entry.workspace.id == workspace_id && !is_expired(entry, now)) {
            return true;
        }
    }
    return false;
}

size_t TokenRegistry::live_count(Clock::time_point now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t live = 0;
    for (const auto& [token, entry] : tokens_) {
        if (!is_expired(entry, now)) {
            live++;
        }
    }
    return live;
}

size_t TokenRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tokens_.size();
}

} // namespace runbox
