#pragma once

#include "workspace.h"
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <chrono>
#include <fstream>
#include <filesystem>

namespace runbox {

struct TokenEntry {
    std::string token;
    std::filesystem::path file_path;
    Workspace workspace;
    std::chrono::system_clock::time_point expires_at;
};

enum class ResolveStatus {
    Found,
    Expired,    // Still recorded but past its expiry
    NotFound
};

struct Resolution {
    ResolveStatus status = ResolveStatus::NotFound;
    TokenEntry entry;    // Meaningful unless NotFound
};

// A download whose file was opened while the registry lock was held. The
// open descriptor stays readable even if the workspace is destroyed later.
struct OpenedDownload {
    ResolveStatus status = ResolveStatus::NotFound;
    TokenEntry entry;
    std::unique_ptr<std::ifstream> stream;   // Set only when Found
    bool file_missing = false;               // Token was live but the file is gone
};

// Concurrent map from opaque download token to file, owning workspace and
// expiry. Tokens are never updated in place, only removed.
//
// Downloads are multi-use: resolving or opening a token does not consume it.
// It stays valid until its expiry or until its workspace is reclaimed.
class TokenRegistry {
public:
    using Clock = std::chrono::system_clock;

    // Record a new token for `file` valid for `ttl`. Throws ResourceError if
    // no random token can be generated.
    TokenEntry mint(const std::filesystem::path& file,
                    const Workspace& workspace,
                    std::chrono::milliseconds ttl);

    // Entries past their expiry resolve as Expired even before a sweep
    // removes them
    Resolution resolve(const std::string& token, Clock::time_point now = Clock::now()) const;

    OpenedDownload open(const std::string& token, Clock::time_point now = Clock::now()) const;

    bool revoke(const std::string& token);
    size_t revoke_all(const std::string& workspace_id);

    // Revoke every token of the workspace, then destroy its directory after
    // the registry lock is released. Returns true if this call removed the
    // directory. Throws ResourceError if removal failed (tokens stay revoked).
    bool reclaim(const Workspace& workspace, WorkspaceManager& workspaces);

    // Remove and return every entry whose expiry has passed
    std::vector<TokenEntry> take_expired(Clock::time_point now = Clock::now());

    bool is_referenced(const std::filesystem::path& file, Clock::time_point now = Clock::now()) const;
    bool has_live_tokens(const std::string& workspace_id, Clock::time_point now = Clock::now()) const;
    size_t live_count(Clock::time_point now = Clock::now()) const;

    // Recorded entries, expired ones included
    size_t size() const;

private:
    static bool is_expired(const TokenEntry& entry, Clock::time_point now) {
        return entry.expires_at <= now;
    }

    size_t revoke_all_locked(const std::string& workspace_id);

    mutable std::mutex mutex_;
    std::map<std::string, TokenEntry> tokens_;
};

} // namespace runbox
