#pragma once

#include "workspace.h"
#include "token_registry.h"
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace runbox {

struct SweepStats {
    size_t tokens_expired = 0;
    size_t workspaces_reclaimed = 0;
    size_t failures = 0;
};

// Background reclamation of expired tokens and of released workspaces that
// nothing references any more. A failure on one workspace is logged and the
// sweep moves on to the next.
class ExpirySweeper {
public:
    using FatalHandler = std::function<void(const std::string& reason)>;

    ExpirySweeper(TokenRegistry& registry,
                  WorkspaceManager& workspaces,
                  std::chrono::milliseconds interval);
    ~ExpirySweeper();

    ExpirySweeper(const ExpirySweeper&) = delete;
    ExpirySweeper& operator=(const ExpirySweeper&) = delete;

    void start();
    void stop();
    bool running() const;

    SweepStats sweep_once(TokenRegistry::Clock::time_point now = TokenRegistry::Clock::now());

    // Invoked if an unexpected exception escapes a sweep; the sweeper thread
    // exits afterwards
    void set_fatal_handler(FatalHandler handler) { on_fatal_ = std::move(handler); }

private:
    bool reclaim_if_idle(const Workspace& workspace,
                         TokenRegistry::Clock::time_point now,
                         SweepStats& stats);
    void loop();

    TokenRegistry& registry_;
    WorkspaceManager& workspaces_;
    std::chrono::milliseconds interval_;
    FatalHandler on_fatal_;

    mutable std::mutex mutex_;
    std::condition_variable wake_;
    bool running_ = false;
    std::thread thread_;
};

} // namespace runbox
