#include "expiry_sweeper.h"
#include <iostream>
#include <set>

namespace runbox {

ExpirySweeper::ExpirySweeper(TokenRegistry& registry,
                             WorkspaceManager& workspaces,
                             std::chrono::milliseconds interval)
    : registry_(registry), workspaces_(workspaces), interval_(interval) {}

ExpirySweeper::~ExpirySweeper() {
    stop();
}

void ExpirySweeper::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        return;
    }
    running_ = true;
    thread_ = std::thread([this]() { loop(); });
    std::cout << "[Sweeper] Started (interval "
              << std::chrono::duration_cast<std::chrono::seconds>(interval_).count()
              << "s)" << std::endl;
}

void ExpirySweeper::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    wake_.notify_all();
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
        std::cout << "[Sweeper] Stopped" << std::endl;
    }
}

bool ExpirySweeper::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

void ExpirySweeper::loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_) {
        if (wake_.wait_for(lock, interval_, [this]() { return !running_; })) {
            break;
        }

        lock.unlock();
        try {
            SweepStats stats = sweep_once();
            if (stats.tokens_expired > 0 || stats.workspaces_reclaimed > 0 || stats.failures > 0) {
                std::cout << "[Sweeper] Expired " << stats.tokens_expired
                          << " token(s), reclaimed " << stats.workspaces_reclaimed
                          << " workspace(s), " << stats.failures << " failure(s)" << std::endl;
            }
        } catch (const std::exception& e) {
            std::cerr << "[Sweeper] Fatal: " << e.what() << std::endl;
            lock.lock();
            running_ = false;
            lock.unlock();
            if (on_fatal_) {
                on_fatal_(std::string("sweeper failure: ") + e.what());
            }
            return;
        }
        lock.lock();
    }
}

bool ExpirySweeper::reclaim_if_idle(const Workspace& workspace,
                                    TokenRegistry::Clock::time_point now,
                                    SweepStats& stats) {
    // A workspace still owned by its request, or still backing a download,
    // is left alone
    if (!workspaces_.is_released(workspace.id) || registry_.has_live_tokens(workspace.id, now)) {
        return false;
    }

    try {
        if (registry_.reclaim(workspace, workspaces_)) {
            stats.workspaces_reclaimed++;
            std::cout << "[Sweeper] Reclaimed workspace " << workspace.id << std::endl;
            return true;
        }
    } catch (const std::exception& e) {
        stats.failures++;
        std::cerr << "[Sweeper] Failed to reclaim " << workspace.id
                  << ": " << e.what() << std::endl;
    }
    return false;
}

SweepStats ExpirySweeper::sweep_once(TokenRegistry::Clock::time_point now) {
    SweepStats stats;

    std::vector<TokenEntry> expired = registry_.take_expired(now);
    stats.tokens_expired = expired.size();

    std::set<std::string> visited;
    for (const auto& entry : expired) {
        if (visited.insert(entry.workspace.id).second) {
            reclaim_if_idle(entry.workspace, now, stats);
        }
    }

    // Released workspaces whose tokens were revoked elsewhere, or whose
    // earlier removal failed
    for (const auto& workspace : workspaces_.released()) {
        if (visited.insert(workspace.id).second) {
            reclaim_if_idle(workspace, now, stats);
        }
    }

    return stats;
}

} // namespace runbox
