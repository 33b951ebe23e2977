/*
 * runbox - Ephemeral code execution with expiring downloads
 * Every request gets a private workspace; artifacts live behind short-lived tokens
 */

#include "http_server.h"
#include "api.h"
#include "config.h"
#include "constants.h"
#include "errors.h"
#include "workspace.h"
#include "token_registry.h"
#include "process_runner.h"
#include "lifecycle.h"
#include "expiry_sweeper.h"
#include <iostream>
#include <thread>
#include <atomic>
#include <mutex>
#include <csignal>
#include <cstdlib>
#include <pthread.h>
#include <signal.h>
#include <unistd.h>

using namespace runbox;

namespace {

std::atomic<bool> fatal_fault{false};
std::mutex fatal_mutex;
std::string fatal_reason;

// Fault in a worker thread: route it through the same path as an operator
// signal so there is exactly one shutdown sequence
void request_fatal_shutdown(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(fatal_mutex);
        if (fatal_reason.empty()) fatal_reason = reason;
    }
    fatal_fault = true;
    kill(getpid(), SIGUSR1);
}

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [options]\n"
              << "  --port <n>               Listen port (env PORT, default " << DEFAULT_PORT << ")\n"
              << "  --env <mode>             development | production (env RUNBOX_ENV)\n"
              << "  --allowed-hosts <list>   Comma-separated origins (env RUNBOX_ALLOWED_HOSTS)\n"
              << "  --temp-dir <path>        Workspace base directory (env RUNBOX_TEMP_DIR)\n"
              << "  --interpreter <cmd>      Interpreter binary (env RUNBOX_INTERPRETER)\n";
}

} // namespace

int main(int argc, char* argv[]) {
    ServerConfig config;
    try {
        config = ServerConfig::load(argc, argv);
    } catch (const RunboxError& e) {
        std::cerr << "❌ " << e.what();
        if (!e.details().empty()) std::cerr << ": " << e.details();
        std::cerr << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    // Signals are taken synchronously by one thread; every other thread,
    // including the ones spawned below, inherits the blocked mask
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    sigaddset(&signals, SIGUSR1);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);
    std::signal(SIGPIPE, SIG_IGN);

    std::cout << "📦 runbox - Ephemeral Code Execution" << std::endl;
    std::cout << "   Private Workspaces • Expiring Downloads" << std::endl;
    std::cout << "------------------------------------------------" << std::endl;
    std::cout << "Environment: " << config.environment << std::endl;
    std::cout << "Temp dir:    " << config.temp_dir.string() << std::endl;
    std::cout << "Interpreter: " << config.interpreter << std::endl;
    std::cout << "------------------------------------------------" << std::endl;

    try {
        WorkspaceManager workspaces(config.temp_dir);
        workspaces.purge_stale();

        TokenRegistry registry;
        ProcessRunner runner;

        LifecycleOptions options;
        options.interpreter = config.interpreter;
        options.artifact_ttl = ARTIFACT_TTL;
        options.max_upload_bytes = MAX_UPLOAD_SIZE;
        LifecycleCoordinator lifecycle(workspaces, registry, runner, options);

        try {
            std::cout << "Version:     " << lifecycle.interpreter_version() << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "⚠️  Initial interpreter check failed: " << e.what() << std::endl;
        }

        HttpServer server(config.port);
        server.set_allowed_hosts(config.allowed_hosts);
        server.set_fatal_handler(request_fatal_shutdown);

        ApiService api(lifecycle, registry, config);
        api.register_routes(server);

        ExpirySweeper sweeper(registry, workspaces, SWEEP_INTERVAL);
        sweeper.set_fatal_handler(request_fatal_shutdown);

        server.listen();
        sweeper.start();

        std::atomic<bool> signal_seen{false};
        std::thread signal_thread([&]() {
            int sig = 0;
            if (sigwait(&signals, &sig) != 0) {
                std::cerr << "[Main] sigwait failed" << std::endl;
            }
            signal_seen = true;

            if (sig == SIGUSR1) {
                std::lock_guard<std::mutex> lock(fatal_mutex);
                std::cerr << "[Main] Fatal fault (" << fatal_reason
                          << "). Initiating graceful shutdown..." << std::endl;
            } else {
                std::cout << "[Main] Received " << (sig == SIGINT ? "SIGINT" : "SIGTERM")
                          << ". Initiating graceful shutdown..." << std::endl;
            }
            server.begin_shutdown();
        });

        std::cout << "API endpoints:" << std::endl;
        std::cout << "  POST /execute          - Run Python code" << std::endl;
        std::cout << "  POST /host             - Host an uploaded file" << std::endl;
        std::cout << "  GET  /download/{token} - Download an artifact" << std::endl;
        std::cout << "  GET  /health           - Health check" << std::endl;
        std::cout << "  GET  /api              - API information" << std::endl;
        std::cout << std::endl;

        server.serve();

        // serve() also returns if accept() fails for good; wake the signal
        // thread so both paths share one shutdown
        if (!signal_seen) {
            kill(getpid(), SIGTERM);
        }
        signal_thread.join();

        bool drained = server.drain(std::chrono::duration_cast<std::chrono::milliseconds>(SHUTDOWN_GRACE));
        sweeper.stop();

        if (!drained) {
            std::cerr << "[Main] Force exiting after timeout." << std::endl;
            std::cout.flush();
            std::_Exit(1);
        }

        std::cout << "[Main] Shutdown complete." << std::endl;
        return fatal_fault ? 1 : 0;
    } catch (const std::exception& e) {
        std::cerr << "❌ " << e.what() << std::endl;
        return 1;
    }
}
