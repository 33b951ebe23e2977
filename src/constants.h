#pragma once

#include <cstddef>  // for size_t
#include <chrono>

namespace runbox {

// Size limits
constexpr size_t MAX_OUTPUT_SIZE = 10 * 1024 * 1024;              // 10MB per captured stream
constexpr size_t MAX_UPLOAD_SIZE = 20 * 1024 * 1024;              // 20MB hosted file
constexpr size_t MAX_JSON_BODY_SIZE = 5 * 1024 * 1024;            // 5MB /execute body
constexpr size_t MAX_REQUEST_SIZE = 25 * 1024 * 1024;             // upload + multipart framing

// Execution timeouts
constexpr int MIN_TIMEOUT_SECONDS = 1;
constexpr int MAX_TIMEOUT_SECONDS = 60;
constexpr int DEFAULT_TIMEOUT_SECONDS = 30;
constexpr int VERSION_PROBE_TIMEOUT_SECONDS = 5;

// Artifact lifetime
constexpr std::chrono::minutes ARTIFACT_TTL{5};                   // Download token validity
constexpr std::chrono::seconds SWEEP_INTERVAL{60};                // Expiry sweeper period
constexpr std::chrono::seconds SHUTDOWN_GRACE{15};                // Drain window on shutdown

// Token entropy
constexpr size_t TOKEN_BYTES = 16;                                // 128-bit download tokens
constexpr size_t WORKSPACE_ID_BYTES = 12;
constexpr size_t REQUEST_ID_BYTES = 8;

// Buffer sizes
constexpr size_t PIPE_BUFFER_SIZE = 4096;                         // Read buffer size
constexpr size_t INITIAL_HTTP_BUFFER = 8192;                      // Initial HTTP buffer
constexpr size_t DOWNLOAD_CHUNK_SIZE = 64 * 1024;                 // Streamed body chunk

// Network
constexpr int DEFAULT_PORT = 8000;                                // Default server port
constexpr int LISTEN_BACKLOG = 128;                               // Socket listen backlog
constexpr int SOCKET_READ_TIMEOUT_SECONDS = 30;                   // Idle client cutoff

// Service identity
constexpr const char* SERVICE_NAME = "runbox";
constexpr const char* SERVICE_VERSION = "2.1.0";
constexpr const char* EMPTY_OUTPUT_MESSAGE = "Code executed successfully (no output)";

} // namespace runbox
