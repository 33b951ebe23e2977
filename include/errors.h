#pragma once

#include <stdexcept>
#include <string>

namespace runbox {

// Base of every error the service reports to a client. Carries the HTTP
// status the boundary should answer with and optional detail text.
class RunboxError : public std::runtime_error {
public:
    RunboxError(int status, const std::string& message, const std::string& details = "")
        : std::runtime_error(message), status_(status), details_(details) {}

    int status() const { return status_; }
    const std::string& details() const { return details_; }

private:
    int status_;
    std::string details_;
};

// Workspace or file I/O failure
class ResourceError : public RunboxError {
public:
    explicit ResourceError(const std::string& message, const std::string& details = "")
        : RunboxError(500, message, details) {}
};

// Command could not be started
class SpawnError : public RunboxError {
public:
    explicit SpawnError(const std::string& message, const std::string& details = "")
        : RunboxError(500, message, details) {}
};

// Deadline exceeded; the process group was killed
class TimeoutError : public RunboxError {
public:
    explicit TimeoutError(const std::string& message, const std::string& details = "")
        : RunboxError(408, message, details) {}
};

// Process exited non-zero; details hold filtered stderr
class ExecutionError : public RunboxError {
public:
    ExecutionError(const std::string& message, int exit_code, const std::string& details = "")
        : RunboxError(422, message, details), exit_code_(exit_code) {}

    int exit_code() const { return exit_code_; }

private:
    int exit_code_;
};

class NotFoundError : public RunboxError {
public:
    explicit NotFoundError(const std::string& message)
        : RunboxError(404, message) {}
};

class ExpiredError : public RunboxError {
public:
    explicit ExpiredError(const std::string& message)
        : RunboxError(410, message) {}
};

// Missing or malformed input
class ValidationError : public RunboxError {
public:
    explicit ValidationError(const std::string& message, const std::string& details = "")
        : RunboxError(400, message, details) {}
};

class PayloadTooLargeError : public RunboxError {
public:
    explicit PayloadTooLargeError(const std::string& message)
        : RunboxError(413, message) {}
};

} // namespace runbox
