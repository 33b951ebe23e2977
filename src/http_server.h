#pragma once

#include <string>
#include <functional>
#include <map>
#include <set>
#include <vector>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <istream>
#include <memory>

namespace runbox {

// Header names compare case-insensitively, as HTTP requires
struct HeaderLess {
    bool operator()(const std::string& a, const std::string& b) const;
};

using HeaderMap = std::map<std::string, std::string, HeaderLess>;

// Simple HTTP request
struct HttpRequest {
    std::string method;
    std::string path;      // Without the query string
    std::string query;
    HeaderMap headers;
    std::string body;
    std::string client_ip;
    std::string request_id;

    // Header value or "" when absent
    std::string header(const std::string& name) const;
};

// Simple HTTP response
struct HttpResponse {
    int status_code = 200;
    HeaderMap headers;
    std::string body;

    // When set, the body is sent from this stream in chunks and `body` is
    // ignored. stream_length becomes the Content-Length.
    std::shared_ptr<std::istream> body_stream;
    std::uintmax_t stream_length = 0;

    HttpResponse() {
        headers["Content-Type"] = "application/json";
    }
};

// Request handler function type
using HandlerFunc = std::function<HttpResponse(const HttpRequest&)>;

// Minimal HTTP/1.1 server, one thread per connection, one request per
// connection. Routes match exactly first, then by path prefix.
//
// Shutdown is two-phase: begin_shutdown() closes the listener and answers
// every request not yet dispatched with 503; drain() waits for in-flight
// handlers and then shuts down whatever connections remain.
class HttpServer {
public:
    using FatalHandler = std::function<void(const std::string& reason)>;

    explicit HttpServer(int port = 8000);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Register route handlers
    void route(const std::string& method, const std::string& path, HandlerFunc handler);

    // Answers requests no route matches; defaults to a JSON 404
    void set_fallback(HandlerFunc handler) { fallback_ = std::move(handler); }

    // Origins allowed for CORS and listed in the CSP connect-src
    void set_allowed_hosts(const std::vector<std::string>& hosts);

    // Called when an exception escapes a connection thread
    void set_fatal_handler(FatalHandler handler) { on_fatal_ = std::move(handler); }

    // Bind and listen without serving; port 0 picks an ephemeral port.
    // Throws std::runtime_error on socket failures.
    void listen();

    // Accept loop; returns once the listener is closed
    void serve();

    // listen() + serve()
    void start();

    // Close the listener
    void stop();

    void begin_shutdown();
    bool shutting_down() const { return shutting_down_; }

    // Wait up to `grace` for in-flight requests, then force-close the rest.
    // Returns true if everything finished within the grace period.
    bool drain(std::chrono::milliseconds grace);

    size_t in_flight() const;
    int port() const { return port_; }

    // Route, decorate and guard one parsed request
    HttpResponse handle(HttpRequest& req);

    static HttpRequest parse_request(const std::string& raw);
    // Status line and headers, plus the body unless it is streamed
    static std::string build_response(const HttpResponse& resp);

    // Write the whole response, streaming body_stream if present.
    // Returns false if the peer went away or the stream ended early.
    static bool send_response(int fd, const HttpResponse& resp);
    static const char* status_text(int status_code);

private:
    enum class ReadResult { Complete, TooLarge, Malformed, Closed };

    void handle_client(int client_fd, const std::string& client_ip);
    ReadResult read_request(int client_fd, std::string& request_data);
    HttpResponse dispatch(const HttpRequest& req);
    void decorate(const HttpRequest& req, HttpResponse& resp) const;
    static bool write_all(int fd, const std::string& data);
    void track(int client_fd);
    void untrack(int client_fd);

    int port_;
    std::atomic<int> server_fd_;
    std::atomic<bool> running_;
    std::atomic<bool> shutting_down_;
    std::map<std::string, HandlerFunc> routes_;
    HandlerFunc fallback_;
    std::vector<std::string> allowed_hosts_;
    std::string content_security_policy_;
    FatalHandler on_fatal_;

    mutable std::mutex conn_mutex_;
    std::condition_variable conn_cv_;
    std::set<int> connections_;
    size_t in_flight_ = 0;
};

} // namespace runbox
