#include "http_server.h"
#include "constants.h"
#include "file_utils.h"

#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>
#include <cctype>
#include <algorithm>
#include <sstream>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace runbox {

bool HeaderLess::operator()(const std::string& a, const std::string& b) const {
    return std::lexicographical_compare(
        a.begin(), a.end(), b.begin(), b.end(),
        [](unsigned char x, unsigned char y) { return std::tolower(x) < std::tolower(y); });
}

std::string HttpRequest::header(const std::string& name) const {
    auto it = headers.find(name);
    return it == headers.end() ? "" : it->second;
}

HttpServer::HttpServer(int port)
    : port_(port), server_fd_(-1), running_(false), shutting_down_(false) {}

HttpServer::~HttpServer() {
    stop();

    // Connection threads hold `this`; wait for every one of them
    std::unique_lock<std::mutex> lock(conn_mutex_);
    for (int fd : connections_) {
        ::shutdown(fd, SHUT_RDWR);
    }
    conn_cv_.wait(lock, [this]() { return in_flight_ == 0; });
}

void HttpServer::route(const std::string& method, const std::string& path, HandlerFunc handler) {
    routes_[method + " " + path] = handler;
}

void HttpServer::set_allowed_hosts(const std::vector<std::string>& hosts) {
    allowed_hosts_ = hosts;
    content_security_policy_ = "default-src 'self'; connect-src 'self'";
    for (const auto& host : hosts) {
        content_security_policy_ += " " + host;
    }
}

void HttpServer::listen() {
    if (content_security_policy_.empty()) {
        set_allowed_hosts(allowed_hosts_);
    }

    // Create socket
    int fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        throw std::runtime_error("Failed to create socket");
    }

    // Allow reuse
    int opt = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    // Bind
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(static_cast<uint16_t>(port_));

    if (bind(fd, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        int err = errno;
        close(fd);
        throw std::runtime_error("Failed to bind to port " + std::to_string(port_) +
                                 ": " + std::strerror(err));
    }

    // Listen
    if (::listen(fd, LISTEN_BACKLOG) < 0) {
        close(fd);
        throw std::runtime_error("Failed to listen");
    }

    // Port 0 asks the kernel for one; report what we actually got
    socklen_t len = sizeof(addr);
    if (getsockname(fd, (struct sockaddr*)&addr, &len) == 0) {
        port_ = ntohs(addr.sin_port);
    }

    server_fd_ = fd;
    running_ = true;
    std::cout << "[Server] Listening on port " << port_ << std::endl;
}

void HttpServer::serve() {
    int listen_fd = server_fd_;

    // Accept connections
    while (running_) {
        struct sockaddr_in client_addr;
        socklen_t client_len = sizeof(client_addr);

        int client_fd = accept4(listen_fd, (struct sockaddr*)&client_addr, &client_len, SOCK_CLOEXEC);
        if (client_fd < 0) {
            if (!running_) break;
            if (errno == EINTR || errno == ECONNABORTED) continue;
            if (errno == EMFILE || errno == ENFILE) {
                std::cerr << "[Server] accept: " << std::strerror(errno) << std::endl;
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
                continue;
            }
            std::cerr << "[Server] accept failed: " << std::strerror(errno) << std::endl;
            break;
        }

        // Get client IP
        char ip[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &client_addr.sin_addr, ip, sizeof(ip));
        std::string client_ip = ip;

        struct timeval tv;
        tv.tv_sec = SOCKET_READ_TIMEOUT_SECONDS;
        tv.tv_usec = 0;
        setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        track(client_fd);

        // Handle in new thread (simple concurrency)
        try {
            std::thread([this, client_fd, client_ip]() {
                try {
                    handle_client(client_fd, client_ip);
                } catch (const std::exception& e) {
                    std::cerr << "[Server] Connection fault: " << e.what() << std::endl;
                    if (on_fatal_) {
                        on_fatal_(std::string("connection fault: ") + e.what());
                    }
                }
                untrack(client_fd);
            }).detach();
        } catch (const std::system_error& e) {
            std::cerr << "[Server] Failed to spawn connection thread: " << e.what() << std::endl;
            untrack(client_fd);
        }
    }
}

void HttpServer::start() {
    listen();
    serve();
}

void HttpServer::stop() {
    running_ = false;
    int fd = server_fd_.exchange(-1);
    if (fd >= 0) {
        // shutdown() wakes a thread blocked in accept(); close() alone does not
        ::shutdown(fd, SHUT_RDWR);
        close(fd);
        std::cout << "[Server] Listener closed" << std::endl;
    }
}

void HttpServer::begin_shutdown() {
    if (shutting_down_.exchange(true)) {
        return;
    }
    std::cout << "[Server] Shutting down, rejecting new requests" << std::endl;
    stop();
}

bool HttpServer::drain(std::chrono::milliseconds grace) {
    std::unique_lock<std::mutex> lock(conn_mutex_);
    if (in_flight_ > 0) {
        std::cout << "[Server] Waiting for " << in_flight_ << " active connection(s)..." << std::endl;
    }
    if (conn_cv_.wait_for(lock, grace, [this]() { return in_flight_ == 0; })) {
        std::cout << "[Server] All connections closed" << std::endl;
        return true;
    }

    std::cerr << "[Server] Forcing " << connections_.size()
              << " connection(s) closed after grace period" << std::endl;
    for (int fd : connections_) {
        ::shutdown(fd, SHUT_RDWR);
    }
    return false;
}

size_t HttpServer::in_flight() const {
    std::lock_guard<std::mutex> lock(conn_mutex_);
    return in_flight_;
}

void HttpServer::track(int client_fd) {
    std::lock_guard<std::mutex> lock(conn_mutex_);
    connections_.insert(client_fd);
    in_flight_++;
}

void HttpServer::untrack(int client_fd) {
    {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        connections_.erase(client_fd);
        close(client_fd);
        in_flight_--;
    }
    conn_cv_.notify_all();
}

HttpServer::ReadResult HttpServer::read_request(int client_fd, std::string& request_data) {
    request_data.reserve(INITIAL_HTTP_BUFFER);

    char buffer[PIPE_BUFFER_SIZE];
    size_t header_end = std::string::npos;
    size_t expected_size = 0;

    while (true) {
        if (header_end == std::string::npos) {
            size_t pos = request_data.find("\r\n\r\n");
            if (pos != std::string::npos) {
                header_end = pos + 4;
                HttpRequest head = parse_request(request_data.substr(0, header_end));

                if (!head.header("Transfer-Encoding").empty()) {
                    return ReadResult::Malformed;
                }

                size_t content_length = 0;
                std::string length_str = head.header("Content-Length");
                if (!length_str.empty()) {
                    if (length_str.find_first_not_of("0123456789") != std::string::npos) {
                        return ReadResult::Malformed;
                    }
                    if (length_str.size() > 12) {
                        return ReadResult::TooLarge;
                    }
                    content_length = std::stoull(length_str);
                }

                expected_size = header_end + content_length;
                if (expected_size > MAX_REQUEST_SIZE) {
                    return ReadResult::TooLarge;
                }
            } else if (request_data.size() > MAX_REQUEST_SIZE) {
                return ReadResult::TooLarge;
            }
        }

        if (header_end != std::string::npos && request_data.size() >= expected_size) {
            request_data.resize(expected_size);
            return ReadResult::Complete;
        }

        ssize_t bytes_read = recv(client_fd, buffer, sizeof(buffer), 0);
        if (bytes_read < 0 && errno == EINTR) {
            continue;
        }
        if (bytes_read <= 0) {
            return request_data.empty() ? ReadResult::Closed : ReadResult::Malformed;
        }
        request_data.append(buffer, static_cast<size_t>(bytes_read));
    }
}

void HttpServer::handle_client(int client_fd, const std::string& client_ip) {
    std::string request_data;
    ReadResult result = read_request(client_fd, request_data);
    if (result == ReadResult::Closed) {
        return;
    }

    HttpRequest req;
    HttpResponse resp;

    if (result == ReadResult::TooLarge) {
        resp.status_code = 413;
        resp.body = "{\"error\":\"Request exceeds " +
                    std::to_string(MAX_REQUEST_SIZE / (1024 * 1024)) + "MB limit\"}";
        decorate(req, resp);
    } else if (result == ReadResult::Malformed) {
        resp.status_code = 400;
        resp.body = "{\"error\":\"Malformed request\"}";
        decorate(req, resp);
    } else {
        req = parse_request(request_data);
        req.client_ip = client_ip;
        if (req.method.empty()) {
            resp.status_code = 400;
            resp.body = "{\"error\":\"Malformed request\"}";
            decorate(req, resp);
        } else {
            resp = handle(req);
        }
    }

    std::cout << "[Server] " << (req.method.empty() ? "-" : req.method) << " "
              << (req.path.empty() ? "-" : req.path) << " -> " << resp.status_code
              << " [ID: " << resp.headers["X-Request-ID"] << "]" << std::endl;

    // Send response
    if (!send_response(client_fd, resp)) {
        std::cerr << "[Server] Client " << client_ip << " went away before the response was sent"
                  << std::endl;
    }
}

HttpResponse HttpServer::handle(HttpRequest& req) {
    if (req.request_id.empty()) {
        req.request_id = FileUtils::random_hex(REQUEST_ID_BYTES);
    }

    HttpResponse resp;
    if (shutting_down_) {
        std::cerr << "[Server] Request rejected during shutdown: " << req.method << " " << req.path
                  << std::endl;
        resp.status_code = 503;
        resp.body = "{\"error\":\"Server is shutting down\",\"code\":\"SHUTTING_DOWN\"}";
    } else if (req.method == "OPTIONS") {
        resp.status_code = 204;
        resp.headers.erase("Content-Type");
        resp.headers["Access-Control-Allow-Methods"] = "GET, POST, OPTIONS";
        resp.headers["Access-Control-Allow-Headers"] = "Content-Type";
    } else {
        try {
            resp = dispatch(req);
        } catch (const std::exception& e) {
            std::cerr << "[Server] Handler error for " << req.method << " " << req.path
                      << " [ID: " << req.request_id << "]: " << e.what() << std::endl;
            resp = HttpResponse();
            resp.status_code = 500;
            resp.body = "{\"error\":\"Internal server error\"}";
        }
    }

    decorate(req, resp);
    return resp;
}

HttpResponse HttpServer::dispatch(const HttpRequest& req) {
    // Check for exact match
    auto it = routes_.find(req.method + " " + req.path);
    if (it != routes_.end()) {
        return it->second(req);
    }

    // Prefix routes end in '/', e.g. "/download/"; the longest one wins
    const HandlerFunc* best = nullptr;
    size_t best_length = 0;
    for (const auto& [pattern, handler] : routes_) {
        size_t space_pos = pattern.find(' ');
        std::string method = pattern.substr(0, space_pos);
        std::string path_pattern = pattern.substr(space_pos + 1);

        if (path_pattern.size() < 2 || path_pattern.back() != '/') continue;
        if (method == req.method && req.path.compare(0, path_pattern.size(), path_pattern) == 0 &&
            path_pattern.size() > best_length) {
            best = &handler;
            best_length = path_pattern.size();
        }
    }
    if (best) {
        return (*best)(req);
    }

    if (fallback_) {
        return fallback_(req);
    }
    HttpResponse resp;
    resp.status_code = 404;
    resp.body = "{\"error\":\"Not found\"}";
    return resp;
}

void HttpServer::decorate(const HttpRequest& req, HttpResponse& resp) const {
    resp.headers["X-Request-ID"] = req.request_id.empty() ? FileUtils::random_hex(REQUEST_ID_BYTES)
                                                          : req.request_id;
    resp.headers["X-Content-Type-Options"] = "nosniff";
    resp.headers["Content-Security-Policy"] = content_security_policy_.empty()
        ? "default-src 'self'; connect-src 'self'"
        : content_security_policy_;

    std::string origin = req.header("Origin");
    if (!origin.empty() &&
        std::find(allowed_hosts_.begin(), allowed_hosts_.end(), origin) != allowed_hosts_.end()) {
        resp.headers["Access-Control-Allow-Origin"] = origin;
        resp.headers["Vary"] = "Origin";
    }
}

bool HttpServer::write_all(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

HttpRequest HttpServer::parse_request(const std::string& raw) {
    HttpRequest req;

    // Headers end at the first blank line; everything after is the body,
    // byte for byte
    size_t header_end = raw.find("\r\n\r\n");
    size_t body_start;
    if (header_end != std::string::npos) {
        body_start = header_end + 4;
    } else {
        header_end = raw.find("\n\n");
        body_start = header_end == std::string::npos ? raw.size() : header_end + 2;
        if (header_end == std::string::npos) header_end = raw.size();
    }

    std::istringstream stream(raw.substr(0, header_end));

    // Parse request line
    std::string line;
    std::getline(stream, line);
    if (!line.empty() && line.back() == '\r') line.pop_back();

    size_t space1 = line.find(' ');
    size_t space2 = line.find(' ', space1 + 1);

    if (space1 != std::string::npos && space2 != std::string::npos) {
        req.method = line.substr(0, space1);
        std::string target = line.substr(space1 + 1, space2 - space1 - 1);
        size_t question = target.find('?');
        if (question != std::string::npos) {
            req.query = target.substr(question + 1);
            target = target.substr(0, question);
        }
        req.path = target;
    }

    // Parse headers
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) break;

        size_t colon = line.find(':');
        if (colon != std::string::npos) {
            std::string key = line.substr(0, colon);
            size_t value_start = line.find_first_not_of(" \t", colon + 1);
            std::string value = value_start == std::string::npos ? "" : line.substr(value_start);
            req.headers[key] = value;
        }
    }

    // Rest is body
    if (body_start < raw.size()) {
        req.body = raw.substr(body_start);
    }

    return req;
}

const char* HttpServer::status_text(int status_code) {
    switch (status_code) {
        case 200: return "OK";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 410: return "Gone";
        case 413: return "Payload Too Large";
        case 422: return "Unprocessable Entity";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default: return "Unknown";
    }
}

std::string HttpServer::build_response(const HttpResponse& resp) {
    std::ostringstream out;

    // Status line
    out << "HTTP/1.1 " << resp.status_code << " " << status_text(resp.status_code) << "\r\n";

    // Headers
    for (const auto& [key, value] : resp.headers) {
        out << key << ": " << value << "\r\n";
    }

    // Content length
    std::uintmax_t length = resp.body_stream ? resp.stream_length : resp.body.length();
    out << "Content-Length: " << length << "\r\n";
    out << "Connection: close\r\n";
    out << "\r\n";

    // Body
    if (!resp.body_stream) {
        out << resp.body;
    }

    return out.str();
}

bool HttpServer::send_response(int fd, const HttpResponse& resp) {
    if (!write_all(fd, build_response(resp))) {
        return false;
    }
    if (!resp.body_stream) {
        return true;
    }

    std::string chunk(DOWNLOAD_CHUNK_SIZE, '\0');
    std::uintmax_t remaining = resp.stream_length;
    while (remaining > 0) {
        size_t want = static_cast<size_t>(std::min<std::uintmax_t>(remaining, chunk.size()));
        resp.body_stream->read(&chunk[0], static_cast<std::streamsize>(want));
        std::streamsize got = resp.body_stream->gcount();
        if (got <= 0) {
            std::cerr << "[Server] Body stream ended with " << remaining
                      << " bytes still owed" << std::endl;
            return false;
        }
        if (!write_all(fd, chunk.substr(0, static_cast<size_t>(got)))) {
            return false;
        }
        remaining -= static_cast<std::uintmax_t>(got);
    }
    return true;
}

} // namespace runbox
