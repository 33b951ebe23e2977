#pragma once

#include "http_server.h"
#include "config.h"
#include "lifecycle.h"
#include "token_registry.h"
#include "errors.h"
#include <json/json.h>
#include <chrono>
#include <string>

namespace runbox {

// HTTP face of the lifecycle coordinator. Each handler translates one route
// into coordinator calls and maps RunboxError onto the response status.
// Errors are rendered as JSON, or as an HTML page when the client's Accept
// header prefers text/html.
class ApiService {
public:
    ApiService(LifecycleCoordinator& lifecycle,
               TokenRegistry& registry,
               const ServerConfig& config);

    void register_routes(HttpServer& server);

    HttpResponse handle_root(const HttpRequest& req) const;
    HttpResponse handle_api(const HttpRequest& req) const;
    HttpResponse handle_health(const HttpRequest& req) const;
    HttpResponse handle_execute(const HttpRequest& req);
    HttpResponse handle_host(const HttpRequest& req);
    HttpResponse handle_download(const HttpRequest& req);
    HttpResponse handle_not_found(const HttpRequest& req) const;

    static bool prefers_html(const std::string& accept);

    long uptime_seconds() const;

private:
    enum class ErrorShape {
        Execute,   // {error, details?, success:false, timestamp}
        Plain      // {error}
    };

    HttpResponse error_response(const HttpRequest& req, const RunboxError& e, ErrorShape shape) const;
    HttpResponse internal_error(const HttpRequest& req, const std::exception& e) const;

    static HttpResponse json_response(int status, const Json::Value& body);
    static HttpResponse html_response(int status, const std::string& title, const std::string& message);
    static std::string now_iso();

    LifecycleCoordinator& lifecycle_;
    TokenRegistry& registry_;
    ServerConfig config_;
    std::chrono::steady_clock::time_point started_;
};

} // namespace runbox
