#include "api.h"
#include "constants.h"
#include "multipart.h"
#include "file_utils.h"
#include "time_utils.h"
#include <sys/utsname.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>

namespace runbox {

namespace {

const char* const DOWNLOAD_PREFIX = "/download/";

std::string html_escape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default: out += c;
        }
    }
    return out;
}

// Lowercased uname() fields, e.g. {"linux", "x86_64"}
std::pair<std::string, std::string> platform_info() {
    struct utsname info;
    if (uname(&info) != 0) {
        return {"unknown", "unknown"};
    }
    std::string sysname = info.sysname;
    std::transform(sysname.begin(), sysname.end(), sysname.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return {sysname, info.machine};
}

// parseInt-like: numbers are truncated, numeric strings parsed, anything
// else falls back to the default
std::chrono::seconds parse_timeout(const Json::Value& value) {
    long seconds = DEFAULT_TIMEOUT_SECONDS;
    if (value.isNumeric()) {
        double d = value.asDouble();
        if (std::isfinite(d)) {
            seconds = static_cast<long>(std::max(-1e9, std::min(1e9, d)));
        }
    } else if (value.isString()) {
        std::string s = value.asString();
        try {
            seconds = std::stol(s);
        } catch (const std::exception&) {
            seconds = DEFAULT_TIMEOUT_SECONDS;
        }
    }
    return std::chrono::seconds(std::clamp<long>(seconds, MIN_TIMEOUT_SECONDS, MAX_TIMEOUT_SECONDS));
}

Json::Value endpoint_list(bool include_root) {
    Json::Value endpoints;
    if (include_root) {
        endpoints["GET /"] = "API information";
    }
    endpoints["GET /health"] = "Server and interpreter health check";
    endpoints["POST /execute"] = "Execute Python code";
    endpoints["POST /host"] = "Host an uploaded file";
    endpoints["GET /download/:token"] = "Download generated file";
    endpoints["GET /api"] = include_root ? "This endpoint" : "API information";
    return endpoints;
}

} // namespace

ApiService::ApiService(LifecycleCoordinator& lifecycle,
                       TokenRegistry& registry,
                       const ServerConfig& config)
    : lifecycle_(lifecycle), registry_(registry), config_(config),
      started_(std::chrono::steady_clock::now()) {}

void ApiService::register_routes(HttpServer& server) {
    server.route("GET", "/", [this](const HttpRequest& req) { return handle_root(req); });
    server.route("GET", "/api", [this](const HttpRequest& req) { return handle_api(req); });
    server.route("GET", "/health", [this](const HttpRequest& req) { return handle_health(req); });
    server.route("POST", "/execute", [this](const HttpRequest& req) { return handle_execute(req); });
    server.route("POST", "/host", [this](const HttpRequest& req) { return handle_host(req); });
    server.route("GET", DOWNLOAD_PREFIX, [this](const HttpRequest& req) { return handle_download(req); });
    server.set_fallback([this](const HttpRequest& req) { return handle_not_found(req); });
}

long ApiService::uptime_seconds() const {
    return static_cast<long>(std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - started_).count());
}

std::string ApiService::now_iso() {
    return format_iso8601(std::chrono::system_clock::now());
}

bool ApiService::prefers_html(const std::string& accept) {
    // Order of appearance decides; q-values are not weighed
    size_t html = accept.find("text/html");
    if (html == std::string::npos) {
        return false;
    }
    size_t json = accept.find("application/json");
    return json == std::string::npos || html < json;
}

HttpResponse ApiService::json_response(int status, const Json::Value& body) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";

    HttpResponse resp;
    resp.status_code = status;
    resp.headers["Content-Type"] = "application/json; charset=utf-8";
    resp.body = Json::writeString(builder, body);
    return resp;
}

HttpResponse ApiService::html_response(int status, const std::string& title, const std::string& message) {
    std::ostringstream html;
    html << "<!DOCTYPE html>\n"
         << "<html lang=\"en\">\n"
         << "<head><meta charset=\"utf-8\"><title>" << status << " " << html_escape(title)
         << "</title></head>\n"
         << "<body>\n"
         << "<h1>" << status << " " << html_escape(HttpServer::status_text(status)) << "</h1>\n"
         << "<p>" << html_escape(message) << "</p>\n"
         << "<p><a href=\"/\">" << SERVICE_NAME << "</a></p>\n"
         << "</body>\n"
         << "</html>\n";

    HttpResponse resp;
    resp.status_code = status;
    resp.headers["Content-Type"] = "text/html; charset=utf-8";
    resp.body = html.str();
    return resp;
}

HttpResponse ApiService::error_response(const HttpRequest& req, const RunboxError& e,
                                        ErrorShape shape) const {
    bool hide_details = config_.is_production() && e.status() >= 500;

    if (prefers_html(req.header("Accept"))) {
        return html_response(e.status(), e.what(), e.what());
    }

    Json::Value body;
    body["error"] = e.what();
    if (shape == ErrorShape::Execute) {
        if (!e.details().empty() && !hide_details) {
            body["details"] = e.details();
        }
        body["success"] = false;
        body["timestamp"] = now_iso();
    }
    return json_response(e.status(), body);
}

HttpResponse ApiService::internal_error(const HttpRequest& req, const std::exception& e) const {
    std::cerr << "[Api] Server error for request ID: " << req.request_id << ": " << e.what() << std::endl;

    std::string message = config_.is_production() ? "Something went wrong" : e.what();
    if (prefers_html(req.header("Accept"))) {
        return html_response(500, "Internal server error", message);
    }

    Json::Value body;
    body["error"] = "Internal server error";
    body["message"] = message;
    body["requestId"] = req.request_id;
    body["timestamp"] = now_iso();
    return json_response(500, body);
}

HttpResponse ApiService::handle_not_found(const HttpRequest& req) const {
    std::string message = "Route " + req.method + " " + req.path + " not found";
    std::cerr << "[Api] " << message << " [ID: " << req.request_id << "]" << std::endl;

    if (prefers_html(req.header("Accept"))) {
        return html_response(404, "Not found", message);
    }

    Json::Value body;
    body["error"] = "Not found";
    body["message"] = message;
    body["requestId"] = req.request_id;
    body["timestamp"] = now_iso();
    return json_response(404, body);
}

HttpResponse ApiService::handle_root(const HttpRequest& req) const {
    (void)req;
    Json::Value body;
    body["message"] = "Python Code Executor Server is running!";
    body["status"] = "healthy";
    body["endpoints"] = endpoint_list(false);
    return json_response(200, body);
}

HttpResponse ApiService::handle_api(const HttpRequest& req) const {
    (void)req;
    Json::Value body;
    body["name"] = "Python Code Executor API";
    body["version"] = SERVICE_VERSION;
    body["status"] = "running";
    body["endpoints"] = endpoint_list(true);
    body["uptime"] = static_cast<Json::Int64>(uptime_seconds());
    body["timestamp"] = now_iso();
    std::cout << "[Api] API info requested" << std::endl;
    return json_response(200, body);
}

HttpResponse ApiService::handle_health(const HttpRequest& req) const {
    Json::Value body;
    try {
        std::string version = lifecycle_.interpreter_version();
        auto [platform, arch] = platform_info();

        body["status"] = "healthy";
        body["interpreterVersion"] = version;
        body["platform"] = platform;
        body["architecture"] = arch;
        body["tempDir"] = config_.temp_dir.string();
        body["uptime"] = static_cast<Json::Int64>(uptime_seconds());
        body["activeDownloads"] = static_cast<Json::UInt64>(registry_.live_count());
        body["timestamp"] = now_iso();
        std::cout << "[Api] Health check successful" << std::endl;
        return json_response(200, body);
    } catch (const std::exception& e) {
        std::cerr << "[Api] Health check failed [ID: " << req.request_id << "]: " << e.what() << std::endl;

        std::string details = e.what();
        if (auto* err = dynamic_cast<const RunboxError*>(&e)) {
            if (!err->details().empty()) details = err->details();
        }
        body["status"] = "unhealthy";
        body["error"] = "Interpreter not available";
        body["details"] = details;
        body["timestamp"] = now_iso();
        return json_response(500, body);
    }
}

HttpResponse ApiService::handle_execute(const HttpRequest& req) {
    try {
        if (req.body.size() > MAX_JSON_BODY_SIZE) {
            throw PayloadTooLargeError("Request body exceeds " +
                                       std::to_string(MAX_JSON_BODY_SIZE / (1024 * 1024)) + "MB limit");
        }

        Json::Value json;
        Json::CharReaderBuilder builder;
        std::string errors;
        std::istringstream stream(req.body);
        if (!Json::parseFromStream(builder, stream, &json, &errors) || !json.isObject()) {
            std::cerr << "[Api] Invalid JSON for request ID: " << req.request_id << std::endl;
            throw ValidationError("No valid code provided");
        }

        const Json::Value& code = json["code"];
        if (!code.isString() || code.asString().empty()) {
            std::cerr << "[Api] Invalid code provided for request ID: " << req.request_id << std::endl;
            throw ValidationError("No valid code provided");
        }

        ExecutionRequest request;
        request.code = code.asString();
        request.timeout = parse_timeout(json["timeout"]);
        request.allow_network = json["allow_network"].isBool() && json["allow_network"].asBool();

        ExecutionResult result = lifecycle_.execute(request);

        Json::Value body;
        body["output"] = result.output;
        body["success"] = result.success;
        body["generatedFiles"] = Json::Value(Json::arrayValue);
        for (const auto& file : result.generated_files) {
            Json::Value entry;
            entry["filename"] = file.filename;
            entry["downloadUrl"] = file.download_url;
            entry["expires"] = format_iso8601(file.expires_at);
            entry["mimeType"] = file.mime_type;
            entry["size"] = static_cast<Json::UInt64>(file.size);
            body["generatedFiles"].append(entry);
        }
        body["executionTime"] = format_iso8601(result.executed_at);

        std::cout << "[Api] Execution successful for ID: " << req.request_id << std::endl;
        return json_response(200, body);
    } catch (const RunboxError& e) {
        std::cerr << "[Api] Execution failed for ID: " << req.request_id << ": " << e.what() << std::endl;
        return error_response(req, e, ErrorShape::Execute);
    } catch (const std::exception& e) {
        return internal_error(req, e);
    }
}

HttpResponse ApiService::handle_host(const HttpRequest& req) {
    try {
        std::string content_type = req.header("Content-Type");
        if (MultipartParser::extract_boundary(content_type).empty()) {
            throw ValidationError("Expected multipart/form-data upload");
        }

        std::vector<MultipartPart> parts = MultipartParser::parse(content_type, req.body);
        const MultipartPart* file = MultipartParser::find_field(parts, "file");
        if (!file || file->filename.empty()) {
            throw ValidationError("No file uploaded");
        }

        HostedFile hosted = lifecycle_.host(file->filename, file->data);

        Json::Value body;
        body["downloadUrl"] = hosted.download_url;
        body["expires"] = format_iso8601(hosted.expires_at);
        body["filename"] = hosted.filename;
        body["size"] = static_cast<Json::UInt64>(hosted.size);
        return json_response(200, body);
    } catch (const RunboxError& e) {
        std::cerr << "[Api] Upload failed for ID: " << req.request_id << ": " << e.what() << std::endl;
        return error_response(req, e, ErrorShape::Plain);
    } catch (const std::exception& e) {
        return internal_error(req, e);
    }
}

HttpResponse ApiService::handle_download(const HttpRequest& req) {
    try {
        std::string token = req.path.substr(std::min(req.path.size(), std::string(DOWNLOAD_PREFIX).size()));
        if (token.empty() || token.find('/') != std::string::npos) {
            throw NotFoundError("Invalid or expired download token");
        }

        OpenedDownload download = lifecycle_.open_download(token);

        // Size from the open descriptor; the path may already be unlinked
        download.stream->seekg(0, std::ios::end);
        std::streamoff size = download.stream->tellg();
        download.stream->seekg(0, std::ios::beg);
        if (size < 0 || !*download.stream) {
            throw ResourceError("Failed to read file", download.entry.file_path.string());
        }

        std::string filename = download.entry.file_path.filename().string();
        std::replace(filename.begin(), filename.end(), '"', '_');

        HttpResponse resp;
        resp.headers["Content-Type"] = FileUtils::get_mime_type(filename);
        resp.headers["Content-Disposition"] = "attachment; filename=\"" + filename + "\"";
        resp.stream_length = static_cast<std::uintmax_t>(size);
        resp.body_stream = std::move(download.stream);
        std::cout << "[Api] File download started for token: " << token.substr(0, 8) << "..." << std::endl;
        return resp;
    } catch (const RunboxError& e) {
        std::cerr << "[Api] Download failed for ID: " << req.request_id << ": " << e.what() << std::endl;
        return error_response(req, e, ErrorShape::Plain);
    } catch (const std::exception& e) {
        return internal_error(req, e);
    }
}

} // namespace runbox
