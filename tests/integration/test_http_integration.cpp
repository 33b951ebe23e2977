/**
 * HTTP Integration Tests
 *
 * Runs the full service stack behind a real listening socket and talks to it
 * over TCP, covering the request/response lifecycle end to end.
 */

#include <gtest/gtest.h>
#include "../../src/api.h"
#include "../../src/constants.h"
#include "../../src/file_utils.h"
#include <json/json.h>
#include <thread>
#include <chrono>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <cstdlib>
#include <cstring>
#include <atomic>
#include <filesystem>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;
using namespace runbox;

// ============================================================================
// Test Fixture
// ============================================================================

class HttpIntegrationTest : public ::testing::Test {
protected:
    struct Reply {
        int status = 0;
        HeaderMap headers;
        std::string body;
    };

    void SetUp() override {
        base_dir = fs::temp_directory_path() / ("runbox_http_it_" + FileUtils::random_hex(4));
        config.temp_dir = base_dir;
        config.allowed_hosts = {"http://localhost:3000"};

        workspaces = std::make_unique<WorkspaceManager>(base_dir);
        lifecycle = std::make_unique<LifecycleCoordinator>(*workspaces, registry, runner);
        api = std::make_unique<ApiService>(*lifecycle, registry, config);

        // Port 0: the kernel picks a free one
        server = std::make_unique<HttpServer>(0);
        server->set_allowed_hosts(config.allowed_hosts);
        api->register_routes(*server);
        server->listen();
        server_thread = std::thread([this]() { server->serve(); });
    }

    void TearDown() override {
        if (server) {
            server->stop();
        }
        if (server_thread.joinable()) {
            server_thread.join();
        }
        server.reset();
        api.reset();
        lifecycle.reset();
        workspaces.reset();
        fs::remove_all(base_dir);
    }

    static bool python_available() {
        return system("which python3 > /dev/null 2>&1") == 0;
    }

    // Helper: Connect to server
    int connect_to_server() {
        int sock = socket(AF_INET, SOCK_STREAM, 0);
        if (sock < 0) return -1;

        struct sockaddr_in addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_port = htons(static_cast<uint16_t>(server->port()));
        inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);

        // Generous enough for an execution to time out server-side first
        struct timeval tv;
        tv.tv_sec = 70;
        tv.tv_usec = 0;
        setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(sock, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

        if (connect(sock, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
            close(sock);
            return -1;
        }
        return sock;
    }

    static bool send_all(int sock, const std::string& data) {
        size_t sent = 0;
        while (sent < data.size()) {
            ssize_t n = send(sock, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
            if (n <= 0) return false;
            sent += static_cast<size_t>(n);
        }
        return true;
    }

    // The server closes every connection after one response
    static std::string read_until_close(int sock) {
        std::string response;
        char buffer[4096];
        ssize_t n;
        while ((n = recv(sock, buffer, sizeof(buffer), 0)) > 0) {
            response.append(buffer, static_cast<size_t>(n));
        }
        return response;
    }

    static Reply parse_reply(const std::string& raw) {
        Reply reply;
        size_t header_end = raw.find("\r\n\r\n");
        if (header_end == std::string::npos) return reply;

        std::istringstream head(raw.substr(0, header_end));
        std::string line;
        std::getline(head, line);
        if (line.size() > 12) {
            reply.status = std::atoi(line.substr(9, 3).c_str());
        }
        while (std::getline(head, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            size_t colon = line.find(':');
            if (colon == std::string::npos) continue;
            reply.headers[line.substr(0, colon)] = line.substr(colon + 2);
        }
        reply.body = raw.substr(header_end + 4);
        return reply;
    }

    Reply send_request(const std::string& request) {
        int sock = connect_to_server();
        if (sock < 0) {
            ADD_FAILURE() << "connection failed";
            return Reply{};
        }
        send_all(sock, request);
        std::string raw = read_until_close(sock);
        close(sock);
        return parse_reply(raw);
    }

    Reply get(const std::string& path, const std::string& extra_headers = "") {
        return send_request("GET " + path + " HTTP/1.1\r\nHost: localhost\r\n" +
                            extra_headers + "\r\n");
    }

    Reply post(const std::string& path, const std::string& content_type, const std::string& body) {
        return send_request("POST " + path + " HTTP/1.1\r\n"
                            "Host: localhost\r\n"
                            "Content-Type: " + content_type + "\r\n"
                            "Content-Length: " + std::to_string(body.size()) + "\r\n"
                            "\r\n" + body);
    }

    Reply execute(const std::string& code) {
        Json::Value payload;
        payload["code"] = code;
        Json::StreamWriterBuilder builder;
        builder["indentation"] = "";
        return post("/execute", "application/json", Json::writeString(builder, payload));
    }

    static Json::Value parse_json(const std::string& body) {
        Json::Value json;
        Json::CharReaderBuilder builder;
        std::string errors;
        std::istringstream stream(body);
        EXPECT_TRUE(Json::parseFromStream(builder, stream, &json, &errors)) << body;
        return json;
    }

    fs::path base_dir;
    ServerConfig config;
    TokenRegistry registry;
    ProcessRunner runner;
    std::unique_ptr<WorkspaceManager> workspaces;
    std::unique_ptr<LifecycleCoordinator> lifecycle;
    std::unique_ptr<ApiService> api;
    std::unique_ptr<HttpServer> server;
    std::thread server_thread;
};

#define REQUIRE_PYTHON() \
    if (!python_available()) { GTEST_SKIP() << "python3 not installed, skipping test"; }

// ============================================================================
// Basic Request/Response Tests
// ============================================================================

TEST_F(HttpIntegrationTest, ApiInfoOverTheWire) {
    Reply reply = get("/api");

    EXPECT_EQ(reply.status, 200);
    EXPECT_EQ(parse_json(reply.body)["name"].asString(), "Python Code Executor API");
    EXPECT_FALSE(reply.headers["X-Request-ID"].empty());
    EXPECT_EQ(reply.headers["X-Content-Type-Options"], "nosniff");
}

TEST_F(HttpIntegrationTest, RouteNotFound) {
    Reply reply = get("/nonexistent");

    EXPECT_EQ(reply.status, 404);
    Json::Value body = parse_json(reply.body);
    EXPECT_EQ(body["message"].asString(), "Route GET /nonexistent not found");
    EXPECT_EQ(body["requestId"].asString(), reply.headers["X-Request-ID"]);
}

TEST_F(HttpIntegrationTest, CorsForAllowedOrigin) {
    Reply reply = get("/api", "Origin: http://localhost:3000\r\n");

    EXPECT_EQ(reply.headers["Access-Control-Allow-Origin"], "http://localhost:3000");
}

// ============================================================================
// Execution and Download Tests
// ============================================================================

TEST_F(HttpIntegrationTest, ExecutePrintsHi) {
    REQUIRE_PYTHON();

    Reply reply = execute("print('hi')");
    Json::Value body = parse_json(reply.body);

    EXPECT_EQ(reply.status, 200);
    EXPECT_EQ(body["output"].asString(), "hi\n");
    EXPECT_TRUE(body["success"].asBool());
    EXPECT_EQ(body["generatedFiles"].size(), 0u);
}

TEST_F(HttpIntegrationTest, ExecuteThenDownloadGeneratedFile) {
    REQUIRE_PYTHON();

    // Given: An execution that writes out.txt
    Reply reply = execute("open('out.txt','w').write('x')");
    Json::Value body = parse_json(reply.body);
    ASSERT_EQ(reply.status, 200);
    ASSERT_EQ(body["generatedFiles"].size(), 1u);
    std::string url = body["generatedFiles"][0]["downloadUrl"].asString();

    // When: Downloading it twice
    Reply first = get(url);
    Reply second = get(url);

    // Then: Both succeed with the same bytes
    EXPECT_EQ(first.status, 200);
    EXPECT_EQ(first.body, "x");
    EXPECT_EQ(first.headers["Content-Disposition"], "attachment; filename=\"out.txt\"");
    EXPECT_EQ(second.status, 200);
    EXPECT_EQ(second.body, "x");
}

TEST_F(HttpIntegrationTest, ExecutionErrorIs422) {
    REQUIRE_PYTHON();

    Reply reply = execute("raise ValueError('bad input')");
    Json::Value body = parse_json(reply.body);

    EXPECT_EQ(reply.status, 422);
    EXPECT_NE(body["details"].asString().find("bad input"), std::string::npos);
}

TEST_F(HttpIntegrationTest, UnknownDownloadTokenIs404) {
    Reply reply = get("/download/not-a-real-token");

    EXPECT_EQ(reply.status, 404);
    EXPECT_EQ(parse_json(reply.body)["error"].asString(), "Invalid or expired download token");
}

TEST_F(HttpIntegrationTest, HostThenDownloadBinary) {
    // Given: A binary upload
    std::string content("\x00\x01\xff\r\n--x", 8);
    std::string boundary = "IntegrationBoundary";
    std::string body = "--" + boundary + "\r\n"
                       "Content-Disposition: form-data; name=\"file\"; filename=\"blob.bin\"\r\n"
                       "Content-Type: application/octet-stream\r\n"
                       "\r\n" + content + "\r\n"
                       "--" + boundary + "--\r\n";

    Reply hosted = post("/host", "multipart/form-data; boundary=" + boundary, body);
    Json::Value json = parse_json(hosted.body);
    ASSERT_EQ(hosted.status, 200);
    EXPECT_EQ(json["size"].asUInt64(), content.size());

    // When/Then: The download returns the exact bytes
    Reply download = get(json["downloadUrl"].asString());
    EXPECT_EQ(download.status, 200);
    EXPECT_EQ(download.body, content);
    EXPECT_EQ(download.headers["Content-Type"], "application/octet-stream");
}

TEST_F(HttpIntegrationTest, ConcurrentExecutionsStayIsolated) {
    REQUIRE_PYTHON();

    const int count = 8;
    std::vector<std::thread> clients;
    std::vector<std::string> outputs(count);
    for (int i = 0; i < count; ++i) {
        clients.emplace_back([this, i, &outputs]() {
            Reply reply = execute("import os\nprint(" + std::to_string(i) + ", len(os.listdir('.')))");
            outputs[i] = parse_json(reply.body)["output"].asString();
        });
    }
    for (auto& t : clients) t.join();

    // Each process saw only its own script in its working directory
    for (int i = 0; i < count; ++i) {
        EXPECT_EQ(outputs[i], std::to_string(i) + " 1\n");
    }
    EXPECT_EQ(workspaces->active_count(), 0u);
}

// ============================================================================
// Request Limits
// ============================================================================

TEST_F(HttpIntegrationTest, OversizedRequestIs413) {
    // Given: A declared body beyond the request cap; the body is never sent
    Reply reply = send_request("POST /host HTTP/1.1\r\n"
                               "Host: localhost\r\n"
                               "Content-Type: multipart/form-data; boundary=x\r\n"
                               "Content-Length: " + std::to_string(MAX_REQUEST_SIZE + 1) + "\r\n"
                               "\r\n");

    EXPECT_EQ(reply.status, 413);
    EXPECT_NE(reply.body.find("limit"), std::string::npos);
}

TEST_F(HttpIntegrationTest, ChunkedRequestIsRejected) {
    Reply reply = send_request("POST /execute HTTP/1.1\r\n"
                               "Host: localhost\r\n"
                               "Transfer-Encoding: chunked\r\n"
                               "\r\n");

    EXPECT_EQ(reply.status, 400);
}

// ============================================================================
// Shutdown Tests
// ============================================================================

TEST_F(HttpIntegrationTest, RequestCompletedAfterShutdownBeginsIs503) {
    // Given: A connection accepted before shutdown with a half-sent request
    int sock = connect_to_server();
    ASSERT_GE(sock, 0);
    ASSERT_TRUE(send_all(sock, "GET /api HTTP/1.1\r\nHost: localhost\r\n"));
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    // When: Shutdown begins and then the request completes
    server->begin_shutdown();
    ASSERT_TRUE(send_all(sock, "\r\n"));
    Reply reply = parse_reply(read_until_close(sock));
    close(sock);

    // Then: It is refused with 503
    EXPECT_EQ(reply.status, 503);
    EXPECT_EQ(parse_json(reply.body)["code"].asString(), "SHUTTING_DOWN");

    // And: The listener no longer accepts
    int late = connect_to_server();
    EXPECT_LT(late, 0);
    if (late >= 0) close(late);

    EXPECT_TRUE(server->drain(std::chrono::seconds(5)));
}

TEST_F(HttpIntegrationTest, InFlightExecutionFinishesDuringDrain) {
    REQUIRE_PYTHON();

    // Given: An execution already running
    std::string output;
    std::thread client([this, &output]() {
        Reply reply = execute("import time\ntime.sleep(1)\nprint('done')");
        output = parse_json(reply.body)["output"].asString();
    });
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (server->in_flight() == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    // When: Shutdown begins
    server->begin_shutdown();

    // Then: The drain waits for it and it completes normally
    EXPECT_TRUE(server->drain(std::chrono::seconds(15)));
    client.join();
    EXPECT_EQ(output, "done\n");
}
