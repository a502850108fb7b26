/**
 * HTTP Server Integration Tests
 *
 * Drives the public API over real socket connections, with a worker
 * draining the queues behind it. The sandbox is a scripted transport.
 */

#include <gtest/gtest.h>
#include "test_support.h"
#include "api_routes.h"
#include <thread>
#include <chrono>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <cstring>
#include <random>
#include <atomic>
#include <iostream>

using namespace capsulerun;
using namespace capsulerun::testing_support;

// ============================================================================
// Test Fixture
// ============================================================================

class HttpIntegrationTest : public ::testing::Test {
protected:
    std::unique_ptr<TestPipeline> pipeline;
    std::unique_ptr<ApiRoutes> routes;
    std::unique_ptr<HttpServer> server;
    std::thread server_thread;
    std::thread worker_thread;
    int test_port;
    std::atomic<bool> server_failed{false};

    void SetUp() override {
        // Use random port to avoid conflicts
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(18000, 19000);
        test_port = dis(gen);

        pipeline = std::make_unique<TestPipeline>(std::make_shared<MemoryStore>(),
                                                  AdmissionController::Config(),
                                                  FakeTransport::replying("6\n"));
        routes = std::make_unique<ApiRoutes>(pipeline->store, pipeline->admission, pipeline->progress,
                                             pipeline->queue, pipeline->circuit, pipeline->sync,
                                             pipeline->tests, 10);

        server = std::make_unique<HttpServer>(test_port);
        routes->register_routes(*server);

        server_thread = std::thread([this]() {
            try {
                server->start();
            } catch (const std::runtime_error& e) {
                std::cerr << "[Tests] " << e.what() << std::endl;
                server_failed = true;
            }
        });
        worker_thread = std::thread([this]() { pipeline->worker.run(); });

        // Wait for server to start
        int attempts = 0;
        while (!server->running() && !server_failed && attempts < 100) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            attempts++;
        }
        ASSERT_FALSE(server_failed) << "Server could not bind port " << test_port;
    }

    void TearDown() override {
        pipeline->worker.stop();
        if (worker_thread.joinable()) {
            worker_thread.join();
        }
        if (server) {
            server->stop();
        }
        if (server_thread.joinable()) {
            server_thread.join();
        }
        // Let detached connection threads finish before the routes go away
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    // Helper: Connect to server
    int connect_to_server() {
        int sock = socket(AF_INET, SOCK_STREAM, 0);
        if (sock < 0) return -1;

        struct sockaddr_in addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_port = htons(test_port);
        inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);

        // Generous timeout; sync execution holds the connection open
        struct timeval tv;
        tv.tv_sec = 20;
        tv.tv_usec = 0;
        setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(sock, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

        if (connect(sock, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
            close(sock);
            return -1;
        }

        return sock;
    }

    // Helper: Send HTTP request and receive the full response
    std::string send_request(const std::string& request) {
        int sock = connect_to_server();
        if (sock < 0) {
            return "CONNECTION_FAILED";
        }

        ssize_t sent = send(sock, request.c_str(), request.length(), 0);
        if (sent < 0) {
            close(sock);
            return "SEND_FAILED";
        }

        // Server closes after each response
        std::string response;
        char buffer[4096];
        ssize_t n;
        while ((n = recv(sock, buffer, sizeof(buffer), 0)) > 0) {
            response.append(buffer, n);
        }

        close(sock);
        return response;
    }

    std::string post_json(const std::string& path, const std::string& body,
                          const std::string& user = "user-1") {
        return send_request(
            "POST " + path + " HTTP/1.1\r\n"
            "Host: localhost\r\n"
            "Content-Type: application/json\r\n"
            "X-User-Id: " + user + "\r\n"
            "Content-Length: " + std::to_string(body.length()) + "\r\n"
            "\r\n" + body);
    }

    std::string get(const std::string& path) {
        return send_request("GET " + path + " HTTP/1.1\r\nHost: localhost\r\n\r\n");
    }

    static Json::Value body_of(const std::string& response) {
        size_t header_end = response.find("\r\n\r\n");
        if (header_end == std::string::npos) {
            return Json::Value();
        }
        Json::Value body;
        JsonUtils::parse(response.substr(header_end + 4), body);
        return body;
    }

    // Polls the job URL until the job settles
    Json::Value wait_for_job(const std::string& status_path) {
        Json::Value body;
        for (int i = 0; i < 200; ++i) {
            body = body_of(get(status_path));
            std::string status = body["status"].asString();
            if (status == "completed" || status == "failed") break;
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        return body;
    }
};

// ============================================================================
// Basic Request/Response Tests
// ============================================================================

TEST_F(HttpIntegrationTest, HealthCheck) {
    // When: Sending GET /health
    std::string response = get("/health");

    // Then: Should receive 200 OK with JSON body
    EXPECT_NE(response.find("HTTP/1.1 200 OK"), std::string::npos)
        << "Response should be 200 OK. Got:\n" << response;
    EXPECT_EQ(body_of(response)["status"].asString(), "healthy");
    EXPECT_NE(response.find("Access-Control-Allow-Origin: *"), std::string::npos);
    EXPECT_NE(response.find("Content-Type: application/json"), std::string::npos);
}

TEST_F(HttpIntegrationTest, RouteNotFound) {
    std::string response = get("/nonexistent");

    EXPECT_NE(response.find("HTTP/1.1 404"), std::string::npos)
        << "Should return 404 for unknown route. Got:\n" << response;
}

TEST_F(HttpIntegrationTest, MethodMismatchReturns404) {
    std::string response = get("/api/v1/execute");

    EXPECT_NE(response.find("HTTP/1.1 404"), std::string::npos)
        << "Should return 404 for wrong method. Got:\n" << response;
}

TEST_F(HttpIntegrationTest, CorsPreflight) {
    std::string response = send_request(
        "OPTIONS /api/v1/execute HTTP/1.1\r\n"
        "Host: localhost\r\n"
        "Origin: http://example.com\r\n"
        "\r\n");

    EXPECT_NE(response.find("HTTP/1.1 204"), std::string::npos) << response;
    EXPECT_NE(response.find("Access-Control-Allow-Methods"), std::string::npos);
}

TEST_F(HttpIntegrationTest, MalformedJsonIs400) {
    std::string response = post_json("/api/v1/execute/async", "{not json");

    EXPECT_NE(response.find("HTTP/1.1 400"), std::string::npos) << response;
    EXPECT_EQ(body_of(response)["error"]["code"].asString(), "VALIDATION_ERROR");
}

TEST_F(HttpIntegrationTest, OversizedRequestIs413) {
    std::string response = send_request(
        "POST /api/v1/execute HTTP/1.1\r\n"
        "Host: localhost\r\n"
        "Content-Length: 104857600\r\n"
        "\r\n");

    EXPECT_NE(response.find("HTTP/1.1 413"), std::string::npos) << response;
}

// ============================================================================
// Execution Over HTTP
// ============================================================================

TEST_F(HttpIntegrationTest, SyncExecutionReturnsOutput) {
    // Given: A worker and a sandbox that prints 6
    // When: Executing synchronously
    std::string response = post_json("/api/v1/execute",
        R"json({"language": "python", "source_code": "print(sum([1,2,3]))"})json");

    // Then: The result comes back on the same connection
    EXPECT_NE(response.find("HTTP/1.1 200 OK"), std::string::npos) << response;
    Json::Value body = body_of(response);
    EXPECT_TRUE(body["success"].asBool());
    EXPECT_EQ(body["stdout"].asString(), "6\n");
    EXPECT_EQ(body["exitCode"].asInt(), 0);
}

TEST_F(HttpIntegrationTest, AsyncExecutionThenPoll) {
    std::string response = post_json("/api/v1/execute/async",
        R"json({"language": "python", "source_code": "print(sum([1,2,3]))"})json");

    ASSERT_NE(response.find("HTTP/1.1 202 Accepted"), std::string::npos) << response;
    std::string status_url = body_of(response)["statusUrl"].asString();
    ASSERT_FALSE(status_url.empty());

    Json::Value job = wait_for_job(status_url);
    EXPECT_EQ(job["status"].asString(), "completed");
    EXPECT_EQ(job["result"]["stdout"].asString(), "6\n");
}

TEST_F(HttpIntegrationTest, MissingUserIsRejected) {
    std::string response = send_request(
        "POST /api/v1/execute/async HTTP/1.1\r\n"
        "Host: localhost\r\n"
        "Content-Length: 46\r\n"
        "\r\n"
        "{\"language\":\"python\",\"source_code\":\"print(1)\"}");

    EXPECT_NE(response.find("HTTP/1.1 400"), std::string::npos) << response;
}

// ============================================================================
// Generation Over HTTP
// ============================================================================

TEST_F(HttpIntegrationTest, GenerationThenPoll) {
    std::string response = post_json("/api/v1/generate",
        R"({"prompt": "Two sum with a hash map", "language": "python", "difficulty": "easy"})");

    ASSERT_NE(response.find("HTTP/1.1 202"), std::string::npos) << response;
    std::string status_url = body_of(response)["statusUrl"].asString();

    Json::Value job = wait_for_job(status_url);
    EXPECT_EQ(job["status"].asString(), "completed");
    EXPECT_EQ(job["result"]["content"]["title"].asString(), "Two Sum");
    EXPECT_EQ(pipeline->engine.last_context().difficulty, "easy");
}

// ============================================================================
// Connection Handling Tests
// ============================================================================

TEST_F(HttpIntegrationTest, ConcurrentRequests) {
    std::vector<std::thread> threads;
    std::vector<int> results(5, 0);

    for (int i = 0; i < 5; i++) {
        threads.emplace_back([this, i, &results]() {
            std::string response = get("/api/v1/queue/stats");
            results[i] = response.find("HTTP/1.1 200 OK") != std::string::npos ? 1 : 0;
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    for (int i = 0; i < 5; i++) {
        EXPECT_EQ(results[i], 1) << "Concurrent request " << i << " should succeed";
    }
}
