#pragma once

#include <string>
#include <functional>
#include <map>
#include <thread>
#include <atomic>
#include "constants.h"

namespace capsulerun {

// Simple HTTP request
struct HttpRequest {
    std::string method;
    std::string path;           // Without the query string
    std::string query;
    std::map<std::string, std::string> headers;
    std::string body;
    std::string client_ip;

    // Case-insensitive header lookup; empty when absent
    std::string header(const std::string& name) const;
};

// Simple HTTP response
struct HttpResponse {
    int status_code = 200;
    std::map<std::string, std::string> headers;
    std::string body;

    HttpResponse() {
        headers["Content-Type"] = "application/json";
        headers["Access-Control-Allow-Origin"] = "*";
    }
};

// Request handler function type
using HandlerFunc = std::function<HttpResponse(const HttpRequest&)>;

// Minimal HTTP/1.1 server over POSIX sockets, one thread per connection
class HttpServer {
public:
    HttpServer(int port = DEFAULT_PORT);
    ~HttpServer();

    // Exact match first, then the longest registered prefix
    void route(const std::string& method, const std::string& path, HandlerFunc handler);

    // Start server (blocks)
    void start();

    // Stop server
    void stop();

    bool running() const { return running_; }

    // Dispatch without a socket; used by the connection handler
    HttpResponse dispatch(const HttpRequest& req) const;

    static HttpRequest parse_request(const std::string& raw);
    static std::string build_response(const HttpResponse& resp);
    static std::string status_text(int status_code);

private:
    int port_;
    int server_fd_;
    std::atomic<bool> running_;
    std::map<std::string, HandlerFunc> routes_;

    void handle_client(int client_fd, const std::string& client_ip);
};

} // namespace capsulerun
