#include "http_server.h"

#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <sstream>
#include <iostream>
#include <thread>

namespace capsulerun {

namespace {

std::string lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

void write_all(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = write(fd, data.data() + sent, data.size() - sent);
        if (n <= 0) return;
        sent += static_cast<size_t>(n);
    }
}

HttpResponse error_response(int status, const std::string& message) {
    HttpResponse resp;
    resp.status_code = status;
    resp.body = "{\"success\":false,\"error\":{\"code\":\"HTTP_" + std::to_string(status) +
                "\",\"message\":\"" + message + "\"}}";
    return resp;
}

} // namespace

std::string HttpRequest::header(const std::string& name) const {
    std::string wanted = lower(name);
    for (const auto& [key, value] : headers) {
        if (lower(key) == wanted) return value;
    }
    return "";
}

HttpServer::HttpServer(int port) : port_(port), server_fd_(-1), running_(false) {}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::route(const std::string& method, const std::string& path, HandlerFunc handler) {
    routes_[method + " " + path] = handler;
}

void HttpServer::start() {
    // Create socket
    server_fd_ = socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd_ < 0) {
        throw std::runtime_error("Failed to create socket");
    }

    // Allow reuse
    int opt = 1;
    setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    // Bind
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(port_);

    if (bind(server_fd_, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        close(server_fd_);
        server_fd_ = -1;
        throw std::runtime_error("Failed to bind to port " + std::to_string(port_));
    }

    // Listen
    if (listen(server_fd_, LISTEN_BACKLOG) < 0) {
        close(server_fd_);
        server_fd_ = -1;
        throw std::runtime_error("Failed to listen");
    }

    running_ = true;
    std::cout << "[HTTP] Listening on port " << port_ << std::endl;

    // Accept connections
    while (running_) {
        struct sockaddr_in client_addr;
        socklen_t client_len = sizeof(client_addr);

        int client_fd = accept(server_fd_, (struct sockaddr*)&client_addr, &client_len);
        if (client_fd < 0) {
            if (running_) continue;
            break;
        }

        std::string client_ip = inet_ntoa(client_addr.sin_addr);

        // Handle in new thread (simple concurrency)
        std::thread([this, client_fd, client_ip]() {
            handle_client(client_fd, client_ip);
            close(client_fd);
        }).detach();
    }
}

void HttpServer::stop() {
    running_ = false;
    if (server_fd_ >= 0) {
        // shutdown wakes a thread blocked in accept()
        shutdown(server_fd_, SHUT_RDWR);
        close(server_fd_);
        server_fd_ = -1;
    }
}

void HttpServer::handle_client(int client_fd, const std::string& client_ip) {
    std::string request_data;
    request_data.reserve(INITIAL_HTTP_BUFFER);

    char buffer[PIPE_BUFFER_SIZE];
    ssize_t bytes_read;

    // Read until headers are complete, then until Content-Length is satisfied
    while ((bytes_read = read(client_fd, buffer, sizeof(buffer))) > 0) {
        request_data.append(buffer, bytes_read);
        if (request_data.size() > MAX_REQUEST_SIZE) {
            write_all(client_fd, build_response(error_response(413, "Request exceeds size limit")));
            return;
        }

        size_t header_end = request_data.find("\r\n\r\n");
        if (header_end == std::string::npos) {
            continue;
        }

        HttpRequest head = parse_request(request_data.substr(0, header_end + 4));
        std::string length_str = head.header("Content-Length");
        size_t content_length = 0;
        if (!length_str.empty()) {
            try {
                content_length = std::stoul(length_str);
            } catch (const std::exception&) {
                write_all(client_fd, build_response(error_response(400, "Invalid Content-Length")));
                return;
            }
        }

        size_t expected_size = header_end + 4 + content_length;
        if (expected_size > MAX_REQUEST_SIZE) {
            write_all(client_fd, build_response(error_response(413, "Request exceeds size limit")));
            return;
        }

        while (request_data.size() < expected_size) {
            bytes_read = read(client_fd, buffer,
                std::min(sizeof(buffer), expected_size - request_data.size()));
            if (bytes_read <= 0) break;
            request_data.append(buffer, bytes_read);
        }
        break;
    }

    if (request_data.empty()) return;

    HttpRequest req = parse_request(request_data);
    req.client_ip = client_ip;

    HttpResponse resp = dispatch(req);
    write_all(client_fd, build_response(resp));
}

HttpResponse HttpServer::dispatch(const HttpRequest& req) const {
    if (req.method == "OPTIONS") {
        HttpResponse resp;
        resp.status_code = 204;
        resp.headers["Access-Control-Allow-Methods"] = "GET, POST, OPTIONS";
        resp.headers["Access-Control-Allow-Headers"] = "Content-Type, X-User-Id, X-User-Plan";
        return resp;
    }

    const HandlerFunc* handler = nullptr;
    auto it = routes_.find(req.method + " " + req.path);
    if (it != routes_.end()) {
        handler = &it->second;
    } else {
        // Longest prefix wins, e.g. "/api/v1/jobs/" for "/api/v1/jobs/{id}"
        size_t best = 0;
        for (const auto& [pattern, candidate] : routes_) {
            size_t space_pos = pattern.find(' ');
            std::string method = pattern.substr(0, space_pos);
            std::string path_pattern = pattern.substr(space_pos + 1);

            if (method == req.method && path_pattern.back() == '/' &&
                req.path.compare(0, path_pattern.size(), path_pattern) == 0 &&
                path_pattern.size() > best) {
                best = path_pattern.size();
                handler = &candidate;
            }
        }
    }

    if (!handler) {
        return error_response(404, "Not found");
    }

    try {
        return (*handler)(req);
    } catch (const std::exception& e) {
        std::cerr << "[HTTP] Handler for " << req.method << " " << req.path
                  << " threw: " << e.what() << std::endl;
        return error_response(500, "Internal server error");
    }
}

HttpRequest HttpServer::parse_request(const std::string& raw) {
    HttpRequest req;

    size_t header_end = raw.find("\r\n\r\n");
    std::string head = header_end == std::string::npos ? raw : raw.substr(0, header_end);
    if (header_end != std::string::npos) {
        req.body = raw.substr(header_end + 4);
    }

    std::istringstream stream(head);

    // Parse request line
    std::string line;
    std::getline(stream, line);
    if (!line.empty() && line.back() == '\r') line.pop_back();

    size_t space1 = line.find(' ');
    size_t space2 = line.find(' ', space1 + 1);

    if (space1 != std::string::npos && space2 != std::string::npos) {
        req.method = line.substr(0, space1);
        std::string target = line.substr(space1 + 1, space2 - space1 - 1);
        size_t q = target.find('?');
        if (q != std::string::npos) {
            req.query = target.substr(q + 1);
            target = target.substr(0, q);
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
            size_t value_start = line.find_first_not_of(' ', colon + 1);
            std::string value = value_start == std::string::npos ? "" : line.substr(value_start);
            req.headers[key] = value;
        }
    }

    return req;
}

std::string HttpServer::status_text(int status_code) {
    switch (status_code) {
        case 200: return "OK";
        case 202: return "Accepted";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 413: return "Payload Too Large";
        case 429: return "Too Many Requests";
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

    out << "Content-Length: " << resp.body.length() << "\r\n";
    out << "Connection: close\r\n";
    out << "\r\n";

    // Body
    out << resp.body;

    return out.str();
}

} // namespace capsulerun
