#pragma once

#include <string>

namespace capsulerun {

struct ClientResponse {
    long status = 0;
    std::string body;
};

// Outbound HTTP seam used by the sandbox and generation clients.
// Implementations throw std::runtime_error when no response is received.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual ClientResponse post_json(const std::string& url, const std::string& json_body,
                                     long timeout_ms) = 0;
    virtual ClientResponse get(const std::string& url, long timeout_ms) = 0;
};

// libcurl easy-interface transport; one handle per request
class CurlTransport : public HttpTransport {
public:
    CurlTransport();

    ClientResponse post_json(const std::string& url, const std::string& json_body,
                             long timeout_ms) override;
    ClientResponse get(const std::string& url, long timeout_ms) override;
};

} // namespace capsulerun
