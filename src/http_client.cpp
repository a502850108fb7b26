#include "http_client.h"
#include <curl/curl.h>
#include <mutex>
#include <stdexcept>

namespace capsulerun {

namespace {

size_t write_cb(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    std::string* s = static_cast<std::string*>(userp);
    s->append(static_cast<char*>(contents), total);
    return total;
}

// Owns the easy handle and header list for one request
class CurlRequest {
public:
    CurlRequest() : curl_(curl_easy_init()), headers_(nullptr) {
        if (!curl_) throw std::runtime_error("curl_easy_init failed");
    }

    ~CurlRequest() {
        if (headers_) curl_slist_free_all(headers_);
        curl_easy_cleanup(curl_);
    }

    CurlRequest(const CurlRequest&) = delete;
    CurlRequest& operator=(const CurlRequest&) = delete;

    void add_header(const char* header) {
        headers_ = curl_slist_append(headers_, header);
    }

    CURL* handle() const { return curl_; }

    ClientResponse perform(const std::string& url, long timeout_ms) {
        std::string buf;
        curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
        if (headers_) curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers_);
        curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_cb);
        curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &buf);
        curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, timeout_ms);
        curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);

        CURLcode code = curl_easy_perform(curl_);
        if (code != CURLE_OK) {
            throw std::runtime_error(std::string("HTTP request to ") + url + " failed: " +
                                     curl_easy_strerror(code));
        }

        ClientResponse resp;
        curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &resp.status);
        resp.body = std::move(buf);
        return resp;
    }

private:
    CURL* curl_;
    struct curl_slist* headers_;
};

} // namespace

CurlTransport::CurlTransport() {
    static std::once_flag init_flag;
    std::call_once(init_flag, []() {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("curl_global_init failed");
        }
    });
}

ClientResponse CurlTransport::post_json(const std::string& url, const std::string& json_body,
                                        long timeout_ms) {
    CurlRequest req;
    req.add_header("Content-Type: application/json");
    curl_easy_setopt(req.handle(), CURLOPT_POSTFIELDS, json_body.c_str());
    curl_easy_setopt(req.handle(), CURLOPT_POSTFIELDSIZE, static_cast<long>(json_body.size()));
    return req.perform(url, timeout_ms);
}

ClientResponse CurlTransport::get(const std::string& url, long timeout_ms) {
    CurlRequest req;
    curl_easy_setopt(req.handle(), CURLOPT_HTTPGET, 1L);
    return req.perform(url, timeout_ms);
}

} // namespace capsulerun
