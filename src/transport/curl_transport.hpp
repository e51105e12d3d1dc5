#pragma once
#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include "transport/http_transport.hpp"

namespace rock::transport {

// Serialize a request body. Strings that are not valid UTF-8 raise
// RemoteCallError naming method and url.
std::string encode_json_body(const std::string& method, const std::string& url,
                             const nlohmann::json& body);

// libcurl-backed transport. Each request uses its own easy handle, so one
// instance may be shared by sandboxes running on different threads.
class CurlTransport : public HttpTransport {
public:
    explicit CurlTransport(std::shared_ptr<spdlog::logger> logger = nullptr);
    ~CurlTransport() override;

    // Non-copyable
    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    nlohmann::json post_json(const std::string& url,
                             const Headers& headers,
                             const nlohmann::json& body,
                             std::chrono::milliseconds timeout) override;

    nlohmann::json get_json(const std::string& url,
                            const Headers& headers,
                            std::chrono::milliseconds timeout) override;

    nlohmann::json post_multipart(const std::string& url,
                                  const Headers& headers,
                                  const std::map<std::string, std::string>& fields,
                                  const MultipartFile& file,
                                  std::chrono::milliseconds timeout) override;

    // Connect timeout applied to every request
    void set_connect_timeout(std::chrono::milliseconds timeout) { connect_timeout_ = timeout; }

private:
    std::shared_ptr<spdlog::logger> logger_;
    std::chrono::milliseconds connect_timeout_{300000};
};

} // namespace rock::transport
