/**
 * HTTP collaborator used by the sandbox client.
 *
 * Every call is bounded by an explicit timeout. Implementations return the
 * parsed JSON body and throw RemoteCallError on transport failures, timeouts,
 * non-2xx HTTP status or a body that is not JSON.
 */
#pragma once
#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

namespace rock::transport {

using Headers = std::map<std::string, std::string>;

// One file part of a multipart/form-data request
struct MultipartFile {
    std::string field_name = "file";
    std::string file_name;
    std::string content;
    std::string content_type = "application/octet-stream";
};

class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual nlohmann::json post_json(const std::string& url,
                                     const Headers& headers,
                                     const nlohmann::json& body,
                                     std::chrono::milliseconds timeout) = 0;

    virtual nlohmann::json get_json(const std::string& url,
                                    const Headers& headers,
                                    std::chrono::milliseconds timeout) = 0;

    virtual nlohmann::json post_multipart(const std::string& url,
                                          const Headers& headers,
                                          const std::map<std::string, std::string>& fields,
                                          const MultipartFile& file,
                                          std::chrono::milliseconds timeout) = 0;
};

} // namespace rock::transport
