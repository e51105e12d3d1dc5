#include "transport/curl_transport.hpp"
#include "common/errors.hpp"
#include <curl/curl.h>
#include <fmt/core.h>
#include <mutex>

using json = nlohmann::json;

namespace rock::transport {

namespace {

std::once_flag g_curl_init;

// libcurl global state must be set up before any thread uses a handle
void ensure_curl_initialized() {
    std::call_once(g_curl_init, [] { curl_global_init(CURL_GLOBAL_ALL); });
}

struct EasyDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};
struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};
struct MimeDeleter {
    void operator()(curl_mime* mime) const { curl_mime_free(mime); }
};

using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;
using MimeHandle = std::unique_ptr<curl_mime, MimeDeleter>;

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

EasyHandle new_handle(const std::string& method, const std::string& url) {
    ensure_curl_initialized();
    EasyHandle handle(curl_easy_init());
    if (!handle) {
        throw RemoteCallError(method, url, "curl_easy_init failed");
    }
    return handle;
}

HeaderList build_header_list(const Headers& headers, bool json_body) {
    curl_slist* list = nullptr;
    if (json_body) {
        list = curl_slist_append(list, "Content-Type: application/json");
    }
    list = curl_slist_append(list, "Accept: application/json");
    for (const auto& [key, value] : headers) {
        list = curl_slist_append(list, (key + ": " + value).c_str());
    }
    return HeaderList(list);
}

std::string truncate_for_log(const std::string& s, size_t max_len = 512) {
    if (s.size() <= max_len) return s;
    return s.substr(0, max_len) + "...";
}

json perform(CURL* curl, const std::string& method, const std::string& url,
             curl_slist* header_list, std::chrono::milliseconds timeout,
             std::chrono::milliseconds connect_timeout,
             const std::shared_ptr<spdlog::logger>& logger) {
    std::string body;
    char error_buffer[CURL_ERROR_SIZE];
    error_buffer[0] = '\0';

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(connect_timeout.count()));

    if (logger) {
        logger->debug("{} {} (timeout={}ms)", method, url, timeout.count());
    }

    CURLcode code = curl_easy_perform(curl);
    if (code == CURLE_OPERATION_TIMEDOUT) {
        throw RemoteCallError(method, url, fmt::format("timed out after {}ms", timeout.count()));
    }
    if (code != CURLE_OK) {
        std::string detail = error_buffer[0] != '\0' ? error_buffer : curl_easy_strerror(code);
        throw RemoteCallError(method, url, detail);
    }

    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    if (status < 200 || status >= 300) {
        throw RemoteCallError(method, url,
            fmt::format("HTTP {}: {}", status, truncate_for_log(body)));
    }

    try {
        return json::parse(body);
    } catch (const json::parse_error& e) {
        throw RemoteCallError(method, url,
            fmt::format("invalid JSON response ({}): {}", e.what(), truncate_for_log(body)));
    }
}

} // namespace

std::string encode_json_body(const std::string& method, const std::string& url,
                             const json& body) {
    try {
        return body.dump();
    } catch (const json::type_error& e) {
        throw RemoteCallError(method, url, fmt::format("cannot encode request body: {}", e.what()));
    }
}

CurlTransport::CurlTransport(std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger)) {
    ensure_curl_initialized();
}

CurlTransport::~CurlTransport() = default;

json CurlTransport::post_json(const std::string& url,
                              const Headers& headers,
                              const json& body,
                              std::chrono::milliseconds timeout) {
    auto handle = new_handle("POST", url);
    auto header_list = build_header_list(headers, true);

    std::string payload = encode_json_body("POST", url, body);
    curl_easy_setopt(handle.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));

    return perform(handle.get(), "POST", url, header_list.get(), timeout, connect_timeout_, logger_);
}

json CurlTransport::get_json(const std::string& url,
                             const Headers& headers,
                             std::chrono::milliseconds timeout) {
    auto handle = new_handle("GET", url);
    auto header_list = build_header_list(headers, false);

    curl_easy_setopt(handle.get(), CURLOPT_HTTPGET, 1L);

    return perform(handle.get(), "GET", url, header_list.get(), timeout, connect_timeout_, logger_);
}

json CurlTransport::post_multipart(const std::string& url,
                                   const Headers& headers,
                                   const std::map<std::string, std::string>& fields,
                                   const MultipartFile& file,
                                   std::chrono::milliseconds timeout) {
    auto handle = new_handle("POST", url);
    auto header_list = build_header_list(headers, false);

    MimeHandle mime(curl_mime_init(handle.get()));
    if (!mime) {
        throw RemoteCallError("POST", url, "curl_mime_init failed");
    }

    for (const auto& [name, value] : fields) {
        curl_mimepart* part = curl_mime_addpart(mime.get());
        curl_mime_name(part, name.c_str());
        curl_mime_data(part, value.c_str(), CURL_ZERO_TERMINATED);
    }

    curl_mimepart* file_part = curl_mime_addpart(mime.get());
    curl_mime_name(file_part, file.field_name.c_str());
    curl_mime_filename(file_part, file.file_name.c_str());
    curl_mime_type(file_part, file.content_type.c_str());
    curl_mime_data(file_part, file.content.data(), file.content.size());

    curl_easy_setopt(handle.get(), CURLOPT_MIMEPOST, mime.get());

    return perform(handle.get(), "POST", url, header_list.get(), timeout, connect_timeout_, logger_);
}

} // namespace rock::transport
