#include "collaboration_client.hpp"
#include <spdlog/spdlog.h>
#include <memory>
#include <stdexcept>

namespace {

struct CurlDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct HeaderListDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

} // namespace

CollaborationClient::CollaborationClient(const std::string& base_url,
                                         const std::string& access_token,
                                         long timeout_ms)
    : base_url_(base_url)
    , access_token_(access_token)
    , timeout_ms_(timeout_ms)
{}

size_t CollaborationClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

std::string CollaborationClient::extract_error_code(const std::string& response_body) {
    auto doc = nlohmann::json::parse(response_body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) return "";

    auto it = doc.find("error");
    if (it == doc.end()) return "";
    if (it->is_string()) return it->get<std::string>();
    if (it->is_object()) {
        const auto& err = *it;
        if (err.contains("code") && err["code"].is_string()) {
            return err["code"].get<std::string>();
        }
    }
    return "";
}

TransportFailure CollaborationClient::map_curl_code(CURLcode code) {
    switch (code) {
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return TransportFailure::DnsFailure;
        case CURLE_COULDNT_CONNECT:
            return TransportFailure::ConnectFailed;
        case CURLE_OPERATION_TIMEDOUT:
            return TransportFailure::Timeout;
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
            return TransportFailure::ConnectionReset;
        default:
            return TransportFailure::None;
    }
}

nlohmann::json CollaborationClient::request(const std::string& method, const std::string& path,
                                            const nlohmann::json& body) const {
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        throw std::runtime_error("Failed to initialize CURL");
    }

    std::string url = base_url_ + path;
    std::string response_string;
    std::string payload = body.is_null() ? std::string() : body.dump();

    curl_slist* raw_headers = nullptr;
    raw_headers = curl_slist_append(raw_headers, "Content-Type: application/json");
    raw_headers = curl_slist_append(raw_headers, "Accept: application/json");
    if (!access_token_.empty()) {
        std::string auth = "Authorization: Bearer " + access_token_;
        raw_headers = curl_slist_append(raw_headers, auth.c_str());
    }
    std::unique_ptr<curl_slist, HeaderListDeleter> headers(raw_headers);

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, method.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response_string);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, timeout_ms_);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    if (!payload.empty()) {
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, payload.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    }

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        TransportFailure failure = map_curl_code(res);
        if (failure == TransportFailure::None) {
            throw std::runtime_error(std::string("Upstream request failed: ") + curl_easy_strerror(res));
        }
        throw UpstreamError(failure, std::string("Upstream transport failure: ") + curl_easy_strerror(res));
    }

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    spdlog::debug("Upstream {} {} -> HTTP {}", method, path, status);

    if (status < 200 || status >= 300) {
        std::string code = extract_error_code(response_string);
        throw UpstreamError(static_cast<int>(status), code,
                            "Upstream " + method + " returned HTTP " + std::to_string(status));
    }

    if (response_string.empty()) {
        return nlohmann::json::object();
    }

    auto parsed = nlohmann::json::parse(response_string, nullptr, false);
    if (parsed.is_discarded()) {
        throw UpstreamError(static_cast<int>(status), "InvalidResponseBody",
                            "Upstream " + method + " returned a body that is not JSON");
    }
    return parsed;
}
