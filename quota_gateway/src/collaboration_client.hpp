#pragma once

#include "error_classifier.hpp"
#include <string>
#include <nlohmann/json.hpp>
#include <curl/curl.h>

// Thin client for the collaboration platform's REST API. Every failure is
// raised as UpstreamError so the retry layer can classify it.
class CollaborationClient {
public:
    CollaborationClient(const std::string& base_url, const std::string& access_token,
                        long timeout_ms);

    CollaborationClient(const CollaborationClient&) = delete;
    CollaborationClient& operator=(const CollaborationClient&) = delete;

    nlohmann::json request(const std::string& method, const std::string& path,
                           const nlohmann::json& body = nullptr) const;

    // Parses {"error": {"code": "..."}} out of an error body.
    static std::string extract_error_code(const std::string& response_body);
    static TransportFailure map_curl_code(CURLcode code);

private:
    std::string base_url_;
    std::string access_token_;
    long timeout_ms_;

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
};
