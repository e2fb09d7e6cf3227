#include "error_classifier.hpp"
#include "util.hpp"
#include <algorithm>

std::string to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Transient: return "transient";
        case ErrorKind::Permanent: return "permanent";
        default: return "unknown";
    }
}

std::string to_string(TransportFailure failure) {
    switch (failure) {
        case TransportFailure::ConnectionReset: return "connection_reset";
        case TransportFailure::ConnectFailed: return "connect_failed";
        case TransportFailure::DnsFailure: return "dns_failure";
        case TransportFailure::Timeout: return "timeout";
        default: return "none";
    }
}

UpstreamError::UpstreamError(int status_code, std::string sub_code, const std::string& message)
    : std::runtime_error(message)
    , status_code_(status_code)
    , sub_code_(std::move(sub_code))
    , transport_(TransportFailure::None)
{}

UpstreamError::UpstreamError(TransportFailure transport, const std::string& message)
    : std::runtime_error(message)
    , status_code_(0)
    , transport_(transport)
{}

bool ErrorClassifier::is_token_sub_code(const std::string& sub_code) {
    // "InvalidAuthenticationToken", "expired_token", "token-expired", ...
    std::string code = util::to_lower(sub_code);
    code.erase(std::remove_if(code.begin(), code.end(),
                              [](char c) { return c == '_' || c == '-' || c == ' ' || c == '.'; }),
               code.end());

    // Graph codes for a token that can be refreshed
    static const char* const kRefreshableCodes[] = {
        "invalidauthenticationtoken",
        "unauthenticated",
        "tokenunavailable"
    };
    for (const char* refreshable : kRefreshableCodes) {
        if (code.find(refreshable) != std::string::npos) return true;
    }

    if (code.find("token") == std::string::npos) return false;
    return code.find("expired") != std::string::npos ||
           code.find("invalid") != std::string::npos;
}

ErrorKind ErrorClassifier::classify(const UpstreamError& error) {
    if (error.transport() != TransportFailure::None) {
        return ErrorKind::Transient;
    }

    int status = error.status_code();

    if (status == 429 || status == 408) return ErrorKind::Transient;
    if (status >= 500 && status <= 599 && status != 501) return ErrorKind::Transient;

    if (status == 401) {
        return is_token_sub_code(error.sub_code()) ? ErrorKind::Transient
                                                   : ErrorKind::Permanent;
    }

    if (status >= 400 && status <= 499) return ErrorKind::Permanent;

    return ErrorKind::Unknown;
}

ErrorKind ErrorClassifier::classify_exception(const std::exception& error) {
    if (auto upstream = dynamic_cast<const UpstreamError*>(&error)) {
        return classify(*upstream);
    }
    return ErrorKind::Unknown;
}
