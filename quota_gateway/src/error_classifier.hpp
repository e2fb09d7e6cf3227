#pragma once

#include <stdexcept>
#include <string>

enum class ErrorKind {
    Transient,
    Permanent,
    Unknown
};

enum class TransportFailure {
    None,
    ConnectionReset,
    ConnectFailed,
    DnsFailure,
    Timeout
};

std::string to_string(ErrorKind kind);
std::string to_string(TransportFailure failure);

// Failure raised by a call into the collaboration API. status_code is 0
// when no HTTP response was received (see transport).
class UpstreamError : public std::runtime_error {
public:
    UpstreamError(int status_code, std::string sub_code, const std::string& message);
    UpstreamError(TransportFailure transport, const std::string& message);

    int status_code() const { return status_code_; }
    const std::string& sub_code() const { return sub_code_; }
    TransportFailure transport() const { return transport_; }

private:
    int status_code_;
    std::string sub_code_;
    TransportFailure transport_;
};

class ErrorClassifier {
public:
    static ErrorKind classify(const UpstreamError& error);

    // Anything that is not an UpstreamError is Unknown.
    static ErrorKind classify_exception(const std::exception& error);

private:
    static bool is_token_sub_code(const std::string& sub_code);
};
