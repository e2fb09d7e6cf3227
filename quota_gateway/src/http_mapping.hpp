#pragma once

#include "operation_error.hpp"
#include "rate_limiter.hpp"
#include <map>
#include <string>
#include <nlohmann/json.hpp>

struct HttpReply {
    int status = 200;
    std::map<std::string, std::string> headers;
    nlohmann::json body = nlohmann::json::object();
};

// Denials -> 429/402 with enough detail for an upgrade prompt; upstream
// failures -> 502 with a generic message and the correlation id only.
HttpReply to_http_reply(const OperationError& error);

// X-RateLimit-Limit / -Remaining / -Reset (epoch seconds). Skipped for
// unlimited plans.
void add_rate_limit_headers(HttpReply& reply, const RateWindowStatus& status);
