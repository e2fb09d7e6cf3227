#pragma once

#include <string>
#include <memory>
#include <nlohmann/json.hpp>
#include <sw/redis++/redis++.h>

class RedisBus {
public:
    explicit RedisBus(const std::string& redis_url);

    // Appends {"data": <json>} to the stream, capped at max_len entries.
    void publish_audit(const std::string& stream, const nlohmann::json& data);

    bool ping();

private:
    static constexpr long long kStreamMaxLen = 100000;

    std::shared_ptr<sw::redis::Redis> redis_;
};
