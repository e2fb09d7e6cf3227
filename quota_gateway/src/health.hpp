#pragma once

#include "redis_bus.hpp"
#include "pg_store.hpp"
#include "config.hpp"
#include <nlohmann/json.hpp>

class HealthCheck {
public:
    HealthCheck(RedisBus& redis, PostgresStore& pg, const Config& config)
        : redis_(redis), pg_(pg), config_(config) {}

    nlohmann::json get_status() const;

private:
    RedisBus& redis_;
    PostgresStore& pg_;
    const Config& config_;
};
