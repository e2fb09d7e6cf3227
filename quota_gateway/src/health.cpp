#include "health.hpp"

nlohmann::json HealthCheck::get_status() const {
    bool redis_ok = redis_.ping();
    bool pg_ok = pg_.ping();

    nlohmann::json status = {
        {"ok", redis_ok && pg_ok},
        {"redis", redis_ok},
        {"postgres", pg_ok},
        {"service", config_.service_name}
    };

    return status;
}
