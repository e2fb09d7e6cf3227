#pragma once

#include "quota_decision.hpp"
#include "redis_bus.hpp"
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

class Auditor {
public:
    static nlohmann::json build_denial_event(const std::string& tenant_id,
                                             const QuotaDecision& decision);
};

class AuditSink {
public:
    virtual ~AuditSink() = default;
    virtual void emit_denial(const std::string& tenant_id, const QuotaDecision& decision) = 0;
};

// Publishes denial events to the audit stream. Publish failures are logged
// by the bus and never reach the request.
class RedisAuditSink : public AuditSink {
public:
    RedisAuditSink(std::shared_ptr<RedisBus> redis, std::string stream);

    void emit_denial(const std::string& tenant_id, const QuotaDecision& decision) override;

private:
    std::shared_ptr<RedisBus> redis_;
    std::string stream_;
};
