#pragma once

#include "clock.hpp"
#include "plan_limits.hpp"
#include <array>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

struct RateDecision {
    bool allowed = false;
    std::chrono::milliseconds retry_after{0};
};

struct RateWindowStatus {
    int64_t request_count = 0;
    int64_t limit = kUnlimited;
    int64_t remaining = kUnlimited;
    int64_t window_start_ms = 0;
    int64_t reset_at_ms = 0;
};

// Per-tenant request-rate ceiling. Implementations other than the local one
// plug in here when the counter store moves out of process.
class RateLimiter {
public:
    virtual ~RateLimiter() = default;

    virtual RateDecision try_consume(const std::string& tenant_id, const RateLimit& limit) = 0;
    virtual RateWindowStatus status(const std::string& tenant_id, const RateLimit& limit) const = 0;
    virtual void reset(const std::string& tenant_id) = 0;
};

// Fixed window per tenant, in process. Tenants are spread over shards whose
// mutex only guards lookup/insert; each tenant's window has its own mutex.
class LocalRateLimiter : public RateLimiter {
public:
    explicit LocalRateLimiter(std::shared_ptr<const Clock> clock);

    RateDecision try_consume(const std::string& tenant_id, const RateLimit& limit) override;
    RateWindowStatus status(const std::string& tenant_id, const RateLimit& limit) const override;
    void reset(const std::string& tenant_id) override;

    // Forget tenants whose last window ended more than max_idle ago.
    size_t cleanup_idle(std::chrono::milliseconds max_idle);
    size_t tenant_count() const;

private:
    // retired is set under the window mutex when the entry leaves the map;
    // a caller holding a retired window looks the tenant up again.
    struct TenantWindow {
        std::mutex mutex;
        int64_t window_start_ms = 0;
        int64_t window_ms = 0;
        int64_t request_count = 0;
        bool retired = false;
    };

    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<std::string, std::shared_ptr<TenantWindow>> tenants;
    };

    static constexpr size_t kShardCount = 64;

    std::shared_ptr<const Clock> clock_;
    std::array<Shard, kShardCount> shards_;

    Shard& shard_for(const std::string& tenant_id);
    const Shard& shard_for(const std::string& tenant_id) const;
    std::shared_ptr<TenantWindow> find_or_create(const std::string& tenant_id);
    std::shared_ptr<TenantWindow> find(const std::string& tenant_id) const;
    RateDecision consume_locked(const std::string& tenant_id, TenantWindow& window,
                                const RateLimit& limit);
};
