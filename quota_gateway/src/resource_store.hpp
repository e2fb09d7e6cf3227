#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <utility>

// Read-only view of how many resources of a kind a tenant currently owns.
class ResourceCounter {
public:
    virtual ~ResourceCounter() = default;
    virtual int64_t count_resources(const std::string& tenant_id,
                                    const std::string& resource_kind) const = 0;
};

class InMemoryResourceCounter : public ResourceCounter {
public:
    void set_count(const std::string& tenant_id, const std::string& resource_kind, int64_t count);

    int64_t count_resources(const std::string& tenant_id,
                            const std::string& resource_kind) const override;

private:
    mutable std::mutex mutex_;
    std::map<std::pair<std::string, std::string>, int64_t> counts_;
};
