#pragma once

#include "error.hpp"
#include "mcp_types.hpp"
#include <vector>

namespace toolhost {

// Backs resources/list; absent means "not configured"
class ResourceProvider {
public:
    virtual ~ResourceProvider() = default;
    virtual Result<std::vector<ResourceDescriptor>> listResources() const = 0;
};

// Fixed list taken from the config file
class StaticResourceProvider : public ResourceProvider {
public:
    explicit StaticResourceProvider(std::vector<ResourceDescriptor> resources);

    Result<std::vector<ResourceDescriptor>> listResources() const override;

private:
    std::vector<ResourceDescriptor> resources_;
};

// Backs sampling; the server itself never talks to a model
class SamplingBackend {
public:
    virtual ~SamplingBackend() = default;
    virtual Result<SamplingResponse> createMessage(const SamplingRequest& request) = 0;
};

} // namespace toolhost
