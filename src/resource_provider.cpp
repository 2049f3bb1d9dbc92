#include "resource_provider.hpp"

namespace toolhost {

StaticResourceProvider::StaticResourceProvider(std::vector<ResourceDescriptor> resources)
    : resources_(std::move(resources)) {}

Result<std::vector<ResourceDescriptor>> StaticResourceProvider::listResources() const {
    return resources_;
}

} // namespace toolhost
