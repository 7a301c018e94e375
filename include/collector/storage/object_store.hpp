#pragma once

#include "collector/core/result.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace collector::storage {

struct ObjectInfo {
    std::string name;
    std::uint64_t size = 0;
    std::chrono::system_clock::time_point updated{};
};

/**
 * @brief Minimal object store client capability used by the cloud backend
 *
 * Every call is a single remote round trip. compose() is atomic: the destination
 * either keeps its previous content or becomes the concatenation of the sources.
 */
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    virtual collector::Result<ObjectInfo> put(const std::string& name,
                                              const std::vector<std::uint8_t>& content) = 0;

    virtual collector::Result<ObjectInfo> compose(const std::vector<std::string>& sources,
                                                  const std::string& destination) = 0;

    // Empty optional when the object does not exist.
    virtual collector::Result<std::optional<ObjectInfo>> stat(const std::string& name) = 0;

    // Removing a missing object is not an error.
    virtual collector::Result<void> remove(const std::string& name) = 0;

    virtual collector::Result<std::vector<ObjectInfo>> list(const std::string& prefix) = 0;
};

using ObjectStorePtr = std::shared_ptr<ObjectStore>;

} // namespace collector::storage
