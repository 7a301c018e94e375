#pragma once

#include "collector/core/result.hpp"
#include "collector/upload/types.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace collector::storage {

using collector::upload::ContentRange;
using collector::upload::UploadIdentifier;

/*
  Durable home of upload bytes.

  Bytes first land in a temporary location named by the upload identifier.
  Once the upload is complete, finalize() moves them to the retrievable
  location whose name ends up as "filename" in the metadata document.

  Implementations:
    LocalStorageBackend  -> uploads folder + files folder on a POSIX filesystem
    CloudStorageBackend  -> <prefix>/<id>/data objects composed in an object store
*/
class StorageBackend {
public:
    virtual ~StorageBackend() = default;

    /*
      Append one chunk at range.start and return the number of bytes now
      durably stored. On failure the previously stored bytes are untouched.
    */
    virtual collector::Result<std::uint64_t> store(const UploadIdentifier& identifier,
                                                   const std::vector<std::uint8_t>& chunk,
                                                   const ContentRange& range) = 0;

    virtual collector::Result<std::uint64_t> bytes_stored(const UploadIdentifier& identifier) = 0;

    /*
      Move a complete upload to its final location. Calling it again after
      success returns the same name.
    */
    virtual collector::Result<std::string> finalize(const UploadIdentifier& identifier) = 0;

    // Discard temporary and final bytes of one upload.
    virtual collector::Result<void> remove(const UploadIdentifier& identifier) = 0;

    // Delete unfinished uploads not written to for longer than expiration_age.
    virtual collector::Result<std::size_t> cleanup(std::chrono::milliseconds expiration_age) = 0;

    virtual const char* name() const = 0;
};

using StorageBackendPtr = std::shared_ptr<StorageBackend>;

// Periodic sweep of stale temporary data, returns the number of uploads removed.
using CleanupOperation = std::function<collector::Result<std::size_t>(std::chrono::milliseconds)>;

} // namespace collector::storage
