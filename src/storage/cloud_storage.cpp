#include "collector/storage/cloud_storage.hpp"

#include <spdlog/spdlog.h>

#include <map>

namespace collector::storage {

CloudStorageBackend::CloudStorageBackend(ObjectStorePtr store,
                                         std::string uploads_prefix,
                                         std::string files_prefix)
    : store_(std::move(store)),
      uploads_prefix_(std::move(uploads_prefix)),
      files_prefix_(std::move(files_prefix)) {}

std::string CloudStorageBackend::data_object(const UploadIdentifier& identifier) const {
    return uploads_prefix_ + "/" + identifier + "/data";
}

std::string CloudStorageBackend::chunk_object(const UploadIdentifier& identifier) const {
    return uploads_prefix_ + "/" + identifier + "/tmp";
}

std::string CloudStorageBackend::final_object(const UploadIdentifier& identifier) const {
    return files_prefix_ + "/" + identifier;
}

collector::Result<std::uint64_t> CloudStorageBackend::store(const UploadIdentifier& identifier,
                                                            const std::vector<std::uint8_t>& chunk,
                                                            const ContentRange& range) {
    const auto data = data_object(identifier);

    if (range.start == 0) {
        auto put_result = store_->put(data, chunk);
        if (put_result.is_error()) {
            return collector::Err<std::uint64_t>(put_result.error());
        }
        return collector::Ok(put_result.value().size);
    }

    auto stat_result = store_->stat(data);
    if (stat_result.is_error()) {
        return collector::Err<std::uint64_t>(stat_result.error());
    }
    const std::uint64_t committed = stat_result.value() ? stat_result.value()->size : 0;
    if (committed < range.start) {
        return collector::Err<std::uint64_t>(ErrorCode::ContentRangeMismatch,
            "Only " + std::to_string(committed) + " bytes stored for " + identifier +
            ", chunk starts at " + std::to_string(range.start));
    }
    const auto tmp = chunk_object(identifier);
    if (committed > range.start) {
        // The compose of this very chunk went through but its reply never arrived.
        if (committed == range.start + chunk.size()) {
            spdlog::info("Chunk {}-{} of {} already appended, acknowledging resubmission",
                         range.start, range.end, identifier);
            auto remove_result = store_->remove(tmp);
            if (remove_result.is_error()) {
                spdlog::warn("Leaving chunk object {} behind: {}", tmp, describe(remove_result.error()));
            }
            return collector::Ok(committed);
        }
        return collector::Err<std::uint64_t>(ErrorCode::StorageFailure,
            "Object " + data + " holds " + std::to_string(committed) +
            " bytes, expected " + std::to_string(range.start));
    }

    auto put_result = store_->put(tmp, chunk);
    if (put_result.is_error()) {
        return collector::Err<std::uint64_t>(put_result.error());
    }

    auto compose_result = store_->compose({data, tmp}, data);
    if (compose_result.is_error()) {
        return collector::Err<std::uint64_t>(compose_result.error());
    }

    auto remove_result = store_->remove(tmp);
    if (remove_result.is_error()) {
        spdlog::warn("Leaving chunk object {} behind: {}", tmp, describe(remove_result.error()));
    }

    return collector::Ok(compose_result.value().size);
}

collector::Result<std::uint64_t> CloudStorageBackend::bytes_stored(const UploadIdentifier& identifier) {
    for (const auto& name : {data_object(identifier), final_object(identifier)}) {
        auto stat_result = store_->stat(name);
        if (stat_result.is_error()) {
            return collector::Err<std::uint64_t>(stat_result.error());
        }
        if (stat_result.value()) {
            return collector::Ok(stat_result.value()->size);
        }
    }
    return collector::Ok(std::uint64_t{0});
}

collector::Result<std::string> CloudStorageBackend::finalize(const UploadIdentifier& identifier) {
    const auto data = data_object(identifier);
    const auto target = final_object(identifier);

    auto stat_result = store_->stat(data);
    if (stat_result.is_error()) {
        return collector::Err<std::string>(stat_result.error());
    }

    if (!stat_result.value()) {
        auto final_stat = store_->stat(target);
        if (final_stat.is_error()) {
            return collector::Err<std::string>(final_stat.error());
        }
        if (final_stat.value()) {
            return collector::Ok(target);
        }
        return collector::Err<std::string>(ErrorCode::NotFound,
            "No stored bytes for upload " + identifier);
    }

    auto compose_result = store_->compose({data}, target);
    if (compose_result.is_error()) {
        return collector::Err<std::string>(compose_result.error());
    }

    for (const auto& leftover : {data, chunk_object(identifier)}) {
        auto remove_result = store_->remove(leftover);
        if (remove_result.is_error()) {
            spdlog::warn("Cannot remove {} after finalizing: {}", leftover, describe(remove_result.error()));
        }
    }

    spdlog::debug("Finalized upload {} as {}", identifier, target);
    return collector::Ok(target);
}

collector::Result<void> CloudStorageBackend::remove(const UploadIdentifier& identifier) {
    for (const auto& name : {chunk_object(identifier), data_object(identifier), final_object(identifier)}) {
        auto result = store_->remove(name);
        if (result.is_error()) {
            return result;
        }
    }
    return collector::Ok();
}

collector::Result<std::size_t> CloudStorageBackend::cleanup(std::chrono::milliseconds expiration_age) {
    const std::string prefix = uploads_prefix_ + "/";
    auto list_result = store_->list(prefix);
    if (list_result.is_error()) {
        return collector::Err<std::size_t>(list_result.error());
    }

    // An upload is stale once its most recently updated object is.
    std::map<std::string, std::vector<ObjectInfo>> uploads;
    for (auto& object : list_result.value()) {
        if (object.name.compare(0, prefix.size(), prefix) != 0) {
            continue;
        }
        const auto slash = object.name.find('/', prefix.size());
        if (slash == std::string::npos) {
            continue;
        }
        uploads[object.name.substr(prefix.size(), slash - prefix.size())].push_back(std::move(object));
    }

    const auto cutoff = std::chrono::system_clock::now() - expiration_age;
    std::size_t removed = 0;
    for (const auto& [identifier, objects] : uploads) {
        bool stale = true;
        for (const auto& object : objects) {
            if (object.updated >= cutoff) {
                stale = false;
                break;
            }
        }
        if (!stale) {
            continue;
        }

        bool all_removed = true;
        for (const auto& object : objects) {
            auto result = store_->remove(object.name);
            if (result.is_error()) {
                spdlog::warn("Cannot remove expired object {}: {}", object.name, describe(result.error()));
                all_removed = false;
            }
        }
        if (all_removed) {
            ++removed;
            spdlog::debug("Removed expired upload {}", identifier);
        }
    }
    return collector::Ok(removed);
}

} // namespace collector::storage
