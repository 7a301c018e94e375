#pragma once

#include <cstdint>
#include <set>
#include <string>
#include <tuple>

namespace collector::codec {

enum class FileType : std::uint8_t {
    Measurement = 0,
    Log = 1,
    Image = 2,
    Video = 3
};

inline const char* to_string(FileType type) {
    switch (type) {
        case FileType::Measurement: return "measurement";
        case FileType::Log: return "log";
        case FileType::Image: return "image";
        case FileType::Video: return "video";
    }
    return "unknown";
}

/**
 * @brief Reference to one stored file belonging to a completed upload
 */
struct StoredFile {
    std::string path;
    FileType type = FileType::Measurement;

    bool operator<(const StoredFile& other) const {
        return std::tie(path, type) < std::tie(other.path, other.type);
    }
    bool operator==(const StoredFile& other) const {
        return path == other.path && type == other.type;
    }
};

/**
 * @brief Summary of a finished upload handed to the persistence worker
 */
struct CompletedUploadDescriptor {
    std::string device_id;
    std::string measurement_id;
    std::string device_type;
    std::string os_version;
    std::set<StoredFile> files;

    bool operator==(const CompletedUploadDescriptor& other) const {
        return device_id == other.device_id && measurement_id == other.measurement_id &&
               device_type == other.device_type && os_version == other.os_version &&
               files == other.files;
    }
};

} // namespace collector::codec
