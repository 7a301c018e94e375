#include "collector/storage/local_storage.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <system_error>
#include <unistd.h>

namespace collector::storage {
namespace fs = std::filesystem;

namespace {

class FileDescriptor {
public:
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }
    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    int get() const { return fd_; }

    // close(2) can report a deferred write error, so its result matters here.
    bool close() {
        const int fd = fd_;
        fd_ = -1;
        return ::close(fd) == 0;
    }

private:
    int fd_;
};

collector::Error io_error(const std::string& what, const fs::path& path, int error_number) {
    return collector::Error{ErrorCode::StorageFailure,
        what + " " + path.string() + ": " + std::strerror(error_number)};
}

bool write_all(int fd, const std::uint8_t* data, std::size_t size) {
    std::size_t written = 0;
    while (written < size) {
        const ssize_t n = ::write(fd, data + written, size - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        written += static_cast<std::size_t>(n);
    }
    return true;
}

} // namespace

LocalStorageBackend::LocalStorageBackend(fs::path uploads_folder, fs::path files_folder)
    : uploads_folder_(std::move(uploads_folder)), files_folder_(std::move(files_folder)) {}

collector::Result<void> LocalStorageBackend::initialize() {
    for (const auto& folder : {uploads_folder_, files_folder_}) {
        std::error_code ec;
        fs::create_directories(folder, ec);
        if (ec) {
            return collector::Err<void>(collector::Error{ErrorCode::StorageFailure,
                "Cannot create " + folder.string() + ": " + ec.message()});
        }
    }
    spdlog::info("Local storage ready: uploads in {}, files in {}",
                 uploads_folder_.string(), files_folder_.string());
    return collector::Ok();
}

fs::path LocalStorageBackend::temporary_path(const UploadIdentifier& identifier) const {
    return uploads_folder_ / identifier;
}

fs::path LocalStorageBackend::final_path(const UploadIdentifier& identifier) const {
    return files_folder_ / identifier;
}

collector::Result<std::uint64_t> LocalStorageBackend::store(const UploadIdentifier& identifier,
                                                            const std::vector<std::uint8_t>& chunk,
                                                            const ContentRange& range) {
    const auto path = temporary_path(identifier);
    FileDescriptor file(::open(path.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644));
    if (file.get() < 0) {
        return collector::Err<std::uint64_t>(io_error("Cannot open", path, errno));
    }

    struct stat info {};
    if (::fstat(file.get(), &info) != 0) {
        return collector::Err<std::uint64_t>(io_error("Cannot stat", path, errno));
    }

    const auto committed = static_cast<std::uint64_t>(info.st_size);
    if (committed < range.start) {
        return collector::Err<std::uint64_t>(ErrorCode::ContentRangeMismatch,
            "Only " + std::to_string(committed) + " bytes stored for " + identifier +
            ", chunk starts at " + std::to_string(range.start));
    }
    if (committed > range.start) {
        // Leftover of an append that never got acknowledged.
        spdlog::debug("Dropping {} unacknowledged bytes of {}", committed - range.start, identifier);
        if (::ftruncate(file.get(), static_cast<off_t>(range.start)) != 0) {
            return collector::Err<std::uint64_t>(io_error("Cannot truncate", path, errno));
        }
    }

    if (::lseek(file.get(), static_cast<off_t>(range.start), SEEK_SET) < 0) {
        return collector::Err<std::uint64_t>(io_error("Cannot seek", path, errno));
    }

    if (!write_all(file.get(), chunk.data(), chunk.size()) || ::fsync(file.get()) != 0) {
        const int write_errno = errno;
        if (::ftruncate(file.get(), static_cast<off_t>(range.start)) != 0) {
            spdlog::error("Failed to roll back {} to {} bytes: {}",
                          path.string(), range.start, std::strerror(errno));
        }
        return collector::Err<std::uint64_t>(io_error("Cannot append to", path, write_errno));
    }

    if (!file.close()) {
        return collector::Err<std::uint64_t>(io_error("Cannot close", path, errno));
    }

    return collector::Ok(range.start + static_cast<std::uint64_t>(chunk.size()));
}

collector::Result<std::uint64_t> LocalStorageBackend::bytes_stored(const UploadIdentifier& identifier) {
    for (const auto& path : {temporary_path(identifier), final_path(identifier)}) {
        std::error_code ec;
        const auto size = fs::file_size(path, ec);
        if (!ec) {
            return collector::Ok(static_cast<std::uint64_t>(size));
        }
        if (ec != std::errc::no_such_file_or_directory) {
            return collector::Err<std::uint64_t>(io_error("Cannot stat", path, ec.value()));
        }
    }
    return collector::Ok(std::uint64_t{0});
}

collector::Result<std::string> LocalStorageBackend::finalize(const UploadIdentifier& identifier) {
    const auto source = temporary_path(identifier);
    const auto target = final_path(identifier);

    std::error_code ec;
    if (!fs::exists(source, ec)) {
        if (fs::exists(target, ec)) {
            return collector::Ok(target.string());
        }
        return collector::Err<std::string>(ErrorCode::NotFound,
            "No stored bytes for upload " + identifier);
    }

    fs::rename(source, target, ec);
    if (ec == std::errc::cross_device_link) {
        ec.clear();
        fs::copy_file(source, target, fs::copy_options::overwrite_existing, ec);
        if (!ec) {
            fs::remove(source, ec);
        }
    }
    if (ec) {
        return collector::Err<std::string>(ErrorCode::StorageFailure,
            "Cannot move " + source.string() + " to " + target.string() + ": " + ec.message());
    }

    spdlog::debug("Finalized upload {} as {}", identifier, target.string());
    return collector::Ok(target.string());
}

collector::Result<void> LocalStorageBackend::remove(const UploadIdentifier& identifier) {
    for (const auto& path : {temporary_path(identifier), final_path(identifier)}) {
        std::error_code ec;
        fs::remove(path, ec);
        if (ec && ec != std::errc::no_such_file_or_directory) {
            return collector::Err<void>(collector::Error{ErrorCode::StorageFailure,
                "Cannot remove " + path.string() + ": " + ec.message()});
        }
    }
    return collector::Ok();
}

collector::Result<std::size_t> LocalStorageBackend::cleanup(std::chrono::milliseconds expiration_age) {
    std::error_code ec;
    fs::directory_iterator it(uploads_folder_, ec);
    if (ec) {
        return collector::Err<std::size_t>(ErrorCode::StorageFailure,
            "Cannot list " + uploads_folder_.string() + ": " + ec.message());
    }

    const auto now = fs::file_time_type::clock::now();
    std::size_t removed = 0;
    for (const auto& entry : it) {
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec)) {
            continue;
        }
        const auto modified = entry.last_write_time(entry_ec);
        if (entry_ec || now - modified <= expiration_age) {
            continue;
        }
        if (fs::remove(entry.path(), entry_ec)) {
            ++removed;
            spdlog::debug("Removed expired upload file {}", entry.path().string());
        } else if (entry_ec) {
            spdlog::warn("Cannot remove expired upload file {}: {}",
                         entry.path().string(), entry_ec.message());
        }
    }
    return collector::Ok(removed);
}

} // namespace collector::storage
