#include "collector/codec/descriptor_codec.hpp"

#include <arpa/inet.h>

#include <cstring>

namespace collector::codec {

namespace {

collector::Error malformed(const std::string& message) {
    return collector::Error{ErrorCode::MalformedDescriptor, message};
}

} // namespace

std::vector<std::uint8_t> DescriptorCodec::encode(const CompletedUploadDescriptor& descriptor) {
    std::vector<std::uint8_t> buffer;

    // Header: the four string lengths
    write_uint32(buffer, static_cast<std::uint32_t>(descriptor.device_id.size()));
    write_uint32(buffer, static_cast<std::uint32_t>(descriptor.measurement_id.size()));
    write_uint32(buffer, static_cast<std::uint32_t>(descriptor.device_type.size()));
    write_uint32(buffer, static_cast<std::uint32_t>(descriptor.os_version.size()));

    write_bytes(buffer, descriptor.device_id);
    write_bytes(buffer, descriptor.measurement_id);
    write_bytes(buffer, descriptor.device_type);
    write_bytes(buffer, descriptor.os_version);

    write_uint32(buffer, static_cast<std::uint32_t>(descriptor.files.size()));
    for (const auto& file : descriptor.files) {
        write_uint32(buffer, static_cast<std::uint32_t>(file.path.size()));
        write_bytes(buffer, file.path);
        buffer.push_back(static_cast<std::uint8_t>(file.type));
    }

    return buffer;
}

collector::Result<CompletedUploadDescriptor> DescriptorCodec::decode(const std::vector<std::uint8_t>& data) {
    std::size_t cursor = 0;

    std::uint32_t lengths[4];
    for (auto& length : lengths) {
        auto length_result = read_uint32(data, cursor);
        if (length_result.is_error()) {
            return collector::Err<CompletedUploadDescriptor>(length_result.error());
        }
        length = length_result.value();
    }

    CompletedUploadDescriptor descriptor;
    std::string* fields[4] = {
        &descriptor.device_id,
        &descriptor.measurement_id,
        &descriptor.device_type,
        &descriptor.os_version,
    };
    for (std::size_t i = 0; i < 4; ++i) {
        auto field_result = read_bytes(data, cursor, lengths[i]);
        if (field_result.is_error()) {
            return collector::Err<CompletedUploadDescriptor>(field_result.error());
        }
        *fields[i] = std::move(field_result.value());
    }

    auto count_result = read_uint32(data, cursor);
    if (count_result.is_error()) {
        return collector::Err<CompletedUploadDescriptor>(count_result.error());
    }
    const std::uint32_t file_count = count_result.value();

    // Smallest entry is a 4 byte length plus the 1 byte tag.
    if (static_cast<std::uint64_t>(file_count) * 5 > data.size() - cursor) {
        return collector::Err<CompletedUploadDescriptor>(
            malformed("File count " + std::to_string(file_count) + " exceeds remaining input"));
    }

    for (std::uint32_t i = 0; i < file_count; ++i) {
        auto path_length = read_uint32(data, cursor);
        if (path_length.is_error()) {
            return collector::Err<CompletedUploadDescriptor>(path_length.error());
        }
        auto path = read_bytes(data, cursor, path_length.value());
        if (path.is_error()) {
            return collector::Err<CompletedUploadDescriptor>(path.error());
        }
        auto tag = read_uint8(data, cursor);
        if (tag.is_error()) {
            return collector::Err<CompletedUploadDescriptor>(tag.error());
        }
        if (tag.value() > static_cast<std::uint8_t>(FileType::Video)) {
            return collector::Err<CompletedUploadDescriptor>(
                malformed("Unknown file type tag " + std::to_string(tag.value())));
        }
        descriptor.files.insert(StoredFile{std::move(path.value()), static_cast<FileType>(tag.value())});
    }

    if (cursor != data.size()) {
        return collector::Err<CompletedUploadDescriptor>(
            malformed(std::to_string(data.size() - cursor) + " trailing bytes after descriptor"));
    }

    return collector::Ok(std::move(descriptor));
}

void DescriptorCodec::write_uint32(std::vector<std::uint8_t>& buffer, std::uint32_t value) {
    // Network byte order
    const std::uint32_t network_value = htonl(value);
    const auto* bytes = reinterpret_cast<const std::uint8_t*>(&network_value);
    buffer.insert(buffer.end(), bytes, bytes + 4);
}

void DescriptorCodec::write_bytes(std::vector<std::uint8_t>& buffer, const std::string& value) {
    buffer.insert(buffer.end(), value.begin(), value.end());
}

collector::Result<std::uint32_t> DescriptorCodec::read_uint32(const std::vector<std::uint8_t>& buffer,
                                                              std::size_t& cursor) {
    if (buffer.size() < 4 || cursor > buffer.size() - 4) {
        return collector::Err<std::uint32_t>(malformed("Buffer underflow reading uint32"));
    }
    std::uint32_t network_value = 0;
    std::memcpy(&network_value, buffer.data() + cursor, 4);
    cursor += 4;
    return collector::Ok(static_cast<std::uint32_t>(ntohl(network_value)));
}

collector::Result<std::uint8_t> DescriptorCodec::read_uint8(const std::vector<std::uint8_t>& buffer,
                                                            std::size_t& cursor) {
    if (cursor >= buffer.size()) {
        return collector::Err<std::uint8_t>(malformed("Buffer underflow reading uint8"));
    }
    return collector::Ok(buffer[cursor++]);
}

collector::Result<std::string> DescriptorCodec::read_bytes(const std::vector<std::uint8_t>& buffer,
                                                           std::size_t& cursor,
                                                           std::uint32_t length) {
    if (length > buffer.size() - cursor) {
        return collector::Err<std::string>(
            malformed("Buffer underflow reading " + std::to_string(length) + " byte field"));
    }
    std::string value(reinterpret_cast<const char*>(buffer.data() + cursor), length);
    cursor += length;
    return collector::Ok(std::move(value));
}

} // namespace collector::codec
