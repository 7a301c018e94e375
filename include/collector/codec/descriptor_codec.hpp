#pragma once

/**
 * @file descriptor_codec.hpp
 * @brief Binary form of a CompletedUploadDescriptor
 *
 * BINARY FORMAT (all integers big-endian):
 * [device_id_length: 4 bytes]
 * [measurement_id_length: 4 bytes]
 * [device_type_length: 4 bytes]
 * [os_version_length: 4 bytes]
 * [device_id] [measurement_id] [device_type] [os_version]
 * [file_count: 4 bytes]
 * For each file:
 *   [path_length: 4 bytes] [path: N bytes]
 *   [file_type: 1 byte]
 *
 * Decoding walks a single cursor through the buffer; every field starts where
 * the previous one ended.
 */

#include "collector/codec/descriptor.hpp"
#include "collector/core/result.hpp"

#include <cstdint>
#include <vector>

namespace collector::codec {

class DescriptorCodec {
public:
    static std::vector<std::uint8_t> encode(const CompletedUploadDescriptor& descriptor);

    // Fails with ErrorCode::MalformedDescriptor on truncated, oversized or
    // trailing input and on unknown file type tags.
    static collector::Result<CompletedUploadDescriptor> decode(const std::vector<std::uint8_t>& data);

private:
    static void write_uint32(std::vector<std::uint8_t>& buffer, std::uint32_t value);
    static void write_bytes(std::vector<std::uint8_t>& buffer, const std::string& value);

    static collector::Result<std::uint32_t> read_uint32(const std::vector<std::uint8_t>& buffer,
                                                        std::size_t& cursor);
    static collector::Result<std::uint8_t> read_uint8(const std::vector<std::uint8_t>& buffer,
                                                      std::size_t& cursor);
    static collector::Result<std::string> read_bytes(const std::vector<std::uint8_t>& buffer,
                                                     std::size_t& cursor,
                                                     std::uint32_t length);
};

} // namespace collector::codec
