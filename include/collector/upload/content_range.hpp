#pragma once

#include "collector/core/result.hpp"
#include "collector/upload/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace collector::upload {

/**
 * @brief Progress of an existing session as seen by the validator
 */
struct RangeState {
    std::uint64_t bytes_stored = 0;
    std::uint64_t total_length = 0;
};

/**
 * @brief Parses a chunk header of the form "bytes <start>-<end>/<total>"
 */
collector::Result<ContentRange> parse_content_range(const std::string& header);

// Parses a status query header of the form "bytes */<total>" and returns the total.
collector::Result<std::uint64_t> parse_status_range(const std::string& header);

/**
 * @brief Decides whether a chunk may be appended, without side effects
 *
 * @param current  nullopt for the first chunk of a session
 * @param range    declared range of the incoming chunk
 * @param payload_size actual number of payload bytes received
 */
collector::Result<void> validate_chunk(const std::optional<RangeState>& current,
                                       const ContentRange& range,
                                       std::size_t payload_size);

/**
 * @brief Formats the resume header value for @p bytes_stored received bytes ("bytes=0-<n-1>")
 */
std::string make_range_header(std::uint64_t bytes_stored);

} // namespace collector::upload
