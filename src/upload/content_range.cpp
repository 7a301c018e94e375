#include "collector/upload/content_range.hpp"

#include <cctype>

namespace collector::upload {
namespace {

constexpr const char* kUnit = "bytes ";

bool parse_number(const std::string& text, std::uint64_t& out) {
    if (text.empty() || text.size() > 19) {
        return false;
    }
    std::uint64_t value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        value = value * 10 + static_cast<std::uint64_t>(c - '0');
    }
    out = value;
    return true;
}

collector::Result<std::string> strip_unit(const std::string& header) {
    const std::string unit(kUnit);
    if (header.compare(0, unit.size(), unit) != 0) {
        return collector::Err<std::string>(ErrorCode::InvalidRequest,
                                           "Content-Range must use the bytes unit: " + header);
    }
    return collector::Ok(header.substr(unit.size()));
}

} // namespace

collector::Result<ContentRange> parse_content_range(const std::string& header) {
    auto unit_stripped = strip_unit(header);
    if (unit_stripped.is_error()) {
        return collector::Err<ContentRange>(unit_stripped.error());
    }
    const std::string& text = unit_stripped.value();

    const auto dash = text.find('-');
    const auto slash = text.find('/');
    if (dash == std::string::npos || slash == std::string::npos || dash > slash) {
        return collector::Err<ContentRange>(ErrorCode::InvalidRequest,
                                            "Unparsable Content-Range: " + header);
    }

    ContentRange range;
    if (!parse_number(text.substr(0, dash), range.start) ||
        !parse_number(text.substr(dash + 1, slash - dash - 1), range.end) ||
        !parse_number(text.substr(slash + 1), range.total_length)) {
        return collector::Err<ContentRange>(ErrorCode::InvalidRequest,
                                            "Unparsable Content-Range: " + header);
    }
    return collector::Ok(range);
}

collector::Result<std::uint64_t> parse_status_range(const std::string& header) {
    auto unit_stripped = strip_unit(header);
    if (unit_stripped.is_error()) {
        return collector::Err<std::uint64_t>(unit_stripped.error());
    }
    const std::string& text = unit_stripped.value();
    std::uint64_t total = 0;
    if (text.size() < 3 || text.compare(0, 2, "*/") != 0 || !parse_number(text.substr(2), total)) {
        return collector::Err<std::uint64_t>(ErrorCode::InvalidRequest,
                                             "Unparsable status Content-Range: " + header);
    }
    return collector::Ok(total);
}

collector::Result<void> validate_chunk(const std::optional<RangeState>& current,
                                       const ContentRange& range,
                                       std::size_t payload_size) {
    if (range.total_length == 0 || range.end < range.start || range.end >= range.total_length) {
        return collector::Err<void>(Error{ErrorCode::ContentRangeMismatch,
            "Inconsistent range " + std::to_string(range.start) + "-" + std::to_string(range.end) +
            "/" + std::to_string(range.total_length)});
    }

    if (range.length() != static_cast<std::uint64_t>(payload_size)) {
        return collector::Err<void>(Error{ErrorCode::ContentRangeNotMatchingFileSize,
            "Range declares " + std::to_string(range.length()) + " bytes but payload has " +
            std::to_string(payload_size)});
    }

    if (!current) {
        if (range.start != 0) {
            return collector::Err<void>(Error{ErrorCode::ContentRangeMismatch,
                "First chunk must start at 0, got " + std::to_string(range.start)});
        }
        return collector::Ok();
    }

    if (range.total_length != current->total_length) {
        return collector::Err<void>(Error{ErrorCode::ContentRangeMismatch,
            "Total length changed from " + std::to_string(current->total_length) + " to " +
            std::to_string(range.total_length)});
    }

    if (range.start != current->bytes_stored) {
        return collector::Err<void>(Error{ErrorCode::ContentRangeMismatch,
            "Expected chunk at " + std::to_string(current->bytes_stored) + ", got " +
            std::to_string(range.start)});
    }

    return collector::Ok();
}

std::string make_range_header(std::uint64_t bytes_stored) {
    if (bytes_stored == 0) {
        return {};
    }
    return "bytes=0-" + std::to_string(bytes_stored - 1);
}

} // namespace collector::upload
